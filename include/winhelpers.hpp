#pragma once

#include <string>
#include <Windows.h>

namespace WinHelpers {
    std::wstring StringToWideString(const std::string& str);
    std::string WideStringToString(const std::wstring& wstr);
    // Text of a Win32 error code, e.g. from GetLastError or a registry call
    std::string ErrorMessage(DWORD code);
}
