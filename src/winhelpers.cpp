#include "winhelpers.hpp"

#include <format>
#include <stringapiset.h>

std::wstring WinHelpers::StringToWideString(const std::string &str) {
    if (str.empty()) return std::wstring();

    int size = MultiByteToWideChar(CP_UTF8, 0, &str[0], (int)str.size(), NULL, 0);
    std::wstring wstrTo(size, 0);
    MultiByteToWideChar(CP_UTF8, 0, &str[0], (int)str.size(), &wstrTo[0], size);

    return wstrTo;
}

std::string WinHelpers::WideStringToString(const std::wstring &wstr) {
    if (wstr.empty()) return std::string();

    int size = WideCharToMultiByte(CP_UTF8, 0, &wstr[0], (int)wstr.size(), NULL, 0, NULL, NULL);
    std::string strTo(size, 0);
    WideCharToMultiByte(CP_UTF8, 0, &wstr[0], (int)wstr.size(), &strTo[0], size, NULL, NULL);

    return strTo;
}

std::string WinHelpers::ErrorMessage(DWORD code) {
    LPWSTR buffer = nullptr;
    DWORD length = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        NULL,
        code,
        0,
        reinterpret_cast<LPWSTR>(&buffer),
        0,
        NULL
    );

    if (length == 0 || buffer == nullptr) {
        return std::format("Win32 error {}", code);
    }

    std::wstring text(buffer, length);
    LocalFree(buffer);

    // strip trailing CR/LF
    while (!text.empty() && (text.back() == L'\r' || text.back() == L'\n' || text.back() == L' ')) {
        text.pop_back();
    }

    return std::format("{} (error {})", WideStringToString(text), code);
}
