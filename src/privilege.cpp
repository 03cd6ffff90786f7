#include "privilege.hpp"
#include "log.hpp"

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>
#endif

#ifdef _WIN32
bool SystemPrivilegeGate::IsElevated() const {
    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token)) {
        Log::Warning("SystemPrivilegeGate::IsElevated", "OpenProcessToken failed ({})", GetLastError());
        return false;
    }

    TOKEN_ELEVATION elevation {};
    DWORD size = 0;
    bool elevated = GetTokenInformation(token, TokenElevation, &elevation, sizeof(elevation), &size)
        && elevation.TokenIsElevated;

    CloseHandle(token);
    return elevated;
}
#else
bool SystemPrivilegeGate::IsElevated() const {
    return geteuid() == 0;
}
#endif
