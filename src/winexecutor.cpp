#include "winexecutor.hpp"
#include "log.hpp"
#include "winhelpers.hpp"

#include <Windows.h>
#include <combaseapi.h>
#include <powrprof.h>
#include <winreg.h>
#include <winsvc.h>

#include <cctype>
#include <format>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {
    // Owns an open registry key
    class RegKey {
    public:
        RegKey() = default;
        ~RegKey() { if (handle) RegCloseKey(handle); }
        RegKey(const RegKey&) = delete;
        RegKey& operator=(const RegKey&) = delete;

        HKEY* Out() { return &handle; }
        operator HKEY() const { return handle; }
    private:
        HKEY handle = nullptr;
    };

    // Owns a service control manager or service handle
    class ScHandle {
    public:
        explicit ScHandle(SC_HANDLE h) : handle(h) {}
        ~ScHandle() { if (handle) CloseServiceHandle(handle); }
        ScHandle(const ScHandle&) = delete;
        ScHandle& operator=(const ScHandle&) = delete;

        operator SC_HANDLE() const { return handle; }
        bool IsValid() const { return handle != nullptr; }
    private:
        SC_HANDLE handle;
    };

    std::pair<HKEY, std::wstring> SplitRoot(const std::string& path) {
        static const std::pair<const char*, HKEY> roots[] = {
            { "HKCU", HKEY_CURRENT_USER },
            { "HKEY_CURRENT_USER", HKEY_CURRENT_USER },
            { "HKLM", HKEY_LOCAL_MACHINE },
            { "HKEY_LOCAL_MACHINE", HKEY_LOCAL_MACHINE }
        };

        auto pos = path.find('\\');
        std::string root = path.substr(0, pos);
        std::string subkey = pos == std::string::npos ? "" : path.substr(pos + 1);

        for (const auto& [name, hkey] : roots) {
            if (root == name) return { hkey, WinHelpers::StringToWideString(subkey) };
        }
        throw ExecutorException(std::format("Unsupported registry root in '{}'", path));
    }

    ExecutorException Win32Failure(const std::string& what, DWORD code) {
        return ExecutorException(std::format("{}: {}", what, WinHelpers::ErrorMessage(code)));
    }

    DWORD StartTypeOf(ServiceMode mode) {
        switch (mode) {
            case ServiceMode::Boot: return SERVICE_BOOT_START;
            case ServiceMode::System: return SERVICE_SYSTEM_START;
            case ServiceMode::Automatic: return SERVICE_AUTO_START;
            case ServiceMode::Manual: return SERVICE_DEMAND_START;
            case ServiceMode::Disabled: return SERVICE_DISABLED;
        }
        return SERVICE_NO_CHANGE;
    }

    std::optional<ServiceMode> ModeOf(DWORD start_type) {
        switch (start_type) {
            case SERVICE_BOOT_START: return ServiceMode::Boot;
            case SERVICE_SYSTEM_START: return ServiceMode::System;
            case SERVICE_AUTO_START: return ServiceMode::Automatic;
            case SERVICE_DEMAND_START: return ServiceMode::Manual;
            case SERVICE_DISABLED: return ServiceMode::Disabled;
        }
        return std::nullopt;
    }

    ScHandle OpenManager() {
        SC_HANDLE scm = OpenSCManagerW(nullptr, nullptr, SC_MANAGER_CONNECT);
        if (scm == nullptr) throw Win32Failure("OpenSCManager failed", GetLastError());
        return ScHandle(scm);
    }

    SC_HANDLE OpenServiceOrThrow(SC_HANDLE scm, const std::string& name, DWORD access) {
        SC_HANDLE service = OpenServiceW(scm, WinHelpers::StringToWideString(name).c_str(), access);
        if (service == nullptr) throw Win32Failure(std::format("Cannot open service {}", name), GetLastError());
        return service;
    }

    DWORD CurrentState(SC_HANDLE service, const std::string& name) {
        SERVICE_STATUS status {};
        if (!QueryServiceStatus(service, &status))
            throw Win32Failure(std::format("Cannot query status of {}", name), GetLastError());
        return status.dwCurrentState;
    }
}

std::optional<SettingValue> WinExecutor::ReadSetting(const SettingKey& key) {
    auto [root, subkey] = SplitRoot(key.path);
    auto value_name = WinHelpers::StringToWideString(key.name);

    RegKey hkey;
    LSTATUS result = RegOpenKeyExW(root, subkey.c_str(), 0, KEY_QUERY_VALUE | KEY_WOW64_64KEY, hkey.Out());
    if (result == ERROR_FILE_NOT_FOUND) return std::nullopt;
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot open {}", key.path), result);

    DWORD type = 0;
    DWORD size = 0;
    result = RegQueryValueExW(hkey, value_name.c_str(), nullptr, &type, nullptr, &size);
    if (result == ERROR_FILE_NOT_FOUND) return std::nullopt;
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot read {}", key.ToString()), result);

    if (type == REG_DWORD) {
        DWORD value = 0;
        size = sizeof(value);
        result = RegQueryValueExW(hkey, value_name.c_str(), nullptr, nullptr, reinterpret_cast<LPBYTE>(&value), &size);
        if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot read {}", key.ToString()), result);
        return SettingValue(static_cast<std::uint32_t>(value));
    }

    if (type == REG_SZ || type == REG_EXPAND_SZ) {
        std::wstring buffer(size / sizeof(wchar_t) + 1, L'\0');
        DWORD buffer_size = static_cast<DWORD>(buffer.size() * sizeof(wchar_t));
        result = RegQueryValueExW(hkey, value_name.c_str(), nullptr, nullptr, reinterpret_cast<LPBYTE>(buffer.data()), &buffer_size);
        if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot read {}", key.ToString()), result);

        buffer.resize(buffer_size / sizeof(wchar_t));
        while (!buffer.empty() && buffer.back() == L'\0') buffer.pop_back();
        return SettingValue(WinHelpers::WideStringToString(buffer));
    }

    throw ExecutorException(std::format("{} has unsupported registry type {}", key.ToString(), type));
}

void WinExecutor::WriteSetting(const SettingKey& key, const SettingValue& value) {
    auto [root, subkey] = SplitRoot(key.path);
    auto value_name = WinHelpers::StringToWideString(key.name);

    RegKey hkey;
    LSTATUS result = RegCreateKeyExW(root, subkey.c_str(), 0, nullptr, REG_OPTION_NON_VOLATILE,
        KEY_SET_VALUE | KEY_WOW64_64KEY, nullptr, hkey.Out(), nullptr);
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot open {} for writing", key.path), result);

    if (auto dword = std::get_if<std::uint32_t>(&value)) {
        DWORD data = *dword;
        result = RegSetValueExW(hkey, value_name.c_str(), 0, REG_DWORD, reinterpret_cast<const BYTE*>(&data), sizeof(data));
    } else {
        std::wstring data = WinHelpers::StringToWideString(std::get<std::string>(value));
        result = RegSetValueExW(hkey, value_name.c_str(), 0, REG_SZ, reinterpret_cast<const BYTE*>(data.c_str()),
            static_cast<DWORD>((data.length() + 1) * sizeof(wchar_t)));
    }
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot write {}", key.ToString()), result);

    Log::Debug("WinExecutor::WriteSetting", "Wrote {}", key.ToString());
}

void WinExecutor::DeleteSetting(const SettingKey& key) {
    auto [root, subkey] = SplitRoot(key.path);

    RegKey hkey;
    LSTATUS result = RegOpenKeyExW(root, subkey.c_str(), 0, KEY_SET_VALUE | KEY_WOW64_64KEY, hkey.Out());
    if (result == ERROR_FILE_NOT_FOUND) return;
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot open {}", key.path), result);

    result = RegDeleteValueW(hkey, WinHelpers::StringToWideString(key.name).c_str());
    if (result != ERROR_SUCCESS && result != ERROR_FILE_NOT_FOUND)
        throw Win32Failure(std::format("Cannot delete {}", key.ToString()), result);

    Log::Debug("WinExecutor::DeleteSetting", "Deleted {}", key.ToString());
}

std::vector<std::string> WinExecutor::ListSettingKeys(const std::string& path) {
    auto [root, subkey] = SplitRoot(path);

    RegKey hkey;
    LSTATUS result = RegOpenKeyExW(root, subkey.c_str(), 0, KEY_ENUMERATE_SUB_KEYS | KEY_WOW64_64KEY, hkey.Out());
    if (result == ERROR_FILE_NOT_FOUND) return {};
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot open {}", path), result);

    std::vector<std::string> names;
    for (DWORD index = 0;; index++) {
        wchar_t name[256];
        DWORD name_length = static_cast<DWORD>(std::size(name));
        result = RegEnumKeyExW(hkey, index, name, &name_length, nullptr, nullptr, nullptr, nullptr);
        if (result == ERROR_NO_MORE_ITEMS) break;
        if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot enumerate {}", path), result);

        names.push_back(WinHelpers::WideStringToString(std::wstring(name, name_length)));
    }
    return names;
}

std::optional<ServiceMode> WinExecutor::ReadServiceMode(const std::string& name) {
    auto scm = OpenManager();

    ScHandle service(OpenServiceW(scm, WinHelpers::StringToWideString(name).c_str(), SERVICE_QUERY_CONFIG));
    if (!service.IsValid()) {
        DWORD error = GetLastError();
        if (error == ERROR_SERVICE_DOES_NOT_EXIST) return std::nullopt;
        throw Win32Failure(std::format("Cannot open service {}", name), error);
    }

    DWORD bytes_needed = 0;
    QueryServiceConfigW(service, nullptr, 0, &bytes_needed);
    std::vector<BYTE> buffer(bytes_needed);
    auto config = reinterpret_cast<LPQUERY_SERVICE_CONFIGW>(buffer.data());
    if (!QueryServiceConfigW(service, config, bytes_needed, &bytes_needed))
        throw Win32Failure(std::format("Cannot query configuration of {}", name), GetLastError());

    auto mode = ModeOf(config->dwStartType);
    if (!mode.has_value())
        throw ExecutorException(std::format("Service {} has unknown start type {}", name, config->dwStartType));
    return mode;
}

void WinExecutor::SetServiceMode(const std::string& name, ServiceMode mode) {
    auto scm = OpenManager();
    ScHandle service(OpenServiceOrThrow(scm, name, SERVICE_CHANGE_CONFIG));

    if (!ChangeServiceConfigW(service, SERVICE_NO_CHANGE, StartTypeOf(mode), SERVICE_NO_CHANGE,
            nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr)) {
        throw Win32Failure(std::format("Cannot set start mode of {}", name), GetLastError());
    }

    Log::Debug("WinExecutor::SetServiceMode", "{} start mode set to {}", name, ServiceModeName(mode));
}

bool WinExecutor::IsServiceRunning(const std::string& name) {
    auto scm = OpenManager();
    ScHandle service(OpenServiceOrThrow(scm, name, SERVICE_QUERY_STATUS));

    DWORD state = CurrentState(service, name);
    return state == SERVICE_RUNNING || state == SERVICE_START_PENDING;
}

void WinExecutor::LaunchService(const std::string& name) {
    auto scm = OpenManager();
    ScHandle service(OpenServiceOrThrow(scm, name, SERVICE_START));

    if (!::StartServiceW(service, 0, nullptr)) {
        DWORD error = GetLastError();
        if (error != ERROR_SERVICE_ALREADY_RUNNING)
            throw Win32Failure(std::format("Cannot start {}", name), error);
    }

    Log::Debug("WinExecutor::LaunchService", "Started {}", name);
}

void WinExecutor::StopService(const std::string& name) {
    auto scm = OpenManager();
    ScHandle service(OpenServiceOrThrow(scm, name, SERVICE_STOP | SERVICE_QUERY_STATUS));

    SERVICE_STATUS status {};
    if (!ControlService(service, SERVICE_CONTROL_STOP, &status)) {
        DWORD error = GetLastError();
        if (error == ERROR_SERVICE_NOT_ACTIVE) return;
        throw Win32Failure(std::format("Cannot stop {}", name), error);
    }

    auto deadline = std::chrono::steady_clock::now() + stop_timeout;
    while (CurrentState(service, name) != SERVICE_STOPPED) {
        if (std::chrono::steady_clock::now() >= deadline)
            throw ExecutorException(std::format("{} did not stop within {} ms", name, stop_timeout.count()));
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    Log::Debug("WinExecutor::StopService", "Stopped {}", name);
}

std::string WinExecutor::ReadPowerScheme() {
    GUID* active = nullptr;
    DWORD result = PowerGetActiveScheme(nullptr, &active);
    if (result != ERROR_SUCCESS) throw Win32Failure("Cannot read the active power scheme", result);

    wchar_t text[64];
    int length = StringFromGUID2(*active, text, static_cast<int>(std::size(text)));
    LocalFree(active);
    if (length == 0) throw ExecutorException("Cannot format the active power scheme GUID");

    // "{XXXXXXXX-...}" -> "xxxxxxxx-..."
    std::string guid = WinHelpers::WideStringToString(std::wstring(text + 1, length - 3));
    for (auto& c : guid) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return guid;
}

void WinExecutor::SetPowerScheme(const std::string& guid) {
    GUID scheme {};
    std::wstring braced = WinHelpers::StringToWideString(std::format("{{{}}}", guid));
    if (FAILED(IIDFromString(braced.c_str(), &scheme)))
        throw ExecutorException(std::format("'{}' is not a power scheme GUID", guid));

    DWORD result = PowerSetActiveScheme(nullptr, &scheme);
    if (result != ERROR_SUCCESS) throw Win32Failure(std::format("Cannot activate power scheme {}", guid), result);

    Log::Debug("WinExecutor::SetPowerScheme", "Activated power scheme {}", guid);
}

void WinExecutor::ClearCache(const fs::path& path) {
    ClearDirectory(path);
}
