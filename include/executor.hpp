#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// A registry style value: DWORD or string
using SettingValue = std::variant<std::uint32_t, std::string>;

struct SettingKey {
    std::string path; // e.g. "HKCU\\Software\\Microsoft\\GameBar"
    std::string name; // value name under path

    std::string ToString() const {
        return path + "\\" + name;
    }

    bool operator==(const SettingKey&) const = default;
};

enum class ServiceMode {
    Boot,
    System,
    Automatic,
    Manual,
    Disabled
};

const char* ServiceModeName(ServiceMode mode);
std::optional<ServiceMode> ServiceModeFromName(const std::string& name);

class ExecutorException : public std::exception {
public:
    ExecutorException(std::string msg) : message(std::move(msg)) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

/**
 * Primitive operations the tweaks are built from. Every call is synchronous
 * and touches exactly one resource; a failed call throws ExecutorException
 * and leaves that resource as it was.
 */
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    // Settings (registry values)
    virtual std::optional<SettingValue> ReadSetting(const SettingKey& key) = 0;
    virtual void WriteSetting(const SettingKey& key, const SettingValue& value) = 0;
    // Removing a value that does not exist is not an error
    virtual void DeleteSetting(const SettingKey& key) = 0;
    virtual std::vector<std::string> ListSettingKeys(const std::string& path) = 0;

    // Services
    virtual std::optional<ServiceMode> ReadServiceMode(const std::string& name) = 0;
    virtual void SetServiceMode(const std::string& name, ServiceMode mode) = 0;
    virtual bool IsServiceRunning(const std::string& name) = 0;
    virtual void LaunchService(const std::string& name) = 0;
    virtual void StopService(const std::string& name) = 0;

    // Power management
    virtual std::string ReadPowerScheme() = 0;
    virtual void SetPowerScheme(const std::string& guid) = 0;

    // Deletes the contents of a cache directory. One-way.
    virtual void ClearCache(const std::filesystem::path& path) = 0;
};

// Removes everything inside path and keeps path itself. Entries that cannot
// be removed, e.g. files held open by a running game, are logged and left
// behind. A missing path is not an error. Throws ExecutorException if path
// is not a directory or cannot be walked.
void ClearDirectory(const std::filesystem::path& path);
