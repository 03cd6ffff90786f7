#pragma once

#include "executor.hpp"

#include <chrono>

// Registry, service control manager and power API backed executor
class WinExecutor : public ActionExecutor {
public:
    std::optional<SettingValue> ReadSetting(const SettingKey& key) override;
    void WriteSetting(const SettingKey& key, const SettingValue& value) override;
    void DeleteSetting(const SettingKey& key) override;
    std::vector<std::string> ListSettingKeys(const std::string& path) override;

    std::optional<ServiceMode> ReadServiceMode(const std::string& name) override;
    void SetServiceMode(const std::string& name, ServiceMode mode) override;
    bool IsServiceRunning(const std::string& name) override;
    void LaunchService(const std::string& name) override;
    void StopService(const std::string& name) override;

    std::string ReadPowerScheme() override;
    void SetPowerScheme(const std::string& guid) override;

    void ClearCache(const std::filesystem::path& path) override;

    // How long StopService waits for the service to reach the stopped state
    std::chrono::milliseconds stop_timeout { 15000 };
};
