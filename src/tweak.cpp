#include "tweak.hpp"
#include "log.hpp"

#include <format>
#include <optional>
#include <string>

using json = nlohmann::ordered_json;

const char* CategoryName(Category category) {
    switch (category) {
        case Category::System: return "System";
        case Category::Network: return "Network";
        case Category::Graphics: return "Graphics";
    }
    return "Unknown";
}

namespace Tweaks {
    json SettingValueToJson(const std::optional<SettingValue>& value) {
        if (!value.has_value()) return nullptr;
        if (auto dword = std::get_if<std::uint32_t>(&*value)) return *dword;
        return std::get<std::string>(*value);
    }

    std::optional<SettingValue> SettingValueFromJson(const json& j) {
        if (j.is_null()) return std::nullopt;
        if (j.is_number_unsigned() || j.is_number_integer()) {
            auto n = j.get<long long>();
            if (n < 0 || n > 0xFFFFFFFFLL)
                throw ExecutorException(std::format("Captured value {} is out of DWORD range", n));
            return SettingValue(static_cast<std::uint32_t>(n));
        }
        if (j.is_string()) return SettingValue(j.get<std::string>());

        throw ExecutorException(std::format("Captured value {} is not a setting value", j.dump()));
    }

    namespace {
        using Captured = std::vector<std::pair<SettingKey, std::optional<SettingValue>>>;

        SettingKey SplitKey(const std::string& full) {
            auto pos = full.rfind('\\');
            if (pos == std::string::npos || pos == 0 || pos + 1 == full.size())
                throw ExecutorException(std::format("Captured key '{}' is malformed", full));
            return SettingKey { .path = full.substr(0, pos), .name = full.substr(pos + 1) };
        }

        void PutBack(ActionExecutor& executor, const SettingKey& key, const std::optional<SettingValue>& prior) {
            if (prior.has_value()) {
                executor.WriteSetting(key, *prior);
            } else {
                executor.DeleteSetting(key);
            }
        }

        void Rollback(ActionExecutor& executor, const Captured& written) {
            for (auto it = written.rbegin(); it != written.rend(); ++it) {
                try {
                    PutBack(executor, it->first, it->second);
                } catch (const ExecutorException& ex) {
                    Log::Error("Tweaks::Rollback", "Could not roll back {}: {}", it->first.ToString(), ex.message);
                }
            }
        }

        // Writes every setting in order. On failure the settings already
        // written are put back and the failure is rethrown.
        Captured WriteAll(ActionExecutor& executor, const std::vector<Setting>& settings) {
            Captured written;
            try {
                for (const auto& setting : settings) {
                    auto prior = executor.ReadSetting(setting.key);
                    executor.WriteSetting(setting.key, setting.value);
                    written.emplace_back(setting.key, prior);
                }
            } catch (const ExecutorException&) {
                Rollback(executor, written);
                throw;
            }
            return written;
        }

        json CapturedToJson(const Captured& written) {
            json prior = json::object();
            for (const auto& [key, value] : written) {
                prior[key.ToString()] = SettingValueToJson(value);
            }
            return prior;
        }

        // Puts back every captured value, newest first. Keeps going after a
        // failure so a retry has less left to do.
        void UndoCaptured(ActionExecutor& executor, const json& prior) {
            if (!prior.is_object())
                throw ExecutorException("Captured state is not an object");

            std::optional<std::string> first_error;
            std::vector<std::pair<std::string, const json*>> entries;
            for (const auto& [key, value] : prior.items()) {
                entries.emplace_back(key, &value);
            }

            for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
                try {
                    PutBack(executor, SplitKey(it->first), SettingValueFromJson(*it->second));
                } catch (const ExecutorException& ex) {
                    Log::Warning("Tweaks::UndoCaptured", "Failed to restore {}: {}", it->first, ex.message);
                    if (!first_error) first_error = ex.message;
                }
            }

            if (first_error) throw ExecutorException(*first_error);
        }
    }

    Tweak SettingTweak(Tweak base, Setting setting) {
        base.reversible = true;
        base.apply = [setting](ActionExecutor& executor) -> PriorState {
            auto prior = executor.ReadSetting(setting.key);
            executor.WriteSetting(setting.key, setting.value);
            return SettingValueToJson(prior);
        };
        base.undo = [key = setting.key](ActionExecutor& executor, const PriorState& prior) {
            PutBack(executor, key, SettingValueFromJson(prior));
        };
        return base;
    }

    Tweak SettingsTweak(Tweak base, std::vector<Setting> settings) {
        base.reversible = true;
        base.apply = [settings = std::move(settings)](ActionExecutor& executor) -> PriorState {
            return CapturedToJson(WriteAll(executor, settings));
        };
        base.undo = [](ActionExecutor& executor, const PriorState& prior) {
            UndoCaptured(executor, prior);
        };
        return base;
    }

    Tweak PerSubkeySettingsTweak(Tweak base, std::string parent_path, std::vector<std::pair<std::string, SettingValue>> values) {
        base.reversible = true;
        base.apply = [parent_path = std::move(parent_path), values = std::move(values)](ActionExecutor& executor) -> PriorState {
            std::vector<Setting> settings;
            for (const auto& subkey : executor.ListSettingKeys(parent_path)) {
                for (const auto& [name, value] : values) {
                    settings.push_back(Setting {
                        .key = SettingKey { .path = std::format("{}\\{}", parent_path, subkey), .name = name },
                        .value = value
                    });
                }
            }
            if (settings.empty()) {
                Log::Warning("Tweaks::PerSubkeySettingsTweak", "No sub-keys under {}", parent_path);
            }
            return CapturedToJson(WriteAll(executor, settings));
        };
        base.undo = [](ActionExecutor& executor, const PriorState& prior) {
            UndoCaptured(executor, prior);
        };
        return base;
    }

    Tweak ServiceTweak(Tweak base, std::string service, ServiceMode mode) {
        base.reversible = true;
        base.apply = [service, mode](ActionExecutor& executor) -> PriorState {
            auto prior_mode = executor.ReadServiceMode(service);
            if (!prior_mode.has_value())
                throw ExecutorException(std::format("Service {} does not exist", service));

            bool was_running = executor.IsServiceRunning(service);
            executor.SetServiceMode(service, mode);

            if (was_running && mode == ServiceMode::Disabled) {
                try {
                    executor.StopService(service);
                } catch (const ExecutorException&) {
                    try {
                        executor.SetServiceMode(service, *prior_mode);
                    } catch (const ExecutorException& ex) {
                        Log::Error("Tweaks::ServiceTweak", "Could not roll back start mode of {}: {}", service, ex.message);
                    }
                    throw;
                }
            }

            return json {
                { "mode", ServiceModeName(*prior_mode) },
                { "running", was_running }
            };
        };
        base.undo = [service](ActionExecutor& executor, const PriorState& prior) {
            if (!prior.is_object() || !prior.contains("mode") || !prior.at("mode").is_string())
                throw ExecutorException(std::format("Captured state for {} has no start mode", service));

            auto mode = ServiceModeFromName(prior.at("mode").get<std::string>());
            if (!mode.has_value())
                throw ExecutorException(std::format("Unknown start mode '{}'", prior.at("mode").get<std::string>()));

            executor.SetServiceMode(service, *mode);

            bool was_running = prior.value("running", false);
            if (was_running && !executor.IsServiceRunning(service)) {
                executor.LaunchService(service);
            }
        };
        return base;
    }

    Tweak PowerSchemeTweak(Tweak base, std::string scheme_guid) {
        base.reversible = true;
        base.apply = [scheme_guid](ActionExecutor& executor) -> PriorState {
            auto prior = executor.ReadPowerScheme();
            executor.SetPowerScheme(scheme_guid);
            return prior;
        };
        base.undo = [](ActionExecutor& executor, const PriorState& prior) {
            if (!prior.is_string())
                throw ExecutorException("Captured power scheme is not a GUID string");
            executor.SetPowerScheme(prior.get<std::string>());
        };
        return base;
    }

    Tweak CacheTweak(Tweak base, std::vector<std::filesystem::path> paths) {
        base.reversible = false;
        base.apply = [paths = std::move(paths)](ActionExecutor& executor) -> PriorState {
            std::vector<std::string> failures;
            for (const auto& path : paths) {
                try {
                    executor.ClearCache(path);
                    Log::Debug("Tweaks::CacheTweak", "Cleared {}", path.string());
                } catch (const ExecutorException& ex) {
                    failures.push_back(std::format("{}: {}", path.string(), ex.message));
                }
            }

            if (!failures.empty()) {
                std::string reason = failures.front();
                if (failures.size() > 1) reason += std::format(" (and {} more)", failures.size() - 1);
                throw ExecutorException(reason);
            }
            return nullptr;
        };
        base.undo = nullptr;
        return base;
    }
}
