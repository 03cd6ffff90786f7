#pragma once

#include "executor.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class Category {
    System,
    Network,
    Graphics
};

const char* CategoryName(Category category);

// Opaque capture of whatever a tweak overwrote. Null for one-way tweaks.
using PriorState = nlohmann::ordered_json;

struct Tweak {
    std::string id;
    std::string name;
    std::string description;
    Category category = Category::System;
    bool requires_elevation = false;
    bool reversible = true;

    // Throws on failure. A failed apply leaves the system as it found it.
    std::function<PriorState(ActionExecutor&)> apply;
    // Only called for reversible tweaks, with a value apply returned
    std::function<void(ActionExecutor&, const PriorState&)> undo;
};

namespace Tweaks {
    struct Setting {
        SettingKey key;
        SettingValue value;
    };

    // Prior state is the bare previous value, or null if it was absent
    Tweak SettingTweak(Tweak base, Setting setting);

    // Prior state is an object keyed by "path\name"
    Tweak SettingsTweak(Tweak base, std::vector<Setting> settings);

    // Writes each value under every sub-key of parent_path
    Tweak PerSubkeySettingsTweak(Tweak base, std::string parent_path, std::vector<std::pair<std::string, SettingValue>> values);

    // Stops the service and sets its startup mode
    Tweak ServiceTweak(Tweak base, std::string service, ServiceMode mode);

    Tweak PowerSchemeTweak(Tweak base, std::string scheme_guid);

    // One-way: clears every existing directory in paths
    Tweak CacheTweak(Tweak base, std::vector<std::filesystem::path> paths);

    nlohmann::ordered_json SettingValueToJson(const std::optional<SettingValue>& value);
    std::optional<SettingValue> SettingValueFromJson(const nlohmann::ordered_json& j);
}
