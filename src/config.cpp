#include "config.hpp"
#include "log.hpp"
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

Config::Config() {
    Reset();
}

void Config::Reset() {
    this->debug_mode = false;
    this->log_to_file = true;
    this->last_selection.clear();
}

Config* Config::GetInstance() {
    static Config config;
    return &config;
}

void Config::Load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        Log::Debug("Config::Load", "No config at {}. Using defaults", path.string());
        return;
    }

    try {
        std::ifstream stream(path);
        json j = json::parse(stream);

        this->debug_mode = j.value("debug_mode", false);
        this->log_to_file = j.value("log_to_file", true);
        this->last_selection = j.value("last_selection", std::vector<std::string> {});
    } catch (const json::exception& ex) {
        Reset();
        Log::Error("Config::Load", "Failed to load config ({}). Using defaults", ex.what());
    }
}

void Config::Save(const std::filesystem::path& path) {
    std::ofstream stream(path);
    if (!stream.is_open()) {
        Log::Error("Config::Save", "Cannot write config to {}", path.string());
        return;
    }

    json j;
    j["debug_mode"] = this->debug_mode;
    j["log_to_file"] = this->log_to_file;
    j["last_selection"] = this->last_selection;

    std::string s = j.dump(4);
    stream.write(s.data(), s.size());
}
