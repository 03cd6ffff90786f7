#pragma once

#include <filesystem>
#include <string>
#include <vector>

class Config {
public:
    bool debug_mode;
    bool log_to_file;
    // Ids passed to the last apply, reused when apply is given none
    std::vector<std::string> last_selection;

    // Missing or malformed files leave the defaults in place
    void Load(const std::filesystem::path& path);
    void Save(const std::filesystem::path& path);
    void Reset();

    static Config* GetInstance();
private:
    Config();
};
