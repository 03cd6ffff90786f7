#pragma once

#include <filesystem>

class Paths {
public:
    static std::filesystem::path RootDirectory;
    static std::filesystem::path LogFile;
    static std::filesystem::path ConfigFile;
    static std::filesystem::path StateFile;
    // Parent of the GPU shader caches
    static std::filesystem::path LocalAppData;

    static void InitPaths();
};
