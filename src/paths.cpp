#include "paths.hpp"
#include <Windows.h>
#include <ShlObj_core.h>
#include <combaseapi.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <knownfolders.h>

std::filesystem::path Paths::RootDirectory;
std::filesystem::path Paths::LogFile;
std::filesystem::path Paths::ConfigFile;
std::filesystem::path Paths::StateFile;
std::filesystem::path Paths::LocalAppData;

namespace {
    std::filesystem::path KnownFolder(REFKNOWNFOLDERID id) {
        PWSTR folder = nullptr;
        if (FAILED(SHGetKnownFolderPath(id, 0, NULL, &folder))) {
            CoTaskMemFree(folder);
            std::cerr << "Failed to find the per-user application data folder" << std::endl;
            exit(2);
        }

        std::filesystem::path path(folder);
        CoTaskMemFree(folder);
        return path;
    }
}

void Paths::InitPaths() {
    RootDirectory = KnownFolder(FOLDERID_RoamingAppData) / "ArcBooster";
    LocalAppData = KnownFolder(FOLDERID_LocalAppData);
    LogFile = RootDirectory / "latest.log";
    ConfigFile = RootDirectory / "config.json";
    StateFile = RootDirectory / "applied_tweaks.json";

    // Create directories
    std::filesystem::create_directories(RootDirectory);
}
