#pragma once

#include "tweak.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class CatalogException : public std::exception {
public:
    CatalogException(std::string msg) : message(std::move(msg)) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

class TweakCatalog {
public:
    // Throws CatalogException on an empty or duplicate id
    explicit TweakCatalog(std::vector<Tweak> tweaks);

    const std::vector<Tweak>& List() const { return tweaks; }
    const Tweak* Find(const std::string& id) const;
    std::optional<size_t> IndexOf(const std::string& id) const;

    // The shipped catalog. cache_root is the per-user local app data
    // directory the shader caches live under.
    static TweakCatalog Default(const std::filesystem::path& cache_root);
private:
    std::vector<Tweak> tweaks;
};
