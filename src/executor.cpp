#include "executor.hpp"
#include "log.hpp"

#include <format>
#include <system_error>

namespace fs = std::filesystem;

const char* ServiceModeName(ServiceMode mode) {
    switch (mode) {
        case ServiceMode::Boot: return "Boot";
        case ServiceMode::System: return "System";
        case ServiceMode::Automatic: return "Automatic";
        case ServiceMode::Manual: return "Manual";
        case ServiceMode::Disabled: return "Disabled";
    }
    return "Unknown";
}

std::optional<ServiceMode> ServiceModeFromName(const std::string& name) {
    for (auto mode : { ServiceMode::Boot, ServiceMode::System, ServiceMode::Automatic, ServiceMode::Manual, ServiceMode::Disabled }) {
        if (name == ServiceModeName(mode)) return mode;
    }
    return std::nullopt;
}

void ClearDirectory(const fs::path& path) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) throw ExecutorException(std::format("Cannot access {}: {}", path.string(), ec.message()));
    if (!exists) {
        Log::Debug("ClearDirectory", "{} does not exist", path.string());
        return;
    }
    if (!fs::is_directory(path, ec))
        throw ExecutorException(std::format("{} is not a directory", path.string()));

    size_t removed = 0;
    size_t locked = 0;
    fs::directory_iterator it(path, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code remove_ec;
        fs::remove_all(it->path(), remove_ec);
        if (remove_ec) {
            Log::Warning("ClearDirectory", "Could not remove {}: {}", it->path().string(), remove_ec.message());
            locked++;
        } else {
            removed++;
        }
    }
    if (ec)
        throw ExecutorException(std::format("Cannot list {}: {} ({} removed before the error)", path.string(), ec.message(), removed));

    Log::Info("ClearDirectory", "Cleared {} ({} removed, {} in use)", path.string(), removed, locked);
}
