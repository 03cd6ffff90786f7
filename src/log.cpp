#include "log.hpp"
#include <fstream>
#include <memory>

std::unique_ptr<std::ofstream> Log::log_file = nullptr;
std::mutex Log::log_mutex;
int Log::log_level = Log::LEVEL_ERROR;
bool Log::console_output = true;

void Log::OpenLogFile(const std::filesystem::path& path) {
    std::lock_guard lock(log_mutex);
    log_file = std::make_unique<std::ofstream>(path);
    if (!log_file->is_open()) {
        std::cerr << std::format("Failed to open log file {}", path.string()) << std::endl;
        log_file = nullptr;
    }
}

void Log::FreeLogFile() {
    std::lock_guard lock(log_mutex);
    if (log_file == nullptr) return;

    log_file->flush();
    log_file->close();
    log_file = nullptr;
}
