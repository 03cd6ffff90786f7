#include "catalog.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "paths.hpp"
#include "privilege.hpp"
#include "statestore.hpp"
#include "winexecutor.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

namespace {
    const char* APP_NAME = "Arc Booster";
    const char* APP_VERSION = "1.0.0";

    void PrintUsage() {
        std::cout << std::format("{} {}\n", APP_NAME, APP_VERSION)
                  << "Usage: arcboost [command]\n"
                  << "  list               Show every tweak and whether it is applied (default)\n"
                  << "  apply <id>...      Apply the given tweaks\n"
                  << "  apply all          Apply every tweak in the catalog\n"
                  << "  apply              Apply the tweaks selected last time\n"
                  << "  restore            Undo every recorded tweak\n"
                  << "  status             Show the applied record\n";
    }

    void PrintList(TweakEngine& engine) {
        auto status = engine.Status();

        for (auto category : { Category::System, Category::Network, Category::Graphics }) {
            std::cout << std::format("\n{}\n", CategoryName(category));
            for (const auto& ts : status.tweaks) {
                const Tweak& tweak = *ts.tweak;
                if (tweak.category != category) continue;

                std::string badges;
                if (tweak.requires_elevation) badges += " [ADMIN]";
                if (!tweak.reversible) badges += " [ONE-WAY, not reversible]";
                if (ts.applied) badges += " [APPLIED]";

                std::cout << std::format("  {:<34} {}{}\n", tweak.id, tweak.name, badges);
                std::cout << std::format("  {:<34} {}\n", "", tweak.description);
            }
        }
    }

    void PrintStatus(TweakEngine& engine, const std::filesystem::path& state_file) {
        auto status = engine.Status();

        std::cout << std::format("State file: {}\n", state_file.string());
        size_t applied = 0;
        for (const auto& ts : status.tweaks) {
            if (!ts.applied) continue;
            std::cout << std::format("  {:<34} applied {}\n", ts.tweak->id, ts.applied_at);
            applied++;
        }
        if (applied == 0) std::cout << "  No tweaks are applied\n";

        for (const auto& id : status.stale_ids) {
            std::cout << std::format("  {:<34} recorded, but unknown to this version\n", id);
        }
        for (const auto& [key, value] : status.extras.items()) {
            std::cout << std::format("  {:<34} unrecognised entry, kept: {}\n", key, value.dump());
        }
    }

    void PrintResult(const TweakResult& result) {
        if (result.outcome == Outcome::Failed) {
            std::cout << std::format("  [FAILED]  {} - {}: {}\n", result.id, FailureKindName(result.failure), result.reason);
        } else if (result.outcome == Outcome::SkippedInsufficientPrivilege) {
            std::cout << std::format("  [SKIPPED] {} - requires Administrator rights\n", result.id);
        } else if (result.outcome == Outcome::NotFound) {
            std::cout << std::format("  [UNKNOWN] {} - no such tweak\n", result.id);
        } else {
            std::cout << std::format("  [OK]      {} - {}\n", result.id, OutcomeName(result.outcome));
        }
    }

    bool AllSucceeded(const std::vector<TweakResult>& results) {
        return std::none_of(results.begin(), results.end(), [](const TweakResult& r) {
            return r.outcome == Outcome::Failed || r.outcome == Outcome::NotFound;
        });
    }

    void PrintSummary(const std::vector<TweakResult>& results) {
        size_t ok = 0, skipped = 0, failed = 0;
        for (const auto& r : results) {
            if (r.outcome == Outcome::Applied || r.outcome == Outcome::Restored) ok++;
            else if (r.outcome == Outcome::SkippedInsufficientPrivilege) skipped++;
            else failed++;
        }
        std::cout << std::format("\n{} succeeded, {} skipped, {} failed\n", ok, skipped, failed);
    }
}

int main(int argc, char** argv) {
    // Ensure paths are set and directories are created
    Paths::InitPaths();

    // Load config
    auto config = Config::GetInstance();
    config->Load(Paths::ConfigFile);
    if (config->log_to_file) {
        Log::OpenLogFile(Paths::LogFile);
    }
    if (config->debug_mode) {
        Log::SetLevel(Log::LEVEL_DEBUG);
        Log::Info("MAIN", "Started in debug mode");
    } else {
        Log::SetLevel(Log::LEVEL_ERROR);
        Log::SetConsoleOutput(false);
    }

    std::string command;
    if (argc < 2)
        command = "list";
    else
        command = std::string(argv[1]);

    // Convert command into lowercase
    std::transform(command.begin(), command.end(), command.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    int exit_code = 0;
    try {
        auto catalog = TweakCatalog::Default(Paths::LocalAppData);
        WinExecutor executor;
        FileStateStore store(Paths::StateFile);
        SystemPrivilegeGate privileges;
        TweakEngine engine(catalog, executor, store, privileges);

        if (!privileges.IsElevated() && (command == "apply" || command == "restore")) {
            std::cout << "Not running as Administrator. Tweaks marked [ADMIN] will be skipped.\n";
        }

        if (command == "list") {
            PrintList(engine);
        } else if (command == "status") {
            PrintStatus(engine, store.GetPath());
        } else if (command == "apply") {
            std::vector<std::string> ids;
            for (int i = 2; i < argc; i++) ids.emplace_back(argv[i]);

            if (ids.size() == 1 && ids[0] == "all") {
                ids.clear();
                for (const auto& tweak : catalog.List()) ids.push_back(tweak.id);
            } else if (ids.empty()) {
                ids = config->last_selection;
            }

            if (ids.empty()) {
                std::cout << "Nothing selected. Pass tweak ids or 'all'.\n";
            } else {
                config->last_selection = ids;
                std::cout << std::format("Applying {} tweak(s)\n", ids.size());
                auto results = engine.Apply(ids, PrintResult);
                PrintSummary(results);
                if (!AllSucceeded(results)) exit_code = 1;
            }
        } else if (command == "restore") {
            auto report = engine.Restore(PrintResult);
            if (report.nothing_to_restore) {
                std::cout << "Nothing to restore, no tweaks are recorded as applied.\n";
            } else {
                PrintSummary(report.results);
                if (!AllSucceeded(report.results)) exit_code = 1;
            }
        } else {
            PrintUsage();
            exit_code = command == "help" || command == "--help" ? 0 : 1;
        }
    } catch (const StateCorruptedException& ex) {
        Log::Error("MAIN", "Cannot read the applied record: {}", ex.message);
        std::cerr << std::format("The applied tweaks record is unreadable: {}\n"
                                 "Nothing was changed. Inspect or remove the file to continue.\n", ex.message);
        exit_code = 2;
    } catch (const CatalogException& ex) {
        Log::Error("MAIN", "Invalid tweak catalog: {}", ex.message);
        std::cerr << std::format("Invalid tweak catalog: {}\n", ex.message);
        exit_code = 2;
    } catch (const std::exception& ex) {
        Log::Error("MAIN", "Aborted: {}", ex.what());
        std::cerr << std::format("Arc Booster stopped on an unexpected error: {}\n", ex.what());
        exit_code = 2;
    }

    Config::GetInstance()->Save(Paths::ConfigFile);
    Log::FreeLogFile();
    return exit_code;
}
