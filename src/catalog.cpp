#include "catalog.hpp"
#include "log.hpp"

#include <format>
#include <unordered_set>

namespace {
    constexpr const char* HIGH_PERFORMANCE_SCHEME = "8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c";

    constexpr const char* GAME_BAR = "HKCU\\Software\\Microsoft\\GameBar";
    constexpr const char* GAME_DVR = "HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\GameDVR";
    constexpr const char* GAME_CONFIG_STORE = "HKCU\\System\\GameConfigStore";
    constexpr const char* VISUAL_EFFECTS = "HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\Explorer\\VisualEffects";
    constexpr const char* BACKGROUND_APPS = "HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\BackgroundAccessApplications";
    constexpr const char* SYSTEM_PROFILE = "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Multimedia\\SystemProfile";
    constexpr const char* GAMES_TASK = "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Multimedia\\SystemProfile\\Tasks\\Games";
    constexpr const char* PRIORITY_CONTROL = "HKLM\\SYSTEM\\CurrentControlSet\\Control\\PriorityControl";
    constexpr const char* TCPIP_INTERFACES = "HKLM\\SYSTEM\\CurrentControlSet\\Services\\Tcpip\\Parameters\\Interfaces";

    Tweak Base(const char* id, const char* name, const char* description, Category category, bool requires_elevation) {
        return Tweak {
            .id = id,
            .name = name,
            .description = description,
            .category = category,
            .requires_elevation = requires_elevation
        };
    }

    Tweaks::Setting Dword(const char* path, const char* name, std::uint32_t value) {
        return Tweaks::Setting { .key = SettingKey { .path = path, .name = name }, .value = value };
    }

    Tweaks::Setting String(const char* path, const char* name, const char* value) {
        return Tweaks::Setting { .key = SettingKey { .path = path, .name = name }, .value = std::string(value) };
    }
}

TweakCatalog::TweakCatalog(std::vector<Tweak> tweaks) : tweaks(std::move(tweaks)) {
    std::unordered_set<std::string> seen;
    for (const auto& tweak : this->tweaks) {
        if (tweak.id.empty())
            throw CatalogException(std::format("Tweak '{}' has no id", tweak.name));
        if (!seen.insert(tweak.id).second)
            throw CatalogException(std::format("Duplicate tweak id '{}'", tweak.id));
        if (!tweak.apply)
            throw CatalogException(std::format("Tweak '{}' has no apply action", tweak.id));
        if (tweak.reversible && !tweak.undo)
            throw CatalogException(std::format("Reversible tweak '{}' has no undo action", tweak.id));
    }
}

const Tweak* TweakCatalog::Find(const std::string& id) const {
    for (const auto& tweak : tweaks) {
        if (tweak.id == id) return &tweak;
    }
    return nullptr;
}

std::optional<size_t> TweakCatalog::IndexOf(const std::string& id) const {
    for (size_t i = 0; i < tweaks.size(); i++) {
        if (tweaks[i].id == id) return i;
    }
    return std::nullopt;
}

TweakCatalog TweakCatalog::Default(const std::filesystem::path& cache_root) {
    std::vector<Tweak> tweaks;

    // System
    tweaks.push_back(Tweaks::PowerSchemeTweak(
        Base("power_plan_high", "High Performance Power Plan",
            "Activates the High Performance power plan to prevent CPU frequency scaling during gameplay.",
            Category::System, true),
        HIGH_PERFORMANCE_SCHEME
    ));

    tweaks.push_back(Tweaks::SettingTweak(
        Base("game_mode_enable", "Enable Windows Game Mode",
            "Turns on Windows Game Mode to prioritise CPU and GPU resources for the active game.",
            Category::System, false),
        Dword(GAME_BAR, "AutoGameModeEnabled", 1)
    ));

    tweaks.push_back(Tweaks::SettingsTweak(
        Base("disable_game_bar", "Disable Xbox Game Bar",
            "Disables the Xbox Game Bar overlay which can cause micro-stutters during gameplay.",
            Category::System, false),
        {
            Dword(GAME_DVR, "AppCaptureEnabled", 0),
            Dword(GAME_CONFIG_STORE, "GameDVR_Enabled", 0)
        }
    ));

    tweaks.push_back(Tweaks::SettingTweak(
        Base("system_responsiveness", "Maximise System Responsiveness for Games",
            "Sets SystemResponsiveness to 0 so the multimedia scheduler gives the foreground game maximum CPU time.",
            Category::System, true),
        Dword(SYSTEM_PROFILE, "SystemResponsiveness", 0)
    ));

    tweaks.push_back(Tweaks::SettingsTweak(
        Base("games_scheduling_profile", "Optimize Games Scheduling Profile",
            "Raises GPU priority to 8 and CPU priority to 6 in the multimedia Games task profile.",
            Category::System, true),
        {
            Dword(GAMES_TASK, "GPU Priority", 8),
            Dword(GAMES_TASK, "Priority", 6),
            String(GAMES_TASK, "Scheduling Category", "High"),
            String(GAMES_TASK, "SFIO Priority", "High")
        }
    ));

    tweaks.push_back(Tweaks::SettingTweak(
        Base("cpu_priority_separation", "Optimize CPU Priority Separation",
            "Sets Win32PrioritySeparation to 38 (short, variable, foreground boost).",
            Category::System, true),
        Dword(PRIORITY_CONTROL, "Win32PrioritySeparation", 38)
    ));

    tweaks.push_back(Tweaks::SettingTweak(
        Base("visual_effects_performance", "Optimize Visual Effects for Performance",
            "Switches desktop visual effects to 'Adjust for best performance'.",
            Category::System, false),
        Dword(VISUAL_EFFECTS, "VisualFXSetting", 2)
    ));

    tweaks.push_back(Tweaks::ServiceTweak(
        Base("disable_sysmain", "Disable SysMain (Superfetch)",
            "Stops and disables the SysMain service to reduce background disk I/O and RAM pre-loading.",
            Category::System, true),
        "SysMain", ServiceMode::Disabled
    ));

    tweaks.push_back(Tweaks::SettingTweak(
        Base("disable_background_apps", "Disable Background App Refresh",
            "Prevents Microsoft Store apps from running and refreshing in the background.",
            Category::System, false),
        Dword(BACKGROUND_APPS, "GlobalUserDisabled", 1)
    ));

    // Network
    tweaks.push_back(Tweaks::SettingTweak(
        Base("disable_network_throttling", "Disable Network Throttling Index",
            "Removes the Windows cap on network throughput that can increase in-game latency.",
            Category::Network, true),
        Dword(SYSTEM_PROFILE, "NetworkThrottlingIndex", 0xFFFFFFFF)
    ));

    tweaks.push_back(Tweaks::PerSubkeySettingsTweak(
        Base("disable_nagle", "Disable Nagle's Algorithm (TCP No-Delay)",
            "Sets TcpAckFrequency=1 and TCPNoDelay=1 on all network interfaces to stop packet coalescing.",
            Category::Network, true),
        TCPIP_INTERFACES,
        {
            { "TcpAckFrequency", SettingValue(std::uint32_t(1)) },
            { "TCPNoDelay", SettingValue(std::uint32_t(1)) }
        }
    ));

    // Graphics
    tweaks.push_back(Tweaks::SettingsTweak(
        Base("disable_fullscreen_optimizations", "Disable Fullscreen Optimizations",
            "Turns off fullscreen optimizations globally, which can cause frame timing inconsistencies.",
            Category::Graphics, false),
        {
            Dword(GAME_CONFIG_STORE, "GameDVR_FSEBehaviorMode", 2),
            Dword(GAME_CONFIG_STORE, "GameDVR_HonorUserFSEBehaviorMode", 1),
            Dword(GAME_CONFIG_STORE, "GameDVR_FSEBehavior", 2)
        }
    ));

    tweaks.push_back(Tweaks::CacheTweak(
        Base("clear_shader_cache", "Clear GPU Shader Cache",
            "Deletes the DirectX, NVIDIA and AMD shader stores. The cache rebuilds on next launch.",
            Category::Graphics, false),
        {
            cache_root / "D3DSCache",
            cache_root / "NVIDIA" / "DXCache",
            cache_root / "NVIDIA" / "GLCache",
            cache_root / "AMD" / "DxcCache"
        }
    ));

    Log::Debug("TweakCatalog::Default", "Built catalog with {} tweaks", tweaks.size());
    return TweakCatalog(std::move(tweaks));
}
