// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace worldpulse::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_DATA_HOME/WorldPulse/state, created on demand. */
    static std::filesystem::path GetStateDir();
    /** @brief $XDG_CONFIG_HOME/WorldPulse/settings.json (not created). */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace worldpulse::infrastructure
