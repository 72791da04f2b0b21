/**
 * @file WorldPulseApp.hpp
 * @brief Main application class for WorldPulse.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InputBatchReader.hpp"
#include "infrastructure/SnapshotServer.hpp"

namespace worldpulse::app {

/** @brief Command-line overrides of settings.json. */
struct AppOptions {
    std::string settingsPath;               ///< Empty: $XDG_CONFIG_HOME/WorldPulse/settings.json.
    std::optional<std::string> inputDir;
    std::optional<std::string> stateDir;
    bool once = false;                      ///< Run a single cycle and print the snapshot.
    bool serve = false;                     ///< Force the HTTP publisher on.
};

/**
 * @class WorldPulseApp
 * @brief Orchestrates the service lifecycle: initialization, the refresh loop, and shutdown.
 */
class WorldPulseApp {
public:
    explicit WorldPulseApp(AppOptions options);

    /**
     * @brief Runs until interrupted, or for one cycle with --once.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Asks the refresh loop to exit after the current cycle. */
    static void RequestStop();

private:
    /**
     * @brief Loads configuration and the entity catalogue and wires every service.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Runs one cycle from the input directory and logs its outcome. */
    application::CycleStatus RunOnce();

    /**
     * @brief Stops the publisher and flushes pending writes.
     */
    void Shutdown();

    AppOptions m_options;
    infrastructure::AppSettings m_settings;
    application::AppServices m_services;
    std::unique_ptr<infrastructure::InputBatchReader> m_reader;
    std::unique_ptr<infrastructure::SnapshotServer> m_server;
};

} // namespace worldpulse::app
