/**
 * @file StenoDeskApp.hpp
 * @brief Main application class for StenoDesk.
 */

#pragma once

#include <memory>
#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace stenodesk::infrastructure {
class HttpControlServer;
}

namespace stenodesk::app {

/**
 * @struct LaunchOptions
 * @brief Command-line overrides.
 */
struct LaunchOptions {
    std::string configPath; ///< Empty means the XDG default.
    int port = 0;           ///< 0 keeps the configured port.
};

/**
 * @class StenoDeskApp
 * @brief Orchestrates the service lifecycle: composition, startup, serving and shutdown.
 */
class StenoDeskApp {
public:
    explicit StenoDeskApp(LaunchOptions options);
    ~StenoDeskApp();

    /**
     * @brief Serves until SIGINT or SIGTERM.
     * @return Exit code (0 for success, 1 if the lease or the port is taken).
     */
    int Run();

private:
    /**
     * @brief Loads the configuration and builds the services.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Stops the scheduler and the server, releasing the lease.
     */
    void Shutdown();

    std::shared_ptr<domain::TranscriptionEngine> CreateEngine() const;

    LaunchOptions m_options;
    infrastructure::StenoDeskConfig m_config;
    std::string m_dataDir;
    application::AppServices m_services;
    std::unique_ptr<infrastructure::HttpControlServer> m_server;
    bool m_schedulerStarted = false;
};

} // namespace stenodesk::app
