/**
 * @file PatternKeeperApp.hpp
 * @brief Main application class for PatternKeeper.
 */

#pragma once

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <iosfwd>

namespace patternkeeper::app {

/**
 * @class PatternKeeperApp
 * @brief Loads the pattern library once and serves it over MCP.
 */
class PatternKeeperApp {
public:
    /**
     * @brief Builds the services and takes the pattern snapshot.
     * @param config Configuration resolved at startup.
     */
    explicit PatternKeeperApp(infrastructure::ServerConfig config);

    /**
     * @brief Serves requests until the input stream closes.
     * @return Exit code (0 for success).
     */
    int Run(std::istream& in, std::ostream& out);

    const application::AppServices& GetServices() const { return m_services; }

private:
    void Init();

    infrastructure::ServerConfig m_config; ///< Startup configuration.
    application::AppServices m_services;   ///< Wired services sharing one snapshot.
};

} // namespace patternkeeper::app
