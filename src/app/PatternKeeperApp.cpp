/**
 * @file PatternKeeperApp.cpp
 * @brief Implementation of the PatternKeeperApp class.
 */
#include "app/PatternKeeperApp.hpp"
#include "app/McpServer.hpp"
#include "infrastructure/FilePatternRepository.hpp"
#include <iostream>

namespace patternkeeper::app {

PatternKeeperApp::PatternKeeperApp(infrastructure::ServerConfig config)
    : m_config(std::move(config)) {
    Init();
}

void PatternKeeperApp::Init() {
    auto repository = std::make_shared<infrastructure::FilePatternRepository>(m_config.patternsDir);
    application::PatternCollection snapshot = std::make_shared<std::vector<domain::Pattern>>(repository->loadAll());

    std::cerr << "[PatternKeeperApp] Loaded " << snapshot->size() << " patterns from "
              << m_config.patternsDir << std::endl;

    m_services.repository = repository;
    m_services.queryService = std::make_shared<application::PatternQueryService>(snapshot);
    m_services.authoringService = std::make_shared<application::PatternAuthoringService>(repository);
    m_services.toolService = std::make_shared<application::PatternToolService>(
        m_services.queryService, m_services.authoringService);
}

int PatternKeeperApp::Run(std::istream& in, std::ostream& out) {
    std::cerr << "[PatternKeeperApp] Starting MCP server" << std::endl;
    McpServer server(m_services.toolService);
    server.Run(in, out);
    std::cerr << "[PatternKeeperApp] Input closed, shutting down" << std::endl;
    return 0;
}

} // namespace patternkeeper::app
