#include <iostream>
#include <stdexcept>

#include "app/PatternKeeperApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace patternkeeper;

int main(int, char**) {
    infrastructure::ServerConfig config;
    try {
        config = infrastructure::ConfigLoader::LoadFromEnvironment();
    } catch (const std::runtime_error& e) {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 1;
    }

    app::PatternKeeperApp app(config);
    return app.Run(std::cin, std::cout);
}
