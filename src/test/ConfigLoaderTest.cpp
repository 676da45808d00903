#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/PatternKeeperApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using patternkeeper::infrastructure::ConfigLoader;

namespace {

bool LoadFails() {
    try {
        ConfigLoader::LoadFromEnvironment();
    } catch (const std::runtime_error& e) {
        return std::string(e.what()) == "PATTERNS_DIR environment variable MUST be set";
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    unsetenv("PATTERNS_DIR");
    assert(LoadFails() && "Missing PATTERNS_DIR is a configuration error.");
    assert(!ConfigLoader::GetEnv("PATTERNS_DIR"));

    // Set but empty is a configuration; it just names no readable directory
    setenv("PATTERNS_DIR", "", 1);
    assert(!LoadFails());
    auto emptyConfig = ConfigLoader::LoadFromEnvironment();
    assert(emptyConfig.patternsDir.empty());
    assert(ConfigLoader::GetEnv("PATTERNS_DIR") && ConfigLoader::GetEnv("PATTERNS_DIR")->empty());

    patternkeeper::app::PatternKeeperApp emptyApp(emptyConfig);
    assert(emptyApp.GetServices().queryService->Count() == 0);
    assert(emptyApp.GetServices().toolService->ListPatterns().empty());

    setenv("PATTERNS_DIR", "/srv/patterns", 1);
    auto config = ConfigLoader::LoadFromEnvironment();
    assert(config.patternsDir == std::filesystem::path("/srv/patterns"));

    // A directory that does not exist is still a valid configuration
    setenv("PATTERNS_DIR", "/nonexistent/patternkeeper", 1);
    config = ConfigLoader::LoadFromEnvironment();
    assert(config.patternsDir == std::filesystem::path("/nonexistent/patternkeeper"));

    unsetenv("PATTERNS_DIR");
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
