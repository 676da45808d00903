/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace patternkeeper::infrastructure {

std::optional<std::string> ConfigLoader::GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

ServerConfig ConfigLoader::LoadFromEnvironment() {
    auto patternsDir = GetEnv(kPatternsDirVariable);
    if (!patternsDir) {
        std::cerr << "[ConfigLoader] " << kPatternsDirVariable << " is not set." << std::endl;
        throw std::runtime_error(std::string(kPatternsDirVariable) + " environment variable MUST be set");
    }

    ServerConfig config;
    config.patternsDir = *patternsDir;
    return config;
}

} // namespace patternkeeper::infrastructure
