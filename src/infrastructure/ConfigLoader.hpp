/**
 * @file ConfigLoader.hpp
 * @brief Static utility for reading the server configuration from the environment.
 *
 * The configuration is read once at startup and threaded into the components
 * that need it; nothing re-reads the environment per request.
 */

#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace patternkeeper::infrastructure {

/**
 * @struct ServerConfig
 * @brief Operator-supplied settings, fixed for the process lifetime.
 */
struct ServerConfig {
    std::filesystem::path patternsDir; ///< Directory holding the pattern documents.
};

class ConfigLoader {
public:
    /** @brief Name of the variable that points at the pattern directory. */
    static constexpr const char* kPatternsDirVariable = "PATTERNS_DIR";

    /**
     * @brief Builds the configuration from environment variables.
     * @return ServerConfig with the pattern directory.
     * An empty value is accepted; it names no readable directory, so the
     * library simply loads zero patterns.
     * @throws std::runtime_error if PATTERNS_DIR is unset.
     */
    static ServerConfig LoadFromEnvironment();

    /**
     * @brief Reads a single environment variable.
     * @return The value (possibly empty), or nullopt when it is unset.
     */
    static std::optional<std::string> GetEnv(const char* name);
};

} // namespace patternkeeper::infrastructure
