/**
 * @file AtomicFileWriter.hpp
 * @brief Synchronous temp-file-then-rename writes.
 */

#pragma once
#include <string>
#include <filesystem>

namespace patternkeeper::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a file so that readers see either the old or the new content, never a partial one.
 *
 * The parent directory must already exist; it is not created here.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces finalPath with content.
     * @throws std::runtime_error describing the failing step and its cause.
     */
    static void Write(const std::filesystem::path& finalPath, const std::string& content);

private:
    static std::filesystem::path MakeTempPath(const std::filesystem::path& finalPath);
};

} // namespace patternkeeper::infrastructure
