/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace patternkeeper::infrastructure {

namespace fs = std::filesystem;

fs::path AtomicFileWriter::MakeTempPath(const fs::path& finalPath) {
    // filename.<timestamp>-<seq>.tmp, unique per write within the process
    static std::atomic<unsigned long> sequence{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(sequence++) + ".tmp";
    return tempPath;
}

void AtomicFileWriter::Write(const fs::path& finalPath, const std::string& content) {
    fs::path tempPath = MakeTempPath(finalPath);

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("cannot open " + tempPath.string() + ": " + std::strerror(errno));
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            int err = errno;
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("write failed for " + tempPath.string() + ": " + std::strerror(err));
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("rename to " + finalPath.string() + " failed: " + ec.message());
    }
}

} // namespace patternkeeper::infrastructure
