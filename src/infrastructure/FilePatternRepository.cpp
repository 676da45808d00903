/**
 * @file FilePatternRepository.cpp
 * @brief Implementation of the FilePatternRepository class.
 */
#include "infrastructure/FilePatternRepository.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PatternDocumentParser.hpp"
#include "infrastructure/PatternDocumentSerializer.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace patternkeeper::infrastructure {

FilePatternRepository::FilePatternRepository(fs::path patternsDir)
    : m_patternsDir(std::move(patternsDir)) {}

std::vector<domain::Pattern> FilePatternRepository::loadAll() {
    std::vector<domain::Pattern> patterns;
    std::unordered_set<std::string> seenNames;

    std::error_code ec;
    for (fs::directory_iterator it(m_patternsDir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        if (path.extension() != kDocumentExtension) continue;

        auto pattern = PatternDocumentParser::ParseFile(path);
        if (!pattern) {
            std::cerr << "[FilePatternRepository] Skipping unreadable or malformed document: " << path << std::endl;
            continue;
        }

        if (!seenNames.insert(pattern->getName()).second) {
            std::cerr << "[FilePatternRepository] Duplicate pattern name '" << pattern->getName()
                      << "' in " << path << "; lookups return the first one loaded." << std::endl;
        }
        patterns.push_back(std::move(*pattern));
    }

    if (ec) {
        std::cerr << "[FilePatternRepository] Cannot read pattern directory " << m_patternsDir
                  << ": " << ec.message() << std::endl;
    }
    return patterns;
}

fs::path FilePatternRepository::documentPathFor(const std::string& name) const {
    return m_patternsDir / (name + kDocumentExtension);
}

fs::path FilePatternRepository::save(const domain::PatternDraft& draft) {
    fs::path target = documentPathFor(draft.name);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        std::cerr << "[FilePatternRepository] Overwriting existing pattern document: " << target << std::endl;
    }

    try {
        AtomicFileWriter::Write(target, PatternDocumentSerializer::Serialize(draft));
    } catch (const std::runtime_error& e) {
        std::cerr << "[FilePatternRepository] Write failed: " << e.what() << std::endl;
        throw std::runtime_error(std::string("Failed to create pattern: ") + e.what());
    }
    return target;
}

} // namespace patternkeeper::infrastructure
