/**
 * @file FilePatternRepository.hpp
 * @brief Filesystem-based implementation of the PatternRepository.
 */

#pragma once
#include "domain/PatternRepository.hpp"
#include <filesystem>

namespace patternkeeper::infrastructure {

/**
 * @class FilePatternRepository
 * @brief Keeps one markdown document per pattern in a flat directory.
 */
class FilePatternRepository : public domain::PatternRepository {
public:
    /** @brief Extension reserved for pattern documents. */
    static constexpr const char* kDocumentExtension = ".md";

    /**
     * @brief Constructor for FilePatternRepository.
     * @param patternsDir Directory holding the pattern documents. It is not created.
     */
    explicit FilePatternRepository(std::filesystem::path patternsDir);

    /**
     * @brief Parses every *.md entry of the directory.
     * Unreadable directories and malformed documents are logged and skipped.
     * @see domain::PatternRepository::loadAll
     */
    std::vector<domain::Pattern> loadAll() override;

    /**
     * @brief Writes <patternsDir>/<name>.md, overwriting an existing document.
     * The name is expected to have passed PatternNameValidator already.
     * @see domain::PatternRepository::save
     */
    std::filesystem::path save(const domain::PatternDraft& draft) override;

    /** @brief Location the document for a given pattern name would have. */
    std::filesystem::path documentPathFor(const std::string& name) const;

private:
    std::filesystem::path m_patternsDir; ///< Directory scanned on load and written on save.
};

} // namespace patternkeeper::infrastructure
