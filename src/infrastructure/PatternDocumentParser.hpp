/**
 * @file PatternDocumentParser.hpp
 * @brief Parser for pattern documents (YAML header block + markdown body).
 */

#pragma once
#include <string>
#include <optional>
#include <filesystem>
#include "domain/Pattern.hpp"

namespace patternkeeper::infrastructure {

/**
 * @class PatternDocumentParser
 * @brief Stateless parser. Malformed input yields std::nullopt, never an exception.
 *
 * Expected layout:
 * @code
 * ---
 * pattern: retry-backoff
 * category: resilience
 * tags: [go, retry]
 * ---
 *
 * Body text...
 * @endcode
 */
class PatternDocumentParser {
public:
    /**
     * @brief Parses raw document text.
     * @param text Full document.
     * @param origin File the text came from, kept on the resulting Pattern.
     * @return The pattern, or nullopt if the text is not UTF-8, a delimiter is missing or the header is invalid.
     */
    static std::optional<domain::Pattern> Parse(const std::string& text, const std::filesystem::path& origin);

    /** @brief Reads and parses a file; unreadable files yield nullopt. */
    static std::optional<domain::Pattern> ParseFile(const std::filesystem::path& path);

    /** @brief Parses only the header block into metadata. */
    static std::optional<domain::Pattern::Metadata> ParseHeader(const std::string& header);
};

} // namespace patternkeeper::infrastructure
