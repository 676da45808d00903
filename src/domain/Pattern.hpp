/**
 * @file Pattern.hpp
 * @brief Domain entity representing a parsed pattern document.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace patternkeeper::domain {

/**
 * @class Pattern
 * @brief Immutable record made of header metadata, the trimmed body and its origin file.
 *
 * Invariant: name and category are never empty.
 */
class Pattern {
public:
    /**
     * @struct Metadata
     * @brief Fields of the document header block.
     */
    struct Metadata {
        std::string pattern;                  ///< Pattern name (identifier chosen by the author).
        std::string category;                 ///< Free-text classification.
        std::optional<std::string> framework; ///< Optional framework label.
        std::vector<std::string> projects;    ///< Projects where the pattern was used.
        std::vector<std::string> tags;        ///< Tags, duplicates kept as written.

        bool operator==(const Metadata& other) const {
            return pattern == other.pattern &&
                   category == other.category &&
                   framework == other.framework &&
                   projects == other.projects &&
                   tags == other.tags;
        }
    };

    Pattern(Metadata metadata, std::string content, std::filesystem::path filepath)
        : m_metadata(std::move(metadata)), m_content(std::move(content)), m_filepath(std::move(filepath)) {}

    /** @brief Returns header metadata. */
    const Metadata& getMetadata() const { return m_metadata; }

    /** @brief Shortcut for the pattern name. */
    const std::string& getName() const { return m_metadata.pattern; }

    /** @brief Returns the body text without the header block. */
    const std::string& getContent() const { return m_content; }

    /** @brief Returns the file the pattern was loaded from. */
    const std::filesystem::path& getFilepath() const { return m_filepath; }

    /** @brief True if the tag list contains an exact match. */
    bool hasTag(const std::string& tag) const {
        for (const auto& t : m_metadata.tags) {
            if (t == tag) return true;
        }
        return false;
    }

private:
    Metadata m_metadata;
    std::string m_content;
    std::filesystem::path m_filepath;
};

/**
 * @struct PatternDraft
 * @brief Input fields for a pattern that has not been written yet.
 */
struct PatternDraft {
    std::string name;
    std::string category;
    std::string framework;
    std::optional<std::vector<std::string>> projects;
    std::vector<std::string> tags;
    std::string content;
};

} // namespace patternkeeper::domain
