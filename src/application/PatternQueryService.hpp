/**
 * @file PatternQueryService.hpp
 * @brief Read-only queries over the pattern collection loaded at startup.
 */

#pragma once

#include "domain/Pattern.hpp"
#include "domain/SearchCriteria.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patternkeeper::application {

/** @brief Immutable snapshot shared by every reader. */
using PatternCollection = std::shared_ptr<const std::vector<domain::Pattern>>;

/**
 * @class PatternQueryService
 * @brief Linear-scan queries over a snapshot that never changes after construction.
 *
 * Patterns written after the snapshot was taken are not visible until the
 * collection is reloaded. Concurrent calls need no locking.
 */
class PatternQueryService {
public:
    /** @brief Maximum number of characters of content in a search hit. */
    static constexpr std::size_t kExcerptLength = 200;

    struct Summary {
        std::string name;
        std::string category;
    };

    struct SearchHit {
        std::string name;
        std::string excerpt; ///< First kExcerptLength characters of the content.
    };

    explicit PatternQueryService(PatternCollection patterns);

    /** @brief Name and category of every pattern, in collection order. */
    std::vector<Summary> List() const;

    /** @brief Patterns matching every supplied criterion, in collection order. */
    std::vector<SearchHit> Search(const domain::SearchCriteria& criteria) const;

    /** @brief First pattern whose name equals the argument exactly. */
    std::optional<domain::Pattern> FindByName(const std::string& name) const;

    /** @brief Number of patterns in the snapshot. */
    std::size_t Count() const { return m_patterns->size(); }

    /** @brief True if the pattern satisfies every criterion that is set. */
    static bool Matches(const domain::Pattern& pattern, const domain::SearchCriteria& criteria);

private:
    PatternCollection m_patterns;
};

} // namespace patternkeeper::application
