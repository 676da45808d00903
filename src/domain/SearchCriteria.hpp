/**
 * @file SearchCriteria.hpp
 * @brief Value object describing a conjunctive pattern filter.
 */

#pragma once
#include <string>
#include <optional>

namespace patternkeeper::domain {

/**
 * @struct SearchCriteria
 * @brief Every supplied field must match; unset fields do not constrain the result.
 */
struct SearchCriteria {
    std::optional<std::string> query;     ///< Case-insensitive substring of "name content".
    std::optional<std::string> category;  ///< Exact, case-sensitive.
    std::optional<std::string> framework; ///< Exact, case-sensitive.
    std::optional<std::string> tag;       ///< Exact member of the tag list.

    bool isEmpty() const {
        return !query && !category && !framework && !tag;
    }
};

} // namespace patternkeeper::domain
