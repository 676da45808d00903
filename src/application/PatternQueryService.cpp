/**
 * @file PatternQueryService.cpp
 * @brief Implementation of the PatternQueryService class.
 */

#include "application/PatternQueryService.hpp"
#include "domain/TextUtils.hpp"

namespace patternkeeper::application {

using domain::TextUtils;

PatternQueryService::PatternQueryService(PatternCollection patterns)
    : m_patterns(patterns ? std::move(patterns) : PatternCollection(std::make_shared<std::vector<domain::Pattern>>())) {}

std::vector<PatternQueryService::Summary> PatternQueryService::List() const {
    std::vector<Summary> summaries;
    summaries.reserve(m_patterns->size());
    for (const auto& pattern : *m_patterns) {
        summaries.push_back({pattern.getName(), pattern.getMetadata().category});
    }
    return summaries;
}

bool PatternQueryService::Matches(const domain::Pattern& pattern, const domain::SearchCriteria& criteria) {
    const auto& meta = pattern.getMetadata();

    if (criteria.category && meta.category != *criteria.category) return false;
    if (criteria.framework && meta.framework != criteria.framework) return false;
    if (criteria.tag && !pattern.hasTag(*criteria.tag)) return false;

    if (criteria.query) {
        std::string searchable = TextUtils::ToLower(meta.pattern + " " + pattern.getContent());
        if (searchable.find(TextUtils::ToLower(*criteria.query)) == std::string::npos) return false;
    }
    return true;
}

std::vector<PatternQueryService::SearchHit> PatternQueryService::Search(const domain::SearchCriteria& criteria) const {
    std::vector<SearchHit> hits;
    for (const auto& pattern : *m_patterns) {
        if (Matches(pattern, criteria)) {
            hits.push_back({pattern.getName(), TextUtils::Utf8Prefix(pattern.getContent(), kExcerptLength)});
        }
    }
    return hits;
}

std::optional<domain::Pattern> PatternQueryService::FindByName(const std::string& name) const {
    for (const auto& pattern : *m_patterns) {
        if (pattern.getName() == name) {
            return pattern;
        }
    }
    return std::nullopt;
}

} // namespace patternkeeper::application
