/**
 * @file PatternToolService.cpp
 * @brief Implementation of the PatternToolService class.
 */

#include "application/PatternToolService.hpp"
#include <sstream>

namespace patternkeeper::application {

PatternToolService::PatternToolService(std::shared_ptr<const PatternQueryService> queries,
                                       std::shared_ptr<PatternAuthoringService> authoring)
    : m_queries(std::move(queries)), m_authoring(std::move(authoring)) {}

std::string PatternToolService::ListPatterns() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& summary : m_queries->List()) {
        if (!first) out << "\n";
        out << "- " << summary.name << " (" << summary.category << ")";
        first = false;
    }
    return out.str();
}

std::string PatternToolService::SearchPatterns(const domain::SearchCriteria& criteria) const {
    auto hits = m_queries->Search(criteria);
    if (hits.empty()) {
        return "No patterns found.";
    }

    std::ostringstream out;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (i > 0) out << "\n\n";
        out << "**" << hits[i].name << "**\n" << hits[i].excerpt;
    }
    return out.str();
}

std::string PatternToolService::GetPattern(const std::string& name) const {
    auto pattern = m_queries->FindByName(name);
    if (!pattern) {
        return "Pattern '" + name + "' not found.";
    }
    return pattern->getContent();
}

std::string PatternToolService::CreatePattern(const domain::PatternDraft& draft) {
    auto path = m_authoring->CreatePattern(draft);
    std::ostringstream out;
    out << "Pattern '" << draft.name << "' created at " << path;
    return out.str();
}

} // namespace patternkeeper::application
