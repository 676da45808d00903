/**
 * @file PatternToolService.hpp
 * @brief Text rendering of the four pattern operations exposed to clients.
 */

#pragma once

#include "application/PatternAuthoringService.hpp"
#include "application/PatternQueryService.hpp"
#include <memory>
#include <string>

namespace patternkeeper::application {

/**
 * @class PatternToolService
 * @brief Turns query and authoring results into the payloads returned to tool callers.
 *
 * "No matches" and "not found" are rendered as normal text, never as errors.
 */
class PatternToolService {
public:
    PatternToolService(std::shared_ptr<const PatternQueryService> queries,
                       std::shared_ptr<PatternAuthoringService> authoring);

    /** @brief "- <name> (<category>)" lines joined by newlines. */
    std::string ListPatterns() const;

    /** @brief "**<name>**\n<excerpt>" blocks separated by blank lines, or "No patterns found.". */
    std::string SearchPatterns(const domain::SearchCriteria& criteria) const;

    /** @brief Full content, or "Pattern '<name>' not found.". */
    std::string GetPattern(const std::string& name) const;

    /**
     * @brief Writes a new pattern and confirms where it went.
     * @throws std::invalid_argument on an invalid name.
     * @throws std::runtime_error on I/O failure.
     */
    std::string CreatePattern(const domain::PatternDraft& draft);

private:
    std::shared_ptr<const PatternQueryService> m_queries;
    std::shared_ptr<PatternAuthoringService> m_authoring;
};

} // namespace patternkeeper::application
