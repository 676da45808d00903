/**
 * @file PatternAuthoringService.hpp
 * @brief Creation of new pattern documents.
 */

#pragma once

#include "domain/PatternRepository.hpp"
#include <filesystem>
#include <memory>

namespace patternkeeper::application {

/**
 * @class PatternAuthoringService
 * @brief Validates a draft and hands it to the repository.
 *
 * Writes go straight to storage; the in-memory collection used by
 * PatternQueryService is not touched.
 */
class PatternAuthoringService {
public:
    explicit PatternAuthoringService(std::shared_ptr<domain::PatternRepository> repo);

    /**
     * @brief Validates the name and persists the draft.
     * @return Location of the written document.
     * @throws std::invalid_argument if the name breaks a naming rule (nothing is written).
     * @throws std::runtime_error if the write fails.
     */
    std::filesystem::path CreatePattern(const domain::PatternDraft& draft);

private:
    std::shared_ptr<domain::PatternRepository> m_repo;
};

} // namespace patternkeeper::application
