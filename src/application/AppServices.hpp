/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/PatternQueryService.hpp"
#include "application/PatternAuthoringService.hpp"
#include "application/PatternToolService.hpp"
#include "domain/PatternRepository.hpp"

namespace patternkeeper::application {

struct AppServices {
    std::shared_ptr<domain::PatternRepository> repository;
    std::shared_ptr<const PatternQueryService> queryService;
    std::shared_ptr<PatternAuthoringService> authoringService;
    std::shared_ptr<PatternToolService> toolService;
};

} // namespace patternkeeper::application
