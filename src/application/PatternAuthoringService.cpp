#include "application/PatternAuthoringService.hpp"
#include "domain/PatternNameValidator.hpp"

namespace patternkeeper::application {

PatternAuthoringService::PatternAuthoringService(std::shared_ptr<domain::PatternRepository> repo)
    : m_repo(std::move(repo)) {}

std::filesystem::path PatternAuthoringService::CreatePattern(const domain::PatternDraft& draft) {
    domain::PatternNameValidator::Validate(draft.name);
    return m_repo->save(draft);
}

} // namespace patternkeeper::application
