/**
 * @file PatternDocumentSerializer.hpp
 * @brief Renders a PatternDraft into the canonical on-disk document.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Pattern.hpp"

namespace patternkeeper::infrastructure {

class PatternDocumentSerializer {
public:
    /**
     * @brief Builds the document text.
     *
     * pattern, category and framework lines are always written; projects and
     * tags only when non-empty. Values are quoted by yaml-cpp when plain style
     * would not read back as the same string.
     */
    static std::string Serialize(const domain::PatternDraft& draft);

private:
    static std::string EmitScalar(const std::string& value);
    static std::string EmitFlowList(const std::vector<std::string>& values);
};

} // namespace patternkeeper::infrastructure
