#include "infrastructure/PatternDocumentSerializer.hpp"
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace patternkeeper::infrastructure {

std::string PatternDocumentSerializer::Serialize(const domain::PatternDraft& draft) {
    std::ostringstream out;
    out << "---\n";
    out << "pattern: " << EmitScalar(draft.name) << "\n";
    out << "category: " << EmitScalar(draft.category) << "\n";
    out << "framework: " << EmitScalar(draft.framework) << "\n";
    if (draft.projects && !draft.projects->empty()) {
        out << "projects: " << EmitFlowList(*draft.projects) << "\n";
    }
    if (!draft.tags.empty()) {
        out << "tags: " << EmitFlowList(draft.tags) << "\n";
    }
    out << "---\n\n";
    out << draft.content << "\n";
    return out.str();
}

std::string PatternDocumentSerializer::EmitScalar(const std::string& value) {
    YAML::Emitter emitter;
    emitter << value;
    return emitter.c_str();
}

std::string PatternDocumentSerializer::EmitFlowList(const std::vector<std::string>& values) {
    YAML::Emitter emitter;
    emitter << YAML::Flow << YAML::BeginSeq;
    for (const auto& value : values) {
        emitter << value;
    }
    emitter << YAML::EndSeq;
    return emitter.c_str();
}

} // namespace patternkeeper::infrastructure
