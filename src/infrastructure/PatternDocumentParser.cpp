/**
 * @file PatternDocumentParser.cpp
 * @brief Implementation of PatternDocumentParser.
 */

#include "infrastructure/PatternDocumentParser.hpp"
#include "domain/TextUtils.hpp"
#include <fstream>
#include <iterator>
#include <yaml-cpp/yaml.h>

namespace patternkeeper::infrastructure {

namespace {

const std::string kOpeningDelimiter = "---\n";
const std::string kClosingDelimiter = "\n---\n";

bool IsAbsent(const YAML::Node& node) {
    return !node.IsDefined() || node.IsNull();
}

// Required keys must be non-empty scalars.
std::optional<std::string> ReadRequiredString(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (IsAbsent(node) || !node.IsScalar()) return std::nullopt;
    std::string value = node.as<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// Returns false when the key holds something other than a scalar.
bool ReadOptionalString(const YAML::Node& root, const char* key, std::optional<std::string>& out) {
    const YAML::Node node = root[key];
    if (IsAbsent(node)) return true;
    if (!node.IsScalar()) return false;
    out = node.as<std::string>();
    return true;
}

// Returns false when the key holds something other than a sequence of scalars.
bool ReadStringList(const YAML::Node& root, const char* key, std::vector<std::string>& out) {
    const YAML::Node node = root[key];
    if (IsAbsent(node)) return true;
    if (!node.IsSequence()) return false;
    for (const auto& item : node) {
        if (!item.IsScalar()) return false;
        out.push_back(item.as<std::string>());
    }
    return true;
}

} // namespace

std::optional<domain::Pattern::Metadata> PatternDocumentParser::ParseHeader(const std::string& header) {
    try {
        const YAML::Node root = YAML::Load(header);
        if (!root.IsMap()) return std::nullopt;

        auto pattern = ReadRequiredString(root, "pattern");
        auto category = ReadRequiredString(root, "category");
        if (!pattern || !category) return std::nullopt;

        domain::Pattern::Metadata meta;
        meta.pattern = *pattern;
        meta.category = *category;
        if (!ReadOptionalString(root, "framework", meta.framework)) return std::nullopt;
        if (!ReadStringList(root, "projects", meta.projects)) return std::nullopt;
        if (!ReadStringList(root, "tags", meta.tags)) return std::nullopt;
        return meta;
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

std::optional<domain::Pattern> PatternDocumentParser::Parse(const std::string& text, const std::filesystem::path& origin) {
    if (!domain::TextUtils::IsValidUtf8(text)) {
        return std::nullopt;
    }
    if (text.compare(0, kOpeningDelimiter.size(), kOpeningDelimiter) != 0) {
        return std::nullopt;
    }

    std::string rest = text.substr(kOpeningDelimiter.size());
    size_t separator = rest.find(kClosingDelimiter);
    if (separator == std::string::npos) {
        return std::nullopt;
    }

    auto metadata = ParseHeader(rest.substr(0, separator));
    if (!metadata) {
        return std::nullopt;
    }

    std::string body = domain::TextUtils::Trim(rest.substr(separator + kClosingDelimiter.size()));
    return domain::Pattern(std::move(*metadata), std::move(body), origin);
}

std::optional<domain::Pattern> PatternDocumentParser::ParseFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return Parse(content, path);
}

} // namespace patternkeeper::infrastructure
