/**
 * @file McpServer.cpp
 * @brief Implementation of the McpServer class.
 */

#include "app/McpServer.hpp"
#include "domain/Pattern.hpp"
#include "domain/SearchCriteria.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>

namespace patternkeeper::app {

namespace {

constexpr const char* kInstructions =
    "I manage a library of software development patterns stored as markdown files with YAML frontmatter.\n"
    "Use me to discover, search, and create reusable code patterns and architectural solutions.\n\n"
    "Available operations:\n"
    "- list_patterns: Get overview of all available patterns\n"
    "- search_patterns: Find patterns by text, category, framework, or tags\n"
    "- get_pattern: Retrieve full content of a specific pattern\n"
    "- create_pattern: Add new patterns with proper metadata\n\n"
    "Patterns include categories like 'rust', 'aws', 'web' and frameworks like 'axum', 'lambda'.\n"
    "Each pattern contains implementation details, best practices, and usage examples.\n\n"
    "When creating patterns, include relevant tags and specify which projects used them for better discoverability.\n"
    "New patterns are written to disk immediately but only show up in list/search/get after a restart.";

bool IsUnset(const json& args, const char* key) {
    return !args.contains(key) || args[key].is_null();
}

std::optional<std::string> OptionalString(const json& args, const char* key) {
    if (IsUnset(args, key)) return std::nullopt;
    if (!args[key].is_string()) {
        throw std::invalid_argument(std::string("Argument '") + key + "' must be a string");
    }
    return args[key].get<std::string>();
}

std::string RequiredString(const json& args, const char* key) {
    if (IsUnset(args, key)) {
        throw std::invalid_argument(std::string("Missing required argument '") + key + "'");
    }
    return *OptionalString(args, key);
}

std::optional<std::vector<std::string>> OptionalStringList(const json& args, const char* key) {
    if (IsUnset(args, key)) return std::nullopt;
    const json& value = args[key];
    if (!value.is_array()) {
        throw std::invalid_argument(std::string("Argument '") + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string("Argument '") + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::vector<std::string> RequiredStringList(const json& args, const char* key) {
    auto items = OptionalStringList(args, key);
    if (!items) {
        throw std::invalid_argument(std::string("Missing required argument '") + key + "'");
    }
    return *items;
}

json StringProperty(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

json StringArrayProperty(const char* description) {
    return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", description}};
}

} // namespace

McpServer::McpServer(std::shared_ptr<application::PatternToolService> tools, std::string serverName)
    : m_tools(std::move(tools)), m_serverName(std::move(serverName)) {
    RegisterTools();
}

void McpServer::RegisterTools() {
    m_schemas.push_back({
        "list_patterns",
        "List all available patterns",
        {{"type", "object"}, {"properties", json::object()}}
    });
    m_handlers["list_patterns"] = [this](const json&) { return m_tools->ListPatterns(); };

    m_schemas.push_back({
        "search_patterns",
        "Search patterns by query, category, framework or tag",
        {
            {"type", "object"},
            {"properties", {
                {"query", StringProperty("Text Search")},
                {"category", StringProperty("Filter by category")},
                {"framework", StringProperty("Filter by framework")},
                {"tag", StringProperty("Filter by tag")}
            }}
        }
    });
    m_handlers["search_patterns"] = [this](const json& args) {
        domain::SearchCriteria criteria;
        criteria.query = OptionalString(args, "query");
        criteria.category = OptionalString(args, "category");
        criteria.framework = OptionalString(args, "framework");
        criteria.tag = OptionalString(args, "tag");
        return m_tools->SearchPatterns(criteria);
    };

    m_schemas.push_back({
        "get_pattern",
        "Get the pattern based on the pattern name",
        {
            {"type", "object"},
            {"properties", {{"pattern_name", StringProperty("Pattern Name")}}},
            {"required", {"pattern_name"}}
        }
    });
    m_handlers["get_pattern"] = [this](const json& args) {
        return m_tools->GetPattern(RequiredString(args, "pattern_name"));
    };

    m_schemas.push_back({
        "create_pattern",
        "Create patterns by providing, category, framework, projects this pattern was used in, tags, "
        "and the content. Look to existing patterns for examples on how this should look",
        {
            {"type", "object"},
            {"properties", {
                {"pattern_name", StringProperty("Pattern name")},
                {"category", StringProperty("Pattern category")},
                {"framework", StringProperty("Pattern framework")},
                {"projects", StringArrayProperty("Projects in which these patterns were used")},
                {"tag", StringArrayProperty("Pattern tags")},
                {"content", StringProperty("Pattern content")}
            }},
            {"required", {"pattern_name", "category", "framework", "tag", "content"}}
        }
    });
    m_handlers["create_pattern"] = [this](const json& args) {
        domain::PatternDraft draft;
        draft.name = RequiredString(args, "pattern_name");
        draft.category = RequiredString(args, "category");
        draft.framework = RequiredString(args, "framework");
        draft.projects = OptionalStringList(args, "projects");
        draft.tags = RequiredStringList(args, "tag");
        draft.content = RequiredString(args, "content");
        return m_tools->CreatePattern(draft);
    };
}

void McpServer::Run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        json response = HandleLine(line);
        if (!response.is_null()) {
            // Invalid UTF-8 in a payload is replaced rather than thrown
            out << response.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
            out.flush();
        }
    }
}

json McpServer::HandleLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        std::cerr << "[McpServer] Parse error: " << e.what() << std::endl;
        return MakeError(nullptr, rpc_error::PARSE_ERROR, std::string("Parse error: ") + e.what());
    }
    return HandleRequest(request);
}

json McpServer::HandleRequest(const json& request) {
    if (!request.is_object()) {
        return MakeError(nullptr, rpc_error::INVALID_REQUEST, "Request must be a JSON object");
    }

    json id = request.value("id", json());
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return MakeError(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return MakeError(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    std::string method = request["method"].get<std::string>();
    bool isNotification = !request.contains("id");
    if (isNotification || method.rfind("notifications/", 0) == 0) {
        return json();
    }

    json params = request.value("params", json::object());

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "ping") {
        return MakeResult(id, json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }

    return MakeError(id, rpc_error::METHOD_NOT_FOUND, "Unknown method: " + method);
}

json McpServer::HandleInitialize(const json& id) const {
    json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", m_serverName}, {"version", kServerVersion}}},
        {"instructions", kInstructions}
    };
    return MakeResult(id, result);
}

json McpServer::HandleToolsList(const json& id) const {
    json tools = json::array();
    for (const auto& tool : m_schemas) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.inputSchema}
        });
    }
    return MakeResult(id, {{"tools", tools}});
}

json McpServer::HandleToolsCall(const json& params, const json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }

    std::string name = params["name"].get<std::string>();
    auto it = m_handlers.find(name);
    if (it == m_handlers.end()) {
        return MakeError(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }

    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) arguments = json::object();
    if (!arguments.is_object()) {
        return MakeError(id, rpc_error::INVALID_PARAMS, "Tool arguments must be an object");
    }

    try {
        std::string text = it->second(arguments);
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", text}});
        return MakeResult(id, {{"content", content}, {"isError", false}});
    } catch (const std::invalid_argument& e) {
        return MakeError(id, rpc_error::INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[McpServer] Tool '" << name << "' failed: " << e.what() << std::endl;
        return MakeError(id, rpc_error::INTERNAL_ERROR, e.what());
    }
}

json McpServer::MakeResult(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json McpServer::MakeError(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace patternkeeper::app
