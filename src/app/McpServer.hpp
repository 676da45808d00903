/**
 * @file McpServer.hpp
 * @brief Model Context Protocol server: JSON-RPC 2.0, one message per line.
 */

#pragma once

#include "application/PatternToolService.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace patternkeeper::app {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace rpc_error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

/**
 * @class McpServer
 * @brief Routes MCP requests to the pattern tools.
 *
 * Tool handlers report rejected input with std::invalid_argument (mapped to
 * INVALID_PARAMS) and any other failure with std::exception (INTERNAL_ERROR).
 * A failing request never stops the loop.
 */
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerVersion = "0.1.0";

    explicit McpServer(std::shared_ptr<application::PatternToolService> tools,
                       std::string serverName = "patternkeeper");

    // Tool handlers capture this
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;
    McpServer(McpServer&&) = delete;
    McpServer& operator=(McpServer&&) = delete;

    /**
     * @brief Serves requests until the input stream ends.
     * @param in Line-delimited JSON-RPC requests.
     * @param out Line-delimited responses; nothing else is written here.
     */
    void Run(std::istream& in, std::ostream& out);

    /**
     * @brief Handles one decoded message.
     * @return The response, or a null json for notifications.
     */
    json HandleRequest(const json& request);

    /** @brief Handles one raw line, including JSON parse failures. */
    json HandleLine(const std::string& line);

private:
    struct ToolSchema {
        std::string name;
        std::string description;
        json inputSchema;
    };

    using ToolHandler = std::function<std::string(const json&)>;

    void RegisterTools();

    json HandleInitialize(const json& id) const;
    json HandleToolsList(const json& id) const;
    json HandleToolsCall(const json& params, const json& id);

    static json MakeResult(const json& id, const json& result);
    static json MakeError(const json& id, int code, const std::string& message);

    std::shared_ptr<application::PatternToolService> m_tools;
    std::string m_serverName;
    std::vector<ToolSchema> m_schemas;
    std::unordered_map<std::string, ToolHandler> m_handlers;
};

} // namespace patternkeeper::app
