#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/McpServer.hpp"
#include "app/PatternKeeperApp.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace patternkeeper;

namespace {

json Call(app::McpServer& server, int id, const std::string& tool, const json& arguments) {
    return server.HandleRequest({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", tool}, {"arguments", arguments}}}
    });
}

std::string TextOf(const json& response) {
    assert(response.contains("result"));
    assert(response["result"]["isError"] == false);
    return response["result"]["content"][0]["text"].get<std::string>();
}

int ErrorCode(const json& response) {
    assert(response.contains("error"));
    return response["error"]["code"].get<int>();
}

static_assert(!std::is_copy_constructible<app::McpServer>::value, "handlers are bound to one instance");
static_assert(!std::is_move_constructible<app::McpServer>::value, "handlers are bound to one instance");

} // namespace

int main() {
    std::cout << "[Test] Starting McpServer Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "patternkeeper_test_mcp";
    fs::remove_all(root);
    fs::create_directories(root);
    {
        std::ofstream out(root / "retry-backoff.md");
        out << "---\npattern: retry-backoff\ncategory: resilience\ntags: [go, retry]\n---\n\nBackoff body\n";
    }

    infrastructure::ServerConfig config;
    config.patternsDir = root;
    app::PatternKeeperApp patternKeeper(config);
    app::McpServer server(patternKeeper.GetServices().toolService);

    // initialize
    json init = server.HandleRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}});
    assert(init["id"] == 1);
    assert(init["result"]["protocolVersion"] == "2024-11-05");
    assert(init["result"]["capabilities"].contains("tools"));
    assert(init["result"]["serverInfo"]["name"] == "patternkeeper");

    // notifications get no response
    assert(server.HandleRequest({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).is_null());

    // tools/list
    json list = server.HandleRequest({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    std::vector<std::string> names;
    for (const auto& tool : list["result"]["tools"]) {
        names.push_back(tool["name"].get<std::string>());
        assert(tool["inputSchema"]["type"] == "object");
    }
    assert(names == std::vector<std::string>({"list_patterns", "search_patterns", "get_pattern", "create_pattern"}));

    // Tools
    assert(TextOf(Call(server, 3, "list_patterns", json::object())) == "- retry-backoff (resilience)");
    assert(TextOf(Call(server, 4, "search_patterns", {{"tag", "retry"}})) == "**retry-backoff**\nBackoff body");
    assert(TextOf(Call(server, 5, "search_patterns", {{"query", "BACKOFF"}, {"category", nullptr}})) == "**retry-backoff**\nBackoff body");
    assert(TextOf(Call(server, 6, "search_patterns", {{"tag", "circuit-breaker"}})) == "No patterns found.");
    assert(TextOf(Call(server, 7, "get_pattern", {{"pattern_name", "retry-backoff"}})) == "Backoff body");
    assert(TextOf(Call(server, 8, "get_pattern", {{"pattern_name", "missing"}})) == "Pattern 'missing' not found.");

    json created = Call(server, 9, "create_pattern", {
        {"pattern_name", "new-pattern"},
        {"category", "testing"},
        {"framework", "none"},
        {"tag", json::array()},
        {"content", "Fresh"}
    });
    assert(TextOf(created).find("Pattern 'new-pattern' created at ") == 0);
    assert(fs::exists(root / "new-pattern.md"));

    // Error mapping
    json invalidName = Call(server, 10, "create_pattern", {
        {"pattern_name", "bad name"},
        {"category", "c"},
        {"framework", "f"},
        {"tag", json::array()},
        {"content", "x"}
    });
    assert(ErrorCode(invalidName) == app::rpc_error::INVALID_PARAMS);
    assert(invalidName["id"] == 10);
    assert(invalidName["error"]["message"] == "Pattern name can only contain alphanumeric, dash and underscore characters");

    assert(ErrorCode(Call(server, 11, "get_pattern", json::object())) == app::rpc_error::INVALID_PARAMS);
    assert(ErrorCode(Call(server, 12, "search_patterns", {{"tag", 5}})) == app::rpc_error::INVALID_PARAMS);
    assert(ErrorCode(Call(server, 13, "no_such_tool", json::object())) == app::rpc_error::INVALID_PARAMS);
    assert(ErrorCode(server.HandleRequest({{"jsonrpc", "2.0"}, {"id", 14}, {"method", "resources/read"}})) == app::rpc_error::METHOD_NOT_FOUND);
    assert(ErrorCode(server.HandleRequest({{"id", 15}, {"method", "ping"}})) == app::rpc_error::INVALID_REQUEST);
    assert(ErrorCode(server.HandleLine("{not json")) == app::rpc_error::PARSE_ERROR);

    // Write failure maps to an internal error
    fs::path missingRoot = root / "missing-subdir";
    infrastructure::ServerConfig missingConfig;
    missingConfig.patternsDir = missingRoot;
    app::PatternKeeperApp orphan(missingConfig);
    app::McpServer orphanServer(orphan.GetServices().toolService);
    json failed = Call(orphanServer, 16, "create_pattern", {
        {"pattern_name", "orphan"},
        {"category", "c"},
        {"framework", "f"},
        {"tag", {"x"}},
        {"content", "x"}
    });
    assert(ErrorCode(failed) == app::rpc_error::INTERNAL_ERROR);

    // Stream loop: one response per request line, none for notifications and blank lines
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"list_patterns\"}}\n");
    std::ostringstream out;
    server.Run(in, out);

    std::istringstream responses(out.str());
    std::string line;
    std::vector<json> frames;
    while (std::getline(responses, line)) frames.push_back(json::parse(line));
    assert(frames.size() == 2);
    assert(frames[0]["id"] == 1 && frames[0]["result"].empty());
    assert(frames[1]["id"] == 2);
    assert(frames[1]["result"]["content"][0]["text"] == "- retry-backoff (resilience)");

    // A document with Latin-1 bytes is skipped and the loop keeps answering
    fs::path mixedRoot = fs::temp_directory_path() / "patternkeeper_test_mcp_latin1";
    fs::remove_all(mixedRoot);
    fs::create_directories(mixedRoot);
    {
        std::ofstream latin1(mixedRoot / "latin1.md", std::ios::binary);
        latin1 << "---\npattern: caf\xE9\ncategory: c\n---\nbody \xE9\n";
        std::ofstream good(mixedRoot / "good.md", std::ios::binary);
        good << "---\npattern: good\ncategory: c\n---\nGood body\n";
    }
    infrastructure::ServerConfig mixedConfig;
    mixedConfig.patternsDir = mixedRoot;
    app::PatternKeeperApp mixed(mixedConfig);
    app::McpServer mixedServer(mixed.GetServices().toolService);

    std::istringstream mixedIn(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"list_patterns\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"search_patterns\",\"arguments\":{\"query\":\"body\"}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
    std::ostringstream mixedOut;
    mixedServer.Run(mixedIn, mixedOut);

    std::istringstream mixedResponses(mixedOut.str());
    frames.clear();
    while (std::getline(mixedResponses, line)) frames.push_back(json::parse(line));
    assert(frames.size() == 3);
    assert(frames[0]["result"]["content"][0]["text"] == "- good (c)");
    assert(frames[1]["result"]["content"][0]["text"] == "**good**\nGood body");
    assert(frames[2]["id"] == 3 && frames[2]["result"].empty());

    fs::remove_all(mixedRoot);
    fs::remove_all(root);
    std::cout << "[PASS] McpServer Test." << std::endl;
    return 0;
}
