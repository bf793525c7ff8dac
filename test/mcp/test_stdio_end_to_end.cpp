#include <catch2/catch_test_macros.hpp>

#include <mcp_agent/agent/tool_registry.hpp>
#include <mcp_agent/mcp/mcp_client.hpp>
#include <mcp_agent/mcp/stdio_connector.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace mcp_agent;
using nlohmann::json;

// These tests launch the echo_mcp_server fixture built next to the test
// binary; CMake passes its path in MCP_AGENT_ECHO_SERVER.

namespace {

ToolProviderSpec EchoServer(std::map<std::string, std::string> env = {}) {
    return ToolProviderSpec{MCP_AGENT_ECHO_SERVER, {}, std::move(env)};
}

std::unique_ptr<IToolProvider> ConnectOrFail(StdioProviderConnector& connector,
                                             const ToolProviderSpec& spec) {
    auto connected = connector.Connect(spec);
    REQUIRE(connected.IsOk());
    return std::move(connected).Value();
}

std::string FirstText(const json& tool_result) {
    return tool_result.at("content").at(0).at("text").get<std::string>();
}

} // anonymous namespace

TEST_CASE("Echo server: handshake, listing and calls", "[mcp][e2e]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));
    auto provider = ConnectOrFail(connector, EchoServer());

    auto tools = provider->ListTools();
    REQUIRE(tools.IsOk());
    REQUIRE(tools.Value().size() == 3);
    CHECK(tools.Value()[0].name == "echo");
    CHECK(tools.Value()[1].name == "add");
    CHECK(tools.Value()[2].name == "fail");
    CHECK(tools.Value()[0].input_schema["required"] == json::array({"text"}));

    auto sum = provider->CallTool("add", {{"a", 2}, {"b", 2}});
    REQUIRE(sum.IsOk());
    CHECK(FirstText(sum.Value()) == "4");

    auto failed = provider->CallTool("fail", json::object());
    REQUIRE(failed.IsOk());
    CHECK(failed.Value()["isError"] == true);

    auto missing = provider->CallTool("search", json::object());
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().kind == ToolCallFailure::Kind::NotPresent);

    provider->Close();
    auto after = provider->CallTool("echo", {{"text", "x"}});
    REQUIRE(after.IsErr());
    CHECK(after.Error().error.category == ErrorCategory::Connection);
}

TEST_CASE("Echo server: paginated tool listing", "[mcp][e2e]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));
    auto provider = ConnectOrFail(connector, EchoServer({{"ECHO_SERVER_PAGE", "1"}}));

    auto tools = provider->ListTools();
    REQUIRE(tools.IsOk());
    REQUIRE(tools.Value().size() == 3);
    CHECK(tools.Value()[2].name == "fail");
}

TEST_CASE("Echo server: banner lines and notifications are tolerated", "[mcp][e2e]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));
    auto provider = ConnectOrFail(connector, EchoServer({{"ECHO_SERVER_NOISE", "1"}}));

    auto echoed = provider->CallTool("echo", {{"text", "hello"}});
    REQUIRE(echoed.IsOk());
    CHECK(FirstText(echoed.Value()) == "hello");
}

TEST_CASE("Echo server: exit during initialize fails the handshake", "[mcp][e2e]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));

    auto connected = connector.Connect(EchoServer({{"ECHO_SERVER_EXIT_ON_INIT", "1"}}));
    REQUIRE(connected.IsErr());
    CHECK(connected.Error().category == ErrorCategory::Connection);
    CHECK(connected.Error().message.rfind("MCP handshake failed: ", 0) == 0);
}

TEST_CASE("Echo server: unknown command fails to connect", "[mcp][e2e]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));

    auto connected = connector.Connect(ToolProviderSpec{"/nonexistent/server", {}, {}});
    REQUIRE(connected.IsErr());
    CHECK(connected.Error().category == ErrorCategory::Connection);
}

TEST_CASE("Echo server: first registered provider wins a shared tool name",
          "[mcp][e2e][registry]") {
    Logger logger(nullptr);
    StdioProviderConnector connector(logger, std::chrono::seconds(5));
    auto first = ConnectOrFail(connector, EchoServer({{"ECHO_SERVER_TAG", "P1"},
                                                      {"ECHO_SERVER_TOOLS", "echo"}}));
    auto second = ConnectOrFail(connector, EchoServer({{"ECHO_SERVER_TAG", "P2"}}));

    ToolRegistry registry(logger);
    for (auto* provider : {first.get(), second.get()}) {
        auto tools = provider->ListTools();
        REQUIRE(tools.IsOk());
        registry.Register(*provider, std::move(tools).Value());
    }

    auto catalog = registry.AllTools();
    REQUIRE(catalog.size() == 4);
    CHECK(catalog[0].name == "echo");
    CHECK(catalog[1].name == "echo");

    auto echoed = registry.Dispatch("echo", {{"text", "hi"}});
    REQUIRE(echoed.IsOk());
    CHECK(FirstText(echoed.Value()) == "P1:hi");

    // Only the second provider serves "add"; the first rejects it as unknown.
    auto sum = registry.Dispatch("add", {{"a", 1.5}, {"b", 2}});
    REQUIRE(sum.IsOk());
    CHECK(FirstText(sum.Value()) == "3.5");

    auto missing = registry.Dispatch("search", json::object());
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::NotFound);

    first->Close();
    second->Close();
}
