#include <catch2/catch_test_macros.hpp>

#include "../mocks/mock_completion_client.hpp"
#include "../mocks/mock_tool_provider.hpp"

#include <mcp_agent/agent/agent_orchestrator.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace mcp_agent;
using mcp_agent::testing::MockCompletionClient;
using mcp_agent::testing::MockProviderConnector;
using mcp_agent::testing::MockToolProvider;
using nlohmann::json;

namespace {

AgentConfig ConfigWith(std::vector<std::string> commands) {
    AgentConfig config;
    config.model = "claude-3-5-sonnet-20241022";
    config.max_tokens = 1024;
    config.temperature = 0.0;
    for (auto& c : commands) {
        config.tool_providers.push_back(ToolProviderSpec{std::move(c), {}, {}});
    }
    return config;
}

Task TaskWith(std::string instruction,
              std::optional<json> context = std::nullopt) {
    return Task{std::move(instruction), std::move(context)};
}

} // anonymous namespace

// ===========================================================================
// BuildInitialPrompt
// ===========================================================================

TEST_CASE("BuildInitialPrompt: instruction alone without context", "[agent][orchestrator]") {
    Logger logger(nullptr);
    CHECK(BuildInitialPrompt(TaskWith("What is 2+2?"), logger) == "What is 2+2?");
    CHECK(BuildInitialPrompt(TaskWith("t", json::object()), logger) == "t");
    CHECK(BuildInitialPrompt(TaskWith("t", json(nullptr)), logger) == "t");
}

TEST_CASE("BuildInitialPrompt: context appended as indented JSON", "[agent][orchestrator]") {
    Logger logger(nullptr);
    auto prompt = BuildInitialPrompt(TaskWith("Summarize", json{{"user", "alice"}}), logger);
    CHECK(prompt == "Summarize\n\nAdditional context:\n{\n  \"user\": \"alice\"\n}");
}

TEST_CASE("BuildInitialPrompt: context that cannot be encoded is left out",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    auto prompt = BuildInitialPrompt(
        TaskWith("Summarize", json{{"raw", std::string("\xff\xfe")}}), logger);
    CHECK(prompt == "Summarize");
}

// ===========================================================================
// ProviderConnections
// ===========================================================================

TEST_CASE("ProviderConnections: CloseAll closes every provider once", "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    {
        ProviderConnections connections(logger);
        connections.Add(std::make_unique<MockToolProvider>("a", std::vector<std::string>{}, &journal));
        connections.Add(std::make_unique<MockToolProvider>("b", std::vector<std::string>{}, &journal));
        CHECK(connections.Size() == 2);

        connections.CloseAll();
        CHECK(connections.Size() == 0);
        connections.CloseAll();
    }
    CHECK(journal == std::vector<std::string>{"a:close", "b:close"});
}

TEST_CASE("ProviderConnections: destructor closes what is left", "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    {
        ProviderConnections connections(logger);
        connections.Add(std::make_unique<MockToolProvider>("a", std::vector<std::string>{}, &journal));
    }
    CHECK(journal == std::vector<std::string>{"a:close"});
}

// ===========================================================================
// AgentOrchestrator::Run
// ===========================================================================

TEST_CASE("AgentOrchestrator: 2+2 with no providers", "[agent][orchestrator]") {
    Logger logger(nullptr);
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::TextResponse("4", "end_turn", Usage{14, 1}));
    MockProviderConnector connector;

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({}), TaskWith("What is 2+2?"));

    REQUIRE(result.IsOk());
    const auto& run = result.Value();
    CHECK(run.response == "4");
    CHECK(run.model == "claude-3-5-sonnet-20241022");
    CHECK(run.stop_reason == "end_turn");
    CHECK(run.usage == Usage{14, 1});

    REQUIRE(client.CallCount() == 1);
    CHECK_FALSE(client.Requests()[0].tools.has_value());
    CHECK(client.Requests()[0].messages[0].Text() == "What is 2+2?");
    CHECK(connector.ConnectOrder().empty());
}

TEST_CASE("AgentOrchestrator: search tool round trip", "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::ToolUseResponse(
        "toolu_1", "search", {{"query", "x"}}, "", Usage{20, 8}));
    client.EnqueueResponse(
        MockCompletionClient::TextResponse("The result is y.", "end_turn", Usage{30, 4}));

    MockProviderConnector connector;
    auto* provider = connector.Add(
        "search-server",
        std::make_unique<MockToolProvider>("search-server", std::vector<std::string>{"search"},
                                           &journal));
    provider->EnqueueResult("search", Result<json, ToolCallFailure>::Ok(json{{"result", "y"}}));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"search-server"}), TaskWith("Find x"));

    REQUIRE(result.IsOk());
    CHECK(result.Value().response == "The result is y.");
    CHECK(result.Value().usage == Usage{30, 4});

    REQUIRE(client.CallCount() == 2);
    const auto& first = client.Requests()[0];
    REQUIRE(first.tools.has_value());
    CHECK((*first.tools)[0].name == "search");

    const auto& messages = client.Requests()[1].messages;
    REQUIRE(messages.size() == 3);
    CHECK(messages[1].role == Role::Assistant);
    CHECK(std::get<ToolResultBlock>(messages[2].Blocks()[0]).content == R"({"result":"y"})");

    CHECK(journal == std::vector<std::string>{"search-server:search", "search-server:close"});
}

TEST_CASE("AgentOrchestrator: provider that fails to connect is skipped",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::TextResponse("ok"));

    MockProviderConnector connector;
    connector.Add("good", std::make_unique<MockToolProvider>(
                              "good", std::vector<std::string>{"read_file"}, &journal));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"/nonexistent/bad-server", "good"}),
                                   TaskWith("q"));

    REQUIRE(result.IsOk());
    CHECK(connector.ConnectOrder() ==
          std::vector<std::string>{"/nonexistent/bad-server", "good"});
    const auto& tools = client.Requests()[0].tools;
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "read_file");
    CHECK(journal == std::vector<std::string>{"good:close"});
}

TEST_CASE("AgentOrchestrator: every provider failing leaves an empty catalog",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::TextResponse("no tools needed"));
    MockProviderConnector connector;

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"bad-1", "bad-2"}), TaskWith("q"));

    REQUIRE(result.IsOk());
    CHECK(result.Value().response == "no tools needed");
    CHECK_FALSE(client.Requests()[0].tools.has_value());
}

TEST_CASE("AgentOrchestrator: listing failure closes and skips the provider",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::TextResponse("ok"));

    MockProviderConnector connector;
    auto* broken = connector.Add("broken", std::make_unique<MockToolProvider>(
                                               "broken", std::vector<std::string>{"x"}, &journal));
    broken->SetListToolsError(Error{"tools/list", "broken", std::nullopt,
                                    "Result missing 'tools' array", std::nullopt,
                                    ErrorCategory::Provider});
    connector.Add("fine", std::make_unique<MockToolProvider>(
                              "fine", std::vector<std::string>{"y"}, &journal));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"broken", "fine"}), TaskWith("q"));

    REQUIRE(result.IsOk());
    const auto& tools = client.Requests()[0].tools;
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "y");
    CHECK(journal == std::vector<std::string>{"broken:close", "fine:close"});
}

TEST_CASE("AgentOrchestrator: registration order follows declaration order",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::ToolUseResponse("toolu_1", "X", json::object()));
    client.EnqueueResponse(MockCompletionClient::TextResponse("done"));

    MockProviderConnector connector;
    connector.Add("p2", std::make_unique<MockToolProvider>(
                            "p2", std::vector<std::string>{"X"}, &journal));
    connector.Add("p1", std::make_unique<MockToolProvider>(
                            "p1", std::vector<std::string>{"X"}, &journal));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"p1", "p2"}), TaskWith("q"));

    REQUIRE(result.IsOk());
    CHECK(journal == std::vector<std::string>{"p1:X", "p1:close", "p2:close"});
}

TEST_CASE("AgentOrchestrator: config errors stop the run before any connect",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    MockCompletionClient client;
    MockProviderConnector connector;

    auto config = ConfigWith({"server"});
    config.max_tokens = 0;

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(config, TaskWith("q"));

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(connector.ConnectOrder().empty());
    CHECK(client.CallCount() == 0);
}

TEST_CASE("AgentOrchestrator: failed run still closes every provider",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.Enqueue(Result<CompletionResponse, Error>::Err(
        Error::FromHttpStatus("CreateCompletion", "/v1/messages", 401)));

    MockProviderConnector connector;
    connector.Add("a", std::make_unique<MockToolProvider>("a", std::vector<std::string>{"t"},
                                                          &journal));
    connector.Add("b", std::make_unique<MockToolProvider>("b", std::vector<std::string>{"u"},
                                                          &journal));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"a", "b"}), TaskWith("q"));

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(journal == std::vector<std::string>{"a:close", "b:close"});
}

TEST_CASE("AgentOrchestrator: propagated tool failure closes providers",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::ToolUseResponse("toolu_1", "missing", json::object()));

    MockProviderConnector connector;
    connector.Add("a", std::make_unique<MockToolProvider>("a", std::vector<std::string>{"t"},
                                                          &journal));

    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"a"}), TaskWith("q"));

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
    CHECK(result.Error().ExitCode() == 4);
    CHECK(journal == std::vector<std::string>{"a:missing", "a:close"});
}

TEST_CASE("AgentOrchestrator: cancellation is reported and providers are closed",
          "[agent][orchestrator]") {
    Logger logger(nullptr);
    std::vector<std::string> journal;
    MockCompletionClient client;
    client.EnqueueResponse(MockCompletionClient::TextResponse("unused"));

    MockProviderConnector connector;
    connector.Add("a", std::make_unique<MockToolProvider>("a", std::vector<std::string>{"t"},
                                                          &journal));

    std::atomic<bool> cancel{true};
    AgentOrchestrator orchestrator(client, connector, logger);
    auto result = orchestrator.Run(ConfigWith({"a"}), TaskWith("q"), &cancel);

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Cancelled);
    CHECK(client.CallCount() == 0);
    CHECK(journal == std::vector<std::string>{"a:close"});
}
