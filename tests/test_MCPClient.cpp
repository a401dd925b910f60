#include <gtest/gtest.h>
#include "mcp/MCPClient.h"
#include "mcp/MCPErrors.h"
#include "TestSupport.h"
#include <algorithm>
#include <thread>
#include <vector>

using testsupport::fakeServer;

TEST(MCPClientTest, HandshakeThenListTools) {
    MCPClient client(fakeServer("fake"));
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);

    client.connect();
    EXPECT_EQ(client.getState(), MCPClient::State::READY);
    EXPECT_TRUE(client.isConnected());
    EXPECT_GT(client.processId(), 0);
    EXPECT_EQ(client.getServerInfo()["serverInfo"]["name"], "fake-mcp-server");
    EXPECT_EQ(client.getServerInfo()["protocolVersion"], MCP_PROTOCOL_VERSION);

    auto tools = client.listTools();
    auto echo = std::find_if(tools.begin(), tools.end(), [](const ToolDescriptor& t) { return t.name == "echo"; });
    EXPECT_NE(echo, tools.end());
}

TEST(MCPClientTest, ToolResultsAndToolFailuresAreData) {
    MCPClient client(fakeServer("fake"));
    client.connect();

    ToolCallResponse ok = client.callTool("echo", {{"value", "hello"}});
    EXPECT_FALSE(ok.isError);
    EXPECT_EQ(ok.firstText().value_or(""), "hello");

    ToolCallResponse failed = client.callTool("fail", nlohmann::json::object());
    EXPECT_TRUE(failed.isError);
    EXPECT_EQ(failed.firstText().value_or(""), "boom");

    ToolCallResponse thrown = client.callTool("throw", nlohmann::json::object());
    EXPECT_TRUE(thrown.isError);
    EXPECT_NE(thrown.firstText().value_or("").find("tool exploded"), std::string::npos);

    ToolCallResponse missing = client.callTool("no_such_tool", nlohmann::json::object());
    EXPECT_TRUE(missing.isError);
    EXPECT_EQ(missing.firstText().value_or(""), "Tool 'no_such_tool' not found");
}

TEST(MCPClientTest, ConcurrentCallsReceiveTheirOwnResponses) {
    MCPClient client(fakeServer("fake"));
    client.connect();
    uint64_t resolvedBefore = client.getCorrelator().resolvedCount();

    const int n = 16;
    std::vector<std::string> results(n);
    std::vector<std::thread> callers;
    for (int i = 0; i < n; ++i) {
        callers.emplace_back([&client, &results, i]() {
            // Later callers finish first, so responses arrive out of request order.
            nlohmann::json args = {{"value", "call-" + std::to_string(i)}, {"delay_ms", (n - i) * 10}};
            results[i] = client.callTool("echo", args).firstText().value_or("");
        });
    }
    for (auto& t : callers) t.join();

    for (int i = 0; i < n; ++i) {
        EXPECT_EQ(results[i], "call-" + std::to_string(i));
    }
    EXPECT_EQ(client.getCorrelator().resolvedCount() - resolvedBefore, static_cast<uint64_t>(n));
    EXPECT_EQ(client.getCorrelator().discardedCount(), 0u);
    EXPECT_EQ(client.getCorrelator().pendingCount(), 0u);
}

TEST(MCPClientTest, CallsRequireReadyState) {
    MCPClient client(fakeServer("fake"));
    EXPECT_THROW(client.callTool("echo", nlohmann::json::object()), ConnectionClosed);
    EXPECT_THROW(client.listTools(), ConnectionClosed);
}

TEST(MCPClientTest, DisconnectIsIdempotent) {
    MCPClient client(fakeServer("fake"));
    client.disconnect();
    client.connect();
    client.disconnect();
    client.disconnect();

    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.processId(), -1);
    EXPECT_THROW(client.callTool("echo", nlohmann::json::object()), ConnectionClosed);
}

TEST(MCPClientTest, ServerExitSurfacesAsConnectionClosed) {
    MCPClient client(fakeServer("fake", {"--exit-after", "1"}));
    client.connect();

    EXPECT_EQ(client.callTool("echo", {{"value", "first"}}).firstText().value_or(""), "first");
    EXPECT_THROW(client.callTool("echo", {{"value", "second"}}), ConnectionClosed);
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
    EXPECT_FALSE(client.isConnected());

    // An explicit connect brings up a fresh process.
    client.connect();
    EXPECT_EQ(client.callTool("echo", {{"value", "again"}}).firstText().value_or(""), "again");
}

TEST(MCPClientTest, MalformedLineIsProtocolErrorAndDropsConnection) {
    MCPClient client(fakeServer("fake", {"--garbage-on", "echo"}));
    client.connect();

    EXPECT_THROW(client.callTool("echo", {{"value", "x"}}), ProtocolError);
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
    EXPECT_THROW(client.callTool("pid", nlohmann::json::object()), ConnectionClosed);
}

TEST(MCPClientTest, CommandThatExitsImmediatelyFailsToConnect) {
    ServerConfig cfg;
    cfg.name = "exits";
    cfg.command = {"sh", "-c", "exit 3"};
    MCPClient client(cfg);

    EXPECT_THROW(client.connect(), ConnectionClosed);
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
    EXPECT_EQ(client.processId(), -1);
}

TEST(MCPClientTest, MissingExecutableIsProcessError) {
    ServerConfig cfg;
    cfg.name = "missing";
    cfg.command = {"definitely-not-a-real-mcp-server"};
    MCPClient client(cfg);

    EXPECT_THROW(client.connect(), ProcessError);
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
}

TEST(MCPClientTest, SilentServerTimesOutHandshake) {
    ServerConfig cfg;
    cfg.name = "silent";
    cfg.command = {"sleep", "5"};
    cfg.startupTimeoutMs = 200;
    MCPClient client(cfg);

    EXPECT_THROW(client.connect(), OperationTimeout);
    EXPECT_EQ(client.getState(), MCPClient::State::DISCONNECTED);
    EXPECT_EQ(client.processId(), -1);
}

TEST(MCPClientTest, RestartSpawnsNewProcess) {
    MCPClient client(fakeServer("fake"));
    client.connect();
    pid_t before = client.processId();

    client.restart();
    EXPECT_TRUE(client.isConnected());
    EXPECT_NE(client.processId(), before);
    EXPECT_EQ(client.callTool("pid", nlohmann::json::object()).firstText().value_or(""),
              std::to_string(client.processId()));
}
