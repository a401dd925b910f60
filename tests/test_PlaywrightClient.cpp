#include <gtest/gtest.h>
#include "browser/PlaywrightClient.h"
#include "mcp/MCPErrors.h"
#include "mcp/MCPManager.h"
#include "reliability/ReliabilityService.h"
#include "tools/BrowserTools.h"
#include "tools/ToolRegistry.h"
#include "TestSupport.h"
#include <chrono>
#include <thread>

namespace {

ReliabilityConfig fastConfig() {
    ReliabilityConfig config;
    config.maxRetries = 2;
    config.retryDelayMs = 10;
    config.maxRetryDelayMs = 50;
    config.circuitBreakerFailureThreshold = 5;
    config.circuitBreakerRecoveryTimeoutMs = 60000;
    config.requestTimeoutMs = 3000;
    return config;
}

ToolCallRequest toolRequest(const std::string& name, const nlohmann::json& args) {
    ToolCallRequest request;
    request.name = name;
    request.arguments = args;
    return request;
}

} // namespace

class PlaywrightClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        reliability = std::make_unique<ReliabilityService>(config);
        browser = std::make_unique<PlaywrightClient>(manager, *reliability, testsupport::fakeServer("browser"));
    }

    ReliabilityConfig config = fastConfig();
    MCPManager manager;
    std::unique_ptr<ReliabilityService> reliability;
    std::unique_ptr<PlaywrightClient> browser;
};

TEST_F(PlaywrightClientTest, ConnectAndDisconnect) {
    EXPECT_FALSE(browser->isConnected());
    browser->connect();
    EXPECT_TRUE(browser->isConnected());
    EXPECT_TRUE(manager.hasServer("browser"));

    browser->disconnect();
    EXPECT_FALSE(browser->isConnected());
    EXPECT_FALSE(manager.hasServer("browser"));
}

TEST_F(PlaywrightClientTest, OperationsSpawnServerOnDemand) {
    EXPECT_EQ(browser->navigateToUrl("https://example.com"), "Page: https://example.com");
    EXPECT_TRUE(browser->isConnected());

    EXPECT_NO_THROW(browser->clickElement("#submit"));
    EXPECT_NO_THROW(browser->fillField("#name", "Ada"));
    EXPECT_EQ(browser->getTextContent("#title"), "text of #title");
    EXPECT_EQ(browser->getPageContent(), "<html><body>fake</body></html>");
    EXPECT_NO_THROW(browser->waitForElement("#ready", 1000));

    EXPECT_EQ(reliability->getRetryStats("playwright_navigate").retryCount, 0);
}

TEST_F(PlaywrightClientTest, ToolFailureIsRetriedThenRaised) {
    EXPECT_THROW(browser->clickElement("#missing"), ToolError);

    RetryStats stats = reliability->getRetryStats("playwright_click");
    EXPECT_EQ(stats.retryCount, config.maxRetries);
    EXPECT_TRUE(stats.lastFailureTime.has_value());
    EXPECT_EQ(stats.failureCount, 1);
    EXPECT_EQ(stats.circuitState, CircuitBreaker::State::CLOSED);
}

TEST_F(PlaywrightClientTest, MissingTextIsProtocolError) {
    EXPECT_THROW(browser->getTextContent("#empty"), ProtocolError);
    EXPECT_EQ(reliability->getRetryStats("playwright_get_text").retryCount, 0);
}

TEST_F(PlaywrightClientTest, SlowCallTimesOut) {
    config.maxRetries = 1;
    config.requestTimeoutMs = 200;
    reliability = std::make_unique<ReliabilityService>(config);
    browser = std::make_unique<PlaywrightClient>(manager, *reliability, testsupport::fakeServer("browser"));

    EXPECT_THROW(browser->waitForElement("#slow", 1000), OperationTimeout);
    EXPECT_EQ(reliability->getRetryStats("playwright_wait_for_selector").retryCount, 1);
}

TEST_F(PlaywrightClientTest, TimedOutCallIsNotSentAgain) {
    config.maxRetries = 3;
    config.requestTimeoutMs = 200;
    reliability = std::make_unique<ReliabilityService>(config);
    browser = std::make_unique<PlaywrightClient>(manager, *reliability, testsupport::fakeServer("browser"));

    EXPECT_THROW(browser->waitForElement("#slow", 1000), OperationTimeout);
    EXPECT_EQ(reliability->getRetryStats("playwright_wait_for_selector").retryCount, 1);

    // The server must have started exactly one wait plus this count request.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto client = manager.getClient(testsupport::fakeServer("browser"));
    EXPECT_EQ(client->callTool("call_count", nlohmann::json::object()).firstText().value_or(""), "2");
}

TEST_F(PlaywrightClientTest, RepeatedFailuresOpenTheBreaker) {
    config.maxRetries = 1;
    config.circuitBreakerFailureThreshold = 2;
    reliability = std::make_unique<ReliabilityService>(config);
    browser = std::make_unique<PlaywrightClient>(manager, *reliability, testsupport::fakeServer("browser"));

    EXPECT_THROW(browser->clickElement("#missing"), ToolError);
    EXPECT_THROW(browser->clickElement("#missing"), ToolError);
    // Open: fails fast without touching the server, even for a click that would succeed.
    EXPECT_THROW(browser->clickElement("#submit"), CircuitBreakerOpen);

    EXPECT_EQ(reliability->getRetryStats("playwright_click").circuitState, CircuitBreaker::State::OPEN);
    // Other operations have their own breaker.
    EXPECT_EQ(browser->getTextContent("#title"), "text of #title");
}

TEST_F(PlaywrightClientTest, BrowserToolsReportFailuresAsToolErrors) {
    ToolRegistry registry;
    registerBrowserTools(registry, *browser, manager, *reliability);
    EXPECT_EQ(registry.getToolCount(), 7u);
    EXPECT_TRUE(registry.hasTool("navigate_to_url"));
    EXPECT_TRUE(registry.hasTool("server_status"));

    ToolCallResponse missingArg = registry.executeTool("navigate_to_url", toolRequest("navigate_to_url", {}));
    EXPECT_TRUE(missingArg.isError);
    EXPECT_EQ(missingArg.firstText().value_or(""), "Missing required argument: url");

    ToolCallResponse page = registry.executeTool(
        "navigate_to_url", toolRequest("navigate_to_url", {{"url", "https://example.com"}}));
    EXPECT_FALSE(page.isError);
    EXPECT_EQ(page.firstText().value_or(""), "Page: https://example.com");

    ToolCallResponse click = registry.executeTool(
        "click_element", toolRequest("click_element", {{"selector", "#missing"}}));
    EXPECT_TRUE(click.isError);
    EXPECT_NE(click.firstText().value_or("").find("Element not found: #missing"), std::string::npos);

    ToolCallResponse badTimeout = registry.executeTool(
        "wait_for_element", toolRequest("wait_for_element", {{"selector", "#a"}, {"timeout_ms", "soon"}}));
    EXPECT_TRUE(badTimeout.isError);
}

TEST_F(PlaywrightClientTest, BreakerRejectionReadsAsDegradedService) {
    config.maxRetries = 1;
    config.circuitBreakerFailureThreshold = 1;
    reliability = std::make_unique<ReliabilityService>(config);
    browser = std::make_unique<PlaywrightClient>(manager, *reliability, testsupport::fakeServer("browser"));

    ToolRegistry registry;
    registerBrowserTools(registry, *browser, manager, *reliability);
    auto request = toolRequest("click_element", {{"selector", "#missing"}});
    registry.executeTool("click_element", request);

    ToolCallResponse rejected = registry.executeTool("click_element", request);
    EXPECT_TRUE(rejected.isError);
    EXPECT_EQ(rejected.firstText().value_or("").rfind("Browser service degraded", 0), 0u);
}

TEST_F(PlaywrightClientTest, ServerStatusListsServersAndOperations) {
    ToolRegistry registry;
    registerBrowserTools(registry, *browser, manager, *reliability);
    EXPECT_THROW(browser->clickElement("#missing"), ToolError);

    ToolCallResponse response = registry.executeTool("server_status", toolRequest("server_status", {}));
    ASSERT_FALSE(response.isError);
    auto report = nlohmann::json::parse(response.firstText().value_or("{}"));

    ASSERT_EQ(report["servers"].size(), 1u);
    EXPECT_EQ(report["servers"][0]["name"], "browser");
    EXPECT_EQ(report["servers"][0]["connected"], true);
    EXPECT_EQ(report["operations"]["playwright_click"]["retry_count"], config.maxRetries);
    EXPECT_EQ(report["operations"]["playwright_click"]["circuit_state"], "CLOSED");
    EXPECT_TRUE(report["operations"]["playwright_click"].contains("last_failure_ms"));
}
