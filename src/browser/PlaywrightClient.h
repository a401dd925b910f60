#pragma once
#include <string>

#include "mcp/MCPManager.h"
#include "mcp/MCPModels.h"
#include "reliability/ReliabilityService.h"

/**
 * @brief Browser automation calls over a supervised Playwright MCP server.
 *
 * Each operation is exactly one tools/call. The connection is fetched from the
 * supervisor on every attempt, so a crashed server is respawned by the retry loop.
 * Calls are wrapped as circuit breaker -> retry -> timeout, keyed by tool name.
 */
class PlaywrightClient {
public:
    PlaywrightClient(MCPManager& manager, ReliabilityService& reliability, ServerConfig config);

    void connect();
    void disconnect();
    bool isConnected();

    // @return page text reported by the server
    std::string navigateToUrl(const std::string& url);
    void clickElement(const std::string& selector);
    void fillField(const std::string& selector, const std::string& value);
    std::string getTextContent(const std::string& selector);
    // @return current page HTML
    std::string getPageContent();
    void waitForElement(const std::string& selector, long long timeoutMs = 5000);

    const ServerConfig& getConfig() const { return config; }

private:
    MCPManager& manager;
    ReliabilityService& reliability;
    ServerConfig config;

    /**
     * @throws ToolError when the server answers isError
     * @throws CircuitBreakerOpen, OperationTimeout, ConnectionClosed, ProcessError
     */
    ToolCallResponse call(const std::string& action, const ToolCallRequest& request);
    static std::string requireText(const ToolCallResponse& response, const std::string& action);
};
