#include "browser/PlaywrightClient.h"
#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

PlaywrightClient::PlaywrightClient(MCPManager& manager, ReliabilityService& reliability, ServerConfig config)
    : manager(manager), reliability(reliability), config(std::move(config)) {}

void PlaywrightClient::connect() {
    manager.getClient(config);
}

void PlaywrightClient::disconnect() {
    manager.stopServer(config.name);
}

bool PlaywrightClient::isConnected() {
    auto status = manager.getStatus();
    auto it = status.find(config.name);
    return it != status.end() && it->second.isConnected;
}

ToolCallResponse PlaywrightClient::call(const std::string& action, const ToolCallRequest& request) {
    const std::string& operation = request.name;
    return reliability.executeWithCircuitBreaker(operation, [&]() {
        return reliability.executeWithRetry(operation, [&]() {
            auto client = manager.getClient(config);
            ToolCallResponse response = reliability.executeWithTimeout(operation, [client, request]() {
                return client->callTool(request);
            });
            if (response.isError) {
                throw ToolError(action + " failed: " + response.firstText().value_or("no details"));
            }
            return response;
        });
    });
}

std::string PlaywrightClient::requireText(const ToolCallResponse& response, const std::string& action) {
    auto text = response.firstText();
    if (!text) {
        throw ProtocolError("No text content returned from " + action);
    }
    return *text;
}

std::string PlaywrightClient::navigateToUrl(const std::string& url) {
    Logger::getInstance().debug("Navigating to URL: " + url);
    auto response = call("Navigation", {"playwright_navigate", {{"url", url}}});
    std::string content = requireText(response, "navigation");
    Logger::getInstance().debug("Navigated to " + url + ", content length: " + std::to_string(content.size()));
    return content;
}

void PlaywrightClient::clickElement(const std::string& selector) {
    Logger::getInstance().debug("Clicking element: " + selector);
    call("Click", {"playwright_click", {{"selector", selector}}});
}

void PlaywrightClient::fillField(const std::string& selector, const std::string& value) {
    Logger::getInstance().debug("Filling field: " + selector);
    call("Fill", {"playwright_fill", {{"selector", selector}, {"value", value}}});
}

std::string PlaywrightClient::getTextContent(const std::string& selector) {
    Logger::getInstance().debug("Getting text content from: " + selector);
    auto response = call("Get text", {"playwright_get_text", {{"selector", selector}}});
    return requireText(response, "get text");
}

std::string PlaywrightClient::getPageContent() {
    Logger::getInstance().debug("Getting current page content");
    auto response = call("Get page content", {"playwright_get_content", nlohmann::json::object()});
    return requireText(response, "get page content");
}

void PlaywrightClient::waitForElement(const std::string& selector, long long timeoutMs) {
    Logger::getInstance().debug("Waiting for element: " + selector + " (timeout: " + std::to_string(timeoutMs) + "ms)");
    call("Wait for element", {"playwright_wait_for_selector", {{"selector", selector}, {"timeout", timeoutMs}}});
}
