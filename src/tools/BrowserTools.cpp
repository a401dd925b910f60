#include "tools/BrowserTools.h"
#include "browser/PlaywrightClient.h"
#include "mcp/MCPErrors.h"
#include "mcp/MCPManager.h"
#include "reliability/ReliabilityService.h"
#include "utils/Logger.h"

#include <chrono>
#include <stdexcept>

namespace {

PropertySchema stringProperty(const std::string& description) {
    PropertySchema p;
    p.type = "string";
    p.description = description;
    return p;
}

ToolDescriptor describe(const std::string& name, const std::string& description,
                        std::map<std::string, PropertySchema> properties, std::vector<std::string> required) {
    ToolDescriptor d;
    d.name = name;
    d.description = description;
    d.inputSchema.properties = std::move(properties);
    d.inputSchema.required = std::move(required);
    return d;
}

} // namespace

ToolCallResponse BrowserTool::execute(const ToolCallRequest& request) {
    const std::string name = getToolDefinition().name;
    try {
        return run(request.arguments.is_object() ? request.arguments : nlohmann::json::object());
    } catch (const std::invalid_argument& e) {
        return ToolCallResponse::text(e.what(), true);
    } catch (const CircuitBreakerOpen& e) {
        Logger::getInstance().warn(name + " rejected: " + e.what());
        return ToolCallResponse::text(std::string("Browser service degraded, try again later: ") + e.what(), true);
    } catch (const OperationTimeout& e) {
        Logger::getInstance().warn(name + " timed out: " + e.what());
        return ToolCallResponse::text(std::string("Outcome unknown, the browser may still complete the action: ") +
                                      e.what(), true);
    } catch (const std::exception& e) {
        Logger::getInstance().error(name + " failed: " + e.what());
        return ToolCallResponse::text(name + " failed: " + e.what(), true);
    }
}

std::string BrowserTool::requireString(const nlohmann::json& args, const std::string& key) {
    if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
        throw std::invalid_argument("Missing required argument: " + key);
    }
    return args[key].get<std::string>();
}

ToolDescriptor NavigateToUrlTool::getToolDefinition() const {
    return describe("navigate_to_url", "Open a URL in the browser and return the page text",
                    {{"url", stringProperty("Absolute URL to open")}}, {"url"});
}

ToolCallResponse NavigateToUrlTool::run(const nlohmann::json& args) {
    return ToolCallResponse::text(browser.navigateToUrl(requireString(args, "url")));
}

ToolDescriptor ClickElementTool::getToolDefinition() const {
    return describe("click_element", "Click the element matching a CSS selector",
                    {{"selector", stringProperty("CSS selector of the element")}}, {"selector"});
}

ToolCallResponse ClickElementTool::run(const nlohmann::json& args) {
    std::string selector = requireString(args, "selector");
    browser.clickElement(selector);
    return ToolCallResponse::text("Clicked " + selector);
}

ToolDescriptor FillFieldTool::getToolDefinition() const {
    return describe("fill_field", "Type a value into the form field matching a CSS selector",
                    {{"selector", stringProperty("CSS selector of the field")},
                     {"value", stringProperty("Text to enter")}},
                    {"selector", "value"});
}

ToolCallResponse FillFieldTool::run(const nlohmann::json& args) {
    std::string selector = requireString(args, "selector");
    if (!args.contains("value") || !args["value"].is_string()) {
        throw std::invalid_argument("Missing required argument: value");
    }
    browser.fillField(selector, args["value"].get<std::string>());
    return ToolCallResponse::text("Filled " + selector);
}

ToolDescriptor GetTextContentTool::getToolDefinition() const {
    return describe("get_text_content", "Return the text content of the element matching a CSS selector",
                    {{"selector", stringProperty("CSS selector of the element")}}, {"selector"});
}

ToolCallResponse GetTextContentTool::run(const nlohmann::json& args) {
    return ToolCallResponse::text(browser.getTextContent(requireString(args, "selector")));
}

ToolDescriptor GetPageContentTool::getToolDefinition() const {
    return describe("get_page_content", "Return the HTML of the current page", {}, {});
}

ToolCallResponse GetPageContentTool::run(const nlohmann::json&) {
    return ToolCallResponse::text(browser.getPageContent());
}

ToolDescriptor WaitForElementTool::getToolDefinition() const {
    PropertySchema timeout;
    timeout.type = "integer";
    timeout.description = "Milliseconds to wait (default 5000)";
    return describe("wait_for_element", "Wait until the element matching a CSS selector is visible",
                    {{"selector", stringProperty("CSS selector of the element")}, {"timeout_ms", timeout}},
                    {"selector"});
}

ToolCallResponse WaitForElementTool::run(const nlohmann::json& args) {
    std::string selector = requireString(args, "selector");
    long long timeoutMs = 5000;
    if (args.contains("timeout_ms")) {
        if (!args["timeout_ms"].is_number_integer() || args["timeout_ms"].get<long long>() < 0) {
            throw std::invalid_argument("timeout_ms must be a non-negative integer");
        }
        timeoutMs = args["timeout_ms"].get<long long>();
    }
    browser.waitForElement(selector, timeoutMs);
    return ToolCallResponse::text("Element visible: " + selector);
}

ToolDescriptor ServerStatusTool::getToolDefinition() const {
    return describe("server_status", "Report managed MCP servers and retry statistics", {}, {});
}

ToolCallResponse ServerStatusTool::execute(const ToolCallRequest&) {
    nlohmann::json servers = nlohmann::json::array();
    for (const auto& [name, status] : manager.getStatus()) {
        servers.push_back({
            {"name", name},
            {"connected", status.isConnected},
            {"restart_attempts", status.restartAttempts},
            {"max_restart_attempts", status.maxRestartAttempts}
        });
    }

    nlohmann::json operations = nlohmann::json::object();
    for (const auto& [name, stats] : reliability.getAllRetryStats()) {
        nlohmann::json entry = {
            {"retry_count", stats.retryCount},
            {"circuit_state", CircuitBreaker::stateName(stats.circuitState)},
            {"failure_count", stats.failureCount}
        };
        if (stats.lastFailureTime) {
            entry["last_failure_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                stats.lastFailureTime->time_since_epoch()).count();
        }
        operations[name] = entry;
    }

    nlohmann::json report = {{"servers", servers}, {"operations", operations}};
    return ToolCallResponse::text(report.dump(2));
}

void registerBrowserTools(ToolRegistry& registry, PlaywrightClient& browser, MCPManager& manager,
                          ReliabilityService& reliability) {
    registry.registerTool(std::make_unique<NavigateToUrlTool>(browser));
    registry.registerTool(std::make_unique<ClickElementTool>(browser));
    registry.registerTool(std::make_unique<FillFieldTool>(browser));
    registry.registerTool(std::make_unique<GetTextContentTool>(browser));
    registry.registerTool(std::make_unique<GetPageContentTool>(browser));
    registry.registerTool(std::make_unique<WaitForElementTool>(browser));
    registry.registerTool(std::make_unique<ServerStatusTool>(manager, reliability));
}
