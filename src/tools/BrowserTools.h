#pragma once
#include <memory>
#include "tools/ITool.h"
#include "tools/ToolRegistry.h"

class PlaywrightClient;
class MCPManager;
class ReliabilityService;

/**
 * @brief Shared base of the tools backed by the browser client.
 *
 * Every failure comes back as isError text; a breaker rejection reads as a
 * degraded service and a timeout as an unknown outcome.
 */
class BrowserTool : public ITool {
public:
    explicit BrowserTool(PlaywrightClient& browser) : browser(browser) {}

    ToolCallResponse execute(const ToolCallRequest& request) override;

protected:
    PlaywrightClient& browser;

    virtual ToolCallResponse run(const nlohmann::json& args) = 0;

    // @throws std::invalid_argument if key is missing or not a non-empty string
    static std::string requireString(const nlohmann::json& args, const std::string& key);
};

class NavigateToUrlTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

class ClickElementTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

class FillFieldTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

class GetTextContentTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

class GetPageContentTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

class WaitForElementTool : public BrowserTool {
public:
    using BrowserTool::BrowserTool;
    ToolDescriptor getToolDefinition() const override;

protected:
    ToolCallResponse run(const nlohmann::json& args) override;
};

// Supervisor status and per-operation retry statistics as JSON text.
class ServerStatusTool : public ITool {
public:
    ServerStatusTool(MCPManager& manager, ReliabilityService& reliability)
        : manager(manager), reliability(reliability) {}

    ToolDescriptor getToolDefinition() const override;
    ToolCallResponse execute(const ToolCallRequest& request) override;

private:
    MCPManager& manager;
    ReliabilityService& reliability;
};

void registerBrowserTools(ToolRegistry& registry, PlaywrightClient& browser, MCPManager& manager,
                          ReliabilityService& reliability);
