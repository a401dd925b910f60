#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getToolDefinition().name;
    std::lock_guard<std::mutex> lock(mtx);
    if (tools.count(name)) {
        Logger::getInstance().debug("Replacing tool " + name);
    }
    tools[name] = std::shared_ptr<ITool>(std::move(tool));
}

std::shared_ptr<ITool> ToolRegistry::getTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second;
}

ToolCallResponse ToolRegistry::notFound(const std::string& name) {
    return ToolCallResponse::text("Tool '" + name + "' not found", true);
}

ToolCallResponse ToolRegistry::executeTool(const std::string& name, const ToolCallRequest& request) {
    auto tool = getTool(name);
    if (!tool) {
        Logger::getInstance().warn("Tool not found: " + name);
        return notFound(name);
    }

    try {
        return tool->execute(request);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " threw: " + e.what());
        return ToolCallResponse::text(std::string("Tool execution failed: ") + e.what(), true);
    }
}

std::vector<ToolDescriptor> ToolRegistry::getAllTools() const {
    std::vector<std::shared_ptr<ITool>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx);
        snapshot.reserve(tools.size());
        for (const auto& [name, tool] : tools) snapshot.push_back(tool);
    }
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(snapshot.size());
    for (const auto& tool : snapshot) {
        descriptors.push_back(tool->getToolDefinition());
    }
    return descriptors;
}

size_t ToolRegistry::getToolCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.size();
}

bool ToolRegistry::hasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.count(name) > 0;
}

void ToolRegistry::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    tools.clear();
}
