#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "tools/ITool.h"

/**
 * @brief Name -> tool table shared by every server-role worker.
 *
 * Thread-safe. Tools are handed out as shared_ptr so a call in flight keeps its
 * implementation alive even if it is replaced or the registry is cleared.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool under the name in its descriptor.
     *
     * An existing tool with the same name is replaced.
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool.
     * @return nullptr if no tool is registered under name
     */
    std::shared_ptr<ITool> getTool(const std::string& name) const;

    /**
     * @brief Execute the named tool. Never throws.
     *
     * Unknown names yield isError with "Tool '<name>' not found"; exceptions from
     * the tool become isError text.
     */
    ToolCallResponse executeTool(const std::string& name, const ToolCallRequest& request);

    // Descriptors of every registered tool, in no particular order.
    std::vector<ToolDescriptor> getAllTools() const;

    size_t getToolCount() const;
    bool hasTool(const std::string& name) const;
    void clear();

    static ToolCallResponse notFound(const std::string& name);

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<ITool>> tools;
};
