#pragma once
#include "mcp/MCPModels.h"

/**
 * @brief Interface of a tool exposed by the server role.
 *
 * Implementations report their own failures as isError content. An exception
 * escaping execute() is still caught by the registry and converted.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Descriptor advertised through tools/list.
     * @return descriptor whose name is the registry key
     */
    virtual ToolDescriptor getToolDefinition() const = 0;

    /**
     * @brief Execute the tool.
     * @param request tool name and arguments as received from the host
     * @return content items, with isError set on failure
     */
    virtual ToolCallResponse execute(const ToolCallRequest& request) = 0;
};
