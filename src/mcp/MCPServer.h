#pragma once
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "mcp/LineChannel.h"
#include "mcp/MCPModels.h"
#include "mcp/MCPProtocol.h"
#include "tools/ToolRegistry.h"

struct ServerIdentity {
    std::string name = "tandem";
    std::string version = "1.0.0";
    std::string protocolVersion = MCP_PROTOCOL_VERSION;
};

/**
 * @brief Server role: answers initialize, ping, tools/list and tools/call from a host.
 *
 * Tool failures never reach the transport; they come back as isError content.
 * Protocol errors are reserved for malformed envelopes and unknown methods.
 */
class MCPServer {
public:
    explicit MCPServer(ToolRegistry& registry, ServerIdentity identity = ServerIdentity());
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    void start();
    // Both idempotent.
    void stop();
    void shutdown();
    bool isRunning() const { return running.load(); }

    // Async-signal-safe: only flips the running flag.
    void requestStop() noexcept { running.store(false); }

    nlohmann::json handleInitialize() const;
    std::vector<ToolDescriptor> handleToolsListRequest() const;
    ToolCallResponse handleToolExecution(const std::string& name, const ToolCallRequest& request);

    /**
     * @brief Handle one decoded message.
     * @return the reply for requests, nullopt for notifications and stray responses
     */
    std::optional<Envelope> dispatchMessage(const Envelope& message);

    /**
     * @brief Decode and handle one raw line.
     *
     * Lines that fail to decode are answered with -32700 (not JSON) or -32600.
     */
    std::optional<Envelope> handleLine(const std::string& line);

    /**
     * @brief Serve the channel until end of input or stop().
     *
     * tools/call requests run on worker tasks so a slow tool does not hold up
     * the rest; every worker is joined before serve() returns.
     */
    void serve(LineChannel& channel);

private:
    ToolRegistry& registry;
    ServerIdentity identity;
    std::atomic<bool> running{false};

    std::mutex workersMtx;
    std::vector<std::future<void>> workers;

    std::optional<Envelope> handleToolsCall(const Envelope& message);
    void reply(LineChannel& channel, const Envelope& envelope);
    void reapWorkers(bool wait);
};
