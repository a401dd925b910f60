#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <sys/types.h>

#include "mcp/ChildProcess.h"
#include "mcp/LineChannel.h"
#include "mcp/MCPModels.h"
#include "mcp/RequestCorrelator.h"

class IMCPClient {
public:
    virtual ~IMCPClient() = default;
    virtual std::vector<ToolDescriptor> listTools() = 0;
    virtual ToolCallResponse callTool(const ToolCallRequest& request) = 0;

    ToolCallResponse callTool(const std::string& name, const nlohmann::json& arguments) {
        ToolCallRequest request;
        request.name = name;
        request.arguments = arguments;
        return callTool(request);
    }
};

struct ClientInfo {
    std::string name = "tandem";
    std::string version = "1.0.0";
};

/**
 * @brief Client role: drives one MCP server subprocess over its stdio pipes.
 *
 * State machine DISCONNECTED -> HANDSHAKING -> READY -> DISCONNECTED. Any failure
 * drops straight back to DISCONNECTED; only an explicit connect() leaves it.
 * A dedicated reader thread dispatches responses by id, so callers on different
 * threads may have requests in flight at the same time.
 */
class MCPClient : public IMCPClient {
public:
    enum class State {
        DISCONNECTED,
        HANDSHAKING,
        READY
    };

    explicit MCPClient(ServerConfig config, ClientInfo info = ClientInfo());
    ~MCPClient() override;

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /**
     * @brief Spawn the server if needed and perform the initialize handshake.
     *
     * No-op when already READY. On failure the process is torn down and the
     * client is left DISCONNECTED.
     * @throws ProcessError, ConnectionClosed, ProtocolError, OperationTimeout
     */
    void connect();

    // Idempotent.
    void disconnect();

    void restart();

    // READY and the subprocess is still alive.
    bool isConnected();
    State getState() const { return state.load(); }

    /**
     * @brief Issue tools/call and wait for its response.
     * @throws ToolError if the response carries an error object
     * @throws ProtocolError if the result is structurally invalid (the connection is dropped)
     * @throws ConnectionClosed if the client is not READY or the server goes away
     */
    ToolCallResponse callTool(const ToolCallRequest& request) override;
    using IMCPClient::callTool;

    std::vector<ToolDescriptor> listTools() override;

    // The initialize result reported by the server.
    nlohmann::json getServerInfo() const;
    pid_t processId() const;
    const ServerConfig& getConfig() const { return config; }
    const RequestCorrelator& getCorrelator() const { return correlator; }

    static std::string stateName(State state);

private:
    ServerConfig config;
    ClientInfo info;

    mutable std::mutex lifecycleMtx;
    std::atomic<State> state{State::DISCONNECTED};
    std::unique_ptr<ChildProcess> process;
    std::shared_ptr<LineChannel> channel;
    std::thread readerThread;
    std::atomic<bool> stopReader{false};
    RequestCorrelator correlator;
    nlohmann::json serverInfo;

    void performHandshake(const std::shared_ptr<LineChannel>& ch);
    std::shared_ptr<LineChannel> readyChannel();
    Envelope sendRequest(const std::shared_ptr<LineChannel>& ch, const std::string& method,
                         const nlohmann::json& params, std::optional<long long> timeoutMs = std::nullopt);
    void readerLoop(std::shared_ptr<LineChannel> ch);
    void markBroken(std::exception_ptr error);
    void teardownLocked();
};
