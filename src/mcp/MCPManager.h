#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcp/MCPClient.h"
#include "mcp/MCPModels.h"

struct ServerStatus {
    std::string name;
    bool isConnected = false;
    int restartAttempts = 0;
    int maxRestartAttempts = 0;
};

/**
 * @brief Process supervisor: one managed MCP subprocess per configured name.
 *
 * Spawn, restart and stop for a given name are serialized by a per-name lock;
 * different names proceed concurrently. The destructor stops every process.
 */
class MCPManager {
public:
    explicit MCPManager(ClientInfo info = ClientInfo());
    ~MCPManager();

    MCPManager(const MCPManager&) = delete;
    MCPManager& operator=(const MCPManager&) = delete;

    /**
     * @brief Return the connected client for config.name, spawning it if needed.
     *
     * A disconnected entry is discarded and replaced. An entry is only added once
     * its handshake succeeded.
     * @throws ProcessError, ConnectionClosed, ProtocolError, OperationTimeout
     */
    std::shared_ptr<MCPClient> getClient(const ServerConfig& config);

    // Connects every config in parallel; returns how many came up.
    int initFromConfig(const std::vector<ServerConfig>& configs);

    /**
     * @brief Disconnect, wait restartDelayMs and reconnect.
     *
     * The attempt counter is incremented before reconnecting and never reset on
     * success; only resetRestartAttempts() clears it.
     * @throws ServerNotFound, MaxRestartsExceeded, or whatever connect() raised
     */
    void restartServer(const std::string& name);

    /**
     * @brief Report connectedness, restarting first when unhealthy and autoRestart is set.
     * @return false for unknown names
     */
    bool healthCheck(const std::string& name);

    void stopServer(const std::string& name);

    // Best effort: a failure on one entry does not stop the rest.
    void stopAll();

    void resetRestartAttempts(const std::string& name);

    std::map<std::string, ServerStatus> getStatus();
    bool hasServer(const std::string& name);
    size_t serverCount();

private:
    struct ManagedProcess {
        ServerConfig config;
        std::shared_ptr<MCPClient> client;
        std::atomic<int> restartAttempts{0};
    };

    ClientInfo info;
    std::mutex tableMtx;
    std::map<std::string, std::shared_ptr<ManagedProcess>> processes;
    std::map<std::string, std::shared_ptr<std::mutex>> nameLocks;

    std::shared_ptr<std::mutex> lockFor(const std::string& name);
    std::shared_ptr<ManagedProcess> find(const std::string& name);
    void restartLocked(ManagedProcess& entry);
};
