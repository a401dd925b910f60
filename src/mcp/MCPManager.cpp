#include "mcp/MCPManager.h"
#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

#include <chrono>
#include <future>
#include <thread>

MCPManager::MCPManager(ClientInfo info) : info(std::move(info)) {}

MCPManager::~MCPManager() {
    stopAll();
}

std::shared_ptr<std::mutex> MCPManager::lockFor(const std::string& name) {
    std::lock_guard<std::mutex> lock(tableMtx);
    auto& slot = nameLocks[name];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::shared_ptr<MCPManager::ManagedProcess> MCPManager::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(tableMtx);
    auto it = processes.find(name);
    return it == processes.end() ? nullptr : it->second;
}

std::shared_ptr<MCPClient> MCPManager::getClient(const ServerConfig& config) {
    auto nameLock = lockFor(config.name);
    std::lock_guard<std::mutex> guard(*nameLock);

    if (auto existing = find(config.name)) {
        if (existing->client->isConnected()) {
            return existing->client;
        }
        Logger::getInstance().warn("MCP server " + config.name + " is disconnected, replacing it");
        existing->client->disconnect();
        std::lock_guard<std::mutex> lock(tableMtx);
        processes.erase(config.name);
    }

    auto client = std::make_shared<MCPClient>(config, info);
    client->connect();

    auto entry = std::make_shared<ManagedProcess>();
    entry->config = config;
    entry->client = client;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        processes[config.name] = entry;
    }
    Logger::getInstance().info("MCP server " + config.name + " is up (pid " +
                               std::to_string(client->processId()) + ")");
    return client;
}

int MCPManager::initFromConfig(const std::vector<ServerConfig>& configs) {
    if (configs.empty()) return 0;

    std::vector<std::future<bool>> futures;
    for (const auto& cfg : configs) {
        futures.push_back(std::async(std::launch::async, [this, cfg]() {
            try {
                getClient(cfg);
                return true;
            } catch (const std::exception& e) {
                Logger::getInstance().error("Failed to start MCP server " + cfg.name + ": " + e.what());
                return false;
            }
        }));
    }

    int count = 0;
    for (auto& f : futures) {
        if (f.get()) count++;
    }
    return count;
}

void MCPManager::restartServer(const std::string& name) {
    auto nameLock = lockFor(name);
    std::lock_guard<std::mutex> guard(*nameLock);

    auto entry = find(name);
    if (!entry) {
        throw ServerNotFound(name);
    }
    restartLocked(*entry);
}

void MCPManager::restartLocked(ManagedProcess& entry) {
    const std::string& name = entry.config.name;
    if (entry.restartAttempts >= entry.config.maxRestartAttempts) {
        Logger::getInstance().error("Maximum restart attempts (" + std::to_string(entry.config.maxRestartAttempts) +
                                    ") exceeded for " + name);
        throw MaxRestartsExceeded(name);
    }

    int attempt = ++entry.restartAttempts;
    Logger::getInstance().info("Restarting MCP server " + name + " (attempt " + std::to_string(attempt) + "/" +
                               std::to_string(entry.config.maxRestartAttempts) + ")");

    entry.client->disconnect();
    std::this_thread::sleep_for(std::chrono::milliseconds(entry.config.restartDelayMs));
    entry.client->connect();
}

bool MCPManager::healthCheck(const std::string& name) {
    auto nameLock = lockFor(name);
    std::lock_guard<std::mutex> guard(*nameLock);

    auto entry = find(name);
    if (!entry) return false;

    if (entry->client->isConnected()) return true;

    if (entry->config.autoRestart) {
        Logger::getInstance().warn("MCP server " + name + " is unhealthy, attempting restart");
        try {
            restartLocked(*entry);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Health check restart failed for " + name + ": " + e.what());
            return false;
        }
    }
    return entry->client->isConnected();
}

void MCPManager::stopServer(const std::string& name) {
    auto nameLock = lockFor(name);
    std::lock_guard<std::mutex> guard(*nameLock);

    std::shared_ptr<ManagedProcess> entry;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        auto it = processes.find(name);
        if (it == processes.end()) return;
        entry = it->second;
        processes.erase(it);
    }
    Logger::getInstance().info("Stopping MCP server " + name);
    entry->client->disconnect();
}

void MCPManager::stopAll() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        for (const auto& [name, entry] : processes) names.push_back(name);
    }
    for (const auto& name : names) {
        try {
            stopServer(name);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Failed to stop MCP server " + name + ": " + e.what());
        }
    }
}

void MCPManager::resetRestartAttempts(const std::string& name) {
    auto entry = find(name);
    if (!entry) {
        throw ServerNotFound(name);
    }
    entry->restartAttempts = 0;
    Logger::getInstance().info("Restart attempts reset for " + name);
}

std::map<std::string, ServerStatus> MCPManager::getStatus() {
    std::vector<std::shared_ptr<ManagedProcess>> entries;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        for (const auto& [name, entry] : processes) entries.push_back(entry);
    }
    std::map<std::string, ServerStatus> status;
    for (const auto& entry : entries) {
        ServerStatus s;
        s.name = entry->config.name;
        s.isConnected = entry->client->isConnected();
        s.restartAttempts = entry->restartAttempts;
        s.maxRestartAttempts = entry->config.maxRestartAttempts;
        status[s.name] = s;
    }
    return status;
}

bool MCPManager::hasServer(const std::string& name) {
    std::lock_guard<std::mutex> lock(tableMtx);
    return processes.count(name) > 0;
}

size_t MCPManager::serverCount() {
    std::lock_guard<std::mutex> lock(tableMtx);
    return processes.size();
}
