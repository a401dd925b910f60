#include "mcp/MCPServer.h"
#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

#include <chrono>

MCPServer::MCPServer(ToolRegistry& registry, ServerIdentity identity)
    : registry(registry), identity(std::move(identity)) {}

MCPServer::~MCPServer() {
    stop();
    reapWorkers(true);
}

void MCPServer::start() {
    if (running.exchange(true)) return;
    Logger::getInstance().info("MCP server " + identity.name + " " + identity.version + " started");
}

void MCPServer::stop() {
    if (!running.exchange(false)) return;
    Logger::getInstance().info("MCP server " + identity.name + " stopped");
}

void MCPServer::shutdown() {
    stop();
    reapWorkers(true);
}

nlohmann::json MCPServer::handleInitialize() const {
    return {
        {"protocolVersion", identity.protocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", identity.name}, {"version", identity.version}}}
    };
}

std::vector<ToolDescriptor> MCPServer::handleToolsListRequest() const {
    return registry.getAllTools();
}

ToolCallResponse MCPServer::handleToolExecution(const std::string& name, const ToolCallRequest& request) {
    Logger::getInstance().debug("Executing tool " + name);
    return registry.executeTool(name, request);
}

std::optional<Envelope> MCPServer::handleToolsCall(const Envelope& message) {
    const auto& params = message.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return Envelope::errorResponse(message.id, jsonrpc::INVALID_PARAMS, "tools/call requires a string 'name'");
    }
    ToolCallRequest request;
    request.name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return Envelope::errorResponse(message.id, jsonrpc::INVALID_PARAMS, "tools/call 'arguments' must be an object");
        }
        request.arguments = params["arguments"];
    }
    nlohmann::json result = handleToolExecution(request.name, request);
    return Envelope::response(message.id, result);
}

std::optional<Envelope> MCPServer::dispatchMessage(const Envelope& message) {
    if (message.isResponse()) {
        Logger::getInstance().debug("Ignoring stray response from host");
        return std::nullopt;
    }
    if (message.isNotification()) {
        if (message.method == "notifications/initialized" || message.method == "initialized") {
            Logger::getInstance().debug("Host completed initialization");
        } else {
            Logger::getInstance().debug("Ignoring notification " + message.method);
        }
        return std::nullopt;
    }

    try {
        if (message.method == "initialize") {
            return Envelope::response(message.id, handleInitialize());
        }
        if (message.method == "ping") {
            return Envelope::response(message.id, nlohmann::json::object());
        }
        if (message.method == "tools/list") {
            nlohmann::json tools = handleToolsListRequest();
            return Envelope::response(message.id, {{"tools", tools}});
        }
        if (message.method == "tools/call") {
            return handleToolsCall(message);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("Failed to handle " + message.method + ": " + e.what());
        return Envelope::errorResponse(message.id, jsonrpc::INTERNAL_ERROR, e.what());
    }

    Logger::getInstance().warn("Unknown method: " + message.method);
    return Envelope::errorResponse(message.id, jsonrpc::METHOD_NOT_FOUND, "Method not found: " + message.method);
}

std::optional<Envelope> MCPServer::handleLine(const std::string& line) {
    Envelope message;
    try {
        message = decode(line);
    } catch (const ProtocolError& e) {
        Logger::getInstance().warn(std::string("Rejecting malformed message: ") + e.what());
        auto raw = nlohmann::json::parse(line, nullptr, false);
        if (raw.is_discarded()) {
            return Envelope::errorResponse(std::nullopt, jsonrpc::PARSE_ERROR, "Parse error");
        }
        std::optional<int64_t> id;
        if (raw.is_object() && raw.contains("id") && raw["id"].is_number_integer()) {
            id = raw["id"].get<int64_t>();
        }
        return Envelope::errorResponse(id, jsonrpc::INVALID_REQUEST, e.what());
    }
    return dispatchMessage(message);
}

void MCPServer::reply(LineChannel& channel, const Envelope& envelope) {
    try {
        channel.send(envelope);
    } catch (const ConnectionClosed& e) {
        Logger::getInstance().warn(std::string("Could not deliver reply: ") + e.what());
    }
}

void MCPServer::reapWorkers(bool wait) {
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(workersMtx);
        auto it = workers.begin();
        while (it != workers.end()) {
            if (wait || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.push_back(std::move(*it));
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& f : finished) f.get();
}

void MCPServer::serve(LineChannel& channel) {
    start();
    while (running) {
        if (!channel.waitReadable(100)) {
            reapWorkers(false);
            continue;
        }

        std::string line;
        try {
            line = channel.readLine();
        } catch (const ConnectionClosed& e) {
            Logger::getInstance().info(std::string("Host input closed: ") + e.what());
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        Envelope message;
        try {
            message = decode(line);
        } catch (const ProtocolError&) {
            if (auto error = handleLine(line)) reply(channel, *error);
            continue;
        }

        if (message.isRequest() && message.method == "tools/call") {
            auto worker = std::async(std::launch::async, [this, &channel, message]() {
                if (auto response = dispatchMessage(message)) reply(channel, *response);
            });
            std::lock_guard<std::mutex> lock(workersMtx);
            workers.push_back(std::move(worker));
            continue;
        }
        if (auto response = dispatchMessage(message)) reply(channel, *response);
    }
    reapWorkers(true);
    stop();
}
