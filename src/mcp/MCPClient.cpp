#include "mcp/MCPClient.h"
#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

#include <chrono>
#include <sstream>

namespace {

std::string joinCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

MCPClient::MCPClient(ServerConfig config, ClientInfo info)
    : config(std::move(config)), info(std::move(info)) {}

MCPClient::~MCPClient() {
    disconnect();
}

std::string MCPClient::stateName(State state) {
    switch (state) {
        case State::DISCONNECTED: return "DISCONNECTED";
        case State::HANDSHAKING: return "HANDSHAKING";
        case State::READY: return "READY";
    }
    return "UNKNOWN";
}

void MCPClient::connect() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    if (state == State::READY && process && process->isRunning()) {
        Logger::getInstance().debug("Already connected to MCP server " + config.name);
        return;
    }
    // Leftovers of a connection that died on its own.
    teardownLocked();

    Logger::getInstance().info("Starting MCP server process: " + joinCommand(config.fullCommand()));
    state = State::HANDSHAKING;
    try {
        process = std::make_unique<ChildProcess>();
        process->start({config.fullCommand(), config.env, config.workingDirectory});

        channel = std::make_shared<LineChannel>(process->getStdoutFd(), process->getStdinFd());
        correlator.reopen();
        stopReader = false;
        readerThread = std::thread(&MCPClient::readerLoop, this, channel);

        performHandshake(channel);

        State expected = State::HANDSHAKING;
        if (!state.compare_exchange_strong(expected, State::READY)) {
            throw ConnectionClosed("MCP server " + config.name + " closed the connection during handshake");
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("Failed to connect to MCP server " + config.name + ": " + e.what());
        teardownLocked();
        throw;
    }
    Logger::getInstance().info("Successfully connected to MCP server " + config.name);
}

void MCPClient::performHandshake(const std::shared_ptr<LineChannel>& ch) {
    Logger::getInstance().debug("Performing MCP handshake with " + config.name);

    nlohmann::json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"clientInfo", {{"name", info.name}, {"version", info.version}}}
    };
    Envelope response = sendRequest(ch, "initialize", params, config.startupTimeoutMs);

    if (response.error) {
        throw ProtocolError("initialize rejected by " + config.name + ": " + response.error->message);
    }
    if (!response.result || !response.result->is_object()) {
        throw ProtocolError("initialize response from " + config.name + " carries no result object");
    }
    serverInfo = *response.result;

    std::string negotiated = serverInfo.value("protocolVersion", std::string());
    if (negotiated.empty()) {
        throw ProtocolError("initialize response from " + config.name + " lacks protocolVersion");
    }
    if (negotiated != MCP_PROTOCOL_VERSION) {
        Logger::getInstance().warn("MCP server " + config.name + " negotiated protocol " + negotiated);
    }

    ch->send(Envelope::notification("notifications/initialized"));
    Logger::getInstance().debug("MCP handshake completed with " + config.name);
}

void MCPClient::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    if (!process && state == State::DISCONNECTED) {
        return;
    }
    Logger::getInstance().info("Disconnecting from MCP server " + config.name);
    teardownLocked();
}

void MCPClient::restart() {
    Logger::getInstance().info("Restarting MCP server connection " + config.name);
    disconnect();
    connect();
}

void MCPClient::teardownLocked() {
    stopReader = true;
    if (channel) {
        channel->closeWrite();
    }
    if (process) {
        process->terminate();
    }
    if (readerThread.joinable()) {
        readerThread.join();
    }
    if (process) {
        process->closePipes();
    }
    correlator.failAll(std::make_exception_ptr(
        ConnectionClosed("Disconnected from MCP server " + config.name)));
    channel.reset();
    process.reset();
    state = State::DISCONNECTED;
}

bool MCPClient::isConnected() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    return state == State::READY && process && process->isRunning();
}

nlohmann::json MCPClient::getServerInfo() const {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    return serverInfo;
}

pid_t MCPClient::processId() const {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    return process ? process->getPid() : -1;
}

std::shared_ptr<LineChannel> MCPClient::readyChannel() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    if (state != State::READY || !channel) {
        throw ConnectionClosed("Not connected to MCP server " + config.name +
                               " (state " + stateName(state) + ")");
    }
    return channel;
}

Envelope MCPClient::sendRequest(const std::shared_ptr<LineChannel>& ch, const std::string& method,
                                const nlohmann::json& params, std::optional<long long> timeoutMs) {
    int64_t id = correlator.nextId();
    auto pending = correlator.registerRequest(id);

    Envelope request = Envelope::request(id, method, params);
    Logger::getInstance().debug("-> " + config.name + " " + encode(request));
    try {
        ch->send(request);
    } catch (const ConnectionClosed&) {
        correlator.cancel(id);
        throw;
    }

    if (timeoutMs) {
        auto status = pending.wait_for(std::chrono::milliseconds(*timeoutMs));
        if (status == std::future_status::timeout) {
            correlator.cancel(id);
            throw OperationTimeout(config.name + " " + method, *timeoutMs);
        }
    }
    return pending.get();
}

void MCPClient::readerLoop(std::shared_ptr<LineChannel> ch) {
    while (!stopReader) {
        if (!ch->waitReadable(100)) continue;
        if (stopReader) break;

        std::string line;
        try {
            line = ch->readLine();
        } catch (const ConnectionClosed& e) {
            Logger::getInstance().warn("MCP server " + config.name + " closed its output: " + e.what());
            markBroken(std::make_exception_ptr(
                ConnectionClosed("MCP server " + config.name + " closed the connection")));
            return;
        }
        if (isBlank(line)) continue;
        Logger::getInstance().debug("<- " + config.name + " " + line);

        Envelope message;
        try {
            message = decode(line);
        } catch (const ProtocolError& e) {
            Logger::getInstance().error("Malformed message from " + config.name + ": " + e.what());
            markBroken(std::make_exception_ptr(e));
            return;
        }

        if (message.isResponse()) {
            if (!correlator.resolve(message)) {
                Logger::getInstance().debug("Discarded response for unknown or abandoned request id " +
                                            (message.id ? std::to_string(*message.id) : std::string("null")));
            }
        } else if (message.isRequest()) {
            // Server-initiated requests are not part of this client's contract.
            try {
                ch->send(Envelope::errorResponse(message.id, jsonrpc::METHOD_NOT_FOUND,
                                                 "Method not supported by client: " + message.method));
            } catch (const ConnectionClosed& e) {
                Logger::getInstance().debug(std::string("Could not answer server request: ") + e.what());
            }
        } else {
            Logger::getInstance().debug("Ignoring notification from " + config.name + ": " + message.method);
        }
    }
}

void MCPClient::markBroken(std::exception_ptr error) {
    state = State::DISCONNECTED;
    correlator.failAll(error);
}

ToolCallResponse MCPClient::callTool(const ToolCallRequest& request) {
    auto ch = readyChannel();
    Logger::getInstance().debug("Calling MCP tool " + request.name + " on " + config.name);

    Envelope response = sendRequest(ch, "tools/call", request);

    if (response.error) {
        throw ToolError("Tool call " + request.name + " failed: " + response.error->message, response.error->code);
    }
    if (!response.result || !response.result->is_object()) {
        ProtocolError error("Missing result in tools/call response for " + request.name);
        markBroken(std::make_exception_ptr(error));
        throw error;
    }
    try {
        return response.result->get<ToolCallResponse>();
    } catch (const nlohmann::json::exception& e) {
        ProtocolError error("Malformed tools/call result for " + request.name + ": " + e.what());
        markBroken(std::make_exception_ptr(error));
        throw error;
    }
}

std::vector<ToolDescriptor> MCPClient::listTools() {
    auto ch = readyChannel();
    Logger::getInstance().debug("Listing tools of " + config.name);

    Envelope response = sendRequest(ch, "tools/list", nlohmann::json::object());

    if (response.error) {
        throw ToolError("List tools failed: " + response.error->message, response.error->code);
    }
    if (!response.result || !response.result->is_object() || !response.result->contains("tools") ||
        !(*response.result)["tools"].is_array()) {
        ProtocolError error("Missing tools in tools/list response from " + config.name);
        markBroken(std::make_exception_ptr(error));
        throw error;
    }
    try {
        return (*response.result)["tools"].get<std::vector<ToolDescriptor>>();
    } catch (const nlohmann::json::exception& e) {
        ProtocolError error(std::string("Malformed tools/list result: ") + e.what());
        markBroken(std::make_exception_ptr(error));
        throw error;
    }
}
