#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Base of every error raised by the protocol engine.
 */
class MCPError : public std::runtime_error {
public:
    explicit MCPError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed envelope, missing result/error, handshake mismatch. Fatal to the connection.
class ProtocolError : public MCPError {
public:
    explicit ProtocolError(const std::string& message) : MCPError(message) {}
};

// Subprocess exited or its stdout reached EOF. Restart-worthy.
class ConnectionClosed : public MCPError {
public:
    explicit ConnectionClosed(const std::string& message) : MCPError(message) {}
};

// Remote tool reported failure (JSON-RPC error field or isError:true).
class ToolError : public MCPError {
public:
    ToolError(const std::string& message, int code = 0) : MCPError(message), code(code) {}
    int getCode() const { return code; }

private:
    int code;
};

class ProcessError : public MCPError {
public:
    explicit ProcessError(const std::string& message) : MCPError(message) {}
};

class ServerNotFound : public ProcessError {
public:
    explicit ServerNotFound(const std::string& name)
        : ProcessError("No MCP server found with name: " + name) {}
};

class MaxRestartsExceeded : public ProcessError {
public:
    explicit MaxRestartsExceeded(const std::string& name)
        : ProcessError("Maximum restart attempts exceeded for " + name) {}
};

// Fail-fast rejection: the service is degraded, try again later.
class CircuitBreakerOpen : public MCPError {
public:
    explicit CircuitBreakerOpen(const std::string& operation)
        : MCPError("Circuit breaker is open for operation: " + operation) {}
};

// The operation was abandoned, not cancelled. Its remote outcome is unknown.
class OperationTimeout : public MCPError {
public:
    OperationTimeout(const std::string& operation, long long timeoutMs)
        : MCPError("Operation '" + operation + "' timed out after " + std::to_string(timeoutMs) + "ms") {}
};
