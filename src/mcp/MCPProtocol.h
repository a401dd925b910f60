#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// JSON-RPC 2.0 framing shared by the client and server roles.

namespace jsonrpc {

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

} // namespace jsonrpc

// MCP protocol revision spoken on both sides.
inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent
};

/**
 * @brief One JSON-RPC message.
 *
 * Requests carry id + method, notifications carry method only, responses carry
 * id plus exactly one of result / error.
 */
struct Envelope {
    std::optional<int64_t> id;
    std::string method;
    nlohmann::json params;  // null when absent
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    bool isRequest() const { return id.has_value() && !method.empty(); }
    bool isNotification() const { return !id.has_value() && !method.empty(); }
    bool isResponse() const { return method.empty() && (result.has_value() || error.has_value()); }

    static Envelope request(int64_t id, const std::string& method, const nlohmann::json& params = nullptr);
    static Envelope notification(const std::string& method, const nlohmann::json& params = nullptr);
    static Envelope response(std::optional<int64_t> id, const nlohmann::json& result);
    static Envelope errorResponse(std::optional<int64_t> id, int code, const std::string& message,
                                  const nlohmann::json& data = nullptr);
};

nlohmann::json toJson(const Envelope& envelope);

/**
 * @brief Serialize one envelope as compact single-line JSON (no trailing newline).
 *
 * A response without an id (e.g. a parse-error reply) is written with "id": null.
 */
std::string encode(const Envelope& envelope);

/**
 * @brief Parse one line into an envelope.
 *
 * Unknown fields are ignored.
 * @throws ProtocolError if the line is not JSON, lacks the "jsonrpc" discriminator,
 *         or is neither a request, a notification nor a response.
 */
Envelope decode(const std::string& line);
