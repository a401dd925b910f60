#include "mcp/MCPProtocol.h"
#include "mcp/MCPErrors.h"

Envelope Envelope::request(int64_t id, const std::string& method, const nlohmann::json& params) {
    Envelope e;
    e.id = id;
    e.method = method;
    e.params = params;
    return e;
}

Envelope Envelope::notification(const std::string& method, const nlohmann::json& params) {
    Envelope e;
    e.method = method;
    e.params = params;
    return e;
}

Envelope Envelope::response(std::optional<int64_t> id, const nlohmann::json& result) {
    Envelope e;
    e.id = id;
    e.result = result;
    return e;
}

Envelope Envelope::errorResponse(std::optional<int64_t> id, int code, const std::string& message,
                                 const nlohmann::json& data) {
    Envelope e;
    e.id = id;
    e.error = RpcError{code, message, data};
    return e;
}

nlohmann::json toJson(const Envelope& envelope) {
    nlohmann::json j;
    j["jsonrpc"] = "2.0";
    if (envelope.id) {
        j["id"] = *envelope.id;
    } else if (envelope.isResponse()) {
        j["id"] = nullptr;
    }
    if (!envelope.method.empty()) {
        j["method"] = envelope.method;
        if (!envelope.params.is_null()) j["params"] = envelope.params;
    }
    if (envelope.error) {
        j["error"]["code"] = envelope.error->code;
        j["error"]["message"] = envelope.error->message;
        if (!envelope.error->data.is_null()) j["error"]["data"] = envelope.error->data;
    } else if (envelope.result) {
        j["result"] = *envelope.result;
    }
    return j;
}

std::string encode(const Envelope& envelope) {
    // Invalid UTF-8 coming out of a browser page must not abort the write.
    return toJson(envelope).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Envelope decode(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string("Invalid JSON message: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError("JSON-RPC message must be an object");
    }
    if (!j.contains("jsonrpc") || !j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != "2.0") {
        throw ProtocolError("Missing or unsupported 'jsonrpc' field");
    }

    Envelope e;
    if (j.contains("id") && !j["id"].is_null()) {
        if (!j["id"].is_number_integer()) {
            throw ProtocolError("JSON-RPC id must be an integer");
        }
        e.id = j["id"].get<int64_t>();
    }
    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            throw ProtocolError("JSON-RPC method must be a string");
        }
        e.method = j["method"].get<std::string>();
    }
    if (j.contains("params")) {
        e.params = j["params"];
    }
    if (j.contains("result")) {
        e.result = j["result"];
    }
    if (j.contains("error")) {
        const auto& err = j["error"];
        if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer()) {
            throw ProtocolError("Malformed JSON-RPC error object");
        }
        RpcError rpcError;
        rpcError.code = err["code"].get<int>();
        rpcError.message = err.value("message", std::string());
        if (err.contains("data")) rpcError.data = err["data"];
        e.error = rpcError;
    }

    if (e.method.empty()) {
        if (!e.result && !e.error) {
            throw ProtocolError("Response carries neither result nor error");
        }
        if (e.result && e.error) {
            throw ProtocolError("Response carries both result and error");
        }
    }
    return e;
}
