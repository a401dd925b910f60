#include "mcp/MCPModels.h"

void to_json(nlohmann::json& j, const PropertySchema& p) {
    j = nlohmann::json{{"type", p.type}};
    if (p.description) j["description"] = *p.description;
    if (p.enumValues) j["enum"] = *p.enumValues;
}

void from_json(const nlohmann::json& j, PropertySchema& p) {
    p.type = j.at("type").get<std::string>();
    p.description.reset();
    p.enumValues.reset();
    if (j.contains("description") && j["description"].is_string()) {
        p.description = j["description"].get<std::string>();
    }
    if (j.contains("enum") && j["enum"].is_array()) {
        p.enumValues = j["enum"].get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const InputSchema& s) {
    j = nlohmann::json{{"type", s.type}, {"properties", nlohmann::json::object()}, {"required", s.required}};
    for (const auto& [name, prop] : s.properties) {
        j["properties"][name] = prop;
    }
}

void from_json(const nlohmann::json& j, InputSchema& s) {
    s.type = j.value("type", std::string("object"));
    s.properties.clear();
    s.required.clear();
    if (j.contains("properties") && j["properties"].is_object()) {
        for (const auto& [name, prop] : j["properties"].items()) {
            s.properties[name] = prop.get<PropertySchema>();
        }
    }
    if (j.contains("required") && j["required"].is_array()) {
        s.required = j["required"].get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = nlohmann::json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.inputSchema}};
}

void from_json(const nlohmann::json& j, ToolDescriptor& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        t.inputSchema = j["inputSchema"].get<InputSchema>();
    } else {
        t.inputSchema = InputSchema{};
    }
}

void to_json(nlohmann::json& j, const ContentItem& c) {
    j = nlohmann::json{{"type", c.type}};
    if (c.text) j["text"] = *c.text;
    if (c.data) j["data"] = *c.data;
    if (c.mimeType) j["mimeType"] = *c.mimeType;
}

void from_json(const nlohmann::json& j, ContentItem& c) {
    c.type = j.at("type").get<std::string>();
    c.text.reset();
    c.data.reset();
    c.mimeType.reset();
    if (j.contains("text") && j["text"].is_string()) c.text = j["text"].get<std::string>();
    if (j.contains("data") && j["data"].is_string()) c.data = j["data"].get<std::string>();
    if (j.contains("mimeType") && j["mimeType"].is_string()) c.mimeType = j["mimeType"].get<std::string>();
}

void to_json(nlohmann::json& j, const ToolCallRequest& r) {
    j = nlohmann::json{{"name", r.name}, {"arguments", r.arguments.is_null() ? nlohmann::json::object() : r.arguments}};
}

void from_json(const nlohmann::json& j, ToolCallRequest& r) {
    r.name = j.at("name").get<std::string>();
    r.arguments = nlohmann::json::object();
    if (j.contains("arguments") && j["arguments"].is_object()) {
        r.arguments = j["arguments"];
    }
}

void to_json(nlohmann::json& j, const ToolCallResponse& r) {
    j = nlohmann::json{{"content", r.content}, {"isError", r.isError}};
}

void from_json(const nlohmann::json& j, ToolCallResponse& r) {
    r.content = j.at("content").get<std::vector<ContentItem>>();
    r.isError = j.value("isError", false);
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = nlohmann::json{
        {"name", c.name},
        {"command", c.command},
        {"args", c.args},
        {"env", c.env},
        {"auto_restart", c.autoRestart},
        {"max_restart_attempts", c.maxRestartAttempts},
        {"restart_delay_ms", c.restartDelayMs},
        {"startup_timeout_ms", c.startupTimeoutMs}
    };
    if (c.workingDirectory) j["working_directory"] = *c.workingDirectory;
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    c.name = j.at("name").get<std::string>();
    // "command" may be given as a single string or as an argv array.
    const auto& command = j.at("command");
    if (command.is_string()) {
        c.command = {command.get<std::string>()};
    } else {
        c.command = command.get<std::vector<std::string>>();
    }
    c.args = j.value("args", std::vector<std::string>{});
    c.env = j.value("env", std::map<std::string, std::string>{});
    if (j.contains("working_directory") && j["working_directory"].is_string()) {
        c.workingDirectory = j["working_directory"].get<std::string>();
    }
    c.autoRestart = j.value("auto_restart", c.autoRestart);
    c.maxRestartAttempts = j.value("max_restart_attempts", c.maxRestartAttempts);
    c.restartDelayMs = j.value("restart_delay_ms", c.restartDelayMs);
    c.startupTimeoutMs = j.value("startup_timeout_ms", c.startupTimeoutMs);
}
