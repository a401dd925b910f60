#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Property of a tool input schema.
struct PropertySchema {
    std::string type;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> enumValues;

    bool operator==(const PropertySchema& other) const {
        return type == other.type && description == other.description && enumValues == other.enumValues;
    }
};

struct InputSchema {
    std::string type = "object";
    std::map<std::string, PropertySchema> properties;
    std::vector<std::string> required;

    bool operator==(const InputSchema& other) const {
        return type == other.type && properties == other.properties && required == other.required;
    }
};

/**
 * @brief Tool definition as advertised by tools/list.
 *
 * Identity key is name: registering a descriptor under an existing name replaces it.
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema inputSchema;

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description && inputSchema == other.inputSchema;
    }
};

struct ContentItem {
    std::string type = "text";
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mimeType;

    static ContentItem makeText(const std::string& text) {
        ContentItem item;
        item.type = "text";
        item.text = text;
        return item;
    }

    bool operator==(const ContentItem& other) const {
        return type == other.type && text == other.text && data == other.data && mimeType == other.mimeType;
    }
};

struct ToolCallRequest {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const ToolCallRequest& other) const {
        return name == other.name && arguments == other.arguments;
    }
};

struct ToolCallResponse {
    std::vector<ContentItem> content;
    bool isError = false;

    static ToolCallResponse text(const std::string& text, bool isError = false) {
        ToolCallResponse response;
        response.content.push_back(ContentItem::makeText(text));
        response.isError = isError;
        return response;
    }

    // Text of the first content item, or nullopt when there is none.
    std::optional<std::string> firstText() const {
        if (content.empty()) return std::nullopt;
        return content.front().text;
    }

    bool operator==(const ToolCallResponse& other) const {
        return content == other.content && isError == other.isError;
    }
};

/**
 * @brief Launch and supervision settings for one named MCP subprocess.
 *
 * command + args is the literal argv; env overlays the inherited environment.
 * Immutable once a process has been spawned from it.
 */
struct ServerConfig {
    std::string name;
    std::vector<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> workingDirectory;
    bool autoRestart = true;
    int maxRestartAttempts = 3;
    long long restartDelayMs = 1000;
    long long startupTimeoutMs = 30000;

    std::vector<std::string> fullCommand() const {
        std::vector<std::string> argv = command;
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }
};

void to_json(nlohmann::json& j, const PropertySchema& p);
void from_json(const nlohmann::json& j, PropertySchema& p);
void to_json(nlohmann::json& j, const InputSchema& s);
void from_json(const nlohmann::json& j, InputSchema& s);
void to_json(nlohmann::json& j, const ToolDescriptor& t);
void from_json(const nlohmann::json& j, ToolDescriptor& t);
void to_json(nlohmann::json& j, const ContentItem& c);
void from_json(const nlohmann::json& j, ContentItem& c);
void to_json(nlohmann::json& j, const ToolCallRequest& r);
void from_json(const nlohmann::json& j, ToolCallRequest& r);
void to_json(nlohmann::json& j, const ToolCallResponse& r);
void from_json(const nlohmann::json& j, ToolCallResponse& r);
void to_json(nlohmann::json& j, const ServerConfig& c);
void from_json(const nlohmann::json& j, ServerConfig& c);
