// Scripted MCP server used as the subprocess in client, supervisor and browser tests.
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <unistd.h>

#include "mcp/LineChannel.h"
#include "mcp/MCPServer.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {

struct Options {
    std::string failIfExists;
    long exitAfter = -1;
    std::string garbageOn;
};

Options options;
LineChannel* output = nullptr;
std::atomic<long> callCount{0};

using Handler = std::function<ToolCallResponse(const nlohmann::json&)>;

class ScriptedTool : public ITool {
public:
    ScriptedTool(std::string name, std::string description, Handler handler)
        : name(std::move(name)), description(std::move(description)), handler(std::move(handler)) {}

    ToolDescriptor getToolDefinition() const override {
        ToolDescriptor d;
        d.name = name;
        d.description = description;
        return d;
    }

    ToolCallResponse execute(const ToolCallRequest& request) override {
        long n = ++callCount;
        if (options.exitAfter >= 0 && n > options.exitAfter) {
            std::_Exit(0);
        }
        if (!options.garbageOn.empty() && name == options.garbageOn && output) {
            output->writeLine("this is not json");
        }
        return handler(request.arguments);
    }

private:
    std::string name;
    std::string description;
    Handler handler;
};

std::string arg(const nlohmann::json& args, const std::string& key) {
    if (args.contains(key) && args[key].is_string()) return args[key].get<std::string>();
    return "";
}

void add(ToolRegistry& registry, const std::string& name, const std::string& description, Handler handler) {
    registry.registerTool(std::make_unique<ScriptedTool>(name, description, std::move(handler)));
}

void registerScriptedTools(ToolRegistry& registry) {
    add(registry, "echo", "Echo the value argument, optionally after delay_ms", [](const nlohmann::json& args) {
        if (args.contains("delay_ms") && args["delay_ms"].is_number_integer()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(args["delay_ms"].get<long long>()));
        }
        return ToolCallResponse::text(arg(args, "value"));
    });
    add(registry, "fail", "Always reports a tool error", [](const nlohmann::json&) {
        return ToolCallResponse::text("boom", true);
    });
    add(registry, "throw", "Throws inside the tool", [](const nlohmann::json&) -> ToolCallResponse {
        throw std::runtime_error("tool exploded");
    });
    add(registry, "call_count", "Reports how many tool calls this process has started, this one included",
        [](const nlohmann::json&) {
            return ToolCallResponse::text(std::to_string(callCount.load()));
        });
    add(registry, "pid", "Reports the server process id", [](const nlohmann::json&) {
        return ToolCallResponse::text(std::to_string(getpid()));
    });

    add(registry, "playwright_navigate", "Fake navigation", [](const nlohmann::json& args) {
        return ToolCallResponse::text("Page: " + arg(args, "url"));
    });
    add(registry, "playwright_click", "Fake click", [](const nlohmann::json& args) {
        if (arg(args, "selector") == "#missing") {
            return ToolCallResponse::text("Element not found: #missing", true);
        }
        return ToolCallResponse::text("clicked");
    });
    add(registry, "playwright_fill", "Fake fill", [](const nlohmann::json& args) {
        return ToolCallResponse::text("filled " + arg(args, "selector") + " with " + arg(args, "value"));
    });
    add(registry, "playwright_get_text", "Fake text lookup", [](const nlohmann::json& args) {
        if (arg(args, "selector") == "#empty") {
            return ToolCallResponse{};
        }
        return ToolCallResponse::text("text of " + arg(args, "selector"));
    });
    add(registry, "playwright_get_content", "Fake page HTML", [](const nlohmann::json&) {
        return ToolCallResponse::text("<html><body>fake</body></html>");
    });
    add(registry, "playwright_wait_for_selector", "Fake wait", [](const nlohmann::json& args) {
        if (arg(args, "selector") == "#slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        }
        return ToolCallResponse::text("visible");
    });
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        std::string value = argv[i + 1];
        if (flag == "--fail-if-exists") {
            options.failIfExists = value;
        } else if (flag == "--exit-after") {
            options.exitAfter = std::strtol(value.c_str(), nullptr, 10);
        } else if (flag == "--garbage-on") {
            options.garbageOn = value;
        }
    }

    if (!options.failIfExists.empty() && std::filesystem::exists(options.failIfExists)) {
        return 3;
    }

    Logger::getInstance().setLevel(LogLevel::WARNING);

    ToolRegistry registry;
    registerScriptedTools(registry);

    ServerIdentity identity;
    identity.name = "fake-mcp-server";
    identity.version = "0.1.0";
    MCPServer server(registry, identity);

    LineChannel channel(STDIN_FILENO, STDOUT_FILENO);
    output = &channel;
    server.serve(channel);
    server.shutdown();
    return 0;
}
