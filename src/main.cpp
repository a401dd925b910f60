#include <iostream>
#include <string>
#include <vector>
#include <signal.h>
#include <unistd.h>

#include "browser/PlaywrightClient.h"
#include "core/ConfigManager.h"
#include "mcp/LineChannel.h"
#include "mcp/MCPManager.h"
#include "mcp/MCPServer.h"
#include "reliability/ReliabilityService.h"
#include "tools/BrowserTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {

MCPServer* activeServer = nullptr;

void handleSignal(int) {
    if (activeServer) activeServer->requestStop();
}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: the serve loop's poll must wake up with EINTR.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Config cfg;
    try {
        cfg = Config::resolve(args);
    } catch (const std::exception& e) {
        std::cerr << "tandem: " << e.what() << "\n\n" << Config::usage();
        return 2;
    }
    if (cfg.showHelp) {
        std::cout << Config::usage();
        return 0;
    }

    Logger& logger = Logger::getInstance();
    logger.setLevel(Logger::parseLevel(cfg.logging.level));
    logger.setLogFile(cfg.logging.file);
    if (!cfg.configPath.empty()) {
        logger.info("Loaded configuration from " + cfg.configPath);
    }

    MCPManager manager(ClientInfo{cfg.server.name, cfg.server.version});
    ReliabilityService reliability(cfg.reliability);
    PlaywrightClient browser(manager, reliability, cfg.browser);

    ToolRegistry registry;
    registerBrowserTools(registry, browser, manager, reliability);

    ServerIdentity identity;
    identity.name = cfg.server.name;
    identity.version = cfg.server.version;
    identity.protocolVersion = cfg.server.protocolVersion;
    MCPServer server(registry, identity);

    activeServer = &server;
    installSignalHandlers();

    if (!cfg.mcpServers.empty()) {
        int started = manager.initFromConfig(cfg.mcpServers);
        logger.info("Started " + std::to_string(started) + "/" + std::to_string(cfg.mcpServers.size()) +
                    " configured MCP servers");
    }

    logger.info("Serving " + std::to_string(registry.getToolCount()) + " tools on stdio");
    LineChannel channel(STDIN_FILENO, STDOUT_FILENO);
    server.serve(channel);

    server.shutdown();
    activeServer = nullptr;
    manager.stopAll();
    logger.info("Shutdown complete");
    return 0;
}
