#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <nlohmann/json.hpp>

#include "mcp/MCPModels.h"
#include "mcp/MCPProtocol.h"
#include "reliability/ReliabilityService.h"

struct Config {
    struct Server {
        std::string name = "tandem";
        std::string version = "1.0.0";
        std::string protocolVersion = MCP_PROTOCOL_VERSION;
    } server;

    struct Logging {
        std::string level = "INFO";
        std::string file;  // empty: no log file
    } logging;

    ReliabilityConfig reliability;

    ServerConfig browser = defaultBrowser();
    std::vector<ServerConfig> mcpServers;

    // Set by --config or by picking up tandem.json.
    std::string configPath;
    bool showHelp = false;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static ServerConfig defaultBrowser() {
        ServerConfig browser;
        browser.name = "playwright";
        browser.command = {"npx", "@playwright/mcp"};
        return browser;
    }

    static std::optional<std::string> systemEnv(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    }

    /**
     * @brief Defaults < config file < environment < command line.
     *
     * The file is --config PATH if given, otherwise tandem.json in the working
     * directory when it exists.
     * @throws std::runtime_error for an unreadable or malformed file, an unknown
     *         option, or an option missing its value
     */
    static Config resolve(const std::vector<std::string>& args, const EnvLookup& env = systemEnv) {
        Config cfg;
        std::string path;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config" && i + 1 < args.size()) {
                path = args[i + 1];
            }
        }
        if (path.empty() && std::filesystem::exists("tandem.json")) {
            path = "tandem.json";
        }
        if (!path.empty()) {
            cfg.applyJson(loadJsonFile(path));
            cfg.configPath = path;
        }
        cfg.applyEnvironment(env);
        cfg.applyArgs(args);
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        Config cfg;
        cfg.applyJson(loadJsonFile(pathStr));
        cfg.configPath = pathStr;
        return cfg;
    }

    static nlohmann::json loadJsonFile(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

        try {
            return nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
    }

    // Unknown keys are ignored; a present key with the wrong type is an error.
    void applyJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }
        try {
            if (j.contains("server")) {
                const auto& s = j["server"];
                server.name = s.value("name", server.name);
                server.version = s.value("version", server.version);
                server.protocolVersion = s.value("protocol_version", server.protocolVersion);
            }
            if (j.contains("logging")) {
                const auto& l = j["logging"];
                logging.level = l.value("level", logging.level);
                logging.file = l.value("file", logging.file);
            }
            if (j.contains("reliability")) {
                const auto& r = j["reliability"];
                reliability.maxRetries = r.value("max_retries", reliability.maxRetries);
                reliability.retryDelayMs = r.value("retry_delay_ms", reliability.retryDelayMs);
                reliability.backoffMultiplier = r.value("backoff_multiplier", reliability.backoffMultiplier);
                reliability.maxRetryDelayMs = r.value("max_retry_delay_ms", reliability.maxRetryDelayMs);
                reliability.circuitBreakerFailureThreshold =
                    r.value("circuit_breaker_failure_threshold", reliability.circuitBreakerFailureThreshold);
                reliability.circuitBreakerRecoveryTimeoutMs =
                    r.value("circuit_breaker_recovery_timeout_ms", reliability.circuitBreakerRecoveryTimeoutMs);
                reliability.requestTimeoutMs = r.value("request_timeout_ms", reliability.requestTimeoutMs);
            }
            if (j.contains("browser")) {
                // Partial browser sections patch the current settings.
                nlohmann::json merged = browser;
                merged.merge_patch(j["browser"]);
                browser = merged.get<ServerConfig>();
            }
            if (j.contains("mcp_servers")) {
                for (const auto& item : j["mcp_servers"]) {
                    mcpServers.push_back(item.get<ServerConfig>());
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }
    }

    void applyEnvironment(const EnvLookup& env) {
        if (auto v = env("TANDEM_LOG_LEVEL")) logging.level = *v;
        if (auto v = env("TANDEM_LOG_FILE")) logging.file = *v;
        if (auto v = env("TANDEM_MAX_RETRIES")) parseNumber(*v, reliability.maxRetries);
        if (auto v = env("TANDEM_RETRY_DELAY")) parseNumber(*v, reliability.retryDelayMs);
        if (auto v = env("TANDEM_CIRCUIT_BREAKER_THRESHOLD")) parseNumber(*v, reliability.circuitBreakerFailureThreshold);
        if (auto v = env("TANDEM_CIRCUIT_BREAKER_TIMEOUT")) parseNumber(*v, reliability.circuitBreakerRecoveryTimeoutMs);
        if (auto v = env("TANDEM_REQUEST_TIMEOUT")) parseNumber(*v, reliability.requestTimeoutMs);
        if (auto v = env("TANDEM_BROWSER_COMMAND")) setBrowserCommand(*v);
        if (auto v = env("TANDEM_WORKING_DIR")) browser.workingDirectory = *v;
    }

    void applyArgs(const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--help" || arg == "-h") {
                showHelp = true;
                continue;
            }
            if (arg.rfind("--", 0) != 0) {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Missing value for " + arg);
            }
            const std::string& value = args[++i];

            if (arg == "--config") {
                // Consumed by resolve().
            } else if (arg == "--log-level") {
                logging.level = value;
            } else if (arg == "--log-file") {
                logging.file = value;
            } else if (arg == "--max-retries") {
                parseNumber(value, reliability.maxRetries);
            } else if (arg == "--retry-delay") {
                parseNumber(value, reliability.retryDelayMs);
            } else if (arg == "--circuit-breaker-threshold") {
                parseNumber(value, reliability.circuitBreakerFailureThreshold);
            } else if (arg == "--circuit-breaker-timeout") {
                parseNumber(value, reliability.circuitBreakerRecoveryTimeoutMs);
            } else if (arg == "--request-timeout") {
                parseNumber(value, reliability.requestTimeoutMs);
            } else if (arg == "--browser-command") {
                setBrowserCommand(value);
            } else if (arg == "--working-dir") {
                browser.workingDirectory = value;
            } else {
                throw std::runtime_error("Unknown option: " + arg);
            }
        }
    }

    // Whitespace-separated argv; replaces both command and args.
    void setBrowserCommand(const std::string& commandLine) {
        std::istringstream iss(commandLine);
        std::vector<std::string> argv;
        std::string word;
        while (iss >> word) argv.push_back(word);
        if (argv.empty()) return;
        browser.command = argv;
        browser.args.clear();
    }

    static std::string usage() {
        return "Tandem MCP server\n"
               "\n"
               "Usage: tandem [options]\n"
               "\n"
               "Configuration sources, highest precedence first: command line,\n"
               "TANDEM_* environment variables, config file, defaults.\n"
               "\n"
               "Options:\n"
               "  --config PATH                    Config file (default: ./tandem.json if present)\n"
               "  --log-level LEVEL                DEBUG, INFO, WARN or ERROR\n"
               "  --log-file PATH                  Also append log records to PATH\n"
               "  --max-retries COUNT              Attempts per browser call\n"
               "  --retry-delay MS                 Base retry delay\n"
               "  --circuit-breaker-threshold N    Consecutive failures before the breaker opens\n"
               "  --circuit-breaker-timeout MS     Breaker recovery time\n"
               "  --request-timeout MS             Per-call timeout\n"
               "  --browser-command CMD            Browser automation server command line\n"
               "  --working-dir DIR                Working directory of the browser server\n"
               "  --help                           Show this help\n";
    }

private:
    // Malformed or out-of-range values leave target untouched.
    template <typename T>
    static bool parseNumber(const std::string& text, T& target) {
        if (text.empty()) return false;
        char* end = nullptr;
        errno = 0;
        long long value = std::strtoll(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0' || value < 0) return false;
        if (value > static_cast<long long>(std::numeric_limits<T>::max())) return false;
        target = static_cast<T>(value);
        return true;
    }
};
