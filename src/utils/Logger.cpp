#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <ctime>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string upper(const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return out;
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string n = upper(name);
    if (n == "DEBUG" || n == "TRACE") return LogLevel::DEBUG;
    if (n == "INFO") return LogLevel::INFO;
    if (n == "WARN" || n == "WARNING") return LogLevel::WARNING;
    if (n == "ERROR") return LogLevel::ERROR;
    return fallback;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::writeRecord(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tmBuf{};
            localtime_r(&now, &tmBuf);
            logFile << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ");
            logFile << "[" << levelName(level) << "] " << trimmedMsg << std::endl;
        }
    }

    if (!consoleEnabled) return;

    static const bool colored = isatty(STDERR_FILENO) != 0;
    std::string prefix;
    switch (level) {
        case LogLevel::DEBUG:
            prefix = colored ? GRAY + "[debug] " + RESET : "[debug] ";
            break;
        case LogLevel::INFO:
            prefix = colored ? CYAN + "[info] " + RESET : "[info] ";
            break;
        case LogLevel::WARNING:
            prefix = colored ? YELLOW + "[warn] " + RESET : "[warn] ";
            break;
        case LogLevel::ERROR:
            prefix = colored ? RED + BOLD + "[error] " + RESET : "[error] ";
            break;
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << "[tandem] " << prefix << line << std::endl;
    }
}
