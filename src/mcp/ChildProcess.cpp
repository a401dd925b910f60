#include "mcp/ChildProcess.h"
#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {

// Writes to a dead child's stdin must surface as EPIPE, not kill this process.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Child-side failure report: which step failed and its errno.
struct ExecFailure {
    int stage;
    int error;
};

constexpr int STAGE_CHDIR = 1;
constexpr int STAGE_EXEC = 2;

} // namespace

ChildProcess::~ChildProcess() {
    terminate();
    closePipes();
}

std::string ChildProcess::resolveExecutable(const std::string& name, const std::string& pathEnv,
                                            const std::string& baseDir) {
    if (name.empty()) return "";
    // The child chdirs before exec, so relative paths must be anchored there.
    auto anchor = [&baseDir](const fs::path& p) -> std::string {
        if (p.is_absolute() || baseDir.empty()) return p.string();
        std::error_code ec;
        fs::path base = fs::absolute(baseDir, ec);
        return ((ec ? fs::path(baseDir) : base) / p).lexically_normal().string();
    };
    if (name.find('/') != std::string::npos) {
        std::string candidate = anchor(name);
        return isExecutableFile(candidate) ? candidate : "";
    }
    size_t start = 0;
    while (start <= pathEnv.size()) {
        size_t end = pathEnv.find(':', start);
        std::string dir = (end == std::string::npos) ? pathEnv.substr(start) : pathEnv.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = anchor(fs::path(dir) / name);
        if (isExecutableFile(candidate)) {
            return candidate;
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return "";
}

void ChildProcess::start(const Options& options) {
    if (pid > 0) {
        throw ProcessError("Process already started (pid " + std::to_string(pid) + ")");
    }
    if (options.argv.empty()) {
        throw ProcessError("Empty command");
    }
    ignoreSigpipeOnce();

    // Everything the child needs is prepared before fork: only async-signal-safe
    // calls are allowed between fork and exec.
    std::map<std::string, std::string> envMap;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        envMap[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : options.env) {
        envMap[key] = value;
    }
    std::vector<std::string> envStrings;
    envStrings.reserve(envMap.size());
    for (const auto& [key, value] : envMap) {
        envStrings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& s : envStrings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string pathEnv = envMap.count("PATH") ? envMap["PATH"] : "/usr/local/bin:/usr/bin:/bin";
    std::string workDir = options.workingDirectory.value_or("");
    std::string executable = resolveExecutable(options.argv[0], pathEnv, workDir);
    if (executable.empty()) {
        throw ProcessError("Executable not found: " + options.argv[0] +
                           (workDir.empty() ? std::string() : " (in " + workDir + ")"));
    }

    std::vector<std::string> args = options.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int inPipe[2];
    int outPipe[2];
    int errPipe[2];
    if (pipe2(inPipe, O_CLOEXEC) != 0) {
        throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(inPipe[0]);
        close(inPipe[1]);
        throw ProcessError(std::string("pipe failed: ") + std::strerror(err));
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        throw ProcessError(std::string("pipe failed: ") + std::strerror(err));
    }

    pid_t child = fork();
    if (child < 0) {
        int err = errno;
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) close(fd);
        throw ProcessError(std::string("fork failed: ") + std::strerror(err));
    }

    if (child == 0) {
        // Own process group, so terminate() also reaches helpers the server spawns.
        setpgid(0, 0);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        signal(SIGPIPE, SIG_DFL);

        if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
            ExecFailure failure{STAGE_CHDIR, errno};
            ssize_t ignored = write(errPipe[1], &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        }
        execve(executable.c_str(), argv.data(), envp.data());
        ExecFailure failure{STAGE_EXEC, errno};
        ssize_t ignored = write(errPipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);

    // errPipe is close-on-exec: EOF means exec succeeded.
    ExecFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(errPipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        waitpid(child, &status, 0);
        close(inPipe[1]);
        close(outPipe[0]);
        std::string what = failure.stage == STAGE_CHDIR ? "chdir to " + workDir : "exec " + executable;
        throw ProcessError("Failed to " + what + ": " + std::strerror(failure.error));
    }

    pid = child;
    stdinFd = inPipe[1];
    stdoutFd = outPipe[0];
    exitStatus.reset();
    Logger::getInstance().debug("Spawned process " + std::to_string(pid) + ": " + executable);
}

bool ChildProcess::reap(bool block) {
    if (pid <= 0) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return false;
    if (r == pid) {
        if (WIFEXITED(status)) {
            exitStatus = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitStatus = 128 + WTERMSIG(status);
        }
    }
    pid = -1;
    return true;
}

bool ChildProcess::isRunning() {
    if (pid <= 0) return false;
    return !reap(false);
}

void ChildProcess::closeStdin() {
    closeFd(stdinFd);
}

void ChildProcess::closePipes() {
    closeFd(stdinFd);
    closeFd(stdoutFd);
}

void ChildProcess::terminate(int graceMs) {
    closeStdin();
    if (pid <= 0) return;

    using clock = std::chrono::steady_clock;
    auto waitFor = [this](std::chrono::milliseconds budget) {
        auto deadline = clock::now() + budget;
        while (clock::now() < deadline) {
            if (reap(false)) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return reap(false);
    };

    // A well-behaved server exits on its own once stdin closes.
    if (waitFor(std::chrono::milliseconds(std::min(graceMs, 200)))) return;

    pid_t group = pid;
    kill(-group, SIGTERM);
    kill(group, SIGTERM);
    if (waitFor(std::chrono::milliseconds(graceMs))) return;

    Logger::getInstance().warn("Process " + std::to_string(group) + " ignored SIGTERM, killing");
    kill(-group, SIGKILL);
    kill(group, SIGKILL);
    reap(true);
}
