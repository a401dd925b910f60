#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/**
 * @brief Owns one child process and the pipes bound to its stdin and stdout.
 *
 * stderr is inherited so the child's diagnostics stay visible. The pipe ends stay
 * owned by this object; the destructor terminates the child and closes them.
 */
class ChildProcess {
public:
    struct Options {
        std::vector<std::string> argv;
        std::map<std::string, std::string> env;  // overlays the inherited environment
        std::optional<std::string> workingDirectory;
    };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Launch the child.
     * @throws ProcessError if the executable cannot be found or exec fails
     */
    void start(const Options& options);

    // Reaps the child if it has exited.
    bool isRunning();

    /**
     * @brief Close stdin, send SIGTERM, then SIGKILL after graceMs, and reap.
     *
     * Safe to call repeatedly.
     */
    void terminate(int graceMs = 2000);

    pid_t getPid() const { return pid; }
    int getStdinFd() const { return stdinFd; }
    int getStdoutFd() const { return stdoutFd; }
    std::optional<int> getExitStatus() const { return exitStatus; }

    // Lets the child see EOF on its input.
    void closeStdin();

    // Closes the stdout pipe; call once nothing reads from it any more.
    void closePipes();

    /**
     * @brief Locate an executable the way execvp would from inside baseDir.
     * @param pathEnv PATH value to search; names containing '/' are not searched
     * @param baseDir directory the child will run in; relative names and relative
     *        PATH entries are taken against it. Empty means the current directory.
     * @return empty string if nothing executable was found
     */
    static std::string resolveExecutable(const std::string& name, const std::string& pathEnv,
                                         const std::string& baseDir = "");

private:
    pid_t pid = -1;
    int stdinFd = -1;
    int stdoutFd = -1;
    std::optional<int> exitStatus;

    bool reap(bool block);
};
