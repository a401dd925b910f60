#include "mcp/LineChannel.h"
#include "mcp/MCPErrors.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

LineChannel::LineChannel(int readFd, int writeFd, bool ownsFds)
    : readFd(readFd), writeFd(writeFd), ownsFds(ownsFds) {}

LineChannel::~LineChannel() {
    if (!ownsFds) return;
    closeWrite();
    if (readFd >= 0) {
        close(readFd);
        readFd = -1;
    }
}

void LineChannel::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (writeFd < 0) {
        throw ConnectionClosed("Write side of the channel is closed");
    }

    std::string full = line;
    full += '\n';
    const char* data = full.c_str();
    size_t total = 0;
    while (total < full.size()) {
        ssize_t n = write(writeFd, data + total, full.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                throw ConnectionClosed("Peer closed its input");
            }
            throw ConnectionClosed(std::string("Write failed: ") + std::strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
}

std::string LineChannel::readLine() {
    std::lock_guard<std::mutex> lock(readMtx);
    while (true) {
        auto pos = buffer.find('\n');
        if (pos != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        if (eof || readFd < 0) {
            throw ConnectionClosed("End of stream");
        }

        char chunk[4096];
        ssize_t n = read(readFd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            eof = true;
            throw ConnectionClosed(std::string("Read failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof = true;
            // A final line without terminator is still delivered once.
            if (!buffer.empty()) {
                std::string line;
                line.swap(buffer);
                return line;
            }
            throw ConnectionClosed("End of stream");
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

bool LineChannel::waitReadable(int timeoutMs) {
    {
        std::lock_guard<std::mutex> lock(readMtx);
        if (eof || readFd < 0 || buffer.find('\n') != std::string::npos) return true;
    }
    struct pollfd pfd;
    pfd.fd = readFd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
        return errno != EINTR;
    }
    return rc > 0;
}

void LineChannel::closeWrite() {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (ownsFds && writeFd >= 0) {
        close(writeFd);
    }
    writeFd = -1;
}
