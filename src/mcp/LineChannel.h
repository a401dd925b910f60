#pragma once
#include <string>
#include <mutex>
#include "mcp/MCPProtocol.h"

/**
 * @brief Newline-delimited message transport over a pair of file descriptors.
 *
 * Used for a child's stdin/stdout pipes (client role) and for this process's own
 * stdin/stdout (server role). Writes are serialized and handed to the kernel
 * before writeLine returns. Reads block; there is no read timeout at this layer.
 */
class LineChannel {
public:
    LineChannel(int readFd, int writeFd, bool ownsFds = false);
    ~LineChannel();

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    // @throws ConnectionClosed if the peer is gone
    void writeLine(const std::string& line);

    /**
     * @brief Read the next line, without its terminator.
     * @throws ConnectionClosed on end of stream
     */
    std::string readLine();

    /**
     * @brief Wait until readLine can make progress (buffered line, data, or EOF).
     * @return false if nothing happened within timeoutMs
     */
    bool waitReadable(int timeoutMs);

    void send(const Envelope& envelope) { writeLine(encode(envelope)); }
    Envelope receive() { return decode(readLine()); }

    // Closes the write side so the peer sees EOF on its input.
    void closeWrite();

    int getReadFd() const { return readFd; }
    int getWriteFd() const { return writeFd; }

private:
    int readFd;
    int writeFd;
    bool ownsFds;
    bool eof = false;
    std::string buffer;
    std::mutex writeMtx;
    std::mutex readMtx;
};
