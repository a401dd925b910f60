#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include "mcp/MCPProtocol.h"

/**
 * @brief Matches responses read from a connection to the callers awaiting them.
 *
 * Ids start at 1 and only grow for the lifetime of the correlator, across
 * reconnects. Each in-flight request owns a slot keyed by its id; the connection's
 * reader loop resolves slots by the id found in the response, so concurrent
 * callers can never receive each other's answers.
 */
class RequestCorrelator {
public:
    int64_t nextId() { return counter.fetch_add(1, std::memory_order_relaxed); }

    /**
     * @brief Open a slot for id.
     * @return future completed by resolve(), cancel() or failAll(). If the
     *         correlator is closed the future already holds the close error.
     */
    std::future<Envelope> registerRequest(int64_t id);

    /**
     * @brief Deliver a response to its waiter.
     * @return false if no slot is waiting on response.id (late or unknown id)
     */
    bool resolve(const Envelope& response);

    // Drops a slot whose caller gave up; a later response for it is discarded.
    void cancel(int64_t id);

    // Completes every pending slot with error and rejects new ones until reopen().
    void failAll(std::exception_ptr error);
    void reopen();

    size_t pendingCount() const;
    uint64_t resolvedCount() const { return resolved.load(); }
    uint64_t discardedCount() const { return discarded.load(); }

private:
    std::atomic<int64_t> counter{1};
    mutable std::mutex mtx;
    std::unordered_map<int64_t, std::promise<Envelope>> pending;
    std::exception_ptr closedError;
    std::atomic<uint64_t> resolved{0};
    std::atomic<uint64_t> discarded{0};
};
