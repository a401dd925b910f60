#include "mcp/RequestCorrelator.h"
#include "mcp/MCPErrors.h"

std::future<Envelope> RequestCorrelator::registerRequest(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    std::promise<Envelope> slot;
    auto future = slot.get_future();
    if (closedError) {
        slot.set_exception(closedError);
        return future;
    }
    if (pending.count(id)) {
        slot.set_exception(std::make_exception_ptr(ProtocolError("Duplicate request id " + std::to_string(id))));
        return future;
    }
    pending.emplace(id, std::move(slot));
    return future;
}

bool RequestCorrelator::resolve(const Envelope& response) {
    if (!response.id) {
        discarded++;
        return false;
    }
    std::promise<Envelope> slot;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = pending.find(*response.id);
        if (it == pending.end()) {
            discarded++;
            return false;
        }
        slot = std::move(it->second);
        pending.erase(it);
    }
    resolved++;
    slot.set_value(response);
    return true;
}

void RequestCorrelator::cancel(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    pending.erase(id);
}

void RequestCorrelator::failAll(std::exception_ptr error) {
    std::unordered_map<int64_t, std::promise<Envelope>> drained;
    {
        std::lock_guard<std::mutex> lock(mtx);
        closedError = error;
        drained.swap(pending);
    }
    for (auto& [id, slot] : drained) {
        slot.set_exception(error);
    }
}

void RequestCorrelator::reopen() {
    std::lock_guard<std::mutex> lock(mtx);
    closedError = nullptr;
}

size_t RequestCorrelator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}
