#include "reliability/ReliabilityService.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

CircuitBreaker::CircuitBreaker(int failureThreshold, long long recoveryTimeMs)
    : failureThreshold(failureThreshold < 1 ? 1 : failureThreshold), recoveryTime(recoveryTimeMs) {}

void CircuitBreaker::refreshLocked() {
    if (state == State::OPEN && Clock::now() - lastFailure >= recoveryTime) {
        state = State::HALF_OPEN;
    }
}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mtx);
    refreshLocked();
    if (state == State::OPEN) return false;
    if (state == State::HALF_OPEN) {
        // One trial call at a time; the rest are rejected until it reports back.
        if (trialInFlight) return false;
        trialInFlight = true;
    }
    return true;
}

void CircuitBreaker::onSuccess() {
    std::lock_guard<std::mutex> lock(mtx);
    trialInFlight = false;
    failureCount = 0;
    state = State::CLOSED;
}

void CircuitBreaker::onFailure() {
    std::lock_guard<std::mutex> lock(mtx);
    trialInFlight = false;
    failureCount++;
    lastFailure = Clock::now();
    if (state == State::HALF_OPEN || failureCount >= failureThreshold) {
        state = State::OPEN;
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mtx);
    trialInFlight = false;
    failureCount = 0;
    state = State::CLOSED;
}

CircuitBreaker::State CircuitBreaker::getState() {
    std::lock_guard<std::mutex> lock(mtx);
    refreshLocked();
    return state;
}

int CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return failureCount;
}

std::string CircuitBreaker::stateName(State state) {
    switch (state) {
        case State::CLOSED: return "CLOSED";
        case State::OPEN: return "OPEN";
        case State::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

ReliabilityService::ReliabilityService(ReliabilityConfig config) : config(config) {}

bool ReliabilityService::isRetryable(const std::exception& error) {
    return dynamic_cast<const OperationTimeout*>(&error) == nullptr &&
           dynamic_cast<const CircuitBreakerOpen*>(&error) == nullptr;
}

long long ReliabilityService::backoffDelay(long long baseDelayMs, double multiplier, int attempt, long long maxDelayMs) {
    double delay = static_cast<double>(baseDelayMs) * std::pow(multiplier, attempt - 1);
    if (maxDelayMs > 0 && delay > static_cast<double>(maxDelayMs)) {
        return maxDelayMs;
    }
    if (std::isnan(delay) || delay <= 0.0) {
        return 0;
    }
    // Out of range for long long, including +inf from pow overflow.
    constexpr double limit = static_cast<double>(std::numeric_limits<long long>::max());
    if (delay >= limit) {
        return std::numeric_limits<long long>::max();
    }
    return static_cast<long long>(delay);
}

std::shared_ptr<CircuitBreaker> ReliabilityService::breakerFor(const std::string& operation, int failureThreshold,
                                                               long long recoveryTimeMs) {
    std::lock_guard<std::mutex> lock(tableMtx);
    auto& breaker = breakers[operation];
    if (!breaker) {
        breaker = std::make_shared<CircuitBreaker>(failureThreshold, recoveryTimeMs);
    }
    return breaker;
}

std::shared_ptr<ReliabilityService::StatsSlot> ReliabilityService::statsFor(const std::string& operation) {
    std::lock_guard<std::mutex> lock(tableMtx);
    auto& slot = stats[operation];
    if (!slot) {
        slot = std::make_shared<StatsSlot>();
    }
    return slot;
}

void ReliabilityService::recordFailure(const std::string& operation) {
    auto slot = statsFor(operation);
    std::lock_guard<std::mutex> lock(slot->mtx);
    slot->retryCount++;
    slot->lastFailureTime = std::chrono::system_clock::now();
}

RetryStats ReliabilityService::getRetryStats(const std::string& operation) {
    RetryStats result;
    result.operation = operation;

    std::shared_ptr<StatsSlot> slot;
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        auto s = stats.find(operation);
        if (s != stats.end()) slot = s->second;
        auto b = breakers.find(operation);
        if (b != breakers.end()) breaker = b->second;
    }
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mtx);
        result.retryCount = slot->retryCount;
        result.lastFailureTime = slot->lastFailureTime;
    }
    if (breaker) {
        result.circuitState = breaker->getState();
        result.failureCount = breaker->getFailureCount();
    }
    return result;
}

std::map<std::string, RetryStats> ReliabilityService::getAllRetryStats() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        for (const auto& [name, slot] : stats) names.push_back(name);
        for (const auto& [name, breaker] : breakers) {
            if (!stats.count(name)) names.push_back(name);
        }
    }
    std::map<std::string, RetryStats> all;
    for (const auto& name : names) {
        all[name] = getRetryStats(name);
    }
    return all;
}

void ReliabilityService::resetRetryStats(const std::string& operation) {
    std::shared_ptr<StatsSlot> slot;
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(tableMtx);
        auto s = stats.find(operation);
        if (s != stats.end()) slot = s->second;
        auto b = breakers.find(operation);
        if (b != breakers.end()) breaker = b->second;
    }
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mtx);
        slot->retryCount = 0;
        slot->lastFailureTime.reset();
    }
    if (breaker) {
        breaker->reset();
    }
    Logger::getInstance().info("Reset retry stats for " + operation);
}
