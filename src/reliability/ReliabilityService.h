#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "mcp/MCPErrors.h"
#include "utils/Logger.h"

struct ReliabilityConfig {
    int maxRetries = 3;
    long long retryDelayMs = 1000;
    double backoffMultiplier = 2.0;
    long long maxRetryDelayMs = 30000;
    int circuitBreakerFailureThreshold = 5;
    long long circuitBreakerRecoveryTimeoutMs = 60000;
    long long requestTimeoutMs = 30000;
};

/**
 * @brief Three-state guard for one logical operation.
 *
 * CLOSED -> OPEN after failureThreshold consecutive failures, OPEN -> HALF_OPEN once
 * recoveryTimeMs has passed since the last failure, HALF_OPEN -> CLOSED on the next
 * success and back to OPEN on the next failure. HALF_OPEN admits a single trial
 * call until that call reports onSuccess() or onFailure().
 */
class CircuitBreaker {
public:
    enum class State {
        CLOSED,
        OPEN,
        HALF_OPEN
    };

    CircuitBreaker(int failureThreshold, long long recoveryTimeMs);

    // false while OPEN, or while HALF_OPEN with the trial call still running.
    bool allowRequest();
    void onSuccess();
    void onFailure();
    void reset();

    State getState();
    int getFailureCount() const;

    static std::string stateName(State state);

private:
    using Clock = std::chrono::steady_clock;

    int failureThreshold;
    std::chrono::milliseconds recoveryTime;
    mutable std::mutex mtx;
    State state = State::CLOSED;
    int failureCount = 0;
    Clock::time_point lastFailure;
    bool trialInFlight = false;

    void refreshLocked();
};

struct RetryStats {
    std::string operation;
    int retryCount = 0;
    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    CircuitBreaker::State circuitState = CircuitBreaker::State::CLOSED;
    int failureCount = 0;
};

/**
 * @brief Retry, circuit breaker and timeout wrappers around arbitrary calls.
 *
 * Owns one breaker and one stats record per operation name. Blocks must capture
 * by value: executeWithTimeout may abandon a block that is still running.
 */
class ReliabilityService {
public:
    explicit ReliabilityService(ReliabilityConfig config = ReliabilityConfig());

    const ReliabilityConfig& getConfig() const { return config; }

    /**
     * @brief Run block up to maxRetries times with exponential backoff.
     *
     * The delay before attempt n+1 is baseDelayMs * backoffMultiplier^(n-1),
     * capped at maxRetryDelayMs. Every failure is recorded in the stats.
     * Failures that isRetryable() rejects are rethrown at once.
     * @throws the last failure once attempts are exhausted
     */
    template <typename F>
    auto executeWithRetry(const std::string& operation, int maxRetries, long long baseDelayMs,
                          double backoffMultiplier, F&& block) -> decltype(block()) {
        int attempts = maxRetries < 1 ? 1 : maxRetries;
        std::exception_ptr lastError;
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            try {
                return block();
            } catch (const std::exception& e) {
                lastError = std::current_exception();
                recordFailure(operation);
                if (!isRetryable(e)) {
                    Logger::getInstance().error("Operation " + operation + " failed (attempt " +
                                                std::to_string(attempt) + "), not retrying: " + e.what());
                    throw;
                }
                if (attempt < attempts) {
                    long long delay = backoffDelay(baseDelayMs, backoffMultiplier, attempt, config.maxRetryDelayMs);
                    Logger::getInstance().warn("Operation " + operation + " failed (attempt " + std::to_string(attempt) +
                                               "/" + std::to_string(attempts) + "): " + e.what() + ", retrying in " +
                                               std::to_string(delay) + "ms");
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                } else {
                    Logger::getInstance().error("Operation " + operation + " failed after " +
                                                std::to_string(attempts) + " attempts: " + e.what());
                }
            }
        }
        std::rethrow_exception(lastError);
    }

    template <typename F>
    auto executeWithRetry(const std::string& operation, F&& block) -> decltype(block()) {
        return executeWithRetry(operation, config.maxRetries, config.retryDelayMs, config.backoffMultiplier,
                                std::forward<F>(block));
    }

    /**
     * @brief Run block through the named breaker.
     * @throws CircuitBreakerOpen without invoking block while the breaker is open
     */
    template <typename F>
    auto executeWithCircuitBreaker(const std::string& operation, int failureThreshold, long long recoveryTimeMs,
                                   F&& block) -> decltype(block()) {
        using R = decltype(block());
        auto breaker = breakerFor(operation, failureThreshold, recoveryTimeMs);
        if (!breaker->allowRequest()) {
            Logger::getInstance().warn("Circuit breaker open for " + operation + ", failing fast");
            throw CircuitBreakerOpen(operation);
        }
        try {
            if constexpr (std::is_void_v<R>) {
                block();
                breaker->onSuccess();
            } else {
                R result = block();
                breaker->onSuccess();
                return result;
            }
        } catch (...) {
            breaker->onFailure();
            if (breaker->getState() == CircuitBreaker::State::OPEN) {
                Logger::getInstance().warn("Circuit breaker for " + operation + " is now OPEN");
            }
            throw;
        }
    }

    template <typename F>
    auto executeWithCircuitBreaker(const std::string& operation, F&& block) -> decltype(block()) {
        return executeWithCircuitBreaker(operation, config.circuitBreakerFailureThreshold,
                                         config.circuitBreakerRecoveryTimeoutMs, std::forward<F>(block));
    }

    /**
     * @brief Race block against timeoutMs.
     *
     * On expiry the block is abandoned, not cancelled: it keeps running on its own
     * thread and its remote effect is unknown.
     * @throws OperationTimeout
     */
    template <typename F>
    auto executeWithTimeout(const std::string& operation, long long timeoutMs, F block) -> decltype(block()) {
        using R = decltype(block());
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(block));
        auto result = task->get_future();
        std::thread([task]() { (*task)(); }).detach();

        if (result.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::timeout) {
            Logger::getInstance().warn("Operation " + operation + " timed out after " + std::to_string(timeoutMs) + "ms");
            throw OperationTimeout(operation, timeoutMs);
        }
        return result.get();
    }

    template <typename F>
    auto executeWithTimeout(const std::string& operation, F block) -> decltype(block()) {
        return executeWithTimeout(operation, config.requestTimeoutMs, std::move(block));
    }

    RetryStats getRetryStats(const std::string& operation);
    std::map<std::string, RetryStats> getAllRetryStats();

    // Clears the counters and closes the breaker.
    void resetRetryStats(const std::string& operation);

    // A timed-out call may still take effect remotely, and an open breaker
    // rejects every attempt, so neither is repeated.
    static bool isRetryable(const std::exception& error);

    static long long backoffDelay(long long baseDelayMs, double multiplier, int attempt, long long maxDelayMs);

private:
    struct StatsSlot {
        std::mutex mtx;
        int retryCount = 0;
        std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    };

    ReliabilityConfig config;
    std::mutex tableMtx;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers;
    std::map<std::string, std::shared_ptr<StatsSlot>> stats;

    std::shared_ptr<CircuitBreaker> breakerFor(const std::string& operation, int failureThreshold,
                                               long long recoveryTimeMs);
    std::shared_ptr<StatsSlot> statsFor(const std::string& operation);
    void recordFailure(const std::string& operation);
};
