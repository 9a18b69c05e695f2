#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace bqlineage {

/**
 * @brief Token bucket: `capacity` tokens per `period`
 *
 * Starts full. Tokens refill continuously at capacity/period and never
 * exceed capacity. Thread-safe.
 */
class TokenBucket {
public:
    TokenBucket(uint32_t capacity, std::chrono::nanoseconds period);

    /**
     * @brief Try to take one token now
     * @return true if taken, false if rate limited
     */
    bool try_acquire();

    /**
     * @brief Try to take one token at a given steady_clock time
     * Lets tests drive time explicitly.
     */
    bool try_acquire_at(int64_t now_ns);

    /**
     * @brief Nanoseconds until the next token is available (0 if one is)
     */
    [[nodiscard]] int64_t wait_time_ns_at(int64_t now_ns);

    [[nodiscard]] uint32_t available_tokens() const;

    void reset();

    [[nodiscard]] static int64_t steady_now_ns();

private:
    // Caller holds mutex_
    void refill(int64_t now_ns);

    const uint32_t capacity_;
    const int64_t ns_per_token_;

    mutable std::mutex mutex_;
    uint32_t tokens_;
    int64_t last_refill_ns_;
};

/**
 * @brief Blocking gate in front of outbound source calls
 *
 * acquire() waits until the bucket hands out a token. Used to keep
 * Log Source / audit-table calls under requests_per_min.
 */
class RequestGate {
public:
    RequestGate(uint32_t requests, std::chrono::nanoseconds period);

    // Blocks until a request may be made
    void acquire();

    [[nodiscard]] uint64_t waited_total() const { return total_waited_.load(std::memory_order_relaxed); }

private:
    TokenBucket bucket_;
    std::atomic<uint64_t> total_waited_{0};
};

} // namespace bqlineage
