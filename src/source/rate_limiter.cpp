#include "source/rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace bqlineage {

// ============================================================================
// TokenBucket
// ============================================================================

TokenBucket::TokenBucket(uint32_t capacity, std::chrono::nanoseconds period)
    : capacity_(capacity),
      ns_per_token_(capacity == 0 ? 0 : period.count() / capacity),
      tokens_(0),
      last_refill_ns_(0) {
    if (capacity_ == 0) {
        throw std::invalid_argument("TokenBucket capacity must be positive");
    }
    if (ns_per_token_ <= 0) {
        throw std::invalid_argument("TokenBucket period too short for its capacity");
    }
    reset();
}

int64_t TokenBucket::steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void TokenBucket::refill(int64_t now_ns) {
    const int64_t elapsed_ns = now_ns - last_refill_ns_;
    if (elapsed_ns <= 0) return;

    const int64_t earned = elapsed_ns / ns_per_token_;
    if (earned <= 0) return;

    if (tokens_ + earned >= capacity_) {
        tokens_ = capacity_;
        last_refill_ns_ = now_ns;
    } else {
        tokens_ += static_cast<uint32_t>(earned);
        // Keep the remainder so partial periods are not lost
        last_refill_ns_ += earned * ns_per_token_;
    }
}

bool TokenBucket::try_acquire() {
    return try_acquire_at(steady_now_ns());
}

bool TokenBucket::try_acquire_at(int64_t now_ns) {
    std::lock_guard lock(mutex_);
    refill(now_ns);
    if (tokens_ == 0) {
        return false;
    }
    --tokens_;
    return true;
}

int64_t TokenBucket::wait_time_ns_at(int64_t now_ns) {
    std::lock_guard lock(mutex_);
    refill(now_ns);
    if (tokens_ > 0) return 0;
    return std::max<int64_t>(0, last_refill_ns_ + ns_per_token_ - now_ns);
}

uint32_t TokenBucket::available_tokens() const {
    std::lock_guard lock(mutex_);
    return tokens_;
}

void TokenBucket::reset() {
    std::lock_guard lock(mutex_);
    tokens_ = capacity_;
    last_refill_ns_ = steady_now_ns();
}

// ============================================================================
// RequestGate
// ============================================================================

RequestGate::RequestGate(uint32_t requests, std::chrono::nanoseconds period)
    : bucket_(requests, period) {}

void RequestGate::acquire() {
    // Fast path
    if (bucket_.try_acquire()) return;

    total_waited_.fetch_add(1, std::memory_order_relaxed);

    // Wait loop: sleep until the next token is due, then retry
    while (!bucket_.try_acquire()) {
        const int64_t wait_ns = bucket_.wait_time_ns_at(TokenBucket::steady_now_ns());
        std::this_thread::sleep_for(std::chrono::nanoseconds(std::max<int64_t>(wait_ns, 1'000'000)));
    }
}

} // namespace bqlineage
