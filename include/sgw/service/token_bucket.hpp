#pragma once

/// @file token_bucket.hpp
/// @brief Per-session token bucket used for command rate limiting and for
///        the output byte budget.

#include <chrono>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "sgw/foundation/types.hpp"

namespace sgw::service {

/// Token bucket keyed by session.
///
/// Each session's bucket fills at a constant rate and can burst up to a
/// configured capacity. Every operation takes the current time so callers
/// (and tests) control the clock.
///
/// Example:
/// @code
///   TokenBucket commands(20, 10);            // 20 burst, 10 per second
///   if (!commands.consume(sid, 1, now)) { ... }
///
///   TokenBucket output(1 << 20, 1 << 18);    // byte budget
///   if (!output.consume(sid, bytes.size(), now)) { ... }
/// @endcode
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    /// Construct with capacity (max burst) and refill rate (tokens/second).
    TokenBucket(uint32_t capacity, uint32_t refillRate);

    /// Try to consume @p tokens for the session.
    [[nodiscard]] bool consume(sgw::foundation::SessionId key, uint32_t tokens,
                               Clock::time_point now);

    [[nodiscard]] bool consume(sgw::foundation::SessionId key, uint32_t tokens = 1) {
        return consume(key, tokens, Clock::now());
    }

    /// Tokens currently available for the session.
    [[nodiscard]] uint32_t available(sgw::foundation::SessionId key,
                                     Clock::time_point now) const;

    /// Forget a session (on disconnect).
    void remove(sgw::foundation::SessionId key);

    /// Refill a session's bucket to full capacity.
    void reset(sgw::foundation::SessionId key, Clock::time_point now);

    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }

private:
    struct Bucket {
        double tokens;
        Clock::time_point lastRefill;
    };

    void refill(Bucket& bucket, Clock::time_point now) const;

    uint32_t capacity_;
    uint32_t refillRate_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<sgw::foundation::SessionId, Bucket> buckets_;
};

} // namespace sgw::service
