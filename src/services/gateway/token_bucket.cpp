/// @file token_bucket.cpp
/// @brief TokenBucket implementation.

#include "sgw/service/token_bucket.hpp"

#include <algorithm>

namespace sgw::service {

using sgw::foundation::SessionId;

TokenBucket::TokenBucket(uint32_t capacity, uint32_t refillRate)
    : capacity_(capacity), refillRate_(refillRate) {}

bool TokenBucket::consume(SessionId key, uint32_t tokens, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{static_cast<double>(capacity_), now}).first;
    }

    refill(it->second, now);

    auto required = static_cast<double>(tokens);
    if (it->second.tokens < required) {
        return false;
    }

    it->second.tokens -= required;
    return true;
}

uint32_t TokenBucket::available(SessionId key, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return capacity_;
    }

    refill(it->second, now);
    return static_cast<uint32_t>(it->second.tokens);
}

void TokenBucket::remove(SessionId key) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(key);
}

void TokenBucket::reset(SessionId key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[key] = Bucket{static_cast<double>(capacity_), now};
}

void TokenBucket::refill(Bucket& bucket, Clock::time_point now) const {
    // A caller-supplied clock may run behind the last refill; never refund.
    if (now <= bucket.lastRefill) {
        return;
    }
    auto elapsed = std::chrono::duration<double>(now - bucket.lastRefill).count();

    auto added = elapsed * static_cast<double>(refillRate_);
    bucket.tokens = std::min(bucket.tokens + added, static_cast<double>(capacity_));
    bucket.lastRefill = now;
}

} // namespace sgw::service
