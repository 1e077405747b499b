#include "token_bucket.hpp"

#include <algorithm>

namespace apicache {

TokenBucket::TokenBucket(double rate, int burst)
    : TokenBucket(rate, burst, Clock::now())
{}

TokenBucket::TokenBucket(double rate, int burst, Clock::time_point start)
    : rate_(rate > 0.0 ? rate : 0.0)
    , burst_(burst > 0 ? burst : 0)
    , tokens_(static_cast<double>(burst_))
    , last_(start)
{}

bool TokenBucket::allow() {
    return allow_at(Clock::now());
}

bool TokenBucket::allow_at(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (now > last_) {
        double elapsed = std::chrono::duration<double>(now - last_).count();
        tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * rate_);
        last_ = now;
    }

    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

}
