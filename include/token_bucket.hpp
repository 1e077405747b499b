#pragma once

#include <chrono>
#include <mutex>

namespace apicache {

// Non-blocking token bucket. Starts full at `burst` tokens and refills
// continuously at `rate` tokens per second, never above `burst`.
// A burst of zero denies every request.
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double rate, int burst);
    TokenBucket(double rate, int burst, Clock::time_point start);

    // Consumes one token if available; never waits.
    bool allow();

    // Same as allow() with an explicit clock reading. Readings earlier than
    // the last one are treated as no elapsed time.
    bool allow_at(Clock::time_point now);

    double rate() const { return rate_; }
    int burst() const { return burst_; }

private:
    const double rate_;
    const int burst_;
    double tokens_;
    Clock::time_point last_;
    std::mutex mutex_;
};

}
