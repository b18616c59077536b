#pragma once
#include <chrono>
#include <mutex>
#include "../interfaces/IRateLimiter.hpp"

namespace FetchCache {
    // Token bucket. Starts full; `burst` <= 0 uses the rate as capacity.
    class RateLimiter : public IRateLimiter {
    public:
        explicit RateLimiter(double rate_per_second, double burst = 0.0);
        bool TryAcquire() override;
        double Available();
    private:
        void RefillUnlocked();

        double rate;
        double capacity;
        double allowance;
        std::chrono::steady_clock::time_point last_check;
        std::mutex mutex;
    };
}
