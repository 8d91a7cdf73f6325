#include "backoff.hpp"

#include <algorithm>
#include <cmath>

namespace llm_client {

std::chrono::milliseconds computeBackoff(int attempt,
                                         std::chrono::milliseconds base,
                                         std::chrono::milliseconds maxDelay,
                                         double jitterFraction) {
    attempt        = std::max(attempt, 1);
    jitterFraction = std::min(std::max(jitterFraction, 0.0), 1.0);

    // Computed in floating point so large attempt numbers saturate at the
    // cap instead of overflowing the shift.
    const double cap     = static_cast<double>(maxDelay.count());
    const double delay   = static_cast<double>(base.count()) *
                           std::pow(2.0, static_cast<double>(attempt - 1));
    const double jitter  = delay * kJitterRatio * jitterFraction;
    const double clamped = std::min(delay + jitter, cap);

    return std::chrono::milliseconds(static_cast<int64_t>(clamped));
}

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base,
                             std::chrono::milliseconds maxDelay)
    : BackoffPolicy(base, maxDelay, std::random_device{}()) {}

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base,
                             std::chrono::milliseconds maxDelay,
                             std::uint64_t seed)
    : mBase(base)
    , mMaxDelay(maxDelay)
    , mRng(seed) {}

std::chrono::milliseconds BackoffPolicy::delayFor(int attempt) {
    double fraction = 0.0;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        fraction = mUnit(mRng);
    }
    return computeBackoff(attempt, mBase, mMaxDelay, fraction);
}

} // namespace llm_client
