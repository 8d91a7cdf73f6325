#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace llm_client {

/// Jitter is drawn from [0, kJitterRatio) of the unjittered delay.
constexpr double kJitterRatio = 0.1;

/// Exponential backoff for the retry that follows failed attempt @p attempt
/// (1-based): min(base * 2^(attempt-1) + jitter, maxDelay), where
/// jitter = unjittered * kJitterRatio * jitterFraction and jitterFraction
/// is expected in [0, 1).
std::chrono::milliseconds computeBackoff(int attempt,
                                         std::chrono::milliseconds base,
                                         std::chrono::milliseconds maxDelay,
                                         double jitterFraction);

/// computeBackoff with a real random jitter source.  Safe to share between
/// threads; a fixed seed makes the sequence reproducible in tests.
class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds base,
                  std::chrono::milliseconds maxDelay);
    BackoffPolicy(std::chrono::milliseconds base,
                  std::chrono::milliseconds maxDelay,
                  std::uint64_t seed);

    std::chrono::milliseconds delayFor(int attempt);

    std::chrono::milliseconds base()     const { return mBase; }
    std::chrono::milliseconds maxDelay() const { return mMaxDelay; }

private:
    std::chrono::milliseconds mBase;
    std::chrono::milliseconds mMaxDelay;

    std::mutex                             mMutex;
    std::mt19937_64                        mRng;
    std::uniform_real_distribution<double> mUnit{0.0, 1.0};
};

} // namespace llm_client
