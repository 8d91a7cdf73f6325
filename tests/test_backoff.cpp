/// @file test_backoff.cpp
/// Unit tests for backoff.hpp: exponential delay with bounded jitter.

#include "backoff.hpp"

#include <gtest/gtest.h>

using namespace llm_client;
using std::chrono::milliseconds;

// ============================================================================
// computeBackoff
// ============================================================================

TEST(ComputeBackoff, DoublesPerAttemptWithoutJitter) {
    const milliseconds base(100), cap(5000);
    EXPECT_EQ(computeBackoff(1, base, cap, 0.0), milliseconds(100));
    EXPECT_EQ(computeBackoff(2, base, cap, 0.0), milliseconds(200));
    EXPECT_EQ(computeBackoff(3, base, cap, 0.0), milliseconds(400));
    EXPECT_EQ(computeBackoff(4, base, cap, 0.0), milliseconds(800));
}

TEST(ComputeBackoff, JitterAddsAtMostTenPercent) {
    const milliseconds base(100), cap(5000);
    EXPECT_GE(computeBackoff(1, base, cap, 0.5), milliseconds(104));
    EXPECT_LE(computeBackoff(1, base, cap, 0.5), milliseconds(105));
    EXPECT_LE(computeBackoff(3, base, cap, 0.999), milliseconds(440));
    EXPECT_GE(computeBackoff(3, base, cap, 0.999), milliseconds(400));
}

TEST(ComputeBackoff, ClampedToMaxDelay) {
    const milliseconds base(100), cap(5000);
    EXPECT_EQ(computeBackoff(7, base, cap, 0.0), milliseconds(5000));   // 6400 unclamped
    EXPECT_EQ(computeBackoff(10, base, cap, 0.9), milliseconds(5000));
    EXPECT_EQ(computeBackoff(200, base, cap, 0.9), milliseconds(5000));
}

TEST(ComputeBackoff, JitterCannotPushPastCap) {
    // 4800 + 10% jitter would be 5280.
    EXPECT_EQ(computeBackoff(1, milliseconds(4800), milliseconds(5000), 0.99),
              milliseconds(5000));
}

TEST(ComputeBackoff, AttemptBelowOneTreatedAsFirst) {
    EXPECT_EQ(computeBackoff(0, milliseconds(100), milliseconds(5000), 0.0),
              milliseconds(100));
    EXPECT_EQ(computeBackoff(-3, milliseconds(100), milliseconds(5000), 0.0),
              milliseconds(100));
}

TEST(ComputeBackoff, ZeroBaseMeansNoWait) {
    EXPECT_EQ(computeBackoff(5, milliseconds(0), milliseconds(0), 0.7), milliseconds(0));
}

// ============================================================================
// BackoffPolicy
// ============================================================================

TEST(BackoffPolicy, DelaysStayWithinJitterBand) {
    BackoffPolicy policy(milliseconds(100), milliseconds(5000));
    for (int i = 0; i < 200; ++i) {
        for (int attempt = 1; attempt <= 4; ++attempt) {
            const auto floor   = computeBackoff(attempt, milliseconds(100), milliseconds(5000), 0.0);
            const auto ceiling = computeBackoff(attempt, milliseconds(100), milliseconds(5000), 1.0);
            const auto d = policy.delayFor(attempt);
            EXPECT_GE(d, floor);
            EXPECT_LE(d, ceiling);
        }
    }
}

TEST(BackoffPolicy, NeverExceedsMaxDelay) {
    BackoffPolicy policy(milliseconds(100), milliseconds(5000));
    for (int attempt = 1; attempt <= 64; ++attempt) {
        EXPECT_LE(policy.delayFor(attempt), milliseconds(5000)) << "attempt " << attempt;
    }
}

TEST(BackoffPolicy, GrowsMonotonicallyUntilCap) {
    BackoffPolicy policy(milliseconds(100), milliseconds(5000), 42);
    milliseconds previous{0};
    for (int attempt = 1; attempt <= 10; ++attempt) {
        const auto d = policy.delayFor(attempt);
        // Jitter is under 10%, so doubling always dominates it.
        EXPECT_GE(d, previous) << "attempt " << attempt;
        previous = d;
    }
    EXPECT_EQ(previous, milliseconds(5000));
}

TEST(BackoffPolicy, SameSeedSameSequence) {
    BackoffPolicy a(milliseconds(100), milliseconds(5000), 1234);
    BackoffPolicy b(milliseconds(100), milliseconds(5000), 1234);
    for (int attempt = 1; attempt <= 6; ++attempt) {
        EXPECT_EQ(a.delayFor(attempt), b.delayFor(attempt));
    }
}

TEST(BackoffPolicy, ExposesConfiguredBounds) {
    BackoffPolicy policy(milliseconds(250), milliseconds(2000));
    EXPECT_EQ(policy.base(), milliseconds(250));
    EXPECT_EQ(policy.maxDelay(), milliseconds(2000));
}
