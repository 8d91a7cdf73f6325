/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, Retry-After parsing, idempotency keys.

#include "util.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <regex>
#include <set>
#include <stdexcept>

using namespace llm_client;
using std::chrono::milliseconds;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:3000/v1/chat/completions");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "3000");
    EXPECT_EQ(parts.target, "/v1/chat/completions");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://api.example.com/proxy");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/proxy");
}

TEST(ParseUrl, SchemeIsLowerCased) {
    auto parts = parseUrl("HTTP://example.com:8080");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.port, "8080");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://localhost:3000");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:3000/v1"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///v1"), std::invalid_argument);
}

TEST(ParseUrl, NonNumericPortThrows) {
    EXPECT_THROW(parseUrl("http://localhost:http/v1"), std::invalid_argument);
    EXPECT_THROW(parseUrl("http://localhost:/v1"), std::invalid_argument);
}

TEST(ParseUrl, GarbageStringThrows) {
    EXPECT_THROW(parseUrl("not-a-url"), std::invalid_argument);
}

// ============================================================================
// joinPath
// ============================================================================

TEST(JoinPath, RootBase) {
    EXPECT_EQ(joinPath("/", "/v1/chat/completions"), "/v1/chat/completions");
}

TEST(JoinPath, PrefixedBase) {
    EXPECT_EQ(joinPath("/api", "/v1/chat/completions"), "/api/v1/chat/completions");
    EXPECT_EQ(joinPath("/api/", "/v1/chat/completions"), "/api/v1/chat/completions");
}

TEST(JoinPath, RelativePathGetsSeparator) {
    EXPECT_EQ(joinPath("/api", "v1"), "/api/v1");
}

// ============================================================================
// parseRetryAfter
// ============================================================================

TEST(ParseRetryAfter, IntegerSeconds) {
    EXPECT_EQ(parseRetryAfter("2"), milliseconds(2000));
    EXPECT_EQ(parseRetryAfter("0"), milliseconds(0));
}

TEST(ParseRetryAfter, DecimalSeconds) {
    EXPECT_EQ(parseRetryAfter("0.25"), milliseconds(250));
    EXPECT_EQ(parseRetryAfter("1.5"), milliseconds(1500));
}

TEST(ParseRetryAfter, SurroundingWhitespaceIgnored) {
    EXPECT_EQ(parseRetryAfter("  3 "), milliseconds(3000));
}

TEST(ParseRetryAfter, AbsentDefaultsToOneSecond) {
    EXPECT_EQ(parseRetryAfter(""), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("   "), milliseconds(1000));
}

TEST(ParseRetryAfter, UnparseableDefaultsToOneSecond) {
    EXPECT_EQ(parseRetryAfter("soon"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("2s"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("-1"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("+5"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter(".5"), milliseconds(1000));
}

TEST(ParseRetryAfter, OnlyDecimalDigitsAccepted) {
    EXPECT_EQ(parseRetryAfter("0x10"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("1e3"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("1e20"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("inf"), milliseconds(1000));
    EXPECT_EQ(parseRetryAfter("1.2.3"), milliseconds(1000));
}

TEST(ParseRetryAfter, HugeValueIsClampedNotWrapped) {
    const auto maxWait = milliseconds(static_cast<int64_t>(kMaxRetryAfterSeconds * 1000.0));
    EXPECT_EQ(parseRetryAfter("100000000000000000000"), maxWait);
    EXPECT_EQ(parseRetryAfter("999999999999999999999999999999.5"), maxWait);
    EXPECT_EQ(parseRetryAfter("86400"), milliseconds(86400000));

    // Converting the clamped wait to a finer clock must stay in range.
    const auto asNanos = std::chrono::duration_cast<std::chrono::nanoseconds>(maxWait);
    EXPECT_GT(asNanos.count(), 0);
}

// ============================================================================
// generateIdempotencyKey
// ============================================================================

TEST(IdempotencyKey, HasTagMillisAndHexSuffix) {
    const std::regex shape("^cpp-[0-9]+-[0-9a-f]{9}$");
    for (int i = 0; i < 20; ++i) {
        const auto key = generateIdempotencyKey("cpp");
        EXPECT_TRUE(std::regex_match(key, shape)) << key;
    }
}

TEST(IdempotencyKey, UsesGivenTag) {
    EXPECT_EQ(generateIdempotencyKey("cli").rfind("cli-", 0), 0u);
}

TEST(IdempotencyKey, DistinctAcrossCalls) {
    std::set<std::string> keys;
    for (int i = 0; i < 1000; ++i) {
        keys.insert(generateIdempotencyKey("cpp"));
    }
    EXPECT_EQ(keys.size(), 1000u);
}

// ============================================================================
// remainingUntil
// ============================================================================

TEST(RemainingUntil, FutureDeadline) {
    const auto now = Clock::now();
    EXPECT_EQ(remainingUntil(now + milliseconds(1500), now), milliseconds(1500));
}

TEST(RemainingUntil, PastDeadlineIsZero) {
    const auto now = Clock::now();
    EXPECT_EQ(remainingUntil(now - milliseconds(5), now), milliseconds(0));
    EXPECT_EQ(remainingUntil(now, now), milliseconds(0));
}
