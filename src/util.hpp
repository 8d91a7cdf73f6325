#pragma once

#include "models.hpp"

#include <chrono>
#include <string>

namespace llm_client {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "3000", etc.
    std::string target;   // path component (e.g. "/" or "/proxy")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Append @p path to a base target without doubling the separator:
/// joinPath("/", "/v1/x") == "/v1/x", joinPath("/api/", "/v1/x") == "/api/v1/x".
std::string joinPath(const std::string& base, const std::string& path);

/// Largest Retry-After honoured; bigger values are clamped to it.
constexpr double kMaxRetryAfterSeconds = 1e9;

/// Parse a Retry-After header value given in delta-seconds (decimal digits,
/// optionally with a fraction).  Absent, signed, hexadecimal or otherwise
/// unparseable values yield one second.
std::chrono::milliseconds parseRetryAfter(const std::string& value);

/// `<tag>-<unix millis>-<9 lowercase hex chars>`; one per logical call.
std::string generateIdempotencyKey(const std::string& tag);

/// max(0, deadline - now), truncated to milliseconds.
std::chrono::milliseconds remainingUntil(Deadline deadline,
                                         Deadline now = Clock::now());

/// Whole milliseconds in a steady-clock duration.
std::chrono::milliseconds toMillis(Clock::duration d);

} // namespace llm_client
