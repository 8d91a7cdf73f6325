#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace llm_client {

/// Classification of a failed call, fixed at the point the failure is
/// first observed (HTTP status, socket error, deadline check).
enum class ErrorKind {
    DeadlineExceeded,
    Canceled,
    RateLimited,
    Server5xx,
    BadRequest,
    ConnectionFailed,
    StreamTimeout,
    MaxRetriesExceeded,
    Unexpected
};

const char* toString(ErrorKind kind);

/// Typed error surfaced by the client.  Carries enough context for a caller
/// to tell "try again later" from "fix the request" from "out of time".
class ClientError : public std::runtime_error {
public:
    ClientError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return mKind; }

    /// True for the transient classes the executor retries locally.
    bool isRetriable() const;

    std::chrono::milliseconds elapsed()         const { return mElapsed; }
    std::chrono::milliseconds remainingBudget() const { return mRemaining; }
    std::chrono::milliseconds retryAfter()      const { return mRetryAfter; }
    unsigned int              httpStatus()      const { return mHttpStatus; }

    /// For MaxRetriesExceeded: the kind of the last attempt's error.
    ErrorKind lastErrorKind() const { return mLastKind; }

    ClientError& withElapsed(std::chrono::milliseconds elapsed);
    ClientError& withRemaining(std::chrono::milliseconds remaining);
    ClientError& withRetryAfter(std::chrono::milliseconds retryAfter);
    ClientError& withHttpStatus(unsigned int status);
    ClientError& withLastErrorKind(ErrorKind kind);

private:
    ErrorKind                 mKind;
    ErrorKind                 mLastKind   = ErrorKind::Unexpected;
    std::chrono::milliseconds mElapsed{0};
    std::chrono::milliseconds mRemaining{0};
    std::chrono::milliseconds mRetryAfter{0};
    unsigned int              mHttpStatus = 0;
};

/// Map a non-2xx HTTP status to its error class.
ErrorKind classifyStatus(unsigned int status);

} // namespace llm_client
