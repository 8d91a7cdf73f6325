#include "errors.hpp"

namespace llm_client {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeadlineExceeded:   return "DeadlineExceeded";
        case ErrorKind::Canceled:           return "Canceled";
        case ErrorKind::RateLimited:        return "RateLimited";
        case ErrorKind::Server5xx:          return "Server5xx";
        case ErrorKind::BadRequest:         return "BadRequest";
        case ErrorKind::ConnectionFailed:   return "ConnectionFailed";
        case ErrorKind::StreamTimeout:      return "StreamTimeout";
        case ErrorKind::MaxRetriesExceeded: return "MaxRetriesExceeded";
        case ErrorKind::Unexpected:         return "Unexpected";
    }
    return "Unknown";
}

ClientError::ClientError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message)
    , mKind(kind) {}

bool ClientError::isRetriable() const {
    return mKind == ErrorKind::RateLimited
        || mKind == ErrorKind::Server5xx
        || mKind == ErrorKind::ConnectionFailed;
}

ClientError& ClientError::withElapsed(std::chrono::milliseconds elapsed) {
    mElapsed = elapsed;
    return *this;
}

ClientError& ClientError::withRemaining(std::chrono::milliseconds remaining) {
    mRemaining = remaining;
    return *this;
}

ClientError& ClientError::withRetryAfter(std::chrono::milliseconds retryAfter) {
    mRetryAfter = retryAfter;
    return *this;
}

ClientError& ClientError::withHttpStatus(unsigned int status) {
    mHttpStatus = status;
    return *this;
}

ClientError& ClientError::withLastErrorKind(ErrorKind kind) {
    mLastKind = kind;
    return *this;
}

ErrorKind classifyStatus(unsigned int status) {
    if (status == 429) return ErrorKind::RateLimited;
    if (status >= 500) return ErrorKind::Server5xx;
    if (status >= 400) return ErrorKind::BadRequest;
    return ErrorKind::Unexpected;  // 1xx / 3xx are not expected from the API
}

} // namespace llm_client
