#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace llm_client {

/// Absolute instant by which a logical call must complete or fail.
using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// One conversation turn; passed through unmodified to the backend.
struct Message {
    std::string role;      // "system", "user", "assistant", ...
    std::string content;
};

void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);

/// One `data: ` frame extracted from a text/event-stream body.
struct SseEvent {
    std::string data;
};

/// Decoded non-streaming completion.
struct ChatResponse {
    unsigned int   httpStatus = 0;
    std::string    idempotencyKey;
    int            attempts   = 0;
    nlohmann::json body;
};

/// Read-only snapshot of a client's counters.
struct UsageStats {
    std::uint64_t totalCalls       = 0;
    std::uint64_t successfulCalls  = 0;
    std::uint64_t failedCalls      = 0;
    std::uint64_t totalAttempts    = 0;
    std::uint64_t totalRetries     = 0;
    std::uint64_t rateLimited      = 0;
    std::uint64_t streamsOpened    = 0;
    std::uint64_t eventsDelivered  = 0;
    std::uint64_t malformedFrames  = 0;
    std::uint64_t inFlight         = 0;
    std::uint64_t peakInFlight     = 0;
};

} // namespace llm_client
