#pragma once

#include "backoff.hpp"
#include "buffer_pool.hpp"
#include "config.hpp"
#include "models.hpp"
#include "semaphore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace llm_client {

/// Components shared by a ChatClient and the streams it hands out.  Held by
/// shared ownership so an open EventStream keeps them alive.
struct ClientState {
    explicit ClientState(const ClientConfig& config);

    Semaphore     semaphore;
    BufferPool    buffers;
    BackoffPolicy backoff;
    const bool    verbose;

    std::atomic<std::uint64_t> totalCalls{0};
    std::atomic<std::uint64_t> successfulCalls{0};
    std::atomic<std::uint64_t> failedCalls{0};
    std::atomic<std::uint64_t> totalAttempts{0};
    std::atomic<std::uint64_t> totalRetries{0};
    std::atomic<std::uint64_t> rateLimited{0};
    std::atomic<std::uint64_t> streamsOpened{0};
    std::atomic<std::uint64_t> eventsDelivered{0};
    std::atomic<std::uint64_t> malformedFrames{0};

    UsageStats snapshot() const;

    /// Sleep for @p duration unless shutdown is requested first.
    /// @return false if woken by shutdown.
    bool sleepFor(std::chrono::milliseconds duration);

    void requestShutdown();
    bool shutdownRequested() const;

private:
    mutable std::mutex      mMutex;
    std::condition_variable mWake;
    bool                    mShutdown = false;
};

} // namespace llm_client
