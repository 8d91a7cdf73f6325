#include "client_state.hpp"

namespace llm_client {

namespace {

BackoffPolicy makeBackoff(const ClientConfig& config) {
    if (config.jitterSeed != 0) {
        return BackoffPolicy(config.retryBaseDelay, config.maxRetryDelay,
                             config.jitterSeed);
    }
    return BackoffPolicy(config.retryBaseDelay, config.maxRetryDelay);
}

} // namespace

ClientState::ClientState(const ClientConfig& config)
    : semaphore(config.maxConcurrent)
    , buffers()
    , backoff(makeBackoff(config))
    , verbose(config.verbose) {}

UsageStats ClientState::snapshot() const {
    UsageStats s;
    s.totalCalls      = totalCalls.load();
    s.successfulCalls = successfulCalls.load();
    s.failedCalls     = failedCalls.load();
    s.totalAttempts   = totalAttempts.load();
    s.totalRetries    = totalRetries.load();
    s.rateLimited     = rateLimited.load();
    s.streamsOpened   = streamsOpened.load();
    s.eventsDelivered = eventsDelivered.load();
    s.malformedFrames = malformedFrames.load();
    s.inFlight        = semaphore.inUse();
    s.peakInFlight    = semaphore.peak();
    return s;
}

bool ClientState::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mMutex);
    return !mWake.wait_for(lock, duration, [this] { return mShutdown; });
}

void ClientState::requestShutdown() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mShutdown = true;
    }
    mWake.notify_all();
}

bool ClientState::shutdownRequested() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mShutdown;
}

} // namespace llm_client
