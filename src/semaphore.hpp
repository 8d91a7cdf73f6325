#pragma once

#include "models.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace llm_client {

/// Counting semaphore bounding in-flight logical calls.  Also tracks the
/// current and peak number of holders for the usage snapshot.
class Semaphore {
public:
    explicit Semaphore(std::size_t permits);

    Semaphore(const Semaphore&)            = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    /// Block until a permit is free.
    void acquire();

    /// Block until a permit is free or @p deadline passes.
    /// @return false if the deadline passed first.
    bool tryAcquireUntil(Deadline deadline);

    void release();

    std::size_t capacity() const { return mCapacity; }
    std::size_t inUse()    const;
    std::size_t peak()     const;

private:
    const std::size_t       mCapacity;
    mutable std::mutex      mMutex;
    std::condition_variable mFreed;
    std::size_t             mInUse = 0;
    std::size_t             mPeak  = 0;
};

/// One held permit.  Move-only; released on destruction unless already
/// released explicitly.
class SemaphorePermit {
public:
    SemaphorePermit() = default;
    explicit SemaphorePermit(Semaphore& semaphore) : mSemaphore(&semaphore) {}
    SemaphorePermit(SemaphorePermit&& other) noexcept;
    SemaphorePermit& operator=(SemaphorePermit&& other) noexcept;
    ~SemaphorePermit() { release(); }

    SemaphorePermit(const SemaphorePermit&)            = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

    bool held() const { return mSemaphore != nullptr; }
    void release();

private:
    Semaphore* mSemaphore = nullptr;
};

} // namespace llm_client
