#include "semaphore.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace llm_client {

Semaphore::Semaphore(std::size_t permits)
    : mCapacity(permits)
{
    if (permits == 0) {
        throw std::invalid_argument("Semaphore needs at least one permit");
    }
}

void Semaphore::acquire() {
    std::unique_lock<std::mutex> lock(mMutex);
    mFreed.wait(lock, [this] { return mInUse < mCapacity; });
    ++mInUse;
    mPeak = std::max(mPeak, mInUse);
}

bool Semaphore::tryAcquireUntil(Deadline deadline) {
    std::unique_lock<std::mutex> lock(mMutex);
    if (!mFreed.wait_until(lock, deadline, [this] { return mInUse < mCapacity; })) {
        return false;
    }
    ++mInUse;
    mPeak = std::max(mPeak, mInUse);
    return true;
}

void Semaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mInUse == 0) return;
        --mInUse;
    }
    mFreed.notify_one();
}

std::size_t Semaphore::inUse() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mInUse;
}

std::size_t Semaphore::peak() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPeak;
}

SemaphorePermit::SemaphorePermit(SemaphorePermit&& other) noexcept
    : mSemaphore(std::exchange(other.mSemaphore, nullptr)) {}

SemaphorePermit& SemaphorePermit::operator=(SemaphorePermit&& other) noexcept {
    if (this != &other) {
        release();
        mSemaphore = std::exchange(other.mSemaphore, nullptr);
    }
    return *this;
}

void SemaphorePermit::release() {
    if (mSemaphore != nullptr) {
        std::exchange(mSemaphore, nullptr)->release();
    }
}

} // namespace llm_client
