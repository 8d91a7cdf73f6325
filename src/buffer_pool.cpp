#include "buffer_pool.hpp"

#include <utility>

namespace llm_client {

BufferPool::BufferPool(std::size_t maxPooled,
                       std::size_t defaultCapacity,
                       std::size_t capacityCeiling)
    : mMaxPooled(maxPooled)
    , mDefaultCapacity(defaultCapacity)
    , mCapacityCeiling(capacityCeiling) {}

BufferPool::Buffer BufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!mFree.empty()) {
            Buffer buffer = std::move(mFree.back());
            mFree.pop_back();
            buffer.clear();
            return buffer;
        }
    }
    Buffer buffer;
    buffer.reserve(mDefaultCapacity);
    return buffer;
}

void BufferPool::release(Buffer buffer) {
    if (buffer.capacity() > mCapacityCeiling) return;

    buffer.clear();
    std::lock_guard<std::mutex> lock(mMutex);
    if (mFree.size() < mMaxPooled) {
        mFree.push_back(std::move(buffer));
    }
}

std::size_t BufferPool::pooled() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mFree.size();
}

// ---------------------------------------------------------------------------
// Lease
// ---------------------------------------------------------------------------

BufferPool::Lease::Lease(BufferPool& pool, Buffer buffer)
    : mPool(&pool)
    , mBuffer(std::move(buffer)) {}

BufferPool::Lease::Lease(Lease&& other) noexcept
    : mPool(std::exchange(other.mPool, nullptr))
    , mBuffer(std::move(other.mBuffer)) {}

BufferPool::Lease& BufferPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        mPool   = std::exchange(other.mPool, nullptr);
        mBuffer = std::move(other.mBuffer);
    }
    return *this;
}

BufferPool::Lease::~Lease() {
    release();
}

void BufferPool::Lease::release() {
    if (mPool == nullptr) return;
    std::exchange(mPool, nullptr)->release(std::move(mBuffer));
    mBuffer = Buffer{};
}

} // namespace llm_client
