#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace llm_client {

/// Recycles byte buffers used by streaming reads.  Buffers come back cleared
/// with their capacity intact; oversized buffers and buffers beyond the held
/// count are dropped so the pool's memory stays bounded.
class BufferPool {
public:
    using Buffer = std::vector<char>;

    static constexpr std::size_t kDefaultCapacity  = 8 * 1024;
    static constexpr std::size_t kCapacityCeiling  = 64 * 1024;
    static constexpr std::size_t kDefaultMaxPooled = 10;

    explicit BufferPool(std::size_t maxPooled       = kDefaultMaxPooled,
                        std::size_t defaultCapacity = kDefaultCapacity,
                        std::size_t capacityCeiling = kCapacityCeiling);

    BufferPool(const BufferPool&)            = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /// A pooled buffer (empty, capacity kept) or a fresh default-sized one.
    Buffer acquire();

    /// Return @p buffer; kept only if under the ceiling and the pool has room.
    void release(Buffer buffer);

    std::size_t pooled()    const;
    std::size_t maxPooled() const { return mMaxPooled; }

    /// Scoped ownership of one acquired buffer; gives it back on destruction.
    class Lease {
    public:
        Lease() = default;
        Lease(BufferPool& pool, Buffer buffer);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        Buffer&       get()       { return mBuffer; }
        const Buffer& get() const { return mBuffer; }
        bool          active() const { return mPool != nullptr; }

        /// Return the buffer now rather than at destruction.
        void release();

    private:
        BufferPool* mPool = nullptr;
        Buffer      mBuffer;
    };

    Lease lease() { return Lease(*this, acquire()); }

private:
    std::size_t mMaxPooled;
    std::size_t mDefaultCapacity;
    std::size_t mCapacityCeiling;

    mutable std::mutex  mMutex;
    std::vector<Buffer> mFree;
};

} // namespace llm_client
