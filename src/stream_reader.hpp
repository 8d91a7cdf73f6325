#pragma once

#include "buffer_pool.hpp"
#include "client_state.hpp"
#include "models.hpp"
#include "semaphore.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace llm_client {

/// Incremental extractor of `data: ` frames from accumulated stream bytes.
///
/// Tracks how far into the buffer it has consumed, so each line is looked at
/// exactly once and a line split across chunks is only parsed after its
/// terminating newline arrives.  Accepts "\n" and "\r\n" line endings;
/// lines without the `data: ` prefix are skipped.
class SseParser {
public:
    static constexpr const char* kDataPrefix = "data: ";

    /// Extract the next complete frame from @p buffer.
    /// @return false when no complete `data: ` line remains.
    bool next(const std::vector<char>& buffer, SseEvent& out);

    /// Treat an unterminated final line as complete (end of body).
    bool flush(const std::vector<char>& buffer, SseEvent& out);

    /// Erase consumed bytes from the front of @p buffer.
    void compact(std::vector<char>& buffer);

    std::size_t consumed() const { return mConsumed; }

private:
    bool takeLine(const std::vector<char>& buffer, std::size_t end,
                  std::size_t next, SseEvent& out);

    std::size_t mConsumed = 0;
};

/// Lazy, finite, non-restartable sequence of decoded events from one
/// streaming call.
///
/// Pull-based: each next() reads from the socket only as far as needed to
/// complete one event.  While open the stream holds the call's concurrency
/// permit and a pooled buffer; both are given back as soon as the stream
/// terminates, fails, or is destroyed.
class EventStream {
public:
    static constexpr std::size_t kReadChunk = 4096;

    /// How long to keep reading past `[DONE]` for the end of the body, so
    /// the connection can return to the pool.
    static constexpr std::chrono::milliseconds kDrainWindow{100};

    EventStream() = default;
    EventStream(std::shared_ptr<ClientState>  state,
                SemaphorePermit               permit,
                std::unique_ptr<ChunkSource>  source,
                Deadline                      deadline,
                Clock::time_point             callStart,
                std::string                   idempotencyKey);

    EventStream(EventStream&& other) noexcept;
    EventStream& operator=(EventStream&& other) noexcept;
    ~EventStream();

    EventStream(const EventStream&)            = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// The next decoded event, or std::nullopt once the stream has ended
    /// (`[DONE]` or end of body).  Malformed frames are skipped.
    /// @throws ClientError (StreamTimeout / ConnectionFailed) on failure;
    ///         the stream is finished afterwards.
    std::optional<nlohmann::json> next();

    bool finished() const { return mFinished; }

    /// Abandon the stream early, closing its connection.
    void close();

    const std::string& idempotencyKey() const { return mIdempotencyKey; }

private:
    void finish(bool succeeded);
    void drainBody();
    std::optional<nlohmann::json> decode(const SseEvent& event);

    // Declaration order matters: resources are released before the state
    // that owns the pool and semaphore.
    std::shared_ptr<ClientState> mState;
    SemaphorePermit              mPermit;
    BufferPool::Lease            mBuffer;
    std::unique_ptr<ChunkSource> mSource;
    SseParser                    mParser;
    Deadline                     mDeadline{};
    Clock::time_point            mCallStart{};
    std::string                  mIdempotencyKey;
    bool                         mFinished = true;
};

} // namespace llm_client
