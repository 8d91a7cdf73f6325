#include "stream_reader.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <utility>

namespace llm_client {

// ---------------------------------------------------------------------------
// SseParser
// ---------------------------------------------------------------------------

bool SseParser::next(const std::vector<char>& buffer, SseEvent& out) {
    while (mConsumed < buffer.size()) {
        auto first   = buffer.begin() + static_cast<std::ptrdiff_t>(mConsumed);
        auto newline = std::find(first, buffer.end(), '\n');
        if (newline == buffer.end()) return false;  // partial line, wait for more

        const auto end = static_cast<std::size_t>(newline - buffer.begin());
        if (takeLine(buffer, end, end + 1, out)) return true;
    }
    return false;
}

bool SseParser::flush(const std::vector<char>& buffer, SseEvent& out) {
    if (next(buffer, out)) return true;
    if (mConsumed >= buffer.size()) return false;
    return takeLine(buffer, buffer.size(), buffer.size(), out);
}

void SseParser::compact(std::vector<char>& buffer) {
    if (mConsumed == 0) return;
    buffer.erase(buffer.begin(),
                 buffer.begin() + static_cast<std::ptrdiff_t>(mConsumed));
    mConsumed = 0;
}

bool SseParser::takeLine(const std::vector<char>& buffer, std::size_t end,
                         std::size_t next, SseEvent& out) {
    const std::size_t begin = mConsumed;
    mConsumed = next;

    std::size_t length = end - begin;
    if (length > 0 && buffer[begin + length - 1] == '\r') --length;

    const std::size_t prefix = std::strlen(kDataPrefix);
    if (length < prefix ||
        std::memcmp(buffer.data() + begin, kDataPrefix, prefix) != 0) {
        return false;
    }
    out.data.assign(buffer.data() + begin + prefix, length - prefix);
    return true;
}

// ---------------------------------------------------------------------------
// EventStream
// ---------------------------------------------------------------------------

EventStream::EventStream(std::shared_ptr<ClientState>  state,
                         SemaphorePermit               permit,
                         std::unique_ptr<ChunkSource>  source,
                         Deadline                      deadline,
                         Clock::time_point             callStart,
                         std::string                   idempotencyKey)
    : mState(std::move(state))
    , mPermit(std::move(permit))
    , mBuffer(mState->buffers.lease())
    , mSource(std::move(source))
    , mDeadline(deadline)
    , mCallStart(callStart)
    , mIdempotencyKey(std::move(idempotencyKey))
    , mFinished(false)
{
    ++mState->streamsOpened;
}

EventStream::EventStream(EventStream&& other) noexcept
    : mState(std::move(other.mState))
    , mPermit(std::move(other.mPermit))
    , mBuffer(std::move(other.mBuffer))
    , mSource(std::move(other.mSource))
    , mParser(other.mParser)
    , mDeadline(other.mDeadline)
    , mCallStart(other.mCallStart)
    , mIdempotencyKey(std::move(other.mIdempotencyKey))
    , mFinished(std::exchange(other.mFinished, true)) {}

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        if (!mFinished) finish(true);
        mState          = std::move(other.mState);
        mPermit         = std::move(other.mPermit);
        mBuffer         = std::move(other.mBuffer);
        mSource         = std::move(other.mSource);
        mParser         = other.mParser;
        mDeadline       = other.mDeadline;
        mCallStart      = other.mCallStart;
        mIdempotencyKey = std::move(other.mIdempotencyKey);
        mFinished       = std::exchange(other.mFinished, true);
    }
    return *this;
}

EventStream::~EventStream() {
    if (!mFinished) finish(true);
}

void EventStream::close() {
    if (!mFinished) finish(true);
}

std::optional<nlohmann::json> EventStream::next() {
    if (mFinished) return std::nullopt;

    auto& buffer = mBuffer.get();
    SseEvent event;

    try {
        for (;;) {
            while (mParser.next(buffer, event)) {
                if (event.data == "[DONE]") {
                    drainBody();
                    finish(true);
                    return std::nullopt;
                }
                if (auto decoded = decode(event)) return decoded;
            }
            mParser.compact(buffer);

            if (Clock::now() > mDeadline) {
                throw ClientError(ErrorKind::StreamTimeout,
                                  "deadline reached while streaming");
            }

            const std::size_t used = buffer.size();
            buffer.resize(used + kReadChunk);
            const std::size_t n = mSource->read(buffer.data() + used, kReadChunk, mDeadline);
            buffer.resize(used + n);

            if (n == 0) {
                // End of body without [DONE]: a final unterminated line
                // still counts.
                while (mParser.flush(buffer, event)) {
                    if (event.data == "[DONE]") break;
                    if (auto decoded = decode(event)) {
                        finish(true);
                        return decoded;
                    }
                }
                finish(true);
                return std::nullopt;
            }
        }
    } catch (ClientError& e) {
        finish(false);
        e.withElapsed(toMillis(Clock::now() - mCallStart))
         .withRemaining(remainingUntil(mDeadline));
        throw;
    } catch (...) {
        finish(false);
        throw;
    }
}

std::optional<nlohmann::json> EventStream::decode(const SseEvent& event) {
    auto decoded = nlohmann::json::parse(event.data, nullptr, /*allow_exceptions=*/false);
    if (decoded.is_discarded()) {
        ++mState->malformedFrames;
        if (mState->verbose) {
            std::cerr << "[Stream] Dropping malformed frame ("
                      << event.data.size() << " bytes)\n";
        }
        return std::nullopt;
    }
    ++mState->eventsDelivered;
    return decoded;
}

void EventStream::drainBody() {
    const Deadline limit = std::min(mDeadline, Clock::now() + kDrainWindow);
    char scratch[512];
    try {
        while (Clock::now() < limit &&
               mSource->read(scratch, sizeof(scratch), limit) > 0) {
        }
    } catch (const ClientError& e) {
        // The events are all delivered; only the connection is lost.
        if (mState->verbose) {
            std::cerr << "[Stream] Connection not reusable after [DONE]: "
                      << e.what() << "\n";
        }
    }
}

void EventStream::finish(bool succeeded) {
    mFinished = true;
    mSource.reset();
    mBuffer.release();
    mPermit.release();
    if (mState) {
        if (succeeded) {
            ++mState->successfulCalls;
        } else {
            ++mState->failedCalls;
        }
    }
}

} // namespace llm_client
