#pragma once

#include "client_state.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "stream_reader.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llm_client {

/// Deadline-aware chat-completion client.
///
/// Every call acquires one of `maxConcurrent` permits, gets a single
/// idempotency key, and runs a bounded retry loop inside the caller's
/// deadline: 429 waits the server's Retry-After, 5xx and connection
/// failures back off exponentially with jitter, other 4xx fail at once.
/// Safe to use from many threads; each call blocks only its own thread.
class ChatClient {
public:
    using TransportFactory =
        std::function<std::shared_ptr<Transport>(const ClientConfig&)>;

    /// @param factory  Creates the transport session on first use (and again
    ///                 after closeSession()).  Defaults to HttpSession.
    /// @throws std::invalid_argument if @p config does not validate.
    explicit ChatClient(ClientConfig config, TransportFactory factory = {});
    ~ChatClient();

    ChatClient(const ChatClient&)            = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    /// Non-streaming completion.
    /// @throws std::invalid_argument if @p messages is empty.
    /// @throws ClientError on any failure.
    ChatResponse chatCompletion(const std::vector<Message>& messages,
                                Deadline deadline);

    /// Streaming completion.  Returns once the response headers are in; the
    /// permit stays held until the returned stream finishes.
    /// @throws std::invalid_argument if @p messages is empty.
    /// @throws ClientError if no attempt produces a 2xx response.
    EventStream streamChatCompletion(const std::vector<Message>& messages,
                                     Deadline deadline);

    /// Convenience: deadline = now + config().timeout.
    ChatResponse chatCompletion(const std::vector<Message>& messages);
    EventStream  streamChatCompletion(const std::vector<Message>& messages);

    UsageStats stats() const;

    /// Close pooled connections; the next call opens a fresh session.
    void closeSession();

    /// Stop accepting calls.  Calls waiting in a retry delay fail with
    /// Canceled; attempts already on the wire are allowed to finish.
    void shutdown();

    const ClientConfig& config() const { return mConfig; }

private:
    struct RetryState {
        int                        attempt = 0;
        Clock::time_point          startTime;
        std::chrono::milliseconds  budget{0};
        std::string                idempotencyKey;
        std::optional<ClientError> lastError;
    };

    std::shared_ptr<Transport> session();

    SemaphorePermit admit(Deadline deadline);
    HttpRequest     makeRequest(const std::vector<Message>& messages,
                                bool stream,
                                const std::string& idempotencyKey) const;

    template <class Attempt>
    auto executeWithRetry(RetryState& state, Attempt&& attempt)
        -> decltype(attempt(std::chrono::milliseconds{}));

    ClientError failure(const RetryState& state, ErrorKind kind,
                        const std::string& message) const;
    void        annotate(const RetryState& state, ClientError& error) const;

    const ClientConfig           mConfig;
    const std::string            mTarget;
    TransportFactory             mFactory;
    std::shared_ptr<ClientState> mState;

    mutable std::mutex           mSessionMutex;
    std::shared_ptr<Transport>   mTransport;
};

} // namespace llm_client
