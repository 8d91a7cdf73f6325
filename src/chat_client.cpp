#include "chat_client.hpp"
#include "http_session.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace llm_client {

namespace {

constexpr std::size_t kErrorExcerpt = 200;

ClientConfig validated(ClientConfig config) {
    config.validate();
    return config;
}

unsigned int statusOf(const RawResponse& response) {
    return response.status;
}

unsigned int statusOf(const std::unique_ptr<ChunkSource>& source) {
    return source->status();
}

std::string retryAfterOf(const RawResponse& response) {
    return response.header("Retry-After");
}

std::string retryAfterOf(const std::unique_ptr<ChunkSource>& source) {
    return source->header("Retry-After");
}

std::string errorBodyOf(const RawResponse& response, Deadline) {
    return response.body;
}

// Error bodies are small; read what arrives before the attempt ends.
std::string errorBodyOf(const std::unique_ptr<ChunkSource>& source, Deadline deadline) {
    try {
        return source->readAll(deadline);
    } catch (const ClientError& e) {
        return std::string("(error body unavailable: ") + e.what() + ")";
    }
}

std::string describeStatus(unsigned int status, const std::string& body) {
    std::string msg = "HTTP " + std::to_string(status);
    if (auto detail = extractErrorMessage(body)) {
        msg += ": " + *detail;
    } else if (!body.empty()) {
        msg += ": " + body.substr(0, kErrorExcerpt);
    }
    return msg;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ChatClient::ChatClient(ClientConfig config, TransportFactory factory)
    : mConfig(validated(std::move(config)))
    , mTarget(joinPath(parseUrl(mConfig.baseUrl).target, kChatCompletionsPath))
    , mFactory(std::move(factory))
    , mState(std::make_shared<ClientState>(mConfig))
{
    if (!mFactory) {
        mFactory = [](const ClientConfig& cfg) -> std::shared_ptr<Transport> {
            return std::make_shared<HttpSession>(cfg);
        };
    }
}

ChatClient::~ChatClient() {
    shutdown();
}

// ---------------------------------------------------------------------------
// Retry loop
// ---------------------------------------------------------------------------

template <class Attempt>
auto ChatClient::executeWithRetry(RetryState& state, Attempt&& attempt)
    -> decltype(attempt(std::chrono::milliseconds{}))
{
    while (state.attempt < mConfig.retryAttempts) {
        ++state.attempt;

        if (mState->shutdownRequested()) {
            throw failure(state, ErrorKind::Canceled, "client is shut down");
        }

        const auto elapsed = toMillis(Clock::now() - state.startTime);
        if (elapsed >= state.budget) {
            throw failure(state, ErrorKind::DeadlineExceeded,
                          "budget exhausted before attempt " +
                          std::to_string(state.attempt));
        }
        const auto attemptTimeout = state.budget - elapsed;

        ++mState->totalAttempts;
        if (state.attempt > 1) ++mState->totalRetries;

        // --- one attempt ---
        std::optional<ClientError> error;
        try {
            auto result = attempt(attemptTimeout);
            const unsigned int status = statusOf(result);
            if (status >= 200 && status < 300) {
                return result;
            }

            const ErrorKind kind = classifyStatus(status);
            const std::string body =
                errorBodyOf(result, state.startTime + state.budget);
            error = failure(state, kind, describeStatus(status, body));
            error->withHttpStatus(status);
            if (kind == ErrorKind::RateLimited) {
                error->withRetryAfter(parseRetryAfter(retryAfterOf(result)));
            }
        } catch (ClientError& e) {
            if (!e.isRetriable()) {
                annotate(state, e);
                throw;
            }
            error = e;
        } catch (const std::exception& e) {
            throw failure(state, ErrorKind::Unexpected, e.what());
        }

        // --- classify ---
        std::chrono::milliseconds wait{0};
        switch (error->kind()) {
            case ErrorKind::RateLimited:
                ++mState->rateLimited;
                wait = error->retryAfter();
                break;
            case ErrorKind::Server5xx:
            case ErrorKind::ConnectionFailed:
                wait = mState->backoff.delayFor(state.attempt);
                break;
            default:
                if (mConfig.verbose) {
                    std::cerr << "[ChatClient] Not retrying: " << error->what() << "\n";
                }
                throw *error;
        }

        state.lastError = error;
        if (state.attempt >= mConfig.retryAttempts) break;

        const auto now = toMillis(Clock::now() - state.startTime);
        if (wait >= state.budget - now) {
            ClientError deadline = failure(state, ErrorKind::DeadlineExceeded,
                std::string("waiting ") + std::to_string(wait.count()) +
                " ms would exceed the deadline (last error: " + error->what() + ")");
            deadline.withLastErrorKind(error->kind())
                    .withHttpStatus(error->httpStatus())
                    .withRetryAfter(error->retryAfter());
            throw deadline;
        }

        if (mConfig.verbose) {
            std::cerr << "[ChatClient] " << error->what()
                      << " - attempt " << state.attempt << "/" << mConfig.retryAttempts
                      << ", retrying in " << wait.count() << " ms"
                      << " (key " << state.idempotencyKey << ")\n";
        }

        if (!mState->sleepFor(wait)) {
            throw failure(state, ErrorKind::Canceled,
                          "client shut down during retry wait");
        }
    }

    std::string message = "gave up after " + std::to_string(state.attempt) + " attempt(s)";
    ClientError exhausted = failure(state, ErrorKind::MaxRetriesExceeded,
        state.lastError ? message + "; last error: " + state.lastError->what() : message);
    if (state.lastError) {
        exhausted.withLastErrorKind(state.lastError->kind())
                 .withHttpStatus(state.lastError->httpStatus())
                 .withRetryAfter(state.lastError->retryAfter());
    }
    throw exhausted;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ChatResponse ChatClient::chatCompletion(const std::vector<Message>& messages,
                                        Deadline deadline) {
    if (messages.empty()) {
        throw std::invalid_argument("chatCompletion: messages must not be empty");
    }

    ++mState->totalCalls;
    try {
        SemaphorePermit permit = admit(deadline);

        RetryState state;
        state.startTime      = Clock::now();
        state.budget         = remainingUntil(deadline, state.startTime);
        state.idempotencyKey = generateIdempotencyKey(mConfig.clientTag);

        const HttpRequest request = makeRequest(messages, false, state.idempotencyKey);
        // The session is looked up per attempt so a closeSession() during a
        // backoff takes effect on the next try.
        RawResponse raw = executeWithRetry(state, [&](std::chrono::milliseconds timeout) {
            return session()->send(request, timeout);
        });

        ChatResponse response;
        response.httpStatus     = raw.status;
        response.idempotencyKey = state.idempotencyKey;
        response.attempts       = state.attempt;
        try {
            response.body = nlohmann::json::parse(raw.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw failure(state, ErrorKind::Unexpected,
                          std::string("Failed to parse JSON response: ") + e.what());
        }

        ++mState->successfulCalls;
        return response;

    } catch (...) {
        ++mState->failedCalls;
        throw;
    }
}

EventStream ChatClient::streamChatCompletion(const std::vector<Message>& messages,
                                             Deadline deadline) {
    if (messages.empty()) {
        throw std::invalid_argument("streamChatCompletion: messages must not be empty");
    }

    ++mState->totalCalls;
    try {
        SemaphorePermit permit = admit(deadline);

        RetryState state;
        state.startTime      = Clock::now();
        state.budget         = remainingUntil(deadline, state.startTime);
        state.idempotencyKey = generateIdempotencyKey(mConfig.clientTag);

        const HttpRequest request = makeRequest(messages, true, state.idempotencyKey);
        // The session is looked up per attempt so a closeSession() during a
        // backoff takes effect on the next try.
        auto source = executeWithRetry(state, [&](std::chrono::milliseconds timeout) {
            return session()->sendStreaming(request, timeout);
        });

        if (mConfig.verbose) {
            std::cerr << "[ChatClient] Stream open (key " << state.idempotencyKey
                      << ", attempt " << state.attempt << ")\n";
        }

        // Success / failure of the call is counted when the stream ends.
        return EventStream(mState, std::move(permit), std::move(source),
                           deadline, state.startTime, state.idempotencyKey);

    } catch (...) {
        ++mState->failedCalls;
        throw;
    }
}

ChatResponse ChatClient::chatCompletion(const std::vector<Message>& messages) {
    return chatCompletion(messages, Clock::now() + mConfig.timeout);
}

EventStream ChatClient::streamChatCompletion(const std::vector<Message>& messages) {
    return streamChatCompletion(messages, Clock::now() + mConfig.timeout);
}

UsageStats ChatClient::stats() const {
    return mState->snapshot();
}

void ChatClient::closeSession() {
    std::lock_guard<std::mutex> lock(mSessionMutex);
    if (mTransport) {
        mTransport->close();
    }
}

void ChatClient::shutdown() {
    mState->requestShutdown();
    closeSession();
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

std::shared_ptr<Transport> ChatClient::session() {
    std::lock_guard<std::mutex> lock(mSessionMutex);
    if (!mTransport || mTransport->isClosed()) {
        try {
            mTransport = mFactory(mConfig);
        } catch (const std::exception& e) {
            throw ClientError(ErrorKind::Unexpected,
                              std::string("cannot create transport: ") + e.what());
        }
        if (!mTransport) {
            throw ClientError(ErrorKind::Unexpected, "transport factory returned null");
        }
    }
    return mTransport;
}

SemaphorePermit ChatClient::admit(Deadline deadline) {
    if (mState->shutdownRequested()) {
        throw ClientError(ErrorKind::Canceled, "client is shut down");
    }

    const auto waitStart = Clock::now();
    if (!mState->semaphore.tryAcquireUntil(deadline)) {
        throw ClientError(ErrorKind::DeadlineExceeded,
                          "deadline passed while waiting for a concurrency permit")
            .withElapsed(toMillis(Clock::now() - waitStart));
    }
    SemaphorePermit permit(mState->semaphore);

    if (Clock::now() > deadline) {
        throw ClientError(ErrorKind::DeadlineExceeded,
                          "deadline passed before the first attempt")
            .withElapsed(toMillis(Clock::now() - waitStart));
    }
    if (mState->shutdownRequested()) {
        throw ClientError(ErrorKind::Canceled, "client is shut down");
    }
    return permit;
}

HttpRequest ChatClient::makeRequest(const std::vector<Message>& messages,
                                    bool stream,
                                    const std::string& idempotencyKey) const {
    HttpRequest request;
    request.method = "POST";
    request.target = mTarget;
    request.body   = buildChatRequest(mConfig, messages, stream).dump();
    request.headers.emplace_back("Content-Type", "application/json");
    request.headers.emplace_back("Accept", stream ? "text/event-stream" : "application/json");
    request.headers.emplace_back("Idempotency-Key", idempotencyKey);
    return request;
}

ClientError ChatClient::failure(const RetryState& state, ErrorKind kind,
                                const std::string& message) const {
    ClientError error(kind, message);
    annotate(state, error);
    return error;
}

void ChatClient::annotate(const RetryState& state, ClientError& error) const {
    const auto elapsed = toMillis(Clock::now() - state.startTime);
    error.withElapsed(elapsed)
         .withRemaining(elapsed >= state.budget ? std::chrono::milliseconds{0}
                                                : state.budget - elapsed);
}

} // namespace llm_client
