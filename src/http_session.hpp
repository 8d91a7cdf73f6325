#pragma once

#include "config.hpp"
#include "transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace llm_client {

/// Connection-pooled HTTP/1.1 transport built on Boost.Beast.
///
/// Keeps idle keep-alive connections to the configured backend, caches the
/// resolver result, and bounds every socket operation by the attempt
/// timeout.  HTTPS is available when built with OpenSSL
/// (LLM_CLIENT_HAS_SSL).  Safe to call from many threads at once; each
/// checked-out connection is driven only by the thread holding it.
class HttpSession : public Transport {
public:
    /// @throws std::invalid_argument for a malformed base URL, or
    ///         std::runtime_error for HTTPS without SSL support.
    explicit HttpSession(const ClientConfig& config);
    ~HttpSession() override;

    HttpSession(const HttpSession&)            = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    RawResponse send(const HttpRequest& request,
                     std::chrono::milliseconds timeout) override;

    std::unique_ptr<ChunkSource> sendStreaming(const HttpRequest& request,
                                               std::chrono::milliseconds timeout) override;

    void close() override;
    bool isClosed() const override;

    // ---- pool introspection ----
    std::size_t   idleConnections()    const;
    std::size_t   openConnections()    const;
    std::uint64_t connectionsCreated() const;

    /// Path prefix of the base URL ("/" when none).
    const std::string& basePath() const { return mBasePath; }

private:
    class  Pool;
    class  StreamingBody;

    std::shared_ptr<Pool> mPool;
    std::string           mBasePath;
    bool                  mVerbose = false;
};

} // namespace llm_client
