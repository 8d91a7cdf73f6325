#pragma once

#include "models.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace llm_client {

/// One HTTP attempt, independent of the transport that carries it.
struct HttpRequest {
    std::string method = "POST";
    std::string target;            // origin-form path, e.g. "/v1/chat/completions"
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

/// Response headers keyed by lower-cased field name.
using HeaderMap = std::map<std::string, std::string>;

/// Fully-read response of a single attempt.
struct RawResponse {
    unsigned int status = 0;
    HeaderMap    headers;
    std::string  body;

    /// Case-insensitive lookup; empty string when absent.
    std::string header(const std::string& name) const;
};

/// Incrementally-read response body of a streaming attempt.  The status
/// line and headers are available as soon as the source is returned.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual unsigned int     status()  const = 0;
    virtual const HeaderMap& headers() const = 0;

    /// Read up to @p capacity bytes of body into @p dst, waiting no later
    /// than @p deadline.  Returns 0 once the body is complete.
    /// Throws ClientError (StreamTimeout / ConnectionFailed) on failure.
    virtual std::size_t read(char* dst, std::size_t capacity, Deadline deadline) = 0;

    /// Drain the (error) body into a string, for diagnostics.
    virtual std::string readAll(Deadline deadline);

    std::string header(const std::string& name) const;
};

/// Issues single HTTP attempts over a shared connection pool.
/// Implementations must be safe to call concurrently from many threads.
class Transport {
public:
    virtual ~Transport() = default;

    /// One attempt bounded by @p timeout.  Throws ClientError
    /// (ConnectionFailed) on socket failures and timeouts; any HTTP status
    /// is returned, not thrown.
    virtual RawResponse send(const HttpRequest& request,
                             std::chrono::milliseconds timeout) = 0;

    /// As send(), but returns after the response headers; the body is
    /// pulled through the returned source.
    virtual std::unique_ptr<ChunkSource> sendStreaming(const HttpRequest& request,
                                                       std::chrono::milliseconds timeout) = 0;

    /// Drop pooled connections.  A closed transport is not reused.
    virtual void close() = 0;
    virtual bool isClosed() const = 0;
};

std::string toLowerAscii(std::string s);

} // namespace llm_client
