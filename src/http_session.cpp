#include "http_session.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef LLM_CLIENT_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace llm_client {

namespace {

constexpr std::uint64_t kMaxResponseBody = 32ull * 1024 * 1024;
constexpr const char*   kUserAgent       = "llm_client/1.0";

std::string toStd(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

ClientError transportError(const std::string& step, const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return ClientError(ErrorKind::ConnectionFailed, step + " timed out");
    }
    return ClientError(ErrorKind::ConnectionFailed, step + " failed: " + ec.message());
}

// A kept-alive connection the server has since closed fails on first use
// with one of these, before any response byte arrives.
bool isStaleConnectionError(const beast::error_code& ec) {
    return ec == http::error::end_of_stream
        || ec == net::error::eof
        || ec == net::error::connection_reset
        || ec == net::error::connection_aborted
        || ec == net::error::broken_pipe;
}

template <class Fields>
HeaderMap collectHeaders(const Fields& fields) {
    HeaderMap out;
    for (const auto& field : fields) {
        out[toLowerAscii(toStd(field.name_string()))] = toStd(field.value());
    }
    return out;
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

/// One socket plus the io_context that drives its operations.  Async
/// operations are used only so tcp_stream's expiry can bound them; the
/// owning thread runs the context to completion after each one.
struct Connection {
    net::io_context                     ioc;
    std::unique_ptr<beast::tcp_stream>  plain;
#ifdef LLM_CLIENT_HAS_SSL
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
#endif
    beast::flat_buffer                  buffer;
    Clock::time_point                   lastUsed = Clock::now();
    bool                                reused   = false;

    beast::tcp_stream& lowest() {
#ifdef LLM_CLIENT_HAS_SSL
        if (tls) return beast::get_lowest_layer(*tls);
#endif
        return *plain;
    }

    template <class F>
    void withStream(F&& f) {
#ifdef LLM_CLIENT_HAS_SSL
        if (tls) {
            f(*tls);
            return;
        }
#endif
        f(*plain);
    }

    void run() {
        ioc.restart();
        ioc.run();
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Pool
// ---------------------------------------------------------------------------

class HttpSession::Pool {
public:
    explicit Pool(const ClientConfig& config)
        : mMaxConnections(config.maxConcurrent)
        , mKeepAlive(config.keepAlive)
        , mConnectTimeout(config.connectTimeout)
        , mDnsTtl(config.dnsCacheTtl)
        , mVerbose(config.verbose)
#ifdef LLM_CLIENT_HAS_SSL
        , mSslContext(net::ssl::context::tlsv12_client)
#endif
    {
        auto parts = parseUrl(config.baseUrl);
        mHost   = parts.host;
        mPort   = parts.port;
        mUseSsl = (parts.scheme == "https");
        mHostHeader = (parts.port == (mUseSsl ? "443" : "80"))
                    ? mHost : mHost + ":" + mPort;

        if (mUseSsl) {
#ifdef LLM_CLIENT_HAS_SSL
            mSslContext.set_default_verify_paths();
            mSslContext.set_verify_mode(net::ssl::verify_peer);
#else
            throw std::runtime_error(
                "HTTPS endpoint requested but SSL support was not compiled in. "
                "Rebuild with OpenSSL to enable HTTPS.");
#endif
        }
    }

    const std::string& hostHeader() const { return mHostHeader; }
    bool verbose() const { return mVerbose; }

    /// Hand out an idle connection, or open a new one if under the cap.
    /// Waits for a returned connection no later than @p deadline.
    std::unique_ptr<Connection> checkout(Deadline deadline) {
        std::unique_lock<std::mutex> lock(mMutex);
        for (;;) {
            if (mClosed) {
                throw ClientError(ErrorKind::ConnectionFailed, "session closed");
            }
            evictExpiredLocked(Clock::now());

            if (!mIdle.empty()) {
                auto conn = std::move(mIdle.back());
                mIdle.pop_back();
                conn->reused = true;
                return conn;
            }
            if (mOpen < mMaxConnections) {
                ++mOpen;
                break;
            }
            if (!mReturned.wait_until(lock, deadline, [this] {
                    return mClosed || !mIdle.empty() || mOpen < mMaxConnections;
                })) {
                throw ClientError(ErrorKind::ConnectionFailed,
                                  "timed out waiting for a pooled connection");
            }
        }
        lock.unlock();

        try {
            return connect(deadline);
        } catch (...) {
            releaseSlot();
            throw;
        }
    }

    /// Return a connection after a complete exchange.
    void checkin(std::unique_ptr<Connection> conn, bool keepAlive) {
        if (!conn) return;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (!mClosed && keepAlive && mIdle.size() < mMaxConnections) {
                conn->buffer.consume(conn->buffer.size());
                conn->lastUsed = Clock::now();
                mIdle.push_back(std::move(conn));
                mReturned.notify_one();
                return;
            }
        }
        discard(std::move(conn));
    }

    /// Close a connection that cannot be reused.
    void discard(std::unique_ptr<Connection> conn) {
        if (!conn) return;
        beast::error_code ec;
        conn->lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
        conn.reset();
        releaseSlot();
    }

    void close() {
        std::deque<std::unique_ptr<Connection>> idle;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mClosed = true;
            idle.swap(mIdle);
            mOpen -= idle.size();
        }
        mReturned.notify_all();
        if (mVerbose && !idle.empty()) {
            std::cerr << "[Transport] Closed " << idle.size()
                      << " idle connection(s)\n";
        }
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mClosed;
    }

    std::size_t idle() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mIdle.size();
    }

    std::size_t open() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mOpen;
    }

    std::uint64_t created() const { return mCreated.load(); }

private:
    void releaseSlot() {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mOpen > 0) --mOpen;
        }
        mReturned.notify_one();
    }

    void evictExpiredLocked(Clock::time_point now) {
        auto expired = [&](const std::unique_ptr<Connection>& c) {
            return now - c->lastUsed >= mKeepAlive;
        };
        const auto before = mIdle.size();
        mIdle.erase(std::remove_if(mIdle.begin(), mIdle.end(), expired),
                    mIdle.end());
        mOpen -= before - mIdle.size();
    }

    tcp::resolver::results_type resolve(net::io_context& ioc, Deadline deadline) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mDnsValid && Clock::now() < mDnsExpiry) return mDnsResults;
        }

        tcp::resolver               resolver(ioc);
        tcp::resolver::results_type results;
        beast::error_code           ec;
        bool                        done = false;

        resolver.async_resolve(mHost, mPort,
            [&](const beast::error_code& e, tcp::resolver::results_type r) {
                ec      = e;
                results = std::move(r);
                done    = true;
            });
        ioc.restart();
        ioc.run_until(deadline);
        if (!done) {
            resolver.cancel();
            ioc.restart();
            ioc.run();
            throw ClientError(ErrorKind::ConnectionFailed,
                              "DNS resolution of " + mHost + " timed out");
        }
        if (ec) {
            throw ClientError(ErrorKind::ConnectionFailed,
                              "DNS resolution of " + mHost + " failed: " + ec.message());
        }

        std::lock_guard<std::mutex> lock(mMutex);
        mDnsResults = results;
        mDnsExpiry  = Clock::now() + mDnsTtl;
        mDnsValid   = true;
        return results;
    }

    std::unique_ptr<Connection> connect(Deadline deadline) {
        auto conn = std::make_unique<Connection>();
        const Deadline connectDeadline = std::min(deadline, Clock::now() + mConnectTimeout);

        auto const endpoints = resolve(conn->ioc, connectDeadline);

#ifdef LLM_CLIENT_HAS_SSL
        if (mUseSsl) {
            conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
                conn->ioc, mSslContext);
            if (!SSL_set_tlsext_host_name(conn->tls->native_handle(), mHost.c_str())) {
                throw ClientError(ErrorKind::ConnectionFailed,
                                  "Failed to set SNI hostname");
            }
            conn->tls->set_verify_callback(net::ssl::host_name_verification(mHost));
        } else
#endif
        {
            conn->plain = std::make_unique<beast::tcp_stream>(conn->ioc);
        }

        beast::error_code ec;
        auto& stream = conn->lowest();
        stream.expires_at(connectDeadline);
        stream.async_connect(endpoints,
            [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
        conn->run();
        if (ec) throw transportError("connect to " + mHostHeader, ec);

        beast::error_code ignored;
        stream.socket().set_option(tcp::no_delay(true), ignored);
        stream.socket().set_option(net::socket_base::keep_alive(true), ignored);

#ifdef LLM_CLIENT_HAS_SSL
        if (conn->tls) {
            stream.expires_at(deadline);
            conn->tls->async_handshake(net::ssl::stream_base::client,
                [&ec](const beast::error_code& e) { ec = e; });
            conn->run();
            if (ec) throw transportError("TLS handshake", ec);
        }
#endif

        ++mCreated;
        if (mVerbose) {
            std::cerr << "[Transport] Opened connection to " << mHostHeader << "\n";
        }
        return conn;
    }

    std::string mHost;
    std::string mPort;
    std::string mHostHeader;
    bool        mUseSsl = false;

    const std::size_t               mMaxConnections;
    const std::chrono::milliseconds mKeepAlive;
    const std::chrono::milliseconds mConnectTimeout;
    const std::chrono::seconds      mDnsTtl;
    const bool                      mVerbose;

#ifdef LLM_CLIENT_HAS_SSL
    net::ssl::context mSslContext;
#endif

    mutable std::mutex                      mMutex;
    std::condition_variable                 mReturned;
    std::deque<std::unique_ptr<Connection>> mIdle;
    std::size_t                             mOpen   = 0;
    bool                                    mClosed = false;
    std::atomic<std::uint64_t>              mCreated{0};

    tcp::resolver::results_type mDnsResults;
    Clock::time_point           mDnsExpiry{};
    bool                        mDnsValid = false;
};

// ---------------------------------------------------------------------------
// Exchange helpers
// ---------------------------------------------------------------------------

namespace {

using Request = http::request<http::string_body>;

Request buildRequest(const HttpRequest& request, const std::string& hostHeader) {
    const auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    Request req{verb, request.target.empty() ? "/" : request.target, 11};
    req.set(http::field::host, hostHeader);
    req.set(http::field::user_agent, kUserAgent);
    req.keep_alive(true);
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

beast::error_code writeRequest(Connection& conn,
                               Request& req,
                               Deadline deadline) {
    beast::error_code ec;
    conn.lowest().expires_at(deadline);
    conn.withStream([&](auto& stream) {
        http::async_write(stream, req,
            [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    });
    conn.run();
    return ec;
}

template <class Parser>
beast::error_code readHeader(Connection& conn,
                             Parser& parser,
                             Deadline deadline) {
    beast::error_code ec;
    conn.lowest().expires_at(deadline);
    conn.withStream([&](auto& stream) {
        http::async_read_header(stream, conn.buffer, parser,
            [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    });
    conn.run();
    return ec;
}

template <class Parser>
beast::error_code readRest(Connection& conn,
                           Parser& parser,
                           Deadline deadline) {
    beast::error_code ec;
    conn.lowest().expires_at(deadline);
    conn.withStream([&](auto& stream) {
        http::async_read(stream, conn.buffer, parser,
            [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    });
    conn.run();
    return ec;
}

// Returns after whatever the socket had ready has been parsed, so a slow
// stream yields each frame as it arrives.
template <class Parser>
beast::error_code readSome(Connection& conn,
                           Parser& parser,
                           Deadline deadline) {
    beast::error_code ec;
    conn.lowest().expires_at(deadline);
    conn.withStream([&](auto& stream) {
        http::async_read_some(stream, conn.buffer, parser,
            [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    });
    conn.run();
    return ec;
}

} // namespace

// ---------------------------------------------------------------------------
// StreamingBody
// ---------------------------------------------------------------------------

class HttpSession::StreamingBody : public ChunkSource {
public:
    using Parser = http::response_parser<http::buffer_body>;

    StreamingBody(std::shared_ptr<Pool>       pool,
                  std::unique_ptr<Connection> conn,
                  std::unique_ptr<Parser>     parser)
        : mPool(std::move(pool))
        , mConn(std::move(conn))
        , mParser(std::move(parser))
        , mStatus(mParser->get().result_int())
        , mHeaders(collectHeaders(mParser->get().base())) {}

    ~StreamingBody() override {
        // An unfinished body leaves unread bytes on the socket.
        if (mConn) mPool->discard(std::move(mConn));
    }

    unsigned int     status()  const override { return mStatus; }
    const HeaderMap& headers() const override { return mHeaders; }

    std::size_t read(char* dst, std::size_t capacity, Deadline deadline) override {
        for (;;) {
            if (!mConn) return 0;
            if (mParser->is_done()) {
                finish();
                return 0;
            }
            if (Clock::now() > deadline) {
                mPool->discard(std::move(mConn));
                throw ClientError(ErrorKind::StreamTimeout,
                                  "deadline reached while reading stream");
            }

            auto& body = mParser->get().body();
            body.data  = dst;
            body.size  = capacity;

            auto ec = readSome(*mConn, *mParser, deadline);
            if (ec == http::error::need_buffer) ec = {};
            if (ec) {
                mPool->discard(std::move(mConn));
                if (ec == beast::error::timeout) {
                    throw ClientError(ErrorKind::StreamTimeout,
                                      "stream read timed out");
                }
                throw transportError("stream read", ec);
            }

            const std::size_t n = capacity - body.size;
            if (mParser->is_done()) finish();
            if (n > 0) return n;
        }
    }

private:
    void finish() {
        const bool keepAlive = mParser->get().keep_alive();
        mPool->checkin(std::move(mConn), keepAlive);
    }

    std::shared_ptr<Pool>       mPool;
    std::unique_ptr<Connection> mConn;
    std::unique_ptr<Parser>     mParser;
    unsigned int                mStatus;
    HeaderMap                   mHeaders;
};

// ---------------------------------------------------------------------------
// HttpSession
// ---------------------------------------------------------------------------

HttpSession::HttpSession(const ClientConfig& config)
    : mPool(std::make_shared<Pool>(config))
    , mBasePath(parseUrl(config.baseUrl).target)
    , mVerbose(config.verbose) {}

HttpSession::~HttpSession() {
    mPool->close();
}

RawResponse HttpSession::send(const HttpRequest& request,
                              std::chrono::milliseconds timeout) {
    const Deadline deadline = Clock::now() + timeout;
    auto req = buildRequest(request, mPool->hostHeader());

    for (int pass = 0;; ++pass) {
        auto conn = mPool->checkout(deadline);
        const bool reused = conn->reused;

        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxResponseBody);

        auto ec = writeRequest(*conn, req, deadline);
        if (!ec) ec = readHeader(*conn, parser, deadline);
        if (ec) {
            mPool->discard(std::move(conn));
            if (reused && pass == 0 && isStaleConnectionError(ec)) {
                if (mVerbose) {
                    std::cerr << "[Transport] Pooled connection went stale ("
                              << ec.message() << "); reconnecting\n";
                }
                continue;
            }
            throw transportError(request.method + " " + toStd(req.target()), ec);
        }

        ec = readRest(*conn, parser, deadline);
        if (ec) {
            mPool->discard(std::move(conn));
            throw transportError("reading response body", ec);
        }

        auto& res = parser.get();
        RawResponse out;
        out.status  = res.result_int();
        out.headers = collectHeaders(res.base());
        out.body    = std::move(res.body());

        mPool->checkin(std::move(conn), res.keep_alive());
        return out;
    }
}

std::unique_ptr<ChunkSource> HttpSession::sendStreaming(const HttpRequest& request,
                                                        std::chrono::milliseconds timeout) {
    const Deadline deadline = Clock::now() + timeout;
    auto req = buildRequest(request, mPool->hostHeader());

    for (int pass = 0;; ++pass) {
        auto conn = mPool->checkout(deadline);
        const bool reused = conn->reused;

        auto parser = std::make_unique<StreamingBody::Parser>();
        parser->body_limit((std::numeric_limits<std::uint64_t>::max)());

        auto ec = writeRequest(*conn, req, deadline);
        if (!ec) ec = readHeader(*conn, *parser, deadline);
        if (ec) {
            mPool->discard(std::move(conn));
            if (reused && pass == 0 && isStaleConnectionError(ec)) {
                if (mVerbose) {
                    std::cerr << "[Transport] Pooled connection went stale ("
                              << ec.message() << "); reconnecting\n";
                }
                continue;
            }
            throw transportError(request.method + " " + toStd(req.target()), ec);
        }

        return std::make_unique<StreamingBody>(mPool, std::move(conn), std::move(parser));
    }
}

void HttpSession::close() {
    mPool->close();
}

bool HttpSession::isClosed() const {
    return mPool->closed();
}

std::size_t HttpSession::idleConnections() const {
    return mPool->idle();
}

std::size_t HttpSession::openConnections() const {
    return mPool->open();
}

std::uint64_t HttpSession::connectionsCreated() const {
    return mPool->created();
}

} // namespace llm_client
