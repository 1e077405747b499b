#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <variant>

#include "server_config.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace apicache {

// One connection to the upstream. Owned by exactly one exchange at a time,
// or parked idle in the pool. Every operation on the stream runs on its
// strand, fixed when the connection is created.
struct UpstreamConnection {
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;
    using PlainStream = beast::tcp_stream;

    // tls is null for plain http.
    UpstreamConnection(net::strand<net::any_io_executor> ex, ssl::context* tls);

    net::strand<net::any_io_executor> strand;
    std::variant<TlsStream, PlainStream> stream;
    bool established = false;
    std::chrono::steady_clock::time_point idle_since;

    PlainStream& lowest_layer();
};

using UpstreamConnectionPtr = std::unique_ptr<UpstreamConnection>;

// Receives a connection slot from the pool once one frees up.
class ConnectionWaiter {
public:
    virtual ~ConnectionWaiter() = default;

    // conn is an idle established connection, or null when the waiter was
    // granted a free slot and must open a connection itself.
    // Called from any thread; implementations post to their own executor.
    virtual void on_granted(UpstreamConnectionPtr conn) = 0;
};

/**
 * Keep-alive connections to the upstream host.
 * At most max_conns connections are open at once (0 = no limit); further
 * requests queue until one is returned or closed. At most max_idle returned
 * connections are parked for reuse (0 = no limit), each for idle_timeout.
 */
class UpstreamConnectionPool {
public:
    UpstreamConnectionPool(int max_idle, int max_conns, Duration idle_timeout);
    ~UpstreamConnectionPool();

    UpstreamConnectionPool(const UpstreamConnectionPool&) = delete;
    UpstreamConnectionPool& operator=(const UpstreamConnectionPool&) = delete;

    /**
     * Claims a connection slot.
     * @param out Set to an idle connection when one is available, else null.
     * @param waiter Queued when the limit is reached; granted later.
     * @return true if a slot was claimed now; false if the waiter was queued.
     */
    bool acquire(UpstreamConnectionPtr& out, const std::weak_ptr<ConnectionWaiter>& waiter);

    // Parks a connection that finished a keep-alive exchange.
    void release(UpstreamConnectionPtr conn);

    // Frees the slot of a connection that is closed or was never opened.
    void discard(UpstreamConnectionPtr conn);

    // Closes idle connections and stops parking returned ones. Call before
    // the io_context the connections run on is destroyed.
    void shutdown();

    std::size_t open_count() const;
    std::size_t idle_count() const;

private:
    const std::size_t max_idle_;
    const std::size_t max_conns_;
    const Duration idle_timeout_;

    std::deque<UpstreamConnectionPtr> idle_;
    std::deque<std::weak_ptr<ConnectionWaiter>> waiters_;
    std::size_t open_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;

    // Hands a slot (and conn, if any) to the first live waiter. Lock held.
    std::shared_ptr<ConnectionWaiter> next_waiter();
    void publish_gauges();
};

}
