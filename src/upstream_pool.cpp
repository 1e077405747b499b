#include "upstream_pool.hpp"
#include "metrics.hpp"

namespace apicache {

UpstreamConnection::UpstreamConnection(net::strand<net::any_io_executor> ex, ssl::context* tls)
    : strand(std::move(ex))
    , stream(tls
                 ? std::variant<TlsStream, PlainStream>(std::in_place_type<TlsStream>, strand, *tls)
                 : std::variant<TlsStream, PlainStream>(std::in_place_type<PlainStream>, strand))
{}

UpstreamConnection::PlainStream& UpstreamConnection::lowest_layer() {
    if (auto* tls = std::get_if<TlsStream>(&stream)) {
        return beast::get_lowest_layer(*tls);
    }
    return std::get<PlainStream>(stream);
}

UpstreamConnectionPool::UpstreamConnectionPool(int max_idle, int max_conns, Duration idle_timeout)
    : max_idle_(max_idle > 0 ? static_cast<std::size_t>(max_idle) : 0)
    , max_conns_(max_conns > 0 ? static_cast<std::size_t>(max_conns) : 0)
    , idle_timeout_(idle_timeout)
{}

UpstreamConnectionPool::~UpstreamConnectionPool() {
    shutdown();
}

bool UpstreamConnectionPool::acquire(UpstreamConnectionPtr& out, const std::weak_ptr<ConnectionWaiter>& waiter) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reset();

    auto now = std::chrono::steady_clock::now();
    while (!idle_.empty() && now - idle_.front()->idle_since >= idle_timeout_) {
        idle_.pop_front();
        --open_;
    }

    if (!idle_.empty()) {
        // Most recently used first
        out = std::move(idle_.back());
        idle_.pop_back();
        publish_gauges();
        return true;
    }

    if (closed_ || max_conns_ == 0 || open_ < max_conns_) {
        ++open_;
        publish_gauges();
        return true;
    }

    waiters_.push_back(waiter);
    return false;
}

void UpstreamConnectionPool::release(UpstreamConnectionPtr conn) {
    std::shared_ptr<ConnectionWaiter> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            --open_;
            return;
        }

        waiter = next_waiter();
        if (!waiter) {
            if (max_idle_ > 0 && idle_.size() >= max_idle_) {
                --open_;
            } else {
                conn->idle_since = std::chrono::steady_clock::now();
                idle_.push_back(std::move(conn));
            }
            publish_gauges();
            return;
        }
    }
    waiter->on_granted(std::move(conn));
}

void UpstreamConnectionPool::discard(UpstreamConnectionPtr conn) {
    conn.reset();

    std::shared_ptr<ConnectionWaiter> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            waiter = next_waiter();
        }
        if (!waiter) {
            --open_;
            publish_gauges();
            return;
        }
    }
    waiter->on_granted(nullptr);
}

void UpstreamConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    open_ -= idle_.size();
    idle_.clear();
    waiters_.clear();
}

std::size_t UpstreamConnectionPool::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::size_t UpstreamConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::shared_ptr<ConnectionWaiter> UpstreamConnectionPool::next_waiter() {
    while (!waiters_.empty()) {
        auto waiter = waiters_.front().lock();
        waiters_.pop_front();
        if (waiter) return waiter;
    }
    return nullptr;
}

void UpstreamConnectionPool::publish_gauges() {
    auto& metrics = MetricsRegistry::instance();
    metrics.set_gauge(metric::upstream_connections_open, static_cast<double>(open_));
    metrics.set_gauge(metric::upstream_connections_idle, static_cast<double>(idle_.size()));
}

}
