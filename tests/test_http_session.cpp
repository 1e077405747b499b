#include <gtest/gtest.h>
#include "http_session.hpp"
#include "endpoint_resolver.hpp"
#include "rate_limiter.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <sstream>
#include <thread>

using namespace apicache;
using namespace std::chrono_literals;

namespace {

class EmptyCacheStore : public CacheStore {
public:
    StoreResult get(const std::string&, CachedEntry&) override { return StoreResult::missing(); }
    StoreResult set(const std::string&, const CachedEntry&, Duration) override { return StoreResult::success(); }
    StoreResult remove(const std::string&) override { return StoreResult::success(0); }
    StoreResult remove_matching(const std::string&) override { return StoreResult::success(0); }
    bool is_connected() const override { return true; }
};

class UnreachableUpstream : public UpstreamClient {
public:
    void async_send(net::any_io_executor,
                    const http::request<http::string_body>&,
                    std::shared_ptr<RequestContext>,
                    Handler handler) override {
        UpstreamOutcome outcome;
        outcome.fault = UpstreamFault::transport;
        outcome.ec = net::error::connection_refused;
        handler(std::move(outcome));
    }
};

}

// Sessions served from an io thread; the test thread acts as the client.
class HttpSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.server.idle_timeout = 30s;
        config_.server.read_timeout = 30s;
        resolver_ = std::make_unique<EndpointResolver>(table_);
        engine_ = std::make_unique<ForwardingEngine>(config_, *resolver_, limiters_, store_, upstream_, logger_);

        acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
            if (ec) return;
            std::make_shared<HttpSession>(std::move(socket), config_, *engine_, store_, logger_, state_)->run();
        });
        io_thread_ = std::thread([this] { ioc_.run(); });
    }

    void TearDown() override {
        work_.reset();
        ioc_.stop();
        if (io_thread_.joinable()) io_thread_.join();
    }

    bool wait_for_no_sessions(std::chrono::milliseconds limit) {
        auto until = std::chrono::steady_clock::now() + limit;
        while (state_.active_sessions.load() > 0) {
            if (std::chrono::steady_clock::now() >= until) return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    ServerConfig config_;
    EndpointRuleTable table_;
    std::unique_ptr<EndpointResolver> resolver_;
    RateLimiterRegistry limiters_;
    EmptyCacheStore store_;
    UnreachableUpstream upstream_;
    std::stringstream log_output_;
    Logger logger_{log_output_, Logger::Level::DEBUG};
    std::unique_ptr<ForwardingEngine> engine_;
    ServerState state_;

    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_{ioc_.get_executor()};
    tcp::acceptor acceptor_{ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)};
    std::thread io_thread_;
};

TEST_F(HttpSessionTest, DrainClosesIdleKeepAliveSession) {
    net::io_context client_ioc;
    tcp::socket client(client_ioc);
    client.connect(acceptor_.local_endpoint());

    http::request<http::string_body> req{http::verb::get, "/health", 11};
    req.set(http::field::host, "localhost");
    http::write(client, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(client, buffer, res);
    ASSERT_EQ(res.result(), http::status::ok);
    ASSERT_TRUE(res.keep_alive());
    EXPECT_EQ(state_.active_sessions.load(), 1);

    auto started = std::chrono::steady_clock::now();
    state_.begin_drain();

    // The server closes its end; the client sees end of stream.
    char byte;
    beast::error_code ec;
    client.read_some(net::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec == net::error::eof || ec == net::error::connection_reset) << ec.message();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_TRUE(wait_for_no_sessions(5s));
}

TEST_F(HttpSessionTest, DrainLeavesNoSessionsWhenNoneAreOpen) {
    state_.begin_drain();
    EXPECT_TRUE(state_.draining.load());
    EXPECT_EQ(state_.active_sessions.load(), 0);
}
