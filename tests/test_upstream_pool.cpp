#include <gtest/gtest.h>
#include "upstream_pool.hpp"
#include "metrics.hpp"

#include <boost/asio/io_context.hpp>
#include <vector>

using namespace apicache;
using namespace std::chrono_literals;

namespace {

class RecordingWaiter : public ConnectionWaiter {
public:
    void on_granted(UpstreamConnectionPtr conn) override {
        ++grants;
        granted.push_back(std::move(conn));
    }

    int grants = 0;
    std::vector<UpstreamConnectionPtr> granted;
};

}

class UpstreamPoolTest : public ::testing::Test {
protected:
    net::io_context ioc_;

    UpstreamConnectionPtr make_connection() {
        auto conn = std::make_unique<UpstreamConnection>(
            net::strand<net::any_io_executor>(ioc_.get_executor()), nullptr);
        conn->established = true;
        return conn;
    }
};

TEST_F(UpstreamPoolTest, ReturnedConnectionIsReused) {
    UpstreamConnectionPool pool(10, 0, 90s);
    auto waiter = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr out;
    ASSERT_TRUE(pool.acquire(out, waiter));
    EXPECT_EQ(out, nullptr);
    EXPECT_EQ(pool.open_count(), 1u);

    auto conn = make_connection();
    UpstreamConnection* raw = conn.get();
    pool.release(std::move(conn));
    EXPECT_EQ(pool.idle_count(), 1u);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge(metric::upstream_connections_idle), 1.0);

    ASSERT_TRUE(pool.acquire(out, waiter));
    EXPECT_EQ(out.get(), raw);
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 1u);
    EXPECT_EQ(waiter->grants, 0);
}

TEST_F(UpstreamPoolTest, ConnectionLimitQueuesWaiters) {
    UpstreamConnectionPool pool(10, 1, 90s);
    auto first = std::make_shared<RecordingWaiter>();
    auto second = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr out;
    ASSERT_TRUE(pool.acquire(out, first));
    EXPECT_FALSE(pool.acquire(out, second));
    EXPECT_EQ(pool.open_count(), 1u);

    // A kept-alive connection goes straight to the waiter.
    auto conn = make_connection();
    UpstreamConnection* raw = conn.get();
    pool.release(std::move(conn));
    ASSERT_EQ(second->grants, 1);
    EXPECT_EQ(second->granted.front().get(), raw);
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 1u);

    pool.discard(std::move(second->granted.front()));
    EXPECT_EQ(pool.open_count(), 0u);
}

TEST_F(UpstreamPoolTest, DiscardedSlotGoesToNextLiveWaiter) {
    UpstreamConnectionPool pool(10, 1, 90s);
    auto holder = std::make_shared<RecordingWaiter>();
    auto gone = std::make_shared<RecordingWaiter>();
    auto live = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr out;
    ASSERT_TRUE(pool.acquire(out, holder));
    EXPECT_FALSE(pool.acquire(out, gone));
    EXPECT_FALSE(pool.acquire(out, live));
    gone.reset();

    pool.discard(nullptr);
    ASSERT_EQ(live->grants, 1);
    EXPECT_EQ(live->granted.front(), nullptr);
    EXPECT_EQ(pool.open_count(), 1u);
}

TEST_F(UpstreamPoolTest, IdleLimitClosesSurplusConnections) {
    UpstreamConnectionPool pool(1, 0, 90s);
    auto waiter = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr a, b;
    ASSERT_TRUE(pool.acquire(a, waiter));
    ASSERT_TRUE(pool.acquire(b, waiter));
    EXPECT_EQ(pool.open_count(), 2u);

    pool.release(make_connection());
    pool.release(make_connection());
    EXPECT_EQ(pool.idle_count(), 1u);
    EXPECT_EQ(pool.open_count(), 1u);
}

TEST_F(UpstreamPoolTest, ExpiredIdleConnectionsAreNotHandedOut) {
    UpstreamConnectionPool pool(10, 0, Duration(0));
    auto waiter = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr out;
    ASSERT_TRUE(pool.acquire(out, waiter));
    pool.release(make_connection());
    EXPECT_EQ(pool.idle_count(), 1u);

    ASSERT_TRUE(pool.acquire(out, waiter));
    EXPECT_EQ(out, nullptr);
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 1u);
}

TEST_F(UpstreamPoolTest, ShutdownClosesIdleAndStopsParking) {
    UpstreamConnectionPool pool(10, 1, 90s);
    auto waiter = std::make_shared<RecordingWaiter>();

    UpstreamConnectionPtr a;
    ASSERT_TRUE(pool.acquire(a, waiter));
    pool.release(make_connection());
    ASSERT_EQ(pool.idle_count(), 1u);

    pool.shutdown();
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 0u);

    UpstreamConnectionPtr b;
    ASSERT_TRUE(pool.acquire(b, waiter));
    pool.release(make_connection());
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 0u);
}
