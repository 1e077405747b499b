#include <gtest/gtest.h>
#include "request_context.hpp"
#include "request_id.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace apicache;

TEST(RequestContextTest, StartsLive) {
    RequestContext ctx;
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_EQ(ctx.reason(), RequestContext::Reason::none);
}

TEST(RequestContextTest, FirstCancelWins) {
    RequestContext ctx;
    ctx.cancel(RequestContext::Reason::client_gone);
    ctx.cancel(RequestContext::Reason::deadline);
    EXPECT_TRUE(ctx.is_cancelled());
    EXPECT_EQ(ctx.reason(), RequestContext::Reason::client_gone);
}

TEST(RequestContextTest, HandlerRunsOnceOnCancel) {
    RequestContext ctx;
    int calls = 0;
    ctx.on_cancel([&] { ++calls; });
    EXPECT_EQ(calls, 0);

    ctx.cancel(RequestContext::Reason::deadline);
    ctx.cancel(RequestContext::Reason::deadline);
    EXPECT_EQ(calls, 1);
}

TEST(RequestContextTest, HandlerInstalledAfterCancelRunsImmediately) {
    RequestContext ctx;
    ctx.cancel(RequestContext::Reason::client_gone);
    bool ran = false;
    ctx.on_cancel([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(RequestContextTest, ReplacedAndClearedHandlersDoNotRun) {
    RequestContext ctx;
    int first = 0, second = 0;
    ctx.on_cancel([&] { ++first; });
    ctx.on_cancel([&] { ++second; });
    ctx.cancel(RequestContext::Reason::deadline);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);

    RequestContext other;
    bool ran = false;
    other.on_cancel([&] { ran = true; });
    other.clear_cancel_handler();
    other.cancel(RequestContext::Reason::client_gone);
    EXPECT_FALSE(ran);
}

TEST(RequestContextTest, ConcurrentCancelRunsHandlerOnce) {
    RequestContext ctx;
    std::atomic<int> calls{0};
    ctx.on_cancel([&] { calls++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] { ctx.cancel(RequestContext::Reason::deadline); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(calls.load(), 1);
}

TEST(RequestIdTest, GeneratesUniqueHexIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        std::string id = RequestIdGenerator::generate();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}
