#include <gtest/gtest.h>
#include "mcp/MCPErrors.h"
#include "mcp/RequestCorrelator.h"
#include <algorithm>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

TEST(RequestCorrelatorTest, IdsStartAtOneAndIncrease) {
    RequestCorrelator correlator;
    EXPECT_EQ(correlator.nextId(), 1);
    EXPECT_EQ(correlator.nextId(), 2);
    EXPECT_EQ(correlator.nextId(), 3);
}

TEST(RequestCorrelatorTest, ConcurrentCallersGetDistinctIds) {
    RequestCorrelator correlator;
    std::vector<std::vector<int64_t>> perThread(8);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < perThread.size(); ++t) {
        threads.emplace_back([&correlator, &perThread, t]() {
            for (int i = 0; i < 500; ++i) perThread[t].push_back(correlator.nextId());
        });
    }
    for (auto& th : threads) th.join();

    std::set<int64_t> all;
    for (const auto& ids : perThread) {
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        all.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(all.size(), 4000u);
    EXPECT_EQ(*all.begin(), 1);
    EXPECT_EQ(*all.rbegin(), 4000);
}

TEST(RequestCorrelatorTest, ResponsesReachTheirOwnWaiter) {
    RequestCorrelator correlator;
    auto first = correlator.registerRequest(1);
    auto second = correlator.registerRequest(2);

    EXPECT_TRUE(correlator.resolve(Envelope::response(2, {{"v", "two"}})));
    EXPECT_TRUE(correlator.resolve(Envelope::response(1, {{"v", "one"}})));

    EXPECT_EQ((*first.get().result)["v"], "one");
    EXPECT_EQ((*second.get().result)["v"], "two");
    EXPECT_EQ(correlator.pendingCount(), 0u);
    EXPECT_EQ(correlator.resolvedCount(), 2u);
}

TEST(RequestCorrelatorTest, LateResponseAfterCancelIsDiscarded) {
    RequestCorrelator correlator;
    auto abandoned = correlator.registerRequest(5);
    correlator.cancel(5);

    EXPECT_FALSE(correlator.resolve(Envelope::response(5, nlohmann::json::object())));
    EXPECT_FALSE(correlator.resolve(Envelope::response(99, nlohmann::json::object())));
    EXPECT_EQ(correlator.discardedCount(), 2u);
    EXPECT_EQ(correlator.resolvedCount(), 0u);
}

TEST(RequestCorrelatorTest, FailAllCompletesWaitersAndRejectsNewOnes) {
    RequestCorrelator correlator;
    auto pending = correlator.registerRequest(1);

    correlator.failAll(std::make_exception_ptr(ConnectionClosed("gone")));
    EXPECT_THROW(pending.get(), ConnectionClosed);

    auto rejected = correlator.registerRequest(2);
    ASSERT_EQ(rejected.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_THROW(rejected.get(), ConnectionClosed);

    correlator.reopen();
    auto accepted = correlator.registerRequest(3);
    EXPECT_EQ(accepted.wait_for(std::chrono::seconds(0)), std::future_status::timeout);
    correlator.resolve(Envelope::response(3, nullptr));
    EXPECT_TRUE(accepted.get().isResponse());
}

TEST(RequestCorrelatorTest, DuplicateIdIsRejected) {
    RequestCorrelator correlator;
    auto first = correlator.registerRequest(1);
    auto duplicate = correlator.registerRequest(1);
    EXPECT_THROW(duplicate.get(), ProtocolError);
    correlator.resolve(Envelope::response(1, nullptr));
    EXPECT_TRUE(first.get().isResponse());
}
