/**
 * @file test_concurrency.cpp
 * @brief Tests for Channel, WorkerGroup and CancellationWatcher (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treemerge/Channel.hpp"
#include "treemerge/WorkerGroup.hpp"

#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>

using namespace treemerge;
using namespace std::chrono_literals;

namespace {
    std::system_error thread_limit() {
        return std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }

    bool wait_for_cancel(const CancellationToken& token, std::chrono::milliseconds limit) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!token.cancelled()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
}

// ============================================================================
// Channel
// ============================================================================

TEST(Channel, DrainsAfterClose) {
    Channel<int> ch;
    EXPECT_TRUE(ch.push(1));
    EXPECT_TRUE(ch.push(2));
    ch.close();
    EXPECT_FALSE(ch.push(3));

    EXPECT_EQ(ch.pop(), 1);
    EXPECT_EQ(ch.pop(), 2);
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(Channel, ManyProducersOneConsumer) {
    Channel<int> ch;
    std::atomic<int> remaining{4};
    WorkerGroup producers;
    const std::size_t started = producers.start(4, [&]() {
        for (int i = 0; i < 250; ++i) ch.push(1);
        if (remaining.fetch_sub(1) == 1) ch.close();
    });
    ASSERT_EQ(started, 4u);

    int total = 0;
    while (auto v = ch.pop()) total += *v;
    EXPECT_EQ(total, 1000);
}

// ============================================================================
// WorkerGroup
// ============================================================================

TEST(WorkerGroup, KeepsThreadsStartedBeforeFailure) {
    int calls = 0;
    WorkerGroup group([&calls](std::function<void()> body) {
        if (++calls == 3) throw thread_limit();
        return std::thread(std::move(body));
    });

    std::atomic<int> ran{0};
    const std::size_t started = group.start(6, [&]() { ++ran; });
    EXPECT_EQ(started, 2u);
    EXPECT_EQ(group.size(), 2u);
    group.join();
    EXPECT_EQ(ran.load(), 2);
    EXPECT_EQ(group.size(), 0u);
}

TEST(WorkerGroup, ThrowsWhenNothingStarts) {
    WorkerGroup group([](std::function<void()>) -> std::thread { throw thread_limit(); });
    EXPECT_THROW(group.start(3, []() {}), std::system_error);
    EXPECT_EQ(group.size(), 0u);
}

TEST(WorkerGroup, DestructorJoins) {
    std::atomic<int> ran{0};
    {
        WorkerGroup group;
        group.start(3, [&]() {
            std::this_thread::sleep_for(10ms);
            ++ran;
        });
    }
    EXPECT_EQ(ran.load(), 3);
}

// ============================================================================
// CancellationWatcher
// ============================================================================

TEST(CancellationWatcher, CancelsWhenConditionTurnsTrue) {
    CancellationToken token;
    std::atomic<bool> flag{false};
    CancellationWatcher watcher(token, [&]() { return flag.load(); }, 5ms);
    ASSERT_TRUE(watcher.active());

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(token.cancelled());

    flag = true;
    EXPECT_TRUE(wait_for_cancel(token, 2000ms));
}

TEST(CancellationWatcher, StopsQuietlyOnDestruction) {
    CancellationToken token;
    const auto start = std::chrono::steady_clock::now();
    {
        CancellationWatcher watcher(token, []() { return false; }, 10000ms);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5000ms);
    EXPECT_FALSE(token.cancelled());
}
