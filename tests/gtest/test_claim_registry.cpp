#include <gtest/gtest.h>

#include "chunkscribe/claim_registry.hpp"
#include "chunkscribe/compute_slots.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace chunkscribe;

TEST(ClaimRegistryTest, SecondClaimantGetsNothing) {
    ClaimRegistry registry;
    auto first = registry.try_claim("c/m/talk");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->held());
    EXPECT_TRUE(registry.is_claimed("c/m/talk"));

    EXPECT_FALSE(registry.try_claim("c/m/talk").has_value());
    EXPECT_EQ(registry.contended(), 1u);

    EXPECT_TRUE(registry.try_claim("c/m/other").has_value());
}

TEST(ClaimRegistryTest, DestructionReleases) {
    ClaimRegistry registry;
    {
        auto claim = registry.try_claim("k");
        ASSERT_TRUE(claim.has_value());
        EXPECT_EQ(registry.active(), 1u);
    }
    EXPECT_EQ(registry.active(), 0u);
    EXPECT_TRUE(registry.try_claim("k").has_value());
}

TEST(ClaimRegistryTest, MoveTransfersOwnership) {
    ClaimRegistry registry;
    auto claim = registry.try_claim("k");
    ASSERT_TRUE(claim.has_value());
    Claim moved = std::move(*claim);
    EXPECT_FALSE(claim->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(moved.key(), "k");

    claim.reset();
    EXPECT_TRUE(registry.is_claimed("k"));
    moved.release();
    EXPECT_FALSE(registry.is_claimed("k"));
}

TEST(ClaimRegistryTest, ContentionRequestsRerun) {
    ClaimRegistry registry;
    auto claim = registry.try_claim("k");
    ASSERT_TRUE(claim.has_value());

    EXPECT_FALSE(registry.try_claim("k").has_value());
    EXPECT_FALSE(registry.try_claim("k").has_value());

    // Two losing callers collapse into one re-run.
    EXPECT_TRUE(claim->finish_or_rerun());
    EXPECT_TRUE(claim->held());
    EXPECT_FALSE(claim->finish_or_rerun());
    EXPECT_FALSE(claim->held());
    EXPECT_FALSE(registry.is_claimed("k"));
}

TEST(ClaimRegistryTest, ConcurrentClaimantsRunOnePassAtATime) {
    ClaimRegistry registry;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> passes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (auto claim = registry.try_claim("group")) {
                do {
                    int now = ++inside;
                    int seen = max_inside.load();
                    while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    ++passes;
                    --inside;
                } while (claim->finish_or_rerun());
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_GE(passes.load(), 1);
    EXPECT_EQ(registry.active(), 0u);
}

TEST(ComputeSlotsTest, RejectsZeroCapacity) {
    EXPECT_THROW(ComputeSlots(0), InvalidArgumentError);
}

TEST(ComputeSlotsTest, BoundsConcurrentHolders) {
    ComputeSlots slots(2);
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i] {
            ComputeSlots::Lease lease(slots, i % 3);
            int now = ++inside;
            int seen = max_inside.load();
            while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --inside;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(max_inside.load(), 2);
    EXPECT_EQ(slots.in_use(), 0u);
    EXPECT_EQ(slots.waiting(), 0u);
}

TEST(ComputeSlotsTest, HigherPriorityWaiterGoesFirst) {
    ComputeSlots slots(1);
    std::vector<int> order;
    std::mutex order_mutex;

    auto holder = std::make_unique<ComputeSlots::Lease>(slots, 0);

    auto waiter = [&](int priority) {
        ComputeSlots::Lease lease(slots, priority);
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(priority);
    };
    std::thread low(waiter, 10);
    std::thread high(waiter, 90);

    while (slots.waiting() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    holder.reset();
    low.join();
    high.join();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 90);
    EXPECT_EQ(order[1], 10);
}
