#include <gtest/gtest.h>
#include "slot_pool.h"
#include <atomic>
#include <thread>
#include <vector>

namespace runcage {
namespace {

TEST(SlotPoolTest, AcquireUntilExhausted) {
    SlotPool pool(2);

    auto a = pool.acquire("job-a");
    auto b = pool.acquire("job-b");
    auto c = pool.acquire("job-c");

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
    EXPECT_FALSE(c.has_value());
    EXPECT_EQ(pool.in_use(), 2u);
    EXPECT_EQ(pool.available(), 0u);
    EXPECT_EQ(pool.holder(*a).value_or(""), "job-a");
}

TEST(SlotPoolTest, ReleaseMakesSlotReusable) {
    SlotPool pool(1);
    auto slot = pool.acquire("job-a");

    EXPECT_TRUE(pool.release(*slot));
    EXPECT_FALSE(pool.release(*slot)) << "Releasing a free slot is refused";
    EXPECT_FALSE(pool.holder(*slot).has_value());
    EXPECT_TRUE(pool.acquire("job-b").has_value());
}

TEST(SlotPoolTest, OutOfRangeSlot) {
    SlotPool pool(1);
    EXPECT_FALSE(pool.release(5));
    EXPECT_FALSE(pool.holder(5).has_value());
}

TEST(SlotPoolTest, NeverDoubleAllocatesUnderContention) {
    // Given: many threads competing for four slots
    SlotPool pool(4);
    std::atomic<int> holders{0};
    std::atomic<int> max_holders{0};
    std::atomic<bool> collision{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 16; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; i++) {
                std::string job = "job-" + std::to_string(t) + "-" + std::to_string(i);
                auto slot = pool.acquire(job);
                if (!slot) continue;
                int now = ++holders;
                int seen = max_holders.load();
                while (now > seen && !max_holders.compare_exchange_weak(seen, now)) {
                }
                if (pool.holder(*slot).value_or("") != job) {
                    collision = true;
                }
                --holders;
                pool.release(*slot);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Then: never more holders than slots, and no slot changed hands while held
    EXPECT_LE(max_holders.load(), 4);
    EXPECT_FALSE(collision.load());
    EXPECT_EQ(pool.in_use(), 0u);
}

} // namespace
} // namespace runcage
