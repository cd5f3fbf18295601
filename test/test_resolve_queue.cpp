#include <gtest/gtest.h>

#include "mlat_track/resolve_queue.hpp"

using namespace mlat_track;

TEST(ResolveQueue, FiresInDeadlineThenScheduleOrder)
{
    ResolveQueue queue;
    uint64_t h1 = queue.schedule(5.0, "b");
    uint64_t h2 = queue.schedule(3.0, "a");
    uint64_t h3 = queue.schedule(5.0, "c");
    EXPECT_LT(h1, h2);
    EXPECT_LT(h2, h3);
    EXPECT_EQ(queue.size(), 3u);

    double deadline;
    ASSERT_TRUE(queue.next_deadline(deadline));
    EXPECT_DOUBLE_EQ(deadline, 3.0);

    std::string key;
    EXPECT_FALSE(queue.pop_due(2.9, key));
    ASSERT_TRUE(queue.pop_due(3.0, key));
    EXPECT_EQ(key, "a");

    uint64_t handle = 0;
    ASSERT_TRUE(queue.pop_due(10.0, key, &handle));
    EXPECT_EQ(key, "b");
    EXPECT_EQ(handle, h1);
    ASSERT_TRUE(queue.pop_due(10.0, key));
    EXPECT_EQ(key, "c");

    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.next_deadline(deadline));
    EXPECT_FALSE(queue.pop_due(100.0, key));
}

TEST(MlatClock, ManualClockMoves)
{
    ManualClock clock(10.0);
    EXPECT_DOUBLE_EQ(clock.now(), 10.0);
    clock.advance(2.5);
    EXPECT_DOUBLE_EQ(clock.now(), 12.5);
    EXPECT_DOUBLE_EQ(clock.wall_time(), 12.5);
    clock.set(1.0);
    EXPECT_DOUBLE_EQ(clock.now(), 1.0);
}

TEST(MlatClock, SystemClockIsMonotonic)
{
    SystemClock clock;
    double t0 = clock.now();
    EXPECT_GE(clock.now(), t0);
    EXPECT_GT(clock.wall_time(), 1.5E9);
}
