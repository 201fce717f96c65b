#include <gtest/gtest.h>
#include <stdexcept>
#include "kernel/CrimeHistory.h"

TEST(CrimeHistoryTest, StartsEmpty) {
    CrimeHistory h(5);
    EXPECT_EQ(h.capacity(), 5u);
    EXPECT_EQ(h.size(), 0u);
    EXPECT_EQ(h.count(), 0u);
    EXPECT_FALSE(h.full());
    EXPECT_FALSE(h.newest());
}

TEST(CrimeHistoryTest, CountsWithinWindow) {
    CrimeHistory h(4);
    h.push(true);
    h.push(false);
    h.push(true);

    EXPECT_EQ(h.size(), 3u);
    EXPECT_EQ(h.count(), 2u);
    EXPECT_TRUE(h.at(0));
    EXPECT_FALSE(h.at(1));
    EXPECT_TRUE(h.newest());
}

// Oldest day falls out once the window is full
TEST(CrimeHistoryTest, EvictsOldest) {
    CrimeHistory h(3);
    h.push(true);
    h.push(true);
    h.push(false);
    EXPECT_TRUE(h.full());
    EXPECT_EQ(h.count(), 2u);

    h.push(false);   // evicts the first crime day
    EXPECT_EQ(h.size(), 3u);
    EXPECT_EQ(h.count(), 1u);
    EXPECT_TRUE(h.at(0));
    EXPECT_FALSE(h.at(2));

    h.push(false);
    h.push(false);
    EXPECT_EQ(h.count(), 0u);
}

TEST(CrimeHistoryTest, NeverExceedsCapacity) {
    CrimeHistory h(30);
    for (int day = 0; day < 365; ++day) {
        h.push(day % 2 == 0);
        EXPECT_LE(h.size(), 30u);
        EXPECT_LE(h.count(), 30u);
    }
    EXPECT_EQ(h.count(), 15u);
}

TEST(CrimeHistoryTest, ResetClears) {
    CrimeHistory h(2);
    h.push(true);
    h.reset(10);
    EXPECT_EQ(h.capacity(), 10u);
    EXPECT_EQ(h.size(), 0u);
    EXPECT_EQ(h.count(), 0u);
}

TEST(CrimeHistoryTest, Errors) {
    CrimeHistory empty;
    EXPECT_THROW(empty.push(true), std::logic_error);

    CrimeHistory h(3);
    h.push(true);
    EXPECT_THROW(h.at(1), std::out_of_range);
}
