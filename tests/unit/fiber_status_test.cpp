#include <gtest/gtest.h>
#include "fiber_status.hpp"
#include "unit_test_utils.hpp"

TEST(FiberBitSetTest, StartsEmpty) {
    FiberBitSet bits(130);

    EXPECT_EQ(bits.capacity(), 130);
    EXPECT_EQ(bits.cardinality(), 0);
    EXPECT_EQ(bits.data().size(), 3);
    for (size_t i = 0; i < bits.capacity(); ++i) {
        EXPECT_FALSE(bits.get(i));
    }
}

TEST(FiberBitSetTest, SetAndUnsetAcrossWordBoundaries) {
    FiberBitSet bits(130);

    bits.set(0);
    bits.set(63);
    bits.set(64);
    bits.set(129);
    EXPECT_EQ(bits.cardinality(), 4);
    EXPECT_TRUE(bits.get(63));
    EXPECT_TRUE(bits.get(64));
    EXPECT_FALSE(bits.get(65));

    // Setting twice does not count twice
    bits.set(64);
    EXPECT_EQ(bits.cardinality(), 4);

    bits.unset(64);
    EXPECT_FALSE(bits.get(64));
    EXPECT_EQ(bits.cardinality(), 3);
}

TEST(FiberBitSetTest, CardinalityCountsFullWords) {
    FiberBitSet bits(192, {~uint64_t{0}, 0, uint64_t{0x8000000000000001}});
    EXPECT_EQ(bits.cardinality(), 66);
}

TEST(FiberBitSetTest, OutOfRangeIndexThrows) {
    FiberBitSet bits(10);

    EXPECT_THROW(bits.set(10), std::out_of_range);
    EXPECT_THROW(bits.get(100), std::out_of_range);
    EXPECT_THROW(bits.unset(10), std::out_of_range);

    FiberBitSet empty;
    EXPECT_EQ(empty.capacity(), 0);
    EXPECT_EQ(empty.cardinality(), 0);
    EXPECT_THROW(empty.get(0), std::out_of_range);
}

TEST(FiberBitSetTest, FromWordsValidatesLengthAndMasksTail) {
    EXPECT_THROW(FiberBitSet(65, {0x1}), std::invalid_argument);
    EXPECT_THROW(FiberBitSet(0, {0x1}), std::invalid_argument);

    // Bits beyond capacity in the last word are dropped
    FiberBitSet bits(4, {0xFF});
    EXPECT_EQ(bits.cardinality(), 4);
    EXPECT_EQ(bits.data()[0], 0xFu);
}

TEST(FiberCacheStatusTest, CachedFiberCountIsCardinality) {
    auto status = unit_test_utils::makeStatusWithBits("/data/a.parquet", 10, {1, 3, 9});

    EXPECT_EQ(status.file(), "/data/a.parquet");
    EXPECT_EQ(status.cachedFiberCount(), 3);
    EXPECT_EQ(status.groupCount(), 1);
    EXPECT_EQ(status.fieldCount(), 10);
}

TEST(FiberCacheStatusTest, MoreCacheThanIsStrict) {
    auto five = unit_test_utils::makeStatus("/data/a.parquet", 5);
    auto other_five = unit_test_utils::makeStatusWithBits("/data/a.parquet", 10, {0, 2, 4, 6, 8});
    auto eight = unit_test_utils::makeStatus("/data/a.parquet", 8);

    EXPECT_TRUE(eight.moreCacheThan(five));
    EXPECT_FALSE(five.moreCacheThan(eight));

    // Equal counts never win, whichever fibers they cover
    EXPECT_FALSE(five.moreCacheThan(other_five));
    EXPECT_FALSE(other_five.moreCacheThan(five));
    EXPECT_FALSE(five.moreCacheThan(five));
}
