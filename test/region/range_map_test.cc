#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/region/range_map.h"

#include <algorithm>
#include <random>

using namespace Strata;
using ::testing::ElementsAre;

class RangeMapTest : public ::testing::Test {
protected:
    RangeMap map_;
};

TEST_F(RangeMapTest, EmptyRangesAreIgnored) {
    map_.Insert(ByteRange{5, 5}, 1);
    map_.Insert(ByteRange{9, 3}, 1);
    EXPECT_TRUE(map_.empty());
    EXPECT_TRUE(map_.Regions().empty());
}

TEST_F(RangeMapTest, SplitsOverlaps) {
    map_.Insert(ByteRange{0, 10}, 0);
    map_.Insert(ByteRange{4, 5}, 1);
    EXPECT_THAT(map_.Regions(3), ElementsAre(Region{3, 0, 4, {0}}, Region{3, 4, 5, {0, 1}},
                                             Region{3, 5, 10, {0}}));
}

TEST_F(RangeMapTest, AbuttingMarksCancelAtSeam) {
    map_.Insert(ByteRange{0, 4}, 0);
    map_.Insert(ByteRange{4, 10}, 0);
    EXPECT_THAT(map_.Events(), ElementsAre(BoundaryEvent{0, 0, 1}, BoundaryEvent{10, 0, -1}));
    EXPECT_THAT(map_.Regions(), ElementsAre(Region{0, 0, 10, {0}}));
}

TEST_F(RangeMapTest, ClearResets) {
    map_.Insert(ByteRange{0, 4}, 0);
    map_.clear();
    EXPECT_TRUE(map_.empty());
}

TEST_F(RangeMapTest, InsertOrderDoesNotMatter) {
    std::vector<std::pair<ByteRange, LabelId>> marks;
    std::mt19937 rng(7);
    std::uniform_int_distribution<uint32_t> offset(0, 200);
    std::uniform_int_distribution<uint32_t> len(1, 40);
    std::uniform_int_distribution<LabelId> label(0, 5);
    for (int i = 0; i < 300; ++i) {
        const uint32_t start = offset(rng);
        marks.emplace_back(ByteRange{start, start + len(rng)}, label(rng));
    }

    for (const auto& [range, id] : marks) {
        map_.Insert(range, id);
    }
    const auto expected = map_.Regions();

    for (int round = 0; round < 5; ++round) {
        std::shuffle(marks.begin(), marks.end(), rng);
        RangeMap shuffled;
        for (const auto& [range, id] : marks) {
            shuffled.Insert(range, id);
        }
        EXPECT_EQ(shuffled.Regions(), expected);
    }
}

TEST_F(RangeMapTest, CoverageMatchesUnionOfMarks) {
    const std::vector<std::pair<ByteRange, LabelId>> marks = {
        {{0, 10}, 0}, {{5, 15}, 1}, {{20, 30}, 0}, {{25, 26}, 2}, {{29, 40}, 1},
    };
    for (const auto& [range, id] : marks) {
        map_.Insert(range, id);
    }
    const auto regions = map_.Regions();

    // Every byte is covered by exactly the labels of the marks containing it
    for (uint32_t byte = 0; byte < 45; ++byte) {
        std::vector<LabelId> want;
        for (const auto& [range, id] : marks) {
            if (range.start <= byte && byte < range.end) want.push_back(id);
        }
        std::sort(want.begin(), want.end());
        want.erase(std::unique(want.begin(), want.end()), want.end());

        std::vector<LabelId> got;
        for (const auto& region : regions) {
            if (region.start <= byte && byte < region.end) got = region.labels;
        }
        EXPECT_EQ(got, want) << "byte " << byte;
    }
}
