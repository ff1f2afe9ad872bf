#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/region/sweep.h"
#include "../../src/common/errors.h"

#include <tuple>

using namespace Strata;
using ::testing::ElementsAre;

namespace {

// Events for a list of (start, end, label) marks, as the mark store emits them
std::vector<BoundaryEvent> EventsFor(const std::vector<std::tuple<uint32_t, uint32_t, LabelId>>& marks) {
    std::vector<BoundaryEvent> events;
    for (const auto& [start, end, label] : marks) {
        events.push_back(BoundaryEvent{start, label, 1});
        events.push_back(BoundaryEvent{end, label, -1});
    }
    NormalizeEvents(events);
    return events;
}

Region R(uint32_t start, uint32_t end, std::vector<LabelId> labels) {
    return Region{1, start, end, std::move(labels)};
}

} // namespace

TEST(NormalizeEventsTest, SortsAndMergesCoincidentEvents) {
    std::vector<BoundaryEvent> events = {
        {10, 1, -1}, {0, 2, 1}, {0, 1, 1}, {0, 1, 1}, {4, 1, 1}, {4, 1, -1},
    };
    NormalizeEvents(events);
    EXPECT_THAT(events, ElementsAre(BoundaryEvent{0, 1, 2}, BoundaryEvent{0, 2, 1},
                                    BoundaryEvent{10, 1, -1}));
}

TEST(SweepTest, EmptyStream) {
    EXPECT_TRUE(SweepAll(1, {}).empty());
}

TEST(SweepTest, SingleMark) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 4, 0}})), ElementsAre(R(0, 4, {0})));
}

TEST(SweepTest, NestedSameLabelCollapses) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 10, 0}, {4, 5, 0}})), ElementsAre(R(0, 10, {0})));
}

TEST(SweepTest, AbuttingSameLabelCoalesces) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 4, 0}, {4, 10, 0}})), ElementsAre(R(0, 10, {0})));
}

TEST(SweepTest, GapIsPreserved) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 4, 0}, {6, 10, 0}})),
                ElementsAre(R(0, 4, {0}), R(6, 10, {0})));
}

TEST(SweepTest, NestedDifferentLabelSplits) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 10, 0}, {4, 5, 1}})),
                ElementsAre(R(0, 4, {0}), R(4, 5, {0, 1}), R(5, 10, {0})));
}

TEST(SweepTest, CoincidentOpensOfOneLabel) {
    EXPECT_THAT(SweepAll(1, EventsFor({{0, 5, 1}, {0, 7, 1}, {0, 50, 2}, {51, 53, 1}})),
                ElementsAre(R(0, 7, {1, 2}), R(7, 50, {2}), R(51, 53, {1})));
}

TEST(SweepTest, IdenticalMarksCollapse) {
    EXPECT_THAT(SweepAll(1, EventsFor({{3, 9, 4}, {3, 9, 4}, {3, 9, 4}})), ElementsAre(R(3, 9, {4})));
}

TEST(SweepTest, UnderflowThrows) {
    std::vector<BoundaryEvent> events = {{0, 1, 1}, {5, 1, -1}, {8, 1, -1}};
    try {
        SweepAll(9, events);
        FAIL() << "expected InvariantViolation";
    } catch (const InvariantViolation& e) {
        EXPECT_EQ(e.scope(), 9u);
        EXPECT_EQ(e.offset(), 8u);
    }
}

TEST(SweepTest, CloseBeforeOpenThrows) {
    EXPECT_THROW(SweepAll(1, {{2, 3, -1}}), InvariantViolation);
}

TEST(SweepTest, LeakAtEndThrows) {
    std::vector<BoundaryEvent> events = {{0, 1, 1}, {0, 2, 1}, {5, 2, -1}};
    Sweep sweep(1, events);
    Region region;
    // Regions before the leak are still produced
    ASSERT_TRUE(sweep.Next(region));
    EXPECT_EQ(region, R(0, 5, {1, 2}));
    EXPECT_THROW(sweep.Next(region), InvariantViolation);
}

TEST(SweepTest, SweepIsLazyAndRestartable) {
    const auto events = EventsFor({{0, 10, 0}, {4, 5, 1}});
    Sweep first(1, events);
    Region region;
    ASSERT_TRUE(first.Next(region));
    EXPECT_EQ(region, R(0, 4, {0}));

    // A fresh sweep over the same events starts over
    EXPECT_THAT(SweepAll(1, events), ElementsAre(R(0, 4, {0}), R(4, 5, {0, 1}), R(5, 10, {0})));

    ASSERT_TRUE(first.Next(region));
    EXPECT_EQ(region, R(4, 5, {0, 1}));
}

TEST(SweepTest, ExhaustedSweepKeepsReturningFalse) {
    Sweep sweep(1, EventsFor({{0, 1, 0}}));
    Region region;
    ASSERT_TRUE(sweep.Next(region));
    EXPECT_FALSE(sweep.Next(region));
    EXPECT_FALSE(sweep.Next(region));
}

TEST(SweepTest, RegionsAreMaximalAndDisjoint) {
    const auto regions = SweepAll(1, EventsFor({
        {0, 100, 0}, {10, 20, 1}, {15, 30, 2}, {20, 25, 1}, {40, 60, 3}, {60, 70, 3}, {90, 120, 4},
    }));
    ASSERT_FALSE(regions.empty());
    for (size_t i = 0; i < regions.size(); ++i) {
        EXPECT_LT(regions[i].start, regions[i].end);
        EXPECT_FALSE(regions[i].labels.empty());
        if (i > 0) {
            EXPECT_LE(regions[i - 1].end, regions[i].start);
            // Touching neighbours never carry the same label set
            if (regions[i - 1].end == regions[i].start) {
                EXPECT_NE(regions[i - 1].labels, regions[i].labels);
            }
        }
    }
    EXPECT_EQ(regions.front().start, 0u);
    EXPECT_EQ(regions.back().end, 120u);
}
