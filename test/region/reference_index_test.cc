#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/region/database.h"
#include "../../src/common/errors.h"

using namespace Strata;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ReferenceIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseOptions options;
        options.store.num_shards = 8;
        options.worker_threads = 2;
        // Small pages so iteration crosses page boundaries
        options.scan_batch = 2;
        db_ = std::make_unique<Database>(options);
    }

    std::unique_ptr<Database> db_;
};

TEST_F(ReferenceIndexTest, ReferencesAreOrderedByScopeThenStart) {
    db_->marks().Insert(9, ByteRange{0, 3}, 7);
    db_->marks().Insert(2, ByteRange{50, 60}, 7);
    db_->marks().Insert(2, ByteRange{10, 20}, 7);
    db_->marks().Insert(2, ByteRange{15, 30}, 8);
    db_->marks().Insert(5, ByteRange{1, 2}, 7);
    ASSERT_TRUE(db_->compactor().FinalizeAll().ok());

    EXPECT_THAT(db_->references().CollectReferences(7),
                ElementsAre(Region{2, 10, 15, {7}}, Region{2, 15, 20, {7, 8}}, Region{2, 50, 60, {7}},
                            Region{5, 1, 2, {7}}, Region{9, 0, 3, {7}}));
}

TEST_F(ReferenceIndexTest, IteratorPagesLazily) {
    for (uint32_t i = 0; i < 7; ++i) {
        db_->marks().Insert(1, ByteRange{i * 10, i * 10 + 5}, 3);
    }
    db_->compactor().Finalize(1);

    ReferenceIterator it = db_->references().References(3);
    ConsolidatedEntry entry;
    uint32_t expected_start = 0;
    size_t count = 0;
    while (it.Next(entry)) {
        EXPECT_EQ(entry.scope, 1u);
        EXPECT_EQ(entry.start, expected_start);
        EXPECT_EQ(entry.end, expected_start + 5);
        EXPECT_THAT(entry.labels, ElementsAre(3u));
        expected_start += 10;
        ++count;
    }
    EXPECT_EQ(count, 7u);
    EXPECT_FALSE(it.Next(entry));
}

TEST_F(ReferenceIndexTest, UnknownLabelYieldsNothing) {
    db_->marks().Insert(1, ByteRange{0, 5}, 3);
    db_->compactor().Finalize(1);
    ReferenceIterator it = db_->references().References(4);
    ConsolidatedEntry entry;
    EXPECT_FALSE(it.Next(entry));
}

TEST_F(ReferenceIndexTest, ReferencesInRestrictsToScope) {
    db_->marks().Insert(1, ByteRange{0, 5}, 3);
    db_->marks().Insert(2, ByteRange{0, 5}, 3);
    db_->marks().Insert(2, ByteRange{8, 9}, 3);
    db_->compactor().FinalizeAll();

    EXPECT_THAT(db_->references().ReferencesIn(3, 2),
                ElementsAre(Region{2, 0, 5, {3}}, Region{2, 8, 9, {3}}));
    EXPECT_THAT(db_->references().ReferencesIn(4, 2), IsEmpty());
}

TEST_F(ReferenceIndexTest, ScopedQueriesRequireFinalizedScope) {
    db_->marks().Insert(1, ByteRange{0, 5}, 3);
    EXPECT_FALSE(db_->regions().IsFinalized(1));
    EXPECT_THROW(db_->references().ReferencesIn(3, 1), ScopeNotFinalized);
    EXPECT_THROW(db_->regions().RegionsIn(1), ScopeNotFinalized);
    Region region;
    EXPECT_THROW(db_->regions().RegionAt(1, 2, region), ScopeNotFinalized);
}

TEST_F(ReferenceIndexTest, RegionAtFindsCoveringRegion) {
    db_->marks().Insert(1, ByteRange{0, 10}, 0);
    db_->marks().Insert(1, ByteRange{4, 5}, 1);
    db_->marks().Insert(1, ByteRange{20, 30}, 2);
    db_->compactor().Finalize(1);

    Region region;
    ASSERT_TRUE(db_->regions().RegionAt(1, 4, region));
    EXPECT_EQ(region, (Region{1, 4, 5, {0, 1}}));
    ASSERT_TRUE(db_->regions().RegionAt(1, 9, region));
    EXPECT_EQ(region, (Region{1, 5, 10, {0}}));
    ASSERT_TRUE(db_->regions().RegionAt(1, 0, region));
    EXPECT_EQ(region.start, 0u);
    // Gap and past the end
    EXPECT_FALSE(db_->regions().RegionAt(1, 10, region));
    EXPECT_FALSE(db_->regions().RegionAt(1, 15, region));
    EXPECT_FALSE(db_->regions().RegionAt(1, 30, region));
}

TEST_F(ReferenceIndexTest, RegionAtIgnoresOtherScopes) {
    db_->marks().Insert(1, ByteRange{0, 10}, 0);
    db_->marks().Insert(2, ByteRange{5, 10}, 0);
    db_->compactor().FinalizeAll();

    Region region;
    EXPECT_FALSE(db_->regions().RegionAt(2, 3, region));
    ASSERT_TRUE(db_->regions().RegionAt(2, 5, region));
    EXPECT_EQ(region.scope, 2u);
}

TEST_F(ReferenceIndexTest, EraseRemovesEveryFanOutKey) {
    db_->marks().Insert(1, ByteRange{0, 10}, 0);
    db_->marks().Insert(1, ByteRange{0, 10}, 1);
    db_->compactor().Finalize(1);
    ASSERT_EQ(db_->references().CollectReferences(0).size(), 1u);
    ASSERT_EQ(db_->references().CollectReferences(1).size(), 1u);

    db_->references().Erase(Region{1, 0, 10, {0, 1}});
    EXPECT_THAT(db_->references().CollectReferences(0), IsEmpty());
    EXPECT_THAT(db_->references().CollectReferences(1), IsEmpty());
}
