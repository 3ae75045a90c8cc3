#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "pool/errors.hpp"
#include "store/memory_store.hpp"
#include "test_utils.hpp"

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryStore store_;
};

TEST_F(MemoryStoreTest, ChooseRespectsMaxScore) {
    runSync(store_.upsert("k", "late", 50));
    runSync(store_.upsert("k", "early", 10));

    EXPECT_FALSE(runSync(store_.chooseAndLock("k", 5, 100)).has_value());
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 60, 100)), "early");
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 60, 100)), "late");
    EXPECT_FALSE(runSync(store_.chooseAndLock("k", 60, 100)).has_value());
    EXPECT_DOUBLE_EQ(*runSync(store_.score("k", "early")), 100);
}

TEST_F(MemoryStoreTest, TiesBreakOnMemberBytes) {
    runSync(store_.addMany("k", {"b", "B", "a", "aa"}, 0));

    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "B");
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "a");
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "aa");
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "b");
}

TEST_F(MemoryStoreTest, AddManyCountsOnlyNewMembers) {
    EXPECT_EQ(runSync(store_.addMany("k", {"a", "b", "a"}, 0)), 2u);
    EXPECT_EQ(runSync(store_.addMany("k", {"b", "c"}, 0)), 1u);
    EXPECT_EQ(runSync(store_.count("k")), 3u);
    EXPECT_EQ(runSync(store_.addMany("k", {}, 0)), 0u);
}

TEST_F(MemoryStoreTest, CountUpToIsInclusive) {
    runSync(store_.addMany("k", {"a", "b"}, 5));
    runSync(store_.upsert("k", "c", 6));

    EXPECT_EQ(runSync(store_.countUpTo("k", 4.9)), 0u);
    EXPECT_EQ(runSync(store_.countUpTo("k", 5)), 2u);
    EXPECT_EQ(runSync(store_.countUpTo("k", 6)), 3u);
    EXPECT_EQ(runSync(store_.countUpTo("missing", 6)), 0u);
}

TEST_F(MemoryStoreTest, UpdateIfMemberNeverInserts) {
    EXPECT_FALSE(runSync(store_.updateIfMember("k", "a", 1)));
    EXPECT_TRUE(store_.keys().empty());

    runSync(store_.upsert("k", "a", 0));
    EXPECT_TRUE(runSync(store_.updateIfMember("k", "a", 7)));
    EXPECT_DOUBLE_EQ(*runSync(store_.score("k", "a")), 7);
}

TEST_F(MemoryStoreTest, RemovingLastMemberDropsKey) {
    runSync(store_.upsert("k", "a", 0));
    EXPECT_EQ(store_.keys(), std::vector<std::string>{"k"});

    EXPECT_TRUE(runSync(store_.remove("k", "a")));
    EXPECT_TRUE(store_.keys().empty());
    EXPECT_FALSE(runSync(store_.remove("k", "a")));
}

TEST_F(MemoryStoreTest, SwapReplacesDestination) {
    runSync(store_.addMany("live", {"old"}, 3));
    runSync(store_.addMany("tmp", {"new"}, 0));

    runSync(store_.swap("tmp", "live", false));

    EXPECT_EQ(store_.keys(), std::vector<std::string>{"live"});
    EXPECT_FALSE(runSync(store_.score("live", "old")).has_value());
    EXPECT_DOUBLE_EQ(*runSync(store_.score("live", "new")), 0);
}

TEST_F(MemoryStoreTest, SwapCarriesScoresOfSharedMembers) {
    runSync(store_.upsert("live", "kept", 42));
    runSync(store_.upsert("live", "gone", 7));
    runSync(store_.addMany("tmp", {"kept", "fresh"}, 0));

    runSync(store_.swap("tmp", "live", true));

    EXPECT_EQ(runSync(store_.count("live")), 2u);
    EXPECT_DOUBLE_EQ(*runSync(store_.score("live", "kept")), 42);
    EXPECT_DOUBLE_EQ(*runSync(store_.score("live", "fresh")), 0);
    EXPECT_FALSE(runSync(store_.score("live", "gone")).has_value());
}

TEST_F(MemoryStoreTest, SwapIntoMissingDestination) {
    runSync(store_.addMany("tmp", {"a"}, 0));
    runSync(store_.swap("tmp", "live", true));
    EXPECT_EQ(store_.keys(), std::vector<std::string>{"live"});
}

TEST_F(MemoryStoreTest, SwapWithoutSourceFails) {
    runSync(store_.upsert("live", "a", 1));
    EXPECT_THROW(runSync(store_.swap("tmp", "live", false)), StoreError);
    EXPECT_DOUBLE_EQ(*runSync(store_.score("live", "a")), 1);
}

TEST_F(MemoryStoreTest, NaNScoresAreRejected) {
    runSync(store_.addMany("k", {"a", "b"}, 0));
    const double nan = std::nan("");

    EXPECT_THROW(runSync(store_.upsert("k", "a", nan)), StoreError);
    EXPECT_THROW(runSync(store_.updateIfMember("k", "a", nan)), StoreError);
    EXPECT_THROW(runSync(store_.addIfNew("k", "c", nan)), StoreError);
    EXPECT_THROW(runSync(store_.addMany("k", {"c"}, nan)), StoreError);
    EXPECT_THROW(runSync(store_.chooseAndLock("k", 0, nan)), StoreError);

    EXPECT_EQ(runSync(store_.count("k")), 2u);
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "a");
    EXPECT_EQ(runSync(store_.chooseAndLock("k", 0, 1)), "b");
}
