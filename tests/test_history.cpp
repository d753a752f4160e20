#include <gtest/gtest.h>
#include "../src/core/history/report_history.hpp"
#include "test_support.hpp"

using namespace serverscore;
using namespace serverscore::history;
using namespace serverscore::test_support;

TEST(ReportHistoryTest, NewestFirst) {
    ReportHistory history(5);
    for (uint64_t c = 1; c <= 3; ++c) {
        history.push(make_report(c, NOW_MS + c));
    }

    ASSERT_EQ(history.size(), 3u);
    ASSERT_NE(history.latest(), nullptr);
    EXPECT_EQ(history.latest()->counter, 3u);

    auto recent = history.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].counter, 3u);
    EXPECT_EQ(recent[1].counter, 2u);

    auto chrono = history.chronological();
    ASSERT_EQ(chrono.size(), 3u);
    EXPECT_EQ(chrono.front().counter, 1u);
    EXPECT_EQ(chrono.back().counter, 3u);
}

TEST(ReportHistoryTest, EvictsOldestAtCapacity) {
    ReportHistory history(3);
    for (uint64_t c = 1; c <= 5; ++c) {
        history.push(make_report(c, NOW_MS + c));
        EXPECT_LE(history.size(), history.capacity());
    }

    auto chrono = history.chronological();
    ASSERT_EQ(chrono.size(), 3u);
    EXPECT_EQ(chrono.front().counter, 3u);
    EXPECT_EQ(chrono.back().counter, 5u);
}

TEST(ReportHistoryTest, FromRecentKeepsNewest) {
    std::vector<report::Report> fetched;
    for (uint64_t c = 10; c >= 1; --c) {
        fetched.push_back(make_report(c, NOW_MS + c));
    }

    auto history = ReportHistory::from_recent(fetched, 4);
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history.latest()->counter, 10u);
    EXPECT_EQ(history.chronological().front().counter, 7u);
}

TEST(ReportHistoryTest, EmptyAndInvalidCapacity) {
    ReportHistory history(2);
    EXPECT_TRUE(history.empty());
    EXPECT_EQ(history.latest(), nullptr);
    EXPECT_TRUE(history.recent(5).empty());

    EXPECT_THROW(ReportHistory(0), std::invalid_argument);
}
