#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <ferry/downloader/history_log.hpp>

#include "test_support.h"

#include <chrono>

using json = nlohmann::json;
using namespace ferry::downloader;
using namespace ferry::downloader::test;

namespace {

Task finished_task(const std::string& category, std::uint64_t bytes, bool ok) {
    auto t = make_task(category, 1, 1, bytes);
    const auto start = currentTime() - std::chrono::seconds(4);
    t.start(start);
    t.updateProgress(bytes, bytes);
    if (ok)
        t.complete(start + std::chrono::seconds(2));
    else
        t.fail("Server error (HTTP 500)");
    return t;
}

} // namespace

TEST(HistoryLogTest, RecordsMostRecentFirstAndPersists) {
    TempDir tmp;
    {
        HistoryLog log(tmp.path);
        log.recordSuccess(finished_task("maps", 1000, true));
        log.recordFailure(finished_task("audio", 10, false), "Server error (HTTP 500)");
        ASSERT_EQ(log.count(), 2u);
        auto all = log.entries();
        EXPECT_EQ(all[0].category, "audio");
        EXPECT_EQ(all[1].category, "maps");
        EXPECT_EQ(log.entries(1).size(), 1u);
    }
    HistoryLog reopened(tmp.path);
    ASSERT_EQ(reopened.count(), 2u);
    EXPECT_EQ(reopened.entries()[0].category, "audio");
    ASSERT_TRUE(reopened.entries()[0].errorMessage.has_value());
}

TEST(HistoryLogTest, BoundedToMaxEntries) {
    TempDir tmp;
    HistoryLog log(tmp.path, 3);
    for (int i = 0; i < 5; ++i)
        log.recordSuccess(finished_task("c" + std::to_string(i), 100, true));
    ASSERT_EQ(log.count(), 3u);
    EXPECT_EQ(log.entries()[0].category, "c4");
    EXPECT_EQ(log.entries()[2].category, "c2");
}

TEST(HistoryLogTest, FiltersAndStatistics) {
    TempDir tmp;
    HistoryLog log(tmp.path);
    log.recordSuccess(finished_task("maps", 4000, true));
    log.recordSuccess(finished_task("maps", 2000, true));
    log.recordFailure(finished_task("audio", 0, false), "boom");

    EXPECT_EQ(log.entriesForCategory("maps").size(), 2u);
    EXPECT_EQ(log.entriesForDataset("audio dataset").size(), 1u);
    EXPECT_EQ(log.successful().size(), 2u);
    EXPECT_EQ(log.failed().size(), 1u);

    auto s = log.statistics();
    EXPECT_EQ(s.totalDownloads, 3u);
    EXPECT_EQ(s.successfulDownloads, 2u);
    EXPECT_EQ(s.failedDownloads, 1u);
    EXPECT_EQ(s.totalBytesDownloaded, 6000u);
    EXPECT_DOUBLE_EQ(s.averageSize, 3000.0);
    EXPECT_EQ(s.averageDuration, std::chrono::milliseconds(2000));
    EXPECT_DOUBLE_EQ(s.averageSpeed, 1500.0);
    EXPECT_NEAR(s.successRate(), 2.0 / 3.0, 1e-9);
}

TEST(HistoryLogTest, EmptyStatisticsAreZero) {
    TempDir tmp;
    HistoryLog log(tmp.path);
    auto s = log.statistics();
    EXPECT_EQ(s.totalDownloads, 0u);
    EXPECT_DOUBLE_EQ(s.successRate(), 0.0);
    EXPECT_DOUBLE_EQ(s.averageSpeed, 0.0);
}

TEST(HistoryLogTest, ClearBeforeAndClear) {
    TempDir tmp;
    HistoryLog log(tmp.path);
    log.recordSuccess(finished_task("old", 10, true));
    const auto cutoff = currentTime() + std::chrono::milliseconds(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    log.recordSuccess(finished_task("new", 10, true));

    EXPECT_EQ(log.clearBefore(cutoff), 1u);
    ASSERT_EQ(log.count(), 1u);
    EXPECT_EQ(log.entries()[0].category, "new");

    log.clear();
    EXPECT_EQ(log.count(), 0u);
    HistoryLog reopened(tmp.path);
    EXPECT_EQ(reopened.count(), 0u);
}

TEST(HistoryLogTest, ExportIsJsonArray) {
    TempDir tmp;
    HistoryLog log(tmp.path);
    log.recordSuccess(finished_task("maps", 10, true));
    auto exported = log.exportJson();
    ASSERT_TRUE(exported.ok());
    auto j = json::parse(exported.value());
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0].at("category"), "maps");
}

TEST(HistoryLogTest, CorruptFileStartsEmpty) {
    TempDir tmp;
    write_file(tmp.path / HistoryLog::kFileName, "[{\"broken\": ");
    HistoryLog log(tmp.path);
    EXPECT_EQ(log.count(), 0u);
    EXPECT_FALSE(log.reload().ok());
}
