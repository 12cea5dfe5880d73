#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <ferry/downloader/serialization.hpp>

#include <chrono>
#include <string>

using json = nlohmann::json;
using namespace ferry::downloader;

TEST(Iso8601, FormatsUtcWithMilliseconds) {
    const Timestamp t = Clock::from_time_t(0) + std::chrono::milliseconds(1250);
    EXPECT_EQ(formatIso8601(t), "1970-01-01T00:00:01.250Z");
}

TEST(Iso8601, ParsesZuluOffsetsAndFractions) {
    auto z = parseIso8601("2025-01-31T08:15:00.250Z");
    ASSERT_TRUE(z.has_value());
    EXPECT_EQ(formatIso8601(*z), "2025-01-31T08:15:00.250Z");

    auto off = parseIso8601("2025-01-31T10:15:00+02:00");
    ASSERT_TRUE(off.has_value());
    EXPECT_EQ(formatIso8601(*off), "2025-01-31T08:15:00.000Z");

    EXPECT_FALSE(parseIso8601("2025-01-31").has_value());
    EXPECT_FALSE(parseIso8601("2025-01-31T08:15:00").has_value());
    EXPECT_FALSE(parseIso8601("2025-01-31T08:15:00Zjunk").has_value());
}

TEST(TaskJson, UsesCamelCaseKeysAndOmitsAbsentOptionals) {
    Task t;
    t.id = "t1";
    t.url = "https://example.org/a.zip";
    t.category = "maps";
    t.status = TaskStatus::Paused;
    t.bytesDownloaded = 10;
    t.totalBytes = 100;
    t.createdAt = Clock::from_time_t(0);

    json j = t;
    EXPECT_EQ(j.at("status"), "paused");
    EXPECT_EQ(j.at("bytesDownloaded"), 10);
    EXPECT_EQ(j.at("createdAt"), "1970-01-01T00:00:00.000Z");
    EXPECT_FALSE(j.contains("errorMessage"));
    EXPECT_FALSE(j.contains("startedAt"));

    auto back = j.get<Task>();
    EXPECT_EQ(back, t);
}

TEST(TaskJson, RejectsUnknownStatus) {
    json j = {{"id", "t1"},
              {"url", "u"},
              {"status", "exploding"},
              {"createdAt", "2025-01-01T00:00:00.000Z"}};
    EXPECT_THROW(j.get<Task>(), std::invalid_argument);
}

TEST(TaskJson, MissingOptionalFieldsTakeDefaults) {
    json j = {{"id", "t1"},
              {"url", "u"},
              {"status", "pending"},
              {"createdAt", "2025-01-01T00:00:00.000Z"},
              {"errorMessage", nullptr}};
    auto t = j.get<Task>();
    EXPECT_EQ(t.partIndex, 1);
    EXPECT_EQ(t.partCount, 1);
    EXPECT_EQ(t.totalBytes, 0u);
    EXPECT_FALSE(t.errorMessage.has_value());
}

TEST(SnapshotJson, KeysMatchPersistedFormat) {
    QueueSnapshot s;
    s.paused = true;
    s.maxConcurrent = 2;
    s.exportedAt = Clock::from_time_t(60);
    json j = s;
    EXPECT_TRUE(j.contains("queueOrder"));
    EXPECT_EQ(j.at("isPaused"), true);
    EXPECT_EQ(j.at("maxConcurrentDownloads"), 2);
    EXPECT_EQ(j.at("version"), QueueSnapshot::kCurrentVersion);

    auto back = j.get<QueueSnapshot>();
    EXPECT_TRUE(back.paused);
    EXPECT_EQ(back.maxConcurrent, 2);
    EXPECT_EQ(back.exportedAt, s.exportedAt);
}

TEST(HistoryJson, RecordedAtFallsBackToCompletion) {
    json j = {{"id", "h1"},
              {"taskId", "t1"},
              {"startedAt", "2025-01-01T00:00:00.000Z"},
              {"completedAt", "2025-01-01T00:01:00.000Z"},
              {"success", true}};
    auto e = j.get<HistoryEntry>();
    ASSERT_TRUE(e.completedAt.has_value());
    EXPECT_EQ(e.recordedAt, *e.completedAt);
    EXPECT_EQ(e.duration(), std::chrono::minutes(1));
}
