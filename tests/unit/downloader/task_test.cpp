#include <gtest/gtest.h>
#include <ferry/core/uuid.h>
#include <ferry/downloader/types.hpp>

#include <chrono>
#include <string>

using namespace ferry::downloader;

namespace {

Task make_task(const std::string& id, TaskStatus status = TaskStatus::Pending) {
    Task t;
    t.id = id;
    t.url = "https://data.example.org/sets/" + id + ".zip";
    t.category = "maps";
    t.status = status;
    t.createdAt = currentTime();
    return t;
}

} // namespace

TEST(TaskModel, FromManifestCopiesMetadataAndGeneratesId) {
    ManifestEntry entry;
    entry.url = "https://data.example.org/atlas/part-2.zip";
    entry.category = "atlas";
    entry.partIndex = 2;
    entry.partCount = 4;
    entry.datasetName = "World Atlas";
    entry.estimatedSize = 4096;

    auto a = Task::fromManifest(entry);
    auto b = Task::fromManifest(entry);

    EXPECT_FALSE(a.id.empty());
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.url, entry.url);
    EXPECT_EQ(a.category, "atlas");
    EXPECT_EQ(a.partIndex, 2);
    EXPECT_EQ(a.partCount, 4);
    EXPECT_EQ(a.totalBytes, 4096u);
    EXPECT_EQ(a.status, TaskStatus::Pending);
    EXPECT_EQ(a.bytesDownloaded, 0u);
    EXPECT_FALSE(a.resumeTokenPath.has_value());
}

TEST(TaskModel, FilenameUsesLastPathComponent) {
    auto t = make_task("x");
    t.url = "https://host.example/a/b/archive.tar.gz?sig=abc#frag";
    EXPECT_EQ(t.filename(), "archive.tar.gz");

    t.url = "https://host.example/files/archive.zip/content";
    EXPECT_EQ(t.filename(), "archive.zip");

    t.url = "https://host.example";
    EXPECT_EQ(t.filename(), "download");
}

TEST(TaskModel, DisplayNameIncludesPartsOnlyForMultiPart) {
    auto t = make_task("x");
    EXPECT_EQ(t.displayName(), "maps");
    t.partIndex = 2;
    t.partCount = 3;
    EXPECT_EQ(t.displayName(), "maps (Part 2 of 3)");
}

TEST(TaskModel, UpdateProgressClampsToTotal) {
    auto t = make_task("x");
    t.updateProgress(500, 1000);
    EXPECT_EQ(t.bytesDownloaded, 500u);
    EXPECT_DOUBLE_EQ(t.progress, 0.5);

    t.updateProgress(5000, 1000);
    EXPECT_EQ(t.bytesDownloaded, 1000u);
    EXPECT_DOUBLE_EQ(t.progress, 1.0);
    EXPECT_EQ(t.remainingBytes(), 0u);
}

TEST(TaskModel, UpdateProgressWithUnknownTotalKeepsProgressAtZero) {
    auto t = make_task("x");
    t.updateProgress(700, 0);
    EXPECT_EQ(t.bytesDownloaded, 700u);
    EXPECT_DOUBLE_EQ(t.progress, 0.0);
}

TEST(TaskModel, StartRecordsFirstStartOnly) {
    auto t = make_task("x");
    const auto first = currentTime();
    ASSERT_TRUE(t.start(first));
    EXPECT_EQ(t.status, TaskStatus::Downloading);
    ASSERT_TRUE(t.pause());
    ASSERT_TRUE(t.start(first + std::chrono::seconds(30)));
    EXPECT_EQ(t.startedAt, first);
}

TEST(TaskModel, IllegalTransitionsLeaveTaskUntouched) {
    auto t = make_task("x", TaskStatus::Completed);
    const auto before = t;
    EXPECT_FALSE(t.start());
    EXPECT_FALSE(t.pause());
    EXPECT_FALSE(t.requeue());
    EXPECT_FALSE(t.fail("late"));
    EXPECT_EQ(t, before);

    auto p = make_task("y");
    EXPECT_FALSE(p.complete());
    EXPECT_FALSE(p.startExtracting());
    EXPECT_EQ(p.status, TaskStatus::Pending);
}

TEST(TaskModel, CompleteFillsCountersAndDropsToken) {
    auto t = make_task("x");
    t.totalBytes = 2048;
    t.resumeTokenPath = "/tmp/x.resume";
    ASSERT_TRUE(t.start());
    t.updateProgress(1024, 2048);
    ASSERT_TRUE(t.complete());
    EXPECT_EQ(t.status, TaskStatus::Completed);
    EXPECT_EQ(t.bytesDownloaded, 2048u);
    EXPECT_DOUBLE_EQ(t.progress, 1.0);
    EXPECT_TRUE(t.completedAt.has_value());
    EXPECT_FALSE(t.resumeTokenPath.has_value());
}

TEST(TaskModel, ResetZeroesCountersFromTerminalStates) {
    auto t = make_task("x");
    ASSERT_TRUE(t.start());
    t.updateProgress(10, 100);
    t.resumeTokenPath = "/tmp/resume/x.resume";
    ASSERT_TRUE(t.fail("boom"));
    ASSERT_TRUE(t.reset());
    EXPECT_EQ(t.status, TaskStatus::Pending);
    EXPECT_EQ(t.bytesDownloaded, 0u);
    EXPECT_DOUBLE_EQ(t.progress, 0.0);
    EXPECT_FALSE(t.errorMessage.has_value());
    EXPECT_FALSE(t.resumeTokenPath.has_value());
    EXPECT_FALSE(t.startedAt.has_value());

    auto d = make_task("y", TaskStatus::Downloading);
    EXPECT_FALSE(d.reset());
}

TEST(TaskModel, StatusPredicates) {
    EXPECT_TRUE(isActive(TaskStatus::Queued));
    EXPECT_TRUE(isActive(TaskStatus::Downloading));
    EXPECT_TRUE(isActive(TaskStatus::Extracting));
    EXPECT_FALSE(isActive(TaskStatus::Paused));
    EXPECT_TRUE(canStart(TaskStatus::Failed));
    EXPECT_FALSE(canStart(TaskStatus::Completed));
    EXPECT_TRUE(canPause(TaskStatus::Queued));
    EXPECT_FALSE(canPause(TaskStatus::Paused));
    EXPECT_TRUE(canRetry(TaskStatus::Failed));
    EXPECT_FALSE(canRetry(TaskStatus::Completed));
}

TEST(TaskModel, StatusNamesRoundTrip) {
    for (auto s : {TaskStatus::Pending, TaskStatus::Queued, TaskStatus::Downloading,
                   TaskStatus::Paused, TaskStatus::Extracting, TaskStatus::Completed,
                   TaskStatus::Failed}) {
        auto parsed = statusFromName(statusName(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(statusFromName("bogus").has_value());
}

TEST(QueueSnapshotModel, ValidateReportsMismatchesAndRepairRebuildsOrder) {
    QueueSnapshot s;
    s.tasks = {make_task("a"), make_task("b")};
    s.order = {"a", "ghost"};

    auto problems = s.validate();
    ASSERT_FALSE(problems.empty());
    EXPECT_EQ(problems.front(), "Queue order IDs don't match task IDs");
    EXPECT_FALSE(s.isValid());

    auto fixed = s.repaired();
    EXPECT_TRUE(fixed.isValid());
    EXPECT_EQ(fixed.order, (std::vector<std::string>{"a", "b"}));
}

TEST(QueueSnapshotModel, DuplicatesAndBadVersionAreReported) {
    QueueSnapshot s;
    s.tasks = {make_task("a"), make_task("a")};
    s.order = {"a", "a"};
    s.version = 0;
    auto problems = s.validate();
    auto has = [&](const std::string& text) {
        return std::find(problems.begin(), problems.end(), text) != problems.end();
    };
    EXPECT_TRUE(has("Duplicate task IDs found"));
    EXPECT_TRUE(has("Duplicate IDs in queue order"));
    EXPECT_TRUE(has("Invalid version number: 0"));
}

TEST(HistoryEntryModel, FromTaskComputesDurationAndSpeed) {
    auto t = make_task("x");
    const auto start = currentTime();
    ASSERT_TRUE(t.start(start));
    t.updateProgress(4000, 4000);
    ASSERT_TRUE(t.complete(start + std::chrono::seconds(2)));

    auto e = HistoryEntry::fromTask(t, true, std::nullopt, start + std::chrono::seconds(3));
    EXPECT_EQ(e.taskId, "x");
    EXPECT_TRUE(e.success);
    EXPECT_EQ(e.duration(), std::chrono::milliseconds(2000));
    EXPECT_DOUBLE_EQ(e.averageSpeed(), 2000.0);
    EXPECT_FALSE(e.errorMessage.has_value());
}

TEST(HistoryEntryModel, FailureFallsBackToTaskMessage) {
    auto t = make_task("x");
    ASSERT_TRUE(t.start());
    ASSERT_TRUE(t.fail("Server error: HTTP 500"));
    auto e = HistoryEntry::fromTask(t, false);
    EXPECT_FALSE(e.success);
    ASSERT_TRUE(e.errorMessage.has_value());
    EXPECT_EQ(*e.errorMessage, "Server error: HTTP 500");
    EXPECT_FALSE(e.completedAt.has_value());
}

TEST(ByteFormatting, Units) {
    EXPECT_EQ(formatByteCount(512), "512 B");
    EXPECT_EQ(formatByteCount(1536), "1.5 KB");
    EXPECT_EQ(formatByteCount(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(formatByteCount(2ull * 1024 * 1024 * 1024), "2.0 GB");
}

TEST(TaskIds, GeneratedIdsAreVersion4Uuids) {
    const auto a = ferry::core::generateUUID();
    const auto b = ferry::core::generateUUID();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_TRUE(ferry::core::isUUID(a));
    EXPECT_NE(a, b);
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(std::string("89ab").find(a[19]), std::string::npos);
    EXPECT_EQ(a.find_first_of("ABCDEF"), std::string::npos);
    EXPECT_FALSE(ferry::core::isUUID("not-a-uuid"));
}
