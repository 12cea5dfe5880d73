#include <gtest/gtest.h>
#include <ferry/downloader/download_stack.hpp>

#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;
using namespace ferry::downloader;
using namespace ferry::downloader::test;
using namespace std::chrono_literals;

namespace {

DownloadStackOptions options_for(const fs::path& dir) {
    DownloadStackOptions o;
    o.dataDir = dir;
    o.engine.maxConcurrent = 2;
    o.engine.retryDelay = 20ms;
    o.engine.pollInterval = 20ms;
    o.state.debounce = 10min;
    o.spaceQuery = [](const fs::path&) -> std::uint64_t { return 1ull << 40; };
    return o;
}

} // namespace

TEST(DownloadStackTest, WiresComponentsOverOneDataDirectory) {
    TempDir tmp;
    auto backend = std::make_shared<FakeTransferBackend>();
    DownloadStack stack(options_for(tmp.path), backend);

    EXPECT_TRUE(fs::is_directory(stack.placement().resumeDirectory()));
    EXPECT_EQ(stack.tokens().directory(), stack.placement().resumeDirectory());
    EXPECT_EQ(stack.queue().maxConcurrent(), 2);
    EXPECT_TRUE(stack.network().isConnected());
    EXPECT_TRUE(stack.engine().isNetworkAvailable());

    auto report = stack.restore();
    EXPECT_FALSE(report.queue.restored);
    EXPECT_EQ(report.expiredTokens, 0u);

    auto t = make_task("maps", 1, 1, 4096);
    ASSERT_TRUE(stack.engine().enqueue(t));
    stack.engine().start();
    EXPECT_EQ(stack.queue().task(t.id)->status, TaskStatus::Downloading);

    backend->fireProgress(*stack.coordinator().jobFor(t.id), 2048, 4096);
    EXPECT_EQ(stack.progress().bytesDownloaded(), 2048u);

    const auto payload = stack.placement().tempDirectory() / "done.bin";
    write_file(payload, std::string(4096, 'p'));
    backend->fireFinished(*stack.coordinator().jobFor(t.id), payload);
    EXPECT_EQ(stack.queue().task(t.id)->status, TaskStatus::Completed);
    EXPECT_TRUE(stack.placement().hasCompletedFile(*stack.queue().task(t.id)));
    ASSERT_EQ(stack.history().entries().size(), 1u);
    EXPECT_TRUE(stack.history().entries()[0].success);
}

TEST(DownloadStackTest, ShutdownFlushesPendingSnapshot) {
    TempDir tmp;
    std::string id;
    {
        DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>());
        auto t = make_task();
        id = t.id;
        ASSERT_TRUE(stack.engine().enqueue(t));
        ASSERT_TRUE(stack.shutdown().ok());
        EXPECT_FALSE(stack.engine().isRunning());
        EXPECT_FALSE(stack.state().hasPendingSave());
    }

    StateStore reader(tmp.path);
    auto loaded = reader.load();
    ASSERT_TRUE(loaded.ok());
    ASSERT_TRUE(loaded.value().has_value());
    ASSERT_EQ(loaded.value()->tasks.size(), 1u);
    EXPECT_EQ(loaded.value()->tasks[0].id, id);
}

TEST(DownloadStackTest, RestoreAfterRelaunchKeepsPausedTokenAndDemotesLostTransfer) {
    TempDir tmp;
    Task a = make_task("maps", 1, 2, 4096);
    Task b = make_task("maps", 2, 2, 4096);
    {
        DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>());
        ASSERT_EQ(stack.engine().enqueueAll({a, b}), 2u);
        stack.engine().start();
        ASSERT_TRUE(stack.engine().pauseTask(a.id));
        ASSERT_EQ(stack.queue().task(b.id)->status, TaskStatus::Downloading);
    }

    auto backend = std::make_shared<FakeTransferBackend>();
    DownloadStack stack(options_for(tmp.path), backend);
    write_file(stack.placement().tempDirectory() / "leftover.part", "x");
    auto report = stack.restore();

    EXPECT_TRUE(report.queue.restored);
    EXPECT_EQ(report.queue.taskCount, 2u);
    EXPECT_EQ(report.queue.demotedToPending, 1u);
    EXPECT_EQ(report.expiredTokens, 0u);

    auto pa = stack.queue().task(a.id);
    EXPECT_EQ(pa->status, TaskStatus::Paused);
    EXPECT_EQ(pa->resumeTokenPath, stack.tokens().pathFor(a.id).string());
    EXPECT_EQ(stack.queue().task(b.id)->status, TaskStatus::Pending);
    EXPECT_TRUE(fs::is_empty(stack.placement().tempDirectory()));

    stack.engine().start();
    EXPECT_EQ(stack.queue().task(b.id)->status, TaskStatus::Downloading);
    ASSERT_TRUE(stack.engine().resumeTask(a.id));
    EXPECT_EQ(backend->resumes(), 1);
}

TEST(DownloadStackTest, ExpiredTokensAreDroppedAndTasksStartOver) {
    TempDir tmp;
    Task a = make_task("maps", 1, 2, 4096);
    Task b = make_task("maps", 2, 2, 4096);
    {
        auto backend = std::make_shared<FakeTransferBackend>();
        DownloadStack stack(options_for(tmp.path), backend);
        ASSERT_EQ(stack.engine().enqueueAll({a, b}), 2u);
        stack.engine().start();
        backend->fireProgress(*stack.coordinator().jobFor(a.id), 1024, 4096);
        backend->fireProgress(*stack.coordinator().jobFor(b.id), 2048, 4096);
        ASSERT_TRUE(stack.engine().pauseTask(a.id));
        // b is still downloading, with a token saved mid-transfer
        ASSERT_TRUE(stack.tokens().save(b.id, make_token()).ok());
        const auto old = fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
        fs::last_write_time(stack.tokens().pathFor(a.id), old);
        fs::last_write_time(stack.tokens().pathFor(b.id), old);
        ASSERT_EQ(stack.queue().task(a.id)->bytesDownloaded, 1024u);
    }

    DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>());
    auto report = stack.restore();
    EXPECT_EQ(report.expiredTokens, 2u);
    EXPECT_EQ(report.queue.demotedToPending, 2u);
    EXPECT_EQ(stack.tokens().count(), 0u);

    for (const auto& id : {a.id, b.id}) {
        auto restored = stack.queue().task(id);
        ASSERT_TRUE(restored.has_value());
        EXPECT_EQ(restored->status, TaskStatus::Pending) << statusName(restored->status);
        EXPECT_FALSE(restored->resumeTokenPath.has_value());
        EXPECT_EQ(restored->bytesDownloaded, 0u);
        EXPECT_DOUBLE_EQ(restored->progress, 0.0);
    }
}

TEST(DownloadStackTest, RelaunchReattachesSurvivingJobs) {
    TempDir tmp;
    Task a = make_task("maps", 1, 1, 4096);
    {
        DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>());
        ASSERT_TRUE(stack.engine().enqueue(a));
        stack.engine().start();
        ASSERT_EQ(stack.queue().task(a.id)->status, TaskStatus::Downloading);
        // a token written mid-transfer keeps the task downloading across the restart
        ASSERT_TRUE(stack.tokens().save(a.id, make_token()).ok());
    }

    auto backend = std::make_shared<FakeTransferBackend>();
    const auto survivor = backend->adoptJob(a.url);
    const auto stranger = backend->adoptJob("https://elsewhere.example.org/other.zip");

    DownloadStack stack(options_for(tmp.path), backend);
    auto report = stack.restore();
    EXPECT_EQ(report.relaunch.jobsReattached, 1u);
    EXPECT_EQ(report.relaunch.jobsCancelled, 1u);
    EXPECT_TRUE(backend->isCancelled(stranger));
    EXPECT_EQ(stack.coordinator().jobFor(a.id), survivor);
    EXPECT_EQ(stack.queue().task(a.id)->status, TaskStatus::Downloading);

    const auto payload = stack.placement().tempDirectory() / "survivor.bin";
    write_file(payload, std::string(4096, 's'));
    backend->fireFinished(survivor, payload);
    EXPECT_EQ(stack.queue().task(a.id)->status, TaskStatus::Completed);
}

TEST(DownloadStackTest, ExternalNetworkSignalDrivesEngine) {
    TempDir tmp;
    auto network = std::make_shared<NetworkSignal>(NetworkStatus{false, LinkType::Unknown});
    DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>(), network);
    EXPECT_FALSE(stack.engine().isNetworkAvailable());

    auto t = make_task();
    ASSERT_TRUE(stack.engine().enqueue(t));
    stack.engine().start();
    EXPECT_EQ(stack.queue().task(t.id)->status, TaskStatus::Pending);

    network->publish({true, LinkType::Ethernet});
    EXPECT_TRUE(wait_until(
        [&] { return stack.queue().task(t.id)->status == TaskStatus::Downloading; }));
}

TEST(DownloadStackTest, CancelLeavesNoHistory) {
    TempDir tmp;
    DownloadStack stack(options_for(tmp.path), std::make_shared<FakeTransferBackend>());
    auto t = make_task();
    ASSERT_TRUE(stack.engine().enqueue(t));
    stack.engine().start();
    ASSERT_EQ(stack.queue().task(t.id)->status, TaskStatus::Downloading);

    ASSERT_TRUE(stack.engine().cancelTask(t.id));
    EXPECT_FALSE(stack.queue().contains(t.id));
    EXPECT_EQ(stack.history().count(), 0u);
    EXPECT_TRUE(stack.history().failed().empty());
}
