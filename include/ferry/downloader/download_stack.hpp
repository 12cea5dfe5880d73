#pragma once

/*
 * Ferry Downloader - Composition root
 *
 * Builds the whole subsystem over one data directory and runs the relaunch
 * sequence: restore the queue snapshot, expire stale resume tokens, reattach
 * surviving backend jobs.
 */

#include <ferry/downloader/download_engine.hpp>
#include <ferry/downloader/file_placement.hpp>
#include <ferry/downloader/history_log.hpp>
#include <ferry/downloader/network_signal.hpp>
#include <ferry/downloader/progress_tracker.hpp>
#include <ferry/downloader/resume_token_store.hpp>
#include <ferry/downloader/state_store.hpp>
#include <ferry/downloader/task_queue.hpp>
#include <ferry/downloader/transfer_backend.hpp>
#include <ferry/downloader/transfer_coordinator.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>

namespace ferry::downloader {

struct DownloadStackOptions {
    std::filesystem::path dataDir;
    EngineConfig engine{};
    StateStoreConfig state{};
    CoordinatorConfig coordinator{};
    std::size_t historyMaxEntries{HistoryLog::kDefaultMaxEntries};
    std::chrono::hours resumeTokenMaxAge{ResumeTokenStore::kDefaultMaxAge};
    double storageMargin{FilePlacement::kDefaultStorageMargin};
    FilePlacement::SpaceQuery spaceQuery{};
};

struct StartupReport {
    RestoreReport queue;
    std::size_t expiredTokens{0};
    RelaunchReport relaunch;
};

class DownloadStack {
public:
    /// A null network signal gets a private one that always reports connected.
    DownloadStack(DownloadStackOptions options, std::shared_ptr<ITransferBackend> backend,
                  std::shared_ptr<NetworkSignal> network = nullptr);
    ~DownloadStack();

    DownloadStack(const DownloadStack&) = delete;
    DownloadStack& operator=(const DownloadStack&) = delete;

    /// Restores persisted state. Call once, before engine().start().
    StartupReport restore();
    /// Stops the engine and writes any pending snapshot.
    Expected<void> shutdown();

    [[nodiscard]] const DownloadStackOptions& options() const noexcept { return options_; }
    [[nodiscard]] ResumeTokenStore& tokens() noexcept { return *tokens_; }
    [[nodiscard]] StateStore& state() noexcept { return *state_; }
    [[nodiscard]] HistoryLog& history() noexcept { return *history_; }
    [[nodiscard]] TaskQueue& queue() noexcept { return *queue_; }
    [[nodiscard]] FilePlacement& placement() noexcept { return *placement_; }
    [[nodiscard]] TransferCoordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] NetworkSignal& network() noexcept { return *network_; }
    [[nodiscard]] ProgressTracker& progress() noexcept { return *tracker_; }
    [[nodiscard]] DownloadEngine& engine() noexcept { return *engine_; }

private:
    DownloadStackOptions options_;
    std::shared_ptr<FilePlacement> placement_;
    std::shared_ptr<ResumeTokenStore> tokens_;
    std::shared_ptr<StateStore> state_;
    std::shared_ptr<HistoryLog> history_;
    std::shared_ptr<TaskQueue> queue_;
    std::shared_ptr<ITransferBackend> backend_;
    std::shared_ptr<TransferCoordinator> coordinator_;
    std::shared_ptr<NetworkSignal> network_;
    std::shared_ptr<ProgressTracker> tracker_;
    std::unique_ptr<DownloadEngine> engine_;
};

} // namespace ferry::downloader
