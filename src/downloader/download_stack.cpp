/*
 * ferry/src/downloader/download_stack.cpp
 */

#include <ferry/downloader/download_stack.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace ferry::downloader {

DownloadStack::DownloadStack(DownloadStackOptions options, std::shared_ptr<ITransferBackend> backend,
                             std::shared_ptr<NetworkSignal> network)
    : options_(std::move(options)), backend_(std::move(backend)), network_(std::move(network)) {
    placement_ = std::make_shared<FilePlacement>(options_.dataDir, options_.spaceQuery,
                                                 options_.storageMargin);
    if (auto r = placement_->ensureLayout(); !r.ok())
        spdlog::error("DownloadStack: {}", r.error().message);

    tokens_ = std::make_shared<ResumeTokenStore>(placement_->resumeDirectory());
    state_ = std::make_shared<StateStore>(options_.dataDir, options_.state);
    history_ = std::make_shared<HistoryLog>(options_.dataDir, options_.historyMaxEntries);
    queue_ = std::make_shared<TaskQueue>(tokens_, state_, history_, options_.engine.maxConcurrent);
    coordinator_ = std::make_shared<TransferCoordinator>(queue_, placement_, backend_,
                                                         options_.coordinator);
    if (!network_)
        network_ = std::make_shared<NetworkSignal>();
    tracker_ = std::make_shared<ProgressTracker>();
    engine_ = std::make_unique<DownloadEngine>(queue_, coordinator_, network_, options_.engine);
    engine_->setProgressTracker(tracker_);
}

DownloadStack::~DownloadStack() {
    if (auto r = shutdown(); !r.ok())
        spdlog::error("DownloadStack: final state write failed: {}", r.error().message);
}

StartupReport DownloadStack::restore() {
    StartupReport report;
    // Expire first so the queue reconciles against the tokens that remain.
    report.expiredTokens = tokens_->cleanupOlderThan(options_.resumeTokenMaxAge);
    report.queue = queue_->restoreState();
    report.relaunch = coordinator_->restoreAfterRelaunch();
    spdlog::info("DownloadStack: {} task(s) restored from {}", report.queue.taskCount,
                 options_.dataDir.string());
    return report;
}

Expected<void> DownloadStack::shutdown() {
    if (engine_)
        engine_->stop();
    return queue_->flush();
}

} // namespace ferry::downloader
