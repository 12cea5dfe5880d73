#pragma once

/*
 * Ferry Downloader - Download engine
 *
 * The control loop: admits pending tasks through the coordinator, applies the
 * retry/backoff policy, reacts to connectivity changes and reports lifecycle
 * events to a delegate. It is the only component deciding when work happens.
 *
 * Threads:
 * - a worker thread sweeps the queue every pollInterval and fires due retries
 * - backend callbacks arrive on backend threads; a completion sweeps inline so
 *   the freed slot is refilled immediately
 * - network transitions arrive on the NetworkSignal publisher's thread
 */

#include <ferry/downloader/network_signal.hpp>
#include <ferry/downloader/progress_tracker.hpp>
#include <ferry/downloader/task_queue.hpp>
#include <ferry/downloader/transfer_coordinator.hpp>
#include <ferry/downloader/types.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ferry::downloader {

struct EngineConfig {
    int maxConcurrent{3};
    int maxRetries{3};
    std::chrono::milliseconds retryDelay{2000};
    std::chrono::milliseconds pollInterval{500};
    bool allowCellular{true};
};

/**
 * Engine -> presentation events. Every method has a no-op default. Callbacks
 * may arrive on any engine thread.
 */
class IDownloadEngineDelegate {
public:
    virtual ~IDownloadEngineDelegate() = default;

    virtual void onTaskUpdated(const Task&) {}
    virtual void onTaskStarted(const Task&) {}
    virtual void onTaskCompleted(const Task&) {}
    virtual void onTaskFailed(const Task&) {}
    virtual void onRunningStateChanged(bool /*running*/) {}
    virtual void onPausedStateChanged(bool /*paused*/) {}
    virtual void onNetworkStateChanged(bool /*available*/) {}
    virtual void onAllTasksFinished() {}
};

class DownloadEngine {
public:
    DownloadEngine(std::shared_ptr<TaskQueue> queue,
                   std::shared_ptr<TransferCoordinator> coordinator,
                   std::shared_ptr<NetworkSignal> network, EngineConfig config = {});
    /// Must not be destroyed from inside one of its own callbacks.
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    void setDelegate(std::shared_ptr<IDownloadEngineDelegate> delegate);
    void setProgressTracker(std::shared_ptr<ProgressTracker> tracker);

    // --- lifecycle ---
    void start();
    void stop();
    /// Pauses every active transfer (tokens captured) and sets the global pause flag.
    void pause();
    /// Requeues paused tasks and sweeps the queue immediately.
    void resume();

    // --- per task ---
    bool pauseTask(const std::string& id);
    /// Starts right away when a slot is free, otherwise jumps the admission line.
    bool resumeTask(const std::string& id);
    /// Aborts the transfer and removes the task.
    bool cancelTask(const std::string& id);
    /// failed -> pending with a fresh retry budget.
    bool retryTask(const std::string& id);

    bool enqueue(Task task);
    std::size_t enqueueAll(std::vector<Task> tasks);
    [[nodiscard]] std::vector<Task> allTasks() const;
    /// Cancels everything and empties the queue.
    void clearAll();

    [[nodiscard]] int retryCount(const std::string& id) const;
    void resetRetryCount(const std::string& id);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isPaused() const noexcept { return paused_.load(); }
    [[nodiscard]] bool isNetworkAvailable() const noexcept { return networkAvailable_.load(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// One admission sweep: starts pending tasks until the queue refuses.
    void processQueue();

private:
    class Relay;

    struct ScheduledRetry {
        std::string taskId;
        std::chrono::steady_clock::time_point due;
    };

    void workerLoop();
    void wake();
    void runDueRetries();
    void dropScheduledRetry(const std::string& id);
    bool admits(const NetworkStatus& status) const noexcept;
    void onNetworkChanged(const NetworkStatus& status);

    // Relay targets
    void handleTaskUpdated(const Task& task);
    void handleTaskCompleted(const Task& task);
    void handleTaskFailed(const Task& task);
    void handleQueueCompleted();
    void handleTransferStarted(const std::string& id);
    void handleTransferProgress(const std::string& id, std::uint64_t written,
                                std::uint64_t total);
    void handleTransferCompleted(const std::string& id);
    bool handleTransferFailed(const std::string& id, const TransferError& error);

    std::shared_ptr<IDownloadEngineDelegate> delegate() const;
    std::shared_ptr<ProgressTracker> tracker() const;

    std::shared_ptr<TaskQueue> queue_;
    std::shared_ptr<TransferCoordinator> coordinator_;
    std::shared_ptr<NetworkSignal> network_;
    EngineConfig config_;
    std::shared_ptr<Relay> relay_;
    NetworkSignal::SubscriptionId subscription_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> networkAvailable_{true};

    // Delegate callbacks may re-enter processQueue() on the sweeping thread.
    std::recursive_mutex sweepMutex_;

    mutable std::mutex mutex_; // retry state, wake flag
    std::condition_variable cv_;
    bool wakeRequested_{false};
    std::unordered_map<std::string, int> retryCounts_;
    std::vector<ScheduledRetry> retries_;
    std::thread worker_;

    mutable std::mutex hooksMutex_;
    std::shared_ptr<IDownloadEngineDelegate> delegate_;
    std::shared_ptr<ProgressTracker> tracker_;
};

} // namespace ferry::downloader
