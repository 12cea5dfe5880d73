#pragma once

/*
 * Ferry Downloader - Task queue (sole owner of task state)
 *
 * Every public method is linearizable: state is guarded by one mutex and each
 * mutation completes before the next begins. Observers, the state store and
 * the history log are only invoked after that mutex is released, so callbacks
 * may freely call back into the queue.
 */

#include <ferry/downloader/resume_token_store.hpp>
#include <ferry/downloader/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::downloader {

class HistoryLog;
class StateStore;

/**
 * Queue change notifications. Every method has a no-op default so observers
 * override only what they need.
 */
class IQueueObserver {
public:
    virtual ~IQueueObserver() = default;

    virtual void onTaskEnqueued(const Task&) {}
    virtual void onTaskRemoved(const std::string& /*taskId*/) {}
    virtual void onQueueCleared() {}
    virtual void onTaskUpdated(const Task&) {}
    virtual void onActiveCountChanged(std::size_t /*activeCount*/) {}
    virtual void onTaskCompleted(const Task&) {}
    virtual void onTaskFailed(const Task&) {}
    virtual void onPauseStateChanged(bool /*paused*/) {}
    /// Every task in the queue has reached completed.
    virtual void onQueueCompleted() {}
};

struct StatusCounts {
    std::size_t pending{0};
    std::size_t queued{0};
    std::size_t downloading{0};
    std::size_t paused{0};
    std::size_t extracting{0};
    std::size_t completed{0};
    std::size_t failed{0};

    [[nodiscard]] std::size_t total() const noexcept {
        return pending + queued + downloading + paused + extracting + completed + failed;
    }
    [[nodiscard]] std::size_t active() const noexcept { return queued + downloading + extracting; }
};

/**
 * Aggregate view of all tasks sharing a category.
 */
struct TaskGroup {
    std::string category;
    std::vector<Task> tasks; // ordered by part index
    StatusCounts counts;
    std::uint64_t totalBytes{0};
    std::uint64_t downloadedBytes{0};
    double progress{0.0};
    TaskStatus overallStatus{TaskStatus::Pending};
};

struct RestoreReport {
    bool restored{false};
    std::size_t taskCount{0};
    std::size_t demotedToPending{0};
    std::size_t orphanedTokensRemoved{0};
};

class TaskQueue {
public:
    static constexpr int kDefaultMaxConcurrent = 3;

    /**
     * @param tokens   resume token storage (required)
     * @param state    snapshot persistence; nullptr keeps the queue in memory only
     * @param history  terminal outcome log; nullptr disables recording
     */
    explicit TaskQueue(std::shared_ptr<ResumeTokenStore> tokens,
                       std::shared_ptr<StateStore> state = nullptr,
                       std::shared_ptr<HistoryLog> history = nullptr,
                       int maxConcurrent = kDefaultMaxConcurrent);

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void addObserver(std::weak_ptr<IQueueObserver> observer);
    void removeObserver(const std::shared_ptr<IQueueObserver>& observer);

    // --- collection ---
    bool enqueue(Task task);
    std::size_t enqueueAll(std::vector<Task> tasks);
    bool remove(const std::string& id);
    void clear();
    bool reorder(const std::string& id, std::size_t index);
    /// Moves a pending/queued task to just before the first pending/queued task.
    bool prioritize(const std::string& id);

    // --- admission ---
    /// First pending task in order, or nothing when paused or at the concurrency limit.
    [[nodiscard]] std::optional<Task> nextPendingTask() const;
    [[nodiscard]] std::size_t activeCount() const;

    // --- mutation ---
    bool updateTask(const std::string& id, const std::function<void(Task&)>& transform);
    bool updateProgress(const std::string& id, std::uint64_t bytes, std::uint64_t total);
    bool setResumeTokenPath(const std::string& id, std::optional<std::string> path);

    bool markQueued(const std::string& id);
    /// Also refuses when starting the task would exceed the concurrency limit.
    bool markDownloading(const std::string& id);
    bool markPaused(const std::string& id);
    bool markExtracting(const std::string& id);
    bool markCompleted(const std::string& id);
    bool markFailed(const std::string& id, std::string message);
    /// paused -> pending, keeping byte counters and resume token.
    bool requeue(const std::string& id);

    // --- global controls ---
    void setPaused(bool paused);
    [[nodiscard]] bool isPaused() const;
    /// Pauses every pausable task and sets the global pause flag.
    std::vector<std::string> pauseAll();
    void resumeAll();
    /// Every failed task -> pending, counters zeroed and resume tokens deleted.
    std::size_t retryFailed();
    /// failed -> pending, counters zeroed and resume token deleted.
    bool retryTask(const std::string& id);
    /// completed or failed -> pending, as retryTask.
    bool resetTask(const std::string& id);
    void setMaxConcurrent(int maxConcurrent);
    [[nodiscard]] int maxConcurrent() const;

    // --- queries ---
    [[nodiscard]] std::optional<Task> task(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<Task> allTasks() const;
    [[nodiscard]] std::vector<std::string> order() const;
    [[nodiscard]] std::vector<Task> tasksWithStatus(TaskStatus status) const;
    [[nodiscard]] std::vector<Task> tasksForCategory(const std::string& category) const;
    [[nodiscard]] std::vector<Task> activeTasks() const;
    [[nodiscard]] std::vector<Task> completedTasks() const;
    [[nodiscard]] std::vector<Task> failedTasks() const;
    [[nodiscard]] StatusCounts counts() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool allCompleted() const;

    /// Mean of per-task progress.
    [[nodiscard]] double overallProgress() const;
    [[nodiscard]] std::uint64_t totalBytes() const;
    [[nodiscard]] std::uint64_t downloadedBytes() const;
    [[nodiscard]] std::map<std::string, double> categoryProgress() const;
    [[nodiscard]] std::vector<TaskGroup> groupsByCategory() const;

    // --- persistence ---
    [[nodiscard]] QueueSnapshot exportState() const;
    Expected<void> importState(const QueueSnapshot& snapshot);
    RestoreReport restoreState();
    Expected<void> flush();

    // --- resume tokens ---
    Expected<std::filesystem::path> saveResumeToken(const std::string& id,
                                                    const ResumeToken& token);
    Expected<ResumeToken> loadResumeToken(const std::string& id);
    bool deleteResumeToken(const std::string& id);
    [[nodiscard]] bool hasResumeToken(const std::string& id) const;
    [[nodiscard]] const std::shared_ptr<ResumeTokenStore>& resumeTokens() const noexcept {
        return tokens_;
    }

private:
    struct Event;
    using Events = std::vector<Event>;

    // All *Locked helpers require mutex_ to be held.
    std::size_t activeCountLocked() const;
    bool allCompletedLocked() const;
    Task* findLocked(const std::string& id);
    QueueSnapshot snapshotLocked() const;
    bool transitionLocked(const std::string& id, const std::function<bool(Task&)>& step,
                          Events& events);

    // Called without mutex_ held.
    bool apply(const std::string& id, const std::function<bool(Task&)>& step);
    void dispatch(const Events& events);
    void persist();

    std::shared_ptr<ResumeTokenStore> tokens_;
    std::shared_ptr<StateStore> state_;
    std::shared_ptr<HistoryLog> history_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Task> tasks_;
    std::vector<std::string> order_;
    bool paused_{false};
    int maxConcurrent_;
    std::size_t lastActiveCount_{0};

    std::mutex observersMutex_;
    std::vector<std::weak_ptr<IQueueObserver>> observers_;

    std::mutex persistMutex_; // keeps scheduled snapshots in mutation order
};

} // namespace ferry::downloader
