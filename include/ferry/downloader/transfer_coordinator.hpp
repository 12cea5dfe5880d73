#pragma once

/*
 * Ferry Downloader - Transfer coordinator
 *
 * Translates queue intent ("start task X") into ITransferBackend calls and
 * backend callbacks back into queue transitions and file placement. Owns the
 * job handle <-> task id mapping.
 */

#include <ferry/downloader/file_placement.hpp>
#include <ferry/downloader/task_queue.hpp>
#include <ferry/downloader/transfer_backend.hpp>
#include <ferry/downloader/transfer_error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ferry::downloader {

struct CoordinatorConfig {
    /// Completed payloads smaller than this are treated as a disguised error page.
    std::uint64_t minPayloadBytes{2048};
};

/**
 * Transfer-level notifications for the engine. Invoked without any
 * coordinator or queue lock held.
 */
class ITransferListener {
public:
    virtual ~ITransferListener() = default;

    virtual void onTransferStarted(const std::string& /*taskId*/, bool /*resumed*/) {}
    virtual void onTransferProgress(const std::string& /*taskId*/, std::uint64_t /*written*/,
                                    std::uint64_t /*total*/) {}
    virtual void onTransferCompleted(const std::string& /*taskId*/) {}
    /**
     * Offered before the task is marked failed. Returning true means the
     * listener took over (retry scheduled, task paused) and the coordinator
     * leaves the task alone.
     */
    virtual bool onTransferFailed(const std::string& /*taskId*/, const TransferError& /*error*/) {
        return false;
    }
};

struct RelaunchReport {
    std::size_t jobsReattached{0};
    std::size_t jobsCancelled{0};
    std::size_t tasksRequeued{0};
    std::size_t orphanedPayloadsRemoved{0};
};

class TransferCoordinator {
public:
    TransferCoordinator(std::shared_ptr<TaskQueue> queue, std::shared_ptr<FilePlacement> placement,
                        std::shared_ptr<ITransferBackend> backend, CoordinatorConfig config = {});
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    void setListener(std::weak_ptr<ITransferListener> listener);

    // --- engine intent ---

    /**
     * Moves the task to downloading and launches its transfer, resuming from
     * a stored token when one loads cleanly. Returns false when the task could
     * not be admitted (unknown, illegal state, concurrency limit, already running).
     */
    bool startTask(const std::string& id);
    /// Relaunches a task that is still downloading but has no live job (retry after backoff).
    bool restartTask(const std::string& id);
    /// InsufficientStorage error when the declared size does not fit, nothing otherwise.
    [[nodiscard]] std::optional<TransferError> checkStorage(const Task& task) const;

    bool pauseTask(const std::string& id);
    /// Pauses every active transfer, capturing tokens, and sets the queue pause flag.
    std::size_t pauseAll();
    /// Requeues paused tasks (tokens kept) and clears the queue pause flag.
    std::size_t resumeAll();
    /// Aborts the transfer and discards its token and payload. The task stays
    /// in the queue, untouched, for the caller to remove.
    bool cancelTask(const std::string& id);
    /// Aborts everything and empties the queue, its tokens and completed payloads.
    void cancelAll();
    /// failed -> pending with the stale token discarded.
    bool retryTask(const std::string& id);

    RelaunchReport restoreAfterRelaunch();

    // --- backend callbacks, by task id ---
    void handleProgress(const std::string& id, std::int64_t written, std::int64_t expected);
    void handleComplete(const std::string& id, const std::filesystem::path& location);
    void handleFailed(const std::string& id, const TransferError& error,
                      std::optional<ResumeToken> token);
    void handlePaused(const std::string& id, std::optional<ResumeToken> token);
    void handleResumedAtOffset(const std::string& id, std::int64_t offset,
                               std::int64_t expected);

    // --- job mapping ---
    [[nodiscard]] std::optional<JobHandle> jobFor(const std::string& id) const;
    [[nodiscard]] std::optional<std::string> taskForJob(JobHandle job) const;
    [[nodiscard]] std::size_t activeJobCount() const;

    [[nodiscard]] const std::shared_ptr<TaskQueue>& queue() const noexcept { return queue_; }
    [[nodiscard]] const std::shared_ptr<FilePlacement>& placement() const noexcept {
        return placement_;
    }

private:
    class EventSink;

    bool launch(const Task& task);
    bool stashResumeToken(const std::string& id, const ResumeToken& token);
    void discardResumeToken(const std::string& id);
    std::shared_ptr<ITransferListener> listener() const;

    void mapJob(JobHandle job, const std::string& id);
    std::optional<JobHandle> unmapTask(const std::string& id);
    std::optional<std::string> unmapJob(JobHandle job);

    std::shared_ptr<TaskQueue> queue_;
    std::shared_ptr<FilePlacement> placement_;
    std::shared_ptr<ITransferBackend> backend_;
    CoordinatorConfig config_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex jobsMutex_;
    std::unordered_map<JobHandle, std::string> jobToTask_;
    std::unordered_map<std::string, JobHandle> taskToJob_;

    mutable std::mutex listenerMutex_;
    std::weak_ptr<ITransferListener> listener_;
};

} // namespace ferry::downloader
