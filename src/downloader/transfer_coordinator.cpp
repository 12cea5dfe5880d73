/*
 * ferry/src/downloader/transfer_coordinator.cpp
 */

#include <ferry/downloader/transfer_coordinator.hpp>

#include <spdlog/spdlog.h>

#include <shared_mutex>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ferry::downloader {

namespace fs = std::filesystem;

namespace {

void remove_quietly(const fs::path& p) {
    std::error_code ec;
    if (!fs::remove(p, ec) && ec)
        spdlog::debug("TransferCoordinator: could not remove {}: {}", p.string(), ec.message());
}

TransferError to_transfer_error(const Error& e, const std::string& url) {
    if (e.code == ErrorCode::InvalidArgument)
        return TransferError::invalidUrl(url);
    return TransferError::unknown(e.message);
}

} // namespace

// Non-owning back-reference handed to the backend. The coordinator detaches it
// on destruction; a detached sink drops every event.
class TransferCoordinator::EventSink final : public ITransferEvents {
public:
    explicit EventSink(TransferCoordinator* owner) : owner_(owner) {}

    void detach() {
        std::unique_lock lk(mutex_);
        owner_ = nullptr;
    }

    void onProgress(JobHandle job, std::int64_t written, std::int64_t expected) override {
        std::shared_lock lk(mutex_);
        if (!owner_)
            return;
        if (auto id = owner_->taskForJob(job))
            owner_->handleProgress(*id, written, expected);
    }

    void onFinished(JobHandle job, const fs::path& location) override {
        std::shared_lock lk(mutex_);
        if (!owner_)
            return;
        auto id = owner_->unmapJob(job);
        if (!id) {
            spdlog::debug("TransferCoordinator: finished event for unknown job {}", job);
            remove_quietly(location);
            return;
        }
        owner_->handleComplete(*id, location);
    }

    void onFailed(JobHandle job, const TransferError& error,
                  std::optional<ResumeToken> token) override {
        std::shared_lock lk(mutex_);
        if (!owner_)
            return;
        auto id = owner_->unmapJob(job);
        if (!id) {
            spdlog::debug("TransferCoordinator: failure event for unknown job {}", job);
            return;
        }
        // A cancellation that still produced a token is a pause by the platform.
        if (error.kind == TransferErrorKind::Cancelled && token) {
            owner_->handlePaused(*id, std::move(token));
            return;
        }
        owner_->handleFailed(*id, error, std::move(token));
    }

    void onResumedAtOffset(JobHandle job, std::int64_t offset, std::int64_t expected) override {
        std::shared_lock lk(mutex_);
        if (!owner_)
            return;
        if (auto id = owner_->taskForJob(job))
            owner_->handleResumedAtOffset(*id, offset, expected);
    }

private:
    std::shared_mutex mutex_;
    TransferCoordinator* owner_;
};

TransferCoordinator::TransferCoordinator(std::shared_ptr<TaskQueue> queue,
                                         std::shared_ptr<FilePlacement> placement,
                                         std::shared_ptr<ITransferBackend> backend,
                                         CoordinatorConfig config)
    : queue_(std::move(queue)), placement_(std::move(placement)), backend_(std::move(backend)),
      config_(config), sink_(std::make_shared<EventSink>(this)) {
    backend_->setEventSink(sink_);
}

TransferCoordinator::~TransferCoordinator() {
    sink_->detach();
}

void TransferCoordinator::setListener(std::weak_ptr<ITransferListener> listener) {
    std::lock_guard lk(listenerMutex_);
    listener_ = std::move(listener);
}

std::shared_ptr<ITransferListener> TransferCoordinator::listener() const {
    std::lock_guard lk(listenerMutex_);
    return listener_.lock();
}

// ---------- job mapping ----------

void TransferCoordinator::mapJob(JobHandle job, const std::string& id) {
    std::lock_guard lk(jobsMutex_);
    jobToTask_[job] = id;
    taskToJob_[id] = job;
}

std::optional<JobHandle> TransferCoordinator::unmapTask(const std::string& id) {
    std::lock_guard lk(jobsMutex_);
    auto it = taskToJob_.find(id);
    if (it == taskToJob_.end())
        return std::nullopt;
    const auto job = it->second;
    taskToJob_.erase(it);
    jobToTask_.erase(job);
    return job;
}

std::optional<std::string> TransferCoordinator::unmapJob(JobHandle job) {
    std::lock_guard lk(jobsMutex_);
    auto it = jobToTask_.find(job);
    if (it == jobToTask_.end())
        return std::nullopt;
    auto id = std::move(it->second);
    jobToTask_.erase(it);
    taskToJob_.erase(id);
    return id;
}

std::optional<JobHandle> TransferCoordinator::jobFor(const std::string& id) const {
    std::lock_guard lk(jobsMutex_);
    auto it = taskToJob_.find(id);
    if (it == taskToJob_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> TransferCoordinator::taskForJob(JobHandle job) const {
    std::lock_guard lk(jobsMutex_);
    auto it = jobToTask_.find(job);
    if (it == jobToTask_.end())
        return std::nullopt;
    return it->second;
}

std::size_t TransferCoordinator::activeJobCount() const {
    std::lock_guard lk(jobsMutex_);
    return jobToTask_.size();
}

// ---------- resume tokens ----------

bool TransferCoordinator::stashResumeToken(const std::string& id, const ResumeToken& token) {
    auto saved = queue_->saveResumeToken(id, token);
    if (!saved.ok()) {
        spdlog::warn("TransferCoordinator: could not keep resume token for {}: {}", id,
                     saved.error().message);
        return false;
    }
    return true;
}

void TransferCoordinator::discardResumeToken(const std::string& id) {
    if (queue_->deleteResumeToken(id))
        spdlog::debug("TransferCoordinator: discarded resume token for {}", id);
}

// ---------- engine intent ----------

std::optional<TransferError> TransferCoordinator::checkStorage(const Task& task) const {
    if (task.totalBytes == 0 || placement_->hasSpaceFor(task.totalBytes))
        return std::nullopt;
    return TransferError::insufficientStorage(placement_->requiredSpaceFor(task.totalBytes),
                                              placement_->availableSpace());
}

bool TransferCoordinator::startTask(const std::string& id) {
    if (jobFor(id)) {
        spdlog::debug("TransferCoordinator: {} already has a running transfer", id);
        return false;
    }
    if (!queue_->markDownloading(id))
        return false;
    auto task = queue_->task(id);
    if (!task)
        return false;
    return launch(*task);
}

bool TransferCoordinator::restartTask(const std::string& id) {
    auto task = queue_->task(id);
    if (!task || task->status != TaskStatus::Downloading || jobFor(id))
        return false;
    spdlog::debug("TransferCoordinator: restarting {}", id);
    return launch(*task);
}

bool TransferCoordinator::launch(const Task& task) {
    Expected<JobHandle> job;
    bool resumed = false;

    if (task.resumeTokenPath || queue_->hasResumeToken(task.id)) {
        auto token = queue_->loadResumeToken(task.id);
        if (token.ok()) {
            // Held across the call so an early event blocks until the job is mapped.
            std::lock_guard lk(jobsMutex_);
            job = backend_->resumeTransfer(token.value());
            if (job.ok()) {
                jobToTask_[job.value()] = task.id;
                taskToJob_[task.id] = job.value();
                resumed = true;
            } else {
                spdlog::warn("TransferCoordinator: resume of {} refused ({}), starting over",
                             task.id, job.error().message);
            }
        } else {
            spdlog::warn("TransferCoordinator: {}", token.error().message);
        }
        // Consumed by the running job, or unusable.
        discardResumeToken(task.id);
    }

    if (!resumed) {
        std::lock_guard lk(jobsMutex_);
        job = backend_->startTransfer(task.url);
        if (job.ok()) {
            jobToTask_[job.value()] = task.id;
            taskToJob_[task.id] = job.value();
        }
    }

    if (!job.ok()) {
        spdlog::warn("TransferCoordinator: could not start {}: {}", task.id,
                     job.error().message);
        handleFailed(task.id, to_transfer_error(job.error(), task.url), std::nullopt);
        return false;
    }

    spdlog::debug("TransferCoordinator: {} {} as job {}", resumed ? "resumed" : "started",
                  task.id, job.value());
    if (auto l = listener())
        l->onTransferStarted(task.id, resumed);
    return true;
}

bool TransferCoordinator::pauseTask(const std::string& id) {
    auto task = queue_->task(id);
    if (!task || !canPause(task->status))
        return false;
    if (auto job = unmapTask(id)) {
        if (auto token = backend_->cancel(*job))
            stashResumeToken(id, *token);
    }
    return queue_->markPaused(id);
}

std::size_t TransferCoordinator::pauseAll() {
    for (const auto& t : queue_->activeTasks()) {
        auto job = unmapTask(t.id);
        if (!job)
            continue;
        if (auto token = backend_->cancel(*job))
            stashResumeToken(t.id, *token);
    }
    auto paused = queue_->pauseAll();
    spdlog::info("TransferCoordinator: paused {} task(s)", paused.size());
    return paused.size();
}

std::size_t TransferCoordinator::resumeAll() {
    std::size_t n = 0;
    for (const auto& t : queue_->tasksWithStatus(TaskStatus::Paused)) {
        if (queue_->requeue(t.id))
            ++n;
    }
    queue_->resumeAll();
    return n;
}

bool TransferCoordinator::cancelTask(const std::string& id) {
    auto task = queue_->task(id);
    if (!task)
        return false;
    if (auto job = unmapTask(id)) {
        if (backend_->cancel(*job))
            spdlog::debug("TransferCoordinator: dropping resume token of cancelled {}", id);
    }
    discardResumeToken(id);
    if (placement_->removeCompleted(*task))
        spdlog::debug("TransferCoordinator: removed payload of cancelled {}", id);
    return true;
}

void TransferCoordinator::cancelAll() {
    backend_->cancelAll();
    {
        std::lock_guard lk(jobsMutex_);
        jobToTask_.clear();
        taskToJob_.clear();
    }
    for (const auto& t : queue_->allTasks())
        placement_->removeCompleted(t);
    queue_->clear();
}

bool TransferCoordinator::retryTask(const std::string& id) {
    auto task = queue_->task(id);
    if (!task || task->status != TaskStatus::Failed)
        return false;
    // The queue drops the stale token along with the counters.
    return queue_->retryTask(id);
}

RelaunchReport TransferCoordinator::restoreAfterRelaunch() {
    RelaunchReport report;
    const auto jobs = backend_->pendingJobs();
    auto tasks = queue_->allTasks();

    std::unordered_set<std::string> claimed;
    for (const auto& job : jobs) {
        const Task* match = nullptr;
        for (const auto& t : tasks) {
            if (t.url == job.url && t.status == TaskStatus::Downloading &&
                !claimed.contains(t.id)) {
                match = &t;
                break;
            }
        }
        if (match) {
            claimed.insert(match->id);
            mapJob(job.handle, match->id);
            ++report.jobsReattached;
        } else {
            if (backend_->cancel(job.handle))
                spdlog::debug("TransferCoordinator: dropped token of orphaned job {}", job.handle);
            ++report.jobsCancelled;
        }
    }

    // Interrupted transfers with no surviving job go back to the admission line.
    for (const auto& t : tasks) {
        if (t.status != TaskStatus::Downloading || claimed.contains(t.id))
            continue;
        if (queue_->updateTask(t.id, [](Task& task) { task.status = TaskStatus::Pending; }))
            ++report.tasksRequeued;
    }

    std::unordered_set<std::string> validIds;
    for (const auto& t : tasks)
        validIds.insert(t.id);
    report.orphanedPayloadsRemoved = placement_->cleanupOrphanedCompleted(validIds);
    if (jobs.empty())
        placement_->cleanupTemp();

    spdlog::info("TransferCoordinator: relaunch reattached {} job(s), cancelled {}, requeued {} "
                 "task(s), removed {} orphaned payload(s)",
                 report.jobsReattached, report.jobsCancelled, report.tasksRequeued,
                 report.orphanedPayloadsRemoved);
    return report;
}

// ---------- backend callbacks ----------

void TransferCoordinator::handleProgress(const std::string& id, std::int64_t written,
                                         std::int64_t expected) {
    const auto bytes = written > 0 ? static_cast<std::uint64_t>(written) : 0;
    const auto total = expected > 0 ? static_cast<std::uint64_t>(expected) : 0;
    if (!queue_->updateProgress(id, bytes, total))
        return;
    if (auto l = listener())
        l->onTransferProgress(id, bytes, total);
}

void TransferCoordinator::handleComplete(const std::string& id, const fs::path& location) {
    unmapTask(id);
    auto task = queue_->task(id);
    if (!task || task->status != TaskStatus::Downloading) {
        spdlog::debug("TransferCoordinator: ignoring completion for {}", id);
        remove_quietly(location);
        return;
    }

    std::error_code ec;
    const auto size = fs::file_size(location, ec);
    if (!ec && size < config_.minPayloadBytes) {
        spdlog::warn("TransferCoordinator: payload for {} is only {} bytes, treating as an error "
                     "response",
                     id, size);
        remove_quietly(location);
        handleFailed(id, TransferError::serverError(404), std::nullopt);
        return;
    }

    auto placed = placement_->moveCompleted(location, *task);
    if (!placed.ok()) {
        spdlog::warn("TransferCoordinator: {}", placed.error().message);
        handleFailed(id, TransferError::fileMoveFailed(placed.error().message), std::nullopt);
        return;
    }

    if (task->resumeTokenPath || queue_->hasResumeToken(id))
        discardResumeToken(id);

    // Archive extraction happens elsewhere; the payload is ready as soon as it is placed.
    queue_->markExtracting(id);
    queue_->markCompleted(id);
    spdlog::debug("TransferCoordinator: {} completed at {}", id, placed.value().string());

    if (auto l = listener())
        l->onTransferCompleted(id);
}

void TransferCoordinator::handleFailed(const std::string& id, const TransferError& error,
                                       std::optional<ResumeToken> token) {
    unmapTask(id);
    auto task = queue_->task(id);
    if (!task || isTerminal(task->status)) {
        spdlog::debug("TransferCoordinator: ignoring failure for {}", id);
        return;
    }
    if (token)
        stashResumeToken(id, *token);

    if (auto l = listener(); l && l->onTransferFailed(id, error))
        return;

    spdlog::info("TransferCoordinator: {} failed: {}", id, error.message());
    queue_->markFailed(id, error.message());
}

void TransferCoordinator::handlePaused(const std::string& id, std::optional<ResumeToken> token) {
    unmapTask(id);
    if (!queue_->contains(id))
        return;
    if (token)
        stashResumeToken(id, *token);
    queue_->markPaused(id);
}

void TransferCoordinator::handleResumedAtOffset(const std::string& id, std::int64_t offset,
                                                std::int64_t expected) {
    spdlog::debug("TransferCoordinator: {} resumed at offset {}", id, offset);
    handleProgress(id, offset, expected);
}

} // namespace ferry::downloader
