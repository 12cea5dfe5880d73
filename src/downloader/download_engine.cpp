/*
 * ferry/src/downloader/download_engine.cpp
 *
 * Retry model: a retryable failure keeps the task in downloading (its slot
 * stays taken) and schedules a relaunch after retryDelay on the worker thread.
 * Once the budget is spent the task fails with MaxRetriesExceeded.
 */

#include <ferry/downloader/download_engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ferry::downloader {

// Forwards queue and transfer notifications to the engine. detach() waits for
// callbacks already running, so none can reach a destroyed engine.
class DownloadEngine::Relay final : public IQueueObserver, public ITransferListener {
public:
    explicit Relay(DownloadEngine* engine) : engine_(engine) {}

    void detach() {
        std::unique_lock lk(mutex_);
        engine_ = nullptr;
        cv_.wait(lk, [this] { return inFlight_ == 0; });
    }

    void onTaskUpdated(const Task& task) override {
        with([&](DownloadEngine& e) { e.handleTaskUpdated(task); });
    }
    void onTaskCompleted(const Task& task) override {
        with([&](DownloadEngine& e) { e.handleTaskCompleted(task); });
    }
    void onTaskFailed(const Task& task) override {
        with([&](DownloadEngine& e) { e.handleTaskFailed(task); });
    }
    void onQueueCompleted() override {
        with([](DownloadEngine& e) { e.handleQueueCompleted(); });
    }

    void onTransferStarted(const std::string& id, bool /*resumed*/) override {
        with([&](DownloadEngine& e) { e.handleTransferStarted(id); });
    }
    void onTransferProgress(const std::string& id, std::uint64_t written,
                            std::uint64_t total) override {
        with([&](DownloadEngine& e) { e.handleTransferProgress(id, written, total); });
    }
    void onTransferCompleted(const std::string& id) override {
        with([&](DownloadEngine& e) { e.handleTransferCompleted(id); });
    }
    bool onTransferFailed(const std::string& id, const TransferError& error) override {
        bool handled = false;
        with([&](DownloadEngine& e) { handled = e.handleTransferFailed(id, error); });
        return handled;
    }

private:
    template <typename F> void with(F&& fn) {
        DownloadEngine* engine = nullptr;
        {
            std::lock_guard lk(mutex_);
            if (!engine_)
                return;
            engine = engine_;
            ++inFlight_;
        }
        struct Release {
            Relay* self;
            ~Release() {
                std::lock_guard lk(self->mutex_);
                if (--self->inFlight_ == 0)
                    self->cv_.notify_all();
            }
        } release{this};
        fn(*engine);
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    DownloadEngine* engine_;
    std::size_t inFlight_{0};
};

DownloadEngine::DownloadEngine(std::shared_ptr<TaskQueue> queue,
                               std::shared_ptr<TransferCoordinator> coordinator,
                               std::shared_ptr<NetworkSignal> network, EngineConfig config)
    : queue_(std::move(queue)), coordinator_(std::move(coordinator)), network_(std::move(network)),
      config_(config), relay_(std::make_shared<Relay>(this)) {
    if (!network_)
        network_ = std::make_shared<NetworkSignal>();
    if (config_.maxConcurrent > 0)
        queue_->setMaxConcurrent(config_.maxConcurrent);
    networkAvailable_ = admits(network_->status());

    queue_->addObserver(relay_);
    coordinator_->setListener(relay_);
    subscription_ =
        network_->subscribe([this](const NetworkStatus& status) { onNetworkChanged(status); });
}

DownloadEngine::~DownloadEngine() {
    network_->unsubscribe(subscription_);
    stop();
    relay_->detach();
}

void DownloadEngine::setDelegate(std::shared_ptr<IDownloadEngineDelegate> delegate) {
    std::lock_guard lk(hooksMutex_);
    delegate_ = std::move(delegate);
}

void DownloadEngine::setProgressTracker(std::shared_ptr<ProgressTracker> tracker) {
    std::lock_guard lk(hooksMutex_);
    tracker_ = std::move(tracker);
}

std::shared_ptr<IDownloadEngineDelegate> DownloadEngine::delegate() const {
    std::lock_guard lk(hooksMutex_);
    return delegate_;
}

std::shared_ptr<ProgressTracker> DownloadEngine::tracker() const {
    std::lock_guard lk(hooksMutex_);
    return tracker_;
}

// ---------- lifecycle ----------

void DownloadEngine::start() {
    if (running_.exchange(true))
        return;
    paused_ = queue_->isPaused();
    spdlog::info("DownloadEngine: started (max {} concurrent, {} retries, {}ms backoff){}",
                 queue_->maxConcurrent(), config_.maxRetries, config_.retryDelay.count(),
                 paused_.load() ? ", paused" : "");
    if (auto d = delegate())
        d->onRunningStateChanged(true);

    runDueRetries();
    processQueue();
    worker_ = std::thread([this] { workerLoop(); });
}

void DownloadEngine::stop() {
    if (!running_.exchange(false))
        return;
    {
        std::lock_guard lk(mutex_);
        wakeRequested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    spdlog::info("DownloadEngine: stopped");
    if (auto d = delegate())
        d->onRunningStateChanged(false);
}

void DownloadEngine::pause() {
    if (!running_.load() || paused_.exchange(true))
        return;
    coordinator_->pauseAll();
    spdlog::info("DownloadEngine: paused");
    if (auto d = delegate())
        d->onPausedStateChanged(true);
}

void DownloadEngine::resume() {
    if (!running_.load() || !paused_.exchange(false))
        return;
    const auto requeued = coordinator_->resumeAll();
    spdlog::info("DownloadEngine: resumed, {} task(s) requeued", requeued);
    processQueue();
    if (auto d = delegate())
        d->onPausedStateChanged(false);
}

// ---------- worker ----------

void DownloadEngine::wake() {
    {
        std::lock_guard lk(mutex_);
        wakeRequested_ = true;
    }
    cv_.notify_all();
}

void DownloadEngine::workerLoop() {
    std::unique_lock lk(mutex_);
    while (running_.load()) {
        auto deadline = std::chrono::steady_clock::now() + config_.pollInterval;
        for (const auto& r : retries_)
            deadline = std::min(deadline, r.due);
        cv_.wait_until(lk, deadline, [this] { return wakeRequested_ || !running_.load(); });
        if (!running_.load())
            break;
        wakeRequested_ = false;
        lk.unlock();
        runDueRetries();
        processQueue();
        lk.lock();
    }
}

void DownloadEngine::runDueRetries() {
    std::vector<std::string> due;
    {
        std::lock_guard lk(mutex_);
        const auto now = std::chrono::steady_clock::now();
        auto split = std::stable_partition(retries_.begin(), retries_.end(),
                                           [&](const ScheduledRetry& r) { return r.due > now; });
        for (auto it = split; it != retries_.end(); ++it)
            due.push_back(std::move(it->taskId));
        retries_.erase(split, retries_.end());
    }
    for (const auto& id : due) {
        if (!coordinator_->restartTask(id))
            spdlog::debug("DownloadEngine: retry of {} dropped, task no longer waiting", id);
    }
}

void DownloadEngine::dropScheduledRetry(const std::string& id) {
    std::lock_guard lk(mutex_);
    std::erase_if(retries_, [&](const ScheduledRetry& r) { return r.taskId == id; });
}

void DownloadEngine::processQueue() {
    std::lock_guard sweep(sweepMutex_);
    if (!running_.load() || paused_.load() || !networkAvailable_.load())
        return;

    while (auto next = queue_->nextPendingTask()) {
        if (auto err = coordinator_->checkStorage(*next)) {
            // Fails before any network attempt and without touching the retry budget.
            spdlog::warn("DownloadEngine: {}: {}", next->id, err->message());
            queue_->markFailed(next->id, err->message());
            continue;
        }
        if (!coordinator_->startTask(next->id)) {
            auto now = queue_->task(next->id);
            if (now && now->status == TaskStatus::Pending)
                break;
        }
    }
}

// ---------- per task ----------

bool DownloadEngine::pauseTask(const std::string& id) {
    dropScheduledRetry(id);
    return coordinator_->pauseTask(id);
}

bool DownloadEngine::resumeTask(const std::string& id) {
    auto task = queue_->task(id);
    if (!task || task->status != TaskStatus::Paused)
        return false;

    const bool canRunNow = running_.load() && !paused_.load() && networkAvailable_.load() &&
                           queue_->activeCount() < static_cast<std::size_t>(queue_->maxConcurrent());
    if (canRunNow && coordinator_->startTask(id))
        return true;

    // No free slot: back to pending (token kept) at the head of the line.
    auto current = queue_->task(id);
    if (current && current->status == TaskStatus::Paused) {
        queue_->requeue(id);
        queue_->prioritize(id);
    }
    wake();
    return true;
}

bool DownloadEngine::cancelTask(const std::string& id) {
    dropScheduledRetry(id);
    resetRetryCount(id);
    if (!coordinator_->cancelTask(id))
        return false;
    queue_->remove(id);
    if (auto t = tracker())
        t->remove(id);
    wake();
    return true;
}

bool DownloadEngine::retryTask(const std::string& id) {
    resetRetryCount(id);
    if (!coordinator_->retryTask(id))
        return false;
    processQueue();
    return true;
}

bool DownloadEngine::enqueue(Task task) {
    const bool added = queue_->enqueue(std::move(task));
    if (added)
        wake();
    return added;
}

std::size_t DownloadEngine::enqueueAll(std::vector<Task> tasks) {
    const auto added = queue_->enqueueAll(std::move(tasks));
    if (added > 0)
        wake();
    return added;
}

std::vector<Task> DownloadEngine::allTasks() const {
    return queue_->allTasks();
}

void DownloadEngine::clearAll() {
    {
        std::lock_guard lk(mutex_);
        retries_.clear();
        retryCounts_.clear();
    }
    coordinator_->cancelAll();
    if (auto t = tracker())
        t->reset();
}

int DownloadEngine::retryCount(const std::string& id) const {
    std::lock_guard lk(mutex_);
    auto it = retryCounts_.find(id);
    return it == retryCounts_.end() ? 0 : it->second;
}

void DownloadEngine::resetRetryCount(const std::string& id) {
    std::lock_guard lk(mutex_);
    retryCounts_.erase(id);
}

// ---------- network ----------

bool DownloadEngine::admits(const NetworkStatus& status) const noexcept {
    return status.connected && (config_.allowCellular || !status.isExpensive());
}

void DownloadEngine::onNetworkChanged(const NetworkStatus& status) {
    const bool available = admits(status);
    const bool was = networkAvailable_.exchange(available);
    if (was == available)
        return;

    if (auto d = delegate())
        d->onNetworkStateChanged(available);

    if (!available) {
        spdlog::info("DownloadEngine: network unavailable ({}), pausing transfers",
                     linkTypeName(status.link));
        for (const auto& t : queue_->tasksWithStatus(TaskStatus::Downloading)) {
            dropScheduledRetry(t.id);
            coordinator_->pauseTask(t.id);
        }
    } else if (running_.load() && !paused_.load()) {
        spdlog::info("DownloadEngine: network available ({}), resuming admission",
                     linkTypeName(status.link));
        wake();
    }
}

// ---------- relay targets ----------

void DownloadEngine::handleTaskUpdated(const Task& task) {
    if (auto d = delegate())
        d->onTaskUpdated(task);
}

void DownloadEngine::handleTaskCompleted(const Task& task) {
    if (auto d = delegate())
        d->onTaskCompleted(task);
}

void DownloadEngine::handleTaskFailed(const Task& task) {
    dropScheduledRetry(task.id);
    resetRetryCount(task.id);
    if (auto t = tracker())
        t->taskFailed(task.id);
    if (auto d = delegate())
        d->onTaskFailed(task);
    wake();
}

void DownloadEngine::handleQueueCompleted() {
    spdlog::info("DownloadEngine: all tasks finished");
    if (auto d = delegate())
        d->onAllTasksFinished();
}

void DownloadEngine::handleTransferStarted(const std::string& id) {
    auto task = queue_->task(id);
    if (!task)
        return;
    if (auto d = delegate())
        d->onTaskStarted(*task);
}

void DownloadEngine::handleTransferProgress(const std::string& id, std::uint64_t written,
                                            std::uint64_t total) {
    if (auto t = tracker())
        t->update(id, written, total);
}

void DownloadEngine::handleTransferCompleted(const std::string& id) {
    resetRetryCount(id);
    if (auto t = tracker())
        t->taskCompleted(id);
    processQueue();
}

bool DownloadEngine::handleTransferFailed(const std::string& id, const TransferError& error) {
    if (error.shouldAutoPause() && !network_->isConnected()) {
        spdlog::info("DownloadEngine: {} interrupted by {}, pausing", id, kindName(error.kind));
        queue_->markPaused(id);
        return true;
    }
    if (!error.isRetryable())
        return false;

    int attempts = 0;
    {
        std::lock_guard lk(mutex_);
        int& count = retryCounts_[id];
        if (count < config_.maxRetries) {
            ++count;
            retries_.push_back({id, std::chrono::steady_clock::now() + config_.retryDelay});
            wakeRequested_ = true;
            spdlog::info("DownloadEngine: retrying {} in {}ms (attempt {}/{}): {}", id,
                         config_.retryDelay.count(), count, config_.maxRetries, error.message());
        } else {
            attempts = count + 1;
            retryCounts_.erase(id);
        }
    }
    if (attempts == 0) {
        cv_.notify_all();
        return true;
    }

    const auto exhausted = TransferError::maxRetriesExceeded(attempts);
    spdlog::warn("DownloadEngine: {} gave up: {}", id, error.message());
    queue_->markFailed(id, exhausted.message());
    return true;
}

} // namespace ferry::downloader
