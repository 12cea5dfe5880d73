/*
 * ferry/src/downloader/task_queue.cpp
 *
 * Locking discipline:
 * - mutex_ guards tasks_, order_, paused_, maxConcurrent_, lastActiveCount_
 * - mutations collect Events while holding mutex_, then release it and
 *   dispatch (observers, history log) and persist (state store)
 * - nothing outside this file is ever called while mutex_ is held, except the
 *   Task value methods
 */

#include <ferry/downloader/history_log.hpp>
#include <ferry/downloader/state_store.hpp>
#include <ferry/downloader/task_queue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace ferry::downloader {

struct TaskQueue::Event {
    enum class Kind {
        Enqueued,
        Removed,
        Cleared,
        Updated,
        ActiveCountChanged,
        Completed,
        Failed,
        PauseStateChanged,
        QueueCompleted
    };

    Kind kind;
    Task task{};
    std::string id{};
    std::size_t count{0};
    bool flag{false};
};

TaskQueue::TaskQueue(std::shared_ptr<ResumeTokenStore> tokens, std::shared_ptr<StateStore> state,
                     std::shared_ptr<HistoryLog> history, int maxConcurrent)
    : tokens_(std::move(tokens)), state_(std::move(state)), history_(std::move(history)),
      maxConcurrent_(maxConcurrent > 0 ? maxConcurrent : kDefaultMaxConcurrent) {}

// ---------- observers ----------

void TaskQueue::addObserver(std::weak_ptr<IQueueObserver> observer) {
    std::lock_guard lk(observersMutex_);
    observers_.push_back(std::move(observer));
}

void TaskQueue::removeObserver(const std::shared_ptr<IQueueObserver>& observer) {
    std::lock_guard lk(observersMutex_);
    std::erase_if(observers_, [&](const std::weak_ptr<IQueueObserver>& w) {
        auto s = w.lock();
        return !s || s == observer;
    });
}

void TaskQueue::dispatch(const Events& events) {
    if (events.empty())
        return;

    if (history_) {
        for (const auto& e : events) {
            if (e.kind == Event::Kind::Completed)
                history_->recordSuccess(e.task);
            else if (e.kind == Event::Kind::Failed)
                history_->recordFailure(e.task, e.task.errorMessage.value_or("Unknown error"));
        }
    }

    std::vector<std::shared_ptr<IQueueObserver>> targets;
    {
        std::lock_guard lk(observersMutex_);
        std::erase_if(observers_, [](const std::weak_ptr<IQueueObserver>& w) { return w.expired(); });
        for (const auto& w : observers_) {
            if (auto s = w.lock())
                targets.push_back(std::move(s));
        }
    }

    for (const auto& e : events) {
        for (const auto& o : targets) {
            switch (e.kind) {
                case Event::Kind::Enqueued:
                    o->onTaskEnqueued(e.task);
                    break;
                case Event::Kind::Removed:
                    o->onTaskRemoved(e.id);
                    break;
                case Event::Kind::Cleared:
                    o->onQueueCleared();
                    break;
                case Event::Kind::Updated:
                    o->onTaskUpdated(e.task);
                    break;
                case Event::Kind::ActiveCountChanged:
                    o->onActiveCountChanged(e.count);
                    break;
                case Event::Kind::Completed:
                    o->onTaskCompleted(e.task);
                    break;
                case Event::Kind::Failed:
                    o->onTaskFailed(e.task);
                    break;
                case Event::Kind::PauseStateChanged:
                    o->onPauseStateChanged(e.flag);
                    break;
                case Event::Kind::QueueCompleted:
                    o->onQueueCompleted();
                    break;
            }
        }
    }
}

void TaskQueue::persist() {
    if (!state_)
        return;
    std::lock_guard pl(persistMutex_);
    state_->scheduleSave(exportState());
}

// ---------- locked helpers ----------

std::size_t TaskQueue::activeCountLocked() const {
    return static_cast<std::size_t>(std::count_if(
        tasks_.begin(), tasks_.end(), [](const auto& kv) { return isActive(kv.second.status); }));
}

bool TaskQueue::allCompletedLocked() const {
    return !tasks_.empty() && std::all_of(tasks_.begin(), tasks_.end(), [](const auto& kv) {
        return kv.second.status == TaskStatus::Completed;
    });
}

Task* TaskQueue::findLocked(const std::string& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

bool TaskQueue::transitionLocked(const std::string& id, const std::function<bool(Task&)>& step,
                                 Events& events) {
    Task* t = findLocked(id);
    if (!t)
        return false;
    const auto before = t->status;
    if (!step(*t))
        return false;

    events.push_back({Event::Kind::Updated, *t});

    const auto active = activeCountLocked();
    if (active != lastActiveCount_) {
        lastActiveCount_ = active;
        events.push_back({Event::Kind::ActiveCountChanged, {}, {}, active});
    }
    if (before != t->status) {
        spdlog::debug("TaskQueue: {} {} -> {}", id, statusName(before), statusName(t->status));
        if (t->status == TaskStatus::Completed) {
            events.push_back({Event::Kind::Completed, *t});
            if (allCompletedLocked())
                events.push_back({Event::Kind::QueueCompleted});
        } else if (t->status == TaskStatus::Failed) {
            events.push_back({Event::Kind::Failed, *t});
        }
    }
    return true;
}

QueueSnapshot TaskQueue::snapshotLocked() const {
    QueueSnapshot s;
    s.tasks.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = tasks_.find(id);
        if (it != tasks_.end())
            s.tasks.push_back(it->second);
    }
    s.order = order_;
    s.paused = paused_;
    s.maxConcurrent = maxConcurrent_;
    s.exportedAt = currentTime();
    s.version = QueueSnapshot::kCurrentVersion;
    return s;
}

// ---------- collection ----------

bool TaskQueue::enqueue(Task task) {
    std::vector<Task> one;
    one.push_back(std::move(task));
    return enqueueAll(std::move(one)) == 1;
}

std::size_t TaskQueue::enqueueAll(std::vector<Task> tasks) {
    Events events;
    std::size_t added = 0;
    {
        std::lock_guard lk(mutex_);
        for (auto& t : tasks) {
            if (t.id.empty() || tasks_.contains(t.id)) {
                spdlog::debug("TaskQueue: skipping duplicate or unnamed task '{}'", t.id);
                continue;
            }
            if (t.totalBytes > 0 && t.bytesDownloaded > t.totalBytes)
                t.bytesDownloaded = t.totalBytes;
            order_.push_back(t.id);
            events.push_back({Event::Kind::Enqueued, t});
            tasks_.emplace(t.id, std::move(t));
            ++added;
        }
        const auto active = activeCountLocked();
        if (active != lastActiveCount_) {
            lastActiveCount_ = active;
            events.push_back({Event::Kind::ActiveCountChanged, {}, {}, active});
        }
    }
    if (added == 0)
        return 0;
    spdlog::debug("TaskQueue: enqueued {} task(s)", added);
    dispatch(events);
    persist();
    return added;
}

bool TaskQueue::remove(const std::string& id) {
    Events events;
    {
        std::lock_guard lk(mutex_);
        if (tasks_.erase(id) == 0)
            return false;
        std::erase(order_, id);
        events.push_back({Event::Kind::Removed, {}, id});
        const auto active = activeCountLocked();
        if (active != lastActiveCount_) {
            lastActiveCount_ = active;
            events.push_back({Event::Kind::ActiveCountChanged, {}, {}, active});
        }
    }
    tokens_->remove(id);
    spdlog::debug("TaskQueue: removed {}", id);
    dispatch(events);
    persist();
    return true;
}

void TaskQueue::clear() {
    Events events;
    std::vector<std::string> ids;
    {
        std::lock_guard lk(mutex_);
        ids = order_;
        tasks_.clear();
        order_.clear();
        events.push_back({Event::Kind::Cleared});
        if (lastActiveCount_ != 0) {
            lastActiveCount_ = 0;
            events.push_back({Event::Kind::ActiveCountChanged, {}, {}, 0});
        }
    }
    tokens_->removeMany(ids);
    spdlog::info("TaskQueue: cleared {} task(s)", ids.size());
    dispatch(events);
    persist();
}

bool TaskQueue::reorder(const std::string& id, std::size_t index) {
    {
        std::lock_guard lk(mutex_);
        auto it = std::find(order_.begin(), order_.end(), id);
        if (it == order_.end())
            return false;
        order_.erase(it);
        index = std::min(index, order_.size());
        order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(index), id);
    }
    persist();
    return true;
}

bool TaskQueue::prioritize(const std::string& id) {
    {
        std::lock_guard lk(mutex_);
        const Task* t = findLocked(id);
        if (!t || (t->status != TaskStatus::Pending && t->status != TaskStatus::Queued))
            return false;
        std::erase(order_, id);
        auto first = std::find_if(order_.begin(), order_.end(), [this](const std::string& other) {
            const auto s = tasks_.at(other).status;
            return s == TaskStatus::Pending || s == TaskStatus::Queued;
        });
        order_.insert(first, id);
    }
    spdlog::debug("TaskQueue: prioritized {}", id);
    persist();
    return true;
}

// ---------- admission ----------

std::optional<Task> TaskQueue::nextPendingTask() const {
    std::lock_guard lk(mutex_);
    if (paused_)
        return std::nullopt;
    if (activeCountLocked() >= static_cast<std::size_t>(maxConcurrent_))
        return std::nullopt;
    for (const auto& id : order_) {
        const auto& t = tasks_.at(id);
        if (t.status == TaskStatus::Pending)
            return t;
    }
    return std::nullopt;
}

std::size_t TaskQueue::activeCount() const {
    std::lock_guard lk(mutex_);
    return activeCountLocked();
}

// ---------- mutation ----------

bool TaskQueue::updateTask(const std::string& id, const std::function<void(Task&)>& transform) {
    return apply(id, [&](Task& t) {
        const auto keepId = t.id;
        transform(t);
        t.id = keepId;
        if (t.totalBytes > 0) {
            t.bytesDownloaded = std::min(t.bytesDownloaded, t.totalBytes);
            t.progress = std::clamp(
                static_cast<double>(t.bytesDownloaded) / static_cast<double>(t.totalBytes), 0.0,
                1.0);
        }
        return true;
    });
}

bool TaskQueue::updateProgress(const std::string& id, std::uint64_t bytes, std::uint64_t total) {
    return apply(id, [&](Task& t) {
        // Late callbacks for a finished or paused transfer are dropped.
        if (t.status != TaskStatus::Downloading)
            return false;
        t.updateProgress(bytes, total);
        return true;
    });
}

bool TaskQueue::setResumeTokenPath(const std::string& id, std::optional<std::string> path) {
    return updateTask(id, [&](Task& t) { t.resumeTokenPath = path; });
}

bool TaskQueue::apply(const std::string& id, const std::function<bool(Task&)>& step) {
    Events events;
    bool changed = false;
    {
        std::lock_guard lk(mutex_);
        changed = transitionLocked(id, step, events);
    }
    if (changed) {
        dispatch(events);
        persist();
    }
    return changed;
}

bool TaskQueue::markQueued(const std::string& id) {
    return apply(id, [](Task& t) { return t.queue(); });
}

bool TaskQueue::markDownloading(const std::string& id) {
    Events events;
    bool changed = false;
    {
        std::lock_guard lk(mutex_);
        const Task* t = findLocked(id);
        if (!t)
            return false;
        if (!isActive(t->status) &&
            activeCountLocked() >= static_cast<std::size_t>(maxConcurrent_)) {
            spdlog::debug("TaskQueue: {} not started, concurrency limit {} reached", id,
                          maxConcurrent_);
            return false;
        }
        changed = transitionLocked(id, [](Task& task) { return task.start(); }, events);
    }
    if (changed) {
        dispatch(events);
        persist();
    }
    return changed;
}

bool TaskQueue::markPaused(const std::string& id) {
    return apply(id, [](Task& t) { return t.pause(); });
}

bool TaskQueue::markExtracting(const std::string& id) {
    return apply(id, [](Task& t) { return t.startExtracting(); });
}

bool TaskQueue::markCompleted(const std::string& id) {
    return apply(id, [](Task& t) { return t.complete(); });
}

bool TaskQueue::markFailed(const std::string& id, std::string message) {
    return apply(id, [&](Task& t) { return t.fail(std::move(message)); });
}

bool TaskQueue::requeue(const std::string& id) {
    return apply(id, [](Task& t) { return t.requeue(); });
}

bool TaskQueue::retryTask(const std::string& id) {
    if (!apply(id, [](Task& t) { return canRetry(t.status) && t.reset(); }))
        return false;
    tokens_->remove(id);
    return true;
}

bool TaskQueue::resetTask(const std::string& id) {
    if (!apply(id, [](Task& t) { return t.reset(); }))
        return false;
    tokens_->remove(id);
    return true;
}

// ---------- global controls ----------

void TaskQueue::setPaused(bool paused) {
    Events events;
    {
        std::lock_guard lk(mutex_);
        if (paused_ == paused)
            return;
        paused_ = paused;
        events.push_back({Event::Kind::PauseStateChanged, {}, {}, 0, paused});
    }
    spdlog::info("TaskQueue: {}", paused ? "paused" : "resumed");
    dispatch(events);
    persist();
}

bool TaskQueue::isPaused() const {
    std::lock_guard lk(mutex_);
    return paused_;
}

std::vector<std::string> TaskQueue::pauseAll() {
    Events events;
    std::vector<std::string> pausedIds;
    {
        std::lock_guard lk(mutex_);
        for (const auto& id : order_) {
            if (transitionLocked(id, [](Task& t) { return t.pause(); }, events))
                pausedIds.push_back(id);
        }
        if (!paused_) {
            paused_ = true;
            events.push_back({Event::Kind::PauseStateChanged, {}, {}, 0, true});
        }
    }
    dispatch(events);
    persist();
    return pausedIds;
}

void TaskQueue::resumeAll() {
    setPaused(false);
}

std::size_t TaskQueue::retryFailed() {
    Events events;
    std::vector<std::string> reset;
    {
        std::lock_guard lk(mutex_);
        for (const auto& id : order_) {
            if (transitionLocked(
                    id, [](Task& t) { return canRetry(t.status) && t.reset(); }, events))
                reset.push_back(id);
        }
    }
    const auto n = reset.size();
    if (n > 0) {
        tokens_->removeMany(reset);
        spdlog::info("TaskQueue: {} failed task(s) reset for retry", n);
        dispatch(events);
        persist();
    }
    return n;
}

void TaskQueue::setMaxConcurrent(int maxConcurrent) {
    if (maxConcurrent <= 0)
        return;
    {
        std::lock_guard lk(mutex_);
        if (maxConcurrent_ == maxConcurrent)
            return;
        maxConcurrent_ = maxConcurrent;
    }
    persist();
}

int TaskQueue::maxConcurrent() const {
    std::lock_guard lk(mutex_);
    return maxConcurrent_;
}

// ---------- queries ----------

std::optional<Task> TaskQueue::task(const std::string& id) const {
    std::lock_guard lk(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second;
}

bool TaskQueue::contains(const std::string& id) const {
    std::lock_guard lk(mutex_);
    return tasks_.contains(id);
}

std::vector<Task> TaskQueue::allTasks() const {
    std::lock_guard lk(mutex_);
    std::vector<Task> out;
    out.reserve(order_.size());
    for (const auto& id : order_)
        out.push_back(tasks_.at(id));
    return out;
}

std::vector<std::string> TaskQueue::order() const {
    std::lock_guard lk(mutex_);
    return order_;
}

std::vector<Task> TaskQueue::tasksWithStatus(TaskStatus status) const {
    std::lock_guard lk(mutex_);
    std::vector<Task> out;
    for (const auto& id : order_) {
        const auto& t = tasks_.at(id);
        if (t.status == status)
            out.push_back(t);
    }
    return out;
}

std::vector<Task> TaskQueue::tasksForCategory(const std::string& category) const {
    std::lock_guard lk(mutex_);
    std::vector<Task> out;
    for (const auto& id : order_) {
        const auto& t = tasks_.at(id);
        if (t.category == category)
            out.push_back(t);
    }
    return out;
}

std::vector<Task> TaskQueue::activeTasks() const {
    std::lock_guard lk(mutex_);
    std::vector<Task> out;
    for (const auto& id : order_) {
        const auto& t = tasks_.at(id);
        if (isActive(t.status))
            out.push_back(t);
    }
    return out;
}

std::vector<Task> TaskQueue::completedTasks() const {
    return tasksWithStatus(TaskStatus::Completed);
}

std::vector<Task> TaskQueue::failedTasks() const {
    return tasksWithStatus(TaskStatus::Failed);
}

namespace {

void tally(StatusCounts& c, TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending:
            ++c.pending;
            break;
        case TaskStatus::Queued:
            ++c.queued;
            break;
        case TaskStatus::Downloading:
            ++c.downloading;
            break;
        case TaskStatus::Paused:
            ++c.paused;
            break;
        case TaskStatus::Extracting:
            ++c.extracting;
            break;
        case TaskStatus::Completed:
            ++c.completed;
            break;
        case TaskStatus::Failed:
            ++c.failed;
            break;
    }
}

TaskStatus group_status(const StatusCounts& c) {
    const auto total = c.total();
    if (total > 0 && c.completed == total)
        return TaskStatus::Completed;
    if (c.extracting > 0)
        return TaskStatus::Extracting;
    if (c.downloading > 0)
        return TaskStatus::Downloading;
    if (c.queued > 0)
        return TaskStatus::Queued;
    if (c.failed > 0)
        return TaskStatus::Failed;
    if (c.paused > 0)
        return TaskStatus::Paused;
    return TaskStatus::Pending;
}

} // namespace

StatusCounts TaskQueue::counts() const {
    std::lock_guard lk(mutex_);
    StatusCounts c;
    for (const auto& [id, t] : tasks_)
        tally(c, t.status);
    return c;
}

std::size_t TaskQueue::size() const {
    std::lock_guard lk(mutex_);
    return tasks_.size();
}

bool TaskQueue::allCompleted() const {
    std::lock_guard lk(mutex_);
    return allCompletedLocked();
}

double TaskQueue::overallProgress() const {
    std::lock_guard lk(mutex_);
    if (tasks_.empty())
        return 0.0;
    double sum = 0.0;
    for (const auto& [id, t] : tasks_)
        sum += t.progress;
    return sum / static_cast<double>(tasks_.size());
}

std::uint64_t TaskQueue::totalBytes() const {
    std::lock_guard lk(mutex_);
    std::uint64_t sum = 0;
    for (const auto& [id, t] : tasks_)
        sum += t.totalBytes;
    return sum;
}

std::uint64_t TaskQueue::downloadedBytes() const {
    std::lock_guard lk(mutex_);
    std::uint64_t sum = 0;
    for (const auto& [id, t] : tasks_)
        sum += t.bytesDownloaded;
    return sum;
}

std::map<std::string, double> TaskQueue::categoryProgress() const {
    std::map<std::string, double> out;
    for (const auto& g : groupsByCategory())
        out[g.category] = g.progress;
    return out;
}

std::vector<TaskGroup> TaskQueue::groupsByCategory() const {
    std::map<std::string, TaskGroup> groups;
    {
        std::lock_guard lk(mutex_);
        for (const auto& id : order_) {
            const auto& t = tasks_.at(id);
            auto& g = groups[t.category];
            g.category = t.category;
            g.tasks.push_back(t);
        }
    }
    std::vector<TaskGroup> out;
    out.reserve(groups.size());
    for (auto& [category, g] : groups) {
        std::sort(g.tasks.begin(), g.tasks.end(),
                  [](const Task& a, const Task& b) { return a.partIndex < b.partIndex; });
        double progressSum = 0.0;
        for (const auto& t : g.tasks) {
            tally(g.counts, t.status);
            g.totalBytes += t.totalBytes;
            g.downloadedBytes += t.bytesDownloaded;
            progressSum += t.progress;
        }
        g.progress = g.tasks.empty() ? 0.0 : progressSum / static_cast<double>(g.tasks.size());
        g.overallStatus = group_status(g.counts);
        out.push_back(std::move(g));
    }
    return out;
}

// ---------- persistence ----------

QueueSnapshot TaskQueue::exportState() const {
    std::lock_guard lk(mutex_);
    return snapshotLocked();
}

Expected<void> TaskQueue::importState(const QueueSnapshot& snapshot) {
    auto problems = snapshot.validate();
    if (!problems.empty()) {
        std::string joined;
        for (const auto& p : problems) {
            if (!joined.empty())
                joined += "; ";
            joined += p;
        }
        return Error{ErrorCode::InvalidState, "Invalid queue snapshot: " + joined};
    }

    Events events;
    {
        std::lock_guard lk(mutex_);
        tasks_.clear();
        for (const auto& t : snapshot.tasks)
            tasks_.emplace(t.id, t);
        order_ = snapshot.order;
        if (paused_ != snapshot.paused) {
            paused_ = snapshot.paused;
            events.push_back({Event::Kind::PauseStateChanged, {}, {}, 0, paused_});
        }
        if (snapshot.maxConcurrent > 0)
            maxConcurrent_ = snapshot.maxConcurrent;
        const auto active = activeCountLocked();
        if (active != lastActiveCount_) {
            lastActiveCount_ = active;
            events.push_back({Event::Kind::ActiveCountChanged, {}, {}, active});
        }
    }
    spdlog::info("TaskQueue: imported {} task(s)", snapshot.tasks.size());
    dispatch(events);
    persist();
    return Expected<void>{};
}

RestoreReport TaskQueue::restoreState() {
    RestoreReport report;
    if (!state_)
        return report;

    auto snapshot = state_->loadValidated();
    if (!snapshot) {
        spdlog::info("TaskQueue: no prior state to restore");
        return report;
    }
    auto imported = importState(*snapshot);
    if (!imported.ok()) {
        spdlog::warn("TaskQueue: restore failed: {}", imported.error().message);
        return report;
    }

    // Reconcile paused/downloading tasks with the tokens actually on disk.
    std::vector<std::string> candidates;
    std::unordered_set<std::string> withToken;
    {
        std::lock_guard lk(mutex_);
        for (const auto& id : order_) {
            const auto s = tasks_.at(id).status;
            if (s == TaskStatus::Paused || s == TaskStatus::Downloading)
                candidates.push_back(id);
        }
    }
    for (const auto& id : candidates) {
        if (tokens_->exists(id))
            withToken.insert(id);
    }

    Events events;
    std::unordered_set<std::string> validIds;
    {
        std::lock_guard lk(mutex_);
        for (const auto& id : candidates) {
            const bool hasToken = withToken.contains(id);
            const auto tokenPath = tokens_->pathFor(id).string();
            transitionLocked(
                id,
                [&](Task& t) {
                    if (hasToken) {
                        if (t.resumeTokenPath == tokenPath)
                            return false;
                        t.resumeTokenPath = tokenPath;
                        return true;
                    }
                    const bool orphanedPause =
                        t.status == TaskStatus::Paused && t.resumeTokenPath.has_value();
                    if (t.status != TaskStatus::Downloading && !orphanedPause)
                        return false;
                    t.status = TaskStatus::Pending;
                    t.progress = 0.0;
                    t.bytesDownloaded = 0;
                    t.resumeTokenPath.reset();
                    ++report.demotedToPending;
                    return true;
                },
                events);
        }
        for (const auto& [id, t] : tasks_)
            validIds.insert(id);
        report.taskCount = tasks_.size();
    }

    report.orphanedTokensRemoved = tokens_->cleanupOrphaned(validIds);
    report.restored = true;
    spdlog::info("TaskQueue: restored {} task(s), {} demoted to pending, {} orphaned token(s) "
                 "removed",
                 report.taskCount, report.demotedToPending, report.orphanedTokensRemoved);
    dispatch(events);
    persist();
    return report;
}

Expected<void> TaskQueue::flush() {
    if (!state_)
        return Expected<void>{};
    std::lock_guard pl(persistMutex_);
    return state_->flush();
}

// ---------- resume tokens ----------

Expected<std::filesystem::path> TaskQueue::saveResumeToken(const std::string& id,
                                                           const ResumeToken& token) {
    auto saved = tokens_->save(id, token);
    if (!saved.ok())
        return saved;
    setResumeTokenPath(id, saved.value().string());
    return saved;
}

Expected<ResumeToken> TaskQueue::loadResumeToken(const std::string& id) {
    return tokens_->loadValidated(id);
}

bool TaskQueue::deleteResumeToken(const std::string& id) {
    const bool removed = tokens_->remove(id);
    setResumeTokenPath(id, std::nullopt);
    return removed;
}

bool TaskQueue::hasResumeToken(const std::string& id) const {
    return tokens_->exists(id);
}

} // namespace ferry::downloader
