/*
 * ferry/src/downloader/task.cpp
 *
 * Task state machine, snapshot validation and history records.
 */

#include <ferry/core/uuid.h>
#include <ferry/downloader/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ferry::downloader {

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::CorruptData:
            return "CorruptData";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

const char* statusName(TaskStatus s) noexcept {
    switch (s) {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::Queued:
            return "queued";
        case TaskStatus::Downloading:
            return "downloading";
        case TaskStatus::Paused:
            return "paused";
        case TaskStatus::Extracting:
            return "extracting";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Failed:
            return "failed";
    }
    return "pending";
}

std::optional<TaskStatus> statusFromName(std::string_view name) noexcept {
    for (auto s : {TaskStatus::Pending, TaskStatus::Queued, TaskStatus::Downloading,
                   TaskStatus::Paused, TaskStatus::Extracting, TaskStatus::Completed,
                   TaskStatus::Failed}) {
        if (name == statusName(s))
            return s;
    }
    return std::nullopt;
}

std::string formatByteCount(std::uint64_t bytes) {
    constexpr double kKiB = 1024.0;
    const auto b = static_cast<double>(bytes);
    if (bytes < 1024)
        return fmt::format("{} B", bytes);
    if (b < kKiB * kKiB)
        return fmt::format("{:.1f} KB", b / kKiB);
    if (b < kKiB * kKiB * kKiB)
        return fmt::format("{:.1f} MB", b / (kKiB * kKiB));
    return fmt::format("{:.1f} GB", b / (kKiB * kKiB * kKiB));
}

// ---------- Task ----------

Task Task::fromManifest(const ManifestEntry& entry) {
    Task t;
    t.id = core::generateUUID();
    t.url = entry.url;
    t.category = entry.category;
    t.partIndex = entry.partIndex;
    t.partCount = entry.partCount;
    t.datasetName = entry.datasetName;
    t.totalBytes = entry.estimatedSize;
    t.createdAt = currentTime();
    return t;
}

std::string Task::filename() const {
    std::string_view path = url;
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    if (auto q = path.find_first_of("?#"); q != std::string_view::npos)
        path = path.substr(0, q);

    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos)
            next = path.size();
        if (next > pos)
            parts.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    if (parts.empty())
        return "download";
    // Some hosts serve the payload from ".../<name>/content"
    if (parts.back() == "content" && parts.size() > 1)
        return std::string(parts[parts.size() - 2]);
    return std::string(parts.back());
}

std::string Task::displayName() const {
    if (partCount <= 1)
        return category;
    return fmt::format("{} (Part {} of {})", category, partIndex, partCount);
}

std::uint64_t Task::remainingBytes() const noexcept {
    return totalBytes > bytesDownloaded ? totalBytes - bytesDownloaded : 0;
}

void Task::updateProgress(std::uint64_t bytes, std::uint64_t total) {
    if (total > 0)
        totalBytes = std::max(totalBytes, total);
    if (totalBytes > 0) {
        bytesDownloaded = std::min(bytes, totalBytes);
        progress = std::clamp(static_cast<double>(bytesDownloaded) /
                                  static_cast<double>(totalBytes),
                              0.0, 1.0);
    } else {
        bytesDownloaded = bytes;
        progress = 0.0;
    }
}

bool Task::start(Timestamp now) {
    if (!canStart(status) && status != TaskStatus::Queued)
        return false;
    status = TaskStatus::Downloading;
    if (!startedAt)
        startedAt = now;
    errorMessage.reset();
    return true;
}

bool Task::queue() {
    if (status != TaskStatus::Pending)
        return false;
    status = TaskStatus::Queued;
    return true;
}

bool Task::pause() {
    if (!canPause(status))
        return false;
    status = TaskStatus::Paused;
    return true;
}

bool Task::startExtracting() {
    if (status != TaskStatus::Downloading)
        return false;
    status = TaskStatus::Extracting;
    progress = 1.0;
    if (totalBytes > 0)
        bytesDownloaded = totalBytes;
    return true;
}

bool Task::complete(Timestamp now) {
    if (status != TaskStatus::Downloading && status != TaskStatus::Extracting)
        return false;
    status = TaskStatus::Completed;
    progress = 1.0;
    if (totalBytes > 0)
        bytesDownloaded = totalBytes;
    else
        totalBytes = bytesDownloaded;
    completedAt = now;
    errorMessage.reset();
    resumeTokenPath.reset();
    return true;
}

bool Task::fail(std::string message) {
    if (isTerminal(status))
        return false;
    status = TaskStatus::Failed;
    errorMessage = std::move(message);
    return true;
}

bool Task::requeue() {
    if (status != TaskStatus::Paused)
        return false;
    status = TaskStatus::Pending;
    return true;
}

bool Task::reset() {
    if (!isTerminal(status))
        return false;
    status = TaskStatus::Pending;
    progress = 0.0;
    bytesDownloaded = 0;
    errorMessage.reset();
    resumeTokenPath.reset();
    startedAt.reset();
    completedAt.reset();
    return true;
}

// ---------- QueueSnapshot ----------

std::vector<std::string> QueueSnapshot::validate() const {
    std::vector<std::string> errors;

    std::unordered_set<std::string> taskIds;
    bool duplicateTasks = false;
    for (const auto& t : tasks) {
        if (!taskIds.insert(t.id).second)
            duplicateTasks = true;
    }
    std::unordered_set<std::string> orderIds;
    bool duplicateOrder = false;
    for (const auto& id : order) {
        if (!orderIds.insert(id).second)
            duplicateOrder = true;
    }

    std::size_t missing = 0;
    for (const auto& id : taskIds) {
        if (!orderIds.contains(id))
            ++missing;
    }
    std::size_t extra = 0;
    for (const auto& id : orderIds) {
        if (!taskIds.contains(id))
            ++extra;
    }
    if (missing > 0 || extra > 0) {
        errors.emplace_back("Queue order IDs don't match task IDs");
        if (missing > 0)
            errors.push_back(fmt::format("Tasks not in queue order: {}", missing));
        if (extra > 0)
            errors.push_back(fmt::format("Queue contains non-existent task IDs: {}", extra));
    }
    if (duplicateTasks)
        errors.emplace_back("Duplicate task IDs found");
    if (duplicateOrder)
        errors.emplace_back("Duplicate IDs in queue order");
    if (version < 1)
        errors.push_back(fmt::format("Invalid version number: {}", version));
    return errors;
}

QueueSnapshot QueueSnapshot::repaired() const {
    QueueSnapshot out = *this;
    out.order.clear();
    out.order.reserve(tasks.size());
    for (const auto& t : tasks)
        out.order.push_back(t.id);
    return out;
}

// ---------- HistoryEntry ----------

HistoryEntry HistoryEntry::fromTask(const Task& task, bool success,
                                    std::optional<std::string> errorMessage, Timestamp now) {
    HistoryEntry e;
    e.id = core::generateUUID();
    e.taskId = task.id;
    e.url = task.url;
    e.category = task.category;
    e.datasetName = task.datasetName;
    e.startedAt = task.startedAt.value_or(task.createdAt);
    if (success)
        e.completedAt = task.completedAt.value_or(now);
    e.recordedAt = now;
    e.bytesDownloaded = task.bytesDownloaded;
    e.totalBytes = task.totalBytes;
    e.success = success;
    if (!success)
        e.errorMessage = errorMessage ? std::move(errorMessage) : task.errorMessage;
    return e;
}

std::chrono::milliseconds HistoryEntry::duration() const {
    const auto end = completedAt.value_or(recordedAt);
    if (end <= startedAt)
        return std::chrono::milliseconds{0};
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - startedAt);
}

double HistoryEntry::averageSpeed() const {
    const auto ms = duration().count();
    if (ms <= 0)
        return 0.0;
    return static_cast<double>(bytesDownloaded) * 1000.0 / static_cast<double>(ms);
}

} // namespace ferry::downloader
