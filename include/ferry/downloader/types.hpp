#pragma once

/*
 * Ferry Downloader - Core data model (C++20)
 *
 * Task, queue snapshot and history records shared by every component of the
 * download orchestration subsystem, plus the lightweight Expected<T> used at
 * all fallible API boundaries.
 *
 * Copyright (c) Ferry Contributors
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::downloader {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * Current wall-clock time truncated to millisecond precision, so values survive
 * an ISO-8601 round trip unchanged.
 */
inline Timestamp currentTime() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

// ================================
// Errors
// ================================

/**
 * Canonical error codes for non-transfer operations (persistence, validation).
 * Transfer failures use TransferError (transfer_error.hpp).
 */
enum class ErrorCode { None = 0, InvalidArgument, NotFound, IoError, CorruptData, InvalidState, Unknown };

const char* errorCodeName(ErrorCode code) noexcept;

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ================================
// Task status
// ================================

enum class TaskStatus { Pending, Queued, Downloading, Paused, Extracting, Completed, Failed };

const char* statusName(TaskStatus s) noexcept;
std::optional<TaskStatus> statusFromName(std::string_view name) noexcept;

// downloading, extracting and queued tasks occupy a concurrency slot
constexpr bool isActive(TaskStatus s) noexcept {
    return s == TaskStatus::Downloading || s == TaskStatus::Extracting || s == TaskStatus::Queued;
}
constexpr bool canStart(TaskStatus s) noexcept {
    return s == TaskStatus::Pending || s == TaskStatus::Paused || s == TaskStatus::Failed;
}
constexpr bool canPause(TaskStatus s) noexcept {
    return s == TaskStatus::Downloading || s == TaskStatus::Queued;
}
constexpr bool isTerminal(TaskStatus s) noexcept {
    return s == TaskStatus::Completed || s == TaskStatus::Failed;
}
constexpr bool canRetry(TaskStatus s) noexcept {
    return s == TaskStatus::Failed;
}

// ================================
// Task
// ================================

/**
 * One row of the catalog handed to the queue. Only used to build Tasks.
 */
struct ManifestEntry {
    std::string url;
    std::string category;
    int partIndex{1};
    int partCount{1};
    std::string datasetName;
    std::uint64_t estimatedSize{0}; // 0 = unknown
};

/**
 * One transfer unit. Identity and grouping metadata are fixed at creation; the
 * remaining fields only change through the transition methods below, which
 * return false (and leave the task untouched) when the transition is illegal.
 */
struct Task {
    std::string id;
    std::string url;
    std::string category;
    int partIndex{1};
    int partCount{1};
    std::string datasetName;

    TaskStatus status{TaskStatus::Pending};
    double progress{0.0};
    std::uint64_t bytesDownloaded{0};
    std::uint64_t totalBytes{0}; // 0 = unknown
    std::optional<std::string> errorMessage;
    std::optional<std::string> resumeTokenPath;
    Timestamp createdAt{};
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> completedAt;

    static Task fromManifest(const ManifestEntry& entry);

    /// Name of the payload as published by the server (last URL path component).
    [[nodiscard]] std::string filename() const;
    [[nodiscard]] std::string displayName() const;
    [[nodiscard]] std::uint64_t remainingBytes() const noexcept;

    void updateProgress(std::uint64_t bytes, std::uint64_t total);

    bool start(Timestamp now = currentTime());
    bool queue();
    bool pause();
    bool startExtracting();
    bool complete(Timestamp now = currentTime());
    bool fail(std::string message);
    /// paused -> pending, keeping counters and resume token
    bool requeue();
    /// failed/completed -> pending, counters and token reference cleared
    bool reset();

    bool operator==(const Task&) const = default;
};

// ================================
// Snapshot
// ================================

struct QueueSnapshot {
    static constexpr int kCurrentVersion = 1;

    std::vector<Task> tasks; // written in queue order
    std::vector<std::string> order;
    bool paused{false};
    int maxConcurrent{3};
    Timestamp exportedAt{};
    int version{kCurrentVersion};

    /// Empty when the snapshot is consistent; otherwise one line per problem.
    [[nodiscard]] std::vector<std::string> validate() const;
    [[nodiscard]] bool isValid() const { return validate().empty(); }
    /// Copy whose order list is rebuilt from the task collection.
    [[nodiscard]] QueueSnapshot repaired() const;
};

// ================================
// History
// ================================

struct HistoryEntry {
    std::string id;
    std::string taskId;
    std::string url;
    std::string category;
    std::string datasetName;
    Timestamp startedAt{};
    std::optional<Timestamp> completedAt;
    Timestamp recordedAt{};
    std::uint64_t bytesDownloaded{0};
    std::uint64_t totalBytes{0};
    bool success{false};
    std::optional<std::string> errorMessage;

    static HistoryEntry fromTask(const Task& task, bool success,
                                 std::optional<std::string> errorMessage = std::nullopt,
                                 Timestamp now = currentTime());

    [[nodiscard]] std::chrono::milliseconds duration() const;
    /// Bytes per second over duration(), or 0 when the duration is zero.
    [[nodiscard]] double averageSpeed() const;

    bool operator==(const HistoryEntry&) const = default;
};

/// "512 B", "1.5 KB", "2.3 MB", "1.1 GB"
std::string formatByteCount(std::uint64_t bytes);

} // namespace ferry::downloader
