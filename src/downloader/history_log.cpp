/*
 * ferry/src/downloader/history_log.cpp
 */

#include <ferry/downloader/file_io.hpp>
#include <ferry/downloader/history_log.hpp>
#include <ferry/downloader/serialization.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace ferry::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

HistoryLog::HistoryLog(fs::path directory, std::size_t maxEntries)
    : path_(std::move(directory) / kFileName), maxEntries_(std::max<std::size_t>(1, maxEntries)) {
    auto r = reload();
    if (!r.ok()) {
        spdlog::warn("HistoryLog: starting empty: {}", r.error().message);
    }
}

void HistoryLog::record(const Task& task, bool success, std::optional<std::string> errorMessage) {
    auto entry = HistoryEntry::fromTask(task, success, std::move(errorMessage));
    std::lock_guard lk(mutex_);
    entries_.insert(entries_.begin(), std::move(entry));
    if (entries_.size() > maxEntries_)
        entries_.resize(maxEntries_);
    auto r = persistLocked();
    if (!r.ok()) {
        spdlog::error("HistoryLog: failed to persist: {}", r.error().message);
    }
    spdlog::debug("HistoryLog: recorded {} for task {}", success ? "success" : "failure", task.id);
}

std::vector<HistoryEntry> HistoryLog::entries(std::size_t limit) const {
    std::lock_guard lk(mutex_);
    if (limit == 0 || limit >= entries_.size())
        return entries_;
    return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(limit)};
}

std::vector<HistoryEntry> HistoryLog::entriesForCategory(const std::string& category) const {
    std::lock_guard lk(mutex_);
    std::vector<HistoryEntry> out;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [&](const HistoryEntry& e) { return e.category == category; });
    return out;
}

std::vector<HistoryEntry> HistoryLog::entriesForDataset(const std::string& datasetName) const {
    std::lock_guard lk(mutex_);
    std::vector<HistoryEntry> out;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [&](const HistoryEntry& e) { return e.datasetName == datasetName; });
    return out;
}

std::vector<HistoryEntry> HistoryLog::successful() const {
    std::lock_guard lk(mutex_);
    std::vector<HistoryEntry> out;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [](const HistoryEntry& e) { return e.success; });
    return out;
}

std::vector<HistoryEntry> HistoryLog::failed() const {
    std::lock_guard lk(mutex_);
    std::vector<HistoryEntry> out;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [](const HistoryEntry& e) { return !e.success; });
    return out;
}

std::size_t HistoryLog::count() const {
    std::lock_guard lk(mutex_);
    return entries_.size();
}

HistoryStatistics HistoryLog::statistics() const {
    std::lock_guard lk(mutex_);
    HistoryStatistics s;
    s.totalDownloads = entries_.size();
    double speedSum = 0.0;
    std::chrono::milliseconds durationSum{0};
    for (const auto& e : entries_) {
        if (!e.success) {
            ++s.failedDownloads;
            continue;
        }
        ++s.successfulDownloads;
        s.totalBytesDownloaded += e.bytesDownloaded;
        speedSum += e.averageSpeed();
        durationSum += e.duration();
    }
    if (s.successfulDownloads > 0) {
        const auto n = static_cast<double>(s.successfulDownloads);
        s.averageSpeed = speedSum / n;
        s.averageSize = static_cast<double>(s.totalBytesDownloaded) / n;
        s.averageDuration = durationSum / static_cast<long long>(s.successfulDownloads);
    }
    return s;
}

void HistoryLog::clear() {
    std::lock_guard lk(mutex_);
    entries_.clear();
    auto r = persistLocked();
    if (!r.ok()) {
        spdlog::error("HistoryLog: failed to persist: {}", r.error().message);
    }
}

std::size_t HistoryLog::clearBefore(Timestamp cutoff) {
    std::lock_guard lk(mutex_);
    const auto before = entries_.size();
    std::erase_if(entries_, [&](const HistoryEntry& e) { return e.recordedAt < cutoff; });
    const auto removed = before - entries_.size();
    if (removed > 0) {
        auto r = persistLocked();
        if (!r.ok()) {
            spdlog::error("HistoryLog: failed to persist: {}", r.error().message);
        }
    }
    return removed;
}

Expected<std::string> HistoryLog::exportJson() const {
    std::lock_guard lk(mutex_);
    try {
        return json(entries_).dump(2);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Failed to encode history: ") + e.what()};
    }
}

Expected<void> HistoryLog::reload() {
    std::lock_guard lk(mutex_);
    entries_.clear();
    std::error_code ec;
    if (!fs::exists(path_, ec))
        return Expected<void>{};
    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open history file: " + path_.string()};
    }
    try {
        json j;
        in >> j;
        entries_ = j.get<std::vector<HistoryEntry>>();
    } catch (const std::exception& e) {
        entries_.clear();
        return Error{ErrorCode::CorruptData, std::string("Failed to decode history: ") + e.what()};
    }
    if (entries_.size() > maxEntries_)
        entries_.resize(maxEntries_);
    return Expected<void>{};
}

Expected<void> HistoryLog::persistLocked() const {
    std::string text;
    try {
        text = json(entries_).dump(2);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Failed to encode history: ") + e.what()};
    }
    return writeFileAtomic(path_, text);
}

} // namespace ferry::downloader
