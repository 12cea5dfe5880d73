#pragma once

/*
 * Bounded, most-recent-first log of terminal task outcomes, persisted as a JSON
 * array next to (but separate from) the queue snapshot.
 */

#include <ferry/downloader/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry::downloader {

struct HistoryStatistics {
    std::size_t totalDownloads{0};
    std::size_t successfulDownloads{0};
    std::size_t failedDownloads{0};
    std::uint64_t totalBytesDownloaded{0};
    double averageSpeed{0.0};  // bytes/s over successful entries
    double averageSize{0.0};   // bytes over successful entries
    std::chrono::milliseconds averageDuration{0};

    [[nodiscard]] double successRate() const {
        return totalDownloads == 0
                   ? 0.0
                   : static_cast<double>(successfulDownloads) / static_cast<double>(totalDownloads);
    }
};

class HistoryLog {
public:
    static constexpr std::size_t kDefaultMaxEntries = 1000;
    static constexpr const char* kFileName = "download_history.json";

    explicit HistoryLog(std::filesystem::path directory,
                        std::size_t maxEntries = kDefaultMaxEntries);

    void record(const Task& task, bool success,
                std::optional<std::string> errorMessage = std::nullopt);
    void recordSuccess(const Task& task) { record(task, true); }
    void recordFailure(const Task& task, std::string errorMessage) {
        record(task, false, std::move(errorMessage));
    }

    /// Most recent first; limit 0 = everything.
    [[nodiscard]] std::vector<HistoryEntry> entries(std::size_t limit = 0) const;
    [[nodiscard]] std::vector<HistoryEntry> entriesForCategory(const std::string& category) const;
    [[nodiscard]] std::vector<HistoryEntry> entriesForDataset(const std::string& datasetName) const;
    [[nodiscard]] std::vector<HistoryEntry> successful() const;
    [[nodiscard]] std::vector<HistoryEntry> failed() const;
    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] HistoryStatistics statistics() const;

    void clear();
    /// Drops entries recorded before the cutoff. Returns how many were removed.
    std::size_t clearBefore(Timestamp cutoff);

    Expected<std::string> exportJson() const;
    /// Re-reads the history file, replacing the in-memory log.
    Expected<void> reload();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    // Caller holds mutex_.
    Expected<void> persistLocked() const;

    std::filesystem::path path_;
    std::size_t maxEntries_;
    mutable std::mutex mutex_;
    std::vector<HistoryEntry> entries_;
};

} // namespace ferry::downloader
