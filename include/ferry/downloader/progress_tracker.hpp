#pragma once

/*
 * Ferry Downloader - Progress aggregation
 *
 * Converts raw byte-count callbacks into an aggregate throughput and ETA.
 * Independent of the queue; fed by the engine and safe to reset at any time.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::downloader {

struct TaskProgress {
    std::uint64_t bytesDownloaded{0};
    std::uint64_t totalBytes{0};
    double rate{0.0}; // smoothed bytes/s

    [[nodiscard]] double progress() const noexcept {
        if (totalBytes == 0)
            return 0.0;
        const double p = static_cast<double>(bytesDownloaded) / static_cast<double>(totalBytes);
        return p > 1.0 ? 1.0 : p;
    }
};

struct ProgressSnapshot {
    double overallProgress{0.0};
    std::uint64_t bytesDownloaded{0};
    std::uint64_t bytesExpected{0};
    double rate{0.0};
    std::optional<std::chrono::seconds> eta;
    std::size_t activeTasks{0};

    [[nodiscard]] int percentage() const noexcept {
        return static_cast<int>(overallProgress * 100.0 + 0.5);
    }
};

class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double kSmoothing = 0.3;
    static constexpr std::size_t kMaxSamples = 10;
    static constexpr std::chrono::milliseconds kMinSampleInterval{500};
    static constexpr double kMaxEtaSeconds = 24.0 * 60.0 * 60.0;

    void update(const std::string& taskId, std::uint64_t bytes, std::uint64_t total);
    void update(const std::string& taskId, std::uint64_t bytes, std::uint64_t total,
                Clock::time_point now);
    void taskCompleted(const std::string& taskId);
    void taskFailed(const std::string& taskId);
    void remove(const std::string& taskId);
    void reset();

    [[nodiscard]] std::optional<TaskProgress> progressFor(const std::string& taskId) const;
    [[nodiscard]] std::vector<std::string> trackedTaskIds() const;

    [[nodiscard]] double overallProgress() const;
    [[nodiscard]] std::uint64_t bytesDownloaded() const;
    [[nodiscard]] std::uint64_t bytesExpected() const;
    /// Aggregate bytes/s.
    [[nodiscard]] double rate() const;
    /// Nothing when the rate is unknown or the estimate exceeds 24h.
    [[nodiscard]] std::optional<std::chrono::seconds> eta() const;
    /// Tasks whose byte count has not reached a known total.
    [[nodiscard]] std::size_t activeTaskCount() const;
    [[nodiscard]] ProgressSnapshot snapshot() const;

    [[nodiscard]] std::string formattedRate() const;
    [[nodiscard]] std::optional<std::string> formattedEta() const;

    /// "512 B/s", "1.5 KB/s", "2.3 MB/s", "1.1 GB/s"
    static std::string formatRate(double bytesPerSecond);
    /// "45s", "3m 12s", "1h 5m"
    static std::string formatDuration(std::chrono::seconds duration);

private:
    struct Entry {
        TaskProgress progress;
        std::optional<Clock::time_point> lastUpdate;
    };
    struct Sample {
        std::uint64_t bytes;
        Clock::time_point at;
    };

    std::uint64_t downloadedLocked() const;
    std::uint64_t expectedLocked() const;
    double rateLocked() const;
    std::optional<std::chrono::seconds> etaLocked() const;
    void sampleLocked(Clock::time_point now);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> tasks_;
    std::vector<Sample> samples_;
};

} // namespace ferry::downloader
