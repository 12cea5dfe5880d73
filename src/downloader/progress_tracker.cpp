/*
 * ferry/src/downloader/progress_tracker.cpp
 *
 * Aggregate rate comes from the first/last samples of a short rolling window of
 * total-bytes readings (at most kMaxSamples, at least kMinSampleInterval
 * apart). Until two samples exist, the per-task EMA rates are summed instead.
 */

#include <ferry/downloader/progress_tracker.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace ferry::downloader {

void ProgressTracker::update(const std::string& taskId, std::uint64_t bytes, std::uint64_t total) {
    update(taskId, bytes, total, Clock::now());
}

void ProgressTracker::update(const std::string& taskId, std::uint64_t bytes, std::uint64_t total,
                             Clock::time_point now) {
    std::lock_guard lk(mutex_);
    auto& e = tasks_[taskId];
    if (e.lastUpdate) {
        const std::chrono::duration<double> elapsed = now - *e.lastUpdate;
        if (elapsed.count() > 0.0) {
            const double delta =
                static_cast<double>(bytes) - static_cast<double>(e.progress.bytesDownloaded);
            const double instant = delta / elapsed.count();
            e.progress.rate = e.progress.rate * (1.0 - kSmoothing) + instant * kSmoothing;
        }
    }
    e.progress.bytesDownloaded = bytes;
    e.progress.totalBytes = total;
    e.lastUpdate = now;
    sampleLocked(now);
}

void ProgressTracker::sampleLocked(Clock::time_point now) {
    if (!samples_.empty() && now - samples_.back().at < kMinSampleInterval)
        return;
    samples_.push_back({downloadedLocked(), now});
    if (samples_.size() > kMaxSamples)
        samples_.erase(samples_.begin(),
                       samples_.begin() + static_cast<std::ptrdiff_t>(samples_.size() - kMaxSamples));
}

void ProgressTracker::taskCompleted(const std::string& taskId) {
    std::lock_guard lk(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return;
    it->second.progress.bytesDownloaded = it->second.progress.totalBytes;
    it->second.progress.rate = 0.0;
}

void ProgressTracker::taskFailed(const std::string& taskId) {
    remove(taskId);
}

void ProgressTracker::remove(const std::string& taskId) {
    std::lock_guard lk(mutex_);
    tasks_.erase(taskId);
}

void ProgressTracker::reset() {
    std::lock_guard lk(mutex_);
    tasks_.clear();
    samples_.clear();
}

std::optional<TaskProgress> ProgressTracker::progressFor(const std::string& taskId) const {
    std::lock_guard lk(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second.progress;
}

std::vector<std::string> ProgressTracker::trackedTaskIds() const {
    std::lock_guard lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, e] : tasks_)
        ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::uint64_t ProgressTracker::downloadedLocked() const {
    std::uint64_t sum = 0;
    for (const auto& [id, e] : tasks_)
        sum += e.progress.bytesDownloaded;
    return sum;
}

std::uint64_t ProgressTracker::expectedLocked() const {
    std::uint64_t sum = 0;
    for (const auto& [id, e] : tasks_)
        sum += e.progress.totalBytes;
    return sum;
}

double ProgressTracker::rateLocked() const {
    if (samples_.size() < 2) {
        double sum = 0.0;
        for (const auto& [id, e] : tasks_)
            sum += e.progress.rate;
        return std::max(sum, 0.0);
    }
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const std::chrono::duration<double> elapsed = last.at - first.at;
    if (elapsed.count() <= 0.0)
        return 0.0;
    const double delta = static_cast<double>(last.bytes) - static_cast<double>(first.bytes);
    return std::max(delta / elapsed.count(), 0.0);
}

std::optional<std::chrono::seconds> ProgressTracker::etaLocked() const {
    const double r = rateLocked();
    if (r <= 0.0)
        return std::nullopt;
    const auto downloaded = downloadedLocked();
    const auto expected = expectedLocked();
    if (expected <= downloaded)
        return std::nullopt;
    const double seconds = static_cast<double>(expected - downloaded) / r;
    if (seconds >= kMaxEtaSeconds)
        return std::nullopt;
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
}

double ProgressTracker::overallProgress() const {
    std::lock_guard lk(mutex_);
    const auto expected = expectedLocked();
    if (expected == 0)
        return 0.0;
    return std::min(1.0, static_cast<double>(downloadedLocked()) / static_cast<double>(expected));
}

std::uint64_t ProgressTracker::bytesDownloaded() const {
    std::lock_guard lk(mutex_);
    return downloadedLocked();
}

std::uint64_t ProgressTracker::bytesExpected() const {
    std::lock_guard lk(mutex_);
    return expectedLocked();
}

double ProgressTracker::rate() const {
    std::lock_guard lk(mutex_);
    return rateLocked();
}

std::optional<std::chrono::seconds> ProgressTracker::eta() const {
    std::lock_guard lk(mutex_);
    return etaLocked();
}

std::size_t ProgressTracker::activeTaskCount() const {
    std::lock_guard lk(mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto& kv) {
        const auto& p = kv.second.progress;
        return p.totalBytes == 0 || p.bytesDownloaded < p.totalBytes;
    }));
}

ProgressSnapshot ProgressTracker::snapshot() const {
    ProgressSnapshot s;
    s.activeTasks = activeTaskCount();
    std::lock_guard lk(mutex_);
    s.bytesDownloaded = downloadedLocked();
    s.bytesExpected = expectedLocked();
    if (s.bytesExpected > 0)
        s.overallProgress = std::min(1.0, static_cast<double>(s.bytesDownloaded) /
                                              static_cast<double>(s.bytesExpected));
    s.rate = rateLocked();
    s.eta = etaLocked();
    return s;
}

std::string ProgressTracker::formattedRate() const {
    return formatRate(rate());
}

std::optional<std::string> ProgressTracker::formattedEta() const {
    auto e = eta();
    if (!e || e->count() <= 0)
        return std::nullopt;
    return formatDuration(*e);
}

std::string ProgressTracker::formatRate(double bytesPerSecond) {
    constexpr double kKiB = 1024.0;
    const auto whole = static_cast<std::int64_t>(bytesPerSecond);
    if (whole < 1024)
        return fmt::format("{} B/s", whole);
    if (bytesPerSecond < kKiB * kKiB)
        return fmt::format("{:.1f} KB/s", bytesPerSecond / kKiB);
    if (bytesPerSecond < kKiB * kKiB * kKiB)
        return fmt::format("{:.1f} MB/s", bytesPerSecond / (kKiB * kKiB));
    return fmt::format("{:.1f} GB/s", bytesPerSecond / (kKiB * kKiB * kKiB));
}

std::string ProgressTracker::formatDuration(std::chrono::seconds duration) {
    const auto total = duration.count() < 0 ? 0 : duration.count();
    if (total < 60)
        return fmt::format("{}s", total);
    if (total < 3600)
        return fmt::format("{}m {}s", total / 60, total % 60);
    return fmt::format("{}h {}m", total / 3600, (total % 3600) / 60);
}

} // namespace ferry::downloader
