#pragma once

/*
 * Durable queue snapshot persistence.
 *
 * scheduleSave() is throttled, not debounced: the first request of a burst
 * fixes the write deadline, later requests only replace the pending snapshot,
 * so at most one write happens per window and it carries the latest state.
 * Writes whose content (ignoring the export timestamp) hashes the same as the
 * last write are skipped.
 */

#include <ferry/downloader/types.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ferry::downloader {

struct StateStoreConfig {
    std::chrono::milliseconds debounce{1000};
    std::string fileName{"download_state.json"};
    std::string backupFileName{"download_state.backup.json"};
};

class StateStore {
public:
    explicit StateStore(std::filesystem::path directory, StateStoreConfig config = {});
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /// Immediate atomic write. Supersedes any pending scheduled snapshot.
    Expected<void> save(const QueueSnapshot& snapshot);
    void scheduleSave(QueueSnapshot snapshot);
    /// Writes the pending snapshot now (if any) and returns once it is on disk.
    Expected<void> flush();

    /// Raw load. nullopt when nothing is persisted; error when the file is unreadable.
    Expected<std::optional<QueueSnapshot>> load() const;
    /// Load + validate + single repair attempt. Unrecoverable state is cleared.
    std::optional<QueueSnapshot> loadValidated();
    Expected<void> clear();

    [[nodiscard]] bool hasPersistedState() const;
    [[nodiscard]] std::uint64_t fileSize() const;
    [[nodiscard]] bool hasPendingSave() const;
    [[nodiscard]] std::size_t writeCount() const noexcept { return writes_.load(); }

    Expected<void> createBackup();
    Expected<void> restoreFromBackup();

    [[nodiscard]] const std::filesystem::path& statePath() const noexcept { return path_; }
    [[nodiscard]] const std::filesystem::path& backupPath() const noexcept { return backupPath_; }

private:
    void writerLoop();
    // Caller holds writeMutex_.
    Expected<void> writeLocked(const QueueSnapshot& snapshot);

    std::filesystem::path path_;
    std::filesystem::path backupPath_;
    StateStoreConfig config_;

    mutable std::mutex mutex_; // guards pending_, deadline_
    std::mutex writeMutex_;    // serializes disk writes and lastHash_
    std::condition_variable cv_;
    std::optional<QueueSnapshot> pending_;
    std::chrono::steady_clock::time_point deadline_{};
    std::optional<std::size_t> lastHash_;
    std::atomic<std::size_t> writes_{0};

    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace ferry::downloader
