/*
 * ferry/src/downloader/state_store.cpp
 *
 * Debounced snapshot writer:
 * - One background thread waits for a scheduled snapshot and its deadline
 * - Disk writes are serialized by writeMutex_; the pending snapshot is taken
 *   under that mutex so a flush can never be overtaken by an older write
 * - Destruction flushes whatever is still pending
 */

#include <ferry/downloader/file_io.hpp>
#include <ferry/downloader/serialization.hpp>
#include <ferry/downloader/state_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

namespace ferry::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::size_t content_hash(json j) {
    j.erase("exportedAt");
    return std::hash<std::string>{}(j.dump());
}

} // namespace

StateStore::StateStore(fs::path directory, StateStoreConfig config)
    : path_(directory / config.fileName), backupPath_(directory / config.backupFileName),
      config_(std::move(config)) {
    auto r = ensureDirectory(directory);
    if (!r.ok()) {
        spdlog::warn("StateStore: {}", r.error().message);
    }
    worker_ = std::thread([this] { writerLoop(); });
}

StateStore::~StateStore() {
    running_.store(false);
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    auto r = flush();
    if (!r.ok()) {
        spdlog::error("StateStore: final flush failed: {}", r.error().message);
    }
}

void StateStore::writerLoop() {
    std::unique_lock lk(mutex_);
    while (running_.load()) {
        if (!pending_) {
            cv_.wait(lk, [this] { return !running_.load() || pending_.has_value(); });
            continue;
        }
        // Woken early by stop or by flush()/save() taking the snapshot.
        if (cv_.wait_until(lk, deadline_, [this] { return !running_.load() || !pending_; }))
            continue;

        lk.unlock();
        {
            std::lock_guard wl(writeMutex_);
            std::optional<QueueSnapshot> snapshot;
            {
                std::lock_guard g(mutex_);
                snapshot.swap(pending_);
            }
            if (snapshot) {
                auto r = writeLocked(*snapshot);
                if (!r.ok()) {
                    spdlog::error("StateStore: debounced save failed: {}", r.error().message);
                }
            }
        }
        lk.lock();
    }
}

Expected<void> StateStore::writeLocked(const QueueSnapshot& snapshot) {
    std::string text;
    std::size_t hash = 0;
    try {
        json j = snapshot;
        hash = content_hash(j);
        if (lastHash_ && *lastHash_ == hash && fs::exists(path_)) {
            spdlog::debug("StateStore: snapshot unchanged, skipping write");
            return Expected<void>{};
        }
        text = j.dump(2);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("StateStore: failed to encode snapshot: ") + e.what()};
    }

    auto r = writeFileAtomic(path_, text);
    if (!r.ok())
        return r;
    lastHash_ = hash;
    writes_.fetch_add(1);
    spdlog::debug("StateStore: saved {} tasks ({} bytes) to {}", snapshot.tasks.size(),
                  text.size(), path_.string());
    return Expected<void>{};
}

Expected<void> StateStore::save(const QueueSnapshot& snapshot) {
    std::lock_guard wl(writeMutex_);
    {
        std::lock_guard g(mutex_);
        pending_.reset();
    }
    cv_.notify_all();
    return writeLocked(snapshot);
}

void StateStore::scheduleSave(QueueSnapshot snapshot) {
    {
        std::lock_guard g(mutex_);
        if (!pending_)
            deadline_ = std::chrono::steady_clock::now() + config_.debounce;
        pending_ = std::move(snapshot);
    }
    cv_.notify_all();
}

Expected<void> StateStore::flush() {
    std::lock_guard wl(writeMutex_);
    std::optional<QueueSnapshot> snapshot;
    {
        std::lock_guard g(mutex_);
        snapshot.swap(pending_);
    }
    cv_.notify_all();
    if (!snapshot)
        return Expected<void>{};
    return writeLocked(*snapshot);
}

bool StateStore::hasPendingSave() const {
    std::lock_guard g(mutex_);
    return pending_.has_value();
}

Expected<std::optional<QueueSnapshot>> StateStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec))
        return std::optional<QueueSnapshot>{};

    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open state file: " + path_.string()};
    }
    try {
        json j;
        in >> j;
        return std::optional<QueueSnapshot>{j.get<QueueSnapshot>()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::CorruptData,
                     std::string("Failed to decode state file: ") + e.what()};
    }
}

std::optional<QueueSnapshot> StateStore::loadValidated() {
    auto loaded = load();
    if (!loaded.ok()) {
        spdlog::warn("StateStore: {}; discarding persisted state", loaded.error().message);
        auto cr = clear();
        if (!cr.ok())
            spdlog::error("StateStore: {}", cr.error().message);
        return std::nullopt;
    }
    if (!loaded.value())
        return std::nullopt;

    auto snapshot = std::move(*loaded.value());
    auto problems = snapshot.validate();
    if (problems.empty())
        return snapshot;

    for (const auto& p : problems)
        spdlog::warn("StateStore: invalid snapshot: {}", p);

    auto repaired = snapshot.repaired();
    if (repaired.isValid()) {
        spdlog::warn("StateStore: repaired snapshot by rebuilding queue order ({} tasks)",
                     repaired.tasks.size());
        auto sr = save(repaired);
        if (!sr.ok())
            spdlog::error("StateStore: failed to persist repaired snapshot: {}",
                          sr.error().message);
        return repaired;
    }

    spdlog::error("StateStore: snapshot could not be repaired; starting with empty state");
    auto cr = clear();
    if (!cr.ok())
        spdlog::error("StateStore: {}", cr.error().message);
    return std::nullopt;
}

Expected<void> StateStore::clear() {
    std::lock_guard wl(writeMutex_);
    {
        std::lock_guard g(mutex_);
        pending_.reset();
    }
    cv_.notify_all();
    lastHash_.reset();
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to remove state file " + path_.string() + ": " + ec.message()};
    }
    spdlog::debug("StateStore: cleared {}", path_.string());
    return Expected<void>{};
}

bool StateStore::hasPersistedState() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

std::uint64_t StateStore::fileSize() const {
    std::error_code ec;
    auto sz = fs::file_size(path_, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

Expected<void> StateStore::createBackup() {
    std::lock_guard wl(writeMutex_);
    auto bytes = readFileBytes(path_);
    if (!bytes.ok()) {
        if (bytes.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "No download state to back up"};
        return bytes.error();
    }
    auto r = writeFileAtomic(backupPath_, bytes.value());
    if (r.ok())
        spdlog::info("StateStore: backup written to {}", backupPath_.string());
    return r;
}

Expected<void> StateStore::restoreFromBackup() {
    std::lock_guard wl(writeMutex_);
    auto bytes = readFileBytes(backupPath_);
    if (!bytes.ok()) {
        if (bytes.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "No download state backup found"};
        return bytes.error();
    }
    {
        std::lock_guard g(mutex_);
        pending_.reset();
    }
    cv_.notify_all();
    auto r = writeFileAtomic(path_, bytes.value());
    if (!r.ok())
        return r;
    lastHash_.reset();
    spdlog::info("StateStore: state restored from {}", backupPath_.string());
    return Expected<void>{};
}

} // namespace ferry::downloader
