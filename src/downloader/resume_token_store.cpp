/*
 * ferry/src/downloader/resume_token_store.cpp
 *
 * One file per task under the resume directory, written through writeFileAtomic
 * so a crash never leaves a truncated token behind.
 */

#include <ferry/core/uuid.h>
#include <ferry/downloader/file_io.hpp>
#include <ferry/downloader/resume_token_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace ferry::downloader {

namespace fs = std::filesystem;

namespace {

bool is_safe_task_id(std::string_view id) {
    return !id.empty() && id.find('/') == std::string_view::npos &&
           id.find('\\') == std::string_view::npos && id != "." && id != "..";
}

} // namespace

ResumeTokenStore::ResumeTokenStore(fs::path directory) : dir_(std::move(directory)) {
    auto r = ensureDirectory(dir_);
    if (!r.ok()) {
        spdlog::warn("ResumeTokenStore: {}", r.error().message);
    }
}

fs::path ResumeTokenStore::pathFor(std::string_view taskId) const {
    return dir_ / (std::string(taskId) + kExtension);
}

Expected<fs::path> ResumeTokenStore::save(std::string_view taskId,
                                          std::span<const std::byte> token) {
    if (!is_safe_task_id(taskId)) {
        return Error{ErrorCode::InvalidArgument,
                     "ResumeTokenStore.save: invalid task id '" + std::string(taskId) + "'"};
    }
    if (token.empty()) {
        return Error{ErrorCode::InvalidArgument, "ResumeTokenStore.save: empty token"};
    }
    auto path = pathFor(taskId);
    auto r = writeFileAtomic(path, token);
    if (!r.ok())
        return r.error();
    spdlog::debug("ResumeTokenStore: saved {} bytes for task {}", token.size(), taskId);
    return path;
}

Expected<ResumeToken> ResumeTokenStore::load(std::string_view taskId) const {
    if (!is_safe_task_id(taskId)) {
        return Error{ErrorCode::InvalidArgument,
                     "ResumeTokenStore.load: invalid task id '" + std::string(taskId) + "'"};
    }
    return readFileBytes(pathFor(taskId));
}

Expected<ResumeToken> ResumeTokenStore::loadValidated(std::string_view taskId) {
    auto loaded = load(taskId);
    if (!loaded.ok())
        return loaded;
    if (!isValidToken(loaded.value())) {
        spdlog::warn("ResumeTokenStore: discarding corrupt token for task {} ({} bytes)", taskId,
                     loaded.value().size());
        remove(taskId);
        return Error{ErrorCode::CorruptData, "Resume token for " + std::string(taskId) +
                                                 " failed validation"};
    }
    return loaded;
}

bool ResumeTokenStore::exists(std::string_view taskId) const {
    if (!is_safe_task_id(taskId))
        return false;
    std::error_code ec;
    return fs::is_regular_file(pathFor(taskId), ec);
}

bool ResumeTokenStore::remove(std::string_view taskId) {
    if (!is_safe_task_id(taskId))
        return false;
    std::error_code ec;
    const bool removed = fs::remove(pathFor(taskId), ec);
    if (ec) {
        spdlog::debug("ResumeTokenStore: failed to remove token for {}: {}", taskId,
                      ec.message());
        return false;
    }
    return removed;
}

std::size_t ResumeTokenStore::removeMany(const std::vector<std::string>& taskIds) {
    std::size_t n = 0;
    for (const auto& id : taskIds) {
        if (remove(id))
            ++n;
    }
    return n;
}

std::size_t ResumeTokenStore::removeAll() {
    std::size_t n = 0;
    for (const auto& file : tokenFiles()) {
        std::error_code ec;
        if (fs::remove(file, ec))
            ++n;
    }
    if (n > 0)
        spdlog::info("ResumeTokenStore: removed all {} tokens", n);
    return n;
}

std::size_t ResumeTokenStore::cleanupOrphaned(const std::unordered_set<std::string>& validIds) {
    std::size_t n = 0;
    for (const auto& file : tokenFiles()) {
        const auto stem = file.stem().string();
        if (core::isUUID(stem) && validIds.contains(stem))
            continue;
        std::error_code ec;
        if (fs::remove(file, ec)) {
            ++n;
            spdlog::debug("ResumeTokenStore: removed orphaned token {}", file.filename().string());
        }
    }
    if (n > 0)
        spdlog::info("ResumeTokenStore: cleaned up {} orphaned tokens", n);
    return n;
}

std::size_t ResumeTokenStore::cleanupOlderThan(std::chrono::seconds maxAge) {
    const auto cutoff = fs::file_time_type::clock::now() - maxAge;
    std::size_t n = 0;
    for (const auto& file : tokenFiles()) {
        std::error_code ec;
        auto mtime = fs::last_write_time(file, ec);
        if (ec || mtime >= cutoff)
            continue;
        if (fs::remove(file, ec))
            ++n;
    }
    if (n > 0)
        spdlog::info("ResumeTokenStore: removed {} tokens older than {}s", n, maxAge.count());
    return n;
}

std::size_t ResumeTokenStore::count() const {
    return tokenFiles().size();
}

std::uint64_t ResumeTokenStore::totalSize() const {
    std::uint64_t total = 0;
    for (const auto& file : tokenFiles()) {
        std::error_code ec;
        auto sz = fs::file_size(file, ec);
        if (!ec)
            total += static_cast<std::uint64_t>(sz);
    }
    return total;
}

std::vector<std::string> ResumeTokenStore::allTaskIds() const {
    std::vector<std::string> ids;
    for (const auto& file : tokenFiles())
        ids.push_back(file.stem().string());
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string ResumeTokenStore::diagnosticInfo() const {
    return "ResumeTokenStore{dir=" + dir_.string() + ", count=" + std::to_string(count()) +
           ", bytes=" + std::to_string(totalSize()) + "}";
}

bool ResumeTokenStore::isValidToken(std::span<const std::byte> token) {
    if (token.size() <= 8)
        return false;
    auto as_text = [&](std::size_t n) {
        n = std::min(n, token.size());
        return std::string_view(reinterpret_cast<const char*>(token.data()), n);
    };
    if (as_text(6) == "bplist")
        return true;
    const auto head = as_text(50);
    return head.find("<?xml") != std::string_view::npos &&
           head.find("plist") != std::string_view::npos;
}

std::vector<fs::path> ResumeTokenStore::tokenFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec)
        return files;
    for (const auto& entry : it) {
        std::error_code fec;
        if (!entry.is_regular_file(fec))
            continue;
        if (entry.path().extension() == kExtension)
            files.push_back(entry.path());
    }
    return files;
}

} // namespace ferry::downloader
