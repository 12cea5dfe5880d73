/*
 * ferry/src/downloader/file_placement.cpp
 */

#include <ferry/downloader/file_io.hpp>
#include <ferry/downloader/file_placement.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ferry::downloader {

namespace fs = std::filesystem;

namespace {

std::uint64_t filesystem_free_space(const fs::path& p) {
    std::error_code ec;
    auto existing = p;
    // space() needs an existing path; walk up until one exists.
    while (!existing.empty() && !fs::exists(existing, ec))
        existing = existing.parent_path();
    if (existing.empty())
        existing = fs::current_path(ec);
    auto info = fs::space(existing, ec);
    if (ec) {
        spdlog::debug("FilePlacement: space() failed for {}: {}", existing.string(), ec.message());
        return 0;
    }
    return static_cast<std::uint64_t>(info.available);
}

} // namespace

FilePlacement::FilePlacement(fs::path root, SpaceQuery spaceQuery, double storageMargin)
    : root_(std::move(root)), spaceQuery_(std::move(spaceQuery)),
      margin_(storageMargin < 0.0 ? 0.0 : storageMargin) {
    if (!spaceQuery_)
        spaceQuery_ = filesystem_free_space;
}

Expected<void> FilePlacement::ensureLayout() const {
    for (const auto& dir : {resumeDirectory(), completedDirectory(), tempDirectory()}) {
        auto r = ensureDirectory(dir);
        if (!r.ok())
            return r;
    }
    return Expected<void>{};
}

fs::path FilePlacement::completedPathFor(const Task& task) const {
    auto name = task.filename();
    if (name == "." || name == "..")
        name = "download";
    return completedDirectory() / (task.id + "_" + name);
}

Expected<fs::path> FilePlacement::moveCompleted(const fs::path& tempLocation,
                                                const Task& task) const {
    std::error_code ec;
    if (!fs::is_regular_file(tempLocation, ec)) {
        return Error{ErrorCode::NotFound,
                     "Downloaded file is missing: " + tempLocation.string()};
    }
    auto dest = completedPathFor(task);
    auto r = moveFileReplacing(tempLocation, dest);
    if (!r.ok())
        return r.error();
    spdlog::debug("FilePlacement: placed {} at {}", task.id, dest.string());
    return dest;
}

bool FilePlacement::removeCompleted(const Task& task) const {
    std::error_code ec;
    const bool removed = fs::remove(completedPathFor(task), ec);
    if (ec) {
        spdlog::debug("FilePlacement: failed to remove payload for {}: {}", task.id,
                      ec.message());
        return false;
    }
    return removed;
}

bool FilePlacement::hasCompletedFile(const Task& task) const {
    std::error_code ec;
    return fs::is_regular_file(completedPathFor(task), ec);
}

std::uint64_t FilePlacement::availableSpace() const {
    return spaceQuery_(root_);
}

std::uint64_t FilePlacement::requiredSpaceFor(std::uint64_t bytes) const {
    return static_cast<std::uint64_t>(std::ceil(static_cast<double>(bytes) * (1.0 + margin_)));
}

bool FilePlacement::hasSpaceFor(std::uint64_t bytes) const {
    if (bytes == 0)
        return true;
    return availableSpace() >= requiredSpaceFor(bytes);
}

std::size_t FilePlacement::cleanupTemp() const {
    std::size_t n = 0;
    std::error_code ec;
    fs::directory_iterator it(tempDirectory(), ec);
    if (ec)
        return 0;
    std::vector<fs::path> victims;
    for (const auto& entry : it)
        victims.push_back(entry.path());
    for (const auto& p : victims) {
        std::error_code rec;
        n += static_cast<std::size_t>(fs::remove_all(p, rec));
    }
    if (n > 0)
        spdlog::info("FilePlacement: removed {} temp entries", n);
    return n;
}

std::size_t FilePlacement::cleanupOrphanedCompleted(
    const std::unordered_set<std::string>& validIds) const {
    std::error_code ec;
    fs::directory_iterator it(completedDirectory(), ec);
    if (ec)
        return 0;
    std::vector<fs::path> orphans;
    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        const auto sep = name.find('_');
        if (sep == std::string::npos || !validIds.contains(name.substr(0, sep)))
            orphans.push_back(entry.path());
    }
    std::size_t n = 0;
    for (const auto& p : orphans) {
        std::error_code rec;
        if (fs::remove(p, rec))
            ++n;
    }
    if (n > 0)
        spdlog::info("FilePlacement: removed {} orphaned payloads", n);
    return n;
}

} // namespace ferry::downloader
