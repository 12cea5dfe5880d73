#pragma once

/*
 * On-disk layout under the downloads data directory:
 *
 *   <root>/resume/      resume tokens (ResumeTokenStore)
 *   <root>/completed/   finished payloads, "<taskId>_<filename>"
 *   <root>/temp/        scratch space for the transfer backend
 */

#include <ferry/downloader/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>

namespace ferry::downloader {

class FilePlacement {
public:
    /// Returns free bytes on the volume holding the given path.
    using SpaceQuery = std::function<std::uint64_t(const std::filesystem::path&)>;

    static constexpr double kDefaultStorageMargin = 0.10;

    explicit FilePlacement(std::filesystem::path root, SpaceQuery spaceQuery = {},
                           double storageMargin = kDefaultStorageMargin);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path resumeDirectory() const { return root_ / "resume"; }
    [[nodiscard]] std::filesystem::path completedDirectory() const { return root_ / "completed"; }
    [[nodiscard]] std::filesystem::path tempDirectory() const { return root_ / "temp"; }

    Expected<void> ensureLayout() const;

    [[nodiscard]] std::filesystem::path completedPathFor(const Task& task) const;
    Expected<std::filesystem::path> moveCompleted(const std::filesystem::path& tempLocation,
                                                  const Task& task) const;
    bool removeCompleted(const Task& task) const;
    [[nodiscard]] bool hasCompletedFile(const Task& task) const;

    [[nodiscard]] std::uint64_t availableSpace() const;
    /// Bytes needed for a payload once the safety margin is applied.
    [[nodiscard]] std::uint64_t requiredSpaceFor(std::uint64_t bytes) const;
    [[nodiscard]] bool hasSpaceFor(std::uint64_t bytes) const;

    std::size_t cleanupTemp() const;
    /// Removes completed payloads whose "<taskId>_" prefix matches no known task.
    std::size_t cleanupOrphanedCompleted(const std::unordered_set<std::string>& validIds) const;

private:
    std::filesystem::path root_;
    SpaceQuery spaceQuery_;
    double margin_;
};

} // namespace ferry::downloader
