#pragma once

/*
 * Flat-file store for opaque resume tokens: <directory>/<taskId>.resume
 *
 * The bytes belong to the transfer backend. The store only sniffs the envelope
 * (binary or XML property list) to discard tokens that are obviously damaged.
 */

#include <ferry/downloader/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ferry::downloader {

using ResumeToken = std::vector<std::byte>;

class ResumeTokenStore {
public:
    static constexpr std::chrono::hours kDefaultMaxAge{24 * 7};
    static constexpr const char* kExtension = ".resume";

    explicit ResumeTokenStore(std::filesystem::path directory);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }
    [[nodiscard]] std::filesystem::path pathFor(std::string_view taskId) const;

    /// Atomically writes the token and returns the file it landed in.
    Expected<std::filesystem::path> save(std::string_view taskId,
                                         std::span<const std::byte> token);
    Expected<ResumeToken> load(std::string_view taskId) const;
    /// Like load(), but deletes the file and fails with CorruptData when the sniff rejects it.
    Expected<ResumeToken> loadValidated(std::string_view taskId);

    [[nodiscard]] bool exists(std::string_view taskId) const;
    /// True when a file was actually deleted.
    bool remove(std::string_view taskId);
    std::size_t removeMany(const std::vector<std::string>& taskIds);
    std::size_t removeAll();

    /// Deletes tokens whose task id is not in validIds, and files whose name is not a task id.
    std::size_t cleanupOrphaned(const std::unordered_set<std::string>& validIds);
    std::size_t cleanupOlderThan(std::chrono::seconds maxAge = kDefaultMaxAge);

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] std::uint64_t totalSize() const;
    [[nodiscard]] std::vector<std::string> allTaskIds() const;
    [[nodiscard]] std::string diagnosticInfo() const;

    static bool isValidToken(std::span<const std::byte> token);

private:
    std::vector<std::filesystem::path> tokenFiles() const;

    std::filesystem::path dir_;
};

} // namespace ferry::downloader
