#pragma once

/*
 * Durable file primitives shared by the persistence components.
 *
 * All writers go through a sibling temp file + fsync + rename so readers only
 * ever observe the previous or the new complete content.
 */

#include <ferry/downloader/types.hpp>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace ferry::downloader {

Expected<void> writeFileAtomic(const std::filesystem::path& target,
                               std::span<const std::byte> data);
Expected<void> writeFileAtomic(const std::filesystem::path& target, std::string_view text);

Expected<std::vector<std::byte>> readFileBytes(const std::filesystem::path& path);

/**
 * Move src onto dst, replacing dst. Falls back to copy + fsync + remove when the
 * two paths live on different filesystems.
 */
Expected<void> moveFileReplacing(const std::filesystem::path& src,
                                 const std::filesystem::path& dst);

Expected<void> ensureDirectory(const std::filesystem::path& dir);

} // namespace ferry::downloader
