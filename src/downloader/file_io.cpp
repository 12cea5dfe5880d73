/*
 * ferry/src/downloader/file_io.cpp
 *
 * Atomic replace and cross-device move helpers:
 * - Temp file next to the target, fsync, rename over the target, fsync the directory
 * - EXDEV fallback: copy + fsync + replace when a rename crosses filesystems
 * - Restrictive permissions (0600) for state files on POSIX
 */

#include <ferry/downloader/file_io.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#endif

namespace ferry::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

static Expected<void> fsync_dir(const fs::path& dir) {
#if defined(_WIN32)
    (void)dir; // directory entries are durable once MoveFileEx returns
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

static void ensure_file_private(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

static fs::path sibling_temp_path(const fs::path& target) {
    static std::atomic<std::uint64_t> counter{0};
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    auto tmp = target;
    tmp += ".tmp." + std::to_string(now_ns) + "." + std::to_string(counter.fetch_add(1));
    return tmp;
}

// Copy file contents and ensure durability (fsync destination and dir). Replace if exists.
static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
    const auto tmp = sibling_temp_path(dst);
    {
        std::ifstream is(src, std::ios::binary);
        if (!is.good()) {
            return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
        }
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "copy: failed to open destination: " + tmp.string()};
        }
        std::vector<char> buffer(1 << 20);
        while (is.good()) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = is.gcount();
            if (got > 0) {
                os.write(buffer.data(), got);
                if (!os.good()) {
                    std::error_code ec;
                    fs::remove(tmp, ec);
                    return Error{ErrorCode::IoError,
                                 "copy: write failed for destination: " + dst.string()};
                }
            }
        }
        if (!is.eof()) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
        }
    }

    auto rf = fsync_file(tmp);
    if (!rf.ok())
        return rf;
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec) {
        std::error_code del_ec;
        fs::remove(tmp, del_ec);
        return Error{ErrorCode::IoError, "copy: rename failed (" + ec.message() + ") for " +
                                             dst.string()};
    }
    return fsync_dir(dst.parent_path());
}

Expected<void> ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create directory " + dir.string() + ": " + ec.message()};
    }
    return Expected<void>{};
}

Expected<void> writeFileAtomic(const fs::path& target, std::span<const std::byte> data) {
    if (target.has_parent_path()) {
        auto dr = ensureDirectory(target.parent_path());
        if (!dr.ok())
            return dr;
    }

    const auto tmp = sibling_temp_path(target);
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Failed to open temp file: " + tmp.string()};
        }
        os.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
        if (!os.good()) {
            os.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            return Error{ErrorCode::IoError, "write failed on: " + tmp.string()};
        }
    }
    ensure_file_private(tmp);

    auto rf = fsync_file(tmp);
    if (!rf.ok()) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return rf;
    }

    std::error_code ren_ec;
    fs::rename(tmp, target, ren_ec);
    if (ren_ec) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() + ") for " +
                                             target.string()};
    }

    if (target.has_parent_path()) {
        auto rd = fsync_dir(target.parent_path());
        if (!rd.ok()) {
            spdlog::debug("fsync on dir failed (continuing): {}", target.parent_path().string());
        }
    }
    return Expected<void>{};
}

Expected<void> writeFileAtomic(const fs::path& target, std::string_view text) {
    return writeFileAtomic(target, std::as_bytes(std::span<const char>(text.data(), text.size())));
}

Expected<std::vector<std::byte>> readFileBytes(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "No such file: " + path.string()};
    }
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Error{ErrorCode::IoError, "Failed to open for read: " + path.string()};
    }
    is.seekg(0, std::ios::end);
    const auto size = is.tellg();
    if (size < 0) {
        return Error{ErrorCode::IoError, "tellg failed on: " + path.string()};
    }
    is.seekg(0, std::ios::beg);
    std::vector<std::byte> bytes(static_cast<std::size_t>(size));
    if (!bytes.empty()) {
        is.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
        if (is.gcount() != static_cast<std::streamsize>(size)) {
            return Error{ErrorCode::IoError, "Short read on: " + path.string()};
        }
    }
    return bytes;
}

Expected<void> moveFileReplacing(const fs::path& src, const fs::path& dst) {
    if (dst.has_parent_path()) {
        auto dr = ensureDirectory(dst.parent_path());
        if (!dr.ok())
            return dr;
    }

    std::error_code ren_ec;
    fs::rename(src, dst, ren_ec);
    if (!ren_ec) {
        auto rd = fsync_dir(dst.parent_path());
        if (!rd.ok()) {
            spdlog::debug("fsync on dir failed (continuing): {}", dst.parent_path().string());
        }
        return Expected<void>{};
    }

    if (ren_ec != std::errc::cross_device_link) {
        return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() + ") from " +
                                             src.string() + " to " + dst.string()};
    }

    spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                 dst.string());
    auto copied = copy_file_fsync_replace(src, dst);
    if (!copied.ok())
        return copied;
    std::error_code del_ec;
    fs::remove(src, del_ec);
    if (del_ec) {
        spdlog::debug("moveFileReplacing: failed to remove source {}: {}", src.string(),
                      del_ec.message());
    }
    return Expected<void>{};
}

} // namespace ferry::downloader
