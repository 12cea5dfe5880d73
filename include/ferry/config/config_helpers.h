#pragma once

#include <ferry/downloader/download_engine.hpp>
#include <ferry/downloader/download_stack.hpp>
#include <ferry/downloader/state_store.hpp>
#include <ferry/downloader/transfer_coordinator.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace ferry::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Scalar parsing; nothing on malformed input
std::optional<std::int64_t> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path ($FERRY_CONFIG, then XDG)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// $XDG_DATA_HOME/ferry or ~/.local/share/ferry
std::filesystem::path get_data_dir();

/// [downloader] section of config.toml. Missing or malformed keys keep the default.
struct DownloaderSettings {
    int maxConcurrent{3};
    int maxRetries{3};
    std::chrono::milliseconds retryDelay{2000};
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds saveDebounce{1000};
    std::size_t historyMaxEntries{1000};
    std::chrono::hours resumeTokenMaxAge{168};
    bool allowCellular{true};
    std::uint64_t minPayloadBytes{2048};
    double storageMargin{0.10};
    std::filesystem::path dataDir; // empty = get_data_dir() / "downloads"
    std::string logLevel{"info"};
};

DownloaderSettings load_downloader_settings(const std::filesystem::path& config_path);

/// data_dir from the settings, $FERRY_DATA_DIR, or the XDG default.
std::filesystem::path resolve_downloads_dir(const DownloaderSettings& settings);

downloader::EngineConfig to_engine_config(const DownloaderSettings& settings);
downloader::StateStoreConfig to_state_store_config(const DownloaderSettings& settings);
downloader::CoordinatorConfig to_coordinator_config(const DownloaderSettings& settings);
downloader::DownloadStackOptions to_stack_options(const DownloaderSettings& settings);

/// trace|debug|info|warn|error|critical|off. Returns false for an unknown level.
bool apply_log_level(std::string_view level);

} // namespace ferry::config
