#include <ferry/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace ferry::config {

namespace {

std::string lowercase(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename T> std::optional<T> from_chars_exact(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    T out{};
    const auto* first = v.data();
    const auto* last = v.data() + v.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return out;
}

} // namespace

std::optional<std::int64_t> parse_int(std::string_view s) {
    return from_chars_exact<std::int64_t>(s);
}

std::optional<double> parse_double(std::string_view s) {
    return from_chars_exact<double>(s);
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    v = lowercase(v);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto v = parse_int(s);
    if (!v || *v < 0)
        return std::nullopt;
    return std::chrono::milliseconds(*v);
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section)
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            const char q = v.front();
            size_t close = v.find(q, 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        if (k == key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("FERRY_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "ferry" / "config.toml";
    }

    return configHome / "ferry" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "ferry";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "ferry";
    }
    return std::filesystem::temp_directory_path() / "ferry";
}

DownloaderSettings load_downloader_settings(const std::filesystem::path& config_path) {
    DownloaderSettings s;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::debug("config: {} not found, using downloader defaults", config_path.string());
        return s;
    }

    auto value = [&](const char* key) {
        return parse_config_value(config_path, "downloader", key);
    };
    auto warn_malformed = [&](const char* key, const std::string& raw) {
        spdlog::warn("config: ignoring malformed downloader.{} = '{}'", key, raw);
    };

    auto read_int = [&](const char* key, auto& field, std::int64_t min) {
        auto raw = value(key);
        if (raw.empty())
            return;
        auto v = parse_int(raw);
        if (!v || *v < min) {
            warn_malformed(key, raw);
            return;
        }
        field = static_cast<std::remove_reference_t<decltype(field)>>(*v);
    };
    auto read_ms = [&](const char* key, std::chrono::milliseconds& field) {
        auto raw = value(key);
        if (raw.empty())
            return;
        if (auto v = parse_ms(raw))
            field = *v;
        else
            warn_malformed(key, raw);
    };

    read_int("max_concurrent", s.maxConcurrent, 1);
    read_int("max_retries", s.maxRetries, 0);
    read_ms("retry_delay_ms", s.retryDelay);
    read_ms("poll_interval_ms", s.pollInterval);
    read_ms("save_debounce_ms", s.saveDebounce);
    read_int("history_max_entries", s.historyMaxEntries, 1);
    read_int("min_payload_bytes", s.minPayloadBytes, 0);

    std::int64_t hours = s.resumeTokenMaxAge.count();
    read_int("resume_token_max_age_hours", hours, 1);
    s.resumeTokenMaxAge = std::chrono::hours(hours);

    if (auto raw = value("allow_cellular"); !raw.empty()) {
        if (auto v = parse_bool(raw))
            s.allowCellular = *v;
        else
            warn_malformed("allow_cellular", raw);
    }
    if (auto raw = value("storage_margin"); !raw.empty()) {
        auto v = parse_double(raw);
        if (v && *v >= 0.0)
            s.storageMargin = *v;
        else
            warn_malformed("storage_margin", raw);
    }
    if (auto raw = value("data_dir"); !raw.empty())
        s.dataDir = expand_tilde(raw);
    if (auto raw = value("log_level"); !raw.empty())
        s.logLevel = lowercase(raw);

    return s;
}

std::filesystem::path resolve_downloads_dir(const DownloaderSettings& settings) {
    if (!settings.dataDir.empty())
        return settings.dataDir;
    if (const char* env = std::getenv("FERRY_DATA_DIR"); env && *env)
        return std::filesystem::path(env);
    return get_data_dir() / "downloads";
}

downloader::EngineConfig to_engine_config(const DownloaderSettings& settings) {
    downloader::EngineConfig c;
    c.maxConcurrent = settings.maxConcurrent;
    c.maxRetries = settings.maxRetries;
    c.retryDelay = settings.retryDelay;
    c.pollInterval = settings.pollInterval;
    c.allowCellular = settings.allowCellular;
    return c;
}

downloader::StateStoreConfig to_state_store_config(const DownloaderSettings& settings) {
    downloader::StateStoreConfig c;
    c.debounce = settings.saveDebounce;
    return c;
}

downloader::CoordinatorConfig to_coordinator_config(const DownloaderSettings& settings) {
    downloader::CoordinatorConfig c;
    c.minPayloadBytes = settings.minPayloadBytes;
    return c;
}

downloader::DownloadStackOptions to_stack_options(const DownloaderSettings& settings) {
    downloader::DownloadStackOptions o;
    o.dataDir = resolve_downloads_dir(settings);
    o.engine = to_engine_config(settings);
    o.state = to_state_store_config(settings);
    o.coordinator = to_coordinator_config(settings);
    o.historyMaxEntries = settings.historyMaxEntries;
    o.resumeTokenMaxAge = settings.resumeTokenMaxAge;
    o.storageMargin = settings.storageMargin;
    return o;
}

bool apply_log_level(std::string_view level) {
    const auto name = lowercase(level);
    const auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        spdlog::warn("config: unknown log level '{}'", name);
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace ferry::config
