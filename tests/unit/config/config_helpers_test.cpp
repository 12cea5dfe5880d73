#include <gtest/gtest.h>
#include <ferry/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include "unit/downloader/test_support.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace ferry::config;
using ferry::downloader::test::TempDir;
using ferry::downloader::test::write_file;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = old;
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_)
            ::setenv(name_, old_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

fs::path write_config(const TempDir& tmp, const std::string& body) {
    auto p = tmp.path / "config.toml";
    write_file(p, body);
    return p;
}

} // namespace

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
    EXPECT_EQ(unquote("\""), "\"");
}

TEST(ConfigHelpersTest, ScalarParsing) {
    EXPECT_EQ(parse_int(" 42 "), 42);
    EXPECT_EQ(parse_int("-7"), -7);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_FALSE(parse_int("").has_value());

    EXPECT_DOUBLE_EQ(*parse_double("0.25"), 0.25);
    EXPECT_FALSE(parse_double("abc").has_value());

    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_FALSE(parse_bool("maybe").has_value());

    EXPECT_EQ(parse_ms("1500"), std::chrono::milliseconds(1500));
    EXPECT_FALSE(parse_ms("-1").has_value());
}

TEST(ConfigHelpersTest, ParseConfigValueHonoursSectionsAndComments) {
    TempDir tmp;
    auto cfg = write_config(tmp, R"(# ferry configuration
max_concurrent = 9

[core]
max_concurrent = 8

[downloader]
max_concurrent = 5   # inline comment
data_dir = "/srv/ferry # not a comment"
log_level = 'debug'

[other]
log_level = "trace"
)");

    EXPECT_EQ(parse_config_value(cfg, "downloader", "max_concurrent"), "5");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "data_dir"), "/srv/ferry # not a comment");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "log_level"), "debug");
    EXPECT_EQ(parse_config_value(cfg, "core", "max_concurrent"), "8");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "missing"), "");
    EXPECT_EQ(parse_config_value(tmp.path / "absent.toml", "downloader", "max_concurrent"), "");
}

TEST(ConfigHelpersTest, MissingFileYieldsDefaults) {
    TempDir tmp;
    auto s = load_downloader_settings(tmp.path / "none.toml");
    EXPECT_EQ(s.maxConcurrent, 3);
    EXPECT_EQ(s.maxRetries, 3);
    EXPECT_EQ(s.retryDelay, std::chrono::milliseconds(2000));
    EXPECT_EQ(s.resumeTokenMaxAge, std::chrono::hours(168));
    EXPECT_TRUE(s.allowCellular);
    EXPECT_TRUE(s.dataDir.empty());
    EXPECT_EQ(s.logLevel, "info");
}

TEST(ConfigHelpersTest, LoadsDownloaderSection) {
    TempDir tmp;
    auto cfg = write_config(tmp, R"([downloader]
max_concurrent = 2
max_retries = 0
retry_delay_ms = 250
poll_interval_ms = 100
save_debounce_ms = 50
history_max_entries = 20
resume_token_max_age_hours = 12
allow_cellular = false
min_payload_bytes = 512
storage_margin = 0.25
data_dir = "/var/lib/ferry"
log_level = "WARN"
)");
    auto s = load_downloader_settings(cfg);
    EXPECT_EQ(s.maxConcurrent, 2);
    EXPECT_EQ(s.maxRetries, 0);
    EXPECT_EQ(s.retryDelay, std::chrono::milliseconds(250));
    EXPECT_EQ(s.pollInterval, std::chrono::milliseconds(100));
    EXPECT_EQ(s.saveDebounce, std::chrono::milliseconds(50));
    EXPECT_EQ(s.historyMaxEntries, 20u);
    EXPECT_EQ(s.resumeTokenMaxAge, std::chrono::hours(12));
    EXPECT_FALSE(s.allowCellular);
    EXPECT_EQ(s.minPayloadBytes, 512u);
    EXPECT_DOUBLE_EQ(s.storageMargin, 0.25);
    EXPECT_EQ(s.dataDir, fs::path("/var/lib/ferry"));
    EXPECT_EQ(s.logLevel, "warn");

    auto engine = to_engine_config(s);
    EXPECT_EQ(engine.maxConcurrent, 2);
    EXPECT_EQ(engine.maxRetries, 0);
    EXPECT_EQ(engine.retryDelay, std::chrono::milliseconds(250));
    EXPECT_FALSE(engine.allowCellular);
    EXPECT_EQ(to_state_store_config(s).debounce, std::chrono::milliseconds(50));
    EXPECT_EQ(to_coordinator_config(s).minPayloadBytes, 512u);

    auto opts = to_stack_options(s);
    EXPECT_EQ(opts.dataDir, fs::path("/var/lib/ferry"));
    EXPECT_EQ(opts.historyMaxEntries, 20u);
    EXPECT_EQ(opts.resumeTokenMaxAge, std::chrono::hours(12));
    EXPECT_DOUBLE_EQ(opts.storageMargin, 0.25);
}

TEST(ConfigHelpersTest, MalformedValuesKeepDefaults) {
    TempDir tmp;
    auto cfg = write_config(tmp, R"([downloader]
max_concurrent = 0
max_retries = many
retry_delay_ms = -5
allow_cellular = sometimes
storage_margin = -0.5
resume_token_max_age_hours = 0
)");
    auto s = load_downloader_settings(cfg);
    EXPECT_EQ(s.maxConcurrent, 3);
    EXPECT_EQ(s.maxRetries, 3);
    EXPECT_EQ(s.retryDelay, std::chrono::milliseconds(2000));
    EXPECT_TRUE(s.allowCellular);
    EXPECT_DOUBLE_EQ(s.storageMargin, 0.10);
    EXPECT_EQ(s.resumeTokenMaxAge, std::chrono::hours(168));
}

TEST(ConfigHelpersTest, DataDirExpandsTilde) {
    TempDir tmp;
    ScopedEnv home("HOME", tmp.path.string());
    auto cfg = write_config(tmp, "[downloader]\ndata_dir = \"~/maps\"\n");
    auto s = load_downloader_settings(cfg);
    EXPECT_EQ(s.dataDir, tmp.path / "maps");
}

TEST(ConfigHelpersTest, ResolveDownloadsDirPrecedence) {
    TempDir tmp;
    DownloaderSettings s;
    s.dataDir = tmp.path / "explicit";
    EXPECT_EQ(resolve_downloads_dir(s), tmp.path / "explicit");

    s.dataDir.clear();
    {
        ScopedEnv env("FERRY_DATA_DIR", (tmp.path / "env").string());
        EXPECT_EQ(resolve_downloads_dir(s), tmp.path / "env");
    }
    ScopedEnv noEnv("FERRY_DATA_DIR", "");
    ScopedEnv xdg("XDG_DATA_HOME", (tmp.path / "xdg").string());
    EXPECT_EQ(resolve_downloads_dir(s), tmp.path / "xdg" / "ferry" / "downloads");
}

TEST(ConfigHelpersTest, ConfigPathOverrideAndEnvironment) {
    TempDir tmp;
    EXPECT_EQ(get_config_path("/etc/ferry.toml"), fs::path("/etc/ferry.toml"));
    {
        ScopedEnv env("FERRY_CONFIG", (tmp.path / "from-env.toml").string());
        EXPECT_EQ(get_config_path(), tmp.path / "from-env.toml");
    }
    ScopedEnv noEnv("FERRY_CONFIG", "");
    ScopedEnv xdg("XDG_CONFIG_HOME", (tmp.path / "cfg").string());
    EXPECT_EQ(get_config_path(), tmp.path / "cfg" / "ferry" / "config.toml");
}

TEST(ConfigHelpersTest, ApplyLogLevel) {
    const auto before = spdlog::get_level();
    EXPECT_TRUE(apply_log_level("DEBUG"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(apply_log_level("off"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
    EXPECT_FALSE(apply_log_level("chatty"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
    spdlog::set_level(before);
}
