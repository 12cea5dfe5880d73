/*
 * ferry/src/downloader/serialization.cpp
 *
 * nlohmann::json mapping for Task, QueueSnapshot and HistoryEntry.
 */

#include <ferry/downloader/serialization.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace ferry::downloader {

using nlohmann::json;

namespace {

std::time_t utc_to_time_t(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

template <typename T> void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v)
        j[key] = *v;
}

void put_time(json& j, const char* key, const std::optional<Timestamp>& t) {
    if (t)
        j[key] = formatIso8601(*t);
}

Timestamp get_time(const json& j, const char* key) {
    auto raw = j.at(key).get<std::string>();
    auto t = parseIso8601(raw);
    if (!t)
        throw std::invalid_argument(fmt::format("invalid timestamp for '{}': {}", key, raw));
    return *t;
}

std::optional<Timestamp> get_optional_time(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    return get_time(j, key);
}

std::optional<std::string> get_optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    return j[key].get<std::string>();
}

} // namespace

std::string formatIso8601(Timestamp t) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch());
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms);
    auto frac = (ms - secs).count();
    if (frac < 0) {
        frac += 1000;
        secs -= std::chrono::seconds{1};
    }
    const std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                       static_cast<int>(frac));
}

std::optional<Timestamp> parseIso8601(std::string_view s) {
    // YYYY-MM-DDTHH:MM:SS[.fff...](Z|+HH:MM|-HH:MM)
    if (s.size() < 19)
        return std::nullopt;
    std::tm tm{};
    int consumed = 0;
    const std::string head(s.substr(0, 19));
    if (std::sscanf(head.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6 ||
        consumed != 19) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::size_t pos = 19;
    int millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3)
                millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (int d = digits; d < 3; ++d)
            millis *= 10;
    }

    int offsetMinutes = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        const int sign = s[pos] == '-' ? -1 : 1;
        int hh = 0;
        int mm = 0;
        const std::string tz(s.substr(pos + 1));
        if (std::sscanf(tz.c_str(), "%2d:%2d", &hh, &mm) != 2)
            return std::nullopt;
        offsetMinutes = sign * (hh * 60 + mm);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size())
        return std::nullopt;

    const std::time_t tt = utc_to_time_t(&tm);
    if (tt == static_cast<std::time_t>(-1))
        return std::nullopt;
    return Clock::from_time_t(tt) + std::chrono::milliseconds{millis} -
           std::chrono::minutes{offsetMinutes};
}

// ---------- Task ----------

void to_json(json& j, const Task& t) {
    j = json{{"id", t.id},
             {"url", t.url},
             {"category", t.category},
             {"partIndex", t.partIndex},
             {"partCount", t.partCount},
             {"datasetName", t.datasetName},
             {"status", statusName(t.status)},
             {"progress", t.progress},
             {"bytesDownloaded", t.bytesDownloaded},
             {"totalBytes", t.totalBytes},
             {"createdAt", formatIso8601(t.createdAt)}};
    put_optional(j, "errorMessage", t.errorMessage);
    put_optional(j, "resumeTokenPath", t.resumeTokenPath);
    put_time(j, "startedAt", t.startedAt);
    put_time(j, "completedAt", t.completedAt);
}

void from_json(const json& j, Task& t) {
    t.id = j.at("id").get<std::string>();
    t.url = j.at("url").get<std::string>();
    t.category = j.value("category", std::string{});
    t.partIndex = j.value("partIndex", 1);
    t.partCount = j.value("partCount", 1);
    t.datasetName = j.value("datasetName", std::string{});

    const auto statusRaw = j.at("status").get<std::string>();
    auto status = statusFromName(statusRaw);
    if (!status)
        throw std::invalid_argument("unknown task status: " + statusRaw);
    t.status = *status;

    t.progress = j.value("progress", 0.0);
    t.bytesDownloaded = j.value("bytesDownloaded", std::uint64_t{0});
    t.totalBytes = j.value("totalBytes", std::uint64_t{0});
    t.errorMessage = get_optional_string(j, "errorMessage");
    t.resumeTokenPath = get_optional_string(j, "resumeTokenPath");
    t.createdAt = get_time(j, "createdAt");
    t.startedAt = get_optional_time(j, "startedAt");
    t.completedAt = get_optional_time(j, "completedAt");
}

// ---------- QueueSnapshot ----------

void to_json(json& j, const QueueSnapshot& s) {
    j = json{{"tasks", s.tasks},
             {"queueOrder", s.order},
             {"isPaused", s.paused},
             {"maxConcurrentDownloads", s.maxConcurrent},
             {"exportedAt", formatIso8601(s.exportedAt)},
             {"version", s.version}};
}

void from_json(const json& j, QueueSnapshot& s) {
    s.tasks = j.at("tasks").get<std::vector<Task>>();
    s.order = j.at("queueOrder").get<std::vector<std::string>>();
    s.paused = j.value("isPaused", false);
    s.maxConcurrent = j.value("maxConcurrentDownloads", 3);
    s.exportedAt = get_time(j, "exportedAt");
    s.version = j.value("version", 0);
}

// ---------- HistoryEntry ----------

void to_json(json& j, const HistoryEntry& e) {
    j = json{{"id", e.id},
             {"taskId", e.taskId},
             {"url", e.url},
             {"category", e.category},
             {"datasetName", e.datasetName},
             {"startedAt", formatIso8601(e.startedAt)},
             {"recordedAt", formatIso8601(e.recordedAt)},
             {"bytesDownloaded", e.bytesDownloaded},
             {"totalBytes", e.totalBytes},
             {"success", e.success}};
    put_time(j, "completedAt", e.completedAt);
    put_optional(j, "errorMessage", e.errorMessage);
}

void from_json(const json& j, HistoryEntry& e) {
    e.id = j.at("id").get<std::string>();
    e.taskId = j.at("taskId").get<std::string>();
    e.url = j.value("url", std::string{});
    e.category = j.value("category", std::string{});
    e.datasetName = j.value("datasetName", std::string{});
    e.startedAt = get_time(j, "startedAt");
    e.completedAt = get_optional_time(j, "completedAt");
    e.recordedAt = j.contains("recordedAt") ? get_time(j, "recordedAt")
                                            : e.completedAt.value_or(e.startedAt);
    e.bytesDownloaded = j.value("bytesDownloaded", std::uint64_t{0});
    e.totalBytes = j.value("totalBytes", std::uint64_t{0});
    e.success = j.value("success", false);
    e.errorMessage = get_optional_string(j, "errorMessage");
}

} // namespace ferry::downloader
