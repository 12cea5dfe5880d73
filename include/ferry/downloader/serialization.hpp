#pragma once

/*
 * JSON encoding of the persisted records (nlohmann::json, ADL hooks).
 *
 * Dates are ISO-8601 UTC with millisecond precision ("2025-01-31T08:15:00.250Z").
 * Keys come out sorted because nlohmann::json objects are ordered maps.
 * from_json throws nlohmann::json::exception or std::invalid_argument on bad
 * input; callers convert that into an Error at their boundary.
 */

#include <ferry/downloader/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ferry::downloader {

std::string formatIso8601(Timestamp t);
std::optional<Timestamp> parseIso8601(std::string_view s);

void to_json(nlohmann::json& j, const Task& t);
void from_json(const nlohmann::json& j, Task& t);

void to_json(nlohmann::json& j, const QueueSnapshot& s);
void from_json(const nlohmann::json& j, QueueSnapshot& s);

void to_json(nlohmann::json& j, const HistoryEntry& e);
void from_json(const nlohmann::json& j, HistoryEntry& e);

} // namespace ferry::downloader
