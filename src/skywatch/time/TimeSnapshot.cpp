// src/skywatch/time/TimeSnapshot.cpp
#include "skywatch/time/TimeSnapshot.hpp"

#include "skywatch/detail/JsonExtras.h"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>

namespace skywatch::time {

// ---------- helpers ----------

namespace {

using detail::collect_extras;
using detail::merge_extras;

constexpr int kIntMin = std::numeric_limits<int>::min();
constexpr int kIntMax = std::numeric_limits<int>::max();

// Missing, null, non-integral and out-of-int-range members all read as absent.
std::optional<int> optional_int(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned()) {
        const auto u = it->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(kIntMax)) return std::nullopt;
        return static_cast<int>(u);
    }
    if (it->is_number_integer()) {
        const auto v = it->get<std::int64_t>();
        if (v < kIntMin || v > kIntMax) return std::nullopt;
        return static_cast<int>(v);
    }
    if (it->is_number_float()) {
        const double d = it->get<double>();
        if (!std::isfinite(d) || d < static_cast<double>(kIntMin) || d > static_cast<double>(kIntMax))
            return std::nullopt;
        if (std::trunc(d) != d) return std::nullopt;
        return static_cast<int>(d);
    }
    return std::nullopt;
}

void put_optional(json& j, const char* key, const std::optional<int>& v)
{
    if (v) j[key] = *v;
    else   j[key] = nullptr;
}

constexpr std::initializer_list<const char*> kSnapshotKeys = {
    "second", "minute", "hour", "day", "month", "year", "dayOfTheWeek", "display", "weekdays"
};

} // namespace

// ---------- validation ----------

bool IsValid(const RawTimeSnapshot& raw) noexcept
{
    return raw.second.has_value() && raw.minute.has_value() && raw.day.has_value()
        && raw.month.has_value() && raw.year.has_value();
}

TimeReading Inspect(const std::optional<RawTimeSnapshot>& raw)
{
    if (!raw)
        return Absent{};

    if (!IsValid(*raw))
        return Partial{*raw};

    TimeSnapshot s;
    s.second       = *raw->second;
    s.minute       = *raw->minute;
    s.day          = *raw->day;
    s.month        = *raw->month;
    s.year         = *raw->year;
    s.hour         = raw->hour;
    s.dayOfTheWeek = raw->dayOfTheWeek;
    s.display      = raw->display;
    s.weekdays     = raw->weekdays;
    s.extras       = raw->extras;
    return Complete{std::move(s)};
}

RawTimeSnapshot TimeSnapshot::ToRaw() const
{
    RawTimeSnapshot raw;
    raw.second       = second;
    raw.minute       = minute;
    raw.hour         = hour;
    raw.day          = day;
    raw.month        = month;
    raw.year         = year;
    raw.dayOfTheWeek = dayOfTheWeek;
    raw.display      = display;
    raw.weekdays     = weekdays;
    raw.extras       = extras;
    return raw;
}

std::string FormatDate(const TimeSnapshot& s)
{
    return std::to_string(s.day) + "/" + std::to_string(s.month) + "/" + std::to_string(s.year);
}

std::string WeekdayName(const TimeSnapshot& s)
{
    if (!s.dayOfTheWeek)
        return {};
    const int idx = *s.dayOfTheWeek;
    if (idx < 0 || static_cast<std::size_t>(idx) >= s.weekdays.size())
        return {};
    return s.weekdays[static_cast<std::size_t>(idx)];
}

// ---------- DisplayFields ----------
void to_json(json& j, const DisplayFields& v) {
    j = json::object({
        {"date", v.date},
        {"time", v.time}
    });
    merge_extras(j, v.extras);
}
void from_json(const json& j, DisplayFields& v) {
    v.date   = j.value("date", std::string{});
    v.time   = j.value("time", std::string{});
    v.extras = collect_extras(j, {"date", "time"});
}

// ---------- RawTimeSnapshot ----------
void to_json(json& j, const RawTimeSnapshot& v) {
    j = json::object();
    put_optional(j, "second", v.second);
    put_optional(j, "minute", v.minute);
    put_optional(j, "hour", v.hour);
    put_optional(j, "day", v.day);
    put_optional(j, "month", v.month);
    put_optional(j, "year", v.year);
    put_optional(j, "dayOfTheWeek", v.dayOfTheWeek);
    if (v.display) j["display"] = *v.display;
    if (!v.weekdays.empty()) j["weekdays"] = v.weekdays;
    merge_extras(j, v.extras);
}
void from_json(const json& j, RawTimeSnapshot& v) {
    v = {};
    if (!j.is_object()) return;

    v.second       = optional_int(j, "second");
    v.minute       = optional_int(j, "minute");
    v.hour         = optional_int(j, "hour");
    v.day          = optional_int(j, "day");
    v.month        = optional_int(j, "month");
    v.year         = optional_int(j, "year");
    v.dayOfTheWeek = optional_int(j, "dayOfTheWeek");

    if (auto it = j.find("display"); it != j.end() && it->is_object())
        v.display = it->get<DisplayFields>();

    if (auto it = j.find("weekdays"); it != j.end() && it->is_array()) {
        for (const auto& w : *it) {
            if (w.is_string()) v.weekdays.push_back(w.get<std::string>());
        }
    }

    v.extras = collect_extras(j, kSnapshotKeys);
}

// ---------- TimeSnapshot ----------
void to_json(json& j, const TimeSnapshot& v) {
    to_json(j, v.ToRaw());
}

std::optional<RawTimeSnapshot> ParseTimeSnapshot(const json& j)
{
    if (!j.is_object())
        return std::nullopt;
    return j.get<RawTimeSnapshot>();
}

} // namespace skywatch::time
