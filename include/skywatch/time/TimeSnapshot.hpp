#pragma once
// include/skywatch/time/TimeSnapshot.hpp
//
// Calendar readings delivered by the external time feed.
//
// The feed may emit partially-initialized values while it starts up, so the wire form
// (RawTimeSnapshot) keeps every field optional. Inspect() turns a raw reading into a
// TimeReading, which is either Absent, Partial or Complete. Only a Complete reading
// carries a TimeSnapshot, and only a TimeSnapshot is ever compared for date changes.

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skywatch::time {

using json = nlohmann::json;

// Formatting fields supplied by the calendar. Never interpreted by the engine.
struct DisplayFields {
    std::string date;
    std::string time;

    json extras = json::object();
};

struct RawTimeSnapshot {
    std::optional<int> second;
    std::optional<int> minute;
    std::optional<int> hour;
    std::optional<int> day;
    std::optional<int> month;
    std::optional<int> year;
    std::optional<int> dayOfTheWeek;

    std::optional<DisplayFields> display;
    std::vector<std::string>     weekdays;

    // Unknown fields from the feed, preserved and round-tripped.
    json extras = json::object();
};

// A fully populated reading. Only constructed through Inspect().
struct TimeSnapshot {
    int second = 0;
    int minute = 0;
    int day    = 0;
    int month  = 0;
    int year   = 0;

    std::optional<int> hour;
    std::optional<int> dayOfTheWeek;

    std::optional<DisplayFields> display;
    std::vector<std::string>     weekdays;

    json extras = json::object();

    [[nodiscard]] bool SameDate(const TimeSnapshot& other) const noexcept
    {
        return day == other.day && month == other.month && year == other.year;
    }

    [[nodiscard]] RawTimeSnapshot ToRaw() const;
};

struct Absent {};

struct Partial {
    RawTimeSnapshot raw;
};

struct Complete {
    TimeSnapshot snapshot;
};

using TimeReading = std::variant<Absent, Partial, Complete>;

// True iff second, minute, day, month and year are all present.
[[nodiscard]] bool IsValid(const RawTimeSnapshot& raw) noexcept;

[[nodiscard]] TimeReading Inspect(const std::optional<RawTimeSnapshot>& raw);

[[nodiscard]] inline bool IsComplete(const TimeReading& r) noexcept
{
    return std::holds_alternative<Complete>(r);
}

// Returns the snapshot of a Complete reading, nullptr otherwise.
[[nodiscard]] inline const TimeSnapshot* CompleteSnapshot(const TimeReading& r) noexcept
{
    if (const auto* c = std::get_if<Complete>(&r))
        return &c->snapshot;
    return nullptr;
}

// "day/month/year", the compact form used next to the calendar's own display string.
[[nodiscard]] std::string FormatDate(const TimeSnapshot& s);

// Weekday name looked up from the calendar's weekday list; empty when unknown.
[[nodiscard]] std::string WeekdayName(const TimeSnapshot& s);

// ---------- JSON (de)serialization ----------
// null members are read back as absent, so a feed value like {"second": null} stays Partial.
void to_json(json& j, const DisplayFields& v);
void from_json(const json& j, DisplayFields& v);

void to_json(json& j, const RawTimeSnapshot& v);
void from_json(const json& j, RawTimeSnapshot& v);

void to_json(json& j, const TimeSnapshot& v);

// Parses one feed value. null (or a non-object) is "no information this tick".
[[nodiscard]] std::optional<RawTimeSnapshot> ParseTimeSnapshot(const json& j);

} // namespace skywatch::time
