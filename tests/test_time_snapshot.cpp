// tests/test_time_snapshot.cpp
//
// Coverage for skywatch/time/TimeSnapshot: the five-field validity rule, the
// Absent/Partial/Complete reading, and the tolerant JSON reader used on feed values.

#include <doctest/doctest.h>

#include "skywatch/time/TimeSnapshot.hpp"

#include "support/EngineFakes.h"

#include <array>
#include <optional>
#include <variant>

using namespace skywatch;
using skywatch::time::json;

TEST_CASE("time::IsValid requires second, minute, day, month and year")
{
    const time::RawTimeSnapshot full = testing::MakeRaw(1000, 1, 1);
    CHECK(time::IsValid(full));

    // Every subset of the required fields short of all five is invalid.
    using Field = std::optional<int> time::RawTimeSnapshot::*;
    const std::array<Field, 5> required = {
        &time::RawTimeSnapshot::second, &time::RawTimeSnapshot::minute,
        &time::RawTimeSnapshot::day,    &time::RawTimeSnapshot::month,
        &time::RawTimeSnapshot::year,
    };

    for (unsigned mask = 0; mask < 31u; ++mask)
    {
        time::RawTimeSnapshot r = full;
        for (std::size_t bit = 0; bit < required.size(); ++bit)
        {
            if ((mask & (1u << bit)) == 0)
                (r.*required[bit]).reset();
        }
        INFO("mask: ", mask);
        CHECK_FALSE(time::IsValid(r));
    }
}

TEST_CASE("time::IsValid ignores hour and weekday")
{
    time::RawTimeSnapshot r = testing::MakeRaw(1000, 1, 1);
    r.hour.reset();
    r.dayOfTheWeek.reset();
    CHECK(time::IsValid(r));
}

TEST_CASE("time::Inspect sorts readings into Absent, Partial and Complete")
{
    CHECK(std::holds_alternative<time::Absent>(time::Inspect(std::nullopt)));

    time::RawTimeSnapshot partial = testing::MakeRaw(1000, 1, 1);
    partial.minute.reset();
    const time::TimeReading p = time::Inspect(partial);
    REQUIRE(std::holds_alternative<time::Partial>(p));
    CHECK(std::get<time::Partial>(p).raw.day == 1);
    CHECK(time::CompleteSnapshot(p) == nullptr);

    const time::TimeReading c = time::Inspect(testing::MakeRaw(1000, 2, 3, 4, 5, 6));
    REQUIRE(time::IsComplete(c));
    const time::TimeSnapshot* s = time::CompleteSnapshot(c);
    REQUIRE(s != nullptr);
    CHECK(s->year == 1000);
    CHECK(s->month == 2);
    CHECK(s->day == 3);
    CHECK(s->hour == 4);
    CHECK(s->minute == 5);
    CHECK(s->second == 6);
}

TEST_CASE("time::ParseTimeSnapshot treats null members as absent")
{
    const json j = json::parse(R"({"second": null, "minute": 3, "day": 1, "month": 1, "year": 1000})");
    const auto raw = time::ParseTimeSnapshot(j);
    REQUIRE(raw.has_value());
    CHECK_FALSE(raw->second.has_value());
    CHECK(std::holds_alternative<time::Partial>(time::Inspect(raw)));
}

TEST_CASE("time::ParseTimeSnapshot returns nullopt for null and non-object values")
{
    CHECK_FALSE(time::ParseTimeSnapshot(json(nullptr)).has_value());
    CHECK_FALSE(time::ParseTimeSnapshot(json::array({1, 2, 3})).has_value());
    CHECK_FALSE(time::ParseTimeSnapshot(json("1000-01-01")).has_value());
}

TEST_CASE("time::ParseTimeSnapshot rejects non-integral numbers and strings")
{
    const json j = json::parse(R"({"second": 1.5, "minute": "3", "day": 2.0, "month": 1, "year": 1000})");
    const auto raw = time::ParseTimeSnapshot(j);
    REQUIRE(raw.has_value());
    CHECK_FALSE(raw->second.has_value());
    CHECK_FALSE(raw->minute.has_value());
    CHECK(raw->day == 2);
}

TEST_CASE("time::ParseTimeSnapshot treats numbers outside the int range as absent")
{
    // 4294968296 would wrap to 1000 if narrowed.
    const json wide = json::parse(R"({"second": 0, "minute": 0, "day": 1, "month": 1, "year": 4294968296})");
    const auto a = time::ParseTimeSnapshot(wide);
    REQUIRE(a.has_value());
    CHECK_FALSE(a->year.has_value());
    CHECK(std::holds_alternative<time::Partial>(time::Inspect(a)));

    const json negative = json::parse(R"({"second": 0, "minute": 0, "day": 1, "month": 1, "year": -4294967296})");
    const auto b = time::ParseTimeSnapshot(negative);
    REQUIRE(b.has_value());
    CHECK_FALSE(b->year.has_value());

    const json huge = json::parse(R"({"second": 0, "minute": 0, "day": 1, "month": 1, "year": 1e300})");
    const auto c = time::ParseTimeSnapshot(huge);
    REQUIRE(c.has_value());
    CHECK_FALSE(c->year.has_value());
    CHECK(std::holds_alternative<time::Partial>(time::Inspect(c)));

    const json edge = json::parse(R"({"second": 0, "minute": 0, "day": -2147483648, "month": 1, "year": 2147483647})");
    const auto d = time::ParseTimeSnapshot(edge);
    REQUIRE(d.has_value());
    CHECK(d->year == 2147483647);
    CHECK(d->day == -2147483648);
}

TEST_CASE("time snapshot JSON keeps calendar display fields and unknown members")
{
    const json j = json::parse(R"({
        "second": 0, "minute": 30, "hour": 14, "day": 5, "month": 6, "year": 1492,
        "dayOfTheWeek": 2,
        "weekdays": ["Moonday", "Toilday", "Wealday"],
        "display": {"date": "5th of Flamerule", "time": "2:30 PM", "yearName": "Year of Shadows"},
        "era": "DR"
    })");

    const auto raw = time::ParseTimeSnapshot(j);
    REQUIRE(raw.has_value());
    REQUIRE(raw->display.has_value());
    CHECK(raw->display->date == "5th of Flamerule");
    CHECK(raw->extras.value("era", "") == "DR");

    const time::TimeReading reading = time::Inspect(raw);
    const time::TimeSnapshot* s = time::CompleteSnapshot(reading);
    REQUIRE(s != nullptr);
    CHECK(time::WeekdayName(*s) == "Wealday");
    CHECK(time::FormatDate(*s) == "5/6/1492");

    const json back = *s;
    CHECK(back["era"] == "DR");
    CHECK(back["display"]["yearName"] == "Year of Shadows");
    CHECK(back["hour"] == 14);
}

TEST_CASE("time::WeekdayName is empty for an out-of-range index")
{
    time::TimeSnapshot s = testing::MakeSnapshot(1000, 1, 1);
    s.weekdays = {"A", "B"};
    s.dayOfTheWeek = 7;
    CHECK(time::WeekdayName(s).empty());
    s.dayOfTheWeek.reset();
    CHECK(time::WeekdayName(s).empty());
}
