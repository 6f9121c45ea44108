// tests/test_module_settings.cpp
//
// Coverage for store::ModuleSettings: typed keys over the shared store, tolerant reads of
// hand-edited values, and the weather record's stored JSON form.

#include <doctest/doctest.h>

#include "skywatch/store/ModuleSettings.hpp"

#include "support/EngineFakes.h"

using namespace skywatch;
using store::json;
namespace Keys = store::SettingKeys;

TEST_CASE("ModuleSettings: record round-trips through the lastWeatherData key")
{
    store::MemoryKeyValueStore kv;
    store::ModuleSettings settings(kv);

    auto none = settings.LastWeather();
    REQUIRE(none.has_value());
    CHECK_FALSE(none->has_value());

    weather::WeatherRecord r = testing::MakeRecord(testing::MakeSnapshot(1000, 4, 5, 6, 7, 8), 72);
    r.content.climate = {weather::Climate::Hot, weather::Humidity::Barren, weather::Season::Summer};
    r.content.condition = weather::Condition::Heatwave;
    REQUIRE(settings.SetLastWeather(r).has_value());

    auto stored = kv.Get(Keys::kLastWeatherData);
    REQUIRE(stored.has_value());
    REQUIRE(stored->has_value());
    const json& j = **stored;
    CHECK(j["temperature"] == 72);
    CHECK(j["climate"] == 2);
    CHECK(j["date"]["day"] == 5);

    auto back = settings.LastWeather();
    REQUIRE(back.has_value());
    REQUIRE(back->has_value());
    CHECK((*back)->content.condition == weather::Condition::Heatwave);
    CHECK((*back)->content.climate.season == weather::Season::Summer);
    REQUIRE((*back)->date.has_value());
    CHECK((*back)->date->minute == 7);
}

TEST_CASE("ModuleSettings: a stored record without a complete date reads back undated")
{
    store::MemoryKeyValueStore kv;
    REQUIRE(kv.Set(Keys::kLastWeatherData, json::parse(R"({
        "climate": 1, "humidity": 1, "season": 0, "condition": 2,
        "temperature": 55, "description": "Steady rain falls throughout the day.",
        "date": {"day": 3, "month": 2, "year": 1000, "second": null, "minute": 0}
    })")).has_value());

    store::ModuleSettings settings(kv);
    auto r = settings.LastWeather();
    REQUIRE(r.has_value());
    REQUIRE(r->has_value());
    CHECK_FALSE((*r)->date.has_value());
    CHECK((*r)->content.condition == weather::Condition::Rain);
}

TEST_CASE("ModuleSettings: unknown record members survive a rewrite")
{
    store::MemoryKeyValueStore kv;
    REQUIRE(kv.Set(Keys::kLastWeatherData, json::parse(R"({
        "climate": 0, "humidity": 1, "season": 3, "condition": 5, "temperature": 20,
        "description": "Snow drifts down from a pale sky.", "date": null,
        "windSpeed": 12
    })")).has_value());

    store::ModuleSettings settings(kv);
    auto r = settings.LastWeather();
    REQUIRE(r.has_value());
    REQUIRE(r->has_value());
    REQUIRE(settings.SetLastWeather(**r).has_value());

    CHECK((**kv.Get(Keys::kLastWeatherData))["windSpeed"] == 12);
}

TEST_CASE("ModuleSettings: a non-object record is a TypeError")
{
    store::MemoryKeyValueStore kv;
    REQUIRE(kv.Set(Keys::kLastWeatherData, "sunny").has_value());

    store::ModuleSettings settings(kv);
    auto r = settings.LastWeather();
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == store::StoreError::Code::TypeError);
}

TEST_CASE("ModuleSettings: null record means nothing stored")
{
    store::MemoryKeyValueStore kv;
    REQUIRE(kv.Set(Keys::kLastWeatherData, nullptr).has_value());

    auto r = store::ModuleSettings(kv).LastWeather();
    REQUIRE(r.has_value());
    CHECK_FALSE(r->has_value());
}

TEST_CASE("ModuleSettings: climate selection accepts numbers or names and skips junk")
{
    store::MemoryKeyValueStore kv;
    REQUIRE(kv.Set(Keys::kClimate, "Temperate").has_value());
    REQUIRE(kv.Set(Keys::kHumidity, 2).has_value());
    REQUIRE(kv.Set(Keys::kSeason, "monsoon").has_value());

    auto p = store::ModuleSettings(kv).SelectedClimate();
    REQUIRE(p.has_value());
    CHECK(p->climate == weather::Climate::Temperate);
    CHECK(p->humidity == weather::Humidity::Verdant);
    CHECK_FALSE(p->season.has_value());
    CHECK_FALSE(p->IsComplete());
}

TEST_CASE("ModuleSettings: presentation defaults")
{
    store::MemoryKeyValueStore kv;
    store::ModuleSettings settings(kv);

    CHECK(settings.GetWindowPosition().left == 100);
    CHECK(settings.GetWindowPosition().top == 100);
    CHECK_FALSE(settings.UseCelsius());
    CHECK(settings.DialogDisplay());

    REQUIRE(kv.Set(Keys::kWindowPosition, "top-left").has_value());
    REQUIRE(kv.Set(Keys::kUseCelsius, "yes").has_value());
    CHECK(settings.GetWindowPosition().left == 100);
    CHECK_FALSE(settings.UseCelsius());

    REQUIRE(settings.SetWindowPosition({250, 40}).has_value());
    REQUIRE(settings.SetUseCelsius(true).has_value());
    REQUIRE(settings.SetDialogDisplay(false).has_value());
    CHECK(settings.GetWindowPosition().left == 250);
    CHECK(settings.GetWindowPosition().top == 40);
    CHECK(settings.UseCelsius());
    CHECK_FALSE(settings.DialogDisplay());
}

TEST_CASE("ModuleSettings: biome id is stored as text")
{
    store::MemoryKeyValueStore kv;
    store::ModuleSettings settings(kv);

    auto none = settings.Biome();
    REQUIRE(none.has_value());
    CHECK_FALSE(none->has_value());

    REQUIRE(settings.SetBiome("savanna").has_value());
    CHECK(**kv.Get(Keys::kBiome) == "savanna");
    CHECK(settings.Biome()->value() == "savanna");
}
