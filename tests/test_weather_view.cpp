// tests/test_weather_view.cpp

#include <doctest/doctest.h>

#include "skywatch/engine/WeatherView.hpp"

#include "support/EngineFakes.h"

using namespace skywatch;

TEST_CASE("BuildWeatherView: empty state")
{
    const engine::WeatherState state{};
    engine::ViewOptions opts;
    opts.isGM = true;

    const engine::WeatherView v = engine::BuildWeatherView(state, opts);
    CHECK(v.isGM);
    CHECK_FALSE(v.hasWeather);
    CHECK(v.formattedDate.empty());
    CHECK(v.windowPosition.left == 100);
}

TEST_CASE("BuildWeatherView: clock wins over the record's date")
{
    engine::WeatherState state;
    state.record = testing::MakeRecord(testing::MakeSnapshot(1000, 1, 1), 68);
    state.clock  = testing::MakeSnapshot(1000, 1, 2, 14, 30, 0);
    state.clock->display = time::DisplayFields{"2nd of Hammer", "2:30 PM", time::json::object()};
    state.clock->weekdays = {"Sul", "Mol", "Zol"};
    state.clock->dayOfTheWeek = 1;

    engine::ViewOptions opts;
    opts.useCelsius = true;

    const engine::WeatherView v = engine::BuildWeatherView(state, opts);
    CHECK(v.formattedDate == "2/1/1000");
    CHECK(v.displayDate == "2nd of Hammer");
    CHECK(v.formattedTime == "2:30 PM");
    CHECK(v.weekday == "Mol");
    CHECK(v.hasWeather);
    CHECK(v.currentTemperature == "20\xC2\xB0" "C");
    CHECK(v.currentDescription == "stored");
}

TEST_CASE("BuildWeatherView: record date is used before the first tick")
{
    engine::WeatherState state;
    state.record = testing::MakeRecord(testing::MakeSnapshot(1000, 9, 10));

    const engine::WeatherView v = engine::BuildWeatherView(state, engine::ViewOptions{});
    CHECK(v.formattedDate == "10/9/1000");
}

TEST_CASE("BuildWeatherView: observers see weather only when the dialog is enabled")
{
    const engine::WeatherState state{};

    engine::ViewOptions opts;
    opts.isGM = false;
    opts.dialogDisplay = true;
    CHECK_FALSE(engine::BuildWeatherView(state, opts).hideWeather);

    opts.dialogDisplay = false;
    CHECK(engine::BuildWeatherView(state, opts).hideWeather);

    opts.isGM = true;
    CHECK_FALSE(engine::BuildWeatherView(state, opts).hideWeather);
}
