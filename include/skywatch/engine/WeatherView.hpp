#pragma once
// include/skywatch/engine/WeatherView.hpp
//
// Flat, display-ready values for whatever draws the weather panel.

#include "skywatch/engine/WeatherState.hpp"
#include "skywatch/store/ModuleSettings.hpp"

#include <string>

namespace skywatch::engine {

struct WeatherView {
    bool isGM = false;

    std::string displayDate;    // calendar's own date string
    std::string formattedDate;  // "day/month/year"
    std::string formattedTime;  // calendar's own time string
    std::string weekday;

    bool        hasWeather = false;
    std::string currentTemperature;
    std::string currentDescription;

    // Observers only see the panel when the operator allows it.
    bool hideWeather = true;

    store::WindowPosition windowPosition;
};

struct ViewOptions {
    bool isGM          = false;
    bool useCelsius    = false;
    bool dialogDisplay = true;

    store::WindowPosition windowPosition;
};

// Time fields come from the clock when the feed has delivered one, otherwise from the
// record's own snapshot.
[[nodiscard]] WeatherView BuildWeatherView(const WeatherState& state, const ViewOptions& opts);

} // namespace skywatch::engine
