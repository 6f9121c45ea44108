// src/skywatch/engine/WeatherView.cpp
#include "skywatch/engine/WeatherView.hpp"

namespace skywatch::engine {

WeatherView BuildWeatherView(const WeatherState& state, const ViewOptions& opts)
{
    WeatherView v;
    v.isGM           = opts.isGM;
    v.hideWeather    = !(opts.isGM || opts.dialogDisplay);
    v.windowPosition = opts.windowPosition;

    const time::TimeSnapshot* when = nullptr;
    if (state.clock)
        when = &*state.clock;
    else if (state.record && state.record->date)
        when = &*state.record->date;

    if (when)
    {
        v.formattedDate = time::FormatDate(*when);
        v.weekday       = time::WeekdayName(*when);
        if (when->display)
        {
            v.displayDate   = when->display->date;
            v.formattedTime = when->display->time;
        }
    }

    if (state.record)
    {
        v.hasWeather         = true;
        v.currentTemperature = state.record->content.TemperatureText(opts.useCelsius);
        v.currentDescription = state.record->content.Description();
    }

    return v;
}

} // namespace skywatch::engine
