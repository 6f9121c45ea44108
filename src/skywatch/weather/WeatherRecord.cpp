// src/skywatch/weather/WeatherRecord.cpp
#include "skywatch/weather/WeatherRecord.hpp"

#include "skywatch/detail/JsonExtras.h"

#include <cmath>
#include <string>

namespace skywatch::weather {

using detail::collect_extras;
using detail::merge_extras;

const char* ConditionName(Condition c) noexcept
{
    switch (c)
    {
    case Condition::Clear:    return "Clear";
    case Condition::Overcast: return "Overcast";
    case Condition::Rain:     return "Rain";
    case Condition::Storm:    return "Storm";
    case Condition::Heatwave: return "Heatwave";
    case Condition::Snow:     return "Snow";
    }
    return "?";
}

int FahrenheitToCelsius(int f) noexcept
{
    return static_cast<int>(std::lround((f - 32) * 5.0 / 9.0));
}

int WeatherContent::Temperature(bool useCelsius) const noexcept
{
    return useCelsius ? FahrenheitToCelsius(temperatureF) : temperatureF;
}

std::string WeatherContent::TemperatureText(bool useCelsius) const
{
    return std::to_string(Temperature(useCelsius)) + (useCelsius ? "\xC2\xB0" "C" : "\xC2\xB0" "F");
}

// ---------- ClimateSelection ----------
void to_json(json& j, const ClimateSelection& v) {
    j = json::object({
        {"climate",  static_cast<int>(v.climate)},
        {"humidity", static_cast<int>(v.humidity)},
        {"season",   static_cast<int>(v.season)}
    });
}
void from_json(const json& j, ClimateSelection& v) {
    v = kDefaultClimate;
    if (!j.is_object()) return;
    if (auto it = j.find("climate"); it != j.end())
        v.climate = ClimateFromJson(*it).value_or(kDefaultClimate.climate);
    if (auto it = j.find("humidity"); it != j.end())
        v.humidity = HumidityFromJson(*it).value_or(kDefaultClimate.humidity);
    if (auto it = j.find("season"); it != j.end())
        v.season = SeasonFromJson(*it).value_or(kDefaultClimate.season);
}

// ---------- WeatherContent ----------
void to_json(json& j, const WeatherContent& v) {
    j = v.climate;
    j["condition"]   = static_cast<int>(v.condition);
    j["temperature"] = v.temperatureF;
    j["description"] = v.description;
    merge_extras(j, v.extras);
}
void from_json(const json& j, WeatherContent& v) {
    v.climate      = j.get<ClimateSelection>();
    v.temperatureF = j.value("temperature", 0);
    v.description  = j.value("description", std::string{});

    const int cond = j.value("condition", 0);
    v.condition = (cond >= 0 && cond < kConditionCount) ? static_cast<Condition>(cond)
                                                        : Condition::Clear;

    v.extras = collect_extras(j, {"climate", "humidity", "season", "condition",
                                  "temperature", "description", "date"});
}

// ---------- WeatherRecord ----------
void to_json(json& j, const WeatherRecord& v) {
    j = v.content;
    if (v.date) j["date"] = *v.date;
    else        j["date"] = nullptr;
}
void from_json(const json& j, WeatherRecord& v) {
    v.content = j.get<WeatherContent>();
    v.date.reset();

    if (auto it = j.find("date"); it != j.end() && it->is_object()) {
        const auto reading = time::Inspect(it->get<time::RawTimeSnapshot>());
        if (const auto* s = time::CompleteSnapshot(reading))
            v.date = *s;
    }
}

} // namespace skywatch::weather
