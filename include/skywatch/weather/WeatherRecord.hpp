#pragma once
// include/skywatch/weather/WeatherRecord.hpp
//
// The shared weather record: generated content plus the calendar snapshot it was
// generated for. Persisted as a single JSON value; unknown fields written by other
// versions are preserved and round-tripped.

#include "skywatch/time/TimeSnapshot.hpp"
#include "skywatch/weather/Climate.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace skywatch::weather {

using json = nlohmann::json;

enum class Condition : std::uint8_t { Clear = 0, Overcast, Rain, Storm, Heatwave, Snow };

inline constexpr int kConditionCount = 6;

[[nodiscard]] const char* ConditionName(Condition c) noexcept;

// Generator output. The engine never interprets it beyond passing it back as a seed.
struct WeatherContent {
    ClimateSelection climate;
    Condition        condition = Condition::Clear;
    int              temperatureF = 0;
    std::string      description;

    json extras = json::object();

    [[nodiscard]] int Temperature(bool useCelsius) const noexcept;

    // "72°F" / "22°C"
    [[nodiscard]] std::string TemperatureText(bool useCelsius) const;

    [[nodiscard]] const std::string& Description() const noexcept { return description; }
};

struct WeatherRecord {
    std::optional<time::TimeSnapshot> date;
    WeatherContent                    content;
};

[[nodiscard]] int FahrenheitToCelsius(int f) noexcept;

// ---------- JSON (de)serialization ----------
void to_json(json& j, const ClimateSelection& v);
void from_json(const json& j, ClimateSelection& v);

void to_json(json& j, const WeatherContent& v);
void from_json(const json& j, WeatherContent& v);

// A stored date that is missing or only partially populated is read back as absent.
void to_json(json& j, const WeatherRecord& v);
void from_json(const json& j, WeatherRecord& v);

} // namespace skywatch::weather
