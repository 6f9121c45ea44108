#pragma once
// include/skywatch/weather/WeatherGenerator.hpp
//
// Call contract for weather generation, plus a small default implementation.

#include "skywatch/weather/Climate.hpp"
#include "skywatch/weather/WeatherRecord.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace skywatch::weather {

// Turns climate parameters into weather content. `seed` is the previous record (for
// continuity) or nullptr for a first-ever record. Treated as side-effect free by callers.
class IWeatherGenerator {
public:
    virtual ~IWeatherGenerator() = default;

    [[nodiscard]] virtual WeatherContent Generate(const ClimateSelection& climate,
                                                  const WeatherRecord* seed) = 0;
};

// Markov chain over Condition, one step per call.
//
// Row probabilities come from a temperate base table, shifted by humidity (wetter rows
// for Verdant, drier for Barren) and gated by climate/season (no snow when hot, no
// heatwave when cold). The temperature is drawn around a climate/season baseline.
class SeasonalWeatherGenerator final : public IWeatherGenerator {
public:
    explicit SeasonalWeatherGenerator(std::uint64_t seed);

    [[nodiscard]] WeatherContent Generate(const ClimateSelection& climate,
                                          const WeatherRecord* seed) override;

    using Row = std::array<float, kConditionCount>;

    // Normalized transition row P[next | current] for the given selection.
    [[nodiscard]] static Row TransitionRow(const ClimateSelection& climate, Condition current) noexcept;

    // Mean temperature in Fahrenheit for the selection.
    [[nodiscard]] static int BaselineF(const ClimateSelection& climate) noexcept;

private:
    std::mt19937_64 m_rng;
};

} // namespace skywatch::weather
