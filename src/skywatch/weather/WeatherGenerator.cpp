// src/skywatch/weather/WeatherGenerator.cpp
#include "skywatch/weather/WeatherGenerator.hpp"

#include <algorithm>

namespace skywatch::weather {

namespace {

using Row = SeasonalWeatherGenerator::Row;

// Hand-tuned temperate table; rows sum to 1.
constexpr std::array<Row, kConditionCount> kTemperate{{
    {{0.70f, 0.20f, 0.08f, 0.01f, 0.01f, 0.00f}}, // Clear ->
    {{0.40f, 0.40f, 0.18f, 0.02f, 0.00f, 0.00f}}, // Overcast ->
    {{0.20f, 0.50f, 0.25f, 0.05f, 0.00f, 0.00f}}, // Rain ->
    {{0.30f, 0.40f, 0.20f, 0.10f, 0.00f, 0.00f}}, // Storm ->
    {{0.60f, 0.30f, 0.05f, 0.00f, 0.05f, 0.00f}}, // Heatwave ->
    {{0.20f, 0.30f, 0.00f, 0.00f, 0.00f, 0.50f}}, // Snow ->
}};

// [climate][season], Fahrenheit.
constexpr int kBaselineF[3][4] = {
    //  Spring Summer Fall Winter
    {   40,    60,    38,  15 }, // Cold
    {   60,    78,    58,  35 }, // Temperate
    {   80,    98,    82,  65 }, // Hot
};

constexpr int kJitterF = 6;

constexpr int Idx(Condition c) noexcept { return static_cast<int>(c); }

bool SnowPossible(const ClimateSelection& c) noexcept
{
    switch (c.climate)
    {
    case Climate::Cold:      return c.season != Season::Summer;
    case Climate::Temperate: return c.season == Season::Winter;
    case Climate::Hot:       return false;
    }
    return false;
}

bool HeatwavePossible(const ClimateSelection& c) noexcept
{
    switch (c.climate)
    {
    case Climate::Cold:      return false;
    case Climate::Temperate: return c.season == Season::Summer;
    case Climate::Hot:       return c.season != Season::Winter;
    }
    return false;
}

int ConditionOffsetF(Condition c) noexcept
{
    switch (c)
    {
    case Condition::Clear:    return 2;
    case Condition::Overcast: return -2;
    case Condition::Rain:     return -3;
    case Condition::Storm:    return -5;
    case Condition::Heatwave: return 15;
    case Condition::Snow:     return -8;
    }
    return 0;
}

const char* Describe(Condition c, Humidity h) noexcept
{
    switch (c)
    {
    case Condition::Clear:
        return h == Humidity::Verdant ? "Clear skies, the air is thick and muggy."
                                      : "Clear skies.";
    case Condition::Overcast:
        return "Grey clouds cover the sky.";
    case Condition::Rain:
        return h == Humidity::Barren ? "A brief, light rain falls."
                                     : "Steady rain falls throughout the day.";
    case Condition::Storm:
        return "Thunder rolls as a storm sweeps through.";
    case Condition::Heatwave:
        return "Oppressive heat shimmers off the ground.";
    case Condition::Snow:
        return "Snow drifts down from a pale sky.";
    }
    return "";
}

} // namespace

SeasonalWeatherGenerator::SeasonalWeatherGenerator(std::uint64_t seed)
    : m_rng(seed)
{
}

SeasonalWeatherGenerator::Row SeasonalWeatherGenerator::TransitionRow(const ClimateSelection& climate,
                                                                      Condition current) noexcept
{
    Row row = kTemperate[static_cast<std::size_t>(Idx(current))];

    switch (climate.humidity)
    {
    case Humidity::Barren:
        row[Idx(Condition::Clear)] *= 1.3f;
        row[Idx(Condition::Rain)]  *= 0.5f;
        row[Idx(Condition::Storm)] *= 0.5f;
        row[Idx(Condition::Snow)]  *= 0.5f;
        break;
    case Humidity::Modest:
        break;
    case Humidity::Verdant:
        row[Idx(Condition::Overcast)] *= 1.2f;
        row[Idx(Condition::Rain)]     *= 1.5f;
        row[Idx(Condition::Storm)]    *= 1.5f;
        row[Idx(Condition::Snow)]     *= 1.5f;
        break;
    }

    if (SnowPossible(climate))
    {
        // Cold precipitation falls as snow.
        row[Idx(Condition::Snow)] += row[Idx(Condition::Rain)] * 0.75f + 0.05f;
        row[Idx(Condition::Rain)] *= 0.25f;
    }
    else
    {
        row[Idx(Condition::Snow)] = 0.0f;
    }

    if (HeatwavePossible(climate))
        row[Idx(Condition::Heatwave)] += climate.season == Season::Summer ? 0.08f : 0.03f;
    else
        row[Idx(Condition::Heatwave)] = 0.0f;

    float sum = 0.0f;
    for (float p : row) sum += p;

    if (!(sum > 0.0f))
    {
        row.fill(0.0f);
        row[Idx(Condition::Clear)] = 1.0f;
        return row;
    }

    for (float& p : row) p /= sum;
    return row;
}

int SeasonalWeatherGenerator::BaselineF(const ClimateSelection& climate) noexcept
{
    return kBaselineF[static_cast<int>(climate.climate)][static_cast<int>(climate.season)];
}

WeatherContent SeasonalWeatherGenerator::Generate(const ClimateSelection& climate,
                                                  const WeatherRecord* seed)
{
    const Condition current = seed ? seed->content.condition : Condition::Clear;
    const Row row = TransitionRow(climate, current);

    std::uniform_real_distribution<float> pick(0.0f, 1.0f);
    const float r = pick(m_rng);

    Condition next = Condition::Clear;
    float acc = 0.0f;
    for (int i = 0; i < kConditionCount; ++i)
    {
        acc += row[static_cast<std::size_t>(i)];
        if (r <= acc && row[static_cast<std::size_t>(i)] > 0.0f)
        {
            next = static_cast<Condition>(i);
            break;
        }
    }

    std::uniform_int_distribution<int> jitter(-kJitterF, kJitterF);
    int tempF = BaselineF(climate) + ConditionOffsetF(next) + jitter(m_rng);

    // Continuity: drift halfway toward the new value instead of jumping.
    if (seed && seed->content.climate.season == climate.season)
        tempF = (tempF + seed->content.temperatureF + 1) / 2;

    if (next == Condition::Snow)
        tempF = std::min(tempF, 32);

    WeatherContent out;
    out.climate      = climate;
    out.condition    = next;
    out.temperatureF = tempF;
    out.description  = Describe(next, climate.humidity);
    return out;
}

} // namespace skywatch::weather
