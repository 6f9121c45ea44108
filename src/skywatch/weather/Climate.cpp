// src/skywatch/weather/Climate.cpp
#include "skywatch/weather/Climate.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace skywatch::weather {

namespace {

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

std::optional<int> ParseIndex(std::string_view sv) noexcept
{
    int v = 0;
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, v);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

template <typename Enum, std::size_t N>
std::optional<Enum> ParseEnum(std::string_view s, const std::array<SelectionOption, N>& options) noexcept
{
    for (const auto& o : options)
    {
        if (EqualsI(s, o.label))
            return static_cast<Enum>(o.value);
    }

    if (const auto idx = ParseIndex(s))
    {
        for (const auto& o : options)
        {
            if (o.value == *idx)
                return static_cast<Enum>(o.value);
        }
    }

    return std::nullopt;
}

template <typename Enum, std::size_t N>
std::optional<Enum> EnumFromJson(const json& j, const std::array<SelectionOption, N>& options) noexcept
{
    if (j.is_number_integer())
    {
        const auto i = j.get<std::int64_t>();
        for (const auto& o : options)
        {
            if (o.value == i)
                return static_cast<Enum>(o.value);
        }
        return std::nullopt;
    }

    if (j.is_string())
        return ParseEnum<Enum>(j.get_ref<const std::string&>(), options);

    return std::nullopt;
}

} // namespace

const char* ClimateName(Climate c) noexcept
{
    switch (c)
    {
    case Climate::Cold:      return "Cold";
    case Climate::Temperate: return "Temperate";
    case Climate::Hot:       return "Hot";
    }
    return "?";
}

const char* HumidityName(Humidity h) noexcept
{
    switch (h)
    {
    case Humidity::Barren:  return "Barren";
    case Humidity::Modest:  return "Modest";
    case Humidity::Verdant: return "Verdant";
    }
    return "?";
}

const char* SeasonName(Season s) noexcept
{
    switch (s)
    {
    case Season::Spring: return "Spring";
    case Season::Summer: return "Summer";
    case Season::Fall:   return "Fall";
    case Season::Winter: return "Winter";
    }
    return "?";
}

std::optional<Climate> ParseClimate(std::string_view s) noexcept
{
    return ParseEnum<Climate>(s, kClimateSelections);
}

std::optional<Humidity> ParseHumidity(std::string_view s) noexcept
{
    return ParseEnum<Humidity>(s, kHumiditySelections);
}

std::optional<Season> ParseSeason(std::string_view s) noexcept
{
    if (EqualsI(s, "autumn"))
        return Season::Fall;
    return ParseEnum<Season>(s, kSeasonSelections);
}

ClimateSelection Resolve(const ClimateParameters& params, const ClimateSelection& fallback) noexcept
{
    ClimateSelection out = fallback;
    if (params.climate)  out.climate  = *params.climate;
    if (params.humidity) out.humidity = *params.humidity;
    if (params.season)   out.season   = *params.season;
    return out;
}

std::optional<ClimateSelection> ToSelection(const ClimateParameters& params) noexcept
{
    if (!params.IsComplete())
        return std::nullopt;
    return ClimateSelection{*params.climate, *params.humidity, *params.season};
}

const BiomeMapping* FindBiome(std::string_view id) noexcept
{
    for (const auto& b : kBiomeMappings)
    {
        if (EqualsI(b.id, id))
            return &b;
    }
    return nullptr;
}

std::optional<Climate> ClimateFromJson(const json& j) noexcept
{
    return EnumFromJson<Climate>(j, kClimateSelections);
}

std::optional<Humidity> HumidityFromJson(const json& j) noexcept
{
    return EnumFromJson<Humidity>(j, kHumiditySelections);
}

std::optional<Season> SeasonFromJson(const json& j) noexcept
{
    if (j.is_string())
        return ParseSeason(j.get_ref<const std::string&>());
    return EnumFromJson<Season>(j, kSeasonSelections);
}

} // namespace skywatch::weather
