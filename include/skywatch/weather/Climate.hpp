#pragma once
// include/skywatch/weather/Climate.hpp
//
// Climate parameters selected by the operator and handed to the weather generator.

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace skywatch::weather {

using json = nlohmann::json;

enum class Climate : std::uint8_t { Cold = 0, Temperate, Hot };
enum class Humidity : std::uint8_t { Barren = 0, Modest, Verdant };
enum class Season : std::uint8_t { Spring = 0, Summer, Fall, Winter };

[[nodiscard]] const char* ClimateName(Climate c) noexcept;
[[nodiscard]] const char* HumidityName(Humidity h) noexcept;
[[nodiscard]] const char* SeasonName(Season s) noexcept;

// Case-insensitive names or the numeric value ("0", "1", ...).
[[nodiscard]] std::optional<Climate> ParseClimate(std::string_view s) noexcept;
[[nodiscard]] std::optional<Humidity> ParseHumidity(std::string_view s) noexcept;
[[nodiscard]] std::optional<Season> ParseSeason(std::string_view s) noexcept;

struct ClimateParameters {
    std::optional<Climate>  climate;
    std::optional<Humidity> humidity;
    std::optional<Season>   season;

    [[nodiscard]] bool IsComplete() const noexcept
    {
        return climate.has_value() && humidity.has_value() && season.has_value();
    }
};

// Fully populated selection, the only form the generator accepts.
struct ClimateSelection {
    Climate  climate  = Climate::Cold;
    Humidity humidity = Humidity::Modest;
    Season   season   = Season::Spring;

    bool operator==(const ClimateSelection&) const = default;
};

// Used when seeding the very first record.
inline constexpr ClimateSelection kDefaultClimate{Climate::Cold, Humidity::Modest, Season::Spring};

// Fills the missing fields of `params` from `fallback`.
[[nodiscard]] ClimateSelection Resolve(const ClimateParameters& params,
                                       const ClimateSelection& fallback = kDefaultClimate) noexcept;

[[nodiscard]] std::optional<ClimateSelection> ToSelection(const ClimateParameters& params) noexcept;

// ---------- Biomes ----------
// A biome is a named preset for climate + humidity.

struct BiomeMapping {
    std::string_view id;
    std::string_view label;
    Climate          climate;
    Humidity         humidity;
};

inline constexpr std::array<BiomeMapping, 10> kBiomeMappings{{
    {"tundra",              "Tundra",                Climate::Cold,      Humidity::Barren},
    {"borealForest",        "Boreal forest",         Climate::Cold,      Humidity::Modest},
    {"alpine",              "Alpine",                Climate::Cold,      Humidity::Verdant},
    {"grassland",           "Grassland",             Climate::Temperate, Humidity::Barren},
    {"temperateForest",     "Temperate forest",      Climate::Temperate, Humidity::Modest},
    {"temperateRainforest", "Temperate rainforest",  Climate::Temperate, Humidity::Verdant},
    {"desert",              "Desert",                Climate::Hot,       Humidity::Barren},
    {"savanna",             "Savanna",               Climate::Hot,       Humidity::Modest},
    {"shrubland",           "Shrubland",             Climate::Hot,       Humidity::Modest},
    {"tropicalRainforest",  "Tropical rainforest",   Climate::Hot,       Humidity::Verdant},
}};

// nullptr when `id` is not a known biome.
[[nodiscard]] const BiomeMapping* FindBiome(std::string_view id) noexcept;

// Value/label pairs for selection widgets.
struct SelectionOption {
    int              value;
    std::string_view label;
};

inline constexpr std::array<SelectionOption, 3> kClimateSelections{{
    {static_cast<int>(Climate::Cold), "Cold"},
    {static_cast<int>(Climate::Temperate), "Temperate"},
    {static_cast<int>(Climate::Hot), "Hot"},
}};

inline constexpr std::array<SelectionOption, 3> kHumiditySelections{{
    {static_cast<int>(Humidity::Barren), "Barren"},
    {static_cast<int>(Humidity::Modest), "Modest"},
    {static_cast<int>(Humidity::Verdant), "Verdant"},
}};

inline constexpr std::array<SelectionOption, 4> kSeasonSelections{{
    {static_cast<int>(Season::Spring), "Spring"},
    {static_cast<int>(Season::Summer), "Summer"},
    {static_cast<int>(Season::Fall), "Fall"},
    {static_cast<int>(Season::Winter), "Winter"},
}};

// ---------- JSON ----------
// Enums are stored as their numeric value. Readers accept numbers or names.
[[nodiscard]] std::optional<Climate> ClimateFromJson(const json& j) noexcept;
[[nodiscard]] std::optional<Humidity> HumidityFromJson(const json& j) noexcept;
[[nodiscard]] std::optional<Season> SeasonFromJson(const json& j) noexcept;

} // namespace skywatch::weather
