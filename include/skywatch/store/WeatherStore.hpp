#pragma once
// include/skywatch/store/WeatherStore.hpp
//
// The narrow read/write contract the engine holds against the shared store.

#include "skywatch/store/KeyValueStore.hpp"
#include "skywatch/store/ModuleSettings.hpp"
#include "skywatch/weather/WeatherRecord.hpp"

#include <expected>
#include <optional>

namespace skywatch::store {

class IWeatherStore {
public:
    virtual ~IWeatherStore() = default;

    // nullopt when no record has been written yet. Any other failure is an error.
    [[nodiscard]] virtual std::expected<std::optional<weather::WeatherRecord>, StoreError> Read() const = 0;

    // The record is written as one value; it either fully lands or the call fails.
    [[nodiscard]] virtual std::expected<void, StoreError> Write(const weather::WeatherRecord& record) = 0;
};

// Stores the record under SettingKeys::kLastWeatherData.
class SettingsWeatherStore final : public IWeatherStore {
public:
    explicit SettingsWeatherStore(ModuleSettings& settings) noexcept : m_settings(settings) {}

    [[nodiscard]] std::expected<std::optional<weather::WeatherRecord>, StoreError> Read() const override
    {
        return m_settings.LastWeather();
    }

    [[nodiscard]] std::expected<void, StoreError> Write(const weather::WeatherRecord& record) override
    {
        return m_settings.SetLastWeather(record);
    }

private:
    ModuleSettings& m_settings;
};

} // namespace skywatch::store
