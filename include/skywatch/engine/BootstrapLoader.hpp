#pragma once
// include/skywatch/engine/BootstrapLoader.hpp

#include "skywatch/authority/AuthorityGate.hpp"
#include "skywatch/engine/EngineError.hpp"
#include "skywatch/engine/WeatherState.hpp"
#include "skywatch/store/WeatherStore.hpp"
#include "skywatch/weather/WeatherGenerator.hpp"

#include <expected>
#include <optional>

namespace skywatch::engine {

// Runs once when an instance starts.
//
//  - A stored record is adopted as-is, whatever the instance's role.
//  - With nothing stored, the authoritative instance generates a first record from
//    weather::kDefaultClimate (no seed), commits it and adopts it.
//  - With nothing stored, an observer stays empty until a later reload.
//
// A store read that fails for any reason other than "nothing stored" is surfaced.
class BootstrapLoader {
public:
    BootstrapLoader(WeatherState& state,
                    store::IWeatherStore& weatherStore,
                    weather::IWeatherGenerator& generator,
                    const authority::AuthorityGate& gate) noexcept
        : m_state(state), m_store(weatherStore), m_generator(generator), m_gate(gate) {}

    [[nodiscard]] std::expected<std::optional<weather::WeatherRecord>, EngineError> Initialize();

private:
    WeatherState&                   m_state;
    store::IWeatherStore&           m_store;
    weather::IWeatherGenerator&     m_generator;
    const authority::AuthorityGate& m_gate;
};

} // namespace skywatch::engine
