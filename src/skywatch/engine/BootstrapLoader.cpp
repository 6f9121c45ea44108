// src/skywatch/engine/BootstrapLoader.cpp
#include "skywatch/engine/BootstrapLoader.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace skywatch::engine {

std::expected<std::optional<weather::WeatherRecord>, EngineError> BootstrapLoader::Initialize()
{
    auto stored = m_store.Read();
    if (!stored)
    {
        spdlog::error("Weather: cannot load stored record ({}: {})",
                      store::StoreErrorCodeName(stored.error().code), stored.error().message);
        return std::unexpected(FromStoreRead(stored.error()));
    }

    if (*stored)
    {
        spdlog::info("Weather: using saved weather data");
        m_state.record = **stored;
        if (m_state.record->date)
            m_state.clock = m_state.record->date;
        return m_state.record;
    }

    if (!m_gate.IsAuthoritative())
    {
        spdlog::info("Weather: no saved weather data, waiting for the authoritative instance");
        return std::optional<weather::WeatherRecord>{};
    }

    spdlog::info("Weather: no saved weather data, generating first record");

    weather::WeatherRecord first;
    first.content = m_generator.Generate(weather::kDefaultClimate, nullptr);

    auto written = m_store.Write(first);
    if (!written)
    {
        spdlog::error("Weather: cannot save first record ({}: {})",
                      store::StoreErrorCodeName(written.error().code), written.error().message);
        return std::unexpected(FromStoreWrite(written.error()));
    }

    m_state.record = std::move(first);
    return m_state.record;
}

} // namespace skywatch::engine
