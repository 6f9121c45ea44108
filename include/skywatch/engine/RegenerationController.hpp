#pragma once
// include/skywatch/engine/RegenerationController.hpp
//
// Reacts to time-feed readings and manual regeneration requests.
//
// The controller is the only code path that writes the weather record after bootstrap.
// It runs on the instance's serialized event stream, so it holds no locks. A store write
// completes (successfully or not) before any call here returns, and the in-memory record
// is replaced only after the write succeeded.

#include "skywatch/engine/ChangeNotifier.hpp"
#include "skywatch/engine/EngineError.hpp"
#include "skywatch/engine/WeatherState.hpp"
#include "skywatch/store/ModuleSettings.hpp"
#include "skywatch/store/WeatherStore.hpp"
#include "skywatch/time/ChangeDetector.hpp"
#include "skywatch/weather/Climate.hpp"
#include "skywatch/weather/WeatherGenerator.hpp"

#include <cstdint>
#include <expected>
#include <optional>

namespace skywatch::engine {

enum class TimeUpdateOutcome : std::uint8_t {
    Ignored = 0,  // absent or partial reading; nothing changed
    Refreshed,    // clock (and the record's time of day) updated, nothing committed
    Deferred,     // material change seen by an observer; waits for the authoritative record
    Adopted,      // first snapshot attached to an undated record and committed
    Regenerated,  // new content generated and committed
};

[[nodiscard]] const char* TimeUpdateOutcomeName(TimeUpdateOutcome o) noexcept;

class RegenerationController {
public:
    RegenerationController(WeatherState& state,
                           store::IWeatherStore& weatherStore,
                           const store::ModuleSettings& settings,
                           weather::IWeatherGenerator& generator,
                           const ChangeNotifier& notifier) noexcept;

    // Handles one reading from the time feed. Parameters for generation are read from the
    // stored climate selection; missing fields fall back to weather::kDefaultClimate.
    [[nodiscard]] std::expected<TimeUpdateOutcome, EngineError>
    OnTimeUpdate(const std::optional<time::RawTimeSnapshot>& incoming, bool isAuthoritative);

    // Forces a new record from `params` regardless of the calendar. Rejected without any
    // store interaction when not authoritative or when a parameter is missing.
    [[nodiscard]] std::expected<void, EngineError>
    ManualRegenerate(const weather::ClimateParameters& params, bool isAuthoritative);

private:
    [[nodiscard]] std::expected<void, EngineError> Commit(weather::WeatherRecord record);

    WeatherState&                  m_state;
    store::IWeatherStore&          m_store;
    const store::ModuleSettings&   m_settings;
    weather::IWeatherGenerator&    m_generator;
    const ChangeNotifier&          m_notifier;
};

} // namespace skywatch::engine
