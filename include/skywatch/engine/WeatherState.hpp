#pragma once
// include/skywatch/engine/WeatherState.hpp

#include "skywatch/time/TimeSnapshot.hpp"
#include "skywatch/weather/WeatherRecord.hpp"

#include <optional>

namespace skywatch::engine {

// What one instance currently holds in memory.
//
// `record` is the last record read from or committed to the store; its `date` is the
// snapshot it was generated for and is what transitions are detected against.
// `clock` is the latest complete reading from the time feed, used for display. On an
// observer the clock can run ahead of the record's date until the authoritative
// instance publishes the next record.
struct WeatherState {
    std::optional<weather::WeatherRecord> record;
    std::optional<time::TimeSnapshot>     clock;

    [[nodiscard]] const weather::WeatherRecord* Seed() const noexcept
    {
        return record ? &*record : nullptr;
    }

    [[nodiscard]] std::optional<time::TimeSnapshot> RecordDate() const
    {
        return record ? record->date : std::nullopt;
    }
};

} // namespace skywatch::engine
