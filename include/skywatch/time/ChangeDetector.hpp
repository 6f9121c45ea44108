#pragma once
// include/skywatch/time/ChangeDetector.hpp
//
// Classifies a feed reading against the last-known snapshot.
//
// Only calendar date fields (day/month/year) make a transition Material. A change
// restricted to second/minute is cosmetic and classifies as None; callers refresh
// their clock display for it but never regenerate.

#include "skywatch/time/TimeSnapshot.hpp"

#include <cstdint>
#include <optional>

namespace skywatch::time {

enum class Transition : std::uint8_t {
    None = 0,
    Material,
};

[[nodiscard]] const char* TransitionName(Transition t) noexcept;

// Rules, in order:
//   1. incoming Absent                  -> None
//   2. incoming Partial                 -> None (regardless of previous)
//   3. previous absent                  -> Material
//   4. day, month or year differ        -> Material, otherwise None
[[nodiscard]] Transition Classify(const std::optional<TimeSnapshot>& previous,
                                  const TimeReading& incoming) noexcept;

// Raw-input convenience; runs the reading through Inspect() first.
[[nodiscard]] Transition ClassifyRaw(const std::optional<TimeSnapshot>& previous,
                                     const std::optional<RawTimeSnapshot>& incoming);

// True when both readings are on the same date but the clock moved.
[[nodiscard]] bool IsCosmeticChange(const std::optional<TimeSnapshot>& previous,
                                    const TimeSnapshot& incoming) noexcept;

} // namespace skywatch::time
