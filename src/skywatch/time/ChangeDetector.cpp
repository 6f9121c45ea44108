// src/skywatch/time/ChangeDetector.cpp
#include "skywatch/time/ChangeDetector.hpp"

namespace skywatch::time {

const char* TransitionName(Transition t) noexcept
{
    switch (t)
    {
    case Transition::None:     return "none";
    case Transition::Material: return "material";
    }
    return "?";
}

Transition Classify(const std::optional<TimeSnapshot>& previous,
                    const TimeReading& incoming) noexcept
{
    const TimeSnapshot* next = CompleteSnapshot(incoming);
    if (!next)
        return Transition::None; // absent or partial

    if (!previous)
        return Transition::Material;

    return previous->SameDate(*next) ? Transition::None : Transition::Material;
}

Transition ClassifyRaw(const std::optional<TimeSnapshot>& previous,
                       const std::optional<RawTimeSnapshot>& incoming)
{
    return Classify(previous, Inspect(incoming));
}

bool IsCosmeticChange(const std::optional<TimeSnapshot>& previous,
                      const TimeSnapshot& incoming) noexcept
{
    if (!previous || !previous->SameDate(incoming))
        return false;
    return previous->second != incoming.second || previous->minute != incoming.minute
        || previous->hour != incoming.hour;
}

} // namespace skywatch::time
