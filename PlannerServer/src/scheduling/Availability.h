#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "Types.h"

namespace scheduling {

struct MinuteRange {
    int start = 0;
    int end = 0;
};

// Sorts and unions busy slots (touching slots merge too). Time off is merged
// separately so callers can tell the two apart. Throws ConfigurationError for
// a slot with start >= end.
NormalizedAvailability normalize(std::vector<BusySlot> raw_busy, std::vector<BusySlot> time_off, std::optional<std::time_t> deadline);

// Busy and time-off intervals intersecting `day`, clipped to [0, 1440).
std::vector<MinuteRange> blocked_minutes_on(const NormalizedAvailability& a, int64_t day);

// Busy slots first, then time off, each in start order.
std::vector<BusySlot> overlapping(const NormalizedAvailability& a, std::time_t start, std::time_t end);

}
