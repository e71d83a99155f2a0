#pragma once

#include <ctime>
#include <vector>
#include "Types.h"

namespace scheduling {

// Placements whose [start, end) intersects the slot. Input order is kept.
std::vector<Placement> detect_conflicts(const BusySlot& slot, const std::vector<Placement>& placements);

// Placements intersecting any busy slot or time off, each reported once.
std::vector<Placement> detect_conflicts_all(const NormalizedAvailability& availability, const std::vector<Placement>& placements);

// Placements that ended before `now`, in input order. Detached placements are
// left alone.
std::vector<Placement> detect_overdue(const std::vector<Placement>& placements, std::time_t now);

}
