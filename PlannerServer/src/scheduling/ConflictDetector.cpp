#include "ConflictDetector.h"
#include "Availability.h"
#include "CivilTime.h"

namespace scheduling {

std::vector<Placement> detect_conflicts(const BusySlot& slot, const std::vector<Placement>& placements) {
    if (slot.start >= slot.end) throw ConfigurationError("busy slot start must be before end");
    std::vector<Placement> out;
    for (const auto& p : placements) {
        if (placement_start(p) < slot.end && slot.start < placement_end(p)) out.push_back(p);
    }
    return out;
}

std::vector<Placement> detect_conflicts_all(const NormalizedAvailability& availability, const std::vector<Placement>& placements) {
    std::vector<Placement> out;
    for (const auto& p : placements) {
        if (!overlapping(availability, placement_start(p), placement_end(p)).empty()) out.push_back(p);
    }
    return out;
}

std::vector<Placement> detect_overdue(const std::vector<Placement>& placements, std::time_t now) {
    std::vector<Placement> out;
    for (const auto& p : placements) {
        if (!p.detached && placement_end(p) < now) out.push_back(p);
    }
    return out;
}

}
