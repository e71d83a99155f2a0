#include "Types.h"

namespace scheduling {

const char* to_string(BusySource s) {
    switch (s) {
        case BusySource::ExistingPlan: return "existing_plan";
        case BusySource::ManualTask: return "manual_task";
        case BusySource::CalendarEvent: return "calendar_event";
        case BusySource::TimeOff: return "time_off";
    }
    return "calendar_event";
}

std::optional<BusySource> busy_source_from_string(const std::string& s) {
    if (s == "existing_plan") return BusySource::ExistingPlan;
    if (s == "manual_task") return BusySource::ManualTask;
    if (s == "calendar_event") return BusySource::CalendarEvent;
    if (s == "time_off") return BusySource::TimeOff;
    return std::nullopt;
}

const char* to_string(UnplacedReason r) {
    switch (r) {
        case UnplacedReason::NoCapacity: return "no_capacity";
        case UnplacedReason::ExceedsDayWindow: return "exceeds_day_window";
        case UnplacedReason::DependencyUnplaced: return "dependency_unplaced";
        case UnplacedReason::PastHorizon: return "past_horizon";
    }
    return "no_capacity";
}

const char* to_string(ProposalStatus s) {
    switch (s) {
        case ProposalStatus::Pending: return "pending";
        case ProposalStatus::Accepted: return "accepted";
        case ProposalStatus::Rejected: return "rejected";
        case ProposalStatus::Expired: return "expired";
    }
    return "pending";
}

std::optional<ProposalStatus> proposal_status_from_string(const std::string& s) {
    if (s == "pending") return ProposalStatus::Pending;
    if (s == "accepted") return ProposalStatus::Accepted;
    if (s == "rejected") return ProposalStatus::Rejected;
    if (s == "expired") return ProposalStatus::Expired;
    return std::nullopt;
}

}
