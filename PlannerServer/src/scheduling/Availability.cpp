#include "Availability.h"
#include "CivilTime.h"
#include <algorithm>

namespace scheduling {

static std::vector<BusySlot> merge_slots(std::vector<BusySlot> slots) {
    for (const auto& s : slots) {
        if (s.start >= s.end) {
            throw ConfigurationError("busy slot start must be before end: " + format_iso_z(s.start) + " >= " + format_iso_z(s.end));
        }
    }
    std::stable_sort(slots.begin(), slots.end(), [](const BusySlot& a, const BusySlot& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });
    std::vector<BusySlot> out;
    out.reserve(slots.size());
    for (auto& s : slots) {
        if (!out.empty() && s.start <= out.back().end) {
            auto& cur = out.back();
            cur.end = std::max(cur.end, s.end);
            cur.merged_count += s.merged_count;
            continue;
        }
        out.push_back(std::move(s));
    }
    return out;
}

NormalizedAvailability normalize(std::vector<BusySlot> raw_busy, std::vector<BusySlot> time_off, std::optional<std::time_t> deadline) {
    NormalizedAvailability a;
    a.busy_slots = merge_slots(std::move(raw_busy));
    a.time_off = merge_slots(std::move(time_off));
    a.deadline = deadline;
    return a;
}

static void clip_into(const std::vector<BusySlot>& slots, std::time_t lo, std::time_t hi, std::vector<MinuteRange>& out) {
    for (const auto& s : slots) {
        if (s.start >= hi) break;
        if (s.end <= lo) continue;
        std::time_t b = std::max(s.start, lo);
        std::time_t e = std::min(s.end, hi);
        int start_min = static_cast<int>((b - lo) / 60);
        int end_min = static_cast<int>((e - lo + 59) / 60);
        if (end_min > start_min) out.push_back(MinuteRange{start_min, end_min});
    }
}

std::vector<MinuteRange> blocked_minutes_on(const NormalizedAvailability& a, int64_t day) {
    std::time_t lo = day_start(day);
    std::time_t hi = lo + kSecondsPerDay;
    std::vector<MinuteRange> out;
    clip_into(a.busy_slots, lo, hi, out);
    clip_into(a.time_off, lo, hi, out);
    std::sort(out.begin(), out.end(), [](const MinuteRange& x, const MinuteRange& y) { return x.start < y.start; });
    return out;
}

std::vector<BusySlot> overlapping(const NormalizedAvailability& a, std::time_t start, std::time_t end) {
    std::vector<BusySlot> out;
    for (const auto* list : {&a.busy_slots, &a.time_off}) {
        for (const auto& s : *list) {
            if (s.start < end && start < s.end) out.push_back(s);
        }
    }
    return out;
}

}
