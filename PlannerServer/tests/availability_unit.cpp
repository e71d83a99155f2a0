#include <iostream>
#include <string>
#include <vector>
#include "scheduling/Availability.h"
#include "scheduling/CivilTime.h"

using namespace scheduling;

static BusySlot slot(std::time_t s, std::time_t e, BusySource src = BusySource::CalendarEvent, const std::string& title = "") {
    BusySlot b;
    b.start = s;
    b.end = e;
    b.source = src;
    if (!title.empty()) b.metadata["title"] = title;
    return b;
}

int main() {
    const std::time_t d0 = day_start(parse_date("2026-03-02"));
    const std::time_t h = 3600;

    // unsorted, overlapping, touching
    std::vector<BusySlot> raw = {
        slot(d0 + 14 * h, d0 + 15 * h, BusySource::ManualTask),
        slot(d0 + 9 * h, d0 + 10 * h, BusySource::CalendarEvent, "Standup"),
        slot(d0 + 9 * h + 1800, d0 + 11 * h),
        slot(d0 + 11 * h, d0 + 12 * h),
    };
    std::vector<BusySlot> off = {slot(d0 + 86400, d0 + 2 * 86400, BusySource::TimeOff)};
    auto a = normalize(raw, off, std::nullopt);

    if (a.busy_slots.size() != 2) { std::cerr << "expected 2 merged slots got " << a.busy_slots.size() << "\n"; return 1; }
    const auto& first = a.busy_slots[0];
    if (first.start != d0 + 9 * h || first.end != d0 + 12 * h) { std::cerr << "merge bounds wrong\n"; return 1; }
    if (first.merged_count != 3) { std::cerr << "merged_count expected 3 got " << first.merged_count << "\n"; return 1; }
    if (first.metadata.count("title") == 0 || first.metadata.at("title") != "Standup") { std::cerr << "earliest slot metadata lost\n"; return 1; }
    if (a.busy_slots[1].source != BusySource::ManualTask) { std::cerr << "source lost\n"; return 1; }
    for (size_t i = 1; i < a.busy_slots.size(); ++i) {
        if (a.busy_slots[i - 1].end >= a.busy_slots[i].start) { std::cerr << "slots not disjoint\n"; return 1; }
    }
    if (a.time_off.size() != 1) { std::cerr << "time off should stay separate\n"; return 1; }
    if (a.deadline) { std::cerr << "unexpected deadline\n"; return 1; }

    auto mins = blocked_minutes_on(a, parse_date("2026-03-02"));
    if (mins.size() != 2 || mins[0].start != 540 || mins[0].end != 720 || mins[1].start != 840 || mins[1].end != 900) {
        std::cerr << "blocked_minutes_on day 0 wrong\n"; return 1;
    }
    auto next = blocked_minutes_on(a, parse_date("2026-03-03"));
    if (next.size() != 1 || next[0].start != 0 || next[0].end != 1440) { std::cerr << "time off not clipped to whole day\n"; return 1; }

    auto hits = overlapping(a, d0 + 11 * h + 1800, d0 + 86400 + 60);
    if (hits.size() != 3) { std::cerr << "overlapping expected 3 got " << hits.size() << "\n"; return 1; }
    if (hits.back().source != BusySource::TimeOff) { std::cerr << "time off should come last\n"; return 1; }
    if (!overlapping(a, d0 + 12 * h, d0 + 14 * h).empty()) { std::cerr << "half-open boundary treated as overlap\n"; return 1; }

    bool threw = false;
    try {
        normalize({slot(d0 + 10 * h, d0 + 10 * h)}, {}, std::nullopt);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    if (!threw) { std::cerr << "empty slot accepted\n"; return 1; }

    auto with_deadline = normalize({}, {}, d0 + 17 * h);
    if (!with_deadline.deadline || *with_deadline.deadline != d0 + 17 * h) { std::cerr << "deadline not kept\n"; return 1; }

    std::cout << "availability_unit ok\n";
    return 0;
}
