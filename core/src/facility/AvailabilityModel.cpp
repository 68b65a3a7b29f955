#include "leaguesched/core/facility/AvailabilityModel.h"

#include <algorithm>

namespace leaguesched::core::facility {

std::vector<model::TimeSlot> AvailabilityModel::Availability(const model::Facility& facility,
                                                             const model::CalendarDate& date) {
    std::vector<model::TimeSlot> slots;
    if (!facility.IsAvailableOn(date)) {
        return slots;
    }
    const auto it = facility.schedule.find(date.weekday());
    if (it == facility.schedule.end()) {
        return slots;
    }
    slots = it->second;
    std::stable_sort(slots.begin(), slots.end(), [](const auto& a, const auto& b) {
        return a.start_time < b.start_time;
    });
    return slots;
}

int AvailabilityModel::TotalCourts(const std::vector<model::TimeSlot>& slots) {
    int total = 0;
    for (const auto& slot : slots) {
        total += std::max(0, slot.available_courts);
    }
    return total;
}

}  // namespace leaguesched::core::facility
