#pragma once

#include "leaguesched/core/model/LeagueTypes.h"

#include <vector>

namespace leaguesched::core::facility {

// What a facility physically offers on a date. Bookings are not considered.
class AvailabilityModel {
public:
    static std::vector<model::TimeSlot> Availability(const model::Facility& facility,
                                                     const model::CalendarDate& date);
    static int TotalCourts(const std::vector<model::TimeSlot>& slots);
};

}  // namespace leaguesched::core::facility
