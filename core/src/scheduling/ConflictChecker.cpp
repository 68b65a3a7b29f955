#include "leaguesched/core/scheduling/ConflictChecker.h"

#include "leaguesched/core/facility/AvailabilityModel.h"

#include <algorithm>
#include <map>

namespace leaguesched::core::scheduling {

namespace {

using model::ErrorKind;

std::map<int, int> BookedLines(const std::vector<model::Match>& matches,
                               int facility_id,
                               int exclude_match_id) {
    std::map<int, int> booked;
    for (const auto& other : matches) {
        if (other.id == exclude_match_id || other.facility_id != facility_id) {
            continue;
        }
        for (const auto& time : other.scheduled_times) {
            booked[time.minutes] += 1;
        }
    }
    return booked;
}

}  // namespace

ConflictChecker::ConflictChecker(const persist::ILeagueStore& store, ConflictSettings settings)
    : store_(store), settings_(settings) {}

std::vector<model::TimeSlot> ConflictChecker::RemainingSlots(const model::Facility& facility,
                                                             const model::CalendarDate& date,
                                                             int exclude_match_id) const {
    auto slots = facility::AvailabilityModel::Availability(facility, date);
    if (slots.empty()) {
        return slots;
    }
    const auto booked = BookedLines(store_.ListMatchesOn(date), facility.id, exclude_match_id);
    for (auto& slot : slots) {
        const auto it = booked.find(slot.start_time.minutes);
        if (it != booked.end()) {
            slot.available_courts = std::max(0, slot.available_courts - it->second);
        }
    }
    return slots;
}

bool ConflictChecker::Overlaps(const std::vector<model::TimeOfDay>& a,
                               const std::vector<model::TimeOfDay>& b) const {
    if (a.empty() || b.empty()) {
        return true;
    }
    const int duration = settings_.match_duration_minutes;
    for (const auto& first : a) {
        for (const auto& second : b) {
            if (first.minutes < second.minutes + duration && second.minutes < first.minutes + duration) {
                return true;
            }
        }
    }
    return false;
}

bool ConflictChecker::CheckTeams(const model::Match& match,
                                 const model::CalendarDate& date,
                                 const std::vector<model::TimeOfDay>& times,
                                 model::Error* error) const {
    for (const auto& other : store_.ListMatchesOn(date)) {
        if (other.id == match.id) {
            continue;
        }
        int team_id = 0;
        if (other.Involves(match.home_team_id)) {
            team_id = match.home_team_id;
        } else if (other.Involves(match.visitor_team_id)) {
            team_id = match.visitor_team_id;
        } else {
            continue;
        }
        if (settings_.block_team_same_day || Overlaps(times, other.scheduled_times)) {
            return model::Fail(error, ErrorKind::Conflict,
                               "Team " + std::to_string(team_id) + " already plays match " +
                                   std::to_string(other.id) + " on " + date.ToString());
        }
    }
    return true;
}

bool ConflictChecker::CheckFacility(const model::Match& match,
                                    const model::Facility& facility,
                                    const model::CalendarDate& date,
                                    const std::vector<model::TimeOfDay>& times,
                                    model::Error* error) const {
    if (!facility.IsAvailableOn(date)) {
        return model::Fail(error, ErrorKind::Capacity,
                           facility.name + " is unavailable on " + date.ToString());
    }
    if (times.empty()) {
        return true;
    }
    const auto slots = facility::AvailabilityModel::Availability(facility, date);
    const auto booked = BookedLines(store_.ListMatchesOn(date), facility.id, match.id);
    std::map<int, int> wanted;
    for (const auto& time : times) {
        wanted[time.minutes] += 1;
    }
    for (const auto& [minutes, lines] : wanted) {
        const model::TimeOfDay time{minutes};
        int capacity = -1;
        for (const auto& slot : slots) {
            if (slot.start_time == time) {
                capacity = slot.available_courts;
                break;
            }
        }
        if (capacity < 0) {
            return model::Fail(error, ErrorKind::Capacity,
                               facility.name + " has no slot at " + time.ToString() + " on " + date.ToString());
        }
        const auto it = booked.find(minutes);
        const int taken = it == booked.end() ? 0 : it->second;
        if (taken + lines <= capacity) {
            continue;
        }
        if (taken > 0) {
            return model::Fail(error, ErrorKind::Conflict,
                               facility.name + " at " + time.ToString() + " on " + date.ToString() + " has " +
                                   std::to_string(capacity - taken) + " of " + std::to_string(capacity) +
                                   " court(s) left");
        }
        return model::Fail(error, ErrorKind::Capacity,
                           facility.name + " at " + time.ToString() + " has " + std::to_string(capacity) +
                               " court(s) for " + std::to_string(lines) + " line(s)");
    }
    return true;
}

bool ConflictChecker::Check(const model::Match& match,
                            const model::Facility& facility,
                            const model::CalendarDate& date,
                            const std::vector<model::TimeOfDay>& times,
                            model::Error* error) const {
    return CheckTeams(match, date, times, error) && CheckFacility(match, facility, date, times, error);
}

}  // namespace leaguesched::core::scheduling
