#pragma once

#include "leaguesched/core/model/CalendarDate.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace leaguesched::core::model {

struct League {
    int id = 0;
    std::string name;
    int year = 0;
    std::string section;
    std::string region;
    std::string age_group;
    std::string division;
    int num_matches = 10;
    int num_lines_per_match = 3;
    bool allow_split_lines = false;
    std::vector<Weekday> preferred_days;
    std::vector<Weekday> backup_days;
    std::optional<CalendarDate> start_date;
    std::optional<CalendarDate> end_date;
    std::vector<int> preferred_facility_ids;
};

struct Team {
    int id = 0;
    std::string name;
    int league_id = 0;
    std::string captain;
    int home_facility_id = 0;
    std::vector<Weekday> preferred_days;
};

struct TimeSlot {
    TimeOfDay start_time;
    int available_courts = 0;
};

// Slots per weekday, kept sorted by start time.
using WeeklySchedule = std::map<Weekday, std::vector<TimeSlot>>;

struct Facility {
    int id = 0;
    std::string name;
    std::string short_name;
    std::string location;
    int total_courts = 0;
    WeeklySchedule schedule;
    std::set<CalendarDate> unavailable_dates;

    bool IsAvailableOn(const CalendarDate& date) const { return unavailable_dates.count(date) == 0; }
};

struct Match {
    int id = 0;
    int league_id = 0;
    int home_team_id = 0;
    int visitor_team_id = 0;
    std::optional<int> facility_id;
    std::optional<CalendarDate> date;
    std::vector<TimeOfDay> scheduled_times;
    // Caller override of the league's line count; 0 means the league default.
    int num_lines = 0;

    bool IsScheduled() const {
        return facility_id.has_value() && date.has_value() && !scheduled_times.empty();
    }
    bool IsUnscheduled() const {
        return !facility_id.has_value() && !date.has_value() && scheduled_times.empty();
    }
    bool IsPartiallyScheduled(int expected_lines) const;
    bool IsFullyScheduled(int expected_lines) const;
    std::string status(int expected_lines) const;
    bool Involves(int team_id) const { return home_team_id == team_id || visitor_team_id == team_id; }
};

int ExpectedLines(const Match& match, const League& league);

bool operator==(const Match& a, const Match& b);
inline bool operator!=(const Match& a, const Match& b) { return !(a == b); }

}  // namespace leaguesched::core::model
