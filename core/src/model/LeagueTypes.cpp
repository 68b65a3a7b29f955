#include "leaguesched/core/model/LeagueTypes.h"

namespace leaguesched::core::model {

bool Match::IsPartiallyScheduled(int expected_lines) const {
    const int lines = static_cast<int>(scheduled_times.size());
    if (lines == 0) {
        // Placed at a facility and date without line times.
        return facility_id.has_value() && date.has_value();
    }
    return IsScheduled() && lines < expected_lines;
}

bool Match::IsFullyScheduled(int expected_lines) const {
    return IsScheduled() && static_cast<int>(scheduled_times.size()) == expected_lines;
}

std::string Match::status(int expected_lines) const {
    if (IsPartiallyScheduled(expected_lines)) {
        return "partially_scheduled";
    }
    if (!IsScheduled()) {
        return "unscheduled";
    }
    if (IsFullyScheduled(expected_lines)) {
        return "fully_scheduled";
    }
    return "over_scheduled";
}

int ExpectedLines(const Match& match, const League& league) {
    return match.num_lines > 0 ? match.num_lines : league.num_lines_per_match;
}

bool operator==(const Match& a, const Match& b) {
    return a.id == b.id && a.league_id == b.league_id && a.home_team_id == b.home_team_id &&
           a.visitor_team_id == b.visitor_team_id && a.facility_id == b.facility_id &&
           a.date == b.date && a.scheduled_times == b.scheduled_times && a.num_lines == b.num_lines;
}

}  // namespace leaguesched::core::model
