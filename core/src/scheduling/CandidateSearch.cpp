#include "leaguesched/core/scheduling/CandidateSearch.h"

#include <algorithm>
#include <set>

namespace leaguesched::core::scheduling {

namespace {

bool Contains(const std::vector<model::Weekday>& days, model::Weekday day) {
    return std::find(days.begin(), days.end(), day) != days.end();
}

}  // namespace

LeagueSeasonWindow::LeagueSeasonWindow(int default_weeks) : default_weeks_(default_weeks) {}

std::optional<SeasonWindow> LeagueSeasonWindow::WindowFor(const model::League& league) const {
    if (!league.start_date) {
        return std::nullopt;
    }
    SeasonWindow window;
    window.start = *league.start_date;
    window.end = league.end_date ? *league.end_date : window.start.AddDays(default_weeks_ * 7);
    if (window.end < window.start) {
        return std::nullopt;
    }
    return window;
}

int CandidateSearch::DatePriority(model::Weekday day,
                                  const model::League& league,
                                  const model::Team& home,
                                  const model::Team& visitor) {
    const bool league_open = league.preferred_days.empty() && league.backup_days.empty();
    if (!league_open && !Contains(league.preferred_days, day) && !Contains(league.backup_days, day)) {
        return 0;
    }
    const bool home_likes = Contains(home.preferred_days, day);
    const bool visitor_likes = Contains(visitor.preferred_days, day);
    if (home_likes && visitor_likes) {
        return 1;
    }
    if (home_likes || visitor_likes) {
        return 2;
    }
    if (Contains(league.preferred_days, day)) {
        return 3;
    }
    if (Contains(league.backup_days, day)) {
        return 4;
    }
    return 5;
}

std::vector<CandidateDate> CandidateSearch::CandidateDates(const SeasonWindow& window,
                                                           const model::League& league,
                                                           const model::Team& home,
                                                           const model::Team& visitor,
                                                           std::size_t max_dates) {
    std::vector<CandidateDate> dates;
    for (auto date = window.start; date <= window.end; date = date.AddDays(1)) {
        const int priority = DatePriority(date.weekday(), league, home, visitor);
        if (priority > 0) {
            dates.push_back({date, priority});
        }
    }
    std::stable_sort(dates.begin(), dates.end(), [](const CandidateDate& a, const CandidateDate& b) {
        return a.priority < b.priority;
    });
    if (dates.size() > max_dates) {
        dates.resize(max_dates);
    }
    return dates;
}

std::vector<int> CandidateSearch::CandidateFacilities(const model::League& league,
                                                      const model::Team& home,
                                                      const model::Team& visitor,
                                                      const std::vector<model::Facility>& facilities) {
    std::set<int> known;
    for (const auto& facility : facilities) {
        known.insert(facility.id);
    }

    std::vector<int> order;
    std::set<int> seen;
    auto add = [&](int facility_id) {
        if (known.count(facility_id) > 0 && seen.insert(facility_id).second) {
            order.push_back(facility_id);
        }
    };

    add(home.home_facility_id);
    for (int facility_id : league.preferred_facility_ids) {
        add(facility_id);
    }
    add(visitor.home_facility_id);
    for (int facility_id : known) {
        add(facility_id);
    }
    return order;
}

}  // namespace leaguesched::core::scheduling
