#pragma once

#include "leaguesched/core/model/LeagueTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace leaguesched::core::scheduling {

// Inclusive on both ends.
struct SeasonWindow {
    model::CalendarDate start;
    model::CalendarDate end;
};

class ISeasonWindowProvider {
public:
    virtual ~ISeasonWindowProvider() = default;
    virtual std::optional<SeasonWindow> WindowFor(const model::League& league) const = 0;
};

// Reads the window from the league itself; an open end runs `default_weeks`.
class LeagueSeasonWindow final : public ISeasonWindowProvider {
public:
    explicit LeagueSeasonWindow(int default_weeks = 16);

    std::optional<SeasonWindow> WindowFor(const model::League& league) const override;

private:
    int default_weeks_ = 16;
};

struct CandidateDate {
    model::CalendarDate date;
    // 1 both teams prefer the day, 2 one team, 3 league preferred,
    // 4 league backup, 5 league lists no days at all.
    int priority = 5;
};

class CandidateSearch {
public:
    static int DatePriority(model::Weekday day,
                            const model::League& league,
                            const model::Team& home,
                            const model::Team& visitor);

    // Sorted by priority, then by date; at most `max_dates` entries.
    static std::vector<CandidateDate> CandidateDates(const SeasonWindow& window,
                                                     const model::League& league,
                                                     const model::Team& home,
                                                     const model::Team& visitor,
                                                     std::size_t max_dates);

    // Home facility, league preferred facilities, visitor facility, then the
    // rest by id. Each facility id appears once; unknown ids are dropped.
    static std::vector<int> CandidateFacilities(const model::League& league,
                                                const model::Team& home,
                                                const model::Team& visitor,
                                                const std::vector<model::Facility>& facilities);
};

}  // namespace leaguesched::core::scheduling
