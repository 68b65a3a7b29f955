#pragma once

#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/model/LeagueTypes.h"
#include "leaguesched/core/persist/ILeagueStore.h"
#include "leaguesched/core/scheduling/ConflictChecker.h"
#include "leaguesched/core/scheduling/SlotPlanner.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::scheduling {

struct ScheduleOptions {
    TimeOption time_option = TimeOption::Auto;
    std::vector<model::TimeOfDay> times;
    // 0 uses the league's num_lines_per_match.
    int num_lines = 0;
    bool partial_schedule = false;
};

class MatchScheduler {
public:
    using LogFn = std::function<void(const std::string&)>;

    MatchScheduler(persist::ILeagueStore& store, ConflictSettings settings, LogFn log_fn = {});

    // On failure `match` and the store are left untouched.
    bool Schedule(model::Match& match,
                  const std::optional<int>& facility_id,
                  const std::optional<model::CalendarDate>& date,
                  const ScheduleOptions& options,
                  model::Error* error);
    bool Unschedule(model::Match& match, model::Error* error);
    bool Delete(const model::Match& match, model::Error* error);

private:
    bool Commit(model::Match& match, const model::Match& updated, model::Error* error);
    void Log(const std::string& line) const;

    persist::ILeagueStore& store_;
    ConflictChecker checker_;
    LogFn log_fn_{};
};

}  // namespace leaguesched::core::scheduling
