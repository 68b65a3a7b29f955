#pragma once

#include "leaguesched/core/bulk/BulkTypes.h"
#include "leaguesched/core/persist/ILeagueStore.h"
#include "leaguesched/core/scheduling/CandidateSearch.h"
#include "leaguesched/core/scheduling/MatchScheduler.h"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace leaguesched::core::bulk {

// Applies one operation to many matches. Each match is handled on its own:
// a failure is recorded in the result and processing moves on.
class BulkOperationRunner {
public:
    using LogFn = std::function<void(const std::string&)>;

    BulkOperationRunner(persist::ILeagueStore& store,
                        scheduling::MatchScheduler& scheduler,
                        const scheduling::ISeasonWindowProvider& windows,
                        std::size_t max_candidate_dates,
                        LogFn log_fn = {});

    // Matches in scope, ordered by id.
    std::vector<int> ResolveScope(const BulkScope& scope) const;

    BulkOperationResult Run(BulkOperation operation, const BulkScope& scope);
    BulkOperationResult Run(BulkOperation operation, const std::vector<int>& match_ids, const std::string& scope_label);

private:
    BulkEntry Process(BulkOperation operation, int match_id);
    BulkEntry AutoSchedule(const model::Match& match);
    BulkEntry Unschedule(const model::Match& match);
    BulkEntry Delete(const model::Match& match);
    void Log(const std::string& line) const;

    persist::ILeagueStore& store_;
    scheduling::MatchScheduler& scheduler_;
    const scheduling::ISeasonWindowProvider& windows_;
    std::size_t max_candidate_dates_ = 365;
    LogFn log_fn_{};
};

}  // namespace leaguesched::core::bulk
