#pragma once

#include "leaguesched/core/api/EngineConfig.h"
#include "leaguesched/core/bulk/BulkOperationRunner.h"
#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/persist/ILeagueStore.h"
#include "leaguesched/core/scheduling/CandidateSearch.h"
#include "leaguesched/core/scheduling/MatchScheduler.h"

#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace leaguesched::core::api {

class LeagueEngine {
public:
    using LogFn = std::function<void(const std::string&)>;

    // `sink` receives every log line in addition to the internal buffer.
    LeagueEngine(persist::ILeagueStore& store, EngineConfig config, LogFn sink = {});

    LeagueEngine(const LeagueEngine&) = delete;
    LeagueEngine& operator=(const LeagueEngine&) = delete;

    bool GenerateFixtures(int league_id, int& created_count, model::Error* error);

    bool ScheduleMatch(int match_id,
                       int facility_id,
                       const model::CalendarDate& date,
                       const scheduling::ScheduleOptions& options,
                       model::Match* updated,
                       model::Error* error);
    bool UnscheduleMatch(int match_id, model::Error* error);
    bool DeleteMatch(int match_id, model::Error* error);

    bulk::BulkOperationResult RunBulk(bulk::BulkOperation operation, const bulk::BulkScope& scope);

    std::string GetLastLogLines(int n) const;
    const EngineConfig& config() const { return config_; }

private:
    void AppendLogLine(const std::string& line);

    persist::ILeagueStore& store_;
    EngineConfig config_;
    LogFn sink_{};
    scheduling::LeagueSeasonWindow windows_;
    scheduling::MatchScheduler scheduler_;
    bulk::BulkOperationRunner runner_;

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_{};
    size_t max_log_lines_ = 2000;
};

}  // namespace leaguesched::core::api
