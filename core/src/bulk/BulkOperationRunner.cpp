#include "leaguesched/core/bulk/BulkOperationRunner.h"

#include <exception>
#include <utility>

namespace leaguesched::core::bulk {

namespace {

using model::ErrorKind;

BulkEntry Succeeded(int match_id, std::string detail) {
    return BulkEntry{match_id, BulkOutcome::Succeeded, ErrorKind::None, std::move(detail)};
}

BulkEntry Skipped(int match_id, ErrorKind kind, std::string detail) {
    return BulkEntry{match_id, BulkOutcome::Skipped, kind, std::move(detail)};
}

BulkEntry Failed(int match_id, ErrorKind kind, std::string detail) {
    return BulkEntry{match_id, BulkOutcome::Failed, kind, std::move(detail)};
}

std::string JoinTimes(const std::vector<model::TimeOfDay>& times) {
    std::string text;
    for (const auto& time : times) {
        if (!text.empty()) {
            text += ',';
        }
        text += time.ToString();
    }
    return text;
}

}  // namespace

BulkOperationRunner::BulkOperationRunner(persist::ILeagueStore& store,
                                         scheduling::MatchScheduler& scheduler,
                                         const scheduling::ISeasonWindowProvider& windows,
                                         std::size_t max_candidate_dates,
                                         LogFn log_fn)
    : store_(store),
      scheduler_(scheduler),
      windows_(windows),
      max_candidate_dates_(max_candidate_dates),
      log_fn_(std::move(log_fn)) {}

std::vector<int> BulkOperationRunner::ResolveScope(const BulkScope& scope) const {
    const auto matches = scope.kind == BulkScope::Kind::League ? store_.ListMatchesForLeague(scope.league_id)
                                                               : store_.ListMatches();
    std::vector<int> ids;
    for (const auto& match : matches) {
        if (scope.Includes(match)) {
            ids.push_back(match.id);
        }
    }
    return ids;
}

BulkOperationResult BulkOperationRunner::Run(BulkOperation operation, const BulkScope& scope) {
    return Run(operation, ResolveScope(scope), scope.Describe());
}

BulkOperationResult BulkOperationRunner::Run(BulkOperation operation,
                                             const std::vector<int>& match_ids,
                                             const std::string& scope_label) {
    BulkOperationResult result;
    result.operation = operation;
    result.scope = scope_label;
    result.entries.reserve(match_ids.size());

    Log("[bulk] " + BulkOperationName(operation) + " over " + scope_label + " (" +
        std::to_string(match_ids.size()) + " match(es))");
    for (int match_id : match_ids) {
        BulkEntry entry;
        try {
            entry = Process(operation, match_id);
        } catch (const std::exception& ex) {
            entry = Failed(match_id, ErrorKind::Internal, ex.what());
        }
        if (entry.outcome != BulkOutcome::Succeeded) {
            Log("[bulk] Match " + std::to_string(match_id) + " " + BulkOutcomeName(entry.outcome) + ": " +
                entry.detail);
        }
        result.entries.push_back(std::move(entry));
    }
    Log("[bulk] " + result.Summary());
    return result;
}

BulkEntry BulkOperationRunner::Process(BulkOperation operation, int match_id) {
    // Reread so earlier matches in this run are visible.
    const auto match = store_.FindMatch(match_id);
    if (!match) {
        return Failed(match_id, ErrorKind::NotFound, "match no longer exists");
    }
    switch (operation) {
        case BulkOperation::AutoSchedule:
            return AutoSchedule(*match);
        case BulkOperation::Unschedule:
            return Unschedule(*match);
        case BulkOperation::Delete:
            return Delete(*match);
    }
    return Failed(match_id, ErrorKind::InvalidRequest, "unknown operation");
}

BulkEntry BulkOperationRunner::AutoSchedule(const model::Match& match) {
    if (match.IsScheduled()) {
        return Skipped(match.id, ErrorKind::None, "already scheduled");
    }
    const auto league = store_.FindLeague(match.league_id);
    if (!league) {
        return Failed(match.id, ErrorKind::NotFound, "unknown league " + std::to_string(match.league_id));
    }
    const auto home = store_.FindTeam(match.home_team_id);
    const auto visitor = store_.FindTeam(match.visitor_team_id);
    if (!home || !visitor) {
        return Failed(match.id, ErrorKind::NotFound, "unknown team");
    }
    const auto window = windows_.WindowFor(*league);
    if (!window) {
        return Failed(match.id, ErrorKind::InvalidRequest, league->name + " has no season start date");
    }

    const auto dates = scheduling::CandidateSearch::CandidateDates(*window, *league, *home, *visitor,
                                                                   max_candidate_dates_);
    const auto facility_ids =
        scheduling::CandidateSearch::CandidateFacilities(*league, *home, *visitor, store_.ListFacilities());
    if (dates.empty() || facility_ids.empty()) {
        return Failed(match.id, ErrorKind::InsufficientCapacity, "no available dates");
    }

    scheduling::ScheduleOptions options;
    options.time_option = scheduling::TimeOption::Auto;
    options.num_lines = match.num_lines;

    model::Error last_error;
    for (const auto& candidate : dates) {
        for (int facility_id : facility_ids) {
            model::Match attempt = match;
            model::Error error;
            if (scheduler_.Schedule(attempt, facility_id, candidate.date, options, &error)) {
                return Succeeded(match.id, "facility " + std::to_string(facility_id) + " on " +
                                               candidate.date.ToString() + " at " +
                                               JoinTimes(attempt.scheduled_times));
            }
            last_error = std::move(error);
        }
    }
    return Failed(match.id, last_error.kind, "no facility/date fits: " + last_error.message);
}

BulkEntry BulkOperationRunner::Unschedule(const model::Match& match) {
    model::Match target = match;
    model::Error error;
    if (!scheduler_.Unschedule(target, &error)) {
        return Failed(match.id, error.kind, error.message);
    }
    return Succeeded(match.id, "unscheduled");
}

BulkEntry BulkOperationRunner::Delete(const model::Match& match) {
    model::Error error;
    if (scheduler_.Delete(match, &error)) {
        return Succeeded(match.id, "deleted");
    }
    if (error.kind == ErrorKind::DeleteUnsafe) {
        return Skipped(match.id, error.kind, error.message);
    }
    return Failed(match.id, error.kind, error.message);
}

void BulkOperationRunner::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace leaguesched::core::bulk
