#include "leaguesched/core/scheduling/MatchScheduler.h"

#include "leaguesched/core/facility/AvailabilityModel.h"

#include <sstream>
#include <utility>

namespace leaguesched::core::scheduling {

namespace {

using model::ErrorKind;

std::string DescribeTimes(const std::vector<model::TimeOfDay>& times) {
    if (times.empty()) {
        return "no times";
    }
    std::ostringstream out;
    for (size_t i = 0; i < times.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << times[i].ToString();
    }
    return out.str();
}

}  // namespace

MatchScheduler::MatchScheduler(persist::ILeagueStore& store, ConflictSettings settings, LogFn log_fn)
    : store_(store), checker_(store, settings), log_fn_(std::move(log_fn)) {}

bool MatchScheduler::Schedule(model::Match& match,
                              const std::optional<int>& facility_id,
                              const std::optional<model::CalendarDate>& date,
                              const ScheduleOptions& options,
                              model::Error* error) {
    if (!facility_id || !date) {
        return model::Fail(error, ErrorKind::InvalidRequest,
                           "Match " + std::to_string(match.id) + " needs both a facility and a date");
    }
    if (options.num_lines < 0) {
        return model::Fail(error, ErrorKind::InvalidRequest, "num_lines must not be negative");
    }
    if (!store_.FindMatch(match.id)) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match.id));
    }
    const auto league = store_.FindLeague(match.league_id);
    if (!league) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown league " + std::to_string(match.league_id));
    }
    const auto facility = store_.FindFacility(*facility_id);
    if (!facility) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown facility " + std::to_string(*facility_id));
    }
    if (!facility->IsAvailableOn(*date)) {
        return model::Fail(error, ErrorKind::Capacity,
                           facility->name + " is unavailable on " + date->ToString());
    }
    if (checker_.settings().block_team_same_day &&
        !checker_.CheckTeams(match, *date, {}, error)) {
        return false;
    }

    model::Match updated = match;
    updated.num_lines = options.num_lines;

    PlanRequest request;
    request.num_lines = model::ExpectedLines(updated, *league);
    request.time_option = options.time_option;
    request.allow_split_lines = league->allow_split_lines;
    request.times = options.times;
    request.partial_schedule = options.partial_schedule;

    std::vector<model::TimeOfDay> times;
    const auto remaining = checker_.RemainingSlots(*facility, *date, match.id);
    model::Error plan_error;
    if (!SlotPlanner::Plan(request, remaining, times, &plan_error)) {
        // A plan that fits the empty facility fails only because of other bookings.
        std::vector<model::TimeOfDay> unbooked;
        if (SlotPlanner::Plan(request, core::facility::AvailabilityModel::Availability(*facility, *date), unbooked,
                              nullptr)) {
            return model::Fail(error, ErrorKind::Conflict,
                               facility->name + " on " + date->ToString() + " is already booked at " +
                                   DescribeTimes(unbooked) + ": " + plan_error.message);
        }
        if (error) {
            *error = plan_error;
        }
        return false;
    }
    if (!checker_.Check(match, *facility, *date, times, error)) {
        return false;
    }

    updated.facility_id = facility->id;
    updated.date = *date;
    updated.scheduled_times = std::move(times);
    if (!Commit(match, updated, error)) {
        return false;
    }
    Log("[leaguesched] Scheduled match " + std::to_string(match.id) + " at " + facility->name + " on " +
        date->ToString() + " (" + DescribeTimes(match.scheduled_times) + ")");
    return true;
}

bool MatchScheduler::Unschedule(model::Match& match, model::Error* error) {
    if (!store_.FindMatch(match.id)) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match.id));
    }
    model::Match updated = match;
    updated.facility_id.reset();
    updated.date.reset();
    updated.scheduled_times.clear();
    updated.num_lines = 0;
    if (!Commit(match, updated, error)) {
        return false;
    }
    Log("[leaguesched] Unscheduled match " + std::to_string(match.id));
    return true;
}

bool MatchScheduler::Delete(const model::Match& match, model::Error* error) {
    const auto stored = store_.FindMatch(match.id);
    if (!stored) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match.id));
    }
    if (!stored->IsUnscheduled()) {
        return model::Fail(error, ErrorKind::DeleteUnsafe,
                           "Match " + std::to_string(match.id) + " is scheduled; unschedule it first");
    }
    std::string store_error;
    if (!store_.DeleteMatch(match.id, &store_error)) {
        return model::Fail(error, ErrorKind::Persistence, store_error);
    }
    Log("[leaguesched] Deleted match " + std::to_string(match.id));
    return true;
}

bool MatchScheduler::Commit(model::Match& match, const model::Match& updated, model::Error* error) {
    std::string store_error;
    if (!store_.UpdateMatch(updated, &store_error)) {
        Log("[leaguesched] Failed to store match " + std::to_string(match.id) + ": " + store_error);
        return model::Fail(error, ErrorKind::Persistence, store_error);
    }
    match = updated;
    return true;
}

void MatchScheduler::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace leaguesched::core::scheduling
