#include "leaguesched/core/api/LeagueEngine.h"

#include "leaguesched/core/fixtures/FixtureGenerator.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace leaguesched::core::api {

namespace {

using model::ErrorKind;

scheduling::ConflictSettings ToConflictSettings(const SchedulingConfig& config) {
    scheduling::ConflictSettings settings;
    settings.match_duration_minutes = config.match_duration_minutes;
    settings.block_team_same_day = config.block_team_same_day;
    return settings;
}

void AppendProgressLog(const std::string& path, const std::string& line) {
    const std::filesystem::path fs_path(path);
    std::error_code ec;
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
    }
    std::ofstream output(path, std::ios::binary | std::ios::app);
    if (!output) {
        std::cerr << "[leaguesched] Failed to open progress log: " << path << '\n';
        return;
    }
    output << line << '\n';
}

}  // namespace

LeagueEngine::LeagueEngine(persist::ILeagueStore& store, EngineConfig config, LogFn sink)
    : store_(store),
      config_(std::move(config)),
      sink_(std::move(sink)),
      windows_(config_.scheduling.default_season_weeks),
      scheduler_(store_, ToConflictSettings(config_.scheduling), [this](const std::string& line) {
          AppendLogLine(line);
      }),
      runner_(store_,
              scheduler_,
              windows_,
              static_cast<std::size_t>(config_.scheduling.max_candidate_dates),
              [this](const std::string& line) { AppendLogLine(line); }) {}

bool LeagueEngine::GenerateFixtures(int league_id, int& created_count, model::Error* error) {
    created_count = 0;
    const auto league = store_.FindLeague(league_id);
    if (!league) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown league " + std::to_string(league_id));
    }

    std::vector<model::Match> created;
    model::Error generate_error;
    if (!fixtures::FixtureGenerator::Generate(*league, store_.ListTeams(league_id), store_.ListMatches(), created,
                                              &generate_error)) {
        AppendLogLine("[leaguesched] Fixture generation for " + league->name + " failed: " +
                      generate_error.message);
        if (error) {
            *error = generate_error;
        }
        return false;
    }

    for (const auto& match : created) {
        std::string store_error;
        if (!store_.CreateMatch(match, &store_error)) {
            AppendLogLine("[leaguesched] Stored " + std::to_string(created_count) + " of " +
                          std::to_string(created.size()) + " fixtures for " + league->name + ": " + store_error);
            return model::Fail(error, ErrorKind::Persistence, store_error);
        }
        ++created_count;
    }
    AppendLogLine("[leaguesched] Generated " + std::to_string(created_count) + " fixture(s) for " + league->name);
    return true;
}

bool LeagueEngine::ScheduleMatch(int match_id,
                                 int facility_id,
                                 const model::CalendarDate& date,
                                 const scheduling::ScheduleOptions& options,
                                 model::Match* updated,
                                 model::Error* error) {
    auto match = store_.FindMatch(match_id);
    if (!match) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match_id));
    }
    if (!scheduler_.Schedule(*match, facility_id, date, options, error)) {
        return false;
    }
    if (updated) {
        *updated = *match;
    }
    return true;
}

bool LeagueEngine::UnscheduleMatch(int match_id, model::Error* error) {
    auto match = store_.FindMatch(match_id);
    if (!match) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match_id));
    }
    return scheduler_.Unschedule(*match, error);
}

bool LeagueEngine::DeleteMatch(int match_id, model::Error* error) {
    const auto match = store_.FindMatch(match_id);
    if (!match) {
        return model::Fail(error, ErrorKind::NotFound, "Unknown match " + std::to_string(match_id));
    }
    return scheduler_.Delete(*match, error);
}

bulk::BulkOperationResult LeagueEngine::RunBulk(bulk::BulkOperation operation, const bulk::BulkScope& scope) {
    return runner_.Run(operation, scope);
}

std::string LeagueEngine::GetLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

void LeagueEngine::AppendLogLine(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_lines_.size() >= max_log_lines_) {
            log_lines_.pop_front();
        }
        log_lines_.push_back(line);
        if (!config_.output.progress_log.empty()) {
            AppendProgressLog(config_.output.progress_log, line);
        }
    }
    if (sink_) {
        sink_(line);
    }
}

}  // namespace leaguesched::core::api
