#pragma once

#include <string>

namespace leaguesched::core::api {

struct SchedulingConfig {
    int match_duration_minutes = 180;
    bool block_team_same_day = true;
    int default_season_weeks = 16;
    int max_candidate_dates = 365;
};

struct OutputConfig {
    std::string data_json = "out/league.json";
    std::string bulk_report_json = "out/bulk_report.json";
    // Empty disables the progress log.
    std::string progress_log;
};

struct EngineConfig {
    SchedulingConfig scheduling;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, EngineConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, EngineConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const EngineConfig& config, std::string* error);
    static std::string ToJsonString(const EngineConfig& config);
};

}  // namespace leaguesched::core::api
