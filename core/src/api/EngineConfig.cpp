#include "leaguesched/core/api/EngineConfig.h"

#include "leaguesched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace leaguesched::core::api {

namespace {

bool ParseJson(const std::string& text, nlohmann::json& root, std::string* error) {
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    if (!root.is_object()) {
        if (error) {
            *error = "Config root must be a JSON object";
        }
        return false;
    }
    return true;
}

bool Validate(const EngineConfig& config, std::string* error) {
    const auto& scheduling = config.scheduling;
    std::string problem;
    if (scheduling.match_duration_minutes < 1) {
        problem = "scheduling.match_duration_minutes must be positive";
    } else if (scheduling.default_season_weeks < 1) {
        problem = "scheduling.default_season_weeks must be positive";
    } else if (scheduling.max_candidate_dates < 1) {
        problem = "scheduling.max_candidate_dates must be positive";
    } else if (config.output.data_json.empty()) {
        problem = "output.data_json must not be empty";
    }
    if (problem.empty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

nlohmann::json ToJson(const EngineConfig& config) {
    nlohmann::json root;
    root["scheduling"] = {
        {"match_duration_minutes", config.scheduling.match_duration_minutes},
        {"block_team_same_day", config.scheduling.block_team_same_day},
        {"default_season_weeks", config.scheduling.default_season_weeks},
        {"max_candidate_dates", config.scheduling.max_candidate_dates},
    };
    root["output"] = {
        {"data_json", config.output.data_json},
        {"bulk_report_json", config.output.bulk_report_json},
        {"progress_log", config.output.progress_log},
    };
    return root;
}

}  // namespace

bool EngineConfig::LoadFromString(const std::string& text, EngineConfig& config, std::string* error) {
    nlohmann::json root;
    if (!ParseJson(text, root, error)) {
        return false;
    }

    EngineConfig loaded;
    try {
        if (root.contains("scheduling")) {
            const auto& node = root.at("scheduling");
            auto& scheduling = loaded.scheduling;
            scheduling.match_duration_minutes =
                node.value("match_duration_minutes", scheduling.match_duration_minutes);
            scheduling.block_team_same_day = node.value("block_team_same_day", scheduling.block_team_same_day);
            scheduling.default_season_weeks = node.value("default_season_weeks", scheduling.default_season_weeks);
            scheduling.max_candidate_dates = node.value("max_candidate_dates", scheduling.max_candidate_dates);
        }
        if (root.contains("output")) {
            const auto& node = root.at("output");
            loaded.output.data_json = node.value("data_json", loaded.output.data_json);
            loaded.output.bulk_report_json = node.value("bulk_report_json", loaded.output.bulk_report_json);
            loaded.output.progress_log = node.value("progress_log", loaded.output.progress_log);
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }

    if (!Validate(loaded, error)) {
        return false;
    }
    config = loaded;
    return true;
}

bool EngineConfig::LoadFromFile(const std::string& path, EngineConfig& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return LoadFromString(text, config, error);
}

bool EngineConfig::SaveToFile(const std::string& path, const EngineConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJsonString(config), error);
}

std::string EngineConfig::ToJsonString(const EngineConfig& config) {
    return ToJson(config).dump(2);
}

}  // namespace leaguesched::core::api
