#include "leaguesched/core/api/EngineConfig.h"
#include "leaguesched/core/api/LeagueEngine.h"
#include "leaguesched/core/bulk/BulkTypes.h"
#include "leaguesched/core/persist/InMemoryLeagueStore.h"
#include "leaguesched/core/persist/LeagueSnapshot.h"
#include "leaguesched/core/util/AtomicFileWriter.h"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using leaguesched::core::api::EngineConfig;
using leaguesched::core::api::LeagueEngine;
using leaguesched::core::model::CalendarDate;
using leaguesched::core::model::Error;
using leaguesched::core::model::ErrorKindName;
using leaguesched::core::model::TimeOfDay;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitOperationFailed = 2;

void PrintUsage() {
    std::cerr << "Usage: leagueschedcli <config.json> <command> [args]\n"
              << "  generate <league_id>\n"
              << "  schedule <match_id> <facility_id> <YYYY-MM-DD> [--same HH:MM | --custom HH:MM,... | --partial]"
                 " [--lines N]\n"
              << "  unschedule <match_id>\n"
              << "  delete <match_id>\n"
              << "  bulk <auto-schedule|unschedule|delete> [--league ID] [--facility ID] [--team ID]\n";
}

std::optional<int> ParseId(const std::string& text) {
    try {
        size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool ParseTimes(const std::string& text, std::vector<TimeOfDay>& times) {
    std::istringstream input(text);
    std::string item;
    while (std::getline(input, item, ',')) {
        const auto time = TimeOfDay::Parse(item);
        if (!time) {
            return false;
        }
        times.push_back(*time);
    }
    return !times.empty();
}

int ReportFailure(const std::string& what, const Error& error) {
    std::cerr << "[leagueschedcli] " << what << " failed (" << ErrorKindName(error.kind) << "): " << error.message
              << '\n';
    return kExitOperationFailed;
}

bool SaveData(const EngineConfig& config, const leaguesched::core::persist::InMemoryLeagueStore& store) {
    std::string error;
    if (!leaguesched::core::persist::SaveSnapshot(config.output.data_json, store, &error)) {
        std::cerr << "[leagueschedcli] " << error << '\n';
        return false;
    }
    return true;
}

int RunGenerate(LeagueEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }
    const auto league_id = ParseId(args[0]);
    if (!league_id) {
        std::cerr << "[leagueschedcli] Invalid league id: " << args[0] << '\n';
        return kExitUsage;
    }
    int created = 0;
    Error error;
    if (!engine.GenerateFixtures(*league_id, created, &error)) {
        return ReportFailure("generate", error);
    }
    std::cout << "[leagueschedcli] created_count=" << created << '\n';
    return kExitOk;
}

int RunSchedule(LeagueEngine& engine, const std::vector<std::string>& args) {
    using leaguesched::core::scheduling::ScheduleOptions;
    using leaguesched::core::scheduling::TimeOption;

    if (args.size() < 3) {
        PrintUsage();
        return kExitUsage;
    }
    const auto match_id = ParseId(args[0]);
    const auto facility_id = ParseId(args[1]);
    const auto date = CalendarDate::Parse(args[2]);
    if (!match_id || !facility_id || !date) {
        std::cerr << "[leagueschedcli] Invalid match id, facility id or date." << '\n';
        return kExitUsage;
    }

    ScheduleOptions options;
    for (size_t i = 3; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if (arg == "--partial") {
            options.partial_schedule = true;
        } else if (arg == "--same" && has_value) {
            const auto time = TimeOfDay::Parse(args[++i]);
            if (!time) {
                std::cerr << "[leagueschedcli] Invalid time: " << args[i] << '\n';
                return kExitUsage;
            }
            options.time_option = TimeOption::Same;
            options.times = {*time};
        } else if (arg == "--custom" && has_value) {
            options.time_option = TimeOption::Custom;
            if (!ParseTimes(args[++i], options.times)) {
                std::cerr << "[leagueschedcli] Invalid time list: " << args[i] << '\n';
                return kExitUsage;
            }
        } else if (arg == "--lines" && has_value) {
            const auto lines = ParseId(args[++i]);
            if (!lines || *lines < 1) {
                std::cerr << "[leagueschedcli] Invalid line count: " << args[i] << '\n';
                return kExitUsage;
            }
            options.num_lines = *lines;
        } else {
            std::cerr << "[leagueschedcli] Unknown option: " << arg << '\n';
            return kExitUsage;
        }
    }

    leaguesched::core::model::Match updated;
    Error error;
    if (!engine.ScheduleMatch(*match_id, *facility_id, *date, options, &updated, &error)) {
        return ReportFailure("schedule", error);
    }
    std::cout << "[leagueschedcli] Match " << updated.id << " on " << updated.date->ToString() << " at facility "
              << *updated.facility_id << ":";
    for (const auto& time : updated.scheduled_times) {
        std::cout << ' ' << time.ToString();
    }
    std::cout << '\n';
    return kExitOk;
}

int RunSingle(LeagueEngine& engine, const std::string& command, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }
    const auto match_id = ParseId(args[0]);
    if (!match_id) {
        std::cerr << "[leagueschedcli] Invalid match id: " << args[0] << '\n';
        return kExitUsage;
    }
    Error error;
    const bool ok = command == "unschedule" ? engine.UnscheduleMatch(*match_id, &error)
                                            : engine.DeleteMatch(*match_id, &error);
    if (!ok) {
        return ReportFailure(command, error);
    }
    return kExitOk;
}

int RunBulk(LeagueEngine& engine, const std::vector<std::string>& args) {
    using leaguesched::core::bulk::BulkOperation;
    using leaguesched::core::bulk::BulkScope;

    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }
    BulkOperation operation = BulkOperation::AutoSchedule;
    if (!leaguesched::core::bulk::ParseBulkOperation(args[0], operation)) {
        std::cerr << "[leagueschedcli] Unknown bulk operation: " << args[0] << '\n';
        return kExitUsage;
    }

    std::optional<int> league_id;
    std::optional<int> facility_id;
    std::optional<int> team_id;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::optional<int>* target = nullptr;
        if (arg == "--league") {
            target = &league_id;
        } else if (arg == "--facility") {
            target = &facility_id;
        } else if (arg == "--team") {
            target = &team_id;
        }
        if (target == nullptr || i + 1 >= args.size()) {
            std::cerr << "[leagueschedcli] Unknown option: " << arg << '\n';
            return kExitUsage;
        }
        *target = ParseId(args[++i]);
        if (!*target) {
            std::cerr << "[leagueschedcli] Invalid id: " << args[i] << '\n';
            return kExitUsage;
        }
    }

    BulkScope scope;
    if (facility_id || team_id) {
        std::ostringstream label;
        label << "matches with";
        if (league_id) {
            label << " league " << *league_id;
        }
        if (facility_id) {
            label << " facility " << *facility_id;
        }
        if (team_id) {
            label << " team " << *team_id;
        }
        scope = BulkScope::Filtered(label.str(), [=](const leaguesched::core::model::Match& match) {
            return (!league_id || match.league_id == *league_id) &&
                   (!facility_id || match.facility_id == facility_id) && (!team_id || match.Involves(*team_id));
        });
    } else if (league_id) {
        scope = BulkScope::ForLeague(*league_id);
    } else {
        scope = BulkScope::AllMatches();
    }

    const auto result = engine.RunBulk(operation, scope);
    if (result.HasWarnings()) {
        std::cout << "[leagueschedcli] Warning: " << result.Summary() << '\n';
        for (const auto& entry : result.entries) {
            if (entry.outcome != leaguesched::core::bulk::BulkOutcome::Succeeded) {
                std::cout << "  match " << entry.match_id << ": "
                          << leaguesched::core::bulk::BulkOutcomeName(entry.outcome) << " - " << entry.detail << '\n';
            }
        }
    } else {
        std::cout << "[leagueschedcli] " << result.Summary() << '\n';
    }

    const auto& report_path = engine.config().output.bulk_report_json;
    if (!report_path.empty()) {
        std::string error;
        if (!leaguesched::core::util::AtomicFileWriter::Write(report_path, result.ToJsonString(), &error)) {
            std::cerr << "[leagueschedcli] " << error << '\n';
        }
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return kExitUsage;
    }

    const std::string config_path = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    EngineConfig config;
    std::string config_error;
    if (!EngineConfig::LoadFromFile(config_path, config, &config_error)) {
        std::cerr << "[leagueschedcli] " << config_error << '\n';
        return kExitUsage;
    }

    leaguesched::core::persist::InMemoryLeagueStore store;
    std::string load_error;
    if (!leaguesched::core::persist::LoadSnapshot(config.output.data_json, store, &load_error)) {
        std::cerr << "[leagueschedcli] " << load_error << '\n';
        return kExitUsage;
    }

    LeagueEngine engine(store, config, [](const std::string& line) { std::cout << line << '\n'; });

    int exit_code = kExitUsage;
    if (command == "generate") {
        exit_code = RunGenerate(engine, args);
    } else if (command == "schedule") {
        exit_code = RunSchedule(engine, args);
    } else if (command == "unschedule" || command == "delete") {
        exit_code = RunSingle(engine, command, args);
    } else if (command == "bulk") {
        exit_code = RunBulk(engine, args);
    } else {
        std::cerr << "[leagueschedcli] Unknown command: " << command << '\n';
        PrintUsage();
        return kExitUsage;
    }

    if (exit_code == kExitUsage) {
        return exit_code;
    }
    if (!SaveData(config, store)) {
        return kExitUsage;
    }
    return exit_code;
}
