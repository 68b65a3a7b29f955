#include "leaguesched/core/persist/LeagueSnapshot.h"

#include "leaguesched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace leaguesched::core::persist {

namespace {

using nlohmann::json;

json WriteDays(const std::vector<model::Weekday>& days) {
    json node = json::array();
    for (auto day : days) {
        node.push_back(model::WeekdayName(day));
    }
    return node;
}

std::vector<model::Weekday> ReadDays(const json& node, const char* key) {
    std::vector<model::Weekday> days;
    if (!node.contains(key)) {
        return days;
    }
    for (const auto& item : node.at(key)) {
        const auto name = item.get<std::string>();
        const auto day = model::ParseWeekday(name);
        if (!day) {
            throw std::runtime_error("invalid weekday '" + name + "'");
        }
        days.push_back(*day);
    }
    return days;
}

json WriteDate(const std::optional<model::CalendarDate>& date) {
    return date ? json(date->ToString()) : json(nullptr);
}

model::CalendarDate ParseDateOrThrow(const std::string& text) {
    const auto date = model::CalendarDate::Parse(text);
    if (!date) {
        throw std::runtime_error("invalid date '" + text + "'");
    }
    return *date;
}

std::optional<model::CalendarDate> ReadDate(const json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return ParseDateOrThrow(node.at(key).get<std::string>());
}

model::TimeOfDay ParseTimeOrThrow(const std::string& text) {
    const auto time = model::TimeOfDay::Parse(text);
    if (!time) {
        throw std::runtime_error("invalid time '" + text + "'");
    }
    return *time;
}

json WriteLeague(const model::League& league) {
    json node = {
        {"id", league.id},
        {"name", league.name},
        {"year", league.year},
        {"section", league.section},
        {"region", league.region},
        {"age_group", league.age_group},
        {"division", league.division},
        {"num_matches", league.num_matches},
        {"num_lines_per_match", league.num_lines_per_match},
        {"allow_split_lines", league.allow_split_lines},
        {"preferred_facility_ids", league.preferred_facility_ids},
    };
    node["preferred_days"] = WriteDays(league.preferred_days);
    node["backup_days"] = WriteDays(league.backup_days);
    node["start_date"] = WriteDate(league.start_date);
    node["end_date"] = WriteDate(league.end_date);
    return node;
}

model::League ReadLeague(const json& node) {
    model::League league;
    league.id = node.at("id").get<int>();
    league.name = node.value("name", "");
    league.year = node.value("year", 0);
    league.section = node.value("section", "");
    league.region = node.value("region", "");
    league.age_group = node.value("age_group", "");
    league.division = node.value("division", "");
    league.num_matches = node.value("num_matches", league.num_matches);
    league.num_lines_per_match = node.value("num_lines_per_match", league.num_lines_per_match);
    league.allow_split_lines = node.value("allow_split_lines", league.allow_split_lines);
    league.preferred_days = ReadDays(node, "preferred_days");
    league.backup_days = ReadDays(node, "backup_days");
    league.start_date = ReadDate(node, "start_date");
    league.end_date = ReadDate(node, "end_date");
    if (node.contains("preferred_facility_ids")) {
        league.preferred_facility_ids = node.at("preferred_facility_ids").get<std::vector<int>>();
    }
    return league;
}

json WriteTeam(const model::Team& team) {
    json node = {
        {"id", team.id},
        {"name", team.name},
        {"league_id", team.league_id},
        {"captain", team.captain},
        {"home_facility_id", team.home_facility_id},
    };
    node["preferred_days"] = WriteDays(team.preferred_days);
    return node;
}

model::Team ReadTeam(const json& node) {
    model::Team team;
    team.id = node.at("id").get<int>();
    team.name = node.value("name", "");
    team.league_id = node.at("league_id").get<int>();
    team.captain = node.value("captain", "");
    team.home_facility_id = node.value("home_facility_id", 0);
    team.preferred_days = ReadDays(node, "preferred_days");
    return team;
}

json WriteFacility(const model::Facility& facility) {
    json node = {
        {"id", facility.id},
        {"name", facility.name},
        {"short_name", facility.short_name},
        {"location", facility.location},
        {"total_courts", facility.total_courts},
    };
    json schedule = json::object();
    for (const auto& [day, slots] : facility.schedule) {
        json day_slots = json::array();
        for (const auto& slot : slots) {
            day_slots.push_back({{"time", slot.start_time.ToString()}, {"available_courts", slot.available_courts}});
        }
        schedule[model::WeekdayName(day)] = std::move(day_slots);
    }
    node["schedule"] = std::move(schedule);
    node["unavailable_dates"] = json::array();
    for (const auto& date : facility.unavailable_dates) {
        node["unavailable_dates"].push_back(date.ToString());
    }
    return node;
}

model::Facility ReadFacility(const json& node) {
    model::Facility facility;
    facility.id = node.at("id").get<int>();
    facility.name = node.value("name", "");
    facility.short_name = node.value("short_name", "");
    facility.location = node.value("location", "");
    facility.total_courts = node.value("total_courts", 0);
    if (node.contains("schedule")) {
        for (const auto& item : node.at("schedule").items()) {
            const auto day = model::ParseWeekday(item.key());
            if (!day) {
                throw std::runtime_error("invalid weekday '" + item.key() + "'");
            }
            auto& slots = facility.schedule[*day];
            for (const auto& slot_node : item.value()) {
                model::TimeSlot slot;
                slot.start_time = ParseTimeOrThrow(slot_node.at("time").get<std::string>());
                slot.available_courts = slot_node.value("available_courts", 0);
                if (slot.available_courts < 0) {
                    throw std::runtime_error("negative court count in facility " + std::to_string(facility.id));
                }
                slots.push_back(slot);
            }
        }
    }
    if (node.contains("unavailable_dates")) {
        for (const auto& item : node.at("unavailable_dates")) {
            facility.unavailable_dates.insert(ParseDateOrThrow(item.get<std::string>()));
        }
    }
    return facility;
}

json WriteMatch(const model::Match& match) {
    json node = {
        {"id", match.id},
        {"league_id", match.league_id},
        {"home_team_id", match.home_team_id},
        {"visitor_team_id", match.visitor_team_id},
        {"num_lines", match.num_lines},
    };
    node["facility_id"] = match.facility_id ? json(*match.facility_id) : json(nullptr);
    node["date"] = WriteDate(match.date);
    node["scheduled_times"] = json::array();
    for (const auto& time : match.scheduled_times) {
        node["scheduled_times"].push_back(time.ToString());
    }
    return node;
}

model::Match ReadMatch(const json& node) {
    model::Match match;
    match.id = node.at("id").get<int>();
    match.league_id = node.at("league_id").get<int>();
    match.home_team_id = node.at("home_team_id").get<int>();
    match.visitor_team_id = node.at("visitor_team_id").get<int>();
    match.num_lines = node.value("num_lines", 0);
    if (node.contains("facility_id") && !node.at("facility_id").is_null()) {
        match.facility_id = node.at("facility_id").get<int>();
    }
    match.date = ReadDate(node, "date");
    if (node.contains("scheduled_times")) {
        for (const auto& item : node.at("scheduled_times")) {
            match.scheduled_times.push_back(ParseTimeOrThrow(item.get<std::string>()));
        }
    }
    return match;
}

template <typename T, typename ReadFn>
std::vector<T> ReadArray(const json& root, const char* key, ReadFn read) {
    std::vector<T> items;
    if (!root.contains(key)) {
        return items;
    }
    for (const auto& node : root.at(key)) {
        items.push_back(read(node));
    }
    return items;
}

}  // namespace

bool LoadSnapshotFromString(const std::string& text, InMemoryLeagueStore& store, std::string* error) {
    std::vector<model::League> leagues;
    std::vector<model::Team> teams;
    std::vector<model::Facility> facilities;
    std::vector<model::Match> matches;
    try {
        const json root = json::parse(text);
        const int version = root.value("version", kSnapshotVersion);
        if (version != kSnapshotVersion) {
            if (error) {
                *error = "Unsupported snapshot version " + std::to_string(version);
            }
            return false;
        }
        leagues = ReadArray<model::League>(root, "leagues", ReadLeague);
        teams = ReadArray<model::Team>(root, "teams", ReadTeam);
        facilities = ReadArray<model::Facility>(root, "facilities", ReadFacility);
        matches = ReadArray<model::Match>(root, "matches", ReadMatch);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse snapshot: ") + ex.what();
        }
        return false;
    }

    store.Clear();
    for (const auto& league : leagues) {
        store.PutLeague(league);
    }
    for (const auto& team : teams) {
        store.PutTeam(team);
    }
    for (const auto& facility : facilities) {
        store.PutFacility(facility);
    }
    for (const auto& match : matches) {
        store.PutMatch(match);
    }
    return true;
}

bool LoadSnapshot(const std::string& path, InMemoryLeagueStore& store, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open snapshot: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadSnapshotFromString(buffer.str(), store, error);
}

std::string SnapshotToJsonString(const InMemoryLeagueStore& store) {
    json root;
    root["version"] = kSnapshotVersion;
    root["leagues"] = json::array();
    for (const auto& league : store.ListLeagues()) {
        root["leagues"].push_back(WriteLeague(league));
    }
    root["teams"] = json::array();
    for (const auto& team : store.ListAllTeams()) {
        root["teams"].push_back(WriteTeam(team));
    }
    root["facilities"] = json::array();
    for (const auto& facility : store.ListFacilities()) {
        root["facilities"].push_back(WriteFacility(facility));
    }
    root["matches"] = json::array();
    for (const auto& match : store.ListMatches()) {
        root["matches"].push_back(WriteMatch(match));
    }
    return root.dump(2);
}

bool SaveSnapshot(const std::string& path, const InMemoryLeagueStore& store, std::string* error) {
    return util::AtomicFileWriter::Write(path, SnapshotToJsonString(store), error);
}

}  // namespace leaguesched::core::persist
