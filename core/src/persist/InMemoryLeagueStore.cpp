#include "leaguesched/core/persist/InMemoryLeagueStore.h"

namespace leaguesched::core::persist {

namespace {

template <typename Map>
auto FindIn(const Map& map, int id) -> std::optional<typename Map::mapped_type> {
    const auto it = map.find(id);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

void InMemoryLeagueStore::PutLeague(const model::League& league) {
    std::lock_guard<std::mutex> lock(mutex_);
    leagues_[league.id] = league;
}

void InMemoryLeagueStore::PutTeam(const model::Team& team) {
    std::lock_guard<std::mutex> lock(mutex_);
    teams_[team.id] = team;
}

void InMemoryLeagueStore::PutFacility(const model::Facility& facility) {
    std::lock_guard<std::mutex> lock(mutex_);
    facilities_[facility.id] = facility;
}

void InMemoryLeagueStore::PutMatch(const model::Match& match) {
    std::lock_guard<std::mutex> lock(mutex_);
    matches_[match.id] = match;
}

void InMemoryLeagueStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    leagues_.clear();
    teams_.clear();
    facilities_.clear();
    matches_.clear();
}

std::optional<model::League> InMemoryLeagueStore::FindLeague(int league_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindIn(leagues_, league_id);
}

std::vector<model::League> InMemoryLeagueStore::ListLeagues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::League> leagues;
    leagues.reserve(leagues_.size());
    for (const auto& entry : leagues_) {
        leagues.push_back(entry.second);
    }
    return leagues;
}

std::optional<model::Team> InMemoryLeagueStore::FindTeam(int team_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindIn(teams_, team_id);
}

std::vector<model::Team> InMemoryLeagueStore::ListTeams(int league_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Team> teams;
    for (const auto& entry : teams_) {
        if (entry.second.league_id == league_id) {
            teams.push_back(entry.second);
        }
    }
    return teams;
}

std::vector<model::Team> InMemoryLeagueStore::ListAllTeams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Team> teams;
    teams.reserve(teams_.size());
    for (const auto& entry : teams_) {
        teams.push_back(entry.second);
    }
    return teams;
}

std::optional<model::Facility> InMemoryLeagueStore::FindFacility(int facility_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindIn(facilities_, facility_id);
}

std::vector<model::Facility> InMemoryLeagueStore::ListFacilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Facility> facilities;
    facilities.reserve(facilities_.size());
    for (const auto& entry : facilities_) {
        facilities.push_back(entry.second);
    }
    return facilities;
}

std::optional<model::Match> InMemoryLeagueStore::FindMatch(int match_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindIn(matches_, match_id);
}

std::vector<model::Match> InMemoryLeagueStore::ListMatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Match> matches;
    matches.reserve(matches_.size());
    for (const auto& entry : matches_) {
        matches.push_back(entry.second);
    }
    return matches;
}

std::vector<model::Match> InMemoryLeagueStore::ListMatchesForLeague(int league_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Match> matches;
    for (const auto& entry : matches_) {
        if (entry.second.league_id == league_id) {
            matches.push_back(entry.second);
        }
    }
    return matches;
}

std::vector<model::Match> InMemoryLeagueStore::ListMatchesOn(const model::CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Match> matches;
    for (const auto& entry : matches_) {
        if (entry.second.date.has_value() && *entry.second.date == date) {
            matches.push_back(entry.second);
        }
    }
    return matches;
}

bool InMemoryLeagueStore::CreateMatch(const model::Match& match, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (matches_.count(match.id) != 0) {
        if (error) {
            *error = "Match " + std::to_string(match.id) + " already exists";
        }
        return false;
    }
    matches_[match.id] = match;
    return true;
}

bool InMemoryLeagueStore::UpdateMatch(const model::Match& match, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match.id);
    if (it == matches_.end()) {
        if (error) {
            *error = "Match " + std::to_string(match.id) + " not found";
        }
        return false;
    }
    it->second = match;
    return true;
}

bool InMemoryLeagueStore::DeleteMatch(int match_id, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (matches_.erase(match_id) == 0) {
        if (error) {
            *error = "Match " + std::to_string(match_id) + " not found";
        }
        return false;
    }
    return true;
}

}  // namespace leaguesched::core::persist
