#pragma once

#include "leaguesched/core/model/LeagueTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::persist {

// Storage collaborator. Reads are expected to reflect every committed write
// immediately; match lists come back ordered by id.
class ILeagueStore {
public:
    virtual ~ILeagueStore() = default;

    virtual std::optional<model::League> FindLeague(int league_id) const = 0;
    virtual std::vector<model::League> ListLeagues() const = 0;
    virtual std::optional<model::Team> FindTeam(int team_id) const = 0;
    virtual std::vector<model::Team> ListTeams(int league_id) const = 0;
    virtual std::optional<model::Facility> FindFacility(int facility_id) const = 0;
    virtual std::vector<model::Facility> ListFacilities() const = 0;

    virtual std::optional<model::Match> FindMatch(int match_id) const = 0;
    virtual std::vector<model::Match> ListMatches() const = 0;
    virtual std::vector<model::Match> ListMatchesForLeague(int league_id) const = 0;
    virtual std::vector<model::Match> ListMatchesOn(const model::CalendarDate& date) const = 0;

    virtual bool CreateMatch(const model::Match& match, std::string* error) = 0;
    virtual bool UpdateMatch(const model::Match& match, std::string* error) = 0;
    virtual bool DeleteMatch(int match_id, std::string* error) = 0;
};

}  // namespace leaguesched::core::persist
