#pragma once

#include "leaguesched/core/persist/ILeagueStore.h"

#include <map>
#include <mutex>

namespace leaguesched::core::persist {

class InMemoryLeagueStore final : public ILeagueStore {
public:
    InMemoryLeagueStore() = default;

    void PutLeague(const model::League& league);
    void PutTeam(const model::Team& team);
    void PutFacility(const model::Facility& facility);
    void PutMatch(const model::Match& match);
    void Clear();

    std::optional<model::League> FindLeague(int league_id) const override;
    std::vector<model::League> ListLeagues() const override;
    std::optional<model::Team> FindTeam(int team_id) const override;
    std::vector<model::Team> ListTeams(int league_id) const override;
    std::vector<model::Team> ListAllTeams() const;
    std::optional<model::Facility> FindFacility(int facility_id) const override;
    std::vector<model::Facility> ListFacilities() const override;

    std::optional<model::Match> FindMatch(int match_id) const override;
    std::vector<model::Match> ListMatches() const override;
    std::vector<model::Match> ListMatchesForLeague(int league_id) const override;
    std::vector<model::Match> ListMatchesOn(const model::CalendarDate& date) const override;

    bool CreateMatch(const model::Match& match, std::string* error) override;
    bool UpdateMatch(const model::Match& match, std::string* error) override;
    bool DeleteMatch(int match_id, std::string* error) override;

private:
    mutable std::mutex mutex_;
    std::map<int, model::League> leagues_;
    std::map<int, model::Team> teams_;
    std::map<int, model::Facility> facilities_;
    std::map<int, model::Match> matches_;
};

}  // namespace leaguesched::core::persist
