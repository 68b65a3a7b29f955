#pragma once

#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/model/LeagueTypes.h"

#include <utility>
#include <vector>

namespace leaguesched::core::fixtures {

struct Pairing {
    int round_index = 0;
    int first_team_id = 0;
    int second_team_id = 0;
};

class FixtureGenerator {
public:
    // One full circle-method cycle over the given team ids: every unordered
    // pair exactly once, grouped by round.
    static std::vector<Pairing> BuildRoundRobin(const std::vector<int>& team_ids);

    // Appends to `created` only the matches needed to bring every team of the
    // league up to league.num_matches. `existing` may hold matches of any
    // league; those of other leagues only influence id allocation.
    static bool Generate(const model::League& league,
                         const std::vector<model::Team>& teams,
                         const std::vector<model::Match>& existing,
                         std::vector<model::Match>& created,
                         model::Error* error);

    static int BaseMatchId(const model::League& league);
};

}  // namespace leaguesched::core::fixtures
