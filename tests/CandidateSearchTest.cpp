#include "TestFixtures.h"

#include "leaguesched/core/scheduling/CandidateSearch.h"

#include <catch2/catch_test_macros.hpp>

namespace leaguesched::test {
namespace {

using core::scheduling::CandidateSearch;
using core::scheduling::LeagueSeasonWindow;
using core::scheduling::SeasonWindow;

TEST_CASE("Open end runs default weeks", "[league_season_window]") {
    auto league = MakeLeague(1);
    league.end_date.reset();
    const auto window = LeagueSeasonWindow(16).WindowFor(league);
    REQUIRE(window.has_value());
    CHECK(window->start == Date("2025-01-06"));
    CHECK(window->end == Date("2025-04-28"));
}

TEST_CASE("No start means no window", "[league_season_window]") {
    auto league = MakeLeague(1);
    league.start_date.reset();
    CHECK_FALSE(LeagueSeasonWindow().WindowFor(league).has_value());
}

TEST_CASE("Team preferences outrank league days", "[candidate_search]") {
    auto league = MakeLeague(1);
    league.preferred_days = {Weekday::Monday};
    league.backup_days = {Weekday::Wednesday};
    auto home = MakeTeam(1, 1);
    auto visitor = MakeTeam(2, 1);
    home.preferred_days = {Weekday::Wednesday};
    visitor.preferred_days = {Weekday::Wednesday, Weekday::Friday};

    CHECK(CandidateSearch::DatePriority(Weekday::Wednesday, league, home, visitor) == 1);
    CHECK(CandidateSearch::DatePriority(Weekday::Monday, league, home, visitor) == 3);
    CHECK(CandidateSearch::DatePriority(Weekday::Friday, league, home, visitor) == 0);

    home.preferred_days = {Weekday::Monday};
    CHECK(CandidateSearch::DatePriority(Weekday::Monday, league, home, visitor) == 2);
    CHECK(CandidateSearch::DatePriority(Weekday::Wednesday, league, home, MakeTeam(3, 1)) == 4);
}

TEST_CASE("Dates ordered by priority then chronologically", "[candidate_search]") {
    auto league = MakeLeague(1);
    league.preferred_days = {Weekday::Monday};
    league.backup_days = {Weekday::Wednesday};
    auto home = MakeTeam(1, 1);
    home.preferred_days = {Weekday::Wednesday};
    auto visitor = MakeTeam(2, 1);
    visitor.preferred_days = {Weekday::Wednesday};

    const SeasonWindow window{Date("2025-01-06"), Date("2025-01-19")};
    const auto dates = CandidateSearch::CandidateDates(window, league, home, visitor, 365);
    REQUIRE(dates.size() == 4u);
    CHECK(dates[0].date == Date("2025-01-08"));
    CHECK(dates[1].date == Date("2025-01-15"));
    CHECK(dates[2].date == Date("2025-01-06"));
    CHECK(dates[3].date == Date("2025-01-13"));
    CHECK(dates[0].priority == 1);
    CHECK(dates[2].priority == 3);

    const auto capped = CandidateSearch::CandidateDates(window, league, home, visitor, 3);
    CHECK(capped.size() == 3u);
}

TEST_CASE("League without days allows every day", "[candidate_search]") {
    auto league = MakeLeague(1);
    league.preferred_days.clear();
    league.backup_days.clear();
    auto home = MakeTeam(1, 1);
    home.preferred_days = {Weekday::Saturday};

    const SeasonWindow window{Date("2025-01-06"), Date("2025-01-12")};
    const auto dates = CandidateSearch::CandidateDates(window, league, home, MakeTeam(2, 1), 365);
    REQUIRE(dates.size() == 7u);
    CHECK(dates[0].date == Date("2025-01-11"));
    CHECK(dates[0].priority == 2);
    CHECK(dates[1].date == Date("2025-01-06"));
    CHECK(dates[1].priority == 5);
}

TEST_CASE("Facilities start with home then league then visitor", "[candidate_search]") {
    auto league = MakeLeague(1);
    league.preferred_facility_ids = {20, 30, 99};
    const auto home = MakeTeam(1, 1, 30);
    const auto visitor = MakeTeam(2, 1, 10);
    std::vector<Facility> facilities;
    for (int id : {40, 5, 10, 20, 30}) {
        facilities.push_back(MakeFacility(id, Weekday::Monday, {{"09:00", 2}}));
    }
    const auto order = CandidateSearch::CandidateFacilities(league, home, visitor, facilities);
    CHECK(order == (std::vector<int>{30, 20, 10, 5, 40}));
}

}  // namespace
}  // namespace leaguesched::test
