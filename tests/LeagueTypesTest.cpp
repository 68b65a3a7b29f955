#include "TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

namespace leaguesched::test {
namespace {

TEST_CASE("Derives status from placement", "[league_types]") {
    auto match = MakeMatch(1, 1, 1, 2);
    CHECK(match.IsUnscheduled());
    CHECK(match.status(3) == "unscheduled");

    match.facility_id = 10;
    match.date = Date("2025-01-06");
    CHECK_FALSE(match.IsUnscheduled());
    CHECK_FALSE(match.IsScheduled());
    CHECK(match.status(3) == "partially_scheduled");

    match.scheduled_times = {Time("09:00"), Time("09:00")};
    CHECK(match.status(3) == "partially_scheduled");

    match.scheduled_times.push_back(Time("10:30"));
    CHECK(match.IsFullyScheduled(3));
    CHECK(match.status(3) == "fully_scheduled");

    match.scheduled_times.push_back(Time("10:30"));
    CHECK(match.status(3) == "over_scheduled");
}

TEST_CASE("Expected lines honours override", "[league_types]") {
    const auto league = MakeLeague(1, 10, 3);
    auto match = MakeMatch(1, 1, 1, 2);
    CHECK(core::model::ExpectedLines(match, league) == 3);
    match.num_lines = 5;
    CHECK(core::model::ExpectedLines(match, league) == 5);
}

}  // namespace
}  // namespace leaguesched::test
