#include "TestFixtures.h"

#include "leaguesched/core/bulk/BulkOperationRunner.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

namespace leaguesched::test {
namespace {

using core::bulk::BulkOperation;
using core::bulk::BulkOperationRunner;
using core::bulk::BulkOutcome;
using core::bulk::BulkScope;
using core::model::ErrorKind;
using core::scheduling::ConflictSettings;
using core::scheduling::LeagueSeasonWindow;
using core::scheduling::MatchScheduler;

// League 2 has a single Monday in its season and one facility whose only
// slot holds three 3-line matches.
void SeedOneMonday(core::persist::InMemoryLeagueStore& store) {
    auto league = MakeLeague(2, 1, 3, false);
    league.start_date = Date("2025-01-06");
    league.end_date = Date("2025-01-06");
    store.PutLeague(league);
    store.PutFacility(MakeFacility(30, Weekday::Monday, {{"10:30", 9}}));
    for (int id = 11; id <= 20; ++id) {
        store.PutTeam(MakeTeam(id, 2, 30));
    }
    for (int i = 0; i < 5; ++i) {
        store.PutMatch(MakeMatch(101 + i, 2, 11 + 2 * i, 12 + 2 * i));
    }
}

class BulkOperationRunnerFixture {
protected:
    BulkOperationRunnerFixture() { SeedOneMonday(store_); }

    core::persist::InMemoryLeagueStore store_;
    MatchScheduler scheduler_{store_, ConflictSettings{}};
    LeagueSeasonWindow windows_{16};
    std::vector<std::string> log_;
    BulkOperationRunner runner_{store_, scheduler_, windows_, 365,
                                [this](const std::string& line) { log_.push_back(line); }};
};

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Auto schedule records partial failure", "[bulk_operation_runner]") {
    const auto result = runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2));
    CHECK(result.succeeded_count() == 3);
    CHECK(result.failed_count() == 2);
    CHECK(result.skipped_count() == 0);
    CHECK(result.HasWarnings());

    REQUIRE(result.entries.size() == 5u);
    for (size_t i = 0; i < result.entries.size(); ++i) {
        CHECK(result.entries[i].match_id == 101 + static_cast<int>(i));
    }
    CHECK(result.entries[3].outcome == BulkOutcome::Failed);
    CHECK(result.entries[3].error_kind == ErrorKind::Conflict);
    CHECK(store_.FindMatch(103)->IsScheduled());
    CHECK(store_.FindMatch(105)->IsUnscheduled());
    CHECK(result.Summary() == "auto_schedule over league 2: 3 succeeded, 0 skipped, 2 failed");
    REQUIRE_FALSE(log_.empty());
    CHECK(log_.back() == "[bulk] " + result.Summary());
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Already scheduled matches are skipped", "[bulk_operation_runner]") {
    auto first = runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2));
    REQUIRE(first.succeeded_count() == 3);
    const auto second = runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2));
    CHECK(second.skipped_count() == 3);
    CHECK(second.failed_count() == 2);
    CHECK(second.succeeded_count() == 0);
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Delete skips scheduled matches", "[bulk_operation_runner]") {
    auto scheduled = *store_.FindMatch(101);
    core::model::Error error;
    REQUIRE(scheduler_.Schedule(scheduled, 30, Date("2025-01-06"), {}, &error));
    const auto before = *store_.FindMatch(101);

    const auto result = runner_.Run(BulkOperation::Delete, BulkScope::AllMatches());
    CHECK(result.skipped_count() == 1);
    CHECK(result.succeeded_count() == 4);
    CHECK(result.failed_count() == 0);
    CHECK(result.entries[0].outcome == BulkOutcome::Skipped);
    CHECK(result.entries[0].error_kind == ErrorKind::DeleteUnsafe);
    REQUIRE(store_.FindMatch(101).has_value());
    CHECK(*store_.FindMatch(101) == before);
    CHECK(store_.ListMatches().size() == 1u);
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Unschedule stays inside the league", "[bulk_operation_runner]") {
    REQUIRE(runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2)).succeeded_count() == 3);
    auto other = MakeMatch(900, 3, 1, 2);
    other.facility_id = 30;
    other.date = Date("2025-01-13");
    other.scheduled_times = {Time("10:30")};
    store_.PutMatch(other);

    const auto result = runner_.Run(BulkOperation::Unschedule, BulkScope::ForLeague(2));
    CHECK(result.succeeded_count() == 5);
    for (const auto& match : store_.ListMatchesForLeague(2)) {
        CHECK(match.IsUnscheduled());
    }
    CHECK(*store_.FindMatch(900) == other);
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Filtered scope uses predicate", "[bulk_operation_runner]") {
    const auto scope = BulkScope::Filtered("team 13", [](const Match& match) { return match.Involves(13); });
    CHECK(runner_.ResolveScope(scope) == std::vector<int>{102});
    const auto result = runner_.Run(BulkOperation::AutoSchedule, scope);
    CHECK(result.scope == "team 13");
    REQUIRE(result.entries.size() == 1u);
    CHECK(result.entries[0].outcome == BulkOutcome::Succeeded);
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "League without season fails every match", "[bulk_operation_runner]") {
    auto league = *store_.FindLeague(2);
    league.start_date.reset();
    store_.PutLeague(league);
    const auto result = runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2));
    CHECK(result.failed_count() == 5);
    CHECK(result.entries[0].error_kind == ErrorKind::InvalidRequest);
}

TEST_CASE_METHOD(BulkOperationRunnerFixture, "Report json carries counts and reasons", "[bulk_operation_runner]") {
    const auto result = runner_.Run(BulkOperation::AutoSchedule, BulkScope::ForLeague(2));
    const auto json = nlohmann::json::parse(result.ToJsonString());
    CHECK(json.at("operation").get<std::string>() == "auto_schedule");
    CHECK(json.at("succeeded_count").get<int>() == 3);
    CHECK(json.at("failed_count").get<int>() == 2);
    REQUIRE(json.at("details").size() == 5u);
    CHECK(json.at("details")[4].at("error").get<std::string>() == "conflict");
    CHECK_FALSE(json.at("details")[0].contains("error"));
}

TEST_CASE("Exception on one match does not stop the run", "[bulk_operation_runner_fault]") {
    core::persist::InMemoryLeagueStore inner;
    SeedOneMonday(inner);
    FaultyStore store(inner);
    store.throwing_updates.insert(102);
    MatchScheduler scheduler(store, ConflictSettings{});
    LeagueSeasonWindow windows;
    BulkOperationRunner runner(store, scheduler, windows, 365);

    const auto result = runner.Run(BulkOperation::AutoSchedule, BulkScope::AllMatches());
    REQUIRE(result.entries.size() == 5u);
    CHECK(result.entries[1].outcome == BulkOutcome::Failed);
    CHECK(result.entries[1].error_kind == ErrorKind::Internal);
    CHECK(result.succeeded_count() == 3);
    CHECK(result.failed_count() == 2);
    CHECK(inner.FindMatch(104)->IsScheduled());
}

TEST_CASE("Bulk operation names accept both spellings", "[bulk_operation_name]") {
    BulkOperation operation = BulkOperation::Delete;
    CHECK(core::bulk::ParseBulkOperation("auto-schedule", operation));
    CHECK(operation == BulkOperation::AutoSchedule);
    CHECK(core::bulk::ParseBulkOperation("unschedule", operation));
    CHECK(operation == BulkOperation::Unschedule);
    CHECK_FALSE(core::bulk::ParseBulkOperation("purge", operation));
}

}  // namespace
}  // namespace leaguesched::test
