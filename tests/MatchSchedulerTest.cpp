#include "TestFixtures.h"

#include "leaguesched/core/scheduling/MatchScheduler.h"

#include <catch2/catch_test_macros.hpp>

namespace leaguesched::test {
namespace {

using core::model::Error;
using core::model::ErrorKind;
using core::scheduling::ConflictSettings;
using core::scheduling::MatchScheduler;
using core::scheduling::ScheduleOptions;
using core::scheduling::TimeOption;

class MatchSchedulerFixture {
protected:
    MatchSchedulerFixture() {
        SeedMondayLeague(store_);
        store_.PutMatch(MakeMatch(1, 1, 1, 2));
        store_.PutMatch(MakeMatch(2, 1, 3, 4));
        store_.PutMatch(MakeMatch(3, 1, 1, 3));
    }

    core::persist::InMemoryLeagueStore store_;
    std::vector<std::string> log_;
    MatchScheduler scheduler_{store_, ConflictSettings{}, [this](const std::string& line) { log_.push_back(line); }};
};

TEST_CASE_METHOD(MatchSchedulerFixture, "Auto places all lines in the only slot that fits", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    Error error;
    REQUIRE(scheduler_.Schedule(match, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(match.facility_id == 10);
    CHECK(match.date == Date("2025-01-06"));
    CHECK(match.scheduled_times == std::vector<TimeOfDay>(3, Time("10:30")));
    CHECK(*store_.FindMatch(1) == match);
    CHECK(match.status(3) == "fully_scheduled");
    REQUIRE_FALSE(log_.empty());
    CHECK(log_.back().rfind("[leaguesched] Scheduled match 1", 0) == 0u);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Auto fails without a large enough single slot", "[match_scheduler]") {
    store_.PutFacility(MakeFacility(20, Weekday::Monday, {{"09:00", 2}}));
    auto match = *store_.FindMatch(1);
    const auto before = match;
    Error error;
    CHECK_FALSE(scheduler_.Schedule(match, 20, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::NoSingleSlot);
    CHECK(match == before);
    CHECK(*store_.FindMatch(1) == before);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Second match sees courts taken by the first", "[match_scheduler]") {
    auto first = *store_.FindMatch(1);
    auto second = *store_.FindMatch(2);
    Error error;
    REQUIRE(scheduler_.Schedule(first, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK_FALSE(scheduler_.Schedule(second, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::Conflict);
    CHECK(error.message.find("10:30") != std::string::npos);
    CHECK(store_.FindMatch(2)->IsUnscheduled());
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Booked start time conflicts only when the empty slot would fit",
                 "[match_scheduler]") {
    auto first = *store_.FindMatch(1);
    auto second = *store_.FindMatch(2);
    ScheduleOptions options;
    options.time_option = TimeOption::Same;
    options.times = {Time("09:00")};
    options.num_lines = 2;
    Error error;
    REQUIRE(scheduler_.Schedule(first, 10, Date("2025-01-06"), options, &error));

    options.num_lines = 1;
    CHECK_FALSE(scheduler_.Schedule(second, 10, Date("2025-01-06"), options, &error));
    CHECK(error.kind == ErrorKind::Conflict);

    options.num_lines = 3;
    CHECK_FALSE(scheduler_.Schedule(second, 10, Date("2025-01-06"), options, &error));
    CHECK(error.kind == ErrorKind::Capacity);

    options.time_option = TimeOption::Custom;
    options.times = {Time("09:00"), Time("10:30")};
    options.num_lines = 2;
    CHECK_FALSE(scheduler_.Schedule(second, 10, Date("2025-01-06"), options, &error));
    CHECK(error.kind == ErrorKind::Conflict);
    CHECK(store_.FindMatch(2)->IsUnscheduled());
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Team cannot play twice on one date", "[match_scheduler]") {
    auto first = *store_.FindMatch(1);
    auto clash = *store_.FindMatch(3);
    Error error;
    REQUIRE(scheduler_.Schedule(first, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    ScheduleOptions options;
    options.time_option = TimeOption::Same;
    options.times = {Time("09:00")};
    options.num_lines = 1;
    CHECK_FALSE(scheduler_.Schedule(clash, 10, Date("2025-01-06"), options, &error));
    CHECK(error.kind == ErrorKind::Conflict);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Custom times with line override", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    ScheduleOptions options;
    options.time_option = TimeOption::Custom;
    options.times = {Time("10:30"), Time("09:00")};
    options.num_lines = 2;
    Error error;
    REQUIRE(scheduler_.Schedule(match, 10, Date("2025-01-06"), options, &error));
    CHECK(match.scheduled_times == (std::vector<TimeOfDay>{Time("09:00"), Time("10:30")}));
    CHECK(match.num_lines == 2);
    CHECK(match.status(core::model::ExpectedLines(match, *store_.FindLeague(1))) == "fully_scheduled");
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Partial placement keeps times empty", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    ScheduleOptions options;
    options.partial_schedule = true;
    Error error;
    REQUIRE(scheduler_.Schedule(match, 10, Date("2025-01-06"), options, &error));
    CHECK(match.scheduled_times.empty());
    CHECK(match.status(3) == "partially_scheduled");

    CHECK_FALSE(scheduler_.Delete(match, &error));
    CHECK(error.kind == ErrorKind::DeleteUnsafe);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Rejects missing or unknown placement", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    Error error;
    CHECK_FALSE(scheduler_.Schedule(match, std::nullopt, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::InvalidRequest);

    CHECK_FALSE(scheduler_.Schedule(match, 99, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::NotFound);

    auto ghost = MakeMatch(77, 1, 1, 2);
    CHECK_FALSE(scheduler_.Schedule(ghost, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::NotFound);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Blackout date fails with capacity", "[match_scheduler]") {
    auto facility = *store_.FindFacility(10);
    facility.unavailable_dates.insert(Date("2025-01-13"));
    store_.PutFacility(facility);
    auto match = *store_.FindMatch(1);
    Error error;
    CHECK_FALSE(scheduler_.Schedule(match, 10, Date("2025-01-13"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::Capacity);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Schedule then unschedule restores prior state", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    const auto before = match;
    Error error;
    REQUIRE(scheduler_.Schedule(match, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    REQUIRE(scheduler_.Unschedule(match, &error));
    CHECK(match == before);
    CHECK(*store_.FindMatch(1) == before);
}

TEST_CASE_METHOD(MatchSchedulerFixture, "Delete refuses scheduled matches", "[match_scheduler]") {
    auto match = *store_.FindMatch(1);
    Error error;
    ScheduleOptions options;
    options.time_option = TimeOption::Same;
    options.times = {Time("09:00")};
    options.num_lines = 1;
    REQUIRE(scheduler_.Schedule(match, 10, Date("2025-01-06"), options, &error));
    const auto scheduled = *store_.FindMatch(1);

    CHECK_FALSE(scheduler_.Delete(match, &error));
    CHECK(error.kind == ErrorKind::DeleteUnsafe);
    CHECK(*store_.FindMatch(1) == scheduled);

    CHECK(scheduler_.Delete(*store_.FindMatch(2), &error));
    CHECK_FALSE(store_.FindMatch(2).has_value());
}

TEST_CASE("Store failure leaves match unchanged", "[match_scheduler_store]") {
    core::persist::InMemoryLeagueStore inner;
    SeedMondayLeague(inner);
    inner.PutMatch(MakeMatch(1, 1, 1, 2));
    FaultyStore store(inner);
    store.failing_updates.insert(1);
    MatchScheduler scheduler(store, ConflictSettings{});

    auto match = *store.FindMatch(1);
    const auto before = match;
    Error error;
    CHECK_FALSE(scheduler.Schedule(match, 10, Date("2025-01-06"), ScheduleOptions{}, &error));
    CHECK(error.kind == ErrorKind::Persistence);
    CHECK(match == before);
}

}  // namespace
}  // namespace leaguesched::test
