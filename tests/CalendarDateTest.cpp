#include "TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

namespace leaguesched::test {
namespace {

TEST_CASE("Parses and formats iso dates", "[calendar_date]") {
    const auto date = CalendarDate::Parse("2025-03-09");
    REQUIRE(date.has_value());
    CHECK(date->year == 2025);
    CHECK(date->month == 3);
    CHECK(date->day == 9);
    CHECK(date->ToString() == "2025-03-09");
}

TEST_CASE("Rejects malformed and impossible dates", "[calendar_date]") {
    CHECK_FALSE(CalendarDate::Parse("2025-3-09").has_value());
    CHECK_FALSE(CalendarDate::Parse("2025-13-01").has_value());
    CHECK_FALSE(CalendarDate::Parse("2025-02-29").has_value());
    CHECK_FALSE(CalendarDate::Parse("2025/01/01").has_value());
    CHECK(CalendarDate::Parse("2024-02-29").has_value());
}

TEST_CASE("Computes weekdays", "[calendar_date]") {
    CHECK(Date("1970-01-01").weekday() == Weekday::Thursday);
    CHECK(Date("2025-01-06").weekday() == Weekday::Monday);
    CHECK(Date("2025-01-12").weekday() == Weekday::Sunday);
}

TEST_CASE("Adds days across month and year", "[calendar_date]") {
    CHECK(Date("2024-12-30").AddDays(3) == Date("2025-01-02"));
    CHECK(Date("2024-02-28").AddDays(1) == Date("2024-02-29"));
    CHECK(Date("2025-03-01").AddDays(-1) == Date("2025-02-28"));
    CHECK(Date("2025-01-06") < Date("2025-01-07"));
}

TEST_CASE("Parses clock times", "[time_of_day]") {
    CHECK(Time("9:30").ToString() == "09:30");
    CHECK(Time("18:05").minutes == 18 * 60 + 5);
    CHECK_FALSE(TimeOfDay::Parse("24:00").has_value());
    CHECK_FALSE(TimeOfDay::Parse("10:60").has_value());
    CHECK_FALSE(TimeOfDay::Parse("1030").has_value());
    CHECK(Time("09:00") < Time("10:30"));
}

TEST_CASE("Parses names case insensitively", "[weekday]") {
    CHECK(core::model::ParseWeekday("monday") == Weekday::Monday);
    CHECK(core::model::ParseWeekday("SATURDAY") == Weekday::Saturday);
    CHECK_FALSE(core::model::ParseWeekday("Mon").has_value());
    CHECK(core::model::WeekdayName(Weekday::Wednesday) == "Wednesday");
}

}  // namespace
}  // namespace leaguesched::test
