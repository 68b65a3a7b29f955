#pragma once

#include <optional>
#include <string>

namespace leaguesched::core::model {

enum class Weekday {
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday
};

std::string WeekdayName(Weekday day);
std::optional<Weekday> ParseWeekday(const std::string& name);

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    static std::optional<CalendarDate> Parse(const std::string& text);
    static CalendarDate FromDayNumber(long long day_number);

    // Days since 1970-01-01.
    long long DayNumber() const;
    Weekday weekday() const;
    CalendarDate AddDays(long long days) const;
    std::string ToString() const;
};

bool operator==(const CalendarDate& a, const CalendarDate& b);
bool operator!=(const CalendarDate& a, const CalendarDate& b);
bool operator<(const CalendarDate& a, const CalendarDate& b);
bool operator<=(const CalendarDate& a, const CalendarDate& b);

struct TimeOfDay {
    int minutes = 0;

    static std::optional<TimeOfDay> Parse(const std::string& text);
    static TimeOfDay At(int hour, int minute) { return TimeOfDay{hour * 60 + minute}; }

    int hour() const { return minutes / 60; }
    int minute() const { return minutes % 60; }
    std::string ToString() const;
};

inline bool operator==(const TimeOfDay& a, const TimeOfDay& b) { return a.minutes == b.minutes; }
inline bool operator!=(const TimeOfDay& a, const TimeOfDay& b) { return a.minutes != b.minutes; }
inline bool operator<(const TimeOfDay& a, const TimeOfDay& b) { return a.minutes < b.minutes; }

}  // namespace leaguesched::core::model
