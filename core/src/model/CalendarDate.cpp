#include "leaguesched/core/model/CalendarDate.h"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace leaguesched::core::model {

namespace {

constexpr std::array<const char*, 7> kWeekdayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool ParseDigits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

}  // namespace

std::string WeekdayName(Weekday day) {
    return kWeekdayNames[static_cast<size_t>(day)];
}

std::optional<Weekday> ParseWeekday(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char ch : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    for (size_t i = 0; i < kWeekdayNames.size(); ++i) {
        std::string candidate = kWeekdayNames[i];
        for (auto& ch : candidate) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (candidate == lowered) {
            return static_cast<Weekday>(i);
        }
    }
    return std::nullopt;
}

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    CalendarDate date;
    if (!ParseDigits(text, 0, 4, date.year) || !ParseDigits(text, 5, 2, date.month) ||
        !ParseDigits(text, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (date.year < 1900 || date.year > 2100 || date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

// Howard Hinnant's days_from_civil / civil_from_days.
long long CalendarDate::DayNumber() const {
    const int y = month <= 2 ? year - 1 : year;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::FromDayNumber(long long day_number) {
    const long long z = day_number + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    CalendarDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

Weekday CalendarDate::weekday() const {
    // 1970-01-01 was a Thursday.
    const long long offset = (DayNumber() + 3) % 7;
    return static_cast<Weekday>(offset < 0 ? offset + 7 : offset);
}

CalendarDate CalendarDate::AddDays(long long days) const {
    return FromDayNumber(DayNumber() + days);
}

std::string CalendarDate::ToString() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return out.str();
}

bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CalendarDate& a, const CalendarDate& b) {
    return !(a == b);
}

bool operator<(const CalendarDate& a, const CalendarDate& b) {
    if (a.year != b.year) {
        return a.year < b.year;
    }
    if (a.month != b.month) {
        return a.month < b.month;
    }
    return a.day < b.day;
}

bool operator<=(const CalendarDate& a, const CalendarDate& b) {
    return !(b < a);
}

std::optional<TimeOfDay> TimeOfDay::Parse(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
        return std::nullopt;
    }
    int hour = 0;
    int minute = 0;
    if (!ParseDigits(text, 0, colon, hour) || !ParseDigits(text, colon + 1, 2, minute)) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59) {
        return std::nullopt;
    }
    return TimeOfDay::At(hour, minute);
}

std::string TimeOfDay::ToString() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << hour() << ':' << std::setw(2) << minute();
    return out.str();
}

}  // namespace leaguesched::core::model
