#include "httpdate.hpp"

#include <array>
#include <cstdio>
#include <ctime>

#include "log.hpp"
#include "string.hpp"

namespace {
// I do this myself, because I don't want to worry about locales
constexpr std::array weekDays = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
constexpr std::array longWeekDays
    = { "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday" };
constexpr std::array months
    = { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

std::optional<int> parseMonth(std::string_view str)
{
    for (size_t i = 0; i < months.size(); ++i) {
        if (str == months[i]) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

bool isWeekDay(std::string_view str, bool longForm)
{
    for (size_t i = 0; i < weekDays.size(); ++i) {
        if (str == (longForm ? longWeekDays[i] : weekDays[i])) {
            return true;
        }
    }
    return false;
}

// HH:MM:SS
bool parseTimeOfDay(std::string_view str, std::tm& tm)
{
    const auto parts = split(str, ':');
    if (parts.size() != 3) {
        return false;
    }
    const auto hour = parts[0].size() == 2 ? parseInt<int>(parts[0]) : std::nullopt;
    const auto min = parts[1].size() == 2 ? parseInt<int>(parts[1]) : std::nullopt;
    const auto sec = parts[2].size() == 2 ? parseInt<int>(parts[2]) : std::nullopt;
    // Leap seconds (60) are allowed by the grammar
    if (!hour || !min || !sec || *hour > 23 || *min > 59 || *sec > 60) {
        return false;
    }
    tm.tm_hour = *hour;
    tm.tm_min = *min;
    tm.tm_sec = *sec;
    return true;
}

bool setDate(std::tm& tm, std::optional<int> day, std::optional<int> month, std::optional<int> year)
{
    if (!day || !month || !year || *day < 1 || *day > 31) {
        return false;
    }
    tm.tm_mday = *day;
    tm.tm_mon = *month;
    tm.tm_year = *year - 1900;
    return true;
}

// Sun, 06 Nov 1994 08:49:37 GMT
bool parseImfFixdate(const std::vector<std::string_view>& parts, std::tm& tm)
{
    if (parts.size() != 6 || parts[0].size() != 4 || parts[0].back() != ','
        || !isWeekDay(parts[0].substr(0, 3), false) || parts[1].size() != 2
        || parts[3].size() != 4 || parts[5] != "GMT") {
        return false;
    }
    return setDate(tm, parseInt<int>(parts[1]), parseMonth(parts[2]), parseInt<int>(parts[3]))
        && parseTimeOfDay(parts[4], tm);
}

// Sunday, 06-Nov-94 08:49:37 GMT
bool parseRfc850(const std::vector<std::string_view>& parts, std::tm& tm)
{
    if (parts.size() != 4 || parts[0].empty() || parts[0].back() != ','
        || !isWeekDay(parts[0].substr(0, parts[0].size() - 1), true) || parts[3] != "GMT") {
        return false;
    }
    const auto date = split(parts[1], '-');
    if (date.size() != 3 || date[0].size() != 2 || date[2].size() != 2) {
        return false;
    }
    auto year = parseInt<int>(date[2]);
    if (year) {
        // RFC7231, 7.1.1.1: interpret as the most recent year that ended with these digits, which
        // is good enough with a fixed cutoff.
        *year += *year < 70 ? 2000 : 1900;
    }
    return setDate(tm, parseInt<int>(date[0]), parseMonth(date[1]), year)
        && parseTimeOfDay(parts[2], tm);
}

// Sun Nov  6 08:49:37 1994
bool parseAsctime(const std::vector<std::string_view>& parts, std::tm& tm)
{
    if (parts.size() != 5 || !isWeekDay(parts[0], false) || parts[2].empty()
        || parts[2].size() > 2 || parts[4].size() != 4) {
        return false;
    }
    return setDate(tm, parseInt<int>(parts[2]), parseMonth(parts[1]), parseInt<int>(parts[4]))
        && parseTimeOfDay(parts[3], tm);
}
}

std::optional<std::string> formatHttpDate(int64_t unixSeconds)
{
    const auto t = static_cast<std::time_t>(unixSeconds);
    std::tm tm;
    if (!::gmtime_r(&t, &tm)) {
        slog::error("Could not convert time ", unixSeconds);
        return std::nullopt;
    }
    if (tm.tm_wday < 0 || tm.tm_wday > 6) {
        slog::error("Weekday is out of range: ", tm.tm_wday);
        return std::nullopt;
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11) {
        slog::error("Month is out of range: ", tm.tm_mon);
        return std::nullopt;
    }
    char buf[32];
    const auto res = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
        weekDays[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour,
        tm.tm_min, tm.tm_sec);
    if (res < 0) {
        slog::error("Could not format time");
        return std::nullopt;
    }
    return std::string(buf);
}

std::optional<int64_t> parseHttpDate(std::string_view str)
{
    // asctime pads single digit days with a second space, which split turns into an empty part
    std::vector<std::string_view> parts;
    for (const auto part : split(httpTrim(str), ' ')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }

    std::tm tm {};
    if (!parseImfFixdate(parts, tm) && !parseRfc850(parts, tm) && !parseAsctime(parts, tm)) {
        return std::nullopt;
    }
    const auto t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(t);
}
