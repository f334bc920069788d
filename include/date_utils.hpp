#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace dates {

/**
 * @brief Parse "YYYY-MM-DD" into a UTC timestamp at midnight.
 * @return false if the string is not a well-formed calendar date.
 */
inline bool parse(const std::string& date, std::time_t& out) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < date.size(); ++i) {
        if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(date[i]))) {
            return false;
        }
    }

    int y = 0;
    int m = 0;
    int d = 0;
    if (std::sscanf(date.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }

    struct tm tm {};
    tm.tm_year = y - 1900;
    tm.tm_mon  = m - 1;
    tm.tm_mday = d;
    out        = timegm(&tm);

    // Reject dates that timegm normalized (e.g. 2024-02-30)
    struct tm check {};
    gmtime_r(&out, &check);
    return check.tm_year == tm.tm_year && check.tm_mon == tm.tm_mon && check.tm_mday == tm.tm_mday;
}

[[nodiscard]] inline bool isValid(const std::string& date) {
    std::time_t t = 0;
    return parse(date, t);
}

[[nodiscard]] inline std::string format(std::time_t t) {
    struct tm tm {};
    gmtime_r(&t, &tm);
    char buf[11];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

/**
 * @brief Calendar date following the given one. Empty string on bad input.
 */
[[nodiscard]] inline std::string nextDay(const std::string& date) {
    std::time_t t = 0;
    if (!parse(date, t)) {
        return "";
    }
    return format(t + 86400);
}

/**
 * @brief Date `days` calendar days after (or before, if negative) the given
 *        one. Empty string on bad input.
 */
[[nodiscard]] inline std::string addDays(const std::string& date, int64_t days) {
    std::time_t t = 0;
    if (!parse(date, t)) {
        return "";
    }
    return format(t + static_cast<std::time_t>(days) * 86400);
}

/**
 * @brief Whole days from `from` to `to` (negative if `to` is earlier).
 */
[[nodiscard]] inline int64_t daysBetween(const std::string& from, const std::string& to) {
    std::time_t a = 0;
    std::time_t b = 0;
    if (!parse(from, a) || !parse(to, b)) {
        return 0;
    }
    return static_cast<int64_t>((b - a) / 86400);
}

/**
 * @brief Every calendar date in [start, end], inclusive.
 *        Empty if either bound is malformed or start > end.
 */
[[nodiscard]] inline std::vector<std::string> range(const std::string& start, const std::string& end) {
    std::vector<std::string> result;
    std::time_t              a = 0;
    std::time_t              b = 0;
    if (!parse(start, a) || !parse(end, b) || a > b) {
        return result;
    }
    for (std::time_t t = a; t <= b; t += 86400) {
        result.push_back(format(t));
    }
    return result;
}

}  // namespace dates
