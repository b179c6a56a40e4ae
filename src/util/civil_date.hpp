#ifndef PHIGUARD_UTIL_CIVIL_DATE_HPP
#define PHIGUARD_UTIL_CIVIL_DATE_HPP

#include <cstdint>

/**
 * @file civil_date.hpp
 * @brief Proleptic Gregorian calendar arithmetic on plain integers.
 *
 * daysFromCivil / civilFromDays convert between (year, month, day) and a day count
 * relative to 1970-01-01, which makes "add N days" a simple integer addition that
 * handles month ends and leap years.
 */

namespace phiguard {
namespace util {

struct CivilDate
{
    int64_t year = 1970;
    unsigned month = 1;   // 1..12
    unsigned day = 1;     // 1..31
};

inline bool isLeapYear(int64_t y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline unsigned daysInMonth(int64_t y, unsigned m)
{
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) {
        return 0;
    }
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

inline bool isValidDate(int64_t y, unsigned m, unsigned d)
{
    return m >= 1 && m <= 12 && d >= 1 && d <= daysInMonth(y, m);
}

/**
 * @brief Days since 1970-01-01 for the given civil date.
 */
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;                                   // [0, 399]
    const int64_t mp = (static_cast<int64_t>(m) + 9) % 12;               // March = 0
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(d) - 1; // [0, 365]
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
    return era * 146097 + doe - 719468;
}

/**
 * @brief Inverse of daysFromCivil.
 */
inline CivilDate civilFromDays(int64_t z)
{
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;

    CivilDate out;
    out.year = yoe + era * 400 + (m <= 2 ? 1 : 0);
    out.month = static_cast<unsigned>(m);
    out.day = static_cast<unsigned>(d);
    return out;
}

inline CivilDate addDays(const CivilDate &date, int64_t days)
{
    return civilFromDays(daysFromCivil(date.year, date.month, date.day) + days);
}

} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_CIVIL_DATE_HPP
