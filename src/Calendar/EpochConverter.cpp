//  EpochConverter.cpp
//  IranCal
//
#include "EpochConverter.hpp"

#include "CalendarError.hpp"
#include "LeapCycle.hpp"
#include "MonthTable.hpp"
#include "OrdinalMapper.hpp"

#include <climits>
#include <sstream>
#include <stdexcept>

namespace {

inline long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b) != 0 && ((a < 0) != (b < 0))) {
        q -= 1;
    }
    return q;
}

inline long long floorMod(long long a, long long b) {
    return a - floorDiv(a, b) * b;
}

/* consecutive index of a year: 1 -> 0, 2 -> 1, -1 -> -1 */
inline long long yearIndex(int year) {
    return year > 0 ? (long long)year - 1 : (long long)year;
}

inline int yearFromIndex(long long e) {
    return (int)(e >= 0 ? e + 1 : e);
}

} // namespace

EpochConverter::EpochConverter(const CalendarConfig &cfg)
    : cfg_(cfg), epoch_serial_(0) {
    const std::string msg = cfg_.check();
    if (!msg.empty()) {
        throw InvalidDate("bad calendar configuration: " + msg);
    }
    const long long anchor = GregorianDate::daysFromCivil(cfg_.reference_year - cfg_.gregorian_offset,
                                                          (unsigned)cfg_.nowruz_month,
                                                          (unsigned)cfg_.nowruz_day);
    epoch_serial_ = anchor - yearStart(cfg_.reference_year);
}

long long EpochConverter::yearStart(int year) {
    if (year > 0) {
        /* years 1..year-1 */
        const long long n = (long long)year - 1;
        return 365 * n + leapSlotsBefore(n);
    }
    /* minus the lengths of years year..-1, i.e. year-1 in [year-1, -1) */
    const long long n = -(long long)year;
    return -(365 * n + leapSlotsBefore(-1) - leapSlotsBefore((long long)year - 1));
}

long long EpochConverter::minSerialDay() const {
    return epoch_serial_ + yearStart(INT_MIN);
}

long long EpochConverter::maxSerialDay() const {
    return epoch_serial_ + yearStart(INT_MAX) + MonthTable::daysInYear(INT_MAX) - 1;
}

long long EpochConverter::serialDay(const ICDate &date) const {
    return epoch_serial_ + yearStart(date.year()) + toOrdinal(date) - 1;
}

ICDate EpochConverter::fromSerialDay(long long serial) const {
    if (serial < minSerialDay() || serial > maxSerialDay()) {
        std::ostringstream oss;
        oss << "serial day " << serial << " falls outside IC years " << INT_MIN << " to " << INT_MAX;
        throw std::out_of_range(oss.str());
    }
    const long long offset = serial - epoch_serial_;

    /* first guess from the mean year, then step to the year holding offset */
    long long e = floorDiv(offset * LEAP_CYCLE_YEARS, LEAP_CYCLE_DAYS);
    if (e < INT_MIN) {
        e = INT_MIN;
    } else if (e > (long long)INT_MAX - 1) {
        e = (long long)INT_MAX - 1;
    }
    while (e > INT_MIN && yearStart(yearFromIndex(e)) > offset) {
        e--;
    }
    while (e < (long long)INT_MAX - 1 && yearStart(yearFromIndex(e + 1)) <= offset) {
        e++;
    }
    const int year = yearFromIndex(e);
    return fromOrdinal(year, (int)(offset - yearStart(year)) + 1);
}

GregorianDate EpochConverter::toGregorian(const ICDate &date) const {
    return GregorianDate::fromDays(serialDay(date));
}

ICDate EpochConverter::fromGregorian(const GregorianDate &g) const {
    return fromSerialDay(g.days());
}

GregorianDate EpochConverter::nowruz(int year) const {
    return toGregorian(ICDate(year, 1, 1));
}

long long EpochConverter::daysBetween(const ICDate &a, const ICDate &b) const {
    return serialDay(b) - serialDay(a);
}

ICDate EpochConverter::addDays(const ICDate &date, long long n) const {
    const long long span = maxSerialDay() - minSerialDay();
    if (n > span || n < -span) {
        std::ostringstream oss;
        oss << "cannot add " << n << " days to " << date;
        throw std::out_of_range(oss.str());
    }
    return fromSerialDay(serialDay(date) + n);
}

int EpochConverter::weekday(const ICDate &date) const {
    /* serial 0 (1970-01-01) was a Thursday, index 5 in a Saturday-first week */
    return (int)floorMod(serialDay(date) + 5, 7);
}
