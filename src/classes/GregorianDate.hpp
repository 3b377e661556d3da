//  GregorianDate.hpp
//  IranCal
//
//  Proleptic Gregorian date, astronomical year numbering (year 0 = 1 BCE).
//
#ifndef GregorianDate_hpp
#define GregorianDate_hpp

#include <ostream>

#include "ICDate.hpp"

class GregorianDate {
public:
    /* throws InvalidDate */
    GregorianDate(int year, int month, int day);

    static bool isValid(int year, int month, int day);
    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);  /* 0 for a bad month */
    static int dayOfYear(int year, int month, int day);

    /* days since 1970-01-01 */
    static long long daysFromCivil(int y, unsigned m, unsigned d);
    static void civilFromDays(long long z, int &y, unsigned &m, unsigned &d);
    /* throws std::out_of_range when the year does not fit in an int */
    static GregorianDate fromDays(long long z);
    static long long minDays();     /* INT_MIN-01-01 */
    static long long maxDays();     /* INT_MAX-12-31 */

    /* YYYYMMDD; false for a malformed or invalid value */
    static bool parseYYYYMMDD(long yyyymmdd, int &y, int &m, int &d);

    /* current UTC date from the system clock */
    static GregorianDate today();

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    YMD asTuple() const;
    long long days() const;
    int compare(const GregorianDate &rhs) const;

private:
    int year_;
    int month_;
    int day_;
};

bool operator==(const GregorianDate &lhs, const GregorianDate &rhs);
bool operator!=(const GregorianDate &lhs, const GregorianDate &rhs);
bool operator<(const GregorianDate &lhs, const GregorianDate &rhs);

/* YYYY-MM-DD */
std::ostream &operator<<(std::ostream &os, const GregorianDate &g);

#endif /* GregorianDate_hpp */
