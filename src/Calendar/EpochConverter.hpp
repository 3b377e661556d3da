//  EpochConverter.hpp
//  IranCal
//
//  IC <-> proleptic Gregorian through a serial day number (days since
//  1970-01-01, the count GregorianDate::days() uses).
//
//  On the IC side the count accumulates whole IC years from Nowruz of year 1
//  (year -1 directly precedes year 1) plus the ordinal within the year. The
//  two counts are tied by the Nowruz anchor of CalendarConfig; see
//  CalendarConfig.hpp. Nowruz on a fixed Gregorian day is an approximation,
//  not an equinox computation.
//
//  Every valid ICDate has a serial day. A conversion throws std::out_of_range
//  only when the resulting year does not fit in an int, which happens for the
//  lowest few thousand IC years and the highest few thousand Gregorian years.
//
#ifndef EpochConverter_hpp
#define EpochConverter_hpp

#include "CalendarConfig.hpp"
#include "GregorianDate.hpp"
#include "ICDate.hpp"

class EpochConverter {
public:
    /* throws InvalidDate when cfg.check() fails */
    explicit EpochConverter(const CalendarConfig &cfg = CalendarConfig());

    GregorianDate toGregorian(const ICDate &date) const;
    ICDate fromGregorian(const GregorianDate &g) const;

    long long serialDay(const ICDate &date) const;
    /* throws std::out_of_range outside [minSerialDay(), maxSerialDay()] */
    ICDate fromSerialDay(long long serial) const;

    /* serial days of 1/1/INT_MIN and of the last day of INT_MAX */
    long long minSerialDay() const;
    long long maxSerialDay() const;

    /* Gregorian date of 1/1 of an IC year */
    GregorianDate nowruz(int year) const;

    long long daysBetween(const ICDate &a, const ICDate &b) const;
    ICDate addDays(const ICDate &date, long long n) const;

    /* 0 = Saturday ... 6 = Friday */
    int weekday(const ICDate &date) const;

    const CalendarConfig &config() const { return cfg_; }

    /* days from Nowruz of year 1 to Nowruz of year (negative before the epoch) */
    static long long yearStart(int year);

private:
    CalendarConfig cfg_;
    long long epoch_serial_;    /* serial day of 1/1/1 */
};

#endif /* EpochConverter_hpp */
