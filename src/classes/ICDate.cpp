//  ICDate.cpp
//  IranCal
//
#include "ICDate.hpp"

#include "CalendarError.hpp"
#include "MonthTable.hpp"

#include <iomanip>
#include <sstream>

ICDate::ICDate(int year, int month, int day)
    : year_(year), month_(month), day_(day) {
    if (!isValid(year, month, day)) {
        std::ostringstream oss;
        oss << "invalid IC date " << year << "/" << month << "/" << day;
        if (year == 0) {
            oss << ": there is no year 0";
        } else {
            oss << ": month must be 1-12 and day must be valid for that month";
        }
        throw InvalidDate(oss.str());
    }
}

bool ICDate::isValid(int year, int month, int day) {
    if (year == 0) {
        return false;
    }
    if (month < 1 || month > MONTHS_PER_YEAR) {
        return false;
    }
    return day >= 1 && day <= MonthTable::daysInMonth(year, month);
}

YMD ICDate::asTuple() const {
    return YMD(year_, month_, day_);
}

int ICDate::compare(const ICDate &rhs) const {
    if (year_ != rhs.year_) {
        return year_ < rhs.year_ ? -1 : 1;
    }
    if (month_ != rhs.month_) {
        return month_ < rhs.month_ ? -1 : 1;
    }
    if (day_ != rhs.day_) {
        return day_ < rhs.day_ ? -1 : 1;
    }
    return 0;
}

bool operator==(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) == 0; }
bool operator!=(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) != 0; }
bool operator<(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) < 0; }
bool operator<=(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) <= 0; }
bool operator>(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) > 0; }
bool operator>=(const ICDate &lhs, const ICDate &rhs) { return lhs.compare(rhs) >= 0; }

std::ostream &operator<<(std::ostream &os, const ICDate &d) {
    std::ostringstream oss;
    if (d.year() < 0) {
        oss << '-';
    }
    oss << std::setw(4) << std::setfill('0') << (d.year() < 0 ? -(long)d.year() : (long)d.year()) << "-"
        << std::setw(2) << std::setfill('0') << d.month() << "-"
        << std::setw(2) << std::setfill('0') << d.day();
    return os << oss.str();
}

int yearsBetween(const ICDate &a, const ICDate &b) {
    /* no year 0, so crossing the epoch is one year shorter than the difference */
    long years = (long)b.year() - a.year();
    if (a.year() < 0 && b.year() > 0) {
        years -= 1;
    } else if (a.year() > 0 && b.year() < 0) {
        years += 1;
    }
    if (years > 0 && (b.month() < a.month() || (b.month() == a.month() && b.day() < a.day()))) {
        years -= 1;
    } else if (years < 0 && (b.month() > a.month() || (b.month() == a.month() && b.day() > a.day()))) {
        years += 1;
    }
    return (int)years;
}
