//  GregorianDate.cpp
//  IranCal
//
#include "GregorianDate.hpp"

#include "CalendarError.hpp"

#include <climits>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

GregorianDate::GregorianDate(int year, int month, int day)
    : year_(year), month_(month), day_(day) {
    if (!isValid(year, month, day)) {
        std::ostringstream oss;
        oss << "invalid Gregorian date " << year << "-" << month << "-" << day;
        throw InvalidDate(oss.str());
    }
}

bool GregorianDate::isValid(int year, int month, int day) {
    const int dim = daysInMonth(year, month);
    return dim > 0 && day >= 1 && day <= dim;
}

bool GregorianDate::isLeapYear(int year) {
    if ((year % 4) != 0) {
        return false;
    }
    if ((year % 100) != 0) {
        return true;
    }
    return (year % 400) == 0;
}

int GregorianDate::daysInMonth(int year, int month) {
    static const int dim[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return dim[month - 1];
}

int GregorianDate::dayOfYear(int year, int month, int day) {
    static const int cum[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
    if (month < 1 || month > 12) {
        return 0;
    }
    int doy = cum[month - 1] + day;
    if (month > 2 && isLeapYear(year)) {
        doy += 1;
    }
    return doy;
}

long long GregorianDate::daysFromCivil(int y, unsigned m, unsigned d) {
    long long yy = (long long)y - (m <= 2);
    const long long era = (yy >= 0 ? yy : yy - 399) / 400;
    const unsigned yoe = (unsigned)(yy - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (long long)doe - 719468;
}

void GregorianDate::civilFromDays(long long z, int &y, unsigned &m, unsigned &d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long long yy = (long long)yoe + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    yy += (m <= 2);
    y = (int)yy;
}

long long GregorianDate::minDays() {
    return daysFromCivil(INT_MIN, 1, 1);
}

long long GregorianDate::maxDays() {
    return daysFromCivil(INT_MAX, 12, 31);
}

GregorianDate GregorianDate::fromDays(long long z) {
    if (z < minDays() || z > maxDays()) {
        std::ostringstream oss;
        oss << "day " << z << " since 1970-01-01 is outside the representable Gregorian years";
        throw std::out_of_range(oss.str());
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(z, y, m, d);
    return GregorianDate(y, (int)m, (int)d);
}

bool GregorianDate::parseYYYYMMDD(long yyyymmdd, int &y, int &m, int &d) {
    if (yyyymmdd <= 0) {
        return false;
    }
    y = (int)(yyyymmdd / 10000);
    const long md = yyyymmdd % 10000;
    m = (int)(md / 100);
    d = (int)(md % 100);
    return isValid(y, m, d);
}

GregorianDate GregorianDate::today() {
    const std::time_t now = std::time(nullptr);
    long long days = (long long)now / 86400;
    if ((long long)now % 86400 < 0) {
        days -= 1;
    }
    return fromDays(days);
}

YMD GregorianDate::asTuple() const {
    return YMD(year_, month_, day_);
}

long long GregorianDate::days() const {
    return daysFromCivil(year_, (unsigned)month_, (unsigned)day_);
}

int GregorianDate::compare(const GregorianDate &rhs) const {
    const long long a = days();
    const long long b = rhs.days();
    return a < b ? -1 : (a > b ? 1 : 0);
}

bool operator==(const GregorianDate &lhs, const GregorianDate &rhs) { return lhs.compare(rhs) == 0; }
bool operator!=(const GregorianDate &lhs, const GregorianDate &rhs) { return lhs.compare(rhs) != 0; }
bool operator<(const GregorianDate &lhs, const GregorianDate &rhs) { return lhs.compare(rhs) < 0; }

std::ostream &operator<<(std::ostream &os, const GregorianDate &g) {
    std::ostringstream oss;
    if (g.year() < 0) {
        oss << '-';
    }
    oss << std::setw(4) << std::setfill('0') << (g.year() < 0 ? -(long)g.year() : (long)g.year()) << "-"
        << std::setw(2) << std::setfill('0') << g.month() << "-"
        << std::setw(2) << std::setfill('0') << g.day();
    return os << oss.str();
}
