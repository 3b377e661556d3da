//  OffsetConverter.cpp
//  IranCal
//
#include "OffsetConverter.hpp"

#include "CalendarError.hpp"

#include <climits>
#include <sstream>
#include <stdexcept>

YMD OffsetConverter::toSolarHijri(const ICDate &date) const {
    const long long sh_year = (long long)date.year() - offset_;
    if (sh_year < INT_MIN || sh_year > INT_MAX) {
        std::ostringstream oss;
        oss << "IC year " << date.year() << " has no Solar Hijri equivalent";
        throw std::out_of_range(oss.str());
    }
    return YMD((int)sh_year, date.month(), date.day());
}

ICDate OffsetConverter::fromSolarHijri(int year, int month, int day) const {
    const long long ic_year = (long long)year + offset_;
    if (ic_year < INT_MIN || ic_year > INT_MAX) {
        std::ostringstream oss;
        oss << "Solar Hijri year " << year << " has no IC equivalent";
        throw InvalidDate(oss.str());
    }
    return ICDate((int)ic_year, month, day);
}
