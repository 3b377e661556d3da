//  OrdinalMapper.cpp
//  IranCal
//
#include "OrdinalMapper.hpp"

#include "CalendarError.hpp"
#include "MonthTable.hpp"

#include <sstream>

int toOrdinal(const ICDate &date) {
    return MonthTable::daysBeforeMonth(date.month()) + date.day();
}

ICDate fromOrdinal(int year, int ordinal) {
    if (year == 0) {
        throw InvalidDate("invalid IC year 0: there is no year 0");
    }
    const int ndays = MonthTable::daysInYear(year);
    if (ordinal < 1 || ordinal > ndays) {
        std::ostringstream oss;
        oss << "ordinal day " << ordinal << " out of range 1-" << ndays << " for year " << year;
        throw OrdinalOutOfRange(oss.str());
    }
    int rest = ordinal;
    int month = 1;
    for (; month < MONTHS_PER_YEAR; month++) {
        const int dim = MonthTable::daysInMonth(year, month);
        if (rest <= dim) {
            break;
        }
        rest -= dim;
    }
    return ICDate(year, month, rest);
}
