//  MonthTable.cpp
//  IranCal
//
#include "MonthTable.hpp"

#include "CalendarError.hpp"
#include "LeapCycle.hpp"

#include <string>

const int MonthTable::nominal[MONTHS_PER_YEAR] = {31, 31, 31, 31, 31, 31, 30, 30, 30, 30, 30, 29};

void MonthTable::checkMonth(int month) {
    if (month < 1 || month > MONTHS_PER_YEAR) {
        throw InvalidMonth("invalid month " + std::to_string(month) + ", must be 1-12");
    }
}

int MonthTable::nominalDays(int month) {
    checkMonth(month);
    return nominal[month - 1];
}

int MonthTable::daysInMonth(int year, int month) {
    checkMonth(month);
    if (month == MONTHS_PER_YEAR && isLeapYear(year)) {
        return 30;
    }
    return nominal[month - 1];
}

int MonthTable::daysInYear(int year) {
    return isLeapYear(year) ? 366 : 365;
}

int MonthTable::daysBeforeMonth(int month) {
    checkMonth(month);
    int n = 0;
    for (int m = 1; m < month; m++) {
        n += nominal[m - 1];
    }
    return n;
}
