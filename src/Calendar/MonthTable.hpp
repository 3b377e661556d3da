//  MonthTable.hpp
//  IranCal
//
//  Month lengths: 1-6 have 31 days, 7-11 have 30, month 12 has 29 in a
//  common year and 30 in a leap year.
//
#ifndef MonthTable_hpp
#define MonthTable_hpp

const int MONTHS_PER_YEAR = 12;

class MonthTable {
public:
    /* throws InvalidMonth for month outside [1,12] */
    static int daysInMonth(int year, int month);
    static int daysInYear(int year);

    /* length of month in a common year; throws InvalidMonth */
    static int nominalDays(int month);

    /* days in months 1..month-1; month 12 never precedes another month,
     * so the sum does not depend on the year. Throws InvalidMonth. */
    static int daysBeforeMonth(int month);

private:
    static const int nominal[MONTHS_PER_YEAR];
    static void checkMonth(int month);
};

#endif /* MonthTable_hpp */
