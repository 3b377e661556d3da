//  LeapCycle.hpp
//  IranCal
//
//  33-year leap cycle. A year's position in the cycle is
//  ((year - 1) mod 33) + 1 with a floor modulo, so it stays in [1,33]
//  for negative years too. Positions 1, 5, 9, 13, 17, 22, 26 and 30 are leap.
//
#ifndef LeapCycle_hpp
#define LeapCycle_hpp

#include <vector>

const int LEAP_CYCLE_YEARS = 33;
const int LEAP_CYCLE_LEAPS = 8;
const int LEAP_CYCLE_DAYS = 33 * 365 + 8;      /* 12053 */
const double MEAN_YEAR_DAYS = 365.24219852;    /* 12053 / 33 */

struct LeapCycleInfo {
    int year;
    long cycle_number;      /* 1-based; 0 and below before the epoch */
    int cycle_position;     /* 1..33 */
    bool is_leap;
    int years_to_next_leap; /* 0 when the year itself is leap */
    int cycle_length;
};

bool isLeapYear(int year);
int cyclePosition(int year);
long cycleNumber(int year);
int yearsToNextLeap(int year);
LeapCycleInfo leapCycleInfo(int year);

/* Leap years in [y0, y1], year 0 skipped. Empty when y0 > y1. */
std::vector<int> leapYearsInRange(int y0, int y1);

/*
 * Number of integers t in [0, x) whose cycle slot (t mod 33) + 1 is a leap
 * position; negative for x < 0 (minus the count in [x, 0)).
 * With t = year - 1 this counts leap years, which is what the day-count
 * arithmetic needs.
 */
long long leapSlotsBefore(long long x);

#endif /* LeapCycle_hpp */
