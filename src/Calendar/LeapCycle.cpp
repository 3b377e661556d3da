//  LeapCycle.cpp
//  IranCal
//
#include "LeapCycle.hpp"

namespace {

const int kLeapPositions[LEAP_CYCLE_LEAPS] = {1, 5, 9, 13, 17, 22, 26, 30};

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

inline bool isLeapPosition(int pos) {
    for (int i = 0; i < LEAP_CYCLE_LEAPS; i++) {
        if (kLeapPositions[i] == pos) {
            return true;
        }
    }
    return false;
}

/* leap positions <= r, for r in [0,33] */
inline int leapPositionsUpTo(int r) {
    int n = 0;
    for (int i = 0; i < LEAP_CYCLE_LEAPS; i++) {
        if (kLeapPositions[i] <= r) {
            n++;
        }
    }
    return n;
}

} // namespace

int cyclePosition(int year) {
    return (int)floorMod((long long)year - 1, LEAP_CYCLE_YEARS) + 1;
}

long cycleNumber(int year) {
    return (long)floorDiv((long long)year - 1, LEAP_CYCLE_YEARS) + 1;
}

bool isLeapYear(int year) {
    return isLeapPosition(cyclePosition(year));
}

int yearsToNextLeap(int year) {
    const int pos = cyclePosition(year);
    if (isLeapPosition(pos)) {
        return 0;
    }
    for (int i = 0; i < LEAP_CYCLE_LEAPS; i++) {
        if (kLeapPositions[i] > pos) {
            return kLeapPositions[i] - pos;
        }
    }
    /* wrap to position 1 of the next cycle */
    return LEAP_CYCLE_YEARS - pos + kLeapPositions[0];
}

LeapCycleInfo leapCycleInfo(int year) {
    LeapCycleInfo info;
    info.year = year;
    info.cycle_number = cycleNumber(year);
    info.cycle_position = cyclePosition(year);
    info.is_leap = isLeapPosition(info.cycle_position);
    info.years_to_next_leap = yearsToNextLeap(year);
    info.cycle_length = LEAP_CYCLE_YEARS;
    return info;
}

std::vector<int> leapYearsInRange(int y0, int y1) {
    std::vector<int> out;
    if (y0 > y1) {
        return out;
    }
    for (long long y = y0; y <= y1; y++) {
        if (y != 0 && isLeapYear((int)y)) {
            out.push_back((int)y);
        }
    }
    return out;
}

long long leapSlotsBefore(long long x) {
    return LEAP_CYCLE_LEAPS * floorDiv(x, LEAP_CYCLE_YEARS)
           + leapPositionsUpTo((int)floorMod(x, LEAP_CYCLE_YEARS));
}
