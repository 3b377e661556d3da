//  ICDate.hpp
//  IranCal
//
//  A validated IC calendar date. Years run ... -2, -1, 1, 2 ...; there is
//  no year 0. Instances are immutable and always valid.
//
#ifndef ICDate_hpp
#define ICDate_hpp

#include <cstddef>
#include <functional>
#include <ostream>
#include <tuple>

typedef std::tuple<int, int, int> YMD;

class ICDate {
public:
    /* throws InvalidDate */
    ICDate(int year, int month, int day);

    static bool isValid(int year, int month, int day);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    YMD asTuple() const;

    /* <0, 0, >0 as in strcmp, lexicographic on (year, month, day) */
    int compare(const ICDate &rhs) const;

private:
    int year_;
    int month_;
    int day_;
};

bool operator==(const ICDate &lhs, const ICDate &rhs);
bool operator!=(const ICDate &lhs, const ICDate &rhs);
bool operator<(const ICDate &lhs, const ICDate &rhs);
bool operator<=(const ICDate &lhs, const ICDate &rhs);
bool operator>(const ICDate &lhs, const ICDate &rhs);
bool operator>=(const ICDate &lhs, const ICDate &rhs);

/* YYYY-MM-DD */
std::ostream &operator<<(std::ostream &os, const ICDate &d);

/* Complete years from a to b; negative when b is before a. */
int yearsBetween(const ICDate &a, const ICDate &b);

namespace std {
template <>
struct hash<ICDate> {
    size_t operator()(const ICDate &d) const {
        size_t h = hash<int>()(d.year());
        h = h * 31 + (size_t)d.month();
        h = h * 37 + (size_t)d.day();
        return h;
    }
};
} // namespace std

#endif /* ICDate_hpp */
