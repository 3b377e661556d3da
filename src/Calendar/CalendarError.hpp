//  CalendarError.hpp
//  IranCal
//
//  Validation errors raised by the date engine. All of them are
//  deterministic input errors reported to the immediate caller.
//
#ifndef CalendarError_hpp
#define CalendarError_hpp

#include <stdexcept>
#include <string>

class CalendarError : public std::invalid_argument {
public:
    explicit CalendarError(const std::string &what) : std::invalid_argument(what) {}
};

/* year 0, month outside [1,12] or day outside the month */
class InvalidDate : public CalendarError {
public:
    explicit InvalidDate(const std::string &what) : CalendarError(what) {}
};

/* month outside [1,12] passed to a month-length query */
class InvalidMonth : public CalendarError {
public:
    explicit InvalidMonth(const std::string &what) : CalendarError(what) {}
};

/* day-of-year outside [1, daysInYear(year)] */
class OrdinalOutOfRange : public CalendarError {
public:
    explicit OrdinalOutOfRange(const std::string &what) : CalendarError(what) {}
};

#endif /* CalendarError_hpp */
