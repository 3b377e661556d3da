//  DateFormat.hpp
//  IranCal
//
//  Display strings for IC and Gregorian dates. Locale text lives here only.
//
#ifndef DateFormat_hpp
#define DateFormat_hpp

#include <string>

#include "CalendarConfig.hpp"
#include "GregorianDate.hpp"
#include "ICDate.hpp"

enum FormatStyle {
    FMT_PERSIAN = 0,    /* 1 بهمن 5025 IC */
    FMT_LATIN = 1,      /* 1 Bahman 5025 IC */
    FMT_NUMERIC = 2,    /* 5025-11-01 */
    FMT_COMPACT = 3,    /* 5025/11/01 */
    FMT_FULL = 4        /* 1 بهمن 5025 IC (1404 SH) */
};

static inline const char *FormatStyleName(FormatStyle s)
{
    switch (s) {
        case FMT_PERSIAN: return "PERSIAN";
        case FMT_LATIN:   return "LATIN";
        case FMT_NUMERIC: return "NUMERIC";
        case FMT_COMPACT: return "COMPACT";
        case FMT_FULL:    return "FULL";
        default:          return "UNKNOWN";
    }
}

/* Case-insensitive style name or its number 0-4. False when unknown. */
bool parseFormatStyle(const char *s, FormatStyle &out);

const char *monthNamePersian(int month);
const char *monthNameLatin(int month);
const char *weekdayNamePersian(int weekday);    /* 0 = Saturday */
const char *weekdayNameLatin(int weekday);
const char *gregorianMonthName(int month);
const char *gregorianWeekdayName(int weekday);  /* same Saturday-first index */

std::string formatDate(const ICDate &d, FormatStyle style, const CalendarConfig &cfg);

/* 21 January 2026; years <= 0 are written as BCE */
std::string formatGregorianLong(const GregorianDate &g);
std::string formatGregorianISO(const GregorianDate &g);

#endif /* DateFormat_hpp */
