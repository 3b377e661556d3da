//  DateFormat.cpp
//  IranCal
//
#include "DateFormat.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <strings.h>

namespace {

const char *kMonthPersian[12] = {
    "فروردین", "اردیبهشت", "خرداد",
    "تیر", "مرداد", "شهریور",
    "مهر", "آبان", "آذر",
    "دی", "بهمن", "اسفند"
};

const char *kMonthLatin[12] = {
    "Farvardin", "Ordibehesht", "Khordad",
    "Tir", "Mordad", "Shahrivar",
    "Mehr", "Aban", "Azar",
    "Dey", "Bahman", "Esfand"
};

const char *kWeekdayPersian[7] = {
    "شنبه", "یکشنبه", "دوشنبه", "سه‌شنبه", "چهارشنبه", "پنجشنبه", "جمعه"
};

const char *kWeekdayLatin[7] = {
    "Shanbe", "Yekshanbe", "Doshanbe", "Seshanbe", "Chaharshanbe", "Panjshanbe", "Jome"
};

const char *kGregorianMonth[12] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

const char *kGregorianWeekday[7] = {
    "Saturday", "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"
};

inline const char *pick(const char *const *table, int n, int idx) {
    if (idx < 0 || idx >= n) {
        return "";
    }
    return table[idx];
}

std::string zeroPadded(long v, int width) {
    char buf[32];
    if (v < 0) {
        snprintf(buf, sizeof(buf), "-%0*ld", width, -v);
    } else {
        snprintf(buf, sizeof(buf), "%0*ld", width, v);
    }
    return std::string(buf);
}

} // namespace

bool parseFormatStyle(const char *s, FormatStyle &out)
{
    if (s == nullptr || s[0] == '\0') {
        return false;
    }
    static const FormatStyle all[] = {FMT_PERSIAN, FMT_LATIN, FMT_NUMERIC, FMT_COMPACT, FMT_FULL};
    for (FormatStyle f : all) {
        if (strcasecmp(s, FormatStyleName(f)) == 0) {
            out = f;
            return true;
        }
    }
    char *endptr = nullptr;
    const long v = strtol(s, &endptr, 10);
    if (endptr != nullptr && *endptr == '\0' && v >= FMT_PERSIAN && v <= FMT_FULL) {
        out = (FormatStyle)v;
        return true;
    }
    return false;
}

const char *monthNamePersian(int month) { return pick(kMonthPersian, 12, month - 1); }
const char *monthNameLatin(int month) { return pick(kMonthLatin, 12, month - 1); }
const char *weekdayNamePersian(int weekday) { return pick(kWeekdayPersian, 7, weekday); }
const char *weekdayNameLatin(int weekday) { return pick(kWeekdayLatin, 7, weekday); }
const char *gregorianMonthName(int month) { return pick(kGregorianMonth, 12, month - 1); }
const char *gregorianWeekdayName(int weekday) { return pick(kGregorianWeekday, 7, weekday); }

std::string formatDate(const ICDate &d, FormatStyle style, const CalendarConfig &cfg)
{
    std::ostringstream oss;
    switch (style) {
        case FMT_LATIN:
            oss << d.day() << " " << monthNameLatin(d.month()) << " " << d.year() << " " << cfg.code;
            break;
        case FMT_NUMERIC:
            oss << zeroPadded(d.year(), 4) << "-" << zeroPadded(d.month(), 2) << "-" << zeroPadded(d.day(), 2);
            break;
        case FMT_COMPACT:
            oss << zeroPadded(d.year(), 4) << "/" << zeroPadded(d.month(), 2) << "/" << zeroPadded(d.day(), 2);
            break;
        case FMT_FULL:
            oss << d.day() << " " << monthNamePersian(d.month()) << " " << d.year() << " " << cfg.code
                << " (" << ((long)d.year() - cfg.solar_hijri_offset) << " SH)";
            break;
        case FMT_PERSIAN:
        default:
            oss << d.day() << " " << monthNamePersian(d.month()) << " " << d.year() << " " << cfg.code;
            break;
    }
    return oss.str();
}

std::string formatGregorianLong(const GregorianDate &g)
{
    std::ostringstream oss;
    oss << g.day() << " " << gregorianMonthName(g.month()) << " ";
    if (g.year() <= 0) {
        oss << (1 - (long)g.year()) << " BCE";
    } else {
        oss << g.year();
    }
    return oss.str();
}

std::string formatGregorianISO(const GregorianDate &g)
{
    return zeroPadded(g.year(), 4) + "-" + zeroPadded(g.month(), 2) + "-" + zeroPadded(g.day(), 2);
}
