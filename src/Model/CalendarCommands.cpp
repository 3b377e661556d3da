//  CalendarCommands.cpp
//  IranCal
//
#include "CalendarCommands.hpp"

#include "CalendarError.hpp"
#include "EpochConverter.hpp"
#include "LeapCycle.hpp"
#include "MonthTable.hpp"
#include "OffsetConverter.hpp"
#include "OrdinalMapper.hpp"
#include "TableExport.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

static bool parseLongStrict(const char *s, long &out)
{
    if (s == NULL || s[0] == '\0') {
        return false;
    }
    errno = 0;
    char *endptr = NULL;
    const long v = strtol(s, &endptr, 10);
    if (errno != 0 || endptr == s || *endptr != '\0') {
        return false;
    }
    out = v;
    return true;
}

bool parseYearArg(const char *s, int &year)
{
    long v = 0;
    if (!parseLongStrict(s, v) || v < -2147483647L || v > 2147483647L) {
        return false;
    }
    year = (int)v;
    return true;
}

bool parseDateArg(const char *s, int &y, int &m, int &d)
{
    if (s == NULL) {
        return false;
    }
    const char *p = s;
    bool neg = false;
    if (*p == '-') {
        neg = true;
        p++;
    }
    long parts[3] = {0, 0, 0};
    for (int i = 0; i < 3; i++) {
        if (!std::isdigit((unsigned char)*p)) {
            return false;
        }
        long v = 0;
        while (std::isdigit((unsigned char)*p)) {
            v = v * 10 + (*p - '0');
            if (v > 2147483647L) {
                return false;
            }
            p++;
        }
        parts[i] = v;
        if (i < 2) {
            if (*p != '-') {
                return false;
            }
            p++;
        }
    }
    if (*p != '\0') {
        return false;
    }
    y = (int)(neg ? -parts[0] : parts[0]);
    m = (int)parts[1];
    d = (int)parts[2];
    return true;
}

static void printICLines(const CommandContext &ctx, const ICDate &ic, const EpochConverter &epoch)
{
    const OffsetConverter offset(ctx.cfg);
    const YMD sh = offset.toSolarHijri(ic);
    const int wd = epoch.weekday(ic);
    fprintf(ctx.out, "  %-11s%s\n", (ctx.cfg.code + ":").c_str(), formatDate(ic, ctx.style, ctx.cfg).c_str());
    fprintf(ctx.out, "  Latin:     %s\n", formatDate(ic, FMT_LATIN, ctx.cfg).c_str());
    fprintf(ctx.out, "  Numeric:   %s\n", formatDate(ic, FMT_NUMERIC, ctx.cfg).c_str());
    fprintf(ctx.out, "  SH:        %d/%02d/%02d\n", std::get<0>(sh), std::get<1>(sh), std::get<2>(sh));
    fprintf(ctx.out, "  Weekday:   %s (%s)\n", weekdayNamePersian(wd), weekdayNameLatin(wd));
    fprintf(ctx.out, "  Day:       %d of %d\n", toOrdinal(ic), MonthTable::daysInYear(ic.year()));
}

int cmdShowDate(const CommandContext &ctx, const GregorianDate &g)
{
    try {
        const EpochConverter epoch(ctx.cfg);
        const ICDate ic = epoch.fromGregorian(g);
        fprintf(ctx.out, "\nToday's Date:\n");
        printICLines(ctx, ic, epoch);
        fprintf(ctx.out, "  Gregorian: %s\n", formatGregorianLong(g).c_str());
        fprintf(ctx.out, "  Full:      %s\n\n", formatDate(ic, FMT_FULL, ctx.cfg).c_str());
    } catch (const CalendarError &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    } catch (const std::out_of_range &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

int cmdToday(const CommandContext &ctx)
{
    return cmdShowDate(ctx, GregorianDate::today());
}

int cmdConvert(const CommandContext &ctx, const char *date, ConvertDirection dir)
{
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseDateArg(date, y, m, d)) {
        fprintf(ctx.err, "Error: Invalid date format '%s'\n", date ? date : "");
        fprintf(ctx.err, "Expected: YYYY-MM-DD\n");
        return 1;
    }
    if (dir == CONVERT_AUTO) {
        dir = (y >= ctx.cfg.gregorian_offset) ? CONVERT_FROM_IC : CONVERT_FROM_GREGORIAN;
    }
    try {
        const EpochConverter epoch(ctx.cfg);
        if (dir == CONVERT_FROM_IC) {
            const ICDate ic(y, m, d);
            const GregorianDate g = epoch.toGregorian(ic);
            fprintf(ctx.out, "\n%s -> Gregorian Conversion:\n", ctx.cfg.code.c_str());
            printICLines(ctx, ic, epoch);
            fprintf(ctx.out, "  Gregorian: %s\n", formatGregorianLong(g).c_str());
            fprintf(ctx.out, "  ISO:       %s\n\n", formatGregorianISO(g).c_str());
        } else {
            const GregorianDate g(y, m, d);
            const ICDate ic = epoch.fromGregorian(g);
            fprintf(ctx.out, "\nGregorian -> %s Conversion:\n", ctx.cfg.code.c_str());
            fprintf(ctx.out, "  Gregorian: %s\n", formatGregorianLong(g).c_str());
            printICLines(ctx, ic, epoch);
            fprintf(ctx.out, "\n");
        }
    } catch (const CalendarError &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    } catch (const std::out_of_range &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

int cmdSolarHijri(const CommandContext &ctx, const char *date)
{
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseDateArg(date, y, m, d)) {
        fprintf(ctx.err, "Error: Invalid date format '%s'\n", date ? date : "");
        fprintf(ctx.err, "Expected: YYYY-MM-DD\n");
        return 1;
    }
    try {
        const OffsetConverter offset(ctx.cfg);
        const EpochConverter epoch(ctx.cfg);
        const ICDate ic = offset.fromSolarHijri(y, m, d);
        fprintf(ctx.out, "\nSolar Hijri -> %s Conversion:\n", ctx.cfg.code.c_str());
        printICLines(ctx, ic, epoch);
        fprintf(ctx.out, "  Gregorian: %s\n\n", formatGregorianLong(epoch.toGregorian(ic)).c_str());
    } catch (const CalendarError &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    } catch (const std::out_of_range &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

int cmdLeap(const CommandContext &ctx, const char *year)
{
    int y = 0;
    if (!parseYearArg(year, y) || y == 0) {
        fprintf(ctx.err, "Error: Invalid year '%s'\n", year ? year : "");
        return 1;
    }
    const LeapCycleInfo info = leapCycleInfo(y);
    fprintf(ctx.out, "\nLeap Year Information for %d %s:\n", y, ctx.cfg.code.c_str());
    fprintf(ctx.out, "  Is leap year:       %s\n", info.is_leap ? "Yes" : "No");
    fprintf(ctx.out, "  Days in year:       %d\n", MonthTable::daysInYear(y));
    fprintf(ctx.out, "  33-year cycle:      #%ld\n", info.cycle_number);
    fprintf(ctx.out, "  Position in cycle:  %d/%d\n", info.cycle_position, info.cycle_length);
    if (!info.is_leap) {
        fprintf(ctx.out, "  Next leap year in:  %d years\n", info.years_to_next_leap);
    }
    fprintf(ctx.out, "\n");
    return 0;
}

int cmdNowruz(const CommandContext &ctx, const char *year)
{
    int y = 0;
    if (!parseYearArg(year, y)) {
        fprintf(ctx.err, "Error: Invalid year '%s'\n", year ? year : "");
        return 1;
    }
    try {
        const EpochConverter epoch(ctx.cfg);
        const ICDate ic(y, 1, 1);
        const GregorianDate g = epoch.nowruz(y);
        const int wd = epoch.weekday(ic);
        fprintf(ctx.out, "\nNowruz %d %s:\n", y, ctx.cfg.code.c_str());
        fprintf(ctx.out, "  %-11s%s\n", (ctx.cfg.code + ":").c_str(), formatDate(ic, ctx.style, ctx.cfg).c_str());
        fprintf(ctx.out, "  Gregorian: %s\n", formatGregorianLong(g).c_str());
        fprintf(ctx.out, "  Day of week: %s\n\n", gregorianWeekdayName(wd));
    } catch (const CalendarError &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    } catch (const std::out_of_range &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

int cmdInfo(const CommandContext &ctx)
{
    const CalendarConfig &c = ctx.cfg;
    fprintf(ctx.out, "\n%s (%s) Information\n", c.name.c_str(), c.code.c_str());
    fprintf(ctx.out, "================================\n\n");
    fprintf(ctx.out, "Epoch:     1 Farvardin 1 %s = %d BCE (proleptic Gregorian)\n", c.code.c_str(), c.epoch_bce);
    fprintf(ctx.out, "Structure: Identical to Solar Hijri (Persian) calendar\n");
    fprintf(ctx.out, "Months:    12 months (6x31, 5x30, 1x29/30 days)\n");
    fprintf(ctx.out, "Year:      365 days (common), 366 days (leap)\n");
    fprintf(ctx.out, "Leap rule: %d-year cycle (%d leap years per cycle, mean year %.8f days)\n",
            LEAP_CYCLE_YEARS, LEAP_CYCLE_LEAPS, MEAN_YEAR_DAYS);
    fprintf(ctx.out, "\nConversions:\n");
    fprintf(ctx.out, "  %s = Gregorian + %d\n", c.code.c_str(), c.gregorian_offset);
    fprintf(ctx.out, "  %s = Solar Hijri + %d\n", c.code.c_str(), c.solar_hijri_offset);
    fprintf(ctx.out, "  Nowruz %d %s pinned to %s %d (Gregorian %d)\n",
            c.reference_year, c.code.c_str(), gregorianMonthName(c.nowruz_month), c.nowruz_day,
            c.reference_year - c.gregorian_offset);
    const int next = (c.reference_year == -1) ? 1 : c.reference_year + 1;
    fprintf(ctx.out, "  REFERENCE_YEAR %d pins 1 Farvardin %d %s to %s %d instead\n\n",
            next, next, c.code.c_str(), gregorianMonthName(c.nowruz_month), c.nowruz_day);
    return 0;
}

int cmdTable(const CommandContext &ctx, const char *year_from, const char *year_to)
{
    int y0 = 0;
    int y1 = 0;
    if (!parseYearArg(year_from, y0) || !parseYearArg(year_to, y1)) {
        fprintf(ctx.err, "Error: Invalid year range '%s' '%s'\n",
                year_from ? year_from : "", year_to ? year_to : "");
        return 1;
    }
    try {
        exportTable(y0, y1, ctx.cfg);
    } catch (const CalendarError &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    } catch (const std::out_of_range &e) {
        fprintf(ctx.err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
