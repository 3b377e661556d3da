//  CalendarCommands.hpp
//  IranCal
//
//  Command-line actions. Each returns the process exit status and writes its
//  report to out; date errors go to err as "Error: ...".
//
#ifndef CalendarCommands_hpp
#define CalendarCommands_hpp

#include <stdio.h>

#include "CalendarConfig.hpp"
#include "DateFormat.hpp"

enum ConvertDirection {
    CONVERT_AUTO = 0,       /* year >= 3000 is IC, otherwise Gregorian */
    CONVERT_FROM_IC = 1,
    CONVERT_FROM_GREGORIAN = 2
};

struct CommandContext {
    CalendarConfig cfg;
    FormatStyle style = FMT_PERSIAN;
    FILE *out = stdout;
    FILE *err = stderr;
};

/* [-]YYYY-MM-DD with any number of year digits. No range check on month/day. */
bool parseDateArg(const char *s, int &y, int &m, int &d);

/* strict integer */
bool parseYearArg(const char *s, int &year);

int cmdToday(const CommandContext &ctx);
int cmdShowDate(const CommandContext &ctx, const GregorianDate &g);
int cmdConvert(const CommandContext &ctx, const char *date, ConvertDirection dir);
int cmdSolarHijri(const CommandContext &ctx, const char *date);
int cmdLeap(const CommandContext &ctx, const char *year);
int cmdNowruz(const CommandContext &ctx, const char *year);
int cmdInfo(const CommandContext &ctx);
int cmdTable(const CommandContext &ctx, const char *year_from, const char *year_to);

#endif /* CalendarCommands_hpp */
