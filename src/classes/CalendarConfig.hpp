//  CalendarConfig.hpp
//  IranCal
//
//  Calendar constants and run options. Converters copy the value they are
//  built with, so nothing reads ambient state after construction.
//
//  The IC day count is pinned to the Gregorian one by a single anchor: the
//  Nowruz of IC year ReferenceYear falls on NowruzMonth/NowruzDay of
//  Gregorian year ReferenceYear - GregorianOffset. Every other Nowruz follows
//  from the 33-year leap cycle.
//
#ifndef CalendarConfig_hpp
#define CalendarConfig_hpp

#include <stdio.h>
#include <string>

enum TableFormat {
    TABLE_CSV = 0,
    TABLE_NETCDF = 1,
    TABLE_BOTH = 2
};

static inline const char *TableFormatName(TableFormat f)
{
    switch (f) {
        case TABLE_CSV:    return "CSV";
        case TABLE_NETCDF: return "NETCDF";
        case TABLE_BOTH:   return "BOTH";
        default:           return "UNKNOWN";
    }
}

struct CalendarConfig {
    std::string code = "IC";                    /* CALENDAR_CODE */
    std::string name = "Iranian Calendar";      /* CALENDAR_NAME */

    int gregorian_offset = 3000;    /* GREGORIAN_OFFSET: IC = Gregorian + offset */
    int solar_hijri_offset = 3621;  /* SOLAR_HIJRI_OFFSET: IC = Solar Hijri + offset */
    int epoch_bce = 3000;           /* EPOCH_BCE, informational */

    int nowruz_month = 3;           /* NOWRUZ_MONTH, Gregorian */
    int nowruz_day = 21;            /* NOWRUZ_DAY, Gregorian */
    int reference_year = 5025;      /* REFERENCE_YEAR, IC year whose Nowruz is pinned */

    int verbose = 0;                /* VERBOSE */

    std::string table_out_dir = ".";        /* TABLE_OUT_DIR */
    std::string table_prefix = "ic";        /* TABLE_PREFIX */
    TableFormat table_format = TABLE_CSV;   /* TABLE_FORMAT: CSV | NETCDF | BOTH */

    /* Empty string when consistent, otherwise a description of the problem. */
    std::string check() const;
};

/* Defaults overridden by the KEY VALUE pairs in fn. Fatal on a bad file. */
CalendarConfig readCalendarConfig(const char *fn);

void printCalendarConfig(FILE *fp, const CalendarConfig &cfg);

#endif /* CalendarConfig_hpp */
