//  CalendarConfig.cpp
//  IranCal
//
#include "CalendarConfig.hpp"

#include "GregorianDate.hpp"
#include "Macros.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <strings.h>

static bool parseIntValue(const char *s, int &out)
{
    if (s == NULL || s[0] == '\0') {
        return false;
    }
    char *endptr = NULL;
    const long v = strtol(s, &endptr, 10);
    if (endptr == NULL || *endptr != '\0') {
        return false;
    }
    if (v < -2147483647L || v > 2147483647L) {
        return false;
    }
    out = (int)v;
    return true;
}

static void readIntOrDie(const char *fn, const char *key, const char *val, int &out)
{
    if (!parseIntValue(val, out)) {
        fprintf(stderr,
                "ERROR: invalid %s value '%s' in %s. Expected an integer.\n",
                key,
                val,
                fn);
        myexit(ERRDATAIN);
    }
}

std::string CalendarConfig::check() const
{
    if (reference_year == 0) {
        return "REFERENCE_YEAR must not be 0 (there is no year 0)";
    }
    const long greg_year = (long)reference_year - gregorian_offset;
    if (greg_year < -2000000000L || greg_year > 2000000000L) {
        return "REFERENCE_YEAR - GREGORIAN_OFFSET is out of range";
    }
    if (!GregorianDate::isValid((int)greg_year, nowruz_month, nowruz_day)) {
        char buf[MAXLEN];
        snprintf(buf, sizeof(buf),
                 "NOWRUZ_MONTH/NOWRUZ_DAY %d/%d is not a valid date in Gregorian year %ld",
                 nowruz_month, nowruz_day, greg_year);
        return std::string(buf);
    }
    if (code.empty()) {
        return "CALENDAR_CODE must not be empty";
    }
    return "";
}

CalendarConfig readCalendarConfig(const char *fn)
{
    CalendarConfig cfg;
    char    str[MAXLEN];
    char    optstr[MAXLEN];
    char    valstr[MAXLEN];

    FILE *fp;
    fp = fopen(fn, "r");
    CheckFile(fp, fn);
    long lineNo = 0;
    while (fgets(str, MAXLEN, fp)) {
        lineNo++;
        char *p = str;
        while (*p != '\0' && std::isspace((unsigned char)*p)) {
            p++;
        }
        if (*p == '#' || *p == '\0') {
            continue;
        }
        optstr[0] = '\0';
        valstr[0] = '\0';
        if (sscanf(p, "%s %s", optstr, valstr) != 2) {
            fclose(fp);
            fprintf(stderr, "\n  Fatal Error: Invalid KEY VALUE calendar cfg line (missing value).\n");
            fprintf(stderr, "  File: %s\n", fn);
            fprintf(stderr, "  Line: %ld\n", lineNo);
            fprintf(stderr, "  Content: %s\n", optstr);
            myexit(ERRFileIO);
        }

        if (strcasecmp("CALENDAR_CODE", optstr) == 0)
            cfg.code = valstr;
        else if (strcasecmp("CALENDAR_NAME", optstr) == 0) {
            /* the name may contain spaces: take the rest of the line */
            const char *rest = p + strlen(optstr);
            while (*rest != '\0' && std::isspace((unsigned char)*rest)) {
                rest++;
            }
            std::string name(rest);
            while (!name.empty() && std::isspace((unsigned char)name.back())) {
                name.pop_back();
            }
            cfg.name = name;
        }
        else if (strcasecmp("GREGORIAN_OFFSET", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.gregorian_offset);
        else if (strcasecmp("SOLAR_HIJRI_OFFSET", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.solar_hijri_offset);
        else if (strcasecmp("EPOCH_BCE", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.epoch_bce);
        else if (strcasecmp("NOWRUZ_MONTH", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.nowruz_month);
        else if (strcasecmp("NOWRUZ_DAY", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.nowruz_day);
        else if (strcasecmp("REFERENCE_YEAR", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.reference_year);
        else if (strcasecmp("VERBOSE", optstr) == 0)
            readIntOrDie(fn, optstr, valstr, cfg.verbose);
        else if (strcasecmp("TABLE_OUT_DIR", optstr) == 0)
            cfg.table_out_dir = valstr;
        else if (strcasecmp("TABLE_PREFIX", optstr) == 0)
            cfg.table_prefix = valstr;
        else if (strcasecmp("TABLE_FORMAT", optstr) == 0) {
            if (strcasecmp(valstr, "CSV") == 0) {
                cfg.table_format = TABLE_CSV;
            } else if (strcasecmp(valstr, "NETCDF") == 0) {
                cfg.table_format = TABLE_NETCDF;
            } else if (strcasecmp(valstr, "BOTH") == 0) {
                cfg.table_format = TABLE_BOTH;
            } else {
                fprintf(stderr,
                        "WARNING: invalid TABLE_FORMAT value '%s' in %s; using default %s. "
                        "Valid values: CSV/NETCDF/BOTH.\n",
                        valstr,
                        fn,
                        TableFormatName(TABLE_CSV));
                cfg.table_format = TABLE_CSV;
            }
        }
        /* Unrecognized Parameter Flag */
        else {
            fprintf(stderr,
                    "WARNING: Parameter %s in %s cannot be recognized and is ignored.\n",
                    optstr,
                    fn);
        }
    }
    fclose(fp);

    const std::string msg = cfg.check();
    if (!msg.empty()) {
        fprintf(stderr, "\n  Fatal Error: Inconsistent calendar configuration.\n");
        fprintf(stderr, "  File: %s\n", fn);
        fprintf(stderr, "  %s\n", msg.c_str());
        myexit(ERRCONSIS);
    }
    return cfg;
}

void printCalendarConfig(FILE *fp, const CalendarConfig &cfg)
{
    fprintf(fp, "  CALENDAR_CODE       %s\n", cfg.code.c_str());
    fprintf(fp, "  CALENDAR_NAME       %s\n", cfg.name.c_str());
    fprintf(fp, "  GREGORIAN_OFFSET    %d\n", cfg.gregorian_offset);
    fprintf(fp, "  SOLAR_HIJRI_OFFSET  %d\n", cfg.solar_hijri_offset);
    fprintf(fp, "  EPOCH_BCE           %d\n", cfg.epoch_bce);
    fprintf(fp, "  NOWRUZ_MONTH        %d\n", cfg.nowruz_month);
    fprintf(fp, "  NOWRUZ_DAY          %d\n", cfg.nowruz_day);
    fprintf(fp, "  REFERENCE_YEAR      %d\n", cfg.reference_year);
    fprintf(fp, "  TABLE_OUT_DIR       %s\n", cfg.table_out_dir.c_str());
    fprintf(fp, "  TABLE_PREFIX        %s\n", cfg.table_prefix.c_str());
    fprintf(fp, "  TABLE_FORMAT        %s\n", TableFormatName(cfg.table_format));
}
