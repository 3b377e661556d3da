//  irancal.cpp
//  IranCal
//
//  Command-line front-end.
//
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "CalendarCommands.hpp"
#include "CalendarConfig.hpp"
#include "Macros.hpp"

#define IRANCAL_VERSION "1.0.0"

static void usage(const char *prog)
{
    printf("\nUsage: %s [-c cfg] [-f style] [-i|-g] [-v] [-h] [-V] <command> [args]\n", prog);
    printf("\nCommands:\n");
    printf("  today                 Show today's date (default)\n");
    printf("  convert YYYY-MM-DD    Convert IC (year >= 3000) or Gregorian date\n");
    printf("  sh YYYY-MM-DD         Convert a Solar Hijri date\n");
    printf("  leap YEAR             Leap year and 33-year cycle information\n");
    printf("  nowruz YEAR           Gregorian date of Nowruz (1 Farvardin)\n");
    printf("  info                  Calendar summary\n");
    printf("  table Y0 Y1           Export the per-day reference table\n");
    printf("\nOptions:\n");
    printf("  -c cfg    KEY VALUE calendar configuration file\n");
    printf("  -f style  PERSIAN, LATIN, NUMERIC, COMPACT or FULL\n");
    printf("  -i        convert: the date is an IC date\n");
    printf("  -g        convert: the date is a Gregorian date\n");
    printf("  -v        verbose\n");
    printf("  -V        print version\n");
    printf("  -h        this help\n\n");
    printf("Examples:\n");
    printf("  %s convert 5025-11-01\n", prog);
    printf("  %s convert 2026-01-21\n", prog);
    printf("  %s leap 5025\n", prog);
    printf("  %s nowruz 5026\n\n", prog);
}

static const char *requireArg(int argc, char **argv, int idx, const char *cmd, const char *what, const char *example)
{
    if (idx >= argc) {
        fprintf(stderr, "Error: '%s' requires %s\n", cmd, what);
        fprintf(stderr, "Example: irancal %s\n", example);
        exit(1);
    }
    return argv[idx];
}

int main(int argc, char **argv)
{
    CommandContext ctx;
    ConvertDirection dir = CONVERT_AUTO;
    const char *cfg_file = NULL;
    int verbose = 0;
    bool style_set = false;
    FormatStyle style = FMT_PERSIAN;

    int c;
    /* "-" prefixed years (e.g. "leap -5") must reach the command untouched */
    while ((c = getopt(argc, argv, "+c:f:igvVh")) != -1) {
        switch (c) {
            case 'c':
                cfg_file = optarg;
                break;
            case 'f':
                if (!parseFormatStyle(optarg, style)) {
                    fprintf(stderr, "Error: unknown format style '%s'\n", optarg);
                    usage(argv[0]);
                    myexit(ERRUSAGE);
                }
                style_set = true;
                break;
            case 'i':
                dir = CONVERT_FROM_IC;
                break;
            case 'g':
                dir = CONVERT_FROM_GREGORIAN;
                break;
            case 'v':
                verbose = 1;
                break;
            case 'V':
                printf("IranCal v%s\n", IRANCAL_VERSION);
                return 0;
            case 'h':
                usage(argv[0]);
                return 0;
            default:
                usage(argv[0]);
                myexit(ERRUSAGE);
        }
    }

    if (cfg_file != NULL) {
        ctx.cfg = readCalendarConfig(cfg_file);
    }
    if (verbose) {
        ctx.cfg.verbose = 1;
    }
    if (style_set) {
        ctx.style = style;
    }
    if (ctx.cfg.verbose) {
        printf("\nIranCal v%s\n", IRANCAL_VERSION);
        printf("  Configuration%s%s:\n", cfg_file ? " from " : " (defaults)", cfg_file ? cfg_file : "");
        printCalendarConfig(stdout, ctx.cfg);
    }

    if (optind >= argc) {
        return cmdToday(ctx);
    }

    const char *cmd = argv[optind];
    if (strcmp(cmd, "today") == 0) {
        return cmdToday(ctx);
    } else if (strcmp(cmd, "convert") == 0) {
        return cmdConvert(ctx, requireArg(argc, argv, optind + 1, cmd, "a date argument (YYYY-MM-DD)", "convert 5025-11-01"), dir);
    } else if (strcmp(cmd, "sh") == 0) {
        return cmdSolarHijri(ctx, requireArg(argc, argv, optind + 1, cmd, "a date argument (YYYY-MM-DD)", "sh 1404-11-01"));
    } else if (strcmp(cmd, "leap") == 0) {
        return cmdLeap(ctx, requireArg(argc, argv, optind + 1, cmd, "a year argument", "leap 5025"));
    } else if (strcmp(cmd, "nowruz") == 0) {
        return cmdNowruz(ctx, requireArg(argc, argv, optind + 1, cmd, "a year argument", "nowruz 5026"));
    } else if (strcmp(cmd, "info") == 0) {
        return cmdInfo(ctx);
    } else if (strcmp(cmd, "table") == 0) {
        const char *y0 = requireArg(argc, argv, optind + 1, cmd, "a first and last year", "table 5025 5026");
        const char *y1 = requireArg(argc, argv, optind + 2, cmd, "a first and last year", "table 5025 5026");
        return cmdTable(ctx, y0, y1);
    }

    fprintf(stderr, "Error: unknown command '%s'\n", cmd);
    usage(argv[0]);
    return 1;
}
