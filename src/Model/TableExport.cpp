//  TableExport.cpp
//  IranCal
//
#include "TableExport.hpp"

#include "CalendarError.hpp"
#include "Macros.hpp"
#include "MonthTable.hpp"
#include "NetcdfTableContext.hpp"
#include "OrdinalMapper.hpp"
#include "funPlatform.hpp"

#include <memory>
#include <sstream>
#include <vector>

static std::string joinPath(const std::string &a, const std::string &b)
{
    if (a.empty()) {
        return b;
    }
    if (b.empty()) {
        return a;
    }
    if (a.back() == '/') {
        return a + b;
    }
    return a + "/" + b;
}

TableRow makeTableRow(const ICDate &d, const EpochConverter &epoch, const OffsetConverter &offset)
{
    const long long serial = epoch.serialDay(d);
    const GregorianDate g = GregorianDate::fromDays(serial);

    TableRow row;
    row.ic_year = d.year();
    row.ic_month = d.month();
    row.ic_day = d.day();
    row.ordinal = toOrdinal(d);
    row.weekday = epoch.weekday(d);
    row.greg_year = g.year();
    row.greg_month = g.month();
    row.greg_day = g.day();
    row.sh_year = std::get<0>(offset.toSolarHijri(d));
    row.serial = serial;
    return row;
}

long writeTable(int year_from,
                int year_to,
                const EpochConverter &epoch,
                const OffsetConverter &offset,
                const std::vector<ITableSink *> &sinks)
{
    if (year_from > year_to) {
        std::ostringstream oss;
        oss << "empty year range " << year_from << " to " << year_to;
        throw CalendarError(oss.str());
    }
    const char *code = epoch.config().code.c_str();
    for (ITableSink *s : sinks) {
        s->onInit(code, year_from, year_to);
    }

    long nrow = 0;
    for (long long y = year_from; y <= year_to; y++) {
        if (y == 0) {
            continue;
        }
        const int year = (int)y;
        const int ndays = MonthTable::daysInYear(year);
        for (int k = 1; k <= ndays; k++) {
            const TableRow row = makeTableRow(fromOrdinal(year, k), epoch, offset);
            for (ITableSink *s : sinks) {
                s->onWrite(row);
            }
            nrow++;
        }
        if (epoch.config().verbose) {
            printf("  Year %d: %d days\n", year, ndays);
        }
    }

    for (ITableSink *s : sinks) {
        s->onClose();
    }
    return nrow;
}

std::vector<std::string> tableOutputPaths(const CalendarConfig &cfg)
{
    std::vector<std::string> paths;
    const std::string base = joinPath(cfg.table_out_dir, cfg.table_prefix + ".table");
    if (cfg.table_format == TABLE_CSV || cfg.table_format == TABLE_BOTH) {
        paths.push_back(base + ".csv");
    }
    if (cfg.table_format == TABLE_NETCDF || cfg.table_format == TABLE_BOTH) {
        paths.push_back(base + ".nc");
    }
    return paths;
}

long exportTable(int year_from, int year_to, const CalendarConfig &cfg)
{
    const EpochConverter epoch(cfg);
    const OffsetConverter offset(cfg);

    if (mkdir_p(cfg.table_out_dir.c_str(), 0777) != 0) {
        fprintf(stderr, "\n  Fatal Error: Failed to create table output directory.\n");
        fprintf(stderr, "  Dir: %s\n", cfg.table_out_dir.c_str());
        myexit(ERRFileIO);
    }

    std::vector<std::unique_ptr<ITableSink>> owned;
    for (const std::string &p : tableOutputPaths(cfg)) {
        const bool is_nc = p.size() > 3 && p.compare(p.size() - 3, 3, ".nc") == 0;
        if (!is_nc) {
            owned.push_back(std::make_unique<CsvTableSink>(p));
            continue;
        }
#ifdef _NETCDF_ON
        owned.push_back(std::make_unique<NetcdfTableSink>(p));
#else
        fprintf(stderr,
                "WARNING: TABLE_FORMAT %s requested but this build has no NetCDF support; skipping %s.\n",
                TableFormatName(cfg.table_format),
                p.c_str());
#endif
    }
    if (owned.empty()) {
        fprintf(stderr, "\n  Fatal Error: No table output is available for TABLE_FORMAT %s.\n",
                TableFormatName(cfg.table_format));
        myexit(ERRCONSIS);
    }

    std::vector<ITableSink *> sinks;
    for (const auto &s : owned) {
        sinks.push_back(s.get());
    }
    const long nrow = writeTable(year_from, year_to, epoch, offset, sinks);
    for (const auto &s : owned) {
        printf("  Table written: %s (%ld rows)\n", s->path().c_str(), nrow);
    }
    return nrow;
}
