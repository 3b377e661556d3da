//  TableExport.hpp
//  IranCal
//
//  Per-day reference table for a range of IC years, written to every sink
//  selected by TABLE_FORMAT.
//
#ifndef TableExport_hpp
#define TableExport_hpp

#include <string>
#include <vector>

#include "EpochConverter.hpp"
#include "OffsetConverter.hpp"
#include "TableSink.hpp"

/* Row for one IC date. */
TableRow makeTableRow(const ICDate &d, const EpochConverter &epoch, const OffsetConverter &offset);

/*
 * Stream every day of IC years year_from..year_to (year 0 skipped) into the
 * sinks. Returns the number of rows. Throws CalendarError for year_from >
 * year_to.
 */
long writeTable(int year_from,
                int year_to,
                const EpochConverter &epoch,
                const OffsetConverter &offset,
                const std::vector<ITableSink *> &sinks);

/* Output files for cfg: <TABLE_OUT_DIR>/<TABLE_PREFIX>.table.{csv,nc}. */
std::vector<std::string> tableOutputPaths(const CalendarConfig &cfg);

/* Create sinks from cfg and write the table. Returns the number of rows. */
long exportTable(int year_from, int year_to, const CalendarConfig &cfg);

#endif /* TableExport_hpp */
