//  NetcdfTableContext.cpp
//  IranCal
//
#include "NetcdfTableContext.hpp"

#ifdef _NETCDF_ON

#include <netcdf.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "Macros.hpp"

namespace {

static void ncCheck(int status, const char *what, const char *path)
{
    if (status == NC_NOERR) {
        return;
    }
    fprintf(stderr, "\n  Fatal Error: NetCDF table output failure.\n");
    fprintf(stderr, "  Op: %s\n", what);
    if (path != nullptr && path[0] != '\0') {
        fprintf(stderr, "  File: %s\n", path);
    }
    fprintf(stderr, "  NetCDF: %s\n", nc_strerror(status));
    myexit(ERRFileIO);
}

enum TableColumn {
    COL_IC_YEAR = 0,
    COL_IC_MONTH,
    COL_IC_DAY,
    COL_ORDINAL,
    COL_WEEKDAY,
    COL_GREG_YEAR,
    COL_GREG_MONTH,
    COL_GREG_DAY,
    COL_SH_YEAR,
    NUM_INT_COLUMNS
};

static const char *kColumnNames[NUM_INT_COLUMNS] = {
    "ic_year", "ic_month", "ic_day", "ordinal", "weekday",
    "greg_year", "greg_month", "greg_day", "sh_year"
};

static const char *kColumnLongNames[NUM_INT_COLUMNS] = {
    "IC year", "IC month", "IC day of month", "IC day of year",
    "weekday (0 = Saturday)",
    "proleptic Gregorian year (astronomical)", "Gregorian month", "Gregorian day of month",
    "Solar Hijri year"
};

} // namespace

struct NetcdfTableSink::Impl {
    std::string file_path;
    int ncid = -1;
    int dim_day = -1;
    int var_time = -1;
    int varids[NUM_INT_COLUMNS];

    /* rows are buffered and written in one hyperslab per variable on close */
    std::vector<double> times;
    std::vector<int> columns[NUM_INT_COLUMNS];

    explicit Impl(std::string p) : file_path(std::move(p))
    {
        for (int i = 0; i < NUM_INT_COLUMNS; i++) {
            varids[i] = -1;
        }
    }

    void putText(int varid, const char *name, const char *text)
    {
        ncCheck(nc_put_att_text(ncid, varid, name, strlen(text), text), name, file_path.c_str());
    }

    void open(const char *calendar_code, int year_from, int year_to)
    {
        if (ncid != -1) {
            fprintf(stderr, "\n  Fatal Error: NetCDF table is already open.\n");
            fprintf(stderr, "  File: %s\n", file_path.c_str());
            myexit(ERRFileIO);
        }
        const int cmode = NC_NETCDF4 | NC_CLASSIC_MODEL | NC_CLOBBER;
        ncCheck(nc_create(file_path.c_str(), cmode, &ncid), "nc_create", file_path.c_str());
        ncCheck(nc_def_dim(ncid, "day", NC_UNLIMITED, &dim_day), "nc_def_dim(day)", file_path.c_str());

        const int dims[1] = {dim_day};
        ncCheck(nc_def_var(ncid, "time", NC_DOUBLE, 1, dims, &var_time), "nc_def_var(time)", file_path.c_str());
        putText(var_time, "units", "days since 1970-01-01 00:00:00 UTC");
        putText(var_time, "calendar", "proleptic_gregorian");

        for (int i = 0; i < NUM_INT_COLUMNS; i++) {
            ncCheck(nc_def_var(ncid, kColumnNames[i], NC_INT, 1, dims, &varids[i]),
                    "nc_def_var(column)",
                    file_path.c_str());
            putText(varids[i], "long_name", kColumnLongNames[i]);
        }

        putText(NC_GLOBAL, "calendar_code", calendar_code);
        const int range[2] = {year_from, year_to};
        ncCheck(nc_put_att_int(ncid, NC_GLOBAL, "ic_year_range", NC_INT, 2, range),
                "nc_put_att_int(ic_year_range)",
                file_path.c_str());

        ncCheck(nc_enddef(ncid), "nc_enddef", file_path.c_str());
    }

    void append(const TableRow &row)
    {
        if (ncid == -1) {
            fprintf(stderr, "\n  Fatal Error: NetCDF table is not initialized before writing rows.\n");
            myexit(ERRFileIO);
        }
        times.push_back((double)row.serial);
        columns[COL_IC_YEAR].push_back(row.ic_year);
        columns[COL_IC_MONTH].push_back(row.ic_month);
        columns[COL_IC_DAY].push_back(row.ic_day);
        columns[COL_ORDINAL].push_back(row.ordinal);
        columns[COL_WEEKDAY].push_back(row.weekday);
        columns[COL_GREG_YEAR].push_back(row.greg_year);
        columns[COL_GREG_MONTH].push_back(row.greg_month);
        columns[COL_GREG_DAY].push_back(row.greg_day);
        columns[COL_SH_YEAR].push_back(row.sh_year);
    }

    void close()
    {
        if (ncid == -1) {
            return;
        }
        if (!times.empty()) {
            const size_t start[1] = {0};
            const size_t count[1] = {times.size()};
            ncCheck(nc_put_vara_double(ncid, var_time, start, count, times.data()),
                    "nc_put_vara_double(time)",
                    file_path.c_str());
            for (int i = 0; i < NUM_INT_COLUMNS; i++) {
                ncCheck(nc_put_vara_int(ncid, varids[i], start, count, columns[i].data()),
                        "nc_put_vara_int(column)",
                        file_path.c_str());
            }
        }
        ncCheck(nc_close(ncid), "nc_close", file_path.c_str());
        ncid = -1;
        times.clear();
        for (int i = 0; i < NUM_INT_COLUMNS; i++) {
            columns[i].clear();
        }
    }
};

NetcdfTableSink::NetcdfTableSink(std::string file_path)
    : impl_(std::make_unique<Impl>(std::move(file_path)))
{
}

NetcdfTableSink::~NetcdfTableSink()
{
    impl_->close();
}

void NetcdfTableSink::onInit(const char *calendar_code, int year_from, int year_to)
{
    impl_->open(calendar_code, year_from, year_to);
}

void NetcdfTableSink::onWrite(const TableRow &row)
{
    impl_->append(row);
}

void NetcdfTableSink::onClose()
{
    impl_->close();
}

const std::string &NetcdfTableSink::path() const
{
    return impl_->file_path;
}

#endif /* _NETCDF_ON */
