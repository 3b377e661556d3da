//  TableSink.cpp
//  IranCal
//
#include "TableSink.hpp"

#include "Macros.hpp"

#include <utility>

CsvTableSink::CsvTableSink(std::string file_path)
    : file_path_(std::move(file_path))
{
}

CsvTableSink::~CsvTableSink()
{
    onClose();
}

void CsvTableSink::onInit(const char *calendar_code, int year_from, int year_to)
{
    fp_ = fopen(file_path_.c_str(), "w");
    CheckFile(fp_, file_path_.c_str());
    fprintf(fp_, "# %s reference table, years %d to %d\n", calendar_code, year_from, year_to);
    fprintf(fp_, "ic_year,ic_month,ic_day,ordinal,weekday,greg_year,greg_month,greg_day,sh_year,serial_day\n");
    nrow_ = 0;
}

void CsvTableSink::onWrite(const TableRow &row)
{
    if (fp_ == nullptr) {
        fprintf(stderr, "\n  Fatal Error: CSV table is not initialized before writing rows.\n");
        myexit(ERRFileIO);
    }
    const int rc = fprintf(fp_, "%d,%d,%d,%d,%d,%d,%d,%d,%d,%lld\n",
                           row.ic_year, row.ic_month, row.ic_day, row.ordinal, row.weekday,
                           row.greg_year, row.greg_month, row.greg_day, row.sh_year, row.serial);
    if (rc < 0) {
        fprintf(stderr, "\n  Fatal Error: Failed to write CSV table row.\n");
        fprintf(stderr, "  File: %s\n", file_path_.c_str());
        myexit(ERRFileIO);
    }
    nrow_++;
}

void CsvTableSink::onClose()
{
    if (fp_ != nullptr) {
        fclose(fp_);
        fp_ = nullptr;
    }
}
