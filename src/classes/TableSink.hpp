//  TableSink.hpp
//  IranCal
//
//  Per-day reference table rows and the sinks that persist them.
//
#ifndef TableSink_hpp
#define TableSink_hpp

#include <stdio.h>
#include <string>

struct TableRow {
    int ic_year;
    int ic_month;
    int ic_day;
    int ordinal;
    int weekday;        /* 0 = Saturday */
    int greg_year;
    int greg_month;
    int greg_day;
    int sh_year;
    long long serial;   /* days since 1970-01-01 */
};

class ITableSink {
public:
    virtual ~ITableSink() = default;

    virtual void onInit(const char *calendar_code, int year_from, int year_to) = 0;
    virtual void onWrite(const TableRow &row) = 0;
    virtual void onClose() = 0;

    virtual const std::string &path() const = 0;
};

class CsvTableSink final : public ITableSink {
public:
    explicit CsvTableSink(std::string file_path);
    ~CsvTableSink() override;

    CsvTableSink(const CsvTableSink &) = delete;
    CsvTableSink &operator=(const CsvTableSink &) = delete;

    void onInit(const char *calendar_code, int year_from, int year_to) override;
    void onWrite(const TableRow &row) override;
    void onClose() override;

    const std::string &path() const override { return file_path_; }
    long rowsWritten() const { return nrow_; }

private:
    std::string file_path_;
    FILE *fp_ = nullptr;
    long nrow_ = 0;
};

#endif /* TableSink_hpp */
