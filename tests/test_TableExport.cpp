#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "CalendarError.hpp"
#include "TableExport.hpp"

namespace {

class CollectingSink : public ITableSink {
public:
    void onInit(const char *calendar_code, int year_from, int year_to) override {
        code = calendar_code;
        from = year_from;
        to = year_to;
        inits++;
    }
    void onWrite(const TableRow &row) override { rows.push_back(row); }
    void onClose() override { closes++; }
    const std::string &path() const override { return path_; }

    std::string code;
    int from = 0;
    int to = 0;
    int inits = 0;
    int closes = 0;
    std::vector<TableRow> rows;

private:
    std::string path_ = "memory";
};

std::vector<std::string> readLines(const std::string &path) {
    std::vector<std::string> lines;
    FILE *fp = fopen(path.c_str(), "r");
    if (fp == nullptr) {
        return lines;
    }
    char buf[512];
    while (fgets(buf, sizeof(buf), fp) != nullptr) {
        std::string s(buf);
        if (!s.empty() && s.back() == '\n') {
            s.pop_back();
        }
        lines.push_back(s);
    }
    fclose(fp);
    return lines;
}

} // namespace

TEST(TableExport, MakeTableRow) {
    const EpochConverter epoch;
    const OffsetConverter offset;
    const TableRow row = makeTableRow(ICDate(5025, 11, 2), epoch, offset);
    EXPECT_EQ(row.ic_year, 5025);
    EXPECT_EQ(row.ic_month, 11);
    EXPECT_EQ(row.ic_day, 2);
    EXPECT_EQ(row.ordinal, 308);
    EXPECT_EQ(row.weekday, 5);
    EXPECT_EQ(row.greg_year, 2026);
    EXPECT_EQ(row.greg_month, 1);
    EXPECT_EQ(row.greg_day, 22);
    EXPECT_EQ(row.sh_year, 1404);
    EXPECT_EQ(row.serial, 20475);
}

TEST(TableExport, WritesEveryDayToEverySink) {
    const EpochConverter epoch;
    const OffsetConverter offset;
    CollectingSink a;
    CollectingSink b;
    const long n = writeTable(5025, 5026, epoch, offset, {&a, &b});
    EXPECT_EQ(n, 366 + 365);
    EXPECT_EQ(a.rows.size(), 731u);
    EXPECT_EQ(b.rows.size(), 731u);
    EXPECT_EQ(a.code, "IC");
    EXPECT_EQ(a.from, 5025);
    EXPECT_EQ(a.to, 5026);
    EXPECT_EQ(a.inits, 1);
    EXPECT_EQ(a.closes, 1);
    for (size_t i = 1; i < a.rows.size(); i++) {
        ASSERT_EQ(a.rows[i].serial, a.rows[i - 1].serial + 1);
        ASSERT_EQ(a.rows[i].weekday, (a.rows[i - 1].weekday + 1) % 7);
    }
    EXPECT_EQ(a.rows.front().ordinal, 1);
    EXPECT_EQ(a.rows[365].ic_month, 12);
    EXPECT_EQ(a.rows[365].ic_day, 30);
    EXPECT_EQ(a.rows[366].ic_year, 5026);
}

TEST(TableExport, SkipsYearZero) {
    const EpochConverter epoch;
    const OffsetConverter offset;
    CollectingSink sink;
    const long n = writeTable(-1, 1, epoch, offset, {&sink});
    EXPECT_EQ(n, 365 + 366);
    EXPECT_EQ(sink.rows.front().ic_year, -1);
    EXPECT_EQ(sink.rows.back().ic_year, 1);
    EXPECT_EQ(sink.rows[365].greg_year, -2999);
    EXPECT_EQ(sink.rows[365].greg_month, 3);
    EXPECT_EQ(sink.rows[365].greg_day, 22);
}

TEST(TableExport, RejectsReversedRange) {
    const EpochConverter epoch;
    const OffsetConverter offset;
    CollectingSink sink;
    EXPECT_THROW(writeTable(5026, 5025, epoch, offset, {&sink}), CalendarError);
    EXPECT_EQ(sink.inits, 0);
}

TEST(TableExport, OutputPaths) {
    CalendarConfig cfg;
    cfg.table_out_dir = "out/";
    cfg.table_prefix = "ic";
    EXPECT_EQ(tableOutputPaths(cfg), std::vector<std::string>{"out/ic.table.csv"});
    cfg.table_out_dir = "out";
    cfg.table_format = TABLE_BOTH;
    EXPECT_EQ(tableOutputPaths(cfg), (std::vector<std::string>{"out/ic.table.csv", "out/ic.table.nc"}));
    cfg.table_format = TABLE_NETCDF;
    EXPECT_EQ(tableOutputPaths(cfg), std::vector<std::string>{"out/ic.table.nc"});
}

TEST(TableExport, CsvExport) {
    CalendarConfig cfg;
    cfg.table_out_dir = ::testing::TempDir() + "irancal_table/csv";
    cfg.table_prefix = "t";
    cfg.table_format = TABLE_CSV;
    const long n = exportTable(5025, 5025, cfg);
    EXPECT_EQ(n, 366);

    const std::vector<std::string> lines = readLines(cfg.table_out_dir + "/t.table.csv");
    ASSERT_EQ(lines.size(), 2u + 366u);
    EXPECT_EQ(lines[0], "# IC reference table, years 5025 to 5025");
    EXPECT_EQ(lines[1], "ic_year,ic_month,ic_day,ordinal,weekday,greg_year,greg_month,greg_day,sh_year,serial_day");
    EXPECT_EQ(lines[2 + 307], "5025,11,2,308,5,2026,1,22,1404,20475");
}

TEST(TableExport, CsvSinkCountsRows) {
    const std::string path = ::testing::TempDir() + "irancal_sink.csv";
    CsvTableSink sink(path);
    EXPECT_EQ(sink.path(), path);
    const EpochConverter epoch;
    const OffsetConverter offset;
    writeTable(1, 1, epoch, offset, {&sink});
    EXPECT_EQ(sink.rowsWritten(), 366);
    EXPECT_EQ(readLines(path).size(), 368u);
}
