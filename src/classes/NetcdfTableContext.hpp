//  NetcdfTableContext.hpp
//  IranCal
//
//  NetCDF reference table output.
//
#ifndef NetcdfTableContext_hpp
#define NetcdfTableContext_hpp

#ifdef _NETCDF_ON

#include <memory>
#include <string>

#include "TableSink.hpp"

class NetcdfTableSink final : public ITableSink {
public:
    explicit NetcdfTableSink(std::string file_path);
    ~NetcdfTableSink() override;

    void onInit(const char *calendar_code, int year_from, int year_to) override;
    void onWrite(const TableRow &row) override;
    void onClose() override;

    const std::string &path() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

#endif /* _NETCDF_ON */

#endif /* NetcdfTableContext_hpp */
