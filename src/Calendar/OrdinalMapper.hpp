//  OrdinalMapper.hpp
//  IranCal
//
//  Day-of-year <-> (month, day). Ordinal 1 is Nowruz (1/1).
//
#ifndef OrdinalMapper_hpp
#define OrdinalMapper_hpp

#include "ICDate.hpp"

/* 1..daysInYear(date.year()) */
int toOrdinal(const ICDate &date);

/*
 * Throws OrdinalOutOfRange for ordinal outside [1, daysInYear(year)],
 * InvalidDate for year 0.
 */
ICDate fromOrdinal(int year, int ordinal);

#endif /* OrdinalMapper_hpp */
