//  OffsetConverter.hpp
//  IranCal
//
//  IC <-> Solar Hijri. Same months and leap cycle; only the year differs,
//  IC = SH + solar_hijri_offset.
//
#ifndef OffsetConverter_hpp
#define OffsetConverter_hpp

#include "CalendarConfig.hpp"
#include "ICDate.hpp"

class OffsetConverter {
public:
    explicit OffsetConverter(const CalendarConfig &cfg = CalendarConfig())
        : offset_(cfg.solar_hijri_offset) {}

    /* throws std::out_of_range when the Solar Hijri year does not fit in an int */
    YMD toSolarHijri(const ICDate &date) const;

    /* throws InvalidDate when the shifted triple is not a valid IC date */
    ICDate fromSolarHijri(int year, int month, int day) const;

    int offset() const { return offset_; }

private:
    int offset_;
};

#endif /* OffsetConverter_hpp */
