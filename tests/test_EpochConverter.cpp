#include <gtest/gtest.h>

#include <stdexcept>

#include "CalendarError.hpp"
#include "EpochConverter.hpp"
#include "LeapCycle.hpp"
#include "MonthTable.hpp"
#include "OrdinalMapper.hpp"

namespace {

CalendarConfig nowruzAnchoredAt5026() {
    CalendarConfig cfg;
    cfg.reference_year = 5026;
    return cfg;
}

} // namespace

TEST(EpochConverter, DefaultAnchorWinterDates) {
    const EpochConverter conv;
    EXPECT_EQ(conv.fromGregorian(GregorianDate(2026, 1, 22)), ICDate(5025, 11, 2));
    EXPECT_EQ(conv.toGregorian(ICDate(5025, 11, 2)), GregorianDate(2026, 1, 22));
    EXPECT_EQ(conv.fromGregorian(GregorianDate(2026, 1, 21)), ICDate(5025, 11, 1));
}

TEST(EpochConverter, DefaultAnchorNowruz) {
    const EpochConverter conv;
    EXPECT_EQ(conv.nowruz(5025), GregorianDate(2025, 3, 21));
    EXPECT_EQ(conv.nowruz(5026), GregorianDate(2026, 3, 22));
    /* 5025 is leap, so 2026-03-21 is its 30 Esfand */
    EXPECT_EQ(conv.fromGregorian(GregorianDate(2026, 3, 21)), ICDate(5025, 12, 30));
}

TEST(EpochConverter, ReferenceYear5026Anchor) {
    const EpochConverter conv(nowruzAnchoredAt5026());
    EXPECT_EQ(conv.fromGregorian(GregorianDate(2026, 3, 21)), ICDate(5026, 1, 1));
    EXPECT_EQ(conv.nowruz(5026), GregorianDate(2026, 3, 21));
    EXPECT_EQ(conv.toGregorian(ICDate(5025, 11, 2)), GregorianDate(2026, 1, 21));
}

TEST(EpochConverter, EpochFallsIn3000BCE) {
    const EpochConverter conv;
    const GregorianDate g = conv.toGregorian(ICDate(1, 1, 1));
    EXPECT_EQ(g.year(), -2999);
    EXPECT_EQ(g, GregorianDate(-2999, 3, 22));
    EXPECT_EQ(conv.toGregorian(ICDate(-1, 12, 29)), GregorianDate(-2999, 3, 21));
    EXPECT_EQ(conv.daysBetween(ICDate(-1, 12, 29), ICDate(1, 1, 1)), 1);
}

TEST(EpochConverter, SolarHijriEraStart) {
    const EpochConverter conv;
    EXPECT_EQ(conv.toGregorian(ICDate(3622, 1, 1)), GregorianDate(622, 3, 22));
    EXPECT_EQ(conv.toGregorian(ICDate(2461, 1, 1)), GregorianDate(-539, 3, 22));
}

TEST(EpochConverter, YearStart) {
    EXPECT_EQ(EpochConverter::yearStart(1), 0);
    EXPECT_EQ(EpochConverter::yearStart(2), 366);
    EXPECT_EQ(EpochConverter::yearStart(-1), -365);
    EXPECT_EQ(EpochConverter::yearStart(-3), -1096);
    EXPECT_EQ(EpochConverter::yearStart(34) - EpochConverter::yearStart(1), LEAP_CYCLE_DAYS);
    for (int y = -50; y <= 50; y++) {
        if (y == 0 || y == -1) {
            continue;
        }
        EXPECT_EQ(EpochConverter::yearStart(y + 1) - EpochConverter::yearStart(y), MonthTable::daysInYear(y))
            << "year " << y;
    }
    EXPECT_EQ(EpochConverter::yearStart(1) - EpochConverter::yearStart(-1), MonthTable::daysInYear(-1));
}

TEST(EpochConverter, GregorianRoundTrip) {
    const EpochConverter conv;
    const long long from = GregorianDate::daysFromCivil(1900, 1, 1);
    const long long to = GregorianDate::daysFromCivil(2100, 12, 31);
    for (long long z = from; z <= to; z++) {
        const GregorianDate g = GregorianDate::fromDays(z);
        const ICDate ic = conv.fromGregorian(g);
        ASSERT_EQ(conv.toGregorian(ic), g) << g;
    }
}

TEST(EpochConverter, ICRoundTripAcrossEpoch) {
    const EpochConverter conv;
    long long prev = 0;
    bool first = true;
    for (int y = -40; y <= 40; y++) {
        if (y == 0) {
            continue;
        }
        const int n = MonthTable::daysInYear(y);
        for (int k = 1; k <= n; k++) {
            const ICDate d = fromOrdinal(y, k);
            const long long s = conv.serialDay(d);
            if (!first) {
                ASSERT_EQ(s, prev + 1) << d;
            }
            first = false;
            prev = s;
            ASSERT_EQ(conv.fromSerialDay(s), d);
            ASSERT_EQ(conv.fromGregorian(conv.toGregorian(d)), d);
        }
    }
}

TEST(EpochConverter, NowruzStaysNearMarch21) {
    const EpochConverter conv;
    for (int y = 5000; y <= 5100; y++) {
        const GregorianDate g = conv.nowruz(y);
        EXPECT_EQ(g.year(), y - 3000);
        EXPECT_EQ(g.month(), 3);
        EXPECT_GE(g.day(), 20);
        EXPECT_LE(g.day(), 23);
    }
}

TEST(EpochConverter, DayArithmetic) {
    const EpochConverter conv;
    EXPECT_EQ(conv.daysBetween(ICDate(5025, 11, 2), ICDate(5026, 1, 1)), 59);
    EXPECT_EQ(conv.daysBetween(ICDate(5026, 1, 1), ICDate(5025, 11, 2)), -59);
    EXPECT_EQ(conv.addDays(ICDate(5025, 11, 2), 59), ICDate(5026, 1, 1));
    EXPECT_EQ(conv.addDays(ICDate(5025, 12, 29), 1), ICDate(5025, 12, 30));
    EXPECT_EQ(conv.addDays(ICDate(5026, 12, 29), 1), ICDate(5027, 1, 1));
    EXPECT_EQ(conv.addDays(ICDate(1, 1, 1), -1), ICDate(-1, 12, 29));
    EXPECT_EQ(conv.addDays(ICDate(5025, 6, 31), 0), ICDate(5025, 6, 31));
}

TEST(EpochConverter, Weekday) {
    const EpochConverter conv;
    EXPECT_EQ(conv.weekday(ICDate(5025, 11, 2)), 5);   // Thursday 2026-01-22
    EXPECT_EQ(conv.weekday(ICDate(5026, 1, 1)), 1);    // Sunday 2026-03-22
    for (int k = 0; k < 14; k++) {
        const ICDate d = conv.addDays(ICDate(5025, 1, 1), k);
        EXPECT_EQ(conv.weekday(d), (conv.weekday(ICDate(5025, 1, 1)) + k) % 7);
    }
}

TEST(EpochConverter, FarFutureYearsConvert) {
    const EpochConverter conv;
    const ICDate d(2000000, 1, 1);
    GregorianDate g(1970, 1, 1);
    ASSERT_NO_THROW(g = conv.toGregorian(d));
    EXPECT_GT(g.year(), 1990000);
    EXPECT_LT(g.year(), 1998000);
    EXPECT_EQ(conv.fromGregorian(g), d);

    const GregorianDate g2(1500000, 6, 1);
    ICDate ic(1, 1, 1);
    ASSERT_NO_THROW(ic = conv.fromGregorian(g2));
    EXPECT_EQ(conv.toGregorian(ic), g2);

    const ICDate far(500000000, 12, 29);
    EXPECT_EQ(conv.fromSerialDay(conv.serialDay(far)), far);
}

TEST(EpochConverter, IntLimits) {
    const EpochConverter conv;
    const int hi = 2147483647;
    const int lo = -2147483647 - 1;

    /* every valid date has a serial day, and the top IC years still convert */
    const ICDate top(hi, 12, 29);
    EXPECT_EQ(conv.fromSerialDay(conv.serialDay(top)), top);
    EXPECT_EQ(conv.fromGregorian(conv.toGregorian(top)), top);
    EXPECT_EQ(conv.fromSerialDay(conv.serialDay(ICDate(lo, 1, 1))), ICDate(lo, 1, 1));
    EXPECT_EQ(conv.fromSerialDay(conv.minSerialDay()), ICDate(lo, 1, 1));
    EXPECT_EQ(conv.fromSerialDay(conv.maxSerialDay()).year(), hi);

    /* lowest IC years land before Gregorian year INT_MIN */
    EXPECT_THROW(conv.toGregorian(ICDate(lo, 1, 1)), std::out_of_range);
    const GregorianDate first(lo, 1, 1);
    EXPECT_EQ(conv.toGregorian(conv.fromGregorian(first)), first);

    /* highest Gregorian years land after IC year INT_MAX */
    EXPECT_THROW(conv.fromGregorian(GregorianDate(hi, 12, 31)), std::out_of_range);

    EXPECT_THROW(conv.fromSerialDay(conv.maxSerialDay() + 1), std::out_of_range);
    EXPECT_THROW(conv.fromSerialDay(conv.minSerialDay() - 1), std::out_of_range);
    EXPECT_THROW(conv.fromSerialDay(1000000000000LL), std::out_of_range);
    EXPECT_THROW(conv.addDays(ICDate(5025, 1, 1), 9000000000000000000LL), std::out_of_range);
}

TEST(EpochConverter, RejectsInconsistentConfig) {
    CalendarConfig cfg;
    cfg.reference_year = 0;
    EXPECT_THROW(EpochConverter conv(cfg), InvalidDate);

    CalendarConfig bad_day;
    bad_day.nowruz_month = 2;
    bad_day.nowruz_day = 30;
    EXPECT_THROW(EpochConverter conv(bad_day), InvalidDate);
}
