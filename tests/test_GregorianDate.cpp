#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "CalendarError.hpp"
#include "GregorianDate.hpp"

TEST(GregorianDate, LeapRule) {
    EXPECT_TRUE(GregorianDate::isLeapYear(2000));
    EXPECT_FALSE(GregorianDate::isLeapYear(1900));
    EXPECT_TRUE(GregorianDate::isLeapYear(2024));
    EXPECT_FALSE(GregorianDate::isLeapYear(2023));
    EXPECT_TRUE(GregorianDate::isLeapYear(0));
    EXPECT_TRUE(GregorianDate::isLeapYear(-4));
    EXPECT_FALSE(GregorianDate::isLeapYear(-100));
    EXPECT_TRUE(GregorianDate::isLeapYear(-400));
}

TEST(GregorianDate, Validation) {
    EXPECT_THROW(GregorianDate(2023, 2, 29), InvalidDate);
    EXPECT_NO_THROW(GregorianDate(2024, 2, 29));
    EXPECT_THROW(GregorianDate(2024, 13, 1), InvalidDate);
    EXPECT_THROW(GregorianDate(2024, 4, 31), InvalidDate);
    EXPECT_EQ(GregorianDate::daysInMonth(2024, 0), 0);
}

TEST(GregorianDate, DayCount) {
    EXPECT_EQ(GregorianDate::daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(GregorianDate::daysFromCivil(2000, 3, 1), 11017);
    EXPECT_EQ(GregorianDate::daysFromCivil(1969, 12, 31), -1);
    EXPECT_EQ(GregorianDate(2026, 1, 22).days(), 20475);
}

TEST(GregorianDate, DayCountRoundTrip) {
    for (long long z = -1000000; z <= 1000000; z += 997) {
        const GregorianDate g = GregorianDate::fromDays(z);
        ASSERT_EQ(g.days(), z);
    }
}

TEST(GregorianDate, FromDaysCoversEveryIntYear) {
    const GregorianDate first = GregorianDate::fromDays(GregorianDate::minDays());
    EXPECT_EQ(first, GregorianDate(-2147483647 - 1, 1, 1));
    const GregorianDate last = GregorianDate::fromDays(GregorianDate::maxDays());
    EXPECT_EQ(last, GregorianDate(2147483647, 12, 31));
    EXPECT_THROW(GregorianDate::fromDays(GregorianDate::minDays() - 1), std::out_of_range);
    EXPECT_THROW(GregorianDate::fromDays(GregorianDate::maxDays() + 1), std::out_of_range);
}

TEST(GregorianDate, DayOfYear) {
    EXPECT_EQ(GregorianDate::dayOfYear(2024, 3, 1), 61);
    EXPECT_EQ(GregorianDate::dayOfYear(2023, 3, 1), 60);
    EXPECT_EQ(GregorianDate::dayOfYear(2023, 12, 31), 365);
}

TEST(GregorianDate, ParseYYYYMMDD) {
    int y = 0;
    int m = 0;
    int d = 0;
    ASSERT_TRUE(GregorianDate::parseYYYYMMDD(20260122, y, m, d));
    EXPECT_EQ(y, 2026);
    EXPECT_EQ(m, 1);
    EXPECT_EQ(d, 22);
    EXPECT_FALSE(GregorianDate::parseYYYYMMDD(20261301, y, m, d));
    EXPECT_FALSE(GregorianDate::parseYYYYMMDD(20230229, y, m, d));
    EXPECT_FALSE(GregorianDate::parseYYYYMMDD(0, y, m, d));
}

TEST(GregorianDate, OrderingAndStream) {
    EXPECT_LT(GregorianDate(-1, 12, 31), GregorianDate(0, 1, 1));
    EXPECT_EQ(GregorianDate(2026, 1, 22), GregorianDate::fromDays(20475));
    std::ostringstream oss;
    oss << GregorianDate(2026, 1, 22) << " " << GregorianDate(-2999, 3, 22);
    EXPECT_EQ(oss.str(), "2026-01-22 -2999-03-22");
}

TEST(GregorianDate, TodayIsValid) {
    const GregorianDate g = GregorianDate::today();
    EXPECT_TRUE(GregorianDate::isValid(g.year(), g.month(), g.day()));
    EXPECT_GE(g.year(), 2024);
}
