/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Clock.h"
#include "tempora/MonthDay.h"
#include "tempora/Year.h"
#include "tempora/YearMonth.h"

namespace tempora::test {

static Year MakeYear(int64_t aYear) { return Unwrap(Year::Of(aYear)); }

TEST(Tempora_Year, Of)
{
  EXPECT_EQ(MakeYear(2007).getValue(), 2007);
  EXPECT_EQ(MakeYear(Year::MinValue).getValue(), -999'999'999);
  EXPECT_EQ(MakeYear(Year::MaxValue).getValue(), 999'999'999);
  EXPECT_ERR_KIND(Year::Of(int64_t(Year::MaxValue) + 1), InvalidValue);
  EXPECT_ERR_KIND(Year::Of(int64_t(Year::MinValue) - 1), InvalidValue);

  EXPECT_EQ(Year::From(Unwrap(LocalDate::Of(2012, 6, 30))), MakeYear(2012));

  std::unique_ptr<Clock> clock =
      Clock::Fixed(Unwrap(Instant::OfEpochSecond(1351468800)),
                   ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(Year::Now(*clock), MakeYear(2012));
}

TEST(Tempora_Year, ParseAndPrint)
{
  EXPECT_EQ(Unwrap(Year::Parse("2007")), MakeYear(2007));
  EXPECT_EQ(Unwrap(Year::Parse("-0012")), MakeYear(-12));
  EXPECT_EQ(Unwrap(Year::Parse("+12345")), MakeYear(12345));
  EXPECT_EQ(Unwrap(Year::Parse("0000")), MakeYear(0));

  EXPECT_ERR_KIND(Year::Parse("+2007"), Parse);
  EXPECT_ERR_KIND(Year::Parse("12345"), Parse);
  EXPECT_ERR_KIND(Year::Parse("207"), Parse);
  EXPECT_ERR_KIND(Year::Parse("2007-"), Parse);
  EXPECT_ERR_KIND(Year::Parse(""), Parse);

  EXPECT_EQ(MakeYear(2007).toString(), "2007");
  EXPECT_EQ(MakeYear(-12).toString(), "-12");
  EXPECT_EQ(MakeYear(12345).toString(), "12345");
}

TEST(Tempora_Year, Leap)
{
  EXPECT_TRUE(Year::IsLeap(2000));
  EXPECT_FALSE(Year::IsLeap(1900));
  EXPECT_TRUE(Year::IsLeap(2012));
  EXPECT_FALSE(Year::IsLeap(2011));
  EXPECT_TRUE(Year::IsLeap(0));
  EXPECT_TRUE(Year::IsLeap(-4));
  EXPECT_FALSE(Year::IsLeap(-1));

  EXPECT_EQ(MakeYear(2012).length(), 366);
  EXPECT_EQ(MakeYear(2011).length(), 365);

  MonthDay leapDay = Unwrap(MonthDay::Of(2, 29));
  EXPECT_TRUE(MakeYear(2012).isValidMonthDay(leapDay));
  EXPECT_FALSE(MakeYear(2011).isValidMonthDay(leapDay));
  EXPECT_TRUE(MakeYear(2011).isValidMonthDay(Unwrap(MonthDay::Of(2, 28))));
}

TEST(Tempora_Year, Fields)
{
  Year year = MakeYear(-5);
  EXPECT_EQ(Unwrap(year.getLong(ChronoField::Year)), -5);
  EXPECT_EQ(Unwrap(year.getLong(ChronoField::YearOfEra)), 6);
  EXPECT_EQ(Unwrap(year.get(ChronoField::Era)), 0);
  EXPECT_EQ(Unwrap(MakeYear(2012).get(ChronoField::Era)), 1);

  EXPECT_EQ(Unwrap(MakeYear(0).range(ChronoField::YearOfEra)),
            ValueRange::Fixed(1, 1'000'000'000));
  EXPECT_EQ(Unwrap(MakeYear(1).range(ChronoField::YearOfEra)),
            ValueRange::Fixed(1, 999'999'999));

  EXPECT_FALSE(year.isSupported(ChronoField::MonthOfYear));
  EXPECT_FALSE(year.isSupported(ChronoUnit::Months));
  EXPECT_TRUE(year.isSupported(ChronoUnit::Eras));
  EXPECT_ERR_KIND(year.getLong(ChronoField::MonthOfYear), UnsupportedField);
  EXPECT_ERR_KIND(year.range(ChronoField::DayOfMonth), UnsupportedField);
}

TEST(Tempora_Year, With)
{
  Year year = MakeYear(-5);
  EXPECT_EQ(Unwrap(year.with(ChronoField::Year, 2012)), MakeYear(2012));
  // The era is kept.
  EXPECT_EQ(Unwrap(year.with(ChronoField::YearOfEra, 10)), MakeYear(-9));
  EXPECT_EQ(Unwrap(MakeYear(2012).with(ChronoField::YearOfEra, 10)),
            MakeYear(10));
  EXPECT_EQ(Unwrap(year.with(ChronoField::Era, 1)), MakeYear(6));
  EXPECT_EQ(Unwrap(year.with(ChronoField::Era, 0)), year);

  EXPECT_ERR_KIND(year.with(ChronoField::Era, 2), InvalidValue);
  EXPECT_ERR_KIND(year.with(ChronoField::MonthOfYear, 1), UnsupportedField);
}

TEST(Tempora_Year, PlusMinus)
{
  Year year = MakeYear(2012);
  EXPECT_EQ(Unwrap(year.plusYears(-2013)), MakeYear(-1));
  EXPECT_EQ(Unwrap(year.plus(3, ChronoUnit::Decades)), MakeYear(2042));
  EXPECT_EQ(Unwrap(year.plus(2, ChronoUnit::Centuries)), MakeYear(2212));
  EXPECT_EQ(Unwrap(year.minus(1, ChronoUnit::Millennia)), MakeYear(1012));
  EXPECT_EQ(Unwrap(year.minusYears(12)), MakeYear(2000));
  EXPECT_EQ(Unwrap(year.minus(1, ChronoUnit::Eras)), MakeYear(-2011));

  EXPECT_ERR_KIND(year.plus(1, ChronoUnit::Eras), InvalidValue);
  EXPECT_ERR_KIND(year.plus(1, ChronoUnit::Months), UnsupportedField);
  EXPECT_ERR_KIND(MakeYear(Year::MaxValue).plusYears(1), InvalidValue);
  EXPECT_ERR_KIND(year.plusYears(INT64_MAX), ArithmeticOverflow);
  EXPECT_ERR_KIND(year.minusYears(INT64_MIN), ArithmeticOverflow);
}

TEST(Tempora_Year, Until)
{
  Year start = MakeYear(2012);
  EXPECT_EQ(Unwrap(start.until(MakeYear(2001), ChronoUnit::Years)), -11);
  EXPECT_EQ(Unwrap(start.until(MakeYear(2001), ChronoUnit::Decades)), -1);
  EXPECT_EQ(Unwrap(start.until(MakeYear(2111), ChronoUnit::Centuries)), 0);
  EXPECT_EQ(Unwrap(start.until(MakeYear(2112), ChronoUnit::Centuries)), 1);
  EXPECT_EQ(Unwrap(start.until(MakeYear(0), ChronoUnit::Eras)), -1);
  EXPECT_ERR_KIND(start.until(MakeYear(2013), ChronoUnit::Days),
                  UnsupportedField);
}

TEST(Tempora_Year, At)
{
  Year leap = MakeYear(2012);
  Year common = MakeYear(2011);
  EXPECT_EQ(Unwrap(leap.atDay(60)), Unwrap(LocalDate::Of(2012, 2, 29)));
  EXPECT_EQ(Unwrap(leap.atDay(366)), Unwrap(LocalDate::Of(2012, 12, 31)));
  EXPECT_ERR_KIND(common.atDay(366), InvalidValue);
  EXPECT_ERR_KIND(common.atDay(0), InvalidValue);

  EXPECT_EQ(Unwrap(leap.atMonth(6)), Unwrap(YearMonth::Of(2012, 6)));
  EXPECT_EQ(leap.atMonth(Month::December), Unwrap(YearMonth::Of(2012, 12)));
  EXPECT_ERR_KIND(leap.atMonth(13), InvalidValue);

  MonthDay leapDay = Unwrap(MonthDay::Of(2, 29));
  EXPECT_EQ(leap.atMonthDay(leapDay), Unwrap(LocalDate::Of(2012, 2, 29)));
  EXPECT_EQ(common.atMonthDay(leapDay), Unwrap(LocalDate::Of(2011, 2, 28)));
}

TEST(Tempora_Year, Compare)
{
  EXPECT_LT(MakeYear(-1).compareTo(MakeYear(0)), 0);
  EXPECT_GT(MakeYear(2012).compareTo(MakeYear(2011)), 0);
  EXPECT_EQ(MakeYear(2012).compareTo(MakeYear(2012)), 0);
  EXPECT_TRUE(MakeYear(2011).isBefore(MakeYear(2012)));
  EXPECT_TRUE(MakeYear(2012).isAfter(MakeYear(2011)));
  EXPECT_NE(MakeYear(2011), MakeYear(2012));
}

}  // namespace tempora::test
