/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Clock.h"
#include "tempora/YearMonth.h"

namespace tempora::test {

static YearMonth YM(int64_t aYear, int32_t aMonth) {
  return Unwrap(YearMonth::Of(aYear, aMonth));
}

TEST(Tempora_YearMonth, Of)
{
  YearMonth ym = YM(2012, 2);
  EXPECT_EQ(ym.getYear(), 2012);
  EXPECT_EQ(ym.getMonthValue(), 2);
  EXPECT_EQ(ym.getMonth(), Month::February);
  EXPECT_EQ(Unwrap(YearMonth::Of(2012, Month::February)), ym);

  EXPECT_ERR_KIND(YearMonth::Of(2012, 0), InvalidValue);
  EXPECT_ERR_KIND(YearMonth::Of(2012, 13), InvalidValue);
  EXPECT_ERR_KIND(YearMonth::Of(1'000'000'000, 1), InvalidValue);

  EXPECT_EQ(YearMonth::From(Unwrap(LocalDate::Of(2012, 6, 30))), YM(2012, 6));

  std::unique_ptr<Clock> clock =
      Clock::Fixed(Unwrap(Instant::OfEpochSecond(1351468800)),
                   ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(YearMonth::Now(*clock), YM(2012, 10));
}

TEST(Tempora_YearMonth, ParseAndPrint)
{
  EXPECT_EQ(Unwrap(YearMonth::Parse("2007-12")), YM(2007, 12));
  EXPECT_EQ(Unwrap(YearMonth::Parse("-0012-03")), YM(-12, 3));
  EXPECT_EQ(Unwrap(YearMonth::Parse("+12345-01")), YM(12345, 1));

  EXPECT_ERR_KIND(YearMonth::Parse("2007-13"), Parse);
  EXPECT_ERR_KIND(YearMonth::Parse("2007-1"), Parse);
  EXPECT_ERR_KIND(YearMonth::Parse("2007-12-01"), Parse);
  EXPECT_ERR_KIND(YearMonth::Parse("12345-01"), Parse);

  DateTimeResult<YearMonth> invalidMonth = YearMonth::Parse("2007-13");
  EXPECT_EQ(invalidMonth.inspectErr().parsedText(), "2007-13");

  EXPECT_EQ(YM(2007, 12).toString(), "2007-12");
  EXPECT_EQ(YM(0, 1).toString(), "0000-01");
  EXPECT_EQ(YM(-12, 3).toString(), "-0012-03");
  EXPECT_EQ(YM(12345, 1).toString(), "12345-01");
  EXPECT_EQ(YM(-12345, 1).toString(), "-12345-01");
}

TEST(Tempora_YearMonth, Lengths)
{
  EXPECT_EQ(YM(2012, 2).lengthOfMonth(), 29);
  EXPECT_EQ(YM(2011, 2).lengthOfMonth(), 28);
  EXPECT_EQ(YM(2011, 4).lengthOfMonth(), 30);
  EXPECT_EQ(YM(2012, 7).lengthOfYear(), 366);
  EXPECT_EQ(YM(1900, 7).lengthOfYear(), 365);
  EXPECT_TRUE(YM(2012, 2).isLeapYear());
  EXPECT_TRUE(YM(2012, 2).isValidDay(29));
  EXPECT_FALSE(YM(2011, 2).isValidDay(29));
  EXPECT_FALSE(YM(2011, 2).isValidDay(0));
}

TEST(Tempora_YearMonth, Fields)
{
  EXPECT_EQ(YM(2012, 1).getProlepticMonth(), 24144);
  EXPECT_EQ(YM(0, 1).getProlepticMonth(), 0);
  EXPECT_EQ(YM(-1, 12).getProlepticMonth(), -1);

  YearMonth ym = YM(-5, 6);
  EXPECT_EQ(Unwrap(ym.get(ChronoField::MonthOfYear)), 6);
  EXPECT_EQ(Unwrap(ym.getLong(ChronoField::YearOfEra)), 6);
  EXPECT_EQ(Unwrap(ym.getLong(ChronoField::Era)), 0);
  EXPECT_EQ(Unwrap(ym.getLong(ChronoField::ProlepticMonth)), -55);
  EXPECT_ERR_KIND(ym.getLong(ChronoField::DayOfMonth), UnsupportedField);
  EXPECT_FALSE(ym.isSupported(ChronoUnit::Days));
  EXPECT_TRUE(ym.isSupported(ChronoUnit::Months));
}

TEST(Tempora_YearMonth, With)
{
  YearMonth ym = YM(2012, 6);
  EXPECT_EQ(Unwrap(ym.withMonth(1)), YM(2012, 1));
  EXPECT_EQ(Unwrap(ym.withYear(-3)), YM(-3, 6));
  EXPECT_ERR_KIND(ym.withMonth(13), InvalidValue);

  EXPECT_EQ(Unwrap(ym.with(ChronoField::ProlepticMonth, -1)), YM(-1, 12));
  EXPECT_EQ(Unwrap(ym.with(ChronoField::Era, 0)), YM(-2011, 6));
  EXPECT_EQ(Unwrap(YM(-5, 6).with(ChronoField::YearOfEra, 10)), YM(-9, 6));
  EXPECT_EQ(Unwrap(ym.with(ChronoField::Year, 1999)), YM(1999, 6));
  EXPECT_ERR_KIND(ym.with(ChronoField::DayOfMonth, 1), UnsupportedField);
}

TEST(Tempora_YearMonth, PlusMinus)
{
  EXPECT_EQ(Unwrap(YM(2012, 11).plusMonths(3)), YM(2013, 2));
  EXPECT_EQ(Unwrap(YM(2012, 1).minusMonths(1)), YM(2011, 12));
  EXPECT_EQ(Unwrap(YM(0, 1).plusMonths(-1)), YM(-1, 12));
  EXPECT_EQ(Unwrap(YM(2012, 6).plusYears(-2013)), YM(-1, 6));
  EXPECT_EQ(Unwrap(YM(2012, 6).plus(2, ChronoUnit::Decades)), YM(2032, 6));
  EXPECT_EQ(Unwrap(YM(2012, 6).minus(1, ChronoUnit::Centuries)), YM(1912, 6));

  EXPECT_ERR_KIND(YM(2012, 6).plus(1, ChronoUnit::Days), UnsupportedField);
  EXPECT_ERR_KIND(YM(999'999'999, 12).plusMonths(1), InvalidValue);
  EXPECT_ERR_KIND(YM(2012, 6).plusMonths(INT64_MAX), ArithmeticOverflow);
}

TEST(Tempora_YearMonth, Until)
{
  YearMonth start = YM(2012, 1);
  EXPECT_EQ(Unwrap(start.until(YM(2013, 6), ChronoUnit::Months)), 17);
  EXPECT_EQ(Unwrap(start.until(YM(2013, 6), ChronoUnit::Years)), 1);
  EXPECT_EQ(Unwrap(YM(2012, 6).until(YM(2011, 7), ChronoUnit::Months)), -11);
  EXPECT_EQ(Unwrap(YM(2012, 6).until(YM(2011, 7), ChronoUnit::Years)), 0);
  EXPECT_EQ(Unwrap(start.until(YM(2022, 1), ChronoUnit::Decades)), 1);
  EXPECT_EQ(Unwrap(start.until(YM(-1, 1), ChronoUnit::Eras)), -1);
  EXPECT_ERR_KIND(start.until(YM(2013, 6), ChronoUnit::Weeks),
                  UnsupportedField);
}

TEST(Tempora_YearMonth, At)
{
  EXPECT_EQ(Unwrap(YM(2012, 2).atDay(29)), Unwrap(LocalDate::Of(2012, 2, 29)));
  EXPECT_ERR_KIND(YM(2012, 2).atDay(30), InvalidValue);
  EXPECT_EQ(YM(2011, 2).atEndOfMonth(), Unwrap(LocalDate::Of(2011, 2, 28)));
  EXPECT_EQ(YM(2011, 12).atEndOfMonth(), Unwrap(LocalDate::Of(2011, 12, 31)));
}

TEST(Tempora_YearMonth, Compare)
{
  EXPECT_LT(YM(2011, 12).compareTo(YM(2012, 1)), 0);
  EXPECT_GT(YM(2012, 2).compareTo(YM(2012, 1)), 0);
  EXPECT_EQ(YM(2012, 2).compareTo(YM(2012, 2)), 0);
  EXPECT_TRUE(YM(-1, 12).isBefore(YM(0, 1)));
  EXPECT_TRUE(YM(2012, 2).isAfter(YM(2012, 1)));
}

}  // namespace tempora::test
