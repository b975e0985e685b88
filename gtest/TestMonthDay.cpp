/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Clock.h"
#include "tempora/MonthDay.h"

namespace tempora::test {

static MonthDay MD(int32_t aMonth, int32_t aDay) {
  return Unwrap(MonthDay::Of(aMonth, aDay));
}

TEST(Tempora_MonthDay, Of)
{
  MonthDay md = MD(12, 3);
  EXPECT_EQ(md.getMonth(), Month::December);
  EXPECT_EQ(md.getMonthValue(), 12);
  EXPECT_EQ(md.getDayOfMonth(), 3);
  EXPECT_EQ(Unwrap(MonthDay::Of(Month::February, 29)), MD(2, 29));

  DateTimeResult<MonthDay> invalid = MonthDay::Of(2, 30);
  ASSERT_TRUE(invalid.isErr());
  EXPECT_EQ(invalid.inspectErr().message(),
            "Illegal value for DayOfMonth field, value 30 is not valid for "
            "month FEBRUARY");
  EXPECT_ERR_KIND(MonthDay::Of(4, 31), InvalidValue);
  EXPECT_ERR_KIND(MonthDay::Of(13, 1), InvalidValue);
  EXPECT_ERR_KIND(MonthDay::Of(1, 0), InvalidValue);

  EXPECT_EQ(MonthDay::From(Unwrap(LocalDate::Of(2012, 2, 29))), MD(2, 29));

  std::unique_ptr<Clock> clock =
      Clock::Fixed(Unwrap(Instant::OfEpochSecond(1351468800)),
                   ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(MonthDay::Now(*clock), MD(10, 29));
}

TEST(Tempora_MonthDay, ParseAndPrint)
{
  EXPECT_EQ(Unwrap(MonthDay::Parse("--12-03")), MD(12, 3));
  EXPECT_EQ(Unwrap(MonthDay::Parse("--02-29")), MD(2, 29));
  EXPECT_ERR_KIND(MonthDay::Parse("--02-30"), Parse);
  EXPECT_ERR_KIND(MonthDay::Parse("12-03"), Parse);
  EXPECT_ERR_KIND(MonthDay::Parse("--12-3"), Parse);
  EXPECT_ERR_KIND(MonthDay::Parse("--12-03x"), Parse);

  EXPECT_EQ(MD(12, 3).toString(), "--12-03");
  EXPECT_EQ(MD(1, 1).toString(), "--01-01");
}

TEST(Tempora_MonthDay, Fields)
{
  EXPECT_EQ(Unwrap(MD(2, 1).range(ChronoField::DayOfMonth)),
            ValueRange::Fixed(1, 28, 29));
  EXPECT_EQ(Unwrap(MD(4, 1).range(ChronoField::DayOfMonth)),
            ValueRange::Fixed(1, 30));
  EXPECT_EQ(Unwrap(MD(4, 1).range(ChronoField::MonthOfYear)),
            ValueRange::Fixed(1, 12));
  EXPECT_EQ(Unwrap(MD(12, 3).get(ChronoField::DayOfMonth)), 3);
  EXPECT_EQ(Unwrap(MD(12, 3).getLong(ChronoField::MonthOfYear)), 12);
  EXPECT_ERR_KIND(MD(12, 3).getLong(ChronoField::Year), UnsupportedField);
  EXPECT_ERR_KIND(MD(12, 3).range(ChronoField::DayOfYear), UnsupportedField);
}

TEST(Tempora_MonthDay, With)
{
  // The day is clamped to the new month.
  EXPECT_EQ(Unwrap(MD(3, 31).withMonth(2)), MD(2, 29));
  EXPECT_EQ(Unwrap(MD(3, 31).withMonth(4)), MD(4, 30));
  EXPECT_EQ(MD(1, 15).with(Month::June), MD(6, 15));
  EXPECT_ERR_KIND(MD(1, 15).withMonth(0), InvalidValue);

  EXPECT_EQ(Unwrap(MD(2, 1).withDayOfMonth(29)), MD(2, 29));
  EXPECT_ERR_KIND(MD(4, 1).withDayOfMonth(31), InvalidValue);
}

TEST(Tempora_MonthDay, AtYear)
{
  MonthDay leapDay = MD(2, 29);
  EXPECT_TRUE(leapDay.isValidYear(2012));
  EXPECT_FALSE(leapDay.isValidYear(2011));
  EXPECT_FALSE(leapDay.isValidYear(1900));
  EXPECT_TRUE(MD(2, 28).isValidYear(2011));

  EXPECT_EQ(Unwrap(leapDay.atYear(2012)), Unwrap(LocalDate::Of(2012, 2, 29)));
  EXPECT_EQ(Unwrap(leapDay.atYear(2011)), Unwrap(LocalDate::Of(2011, 2, 28)));
  EXPECT_EQ(Unwrap(MD(12, 3).atYear(-5)), Unwrap(LocalDate::Of(-5, 12, 3)));
  EXPECT_ERR_KIND(MD(12, 3).atYear(1'000'000'000), InvalidValue);
}

TEST(Tempora_MonthDay, Compare)
{
  EXPECT_LT(MD(1, 31).compareTo(MD(2, 1)), 0);
  EXPECT_GT(MD(2, 2).compareTo(MD(2, 1)), 0);
  EXPECT_EQ(MD(2, 2).compareTo(MD(2, 2)), 0);
  EXPECT_TRUE(MD(2, 29).isAfter(MD(2, 28)));
  EXPECT_TRUE(MD(12, 31) != MD(1, 1));
}

}  // namespace tempora::test
