/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDate.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/Period.h"
#include "tempora/ZoneOffset.h"

namespace tempora::test {

TEST(Tempora_LocalDate, Of)
{
  LocalDate date = Unwrap(LocalDate::Of(2012, 10, 29));
  EXPECT_EQ(date.getYear(), 2012);
  EXPECT_EQ(date.getMonth(), Month::October);
  EXPECT_EQ(date.getDayOfMonth(), 29);
  EXPECT_EQ(date.getDayOfWeek(), DayOfWeek::Monday);
  EXPECT_EQ(date.getDayOfYear(), 303);

  EXPECT_ERR_KIND(LocalDate::Of(2007, 2, 29), InvalidValue);
  EXPECT_ERR_KIND(LocalDate::Of(2007, 4, 31), InvalidValue);
  EXPECT_ERR_KIND(LocalDate::Of(2007, 13, 1), InvalidValue);
  EXPECT_ERR_KIND(LocalDate::Of(1'000'000'000, 1, 1), InvalidValue);
  EXPECT_TRUE(LocalDate::Of(2008, 2, 29).isOk());
}

TEST(Tempora_LocalDate, InvalidValueMessage)
{
  auto result = LocalDate::Of(2007, 13, 1);
  ASSERT_TRUE(result.isErr());
  EXPECT_EQ(result.inspectErr().message(),
            "Invalid value for MonthOfYear (valid values 1 - 12): 13");
}

TEST(Tempora_LocalDate, EpochDay)
{
  EXPECT_EQ(Unwrap(LocalDate::OfEpochDay(0)), LocalDate::Epoch());
  EXPECT_EQ(LocalDate::Epoch().getDayOfWeek(), DayOfWeek::Thursday);
  EXPECT_EQ(Unwrap(LocalDate::Of(2000, 1, 1)).toEpochDay(), 10957);
  EXPECT_EQ(Unwrap(LocalDate::Of(1969, 12, 31)).toEpochDay(), -1);

  for (int64_t epochDay : {-719528LL, -1LL, 0LL, 59LL, 11016LL, 2932896LL}) {
    LocalDate date = Unwrap(LocalDate::OfEpochDay(epochDay));
    EXPECT_EQ(date.toEpochDay(), epochDay);
  }

  EXPECT_EQ(Unwrap(LocalDate::OfEpochDay(LocalDate::Max().toEpochDay())),
            LocalDate::Max());
  EXPECT_EQ(Unwrap(LocalDate::OfEpochDay(LocalDate::Min().toEpochDay())),
            LocalDate::Min());
  EXPECT_TRUE(LocalDate::OfEpochDay(LocalDate::Max().toEpochDay() + 1).isErr());
}

TEST(Tempora_LocalDate, LeapYears)
{
  EXPECT_TRUE(Unwrap(LocalDate::Of(2000, 1, 1)).isLeapYear());
  EXPECT_FALSE(Unwrap(LocalDate::Of(1900, 1, 1)).isLeapYear());
  EXPECT_TRUE(Unwrap(LocalDate::Of(2008, 1, 1)).isLeapYear());
  EXPECT_TRUE(Unwrap(LocalDate::Of(-4, 1, 1)).isLeapYear());
  EXPECT_EQ(Unwrap(LocalDate::Of(2008, 12, 31)).getDayOfYear(), 366);
  EXPECT_EQ(Unwrap(LocalDate::Of(2008, 2, 1)).lengthOfMonth(), 29);
  EXPECT_EQ(Unwrap(LocalDate::Of(2009, 2, 1)).lengthOfMonth(), 28);
}

TEST(Tempora_LocalDate, PlusMonthsClampsDay)
{
  LocalDate date = Unwrap(LocalDate::Of(2007, 1, 31));
  EXPECT_EQ(Unwrap(date.plusMonths(1)), Unwrap(LocalDate::Of(2007, 2, 28)));
  EXPECT_EQ(Unwrap(date.plusMonths(3)), Unwrap(LocalDate::Of(2007, 4, 30)));
  EXPECT_EQ(Unwrap(date.minusMonths(2)), Unwrap(LocalDate::Of(2006, 11, 30)));

  LocalDate leapDay = Unwrap(LocalDate::Of(2008, 2, 29));
  EXPECT_EQ(Unwrap(leapDay.plusYears(1)), Unwrap(LocalDate::Of(2009, 2, 28)));
  EXPECT_EQ(Unwrap(leapDay.withYear(2012)), Unwrap(LocalDate::Of(2012, 2, 29)));
  EXPECT_EQ(Unwrap(leapDay.withYear(2011)), Unwrap(LocalDate::Of(2011, 2, 28)));

  EXPECT_EQ(Unwrap(date.plusDays(1)), Unwrap(LocalDate::Of(2007, 2, 1)));
  EXPECT_EQ(Unwrap(date.plusWeeks(-1)), Unwrap(LocalDate::Of(2007, 1, 24)));
  EXPECT_TRUE(LocalDate::Max().plusDays(1).isErr());
}

TEST(Tempora_LocalDate, Fields)
{
  LocalDate date = Unwrap(LocalDate::Of(2012, 10, 29));
  EXPECT_EQ(Unwrap(date.get(ChronoField::DayOfMonth)), 29);
  EXPECT_EQ(Unwrap(date.getLong(ChronoField::ProlepticMonth)),
            2012 * 12 + 9);
  EXPECT_EQ(Unwrap(date.getLong(ChronoField::Era)), 1);
  EXPECT_ERR_KIND(date.get(ChronoField::HourOfDay), UnsupportedField);
  EXPECT_ERR_KIND(date.range(ChronoField::HourOfDay), UnsupportedField);
  EXPECT_FALSE(date.isSupported(ChronoField::HourOfDay));

  ValueRange range = Unwrap(date.range(ChronoField::DayOfMonth));
  EXPECT_EQ(range.getMaximum(), 31);

  EXPECT_EQ(Unwrap(date.with(ChronoField::DayOfWeek, 7)),
            Unwrap(LocalDate::Of(2012, 11, 4)));
  EXPECT_EQ(Unwrap(date.with(ChronoField::Year, 2011)),
            Unwrap(LocalDate::Of(2011, 10, 29)));
  EXPECT_EQ(Unwrap(date.with(ChronoField::Era, 0)).getYear(), -2011);
  EXPECT_ERR_KIND(date.with(ChronoField::MonthOfYear, 0), InvalidValue);
}

TEST(Tempora_LocalDate, Until)
{
  LocalDate start = Unwrap(LocalDate::Of(2010, 1, 15));
  LocalDate end = Unwrap(LocalDate::Of(2011, 3, 18));
  EXPECT_EQ(Unwrap(start.until(end)), Period::Of(1, 2, 3));
  EXPECT_EQ(Unwrap(start.until(end, ChronoUnit::Months)), 14);
  EXPECT_EQ(Unwrap(start.until(end, ChronoUnit::Days)), 427);
  EXPECT_EQ(Unwrap(end.until(start, ChronoUnit::Years)), -1);
  EXPECT_ERR_KIND(start.until(end, ChronoUnit::Hours), UnsupportedField);
}

TEST(Tempora_LocalDate, ToStringAndParse)
{
  EXPECT_EQ(Unwrap(LocalDate::Of(2012, 10, 29)).toString(), "2012-10-29");
  EXPECT_EQ(Unwrap(LocalDate::Of(999, 1, 2)).toString(), "0999-01-02");
  EXPECT_EQ(Unwrap(LocalDate::Of(-1, 1, 2)).toString(), "-0001-01-02");
  EXPECT_EQ(Unwrap(LocalDate::Of(10000, 1, 2)).toString(), "+10000-01-02");

  EXPECT_EQ(Unwrap(LocalDate::Parse("2012-10-29")),
            Unwrap(LocalDate::Of(2012, 10, 29)));
  EXPECT_EQ(Unwrap(LocalDate::Parse("+10000-01-02")),
            Unwrap(LocalDate::Of(10000, 1, 2)));
  EXPECT_EQ(Unwrap(LocalDate::Parse("-0001-01-02")),
            Unwrap(LocalDate::Of(-1, 1, 2)));

  EXPECT_ERR_KIND(LocalDate::Parse("10000-01-02"), Parse);
  EXPECT_ERR_KIND(LocalDate::Parse("2012-13-01"), Parse);
  EXPECT_ERR_KIND(LocalDate::Parse("2012-02-30"), Parse);
  EXPECT_ERR_KIND(LocalDate::Parse("2012-1-01"), Parse);
  EXPECT_ERR_KIND(LocalDate::Parse("2012-10-29x"), Parse);
}

TEST(Tempora_LocalDate, Comparison)
{
  LocalDate earlier = Unwrap(LocalDate::Of(-5, 12, 31));
  LocalDate later = Unwrap(LocalDate::Of(2, 1, 1));
  EXPECT_TRUE(earlier.isBefore(later));
  EXPECT_TRUE(later.isAfter(earlier));
  EXPECT_LT(earlier.compareTo(later), 0);
  EXPECT_TRUE(LocalDate::Min().isBefore(LocalDate::Max()));
}

TEST(Tempora_LocalTime, Of)
{
  LocalTime time = Unwrap(LocalTime::Of(10, 15, 30, 500));
  EXPECT_EQ(time.getHour(), 10);
  EXPECT_EQ(time.getMinute(), 15);
  EXPECT_EQ(time.getSecond(), 30);
  EXPECT_EQ(time.getNano(), 500);
  EXPECT_EQ(time.toSecondOfDay(), 36930);

  EXPECT_ERR_KIND(LocalTime::Of(24, 0), InvalidValue);
  EXPECT_ERR_KIND(LocalTime::Of(0, 60), InvalidValue);
  EXPECT_ERR_KIND(LocalTime::Of(0, 0, 0, 1'000'000'000), InvalidValue);
  EXPECT_EQ(Unwrap(LocalTime::OfSecondOfDay(36930)),
            Unwrap(LocalTime::Of(10, 15, 30)));
}

TEST(Tempora_LocalTime, PlusWrapsAroundMidnight)
{
  LocalTime time = Unwrap(LocalTime::Of(23, 0));
  EXPECT_EQ(time.plusHours(2), Unwrap(LocalTime::Of(1, 0)));
  EXPECT_EQ(time.plusMinutes(-1440), time);
  EXPECT_EQ(time.plusSeconds(3601), Unwrap(LocalTime::Of(0, 0, 1)));
  EXPECT_EQ(LocalTime().minusNanos(1), LocalTime::Max());
}

TEST(Tempora_LocalTime, ToString)
{
  EXPECT_EQ(Unwrap(LocalTime::Of(10, 15)).toString(), "10:15");
  EXPECT_EQ(Unwrap(LocalTime::Of(10, 15, 30)).toString(), "10:15:30");
  EXPECT_EQ(Unwrap(LocalTime::Of(10, 15, 0, 500'000'000)).toString(),
            "10:15:00.500");
  EXPECT_EQ(Unwrap(LocalTime::Of(10, 15, 0, 500'000)).toString(),
            "10:15:00.000500");
  EXPECT_EQ(Unwrap(LocalTime::Of(10, 15, 0, 500)).toString(),
            "10:15:00.000000500");
  EXPECT_EQ(LocalTime::Max().toString(), "23:59:59.999999999");
}

TEST(Tempora_LocalTime, Parse)
{
  EXPECT_EQ(Unwrap(LocalTime::Parse("10:15")), Unwrap(LocalTime::Of(10, 15)));
  EXPECT_EQ(Unwrap(LocalTime::Parse("10:15:30.5")),
            Unwrap(LocalTime::Of(10, 15, 30, 500'000'000)));
  EXPECT_ERR_KIND(LocalTime::Parse("24:00"), Parse);
  EXPECT_ERR_KIND(LocalTime::Parse("10"), Parse);
}

TEST(Tempora_LocalDateTime, PlusCarriesIntoDate)
{
  LocalDateTime dateTime = Unwrap(LocalDateTime::Of(2012, 12, 31, 23, 0));
  EXPECT_EQ(Unwrap(dateTime.plusHours(2)),
            Unwrap(LocalDateTime::Of(2013, 1, 1, 1, 0)));
  EXPECT_EQ(Unwrap(dateTime.plusMinutes(-1441)),
            Unwrap(LocalDateTime::Of(2012, 12, 30, 22, 59)));
  EXPECT_EQ(Unwrap(dateTime.plus(1, ChronoUnit::Months)),
            Unwrap(LocalDateTime::Of(2013, 1, 31, 23, 0)));
  EXPECT_TRUE(LocalDateTime::Max().plusNanos(1).isErr());
}

TEST(Tempora_LocalDateTime, EpochSecond)
{
  LocalDateTime epoch =
      Unwrap(LocalDateTime::OfEpochSecond(0, 0, ZoneOffset::UTC()));
  EXPECT_EQ(epoch, LocalDate::Epoch().atStartOfDay());

  ZoneOffset plusTwo = Unwrap(ZoneOffset::OfHours(2));
  LocalDateTime dateTime =
      Unwrap(LocalDateTime::OfEpochSecond(-1, 0, plusTwo));
  EXPECT_EQ(dateTime, Unwrap(LocalDateTime::Of(1970, 1, 1, 1, 59, 59)));
  EXPECT_EQ(dateTime.toEpochSecond(plusTwo), -1);
}

TEST(Tempora_LocalDateTime, ToStringAndParse)
{
  LocalDateTime dateTime = Unwrap(LocalDateTime::Of(2012, 10, 29, 10, 15));
  EXPECT_EQ(dateTime.toString(), "2012-10-29T10:15");
  EXPECT_EQ(Unwrap(LocalDateTime::Parse("2012-10-29T10:15")), dateTime);
  EXPECT_ERR_KIND(LocalDateTime::Parse("2012-10-29 10:15"), Parse);
  EXPECT_ERR_KIND(LocalDateTime::Parse("2012-10-29"), Parse);
}

TEST(Tempora_LocalDateTime, Fields)
{
  LocalDateTime dateTime = Unwrap(LocalDateTime::Of(2012, 10, 29, 10, 15));
  EXPECT_TRUE(dateTime.isSupported(ChronoField::HourOfDay));
  EXPECT_FALSE(dateTime.isSupported(ChronoField::OffsetSeconds));
  EXPECT_EQ(Unwrap(dateTime.get(ChronoField::MinuteOfDay)), 615);
  EXPECT_ERR_KIND(dateTime.getLong(ChronoField::InstantSeconds),
                  UnsupportedField);
}

}  // namespace tempora::test
