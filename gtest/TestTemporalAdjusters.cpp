/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDate.h"
#include "tempora/LocalDateTime.h"
#include "tempora/TemporalAdjusters.h"

namespace tempora::test {

static LocalDate Date(int32_t aYear, int32_t aMonth, int32_t aDay) {
  return Unwrap(LocalDate::Of(aYear, aMonth, aDay));
}

// A Friday in a leap year February.
static LocalDate Friday() { return Date(2008, 2, 15); }

TEST(Tempora_TemporalAdjusters, MonthAndYearBoundaries)
{
  EXPECT_EQ(Unwrap(FirstDayOfMonth().adjust(Friday())), Date(2008, 2, 1));
  EXPECT_EQ(Unwrap(LastDayOfMonth().adjust(Friday())), Date(2008, 2, 29));
  EXPECT_EQ(Unwrap(LastDayOfMonth().adjust(Date(2009, 2, 15))),
            Date(2009, 2, 28));
  EXPECT_EQ(Unwrap(FirstDayOfNextMonth().adjust(Friday())), Date(2008, 3, 1));
  EXPECT_EQ(Unwrap(FirstDayOfNextMonth().adjust(Date(2008, 12, 31))),
            Date(2009, 1, 1));
  EXPECT_EQ(Unwrap(FirstDayOfYear().adjust(Friday())), Date(2008, 1, 1));
  EXPECT_EQ(Unwrap(LastDayOfYear().adjust(Friday())), Date(2008, 12, 31));
  EXPECT_EQ(Unwrap(FirstDayOfNextYear().adjust(Friday())), Date(2009, 1, 1));

  EXPECT_TRUE(FirstDayOfNextYear().adjust(LocalDate::Max()).isErr());
}

TEST(Tempora_TemporalAdjusters, RelativeDayOfWeek)
{
  ASSERT_EQ(Friday().getDayOfWeek(), DayOfWeek::Friday);

  EXPECT_EQ(Unwrap(Next(DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 2, 22));
  EXPECT_EQ(Unwrap(NextOrSame(DayOfWeek::Friday).adjust(Friday())), Friday());
  EXPECT_EQ(Unwrap(Next(DayOfWeek::Monday).adjust(Friday())),
            Date(2008, 2, 18));
  EXPECT_EQ(Unwrap(NextOrSame(DayOfWeek::Thursday).adjust(Friday())),
            Date(2008, 2, 21));

  EXPECT_EQ(Unwrap(Previous(DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 2, 8));
  EXPECT_EQ(Unwrap(PreviousOrSame(DayOfWeek::Friday).adjust(Friday())),
            Friday());
  EXPECT_EQ(Unwrap(PreviousOrSame(DayOfWeek::Sunday).adjust(Friday())),
            Date(2008, 2, 10));
  EXPECT_EQ(Unwrap(Previous(DayOfWeek::Saturday).adjust(Friday())),
            Date(2008, 2, 9));
}

TEST(Tempora_TemporalAdjusters, DayOfWeekInMonth)
{
  EXPECT_EQ(Unwrap(FirstInMonth(DayOfWeek::Monday).adjust(Friday())),
            Date(2008, 2, 4));
  EXPECT_EQ(Unwrap(LastInMonth(DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 2, 29));
  EXPECT_EQ(Unwrap(DayOfWeekInMonth(2, DayOfWeek::Tuesday).adjust(Friday())),
            Date(2008, 2, 12));
  EXPECT_EQ(Unwrap(DayOfWeekInMonth(-2, DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 2, 22));
  EXPECT_EQ(Unwrap(DayOfWeekInMonth(5, DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 2, 29));

  // Ordinals past the month carry into the neighbouring month.
  EXPECT_EQ(Unwrap(DayOfWeekInMonth(6, DayOfWeek::Friday).adjust(Friday())),
            Date(2008, 3, 7));
  EXPECT_EQ(Unwrap(DayOfWeekInMonth(0, DayOfWeek::Monday).adjust(Friday())),
            Date(2008, 1, 28));
}

TEST(Tempora_TemporalAdjusters, LocalDateTime)
{
  LocalDateTime dateTime = Unwrap(LocalDateTime::Of(2008, 2, 15, 10, 30));
  EXPECT_EQ(Unwrap(LastDayOfMonth().adjust(dateTime)).toString(),
            "2008-02-29T10:30");
  EXPECT_EQ(Unwrap(Next(DayOfWeek::Sunday).adjust(dateTime)).toString(),
            "2008-02-17T10:30");
  EXPECT_EQ(Unwrap(FirstDayOfNextYear().adjust(dateTime)).toString(),
            "2009-01-01T10:30");
}

}  // namespace tempora::test
