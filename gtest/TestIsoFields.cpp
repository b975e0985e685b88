/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/IsoFields.h"
#include "tempora/JulianFields.h"
#include "tempora/LocalDate.h"

namespace tempora::test {

static LocalDate Date(int32_t aYear, int32_t aMonth, int32_t aDay) {
  return Unwrap(LocalDate::Of(aYear, aMonth, aDay));
}

static void CheckWeek(const LocalDate& aDate, int64_t aWeekBasedYear,
                      int32_t aWeek) {
  SCOPED_TRACE(aDate.toString());
  EXPECT_EQ(GetIsoField(aDate, IsoField::WeekBasedYear), aWeekBasedYear);
  EXPECT_EQ(GetIsoField(aDate, IsoField::WeekOfWeekBasedYear), aWeek);
}

TEST(Tempora_IsoFields, WeekOfWeekBasedYear)
{
  CheckWeek(Date(2008, 12, 28), 2008, 52);
  CheckWeek(Date(2008, 12, 29), 2009, 1);
  CheckWeek(Date(2009, 12, 31), 2009, 53);
  CheckWeek(Date(2010, 1, 3), 2009, 53);
  CheckWeek(Date(2010, 1, 4), 2010, 1);
  CheckWeek(Date(2012, 2, 29), 2012, 9);
  CheckWeek(Date(2016, 1, 1), 2015, 53);
  CheckWeek(Date(2020, 12, 31), 2020, 53);

  EXPECT_EQ(IsoWeeksInWeekBasedYear(2009), 53);
  EXPECT_EQ(IsoWeeksInWeekBasedYear(2010), 52);
  // Leap year starting on a Wednesday.
  EXPECT_EQ(IsoWeeksInWeekBasedYear(2020), 53);

  EXPECT_EQ(IsoFieldRange(Date(2010, 1, 3), IsoField::WeekOfWeekBasedYear),
            ValueRange::Fixed(1, 53));
  EXPECT_EQ(IsoFieldRange(Date(2010, 6, 1), IsoField::WeekOfWeekBasedYear),
            ValueRange::Fixed(1, 52));
  EXPECT_EQ(IsoFieldRange(IsoField::WeekOfWeekBasedYear),
            ValueRange::Fixed(1, 52, 53));
}

TEST(Tempora_IsoFields, Quarters)
{
  EXPECT_EQ(GetIsoField(Date(2012, 2, 29), IsoField::QuarterOfYear), 1);
  EXPECT_EQ(GetIsoField(Date(2012, 2, 29), IsoField::DayOfQuarter), 60);
  EXPECT_EQ(GetIsoField(Date(2011, 4, 1), IsoField::DayOfQuarter), 1);
  EXPECT_EQ(GetIsoField(Date(2011, 4, 1), IsoField::QuarterOfYear), 2);
  EXPECT_EQ(GetIsoField(Date(2012, 12, 31), IsoField::DayOfQuarter), 92);
  EXPECT_EQ(GetIsoField(Date(2012, 12, 31), IsoField::QuarterOfYear), 4);

  EXPECT_EQ(IsoFieldRange(Date(2012, 1, 10), IsoField::DayOfQuarter),
            ValueRange::Fixed(1, 91));
  EXPECT_EQ(IsoFieldRange(Date(2011, 1, 10), IsoField::DayOfQuarter),
            ValueRange::Fixed(1, 90));
  EXPECT_EQ(IsoFieldRange(Date(2011, 5, 10), IsoField::DayOfQuarter),
            ValueRange::Fixed(1, 91));
  EXPECT_EQ(IsoFieldRange(Date(2011, 8, 10), IsoField::DayOfQuarter),
            ValueRange::Fixed(1, 92));
  EXPECT_STREQ(IsoFieldName(IsoField::DayOfQuarter), "DayOfQuarter");
}

TEST(Tempora_IsoFields, With)
{
  EXPECT_EQ(Unwrap(WithIsoField(Date(2012, 2, 29), IsoField::DayOfQuarter, 1)),
            Date(2012, 1, 1));
  EXPECT_EQ(Unwrap(WithIsoField(Date(2012, 2, 29), IsoField::DayOfQuarter, 91)),
            Date(2012, 3, 31));
  EXPECT_ERR_KIND(WithIsoField(Date(2011, 2, 28), IsoField::DayOfQuarter, 91),
                  InvalidValue);

  // The day-of-month is clamped.
  EXPECT_EQ(Unwrap(WithIsoField(Date(2012, 1, 31), IsoField::QuarterOfYear, 2)),
            Date(2012, 4, 30));
  EXPECT_ERR_KIND(WithIsoField(Date(2012, 1, 31), IsoField::QuarterOfYear, 5),
                  InvalidValue);

  EXPECT_EQ(Unwrap(WithIsoField(Date(2010, 1, 3),
                                IsoField::WeekOfWeekBasedYear, 1)),
            Date(2009, 1, 4));
  EXPECT_ERR_KIND(
      WithIsoField(Date(2010, 6, 1), IsoField::WeekOfWeekBasedYear, 53),
      InvalidValue);

  // The day-of-week is kept and week 53 becomes week 52.
  EXPECT_EQ(Unwrap(WithIsoField(Date(2009, 12, 31), IsoField::WeekBasedYear,
                                2010)),
            Date(2010, 12, 30));
  EXPECT_EQ(Unwrap(WithIsoField(Date(2010, 1, 3), IsoField::WeekBasedYear,
                                2015)),
            Date(2016, 1, 3));
  EXPECT_EQ(Unwrap(WithIsoField(Date(2012, 2, 29), IsoField::WeekBasedYear,
                                2011)),
            Date(2011, 3, 2));
}

TEST(Tempora_IsoFields, Units)
{
  EXPECT_EQ(Unwrap(PlusIsoUnit(Date(2012, 1, 31), 1, IsoUnit::QuarterYears)),
            Date(2012, 4, 30));
  EXPECT_EQ(Unwrap(PlusIsoUnit(Date(2012, 1, 31), -5, IsoUnit::QuarterYears)),
            Date(2010, 10, 31));
  EXPECT_EQ(Unwrap(PlusIsoUnit(Date(2012, 1, 1), 1000, IsoUnit::QuarterYears)),
            Date(2262, 1, 1));

  EXPECT_EQ(Unwrap(PlusIsoUnit(Date(2009, 12, 31), 1, IsoUnit::WeekBasedYears)),
            Date(2010, 12, 30));

  EXPECT_EQ(Unwrap(IsoUnitBetween(Date(2012, 1, 1), Date(2012, 6, 30),
                                  IsoUnit::QuarterYears)),
            1);
  EXPECT_EQ(Unwrap(IsoUnitBetween(Date(2012, 1, 1), Date(2011, 9, 30),
                                  IsoUnit::QuarterYears)),
            -1);
  EXPECT_EQ(Unwrap(IsoUnitBetween(Date(2008, 12, 28), Date(2010, 1, 3),
                                  IsoUnit::WeekBasedYears)),
            1);
  EXPECT_STREQ(IsoUnitName(IsoUnit::QuarterYears), "QuarterYears");
}

TEST(Tempora_JulianFields, Get)
{
  LocalDate epoch = LocalDate::Epoch();
  EXPECT_EQ(GetJulianField(epoch, JulianField::JulianDay), 2440588);
  EXPECT_EQ(GetJulianField(epoch, JulianField::ModifiedJulianDay), 40587);
  EXPECT_EQ(GetJulianField(epoch, JulianField::RataDie), 719163);
  EXPECT_EQ(GetJulianField(Date(1, 1, 1), JulianField::RataDie), 1);
  EXPECT_EQ(GetJulianField(Date(1858, 11, 17), JulianField::ModifiedJulianDay),
            0);
  EXPECT_EQ(GetJulianField(Date(2000, 1, 1), JulianField::JulianDay), 2451545);
}

TEST(Tempora_JulianFields, With)
{
  LocalDate epoch = LocalDate::Epoch();
  EXPECT_EQ(Unwrap(WithJulianField(epoch, JulianField::JulianDay, 2451545)),
            Date(2000, 1, 1));
  EXPECT_EQ(Unwrap(WithJulianField(epoch, JulianField::RataDie, 1)),
            Date(1, 1, 1));
  EXPECT_EQ(
      Unwrap(WithJulianField(epoch, JulianField::ModifiedJulianDay, 40587)),
      epoch);

  ValueRange range = JulianFieldRange(JulianField::JulianDay);
  EXPECT_EQ(range.getMinimum(), LocalDate::Min().toEpochDay() + 2440588);
  EXPECT_ERR_KIND(WithJulianField(epoch, JulianField::JulianDay,
                                  range.getMaximum() + 1),
                  InvalidValue);
}

}  // namespace tempora::test
