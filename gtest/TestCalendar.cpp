/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <vector>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Clock.h"
#include "tempora/LocalDate.h"
#include "tempora/TemporalAdjusters.h"
#include "tempora/calendar/ChronoDate.h"
#include "tempora/calendar/Chronology.h"

namespace tempora::test {

using namespace tempora::calendar;

static LocalDate Date(int32_t aYear, int32_t aMonth, int32_t aDay) {
  return Unwrap(LocalDate::Of(aYear, aMonth, aDay));
}

TEST(Tempora_Chronology, Lookup)
{
  EXPECT_EQ(Unwrap(Chronology::Of("Minguo")), Chronology::Minguo());
  EXPECT_EQ(Unwrap(Chronology::Of("roc")), Chronology::Minguo());
  EXPECT_EQ(Unwrap(Chronology::Of("buddhist")), Chronology::ThaiBuddhist());
  EXPECT_EQ(Unwrap(Chronology::Of("islamic-civil")), Chronology::Hijrah());
  EXPECT_EQ(Unwrap(Chronology::Of("ISO")), Chronology::Iso());
  EXPECT_ERR_KIND(Chronology::Of("Coptic"), InvalidValue);

  EXPECT_EQ(Chronology::AvailableChronologies().size(), 5u);
  EXPECT_STREQ(Chronology::Japanese().getCalendarType(), "japanese");
  EXPECT_EQ(Chronology::ThaiBuddhist().toString(), "ThaiBuddhist");
}

TEST(Tempora_Chronology, Minguo)
{
  Chronology minguo = Chronology::Minguo();
  ChronoDate date = Unwrap(minguo.date(101, 10, 29));
  EXPECT_EQ(date.toLocalDate(), Date(2012, 10, 29));
  EXPECT_EQ(date.toString(), "Minguo ROC 101-10-29");
  EXPECT_EQ(date.getEra(), MinguoRoc);
  EXPECT_TRUE(date.isLeapYear());
  EXPECT_EQ(Unwrap(minguo.date(1, 1, 1)).toLocalDate(), Date(1912, 1, 1));

  ChronoDate beforeRoc = Unwrap(minguo.date(Date(1911, 6, 1)));
  EXPECT_EQ(beforeRoc.getProlepticYear(), 0);
  EXPECT_EQ(beforeRoc.getEra(), MinguoBeforeRoc);
  EXPECT_EQ(beforeRoc.getYearOfEra(), 1);
  EXPECT_EQ(beforeRoc.toString(), "Minguo BEFORE_ROC 1-06-01");
  EXPECT_EQ(Unwrap(minguo.date(MinguoBeforeRoc, 1, 6, 1)), beforeRoc);

  EXPECT_EQ(Unwrap(minguo.dateYearDay(MinguoRoc, 101, 60)).toLocalDate(),
            Date(2012, 2, 29));
  EXPECT_ERR_KIND(minguo.date(101, 2, 30), InvalidValue);
  EXPECT_ERR_KIND(minguo.date(IsoCe, 101, 1, 1), InvalidValue);
}

TEST(Tempora_Chronology, ThaiBuddhist)
{
  ChronoDate date = Unwrap(Chronology::ThaiBuddhist().date(Date(2012, 10, 29)));
  EXPECT_EQ(date.getProlepticYear(), 2555);
  EXPECT_EQ(date.toString(), "ThaiBuddhist BE 2555-10-29");
  EXPECT_EQ(Unwrap(date.get(ChronoField::YearOfEra)), 2555);
  EXPECT_EQ(Unwrap(date.getLong(ChronoField::ProlepticMonth)),
            2555 * 12 + 9);
  EXPECT_TRUE(Chronology::ThaiBuddhist().isLeapYear(2555));
  EXPECT_FALSE(Chronology::ThaiBuddhist().isLeapYear(2556));
}

TEST(Tempora_Chronology, Japanese)
{
  Chronology japanese = Chronology::Japanese();
  ChronoDate date = Unwrap(japanese.date(Date(2012, 10, 29)));
  EXPECT_EQ(date.getEra(), JapaneseHeisei);
  EXPECT_EQ(date.getYearOfEra(), 24);
  EXPECT_EQ(date.getProlepticYear(), 2012);
  EXPECT_EQ(date.toString(), "Japanese Heisei 24-10-29");
  EXPECT_EQ(Unwrap(date.get(ChronoField::Era)), 2);
  EXPECT_EQ(Unwrap(japanese.date(JapaneseHeisei, 24, 10, 29)), date);

  // Heisei began on 1989-01-08.
  ChronoDate lastShowa = Unwrap(japanese.date(Date(1989, 1, 7)));
  EXPECT_EQ(lastShowa.getEra(), JapaneseShowa);
  EXPECT_EQ(lastShowa.getYearOfEra(), 64);
  EXPECT_ERR_KIND(japanese.date(JapaneseHeisei, 1, 1, 1), InvalidValue);

  EXPECT_EQ(Unwrap(japanese.date(Date(2019, 5, 1))).getEra(), JapaneseReiwa);
  EXPECT_EQ(JapaneseEraOf(Date(1920, 1, 1)), JapaneseTaisho);
  EXPECT_EQ(
      Unwrap(Unwrap(japanese.date(Date(1920, 1, 1))).range(
          ChronoField::YearOfEra)),
      ValueRange::Fixed(1, 15));

  ChronoDate showa = Unwrap(japanese.date(Date(1988, 6, 1)));
  ChronoDate nextYear = Unwrap(showa.plus(1, ChronoUnit::Years));
  EXPECT_EQ(nextYear.getEra(), JapaneseHeisei);
  EXPECT_EQ(nextYear.getYearOfEra(), 1);

  EXPECT_ERR_KIND(japanese.date(Date(1868, 9, 7)), InvalidValue);
  EXPECT_ERR_KIND(japanese.eraOf(4), InvalidValue);
}

TEST(Tempora_Chronology, JapaneseMinimumDate)
{
  Chronology japanese = Chronology::Japanese();
  DateTimeResult<ChronoDate> tooEarly = japanese.date(Date(1872, 12, 31));
  ASSERT_TRUE(tooEarly.isErr());
  EXPECT_EQ(tooEarly.inspectErr().kind(), DateTimeError::Kind::InvalidValue);
  EXPECT_EQ(tooEarly.inspectErr().message(),
            "Minimum supported date is January 1st Meiji 6");

  ChronoDate first = Unwrap(japanese.date(Date(1873, 1, 1)));
  EXPECT_EQ(first.toString(), "Japanese Meiji 6-01-01");
  EXPECT_EQ(japanese.range(ChronoField::Year).getMinimum(), 1873);

  EXPECT_ERR_KIND(japanese.date(1872, 12, 31), InvalidValue);
  EXPECT_ERR_KIND(japanese.date(JapaneseMeiji, 5, 12, 31), InvalidValue);
  EXPECT_ERR_KIND(japanese.dateYearDay(1872, 366), InvalidValue);
  EXPECT_ERR_KIND(japanese.dateEpochDay(Date(1872, 12, 31).toEpochDay()),
                  InvalidValue);
  EXPECT_ERR_KIND(first.minus(1, ChronoUnit::Days), InvalidValue);
  EXPECT_ERR_KIND(first.with(ChronoField::YearOfEra, 5), InvalidValue);
  EXPECT_ERR_KIND(Unwrap(japanese.date(Date(1873, 6, 1)))
                      .plus(-1, ChronoUnit::Years),
                  InvalidValue);
}

TEST(Tempora_Chronology, JapaneseDayOfYear)
{
  Chronology japanese = Chronology::Japanese();

  // The day-of-year restarts with each era.
  ChronoDate heiseiStart = Unwrap(japanese.date(Date(1989, 1, 8)));
  EXPECT_EQ(heiseiStart.getDayOfYear(), 1);
  EXPECT_EQ(Unwrap(heiseiStart.get(ChronoField::DayOfYear)), 1);
  EXPECT_EQ(heiseiStart.lengthOfYear(), 358);
  EXPECT_EQ(Unwrap(heiseiStart.range(ChronoField::DayOfYear)),
            ValueRange::Fixed(1, 358));

  ChronoDate showaEnd = Unwrap(japanese.date(Date(1989, 1, 5)));
  EXPECT_EQ(showaEnd.getDayOfYear(), 5);
  EXPECT_EQ(Unwrap(showaEnd.range(ChronoField::DayOfYear)),
            ValueRange::Fixed(1, 7));
  EXPECT_EQ(Unwrap(showaEnd.with(LastDayOfYear())).toLocalDate(),
            Date(1989, 1, 7));
  EXPECT_ERR_KIND(showaEnd.with(ChronoField::DayOfYear, 8), InvalidValue);

  ChronoDate showaStart = Unwrap(japanese.date(Date(1926, 12, 25)));
  EXPECT_EQ(showaStart.getDayOfYear(), 1);
  EXPECT_EQ(showaStart.lengthOfYear(), 7);
  EXPECT_EQ(japanese.range(ChronoField::DayOfYear),
            ValueRange::Fixed(1, 7, 366));

  // Later years of an era count from January 1st.
  EXPECT_EQ(Unwrap(japanese.date(Date(1990, 2, 1))).getDayOfYear(), 32);

  EXPECT_EQ(Unwrap(heiseiStart.with(ChronoField::DayOfYear, 10)).toLocalDate(),
            Date(1989, 1, 17));

  EXPECT_EQ(Unwrap(japanese.dateYearDay(JapaneseHeisei, 1, 1)).toLocalDate(),
            Date(1989, 1, 8));
  EXPECT_EQ(Unwrap(japanese.dateYearDay(JapaneseHeisei, 1, 358)).toLocalDate(),
            Date(1989, 12, 31));
  EXPECT_EQ(Unwrap(japanese.dateYearDay(JapaneseHeisei, 2, 1)).toLocalDate(),
            Date(1990, 1, 1));
  EXPECT_EQ(Unwrap(japanese.dateYearDay(JapaneseShowa, 64, 7)).toLocalDate(),
            Date(1989, 1, 7));
  EXPECT_ERR_KIND(japanese.dateYearDay(JapaneseHeisei, 1, 359), InvalidValue);
  EXPECT_ERR_KIND(japanese.dateYearDay(JapaneseShowa, 64, 8), InvalidValue);

  // The ISO day-of-year is used by the proleptic-year factory.
  EXPECT_EQ(Unwrap(japanese.dateYearDay(1989, 8)).toLocalDate(),
            Date(1989, 1, 8));

  EXPECT_FALSE(heiseiStart.isSupported(ChronoField::AlignedWeekOfYear));
  EXPECT_ERR_KIND(heiseiStart.getLong(ChronoField::AlignedWeekOfYear),
                  UnsupportedField);
}

TEST(Tempora_Chronology, Hijrah)
{
  Chronology hijrah = Chronology::Hijrah();
  ChronoDate first = Unwrap(hijrah.date(1, 1, 1));
  EXPECT_EQ(first.toLocalDate(), Date(622, 7, 19));
  EXPECT_EQ(first.toEpochDay(), -492148);
  EXPECT_EQ(first.getEra(), HijrahAh);

  ChronoDate date = Unwrap(hijrah.date(Date(2012, 10, 29)));
  EXPECT_EQ(date.toString(), "Hijrah AH 1433-12-13");
  EXPECT_EQ(date.lengthOfMonth(), 29);
  EXPECT_EQ(date.lengthOfYear(), 354);
  EXPECT_EQ(date.getDayOfYear(), 338);
  EXPECT_EQ(Unwrap(hijrah.date(1433, 1, 1)).toLocalDate(), Date(2011, 11, 27));

  EXPECT_TRUE(hijrah.isLeapYear(2));
  EXPECT_TRUE(hijrah.isLeapYear(1434));
  EXPECT_FALSE(hijrah.isLeapYear(1433));
  EXPECT_EQ(Unwrap(hijrah.date(1434, 12, 30)).lengthOfYear(), 355);
  EXPECT_ERR_KIND(hijrah.date(1433, 12, 30), InvalidValue);

  // Months are clamped to the length of the target month.
  ChronoDate endOfMuharram = Unwrap(hijrah.date(1433, 1, 30));
  ChronoDate clamped = Unwrap(endOfMuharram.plus(11, ChronoUnit::Months));
  EXPECT_EQ(clamped.getMonthValue(), 12);
  EXPECT_EQ(clamped.getDayOfMonth(), 29);
  EXPECT_EQ(Unwrap(clamped.with(ChronoField::DayOfMonth, 1)).getDayOfMonth(),
            1);
}

TEST(Tempora_Chronology, HijrahBeforeAh)
{
  Chronology hijrah = Chronology::Hijrah();
  EXPECT_EQ(hijrah.eras(), (std::vector<Era>{HijrahBeforeAh, HijrahAh}));
  EXPECT_EQ(Unwrap(hijrah.eraOf(0)), HijrahBeforeAh);
  EXPECT_STREQ(HijrahBeforeAh.name(), "BEFORE_AH");
  EXPECT_EQ(Unwrap(hijrah.prolepticYear(HijrahBeforeAh, 24)), -23);

  // The day before 1 Muharram 1 AH.
  ChronoDate lastBefore = Unwrap(hijrah.date(Date(622, 7, 18)));
  EXPECT_EQ(lastBefore.getEra(), HijrahBeforeAh);
  EXPECT_EQ(lastBefore.getProlepticYear(), 0);
  EXPECT_EQ(lastBefore.getYearOfEra(), 1);
  EXPECT_EQ(lastBefore.toString(), "Hijrah BEFORE_AH 1-12-29");
  EXPECT_EQ(lastBefore.getDayOfYear(), 354);
  EXPECT_EQ(Unwrap(lastBefore.plus(1, ChronoUnit::Days)),
            Unwrap(hijrah.date(1, 1, 1)));

  ChronoDate date = Unwrap(hijrah.date(Date(600, 1, 1)));
  EXPECT_EQ(date.toString(), "Hijrah BEFORE_AH 24-10-06");
  EXPECT_EQ(Unwrap(date.getLong(ChronoField::Era)), 0);
  EXPECT_EQ(Unwrap(date.get(ChronoField::YearOfEra)), 24);
  EXPECT_EQ(Unwrap(date.getLong(ChronoField::Year)), -23);
  EXPECT_EQ(Unwrap(hijrah.date(HijrahBeforeAh, 24, 10, 6)), date);
  EXPECT_EQ(Unwrap(hijrah.date(-23, 10, 6)), date);
  EXPECT_EQ(Unwrap(hijrah.dateYearDay(HijrahBeforeAh, 24, 272)), date);

  ChronoDate flipped = Unwrap(date.with(ChronoField::Era, 1));
  EXPECT_EQ(flipped.toString(), "Hijrah AH 24-10-06");
  EXPECT_EQ(Unwrap(flipped.with(ChronoField::Era, 0)), date);
  EXPECT_EQ(Unwrap(date.with(ChronoField::YearOfEra, 1)).toString(),
            "Hijrah BEFORE_AH 1-10-06");

  EXPECT_EQ(hijrah.range(ChronoField::Year), ValueRange::Fixed(-9998, 9999));
  EXPECT_EQ(hijrah.range(ChronoField::Era), ValueRange::Fixed(0, 1));
  ChronoDate earliest = Unwrap(hijrah.date(HijrahBeforeAh, 9999, 1, 1));
  EXPECT_EQ(earliest.toEpochDay(),
            hijrah.range(ChronoField::EpochDay).getMinimum());
  EXPECT_ERR_KIND(earliest.minus(1, ChronoUnit::Days), InvalidValue);
  EXPECT_ERR_KIND(hijrah.date(HijrahBeforeAh, 10000, 1, 1), InvalidValue);
}

TEST(Tempora_Chronology, FieldsAndComparison)
{
  ChronoDate minguo = Unwrap(Chronology::Minguo().date(101, 10, 29));
  ChronoDate iso = Unwrap(Chronology::Iso().date(Date(2012, 10, 29)));
  EXPECT_TRUE(minguo.isEqual(iso));
  EXPECT_NE(minguo, iso);
  EXPECT_EQ(iso.toString(), "2012-10-29");

  ChronoDate earlier = Unwrap(minguo.with(ChronoField::Year, 100));
  EXPECT_EQ(earlier.toLocalDate(), Date(2011, 10, 29));
  EXPECT_TRUE(earlier.isBefore(minguo));

  ChronoDate otherEra = Unwrap(minguo.with(ChronoField::Era, 0));
  EXPECT_EQ(otherEra.getEra(), MinguoBeforeRoc);
  EXPECT_EQ(otherEra.getYearOfEra(), 101);

  EXPECT_EQ(Unwrap(minguo.plus(1, ChronoUnit::Months)).toString(),
            "Minguo ROC 101-11-29");
  EXPECT_EQ(Unwrap(minguo.minus(1, ChronoUnit::Decades)).toString(),
            "Minguo ROC 91-10-29");
  EXPECT_ERR_KIND(minguo.plus(1, ChronoUnit::Hours), UnsupportedField);
  EXPECT_ERR_KIND(minguo.get(ChronoField::HourOfDay), UnsupportedField);
}

TEST(Tempora_Chronology, Adjusters)
{
  ChronoDate hijrah = Unwrap(Chronology::Hijrah().date(Date(2012, 10, 29)));
  EXPECT_EQ(Unwrap(hijrah.with(LastDayOfMonth())).toString(),
            "Hijrah AH 1433-12-29");
  EXPECT_EQ(Unwrap(hijrah.with(LastDayOfYear())).toString(),
            "Hijrah AH 1433-12-29");
  EXPECT_EQ(Unwrap(hijrah.with(FirstDayOfNextMonth())).toString(),
            "Hijrah AH 1434-01-01");

  ChronoDate minguo = Unwrap(Chronology::Minguo().date(101, 2, 15));
  EXPECT_EQ(Unwrap(minguo.with(LastDayOfMonth())).toString(),
            "Minguo ROC 101-02-29");
  EXPECT_EQ(Unwrap(minguo.with(Next(DayOfWeek::Monday))).toString(),
            "Minguo ROC 101-02-20");
}

TEST(Tempora_Chronology, DateNow)
{
  std::unique_ptr<Clock> clock =
      Clock::Fixed(Unwrap(Instant::OfEpochSecond(1351468800)),
                   ZoneId::Of(ZoneOffset::UTC()));
  ChronoDate date = Unwrap(Chronology::Minguo().dateNow(*clock));
  EXPECT_EQ(date.toString(), "Minguo ROC 101-10-29");
}

}  // namespace tempora::test
