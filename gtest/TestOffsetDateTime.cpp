/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Instant.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/OffsetTime.h"

namespace tempora::test {

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

TEST(Tempora_OffsetDateTime, Of)
{
  OffsetDateTime dateTime =
      Unwrap(OffsetDateTime::Of(2012, 10, 29, 10, 15, 0, 0, Hours(1)));
  EXPECT_EQ(dateTime.getYear(), 2012);
  EXPECT_EQ(dateTime.getOffset(), Hours(1));
  EXPECT_EQ(dateTime.toEpochSecond(), 1351502100);
  EXPECT_EQ(dateTime.toString(), "2012-10-29T10:15+01:00");
  EXPECT_ERR_KIND(OffsetDateTime::Of(2012, 2, 30, 0, 0, 0, 0, Hours(1)),
                  InvalidValue);
}

TEST(Tempora_OffsetDateTime, OfInstant)
{
  Instant instant = Unwrap(Instant::OfEpochSecond(1351502100));
  OffsetDateTime dateTime =
      Unwrap(OffsetDateTime::OfInstant(instant, Hours(-5)));
  EXPECT_EQ(dateTime.toString(), "2012-10-29T04:15-05:00");
  EXPECT_EQ(Unwrap(dateTime.toInstant()), instant);
}

TEST(Tempora_OffsetDateTime, WithOffset)
{
  OffsetDateTime dateTime =
      Unwrap(OffsetDateTime::Of(2012, 10, 29, 10, 15, 0, 0, Hours(1)));

  OffsetDateTime sameLocal = dateTime.withOffsetSameLocal(Hours(3));
  EXPECT_EQ(sameLocal.toLocalDateTime(), dateTime.toLocalDateTime());
  EXPECT_EQ(sameLocal.toEpochSecond(), dateTime.toEpochSecond() - 7200);

  OffsetDateTime sameInstant =
      Unwrap(dateTime.withOffsetSameInstant(Hours(-11)));
  EXPECT_EQ(sameInstant.toString(), "2012-10-28T22:15-11:00");
  EXPECT_TRUE(sameInstant.isEqual(dateTime));
  EXPECT_NE(sameInstant, dateTime);
}

TEST(Tempora_OffsetDateTime, CompareByInstantThenLocal)
{
  OffsetDateTime a =
      Unwrap(OffsetDateTime::Of(2008, 6, 30, 11, 30, 59, 0, Hours(0)));
  OffsetDateTime b =
      Unwrap(OffsetDateTime::Of(2008, 6, 30, 12, 30, 59, 0, Hours(1)));
  EXPECT_TRUE(a.isEqual(b));
  EXPECT_FALSE(a.isBefore(b));
  EXPECT_LT(a.compareTo(b), 0);
  EXPECT_GT(b.compareTo(a), 0);

  OffsetDateTime c =
      Unwrap(OffsetDateTime::Of(2008, 6, 30, 11, 30, 0, 0, Hours(-1)));
  EXPECT_TRUE(a.isBefore(c));
  EXPECT_LT(a.compareTo(c), 0);
}

TEST(Tempora_OffsetDateTime, Plus)
{
  OffsetDateTime dateTime =
      Unwrap(OffsetDateTime::Of(2012, 12, 31, 23, 0, 0, 0, Hours(2)));
  OffsetDateTime later = Unwrap(dateTime.plusHours(2));
  EXPECT_EQ(later.toString(), "2013-01-01T01:00+02:00");
  EXPECT_EQ(Unwrap(dateTime.until(later, ChronoUnit::Minutes)), 120);
  EXPECT_EQ(Unwrap(dateTime.with(ChronoField::OffsetSeconds, 0)).toString(),
            "2012-12-31T23:00Z");
}

TEST(Tempora_OffsetDateTime, Parse)
{
  OffsetDateTime dateTime =
      Unwrap(OffsetDateTime::Parse("2012-10-29T10:15:30-03:30"));
  EXPECT_EQ(dateTime.getOffset().getTotalSeconds(), -12600);
  EXPECT_EQ(dateTime.toString(), "2012-10-29T10:15:30-03:30");
  EXPECT_EQ(Unwrap(OffsetDateTime::Parse("2012-10-29T10:15Z")).getOffset(),
            ZoneOffset::UTC());
  EXPECT_ERR_KIND(OffsetDateTime::Parse("2012-10-29T10:15"), Parse);
  EXPECT_ERR_KIND(OffsetDateTime::Parse("2012-10-29T10:15+19:00"), Parse);
}

TEST(Tempora_OffsetTime, CompareByUtcNanoOfDay)
{
  OffsetTime a = Unwrap(OffsetTime::Of(11, 30, 0, 0, Hours(0)));
  OffsetTime b = Unwrap(OffsetTime::Of(12, 30, 0, 0, Hours(1)));
  EXPECT_TRUE(a.isEqual(b));
  EXPECT_LT(a.compareTo(b), 0);

  OffsetTime c = Unwrap(OffsetTime::Of(10, 0, 0, 0, Hours(-2)));
  EXPECT_TRUE(c.isAfter(a));
}

TEST(Tempora_OffsetTime, Fields)
{
  OffsetTime time = Unwrap(OffsetTime::Of(10, 15, 30, 0, Hours(1)));
  EXPECT_EQ(time.toString(), "10:15:30+01:00");
  EXPECT_EQ(Unwrap(time.get(ChronoField::OffsetSeconds)), 3600);
  EXPECT_EQ(Unwrap(time.get(ChronoField::MinuteOfHour)), 15);
  EXPECT_ERR_KIND(time.range(ChronoField::Year), UnsupportedField);
  EXPECT_ERR_KIND(time.get(ChronoField::DayOfMonth), UnsupportedField);

  EXPECT_EQ(time.withOffsetSameInstant(Hours(3)).toString(), "12:15:30+03:00");
  EXPECT_EQ(time.plusHours(15).toString(), "01:15:30+01:00");
  EXPECT_EQ(Unwrap(OffsetTime::Parse("10:15:30+01:00")), time);
}

}  // namespace tempora::test
