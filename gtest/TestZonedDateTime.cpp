/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/Period.h"
#include "tempora/ZonedDateTime.h"
#include "tempora/zone/ZoneRulesRegistry.h"

namespace tempora::test {

using namespace tempora::zone;

static ZoneId Zone(const char* aId) {
  return Unwrap(ZoneId::Of(aId, IcuRegistry()));
}

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

static LocalDateTime DateTime(int32_t aYear, int32_t aMonth, int32_t aDay,
                              int32_t aHour, int32_t aMinute) {
  return Unwrap(LocalDateTime::Of(aYear, aMonth, aDay, aHour, aMinute));
}

TEST(Tempora_ZonedDateTime, Of)
{
  ZonedDateTime dateTime =
      Unwrap(ZonedDateTime::Of(2008, 6, 1, 12, 0, 0, 0, Zone("Europe/London")));
  EXPECT_EQ(dateTime.getOffset(), Hours(1));
  EXPECT_EQ(dateTime.getZone().getId(), "Europe/London");
  EXPECT_EQ(dateTime.toString(), "2008-06-01T12:00+01:00[Europe/London]");
  EXPECT_EQ(dateTime.toEpochSecond(), 1212318000);

  ZonedDateTime winter =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 1, 15, 12, 0),
                               Zone("Europe/London")));
  EXPECT_EQ(winter.getOffset(), ZoneOffset::UTC());
  EXPECT_EQ(winter.toString(), "2008-01-15T12:00Z[Europe/London]");

  ZonedDateTime fixed =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 3, 30, 1, 30), Zone("+05:00")));
  EXPECT_EQ(fixed.toString(), "2008-03-30T01:30+05:00");
}

TEST(Tempora_ZonedDateTime, GapMovesForward)
{
  ZonedDateTime dateTime = Unwrap(ZonedDateTime::Of(
      DateTime(2008, 3, 30, 1, 30), Zone("Europe/London")));
  EXPECT_EQ(dateTime.toLocalDateTime(), DateTime(2008, 3, 30, 2, 30));
  EXPECT_EQ(dateTime.getOffset(), Hours(1));

  ZonedDateTime newYork = Unwrap(ZonedDateTime::Of(
      DateTime(2012, 3, 11, 2, 15), Zone("America/New_York")));
  EXPECT_EQ(newYork.toString(), "2012-03-11T03:15-04:00[America/New_York]");
}

TEST(Tempora_ZonedDateTime, OverlapPrefersEarlierOffset)
{
  ZoneId london = Zone("Europe/London");
  LocalDateTime local = DateTime(2008, 10, 26, 1, 30);

  ZonedDateTime earlier = Unwrap(ZonedDateTime::Of(local, london));
  EXPECT_EQ(earlier.getOffset(), Hours(1));

  ZonedDateTime later = earlier.withLaterOffsetAtOverlap();
  EXPECT_EQ(later.getOffset(), ZoneOffset::UTC());
  EXPECT_EQ(later.toLocalDateTime(), local);
  EXPECT_EQ(later.withEarlierOffsetAtOverlap(), earlier);
  EXPECT_EQ(later.toEpochSecond() - earlier.toEpochSecond(), 3600);

  EXPECT_EQ(
      Unwrap(ZonedDateTime::OfLocal(local, london, ZoneOffset::UTC())), later);
  EXPECT_EQ(Unwrap(ZonedDateTime::OfLocal(local, london, Hours(5))), earlier);
  EXPECT_EQ(Unwrap(earlier.with(ChronoField::OffsetSeconds, 0)), later);

  ZonedDateTime summer = Unwrap(ZonedDateTime::Of(
      DateTime(2008, 6, 1, 12, 0), london));
  EXPECT_EQ(summer.withLaterOffsetAtOverlap(), summer);
  EXPECT_EQ(Unwrap(summer.with(ChronoField::OffsetSeconds, 0)), summer);
}

TEST(Tempora_ZonedDateTime, OfStrict)
{
  ZoneId london = Zone("Europe/London");
  EXPECT_TRUE(ZonedDateTime::OfStrict(DateTime(2008, 6, 1, 12, 0), Hours(1),
                                      london)
                  .isOk());
  EXPECT_ERR_KIND(ZonedDateTime::OfStrict(DateTime(2008, 6, 1, 12, 0),
                                          ZoneOffset::UTC(), london),
                  InvalidOffset);
  EXPECT_ERR_KIND(ZonedDateTime::OfStrict(DateTime(2008, 3, 30, 1, 30),
                                          ZoneOffset::UTC(), london),
                  InvalidOffset);
  EXPECT_TRUE(ZonedDateTime::OfStrict(DateTime(2008, 10, 26, 1, 30),
                                      ZoneOffset::UTC(), london)
                  .isOk());
}

TEST(Tempora_ZonedDateTime, OfInstant)
{
  Instant instant = Unwrap(Instant::OfEpochSecond(1206838800));
  ZonedDateTime dateTime =
      Unwrap(ZonedDateTime::OfInstant(instant, Zone("Europe/London")));
  EXPECT_EQ(dateTime.toString(), "2008-03-30T02:00+01:00[Europe/London]");
  EXPECT_EQ(Unwrap(dateTime.toInstant()), instant);

  ZonedDateTime before = Unwrap(ZonedDateTime::OfInstant(
      Unwrap(instant.minusSeconds(1)), Zone("Europe/London")));
  EXPECT_EQ(before.toString(), "2008-03-30T00:59:59Z[Europe/London]");
}

TEST(Tempora_ZonedDateTime, PlusAcrossTransition)
{
  ZoneId london = Zone("Europe/London");
  ZonedDateTime start =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 3, 29, 12, 0), london));

  // Date units keep the local time, time units keep the elapsed time.
  ZonedDateTime nextDay = Unwrap(start.plusDays(1));
  EXPECT_EQ(nextDay.toString(), "2008-03-30T12:00+01:00[Europe/London]");
  ZonedDateTime dayLater = Unwrap(start.plusHours(24));
  EXPECT_EQ(dayLater.toString(), "2008-03-30T13:00+01:00[Europe/London]");
  EXPECT_EQ(Unwrap(start.plus(Period::OfDays(1))), nextDay);
  EXPECT_EQ(Unwrap(start.plus(Duration::OfSeconds(86400))), dayLater);

  EXPECT_EQ(Unwrap(start.until(nextDay, ChronoUnit::Hours)), 23);
  EXPECT_EQ(Unwrap(start.until(nextDay, ChronoUnit::Days)), 1);
  EXPECT_EQ(Unwrap(nextDay.minusDays(1)), start);

  ZonedDateTime beforeGap =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 3, 30, 0, 30), london));
  EXPECT_EQ(Unwrap(beforeGap.plusHours(1)).toLocalDateTime(),
            DateTime(2008, 3, 30, 2, 30));
}

TEST(Tempora_ZonedDateTime, WithZone)
{
  ZonedDateTime london =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 6, 1, 12, 0),
                               Zone("Europe/London")));

  ZonedDateTime paris = Unwrap(london.withZoneSameInstant(Zone("Europe/Paris")));
  EXPECT_EQ(paris.toString(), "2008-06-01T13:00+02:00[Europe/Paris]");
  EXPECT_TRUE(paris.isEqual(london));
  EXPECT_NE(paris, london);
  EXPECT_GT(paris.compareTo(london), 0);

  ZonedDateTime sameLocal =
      Unwrap(london.withZoneSameLocal(Zone("Europe/Paris")));
  EXPECT_EQ(sameLocal.toString(), "2008-06-01T12:00+02:00[Europe/Paris]");
  EXPECT_TRUE(sameLocal.isBefore(london));

  ZonedDateTime fixed = london.withFixedOffsetZone();
  EXPECT_EQ(fixed.toString(), "2008-06-01T12:00+01:00");
  EXPECT_TRUE(fixed.getZone().isOffset());
}

TEST(Tempora_ZonedDateTime, Fields)
{
  ZonedDateTime dateTime =
      Unwrap(ZonedDateTime::Of(DateTime(2008, 6, 1, 12, 0),
                               Zone("Europe/London")));
  EXPECT_EQ(Unwrap(dateTime.get(ChronoField::OffsetSeconds)), 3600);
  EXPECT_EQ(Unwrap(dateTime.get(ChronoField::HourOfDay)), 12);
  EXPECT_EQ(Unwrap(dateTime.getLong(ChronoField::InstantSeconds)),
            dateTime.toEpochSecond());
  EXPECT_ERR_KIND(dateTime.get(ChronoField::InstantSeconds), UnsupportedField);

  ZonedDateTime winter = Unwrap(dateTime.withMonth(1));
  EXPECT_EQ(winter.getOffset(), ZoneOffset::UTC());
  EXPECT_EQ(winter.getHour(), 12);
  EXPECT_ERR_KIND(dateTime.withMonth(13), InvalidValue);

  EXPECT_EQ(Unwrap(dateTime.truncatedTo(ChronoUnit::Days)).toString(),
            "2008-06-01T00:00+01:00[Europe/London]");
}

TEST(Tempora_ZonedDateTime, Parse)
{
  const ZoneRulesRegistry& registry = IcuRegistry();

  ZonedDateTime dateTime = Unwrap(ZonedDateTime::Parse(
      "2008-06-01T12:00+01:00[Europe/London]", registry));
  EXPECT_EQ(dateTime.getZone().getId(), "Europe/London");
  EXPECT_EQ(dateTime.getOffset(), Hours(1));

  ZonedDateTime fixed =
      Unwrap(ZonedDateTime::Parse("2008-06-01T12:00:30-03:00", registry));
  EXPECT_TRUE(fixed.getZone().isOffset());
  EXPECT_EQ(fixed.toString(), "2008-06-01T12:00:30-03:00");

  ZonedDateTime overlap = Unwrap(ZonedDateTime::Parse(
      "2008-10-26T01:30Z[Europe/London]", registry));
  EXPECT_EQ(overlap.getOffset(), ZoneOffset::UTC());

  EXPECT_ERR_KIND(
      ZonedDateTime::Parse("2008-06-01T12:00Z[Europe/London]", registry),
      Parse);
  EXPECT_ERR_KIND(
      ZonedDateTime::Parse("2008-06-01T12:00+01:00[Not/AZone]", registry),
      Parse);
  EXPECT_ERR_KIND(ZonedDateTime::Parse("2008-06-01T12:00+01:00[]", registry),
                  Parse);
  EXPECT_ERR_KIND(ZonedDateTime::Parse("2008-06-01T12:00[Europe/London]",
                                       registry),
                  Parse);
}

}  // namespace tempora::test
