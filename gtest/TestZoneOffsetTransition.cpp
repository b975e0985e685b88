/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDateTime.h"
#include "tempora/zone/ZoneOffsetTransition.h"
#include "tempora/zone/ZoneOffsetTransitionRule.h"

namespace tempora::test {

using namespace tempora::zone;

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

TEST(Tempora_ZoneOffsetTransition, Gap)
{
  LocalDateTime local = Unwrap(LocalDateTime::Of(2008, 3, 30, 1, 0));
  ZoneOffsetTransition gap =
      Unwrap(ZoneOffsetTransition::Of(local, Hours(0), Hours(1)));

  EXPECT_TRUE(gap.isGap());
  EXPECT_FALSE(gap.isOverlap());
  EXPECT_EQ(gap.toEpochSecond(), 1206838800);
  EXPECT_EQ(gap.getInstant().getEpochSecond(), 1206838800);
  EXPECT_EQ(gap.getDateTimeBefore(), local);
  EXPECT_EQ(gap.getDateTimeAfter(),
            Unwrap(LocalDateTime::Of(2008, 3, 30, 2, 0)));
  EXPECT_EQ(gap.getDuration(), Duration::OfSeconds(3600));
  EXPECT_TRUE(gap.getValidOffsets().empty());
  EXPECT_FALSE(gap.isValidOffset(Hours(0)));
  EXPECT_FALSE(gap.isValidOffset(Hours(1)));
  EXPECT_EQ(gap.toString(), "Transition[Gap at 2008-03-30T01:00Z to +01:00]");
}

TEST(Tempora_ZoneOffsetTransition, Overlap)
{
  LocalDateTime local = Unwrap(LocalDateTime::Of(2008, 10, 26, 2, 0));
  ZoneOffsetTransition overlap =
      Unwrap(ZoneOffsetTransition::Of(local, Hours(2), Hours(1)));

  EXPECT_TRUE(overlap.isOverlap());
  EXPECT_EQ(overlap.getDateTimeAfter(),
            Unwrap(LocalDateTime::Of(2008, 10, 26, 1, 0)));
  EXPECT_EQ(overlap.getDuration(), Duration::OfSeconds(-3600));

  std::vector<ZoneOffset> offsets = overlap.getValidOffsets();
  ASSERT_EQ(offsets.size(), 2u);
  EXPECT_EQ(offsets[0], Hours(2));
  EXPECT_EQ(offsets[1], Hours(1));
  EXPECT_TRUE(overlap.isValidOffset(Hours(2)));
  EXPECT_TRUE(overlap.isValidOffset(Hours(1)));
  EXPECT_FALSE(overlap.isValidOffset(Hours(0)));
  EXPECT_EQ(overlap.toString(),
            "Transition[Overlap at 2008-10-26T02:00+02:00 to +01:00]");
}

TEST(Tempora_ZoneOffsetTransition, OfInvalid)
{
  LocalDateTime local = Unwrap(LocalDateTime::Of(2008, 3, 30, 1, 0));
  EXPECT_ERR_KIND(ZoneOffsetTransition::Of(local, Hours(1), Hours(1)),
                  InvalidValue);
  EXPECT_ERR_KIND(
      ZoneOffsetTransition::Of(
          Unwrap(LocalDateTime::Of(2008, 3, 30, 1, 0, 0, 5)), Hours(0),
          Hours(1)),
      InvalidValue);
  EXPECT_ERR_KIND(ZoneOffsetTransition::OfEpochSecond(0, Hours(2), Hours(2)),
                  InvalidValue);
}

TEST(Tempora_ZoneOffsetTransition, OfEpochSecondAndOrdering)
{
  ZoneOffsetTransition first =
      Unwrap(ZoneOffsetTransition::OfEpochSecond(1206838800, Hours(0),
                                                 Hours(1)));
  EXPECT_EQ(first.getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2008, 3, 30, 1, 0)));

  ZoneOffsetTransition second =
      Unwrap(ZoneOffsetTransition::OfEpochSecond(1224982800, Hours(1),
                                                 Hours(0)));
  EXPECT_LT(first.compareTo(second), 0);
  EXPECT_GT(second.compareTo(first), 0);
  EXPECT_EQ(first.compareTo(first), 0);
  EXPECT_NE(first, second);
}

TEST(Tempora_ZoneOffsetTransitionRule, LastSundayOfMarch)
{
  ZoneOffsetTransitionRule rule = Unwrap(ZoneOffsetTransitionRule::Of(
      Month::March, -1, DayOfWeek::Sunday, Unwrap(LocalTime::Of(1, 0)), false,
      TimeDefinition::UTC, Hours(1), Hours(1), Hours(2)));

  ZoneOffsetTransition transition = Unwrap(rule.createTransition(2008));
  EXPECT_EQ(transition.getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2008, 3, 30, 2, 0)));
  EXPECT_EQ(transition.getOffsetBefore(), Hours(1));
  EXPECT_EQ(transition.getOffsetAfter(), Hours(2));

  EXPECT_EQ(Unwrap(rule.createTransition(2009)).getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2009, 3, 29, 2, 0)));

  EXPECT_EQ(rule.toString(),
            "TransitionRule[Gap +01:00 to +02:00, SUNDAY on or before last "
            "day of MARCH at 01:00 UTC, standard offset +01:00]");
}

TEST(Tempora_ZoneOffsetTransitionRule, SecondSundayOfMarchWall)
{
  ZoneOffsetTransitionRule rule = Unwrap(ZoneOffsetTransitionRule::Of(
      Month::March, 8, DayOfWeek::Sunday, Unwrap(LocalTime::Of(2, 0)), false,
      TimeDefinition::Wall, Hours(-5), Hours(-5), Hours(-4)));

  EXPECT_EQ(Unwrap(rule.createTransition(2012)).getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2012, 3, 11, 2, 0)));
  EXPECT_EQ(Unwrap(rule.createTransition(2015)).getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2015, 3, 8, 2, 0)));
}

TEST(Tempora_ZoneOffsetTransitionRule, EndOfDay)
{
  ZoneOffsetTransitionRule rule = Unwrap(ZoneOffsetTransitionRule::Of(
      Month::October, 1, std::nullopt, LocalTime::Midnight(), true,
      TimeDefinition::Standard, Hours(0), Hours(1), Hours(0)));
  EXPECT_TRUE(rule.isMidnightEndOfDay());

  // Standard time is shifted by the one hour of saving in force before.
  EXPECT_EQ(Unwrap(rule.createTransition(2010)).getDateTimeBefore(),
            Unwrap(LocalDateTime::Of(2010, 10, 2, 1, 0)));
}

TEST(Tempora_ZoneOffsetTransitionRule, OfInvalid)
{
  LocalTime time = Unwrap(LocalTime::Of(1, 0));
  EXPECT_ERR_KIND(ZoneOffsetTransitionRule::Of(
                      Month::March, 0, std::nullopt, time, false,
                      TimeDefinition::Wall, Hours(0), Hours(0), Hours(1)),
                  InvalidValue);
  EXPECT_ERR_KIND(ZoneOffsetTransitionRule::Of(
                      Month::March, -29, std::nullopt, time, false,
                      TimeDefinition::Wall, Hours(0), Hours(0), Hours(1)),
                  InvalidValue);
  EXPECT_ERR_KIND(ZoneOffsetTransitionRule::Of(
                      Month::March, 1, std::nullopt, time, true,
                      TimeDefinition::Wall, Hours(0), Hours(0), Hours(1)),
                  InvalidValue);
}

}  // namespace tempora::test
