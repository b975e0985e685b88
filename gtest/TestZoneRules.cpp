/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDateTime.h"
#include "tempora/zone/ZoneRules.h"
#include "tempora/zone/ZoneRulesBuilder.h"

namespace tempora::test {

using namespace tempora::zone;

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

static LocalDateTime DateTime(int32_t aYear, int32_t aMonth, int32_t aDay,
                              int32_t aHour, int32_t aMinute) {
  return Unwrap(LocalDateTime::Of(aYear, aMonth, aDay, aHour, aMinute));
}

static Instant InstantAt(int32_t aYear, int32_t aMonth, int32_t aDay,
                         int32_t aHour, int32_t aMinute) {
  return Unwrap(
      DateTime(aYear, aMonth, aDay, aHour, aMinute).toInstant(Hours(0)));
}

// Western European rules from the last rules alone: summer time from the
// last Sunday of March to the last Sunday of October, both at 01:00 UTC.
static std::shared_ptr<const ZoneRules> WesternEuropeanRules() {
  LocalTime oneAm = Unwrap(LocalTime::Of(1, 0));
  std::vector<ZoneOffsetTransitionRule> lastRules = {
      Unwrap(ZoneOffsetTransitionRule::Of(
          Month::March, -1, DayOfWeek::Sunday, oneAm, false,
          TimeDefinition::UTC, Hours(0), Hours(0), Hours(1))),
      Unwrap(ZoneOffsetTransitionRule::Of(
          Month::October, -1, DayOfWeek::Sunday, oneAm, false,
          TimeDefinition::UTC, Hours(0), Hours(1), Hours(0))),
  };
  return Unwrap(ZoneRules::Of(Hours(0), Hours(0), {}, {}, lastRules));
}

TEST(Tempora_ZoneRules, Fixed)
{
  std::shared_ptr<const ZoneRules> rules = ZoneRules::Fixed(Hours(2));
  EXPECT_TRUE(rules->isFixedOffset());
  EXPECT_EQ(rules->toString(), "FixedRules:+02:00");
  EXPECT_EQ(rules->getOffset(Instant::Epoch()), Hours(2));
  EXPECT_EQ(rules->getOffset(DateTime(2008, 3, 30, 1, 30)), Hours(2));
  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 3, 30, 1, 30)),
            std::vector<ZoneOffset>{Hours(2)});
  EXPECT_FALSE(rules->getTransition(DateTime(2008, 3, 30, 1, 30)));
  EXPECT_FALSE(rules->nextTransition(Instant::Epoch()));
  EXPECT_FALSE(rules->previousTransition(Instant::Epoch()));
  EXPECT_FALSE(rules->isDaylightSavings(Instant::Epoch()));
  EXPECT_EQ(*rules, *ZoneRules::Fixed(Hours(2)));
  EXPECT_NE(*rules, *ZoneRules::Fixed(Hours(3)));
}

TEST(Tempora_ZoneRules, LastRulesOffsetAtInstant)
{
  std::shared_ptr<const ZoneRules> rules = WesternEuropeanRules();
  EXPECT_FALSE(rules->isFixedOffset());
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 1, 15, 0, 0)), Hours(0));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 6, 1, 0, 0)), Hours(1));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 3, 30, 0, 59)), Hours(0));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 3, 30, 1, 0)), Hours(1));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 10, 26, 0, 59)), Hours(1));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 10, 26, 1, 0)), Hours(0));

  EXPECT_TRUE(rules->isDaylightSavings(InstantAt(2008, 6, 1, 0, 0)));
  EXPECT_EQ(rules->getDaylightSavings(InstantAt(2008, 6, 1, 0, 0)),
            Duration::OfSeconds(3600));
  EXPECT_EQ(rules->getStandardOffset(InstantAt(2008, 6, 1, 0, 0)), Hours(0));
}

TEST(Tempora_ZoneRules, LastRulesOffsetAtLocal)
{
  std::shared_ptr<const ZoneRules> rules = WesternEuropeanRules();

  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 1, 15, 12, 0)),
            std::vector<ZoneOffset>{Hours(0)});
  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 6, 1, 12, 0)),
            std::vector<ZoneOffset>{Hours(1)});
  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 12, 1, 12, 0)),
            std::vector<ZoneOffset>{Hours(0)});

  LocalDateTime inGap = DateTime(2008, 3, 30, 1, 30);
  EXPECT_TRUE(rules->getValidOffsets(inGap).empty());
  EXPECT_EQ(rules->getOffset(inGap), Hours(0));
  std::optional<ZoneOffsetTransition> gap = rules->getTransition(inGap);
  ASSERT_TRUE(gap);
  EXPECT_TRUE(gap->isGap());
  EXPECT_EQ(gap->getDateTimeBefore(), DateTime(2008, 3, 30, 1, 0));
  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 3, 30, 2, 0)),
            std::vector<ZoneOffset>{Hours(1)});

  LocalDateTime inOverlap = DateTime(2008, 10, 26, 1, 30);
  std::vector<ZoneOffset> offsets = rules->getValidOffsets(inOverlap);
  ASSERT_EQ(offsets.size(), 2u);
  EXPECT_EQ(offsets[0], Hours(1));
  EXPECT_EQ(offsets[1], Hours(0));
  EXPECT_TRUE(rules->isValidOffset(inOverlap, Hours(0)));
  EXPECT_FALSE(rules->isValidOffset(inOverlap, Hours(2)));
  std::optional<ZoneOffsetTransition> overlap =
      rules->getTransition(inOverlap);
  ASSERT_TRUE(overlap);
  EXPECT_TRUE(overlap->isOverlap());
  EXPECT_EQ(rules->getValidOffsets(DateTime(2008, 10, 26, 2, 0)),
            std::vector<ZoneOffset>{Hours(0)});
}

TEST(Tempora_ZoneRules, NextAndPreviousTransition)
{
  std::shared_ptr<const ZoneRules> rules = WesternEuropeanRules();

  std::optional<ZoneOffsetTransition> next =
      rules->nextTransition(InstantAt(2008, 6, 1, 0, 0));
  ASSERT_TRUE(next);
  EXPECT_EQ(next->toEpochSecond(), 1224982800);

  next = rules->nextTransition(InstantAt(2008, 12, 1, 0, 0));
  ASSERT_TRUE(next);
  EXPECT_EQ(next->toEpochSecond(), 1238288400);

  std::optional<ZoneOffsetTransition> previous =
      rules->previousTransition(InstantAt(2008, 6, 1, 0, 0));
  ASSERT_TRUE(previous);
  EXPECT_EQ(previous->toEpochSecond(), 1206838800);

  previous = rules->previousTransition(InstantAt(2008, 1, 15, 0, 0));
  ASSERT_TRUE(previous);
  EXPECT_EQ(previous->toEpochSecond(), 1193533200);
}

TEST(Tempora_ZoneRules, HistoricTransitions)
{
  ZoneOffsetTransition gap = Unwrap(ZoneOffsetTransition::Of(
      DateTime(1990, 1, 1, 0, 0), Hours(0), Hours(1)));
  std::shared_ptr<const ZoneRules> rules =
      Unwrap(ZoneRules::Of(Hours(0), Hours(0), {gap}, {gap}, {}));

  EXPECT_FALSE(rules->isFixedOffset());
  EXPECT_EQ(rules->getOffset(DateTime(1989, 12, 31, 23, 59)), Hours(0));
  EXPECT_EQ(rules->getOffset(DateTime(1990, 1, 1, 1, 0)), Hours(1));
  EXPECT_TRUE(rules->getValidOffsets(DateTime(1990, 1, 1, 0, 30)).empty());
  EXPECT_EQ(rules->getStandardOffset(InstantAt(2000, 1, 1, 0, 0)), Hours(1));
  EXPECT_EQ(rules->getTransitions(), std::vector<ZoneOffsetTransition>{gap});
  EXPECT_TRUE(rules->getTransitionRules().empty());
  EXPECT_EQ(rules->toString(), "ZoneRules[currentStandardOffset=+01:00]");

  Instant at = gap.getInstant();
  EXPECT_EQ(rules->nextTransition(Unwrap(at.minusSeconds(1))), gap);
  EXPECT_FALSE(rules->nextTransition(at));
  EXPECT_FALSE(rules->previousTransition(at));
  EXPECT_EQ(rules->previousTransition(Unwrap(at.plusNanos(1))), gap);
}

TEST(Tempora_ZoneRules, InvalidLastRules)
{
  LocalTime time = Unwrap(LocalTime::Of(1, 0));
  ZoneOffsetTransitionRule sameOffsets = Unwrap(ZoneOffsetTransitionRule::Of(
      Month::March, 1, std::nullopt, time, false, TimeDefinition::Wall,
      Hours(0), Hours(1), Hours(1)));
  EXPECT_ERR_KIND(ZoneRules::Of(Hours(0), Hours(0), {}, {}, {sameOffsets}),
                  ZoneRulesData);

  ZoneOffsetTransitionRule notEveryYear = Unwrap(ZoneOffsetTransitionRule::Of(
      Month::February, 30, std::nullopt, time, false, TimeDefinition::Wall,
      Hours(0), Hours(0), Hours(1)));
  EXPECT_ERR_KIND(ZoneRules::Of(Hours(0), Hours(0), {}, {}, {notEveryYear}),
                  ZoneRulesData);

  EXPECT_ERR_KIND(ZoneRules::FromArrays({0}, {Hours(0)}, {}, {Hours(0)}, {}),
                  ZoneRulesData);
  EXPECT_ERR_KIND(ZoneRules::FromArrays({}, {Hours(0)}, {10, 5},
                                        {Hours(0), Hours(1), Hours(0)}, {}),
                  ZoneRulesData);
}

TEST(Tempora_ZoneRulesBuilder, RecurringRules)
{
  LocalTime oneAm = Unwrap(LocalTime::Of(1, 0));
  ZoneRulesBuilder builder;
  EXPECT_TRUE(builder.addWindowForever(Hours(0)).isOk());
  EXPECT_TRUE(builder
                  .addRuleToWindow(1996, LocalDate::MaxYear, Month::March, -1,
                                   DayOfWeek::Sunday, oneAm, false,
                                   TimeDefinition::UTC, 3600)
                  .isOk());
  EXPECT_TRUE(builder
                  .addRuleToWindow(1996, LocalDate::MaxYear, Month::October,
                                   -1, DayOfWeek::Sunday, oneAm, false,
                                   TimeDefinition::UTC, 0)
                  .isOk());

  std::shared_ptr<const ZoneRules> rules =
      Unwrap(builder.toRules("Test/Western"));

  // Two years are expanded into transitions, then the rules recur.
  std::vector<ZoneOffsetTransition> transitions = rules->getTransitions();
  ASSERT_EQ(transitions.size(), 4u);
  EXPECT_EQ(transitions[0].getDateTimeBefore(), DateTime(1996, 3, 31, 1, 0));
  EXPECT_EQ(transitions[1].getDateTimeBefore(), DateTime(1996, 10, 27, 2, 0));

  const std::vector<ZoneOffsetTransitionRule>& lastRules =
      rules->getTransitionRules();
  ASSERT_EQ(lastRules.size(), 2u);
  EXPECT_EQ(lastRules[0].getDayOfMonthIndicator(), 25);
  EXPECT_EQ(lastRules[0].getOffsetBefore(), Hours(0));
  EXPECT_EQ(lastRules[0].getOffsetAfter(), Hours(1));
  EXPECT_EQ(lastRules[1].getOffsetBefore(), Hours(1));

  EXPECT_EQ(rules->getOffset(InstantAt(1996, 6, 1, 0, 0)), Hours(1));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 6, 1, 0, 0)), Hours(1));
  EXPECT_EQ(rules->getOffset(InstantAt(2008, 12, 1, 0, 0)), Hours(0));

  std::optional<ZoneOffsetTransition> next =
      rules->nextTransition(InstantAt(1997, 11, 1, 0, 0));
  ASSERT_TRUE(next);
  EXPECT_EQ(next->getDateTimeBefore(), DateTime(1998, 3, 29, 1, 0));
}

TEST(Tempora_ZoneRulesBuilder, FixedSavingsWindows)
{
  ZoneRulesBuilder builder;
  EXPECT_TRUE(builder
                  .addWindow(Hours(1), DateTime(1980, 1, 1, 0, 0),
                             TimeDefinition::Wall)
                  .isOk());
  EXPECT_TRUE(builder.setFixedSavingsToWindow(3600).isOk());
  EXPECT_TRUE(builder.addWindowForever(Hours(2)).isOk());

  std::shared_ptr<const ZoneRules> rules = Unwrap(builder.toRules("Test/Fixed"));
  EXPECT_EQ(rules->getOffset(InstantAt(1970, 1, 1, 0, 0)), Hours(2));
  EXPECT_EQ(rules->getStandardOffset(InstantAt(1970, 1, 1, 0, 0)), Hours(1));
  EXPECT_TRUE(rules->isDaylightSavings(InstantAt(1970, 1, 1, 0, 0)));
  EXPECT_EQ(rules->getOffset(InstantAt(1990, 1, 1, 0, 0)), Hours(2));
  EXPECT_EQ(rules->getStandardOffset(InstantAt(1990, 1, 1, 0, 0)), Hours(2));
  EXPECT_FALSE(rules->isDaylightSavings(InstantAt(1990, 1, 1, 0, 0)));
  EXPECT_TRUE(rules->getTransitions().empty());
}

TEST(Tempora_ZoneRulesBuilder, InvalidState)
{
  LocalTime oneAm = Unwrap(LocalTime::Of(1, 0));
  ZoneRulesBuilder empty;
  EXPECT_ERR_KIND(empty.toRules("Test/Empty"), ZoneRulesData);
  EXPECT_ERR_KIND(empty.setFixedSavingsToWindow(3600), ZoneRulesData);
  EXPECT_ERR_KIND(empty.addRuleToWindow(2000, Month::March, 1, oneAm, false,
                                        TimeDefinition::Wall, 3600),
                  ZoneRulesData);

  ZoneRulesBuilder builder;
  EXPECT_TRUE(builder
                  .addWindow(Hours(0), DateTime(2000, 1, 1, 0, 0),
                             TimeDefinition::Wall)
                  .isOk());
  EXPECT_ERR_KIND(builder.addWindow(Hours(0), DateTime(1999, 1, 1, 0, 0),
                                    TimeDefinition::Wall),
                  ZoneRulesData);
  EXPECT_ERR_KIND(builder.addRuleToWindow(2000, Month::March, 0, oneAm, false,
                                          TimeDefinition::Wall, 3600),
                  InvalidValue);
  EXPECT_TRUE(builder
                  .addRuleToWindow(1990, Month::March, 1, oneAm, false,
                                   TimeDefinition::Wall, 3600)
                  .isOk());
  EXPECT_ERR_KIND(builder.setFixedSavingsToWindow(3600), ZoneRulesData);

  ZoneRulesBuilder single;
  EXPECT_TRUE(single.addWindowForever(Hours(0)).isOk());
  EXPECT_TRUE(single
                  .addRuleToWindow(2000, LocalDate::MaxYear, Month::March, -1,
                                   DayOfWeek::Sunday, oneAm, false,
                                   TimeDefinition::UTC, 3600)
                  .isOk());
  EXPECT_ERR_KIND(single.toRules("Test/Single"), ZoneRulesData);
}

}  // namespace tempora::test
