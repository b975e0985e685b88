/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDateTime.h"
#include "tempora/zone/IcuZoneRulesProvider.h"

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
  return Unwrap(DateTime(aYear, aMonth, aDay, aHour, aMinute)
                    .toInstant(ZoneOffset::UTC()));
}

TEST(Tempora_IcuZoneRules, London)
{
  ZoneRulesPtr london = Unwrap(IcuZoneRulesProvider::BuildRules("Europe/London"));
  EXPECT_FALSE(london->isFixedOffset());
  EXPECT_EQ(london->getOffset(InstantAt(2008, 1, 15, 12, 0)), Hours(0));
  EXPECT_EQ(london->getOffset(InstantAt(2008, 6, 1, 12, 0)), Hours(1));
  EXPECT_EQ(london->getOffset(InstantAt(2100, 7, 1, 12, 0)), Hours(1));
  EXPECT_EQ(london->getOffset(InstantAt(2100, 12, 1, 12, 0)), Hours(0));

  // British Standard Time kept summer time as the standard offset.
  EXPECT_EQ(london->getStandardOffset(InstantAt(1970, 1, 1, 0, 0)), Hours(1));
  EXPECT_EQ(london->getStandardOffset(InstantAt(2008, 6, 1, 0, 0)), Hours(0));
  EXPECT_TRUE(london->isDaylightSavings(InstantAt(2008, 6, 1, 0, 0)));

  EXPECT_EQ(london->getTransitionRules().size(), 2u);
}

TEST(Tempora_IcuZoneRules, LondonGapAndOverlap)
{
  ZoneRulesPtr london = Unwrap(IcuZoneRulesProvider::BuildRules("Europe/London"));

  LocalDateTime inGap = DateTime(2008, 3, 30, 1, 30);
  EXPECT_TRUE(london->getValidOffsets(inGap).empty());
  std::optional<ZoneOffsetTransition> gap = london->getTransition(inGap);
  ASSERT_TRUE(gap);
  EXPECT_EQ(gap->toEpochSecond(), 1206838800);
  EXPECT_EQ(gap->getOffsetBefore(), Hours(0));
  EXPECT_EQ(gap->getOffsetAfter(), Hours(1));

  LocalDateTime inOverlap = DateTime(2008, 10, 26, 1, 30);
  std::vector<ZoneOffset> offsets = london->getValidOffsets(inOverlap);
  ASSERT_EQ(offsets.size(), 2u);
  EXPECT_EQ(offsets[0], Hours(1));
  EXPECT_EQ(offsets[1], Hours(0));
}

TEST(Tempora_IcuZoneRules, NewYork)
{
  ZoneRulesPtr newYork =
      Unwrap(IcuZoneRulesProvider::BuildRules("America/New_York"));
  EXPECT_EQ(newYork->getOffset(InstantAt(2012, 1, 1, 12, 0)), Hours(-5));
  EXPECT_EQ(newYork->getOffset(InstantAt(2012, 7, 1, 12, 0)), Hours(-4));
  EXPECT_TRUE(newYork->getValidOffsets(DateTime(2012, 3, 11, 2, 30)).empty());

  std::optional<ZoneOffsetTransition> next =
      newYork->nextTransition(InstantAt(2012, 6, 1, 0, 0));
  ASSERT_TRUE(next);
  EXPECT_EQ(next->toEpochSecond(), 1352008800);
  EXPECT_TRUE(next->isOverlap());

  std::optional<ZoneOffsetTransition> previous =
      newYork->previousTransition(InstantAt(2012, 6, 1, 0, 0));
  ASSERT_TRUE(previous);
  EXPECT_EQ(previous->getDateTimeBefore(), DateTime(2012, 3, 11, 2, 0));
}

TEST(Tempora_IcuZoneRules, Paris)
{
  ZoneRulesPtr paris = Unwrap(IcuZoneRulesProvider::BuildRules("Europe/Paris"));
  EXPECT_EQ(paris->getOffset(InstantAt(1970, 1, 1, 0, 0)), Hours(1));
  EXPECT_EQ(paris->getOffset(InstantAt(2024, 7, 1, 0, 0)), Hours(2));
  EXPECT_EQ(paris->getStandardOffset(InstantAt(2024, 7, 1, 0, 0)), Hours(1));
}

TEST(Tempora_IcuZoneRules, UnknownZone)
{
  EXPECT_ERR_KIND(IcuZoneRulesProvider::BuildRules("Not/AZone"), UnknownZone);
}

TEST(Tempora_IcuZoneRulesProvider, Provide)
{
  std::unique_ptr<IcuZoneRulesProvider> provider =
      Unwrap(IcuZoneRulesProvider::Create({"Europe/Paris"}));
  EXPECT_STREQ(provider->name(), "ICU");
  EXPECT_FALSE(provider->version().empty());

  std::set<std::string> ids = provider->provideZoneIds();
  EXPECT_EQ(ids.count("Europe/London"), 1u);
  EXPECT_EQ(ids.count("Europe/Paris"), 0u);
  for (const std::string& id : ids) {
    EXPECT_NE(id.rfind("SystemV/", 0), 0u) << id;
  }

  ZoneRulesPtr first = Unwrap(provider->provideRules("Europe/London", true));
  ZoneRulesPtr second = Unwrap(provider->provideRules("Europe/London", false));
  EXPECT_EQ(first.get(), second.get());
  EXPECT_ERR_KIND(provider->provideRules("Europe/Paris", false), UnknownZone);

  ZoneRulesVersions versions =
      Unwrap(provider->provideVersions("Europe/London"));
  ASSERT_EQ(versions.size(), 1u);
  EXPECT_EQ(versions.begin()->first, provider->version());
  EXPECT_EQ(*versions.begin()->second, *first);
  EXPECT_FALSE(provider->provideRefresh());
}

}  // namespace tempora::test
