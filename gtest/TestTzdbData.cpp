/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <stdint.h>
#include <stdio.h>

#include <vector>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/ZoneId.h"
#include "tempora/zone/TzdbDataWriter.h"
#include "tempora/zone/TzdbZoneRulesProvider.h"
#include "tempora/zone/ZoneRules.h"
#include "tempora/zone/ZoneRulesRegistry.h"

namespace tempora::test {

using namespace tempora::zone;

using Bytes = std::vector<uint8_t>;

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

// Central European summer time on the last Sundays of March and October.
static ZoneRulesPtr CentralEuropeanRules() {
  LocalTime oneAm = Unwrap(LocalTime::Of(1, 0));
  std::vector<ZoneOffsetTransitionRule> lastRules = {
      Unwrap(ZoneOffsetTransitionRule::Of(
          Month::March, -1, DayOfWeek::Sunday, oneAm, false,
          TimeDefinition::UTC, Hours(1), Hours(1), Hours(2))),
      Unwrap(ZoneOffsetTransitionRule::Of(
          Month::October, -1, DayOfWeek::Sunday, oneAm, false,
          TimeDefinition::UTC, Hours(1), Hours(2), Hours(1))),
  };
  return Unwrap(ZoneRules::Of(Hours(1), Hours(1), {}, {}, lastRules));
}

static std::map<std::string, ZoneRulesByRegion> TwoVersions() {
  ZoneRulesPtr central = CentralEuropeanRules();
  std::map<std::string, ZoneRulesByRegion> versions;
  versions["2011a"] = {{"Test/Berlin", ZoneRules::Fixed(Hours(1))},
                       {"Test/Tokyo", ZoneRules::Fixed(Hours(9))}};
  versions["2012b"] = {{"Test/Berlin", central},
                       {"Test/Paris", central},
                       {"Test/Tokyo", ZoneRules::Fixed(Hours(9))}};
  return versions;
}

TEST(Tempora_TzdbData, RoundTrip)
{
  Bytes bytes = Unwrap(WriteTzdbData(TwoVersions()));
  ASSERT_GE(bytes.size(), 7u);
  EXPECT_EQ(bytes[0], 1);
  EXPECT_EQ(std::string(bytes.begin() + 3, bytes.begin() + 7), "TZDB");

  std::unique_ptr<TzdbZoneRulesProvider> provider =
      Unwrap(TzdbZoneRulesProvider::FromBytes(bytes));
  EXPECT_STREQ(provider->name(), "TZDB");
  EXPECT_EQ(provider->versionIds(),
            (std::vector<std::string>{"2011a", "2012b"}));
  EXPECT_EQ(provider->provideZoneIds(),
            (std::set<std::string>{"Test/Berlin", "Test/Paris", "Test/Tokyo"}));

  // Rules come from the newest version.
  ZoneRulesPtr berlin = Unwrap(provider->provideRules("Test/Berlin", false));
  EXPECT_EQ(*berlin, *CentralEuropeanRules());
  EXPECT_FALSE(berlin->isFixedOffset());
  EXPECT_EQ(*Unwrap(provider->provideRules("Test/Tokyo", false)),
            *ZoneRules::Fixed(Hours(9)));
  EXPECT_ERR_KIND(provider->provideRules("Test/Missing", false), UnknownZone);
}

TEST(Tempora_TzdbData, Versions)
{
  std::unique_ptr<TzdbZoneRulesProvider> provider =
      Unwrap(TzdbZoneRulesProvider::FromBytes(Unwrap(WriteTzdbData(
          TwoVersions()))));

  ZoneRulesVersions berlin = Unwrap(provider->provideVersions("Test/Berlin"));
  ASSERT_EQ(berlin.size(), 2u);
  EXPECT_TRUE(berlin.at("2011a")->isFixedOffset());
  EXPECT_FALSE(berlin.at("2012b")->isFixedOffset());

  // Paris only exists in the newer version.
  ZoneRulesVersions paris = Unwrap(provider->provideVersions("Test/Paris"));
  ASSERT_EQ(paris.size(), 1u);
  EXPECT_EQ(paris.begin()->first, "2012b");

  EXPECT_TRUE(Unwrap(provider->provideVersions("Test/Missing")).empty());
}

TEST(Tempora_TzdbData, IdenticalRulesAreShared)
{
  std::unique_ptr<TzdbZoneRulesProvider> provider =
      Unwrap(TzdbZoneRulesProvider::FromBytes(Unwrap(WriteTzdbData(
          TwoVersions()))));

  ZoneRulesPtr berlin = Unwrap(provider->provideRules("Test/Berlin", true));
  ZoneRulesPtr paris = Unwrap(provider->provideRules("Test/Paris", true));
  EXPECT_EQ(berlin.get(), paris.get());

  ZoneRulesVersions tokyo = Unwrap(provider->provideVersions("Test/Tokyo"));
  ASSERT_EQ(tokyo.size(), 2u);
  EXPECT_EQ(tokyo.at("2011a").get(), tokyo.at("2012b").get());
}

TEST(Tempora_TzdbData, Invalid)
{
  std::map<std::string, ZoneRulesByRegion> nullRules;
  nullRules["2012b"] = {{"Test/Null", nullptr}};
  EXPECT_ERR_KIND(WriteTzdbData(nullRules), NullArgument);

  Bytes empty = Unwrap(WriteTzdbData({}));
  EXPECT_EQ(empty,
            (Bytes{1, 0, 4, 'T', 'Z', 'D', 'B', 0, 0, 0, 0, 0, 0}));
  EXPECT_ERR_KIND(TzdbZoneRulesProvider::FromBytes(empty), ZoneRulesData);

  Bytes bytes = Unwrap(WriteTzdbData(TwoVersions()));
  Bytes badVersion = bytes;
  badVersion[0] = 2;
  EXPECT_ERR_KIND(TzdbZoneRulesProvider::FromBytes(badVersion), ZoneRulesData);
  Bytes badGroup = bytes;
  badGroup[3] = 'X';
  EXPECT_ERR_KIND(TzdbZoneRulesProvider::FromBytes(badGroup), ZoneRulesData);
  Bytes truncated(bytes.begin(), bytes.begin() + bytes.size() / 2);
  EXPECT_ERR_KIND(TzdbZoneRulesProvider::FromBytes(truncated), ZoneRulesData);

  EXPECT_ERR_KIND(TzdbZoneRulesProvider::Open("/nonexistent/tzdb.dat"),
                  ZoneRulesData);
}

TEST(Tempora_TzdbData, FileBackedRegistry)
{
  std::string path = ::testing::TempDir() + "tempora-test-tzdb.dat";
  std::map<std::string, ZoneRulesByRegion> versions;
  versions["2012b"] = {{"Europe/London", ZoneRules::Fixed(Hours(3))},
                       {"Test/Paris", CentralEuropeanRules()}};
  ASSERT_TRUE(WriteTzdbFile(path, versions).isOk());

  std::unique_ptr<TzdbZoneRulesProvider> provider =
      Unwrap(TzdbZoneRulesProvider::Open(path));
  EXPECT_EQ(provider->versionIds(), (std::vector<std::string>{"2012b"}));

  RegistryConfig config;
  config.tzdbPath = path;
  auto registry = Unwrap(ZoneRulesRegistry::CreateDefault(config));

  // File data takes precedence over ICU for the ids it covers.
  ZoneId london = Unwrap(ZoneId::Of("Europe/London", *registry));
  EXPECT_EQ(london.getRules().getOffset(Instant::Epoch()), Hours(3));
  ZoneId paris = Unwrap(ZoneId::Of("Test/Paris", *registry));
  EXPECT_FALSE(paris.getRules().isFixedOffset());
  EXPECT_TRUE(registry->getAvailableZoneIds().count("America/New_York"));

  remove(path.c_str());
}

}  // namespace tempora::test
