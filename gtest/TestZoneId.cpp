/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <stdlib.h>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/ZoneId.h"
#include "tempora/zone/ZoneRules.h"
#include "tempora/zone/ZoneRulesRegistry.h"

namespace tempora::test {

using namespace tempora::zone;

static ZoneOffset Hours(int32_t aHours) {
  return Unwrap(ZoneOffset::OfHours(aHours));
}

namespace {

// Serves a fixed-offset zone and a zone with summer time.
class TestProvider final : public ZoneRulesProvider {
  ZoneRulesPtr mFixed;
  ZoneRulesPtr mSummer;
  int mRefreshes = 0;

 public:
  TestProvider() {
    mFixed = ZoneRules::Fixed(Hours(2));
    LocalTime oneAm = Unwrap(LocalTime::Of(1, 0));
    std::vector<ZoneOffsetTransitionRule> lastRules = {
        Unwrap(ZoneOffsetTransitionRule::Of(
            Month::March, -1, DayOfWeek::Sunday, oneAm, false,
            TimeDefinition::UTC, Hours(0), Hours(0), Hours(1))),
        Unwrap(ZoneOffsetTransitionRule::Of(
            Month::October, -1, DayOfWeek::Sunday, oneAm, false,
            TimeDefinition::UTC, Hours(0), Hours(1), Hours(0))),
    };
    mSummer = Unwrap(ZoneRules::Of(Hours(0), Hours(0), {}, {}, lastRules));
  }

  int refreshes() const { return mRefreshes; }

  const char* name() const override { return "Test"; }

  std::set<std::string> provideZoneIds() const override {
    return {"Test/Fixed", "Test/Summer"};
  }

  DateTimeResult<ZoneRulesPtr> provideRules(const std::string& aRegionId,
                                            bool aForCaching) override {
    if (aRegionId == "Test/Fixed") {
      return mFixed;
    }
    if (aRegionId == "Test/Summer") {
      return mSummer;
    }
    return Err(DateTimeError::UnknownZone("Unknown time-zone ID: " + aRegionId));
  }

  DateTimeResult<ZoneRulesVersions> provideVersions(
      const std::string& aRegionId) override {
    ZoneRulesPtr rules = TEMPORA_TRY(provideRules(aRegionId, false));
    ZoneRulesVersions versions;
    versions.emplace("1", rules);
    return versions;
  }

  bool provideRefresh() override {
    mRefreshes++;
    return true;
  }
};

}  // namespace

static std::unique_ptr<ZoneRulesRegistry> TestRegistry() {
  auto registry = std::make_unique<ZoneRulesRegistry>();
  EXPECT_TRUE(
      registry->registerProvider(std::make_shared<TestProvider>()).isOk());
  return registry;
}

TEST(Tempora_ZoneId, OffsetIds)
{
  auto registry = TestRegistry();

  ZoneId utc = Unwrap(ZoneId::Of("Z", *registry));
  EXPECT_TRUE(utc.isOffset());
  EXPECT_EQ(*utc.asOffset(), ZoneOffset::UTC());
  EXPECT_EQ(utc.getId(), "Z");

  ZoneId plusOne = Unwrap(ZoneId::Of("+1", *registry));
  EXPECT_EQ(plusOne.getId(), "+01:00");
  EXPECT_EQ(plusOne, ZoneId::Of(Hours(1)));
  EXPECT_EQ(plusOne.getRules().getOffset(Instant::Epoch()), Hours(1));

  EXPECT_ERR_KIND(ZoneId::Of("X", *registry), InvalidValue);
  EXPECT_ERR_KIND(ZoneId::Of("+19:00", *registry), InvalidValue);
  EXPECT_ERR_KIND(ZoneId::Of("+01:0", *registry), Parse);
}

TEST(Tempora_ZoneId, PrefixedIds)
{
  auto registry = TestRegistry();

  ZoneId utc = Unwrap(ZoneId::Of("UTC", *registry));
  EXPECT_FALSE(utc.isOffset());
  EXPECT_EQ(utc.getId(), "UTC");
  EXPECT_EQ(utc.normalized(), ZoneId::Of(ZoneOffset::UTC()));

  ZoneId gmt = Unwrap(ZoneId::Of("GMT+01:00", *registry));
  EXPECT_EQ(gmt.getId(), "GMT+01:00");
  EXPECT_FALSE(gmt.isOffset());
  EXPECT_EQ(gmt.normalized().getId(), "+01:00");

  EXPECT_EQ(Unwrap(ZoneId::Of("UT-05", *registry)).getId(), "UT-05:00");
  EXPECT_EQ(Unwrap(ZoneId::Of("UTC+0", *registry)).getId(), "UTC");
  EXPECT_EQ(Unwrap(ZoneId::Of("GMT0", *registry)).getId(), "GMT0");
  EXPECT_ERR_KIND(ZoneId::Of("GMT+", *registry), Parse);

  EXPECT_EQ(Unwrap(ZoneId::OfOffset("", Hours(1))).getId(), "+01:00");
  EXPECT_EQ(Unwrap(ZoneId::OfOffset("UT", Hours(-2))).getId(), "UT-02:00");
  EXPECT_ERR_KIND(ZoneId::OfOffset("CET", Hours(1)), InvalidValue);
}

TEST(Tempora_ZoneId, RegionIds)
{
  auto registry = TestRegistry();

  ZoneId fixed = Unwrap(ZoneId::Of("Test/Fixed", *registry));
  EXPECT_FALSE(fixed.isOffset());
  EXPECT_EQ(fixed.toString(), "Test/Fixed");
  EXPECT_EQ(fixed.normalized().getId(), "+02:00");

  ZoneId summer = Unwrap(ZoneId::Of("Test/Summer", *registry));
  EXPECT_EQ(summer.normalized(), summer);
  EXPECT_NE(summer, fixed);

  EXPECT_ERR_KIND(ZoneId::Of("Test/Missing", *registry), UnknownZone);
  EXPECT_ERR_KIND(ZoneId::Of("1Test", *registry), InvalidValue);
  EXPECT_ERR_KIND(ZoneId::Of("Test/Has Space", *registry), InvalidValue);

  EXPECT_TRUE(ZoneId::IsValidRegionId("America/Argentina/Buenos_Aires"));
  EXPECT_TRUE(ZoneId::IsValidRegionId("Etc/GMT+5"));
  EXPECT_FALSE(ZoneId::IsValidRegionId("E"));
  EXPECT_FALSE(ZoneId::IsValidRegionId("Europe/Paris!"));
}

TEST(Tempora_ZoneId, Aliases)
{
  auto registry = TestRegistry();

  ZoneId est = Unwrap(ZoneId::Of("EST", ZoneId::ShortIds(), *registry));
  EXPECT_TRUE(est.isOffset());
  EXPECT_EQ(est.getId(), "-05:00");
  EXPECT_EQ(ZoneId::ShortIds().at("ECT"), "Europe/Paris");
  EXPECT_ERR_KIND(ZoneId::Of("ECT", ZoneId::ShortIds(), *registry),
                  UnknownZone);

  std::map<std::string, std::string> aliases = {{"Summer", "Test/Summer"}};
  EXPECT_EQ(Unwrap(ZoneId::Of("Summer", aliases, *registry)).getId(),
            "Test/Summer");
  EXPECT_EQ(Unwrap(ZoneId::Of("Test/Fixed", aliases, *registry)).getId(),
            "Test/Fixed");
}

TEST(Tempora_ZoneRulesRegistry, Register)
{
  ZoneRulesRegistry registry;
  EXPECT_TRUE(registry.isEmpty());
  EXPECT_ERR_KIND(registry.getRules("Test/Fixed", false), ZoneRulesData);
  EXPECT_ERR_KIND(registry.registerProvider(nullptr), NullArgument);

  auto provider = std::make_shared<TestProvider>();
  EXPECT_TRUE(registry.registerProvider(provider).isOk());
  EXPECT_FALSE(registry.isEmpty());
  EXPECT_EQ(registry.getAvailableZoneIds(),
            (std::set<std::string>{"Test/Fixed", "Test/Summer"}));

  EXPECT_ERR_KIND(registry.registerProvider(std::make_shared<TestProvider>()),
                  ZoneRulesData);
  EXPECT_EQ(registry.getAvailableZoneIds().size(), 2u);

  ZoneRulesPtr rules = Unwrap(registry.getRules("Test/Fixed", true));
  EXPECT_TRUE(rules->isFixedOffset());
  EXPECT_ERR_KIND(registry.getRules("Test/Missing", true), UnknownZone);

  ZoneRulesVersions versions = Unwrap(registry.getVersions("Test/Summer"));
  ASSERT_EQ(versions.size(), 1u);
  EXPECT_EQ(versions.begin()->first, "1");

  EXPECT_TRUE(registry.refresh());
  EXPECT_EQ(provider->refreshes(), 1);
}

TEST(Tempora_ZoneRulesRegistry, CreateDefault)
{
  RegistryConfig config;
  config.useIcu = false;
  auto empty = Unwrap(ZoneRulesRegistry::CreateDefault(config));
  EXPECT_TRUE(empty->isEmpty());

  auto icu = Unwrap(ZoneRulesRegistry::CreateDefault(RegistryConfig()));
  EXPECT_FALSE(icu->isEmpty());
  ZoneId paris = Unwrap(ZoneId::Of("Europe/Paris", *icu));
  EXPECT_EQ(paris.getRules().getStandardOffset(Instant::Epoch()), Hours(1));

  config.tzdbPath = "/nonexistent/tempora-tzdb.dat";
  EXPECT_TRUE(ZoneRulesRegistry::CreateDefault(config).isErr());
}

TEST(Tempora_ZoneRulesRegistry, ConfigFromEnvironment)
{
  setenv("TEMPORA_TZDB_PATH", "/tmp/tzdb.dat", 1);
  setenv("TEMPORA_DISABLE_ICU", "1", 1);
  RegistryConfig config = RegistryConfig::FromEnvironment();
  EXPECT_EQ(config.tzdbPath, std::optional<std::string>("/tmp/tzdb.dat"));
  EXPECT_FALSE(config.useIcu);

  unsetenv("TEMPORA_TZDB_PATH");
  unsetenv("TEMPORA_DISABLE_ICU");
  config = RegistryConfig::FromEnvironment();
  EXPECT_FALSE(config.tzdbPath);
  EXPECT_TRUE(config.useIcu);
}

}  // namespace tempora::test
