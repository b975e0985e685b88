/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/IcuZoneRulesProvider.h"

#include <math.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "unicode/basictz.h"
#include "unicode/dtrule.h"
#include "unicode/strenum.h"
#include "unicode/timezone.h"
#include "unicode/tzrule.h"
#include "unicode/tztrans.h"
#include "unicode/unistr.h"
#include "unicode/utypes.h"

#include "tempora/Logging.h"
#include "tempora/Month.h"
#include "tempora/ZoneId.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gIcuLog("icu");

#define LOG(level, args) TEMPORA_LOG(gIcuLog, LogLevel::level, args)

// Zones with more historic transitions than this are rejected.
static constexpr size_t MaxHistoricTransitions = 10000;

// Well before the first transition ICU knows of.
static constexpr UDate WalkStart = -1.0e15;

static DateTimeError IcuError(const char* what, UErrorCode status) {
  return DateTimeError::ZoneRulesData(
      Smprintf("ICU %s failed: %s", what, u_errorName(status)));
}

static DateTimeError InvalidRule(const std::string& zoneId, const char* what) {
  return DateTimeError::ZoneRulesData(
      Smprintf("Unsupported ICU rule in %s: %s", zoneId.c_str(), what));
}

static DateTimeResult<ZoneOffset> OffsetOfMillis(int32_t millis) {
  return ZoneOffset::OfTotalSeconds(millis / 1000);
}

static bool IsFinalRule(const icu::TimeZoneRule* rule) {
  auto* annual = dynamic_cast<const icu::AnnualTimeZoneRule*>(rule);
  return annual && annual->getEndYear() == icu::AnnualTimeZoneRule::MAX_YEAR;
}

static int32_t WallMillis(const icu::TimeZoneRule& rule) {
  return rule.getRawOffset() + rule.getDSTSavings();
}

// UCAL_SUNDAY is 1, UCAL_SATURDAY is 7.
static DateTimeResult<DayOfWeek> IsoDayOfWeek(int32_t icuDayOfWeek) {
  return DayOfWeekOf((icuDayOfWeek + 5) % 7 + 1);
}

namespace {

struct RuleDate final {
  Month month = Month::January;
  int32_t dayOfMonthIndicator = 1;
  std::optional<DayOfWeek> dayOfWeek;
};

}  // namespace

static DateTimeResult<RuleDate> ConvertRuleDate(const std::string& zoneId,
                                                const icu::DateTimeRule& rule) {
  RuleDate date;
  date.month = TEMPORA_TRY(MonthOf(rule.getRuleMonth() + 1));

  switch (rule.getDateRuleType()) {
    case icu::DateTimeRule::DOM:
      date.dayOfMonthIndicator = rule.getRuleDayOfMonth();
      return date;

    case icu::DateTimeRule::DOW: {
      int32_t week = rule.getRuleWeekInMonth();
      date.dayOfWeek = TEMPORA_TRY(IsoDayOfWeek(rule.getRuleDayOfWeek()));
      if (week > 0) {
        date.dayOfMonthIndicator = (week - 1) * 7 + 1;
      } else if (week < 0) {
        date.dayOfMonthIndicator = -1 - 7 * (-week - 1);
      } else {
        return Err(InvalidRule(zoneId, "zero week in month"));
      }
      return date;
    }

    case icu::DateTimeRule::DOW_GEQ_DOM:
      date.dayOfMonthIndicator = rule.getRuleDayOfMonth();
      date.dayOfWeek = TEMPORA_TRY(IsoDayOfWeek(rule.getRuleDayOfWeek()));
      return date;

    case icu::DateTimeRule::DOW_LEQ_DOM: {
      int32_t dom = rule.getRuleDayOfMonth();
      date.dayOfWeek = TEMPORA_TRY(IsoDayOfWeek(rule.getRuleDayOfWeek()));
      if (date.month == Month::February) {
        if (dom != 29) {
          return Err(InvalidRule(zoneId, "day before in February"));
        }
        date.dayOfMonthIndicator = -1;
      } else {
        date.dayOfMonthIndicator = dom - MonthLength(date.month, false) - 1;
      }
      return date;
    }
  }

  return Err(InvalidRule(zoneId, "date rule type"));
}

static DateTimeResult<ZoneOffsetTransitionRule> ConvertFinalRule(
    const std::string& zoneId, const icu::AnnualTimeZoneRule& rule,
    const ZoneOffset& offsetBefore) {
  const icu::DateTimeRule* dateTimeRule = rule.getRule();
  if (!dateTimeRule) {
    return Err(InvalidRule(zoneId, "missing date rule"));
  }

  RuleDate date = TEMPORA_TRY(ConvertRuleDate(zoneId, *dateTimeRule));

  int32_t millisInDay = dateTimeRule->getRuleMillisInDay();
  bool endOfDay = false;
  LocalTime time = LocalTime::Midnight();
  if (millisInDay == 86400000) {
    endOfDay = true;
  } else if (millisInDay < 0 || millisInDay > 86400000 ||
             millisInDay % 1000 != 0) {
    return Err(InvalidRule(zoneId, "time of day"));
  } else {
    time = TEMPORA_TRY(LocalTime::OfSecondOfDay(millisInDay / 1000));
  }

  TimeDefinition definition;
  switch (dateTimeRule->getTimeRuleType()) {
    case icu::DateTimeRule::WALL_TIME:
      definition = TimeDefinition::Wall;
      break;
    case icu::DateTimeRule::STANDARD_TIME:
      definition = TimeDefinition::Standard;
      break;
    case icu::DateTimeRule::UTC_TIME:
      definition = TimeDefinition::UTC;
      break;
    default:
      return Err(InvalidRule(zoneId, "time rule type"));
  }

  ZoneOffset standard = TEMPORA_TRY(OffsetOfMillis(rule.getRawOffset()));
  ZoneOffset after = TEMPORA_TRY(OffsetOfMillis(WallMillis(rule)));
  return ZoneOffsetTransitionRule::Of(date.month, date.dayOfMonthIndicator,
                                      date.dayOfWeek, time, endOfDay,
                                      definition, standard, offsetBefore,
                                      after);
}

// Orders the final rules by their start within a year in which all apply.
static DateTimeResult<std::vector<const icu::AnnualTimeZoneRule*>>
SortFinalRules(std::vector<const icu::AnnualTimeZoneRule*> rules) {
  int32_t year = 2001;
  for (auto* rule : rules) {
    year = std::max(year, int32_t(rule->getStartYear()));
  }

  std::vector<std::pair<UDate, const icu::AnnualTimeZoneRule*>> starts;
  for (auto* rule : rules) {
    UDate start;
    if (!rule->getStartInYear(year, rule->getRawOffset(), 0, start)) {
      return Err(DateTimeError::ZoneRulesData(
          std::string("ICU final rule has no start")));
    }
    starts.emplace_back(start, rule);
  }
  std::sort(starts.begin(), starts.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<const icu::AnnualTimeZoneRule*> sorted;
  for (auto& [start, rule] : starts) {
    sorted.push_back(rule);
  }
  return sorted;
}

DateTimeResult<ZoneRulesPtr> IcuZoneRulesProvider::BuildRules(
    const std::string& zoneId) {
  std::unique_ptr<icu::TimeZone> tz(
      icu::TimeZone::createTimeZone(icu::UnicodeString::fromUTF8(zoneId)));
  if (!tz || *tz == icu::TimeZone::getUnknown()) {
    return Err(DateTimeError::UnknownZone("Unknown time-zone ID: " + zoneId));
  }

  auto* basic = dynamic_cast<icu::BasicTimeZone*>(tz.get());
  if (!basic) {
    return Err(InvalidRule(zoneId, "not a BasicTimeZone"));
  }

  UErrorCode status = U_ZERO_ERROR;
  int32_t count = basic->countTransitionRules(status);
  if (U_FAILURE(status)) {
    return Err(IcuError("countTransitionRules", status));
  }

  const icu::InitialTimeZoneRule* initial = nullptr;
  std::vector<const icu::TimeZoneRule*> trsRules(size_t(count), nullptr);
  basic->getTimeZoneRules(initial, trsRules.data(), count, status);
  if (U_FAILURE(status)) {
    return Err(IcuError("getTimeZoneRules", status));
  }
  if (!initial) {
    return Err(InvalidRule(zoneId, "missing initial rule"));
  }

  ZoneOffset baseStandard =
      TEMPORA_TRY(OffsetOfMillis(initial->getRawOffset()));
  ZoneOffset baseWall = TEMPORA_TRY(OffsetOfMillis(WallMillis(*initial)));

  std::vector<ZoneOffsetTransition> standardTransitions;
  std::vector<ZoneOffsetTransition> transitions;

  ZoneOffset currentStandard = baseStandard;
  ZoneOffset currentWall = baseWall;
  UDate base = WalkStart;
  icu::TimeZoneTransition transition;
  size_t walked = 0;
  while (basic->getNextTransition(base, false, transition)) {
    const icu::TimeZoneRule* to = transition.getTo();
    if (!to || IsFinalRule(to)) {
      break;
    }
    if (++walked > MaxHistoricTransitions) {
      return Err(InvalidRule(zoneId, "too many transitions"));
    }

    base = transition.getTime();
    int64_t epochSecond = int64_t(floor(base / 1000.0));
    ZoneOffset standard = TEMPORA_TRY(OffsetOfMillis(to->getRawOffset()));
    ZoneOffset wall = TEMPORA_TRY(OffsetOfMillis(WallMillis(*to)));

    if (standard != currentStandard) {
      standardTransitions.push_back(TEMPORA_TRY(ZoneOffsetTransition::OfEpochSecond(
          epochSecond, currentStandard, standard)));
      currentStandard = standard;
    }
    if (wall != currentWall) {
      transitions.push_back(TEMPORA_TRY(
          ZoneOffsetTransition::OfEpochSecond(epochSecond, currentWall, wall)));
      currentWall = wall;
    }
  }

  std::vector<const icu::AnnualTimeZoneRule*> finalRules;
  for (const icu::TimeZoneRule* rule : trsRules) {
    if (IsFinalRule(rule)) {
      finalRules.push_back(static_cast<const icu::AnnualTimeZoneRule*>(rule));
    }
  }
  finalRules = TEMPORA_TRY(SortFinalRules(std::move(finalRules)));

  std::vector<ZoneOffsetTransitionRule> lastRules;
  for (size_t i = 0; i < finalRules.size(); i++) {
    const icu::AnnualTimeZoneRule* previous =
        finalRules[(i + finalRules.size() - 1) % finalRules.size()];
    ZoneOffset before = TEMPORA_TRY(OffsetOfMillis(WallMillis(*previous)));
    lastRules.push_back(
        TEMPORA_TRY(ConvertFinalRule(zoneId, *finalRules[i], before)));
  }

  LOG(Debug, ("Built %s from ICU: %zu standard, %zu savings, %zu last rules",
              zoneId.c_str(), standardTransitions.size(), transitions.size(),
              lastRules.size()));

  return ZoneRules::Of(baseStandard, baseWall, standardTransitions,
                       transitions, lastRules);
}

DateTimeResult<std::unique_ptr<IcuZoneRulesProvider>>
IcuZoneRulesProvider::Create(const std::set<std::string>& excludedIds) {
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::StringEnumeration> ids(
      icu::TimeZone::createTimeZoneIDEnumeration(UCAL_ZONE_TYPE_ANY, nullptr,
                                                 nullptr, status));
  if (U_FAILURE(status) || !ids) {
    return Err(IcuError("createTimeZoneIDEnumeration", status));
  }

  std::set<std::string> zoneIds;
  int32_t length;
  while (const char* id = ids->next(&length, status)) {
    std::string zoneId(id, size_t(length));
    // SystemV ids are not part of the TZDB region set.
    if (zoneId.substr(0, 8) == "SystemV/" ||
        !ZoneId::IsValidRegionId(zoneId) || excludedIds.count(zoneId)) {
      continue;
    }
    zoneIds.insert(std::move(zoneId));
  }
  if (U_FAILURE(status)) {
    return Err(IcuError("StringEnumeration::next", status));
  }

  const char* version = icu::TimeZone::getTZDataVersion(status);
  if (U_FAILURE(status)) {
    return Err(IcuError("getTZDataVersion", status));
  }

  LOG(Info, ("ICU time-zone data %s: %zu zones, %zu excluded", version,
             zoneIds.size(), excludedIds.size()));

  return std::unique_ptr<IcuZoneRulesProvider>(
      new IcuZoneRulesProvider(std::move(zoneIds), version));
}

DateTimeResult<ZoneRulesPtr> IcuZoneRulesProvider::provideRules(
    const std::string& regionId, bool forCaching) {
  if (!zoneIds_.count(regionId)) {
    return Err(DateTimeError::UnknownZone("Unknown time-zone ID: " + regionId));
  }

  std::lock_guard<std::mutex> lock(cacheLock_);
  auto cached = cache_.find(regionId);
  if (cached != cache_.end()) {
    return cached->second;
  }

  ZoneRulesPtr rules = TEMPORA_TRY(BuildRules(regionId));
  cache_.emplace(regionId, rules);
  return rules;
}

DateTimeResult<ZoneRulesVersions> IcuZoneRulesProvider::provideVersions(
    const std::string& regionId) {
  ZoneRulesPtr rules = TEMPORA_TRY(provideRules(regionId, false));
  ZoneRulesVersions versions;
  versions.emplace(version_, std::move(rules));
  return versions;
}
