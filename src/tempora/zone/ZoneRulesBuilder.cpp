/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneRulesBuilder.h"

#include <algorithm>

#include "tempora/IsoCalendar.h"
#include "tempora/Logging.h"
#include "tempora/TemporalAdjusters.h"
#include "tempora/TemporalFields.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gBuilderLog("zonebuilder");

#define LOG(level, args) TEMPORA_LOG(gBuilderLog, LogLevel::level, args)

// Bounds the rules a single window may expand to.
static constexpr size_t MaxRulesPerWindow = 2000;

static DateTimeError BuilderState(const char* message) {
  return DateTimeError::ZoneRulesData(std::string(message));
}

namespace {

// A transition that may not change the offset, so not yet a
// ZoneOffsetTransition.
struct RuleTransition final {
  LocalDateTime dateTime;
  ZoneOffset offsetBefore;
  ZoneOffset offsetAfter;

  int64_t toEpochSecond() const {
    return dateTime.toEpochSecond(offsetBefore);
  }
};

}  // namespace

static DateTimeResult<RuleTransition> ToTransition(
    const ZoneRulesBuilder::Rule& rule, const ZoneOffset& standardOffset,
    int32_t savingsBeforeSecs) {
  LocalDate date = TEMPORA_TRY(rule.toLocalDate());
  ZoneOffset wallOffset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(
      int64_t(standardOffset.getTotalSeconds()) + savingsBeforeSecs));
  LocalDateTime dateTime =
      TEMPORA_TRY(CreateDateTime(rule.timeDefinition, LocalDateTime(date, rule.time),
                                 standardOffset, wallOffset));
  ZoneOffset offsetAfter = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(
      int64_t(standardOffset.getTotalSeconds()) + rule.savingAmountSecs));
  return RuleTransition{dateTime, wallOffset, offsetAfter};
}

static DateTimeResult<ZoneOffsetTransitionRule> ToTransitionRule(
    ZoneRulesBuilder::Rule rule, const ZoneOffset& standardOffset,
    int32_t savingsBeforeSecs) {
  // "Last Sunday" becomes "Sunday on or after the 25th" so that the rule is
  // stored with a positive day in months of fixed length.
  if (rule.dayOfMonthIndicator < 0 && rule.dayOfWeek &&
      rule.month != Month::February) {
    rule.dayOfMonthIndicator =
        MonthMaxLength(rule.month) + rule.dayOfMonthIndicator - 5;
  }
  if (rule.timeEndOfDay && rule.dayOfMonthIndicator > 0 &&
      !(rule.dayOfMonthIndicator == 28 && rule.month == Month::February)) {
    LocalDate date = TEMPORA_TRY(
        LocalDate::Of(2004, rule.month, rule.dayOfMonthIndicator));
    date = TEMPORA_TRY(date.plusDays(1));
    rule.month = date.getMonth();
    rule.dayOfMonthIndicator = date.getDayOfMonth();
    if (rule.dayOfWeek) {
      rule.dayOfWeek = PlusDays(*rule.dayOfWeek, 1);
    }
    rule.timeEndOfDay = false;
  }

  RuleTransition trans =
      TEMPORA_TRY(ToTransition(rule, standardOffset, savingsBeforeSecs));
  return ZoneOffsetTransitionRule::Of(
      rule.month, rule.dayOfMonthIndicator, rule.dayOfWeek, rule.time,
      rule.timeEndOfDay, rule.timeDefinition, standardOffset,
      trans.offsetBefore, trans.offsetAfter);
}

DateTimeResult<LocalDate> ZoneRulesBuilder::Rule::toLocalDate() const {
  LocalDate date;
  if (dayOfMonthIndicator < 0) {
    int32_t monthLength = MonthLength(month, IsIsoLeapYear(year));
    date = TEMPORA_TRY(
        LocalDate::Of(year, month, monthLength + 1 + dayOfMonthIndicator));
    if (dayOfWeek) {
      date = TEMPORA_TRY(PreviousOrSame(*dayOfWeek).adjust(date));
    }
  } else {
    date = TEMPORA_TRY(LocalDate::Of(year, month, dayOfMonthIndicator));
    if (dayOfWeek) {
      date = TEMPORA_TRY(NextOrSame(*dayOfWeek).adjust(date));
    }
  }
  if (timeEndOfDay) {
    date = TEMPORA_TRY(date.plusDays(1));
  }
  return date;
}

DateTimeResult<Ok> ZoneRulesBuilder::Window::addRule(const Rule& rule,
                                                     int32_t endYear) {
  if (fixedSavingAmountSecs) {
    return Err(BuilderState(
        "Window has a fixed DST saving, so cannot have DST rules"));
  }

  if (endYear == LocalDate::MaxYear) {
    lastRules.push_back(rule);
    maxLastRuleStartYear = std::max(rule.year, maxLastRuleStartYear);
    return Ok();
  }

  for (int64_t year = rule.year; year <= endYear; year++) {
    if (rules.size() >= MaxRulesPerWindow) {
      return Err(BuilderState(
          "Window has reached the maximum number of allowed rules"));
    }
    Rule yearRule = rule;
    yearRule.year = int32_t(year);
    rules.push_back(yearRule);
  }
  return Ok();
}

// Sorts by year, then by the date and time the rule applies.
static DateTimeResult<Ok> SortRules(std::vector<ZoneRulesBuilder::Rule>& rules) {
  std::vector<std::pair<LocalDate, size_t>> keys;
  keys.reserve(rules.size());
  for (size_t i = 0; i < rules.size(); i++) {
    keys.emplace_back(TEMPORA_TRY(rules[i].toLocalDate()), i);
  }

  auto less = [&](const std::pair<LocalDate, size_t>& a,
                  const std::pair<LocalDate, size_t>& b) {
    const ZoneRulesBuilder::Rule& ra = rules[a.second];
    const ZoneRulesBuilder::Rule& rb = rules[b.second];
    if (ra.year != rb.year) {
      return ra.year < rb.year;
    }
    if (ra.month != rb.month) {
      return ra.month < rb.month;
    }
    int32_t cmp = a.first.compareTo(b.first);
    if (cmp != 0) {
      return cmp < 0;
    }
    return ra.time.isBefore(rb.time);
  };
  std::stable_sort(keys.begin(), keys.end(), less);

  std::vector<ZoneRulesBuilder::Rule> sorted;
  sorted.reserve(rules.size());
  for (auto& key : keys) {
    sorted.push_back(rules[key.second]);
  }
  rules = std::move(sorted);
  return Ok();
}

DateTimeResult<Ok> ZoneRulesBuilder::Window::tidy(int32_t windowStartYear) {
  if (lastRules.size() == 1) {
    return Err(
        BuilderState("Cannot have only one rule defined as being forever"));
  }

  std::vector<Rule> pending = std::move(lastRules);
  lastRules.clear();

  if (windowEnd == LocalDateTime::Max()) {
    maxLastRuleStartYear =
        std::max(maxLastRuleStartYear, windowStartYear) + 1;
    if (maxLastRuleStartYear < LocalDate::MaxYear) {
      // Expand the recurring rules up to the year after the latest start,
      // then keep them as last rules from the year after that.
      for (Rule& lastRule : pending) {
        TEMPORA_TRY(addRule(lastRule, maxLastRuleStartYear));
        lastRule.year = maxLastRuleStartYear + 1;
      }
      lastRules = std::move(pending);
      maxLastRuleStartYear++;
    }
  } else {
    int32_t endYear = windowEnd.getYear();
    for (const Rule& lastRule : pending) {
      TEMPORA_TRY(addRule(lastRule, endYear + 1));
    }
    maxLastRuleStartYear = LocalDate::MaxYear;
  }

  TEMPORA_TRY(SortRules(rules));
  TEMPORA_TRY(SortRules(lastRules));
  if (rules.empty() && !fixedSavingAmountSecs) {
    fixedSavingAmountSecs = 0;
  }
  return Ok();
}

DateTimeResult<ZoneOffset> ZoneRulesBuilder::Window::createWallOffset(
    int32_t savingsSecs) const {
  return ZoneOffset::OfTotalSeconds(int64_t(standardOffset.getTotalSeconds()) +
                                    savingsSecs);
}

DateTimeResult<int64_t> ZoneRulesBuilder::Window::createDateTimeEpochSecond(
    int32_t savingsSecs) const {
  ZoneOffset wallOffset = TEMPORA_TRY(createWallOffset(savingsSecs));
  LocalDateTime dateTime = TEMPORA_TRY(
      CreateDateTime(timeDefinition, windowEnd, standardOffset, wallOffset));
  return dateTime.toEpochSecond(wallOffset);
}

DateTimeResult<ZoneRulesBuilder::Window*> ZoneRulesBuilder::lastWindow(
    const char* action) {
  if (windows_.empty()) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("Must add a window before ") + action));
  }
  return &windows_.back();
}

DateTimeResult<Ok> ZoneRulesBuilder::addWindow(const ZoneOffset& standardOffset,
                                               const LocalDateTime& until,
                                               TimeDefinition untilDefinition) {
  if (!windows_.empty() && until.isBefore(windows_.back().windowEnd)) {
    return Err(DateTimeError::ZoneRulesData(
        "Windows must be added in date-time order: " + until.toString() +
        " < " + windows_.back().windowEnd.toString()));
  }

  Window window;
  window.standardOffset = standardOffset;
  window.windowEnd = until;
  window.timeDefinition = untilDefinition;
  windows_.push_back(std::move(window));
  return Ok();
}

DateTimeResult<Ok> ZoneRulesBuilder::addWindowForever(
    const ZoneOffset& standardOffset) {
  return addWindow(standardOffset, LocalDateTime::Max(), TimeDefinition::Wall);
}

DateTimeResult<Ok> ZoneRulesBuilder::setFixedSavingsToWindow(
    int32_t fixedSavingAmountSecs) {
  Window* window = TEMPORA_TRY(lastWindow("setting the fixed savings"));
  if (!window->rules.empty() || !window->lastRules.empty()) {
    return Err(
        BuilderState("Window has DST rules, so cannot have fixed savings"));
  }
  window->fixedSavingAmountSecs = fixedSavingAmountSecs;
  return Ok();
}

DateTimeResult<Ok> ZoneRulesBuilder::addRuleToWindow(
    const LocalDateTime& transitionDateTime, TimeDefinition timeDefinition,
    int32_t savingAmountSecs) {
  return addRuleToWindow(transitionDateTime.getYear(),
                         transitionDateTime.getYear(),
                         transitionDateTime.getMonth(),
                         transitionDateTime.getDayOfMonth(), std::nullopt,
                         transitionDateTime.toLocalTime(), false,
                         timeDefinition, savingAmountSecs);
}

DateTimeResult<Ok> ZoneRulesBuilder::addRuleToWindow(
    int32_t year, Month month, int32_t dayOfMonthIndicator,
    const LocalTime& time, bool timeEndOfDay, TimeDefinition timeDefinition,
    int32_t savingAmountSecs) {
  return addRuleToWindow(year, year, month, dayOfMonthIndicator, std::nullopt,
                         time, timeEndOfDay, timeDefinition, savingAmountSecs);
}

DateTimeResult<Ok> ZoneRulesBuilder::addRuleToWindow(
    int32_t startYear, int32_t endYear, Month month,
    int32_t dayOfMonthIndicator, std::optional<DayOfWeek> dayOfWeek,
    const LocalTime& time, bool timeEndOfDay, TimeDefinition timeDefinition,
    int32_t savingAmountSecs) {
  TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, startYear));
  TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, endYear));
  if (dayOfMonthIndicator < -28 || dayOfMonthIndicator > 31 ||
      dayOfMonthIndicator == 0) {
    return Err(DateTimeError::InvalidValue(
        std::string("Day of month indicator must be between -28 and 31 "
                    "inclusive excluding zero")));
  }
  if (timeEndOfDay && time != LocalTime::Midnight()) {
    return Err(DateTimeError::InvalidValue(
        std::string("Time must be midnight when end of day flag is true")));
  }

  Window* window = TEMPORA_TRY(lastWindow("adding a rule"));
  Rule rule{startYear,    month,          dayOfMonthIndicator,
            dayOfWeek,    time,           timeEndOfDay,
            timeDefinition, savingAmountSecs};
  return window->addRule(rule, endYear);
}

DateTimeResult<std::shared_ptr<const ZoneRules>> ZoneRulesBuilder::toRules(
    const std::string& zoneId) const {
  if (windows_.empty()) {
    return Err(BuilderState("No windows have been added to the builder"));
  }

  std::vector<Window> windows = windows_;
  std::vector<ZoneOffsetTransition> standardTransitions;
  std::vector<ZoneOffsetTransition> transitions;
  std::vector<ZoneOffsetTransitionRule> lastRules;

  const Window& firstWindow = windows.front();
  ZoneOffset loopStandardOffset = firstWindow.standardOffset;
  int32_t loopSavings = firstWindow.fixedSavingAmountSecs.value_or(0);
  ZoneOffset firstWallOffset =
      TEMPORA_TRY(firstWindow.createWallOffset(loopSavings));
  LocalDateTime loopWindowStart = LocalDateTime::Min();
  ZoneOffset loopWindowOffset = firstWallOffset;

  for (Window& window : windows) {
    TEMPORA_TRY(window.tidy(loopWindowStart.getYear()));
    int64_t windowStartEpochSecond =
        loopWindowStart.toEpochSecond(loopWindowOffset);

    // The savings in force when the window starts.
    int32_t effectiveSavings = 0;
    if (window.fixedSavingAmountSecs) {
      effectiveSavings = *window.fixedSavingAmountSecs;
    } else {
      for (const Rule& rule : window.rules) {
        RuleTransition trans =
            TEMPORA_TRY(ToTransition(rule, loopStandardOffset, loopSavings));
        if (trans.toEpochSecond() > windowStartEpochSecond) {
          break;
        }
        effectiveSavings = rule.savingAmountSecs;
      }
    }

    if (loopStandardOffset != window.standardOffset) {
      standardTransitions.push_back(
          TEMPORA_TRY(ZoneOffsetTransition::OfEpochSecond(
              windowStartEpochSecond, loopStandardOffset,
              window.standardOffset)));
      loopStandardOffset = window.standardOffset;
    }

    ZoneOffset effectiveWallOffset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(
        int64_t(loopStandardOffset.getTotalSeconds()) + effectiveSavings));
    if (loopWindowOffset != effectiveWallOffset) {
      transitions.push_back(TEMPORA_TRY(ZoneOffsetTransition::Of(
          loopWindowStart, loopWindowOffset, effectiveWallOffset)));
    }
    loopSavings = effectiveSavings;

    for (const Rule& rule : window.rules) {
      RuleTransition trans =
          TEMPORA_TRY(ToTransition(rule, loopStandardOffset, loopSavings));
      int64_t windowEndEpochSecond =
          TEMPORA_TRY(window.createDateTimeEpochSecond(loopSavings));
      if (trans.toEpochSecond() >= windowStartEpochSecond &&
          trans.toEpochSecond() < windowEndEpochSecond &&
          trans.offsetBefore != trans.offsetAfter) {
        transitions.push_back(TEMPORA_TRY(ZoneOffsetTransition::Of(
            trans.dateTime, trans.offsetBefore, trans.offsetAfter)));
        loopSavings = rule.savingAmountSecs;
      }
    }

    for (const Rule& lastRule : window.lastRules) {
      lastRules.push_back(TEMPORA_TRY(
          ToTransitionRule(lastRule, loopStandardOffset, loopSavings)));
      loopSavings = lastRule.savingAmountSecs;
    }

    loopWindowOffset = TEMPORA_TRY(window.createWallOffset(loopSavings));
    int64_t windowEnd =
        TEMPORA_TRY(window.createDateTimeEpochSecond(loopSavings));
    loopWindowStart = TEMPORA_TRY(
        LocalDateTime::OfEpochSecond(windowEnd, 0, loopWindowOffset));
  }

  LOG(Debug, ("Built %s: %zu standard, %zu savings, %zu last rules",
              zoneId.c_str(), standardTransitions.size(), transitions.size(),
              lastRules.size()));

  return ZoneRules::Of(firstWindow.standardOffset, firstWallOffset,
                       standardTransitions, transitions, lastRules);
}
