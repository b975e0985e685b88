/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneRulesBuilder_h
#define tempora_zone_ZoneRulesBuilder_h

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/DayOfWeek.h"
#include "tempora/LocalDateTime.h"
#include "tempora/Month.h"
#include "tempora/ZoneOffset.h"
#include "tempora/zone/ZoneOffsetTransitionRule.h"
#include "tempora/zone/ZoneRules.h"

namespace tempora {
namespace zone {

/**
 * Builds ZoneRules from the windows and rules of a tz source file.
 *
 * A window is a period of time with a single standard offset, ending at a
 * local date-time. Within a window the savings are either fixed or given
 * by rules. A rule with an end year of LocalDate::MaxYear recurs forever
 * and becomes a last rule of the zone if its window is the final one.
 *
 *   ZoneRulesBuilder builder;
 *   TEMPORA_TRY(builder.addWindowForever(plus1));
 *   TEMPORA_TRY(builder.addRuleToWindow(1996, LocalDate::MaxYear,
 *                                       Month::March, -1, DayOfWeek::Sunday,
 *                                       oneAm, false, TimeDefinition::UTC,
 *                                       3600));
 */
class ZoneRulesBuilder final {
 public:
  struct Rule final {
    int32_t year;
    Month month;
    int32_t dayOfMonthIndicator;
    std::optional<DayOfWeek> dayOfWeek;
    LocalTime time;
    bool timeEndOfDay;
    TimeDefinition timeDefinition;
    int32_t savingAmountSecs;

    DateTimeResult<LocalDate> toLocalDate() const;
  };

  struct Window final {
    ZoneOffset standardOffset;
    LocalDateTime windowEnd;
    TimeDefinition timeDefinition;
    std::optional<int32_t> fixedSavingAmountSecs;
    std::vector<Rule> rules;
    std::vector<Rule> lastRules;
    int32_t maxLastRuleStartYear = LocalDate::MinYear;

    DateTimeResult<Ok> addRule(const Rule& rule, int32_t endYear);
    DateTimeResult<Ok> tidy(int32_t windowStartYear);
    DateTimeResult<ZoneOffset> createWallOffset(int32_t savingsSecs) const;
    DateTimeResult<int64_t> createDateTimeEpochSecond(
        int32_t savingsSecs) const;
  };

 private:
  std::vector<Window> windows_;

  DateTimeResult<Window*> lastWindow(const char* action);

 public:
  /**
   * Adds a window with `standardOffset` ending at `until`, interpreted
   * according to `untilDefinition`. Windows must be added in order.
   */
  DateTimeResult<Ok> addWindow(const ZoneOffset& standardOffset,
                               const LocalDateTime& until,
                               TimeDefinition untilDefinition);

  /**
   * Adds the final window, which lasts forever.
   */
  DateTimeResult<Ok> addWindowForever(const ZoneOffset& standardOffset);

  /**
   * Sets a fixed amount of savings for the whole of the latest window.
   */
  DateTimeResult<Ok> setFixedSavingsToWindow(int32_t fixedSavingAmountSecs);

  /**
   * Adds a single transition to the latest window.
   */
  DateTimeResult<Ok> addRuleToWindow(const LocalDateTime& transitionDateTime,
                                     TimeDefinition timeDefinition,
                                     int32_t savingAmountSecs);

  DateTimeResult<Ok> addRuleToWindow(int32_t year, Month month,
                                     int32_t dayOfMonthIndicator,
                                     const LocalTime& time, bool timeEndOfDay,
                                     TimeDefinition timeDefinition,
                                     int32_t savingAmountSecs);

  /**
   * Adds a rule recurring from `startYear` to `endYear` inclusive to the
   * latest window. The day is chosen as in ZoneOffsetTransitionRule.
   */
  DateTimeResult<Ok> addRuleToWindow(int32_t startYear, int32_t endYear,
                                     Month month, int32_t dayOfMonthIndicator,
                                     std::optional<DayOfWeek> dayOfWeek,
                                     const LocalTime& time, bool timeEndOfDay,
                                     TimeDefinition timeDefinition,
                                     int32_t savingAmountSecs);

  /**
   * Builds the rules. The builder is left unchanged and may be reused.
   */
  DateTimeResult<std::shared_ptr<const ZoneRules>> toRules(
      const std::string& zoneId) const;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneRulesBuilder_h */
