/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneOffsetTransitionRule_h
#define tempora_zone_ZoneOffsetTransitionRule_h

#include <stdint.h>

#include <optional>
#include <string>

#include "tempora/DateTimeError.h"
#include "tempora/DayOfWeek.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/Month.h"
#include "tempora/ZoneOffset.h"
#include "tempora/zone/ZoneOffsetTransition.h"

namespace tempora {
namespace zone {

/**
 * How the local time of a transition rule is to be interpreted.
 */
enum class TimeDefinition : uint8_t {
  // Relative to UTC.
  UTC,
  // Relative to the offset in force before the transition.
  Wall,
  // Relative to the standard offset.
  Standard,
};

const char* TimeDefinitionName(TimeDefinition definition);

/**
 * Converts a local date-time in `definition` terms to wall time.
 */
DateTimeResult<LocalDateTime> CreateDateTime(TimeDefinition definition,
                                             const LocalDateTime& dateTime,
                                             const ZoneOffset& standardOffset,
                                             const ZoneOffset& wallOffset);

/**
 * A rule expressing how to create a transition in any year, such as "the
 * last Sunday in March at 01:00 UTC".
 *
 * The day is either a fixed day of month, the first given day-of-week on or
 * after a day of month, or the last given day-of-week on or before a day
 * counted back from the end of the month. A negative day-of-month indicator
 * counts from the end of the month: -1 is the last day, -2 the day before.
 */
class ZoneOffsetTransitionRule final {
  Month month_;
  int8_t dom_;
  std::optional<DayOfWeek> dayOfWeek_;
  LocalTime time_;
  bool timeEndOfDay_;
  TimeDefinition timeDefinition_;
  ZoneOffset standardOffset_;
  ZoneOffset offsetBefore_;
  ZoneOffset offsetAfter_;

  ZoneOffsetTransitionRule(Month month, int32_t dayOfMonthIndicator,
                           std::optional<DayOfWeek> dayOfWeek,
                           const LocalTime& time, bool timeEndOfDay,
                           TimeDefinition timeDefinition,
                           const ZoneOffset& standardOffset,
                           const ZoneOffset& offsetBefore,
                           const ZoneOffset& offsetAfter)
      : month_(month),
        dom_(int8_t(dayOfMonthIndicator)),
        dayOfWeek_(dayOfWeek),
        time_(time),
        timeEndOfDay_(timeEndOfDay),
        timeDefinition_(timeDefinition),
        standardOffset_(standardOffset),
        offsetBefore_(offsetBefore),
        offsetAfter_(offsetAfter) {}

 public:
  static DateTimeResult<ZoneOffsetTransitionRule> Of(
      Month month, int32_t dayOfMonthIndicator,
      std::optional<DayOfWeek> dayOfWeek, const LocalTime& time,
      bool timeEndOfDay, TimeDefinition timeDefinition,
      const ZoneOffset& standardOffset, const ZoneOffset& offsetBefore,
      const ZoneOffset& offsetAfter);

  Month getMonth() const { return month_; }
  int32_t getDayOfMonthIndicator() const { return dom_; }
  std::optional<DayOfWeek> getDayOfWeek() const { return dayOfWeek_; }
  const LocalTime& getLocalTime() const { return time_; }
  bool isMidnightEndOfDay() const { return timeEndOfDay_; }
  TimeDefinition getTimeDefinition() const { return timeDefinition_; }
  const ZoneOffset& getStandardOffset() const { return standardOffset_; }
  const ZoneOffset& getOffsetBefore() const { return offsetBefore_; }
  const ZoneOffset& getOffsetAfter() const { return offsetAfter_; }

  /**
   * The transition this rule produces in `year`.
   */
  DateTimeResult<ZoneOffsetTransition> createTransition(int32_t year) const;

  bool operator==(const ZoneOffsetTransitionRule& other) const {
    return month_ == other.month_ && dom_ == other.dom_ &&
           dayOfWeek_ == other.dayOfWeek_ &&
           timeDefinition_ == other.timeDefinition_ &&
           time_ == other.time_ && timeEndOfDay_ == other.timeEndOfDay_ &&
           standardOffset_ == other.standardOffset_ &&
           offsetBefore_ == other.offsetBefore_ &&
           offsetAfter_ == other.offsetAfter_;
  }
  bool operator!=(const ZoneOffsetTransitionRule& other) const {
    return !(*this == other);
  }

  /**
   * Formatted as "TransitionRule[Gap +01:00 to +02:00, SUNDAY on or after
   * MARCH 25 at 01:00 UTC, standard offset +01:00]".
   */
  std::string toString() const;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneOffsetTransitionRule_h */
