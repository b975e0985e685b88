/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneOffsetTransitionRule.h"

#include "tempora/IsoCalendar.h"
#include "tempora/LocalDate.h"
#include "tempora/Printf.h"
#include "tempora/TemporalAdjusters.h"

namespace tempora {
namespace zone {

const char* TimeDefinitionName(TimeDefinition definition) {
  switch (definition) {
    case TimeDefinition::UTC:
      return "UTC";
    case TimeDefinition::Wall:
      return "WALL";
    case TimeDefinition::Standard:
      return "STANDARD";
  }
  TEMPORA_CRASH("invalid time definition");
}

DateTimeResult<LocalDateTime> CreateDateTime(TimeDefinition definition,
                                             const LocalDateTime& dateTime,
                                             const ZoneOffset& standardOffset,
                                             const ZoneOffset& wallOffset) {
  switch (definition) {
    case TimeDefinition::UTC:
      return dateTime.plusSeconds(wallOffset.getTotalSeconds());
    case TimeDefinition::Standard:
      return dateTime.plusSeconds(wallOffset.getTotalSeconds() -
                                  standardOffset.getTotalSeconds());
    case TimeDefinition::Wall:
      return dateTime;
  }
  TEMPORA_CRASH("invalid time definition");
}

DateTimeResult<ZoneOffsetTransitionRule> ZoneOffsetTransitionRule::Of(
    Month month, int32_t dayOfMonthIndicator,
    std::optional<DayOfWeek> dayOfWeek, const LocalTime& time,
    bool timeEndOfDay, TimeDefinition timeDefinition,
    const ZoneOffset& standardOffset, const ZoneOffset& offsetBefore,
    const ZoneOffset& offsetAfter) {
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
  return ZoneOffsetTransitionRule(month, dayOfMonthIndicator, dayOfWeek, time,
                                  timeEndOfDay, timeDefinition, standardOffset,
                                  offsetBefore, offsetAfter);
}

DateTimeResult<ZoneOffsetTransition> ZoneOffsetTransitionRule::createTransition(
    int32_t year) const {
  LocalDate date;
  if (dom_ < 0) {
    int32_t lastDay = MonthLength(month_, IsIsoLeapYear(year));
    date = TEMPORA_TRY(LocalDate::Of(year, month_, lastDay + 1 + dom_));
    if (dayOfWeek_) {
      date = TEMPORA_TRY(PreviousOrSame(*dayOfWeek_).adjust(date));
    }
  } else {
    date = TEMPORA_TRY(LocalDate::Of(year, month_, dom_));
    if (dayOfWeek_) {
      date = TEMPORA_TRY(NextOrSame(*dayOfWeek_).adjust(date));
    }
  }
  if (timeEndOfDay_) {
    date = TEMPORA_TRY(date.plusDays(1));
  }
  LocalDateTime transition = TEMPORA_TRY(CreateDateTime(
      timeDefinition_, LocalDateTime(date, time_), standardOffset_,
      offsetBefore_));
  return ZoneOffsetTransition::Of(transition, offsetBefore_, offsetAfter_);
}

std::string ZoneOffsetTransitionRule::toString() const {
  std::string result = "TransitionRule[";
  result += offsetBefore_.compareTo(offsetAfter_) > 0 ? "Gap " : "Overlap ";
  result += offsetBefore_.toString();
  result += " to ";
  result += offsetAfter_.toString();
  result += ", ";
  if (dayOfWeek_) {
    const char* dayName = DayOfWeekName(*dayOfWeek_);
    if (dom_ == -1) {
      result += Smprintf("%s on or before last day of %s", dayName,
                         MonthName(month_));
    } else if (dom_ < 0) {
      result += Smprintf("%s on or before last day minus %d of %s", dayName,
                         -dom_ - 1, MonthName(month_));
    } else {
      result += Smprintf("%s on or after %s %d", dayName, MonthName(month_),
                         int(dom_));
    }
  } else {
    result += Smprintf("%s %d", MonthName(month_), int(dom_));
  }
  result += " at ";
  result += timeEndOfDay_ ? std::string("24:00") : time_.toString();
  result += " ";
  result += TimeDefinitionName(timeDefinition_);
  result += ", standard offset ";
  result += standardOffset_.toString();
  result += ']';
  return result;
}

}  // namespace zone
}  // namespace tempora
