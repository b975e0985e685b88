/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_TemporalFields_h
#define tempora_TemporalFields_h

#include <stdint.h>

#include "tempora/DateTimeError.h"
#include "tempora/ValueRange.h"

namespace tempora {

/**
 * The standard set of date-time fields, in order of increasing duration of
 * their base unit.
 */
enum class ChronoField : uint8_t {
  NanoOfSecond,
  NanoOfDay,
  MicroOfSecond,
  MicroOfDay,
  MilliOfSecond,
  MilliOfDay,
  SecondOfMinute,
  SecondOfDay,
  MinuteOfHour,
  MinuteOfDay,
  HourOfAmPm,
  ClockHourOfAmPm,
  HourOfDay,
  ClockHourOfDay,
  AmPmOfDay,
  DayOfWeek,
  AlignedDayOfWeekInMonth,
  AlignedDayOfWeekInYear,
  DayOfMonth,
  DayOfYear,
  EpochDay,
  AlignedWeekOfMonth,
  AlignedWeekOfYear,
  MonthOfYear,
  ProlepticMonth,
  YearOfEra,
  Year,
  Era,
  InstantSeconds,
  OffsetSeconds,
};

constexpr size_t ChronoFieldCount = size_t(ChronoField::OffsetSeconds) + 1;

/**
 * Return the display name of the field, e.g. "MonthOfYear".
 */
const char* FieldName(ChronoField field);

/**
 * Return the outer range of valid values for the field in the ISO calendar.
 */
ValueRange FieldRange(ChronoField field);

/**
 * True for fields from DayOfWeek to Era.
 */
constexpr bool IsDateBased(ChronoField field) {
  return field >= ChronoField::DayOfWeek && field <= ChronoField::Era;
}

/**
 * True for fields from NanoOfSecond to AmPmOfDay.
 */
constexpr bool IsTimeBased(ChronoField field) {
  return field < ChronoField::DayOfWeek;
}

inline DateTimeResult<int64_t> CheckValidValue(ChronoField field,
                                               int64_t value) {
  return FieldRange(field).checkValidValue(value, field);
}

inline DateTimeResult<int32_t> CheckValidIntValue(ChronoField field,
                                                  int64_t value) {
  return FieldRange(field).checkValidIntValue(value, field);
}

/**
 * Error for a field which the queried type doesn't carry.
 */
DateTimeError UnsupportedFieldError(ChronoField field);

}  // namespace tempora

#endif /* tempora_TemporalFields_h */
