/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/*
 * Quarter-of-year and week-based-year fields of the ISO-8601 calendar.
 *
 * The week-based year starts on the Monday of the week containing the first
 * Thursday of the calendar year, so it has 52 or 53 whole weeks. The first
 * days of January can belong to the previous week-based year and the last
 * days of December to the next one.
 */

#ifndef tempora_IsoFields_h
#define tempora_IsoFields_h

#include <stdint.h>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/ValueRange.h"

namespace tempora {

enum class IsoField : uint8_t {
  // 1 to 90, 91 or 92.
  DayOfQuarter,
  // 1 to 4.
  QuarterOfYear,
  // 1 to 52 or 53.
  WeekOfWeekBasedYear,
  WeekBasedYear,
};

enum class IsoUnit : uint8_t {
  WeekBasedYears,
  // Three months.
  QuarterYears,
};

const char* IsoFieldName(IsoField field);
const char* IsoUnitName(IsoUnit unit);

/**
 * The outer range of the field.
 */
ValueRange IsoFieldRange(IsoField field);

/**
 * The range of the field for the quarter or week-based year containing
 * `date`.
 */
ValueRange IsoFieldRange(const LocalDate& date, IsoField field);

int64_t GetIsoField(const LocalDate& date, IsoField field);

/**
 * Sets the field, keeping the day-of-week for the week fields. Moving a
 * week 53 to a week-based year of 52 weeks lands in week 52.
 */
DateTimeResult<LocalDate> WithIsoField(const LocalDate& date, IsoField field,
                                       int64_t newValue);

DateTimeResult<LocalDate> PlusIsoUnit(const LocalDate& date,
                                      int64_t amountToAdd, IsoUnit unit);

/**
 * Amount of whole `unit`s from `start` until `end`.
 */
DateTimeResult<int64_t> IsoUnitBetween(const LocalDate& start,
                                       const LocalDate& end, IsoUnit unit);

struct IsoYearWeek final {
  int64_t year = 0;
  int32_t week = 0;
};

/**
 * The week-based year and week of `date`.
 */
IsoYearWeek ToIsoWeekOfYear(const LocalDate& date);

/**
 * 52 or 53.
 */
int32_t IsoWeeksInWeekBasedYear(int64_t weekBasedYear);

}  // namespace tempora

#endif /* tempora_IsoFields_h */
