/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Proleptic Gregorian calendar arithmetic. */

#ifndef tempora_IsoCalendar_h
#define tempora_IsoCalendar_h

#include <stdint.h>

#include "tempora/Assertions.h"
#include "tempora/CheckedArithmetic.h"

namespace tempora {

struct IsoDate final {
  int64_t year = 0;
  int32_t month = 0;
  int32_t day = 0;
};

constexpr bool IsIsoLeapYear(int64_t year) {
  return (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));
}

constexpr int32_t IsoDaysInYear(int64_t year) {
  return IsIsoLeapYear(year) ? 366 : 365;
}

constexpr int32_t IsoDaysInMonth(int64_t year, int32_t month) {
  TEMPORA_ASSERT(1 <= month && month <= 12);

  constexpr uint8_t daysInMonth[2][13] = {
      {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31},
      {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31}};

  return daysInMonth[IsIsoLeapYear(year)][month];
}

/**
 * Return the day relative to the Unix epoch of January 1 of `year`.
 */
constexpr int64_t DayFromYear(int64_t year) {
  return 365 * (year - 1970) + FloorDiv<int64_t>(year - 1969, 4) -
         FloorDiv<int64_t>(year - 1901, 100) +
         FloorDiv<int64_t>(year - 1601, 400);
}

/**
 * Return the one-based day of year of the given date.
 */
int32_t IsoDayOfYear(const IsoDate& date);

/**
 * Return the day relative to the Unix epoch, January 1 1970.
 */
inline int64_t MakeDay(const IsoDate& date) {
  return DayFromYear(date.year) + IsoDayOfYear(date) - 1;
}

/**
 * Inverse of MakeDay.
 */
IsoDate EpochDayToIsoDate(int64_t epochDay);

/**
 * Return the ISO day of week, 1 (Monday) to 7 (Sunday), of an epoch day.
 */
constexpr int32_t IsoDayOfWeek(int64_t epochDay) {
  // 1970-01-01 was a Thursday.
  return int32_t(FloorMod<int64_t>(epochDay + 3, 7)) + 1;
}

}  // namespace tempora

#endif /* tempora_IsoCalendar_h */
