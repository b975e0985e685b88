/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Tabular (civil) Islamic calendar arithmetic. */

#ifndef tempora_calendar_HijrahCalendar_h
#define tempora_calendar_HijrahCalendar_h

#include <stdint.h>

#include "tempora/Assertions.h"

namespace tempora {
namespace calendar {

struct HijrahDate final {
  int32_t year = 1;
  int32_t month = 1;
  int32_t day = 1;
};

// Years 1 to 9999 of both eras. Year 0 is 1 BEFORE_AH.
constexpr int32_t HijrahMinYear = -9998;
constexpr int32_t HijrahMaxYear = 9999;

// 1 Muharram 1 AH is the proleptic Gregorian 622-07-19.
constexpr int64_t HijrahEpochDay = -492148;

// Thirty years, eleven of them leap.
constexpr int64_t HijrahDaysInCycle = 10631;

constexpr bool IsHijrahLeapYear(int64_t year) {
  // Leap years 2, 5, 7, 10, 13, 16, 18, 21, 24, 26 and 29 of each cycle.
  return ((11 * year + 14) % 30 + 30) % 30 < 11;
}

constexpr int32_t HijrahDaysInYear(int64_t year) {
  return IsHijrahLeapYear(year) ? 355 : 354;
}

constexpr int32_t HijrahDaysInMonth(int64_t year, int32_t month) {
  TEMPORA_ASSERT(1 <= month && month <= 12);
  if (month == 12) {
    return IsHijrahLeapYear(year) ? 30 : 29;
  }
  return month % 2 == 1 ? 30 : 29;
}

/**
 * Days in the year before the first day of `month`.
 */
constexpr int32_t HijrahDaysBeforeMonth(int32_t month) {
  return 29 * (month - 1) + month / 2;
}

/**
 * Epoch day of the first day of the proleptic `year`.
 */
int64_t HijrahYearStart(int32_t year);

/**
 * Epoch day of a valid date.
 */
int64_t HijrahToEpochDay(const HijrahDate& date);

/**
 * Inverse of HijrahToEpochDay. The epoch day must lie in years
 * HijrahMinYear to HijrahMaxYear.
 */
HijrahDate HijrahFromEpochDay(int64_t epochDay);

// Epoch days of the first and last supported dates.
int64_t HijrahMinEpochDay();
int64_t HijrahMaxEpochDay();

}  // namespace calendar
}  // namespace tempora

#endif /* tempora_calendar_HijrahCalendar_h */
