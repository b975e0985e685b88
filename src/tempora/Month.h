/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Month_h
#define tempora_Month_h

#include <stdint.h>

#include "tempora/CheckedArithmetic.h"
#include "tempora/DateTimeError.h"

namespace tempora {

/**
 * Month of year in the ISO calendar, numbered from 1 (January) to
 * 12 (December).
 */
enum class Month : int32_t {
  January = 1,
  February,
  March,
  April,
  May,
  June,
  July,
  August,
  September,
  October,
  November,
  December,
};

DateTimeResult<Month> MonthOf(int32_t month);

/**
 * Return the month `months` after `month`, wrapping around the year.
 */
constexpr Month PlusMonths(Month month, int64_t months) {
  int64_t amount = months % 12;
  return Month(
      int32_t(FloorMod<int64_t>(int64_t(month) - 1 + amount + 12, 12)) + 1);
}

/**
 * Length of the month in days.
 */
constexpr int32_t MonthLength(Month month, bool leapYear) {
  switch (month) {
    case Month::February:
      return leapYear ? 29 : 28;
    case Month::April:
    case Month::June:
    case Month::September:
    case Month::November:
      return 30;
    default:
      return 31;
  }
}

constexpr int32_t MonthMinLength(Month month) {
  return MonthLength(month, false);
}

constexpr int32_t MonthMaxLength(Month month) {
  return MonthLength(month, true);
}

/**
 * Day-of-year for the first day of `month`, from 1 to 336.
 */
int32_t FirstDayOfYear(Month month, bool leapYear);

/**
 * The first month of the quarter containing `month`.
 */
constexpr Month FirstMonthOfQuarter(Month month) {
  return Month(((int32_t(month) - 1) / 3) * 3 + 1);
}

/**
 * Upper case English name, e.g. "MARCH".
 */
const char* MonthName(Month month);

}  // namespace tempora

#endif /* tempora_Month_h */
