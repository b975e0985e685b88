/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Month.h"

#include <array>

namespace tempora {

DateTimeResult<Month> MonthOf(int32_t month) {
  if (month < 1 || month > 12) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Invalid value for MonthOfYear: %d", month)));
  }
  return Month(month);
}

static constexpr auto FirstDayOfMonth(bool leapYear) {
  // Day of year for the first day of each month, where index 0 is January
  // and day 1 is January 1.
  std::array<int32_t, 13> days = {};
  days[0] = 1;
  for (int32_t month = 1; month <= 12; ++month) {
    days[month] = days[month - 1] + MonthLength(Month(month), leapYear);
  }
  return days;
}

int32_t FirstDayOfYear(Month month, bool leapYear) {
  // First day of month arrays for non-leap and leap years.
  constexpr decltype(FirstDayOfMonth(false)) firstDayOfMonth[2] = {
      FirstDayOfMonth(false), FirstDayOfMonth(true)};

  return firstDayOfMonth[leapYear][int32_t(month) - 1];
}

const char* MonthName(Month month) {
  static constexpr const char* names[] = {
      "JANUARY", "FEBRUARY", "MARCH",     "APRIL",   "MAY",      "JUNE",
      "JULY",    "AUGUST",   "SEPTEMBER", "OCTOBER", "NOVEMBER", "DECEMBER",
  };
  TEMPORA_ASSERT(int32_t(month) >= 1 && int32_t(month) <= 12);
  return names[int32_t(month) - 1];
}

}  // namespace tempora
