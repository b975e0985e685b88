/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/IsoCalendar.h"

#include <array>

namespace tempora {

static constexpr auto FirstDayOfMonth(int64_t year) {
  // The following array contains the day of year for the first day of each
  // month, where index 0 is January, and day 0 is January 1.
  std::array<int32_t, 13> days = {};
  for (int32_t month = 1; month <= 12; ++month) {
    days[month] = days[month - 1] + IsoDaysInMonth(year, month);
  }
  return days;
}

int32_t IsoDayOfYear(const IsoDate& isoDate) {
  const auto& [year, month, day] = isoDate;

  // First day of month arrays for non-leap and leap years.
  constexpr decltype(FirstDayOfMonth(0)) firstDayOfMonth[2] = {
      FirstDayOfMonth(1), FirstDayOfMonth(0)};

  return firstDayOfMonth[IsIsoLeapYear(year)][month - 1] + day;
}

IsoDate EpochDayToIsoDate(int64_t epochDay) {
  // Days in a 400 year cycle.
  constexpr int64_t daysPerCycle = 146'097;

  // Days from 0000-01-01 to 1970-01-01.
  constexpr int64_t days0000To1970 = (daysPerCycle * 5) - (30 * 365 + 7);

  // Count from March 1 of year zero, so the leap day is the last day of the
  // computed year.
  int64_t zeroDay = epochDay + days0000To1970 - 60;
  int64_t adjust = 0;
  if (zeroDay < 0) {
    int64_t adjustCycles = (zeroDay + 1) / daysPerCycle - 1;
    adjust = adjustCycles * 400;
    zeroDay += -adjustCycles * daysPerCycle;
  }

  int64_t yearEst = (400 * zeroDay + 591) / daysPerCycle;
  int64_t doyEst =
      zeroDay - (365 * yearEst + yearEst / 4 - yearEst / 100 + yearEst / 400);
  if (doyEst < 0) {
    yearEst--;
    doyEst = zeroDay -
             (365 * yearEst + yearEst / 4 - yearEst / 100 + yearEst / 400);
  }
  yearEst += adjust;

  int32_t marchDoy0 = int32_t(doyEst);
  int32_t marchMonth0 = (marchDoy0 * 5 + 2) / 153;
  int32_t month = (marchMonth0 + 2) % 12 + 1;
  int32_t dom = marchDoy0 - (marchMonth0 * 306 + 5) / 10 + 1;
  yearEst += marchMonth0 / 10;

  return {yearEst, month, dom};
}

}  // namespace tempora
