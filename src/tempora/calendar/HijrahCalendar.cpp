/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/calendar/HijrahCalendar.h"

#include "tempora/CheckedArithmetic.h"

using namespace tempora;
using namespace tempora::calendar;

// Days from the start of a cycle to the start of each of its years.
static constexpr int32_t CycleYearStart[30] = {
    0,    354,  709,  1063, 1417, 1772, 2126, 2481, 2835, 3189,
    3544, 3898, 4252, 4607, 4961, 5315, 5670, 6024, 6379, 6733,
    7087, 7442, 7796, 8150, 8505, 8859, 9214, 9568, 9922, 10277,
};

int64_t tempora::calendar::HijrahYearStart(int32_t year) {
  // Years before 1 AH repeat the cycle backwards.
  int64_t cycle = FloorDiv<int64_t>(int64_t(year) - 1, 30);
  int32_t yearInCycle = int32_t(FloorMod<int64_t>(int64_t(year) - 1, 30));
  return HijrahEpochDay + cycle * HijrahDaysInCycle +
         CycleYearStart[yearInCycle];
}

int64_t tempora::calendar::HijrahToEpochDay(const HijrahDate& date) {
  return HijrahYearStart(date.year) + HijrahDaysBeforeMonth(date.month) +
         date.day - 1;
}

HijrahDate tempora::calendar::HijrahFromEpochDay(int64_t epochDay) {
  TEMPORA_ASSERT(epochDay >= HijrahMinEpochDay() &&
                 epochDay <= HijrahMaxEpochDay());

  int64_t days = epochDay - HijrahEpochDay;
  int64_t cycle = FloorDiv<int64_t>(days, HijrahDaysInCycle);
  int32_t dayOfCycle = int32_t(FloorMod<int64_t>(days, HijrahDaysInCycle));

  int32_t yearInCycle = 29;
  while (CycleYearStart[yearInCycle] > dayOfCycle) {
    yearInCycle--;
  }
  int32_t dayOfYear = dayOfCycle - CycleYearStart[yearInCycle];

  int32_t month = 12;
  while (HijrahDaysBeforeMonth(month) > dayOfYear) {
    month--;
  }

  HijrahDate date;
  date.year = int32_t(cycle * 30 + yearInCycle + 1);
  date.month = month;
  date.day = dayOfYear - HijrahDaysBeforeMonth(month) + 1;
  return date;
}

int64_t tempora::calendar::HijrahMinEpochDay() {
  return HijrahYearStart(HijrahMinYear);
}

int64_t tempora::calendar::HijrahMaxEpochDay() {
  return HijrahYearStart(HijrahMaxYear) + HijrahDaysInYear(HijrahMaxYear) - 1;
}
