/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/TemporalFields.h"

#include <array>
#include <limits>

namespace tempora {

// Limits of the proleptic year, shared with LocalDate.
static constexpr int64_t MinYear = -999'999'999;
static constexpr int64_t MaxYear = 999'999'999;

static constexpr int64_t NanosPerDay = 86'400'000'000'000;

struct FieldInfo {
  const char* name;
  ValueRange range;
};

static constexpr std::array<FieldInfo, ChronoFieldCount> fieldInfos = {{
    {"NanoOfSecond", ValueRange::Fixed(0, 999'999'999)},
    {"NanoOfDay", ValueRange::Fixed(0, NanosPerDay - 1)},
    {"MicroOfSecond", ValueRange::Fixed(0, 999'999)},
    {"MicroOfDay", ValueRange::Fixed(0, NanosPerDay / 1000 - 1)},
    {"MilliOfSecond", ValueRange::Fixed(0, 999)},
    {"MilliOfDay", ValueRange::Fixed(0, NanosPerDay / 1'000'000 - 1)},
    {"SecondOfMinute", ValueRange::Fixed(0, 59)},
    {"SecondOfDay", ValueRange::Fixed(0, 86'400 - 1)},
    {"MinuteOfHour", ValueRange::Fixed(0, 59)},
    {"MinuteOfDay", ValueRange::Fixed(0, (24 * 60) - 1)},
    {"HourOfAmPm", ValueRange::Fixed(0, 11)},
    {"ClockHourOfAmPm", ValueRange::Fixed(1, 12)},
    {"HourOfDay", ValueRange::Fixed(0, 23)},
    {"ClockHourOfDay", ValueRange::Fixed(1, 24)},
    {"AmPmOfDay", ValueRange::Fixed(0, 1)},
    {"DayOfWeek", ValueRange::Fixed(1, 7)},
    {"AlignedDayOfWeekInMonth", ValueRange::Fixed(1, 7)},
    {"AlignedDayOfWeekInYear", ValueRange::Fixed(1, 7)},
    {"DayOfMonth", ValueRange::Fixed(1, 28, 31)},
    {"DayOfYear", ValueRange::Fixed(1, 365, 366)},
    {"EpochDay",
     ValueRange::Fixed(int64_t(MinYear * 365.25), int64_t(MaxYear * 365.25))},
    {"AlignedWeekOfMonth", ValueRange::Fixed(1, 4, 5)},
    {"AlignedWeekOfYear", ValueRange::Fixed(1, 53)},
    {"MonthOfYear", ValueRange::Fixed(1, 12)},
    {"ProlepticMonth", ValueRange::Fixed(MinYear * 12, MaxYear * 12 + 11)},
    {"YearOfEra", ValueRange::Fixed(1, MaxYear, MaxYear + 1)},
    {"Year", ValueRange::Fixed(MinYear, MaxYear)},
    {"Era", ValueRange::Fixed(0, 1)},
    {"InstantSeconds",
     ValueRange::Fixed(std::numeric_limits<int64_t>::min(),
                       std::numeric_limits<int64_t>::max())},
    {"OffsetSeconds", ValueRange::Fixed(-18 * 3600, 18 * 3600)},
}};

const char* FieldName(ChronoField field) {
  return fieldInfos[size_t(field)].name;
}

ValueRange FieldRange(ChronoField field) {
  return fieldInfos[size_t(field)].range;
}

DateTimeError UnsupportedFieldError(ChronoField field) {
  return DateTimeError::UnsupportedField(
      Smprintf("Unsupported field: %s", FieldName(field)));
}

}  // namespace tempora
