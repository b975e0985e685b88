/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/TemporalUnit.h"

#include <limits>

#include "tempora/Duration.h"

namespace tempora {

const char* UnitName(ChronoUnit unit) {
  switch (unit) {
    case ChronoUnit::Nanos:
      return "Nanos";
    case ChronoUnit::Micros:
      return "Micros";
    case ChronoUnit::Millis:
      return "Millis";
    case ChronoUnit::Seconds:
      return "Seconds";
    case ChronoUnit::Minutes:
      return "Minutes";
    case ChronoUnit::Hours:
      return "Hours";
    case ChronoUnit::HalfDays:
      return "HalfDays";
    case ChronoUnit::Days:
      return "Days";
    case ChronoUnit::Weeks:
      return "Weeks";
    case ChronoUnit::Months:
      return "Months";
    case ChronoUnit::Years:
      return "Years";
    case ChronoUnit::Decades:
      return "Decades";
    case ChronoUnit::Centuries:
      return "Centuries";
    case ChronoUnit::Millennia:
      return "Millennia";
    case ChronoUnit::Eras:
      return "Eras";
    case ChronoUnit::Forever:
      return "Forever";
  }
  TEMPORA_CRASH("invalid unit");
}

Duration UnitDuration(ChronoUnit unit) {
  // Seconds in an average Gregorian year.
  constexpr int64_t secondsPerYear = 31'556'952;

  switch (unit) {
    case ChronoUnit::Nanos:
    case ChronoUnit::Micros:
    case ChronoUnit::Millis:
      return Duration::OfNanos(UnitNanos(unit));
    case ChronoUnit::Seconds:
      return Duration::OfSecondsUnchecked(1, 0);
    case ChronoUnit::Minutes:
      return Duration::OfSecondsUnchecked(60, 0);
    case ChronoUnit::Hours:
      return Duration::OfSecondsUnchecked(3600, 0);
    case ChronoUnit::HalfDays:
      return Duration::OfSecondsUnchecked(43200, 0);
    case ChronoUnit::Days:
      return Duration::OfSecondsUnchecked(86400, 0);
    case ChronoUnit::Weeks:
      return Duration::OfSecondsUnchecked(7 * 86400, 0);
    case ChronoUnit::Months:
      return Duration::OfSecondsUnchecked(secondsPerYear / 12, 0);
    case ChronoUnit::Years:
      return Duration::OfSecondsUnchecked(secondsPerYear, 0);
    case ChronoUnit::Decades:
      return Duration::OfSecondsUnchecked(secondsPerYear * 10, 0);
    case ChronoUnit::Centuries:
      return Duration::OfSecondsUnchecked(secondsPerYear * 100, 0);
    case ChronoUnit::Millennia:
      return Duration::OfSecondsUnchecked(secondsPerYear * 1000, 0);
    case ChronoUnit::Eras:
      return Duration::OfSecondsUnchecked(secondsPerYear * 1'000'000'000, 0);
    case ChronoUnit::Forever:
      return Duration::OfSecondsUnchecked(
          std::numeric_limits<int64_t>::max(), 999'999'999);
  }
  TEMPORA_CRASH("invalid unit");
}

DateTimeError UnsupportedUnitError(ChronoUnit unit) {
  return DateTimeError::UnsupportedField(
      Smprintf("Unsupported unit: %s", UnitName(unit)));
}

}  // namespace tempora
