/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_TemporalUnit_h
#define tempora_TemporalUnit_h

#include <stdint.h>

#include "tempora/DateTimeError.h"

namespace tempora {

class Duration;

/**
 * The standard set of date periods units.
 */
enum class ChronoUnit : uint8_t {
  Nanos,
  Micros,
  Millis,
  Seconds,
  Minutes,
  Hours,
  HalfDays,
  Days,
  Weeks,
  Months,
  Years,
  Decades,
  Centuries,
  Millennia,
  Eras,
  Forever,
};

const char* UnitName(ChronoUnit unit);

/**
 * Return the estimated duration of the unit. Units from Days upwards are
 * estimates based on a 365.2425 day year.
 */
Duration UnitDuration(ChronoUnit unit);

constexpr bool IsDateBased(ChronoUnit unit) {
  return unit >= ChronoUnit::Days && unit != ChronoUnit::Forever;
}

constexpr bool IsTimeBased(ChronoUnit unit) {
  return unit < ChronoUnit::Days;
}

constexpr bool IsDurationEstimated(ChronoUnit unit) {
  return unit >= ChronoUnit::Days;
}

/**
 * Number of nanoseconds in a time-based unit or in a day.
 */
constexpr int64_t UnitNanos(ChronoUnit unit) {
  switch (unit) {
    case ChronoUnit::Nanos:
      return 1;
    case ChronoUnit::Micros:
      return 1'000;
    case ChronoUnit::Millis:
      return 1'000'000;
    case ChronoUnit::Seconds:
      return 1'000'000'000;
    case ChronoUnit::Minutes:
      return 60'000'000'000;
    case ChronoUnit::Hours:
      return 3'600'000'000'000;
    case ChronoUnit::HalfDays:
      return 43'200'000'000'000;
    case ChronoUnit::Days:
      return 86'400'000'000'000;
    default:
      return 0;
  }
}

DateTimeError UnsupportedUnitError(ChronoUnit unit);

}  // namespace tempora

#endif /* tempora_TemporalUnit_h */
