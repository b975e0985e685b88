/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Duration_h
#define tempora_Duration_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/Assertions.h"
#include "tempora/DateTimeError.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class Instant;
class LocalDateTime;
class LocalTime;

/**
 * A time-based amount of time, such as "34.5 seconds".
 *
 * Stored as signed seconds plus a nano-of-second adjustment which is always
 * in the range 0 to 999,999,999. A duration of -1 nanosecond is stored as
 * -1 second plus 999,999,999 nanoseconds.
 */
class Duration final {
  int64_t seconds_ = 0;
  int32_t nanos_ = 0;

  constexpr Duration(int64_t seconds, int32_t nanos)
      : seconds_(seconds), nanos_(nanos) {
    TEMPORA_ASSERT(0 <= nanos && nanos <= 999'999'999);
  }

  DateTimeResult<Duration> plus(int64_t secondsToAdd,
                                int64_t nanosToAdd) const;

 public:
  static constexpr int64_t NanosPerSecond = 1'000'000'000;

  constexpr Duration() = default;

  static constexpr Duration Zero() { return Duration(); }

  static DateTimeResult<Duration> OfDays(int64_t days);
  static DateTimeResult<Duration> OfHours(int64_t hours);
  static DateTimeResult<Duration> OfMinutes(int64_t minutes);
  static Duration OfSeconds(int64_t seconds) { return Duration(seconds, 0); }

  /**
   * Obtains a duration from seconds and a nanosecond adjustment, which may be
   * negative or exceed one second.
   */
  static DateTimeResult<Duration> OfSeconds(int64_t seconds,
                                            int64_t nanoAdjustment);
  static Duration OfMillis(int64_t millis);
  static Duration OfNanos(int64_t nanos);
  static DateTimeResult<Duration> Of(int64_t amount, ChronoUnit unit);

  /**
   * Creates a duration from already normalized fields.
   */
  static constexpr Duration OfSecondsUnchecked(int64_t seconds,
                                               int32_t nanos) {
    return Duration(seconds, nanos);
  }

  /**
   * Duration between two instants. Negative if `end` is before `start`.
   */
  static DateTimeResult<Duration> Between(const Instant& start,
                                          const Instant& end);
  static Duration Between(const LocalTime& start, const LocalTime& end);
  static DateTimeResult<Duration> Between(const LocalDateTime& start,
                                          const LocalDateTime& end);

  /**
   * Parses the ISO-8601 form PnDTnHnMn.nS, with an optional sign before the
   * P and before each number. Letters are case insensitive and the fraction
   * separator may be '.' or ','.
   */
  static DateTimeResult<Duration> Parse(std::string_view text);

  int64_t getSeconds() const { return seconds_; }
  int32_t getNano() const { return nanos_; }

  /**
   * The value of the Seconds or Nanos unit.
   */
  DateTimeResult<int64_t> get(ChronoUnit unit) const;

  bool isZero() const { return (seconds_ | nanos_) == 0; }
  bool isNegative() const { return seconds_ < 0; }

  Duration withSeconds(int64_t seconds) const {
    return Duration(seconds, nanos_);
  }
  DateTimeResult<Duration> withNanos(int32_t nanoOfSecond) const;

  DateTimeResult<Duration> plus(const Duration& duration) const;
  DateTimeResult<Duration> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<Duration> plusDays(int64_t days) const;
  DateTimeResult<Duration> plusHours(int64_t hours) const;
  DateTimeResult<Duration> plusMinutes(int64_t minutes) const;
  DateTimeResult<Duration> plusSeconds(int64_t seconds) const {
    return plus(seconds, 0);
  }
  DateTimeResult<Duration> plusMillis(int64_t millis) const {
    return plus(millis / 1000, (millis % 1000) * 1'000'000);
  }
  DateTimeResult<Duration> plusNanos(int64_t nanos) const {
    return plus(0, nanos);
  }

  DateTimeResult<Duration> minus(const Duration& duration) const;
  DateTimeResult<Duration> minus(int64_t amountToSubtract,
                                 ChronoUnit unit) const;
  DateTimeResult<Duration> minusDays(int64_t days) const;
  DateTimeResult<Duration> minusHours(int64_t hours) const;
  DateTimeResult<Duration> minusMinutes(int64_t minutes) const;
  DateTimeResult<Duration> minusSeconds(int64_t seconds) const;
  DateTimeResult<Duration> minusMillis(int64_t millis) const;
  DateTimeResult<Duration> minusNanos(int64_t nanos) const;

  DateTimeResult<Duration> multipliedBy(int64_t multiplicand) const;

  /**
   * Divides, truncating towards zero at nanosecond precision. Dividing by
   * zero is an arithmetic error.
   */
  DateTimeResult<Duration> dividedBy(int64_t divisor) const;

  DateTimeResult<Duration> negated() const { return multipliedBy(-1); }
  DateTimeResult<Duration> abs() const {
    return isNegative() ? negated() : DateTimeResult<Duration>(*this);
  }

  int64_t toDays() const { return seconds_ / 86400; }
  int64_t toHours() const { return seconds_ / 3600; }
  int64_t toMinutes() const { return seconds_ / 60; }
  DateTimeResult<int64_t> toMillis() const;
  DateTimeResult<int64_t> toNanos() const;

  int32_t compareTo(const Duration& other) const;

  bool operator==(const Duration& other) const {
    return seconds_ == other.seconds_ && nanos_ == other.nanos_;
  }
  bool operator!=(const Duration& other) const { return !(*this == other); }
  bool operator<(const Duration& other) const { return compareTo(other) < 0; }

  /**
   * ISO-8601 representation, e.g. "PT8H6M12.345S". Days are output as
   * hours.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_Duration_h */
