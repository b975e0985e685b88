/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Instant_h
#define tempora_Instant_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class Clock;
class Duration;
class OffsetDateTime;
class ZoneId;
class ZoneOffset;
class ZonedDateTime;

/**
 * An instantaneous point on the time-line, counted in seconds and
 * nanoseconds from 1970-01-01T00:00:00Z.
 *
 * The supported range is -1000000000-01-01T00:00Z to
 * 1000000000-12-31T23:59:59.999999999Z.
 */
class Instant final {
  int64_t seconds_ = 0;
  int32_t nanos_ = 0;

  constexpr Instant(int64_t epochSecond, int32_t nanos)
      : seconds_(epochSecond), nanos_(nanos) {}

  static DateTimeResult<Instant> Create(int64_t seconds, int32_t nanoOfSecond);

  DateTimeResult<Instant> plus(int64_t secondsToAdd, int64_t nanosToAdd) const;
  DateTimeResult<int64_t> nanosUntil(const Instant& end) const;
  DateTimeResult<int64_t> secondsUntil(const Instant& end) const;

 public:
  static constexpr int64_t MinSecond = -31557014167219200LL;
  static constexpr int64_t MaxSecond = 31556889864403199LL;

  constexpr Instant() = default;

  static constexpr Instant Epoch() { return Instant(); }
  static constexpr Instant Min() { return Instant(MinSecond, 0); }
  static constexpr Instant Max() { return Instant(MaxSecond, 999'999'999); }

  static DateTimeResult<Instant> OfEpochSecond(int64_t epochSecond);
  static DateTimeResult<Instant> OfEpochSecond(int64_t epochSecond,
                                               int64_t nanoAdjustment);
  static Instant OfEpochMilli(int64_t epochMilli);

  static Instant Now(const Clock& clock);

  /**
   * Parses text such as "2007-12-03T10:15:30.00Z". The time must include
   * seconds and the offset must be 'Z'.
   */
  static DateTimeResult<Instant> Parse(std::string_view text);

  int64_t getEpochSecond() const { return seconds_; }
  int32_t getNano() const { return nanos_; }

  bool isSupported(ChronoField field) const {
    return field == ChronoField::InstantSeconds ||
           field == ChronoField::NanoOfSecond ||
           field == ChronoField::MicroOfSecond ||
           field == ChronoField::MilliOfSecond;
  }
  bool isSupported(ChronoUnit unit) const {
    return IsTimeBased(unit) || unit == ChronoUnit::Days;
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<Instant> with(ChronoField field, int64_t newValue) const;
  DateTimeResult<Instant> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<Instant> plus(const Duration& duration) const;
  DateTimeResult<Instant> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<Instant> plusSeconds(int64_t seconds) const {
    return plus(seconds, 0);
  }
  DateTimeResult<Instant> plusMillis(int64_t millis) const {
    return plus(millis / 1000, (millis % 1000) * 1000'000);
  }
  DateTimeResult<Instant> plusNanos(int64_t nanos) const {
    return plus(0, nanos);
  }

  DateTimeResult<Instant> minus(const Duration& duration) const;
  DateTimeResult<Instant> minus(int64_t amountToSubtract,
                                ChronoUnit unit) const;
  DateTimeResult<Instant> minusSeconds(int64_t seconds) const;
  DateTimeResult<Instant> minusMillis(int64_t millis) const;
  DateTimeResult<Instant> minusNanos(int64_t nanos) const;

  DateTimeResult<int64_t> until(const Instant& end, ChronoUnit unit) const;

  DateTimeResult<OffsetDateTime> atOffset(const ZoneOffset& offset) const;
  DateTimeResult<ZonedDateTime> atZone(const ZoneId& zone) const;

  DateTimeResult<int64_t> toEpochMilli() const;

  int32_t compareTo(const Instant& other) const {
    if (seconds_ != other.seconds_) {
      return seconds_ < other.seconds_ ? -1 : 1;
    }
    return nanos_ - other.nanos_;
  }

  bool isAfter(const Instant& other) const { return compareTo(other) > 0; }
  bool isBefore(const Instant& other) const { return compareTo(other) < 0; }

  bool operator==(const Instant& other) const {
    return seconds_ == other.seconds_ && nanos_ == other.nanos_;
  }
  bool operator!=(const Instant& other) const { return !(*this == other); }
  bool operator<(const Instant& other) const { return isBefore(other); }

  /**
   * ISO-8601 text in UTC, such as "2011-12-03T10:15:30Z". Seconds are always
   * printed; fractions use three, six or nine digits as needed.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_Instant_h */
