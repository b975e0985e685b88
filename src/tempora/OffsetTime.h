/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_OffsetTime_h
#define tempora_OffsetTime_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalTime.h"
#include "tempora/ZoneOffset.h"

namespace tempora {

class Clock;
class Instant;
class LocalDate;
class OffsetDateTime;
class ZoneId;

/**
 * A time with an offset from UTC, such as 10:15:30+01:00.
 */
class OffsetTime final {
  LocalTime time_;
  ZoneOffset offset_;

  OffsetTime with(const LocalTime& time, const ZoneOffset& offset) const {
    if (time_ == time && offset_ == offset) {
      return *this;
    }
    return OffsetTime(time, offset);
  }

  // Nanoseconds of the day, adjusted to UTC.
  int64_t toEpochNano() const;

 public:
  constexpr OffsetTime() = default;
  constexpr OffsetTime(const LocalTime& time, const ZoneOffset& offset)
      : time_(time), offset_(offset) {}

  static constexpr OffsetTime Min() {
    return OffsetTime(LocalTime::Min(), ZoneOffset::Max());
  }
  static constexpr OffsetTime Max() {
    return OffsetTime(LocalTime::Max(), ZoneOffset::Min());
  }

  static DateTimeResult<OffsetTime> Of(int32_t hour, int32_t minute,
                                       int32_t second, int32_t nanoOfSecond,
                                       const ZoneOffset& offset);
  static DateTimeResult<OffsetTime> OfInstant(const Instant& instant,
                                              const ZoneId& zone);
  static OffsetTime Now(const Clock& clock);

  /**
   * Parses text such as "10:15:30+01:00".
   */
  static DateTimeResult<OffsetTime> Parse(std::string_view text);

  const LocalTime& toLocalTime() const { return time_; }
  const ZoneOffset& getOffset() const { return offset_; }
  int32_t getHour() const { return time_.getHour(); }
  int32_t getMinute() const { return time_.getMinute(); }
  int32_t getSecond() const { return time_.getSecond(); }
  int32_t getNano() const { return time_.getNano(); }

  bool isSupported(ChronoField field) const {
    return IsTimeBased(field) || field == ChronoField::OffsetSeconds;
  }
  bool isSupported(ChronoUnit unit) const { return IsTimeBased(unit); }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<OffsetTime> with(ChronoField field, int64_t newValue) const;
  OffsetTime with(const LocalTime& time) const { return with(time, offset_); }
  DateTimeResult<OffsetTime> withHour(int32_t hour) const;
  DateTimeResult<OffsetTime> withMinute(int32_t minute) const;
  DateTimeResult<OffsetTime> withSecond(int32_t second) const;
  DateTimeResult<OffsetTime> withNano(int32_t nanoOfSecond) const;

  /**
   * Same local time with a different offset.
   */
  OffsetTime withOffsetSameLocal(const ZoneOffset& offset) const {
    return with(time_, offset);
  }

  /**
   * Same instant with a different offset, adjusting the local time by the
   * difference between the offsets.
   */
  OffsetTime withOffsetSameInstant(const ZoneOffset& offset) const;

  DateTimeResult<OffsetTime> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<OffsetTime> plus(int64_t amountToAdd, ChronoUnit unit) const;
  OffsetTime plusHours(int64_t hours) const {
    return with(time_.plusHours(hours), offset_);
  }
  OffsetTime plusMinutes(int64_t minutes) const {
    return with(time_.plusMinutes(minutes), offset_);
  }
  OffsetTime plusSeconds(int64_t seconds) const {
    return with(time_.plusSeconds(seconds), offset_);
  }
  OffsetTime plusNanos(int64_t nanos) const {
    return with(time_.plusNanos(nanos), offset_);
  }

  DateTimeResult<OffsetTime> minus(int64_t amountToSubtract,
                                   ChronoUnit unit) const;
  OffsetTime minusHours(int64_t hours) const {
    return with(time_.minusHours(hours), offset_);
  }
  OffsetTime minusMinutes(int64_t minutes) const {
    return with(time_.minusMinutes(minutes), offset_);
  }
  OffsetTime minusSeconds(int64_t seconds) const {
    return with(time_.minusSeconds(seconds), offset_);
  }
  OffsetTime minusNanos(int64_t nanos) const {
    return with(time_.minusNanos(nanos), offset_);
  }

  /**
   * Amount of time until `end`, measured after normalizing both to UTC.
   */
  DateTimeResult<int64_t> until(const OffsetTime& end, ChronoUnit unit) const;

  OffsetDateTime atDate(const LocalDate& date) const;

  /**
   * Orders by the UTC time of day, then by local time.
   */
  int32_t compareTo(const OffsetTime& other) const;

  bool isAfter(const OffsetTime& other) const {
    return toEpochNano() > other.toEpochNano();
  }
  bool isBefore(const OffsetTime& other) const {
    return toEpochNano() < other.toEpochNano();
  }
  bool isEqual(const OffsetTime& other) const {
    return toEpochNano() == other.toEpochNano();
  }

  bool operator==(const OffsetTime& other) const {
    return time_ == other.time_ && offset_ == other.offset_;
  }
  bool operator!=(const OffsetTime& other) const { return !(*this == other); }

  std::string toString() const {
    return time_.toString() + offset_.toString();
  }
};

}  // namespace tempora

#endif /* tempora_OffsetTime_h */
