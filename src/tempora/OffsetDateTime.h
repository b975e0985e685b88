/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_OffsetDateTime_h
#define tempora_OffsetDateTime_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDateTime.h"
#include "tempora/ZoneOffset.h"

namespace tempora {

class Clock;
class Duration;
class Instant;
class OffsetTime;
class Period;
class ZoneId;
class ZonedDateTime;

/**
 * A date-time with an offset from UTC, such as 2007-12-03T10:15:30+01:00.
 *
 * Equality compares both the local date-time and the offset. isEqual() and
 * friends compare the instant only.
 */
class OffsetDateTime final {
  LocalDateTime dateTime_;
  ZoneOffset offset_;

  OffsetDateTime with(const LocalDateTime& dateTime,
                      const ZoneOffset& offset) const {
    if (dateTime_ == dateTime && offset_ == offset) {
      return *this;
    }
    return OffsetDateTime(dateTime, offset);
  }

 public:
  constexpr OffsetDateTime() = default;
  constexpr OffsetDateTime(const LocalDateTime& dateTime,
                           const ZoneOffset& offset)
      : dateTime_(dateTime), offset_(offset) {}

  static constexpr OffsetDateTime Min() {
    return OffsetDateTime(LocalDateTime::Min(), ZoneOffset::Max());
  }
  static constexpr OffsetDateTime Max() {
    return OffsetDateTime(LocalDateTime::Max(), ZoneOffset::Min());
  }

  static OffsetDateTime Of(const LocalDate& date, const LocalTime& time,
                           const ZoneOffset& offset) {
    return OffsetDateTime(LocalDateTime(date, time), offset);
  }
  static DateTimeResult<OffsetDateTime> Of(int32_t year, int32_t month,
                                           int32_t dayOfMonth, int32_t hour,
                                           int32_t minute, int32_t second,
                                           int32_t nanoOfSecond,
                                           const ZoneOffset& offset);
  static DateTimeResult<OffsetDateTime> OfInstant(const Instant& instant,
                                                  const ZoneOffset& offset);
  static DateTimeResult<OffsetDateTime> OfInstant(const Instant& instant,
                                                  const ZoneId& zone);
  static OffsetDateTime Now(const Clock& clock);

  /**
   * Parses text such as "2007-12-03T10:15:30+01:00".
   */
  static DateTimeResult<OffsetDateTime> Parse(std::string_view text);

  /**
   * Orders by instant only, ignoring the local date-time.
   */
  static int32_t TimeLineOrder(const OffsetDateTime& a,
                               const OffsetDateTime& b);

  const LocalDateTime& toLocalDateTime() const { return dateTime_; }
  const LocalDate& toLocalDate() const { return dateTime_.toLocalDate(); }
  const LocalTime& toLocalTime() const { return dateTime_.toLocalTime(); }
  const ZoneOffset& getOffset() const { return offset_; }

  int32_t getYear() const { return dateTime_.getYear(); }
  int32_t getMonthValue() const { return dateTime_.getMonthValue(); }
  Month getMonth() const { return dateTime_.getMonth(); }
  int32_t getDayOfMonth() const { return dateTime_.getDayOfMonth(); }
  int32_t getDayOfYear() const { return dateTime_.getDayOfYear(); }
  DayOfWeek getDayOfWeek() const { return dateTime_.getDayOfWeek(); }
  int32_t getHour() const { return dateTime_.getHour(); }
  int32_t getMinute() const { return dateTime_.getMinute(); }
  int32_t getSecond() const { return dateTime_.getSecond(); }
  int32_t getNano() const { return dateTime_.getNano(); }

  bool isSupported(ChronoField) const { return true; }
  bool isSupported(ChronoUnit unit) const {
    return dateTime_.isSupported(unit);
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<OffsetDateTime> with(ChronoField field,
                                      int64_t newValue) const;
  OffsetDateTime with(const LocalDateTime& dateTime) const {
    return with(dateTime, offset_);
  }
  DateTimeResult<OffsetDateTime> withYear(int32_t year) const;
  DateTimeResult<OffsetDateTime> withMonth(int32_t month) const;
  DateTimeResult<OffsetDateTime> withDayOfMonth(int32_t dayOfMonth) const;
  DateTimeResult<OffsetDateTime> withDayOfYear(int32_t dayOfYear) const;
  DateTimeResult<OffsetDateTime> withHour(int32_t hour) const;
  DateTimeResult<OffsetDateTime> withMinute(int32_t minute) const;
  DateTimeResult<OffsetDateTime> withSecond(int32_t second) const;
  DateTimeResult<OffsetDateTime> withNano(int32_t nanoOfSecond) const;

  OffsetDateTime withOffsetSameLocal(const ZoneOffset& offset) const {
    return with(dateTime_, offset);
  }

  /**
   * Same instant with a different offset. Fails only if the adjusted local
   * date-time leaves the supported range.
   */
  DateTimeResult<OffsetDateTime> withOffsetSameInstant(
      const ZoneOffset& offset) const;

  DateTimeResult<OffsetDateTime> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<OffsetDateTime> plus(int64_t amountToAdd,
                                      ChronoUnit unit) const;
  DateTimeResult<OffsetDateTime> plus(const Duration& duration) const;
  DateTimeResult<OffsetDateTime> plus(const Period& period) const;
  DateTimeResult<OffsetDateTime> plusYears(int64_t years) const;
  DateTimeResult<OffsetDateTime> plusMonths(int64_t months) const;
  DateTimeResult<OffsetDateTime> plusWeeks(int64_t weeks) const;
  DateTimeResult<OffsetDateTime> plusDays(int64_t days) const;
  DateTimeResult<OffsetDateTime> plusHours(int64_t hours) const;
  DateTimeResult<OffsetDateTime> plusMinutes(int64_t minutes) const;
  DateTimeResult<OffsetDateTime> plusSeconds(int64_t seconds) const;
  DateTimeResult<OffsetDateTime> plusNanos(int64_t nanos) const;

  DateTimeResult<OffsetDateTime> minus(int64_t amountToSubtract,
                                       ChronoUnit unit) const;
  DateTimeResult<OffsetDateTime> minus(const Duration& duration) const;
  DateTimeResult<OffsetDateTime> minus(const Period& period) const;
  DateTimeResult<OffsetDateTime> minusYears(int64_t years) const;
  DateTimeResult<OffsetDateTime> minusMonths(int64_t months) const;
  DateTimeResult<OffsetDateTime> minusWeeks(int64_t weeks) const;
  DateTimeResult<OffsetDateTime> minusDays(int64_t days) const;
  DateTimeResult<OffsetDateTime> minusHours(int64_t hours) const;
  DateTimeResult<OffsetDateTime> minusMinutes(int64_t minutes) const;
  DateTimeResult<OffsetDateTime> minusSeconds(int64_t seconds) const;
  DateTimeResult<OffsetDateTime> minusNanos(int64_t nanos) const;

  /**
   * Amount of time until `end`, after converting `end` to this offset.
   */
  DateTimeResult<int64_t> until(const OffsetDateTime& end,
                                ChronoUnit unit) const;

  DateTimeResult<ZonedDateTime> atZoneSameInstant(const ZoneId& zone) const;
  DateTimeResult<ZonedDateTime> atZoneSimilarLocal(const ZoneId& zone) const;

  OffsetTime toOffsetTime() const;
  ZonedDateTime toZonedDateTime() const;
  DateTimeResult<Instant> toInstant() const;
  int64_t toEpochSecond() const { return dateTime_.toEpochSecond(offset_); }

  /**
   * Orders by instant, then by local date-time.
   */
  int32_t compareTo(const OffsetDateTime& other) const;

  bool isAfter(const OffsetDateTime& other) const {
    return TimeLineOrder(*this, other) > 0;
  }
  bool isBefore(const OffsetDateTime& other) const {
    return TimeLineOrder(*this, other) < 0;
  }
  bool isEqual(const OffsetDateTime& other) const {
    return TimeLineOrder(*this, other) == 0;
  }

  bool operator==(const OffsetDateTime& other) const {
    return dateTime_ == other.dateTime_ && offset_ == other.offset_;
  }
  bool operator!=(const OffsetDateTime& other) const {
    return !(*this == other);
  }

  std::string toString() const {
    return dateTime_.toString() + offset_.toString();
  }
};

}  // namespace tempora

#endif /* tempora_OffsetDateTime_h */
