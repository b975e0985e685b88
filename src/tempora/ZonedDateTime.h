/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_ZonedDateTime_h
#define tempora_ZonedDateTime_h

#include <stdint.h>

#include <optional>
#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDateTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"
#include "tempora/ValueRange.h"
#include "tempora/ZoneId.h"
#include "tempora/ZoneOffset.h"

namespace tempora {

class Clock;
class Duration;
class Instant;
class Period;

namespace zone {
class ZoneRulesRegistry;
}  // namespace zone

/**
 * A date-time in a time-zone, such as 2007-12-03T10:15:30+01:00[Europe/Paris].
 *
 * The offset is always one of the valid offsets of the zone for the local
 * date-time. Operations on the local time-line (date units, field
 * adjustment) resolve the result against the zone, keeping the current
 * offset where it is still valid. Operations on the instant time-line (time
 * units, durations) keep the instant exact and recompute the local
 * date-time.
 */
class ZonedDateTime final {
  LocalDateTime dateTime_;
  ZoneOffset offset_;
  ZoneId zone_;

  ZonedDateTime(const LocalDateTime& dateTime, const ZoneOffset& offset,
                const ZoneId& zone)
      : dateTime_(dateTime), offset_(offset), zone_(zone) {}

  static DateTimeResult<ZonedDateTime> Create(int64_t epochSecond,
                                              int32_t nanoOfSecond,
                                              const ZoneId& zone);

  DateTimeResult<ZonedDateTime> resolveLocal(
      const LocalDateTime& newDateTime) const {
    return OfLocal(newDateTime, zone_, offset_);
  }
  DateTimeResult<ZonedDateTime> resolveInstant(
      const LocalDateTime& newDateTime) const {
    return OfInstant(newDateTime, offset_, zone_);
  }
  ZonedDateTime resolveOffset(const ZoneOffset& offset) const;

 public:
  /**
   * Resolves a local date-time in a zone. In a gap the local date-time is
   * moved later by the length of the gap. In an overlap the earlier offset
   * is used.
   */
  static DateTimeResult<ZonedDateTime> Of(const LocalDateTime& dateTime,
                                          const ZoneId& zone) {
    return OfLocal(dateTime, zone, std::nullopt);
  }
  static DateTimeResult<ZonedDateTime> Of(const LocalDate& date,
                                          const LocalTime& time,
                                          const ZoneId& zone) {
    return Of(LocalDateTime(date, time), zone);
  }
  static DateTimeResult<ZonedDateTime> Of(int32_t year, int32_t month,
                                          int32_t dayOfMonth, int32_t hour,
                                          int32_t minute, int32_t second,
                                          int32_t nanoOfSecond,
                                          const ZoneId& zone);

  /**
   * Like Of, but in an overlap `preferredOffset` is used if it is one of
   * the two valid offsets.
   */
  static DateTimeResult<ZonedDateTime> OfLocal(
      const LocalDateTime& dateTime, const ZoneId& zone,
      const std::optional<ZoneOffset>& preferredOffset);

  static DateTimeResult<ZonedDateTime> OfInstant(const Instant& instant,
                                                 const ZoneId& zone);

  /**
   * The instant described by `dateTime` at `offset`, seen in `zone`.
   */
  static DateTimeResult<ZonedDateTime> OfInstant(const LocalDateTime& dateTime,
                                                 const ZoneOffset& offset,
                                                 const ZoneId& zone);

  /**
   * Fails unless `offset` is valid for `dateTime` in `zone`.
   */
  static DateTimeResult<ZonedDateTime> OfStrict(const LocalDateTime& dateTime,
                                                const ZoneOffset& offset,
                                                const ZoneId& zone);

  /**
   * A zoned date-time whose zone is the fixed offset itself.
   */
  static ZonedDateTime OfFixed(const LocalDateTime& dateTime,
                               const ZoneOffset& offset) {
    return ZonedDateTime(dateTime, offset, ZoneId::Of(offset));
  }

  static ZonedDateTime Now(const Clock& clock);

  /**
   * Parses text such as "2007-12-03T10:15:30+01:00[Europe/Paris]". Without
   * a bracketed zone the offset is the zone. A bracketed region is
   * resolved through `registry` and the offset must be valid in it.
   */
  static DateTimeResult<ZonedDateTime> Parse(
      std::string_view text, const zone::ZoneRulesRegistry& registry);

  const LocalDateTime& toLocalDateTime() const { return dateTime_; }
  const LocalDate& toLocalDate() const { return dateTime_.toLocalDate(); }
  const LocalTime& toLocalTime() const { return dateTime_.toLocalTime(); }
  const ZoneOffset& getOffset() const { return offset_; }
  const ZoneId& getZone() const { return zone_; }

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

  DateTimeResult<ZonedDateTime> with(ChronoField field,
                                     int64_t newValue) const;
  DateTimeResult<ZonedDateTime> with(const LocalDate& date) const {
    return resolveLocal(dateTime_.with(date));
  }
  DateTimeResult<ZonedDateTime> with(const LocalTime& time) const {
    return resolveLocal(dateTime_.with(time));
  }
  DateTimeResult<ZonedDateTime> withYear(int32_t year) const;
  DateTimeResult<ZonedDateTime> withMonth(int32_t month) const;
  DateTimeResult<ZonedDateTime> withDayOfMonth(int32_t dayOfMonth) const;
  DateTimeResult<ZonedDateTime> withDayOfYear(int32_t dayOfYear) const;
  DateTimeResult<ZonedDateTime> withHour(int32_t hour) const;
  DateTimeResult<ZonedDateTime> withMinute(int32_t minute) const;
  DateTimeResult<ZonedDateTime> withSecond(int32_t second) const;
  DateTimeResult<ZonedDateTime> withNano(int32_t nanoOfSecond) const;

  /**
   * In an overlap, switch to the earlier (or later) of the two offsets.
   * Outside an overlap this is a no-op.
   */
  ZonedDateTime withEarlierOffsetAtOverlap() const;
  ZonedDateTime withLaterOffsetAtOverlap() const;

  DateTimeResult<ZonedDateTime> withZoneSameLocal(const ZoneId& zone) const;
  DateTimeResult<ZonedDateTime> withZoneSameInstant(const ZoneId& zone) const;

  /**
   * Replace the zone by the current offset.
   */
  ZonedDateTime withFixedOffsetZone() const;

  DateTimeResult<ZonedDateTime> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<ZonedDateTime> plus(int64_t amountToAdd,
                                     ChronoUnit unit) const;
  DateTimeResult<ZonedDateTime> plus(const Duration& duration) const;
  DateTimeResult<ZonedDateTime> plus(const Period& period) const;
  DateTimeResult<ZonedDateTime> plusYears(int64_t years) const;
  DateTimeResult<ZonedDateTime> plusMonths(int64_t months) const;
  DateTimeResult<ZonedDateTime> plusWeeks(int64_t weeks) const;
  DateTimeResult<ZonedDateTime> plusDays(int64_t days) const;
  DateTimeResult<ZonedDateTime> plusHours(int64_t hours) const;
  DateTimeResult<ZonedDateTime> plusMinutes(int64_t minutes) const;
  DateTimeResult<ZonedDateTime> plusSeconds(int64_t seconds) const;
  DateTimeResult<ZonedDateTime> plusNanos(int64_t nanos) const;

  DateTimeResult<ZonedDateTime> minus(int64_t amountToSubtract,
                                      ChronoUnit unit) const;
  DateTimeResult<ZonedDateTime> minus(const Duration& duration) const;
  DateTimeResult<ZonedDateTime> minus(const Period& period) const;
  DateTimeResult<ZonedDateTime> minusYears(int64_t years) const;
  DateTimeResult<ZonedDateTime> minusMonths(int64_t months) const;
  DateTimeResult<ZonedDateTime> minusWeeks(int64_t weeks) const;
  DateTimeResult<ZonedDateTime> minusDays(int64_t days) const;
  DateTimeResult<ZonedDateTime> minusHours(int64_t hours) const;
  DateTimeResult<ZonedDateTime> minusMinutes(int64_t minutes) const;
  DateTimeResult<ZonedDateTime> minusSeconds(int64_t seconds) const;
  DateTimeResult<ZonedDateTime> minusNanos(int64_t nanos) const;

  /**
   * Amount of time until `end` after moving `end` to this zone. Date units
   * count on the local time-line, time units on the instant time-line.
   */
  DateTimeResult<int64_t> until(const ZonedDateTime& end,
                                ChronoUnit unit) const;

  OffsetDateTime toOffsetDateTime() const {
    return OffsetDateTime(dateTime_, offset_);
  }
  DateTimeResult<Instant> toInstant() const;
  int64_t toEpochSecond() const { return dateTime_.toEpochSecond(offset_); }

  /**
   * Orders by instant, then local date-time, then zone id.
   */
  int32_t compareTo(const ZonedDateTime& other) const;

  bool isAfter(const ZonedDateTime& other) const;
  bool isBefore(const ZonedDateTime& other) const;
  bool isEqual(const ZonedDateTime& other) const;

  bool operator==(const ZonedDateTime& other) const {
    return dateTime_ == other.dateTime_ && offset_ == other.offset_ &&
           zone_ == other.zone_;
  }
  bool operator!=(const ZonedDateTime& other) const {
    return !(*this == other);
  }

  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_ZonedDateTime_h */
