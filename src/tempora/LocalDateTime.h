/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_LocalDateTime_h
#define tempora_LocalDateTime_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/LocalTime.h"

namespace tempora {

class Clock;
class Duration;
class Instant;
class OffsetDateTime;
class Period;
class ZoneId;
class ZoneOffset;
class ZonedDateTime;

/**
 * A date-time without a time-zone, such as 2007-12-03T10:15:30.
 */
class LocalDateTime final {
  LocalDate date_;
  LocalTime time_;

  LocalDateTime with(const LocalDate& newDate, const LocalTime& newTime) const {
    if (date_ == newDate && time_ == newTime) {
      return *this;
    }
    return LocalDateTime(newDate, newTime);
  }

  DateTimeResult<LocalDateTime> plusWithOverflow(const LocalDate& newDate,
                                                 int64_t hours,
                                                 int64_t minutes,
                                                 int64_t seconds,
                                                 int64_t nanos,
                                                 int32_t sign) const;

 public:
  constexpr LocalDateTime() = default;
  constexpr LocalDateTime(const LocalDate& date, const LocalTime& time)
      : date_(date), time_(time) {}

  static constexpr LocalDateTime Min() {
    return LocalDateTime(LocalDate::Min(), LocalTime::Min());
  }
  static constexpr LocalDateTime Max() {
    return LocalDateTime(LocalDate::Max(), LocalTime::Max());
  }

  static DateTimeResult<LocalDateTime> Of(int32_t year, int32_t month,
                                          int32_t dayOfMonth, int32_t hour,
                                          int32_t minute, int32_t second = 0,
                                          int32_t nanoOfSecond = 0);

  /**
   * The local date-time at `epochSecond` and `nanoOfSecond` seen with the
   * given offset.
   */
  static DateTimeResult<LocalDateTime> OfEpochSecond(int64_t epochSecond,
                                                     int32_t nanoOfSecond,
                                                     const ZoneOffset& offset);
  static DateTimeResult<LocalDateTime> OfInstant(const Instant& instant,
                                                 const ZoneId& zone);

  static LocalDateTime Now(const Clock& clock);

  /**
   * Parses text such as "2007-12-03T10:15:30".
   */
  static DateTimeResult<LocalDateTime> Parse(std::string_view text);

  const LocalDate& toLocalDate() const { return date_; }
  const LocalTime& toLocalTime() const { return time_; }

  int32_t getYear() const { return date_.getYear(); }
  int32_t getMonthValue() const { return date_.getMonthValue(); }
  Month getMonth() const { return date_.getMonth(); }
  int32_t getDayOfMonth() const { return date_.getDayOfMonth(); }
  int32_t getDayOfYear() const { return date_.getDayOfYear(); }
  DayOfWeek getDayOfWeek() const { return date_.getDayOfWeek(); }
  int32_t getHour() const { return time_.getHour(); }
  int32_t getMinute() const { return time_.getMinute(); }
  int32_t getSecond() const { return time_.getSecond(); }
  int32_t getNano() const { return time_.getNano(); }

  bool isSupported(ChronoField field) const {
    return IsDateBased(field) || IsTimeBased(field);
  }
  bool isSupported(ChronoUnit unit) const {
    return IsDateBased(unit) || IsTimeBased(unit);
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<LocalDateTime> with(ChronoField field,
                                     int64_t newValue) const;
  LocalDateTime with(const LocalDate& date) const { return with(date, time_); }
  LocalDateTime with(const LocalTime& time) const { return with(date_, time); }
  DateTimeResult<LocalDateTime> withYear(int32_t year) const;
  DateTimeResult<LocalDateTime> withMonth(int32_t month) const;
  DateTimeResult<LocalDateTime> withDayOfMonth(int32_t dayOfMonth) const;
  DateTimeResult<LocalDateTime> withDayOfYear(int32_t dayOfYear) const;
  DateTimeResult<LocalDateTime> withHour(int32_t hour) const;
  DateTimeResult<LocalDateTime> withMinute(int32_t minute) const;
  DateTimeResult<LocalDateTime> withSecond(int32_t second) const;
  DateTimeResult<LocalDateTime> withNano(int32_t nanoOfSecond) const;

  DateTimeResult<LocalDateTime> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<LocalDateTime> plus(int64_t amountToAdd,
                                     ChronoUnit unit) const;
  DateTimeResult<LocalDateTime> plus(const Duration& duration) const;
  DateTimeResult<LocalDateTime> plus(const Period& period) const;
  DateTimeResult<LocalDateTime> plusYears(int64_t years) const;
  DateTimeResult<LocalDateTime> plusMonths(int64_t months) const;
  DateTimeResult<LocalDateTime> plusWeeks(int64_t weeks) const;
  DateTimeResult<LocalDateTime> plusDays(int64_t days) const;
  DateTimeResult<LocalDateTime> plusHours(int64_t hours) const;
  DateTimeResult<LocalDateTime> plusMinutes(int64_t minutes) const;
  DateTimeResult<LocalDateTime> plusSeconds(int64_t seconds) const;
  DateTimeResult<LocalDateTime> plusNanos(int64_t nanos) const;

  DateTimeResult<LocalDateTime> minus(int64_t amountToSubtract,
                                      ChronoUnit unit) const;
  DateTimeResult<LocalDateTime> minus(const Duration& duration) const;
  DateTimeResult<LocalDateTime> minus(const Period& period) const;
  DateTimeResult<LocalDateTime> minusYears(int64_t years) const;
  DateTimeResult<LocalDateTime> minusMonths(int64_t months) const;
  DateTimeResult<LocalDateTime> minusWeeks(int64_t weeks) const;
  DateTimeResult<LocalDateTime> minusDays(int64_t days) const;
  DateTimeResult<LocalDateTime> minusHours(int64_t hours) const;
  DateTimeResult<LocalDateTime> minusMinutes(int64_t minutes) const;
  DateTimeResult<LocalDateTime> minusSeconds(int64_t seconds) const;
  DateTimeResult<LocalDateTime> minusNanos(int64_t nanos) const;

  DateTimeResult<int64_t> until(const LocalDateTime& end,
                                ChronoUnit unit) const;

  OffsetDateTime atOffset(const ZoneOffset& offset) const;

  /**
   * Combines with a zone. A local date-time in a gap is shifted later by the
   * length of the gap; one in an overlap takes the earlier offset.
   */
  DateTimeResult<ZonedDateTime> atZone(const ZoneId& zone) const;

  int64_t toEpochSecond(const ZoneOffset& offset) const;
  DateTimeResult<Instant> toInstant(const ZoneOffset& offset) const;

  int32_t compareTo(const LocalDateTime& other) const {
    int32_t cmp = date_.compareTo(other.date_);
    if (cmp == 0) {
      cmp = time_.compareTo(other.time_);
    }
    return cmp;
  }

  bool isAfter(const LocalDateTime& other) const {
    return compareTo(other) > 0;
  }
  bool isBefore(const LocalDateTime& other) const {
    return compareTo(other) < 0;
  }
  bool isEqual(const LocalDateTime& other) const {
    return compareTo(other) == 0;
  }

  bool operator==(const LocalDateTime& other) const {
    return date_ == other.date_ && time_ == other.time_;
  }
  bool operator!=(const LocalDateTime& other) const {
    return !(*this == other);
  }
  bool operator<(const LocalDateTime& other) const { return isBefore(other); }

  std::string toString() const {
    return date_.toString() + "T" + time_.toString();
  }
};

}  // namespace tempora

#endif /* tempora_LocalDateTime_h */
