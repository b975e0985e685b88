/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_LocalTime_h
#define tempora_LocalTime_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class Clock;
class LocalDate;
class LocalDateTime;
class OffsetTime;
class ZoneOffset;

/**
 * A time without a time-zone, such as 10:15:30, stored to nanosecond
 * precision. The time-line wraps at midnight.
 */
class LocalTime final {
  uint8_t hour_ = 0;
  uint8_t minute_ = 0;
  uint8_t second_ = 0;
  int32_t nano_ = 0;

  constexpr LocalTime(int32_t hour, int32_t minute, int32_t second,
                      int32_t nanoOfSecond)
      : hour_(uint8_t(hour)),
        minute_(uint8_t(minute)),
        second_(uint8_t(second)),
        nano_(nanoOfSecond) {}

 public:
  static constexpr int32_t HoursPerDay = 24;
  static constexpr int32_t MinutesPerHour = 60;
  static constexpr int32_t MinutesPerDay = MinutesPerHour * HoursPerDay;
  static constexpr int32_t SecondsPerMinute = 60;
  static constexpr int32_t SecondsPerHour = SecondsPerMinute * MinutesPerHour;
  static constexpr int32_t SecondsPerDay = SecondsPerHour * HoursPerDay;
  static constexpr int64_t MillisPerDay = SecondsPerDay * 1000LL;
  static constexpr int64_t MicrosPerDay = SecondsPerDay * 1000'000LL;
  static constexpr int64_t NanosPerSecond = 1000'000'000LL;
  static constexpr int64_t NanosPerMinute = NanosPerSecond * SecondsPerMinute;
  static constexpr int64_t NanosPerHour = NanosPerMinute * MinutesPerHour;
  static constexpr int64_t NanosPerDay = NanosPerHour * HoursPerDay;

  constexpr LocalTime() = default;

  static constexpr LocalTime Midnight() { return LocalTime(); }
  static constexpr LocalTime Min() { return LocalTime(); }
  static constexpr LocalTime Noon() { return LocalTime(12, 0, 0, 0); }
  static constexpr LocalTime Max() {
    return LocalTime(23, 59, 59, 999'999'999);
  }

  static DateTimeResult<LocalTime> Of(int32_t hour, int32_t minute);
  static DateTimeResult<LocalTime> Of(int32_t hour, int32_t minute,
                                      int32_t second);
  static DateTimeResult<LocalTime> Of(int32_t hour, int32_t minute,
                                      int32_t second, int32_t nanoOfSecond);
  static DateTimeResult<LocalTime> OfSecondOfDay(int64_t secondOfDay);
  static DateTimeResult<LocalTime> OfNanoOfDay(int64_t nanoOfDay);

  static LocalTime Now(const Clock& clock);

  /**
   * Parses text such as "10:15" or "10:15:30.123".
   */
  static DateTimeResult<LocalTime> Parse(std::string_view text);

  int32_t getHour() const { return hour_; }
  int32_t getMinute() const { return minute_; }
  int32_t getSecond() const { return second_; }
  int32_t getNano() const { return nano_; }

  bool isSupported(ChronoField field) const { return IsTimeBased(field); }
  bool isSupported(ChronoUnit unit) const { return IsTimeBased(unit); }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<LocalTime> with(ChronoField field, int64_t newValue) const;
  DateTimeResult<LocalTime> withHour(int32_t hour) const;
  DateTimeResult<LocalTime> withMinute(int32_t minute) const;
  DateTimeResult<LocalTime> withSecond(int32_t second) const;
  DateTimeResult<LocalTime> withNano(int32_t nanoOfSecond) const;

  /**
   * Truncates to the given unit, which must divide a day without remainder.
   */
  DateTimeResult<LocalTime> truncatedTo(ChronoUnit unit) const;

  DateTimeResult<LocalTime> plus(int64_t amountToAdd, ChronoUnit unit) const;
  LocalTime plusHours(int64_t hours) const;
  LocalTime plusMinutes(int64_t minutes) const;
  LocalTime plusSeconds(int64_t seconds) const;
  LocalTime plusNanos(int64_t nanos) const;

  DateTimeResult<LocalTime> minus(int64_t amountToSubtract,
                                  ChronoUnit unit) const;
  LocalTime minusHours(int64_t hours) const {
    return plusHours(-(hours % HoursPerDay));
  }
  LocalTime minusMinutes(int64_t minutes) const {
    return plusMinutes(-(minutes % MinutesPerDay));
  }
  LocalTime minusSeconds(int64_t seconds) const {
    return plusSeconds(-(seconds % SecondsPerDay));
  }
  LocalTime minusNanos(int64_t nanos) const {
    return plusNanos(-(nanos % NanosPerDay));
  }

  DateTimeResult<int64_t> until(const LocalTime& end, ChronoUnit unit) const;

  LocalDateTime atDate(const LocalDate& date) const;
  OffsetTime atOffset(const ZoneOffset& offset) const;

  int32_t toSecondOfDay() const {
    return hour_ * SecondsPerHour + minute_ * SecondsPerMinute + second_;
  }
  int64_t toNanoOfDay() const {
    return hour_ * NanosPerHour + minute_ * NanosPerMinute +
           second_ * NanosPerSecond + nano_;
  }

  int32_t compareTo(const LocalTime& other) const {
    int32_t cmp = int32_t(hour_) - int32_t(other.hour_);
    if (cmp == 0) {
      cmp = int32_t(minute_) - int32_t(other.minute_);
      if (cmp == 0) {
        cmp = int32_t(second_) - int32_t(other.second_);
        if (cmp == 0) {
          cmp = nano_ < other.nano_ ? -1 : (nano_ > other.nano_ ? 1 : 0);
        }
      }
    }
    return cmp;
  }

  bool isAfter(const LocalTime& other) const { return compareTo(other) > 0; }
  bool isBefore(const LocalTime& other) const { return compareTo(other) < 0; }

  bool operator==(const LocalTime& other) const {
    return hour_ == other.hour_ && minute_ == other.minute_ &&
           second_ == other.second_ && nano_ == other.nano_;
  }
  bool operator!=(const LocalTime& other) const { return !(*this == other); }
  bool operator<(const LocalTime& other) const { return isBefore(other); }

  /**
   * Outputs HH:mm, HH:mm:ss, or HH:mm:ss followed by three, six or nine
   * fraction digits, whichever is the shortest that loses no precision.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_LocalTime_h */
