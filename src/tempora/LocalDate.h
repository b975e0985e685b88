/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_LocalDate_h
#define tempora_LocalDate_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/DayOfWeek.h"
#include "tempora/Month.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class Clock;
class LocalDateTime;
class LocalTime;
class Period;

/**
 * A date without a time-zone in the proleptic ISO-8601 calendar, such as
 * 2007-12-03.
 *
 * Years range from -999,999,999 to 999,999,999. The default constructed date
 * is 1970-01-01.
 */
class LocalDate final {
  int32_t year_ = 1970;
  uint8_t month_ = 1;
  uint8_t day_ = 1;

  constexpr LocalDate(int32_t year, int32_t month, int32_t day)
      : year_(year), month_(uint8_t(month)), day_(uint8_t(day)) {}

  // Validates the day of month against the month length.
  static DateTimeResult<LocalDate> Create(int32_t year, int32_t month,
                                          int32_t dayOfMonth);

  // Clamps the day of month to the last valid day of the month.
  static LocalDate ResolvePreviousValid(int32_t year, int32_t month,
                                        int32_t day);

  int64_t monthsUntil(const LocalDate& end) const;

 public:
  static constexpr int32_t MinYear = -999'999'999;
  static constexpr int32_t MaxYear = 999'999'999;

  constexpr LocalDate() = default;

  static constexpr LocalDate Min() { return LocalDate(MinYear, 1, 1); }
  static constexpr LocalDate Max() { return LocalDate(MaxYear, 12, 31); }
  static constexpr LocalDate Epoch() { return LocalDate(1970, 1, 1); }

  static DateTimeResult<LocalDate> Of(int32_t year, int32_t month,
                                      int32_t dayOfMonth);
  static DateTimeResult<LocalDate> Of(int32_t year, Month month,
                                      int32_t dayOfMonth) {
    return Of(year, int32_t(month), dayOfMonth);
  }
  static DateTimeResult<LocalDate> OfYearDay(int32_t year, int32_t dayOfYear);
  static DateTimeResult<LocalDate> OfEpochDay(int64_t epochDay);

  /**
   * The current date in the clock's zone.
   */
  static LocalDate Now(const Clock& clock);

  /**
   * Parses text such as "2007-12-03".
   */
  static DateTimeResult<LocalDate> Parse(std::string_view text);

  int32_t getYear() const { return year_; }
  int32_t getMonthValue() const { return month_; }
  Month getMonth() const { return Month(month_); }
  int32_t getDayOfMonth() const { return day_; }
  int32_t getDayOfYear() const;
  DayOfWeek getDayOfWeek() const;

  bool isLeapYear() const;
  int32_t lengthOfMonth() const;
  int32_t lengthOfYear() const { return isLeapYear() ? 366 : 365; }

  int64_t toEpochDay() const;
  int64_t getProlepticMonth() const { return int64_t(year_) * 12 + month_ - 1; }

  bool isSupported(ChronoField field) const { return IsDateBased(field); }
  bool isSupported(ChronoUnit unit) const { return IsDateBased(unit); }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<LocalDate> with(ChronoField field, int64_t newValue) const;
  DateTimeResult<LocalDate> withYear(int32_t year) const;
  DateTimeResult<LocalDate> withMonth(int32_t month) const;
  DateTimeResult<LocalDate> withDayOfMonth(int32_t dayOfMonth) const;
  DateTimeResult<LocalDate> withDayOfYear(int32_t dayOfYear) const;

  DateTimeResult<LocalDate> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<LocalDate> plus(const Period& period) const;

  /**
   * Adds years, clamping the day of month when the result would otherwise be
   * February 29 in a non-leap year.
   */
  DateTimeResult<LocalDate> plusYears(int64_t years) const;

  /**
   * Adds months, clamping the day of month to the last valid day of the
   * resulting month.
   */
  DateTimeResult<LocalDate> plusMonths(int64_t months) const;
  DateTimeResult<LocalDate> plusWeeks(int64_t weeks) const;
  DateTimeResult<LocalDate> plusDays(int64_t days) const;

  DateTimeResult<LocalDate> minus(int64_t amountToSubtract,
                                  ChronoUnit unit) const;
  DateTimeResult<LocalDate> minus(const Period& period) const;
  DateTimeResult<LocalDate> minusYears(int64_t years) const;
  DateTimeResult<LocalDate> minusMonths(int64_t months) const;
  DateTimeResult<LocalDate> minusWeeks(int64_t weeks) const;
  DateTimeResult<LocalDate> minusDays(int64_t days) const;

  /**
   * Amount of whole `unit`s from this date until `end`.
   */
  DateTimeResult<int64_t> until(const LocalDate& end, ChronoUnit unit) const;

  /**
   * Period from this date until `end`, as years, months and days.
   */
  DateTimeResult<Period> until(const LocalDate& end) const;

  LocalDateTime atTime(const LocalTime& time) const;
  DateTimeResult<LocalDateTime> atTime(int32_t hour, int32_t minute,
                                       int32_t second = 0,
                                       int32_t nanoOfSecond = 0) const;
  LocalDateTime atStartOfDay() const;

  int32_t compareTo(const LocalDate& other) const {
    int32_t cmp = year_ < other.year_ ? -1 : (year_ > other.year_ ? 1 : 0);
    if (cmp == 0) {
      cmp = int32_t(month_) - int32_t(other.month_);
      if (cmp == 0) {
        cmp = int32_t(day_) - int32_t(other.day_);
      }
    }
    return cmp;
  }

  bool isAfter(const LocalDate& other) const { return compareTo(other) > 0; }
  bool isBefore(const LocalDate& other) const { return compareTo(other) < 0; }
  bool isEqual(const LocalDate& other) const { return compareTo(other) == 0; }

  bool operator==(const LocalDate& other) const {
    return year_ == other.year_ && month_ == other.month_ &&
           day_ == other.day_;
  }
  bool operator!=(const LocalDate& other) const { return !(*this == other); }
  bool operator<(const LocalDate& other) const { return isBefore(other); }

  /**
   * ISO-8601 format uuuu-MM-dd. Years outside 0000 to 9999 carry a sign.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_LocalDate_h */
