/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_MonthDay_h
#define tempora_MonthDay_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/Month.h"
#include "tempora/TemporalFields.h"

namespace tempora {

class Clock;

/**
 * A month and day-of-month in the ISO-8601 calendar, such as --12-03.
 *
 * February 29 is a valid month-day; it only exists in leap years.
 */
class MonthDay final {
  uint8_t month_ = 1;
  uint8_t day_ = 1;

  constexpr MonthDay(int32_t month, int32_t day)
      : month_(uint8_t(month)), day_(uint8_t(day)) {}

 public:
  constexpr MonthDay() = default;

  static DateTimeResult<MonthDay> Of(int32_t month, int32_t dayOfMonth);
  static DateTimeResult<MonthDay> Of(Month month, int32_t dayOfMonth) {
    return Of(int32_t(month), dayOfMonth);
  }
  static MonthDay From(const LocalDate& date) {
    return MonthDay(date.getMonthValue(), date.getDayOfMonth());
  }

  static MonthDay Now(const Clock& clock);

  /**
   * Parses text such as "--12-03".
   */
  static DateTimeResult<MonthDay> Parse(std::string_view text);

  int32_t getMonthValue() const { return month_; }
  Month getMonth() const { return Month(month_); }
  int32_t getDayOfMonth() const { return day_; }

  /**
   * False only for February 29 and a non-leap `year`.
   */
  bool isValidYear(int64_t year) const;

  bool isSupported(ChronoField field) const {
    return field == ChronoField::MonthOfYear ||
           field == ChronoField::DayOfMonth;
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  /**
   * Changes the month, clamping the day to the maximum length of the new
   * month.
   */
  DateTimeResult<MonthDay> withMonth(int32_t month) const;
  MonthDay with(Month month) const;
  DateTimeResult<MonthDay> withDayOfMonth(int32_t dayOfMonth) const;

  /**
   * The date of this month-day in `year`. February 29 becomes February 28
   * in a non-leap year.
   */
  DateTimeResult<LocalDate> atYear(int64_t year) const;

  int32_t compareTo(const MonthDay& other) const {
    int32_t cmp = int32_t(month_) - int32_t(other.month_);
    if (cmp == 0) {
      cmp = int32_t(day_) - int32_t(other.day_);
    }
    return cmp;
  }
  bool isAfter(const MonthDay& other) const { return compareTo(other) > 0; }
  bool isBefore(const MonthDay& other) const { return compareTo(other) < 0; }

  bool operator==(const MonthDay& other) const {
    return month_ == other.month_ && day_ == other.day_;
  }
  bool operator!=(const MonthDay& other) const { return !(*this == other); }
  bool operator<(const MonthDay& other) const { return isBefore(other); }

  /**
   * Format --MM-dd.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_MonthDay_h */
