/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_YearMonth_h
#define tempora_YearMonth_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/Month.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class Clock;

/**
 * A year and month in the proleptic ISO-8601 calendar, such as 2007-12.
 */
class YearMonth final {
  int32_t year_ = 1970;
  uint8_t month_ = 1;

  constexpr YearMonth(int32_t year, int32_t month)
      : year_(year), month_(uint8_t(month)) {}

  DateTimeResult<YearMonth> with(int64_t year, int32_t month) const;

 public:
  constexpr YearMonth() = default;

  static DateTimeResult<YearMonth> Of(int64_t year, int32_t month);
  static DateTimeResult<YearMonth> Of(int64_t year, Month month) {
    return Of(year, int32_t(month));
  }
  static YearMonth From(const LocalDate& date) {
    return YearMonth(date.getYear(), date.getMonthValue());
  }

  static YearMonth Now(const Clock& clock);

  /**
   * Parses text such as "2007-12" or "+12345-01".
   */
  static DateTimeResult<YearMonth> Parse(std::string_view text);

  int32_t getYear() const { return year_; }
  int32_t getMonthValue() const { return month_; }
  Month getMonth() const { return Month(month_); }
  int64_t getProlepticMonth() const { return int64_t(year_) * 12 + month_ - 1; }

  bool isLeapYear() const;
  bool isValidDay(int32_t dayOfMonth) const {
    return dayOfMonth >= 1 && dayOfMonth <= lengthOfMonth();
  }
  int32_t lengthOfMonth() const;
  int32_t lengthOfYear() const { return isLeapYear() ? 366 : 365; }

  bool isSupported(ChronoField field) const {
    return field == ChronoField::MonthOfYear ||
           field == ChronoField::ProlepticMonth ||
           field == ChronoField::YearOfEra || field == ChronoField::Year ||
           field == ChronoField::Era;
  }
  bool isSupported(ChronoUnit unit) const {
    return unit >= ChronoUnit::Months && unit <= ChronoUnit::Eras;
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<YearMonth> with(ChronoField field, int64_t newValue) const;
  DateTimeResult<YearMonth> withYear(int32_t year) const;
  DateTimeResult<YearMonth> withMonth(int32_t month) const;

  DateTimeResult<YearMonth> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<YearMonth> plusYears(int64_t years) const;
  DateTimeResult<YearMonth> plusMonths(int64_t months) const;
  DateTimeResult<YearMonth> minus(int64_t amountToSubtract,
                                  ChronoUnit unit) const;
  DateTimeResult<YearMonth> minusYears(int64_t years) const;
  DateTimeResult<YearMonth> minusMonths(int64_t months) const;

  /**
   * Amount of whole `unit`s from this year-month until `end`.
   */
  DateTimeResult<int64_t> until(const YearMonth& end, ChronoUnit unit) const;

  DateTimeResult<LocalDate> atDay(int32_t dayOfMonth) const;
  LocalDate atEndOfMonth() const;

  int32_t compareTo(const YearMonth& other) const {
    int32_t cmp = year_ < other.year_ ? -1 : (year_ > other.year_ ? 1 : 0);
    if (cmp == 0) {
      cmp = int32_t(month_) - int32_t(other.month_);
    }
    return cmp;
  }
  bool isAfter(const YearMonth& other) const { return compareTo(other) > 0; }
  bool isBefore(const YearMonth& other) const {
    return compareTo(other) < 0;
  }

  bool operator==(const YearMonth& other) const {
    return year_ == other.year_ && month_ == other.month_;
  }
  bool operator!=(const YearMonth& other) const { return !(*this == other); }
  bool operator<(const YearMonth& other) const { return isBefore(other); }

  /**
   * Format yyyy-MM. Years outside 0000 to 9999 print all their digits, with
   * a minus sign for negative years.
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_YearMonth_h */
