/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Year_h
#define tempora_Year_h

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
class MonthDay;
class YearMonth;

/**
 * A year in the proleptic ISO-8601 calendar, such as 2007.
 *
 * Year 0 is 1 BCE. The supported years are those of LocalDate.
 */
class Year final {
  int32_t year_ = 1970;

  constexpr explicit Year(int32_t year) : year_(year) {}

 public:
  static constexpr int32_t MinValue = LocalDate::MinYear;
  static constexpr int32_t MaxValue = LocalDate::MaxYear;

  constexpr Year() = default;

  static DateTimeResult<Year> Of(int64_t isoYear);
  static Year From(const LocalDate& date) { return Year(date.getYear()); }

  static Year Now(const Clock& clock);

  /**
   * Parses text such as "2007", "-0012" or "+12345".
   */
  static DateTimeResult<Year> Parse(std::string_view text);

  static bool IsLeap(int64_t year);

  int32_t getValue() const { return year_; }
  bool isLeap() const { return IsLeap(year_); }
  int32_t length() const { return isLeap() ? 366 : 365; }

  /**
   * False only for February 29 in a non-leap year.
   */
  bool isValidMonthDay(const MonthDay& monthDay) const;

  bool isSupported(ChronoField field) const {
    return field == ChronoField::YearOfEra || field == ChronoField::Year ||
           field == ChronoField::Era;
  }
  bool isSupported(ChronoUnit unit) const {
    return unit >= ChronoUnit::Years && unit <= ChronoUnit::Eras;
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<Year> with(ChronoField field, int64_t newValue) const;

  DateTimeResult<Year> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<Year> plusYears(int64_t years) const;
  DateTimeResult<Year> minus(int64_t amountToSubtract, ChronoUnit unit) const;
  DateTimeResult<Year> minusYears(int64_t years) const;

  DateTimeResult<int64_t> until(const Year& end, ChronoUnit unit) const;

  DateTimeResult<LocalDate> atDay(int32_t dayOfYear) const;
  DateTimeResult<YearMonth> atMonth(int32_t month) const;
  YearMonth atMonth(Month month) const;

  /**
   * The date of `monthDay` in this year. February 29 becomes February 28
   * in a non-leap year.
   */
  LocalDate atMonthDay(const MonthDay& monthDay) const;

  int32_t compareTo(const Year& other) const {
    return year_ < other.year_ ? -1 : (year_ > other.year_ ? 1 : 0);
  }
  bool isAfter(const Year& other) const { return year_ > other.year_; }
  bool isBefore(const Year& other) const { return year_ < other.year_; }

  bool operator==(const Year& other) const { return year_ == other.year_; }
  bool operator!=(const Year& other) const { return !(*this == other); }
  bool operator<(const Year& other) const { return isBefore(other); }

  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_Year_h */
