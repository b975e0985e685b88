/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/YearMonth.h"

#include <stdint.h>
#include <stdlib.h>

#include "tempora/CheckedArithmetic.h"
#include "tempora/IsoCalendar.h"
#include "tempora/IsoParser.h"
#include "tempora/Printf.h"

using namespace tempora;

DateTimeResult<YearMonth> YearMonth::Of(int64_t year, int32_t month) {
  int32_t validYear = TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, year));
  TEMPORA_TRY(CheckValidValue(ChronoField::MonthOfYear, month));
  return YearMonth(validYear, month);
}

YearMonth YearMonth::Now(const Clock& clock) {
  return From(LocalDate::Now(clock));
}

DateTimeResult<YearMonth> YearMonth::Parse(std::string_view text) {
  IsoParser parser(text);
  ParsedDate date = TEMPORA_TRY(parser.parseYearMonth());
  TEMPORA_TRY(parser.finish());
  return parser.resolve(Of(date.year, date.month));
}

bool YearMonth::isLeapYear() const { return IsIsoLeapYear(year_); }

int32_t YearMonth::lengthOfMonth() const {
  return IsoDaysInMonth(year_, month_);
}

DateTimeResult<ValueRange> YearMonth::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  if (field == ChronoField::YearOfEra) {
    return year_ <= 0 ? ValueRange::Fixed(1, int64_t(LocalDate::MaxYear) + 1)
                      : ValueRange::Fixed(1, LocalDate::MaxYear);
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> YearMonth::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  ValueRange valueRange = TEMPORA_TRY(range(field));
  return valueRange.checkValidIntValue(value, field);
}

DateTimeResult<int64_t> YearMonth::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::MonthOfYear:
      return int64_t(month_);
    case ChronoField::ProlepticMonth:
      return getProlepticMonth();
    case ChronoField::YearOfEra:
      return int64_t(year_ < 1 ? 1 - int64_t(year_) : year_);
    case ChronoField::Year:
      return int64_t(year_);
    case ChronoField::Era:
      return int64_t(year_ < 1 ? 0 : 1);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<YearMonth> YearMonth::with(int64_t year, int32_t month) const {
  if (year_ == year && month_ == month) {
    return *this;
  }
  return Of(year, month);
}

DateTimeResult<YearMonth> YearMonth::with(ChronoField field,
                                          int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(CheckValidValue(field, newValue));
  switch (field) {
    case ChronoField::MonthOfYear:
      return with(year_, int32_t(newValue));
    case ChronoField::ProlepticMonth:
      return plusMonths(newValue - getProlepticMonth());
    case ChronoField::YearOfEra:
      return with(year_ < 1 ? 1 - newValue : newValue, month_);
    case ChronoField::Year:
      return with(newValue, month_);
    case ChronoField::Era:
      if (TEMPORA_TRY(getLong(ChronoField::Era)) == newValue) {
        return *this;
      }
      return with(1 - int64_t(year_), month_);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<YearMonth> YearMonth::withYear(int32_t year) const {
  return with(year, month_);
}

DateTimeResult<YearMonth> YearMonth::withMonth(int32_t month) const {
  return with(year_, month);
}

DateTimeResult<YearMonth> YearMonth::plus(int64_t amountToAdd,
                                          ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Months:
      return plusMonths(amountToAdd);
    case ChronoUnit::Years:
      return plusYears(amountToAdd);
    case ChronoUnit::Decades:
      return plusYears(TEMPORA_TRY(MultiplyExact(amountToAdd, 10)));
    case ChronoUnit::Centuries:
      return plusYears(TEMPORA_TRY(MultiplyExact(amountToAdd, 100)));
    case ChronoUnit::Millennia:
      return plusYears(TEMPORA_TRY(MultiplyExact(amountToAdd, 1000)));
    case ChronoUnit::Eras: {
      int64_t era = TEMPORA_TRY(getLong(ChronoField::Era));
      return with(ChronoField::Era, TEMPORA_TRY(AddExact(era, amountToAdd)));
    }
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<YearMonth> YearMonth::plusYears(int64_t years) const {
  if (years == 0) {
    return *this;
  }
  return with(TEMPORA_TRY(AddExact(int64_t(year_), years)), month_);
}

DateTimeResult<YearMonth> YearMonth::plusMonths(int64_t months) const {
  if (months == 0) {
    return *this;
  }
  int64_t calcMonths = TEMPORA_TRY(AddExact(getProlepticMonth(), months));
  int64_t year = FloorDiv<int64_t>(calcMonths, 12);
  int32_t month = int32_t(FloorMod<int64_t>(calcMonths, 12)) + 1;
  return with(year, month);
}

DateTimeResult<YearMonth> YearMonth::minus(int64_t amountToSubtract,
                                           ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    YearMonth yearMonth = TEMPORA_TRY(plus(INT64_MAX, unit));
    return yearMonth.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<YearMonth> YearMonth::minusYears(int64_t years) const {
  return minus(years, ChronoUnit::Years);
}

DateTimeResult<YearMonth> YearMonth::minusMonths(int64_t months) const {
  return minus(months, ChronoUnit::Months);
}

DateTimeResult<int64_t> YearMonth::until(const YearMonth& end,
                                         ChronoUnit unit) const {
  int64_t months = end.getProlepticMonth() - getProlepticMonth();
  switch (unit) {
    case ChronoUnit::Months:
      return months;
    case ChronoUnit::Years:
      return months / 12;
    case ChronoUnit::Decades:
      return months / 120;
    case ChronoUnit::Centuries:
      return months / 1200;
    case ChronoUnit::Millennia:
      return months / 12000;
    case ChronoUnit::Eras:
      return TEMPORA_TRY(end.getLong(ChronoField::Era)) -
             TEMPORA_TRY(getLong(ChronoField::Era));
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<LocalDate> YearMonth::atDay(int32_t dayOfMonth) const {
  return LocalDate::Of(year_, month_, dayOfMonth);
}

LocalDate YearMonth::atEndOfMonth() const {
  return TEMPORA_ALWAYS_OK(LocalDate::Of(year_, month_, lengthOfMonth()));
}

std::string YearMonth::toString() const {
  if (abs(year_) < 1000) {
    return Smprintf("%s%04d-%02d", year_ < 0 ? "-" : "", abs(year_),
                    int(month_));
  }
  return Smprintf("%d-%02d", year_, int(month_));
}
