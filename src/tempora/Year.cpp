/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Year.h"

#include <stdint.h>

#include "tempora/CheckedArithmetic.h"
#include "tempora/IsoCalendar.h"
#include "tempora/IsoParser.h"
#include "tempora/MonthDay.h"
#include "tempora/Printf.h"
#include "tempora/YearMonth.h"

using namespace tempora;

DateTimeResult<Year> Year::Of(int64_t isoYear) {
  int32_t year = TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, isoYear));
  return Year(year);
}

Year Year::Now(const Clock& clock) { return From(LocalDate::Now(clock)); }

DateTimeResult<Year> Year::Parse(std::string_view text) {
  IsoParser parser(text);
  int64_t year = TEMPORA_TRY(parser.parseYear());
  TEMPORA_TRY(parser.finish());
  return parser.resolve(Of(year));
}

bool Year::IsLeap(int64_t year) { return IsIsoLeapYear(year); }

bool Year::isValidMonthDay(const MonthDay& monthDay) const {
  return monthDay.isValidYear(year_);
}

DateTimeResult<ValueRange> Year::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  if (field == ChronoField::YearOfEra) {
    return year_ <= 0 ? ValueRange::Fixed(1, int64_t(MaxValue) + 1)
                      : ValueRange::Fixed(1, MaxValue);
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> Year::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  ValueRange valueRange = TEMPORA_TRY(range(field));
  return valueRange.checkValidIntValue(value, field);
}

DateTimeResult<int64_t> Year::getLong(ChronoField field) const {
  switch (field) {
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

DateTimeResult<Year> Year::with(ChronoField field, int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(CheckValidValue(field, newValue));
  switch (field) {
    case ChronoField::YearOfEra:
      return Of(year_ < 1 ? 1 - newValue : newValue);
    case ChronoField::Year:
      return Of(newValue);
    case ChronoField::Era:
      if (TEMPORA_TRY(getLong(ChronoField::Era)) == newValue) {
        return *this;
      }
      return Of(1 - int64_t(year_));
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<Year> Year::plus(int64_t amountToAdd, ChronoUnit unit) const {
  switch (unit) {
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

DateTimeResult<Year> Year::plusYears(int64_t years) const {
  if (years == 0) {
    return *this;
  }
  return Of(TEMPORA_TRY(AddExact(int64_t(year_), years)));
}

DateTimeResult<Year> Year::minus(int64_t amountToSubtract,
                                 ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    Year year = TEMPORA_TRY(plus(INT64_MAX, unit));
    return year.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<Year> Year::minusYears(int64_t years) const {
  return minus(years, ChronoUnit::Years);
}

DateTimeResult<int64_t> Year::until(const Year& end, ChronoUnit unit) const {
  int64_t years = int64_t(end.year_) - year_;
  switch (unit) {
    case ChronoUnit::Years:
      return years;
    case ChronoUnit::Decades:
      return years / 10;
    case ChronoUnit::Centuries:
      return years / 100;
    case ChronoUnit::Millennia:
      return years / 1000;
    case ChronoUnit::Eras:
      return TEMPORA_TRY(end.getLong(ChronoField::Era)) -
             TEMPORA_TRY(getLong(ChronoField::Era));
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<LocalDate> Year::atDay(int32_t dayOfYear) const {
  return LocalDate::OfYearDay(year_, dayOfYear);
}

DateTimeResult<YearMonth> Year::atMonth(int32_t month) const {
  return YearMonth::Of(year_, month);
}

YearMonth Year::atMonth(Month month) const {
  return TEMPORA_ALWAYS_OK(YearMonth::Of(year_, month));
}

LocalDate Year::atMonthDay(const MonthDay& monthDay) const {
  return TEMPORA_ALWAYS_OK(monthDay.atYear(year_));
}

std::string Year::toString() const { return Smprintf("%d", year_); }
