/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/MonthDay.h"

#include <algorithm>

#include "tempora/IsoCalendar.h"
#include "tempora/IsoParser.h"
#include "tempora/Printf.h"

using namespace tempora;

DateTimeResult<MonthDay> MonthDay::Of(int32_t month, int32_t dayOfMonth) {
  TEMPORA_TRY(CheckValidValue(ChronoField::MonthOfYear, month));
  TEMPORA_TRY(CheckValidValue(ChronoField::DayOfMonth, dayOfMonth));
  if (dayOfMonth > MonthMaxLength(Month(month))) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Illegal value for DayOfMonth field, value %d is not valid "
                 "for month %s",
                 dayOfMonth, MonthName(Month(month)))));
  }
  return MonthDay(month, dayOfMonth);
}

MonthDay MonthDay::Now(const Clock& clock) {
  return From(LocalDate::Now(clock));
}

DateTimeResult<MonthDay> MonthDay::Parse(std::string_view text) {
  IsoParser parser(text);
  ParsedDate date = TEMPORA_TRY(parser.parseMonthDay());
  TEMPORA_TRY(parser.finish());
  return parser.resolve(Of(date.month, date.day));
}

bool MonthDay::isValidYear(int64_t year) const {
  return !(day_ == 29 && month_ == 2 && !IsIsoLeapYear(year));
}

DateTimeResult<ValueRange> MonthDay::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  if (field == ChronoField::DayOfMonth) {
    return ValueRange::Fixed(1, MonthMinLength(getMonth()),
                             MonthMaxLength(getMonth()));
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> MonthDay::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  ValueRange valueRange = TEMPORA_TRY(range(field));
  return valueRange.checkValidIntValue(value, field);
}

DateTimeResult<int64_t> MonthDay::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::DayOfMonth:
      return int64_t(day_);
    case ChronoField::MonthOfYear:
      return int64_t(month_);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<MonthDay> MonthDay::withMonth(int32_t month) const {
  TEMPORA_TRY(CheckValidValue(ChronoField::MonthOfYear, month));
  return with(Month(month));
}

MonthDay MonthDay::with(Month month) const {
  if (month_ == int32_t(month)) {
    return *this;
  }
  int32_t day = std::min(int32_t(day_), MonthMaxLength(month));
  return MonthDay(int32_t(month), day);
}

DateTimeResult<MonthDay> MonthDay::withDayOfMonth(int32_t dayOfMonth) const {
  if (day_ == dayOfMonth) {
    return *this;
  }
  return Of(month_, dayOfMonth);
}

DateTimeResult<LocalDate> MonthDay::atYear(int64_t year) const {
  int32_t validYear = TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, year));
  return LocalDate::Of(validYear, month_, isValidYear(year) ? day_ : 28);
}

std::string MonthDay::toString() const {
  return Smprintf("--%02d-%02d", int(month_), int(day_));
}
