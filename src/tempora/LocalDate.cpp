/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/LocalDate.h"

#include <stdlib.h>

#include <algorithm>

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/IsoCalendar.h"
#include "tempora/IsoParser.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/Period.h"
#include "tempora/Printf.h"
#include "tempora/ZoneId.h"
#include "tempora/zone/ZoneRules.h"

using namespace tempora;

static constexpr int64_t SecondsPerDay = 86400;

DateTimeResult<LocalDate> LocalDate::Create(int32_t year, int32_t month,
                                            int32_t dayOfMonth) {
  if (dayOfMonth > 28) {
    bool leap = IsIsoLeapYear(year);
    if (dayOfMonth > MonthLength(Month(month), leap)) {
      if (dayOfMonth == 29) {
        return Err(DateTimeError::InvalidValue(Smprintf(
            "Invalid date 'February 29' as '%d' is not a leap year", year)));
      }
      return Err(DateTimeError::InvalidValue(Smprintf(
          "Invalid date '%s %d'", MonthName(Month(month)), dayOfMonth)));
    }
  }
  return LocalDate(year, month, dayOfMonth);
}

LocalDate LocalDate::ResolvePreviousValid(int32_t year, int32_t month,
                                          int32_t day) {
  int32_t length = IsoDaysInMonth(year, month);
  return LocalDate(year, month, std::min(day, length));
}

DateTimeResult<LocalDate> LocalDate::Of(int32_t year, int32_t month,
                                        int32_t dayOfMonth) {
  TEMPORA_TRY(CheckValidValue(ChronoField::Year, year));
  TEMPORA_TRY(CheckValidValue(ChronoField::MonthOfYear, month));
  TEMPORA_TRY(CheckValidValue(ChronoField::DayOfMonth, dayOfMonth));
  return Create(year, month, dayOfMonth);
}

DateTimeResult<LocalDate> LocalDate::OfYearDay(int32_t year,
                                               int32_t dayOfYear) {
  TEMPORA_TRY(CheckValidValue(ChronoField::Year, year));
  TEMPORA_TRY(CheckValidValue(ChronoField::DayOfYear, dayOfYear));
  bool leap = IsIsoLeapYear(year);
  if (dayOfYear == 366 && !leap) {
    return Err(DateTimeError::InvalidValue(Smprintf(
        "Invalid date 'DayOfYear 366' as '%d' is not a leap year", year)));
  }
  Month moy = Month((dayOfYear - 1) / 31 + 1);
  int32_t monthEnd = FirstDayOfYear(moy, leap) + MonthLength(moy, leap) - 1;
  if (dayOfYear > monthEnd) {
    moy = PlusMonths(moy, 1);
  }
  int32_t dom = dayOfYear - FirstDayOfYear(moy, leap) + 1;
  return Create(year, int32_t(moy), dom);
}

DateTimeResult<LocalDate> LocalDate::OfEpochDay(int64_t epochDay) {
  TEMPORA_TRY(CheckValidValue(ChronoField::EpochDay, epochDay));
  IsoDate date = EpochDayToIsoDate(epochDay);
  int32_t year = TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, date.year));
  return LocalDate(year, date.month, date.day);
}

LocalDate LocalDate::Now(const Clock& clock) {
  Instant now = clock.instant();
  ZoneOffset offset = clock.getZone().getRules().getOffset(now);
  int64_t epochSec = now.getEpochSecond() + offset.getTotalSeconds();
  int64_t epochDay = FloorDiv(epochSec, SecondsPerDay);
  return TEMPORA_ALWAYS_OK(OfEpochDay(epochDay));
}

DateTimeResult<LocalDate> LocalDate::Parse(std::string_view text) {
  IsoParser parser(text);
  LocalDate date = TEMPORA_TRY(parser.localDate());
  TEMPORA_TRY(parser.finish());
  return date;
}

int32_t LocalDate::getDayOfYear() const {
  return FirstDayOfYear(getMonth(), isLeapYear()) + day_ - 1;
}

DayOfWeek LocalDate::getDayOfWeek() const {
  return DayOfWeek(IsoDayOfWeek(toEpochDay()));
}

bool LocalDate::isLeapYear() const { return IsIsoLeapYear(year_); }

int32_t LocalDate::lengthOfMonth() const {
  return IsoDaysInMonth(year_, month_);
}

int64_t LocalDate::toEpochDay() const {
  return MakeDay(IsoDate{year_, month_, day_});
}

DateTimeResult<ValueRange> LocalDate::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  switch (field) {
    case ChronoField::DayOfMonth:
      return ValueRange::Fixed(1, lengthOfMonth());
    case ChronoField::DayOfYear:
      return ValueRange::Fixed(1, lengthOfYear());
    case ChronoField::AlignedWeekOfMonth:
      return ValueRange::Fixed(
          1, getMonth() == Month::February && !isLeapYear() ? 4 : 5);
    case ChronoField::YearOfEra:
      return year_ <= 0 ? ValueRange::Fixed(1, int64_t(MaxYear) + 1)
                        : ValueRange::Fixed(1, MaxYear);
    default:
      return FieldRange(field);
  }
}

DateTimeResult<int32_t> LocalDate::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  ValueRange valueRange = TEMPORA_TRY(range(field));
  return valueRange.checkValidIntValue(value, field);
}

DateTimeResult<int64_t> LocalDate::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::DayOfWeek:
      return int64_t(getDayOfWeek());
    case ChronoField::AlignedDayOfWeekInMonth:
      return int64_t((day_ - 1) % 7 + 1);
    case ChronoField::AlignedDayOfWeekInYear:
      return int64_t((getDayOfYear() - 1) % 7 + 1);
    case ChronoField::DayOfMonth:
      return int64_t(day_);
    case ChronoField::DayOfYear:
      return int64_t(getDayOfYear());
    case ChronoField::EpochDay:
      return toEpochDay();
    case ChronoField::AlignedWeekOfMonth:
      return int64_t((day_ - 1) / 7 + 1);
    case ChronoField::AlignedWeekOfYear:
      return int64_t((getDayOfYear() - 1) / 7 + 1);
    case ChronoField::MonthOfYear:
      return int64_t(month_);
    case ChronoField::ProlepticMonth:
      return getProlepticMonth();
    case ChronoField::YearOfEra:
      return int64_t(year_ >= 1 ? year_ : 1 - int64_t(year_));
    case ChronoField::Year:
      return int64_t(year_);
    case ChronoField::Era:
      return int64_t(year_ >= 1 ? 1 : 0);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<LocalDate> LocalDate::with(ChronoField field,
                                          int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(CheckValidValue(field, newValue));
  switch (field) {
    case ChronoField::DayOfWeek:
      return plusDays(newValue - int64_t(getDayOfWeek()));
    case ChronoField::AlignedDayOfWeekInMonth:
    case ChronoField::AlignedDayOfWeekInYear:
      return plusDays(newValue - TEMPORA_TRY(getLong(field)));
    case ChronoField::DayOfMonth:
      return withDayOfMonth(int32_t(newValue));
    case ChronoField::DayOfYear:
      return withDayOfYear(int32_t(newValue));
    case ChronoField::EpochDay:
      return OfEpochDay(newValue);
    case ChronoField::AlignedWeekOfMonth:
    case ChronoField::AlignedWeekOfYear:
      return plusWeeks(newValue - TEMPORA_TRY(getLong(field)));
    case ChronoField::MonthOfYear:
      return withMonth(int32_t(newValue));
    case ChronoField::ProlepticMonth:
      return plusMonths(newValue - getProlepticMonth());
    case ChronoField::YearOfEra:
      return withYear(int32_t(year_ >= 1 ? newValue : 1 - newValue));
    case ChronoField::Year:
      return withYear(int32_t(newValue));
    case ChronoField::Era:
      if (TEMPORA_TRY(getLong(ChronoField::Era)) == newValue) {
        return *this;
      }
      return withYear(1 - year_);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<LocalDate> LocalDate::withYear(int32_t year) const {
  if (year_ == year) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::Year, year));
  return ResolvePreviousValid(year, month_, day_);
}

DateTimeResult<LocalDate> LocalDate::withMonth(int32_t month) const {
  if (month_ == month) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::MonthOfYear, month));
  return ResolvePreviousValid(year_, month, day_);
}

DateTimeResult<LocalDate> LocalDate::withDayOfMonth(int32_t dayOfMonth) const {
  if (day_ == dayOfMonth) {
    return *this;
  }
  return Of(year_, month_, dayOfMonth);
}

DateTimeResult<LocalDate> LocalDate::withDayOfYear(int32_t dayOfYear) const {
  if (getDayOfYear() == dayOfYear) {
    return *this;
  }
  return OfYearDay(year_, dayOfYear);
}

DateTimeResult<LocalDate> LocalDate::plus(int64_t amountToAdd,
                                          ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Days:
      return plusDays(amountToAdd);
    case ChronoUnit::Weeks:
      return plusWeeks(amountToAdd);
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

DateTimeResult<LocalDate> LocalDate::plus(const Period& period) const {
  LocalDate result = *this;
  if (period.getYears() != 0 && period.getMonths() != 0) {
    result = TEMPORA_TRY(result.plusMonths(period.toTotalMonths()));
  } else {
    if (period.getYears() != 0) {
      result = TEMPORA_TRY(result.plusYears(period.getYears()));
    }
    if (period.getMonths() != 0) {
      result = TEMPORA_TRY(result.plusMonths(period.getMonths()));
    }
  }
  if (period.getDays() != 0) {
    result = TEMPORA_TRY(result.plusDays(period.getDays()));
  }
  return result;
}

DateTimeResult<LocalDate> LocalDate::plusYears(int64_t years) const {
  if (years == 0) {
    return *this;
  }
  int64_t sum = TEMPORA_TRY(AddExact(year_, years));
  int32_t newYear = TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, sum));
  return ResolvePreviousValid(newYear, month_, day_);
}

DateTimeResult<LocalDate> LocalDate::plusMonths(int64_t months) const {
  if (months == 0) {
    return *this;
  }
  int64_t monthCount = int64_t(year_) * 12 + (month_ - 1);
  int64_t calcMonths = TEMPORA_TRY(AddExact(monthCount, months));
  int32_t newYear = TEMPORA_TRY(
      CheckValidIntValue(ChronoField::Year, FloorDiv<int64_t>(calcMonths, 12)));
  int32_t newMonth = int32_t(FloorMod<int64_t>(calcMonths, 12)) + 1;
  return ResolvePreviousValid(newYear, newMonth, day_);
}

DateTimeResult<LocalDate> LocalDate::plusWeeks(int64_t weeks) const {
  if (weeks == 0) {
    return *this;
  }
  return plusDays(TEMPORA_TRY(MultiplyExact(weeks, 7)));
}

DateTimeResult<LocalDate> LocalDate::plusDays(int64_t days) const {
  if (days == 0) {
    return *this;
  }
  return OfEpochDay(TEMPORA_TRY(AddExact(toEpochDay(), days)));
}

DateTimeResult<LocalDate> LocalDate::minus(int64_t amountToSubtract,
                                           ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    LocalDate date = TEMPORA_TRY(plus(INT64_MAX, unit));
    return date.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<LocalDate> LocalDate::minus(const Period& period) const {
  Period negated = TEMPORA_TRY(period.negated());
  return plus(negated);
}

DateTimeResult<LocalDate> LocalDate::minusYears(int64_t years) const {
  return minus(years, ChronoUnit::Years);
}

DateTimeResult<LocalDate> LocalDate::minusMonths(int64_t months) const {
  return minus(months, ChronoUnit::Months);
}

DateTimeResult<LocalDate> LocalDate::minusWeeks(int64_t weeks) const {
  return minus(weeks, ChronoUnit::Weeks);
}

DateTimeResult<LocalDate> LocalDate::minusDays(int64_t days) const {
  return minus(days, ChronoUnit::Days);
}

int64_t LocalDate::monthsUntil(const LocalDate& end) const {
  int64_t packed1 = getProlepticMonth() * 32 + day_;
  int64_t packed2 = end.getProlepticMonth() * 32 + end.day_;
  return (packed2 - packed1) / 32;
}

DateTimeResult<int64_t> LocalDate::until(const LocalDate& end,
                                         ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Days:
      return end.toEpochDay() - toEpochDay();
    case ChronoUnit::Weeks:
      return (end.toEpochDay() - toEpochDay()) / 7;
    case ChronoUnit::Months:
      return monthsUntil(end);
    case ChronoUnit::Years:
      return monthsUntil(end) / 12;
    case ChronoUnit::Decades:
      return monthsUntil(end) / 120;
    case ChronoUnit::Centuries:
      return monthsUntil(end) / 1200;
    case ChronoUnit::Millennia:
      return monthsUntil(end) / 12000;
    case ChronoUnit::Eras:
      return TEMPORA_TRY(end.getLong(ChronoField::Era)) -
             TEMPORA_TRY(getLong(ChronoField::Era));
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<Period> LocalDate::until(const LocalDate& end) const {
  int64_t totalMonths = end.getProlepticMonth() - getProlepticMonth();
  int32_t days = int32_t(end.day_) - int32_t(day_);
  if (totalMonths > 0 && days < 0) {
    totalMonths--;
    LocalDate calcDate = TEMPORA_TRY(plusMonths(totalMonths));
    days = int32_t(end.toEpochDay() - calcDate.toEpochDay());
  } else if (totalMonths < 0 && days > 0) {
    totalMonths++;
    days -= end.lengthOfMonth();
  }
  int64_t years = totalMonths / 12;
  int32_t months = int32_t(totalMonths % 12);
  return Period::Of(TEMPORA_TRY(ToIntExact(years)), months, days);
}

LocalDateTime LocalDate::atTime(const LocalTime& time) const {
  return LocalDateTime(*this, time);
}

DateTimeResult<LocalDateTime> LocalDate::atTime(int32_t hour, int32_t minute,
                                                int32_t second,
                                                int32_t nanoOfSecond) const {
  LocalTime time =
      TEMPORA_TRY(LocalTime::Of(hour, minute, second, nanoOfSecond));
  return atTime(time);
}

LocalDateTime LocalDate::atStartOfDay() const {
  return LocalDateTime(*this, LocalTime::Midnight());
}

std::string LocalDate::toString() const {
  std::string result;
  int32_t absYear = abs(year_);
  if (absYear < 1000) {
    result = year_ < 0 ? Smprintf("-%04d", absYear) : Smprintf("%04d", year_);
  } else if (year_ > 9999) {
    result = Smprintf("+%d", year_);
  } else {
    result = Smprintf("%d", year_);
  }
  result += Smprintf("-%02d-%02d", int(month_), int(day_));
  return result;
}
