/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/calendar/ChronoDate.h"

#include <algorithm>
#include <limits>

#include "tempora/CheckedArithmetic.h"
#include "tempora/Printf.h"
#include "tempora/calendar/HijrahCalendar.h"

using namespace tempora;
using namespace tempora::calendar;

static bool IsHijrah(const Chronology& chrono) {
  return chrono.getCalendarSystem() == CalendarSystem::Hijrah;
}

static bool IsJapanese(const Chronology& chrono) {
  return chrono.getCalendarSystem() == CalendarSystem::Japanese;
}

// ISO day-of-year of the first day of the Japanese year containing `iso`:
// the era start in the first year of an era, otherwise January 1st.
static int32_t JapaneseYearStartDay(const LocalDate& iso, const Era& era) {
  LocalDate start = JapaneseEraStart(era);
  return start.getYear() == iso.getYear() ? start.getDayOfYear() : 1;
}

// ISO day-of-year of the last day of the Japanese year containing `iso`,
// which ends early when the next era starts within the ISO year.
static int32_t JapaneseYearEndDay(const LocalDate& iso, const Era& era) {
  if (era != JapaneseReiwa) {
    LocalDate next =
        JapaneseEraStart(Era(CalendarSystem::Japanese, era.getValue() + 1));
    if (next.getYear() == iso.getYear()) {
      return next.getDayOfYear() - 1;
    }
  }
  return iso.lengthOfYear();
}

bool ChronoDate::isSupported(ChronoField field) const {
  if (IsJapanese(chrono_)) {
    switch (field) {
      case ChronoField::AlignedDayOfWeekInMonth:
      case ChronoField::AlignedDayOfWeekInYear:
      case ChronoField::AlignedWeekOfMonth:
      case ChronoField::AlignedWeekOfYear:
        return false;
      default:
        break;
    }
  }
  return IsDateBased(field);
}

ChronoDate::Fields ChronoDate::fields() const {
  switch (chrono_.getCalendarSystem()) {
    case CalendarSystem::Hijrah: {
      HijrahDate hijrah = HijrahFromEpochDay(iso_.toEpochDay());
      return Fields{hijrah.year, hijrah.month, hijrah.day};
    }
    case CalendarSystem::Minguo:
      return Fields{iso_.getYear() - 1911, iso_.getMonthValue(),
                    iso_.getDayOfMonth()};
    case CalendarSystem::ThaiBuddhist:
      return Fields{iso_.getYear() + 543, iso_.getMonthValue(),
                    iso_.getDayOfMonth()};
    case CalendarSystem::Iso:
    case CalendarSystem::Japanese:
      break;
  }
  return Fields{iso_.getYear(), iso_.getMonthValue(), iso_.getDayOfMonth()};
}

DateTimeResult<ChronoDate> ChronoDate::withIso(
    const DateTimeResult<LocalDate>& iso) const {
  if (iso.isErr()) {
    return Err(iso.inspectErr());
  }
  return chrono_.date(iso.inspect());
}

Era ChronoDate::getEra() const {
  switch (chrono_.getCalendarSystem()) {
    case CalendarSystem::Japanese:
      return JapaneseEraOf(iso_);
    case CalendarSystem::Hijrah:
      return getProlepticYear() >= 1 ? HijrahAh : HijrahBeforeAh;
    default:
      return TEMPORA_ALWAYS_OK(chrono_.eraOf(getProlepticYear() >= 1 ? 1 : 0));
  }
}

int32_t ChronoDate::getYearOfEra() const {
  switch (chrono_.getCalendarSystem()) {
    case CalendarSystem::Japanese:
      return iso_.getYear() - JapaneseEraStart(getEra()).getYear() + 1;
    default: {
      int32_t year = getProlepticYear();
      return year >= 1 ? year : 1 - year;
    }
  }
}

int32_t ChronoDate::getDayOfYear() const {
  if (IsHijrah(chrono_)) {
    Fields f = fields();
    return HijrahDaysBeforeMonth(f.month) + f.day;
  }
  if (IsJapanese(chrono_)) {
    return iso_.getDayOfYear() - JapaneseYearStartDay(iso_, getEra()) + 1;
  }
  return iso_.getDayOfYear();
}

bool ChronoDate::isLeapYear() const {
  return chrono_.isLeapYear(getProlepticYear());
}

int32_t ChronoDate::lengthOfMonth() const {
  if (IsHijrah(chrono_)) {
    Fields f = fields();
    return HijrahDaysInMonth(f.year, f.month);
  }
  return iso_.lengthOfMonth();
}

int32_t ChronoDate::lengthOfYear() const {
  if (IsHijrah(chrono_)) {
    return HijrahDaysInYear(getProlepticYear());
  }
  if (IsJapanese(chrono_)) {
    Era era = getEra();
    return JapaneseYearEndDay(iso_, era) - JapaneseYearStartDay(iso_, era) + 1;
  }
  return iso_.lengthOfYear();
}

DateTimeResult<ValueRange> ChronoDate::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }

  switch (field) {
    case ChronoField::DayOfMonth:
      return ValueRange::Fixed(1, lengthOfMonth());
    case ChronoField::DayOfYear:
      return ValueRange::Fixed(1, lengthOfYear());
    case ChronoField::AlignedWeekOfMonth:
      return ValueRange::Fixed(1, (lengthOfMonth() + 6) / 7);
    case ChronoField::YearOfEra:
      switch (chrono_.getCalendarSystem()) {
        case CalendarSystem::Japanese: {
          Era era = getEra();
          int64_t start = JapaneseEraStart(era).getYear();
          if (era == JapaneseReiwa) {
            return ValueRange::Fixed(1, LocalDate::MaxYear - start + 1);
          }
          Era next(CalendarSystem::Japanese, era.getValue() + 1);
          int64_t end = JapaneseEraStart(next).getYear();
          return ValueRange::Fixed(1, end - start + 1);
        }
        case CalendarSystem::Hijrah:
          return chrono_.range(field);
        default: {
          ValueRange years = chrono_.range(ChronoField::Year);
          return getProlepticYear() >= 1
                     ? ValueRange::Fixed(1, years.getMaximum())
                     : ValueRange::Fixed(1, 1 - years.getMinimum());
        }
      }
    default:
      return chrono_.range(field);
  }
}

DateTimeResult<int32_t> ChronoDate::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  ValueRange valueRange = TEMPORA_TRY(range(field));
  return valueRange.checkValidIntValue(value, field);
}

DateTimeResult<int64_t> ChronoDate::getLong(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }

  Fields f = fields();
  switch (field) {
    case ChronoField::DayOfWeek:
      return int64_t(getDayOfWeek());
    case ChronoField::AlignedDayOfWeekInMonth:
      return int64_t((f.day - 1) % 7 + 1);
    case ChronoField::AlignedDayOfWeekInYear:
      return int64_t((getDayOfYear() - 1) % 7 + 1);
    case ChronoField::DayOfMonth:
      return int64_t(f.day);
    case ChronoField::DayOfYear:
      return int64_t(getDayOfYear());
    case ChronoField::EpochDay:
      return toEpochDay();
    case ChronoField::AlignedWeekOfMonth:
      return int64_t((f.day - 1) / 7 + 1);
    case ChronoField::AlignedWeekOfYear:
      return int64_t((getDayOfYear() - 1) / 7 + 1);
    case ChronoField::MonthOfYear:
      return int64_t(f.month);
    case ChronoField::ProlepticMonth:
      return int64_t(f.year) * 12 + f.month - 1;
    case ChronoField::YearOfEra:
      return int64_t(getYearOfEra());
    case ChronoField::Year:
      return int64_t(f.year);
    case ChronoField::Era:
      return int64_t(getEra().getValue());
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<ChronoDate> ChronoDate::resolveHijrah(int64_t year,
                                                     int32_t month,
                                                     int32_t day) const {
  int32_t validYear = TEMPORA_TRY(
      chrono_.range(ChronoField::Year).checkValidIntValue(year,
                                                          ChronoField::Year));
  day = std::min(day, HijrahDaysInMonth(validYear, month));
  return chrono_.date(validYear, month, day);
}

DateTimeResult<ChronoDate> ChronoDate::with(ChronoField field,
                                            int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(chrono_.range(field).checkValidValue(newValue, field));

  switch (field) {
    case ChronoField::DayOfWeek:
    case ChronoField::AlignedDayOfWeekInMonth:
    case ChronoField::AlignedDayOfWeekInYear:
      return plus(newValue - TEMPORA_TRY(getLong(field)), ChronoUnit::Days);
    case ChronoField::AlignedWeekOfMonth:
    case ChronoField::AlignedWeekOfYear:
      return plus(newValue - TEMPORA_TRY(getLong(field)), ChronoUnit::Weeks);
    case ChronoField::EpochDay:
      return chrono_.dateEpochDay(newValue);
    case ChronoField::ProlepticMonth:
      return plusMonths(newValue - TEMPORA_TRY(getLong(field)));
    default:
      break;
  }

  Fields f = fields();
  switch (chrono_.getCalendarSystem()) {
    case CalendarSystem::Hijrah:
      switch (field) {
        case ChronoField::DayOfMonth:
        case ChronoField::DayOfYear: {
          ValueRange valueRange = TEMPORA_TRY(range(field));
          TEMPORA_TRY(valueRange.checkValidValue(newValue, field));
          return plus(newValue - TEMPORA_TRY(getLong(field)), ChronoUnit::Days);
        }
        case ChronoField::MonthOfYear:
          return resolveHijrah(f.year, int32_t(newValue), f.day);
        case ChronoField::YearOfEra:
          return resolveHijrah(f.year >= 1 ? newValue : 1 - newValue, f.month,
                               f.day);
        case ChronoField::Year:
          return resolveHijrah(newValue, f.month, f.day);
        case ChronoField::Era:
          if (TEMPORA_TRY(getLong(ChronoField::Era)) == newValue) {
            return *this;
          }
          return resolveHijrah(1 - int64_t(f.year), f.month, f.day);
        default:
          break;
      }
      break;

    case CalendarSystem::Japanese:
      switch (field) {
        case ChronoField::DayOfYear: {
          ValueRange valueRange = TEMPORA_TRY(range(field));
          TEMPORA_TRY(valueRange.checkValidValue(newValue, field));
          return plus(newValue - getDayOfYear(), ChronoUnit::Days);
        }
        case ChronoField::YearOfEra: {
          int32_t year = TEMPORA_TRY(
              chrono_.prolepticYear(getEra(), int32_t(newValue)));
          return withIso(iso_.withYear(year));
        }
        case ChronoField::Era: {
          Era era = TEMPORA_TRY(chrono_.eraOf(int32_t(newValue)));
          int32_t year =
              TEMPORA_TRY(chrono_.prolepticYear(era, getYearOfEra()));
          return withIso(iso_.withYear(year));
        }
        default:
          break;
      }
      break;

    case CalendarSystem::Iso:
    case CalendarSystem::Minguo:
    case CalendarSystem::ThaiBuddhist: {
      int32_t isoDelta = iso_.getYear() - f.year;
      switch (field) {
        case ChronoField::YearOfEra: {
          int64_t year = f.year >= 1 ? newValue : 1 - newValue;
          int32_t isoYear = TEMPORA_TRY(ToIntExact(year + isoDelta));
          return withIso(iso_.withYear(isoYear));
        }
        case ChronoField::Year: {
          int32_t isoYear = TEMPORA_TRY(ToIntExact(newValue + isoDelta));
          return withIso(iso_.withYear(isoYear));
        }
        case ChronoField::Era: {
          if (TEMPORA_TRY(getLong(ChronoField::Era)) == newValue) {
            return *this;
          }
          int32_t isoYear =
              TEMPORA_TRY(ToIntExact(1 - int64_t(f.year) + isoDelta));
          return withIso(iso_.withYear(isoYear));
        }
        default:
          break;
      }
      break;
    }
  }

  return withIso(iso_.with(field, newValue));
}

DateTimeResult<ChronoDate> ChronoDate::plusMonths(int64_t months) const {
  if (months == 0) {
    return *this;
  }
  if (!IsHijrah(chrono_)) {
    return withIso(iso_.plusMonths(months));
  }

  Fields f = fields();
  int64_t monthCount = TEMPORA_TRY(
      AddExact(int64_t(f.year) * 12 + (f.month - 1), months));
  int64_t year = FloorDiv<int64_t>(monthCount, 12);
  int32_t month = int32_t(FloorMod<int64_t>(monthCount, 12)) + 1;
  return resolveHijrah(year, month, f.day);
}

DateTimeResult<ChronoDate> ChronoDate::plusYears(int64_t years) const {
  if (years == 0) {
    return *this;
  }
  if (!IsHijrah(chrono_)) {
    return withIso(iso_.plusYears(years));
  }

  Fields f = fields();
  int64_t year = TEMPORA_TRY(AddExact(f.year, years));
  return resolveHijrah(year, f.month, f.day);
}

DateTimeResult<ChronoDate> ChronoDate::plus(int64_t amountToAdd,
                                            ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Days:
      return withIso(iso_.plusDays(amountToAdd));
    case ChronoUnit::Weeks:
      return withIso(iso_.plusWeeks(amountToAdd));
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

DateTimeResult<ChronoDate> ChronoDate::minus(int64_t amountToSubtract,
                                             ChronoUnit unit) const {
  if (amountToSubtract == std::numeric_limits<int64_t>::min()) {
    ChronoDate date = TEMPORA_TRY(plus(std::numeric_limits<int64_t>::max(), unit));
    return date.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

int32_t ChronoDate::compareTo(const ChronoDate& other) const {
  int64_t day = toEpochDay();
  int64_t otherDay = other.toEpochDay();
  if (day != otherDay) {
    return day < otherDay ? -1 : 1;
  }
  return int32_t(chrono_.getCalendarSystem()) -
         int32_t(other.chrono_.getCalendarSystem());
}

std::string ChronoDate::toString() const {
  if (chrono_.getCalendarSystem() == CalendarSystem::Iso) {
    return iso_.toString();
  }
  Fields f = fields();
  return Smprintf("%s %s %d-%02d-%02d", chrono_.getId(), getEra().name(),
                  getYearOfEra(), f.month, f.day);
}
