/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/IsoFields.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/IsoCalendar.h"

using namespace tempora;

// Days before the first day of each quarter, in common and leap years.
static constexpr int32_t QuarterDays[2][4] = {
    {0, 90, 181, 273},
    {0, 91, 182, 274},
};

const char* tempora::IsoFieldName(IsoField field) {
  switch (field) {
    case IsoField::DayOfQuarter:
      return "DayOfQuarter";
    case IsoField::QuarterOfYear:
      return "QuarterOfYear";
    case IsoField::WeekOfWeekBasedYear:
      return "WeekOfWeekBasedYear";
    case IsoField::WeekBasedYear:
      return "WeekBasedYear";
  }
  TEMPORA_CRASH("invalid iso field");
}

const char* tempora::IsoUnitName(IsoUnit unit) {
  switch (unit) {
    case IsoUnit::WeekBasedYears:
      return "WeekBasedYears";
    case IsoUnit::QuarterYears:
      return "QuarterYears";
  }
  TEMPORA_CRASH("invalid iso unit");
}

int32_t tempora::IsoWeeksInWeekBasedYear(int64_t weekBasedYear) {
  // A year has 53 weeks if it starts on a Thursday, or if it's a leap year
  // which starts on a Wednesday.
  int32_t startOfYear = IsoDayOfWeek(DayFromYear(weekBasedYear));
  bool longYear =
      startOfYear == 4 || (startOfYear == 3 && IsIsoLeapYear(weekBasedYear));
  return longYear ? 53 : 52;
}

IsoYearWeek tempora::ToIsoWeekOfYear(const LocalDate& date) {
  int64_t year = date.getYear();
  int32_t doy = date.getDayOfYear();
  int32_t dow = int32_t(date.getDayOfWeek());

  int32_t woy = (10 + doy - dow) / 7;
  TEMPORA_ASSERT(0 <= woy && woy <= 53);

  // Part of last year's last week.
  if (woy == 0) {
    return {year - 1, IsoWeeksInWeekBasedYear(year - 1)};
  }

  // Part of next year's first week.
  if (woy == 53 && IsoWeeksInWeekBasedYear(year) == 52) {
    return {year + 1, 1};
  }

  return {year, woy};
}

ValueRange tempora::IsoFieldRange(IsoField field) {
  switch (field) {
    case IsoField::DayOfQuarter:
      return ValueRange::Fixed(1, 90, 92);
    case IsoField::QuarterOfYear:
      return ValueRange::Fixed(1, 4);
    case IsoField::WeekOfWeekBasedYear:
      return ValueRange::Fixed(1, 52, 53);
    case IsoField::WeekBasedYear:
      return FieldRange(ChronoField::Year);
  }
  TEMPORA_CRASH("invalid iso field");
}

ValueRange tempora::IsoFieldRange(const LocalDate& date, IsoField field) {
  switch (field) {
    case IsoField::DayOfQuarter:
      switch (GetIsoField(date, IsoField::QuarterOfYear)) {
        case 1:
          return ValueRange::Fixed(1, date.isLeapYear() ? 91 : 90);
        case 2:
          return ValueRange::Fixed(1, 91);
        default:
          return ValueRange::Fixed(1, 92);
      }
    case IsoField::WeekOfWeekBasedYear:
      return ValueRange::Fixed(
          1, IsoWeeksInWeekBasedYear(ToIsoWeekOfYear(date).year));
    case IsoField::QuarterOfYear:
    case IsoField::WeekBasedYear:
      return IsoFieldRange(field);
  }
  TEMPORA_CRASH("invalid iso field");
}

int64_t tempora::GetIsoField(const LocalDate& date, IsoField field) {
  switch (field) {
    case IsoField::DayOfQuarter: {
      int32_t quarter = (date.getMonthValue() - 1) / 3;
      return date.getDayOfYear() - QuarterDays[date.isLeapYear()][quarter];
    }
    case IsoField::QuarterOfYear:
      return (date.getMonthValue() + 2) / 3;
    case IsoField::WeekOfWeekBasedYear:
      return ToIsoWeekOfYear(date).week;
    case IsoField::WeekBasedYear:
      return ToIsoWeekOfYear(date).year;
  }
  TEMPORA_CRASH("invalid iso field");
}

DateTimeResult<LocalDate> tempora::WithIsoField(const LocalDate& date,
                                                IsoField field,
                                                int64_t newValue) {
  ValueRange range = IsoFieldRange(date, field);
  TEMPORA_TRY(range.checkValidValue(newValue, IsoFieldName(field)));
  int64_t current = GetIsoField(date, field);

  switch (field) {
    case IsoField::DayOfQuarter:
      return date.plusDays(newValue - current);
    case IsoField::QuarterOfYear:
      return date.withMonth(
          int32_t(date.getMonthValue() + (newValue - current) * 3));
    case IsoField::WeekOfWeekBasedYear:
      return date.plusWeeks(newValue - current);
    case IsoField::WeekBasedYear: {
      int32_t year = TEMPORA_TRY(
          range.checkValidIntValue(newValue, IsoFieldName(field)));
      int32_t week = ToIsoWeekOfYear(date).week;
      if (week == 53 && IsoWeeksInWeekBasedYear(year) == 52) {
        week = 52;
      }
      // January 4th is always in week 1.
      LocalDate resolved = TEMPORA_TRY(LocalDate::Of(year, 1, 4));
      int64_t days = int64_t(date.getDayOfWeek()) -
                     int64_t(resolved.getDayOfWeek()) + (week - 1) * 7;
      return resolved.plusDays(days);
    }
  }
  TEMPORA_CRASH("invalid iso field");
}

DateTimeResult<LocalDate> tempora::PlusIsoUnit(const LocalDate& date,
                                               int64_t amountToAdd,
                                               IsoUnit unit) {
  switch (unit) {
    case IsoUnit::WeekBasedYears: {
      int64_t year = GetIsoField(date, IsoField::WeekBasedYear);
      return WithIsoField(date, IsoField::WeekBasedYear,
                          TEMPORA_TRY(AddExact(year, amountToAdd)));
    }
    case IsoUnit::QuarterYears: {
      // Whole years first so the month count can't overflow.
      LocalDate result = TEMPORA_TRY(date.plusYears(amountToAdd / 4));
      return result.plusMonths((amountToAdd % 4) * 3);
    }
  }
  TEMPORA_CRASH("invalid iso unit");
}

DateTimeResult<int64_t> tempora::IsoUnitBetween(const LocalDate& start,
                                                const LocalDate& end,
                                                IsoUnit unit) {
  switch (unit) {
    case IsoUnit::WeekBasedYears:
      return SubtractExact(GetIsoField(end, IsoField::WeekBasedYear),
                           GetIsoField(start, IsoField::WeekBasedYear));
    case IsoUnit::QuarterYears:
      return TEMPORA_TRY(start.until(end, ChronoUnit::Months)) / 3;
  }
  TEMPORA_CRASH("invalid iso unit");
}
