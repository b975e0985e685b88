/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_calendar_ChronoDate_h
#define tempora_calendar_ChronoDate_h

#include <stdint.h>

#include <string>

#include "tempora/DateTimeError.h"
#include "tempora/DayOfWeek.h"
#include "tempora/LocalDate.h"
#include "tempora/TemporalAdjusters.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"
#include "tempora/ValueRange.h"
#include "tempora/calendar/Chronology.h"

namespace tempora {
namespace calendar {

/**
 * A date in one of the calendar systems, such as "Minguo ROC 101-10-29".
 *
 * The date is held as its ISO equivalent; the calendar fields are derived
 * from it. Dates of different calendar systems on the same day compare
 * equal with isEqual but not with ==.
 */
class ChronoDate final {
  Chronology chrono_;
  LocalDate iso_;

  ChronoDate(Chronology chrono, const LocalDate& iso)
      : chrono_(chrono), iso_(iso) {}

  friend class Chronology;

  struct Fields final {
    int32_t year;
    int32_t month;
    int32_t day;
  };

  // Proleptic year, month and day in this calendar system.
  Fields fields() const;

  // The same calendar system on another day, checked against its limits.
  DateTimeResult<ChronoDate> withIso(const DateTimeResult<LocalDate>& iso) const;

  DateTimeResult<ChronoDate> plusMonths(int64_t months) const;
  DateTimeResult<ChronoDate> plusYears(int64_t years) const;

  // Hijrah dates are clamped to the last day of the month.
  DateTimeResult<ChronoDate> resolveHijrah(int64_t year, int32_t month,
                                           int32_t day) const;

 public:
  const Chronology& getChronology() const { return chrono_; }

  Era getEra() const;
  int32_t getYearOfEra() const;
  int32_t getProlepticYear() const { return fields().year; }
  int32_t getMonthValue() const { return fields().month; }
  int32_t getDayOfMonth() const { return fields().day; }
  int32_t getDayOfYear() const;
  DayOfWeek getDayOfWeek() const { return iso_.getDayOfWeek(); }

  int64_t toEpochDay() const { return iso_.toEpochDay(); }
  const LocalDate& toLocalDate() const { return iso_; }

  bool isLeapYear() const;
  int32_t lengthOfMonth() const;
  int32_t lengthOfYear() const;

  /**
   * The date-based fields, less the aligned week fields for the Japanese
   * calendar.
   */
  bool isSupported(ChronoField field) const;
  bool isSupported(ChronoUnit unit) const { return IsDateBased(unit); }

  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  DateTimeResult<ChronoDate> with(ChronoField field, int64_t newValue) const;
  DateTimeResult<ChronoDate> with(const TemporalAdjuster& adjuster) const {
    return adjuster.adjust(*this);
  }

  DateTimeResult<ChronoDate> plus(int64_t amountToAdd, ChronoUnit unit) const;
  DateTimeResult<ChronoDate> minus(int64_t amountToSubtract,
                                   ChronoUnit unit) const;

  /**
   * Orders by day, then by calendar system.
   */
  int32_t compareTo(const ChronoDate& other) const;

  bool isAfter(const ChronoDate& other) const {
    return toEpochDay() > other.toEpochDay();
  }
  bool isBefore(const ChronoDate& other) const {
    return toEpochDay() < other.toEpochDay();
  }
  bool isEqual(const ChronoDate& other) const {
    return toEpochDay() == other.toEpochDay();
  }

  bool operator==(const ChronoDate& other) const {
    return chrono_ == other.chrono_ && iso_ == other.iso_;
  }
  bool operator!=(const ChronoDate& other) const { return !(*this == other); }

  /**
   * ISO dates format as LocalDate, others as "Minguo ROC 101-10-29".
   */
  std::string toString() const;
};

}  // namespace calendar
}  // namespace tempora

#endif /* tempora_calendar_ChronoDate_h */
