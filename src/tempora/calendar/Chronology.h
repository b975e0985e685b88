/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_calendar_Chronology_h
#define tempora_calendar_Chronology_h

#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/TemporalFields.h"
#include "tempora/ValueRange.h"

namespace tempora {

class Clock;

namespace calendar {

class ChronoDate;

enum class CalendarSystem : uint8_t {
  Iso,
  Minguo,
  ThaiBuddhist,
  Japanese,
  // The tabular civil Islamic calendar.
  Hijrah,
};

/**
 * An era of a calendar system. Values follow the calendar: 0 and 1 for
 * the ISO, Minguo, Thai Buddhist and Hijrah eras, and -1 (Meiji) to 3
 * (Reiwa) for the Japanese eras.
 */
class Era final {
  CalendarSystem system_;
  int32_t value_;

 public:
  constexpr Era(CalendarSystem system, int32_t value)
      : system_(system), value_(value) {}

  CalendarSystem getCalendarSystem() const { return system_; }
  int32_t getValue() const { return value_; }

  /**
   * The era's name, such as "ROC" or "Heisei", or "" for an unknown era.
   */
  const char* name() const;

  bool operator==(const Era& other) const {
    return system_ == other.system_ && value_ == other.value_;
  }
  bool operator!=(const Era& other) const { return !(*this == other); }

  std::string toString() const { return name(); }
};

constexpr Era IsoBce(CalendarSystem::Iso, 0);
constexpr Era IsoCe(CalendarSystem::Iso, 1);
constexpr Era MinguoBeforeRoc(CalendarSystem::Minguo, 0);
constexpr Era MinguoRoc(CalendarSystem::Minguo, 1);
constexpr Era ThaiBeforeBe(CalendarSystem::ThaiBuddhist, 0);
constexpr Era ThaiBe(CalendarSystem::ThaiBuddhist, 1);
constexpr Era JapaneseMeiji(CalendarSystem::Japanese, -1);
constexpr Era JapaneseTaisho(CalendarSystem::Japanese, 0);
constexpr Era JapaneseShowa(CalendarSystem::Japanese, 1);
constexpr Era JapaneseHeisei(CalendarSystem::Japanese, 2);
constexpr Era JapaneseReiwa(CalendarSystem::Japanese, 3);
constexpr Era HijrahBeforeAh(CalendarSystem::Hijrah, 0);
constexpr Era HijrahAh(CalendarSystem::Hijrah, 1);

/**
 * The first ISO date of a Japanese era.
 */
LocalDate JapaneseEraStart(const Era& era);

/**
 * The Japanese era containing `date`. Dates before Meiji are reported as
 * Meiji.
 */
Era JapaneseEraOf(const LocalDate& date);

/**
 * The earliest date of the Japanese calendar, 1873-01-01 (Meiji 6), when
 * Japan adopted the Gregorian calendar.
 */
LocalDate JapaneseMinDate();

/**
 * A calendar system.
 *
 * All calendar systems share the ISO day: a date in any of them is a view
 * of an epoch day. Minguo and Thai Buddhist years are ISO years shifted by
 * a constant; Japanese years are ISO years counted from the start of each
 * era; Hijrah years follow the 30-year cycle of the tabular calendar.
 */
class Chronology final {
  CalendarSystem system_;

 public:
  constexpr explicit Chronology(CalendarSystem system) : system_(system) {}

  static constexpr Chronology Iso() {
    return Chronology(CalendarSystem::Iso);
  }
  static constexpr Chronology Minguo() {
    return Chronology(CalendarSystem::Minguo);
  }
  static constexpr Chronology ThaiBuddhist() {
    return Chronology(CalendarSystem::ThaiBuddhist);
  }
  static constexpr Chronology Japanese() {
    return Chronology(CalendarSystem::Japanese);
  }
  static constexpr Chronology Hijrah() {
    return Chronology(CalendarSystem::Hijrah);
  }

  /**
   * Looks a calendar system up by id ("Minguo") or by calendar type
   * ("roc").
   */
  static DateTimeResult<Chronology> Of(std::string_view idOrType);

  static std::vector<Chronology> AvailableChronologies();

  CalendarSystem getCalendarSystem() const { return system_; }

  const char* getId() const;

  /**
   * The CLDR calendar type, such as "buddhist".
   */
  const char* getCalendarType() const;

  DateTimeResult<ChronoDate> date(int32_t prolepticYear, int32_t month,
                                  int32_t dayOfMonth) const;
  DateTimeResult<ChronoDate> date(const Era& era, int32_t yearOfEra,
                                  int32_t month, int32_t dayOfMonth) const;
  DateTimeResult<ChronoDate> dateYearDay(int32_t prolepticYear,
                                         int32_t dayOfYear) const;

  /**
   * In the Japanese calendar the day-of-year restarts with each era, so
   * day 1 of Heisei 1 is 1989-01-08.
   */
  DateTimeResult<ChronoDate> dateYearDay(const Era& era, int32_t yearOfEra,
                                         int32_t dayOfYear) const;
  DateTimeResult<ChronoDate> dateEpochDay(int64_t epochDay) const;

  /**
   * The date in this calendar system on the same day as `date`.
   */
  DateTimeResult<ChronoDate> date(const LocalDate& date) const;

  DateTimeResult<ChronoDate> dateNow(const Clock& clock) const;

  bool isLeapYear(int64_t prolepticYear) const;

  /**
   * The proleptic year of `yearOfEra` in `era`, which must belong to this
   * calendar system.
   */
  DateTimeResult<int32_t> prolepticYear(const Era& era,
                                        int32_t yearOfEra) const;

  DateTimeResult<Era> eraOf(int32_t eraValue) const;
  std::vector<Era> eras() const;

  /**
   * The outer range of `field` in this calendar system.
   */
  ValueRange range(ChronoField field) const;

  bool operator==(const Chronology& other) const {
    return system_ == other.system_;
  }
  bool operator!=(const Chronology& other) const { return !(*this == other); }

  std::string toString() const { return getId(); }
};

}  // namespace calendar
}  // namespace tempora

#endif /* tempora_calendar_Chronology_h */
