/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/calendar/Chronology.h"

#include <algorithm>

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/IsoCalendar.h"
#include "tempora/Printf.h"
#include "tempora/calendar/ChronoDate.h"
#include "tempora/calendar/HijrahCalendar.h"

using namespace tempora;
using namespace tempora::calendar;

static constexpr int32_t MinguoYearOffset = 1911;
static constexpr int32_t ThaiYearOffset = 543;

// ISO year minus proleptic year for the shifted-year calendars.
static int32_t IsoYearDelta(CalendarSystem system) {
  switch (system) {
    case CalendarSystem::Minguo:
      return MinguoYearOffset;
    case CalendarSystem::ThaiBuddhist:
      return -ThaiYearOffset;
    default:
      return 0;
  }
}

const char* Era::name() const {
  switch (system_) {
    case CalendarSystem::Iso:
      return value_ == 1 ? "CE" : value_ == 0 ? "BCE" : "";
    case CalendarSystem::Minguo:
      return value_ == 1 ? "ROC" : value_ == 0 ? "BEFORE_ROC" : "";
    case CalendarSystem::ThaiBuddhist:
      return value_ == 1 ? "BE" : value_ == 0 ? "BEFORE_BE" : "";
    case CalendarSystem::Japanese:
      switch (value_) {
        case -1:
          return "Meiji";
        case 0:
          return "Taisho";
        case 1:
          return "Showa";
        case 2:
          return "Heisei";
        case 3:
          return "Reiwa";
      }
      return "";
    case CalendarSystem::Hijrah:
      return value_ == 1 ? "AH" : value_ == 0 ? "BEFORE_AH" : "";
  }
  return "";
}

LocalDate tempora::calendar::JapaneseEraStart(const Era& era) {
  TEMPORA_ASSERT(era.getCalendarSystem() == CalendarSystem::Japanese);
  switch (era.getValue()) {
    case -1:
      return TEMPORA_ALWAYS_OK(LocalDate::Of(1868, 9, 8));
    case 0:
      return TEMPORA_ALWAYS_OK(LocalDate::Of(1912, 7, 30));
    case 1:
      return TEMPORA_ALWAYS_OK(LocalDate::Of(1926, 12, 25));
    case 2:
      return TEMPORA_ALWAYS_OK(LocalDate::Of(1989, 1, 8));
    default:
      return TEMPORA_ALWAYS_OK(LocalDate::Of(2019, 5, 1));
  }
}

Era tempora::calendar::JapaneseEraOf(const LocalDate& date) {
  for (int32_t value = JapaneseReiwa.getValue();
       value > JapaneseMeiji.getValue(); value--) {
    Era era(CalendarSystem::Japanese, value);
    if (!date.isBefore(JapaneseEraStart(era))) {
      return era;
    }
  }
  return JapaneseMeiji;
}

LocalDate tempora::calendar::JapaneseMinDate() {
  return TEMPORA_ALWAYS_OK(LocalDate::Of(1873, 1, 1));
}

static DateTimeError InvalidEra(const Chronology& chrono, const Era& era) {
  return DateTimeError::InvalidValue(Smprintf(
      "Era %s is not valid for the %s calendar", era.toString().c_str(),
      chrono.getId()));
}

DateTimeResult<Chronology> Chronology::Of(std::string_view idOrType) {
  for (const Chronology& chrono : AvailableChronologies()) {
    if (idOrType == chrono.getId() || idOrType == chrono.getCalendarType()) {
      return chrono;
    }
  }
  return Err(DateTimeError::InvalidValue("Unknown calendar system: " +
                                         std::string(idOrType)));
}

std::vector<Chronology> Chronology::AvailableChronologies() {
  return {Iso(), Minguo(), ThaiBuddhist(), Japanese(), Hijrah()};
}

const char* Chronology::getId() const {
  switch (system_) {
    case CalendarSystem::Iso:
      return "ISO";
    case CalendarSystem::Minguo:
      return "Minguo";
    case CalendarSystem::ThaiBuddhist:
      return "ThaiBuddhist";
    case CalendarSystem::Japanese:
      return "Japanese";
    case CalendarSystem::Hijrah:
      return "Hijrah";
  }
  TEMPORA_CRASH("invalid calendar system");
}

const char* Chronology::getCalendarType() const {
  switch (system_) {
    case CalendarSystem::Iso:
      return "iso8601";
    case CalendarSystem::Minguo:
      return "roc";
    case CalendarSystem::ThaiBuddhist:
      return "buddhist";
    case CalendarSystem::Japanese:
      return "japanese";
    case CalendarSystem::Hijrah:
      return "islamic-civil";
  }
  TEMPORA_CRASH("invalid calendar system");
}

DateTimeResult<ChronoDate> Chronology::date(int32_t prolepticYear,
                                            int32_t month,
                                            int32_t dayOfMonth) const {
  TEMPORA_TRY(range(ChronoField::Year)
                  .checkValidIntValue(prolepticYear, ChronoField::Year));

  if (system_ == CalendarSystem::Hijrah) {
    TEMPORA_TRY(CheckValidIntValue(ChronoField::MonthOfYear, month));
    int32_t monthLength = HijrahDaysInMonth(prolepticYear, month);
    if (dayOfMonth < 1 || dayOfMonth > monthLength) {
      return Err(DateTimeError::InvalidValue(Smprintf(
          "Invalid Hijrah date: day %d is not valid for month %d of year %d",
          dayOfMonth, month, prolepticYear)));
    }
    HijrahDate hijrah{prolepticYear, month, dayOfMonth};
    return dateEpochDay(HijrahToEpochDay(hijrah));
  }

  LocalDate iso = TEMPORA_TRY(LocalDate::Of(
      prolepticYear + IsoYearDelta(system_), month, dayOfMonth));
  return date(iso);
}

DateTimeResult<ChronoDate> Chronology::date(const Era& era, int32_t yearOfEra,
                                            int32_t month,
                                            int32_t dayOfMonth) const {
  int32_t year = TEMPORA_TRY(prolepticYear(era, yearOfEra));
  ChronoDate result = TEMPORA_TRY(date(year, month, dayOfMonth));
  if (result.getEra() != era) {
    return Err(DateTimeError::InvalidValue(
        "Requested date is outside bounds of era " + era.toString()));
  }
  return result;
}

DateTimeResult<ChronoDate> Chronology::dateYearDay(int32_t prolepticYear,
                                                   int32_t dayOfYear) const {
  TEMPORA_TRY(range(ChronoField::Year)
                  .checkValidIntValue(prolepticYear, ChronoField::Year));

  if (system_ == CalendarSystem::Hijrah) {
    if (dayOfYear < 1 || dayOfYear > HijrahDaysInYear(prolepticYear)) {
      return Err(DateTimeError::InvalidValue(
          Smprintf("Invalid Hijrah date: day %d is not valid for year %d",
                   dayOfYear, prolepticYear)));
    }
    return dateEpochDay(HijrahYearStart(prolepticYear) + dayOfYear - 1);
  }

  LocalDate iso = TEMPORA_TRY(LocalDate::OfYearDay(
      prolepticYear + IsoYearDelta(system_), dayOfYear));
  return date(iso);
}

DateTimeResult<ChronoDate> Chronology::dateYearDay(const Era& era,
                                                   int32_t yearOfEra,
                                                   int32_t dayOfYear) const {
  int32_t year = TEMPORA_TRY(prolepticYear(era, yearOfEra));
  if (system_ == CalendarSystem::Japanese && yearOfEra == 1) {
    LocalDate start = JapaneseEraStart(era);
    if (dayOfYear < 1 ||
        dayOfYear > start.lengthOfYear() - start.getDayOfYear() + 1) {
      return Err(DateTimeError::InvalidValue(Smprintf(
          "Day %d exceeds the first year of era %s", dayOfYear, era.name())));
    }
    dayOfYear += start.getDayOfYear() - 1;
  }
  ChronoDate result = TEMPORA_TRY(dateYearDay(year, dayOfYear));
  if (result.getEra() != era) {
    return Err(DateTimeError::InvalidValue(
        "Requested date is outside bounds of era " + era.toString()));
  }
  return result;
}

DateTimeResult<ChronoDate> Chronology::dateEpochDay(int64_t epochDay) const {
  LocalDate iso = TEMPORA_TRY(LocalDate::OfEpochDay(epochDay));
  return date(iso);
}

DateTimeResult<ChronoDate> Chronology::date(const LocalDate& date) const {
  switch (system_) {
    case CalendarSystem::Japanese:
      if (date.isBefore(JapaneseMinDate())) {
        return Err(DateTimeError::InvalidValue(
            "Minimum supported date is January 1st Meiji 6"));
      }
      break;
    case CalendarSystem::Hijrah: {
      int64_t epochDay = date.toEpochDay();
      if (epochDay < HijrahMinEpochDay() || epochDay > HijrahMaxEpochDay()) {
        return Err(DateTimeError::InvalidValue(
            "Date outside the Hijrah calendar: " + date.toString()));
      }
      break;
    }
    case CalendarSystem::Minguo:
    case CalendarSystem::ThaiBuddhist: {
      // The proleptic year must stay within the Year range.
      int64_t year = int64_t(date.getYear()) - IsoYearDelta(system_);
      TEMPORA_TRY(range(ChronoField::Year).checkValidValue(year,
                                                          ChronoField::Year));
      break;
    }
    case CalendarSystem::Iso:
      break;
  }
  return ChronoDate(*this, date);
}

DateTimeResult<ChronoDate> Chronology::dateNow(const Clock& clock) const {
  return date(LocalDate::Now(clock));
}

bool Chronology::isLeapYear(int64_t prolepticYear) const {
  if (system_ == CalendarSystem::Hijrah) {
    return IsHijrahLeapYear(prolepticYear);
  }
  return IsIsoLeapYear(prolepticYear + IsoYearDelta(system_));
}

DateTimeResult<int32_t> Chronology::prolepticYear(const Era& era,
                                                  int32_t yearOfEra) const {
  if (era.getCalendarSystem() != system_) {
    return Err(InvalidEra(*this, era));
  }
  TEMPORA_TRY(eraOf(era.getValue()));

  switch (system_) {
    case CalendarSystem::Japanese: {
      if (yearOfEra < 1) {
        return Err(DateTimeError::InvalidValue(
            Smprintf("Invalid year of era: %d", yearOfEra)));
      }
      int64_t year = int64_t(JapaneseEraStart(era).getYear()) + yearOfEra - 1;
      return range(ChronoField::Year).checkValidIntValue(year,
                                                         ChronoField::Year);
    }
    default:
      if (era.getValue() == 1) {
        return yearOfEra;
      }
      return ToIntExact(1 - int64_t(yearOfEra));
  }
}

DateTimeResult<Era> Chronology::eraOf(int32_t eraValue) const {
  for (const Era& era : eras()) {
    if (era.getValue() == eraValue) {
      return era;
    }
  }
  return Err(DateTimeError::InvalidValue(
      Smprintf("Invalid era for the %s calendar: %d", getId(), eraValue)));
}

std::vector<Era> Chronology::eras() const {
  switch (system_) {
    case CalendarSystem::Iso:
      return {IsoBce, IsoCe};
    case CalendarSystem::Minguo:
      return {MinguoBeforeRoc, MinguoRoc};
    case CalendarSystem::ThaiBuddhist:
      return {ThaiBeforeBe, ThaiBe};
    case CalendarSystem::Japanese:
      return {JapaneseMeiji, JapaneseTaisho, JapaneseShowa, JapaneseHeisei,
              JapaneseReiwa};
    case CalendarSystem::Hijrah:
      return {HijrahBeforeAh, HijrahAh};
  }
  TEMPORA_CRASH("invalid calendar system");
}

ValueRange Chronology::range(ChronoField field) const {
  ValueRange iso = FieldRange(field);
  switch (system_) {
    case CalendarSystem::Iso:
      return iso;

    case CalendarSystem::Minguo:
    case CalendarSystem::ThaiBuddhist: {
      int64_t delta = IsoYearDelta(system_);
      switch (field) {
        case ChronoField::ProlepticMonth:
          return ValueRange::Fixed(iso.getMinimum() - delta * 12,
                                   iso.getMaximum() - delta * 12);
        case ChronoField::YearOfEra: {
          ValueRange year = FieldRange(ChronoField::Year);
          int64_t ce = year.getMaximum() - delta;
          int64_t bce = 1 - year.getMinimum() + delta;
          return ValueRange::Fixed(1, std::min(ce, bce), std::max(ce, bce));
        }
        case ChronoField::Year:
          return ValueRange::Fixed(iso.getMinimum() - delta,
                                   iso.getMaximum() - delta);
        default:
          return iso;
      }
    }

    case CalendarSystem::Japanese: {
      int64_t minYear = JapaneseMinDate().getYear();
      switch (field) {
        case ChronoField::Era:
          return ValueRange::Fixed(JapaneseMeiji.getValue(),
                                   JapaneseReiwa.getValue());
        case ChronoField::YearOfEra:
          // Taisho is the shortest era at 15 years.
          return ValueRange::Fixed(
              1, 15,
              LocalDate::MaxYear - JapaneseEraStart(JapaneseReiwa).getYear() +
                  1);
        case ChronoField::DayOfYear: {
          // Showa 1 had seven days.
          int64_t shortest = 366;
          for (const Era& era : eras()) {
            LocalDate start = JapaneseEraStart(era);
            shortest = std::min<int64_t>(
                shortest, start.lengthOfYear() - start.getDayOfYear() + 1);
          }
          return ValueRange::Fixed(1, shortest, 366);
        }
        case ChronoField::Year:
          return ValueRange::Fixed(minYear, LocalDate::MaxYear);
        case ChronoField::ProlepticMonth:
          return ValueRange::Fixed(minYear * 12, iso.getMaximum());
        default:
          return iso;
      }
    }

    case CalendarSystem::Hijrah:
      switch (field) {
        case ChronoField::DayOfMonth:
          return ValueRange::Fixed(1, 29, 30);
        case ChronoField::DayOfYear:
          return ValueRange::Fixed(1, 354, 355);
        case ChronoField::AlignedWeekOfMonth:
          return ValueRange::Fixed(1, 5);
        case ChronoField::AlignedWeekOfYear:
          return ValueRange::Fixed(1, 51);
        case ChronoField::EpochDay:
          return ValueRange::Fixed(HijrahMinEpochDay(), HijrahMaxEpochDay());
        case ChronoField::ProlepticMonth:
          return ValueRange::Fixed(int64_t(HijrahMinYear) * 12,
                                   int64_t(HijrahMaxYear) * 12 + 11);
        case ChronoField::YearOfEra:
          return ValueRange::Fixed(1, HijrahMaxYear);
        case ChronoField::Year:
          return ValueRange::Fixed(HijrahMinYear, HijrahMaxYear);
        case ChronoField::Era:
          return ValueRange::Fixed(HijrahBeforeAh.getValue(),
                                   HijrahAh.getValue());
        default:
          return iso;
      }
  }
  TEMPORA_CRASH("invalid calendar system");
}
