/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/LocalTime.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/Duration.h"
#include "tempora/IsoParser.h"
#include "tempora/LocalDateTime.h"
#include "tempora/OffsetTime.h"
#include "tempora/Printf.h"
#include "tempora/ZoneId.h"
#include "tempora/zone/ZoneRules.h"

using namespace tempora;

DateTimeResult<LocalTime> LocalTime::Of(int32_t hour, int32_t minute) {
  return Of(hour, minute, 0, 0);
}

DateTimeResult<LocalTime> LocalTime::Of(int32_t hour, int32_t minute,
                                        int32_t second) {
  return Of(hour, minute, second, 0);
}

DateTimeResult<LocalTime> LocalTime::Of(int32_t hour, int32_t minute,
                                        int32_t second, int32_t nanoOfSecond) {
  TEMPORA_TRY(CheckValidValue(ChronoField::HourOfDay, hour));
  TEMPORA_TRY(CheckValidValue(ChronoField::MinuteOfHour, minute));
  TEMPORA_TRY(CheckValidValue(ChronoField::SecondOfMinute, second));
  TEMPORA_TRY(CheckValidValue(ChronoField::NanoOfSecond, nanoOfSecond));
  return LocalTime(hour, minute, second, nanoOfSecond);
}

DateTimeResult<LocalTime> LocalTime::OfSecondOfDay(int64_t secondOfDay) {
  TEMPORA_TRY(CheckValidValue(ChronoField::SecondOfDay, secondOfDay));
  int32_t hours = int32_t(secondOfDay / SecondsPerHour);
  secondOfDay -= hours * int64_t(SecondsPerHour);
  int32_t minutes = int32_t(secondOfDay / SecondsPerMinute);
  secondOfDay -= minutes * int64_t(SecondsPerMinute);
  return LocalTime(hours, minutes, int32_t(secondOfDay), 0);
}

DateTimeResult<LocalTime> LocalTime::OfNanoOfDay(int64_t nanoOfDay) {
  TEMPORA_TRY(CheckValidValue(ChronoField::NanoOfDay, nanoOfDay));
  int32_t hours = int32_t(nanoOfDay / NanosPerHour);
  nanoOfDay -= hours * NanosPerHour;
  int32_t minutes = int32_t(nanoOfDay / NanosPerMinute);
  nanoOfDay -= minutes * NanosPerMinute;
  int32_t seconds = int32_t(nanoOfDay / NanosPerSecond);
  nanoOfDay -= seconds * NanosPerSecond;
  return LocalTime(hours, minutes, seconds, int32_t(nanoOfDay));
}

LocalTime LocalTime::Now(const Clock& clock) {
  Instant now = clock.instant();
  ZoneOffset offset = clock.getZone().getRules().getOffset(now);
  int64_t secsOfDay = FloorMod<int64_t>(
      now.getEpochSecond() + offset.getTotalSeconds(), SecondsPerDay);
  return TEMPORA_ALWAYS_OK(
      OfNanoOfDay(secsOfDay * NanosPerSecond + now.getNano()));
}

DateTimeResult<LocalTime> LocalTime::Parse(std::string_view text) {
  IsoParser parser(text);
  LocalTime time = TEMPORA_TRY(parser.localTime());
  TEMPORA_TRY(parser.finish());
  return time;
}

DateTimeResult<ValueRange> LocalTime::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> LocalTime::get(ChronoField field) const {
  int64_t value = TEMPORA_TRY(getLong(field));
  return CheckValidIntValue(field, value);
}

DateTimeResult<int64_t> LocalTime::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::NanoOfSecond:
      return int64_t(nano_);
    case ChronoField::NanoOfDay:
      return toNanoOfDay();
    case ChronoField::MicroOfSecond:
      return int64_t(nano_ / 1000);
    case ChronoField::MicroOfDay:
      return toNanoOfDay() / 1000;
    case ChronoField::MilliOfSecond:
      return int64_t(nano_ / 1000'000);
    case ChronoField::MilliOfDay:
      return toNanoOfDay() / 1000'000;
    case ChronoField::SecondOfMinute:
      return int64_t(second_);
    case ChronoField::SecondOfDay:
      return int64_t(toSecondOfDay());
    case ChronoField::MinuteOfHour:
      return int64_t(minute_);
    case ChronoField::MinuteOfDay:
      return int64_t(hour_ * 60 + minute_);
    case ChronoField::HourOfAmPm:
      return int64_t(hour_ % 12);
    case ChronoField::ClockHourOfAmPm: {
      int32_t ham = hour_ % 12;
      return int64_t(ham % 12 == 0 ? 12 : ham);
    }
    case ChronoField::HourOfDay:
      return int64_t(hour_);
    case ChronoField::ClockHourOfDay:
      return int64_t(hour_ == 0 ? 24 : hour_);
    case ChronoField::AmPmOfDay:
      return int64_t(hour_ / 12);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<LocalTime> LocalTime::with(ChronoField field,
                                          int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(CheckValidValue(field, newValue));
  switch (field) {
    case ChronoField::NanoOfSecond:
      return withNano(int32_t(newValue));
    case ChronoField::NanoOfDay:
      return OfNanoOfDay(newValue);
    case ChronoField::MicroOfSecond:
      return withNano(int32_t(newValue * 1000));
    case ChronoField::MicroOfDay:
      return OfNanoOfDay(newValue * 1000);
    case ChronoField::MilliOfSecond:
      return withNano(int32_t(newValue * 1000'000));
    case ChronoField::MilliOfDay:
      return OfNanoOfDay(newValue * 1000'000);
    case ChronoField::SecondOfMinute:
      return withSecond(int32_t(newValue));
    case ChronoField::SecondOfDay:
      return plusSeconds(newValue - toSecondOfDay());
    case ChronoField::MinuteOfHour:
      return withMinute(int32_t(newValue));
    case ChronoField::MinuteOfDay:
      return plusMinutes(newValue - (hour_ * 60 + minute_));
    case ChronoField::HourOfAmPm:
      return plusHours(newValue - (hour_ % 12));
    case ChronoField::ClockHourOfAmPm:
      return plusHours((newValue == 12 ? 0 : newValue) - (hour_ % 12));
    case ChronoField::HourOfDay:
      return withHour(int32_t(newValue));
    case ChronoField::ClockHourOfDay:
      return withHour(int32_t(newValue == 24 ? 0 : newValue));
    case ChronoField::AmPmOfDay:
      return plusHours((newValue - (hour_ / 12)) * 12);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<LocalTime> LocalTime::withHour(int32_t hour) const {
  if (hour_ == hour) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::HourOfDay, hour));
  return LocalTime(hour, minute_, second_, nano_);
}

DateTimeResult<LocalTime> LocalTime::withMinute(int32_t minute) const {
  if (minute_ == minute) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::MinuteOfHour, minute));
  return LocalTime(hour_, minute, second_, nano_);
}

DateTimeResult<LocalTime> LocalTime::withSecond(int32_t second) const {
  if (second_ == second) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::SecondOfMinute, second));
  return LocalTime(hour_, minute_, second, nano_);
}

DateTimeResult<LocalTime> LocalTime::withNano(int32_t nanoOfSecond) const {
  if (nano_ == nanoOfSecond) {
    return *this;
  }
  TEMPORA_TRY(CheckValidValue(ChronoField::NanoOfSecond, nanoOfSecond));
  return LocalTime(hour_, minute_, second_, nanoOfSecond);
}

DateTimeResult<LocalTime> LocalTime::truncatedTo(ChronoUnit unit) const {
  if (unit == ChronoUnit::Nanos) {
    return *this;
  }
  Duration unitDur = UnitDuration(unit);
  if (unitDur.getSeconds() > SecondsPerDay) {
    return Err(DateTimeError::InvalidValue(
        std::string("Unit is too large to be used for truncation")));
  }
  int64_t dur = TEMPORA_TRY(unitDur.toNanos());
  if (NanosPerDay % dur != 0) {
    return Err(DateTimeError::InvalidValue(std::string(
        "Unit must divide into a standard day without remainder")));
  }
  int64_t nod = toNanoOfDay();
  return OfNanoOfDay((nod / dur) * dur);
}

DateTimeResult<LocalTime> LocalTime::plus(int64_t amountToAdd,
                                          ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Nanos:
      return plusNanos(amountToAdd);
    case ChronoUnit::Micros:
      return plusNanos((amountToAdd % MicrosPerDay) * 1000);
    case ChronoUnit::Millis:
      return plusNanos((amountToAdd % MillisPerDay) * 1000'000);
    case ChronoUnit::Seconds:
      return plusSeconds(amountToAdd);
    case ChronoUnit::Minutes:
      return plusMinutes(amountToAdd);
    case ChronoUnit::Hours:
      return plusHours(amountToAdd);
    case ChronoUnit::HalfDays:
      return plusHours((amountToAdd % 2) * 12);
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

LocalTime LocalTime::plusHours(int64_t hours) const {
  if (hours == 0) {
    return *this;
  }
  int32_t newHour =
      int32_t(((hours % HoursPerDay) + hour_ + HoursPerDay) % HoursPerDay);
  return LocalTime(newHour, minute_, second_, nano_);
}

LocalTime LocalTime::plusMinutes(int64_t minutes) const {
  if (minutes == 0) {
    return *this;
  }
  int32_t mofd = hour_ * MinutesPerHour + minute_;
  int32_t newMofd = int32_t(((minutes % MinutesPerDay) + mofd + MinutesPerDay) %
                            MinutesPerDay);
  if (mofd == newMofd) {
    return *this;
  }
  return LocalTime(newMofd / MinutesPerHour, newMofd % MinutesPerHour, second_,
                   nano_);
}

LocalTime LocalTime::plusSeconds(int64_t seconds) const {
  if (seconds == 0) {
    return *this;
  }
  int32_t sofd = toSecondOfDay();
  int32_t newSofd = int32_t(((seconds % SecondsPerDay) + sofd + SecondsPerDay) %
                            SecondsPerDay);
  if (sofd == newSofd) {
    return *this;
  }
  return LocalTime(newSofd / SecondsPerHour,
                   (newSofd / SecondsPerMinute) % MinutesPerHour,
                   newSofd % SecondsPerMinute, nano_);
}

LocalTime LocalTime::plusNanos(int64_t nanos) const {
  if (nanos == 0) {
    return *this;
  }
  int64_t nofd = toNanoOfDay();
  int64_t newNofd = ((nanos % NanosPerDay) + nofd + NanosPerDay) % NanosPerDay;
  if (nofd == newNofd) {
    return *this;
  }
  return TEMPORA_ALWAYS_OK(OfNanoOfDay(newNofd));
}

DateTimeResult<LocalTime> LocalTime::minus(int64_t amountToSubtract,
                                           ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    LocalTime time = TEMPORA_TRY(plus(INT64_MAX, unit));
    return time.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<int64_t> LocalTime::until(const LocalTime& end,
                                         ChronoUnit unit) const {
  int64_t nanosUntil = end.toNanoOfDay() - toNanoOfDay();
  switch (unit) {
    case ChronoUnit::Nanos:
      return nanosUntil;
    case ChronoUnit::Micros:
      return nanosUntil / 1000;
    case ChronoUnit::Millis:
      return nanosUntil / 1000'000;
    case ChronoUnit::Seconds:
      return nanosUntil / NanosPerSecond;
    case ChronoUnit::Minutes:
      return nanosUntil / NanosPerMinute;
    case ChronoUnit::Hours:
      return nanosUntil / NanosPerHour;
    case ChronoUnit::HalfDays:
      return nanosUntil / (12 * NanosPerHour);
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

LocalDateTime LocalTime::atDate(const LocalDate& date) const {
  return LocalDateTime(date, *this);
}

OffsetTime LocalTime::atOffset(const ZoneOffset& offset) const {
  return OffsetTime(*this, offset);
}

std::string LocalTime::toString() const {
  std::string result = Smprintf("%02d:%02d", int(hour_), int(minute_));
  if (second_ > 0 || nano_ > 0) {
    result += Smprintf(":%02d", int(second_));
    if (nano_ > 0) {
      if (nano_ % 1000'000 == 0) {
        result += Smprintf(".%03d", nano_ / 1000'000);
      } else if (nano_ % 1000 == 0) {
        result += Smprintf(".%06d", nano_ / 1000);
      } else {
        result += Smprintf(".%09d", nano_);
      }
    }
  }
  return result;
}
