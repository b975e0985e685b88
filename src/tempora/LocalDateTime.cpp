/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/LocalDateTime.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/IsoParser.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/Period.h"
#include "tempora/ZoneId.h"
#include "tempora/ZonedDateTime.h"
#include "tempora/zone/ZoneRules.h"

using namespace tempora;

static constexpr int64_t SecondsPerDay = LocalTime::SecondsPerDay;
static constexpr int64_t NanosPerDay = LocalTime::NanosPerDay;

DateTimeResult<LocalDateTime> LocalDateTime::Of(int32_t year, int32_t month,
                                                int32_t dayOfMonth,
                                                int32_t hour, int32_t minute,
                                                int32_t second,
                                                int32_t nanoOfSecond) {
  LocalDate date = TEMPORA_TRY(LocalDate::Of(year, month, dayOfMonth));
  LocalTime time =
      TEMPORA_TRY(LocalTime::Of(hour, minute, second, nanoOfSecond));
  return LocalDateTime(date, time);
}

DateTimeResult<LocalDateTime> LocalDateTime::OfEpochSecond(
    int64_t epochSecond, int32_t nanoOfSecond, const ZoneOffset& offset) {
  TEMPORA_TRY(CheckValidValue(ChronoField::NanoOfSecond, nanoOfSecond));
  int64_t localSecond =
      TEMPORA_TRY(AddExact(epochSecond, offset.getTotalSeconds()));
  int64_t localEpochDay = FloorDiv(localSecond, SecondsPerDay);
  int64_t secsOfDay = FloorMod(localSecond, SecondsPerDay);
  LocalDate date = TEMPORA_TRY(LocalDate::OfEpochDay(localEpochDay));
  LocalTime time = TEMPORA_TRY(LocalTime::OfNanoOfDay(
      secsOfDay * LocalTime::NanosPerSecond + nanoOfSecond));
  return LocalDateTime(date, time);
}

DateTimeResult<LocalDateTime> LocalDateTime::OfInstant(const Instant& instant,
                                                       const ZoneId& zone) {
  ZoneOffset offset = zone.getRules().getOffset(instant);
  return OfEpochSecond(instant.getEpochSecond(), instant.getNano(), offset);
}

LocalDateTime LocalDateTime::Now(const Clock& clock) {
  Instant now = clock.instant();
  ZoneOffset offset = clock.getZone().getRules().getOffset(now);
  return TEMPORA_ALWAYS_OK(
      OfEpochSecond(now.getEpochSecond(), now.getNano(), offset));
}

DateTimeResult<LocalDateTime> LocalDateTime::Parse(std::string_view text) {
  IsoParser parser(text);
  LocalDateTime dateTime = TEMPORA_TRY(parser.localDateTime());
  TEMPORA_TRY(parser.finish());
  return dateTime;
}

DateTimeResult<ValueRange> LocalDateTime::range(ChronoField field) const {
  return IsTimeBased(field) ? time_.range(field) : date_.range(field);
}

DateTimeResult<int32_t> LocalDateTime::get(ChronoField field) const {
  return IsTimeBased(field) ? time_.get(field) : date_.get(field);
}

DateTimeResult<int64_t> LocalDateTime::getLong(ChronoField field) const {
  return IsTimeBased(field) ? time_.getLong(field) : date_.getLong(field);
}

DateTimeResult<LocalDateTime> LocalDateTime::with(ChronoField field,
                                                  int64_t newValue) const {
  if (IsTimeBased(field)) {
    LocalTime time = TEMPORA_TRY(time_.with(field, newValue));
    return with(date_, time);
  }
  LocalDate date = TEMPORA_TRY(date_.with(field, newValue));
  return with(date, time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::withYear(int32_t year) const {
  return with(TEMPORA_TRY(date_.withYear(year)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::withMonth(int32_t month) const {
  return with(TEMPORA_TRY(date_.withMonth(month)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::withDayOfMonth(
    int32_t dayOfMonth) const {
  return with(TEMPORA_TRY(date_.withDayOfMonth(dayOfMonth)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::withDayOfYear(
    int32_t dayOfYear) const {
  return with(TEMPORA_TRY(date_.withDayOfYear(dayOfYear)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::withHour(int32_t hour) const {
  return with(date_, TEMPORA_TRY(time_.withHour(hour)));
}

DateTimeResult<LocalDateTime> LocalDateTime::withMinute(int32_t minute) const {
  return with(date_, TEMPORA_TRY(time_.withMinute(minute)));
}

DateTimeResult<LocalDateTime> LocalDateTime::withSecond(int32_t second) const {
  return with(date_, TEMPORA_TRY(time_.withSecond(second)));
}

DateTimeResult<LocalDateTime> LocalDateTime::withNano(
    int32_t nanoOfSecond) const {
  return with(date_, TEMPORA_TRY(time_.withNano(nanoOfSecond)));
}

DateTimeResult<LocalDateTime> LocalDateTime::truncatedTo(
    ChronoUnit unit) const {
  return with(date_, TEMPORA_TRY(time_.truncatedTo(unit)));
}

DateTimeResult<LocalDateTime> LocalDateTime::plus(int64_t amountToAdd,
                                                  ChronoUnit unit) const {
  if (!IsTimeBased(unit)) {
    return with(TEMPORA_TRY(date_.plus(amountToAdd, unit)), time_);
  }
  switch (unit) {
    case ChronoUnit::Nanos:
      return plusNanos(amountToAdd);
    case ChronoUnit::Micros: {
      LocalDateTime result =
          TEMPORA_TRY(plusDays(amountToAdd / LocalTime::MicrosPerDay));
      return result.plusNanos((amountToAdd % LocalTime::MicrosPerDay) * 1000);
    }
    case ChronoUnit::Millis: {
      LocalDateTime result =
          TEMPORA_TRY(plusDays(amountToAdd / LocalTime::MillisPerDay));
      return result.plusNanos((amountToAdd % LocalTime::MillisPerDay) *
                              1000'000);
    }
    case ChronoUnit::Seconds:
      return plusSeconds(amountToAdd);
    case ChronoUnit::Minutes:
      return plusMinutes(amountToAdd);
    case ChronoUnit::Hours:
      return plusHours(amountToAdd);
    case ChronoUnit::HalfDays: {
      LocalDateTime result = TEMPORA_TRY(plusDays(amountToAdd / 256));
      return result.plusHours((amountToAdd % 256) * 12);
    }
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<LocalDateTime> LocalDateTime::plus(
    const Duration& duration) const {
  LocalDateTime result = *this;
  if (duration.getSeconds() != 0) {
    result = TEMPORA_TRY(result.plusSeconds(duration.getSeconds()));
  }
  if (duration.getNano() != 0) {
    result = TEMPORA_TRY(result.plusNanos(duration.getNano()));
  }
  return result;
}

DateTimeResult<LocalDateTime> LocalDateTime::plus(const Period& period) const {
  return with(TEMPORA_TRY(date_.plus(period)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusYears(int64_t years) const {
  return with(TEMPORA_TRY(date_.plusYears(years)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusMonths(int64_t months) const {
  return with(TEMPORA_TRY(date_.plusMonths(months)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusWeeks(int64_t weeks) const {
  return with(TEMPORA_TRY(date_.plusWeeks(weeks)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusDays(int64_t days) const {
  return with(TEMPORA_TRY(date_.plusDays(days)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusHours(int64_t hours) const {
  return plusWithOverflow(date_, hours, 0, 0, 0, 1);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusMinutes(
    int64_t minutes) const {
  return plusWithOverflow(date_, 0, minutes, 0, 0, 1);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusSeconds(
    int64_t seconds) const {
  return plusWithOverflow(date_, 0, 0, seconds, 0, 1);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusNanos(int64_t nanos) const {
  return plusWithOverflow(date_, 0, 0, 0, nanos, 1);
}

DateTimeResult<LocalDateTime> LocalDateTime::minus(int64_t amountToSubtract,
                                                   ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    LocalDateTime result = TEMPORA_TRY(plus(INT64_MAX, unit));
    return result.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<LocalDateTime> LocalDateTime::minus(
    const Duration& duration) const {
  LocalDateTime result = *this;
  if (duration.getSeconds() != 0) {
    result = TEMPORA_TRY(result.minusSeconds(duration.getSeconds()));
  }
  if (duration.getNano() != 0) {
    result = TEMPORA_TRY(result.minusNanos(duration.getNano()));
  }
  return result;
}

DateTimeResult<LocalDateTime> LocalDateTime::minus(
    const Period& period) const {
  return with(TEMPORA_TRY(date_.minus(period)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusYears(int64_t years) const {
  return with(TEMPORA_TRY(date_.minusYears(years)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusMonths(
    int64_t months) const {
  return with(TEMPORA_TRY(date_.minusMonths(months)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusWeeks(int64_t weeks) const {
  return with(TEMPORA_TRY(date_.minusWeeks(weeks)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusDays(int64_t days) const {
  return with(TEMPORA_TRY(date_.minusDays(days)), time_);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusHours(int64_t hours) const {
  return plusWithOverflow(date_, hours, 0, 0, 0, -1);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusMinutes(
    int64_t minutes) const {
  return plusWithOverflow(date_, 0, minutes, 0, 0, -1);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusSeconds(
    int64_t seconds) const {
  return plusWithOverflow(date_, 0, 0, seconds, 0, -1);
}

DateTimeResult<LocalDateTime> LocalDateTime::minusNanos(int64_t nanos) const {
  return plusWithOverflow(date_, 0, 0, 0, nanos, -1);
}

DateTimeResult<LocalDateTime> LocalDateTime::plusWithOverflow(
    const LocalDate& newDate, int64_t hours, int64_t minutes, int64_t seconds,
    int64_t nanos, int32_t sign) const {
  if ((hours | minutes | seconds | nanos) == 0) {
    return with(newDate, time_);
  }

  // Split each amount into whole days and a remainder below one day, so the
  // remainders can be summed as nanoseconds without overflow.
  int64_t totDays = nanos / NanosPerDay + seconds / SecondsPerDay +
                    minutes / LocalTime::MinutesPerDay +
                    hours / LocalTime::HoursPerDay;
  totDays *= sign;
  int64_t totNanos =
      nanos % NanosPerDay +
      (seconds % SecondsPerDay) * LocalTime::NanosPerSecond +
      (minutes % LocalTime::MinutesPerDay) * LocalTime::NanosPerMinute +
      (hours % LocalTime::HoursPerDay) * LocalTime::NanosPerHour;
  int64_t curNoD = time_.toNanoOfDay();
  totNanos = totNanos * sign + curNoD;
  totDays += FloorDiv(totNanos, NanosPerDay);
  int64_t newNoD = FloorMod(totNanos, NanosPerDay);
  LocalTime newTime =
      newNoD == curNoD ? time_ : TEMPORA_ALWAYS_OK(LocalTime::OfNanoOfDay(newNoD));
  return with(TEMPORA_TRY(newDate.plusDays(totDays)), newTime);
}

DateTimeResult<int64_t> LocalDateTime::until(const LocalDateTime& end,
                                             ChronoUnit unit) const {
  if (IsTimeBased(unit)) {
    int64_t daysUntil = TEMPORA_TRY(date_.until(end.date_, ChronoUnit::Days));
    int64_t timeUntil = end.time_.toNanoOfDay() - time_.toNanoOfDay();
    if (daysUntil > 0 && timeUntil < 0) {
      daysUntil--;
      timeUntil += NanosPerDay;
    } else if (daysUntil < 0 && timeUntil > 0) {
      daysUntil++;
      timeUntil -= NanosPerDay;
    }
    int64_t amount = daysUntil;
    switch (unit) {
      case ChronoUnit::Nanos:
        amount = TEMPORA_TRY(MultiplyExact(amount, NanosPerDay));
        return AddExact(amount, timeUntil);
      case ChronoUnit::Micros:
        amount = TEMPORA_TRY(MultiplyExact(amount, LocalTime::MicrosPerDay));
        return AddExact(amount, timeUntil / 1000);
      case ChronoUnit::Millis:
        amount = TEMPORA_TRY(MultiplyExact(amount, LocalTime::MillisPerDay));
        return AddExact(amount, timeUntil / 1000'000);
      case ChronoUnit::Seconds:
        amount = TEMPORA_TRY(MultiplyExact(amount, SecondsPerDay));
        return AddExact(amount, timeUntil / LocalTime::NanosPerSecond);
      case ChronoUnit::Minutes:
        amount = TEMPORA_TRY(MultiplyExact(amount, LocalTime::MinutesPerDay));
        return AddExact(amount, timeUntil / LocalTime::NanosPerMinute);
      case ChronoUnit::Hours:
        amount = TEMPORA_TRY(MultiplyExact(amount, LocalTime::HoursPerDay));
        return AddExact(amount, timeUntil / LocalTime::NanosPerHour);
      case ChronoUnit::HalfDays:
        amount = TEMPORA_TRY(MultiplyExact(amount, 2));
        return AddExact(amount, timeUntil / (LocalTime::NanosPerHour * 12));
      default:
        return Err(UnsupportedUnitError(unit));
    }
  }

  LocalDate endDate = end.date_;
  if (endDate.isAfter(date_) && end.time_.isBefore(time_)) {
    endDate = TEMPORA_TRY(endDate.minusDays(1));
  } else if (endDate.isBefore(date_) && end.time_.isAfter(time_)) {
    endDate = TEMPORA_TRY(endDate.plusDays(1));
  }
  return date_.until(endDate, unit);
}

OffsetDateTime LocalDateTime::atOffset(const ZoneOffset& offset) const {
  return OffsetDateTime(*this, offset);
}

DateTimeResult<ZonedDateTime> LocalDateTime::atZone(const ZoneId& zone) const {
  return ZonedDateTime::Of(*this, zone);
}

int64_t LocalDateTime::toEpochSecond(const ZoneOffset& offset) const {
  int64_t epochDay = date_.toEpochDay();
  int64_t secs = epochDay * SecondsPerDay + time_.toSecondOfDay();
  return secs - offset.getTotalSeconds();
}

DateTimeResult<Instant> LocalDateTime::toInstant(
    const ZoneOffset& offset) const {
  return Instant::OfEpochSecond(toEpochSecond(offset), time_.getNano());
}
