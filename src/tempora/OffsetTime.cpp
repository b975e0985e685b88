/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/OffsetTime.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/Instant.h"
#include "tempora/IsoParser.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/ZoneId.h"
#include "tempora/zone/ZoneRules.h"

using namespace tempora;

DateTimeResult<OffsetTime> OffsetTime::Of(int32_t hour, int32_t minute,
                                          int32_t second, int32_t nanoOfSecond,
                                          const ZoneOffset& offset) {
  LocalTime time =
      TEMPORA_TRY(LocalTime::Of(hour, minute, second, nanoOfSecond));
  return OffsetTime(time, offset);
}

DateTimeResult<OffsetTime> OffsetTime::OfInstant(const Instant& instant,
                                                 const ZoneId& zone) {
  ZoneOffset offset = zone.getRules().getOffset(instant);
  int64_t secsOfDay = FloorMod<int64_t>(
      instant.getEpochSecond() + offset.getTotalSeconds(),
      LocalTime::SecondsPerDay);
  LocalTime time = TEMPORA_TRY(LocalTime::OfNanoOfDay(
      secsOfDay * LocalTime::NanosPerSecond + instant.getNano()));
  return OffsetTime(time, offset);
}

OffsetTime OffsetTime::Now(const Clock& clock) {
  return TEMPORA_ALWAYS_OK(OfInstant(clock.instant(), clock.getZone()));
}

DateTimeResult<OffsetTime> OffsetTime::Parse(std::string_view text) {
  IsoParser parser(text);
  LocalTime time = TEMPORA_TRY(parser.localTime());
  ZoneOffset offset = TEMPORA_TRY(parser.parseOffset());
  TEMPORA_TRY(parser.finish());
  return OffsetTime(time, offset);
}

int64_t OffsetTime::toEpochNano() const {
  int64_t nod = time_.toNanoOfDay();
  int64_t offsetNanos = offset_.getTotalSeconds() * LocalTime::NanosPerSecond;
  return nod - offsetNanos;
}

DateTimeResult<ValueRange> OffsetTime::range(ChronoField field) const {
  if (field == ChronoField::OffsetSeconds) {
    return FieldRange(field);
  }
  return time_.range(field);
}

DateTimeResult<int32_t> OffsetTime::get(ChronoField field) const {
  if (field == ChronoField::OffsetSeconds) {
    return offset_.getTotalSeconds();
  }
  return time_.get(field);
}

DateTimeResult<int64_t> OffsetTime::getLong(ChronoField field) const {
  if (field == ChronoField::OffsetSeconds) {
    return int64_t(offset_.getTotalSeconds());
  }
  return time_.getLong(field);
}

DateTimeResult<OffsetTime> OffsetTime::with(ChronoField field,
                                            int64_t newValue) const {
  if (field == ChronoField::OffsetSeconds) {
    int32_t seconds = TEMPORA_TRY(CheckValidIntValue(field, newValue));
    ZoneOffset offset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(seconds));
    return with(time_, offset);
  }
  LocalTime time = TEMPORA_TRY(time_.with(field, newValue));
  return with(time, offset_);
}

DateTimeResult<OffsetTime> OffsetTime::withHour(int32_t hour) const {
  return with(TEMPORA_TRY(time_.withHour(hour)), offset_);
}

DateTimeResult<OffsetTime> OffsetTime::withMinute(int32_t minute) const {
  return with(TEMPORA_TRY(time_.withMinute(minute)), offset_);
}

DateTimeResult<OffsetTime> OffsetTime::withSecond(int32_t second) const {
  return with(TEMPORA_TRY(time_.withSecond(second)), offset_);
}

DateTimeResult<OffsetTime> OffsetTime::withNano(int32_t nanoOfSecond) const {
  return with(TEMPORA_TRY(time_.withNano(nanoOfSecond)), offset_);
}

OffsetTime OffsetTime::withOffsetSameInstant(const ZoneOffset& offset) const {
  if (offset == offset_) {
    return *this;
  }
  int32_t difference = offset.getTotalSeconds() - offset_.getTotalSeconds();
  return OffsetTime(time_.plusSeconds(difference), offset);
}

DateTimeResult<OffsetTime> OffsetTime::truncatedTo(ChronoUnit unit) const {
  return with(TEMPORA_TRY(time_.truncatedTo(unit)), offset_);
}

DateTimeResult<OffsetTime> OffsetTime::plus(int64_t amountToAdd,
                                            ChronoUnit unit) const {
  return with(TEMPORA_TRY(time_.plus(amountToAdd, unit)), offset_);
}

DateTimeResult<OffsetTime> OffsetTime::minus(int64_t amountToSubtract,
                                             ChronoUnit unit) const {
  return with(TEMPORA_TRY(time_.minus(amountToSubtract, unit)), offset_);
}

DateTimeResult<int64_t> OffsetTime::until(const OffsetTime& end,
                                          ChronoUnit unit) const {
  int64_t nanosUntil = end.toEpochNano() - toEpochNano();
  switch (unit) {
    case ChronoUnit::Nanos:
      return nanosUntil;
    case ChronoUnit::Micros:
      return nanosUntil / 1000;
    case ChronoUnit::Millis:
      return nanosUntil / 1000'000;
    case ChronoUnit::Seconds:
      return nanosUntil / LocalTime::NanosPerSecond;
    case ChronoUnit::Minutes:
      return nanosUntil / LocalTime::NanosPerMinute;
    case ChronoUnit::Hours:
      return nanosUntil / LocalTime::NanosPerHour;
    case ChronoUnit::HalfDays:
      return nanosUntil / (12 * LocalTime::NanosPerHour);
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

OffsetDateTime OffsetTime::atDate(const LocalDate& date) const {
  return OffsetDateTime(LocalDateTime(date, time_), offset_);
}

int32_t OffsetTime::compareTo(const OffsetTime& other) const {
  if (offset_ == other.offset_) {
    return time_.compareTo(other.time_);
  }
  int64_t thisNano = toEpochNano();
  int64_t otherNano = other.toEpochNano();
  if (thisNano != otherNano) {
    return thisNano < otherNano ? -1 : 1;
  }
  return time_.compareTo(other.time_);
}
