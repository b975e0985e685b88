/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/OffsetDateTime.h"

#include "tempora/Clock.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/IsoParser.h"
#include "tempora/OffsetTime.h"
#include "tempora/Period.h"
#include "tempora/ZoneId.h"
#include "tempora/ZonedDateTime.h"
#include "tempora/zone/ZoneRules.h"

using namespace tempora;

DateTimeResult<OffsetDateTime> OffsetDateTime::Of(
    int32_t year, int32_t month, int32_t dayOfMonth, int32_t hour,
    int32_t minute, int32_t second, int32_t nanoOfSecond,
    const ZoneOffset& offset) {
  LocalDateTime dateTime = TEMPORA_TRY(LocalDateTime::Of(
      year, month, dayOfMonth, hour, minute, second, nanoOfSecond));
  return OffsetDateTime(dateTime, offset);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::OfInstant(
    const Instant& instant, const ZoneOffset& offset) {
  LocalDateTime dateTime = TEMPORA_TRY(LocalDateTime::OfEpochSecond(
      instant.getEpochSecond(), instant.getNano(), offset));
  return OffsetDateTime(dateTime, offset);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::OfInstant(
    const Instant& instant, const ZoneId& zone) {
  return OfInstant(instant, zone.getRules().getOffset(instant));
}

OffsetDateTime OffsetDateTime::Now(const Clock& clock) {
  return TEMPORA_ALWAYS_OK(OfInstant(clock.instant(), clock.getZone()));
}

DateTimeResult<OffsetDateTime> OffsetDateTime::Parse(std::string_view text) {
  IsoParser parser(text);
  LocalDateTime dateTime = TEMPORA_TRY(parser.localDateTime());
  ZoneOffset offset = TEMPORA_TRY(parser.parseOffset());
  TEMPORA_TRY(parser.finish());
  return OffsetDateTime(dateTime, offset);
}

int32_t OffsetDateTime::TimeLineOrder(const OffsetDateTime& a,
                                      const OffsetDateTime& b) {
  int64_t aSecond = a.toEpochSecond();
  int64_t bSecond = b.toEpochSecond();
  if (aSecond != bSecond) {
    return aSecond < bSecond ? -1 : 1;
  }
  return a.getNano() - b.getNano();
}

DateTimeResult<ValueRange> OffsetDateTime::range(ChronoField field) const {
  if (field == ChronoField::InstantSeconds ||
      field == ChronoField::OffsetSeconds) {
    return FieldRange(field);
  }
  return dateTime_.range(field);
}

DateTimeResult<int32_t> OffsetDateTime::get(ChronoField field) const {
  switch (field) {
    case ChronoField::InstantSeconds:
      return Err(DateTimeError::UnsupportedField(
          std::string("Field too large for an int: InstantSeconds")));
    case ChronoField::OffsetSeconds:
      return offset_.getTotalSeconds();
    default:
      return dateTime_.get(field);
  }
}

DateTimeResult<int64_t> OffsetDateTime::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::InstantSeconds:
      return toEpochSecond();
    case ChronoField::OffsetSeconds:
      return int64_t(offset_.getTotalSeconds());
    default:
      return dateTime_.getLong(field);
  }
}

DateTimeResult<OffsetDateTime> OffsetDateTime::with(ChronoField field,
                                                    int64_t newValue) const {
  switch (field) {
    case ChronoField::InstantSeconds: {
      Instant instant =
          TEMPORA_TRY(Instant::OfEpochSecond(newValue, getNano()));
      return OfInstant(instant, offset_);
    }
    case ChronoField::OffsetSeconds: {
      int32_t seconds = TEMPORA_TRY(CheckValidIntValue(field, newValue));
      ZoneOffset offset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(seconds));
      return with(dateTime_, offset);
    }
    default:
      return with(TEMPORA_TRY(dateTime_.with(field, newValue)), offset_);
  }
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withYear(int32_t year) const {
  return with(TEMPORA_TRY(dateTime_.withYear(year)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withMonth(int32_t month) const {
  return with(TEMPORA_TRY(dateTime_.withMonth(month)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withDayOfMonth(
    int32_t dayOfMonth) const {
  return with(TEMPORA_TRY(dateTime_.withDayOfMonth(dayOfMonth)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withDayOfYear(
    int32_t dayOfYear) const {
  return with(TEMPORA_TRY(dateTime_.withDayOfYear(dayOfYear)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withHour(int32_t hour) const {
  return with(TEMPORA_TRY(dateTime_.withHour(hour)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withMinute(
    int32_t minute) const {
  return with(TEMPORA_TRY(dateTime_.withMinute(minute)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withSecond(
    int32_t second) const {
  return with(TEMPORA_TRY(dateTime_.withSecond(second)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withNano(
    int32_t nanoOfSecond) const {
  return with(TEMPORA_TRY(dateTime_.withNano(nanoOfSecond)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::withOffsetSameInstant(
    const ZoneOffset& offset) const {
  if (offset == offset_) {
    return *this;
  }
  int32_t difference = offset.getTotalSeconds() - offset_.getTotalSeconds();
  LocalDateTime adjusted = TEMPORA_TRY(dateTime_.plusSeconds(difference));
  return OffsetDateTime(adjusted, offset);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::truncatedTo(
    ChronoUnit unit) const {
  return with(TEMPORA_TRY(dateTime_.truncatedTo(unit)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plus(int64_t amountToAdd,
                                                    ChronoUnit unit) const {
  return with(TEMPORA_TRY(dateTime_.plus(amountToAdd, unit)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plus(
    const Duration& duration) const {
  return with(TEMPORA_TRY(dateTime_.plus(duration)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plus(
    const Period& period) const {
  return with(TEMPORA_TRY(dateTime_.plus(period)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusYears(int64_t years) const {
  return with(TEMPORA_TRY(dateTime_.plusYears(years)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusMonths(
    int64_t months) const {
  return with(TEMPORA_TRY(dateTime_.plusMonths(months)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusWeeks(int64_t weeks) const {
  return with(TEMPORA_TRY(dateTime_.plusWeeks(weeks)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusDays(int64_t days) const {
  return with(TEMPORA_TRY(dateTime_.plusDays(days)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusHours(int64_t hours) const {
  return with(TEMPORA_TRY(dateTime_.plusHours(hours)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusMinutes(
    int64_t minutes) const {
  return with(TEMPORA_TRY(dateTime_.plusMinutes(minutes)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusSeconds(
    int64_t seconds) const {
  return with(TEMPORA_TRY(dateTime_.plusSeconds(seconds)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::plusNanos(int64_t nanos) const {
  return with(TEMPORA_TRY(dateTime_.plusNanos(nanos)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minus(int64_t amountToSubtract,
                                                     ChronoUnit unit) const {
  return with(TEMPORA_TRY(dateTime_.minus(amountToSubtract, unit)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minus(
    const Duration& duration) const {
  return with(TEMPORA_TRY(dateTime_.minus(duration)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minus(
    const Period& period) const {
  return with(TEMPORA_TRY(dateTime_.minus(period)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusYears(
    int64_t years) const {
  return with(TEMPORA_TRY(dateTime_.minusYears(years)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusMonths(
    int64_t months) const {
  return with(TEMPORA_TRY(dateTime_.minusMonths(months)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusWeeks(
    int64_t weeks) const {
  return with(TEMPORA_TRY(dateTime_.minusWeeks(weeks)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusDays(int64_t days) const {
  return with(TEMPORA_TRY(dateTime_.minusDays(days)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusHours(
    int64_t hours) const {
  return with(TEMPORA_TRY(dateTime_.minusHours(hours)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusMinutes(
    int64_t minutes) const {
  return with(TEMPORA_TRY(dateTime_.minusMinutes(minutes)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusSeconds(
    int64_t seconds) const {
  return with(TEMPORA_TRY(dateTime_.minusSeconds(seconds)), offset_);
}

DateTimeResult<OffsetDateTime> OffsetDateTime::minusNanos(
    int64_t nanos) const {
  return with(TEMPORA_TRY(dateTime_.minusNanos(nanos)), offset_);
}

DateTimeResult<int64_t> OffsetDateTime::until(const OffsetDateTime& end,
                                              ChronoUnit unit) const {
  OffsetDateTime adjusted = TEMPORA_TRY(end.withOffsetSameInstant(offset_));
  return dateTime_.until(adjusted.dateTime_, unit);
}

DateTimeResult<ZonedDateTime> OffsetDateTime::atZoneSameInstant(
    const ZoneId& zone) const {
  return ZonedDateTime::OfInstant(dateTime_, offset_, zone);
}

DateTimeResult<ZonedDateTime> OffsetDateTime::atZoneSimilarLocal(
    const ZoneId& zone) const {
  return ZonedDateTime::OfLocal(dateTime_, zone, offset_);
}

OffsetTime OffsetDateTime::toOffsetTime() const {
  return OffsetTime(dateTime_.toLocalTime(), offset_);
}

ZonedDateTime OffsetDateTime::toZonedDateTime() const {
  return ZonedDateTime::OfFixed(dateTime_, offset_);
}

DateTimeResult<Instant> OffsetDateTime::toInstant() const {
  return dateTime_.toInstant(offset_);
}

int32_t OffsetDateTime::compareTo(const OffsetDateTime& other) const {
  if (offset_ == other.offset_) {
    return dateTime_.compareTo(other.dateTime_);
  }
  int32_t cmp = TimeLineOrder(*this, other);
  if (cmp == 0) {
    cmp = dateTime_.compareTo(other.dateTime_);
  }
  return cmp;
}
