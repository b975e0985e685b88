/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/ZonedDateTime.h"

#include <algorithm>

#include "tempora/Clock.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/IsoParser.h"
#include "tempora/Period.h"
#include "tempora/zone/ZoneRules.h"
#include "tempora/zone/ZoneRulesRegistry.h"

using namespace tempora;
using namespace tempora::zone;

DateTimeResult<ZonedDateTime> ZonedDateTime::Create(int64_t epochSecond,
                                                    int32_t nanoOfSecond,
                                                    const ZoneId& zone) {
  Instant instant =
      TEMPORA_TRY(Instant::OfEpochSecond(epochSecond, nanoOfSecond));
  ZoneOffset offset = zone.getRules().getOffset(instant);
  LocalDateTime dateTime = TEMPORA_TRY(
      LocalDateTime::OfEpochSecond(epochSecond, nanoOfSecond, offset));
  return ZonedDateTime(dateTime, offset, zone);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::Of(
    int32_t year, int32_t month, int32_t dayOfMonth, int32_t hour,
    int32_t minute, int32_t second, int32_t nanoOfSecond, const ZoneId& zone) {
  LocalDateTime dateTime = TEMPORA_TRY(LocalDateTime::Of(
      year, month, dayOfMonth, hour, minute, second, nanoOfSecond));
  return Of(dateTime, zone);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::OfLocal(
    const LocalDateTime& dateTime, const ZoneId& zone,
    const std::optional<ZoneOffset>& preferredOffset) {
  if (zone.isOffset()) {
    return ZonedDateTime(dateTime, *zone.asOffset(), zone);
  }

  const ZoneRules& rules = zone.getRules();
  std::vector<ZoneOffset> validOffsets = rules.getValidOffsets(dateTime);
  if (validOffsets.size() == 1) {
    return ZonedDateTime(dateTime, validOffsets[0], zone);
  }

  if (validOffsets.empty()) {
    // Gap: move forward by the length of the gap.
    std::optional<ZoneOffsetTransition> trans = rules.getTransition(dateTime);
    TEMPORA_ASSERT(trans && trans->isGap());
    LocalDateTime adjusted = TEMPORA_TRY(
        dateTime.plusSeconds(trans->getDuration().getSeconds()));
    return ZonedDateTime(adjusted, trans->getOffsetAfter(), zone);
  }

  // Overlap.
  if (preferredOffset &&
      std::find(validOffsets.begin(), validOffsets.end(), *preferredOffset) !=
          validOffsets.end()) {
    return ZonedDateTime(dateTime, *preferredOffset, zone);
  }
  return ZonedDateTime(dateTime, validOffsets[0], zone);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::OfInstant(const Instant& instant,
                                                       const ZoneId& zone) {
  return Create(instant.getEpochSecond(), instant.getNano(), zone);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::OfInstant(
    const LocalDateTime& dateTime, const ZoneOffset& offset,
    const ZoneId& zone) {
  return Create(dateTime.toEpochSecond(offset), dateTime.getNano(), zone);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::OfStrict(
    const LocalDateTime& dateTime, const ZoneOffset& offset,
    const ZoneId& zone) {
  const ZoneRules& rules = zone.getRules();
  if (!rules.isValidOffset(dateTime, offset)) {
    std::optional<ZoneOffsetTransition> trans = rules.getTransition(dateTime);
    if (trans && trans->isGap()) {
      return Err(DateTimeError::InvalidOffset(
          "LocalDateTime '" + dateTime.toString() +
          "' does not exist in zone '" + zone.getId() +
          "' due to a gap in the local time-line, typically caused by "
          "daylight savings"));
    }
    return Err(DateTimeError::InvalidOffset(
        "ZoneOffset '" + offset.getId() + "' is not valid for LocalDateTime '" +
        dateTime.toString() + "' in zone '" + zone.getId() + "'"));
  }
  return ZonedDateTime(dateTime, offset, zone);
}

ZonedDateTime ZonedDateTime::Now(const Clock& clock) {
  return TEMPORA_ALWAYS_OK(OfInstant(clock.instant(), clock.getZone()));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::Parse(
    std::string_view text, const ZoneRulesRegistry& registry) {
  IsoParser parser(text);
  LocalDateTime dateTime = TEMPORA_TRY(parser.localDateTime());
  ZoneOffset offset = TEMPORA_TRY(parser.parseOffset());
  if (parser.atEnd()) {
    return OfFixed(dateTime, offset);
  }

  std::string_view zoneId = TEMPORA_TRY(parser.parseBracketedZoneId());
  TEMPORA_TRY(parser.finish());
  ZoneId zone = TEMPORA_TRY(parser.resolve(ZoneId::Of(zoneId, registry)));
  return parser.resolve(OfStrict(dateTime, offset, zone));
}

ZonedDateTime ZonedDateTime::resolveOffset(const ZoneOffset& offset) const {
  if (offset != offset_ && zone_.getRules().isValidOffset(dateTime_, offset)) {
    return ZonedDateTime(dateTime_, offset, zone_);
  }
  return *this;
}

DateTimeResult<ValueRange> ZonedDateTime::range(ChronoField field) const {
  if (field == ChronoField::InstantSeconds ||
      field == ChronoField::OffsetSeconds) {
    return FieldRange(field);
  }
  return dateTime_.range(field);
}

DateTimeResult<int32_t> ZonedDateTime::get(ChronoField field) const {
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

DateTimeResult<int64_t> ZonedDateTime::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::InstantSeconds:
      return toEpochSecond();
    case ChronoField::OffsetSeconds:
      return int64_t(offset_.getTotalSeconds());
    default:
      return dateTime_.getLong(field);
  }
}

DateTimeResult<ZonedDateTime> ZonedDateTime::with(ChronoField field,
                                                  int64_t newValue) const {
  switch (field) {
    case ChronoField::InstantSeconds:
      return Create(newValue, getNano(), zone_);
    case ChronoField::OffsetSeconds: {
      int32_t seconds = TEMPORA_TRY(CheckValidIntValue(field, newValue));
      ZoneOffset offset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(seconds));
      return resolveOffset(offset);
    }
    default:
      return resolveLocal(TEMPORA_TRY(dateTime_.with(field, newValue)));
  }
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withYear(int32_t year) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withYear(year)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withMonth(int32_t month) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withMonth(month)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withDayOfMonth(
    int32_t dayOfMonth) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withDayOfMonth(dayOfMonth)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withDayOfYear(
    int32_t dayOfYear) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withDayOfYear(dayOfYear)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withHour(int32_t hour) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withHour(hour)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withMinute(int32_t minute) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withMinute(minute)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withSecond(int32_t second) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withSecond(second)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withNano(
    int32_t nanoOfSecond) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.withNano(nanoOfSecond)));
}

ZonedDateTime ZonedDateTime::withEarlierOffsetAtOverlap() const {
  std::optional<ZoneOffsetTransition> trans =
      zone_.getRules().getTransition(dateTime_);
  if (trans && trans->isOverlap()) {
    const ZoneOffset& earlierOffset = trans->getOffsetBefore();
    if (earlierOffset != offset_) {
      return ZonedDateTime(dateTime_, earlierOffset, zone_);
    }
  }
  return *this;
}

ZonedDateTime ZonedDateTime::withLaterOffsetAtOverlap() const {
  std::optional<ZoneOffsetTransition> trans =
      zone_.getRules().getTransition(dateTime_);
  if (trans && trans->isOverlap()) {
    const ZoneOffset& laterOffset = trans->getOffsetAfter();
    if (laterOffset != offset_) {
      return ZonedDateTime(dateTime_, laterOffset, zone_);
    }
  }
  return *this;
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withZoneSameLocal(
    const ZoneId& zone) const {
  if (zone == zone_) {
    return *this;
  }
  return OfLocal(dateTime_, zone, offset_);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::withZoneSameInstant(
    const ZoneId& zone) const {
  if (zone == zone_) {
    return *this;
  }
  return Create(toEpochSecond(), getNano(), zone);
}

ZonedDateTime ZonedDateTime::withFixedOffsetZone() const {
  if (zone_.isOffset() && *zone_.asOffset() == offset_) {
    return *this;
  }
  return OfFixed(dateTime_, offset_);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::truncatedTo(
    ChronoUnit unit) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.truncatedTo(unit)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plus(int64_t amountToAdd,
                                                  ChronoUnit unit) const {
  LocalDateTime dateTime = TEMPORA_TRY(dateTime_.plus(amountToAdd, unit));
  if (IsDateBased(unit)) {
    return resolveLocal(dateTime);
  }
  return resolveInstant(dateTime);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plus(
    const Duration& duration) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.plus(duration)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plus(const Period& period) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.plus(period)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusYears(int64_t years) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.plusYears(years)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusMonths(int64_t months) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.plusMonths(months)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusWeeks(int64_t weeks) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.plusWeeks(weeks)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusDays(int64_t days) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.plusDays(days)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusHours(int64_t hours) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.plusHours(hours)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusMinutes(
    int64_t minutes) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.plusMinutes(minutes)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusSeconds(
    int64_t seconds) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.plusSeconds(seconds)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::plusNanos(int64_t nanos) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.plusNanos(nanos)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minus(int64_t amountToSubtract,
                                                   ChronoUnit unit) const {
  LocalDateTime dateTime = TEMPORA_TRY(dateTime_.minus(amountToSubtract, unit));
  if (IsDateBased(unit)) {
    return resolveLocal(dateTime);
  }
  return resolveInstant(dateTime);
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minus(
    const Duration& duration) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.minus(duration)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minus(const Period& period) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.minus(period)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusYears(int64_t years) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.minusYears(years)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusMonths(
    int64_t months) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.minusMonths(months)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusWeeks(int64_t weeks) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.minusWeeks(weeks)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusDays(int64_t days) const {
  return resolveLocal(TEMPORA_TRY(dateTime_.minusDays(days)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusHours(int64_t hours) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.minusHours(hours)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusMinutes(
    int64_t minutes) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.minusMinutes(minutes)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusSeconds(
    int64_t seconds) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.minusSeconds(seconds)));
}

DateTimeResult<ZonedDateTime> ZonedDateTime::minusNanos(int64_t nanos) const {
  return resolveInstant(TEMPORA_TRY(dateTime_.minusNanos(nanos)));
}

DateTimeResult<int64_t> ZonedDateTime::until(const ZonedDateTime& end,
                                             ChronoUnit unit) const {
  ZonedDateTime adjusted = TEMPORA_TRY(end.withZoneSameInstant(zone_));
  if (IsDateBased(unit)) {
    return dateTime_.until(adjusted.dateTime_, unit);
  }
  return toOffsetDateTime().until(adjusted.toOffsetDateTime(), unit);
}

DateTimeResult<Instant> ZonedDateTime::toInstant() const {
  return Instant::OfEpochSecond(toEpochSecond(), getNano());
}

int32_t ZonedDateTime::compareTo(const ZonedDateTime& other) const {
  int32_t cmp = OffsetDateTime::TimeLineOrder(toOffsetDateTime(),
                                              other.toOffsetDateTime());
  if (cmp == 0) {
    cmp = dateTime_.compareTo(other.dateTime_);
    if (cmp == 0) {
      cmp = zone_.getId().compare(other.zone_.getId());
    }
  }
  return cmp;
}

bool ZonedDateTime::isAfter(const ZonedDateTime& other) const {
  return OffsetDateTime::TimeLineOrder(toOffsetDateTime(),
                                       other.toOffsetDateTime()) > 0;
}

bool ZonedDateTime::isBefore(const ZonedDateTime& other) const {
  return OffsetDateTime::TimeLineOrder(toOffsetDateTime(),
                                       other.toOffsetDateTime()) < 0;
}

bool ZonedDateTime::isEqual(const ZonedDateTime& other) const {
  return OffsetDateTime::TimeLineOrder(toOffsetDateTime(),
                                       other.toOffsetDateTime()) == 0;
}

std::string ZonedDateTime::toString() const {
  std::string str = dateTime_.toString() + offset_.toString();
  if (!zone_.isOffset() || *zone_.asOffset() != offset_) {
    str += "[" + zone_.toString() + "]";
  }
  return str;
}
