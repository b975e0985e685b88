/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneOffsetTransition.h"

using namespace tempora;
using namespace tempora::zone;

DateTimeResult<ZoneOffsetTransition> ZoneOffsetTransition::Of(
    const LocalDateTime& transition, const ZoneOffset& offsetBefore,
    const ZoneOffset& offsetAfter) {
  if (offsetBefore == offsetAfter) {
    return Err(DateTimeError::InvalidValue(
        std::string("Offsets must not be equal")));
  }
  if (transition.getNano() != 0) {
    return Err(DateTimeError::InvalidValue(
        std::string("Nano-of-second must be zero")));
  }
  TEMPORA_TRY(transition.toInstant(offsetBefore));
  return ZoneOffsetTransition(transition, offsetBefore, offsetAfter);
}

DateTimeResult<ZoneOffsetTransition> ZoneOffsetTransition::OfEpochSecond(
    int64_t epochSecond, const ZoneOffset& offsetBefore,
    const ZoneOffset& offsetAfter) {
  if (offsetBefore == offsetAfter) {
    return Err(DateTimeError::InvalidValue(
        std::string("Offsets must not be equal")));
  }
  TEMPORA_TRY(Instant::OfEpochSecond(epochSecond));
  LocalDateTime transition =
      TEMPORA_TRY(LocalDateTime::OfEpochSecond(epochSecond, 0, offsetBefore));
  return ZoneOffsetTransition(transition, offsetBefore, offsetAfter);
}

Instant ZoneOffsetTransition::getInstant() const {
  return TEMPORA_ALWAYS_OK(Instant::OfEpochSecond(toEpochSecond()));
}

LocalDateTime ZoneOffsetTransition::getDateTimeAfter() const {
  return TEMPORA_ALWAYS_OK(transition_.plusSeconds(getDurationSeconds()));
}

std::vector<ZoneOffset> ZoneOffsetTransition::getValidOffsets() const {
  if (isGap()) {
    return {};
  }
  return {offsetBefore_, offsetAfter_};
}

std::string ZoneOffsetTransition::toString() const {
  std::string result = "Transition[";
  result += isGap() ? "Gap" : "Overlap";
  result += " at ";
  result += transition_.toString();
  result += offsetBefore_.toString();
  result += " to ";
  result += offsetAfter_.toString();
  result += ']';
  return result;
}
