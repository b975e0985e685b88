/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneOffsetTransition_h
#define tempora_zone_ZoneOffsetTransition_h

#include <stdint.h>

#include <string>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/LocalDateTime.h"
#include "tempora/ZoneOffset.h"

namespace tempora {
namespace zone {

/**
 * A change of offset on the local time-line, such as the start of daylight
 * saving time.
 *
 * The transition local date-time is expressed with the offset before the
 * transition. A gap has a later offset after the transition, so some local
 * times do not exist; an overlap has an earlier offset, so some local times
 * occur twice.
 */
class ZoneOffsetTransition final {
  friend class ZoneRules;

  LocalDateTime transition_;
  ZoneOffset offsetBefore_;
  ZoneOffset offsetAfter_;

  ZoneOffsetTransition(const LocalDateTime& transition,
                       const ZoneOffset& offsetBefore,
                       const ZoneOffset& offsetAfter)
      : transition_(transition),
        offsetBefore_(offsetBefore),
        offsetAfter_(offsetAfter) {}

  int32_t getDurationSeconds() const {
    return offsetAfter_.getTotalSeconds() - offsetBefore_.getTotalSeconds();
  }

 public:
  /**
   * The offsets must differ and the local date-time must have no nanoseconds.
   */
  static DateTimeResult<ZoneOffsetTransition> Of(
      const LocalDateTime& transition, const ZoneOffset& offsetBefore,
      const ZoneOffset& offsetAfter);

  /**
   * The transition at `epochSecond`, where the offset changes from
   * `offsetBefore` to `offsetAfter`.
   */
  static DateTimeResult<ZoneOffsetTransition> OfEpochSecond(
      int64_t epochSecond, const ZoneOffset& offsetBefore,
      const ZoneOffset& offsetAfter);

  Instant getInstant() const;
  int64_t toEpochSecond() const {
    return transition_.toEpochSecond(offsetBefore_);
  }

  const LocalDateTime& getDateTimeBefore() const { return transition_; }
  LocalDateTime getDateTimeAfter() const;

  const ZoneOffset& getOffsetBefore() const { return offsetBefore_; }
  const ZoneOffset& getOffsetAfter() const { return offsetAfter_; }

  Duration getDuration() const {
    return Duration::OfSeconds(getDurationSeconds());
  }

  bool isGap() const { return getDurationSeconds() > 0; }
  bool isOverlap() const { return getDurationSeconds() < 0; }

  /**
   * True if `offset` is valid during this transition, which is never the case
   * for a gap.
   */
  bool isValidOffset(const ZoneOffset& offset) const {
    if (isGap()) {
      return false;
    }
    return offsetBefore_ == offset || offsetAfter_ == offset;
  }

  /**
   * Empty for a gap, the before and after offsets for an overlap.
   */
  std::vector<ZoneOffset> getValidOffsets() const;

  int32_t compareTo(const ZoneOffsetTransition& other) const {
    return getInstant().compareTo(other.getInstant());
  }

  bool operator==(const ZoneOffsetTransition& other) const {
    return transition_ == other.transition_ &&
           offsetBefore_ == other.offsetBefore_ &&
           offsetAfter_ == other.offsetAfter_;
  }
  bool operator!=(const ZoneOffsetTransition& other) const {
    return !(*this == other);
  }

  /**
   * Formatted as "Transition[Gap at 2008-03-30T01:00Z to +01:00]".
   */
  std::string toString() const;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneOffsetTransition_h */
