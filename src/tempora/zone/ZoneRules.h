/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneRules_h
#define tempora_zone_ZoneRules_h

#include <stdint.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/LocalDateTime.h"
#include "tempora/ZoneOffset.h"
#include "tempora/zone/ZoneOffsetTransition.h"
#include "tempora/zone/ZoneOffsetTransitionRule.h"

namespace tempora {
namespace zone {

/**
 * The rules defining how the zone offset varies for a single time-zone.
 *
 * Rules consist of the historic transitions of the standard offset, the
 * historic transitions of the actual (wall) offset, and up to fifteen
 * recurring rules that generate the transitions after the last historic one.
 * A fixed offset is represented as rules without any transitions.
 *
 * Instances are immutable apart from an internal, synchronized cache of the
 * transitions generated from the recurring rules, and are shared through
 * std::shared_ptr.
 */
class ZoneRules final {
 public:
  // The offset in force at a local date-time, or the transition if the local
  // date-time falls in a gap or overlap.
  using OffsetInfo = std::variant<ZoneOffset, ZoneOffsetTransition>;

  static constexpr size_t MaxLastRules = 15;

 private:
  // Per-year transitions are cached up to this year.
  static constexpr int32_t LastCachedYear = 2100;

  std::vector<int64_t> standardTransitions_;
  std::vector<ZoneOffset> standardOffsets_;
  std::vector<int64_t> savingsInstantTransitions_;
  std::vector<ZoneOffset> wallOffsets_;
  std::vector<ZoneOffsetTransitionRule> lastRules_;

  // Two local date-times per savings transition, the earlier one first.
  std::vector<LocalDateTime> savingsLocalTransitions_;

  mutable std::mutex cacheLock_;
  mutable std::unordered_map<int32_t, std::vector<ZoneOffsetTransition>>
      lastRulesCache_;

  ZoneRules(std::vector<int64_t>&& standardTransitions,
            std::vector<ZoneOffset>&& standardOffsets,
            std::vector<int64_t>&& savingsInstantTransitions,
            std::vector<ZoneOffset>&& wallOffsets,
            std::vector<ZoneOffsetTransitionRule>&& lastRules,
            std::vector<LocalDateTime>&& savingsLocalTransitions);

  static DateTimeResult<Ok> ValidateLastRules(
      const std::vector<ZoneOffsetTransitionRule>& lastRules);

  OffsetInfo getOffsetInfo(const LocalDateTime& dateTime) const;
  std::vector<ZoneOffsetTransition> findTransitionArray(int32_t year) const;
  static int32_t FindYear(int64_t epochSecond, const ZoneOffset& offset);

 public:
  ZoneRules(const ZoneRules&) = delete;
  ZoneRules& operator=(const ZoneRules&) = delete;

  /**
   * Rules for a fixed offset.
   */
  static std::shared_ptr<const ZoneRules> Fixed(const ZoneOffset& offset);

  /**
   * Builds rules from transition objects. The standard offset transitions
   * and savings transitions must be sorted by instant.
   */
  static DateTimeResult<std::shared_ptr<const ZoneRules>> Of(
      const ZoneOffset& baseStandardOffset, const ZoneOffset& baseWallOffset,
      const std::vector<ZoneOffsetTransition>& standardOffsetTransitions,
      const std::vector<ZoneOffsetTransition>& transitions,
      const std::vector<ZoneOffsetTransitionRule>& lastRules);

  /**
   * Builds rules from the arrays of the binary form: `standardOffsets` has
   * one more entry than `standardTransitions`, and `wallOffsets` one more
   * than `savingsInstantTransitions`.
   */
  static DateTimeResult<std::shared_ptr<const ZoneRules>> FromArrays(
      std::vector<int64_t> standardTransitions,
      std::vector<ZoneOffset> standardOffsets,
      std::vector<int64_t> savingsInstantTransitions,
      std::vector<ZoneOffset> wallOffsets,
      std::vector<ZoneOffsetTransitionRule> lastRules);

  bool isFixedOffset() const {
    return savingsInstantTransitions_.empty() && lastRules_.empty();
  }

  /**
   * The offset in force at `instant`.
   */
  ZoneOffset getOffset(const Instant& instant) const;

  /**
   * The best offset for a local date-time. In a gap or overlap this is the
   * offset before the transition.
   */
  ZoneOffset getOffset(const LocalDateTime& dateTime) const;

  /**
   * The offsets valid at a local date-time: one normally, none in a gap and
   * two in an overlap (the offset before the transition first).
   */
  std::vector<ZoneOffset> getValidOffsets(const LocalDateTime& dateTime) const;

  /**
   * The transition if `dateTime` is in a gap or overlap.
   */
  std::optional<ZoneOffsetTransition> getTransition(
      const LocalDateTime& dateTime) const;

  bool isValidOffset(const LocalDateTime& dateTime,
                     const ZoneOffset& offset) const;

  ZoneOffset getStandardOffset(const Instant& instant) const;
  Duration getDaylightSavings(const Instant& instant) const;
  bool isDaylightSavings(const Instant& instant) const {
    return getStandardOffset(instant) != getOffset(instant);
  }

  /**
   * The first transition strictly after `instant`, if any.
   */
  std::optional<ZoneOffsetTransition> nextTransition(
      const Instant& instant) const;

  /**
   * The last transition strictly before `instant`, if any.
   */
  std::optional<ZoneOffsetTransition> previousTransition(
      const Instant& instant) const;

  /**
   * The historic savings transitions, in order.
   */
  std::vector<ZoneOffsetTransition> getTransitions() const;

  const std::vector<ZoneOffsetTransitionRule>& getTransitionRules() const {
    return lastRules_;
  }

  const std::vector<int64_t>& standardTransitions() const {
    return standardTransitions_;
  }
  const std::vector<ZoneOffset>& standardOffsets() const {
    return standardOffsets_;
  }
  const std::vector<int64_t>& savingsInstantTransitions() const {
    return savingsInstantTransitions_;
  }
  const std::vector<ZoneOffset>& wallOffsets() const { return wallOffsets_; }

  bool operator==(const ZoneRules& other) const;
  bool operator!=(const ZoneRules& other) const { return !(*this == other); }

  std::string toString() const;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneRules_h */
