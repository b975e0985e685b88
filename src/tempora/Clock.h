/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Clock_h
#define tempora_Clock_h

#include <stdint.h>

#include <memory>
#include <string>

#include "tempora/DateTimeError.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/ZoneId.h"

namespace tempora {

/**
 * Source of the current instant together with the zone used to convert it
 * to local date-times. The `Now(clock)` factories of the value types read
 * from a clock.
 */
class Clock {
 protected:
  ZoneId zone_;

  explicit Clock(const ZoneId& zone) : zone_(zone) {}

 public:
  virtual ~Clock() = default;

  /**
   * The system clock in the UTC offset zone.
   */
  static std::unique_ptr<Clock> SystemUTC();
  static std::unique_ptr<Clock> System(const ZoneId& zone);

  /**
   * A clock that always returns `fixedInstant`.
   */
  static std::unique_ptr<Clock> Fixed(const Instant& fixedInstant,
                                      const ZoneId& zone);

  /**
   * A clock that adds `offset` to the instants of `baseClock`. Instants are
   * saturated at Instant::Min() and Instant::Max().
   */
  static std::unique_ptr<Clock> Offset(std::shared_ptr<const Clock> baseClock,
                                       const Duration& offset);

  virtual Instant instant() const = 0;

  /**
   * Milliseconds from the epoch. Fails only if the instant is too far from
   * the epoch to be represented in milliseconds.
   */
  DateTimeResult<int64_t> millis() const { return instant().toEpochMilli(); }

  const ZoneId& getZone() const { return zone_; }

  /**
   * A copy of this clock that uses `zone`.
   */
  virtual std::unique_ptr<Clock> withZone(const ZoneId& zone) const = 0;

  virtual std::string toString() const = 0;
};

}  // namespace tempora

#endif /* tempora_Clock_h */
