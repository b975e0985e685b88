/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_ZoneOffset_h
#define tempora_ZoneOffset_h

#include <stdint.h>

#include <functional>
#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/TemporalFields.h"

namespace tempora {

/**
 * A fixed offset from UTC, such as +02:00, in whole seconds.
 *
 * Offsets range from -18:00 to +18:00 inclusive. The default constructed
 * offset is UTC.
 */
class ZoneOffset final {
  int32_t totalSeconds_ = 0;

  explicit constexpr ZoneOffset(int32_t totalSeconds)
      : totalSeconds_(totalSeconds) {}

 public:
  static constexpr int32_t MaxSeconds = 18 * 3600;

  constexpr ZoneOffset() = default;

  static constexpr ZoneOffset UTC() { return ZoneOffset(0); }
  static constexpr ZoneOffset Min() { return ZoneOffset(-MaxSeconds); }
  static constexpr ZoneOffset Max() { return ZoneOffset(MaxSeconds); }

  static DateTimeResult<ZoneOffset> OfHours(int32_t hours);
  static DateTimeResult<ZoneOffset> OfHoursMinutes(int32_t hours,
                                                   int32_t minutes);

  /**
   * Obtains an offset from hours, minutes and seconds. The sign of all
   * non-zero components must agree.
   */
  static DateTimeResult<ZoneOffset> OfHoursMinutesSeconds(int32_t hours,
                                                          int32_t minutes,
                                                          int32_t seconds);

  static DateTimeResult<ZoneOffset> OfTotalSeconds(int64_t totalSeconds);

  /**
   * Parses an offset id. Accepted formats are:
   *
   *   Z
   *   +h, +hh
   *   +hh:mm, +hhmm
   *   +hh:mm:ss, +hhmmss
   *
   * with '-' accepted in place of '+'.
   */
  static DateTimeResult<ZoneOffset> Parse(std::string_view offsetId);

  int32_t getTotalSeconds() const { return totalSeconds_; }

  /**
   * The normalized id: "Z" for UTC, otherwise "+hh:mm" or "+hh:mm:ss".
   */
  std::string getId() const;

  std::string toString() const { return getId(); }

  bool isSupported(ChronoField field) const {
    return field == ChronoField::OffsetSeconds;
  }
  DateTimeResult<ValueRange> range(ChronoField field) const;
  DateTimeResult<int32_t> get(ChronoField field) const;
  DateTimeResult<int64_t> getLong(ChronoField field) const;

  /**
   * Compares offsets in descending order, so that offsets ahead of UTC sort
   * first, matching the order of local times for the same instant.
   */
  int32_t compareTo(const ZoneOffset& other) const {
    return other.totalSeconds_ - totalSeconds_;
  }

  bool operator==(const ZoneOffset& other) const {
    return totalSeconds_ == other.totalSeconds_;
  }
  bool operator!=(const ZoneOffset& other) const { return !(*this == other); }
};

}  // namespace tempora

template <>
struct std::hash<tempora::ZoneOffset> {
  size_t operator()(const tempora::ZoneOffset& offset) const {
    return std::hash<int32_t>{}(offset.getTotalSeconds());
  }
};

#endif /* tempora_ZoneOffset_h */
