/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_ValueRange_h
#define tempora_ValueRange_h

#include <stdint.h>

#include <limits>
#include <string>

#include "tempora/DateTimeError.h"

namespace tempora {

enum class ChronoField : uint8_t;

/**
 * The range of valid values for a date-time field.
 *
 * The minimum and maximum can each vary, e.g. day-of-month has the fixed
 * minimum 1 and a maximum between 28 and 31.
 */
class ValueRange final {
  int64_t minSmallest_;
  int64_t minLargest_;
  int64_t maxSmallest_;
  int64_t maxLargest_;

  constexpr ValueRange(int64_t minSmallest, int64_t minLargest,
                       int64_t maxSmallest, int64_t maxLargest)
      : minSmallest_(minSmallest),
        minLargest_(minLargest),
        maxSmallest_(maxSmallest),
        maxLargest_(maxLargest) {}

 public:
  /**
   * Obtains a fixed value range. The caller guarantees `min <= max`.
   */
  static constexpr ValueRange Fixed(int64_t min, int64_t max) {
    return ValueRange(min, min, max, max);
  }

  /**
   * Obtains a value range with a fixed minimum and variable maximum. The
   * caller guarantees `min <= maxSmallest <= maxLargest`.
   */
  static constexpr ValueRange Fixed(int64_t min, int64_t maxSmallest,
                                    int64_t maxLargest) {
    return ValueRange(min, min, maxSmallest, maxLargest);
  }

  /**
   * Obtains a value range, validating the ordering of the four bounds.
   */
  static DateTimeResult<ValueRange> Of(int64_t min, int64_t max);
  static DateTimeResult<ValueRange> Of(int64_t min, int64_t maxSmallest,
                                       int64_t maxLargest);
  static DateTimeResult<ValueRange> Of(int64_t minSmallest, int64_t minLargest,
                                       int64_t maxSmallest, int64_t maxLargest);

  bool isFixed() const {
    return minSmallest_ == minLargest_ && maxSmallest_ == maxLargest_;
  }

  int64_t getMinimum() const { return minSmallest_; }
  int64_t getLargestMinimum() const { return minLargest_; }
  int64_t getSmallestMaximum() const { return maxSmallest_; }
  int64_t getMaximum() const { return maxLargest_; }

  /**
   * True if all values in the range fit in an int32_t.
   */
  bool isIntValue() const {
    return getMinimum() >= std::numeric_limits<int32_t>::min() &&
           getMaximum() <= std::numeric_limits<int32_t>::max();
  }

  bool isValidValue(int64_t value) const {
    return value >= getMinimum() && value <= getMaximum();
  }

  bool isValidIntValue(int64_t value) const {
    return isIntValue() && isValidValue(value);
  }

  /**
   * Checks that `value` is within the outer bounds of this range. The error
   * message names `field`.
   */
  DateTimeResult<int64_t> checkValidValue(int64_t value,
                                          ChronoField field) const;
  DateTimeResult<int64_t> checkValidValue(int64_t value,
                                          const char* fieldName) const;

  /**
   * Checks that `value` is valid and fits in an int32_t.
   */
  DateTimeResult<int32_t> checkValidIntValue(int64_t value,
                                             ChronoField field) const;
  DateTimeResult<int32_t> checkValidIntValue(int64_t value,
                                             const char* fieldName) const;

  /**
   * Outputs this range as a string, e.g. "1 - 5" or "0/1 - 59/60".
   */
  std::string toString() const;

  bool operator==(const ValueRange& other) const {
    return minSmallest_ == other.minSmallest_ &&
           minLargest_ == other.minLargest_ &&
           maxSmallest_ == other.maxSmallest_ &&
           maxLargest_ == other.maxLargest_;
  }
  bool operator!=(const ValueRange& other) const { return !(*this == other); }
};

}  // namespace tempora

#endif /* tempora_ValueRange_h */
