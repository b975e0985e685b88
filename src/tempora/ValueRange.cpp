/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/ValueRange.h"

#include <inttypes.h>

#include "tempora/TemporalFields.h"

namespace tempora {

DateTimeResult<ValueRange> ValueRange::Of(int64_t min, int64_t max) {
  if (min > max) {
    return Err(DateTimeError::InvalidValue(
        "Minimum value must be less than maximum value"));
  }
  return ValueRange(min, min, max, max);
}

DateTimeResult<ValueRange> ValueRange::Of(int64_t min, int64_t maxSmallest,
                                          int64_t maxLargest) {
  return Of(min, min, maxSmallest, maxLargest);
}

DateTimeResult<ValueRange> ValueRange::Of(int64_t minSmallest,
                                          int64_t minLargest,
                                          int64_t maxSmallest,
                                          int64_t maxLargest) {
  if (minSmallest > minLargest) {
    return Err(DateTimeError::InvalidValue(
        "Smallest minimum value must be less than largest minimum value"));
  }
  if (maxSmallest > maxLargest) {
    return Err(DateTimeError::InvalidValue(
        "Smallest maximum value must be less than largest maximum value"));
  }
  if (minLargest > maxLargest) {
    return Err(DateTimeError::InvalidValue(
        "Minimum value must be less than maximum value"));
  }
  return ValueRange(minSmallest, minLargest, maxSmallest, maxLargest);
}

DateTimeResult<int64_t> ValueRange::checkValidValue(int64_t value,
                                                    ChronoField field) const {
  return checkValidValue(value, FieldName(field));
}

DateTimeResult<int64_t> ValueRange::checkValidValue(
    int64_t value, const char* fieldName) const {
  if (!isValidValue(value)) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Invalid value for %s (valid values %s): %" PRId64,
                 fieldName, toString().c_str(), value)));
  }
  return value;
}

DateTimeResult<int32_t> ValueRange::checkValidIntValue(
    int64_t value, ChronoField field) const {
  return checkValidIntValue(value, FieldName(field));
}

DateTimeResult<int32_t> ValueRange::checkValidIntValue(
    int64_t value, const char* fieldName) const {
  if (!isValidIntValue(value)) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Invalid int value for %s (valid values %s): %" PRId64,
                 fieldName, toString().c_str(), value)));
  }
  return int32_t(value);
}

std::string ValueRange::toString() const {
  std::string result = std::to_string(minSmallest_);
  if (minSmallest_ != minLargest_) {
    result += '/';
    result += std::to_string(minLargest_);
  }
  result += " - ";
  result += std::to_string(maxSmallest_);
  if (maxSmallest_ != maxLargest_) {
    result += '/';
    result += std::to_string(maxLargest_);
  }
  return result;
}

}  // namespace tempora
