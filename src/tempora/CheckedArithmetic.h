/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Overflow-checked integer arithmetic and floor division. */

#ifndef tempora_CheckedArithmetic_h
#define tempora_CheckedArithmetic_h

#include <stdint.h>

#include <limits>
#include <type_traits>

#include "tempora/Assertions.h"
#include "tempora/DateTimeError.h"

namespace tempora {

/**
 * Floor division of `dividend` by `divisor`, rounding towards negative
 * infinity. `divisor` must be positive.
 */
template <typename T>
constexpr T FloorDiv(T dividend, T divisor) {
  static_assert(std::is_signed_v<T>);
  TEMPORA_ASSERT(divisor > 0);

  T quotient = dividend / divisor;
  T remainder = dividend % divisor;
  if (remainder < 0) {
    quotient -= 1;
  }
  return quotient;
}

/**
 * Floor modulus of `dividend` by `divisor`. The result has the sign of
 * `divisor`, which must be positive.
 */
template <typename T>
constexpr T FloorMod(T dividend, T divisor) {
  static_assert(std::is_signed_v<T>);
  TEMPORA_ASSERT(divisor > 0);

  T remainder = dividend % divisor;
  if (remainder < 0) {
    remainder += divisor;
  }
  return remainder;
}

inline DateTimeResult<int64_t> AddExact(int64_t a, int64_t b) {
  int64_t result;
  if (__builtin_add_overflow(a, b, &result)) {
    return Err(DateTimeError::Overflow("Addition overflows a long: " +
                                       std::to_string(a) + " + " +
                                       std::to_string(b)));
  }
  return result;
}

inline DateTimeResult<int64_t> SubtractExact(int64_t a, int64_t b) {
  int64_t result;
  if (__builtin_sub_overflow(a, b, &result)) {
    return Err(DateTimeError::Overflow("Subtraction overflows a long: " +
                                       std::to_string(a) + " - " +
                                       std::to_string(b)));
  }
  return result;
}

inline DateTimeResult<int64_t> MultiplyExact(int64_t a, int64_t b) {
  int64_t result;
  if (__builtin_mul_overflow(a, b, &result)) {
    return Err(DateTimeError::Overflow("Multiplication overflows a long: " +
                                       std::to_string(a) + " * " +
                                       std::to_string(b)));
  }
  return result;
}

inline DateTimeResult<int32_t> ToIntExact(int64_t value) {
  if (value < std::numeric_limits<int32_t>::min() ||
      value > std::numeric_limits<int32_t>::max()) {
    return Err(DateTimeError::Overflow("Calculation overflows an int: " +
                                       std::to_string(value)));
  }
  return int32_t(value);
}

inline DateTimeResult<int64_t> NegateExact(int64_t value) {
  if (value == std::numeric_limits<int64_t>::min()) {
    return Err(DateTimeError::Overflow("Negation overflows a long: " +
                                       std::to_string(value)));
  }
  return -value;
}

}  // namespace tempora

#endif /* tempora_CheckedArithmetic_h */
