/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Day counts from the epochs used by astronomers and chronologists. */

#ifndef tempora_JulianFields_h
#define tempora_JulianFields_h

#include <stdint.h>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/ValueRange.h"

namespace tempora {

enum class JulianField : uint8_t {
  // Days since -4713-11-24, counted from midnight. 1970-01-01 is 2440588.
  JulianDay,
  // Days since 1858-11-17. 1970-01-01 is 40587.
  ModifiedJulianDay,
  // Days since 0000-12-31. 0001-01-01 is 1.
  RataDie,
};

const char* JulianFieldName(JulianField field);

/**
 * Days between the field's epoch and 1970-01-01.
 */
int64_t JulianFieldOffset(JulianField field);

ValueRange JulianFieldRange(JulianField field);

inline int64_t GetJulianField(const LocalDate& date, JulianField field) {
  return date.toEpochDay() + JulianFieldOffset(field);
}

DateTimeResult<LocalDate> WithJulianField(const LocalDate& date,
                                          JulianField field, int64_t newValue);

}  // namespace tempora

#endif /* tempora_JulianFields_h */
