/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/DayOfWeek.h"

namespace tempora {

DateTimeResult<DayOfWeek> DayOfWeekOf(int32_t dayOfWeek) {
  if (dayOfWeek < 1 || dayOfWeek > 7) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Invalid value for DayOfWeek: %d", dayOfWeek)));
  }
  return DayOfWeek(dayOfWeek);
}

const char* DayOfWeekName(DayOfWeek dayOfWeek) {
  static constexpr const char* names[] = {
      "MONDAY", "TUESDAY", "WEDNESDAY", "THURSDAY",
      "FRIDAY", "SATURDAY", "SUNDAY",
  };
  TEMPORA_ASSERT(int32_t(dayOfWeek) >= 1 && int32_t(dayOfWeek) <= 7);
  return names[int32_t(dayOfWeek) - 1];
}

}  // namespace tempora
