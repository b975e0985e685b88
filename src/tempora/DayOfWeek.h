/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_DayOfWeek_h
#define tempora_DayOfWeek_h

#include <stdint.h>

#include "tempora/CheckedArithmetic.h"
#include "tempora/DateTimeError.h"

namespace tempora {

/**
 * ISO-8601 day of week, numbered from 1 (Monday) to 7 (Sunday).
 */
enum class DayOfWeek : int32_t {
  Monday = 1,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday,
  Sunday,
};

DateTimeResult<DayOfWeek> DayOfWeekOf(int32_t dayOfWeek);

/**
 * Return the day-of-week `days` after `dayOfWeek`, wrapping around the week.
 */
constexpr DayOfWeek PlusDays(DayOfWeek dayOfWeek, int64_t days) {
  int64_t amount = days % 7;
  return DayOfWeek(int32_t(FloorMod<int64_t>(
                       int64_t(dayOfWeek) - 1 + amount + 7, 7)) +
                   1);
}

/**
 * Upper case English name, e.g. "SUNDAY".
 */
const char* DayOfWeekName(DayOfWeek dayOfWeek);

}  // namespace tempora

#endif /* tempora_DayOfWeek_h */
