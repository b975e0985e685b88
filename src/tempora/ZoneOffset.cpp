/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/ZoneOffset.h"

#include <stdlib.h>

#include "tempora/TextUtils.h"

using namespace tempora;

static constexpr int32_t SecondsPerHour = 3600;
static constexpr int32_t SecondsPerMinute = 60;

DateTimeResult<ZoneOffset> ZoneOffset::OfHours(int32_t hours) {
  return OfHoursMinutesSeconds(hours, 0, 0);
}

DateTimeResult<ZoneOffset> ZoneOffset::OfHoursMinutes(int32_t hours,
                                                      int32_t minutes) {
  return OfHoursMinutesSeconds(hours, minutes, 0);
}

static DateTimeResult<Ok> ValidateOffset(int32_t hours, int32_t minutes,
                                         int32_t seconds) {
  if (hours < -18 || hours > 18) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Zone offset hours not in valid range: value %d is not in "
                 "the range -18 to 18",
                 hours)));
  }
  if (hours > 0) {
    if (minutes < 0 || seconds < 0) {
      return Err(DateTimeError::InvalidValue(
          "Zone offset minutes and seconds must be positive because hours is "
          "positive"));
    }
  } else if (hours < 0) {
    if (minutes > 0 || seconds > 0) {
      return Err(DateTimeError::InvalidValue(
          "Zone offset minutes and seconds must be negative because hours is "
          "negative"));
    }
  } else if ((minutes > 0 && seconds < 0) || (minutes < 0 && seconds > 0)) {
    return Err(DateTimeError::InvalidValue(
        "Zone offset minutes and seconds must have the same sign"));
  }
  if (minutes < -59 || minutes > 59) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Zone offset minutes not in valid range: abs(value) %d is "
                 "not in the range 0 to 59",
                 abs(minutes))));
  }
  if (seconds < -59 || seconds > 59) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Zone offset seconds not in valid range: abs(value) %d is "
                 "not in the range 0 to 59",
                 abs(seconds))));
  }
  if (abs(hours) == 18 && (minutes != 0 || seconds != 0)) {
    return Err(DateTimeError::InvalidValue(
        "Zone offset not in valid range: -18:00 to +18:00"));
  }
  return Ok();
}

DateTimeResult<ZoneOffset> ZoneOffset::OfHoursMinutesSeconds(int32_t hours,
                                                             int32_t minutes,
                                                             int32_t seconds) {
  TEMPORA_TRY(ValidateOffset(hours, minutes, seconds));

  int32_t totalSeconds =
      hours * SecondsPerHour + minutes * SecondsPerMinute + seconds;
  return ZoneOffset(totalSeconds);
}

DateTimeResult<ZoneOffset> ZoneOffset::OfTotalSeconds(int64_t totalSeconds) {
  if (totalSeconds < -MaxSeconds || totalSeconds > MaxSeconds) {
    return Err(DateTimeError::InvalidValue(
        "Zone offset not in valid range: -18:00 to +18:00"));
  }
  return ZoneOffset(int32_t(totalSeconds));
}

static DateTimeError InvalidOffsetId(const char* reason,
                                     std::string_view offsetId,
                                     int32_t index) {
  return DateTimeError(Smprintf("Invalid ID for ZoneOffset, %s: %.*s", reason,
                                int(offsetId.size()), offsetId.data()),
                       offsetId, index);
}

// Parses the two digit number at `pos`, optionally preceded by a colon.
static DateTimeResult<int32_t> ParseNumber(std::string_view offsetId,
                                           size_t pos, bool precededByColon) {
  if (precededByColon && offsetId[pos - 1] != ':') {
    return Err(InvalidOffsetId("colon not found when expected", offsetId,
                               int32_t(pos - 1)));
  }
  char ch1 = offsetId[pos];
  char ch2 = offsetId[pos + 1];
  if (!IsAsciiDigit(ch1) || !IsAsciiDigit(ch2)) {
    return Err(InvalidOffsetId("non numeric characters found", offsetId,
                               int32_t(pos)));
  }
  return AsciiDigitToNumber(ch1) * 10 + AsciiDigitToNumber(ch2);
}

DateTimeResult<ZoneOffset> ZoneOffset::Parse(std::string_view offsetId) {
  if (offsetId == "Z") {
    return UTC();
  }

  // "+h" is normalized to "+0h".
  std::string normalized;
  std::string_view id = offsetId;
  if (id.length() == 2) {
    normalized = {id[0], '0', id[1]};
    id = normalized;
  }

  int32_t hours = 0;
  int32_t minutes = 0;
  int32_t seconds = 0;
  switch (id.length()) {
    case 3:
      hours = TEMPORA_TRY(ParseNumber(id, 1, false));
      break;
    case 5:
      hours = TEMPORA_TRY(ParseNumber(id, 1, false));
      minutes = TEMPORA_TRY(ParseNumber(id, 3, false));
      break;
    case 6:
      hours = TEMPORA_TRY(ParseNumber(id, 1, false));
      minutes = TEMPORA_TRY(ParseNumber(id, 4, true));
      break;
    case 7:
      hours = TEMPORA_TRY(ParseNumber(id, 1, false));
      minutes = TEMPORA_TRY(ParseNumber(id, 3, false));
      seconds = TEMPORA_TRY(ParseNumber(id, 5, false));
      break;
    case 9:
      hours = TEMPORA_TRY(ParseNumber(id, 1, false));
      minutes = TEMPORA_TRY(ParseNumber(id, 4, true));
      seconds = TEMPORA_TRY(ParseNumber(id, 7, true));
      break;
    default:
      return Err(InvalidOffsetId("invalid format", offsetId, 0));
  }

  char first = id[0];
  if (first != '+' && first != '-') {
    return Err(
        InvalidOffsetId("plus/minus not found when expected", offsetId, 0));
  }
  if (first == '-') {
    return OfHoursMinutesSeconds(-hours, -minutes, -seconds);
  }
  return OfHoursMinutesSeconds(hours, minutes, seconds);
}

std::string ZoneOffset::getId() const {
  if (totalSeconds_ == 0) {
    return std::string("Z");
  }

  int32_t absTotalSeconds = abs(totalSeconds_);
  int32_t absHours = absTotalSeconds / SecondsPerHour;
  int32_t absMinutes = (absTotalSeconds / SecondsPerMinute) % 60;
  int32_t absSeconds = absTotalSeconds % 60;

  char sign = totalSeconds_ < 0 ? '-' : '+';
  if (absSeconds != 0) {
    return Smprintf("%c%02d:%02d:%02d", sign, absHours, absMinutes,
                    absSeconds);
  }
  return Smprintf("%c%02d:%02d", sign, absHours, absMinutes);
}

DateTimeResult<ValueRange> ZoneOffset::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> ZoneOffset::get(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  return totalSeconds_;
}

DateTimeResult<int64_t> ZoneOffset::getLong(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  return int64_t(totalSeconds_);
}
