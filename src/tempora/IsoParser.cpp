/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/IsoParser.h"

#include "tempora/Printf.h"
#include "tempora/TextUtils.h"

using namespace tempora;

bool IsoParser::digits(size_t minCount, size_t maxCount, int64_t* value) {
  size_t start = index_;
  int64_t result = 0;
  while (hasMore() && index_ - start < maxCount && IsAsciiDigit(current())) {
    result = result * 10 + AsciiDigitToNumber(current());
    index_++;
  }
  if (index_ - start < minCount) {
    index_ = start;
    return false;
  }
  *value = result;
  return true;
}

DateTimeResult<int32_t> IsoParser::twoDigits() {
  int64_t value;
  if (!digits(2, 2, &value)) {
    return Err(error());
  }
  return int32_t(value);
}

bool IsoParser::skip(char ch) {
  if (hasMore() && current() == ch) {
    index_++;
    return true;
  }
  return false;
}

bool IsoParser::skipIgnoreCase(char ch) {
  if (hasMore() && ToAsciiUppercase(current()) == ToAsciiUppercase(ch)) {
    index_++;
    return true;
  }
  return false;
}

DateTimeResult<Ok> IsoParser::expect(char ch) {
  if (!skip(ch)) {
    return Err(error());
  }
  return Ok();
}

DateTimeResult<Ok> IsoParser::expectIgnoreCase(char ch) {
  if (!skipIgnoreCase(ch)) {
    return Err(error());
  }
  return Ok();
}

DateTimeResult<Ok> IsoParser::finish() const {
  if (hasMore()) {
    std::string message = Smprintf(
        "Text '%.*s' could not be parsed, unparsed text found at index %d",
        int(text_.size()), text_.data(), int(index_));
    return Err(DateTimeError(std::move(message), text_, int32_t(index_)));
  }
  return Ok();
}

DateTimeResult<int64_t> IsoParser::parseYear() {
  size_t signIndex = index_;
  bool negative = false;
  bool hasSign = false;
  if (skip('+')) {
    hasSign = true;
  } else if (skip('-')) {
    hasSign = true;
    negative = true;
  }

  size_t digitsStart = index_;
  int64_t year;
  if (!digits(4, 10, &year)) {
    return Err(error());
  }
  size_t count = index_ - digitsStart;
  if ((!hasSign && count > 4) || (hasSign && !negative && count == 4)) {
    index_ = signIndex;
    return Err(error());
  }
  return negative ? -year : year;
}

DateTimeResult<ParsedDate> IsoParser::parseYearMonth() {
  ParsedDate date;
  date.year = TEMPORA_TRY(parseYear());
  TEMPORA_TRY(expect('-'));
  date.month = TEMPORA_TRY(twoDigits());
  return date;
}

DateTimeResult<ParsedDate> IsoParser::parseDate() {
  ParsedDate date = TEMPORA_TRY(parseYearMonth());
  TEMPORA_TRY(expect('-'));
  date.day = TEMPORA_TRY(twoDigits());
  return date;
}

DateTimeResult<ParsedDate> IsoParser::parseMonthDay() {
  ParsedDate date;
  TEMPORA_TRY(expect('-'));
  TEMPORA_TRY(expect('-'));
  date.month = TEMPORA_TRY(twoDigits());
  TEMPORA_TRY(expect('-'));
  date.day = TEMPORA_TRY(twoDigits());
  return date;
}

DateTimeResult<ParsedTime> IsoParser::parseTime(bool requireSeconds) {
  ParsedTime time;
  time.hour = TEMPORA_TRY(twoDigits());
  TEMPORA_TRY(expect(':'));
  time.minute = TEMPORA_TRY(twoDigits());

  if (!skip(':')) {
    if (requireSeconds) {
      return Err(error());
    }
    return time;
  }
  time.second = TEMPORA_TRY(twoDigits());
  time.hasSeconds = true;

  if (skip('.')) {
    int32_t nano = 0;
    int32_t scale = 100'000'000;
    while (hasMore() && IsAsciiDigit(current()) && scale > 0) {
      nano += AsciiDigitToNumber(current()) * scale;
      scale /= 10;
      index_++;
    }
    time.nano = nano;
  }
  return time;
}

DateTimeResult<ZoneOffset> IsoParser::parseOffset() {
  if (skipIgnoreCase('Z')) {
    return ZoneOffset::UTC();
  }

  int32_t sign;
  if (skip('+')) {
    sign = 1;
  } else if (skip('-')) {
    sign = -1;
  } else {
    return Err(error());
  }

  int32_t hours = TEMPORA_TRY(twoDigits());
  TEMPORA_TRY(expect(':'));
  int32_t minutes = TEMPORA_TRY(twoDigits());
  int32_t seconds = 0;
  if (skip(':')) {
    seconds = TEMPORA_TRY(twoDigits());
  }
  return resolve(ZoneOffset::OfHoursMinutesSeconds(
      sign * hours, sign * minutes, sign * seconds));
}

DateTimeResult<std::string_view> IsoParser::parseBracketedZoneId() {
  TEMPORA_TRY(expect('['));
  size_t start = index_;
  while (hasMore() && current() != ']') {
    index_++;
  }
  if (index_ == start) {
    return Err(error());
  }
  std::string_view id = text_.substr(start, index_ - start);
  TEMPORA_TRY(expect(']'));
  return id;
}

DateTimeResult<LocalDate> IsoParser::localDate() {
  ParsedDate date = TEMPORA_TRY(parseDate());
  TEMPORA_TRY(resolve(CheckValidValue(ChronoField::Year, date.year)));
  return resolve(LocalDate::Of(int32_t(date.year), date.month, date.day));
}

DateTimeResult<LocalTime> IsoParser::localTime() {
  ParsedTime time = TEMPORA_TRY(parseTime());
  return resolve(
      LocalTime::Of(time.hour, time.minute, time.second, time.nano));
}

DateTimeResult<LocalDateTime> IsoParser::localDateTime() {
  LocalDate date = TEMPORA_TRY(localDate());
  TEMPORA_TRY(expectIgnoreCase('T'));
  LocalTime time = TEMPORA_TRY(localTime());
  return LocalDateTime(date, time);
}
