/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_IsoParser_h
#define tempora_IsoParser_h

#include <stddef.h>
#include <stdint.h>

#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/LocalDate.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/ZoneOffset.h"

namespace tempora {

struct ParsedDate final {
  int64_t year = 0;
  int32_t month = 0;
  int32_t day = 0;
};

struct ParsedTime final {
  int32_t hour = 0;
  int32_t minute = 0;
  int32_t second = 0;
  int32_t nano = 0;
  bool hasSeconds = false;
};

/**
 * Recursive descent parser for the ISO-8601 extended formats.
 *
 * The parse* methods only check the syntax and return the raw field values.
 * The localDate(), localTime() and localDateTime() methods additionally
 * validate the fields. Validation failures are reported as parse errors
 * carrying the underlying message.
 */
class IsoParser final {
  std::string_view text_;
  size_t index_ = 0;

  DateTimeError error() const {
    return DateTimeError::ParseAt(text_, int32_t(index_));
  }

  bool hasMore() const { return index_ < text_.length(); }
  char current() const { return text_[index_]; }

  // Reads between `minCount` and `maxCount` ASCII digits.
  bool digits(size_t minCount, size_t maxCount, int64_t* value);

  // Reads exactly two digits.
  DateTimeResult<int32_t> twoDigits();

 public:
  explicit IsoParser(std::string_view text) : text_(text) {}

  std::string_view text() const { return text_; }
  size_t index() const { return index_; }
  bool atEnd() const { return !hasMore(); }

  /**
   * Consumes `ch` if it's the next character.
   */
  bool skip(char ch);

  /**
   * Consumes `ch` if it's the next character, ignoring ASCII case.
   */
  bool skipIgnoreCase(char ch);

  DateTimeResult<Ok> expect(char ch);
  DateTimeResult<Ok> expectIgnoreCase(char ch);

  /**
   * Fails unless all input has been consumed.
   */
  DateTimeResult<Ok> finish() const;

  /**
   * [+-]YYYY. More than four digits require a sign, and a four digit year
   * can't carry a plus sign.
   */
  DateTimeResult<int64_t> parseYear();

  /**
   * [+-]YYYY-MM. The day is left at zero.
   */
  DateTimeResult<ParsedDate> parseYearMonth();

  /**
   * [+-]YYYY-MM-DD.
   */
  DateTimeResult<ParsedDate> parseDate();

  /**
   * --MM-DD. The year is left at zero.
   */
  DateTimeResult<ParsedDate> parseMonthDay();

  /**
   * HH:MM[:SS[.fffffffff]].
   */
  DateTimeResult<ParsedTime> parseTime(bool requireSeconds = false);

  /**
   * Z or +HH:MM[:SS].
   */
  DateTimeResult<ZoneOffset> parseOffset();

  /**
   * [zone-id], returning the text between the brackets.
   */
  DateTimeResult<std::string_view> parseBracketedZoneId();

  DateTimeResult<LocalDate> localDate();
  DateTimeResult<LocalTime> localTime();
  DateTimeResult<LocalDateTime> localDateTime();

  /**
   * Wraps a validation failure into a parse error of the whole text.
   */
  template <typename T>
  DateTimeResult<T> resolve(DateTimeResult<T>&& result) const {
    if (result.isErr()) {
      return Err(DateTimeError::ParseWithCause(text_, result.inspectErr()));
    }
    return result.unwrap();
  }
};

}  // namespace tempora

#endif /* tempora_IsoParser_h */
