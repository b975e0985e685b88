/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_DateTimeError_h
#define tempora_DateTimeError_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/Printf.h"
#include "tempora/Result.h"

namespace tempora {

/**
 * Error value returned by every fallible date-time operation.
 */
class DateTimeError final {
 public:
  enum class Kind : uint8_t {
    // A field value is outside of its valid range.
    InvalidValue,

    // The field or unit isn't supported by the queried type.
    UnsupportedField,

    // A required argument is missing.
    NullArgument,

    // Numeric overflow or division by zero.
    ArithmeticOverflow,

    // Malformed input text.
    Parse,

    // The offset isn't valid for the local date-time in the given zone.
    InvalidOffset,

    // The zone identifier isn't known to any registered provider.
    UnknownZone,

    // Zone rules data couldn't be registered, read or decoded.
    ZoneRulesData,
  };

 private:
  std::string message_;
  std::string parsedText_;
  int32_t errorIndex_ = -1;
  Kind kind_;

 public:
  DateTimeError(Kind kind, std::string message)
      : message_(std::move(message)), kind_(kind) {}

  DateTimeError(std::string message, std::string_view parsedText,
                int32_t errorIndex)
      : message_(std::move(message)),
        parsedText_(parsedText),
        errorIndex_(errorIndex),
        kind_(Kind::Parse) {}

  Kind kind() const { return kind_; }

  const std::string& message() const { return message_; }

  /**
   * The text which failed to parse. Empty unless `kind()` is `Kind::Parse`.
   */
  const std::string& parsedText() const { return parsedText_; }

  /**
   * Index into the parsed text where the error was found, or -1.
   */
  int32_t errorIndex() const { return errorIndex_; }

  bool is(Kind kind) const { return kind_ == kind; }

  std::string toString() const;

  static DateTimeError InvalidValue(std::string message) {
    return DateTimeError(Kind::InvalidValue, std::move(message));
  }
  static DateTimeError UnsupportedField(std::string message) {
    return DateTimeError(Kind::UnsupportedField, std::move(message));
  }
  static DateTimeError NullArgument(const char* name) {
    return DateTimeError(Kind::NullArgument, Smprintf("%s", name));
  }
  static DateTimeError Overflow(std::string message) {
    return DateTimeError(Kind::ArithmeticOverflow, std::move(message));
  }
  static DateTimeError InvalidOffset(std::string message) {
    return DateTimeError(Kind::InvalidOffset, std::move(message));
  }
  static DateTimeError UnknownZone(std::string message) {
    return DateTimeError(Kind::UnknownZone, std::move(message));
  }
  static DateTimeError ZoneRulesData(std::string message) {
    return DateTimeError(Kind::ZoneRulesData, std::move(message));
  }

  /**
   * Parse error in the format "Text '<text>' could not be parsed at index N".
   */
  static DateTimeError ParseAt(std::string_view text, int32_t errorIndex);

  /**
   * Parse error wrapping the underlying cause, in the format
   * "Text '<text>' could not be parsed: <cause>".
   */
  static DateTimeError ParseWithCause(std::string_view text,
                                      const DateTimeError& cause);
};

const char* KindName(DateTimeError::Kind kind);

template <typename T>
using DateTimeResult = Result<T, DateTimeError>;

}  // namespace tempora

#endif /* tempora_DateTimeError_h */
