/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/DateTimeError.h"

namespace tempora {

const char* KindName(DateTimeError::Kind kind) {
  switch (kind) {
    case DateTimeError::Kind::InvalidValue:
      return "InvalidValue";
    case DateTimeError::Kind::UnsupportedField:
      return "UnsupportedField";
    case DateTimeError::Kind::NullArgument:
      return "NullArgument";
    case DateTimeError::Kind::ArithmeticOverflow:
      return "ArithmeticOverflow";
    case DateTimeError::Kind::Parse:
      return "Parse";
    case DateTimeError::Kind::InvalidOffset:
      return "InvalidOffset";
    case DateTimeError::Kind::UnknownZone:
      return "UnknownZone";
    case DateTimeError::Kind::ZoneRulesData:
      return "ZoneRulesData";
  }
  TEMPORA_CRASH("invalid error kind");
}

std::string DateTimeError::toString() const {
  std::string result(KindName(kind_));
  result += ": ";
  result += message_;
  return result;
}

DateTimeError DateTimeError::ParseAt(std::string_view text,
                                     int32_t errorIndex) {
  std::string message =
      Smprintf("Text '%.*s' could not be parsed at index %d",
               int(text.size()), text.data(), errorIndex);
  return DateTimeError(std::move(message), text, errorIndex);
}

DateTimeError DateTimeError::ParseWithCause(std::string_view text,
                                            const DateTimeError& cause) {
  std::string message =
      Smprintf("Text '%.*s' could not be parsed: %s", int(text.size()),
               text.data(), cause.message().c_str());
  return DateTimeError(std::move(message), text, 0);
}

}  // namespace tempora
