/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Character classification helpers for ASCII text. */

#ifndef tempora_TextUtils_h
#define tempora_TextUtils_h

#include <stdint.h>

#include "tempora/Assertions.h"

namespace tempora {

constexpr bool IsAsciiDigit(char ch) { return '0' <= ch && ch <= '9'; }

constexpr bool IsAsciiLowercaseAlpha(char ch) {
  return 'a' <= ch && ch <= 'z';
}

constexpr bool IsAsciiUppercaseAlpha(char ch) {
  return 'A' <= ch && ch <= 'Z';
}

constexpr bool IsAsciiAlpha(char ch) {
  return IsAsciiLowercaseAlpha(ch) || IsAsciiUppercaseAlpha(ch);
}

constexpr bool IsAsciiAlphanumeric(char ch) {
  return IsAsciiDigit(ch) || IsAsciiAlpha(ch);
}

constexpr char ToAsciiUppercase(char ch) {
  return IsAsciiLowercaseAlpha(ch) ? char(ch - 'a' + 'A') : ch;
}

constexpr int32_t AsciiDigitToNumber(char ch) {
  TEMPORA_ASSERT(IsAsciiDigit(ch));
  return ch - '0';
}

}  // namespace tempora

#endif /* tempora_TextUtils_h */
