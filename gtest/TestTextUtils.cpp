/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "gtest/gtest.h"
#include "tempora/TextUtils.h"

namespace tempora::test {

static_assert(IsAsciiDigit('0') && IsAsciiDigit('9'));
static_assert(!IsAsciiDigit('/') && !IsAsciiDigit(':'));
static_assert(AsciiDigitToNumber('7') == 7);
static_assert(ToAsciiUppercase('z') == 'Z');

TEST(Tempora_TextUtils, Classes)
{
  for (int i = 0; i < 128; i++) {
    char ch = char(i);
    bool digit = ch >= '0' && ch <= '9';
    bool lower = ch >= 'a' && ch <= 'z';
    bool upper = ch >= 'A' && ch <= 'Z';
    EXPECT_EQ(IsAsciiDigit(ch), digit) << i;
    EXPECT_EQ(IsAsciiLowercaseAlpha(ch), lower) << i;
    EXPECT_EQ(IsAsciiUppercaseAlpha(ch), upper) << i;
    EXPECT_EQ(IsAsciiAlpha(ch), lower || upper) << i;
    EXPECT_EQ(IsAsciiAlphanumeric(ch), digit || lower || upper) << i;
  }

  // Bytes of a UTF-8 sequence are never ASCII letters or digits.
  EXPECT_FALSE(IsAsciiAlphanumeric(char(0xC3)));
  EXPECT_FALSE(IsAsciiAlphanumeric(char(0xA9)));
}

TEST(Tempora_TextUtils, Conversions)
{
  for (char ch = '0'; ch <= '9'; ch++) {
    EXPECT_EQ(AsciiDigitToNumber(ch), ch - '0');
  }
  EXPECT_EQ(ToAsciiUppercase('a'), 'A');
  EXPECT_EQ(ToAsciiUppercase('Q'), 'Q');
  EXPECT_EQ(ToAsciiUppercase('5'), '5');
  EXPECT_EQ(ToAsciiUppercase('['), '[');
}

}  // namespace tempora::test
