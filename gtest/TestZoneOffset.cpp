/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/ZoneOffset.h"

namespace tempora::test {

TEST(Tempora_ZoneOffset, OfHoursMinutesSeconds)
{
  ZoneOffset offset = Unwrap(ZoneOffset::OfHoursMinutesSeconds(1, 2, 3));
  EXPECT_EQ(offset.getTotalSeconds(), 3723);
  EXPECT_EQ(offset.getId(), "+01:02:03");

  offset = Unwrap(ZoneOffset::OfHoursMinutes(-5, -30));
  EXPECT_EQ(offset.getTotalSeconds(), -19800);
  EXPECT_EQ(offset.getId(), "-05:30");

  EXPECT_EQ(Unwrap(ZoneOffset::OfHoursMinutesSeconds(0, -30, -15)).getId(),
            "-00:30:15");
  EXPECT_EQ(Unwrap(ZoneOffset::OfHours(-18)), ZoneOffset::Min());
  EXPECT_EQ(Unwrap(ZoneOffset::OfHours(18)), ZoneOffset::Max());
  EXPECT_EQ(Unwrap(ZoneOffset::OfHours(0)).getId(), "Z");
}

TEST(Tempora_ZoneOffset, OfInvalid)
{
  EXPECT_ERR_KIND(ZoneOffset::OfHours(19), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfHoursMinutes(1, -1), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfHoursMinutes(-1, 1), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfHoursMinutesSeconds(0, 1, -1), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfHoursMinutes(1, 60), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfHoursMinutesSeconds(18, 0, 1), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfTotalSeconds(64801), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::OfTotalSeconds(-64801), InvalidValue);
  EXPECT_TRUE(ZoneOffset::OfTotalSeconds(-64800).isOk());
}

TEST(Tempora_ZoneOffset, Parse)
{
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("Z")), ZoneOffset::UTC());
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("+1")).getTotalSeconds(), 3600);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("-01")).getTotalSeconds(), -3600);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("+0130")).getTotalSeconds(), 5400);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("+01:30")).getTotalSeconds(), 5400);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("-013015")).getTotalSeconds(), -5415);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("+01:30:15")).getTotalSeconds(), 5415);
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("-00")), ZoneOffset::UTC());
  EXPECT_EQ(Unwrap(ZoneOffset::Parse("+18:00")), ZoneOffset::Max());
}

TEST(Tempora_ZoneOffset, ParseInvalid)
{
  EXPECT_ERR_KIND(ZoneOffset::Parse(""), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("z"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("01:00"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("+1:00"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("+01-00"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("+01:00:0"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("*01:00"), Parse);
  EXPECT_ERR_KIND(ZoneOffset::Parse("+0a"), Parse);

  EXPECT_ERR_KIND(ZoneOffset::Parse("+19:00"), InvalidValue);
  EXPECT_ERR_KIND(ZoneOffset::Parse("+01:60"), InvalidValue);
}

TEST(Tempora_ZoneOffset, CompareToIsDescending)
{
  ZoneOffset a = Unwrap(ZoneOffset::OfHoursMinutesSeconds(1, 2, 3));
  ZoneOffset b = Unwrap(ZoneOffset::OfHoursMinutesSeconds(2, 3, 4));
  EXPECT_GT(a.compareTo(b), 0);
  EXPECT_LT(b.compareTo(a), 0);
  EXPECT_EQ(a.compareTo(a), 0);
  EXPECT_GT(ZoneOffset::UTC().compareTo(ZoneOffset::Max()), 0);
}

TEST(Tempora_ZoneOffset, Fields)
{
  ZoneOffset offset = Unwrap(ZoneOffset::OfHours(2));
  EXPECT_EQ(Unwrap(offset.get(ChronoField::OffsetSeconds)), 7200);
  EXPECT_EQ(Unwrap(offset.getLong(ChronoField::OffsetSeconds)), 7200);
  EXPECT_ERR_KIND(offset.get(ChronoField::HourOfDay), UnsupportedField);
  EXPECT_ERR_KIND(offset.range(ChronoField::Year), UnsupportedField);
}

}  // namespace tempora::test
