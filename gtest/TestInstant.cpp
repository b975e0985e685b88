/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <limits>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"

namespace tempora::test {

TEST(Tempora_Instant, OfEpochSecondNormalizes)
{
  Instant instant = Unwrap(Instant::OfEpochSecond(3, -1));
  EXPECT_EQ(instant.getEpochSecond(), 2);
  EXPECT_EQ(instant.getNano(), 999'999'999);

  instant = Instant::OfEpochMilli(-1);
  EXPECT_EQ(instant.getEpochSecond(), -1);
  EXPECT_EQ(instant.getNano(), 999'000'000);
  EXPECT_EQ(Unwrap(instant.toEpochMilli()), -1);
}

TEST(Tempora_Instant, Limits)
{
  EXPECT_ERR_KIND(Instant::OfEpochSecond(Instant::MaxSecond + 1),
                  InvalidValue);
  EXPECT_ERR_KIND(Instant::OfEpochSecond(Instant::MinSecond - 1),
                  InvalidValue);
  EXPECT_TRUE(Instant::Max().plusNanos(1).isErr());
  EXPECT_TRUE(Instant::Min().minusNanos(1).isErr());
  EXPECT_ERR_KIND(Instant::OfEpochSecond(std::numeric_limits<int64_t>::max(),
                                         1'000'000'000),
                  ArithmeticOverflow);
  EXPECT_ERR_KIND(Instant::Max().toEpochMilli(), ArithmeticOverflow);
}

TEST(Tempora_Instant, ToString)
{
  EXPECT_EQ(Instant::Epoch().toString(), "1970-01-01T00:00:00Z");
  EXPECT_EQ(Unwrap(Instant::OfEpochSecond(-1)).toString(),
            "1969-12-31T23:59:59Z");
  EXPECT_EQ(Instant::OfEpochMilli(1500).toString(),
            "1970-01-01T00:00:01.500Z");
  EXPECT_EQ(Unwrap(Instant::OfEpochSecond(0, 1)).toString(),
            "1970-01-01T00:00:00.000000001Z");
  EXPECT_EQ(Instant::Max().toString(),
            "+1000000000-12-31T23:59:59.999999999Z");
}

TEST(Tempora_Instant, Parse)
{
  EXPECT_EQ(Unwrap(Instant::Parse("1970-01-01T00:00:00Z")), Instant::Epoch());
  EXPECT_EQ(Unwrap(Instant::Parse("1970-01-01T00:00:01.5Z")),
            Instant::OfEpochMilli(1500));
  EXPECT_EQ(Unwrap(Instant::Parse("1970-01-01T23:59:60Z")).getEpochSecond(),
            86399);
  EXPECT_EQ(Unwrap(Instant::Parse("1970-01-01T24:00:00Z")).getEpochSecond(),
            86400);
  EXPECT_EQ(Unwrap(Instant::Parse("+1000000000-12-31T23:59:59.999999999Z")),
            Instant::Max());

  EXPECT_ERR_KIND(Instant::Parse("1970-01-01T00:00Z"), Parse);
  EXPECT_ERR_KIND(Instant::Parse("1970-01-01T00:00:00"), Parse);
  EXPECT_ERR_KIND(Instant::Parse("1970-01-01T00:00:00+01:00"), Parse);
}

TEST(Tempora_Instant, Plus)
{
  Instant instant = Unwrap(Instant::OfEpochSecond(10, 500'000'000));
  EXPECT_EQ(Unwrap(instant.plusMillis(600)),
            Unwrap(Instant::OfEpochSecond(11, 100'000'000)));
  EXPECT_EQ(Unwrap(instant.plus(Duration::OfSeconds(-11))),
            Unwrap(Instant::OfEpochSecond(-1, 500'000'000)));
  EXPECT_EQ(Unwrap(instant.plus(2, ChronoUnit::Days)).getEpochSecond(),
            172810);
  EXPECT_ERR_KIND(instant.plus(1, ChronoUnit::Months), UnsupportedField);
}

TEST(Tempora_Instant, TruncatedTo)
{
  Instant instant = Unwrap(Instant::OfEpochSecond(5410, 123));
  EXPECT_EQ(Unwrap(instant.truncatedTo(ChronoUnit::Hours)).getEpochSecond(),
            3600);
  EXPECT_EQ(Unwrap(instant.truncatedTo(ChronoUnit::Seconds)),
            Unwrap(Instant::OfEpochSecond(5410)));
  EXPECT_EQ(Unwrap(instant.truncatedTo(ChronoUnit::Days)), Instant::Epoch());
  EXPECT_ERR_KIND(instant.truncatedTo(ChronoUnit::Weeks), InvalidValue);
}

TEST(Tempora_Instant, Until)
{
  Instant start = Instant::Epoch();
  Instant end = Unwrap(Instant::OfEpochSecond(86400 + 59, 1));
  EXPECT_EQ(Unwrap(start.until(end, ChronoUnit::Hours)), 24);
  EXPECT_EQ(Unwrap(start.until(end, ChronoUnit::Minutes)), 1440);
  EXPECT_EQ(Unwrap(start.until(end, ChronoUnit::Days)), 1);
  EXPECT_EQ(Unwrap(end.until(start, ChronoUnit::Seconds)), -86459);
  EXPECT_ERR_KIND(start.until(end, ChronoUnit::Months), UnsupportedField);
}

TEST(Tempora_Instant, Comparison)
{
  Instant a = Unwrap(Instant::OfEpochSecond(-1, 999'999'999));
  Instant b = Instant::Epoch();
  EXPECT_TRUE(a.isBefore(b));
  EXPECT_TRUE(b.isAfter(a));
  EXPECT_LT(a.compareTo(b), 0);
}

}  // namespace tempora::test
