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
#include "tempora/LocalTime.h"

namespace tempora::test {

TEST(Tempora_Duration, OfSecondsNormalizesNanos)
{
  Duration duration = Unwrap(Duration::OfSeconds(3, -1));
  EXPECT_EQ(duration.getSeconds(), 2);
  EXPECT_EQ(duration.getNano(), 999'999'999);

  duration = Unwrap(Duration::OfSeconds(-1, 2'000'000'001));
  EXPECT_EQ(duration.getSeconds(), 1);
  EXPECT_EQ(duration.getNano(), 1);

  duration = Duration::OfMillis(-500);
  EXPECT_EQ(duration.getSeconds(), -1);
  EXPECT_EQ(duration.getNano(), 500'000'000);
}

TEST(Tempora_Duration, FactoryOverflow)
{
  EXPECT_ERR_KIND(Duration::OfDays(std::numeric_limits<int64_t>::max()),
                  ArithmeticOverflow);
  EXPECT_ERR_KIND(Duration::OfSeconds(std::numeric_limits<int64_t>::max(),
                                      1'000'000'000),
                  ArithmeticOverflow);
}

TEST(Tempora_Duration, OfEstimatedUnit)
{
  EXPECT_EQ(Unwrap(Duration::Of(2, ChronoUnit::Days)).getSeconds(), 172800);
  EXPECT_ERR_KIND(Duration::Of(1, ChronoUnit::Months), UnsupportedField);
}

TEST(Tempora_Duration, Parse)
{
  Duration duration = Unwrap(Duration::Parse("PT1.123456789S"));
  EXPECT_EQ(duration.getSeconds(), 1);
  EXPECT_EQ(duration.getNano(), 123'456'789);

  duration = Unwrap(Duration::Parse("PT-1.1S"));
  EXPECT_EQ(duration.getSeconds(), -2);
  EXPECT_EQ(duration.getNano(), 900'000'000);

  EXPECT_EQ(Unwrap(Duration::Parse("P2D")).getSeconds(), 172800);
  EXPECT_EQ(Unwrap(Duration::Parse("pt15m")).getSeconds(), 900);
  EXPECT_EQ(Unwrap(Duration::Parse("-PT1H")).getSeconds(), -3600);
  EXPECT_EQ(Unwrap(Duration::Parse("PT-1H+30M")).getSeconds(), -1800);
  EXPECT_EQ(Unwrap(Duration::Parse("PT1,5S")).getNano(), 500'000'000);
}

TEST(Tempora_Duration, ParseInvalid)
{
  EXPECT_ERR_KIND(Duration::Parse(""), Parse);
  EXPECT_ERR_KIND(Duration::Parse("P"), Parse);
  EXPECT_ERR_KIND(Duration::Parse("PT"), Parse);
  EXPECT_ERR_KIND(Duration::Parse("P1"), Parse);
  EXPECT_ERR_KIND(Duration::Parse("PT1.1234567891S"), Parse);
  EXPECT_ERR_KIND(Duration::Parse("PT1S "), Parse);
  EXPECT_ERR_KIND(Duration::Parse("PT9223372036854775808S"), Parse);
  EXPECT_ERR_KIND(Duration::Parse("P106751991167301D"), Parse);
}

TEST(Tempora_Duration, ToString)
{
  EXPECT_EQ(Duration::Zero().toString(), "PT0S");
  EXPECT_EQ(Duration::OfSeconds(3661).toString(), "PT1H1M1S");
  EXPECT_EQ(Unwrap(Duration::OfMinutes(90)).toString(), "PT1H30M");
  EXPECT_EQ(Duration::OfMillis(-500).toString(), "PT-0.5S");
  EXPECT_EQ(Duration::OfMillis(-1500).toString(), "PT-1.5S");
  EXPECT_EQ(Duration::OfNanos(1).toString(), "PT0.000000001S");
}

TEST(Tempora_Duration, Arithmetic)
{
  Duration ten = Duration::OfSeconds(10);
  Duration third = Unwrap(ten.dividedBy(3));
  EXPECT_EQ(third.getSeconds(), 3);
  EXPECT_EQ(third.getNano(), 333'333'333);

  EXPECT_EQ(Unwrap(ten.multipliedBy(-3)), Duration::OfSeconds(-30));
  EXPECT_EQ(Unwrap(ten.negated()), Duration::OfSeconds(-10));
  EXPECT_EQ(Unwrap(Duration::OfSeconds(-10).abs()), ten);
  EXPECT_EQ(Unwrap(ten.plusMillis(1500)), Duration::OfMillis(11500));
  EXPECT_EQ(Unwrap(ten.minus(1, ChronoUnit::Minutes)),
            Duration::OfSeconds(-50));

  EXPECT_ERR_KIND(ten.dividedBy(0), ArithmeticOverflow);
  EXPECT_ERR_KIND(
      Duration::OfSeconds(std::numeric_limits<int64_t>::max()).multipliedBy(2),
      ArithmeticOverflow);
  EXPECT_ERR_KIND(
      Duration::OfSeconds(std::numeric_limits<int64_t>::max()).plusSeconds(1),
      ArithmeticOverflow);
}

TEST(Tempora_Duration, Conversions)
{
  Duration duration = Unwrap(Duration::OfSeconds(90061, 5'000'000));
  EXPECT_EQ(duration.toDays(), 1);
  EXPECT_EQ(duration.toHours(), 25);
  EXPECT_EQ(duration.toMinutes(), 1501);
  EXPECT_EQ(Unwrap(duration.toMillis()), 90061005);
  EXPECT_ERR_KIND(
      Duration::OfSeconds(std::numeric_limits<int64_t>::max()).toNanos(),
      ArithmeticOverflow);
}

TEST(Tempora_Duration, Between)
{
  Instant start = Unwrap(Instant::OfEpochSecond(10, 900'000'000));
  Instant end = Unwrap(Instant::OfEpochSecond(12, 100'000'000));
  Duration duration = Unwrap(Duration::Between(start, end));
  EXPECT_EQ(duration.getSeconds(), 1);
  EXPECT_EQ(duration.getNano(), 200'000'000);

  duration = Unwrap(Duration::Between(end, start));
  EXPECT_EQ(duration.getSeconds(), -2);
  EXPECT_EQ(duration.getNano(), 800'000'000);

  Duration time = Duration::Between(Unwrap(LocalTime::Of(23, 0)),
                                    Unwrap(LocalTime::Of(1, 30)));
  EXPECT_EQ(time.getSeconds(), -77400);
}

TEST(Tempora_Duration, Comparison)
{
  EXPECT_LT(Duration::OfMillis(-1), Duration::Zero());
  EXPECT_LT(Duration::OfNanos(1), Duration::OfNanos(2));
  EXPECT_GT(Duration::OfSeconds(1).compareTo(Duration::OfMillis(999)), 0);
}

}  // namespace tempora::test
