/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <stdint.h>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/LocalDate.h"
#include "tempora/Period.h"

namespace tempora::test {

TEST(Tempora_Period, Parse)
{
  EXPECT_EQ(Unwrap(Period::Parse("P1Y2M3D")), Period::Of(1, 2, 3));
  EXPECT_EQ(Unwrap(Period::Parse("P2W")), Period::OfDays(14));
  EXPECT_EQ(Unwrap(Period::Parse("P1Y2W3D")), Period::Of(1, 0, 17));
  EXPECT_EQ(Unwrap(Period::Parse("-P1Y2M")), Period::Of(-1, -2, 0));
  EXPECT_EQ(Unwrap(Period::Parse("P-1Y+2M")), Period::Of(-1, 2, 0));
  EXPECT_EQ(Unwrap(Period::Parse("p1d")), Period::OfDays(1));
}

TEST(Tempora_Period, ParseInvalid)
{
  EXPECT_ERR_KIND(Period::Parse(""), Parse);
  EXPECT_ERR_KIND(Period::Parse("P"), Parse);
  EXPECT_ERR_KIND(Period::Parse("P1"), Parse);
  EXPECT_ERR_KIND(Period::Parse("P1D2Y"), Parse);
  EXPECT_ERR_KIND(Period::Parse("PT1D"), Parse);
  EXPECT_ERR_KIND(Period::Parse("P2147483648D"), Parse);
  EXPECT_ERR_KIND(Period::Parse("P306783379W"), Parse);
}

TEST(Tempora_Period, ToString)
{
  EXPECT_EQ(Period::Zero().toString(), "P0D");
  EXPECT_EQ(Period::Of(1, 2, 3).toString(), "P1Y2M3D");
  EXPECT_EQ(Period::OfMonths(-1).toString(), "P-1M");
  EXPECT_EQ(Unwrap(Period::OfWeeks(2)).toString(), "P14D");
}

TEST(Tempora_Period, Arithmetic)
{
  Period period = Period::Of(1, 15, 5);
  EXPECT_EQ(Unwrap(period.normalized()), Period::Of(2, 3, 5));
  EXPECT_EQ(Unwrap(Period::Of(1, -25, 0).normalized()), Period::Of(-1, -1, 0));
  EXPECT_EQ(period.toTotalMonths(), 27);

  EXPECT_EQ(Unwrap(period.plus(Period::OfDays(-5))), Period::Of(1, 15, 0));
  EXPECT_EQ(Unwrap(period.minusYears(3)), Period::Of(-2, 15, 5));
  EXPECT_EQ(Unwrap(period.multipliedBy(-2)), Period::Of(-2, -30, -10));
  EXPECT_EQ(Unwrap(period.negated()), Period::Of(-1, -15, -5));

  EXPECT_ERR_KIND(Period::OfYears(INT32_MAX).multipliedBy(2),
                  ArithmeticOverflow);
  EXPECT_ERR_KIND(Period::OfDays(INT32_MAX).plusDays(1), ArithmeticOverflow);

  EXPECT_EQ(Unwrap(period.get(ChronoUnit::Days)), 5);
  EXPECT_ERR_KIND(period.get(ChronoUnit::Hours), UnsupportedField);
}

TEST(Tempora_Period, Between)
{
  LocalDate start = Unwrap(LocalDate::Of(2010, 1, 15));
  LocalDate end = Unwrap(LocalDate::Of(2011, 3, 18));
  EXPECT_EQ(Unwrap(Period::Between(start, end)), Period::Of(1, 2, 3));
  EXPECT_EQ(Unwrap(Period::Between(end, start)), Period::Of(-1, -2, -3));
  EXPECT_EQ(Unwrap(Period::Between(start, start)), Period::Zero());
}

TEST(Tempora_Period, AddToDate)
{
  LocalDate date = Unwrap(LocalDate::Of(2007, 1, 31));
  EXPECT_EQ(Unwrap(Period::Of(1, 1, 0).addTo(date)),
            Unwrap(LocalDate::Of(2008, 2, 29)));
  EXPECT_EQ(Unwrap(Period::Of(0, 1, 1).addTo(date)),
            Unwrap(LocalDate::Of(2007, 3, 1)));
  EXPECT_EQ(Unwrap(Period::OfDays(31).subtractFrom(date)),
            Unwrap(LocalDate::Of(2006, 12, 31)));
}

}  // namespace tempora::test
