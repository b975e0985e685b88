/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Clock.h"
#include "tempora/LocalDateTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/OffsetTime.h"
#include "tempora/ZonedDateTime.h"

namespace tempora::test {

static ZoneId PlusOne() {
  return ZoneId::Of(Unwrap(ZoneOffset::OfHours(1)));
}

static std::unique_ptr<Clock> FixedClock() {
  return Clock::Fixed(Unwrap(Instant::OfEpochSecond(1212318000)), PlusOne());
}

TEST(Tempora_Clock, Fixed)
{
  std::unique_ptr<Clock> clock = FixedClock();
  EXPECT_EQ(clock->instant().getEpochSecond(), 1212318000);
  EXPECT_EQ(Unwrap(clock->millis()), 1212318000000);
  EXPECT_EQ(clock->getZone(), PlusOne());
  EXPECT_EQ(clock->toString(), "FixedClock[2008-06-01T11:00:00Z,+01:00]");

  std::unique_ptr<Clock> utc = clock->withZone(ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(utc->instant(), clock->instant());
  EXPECT_EQ(utc->getZone().getId(), "Z");
}

TEST(Tempora_Clock, NowFromClock)
{
  std::unique_ptr<Clock> clock = FixedClock();
  EXPECT_EQ(Instant::Now(*clock).getEpochSecond(), 1212318000);
  EXPECT_EQ(LocalDate::Now(*clock), Unwrap(LocalDate::Of(2008, 6, 1)));
  EXPECT_EQ(LocalTime::Now(*clock), Unwrap(LocalTime::Of(12, 0)));
  EXPECT_EQ(LocalDateTime::Now(*clock).toString(), "2008-06-01T12:00");
  EXPECT_EQ(OffsetDateTime::Now(*clock).toString(), "2008-06-01T12:00+01:00");
  EXPECT_EQ(OffsetTime::Now(*clock).toString(), "12:00+01:00");
  EXPECT_EQ(ZonedDateTime::Now(*clock).toString(), "2008-06-01T12:00+01:00");
}

TEST(Tempora_Clock, Offset)
{
  std::shared_ptr<const Clock> base = FixedClock();
  std::unique_ptr<Clock> later = Clock::Offset(base, Duration::OfSeconds(3600));
  EXPECT_EQ(later->instant().getEpochSecond(), 1212321600);
  EXPECT_EQ(later->getZone(), PlusOne());
  EXPECT_EQ(later->toString(),
            "OffsetClock[FixedClock[2008-06-01T11:00:00Z,+01:00],PT1H]");
  EXPECT_EQ(later->withZone(ZoneId::Of(ZoneOffset::UTC()))->instant(),
            later->instant());

  std::shared_ptr<const Clock> min =
      Clock::Fixed(Instant::Min(), ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(Clock::Offset(min, Duration::OfSeconds(-1))->instant(),
            Instant::Min());
  std::shared_ptr<const Clock> max =
      Clock::Fixed(Instant::Max(), ZoneId::Of(ZoneOffset::UTC()));
  EXPECT_EQ(Clock::Offset(max, Duration::OfSeconds(1))->instant(),
            Instant::Max());
}

TEST(Tempora_Clock, System)
{
  std::unique_ptr<Clock> clock = Clock::SystemUTC();
  EXPECT_EQ(clock->toString(), "SystemClock[Z]");
  Instant first = clock->instant();
  Instant second = clock->instant();
  EXPECT_FALSE(second.isBefore(first));
  EXPECT_GE(LocalDate::Now(*clock).getYear(), 2024);

  std::unique_ptr<Clock> plusOne = Clock::System(PlusOne());
  EXPECT_EQ(plusOne->getZone(), PlusOne());
}

}  // namespace tempora::test
