/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <stdint.h>

#include <vector>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Ser.h"

namespace tempora::test {

using Bytes = std::vector<uint8_t>;

static Bytes SerializeOk(const SerValue& aValue) {
  return Unwrap(Serialize(aValue));
}

template <typename T>
static T DeserializeAs(const Bytes& aBytes) {
  SerValue value = Unwrap(Deserialize(aBytes, IcuRegistry()));
  EXPECT_TRUE(std::holds_alternative<T>(value));
  return std::get<T>(value);
}

TEST(Tempora_Ser, LocalDate)
{
  LocalDate date = Unwrap(LocalDate::Of(2012, 10, 29));
  Bytes bytes = SerializeOk(date);
  EXPECT_EQ(bytes, (Bytes{3, 0x00, 0x00, 0x07, 0xDC, 10, 29}));
  EXPECT_EQ(DeserializeAs<LocalDate>(bytes), date);

  LocalDate negative = Unwrap(LocalDate::Of(-1, 1, 1));
  EXPECT_EQ(SerializeOk(negative), (Bytes{3, 0xFF, 0xFF, 0xFF, 0xFF, 1, 1}));
  EXPECT_EQ(DeserializeAs<LocalDate>(SerializeOk(negative)), negative);
}

TEST(Tempora_Ser, LocalTimeDropsTrailingZeros)
{
  EXPECT_EQ(SerializeOk(Unwrap(LocalTime::Of(10, 0))), (Bytes{5, 0xF5}));
  EXPECT_EQ(SerializeOk(Unwrap(LocalTime::Of(10, 15))), (Bytes{5, 10, 0xF0}));
  EXPECT_EQ(SerializeOk(Unwrap(LocalTime::Of(10, 15, 30))),
            (Bytes{5, 10, 15, 0xE1}));

  LocalTime withNanos = Unwrap(LocalTime::Of(10, 15, 30, 500'000'000));
  Bytes bytes = SerializeOk(withNanos);
  EXPECT_EQ(bytes, (Bytes{5, 10, 15, 30, 0x1D, 0xCD, 0x65, 0x00}));
  EXPECT_EQ(DeserializeAs<LocalTime>(bytes), withNanos);

  EXPECT_EQ(DeserializeAs<LocalTime>(Bytes{5, 0xFF}), LocalTime::Midnight());
}

TEST(Tempora_Ser, ZoneOffset)
{
  EXPECT_EQ(SerializeOk(ZoneOffset::UTC()), (Bytes{8, 0}));
  EXPECT_EQ(SerializeOk(Unwrap(ZoneOffset::OfHours(1))), (Bytes{8, 4}));
  EXPECT_EQ(SerializeOk(Unwrap(ZoneOffset::OfHours(-5))), (Bytes{8, 0xEC}));

  ZoneOffset odd = Unwrap(ZoneOffset::OfTotalSeconds(3601));
  Bytes bytes = SerializeOk(odd);
  EXPECT_EQ(bytes, (Bytes{8, 127, 0x00, 0x00, 0x0E, 0x11}));
  EXPECT_EQ(DeserializeAs<ZoneOffset>(bytes), odd);
  EXPECT_EQ(DeserializeAs<ZoneOffset>(Bytes{8, 0xEC}),
            Unwrap(ZoneOffset::OfHours(-5)));
}

TEST(Tempora_Ser, DurationAndInstant)
{
  Duration duration = Unwrap(Duration::OfSeconds(1, 5));
  Bytes bytes = SerializeOk(duration);
  EXPECT_EQ(bytes, (Bytes{1, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, 5}));
  EXPECT_EQ(DeserializeAs<Duration>(bytes), duration);

  Instant instant = Unwrap(Instant::OfEpochSecond(-1, 999'999'999));
  EXPECT_EQ(DeserializeAs<Instant>(SerializeOk(instant)), instant);
  EXPECT_EQ(SerTypeOf(instant), SerType::Instant);
}

TEST(Tempora_Ser, ZoneIds)
{
  ZoneId london = Unwrap(ZoneId::Of("Europe/London", IcuRegistry()));
  Bytes bytes = SerializeOk(london);
  Bytes expected = {7, 0, 13};
  for (char ch : std::string("Europe/London")) {
    expected.push_back(uint8_t(ch));
  }
  EXPECT_EQ(bytes, expected);
  EXPECT_EQ(SerTypeOf(london), SerType::ZoneRegion);
  EXPECT_EQ(DeserializeAs<ZoneId>(bytes), london);

  // An offset id is written as a plain offset.
  ZoneId offset = ZoneId::Of(Unwrap(ZoneOffset::OfHours(1)));
  EXPECT_EQ(SerTypeOf(offset), SerType::ZoneOffset);
  EXPECT_EQ(SerializeOk(offset), (Bytes{8, 4}));
}

TEST(Tempora_Ser, OffsetZoneIdRoundTrip)
{
  ZoneId offset = ZoneId::Of(Unwrap(ZoneOffset::OfHours(1)));
  Bytes bytes = SerializeOk(offset);

  // Read as a plain value it comes back as the offset itself.
  EXPECT_EQ(DeserializeAs<ZoneOffset>(bytes), Unwrap(ZoneOffset::OfHours(1)));

  ZoneId zoneId = Unwrap(DeserializeZoneId(bytes, IcuRegistry()));
  EXPECT_EQ(zoneId, offset);
  EXPECT_TRUE(zoneId.isOffset());
  EXPECT_EQ(zoneId.getId(), "+01:00");

  ZoneId london = Unwrap(ZoneId::Of("Europe/London", IcuRegistry()));
  EXPECT_EQ(Unwrap(DeserializeZoneId(SerializeOk(london), IcuRegistry())),
            london);

  EXPECT_ERR_KIND(
      DeserializeZoneId(SerializeOk(LocalDate::Epoch()), IcuRegistry()),
      InvalidValue);
  EXPECT_ERR_KIND(DeserializeZoneId(Bytes{8, 4, 0}, IcuRegistry()),
                  InvalidValue);
}

TEST(Tempora_Ser, Composites)
{
  ZoneId london = Unwrap(ZoneId::Of("Europe/London", IcuRegistry()));
  ZonedDateTime zoned = Unwrap(ZonedDateTime::Of(
      Unwrap(LocalDateTime::Of(2008, 10, 26, 1, 30)), london));
  ZonedDateTime later = zoned.withLaterOffsetAtOverlap();

  Bytes bytes = SerializeOk(later);
  EXPECT_EQ(bytes[0], uint8_t(SerType::ZonedDateTime));
  EXPECT_EQ(DeserializeAs<ZonedDateTime>(bytes), later);
  EXPECT_EQ(DeserializeAs<ZonedDateTime>(SerializeOk(zoned)), zoned);

  OffsetDateTime offsetDateTime = Unwrap(OffsetDateTime::Of(
      2012, 10, 29, 10, 15, 30, 0, Unwrap(ZoneOffset::OfHours(-5))));
  EXPECT_EQ(DeserializeAs<OffsetDateTime>(SerializeOk(offsetDateTime)),
            offsetDateTime);

  OffsetTime offsetTime =
      Unwrap(OffsetTime::Of(23, 59, 59, 1, ZoneOffset::UTC()));
  EXPECT_EQ(DeserializeAs<OffsetTime>(SerializeOk(offsetTime)), offsetTime);

  LocalDateTime dateTime = Unwrap(LocalDateTime::Of(2012, 10, 29, 10, 15));
  EXPECT_EQ(SerializeOk(dateTime),
            (Bytes{4, 0x00, 0x00, 0x07, 0xDC, 10, 29, 10, 0xF0}));
}

TEST(Tempora_Ser, Invalid)
{
  const zone::ZoneRulesRegistry& registry = IcuRegistry();
  EXPECT_ERR_KIND(Deserialize(Bytes{}, registry), ZoneRulesData);
  EXPECT_ERR_KIND(Deserialize(Bytes{99}, registry), InvalidValue);
  EXPECT_ERR_KIND(Deserialize(Bytes{3, 0x00, 0x00}, registry), ZoneRulesData);
  EXPECT_ERR_KIND(Deserialize(Bytes{3, 0x00, 0x00, 0x07, 0xDC, 13, 1}, registry),
                  InvalidValue);
  EXPECT_ERR_KIND(Deserialize(Bytes{8, 4, 0}, registry), InvalidValue);
  EXPECT_ERR_KIND(Deserialize(Bytes{7, 0, 3, 'X', '/', 'Y'}, registry),
                  UnknownZone);
}

}  // namespace tempora::test
