/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/DateTimeFormatter.h"
#include "tempora/LocalDateTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/ZonedDateTime.h"

namespace tempora::test {

static DateTimeFormatter Pattern(const char* aPattern) {
  return Unwrap(DateTimeFormatter::OfPattern(aPattern));
}

static LocalDate Date(int32_t aYear, int32_t aMonth, int32_t aDay) {
  return Unwrap(LocalDate::Of(aYear, aMonth, aDay));
}

static OffsetDateTime WithOffset(int32_t aHours, int32_t aMinutes,
                                 int32_t aSeconds) {
  ZoneOffset offset =
      Unwrap(ZoneOffset::OfHoursMinutesSeconds(aHours, aMinutes, aSeconds));
  return OffsetDateTime::Of(Date(2007, 12, 3),
                            Unwrap(LocalTime::Of(10, 15, 30)), offset);
}

static std::string FormatOffset(const char* aPattern, int32_t aHours,
                                int32_t aMinutes = 0, int32_t aSeconds = 0) {
  return Unwrap(
      Pattern(aPattern).format(WithOffset(aHours, aMinutes, aSeconds)));
}

TEST(Tempora_DateTimeFormatter, FormatDate)
{
  DateTimeFormatter iso = Pattern("uuuu-MM-dd");
  EXPECT_EQ(iso.getPattern(), "uuuu-MM-dd");
  EXPECT_EQ(Unwrap(iso.format(Date(2007, 12, 3))), "2007-12-03");
  EXPECT_EQ(Unwrap(iso.format(Date(-5, 6, 1))), "-0005-06-01");
  EXPECT_EQ(Unwrap(iso.format(Date(12345, 1, 1))), "+12345-01-01");

  EXPECT_EQ(Unwrap(Pattern("d/M/yy").format(Date(2007, 2, 3))), "3/2/07");
  EXPECT_EQ(Unwrap(Pattern("yyyy").format(Date(-5, 6, 1))), "0006");
  EXPECT_EQ(Unwrap(Pattern("uuuu-DDD").format(Date(2012, 2, 29))),
            "2012-060");
  EXPECT_EQ(Unwrap(Pattern("uuuuMMdd").format(Date(2007, 12, 3))),
            "20071203");

  EXPECT_ERR_KIND(Pattern("uuuu-MM-dd HH").format(Date(2007, 12, 3)),
                  UnsupportedField);
  EXPECT_ERR_KIND(Pattern("uuuu VV").format(Date(2007, 12, 3)),
                  UnsupportedField);
  EXPECT_ERR_KIND(Pattern("uuuu XXX").format(Date(2007, 12, 3)),
                  UnsupportedField);
}

TEST(Tempora_DateTimeFormatter, FormatTime)
{
  LocalTime time = Unwrap(LocalTime::Of(10, 15, 30, 123'456'789));
  EXPECT_EQ(Unwrap(Pattern("HH:mm:ss.SSS").format(time)), "10:15:30.123");
  EXPECT_EQ(Unwrap(Pattern("HH:mm:ss.SSSSSSSSS").format(time)),
            "10:15:30.123456789");
  EXPECT_EQ(Unwrap(Pattern("H:m:s n").format(time)), "10:15:30 123456789");
  EXPECT_EQ(Unwrap(Pattern("A").format(time)), "36930123");
  EXPECT_EQ(Unwrap(Pattern("kk:mm").format(LocalTime::Midnight())), "24:00");
  EXPECT_EQ(Unwrap(Pattern("HH 'o''clock'").format(time)), "10 o'clock");
  EXPECT_EQ(Unwrap(Pattern("HH''mm").format(time)), "10'15");

  EXPECT_ERR_KIND(Pattern("uuuu").format(time), UnsupportedField);
}

TEST(Tempora_DateTimeFormatter, FormatOffset)
{
  EXPECT_EQ(FormatOffset("X", 1), "+01");
  EXPECT_EQ(FormatOffset("X", 5, 30), "+0530");
  EXPECT_EQ(FormatOffset("XX", 1), "+0100");
  EXPECT_EQ(FormatOffset("XXX", -5, -30), "-05:30");
  EXPECT_EQ(FormatOffset("XXXX", 1), "+0100");
  EXPECT_EQ(FormatOffset("XXXX", 5, 30, 45), "+053045");
  EXPECT_EQ(FormatOffset("XXXXX", 5, 30, 45), "+05:30:45");
  EXPECT_EQ(FormatOffset("ZZZZZ", 5, 30, 45), "+05:30:45");
  EXPECT_EQ(FormatOffset("Z", 1), "+0100");

  EXPECT_EQ(FormatOffset("X", 0), "Z");
  EXPECT_EQ(FormatOffset("XXX", 0), "Z");
  EXPECT_EQ(FormatOffset("x", 0), "+00");
  EXPECT_EQ(FormatOffset("xxx", 0), "+00:00");
  EXPECT_EQ(FormatOffset("Z", 0), "+0000");
  EXPECT_EQ(FormatOffset("ZZZZZ", 0), "Z");

  EXPECT_EQ(FormatOffset("uuuu-MM-dd'T'HH:mm:ssXXX VV", 1),
            "2007-12-03T10:15:30+01:00 +01:00");
}

TEST(Tempora_DateTimeFormatter, FormatZoned)
{
  ZoneId paris = Unwrap(ZoneId::Of("Europe/Paris", IcuRegistry()));
  ZonedDateTime dateTime =
      Unwrap(ZonedDateTime::Of(2007, 12, 3, 10, 15, 0, 0, paris));
  EXPECT_EQ(Unwrap(Pattern("uuuu-MM-dd HH:mmxxx VV").format(dateTime)),
            "2007-12-03 10:15+01:00 Europe/Paris");
}

TEST(Tempora_DateTimeFormatter, ParseDate)
{
  DateTimeFormatter iso = Pattern("uuuu-MM-dd");
  EXPECT_EQ(Unwrap(iso.parseLocalDate("2007-12-03")), Date(2007, 12, 3));
  EXPECT_EQ(Unwrap(iso.parseLocalDate("-0005-06-01")), Date(-5, 6, 1));
  EXPECT_EQ(Unwrap(iso.parseLocalDate("+12345-01-01")), Date(12345, 1, 1));

  // More digits than the pad width need a sign, and a sign needs them.
  EXPECT_ERR_KIND(iso.parseLocalDate("12345-01-01"), Parse);
  EXPECT_ERR_KIND(iso.parseLocalDate("+2007-12-03"), Parse);

  EXPECT_EQ(Unwrap(Pattern("d/M/yy").parseLocalDate("3/2/07")),
            Date(2007, 2, 3));
  EXPECT_EQ(Unwrap(Pattern("uuuu-DDD").parseLocalDate("2012-060")),
            Date(2012, 2, 29));
  EXPECT_EQ(Unwrap(Pattern("yyyy-MM-dd").parseLocalDate("2007-12-03")),
            Date(2007, 12, 3));
}

TEST(Tempora_DateTimeFormatter, ParseAdjacentValues)
{
  EXPECT_EQ(Unwrap(Pattern("uuuuMMdd").parseLocalDate("20071203")),
            Date(2007, 12, 3));
  EXPECT_EQ(Unwrap(Pattern("uMMdd").parseLocalDate("71203")),
            Date(7, 12, 3));
  EXPECT_EQ(Unwrap(Pattern("uuuuMMddHHmm").parseLocalDateTime(
                "200712031015")),
            Unwrap(LocalDateTime::Of(2007, 12, 3, 10, 15)));
  EXPECT_EQ(Unwrap(Pattern("HHmmssSSS").parseLocalTime("101530123")),
            Unwrap(LocalTime::Of(10, 15, 30, 123'000'000)));
  EXPECT_ERR_KIND(Pattern("uuuuMMdd").parseLocalDate("2007120"), Parse);
}

TEST(Tempora_DateTimeFormatter, ParseTime)
{
  EXPECT_EQ(Unwrap(Pattern("HH:mm").parseLocalTime("10:15")),
            Unwrap(LocalTime::Of(10, 15)));
  EXPECT_EQ(Unwrap(Pattern("H:m").parseLocalTime("9:5")),
            Unwrap(LocalTime::Of(9, 5)));
  EXPECT_EQ(Unwrap(Pattern("kk:mm").parseLocalTime("24:00")),
            LocalTime::Midnight());
  EXPECT_EQ(Unwrap(Pattern("HH").parseLocalTime("10")),
            Unwrap(LocalTime::Of(10, 0)));
  EXPECT_EQ(Unwrap(Pattern("A").parseLocalTime("36930123")),
            Unwrap(LocalTime::Of(10, 15, 30, 123'000'000)));
  EXPECT_EQ(Unwrap(Pattern("HH:mm:ss.n").parseLocalTime("10:15:30.5")),
            Unwrap(LocalTime::Of(10, 15, 30, 5)));

  EXPECT_ERR_KIND(Pattern("HH:mm").parseLocalTime("24:00"), Parse);
  EXPECT_ERR_KIND(Pattern("HH:mm kk").parseLocalTime("10:15 11"), Parse);
  EXPECT_ERR_KIND(Pattern("mm").parseLocalTime("15"), Parse);
}

TEST(Tempora_DateTimeFormatter, ParseOffset)
{
  DateTimeFormatter formatter = Pattern("uuuu-MM-dd'T'HH:mmX");
  EXPECT_EQ(Unwrap(formatter.parseOffsetDateTime("2007-12-03T10:15+0530"))
                .toString(),
            "2007-12-03T10:15+05:30");
  EXPECT_EQ(Unwrap(formatter.parseOffsetDateTime("2007-12-03T10:15-05"))
                .toString(),
            "2007-12-03T10:15-05:00");
  EXPECT_EQ(Unwrap(formatter.parseOffsetDateTime("2007-12-03T10:15Z"))
                .toString(),
            "2007-12-03T10:15Z");

  DateTimeFormatter colons = Pattern("uuuu-MM-dd'T'HH:mmXXXXX");
  EXPECT_EQ(Unwrap(colons.parseOffsetDateTime("2007-12-03T10:15+05:30:45"))
                .getOffset()
                .getTotalSeconds(),
            19845);
  EXPECT_EQ(Unwrap(colons.parseOffsetDateTime("2007-12-03T10:15+05:30"))
                .getOffset()
                .getTotalSeconds(),
            19800);
  EXPECT_ERR_KIND(colons.parseOffsetDateTime("2007-12-03T10:15+05"), Parse);
  EXPECT_ERR_KIND(colons.parseOffsetDateTime("2007-12-03T10:15+19:00"),
                  Parse);

  EXPECT_EQ(Unwrap(Pattern("uuuu-MM-dd HH:mm Z")
                       .parseOffsetDateTime("2007-12-03 10:15 +0000"))
                .toString(),
            "2007-12-03T10:15Z");

  // No offset in the text.
  EXPECT_ERR_KIND(Pattern("uuuu-MM-dd'T'HH:mm")
                      .parseOffsetDateTime("2007-12-03T10:15"),
                  Parse);
}

TEST(Tempora_DateTimeFormatter, ParseZoned)
{
  DateTimeFormatter zoned = Pattern("uuuu-MM-dd HH:mm VV");
  ZonedDateTime paris = Unwrap(
      zoned.parseZonedDateTime("2007-12-03 10:15 Europe/Paris", IcuRegistry()));
  EXPECT_EQ(paris.toString(), "2007-12-03T10:15+01:00[Europe/Paris]");

  // The offset and the local date-time give the instant.
  DateTimeFormatter both = Pattern("uuuu-MM-dd HH:mmXXX VV");
  ZonedDateTime summer = Unwrap(both.parseZonedDateTime(
      "2007-06-03 10:15+01:00 Europe/Paris", IcuRegistry()));
  EXPECT_EQ(summer.toString(), "2007-06-03T11:15+02:00[Europe/Paris]");

  ZonedDateTime fixed = Unwrap(Pattern("uuuu-MM-dd HH:mmXXX")
                                   .parseZonedDateTime("2007-12-03 10:15Z",
                                                       IcuRegistry()));
  EXPECT_EQ(fixed.getZone().getId(), "Z");

  EXPECT_ERR_KIND(zoned.parseZonedDateTime("2007-12-03 10:15 Mars/Olympus",
                                           IcuRegistry()),
                  Parse);
  EXPECT_ERR_KIND(Pattern("uuuu-MM-dd HH:mm")
                      .parseZonedDateTime("2007-12-03 10:15", IcuRegistry()),
                  Parse);
}

TEST(Tempora_DateTimeFormatter, ParseErrors)
{
  DateTimeFormatter iso = Pattern("uuuu-MM-dd");

  DateTimeResult<LocalDate> trailing = iso.parseLocalDate("2007-12-03x");
  ASSERT_TRUE(trailing.isErr());
  EXPECT_EQ(trailing.inspectErr().errorIndex(), 10);
  EXPECT_EQ(trailing.inspectErr().parsedText(), "2007-12-03x");

  DateTimeResult<LocalDate> literal = iso.parseLocalDate("2007/12/03");
  ASSERT_TRUE(literal.isErr());
  EXPECT_EQ(literal.inspectErr().errorIndex(), 4);

  DateTimeResult<LocalDate> invalid = iso.parseLocalDate("2007-02-30");
  ASSERT_TRUE(invalid.isErr());
  EXPECT_TRUE(invalid.inspectErr().is(DateTimeError::Kind::Parse));
  EXPECT_EQ(invalid.inspectErr().parsedText(), "2007-02-30");

  EXPECT_ERR_KIND(iso.parseLocalDate("2007-13-03"), Parse);
  EXPECT_ERR_KIND(iso.parseLocalDate(""), Parse);
  EXPECT_ERR_KIND(Pattern("uuuu-MM").parseLocalDate("2007-12"), Parse);
  EXPECT_ERR_KIND(Pattern("HH:mm").parseLocalDate("10:15"), Parse);
  EXPECT_ERR_KIND(iso.parseLocalDateTime("2007-12-03"), Parse);

  // Fields which disagree.
  EXPECT_ERR_KIND(Pattern("uuuu-MM-dd DDD").parseLocalDate("2007-12-03 001"),
                  Parse);
  EXPECT_ERR_KIND(Pattern("uuuu-MM-dd uuuu").parseLocalDate("2007-12-03 2008"),
                  Parse);
  EXPECT_EQ(Unwrap(Pattern("uuuu-MM-dd DDD").parseLocalDate("2007-12-03 337")),
            Date(2007, 12, 3));
}

TEST(Tempora_DateTimeFormatter, InvalidPatterns)
{
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("EEE"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("MMM"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("hh:mm a"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("ZZZZ"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("VVV"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("XXXXXX"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("ddd"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("SSSSSSSSSS"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("uuuu[-MM]"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("uuuu 'abc"), InvalidValue);
  EXPECT_ERR_KIND(DateTimeFormatter::OfPattern("b"), InvalidValue);

  DateTimeResult<DateTimeFormatter> unknown =
      DateTimeFormatter::OfPattern("uuuu-qq");
  ASSERT_TRUE(unknown.isErr());
  EXPECT_EQ(unknown.inspectErr().message(),
            "Invalid pattern 'uuuu-qq': unknown pattern letter: q");
}

}  // namespace tempora::test
