/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/*
 * Pattern based printing and parsing of the date-time values.
 *
 * Only the numeric pattern letters are supported:
 *
 *   u   year                 y   year-of-era
 *   M   month-of-year        d   day-of-month
 *   D   day-of-year          H   hour-of-day (0-23)
 *   k   clock-hour-of-day    m   minute-of-hour
 *   s   second-of-minute     S   fraction-of-second
 *   n   nano-of-second       N   nano-of-day
 *   A   milli-of-day         VV  zone id
 *   X   offset, Z for zero   x   offset
 *   Z   offset +HHMM, or +HH:MM:ss with five letters
 *
 * Text within single quotes is literal, two single quotes print one. Any
 * other character which isn't an ASCII letter is literal, too. Letters which
 * need locale dependent text (month and day names, AM/PM markers, eras and
 * zone names) are rejected.
 *
 * A variable width number directly followed by fixed width numbers leaves
 * their digits to them when parsing, so "uuuuMMdd" reads "20071203".
 */

#ifndef tempora_DateTimeFormatter_h
#define tempora_DateTimeFormatter_h

#include <stdint.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/TemporalFields.h"

namespace tempora {

class LocalDate;
class LocalDateTime;
class LocalTime;
class OffsetDateTime;
class ZonedDateTime;

namespace zone {
class ZoneRulesRegistry;
}  // namespace zone

class DateTimeFormatter final {
 public:
  enum class PartKind : uint8_t {
    Literal,
    Number,
    // Two digit year, 2000 to 2099.
    ReducedYear,
    Fraction,
    Offset,
    ZoneId,
  };

  struct Part final {
    PartKind kind = PartKind::Literal;
    ChronoField field = ChronoField::Year;
    uint8_t minWidth = 0;
    uint8_t maxWidth = 0;
    // Numbers: a '+' is printed when the value has more than `minWidth`
    // digits, and accepted when parsing.
    bool exceedsPad = false;
    // Offsets: index into the offset patterns, from "+HH" to "+HH:MM:SS".
    uint8_t offsetType = 0;
    // Literal text, or the text printed for a zero offset.
    std::string text;

    bool isFixedWidthNumber() const;
  };

  class Parsed;

 private:
  std::string pattern_;
  std::vector<Part> parts_;

  DateTimeFormatter(std::string_view pattern, std::vector<Part>&& parts)
      : pattern_(pattern), parts_(std::move(parts)) {}

  DateTimeResult<Parsed> parseFields(std::string_view text) const;

 public:
  /**
   * Compiles `pattern`, failing with an InvalidValue error for unknown or
   * unsupported letters, bad letter counts and unterminated quotes.
   */
  static DateTimeResult<DateTimeFormatter> OfPattern(std::string_view pattern);

  const std::string& getPattern() const { return pattern_; }

  /**
   * Prints the value. Fails with an UnsupportedField error if the pattern
   * needs a field the value doesn't have, such as an hour for a date.
   */
  DateTimeResult<std::string> format(const LocalDate& date) const;
  DateTimeResult<std::string> format(const LocalTime& time) const;
  DateTimeResult<std::string> format(const LocalDateTime& dateTime) const;
  DateTimeResult<std::string> format(const OffsetDateTime& dateTime) const;
  DateTimeResult<std::string> format(const ZonedDateTime& dateTime) const;

  /**
   * Parses the whole of `text` and resolves the parsed fields into a value.
   * Fields not needed by the value are still validated and cross-checked.
   */
  DateTimeResult<LocalDate> parseLocalDate(std::string_view text) const;
  DateTimeResult<LocalTime> parseLocalTime(std::string_view text) const;
  DateTimeResult<LocalDateTime> parseLocalDateTime(
      std::string_view text) const;
  DateTimeResult<OffsetDateTime> parseOffsetDateTime(
      std::string_view text) const;

  /**
   * Needs a zone id or an offset. With both, the local date-time and the
   * offset give the instant, which is then seen in the zone.
   */
  DateTimeResult<ZonedDateTime> parseZonedDateTime(
      std::string_view text, const zone::ZoneRulesRegistry& registry) const;

  std::string toString() const { return pattern_; }
};

}  // namespace tempora

#endif /* tempora_DateTimeFormatter_h */
