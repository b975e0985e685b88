/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/DateTimeFormatter.h"

#include <inttypes.h>
#include <stdlib.h>

#include <optional>
#include <utility>

#include "tempora/LocalDate.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/Printf.h"
#include "tempora/TextUtils.h"
#include "tempora/ZoneId.h"
#include "tempora/ZoneOffset.h"
#include "tempora/ZonedDateTime.h"

using namespace tempora;

using Part = DateTimeFormatter::Part;
using PartKind = DateTimeFormatter::PartKind;

static constexpr size_t FieldCount = size_t(ChronoField::OffsetSeconds) + 1;

static constexpr int64_t NanosPerMilli = 1'000'000;

class DateTimeFormatter::Parsed final {
  std::optional<int64_t> fields_[FieldCount];

 public:
  std::optional<std::string> zoneId;

  std::optional<int64_t> get(ChronoField field) const {
    return fields_[size_t(field)];
  }

  DateTimeResult<Ok> set(ChronoField field, int64_t value) {
    std::optional<int64_t>& slot = fields_[size_t(field)];
    if (slot && *slot != value) {
      return Err(DateTimeError::InvalidValue(
          Smprintf("Conflict found: %s %" PRId64 " differs from %s %" PRId64,
                   FieldName(field), *slot, FieldName(field), value)));
    }
    slot = value;
    return Ok();
  }
};

bool DateTimeFormatter::Part::isFixedWidthNumber() const {
  switch (kind) {
    case PartKind::Number:
      return minWidth == maxWidth && !exceedsPad;
    case PartKind::ReducedYear:
    case PartKind::Fraction:
      return true;
    case PartKind::Literal:
    case PartKind::Offset:
    case PartKind::ZoneId:
      return false;
  }
  TEMPORA_CRASH("invalid part kind");
}

/****************************************************************************
 * Pattern compilation
 ****************************************************************************/

static DateTimeError PatternError(std::string_view pattern,
                                  const std::string& reason) {
  return DateTimeError::InvalidValue(
      Smprintf("Invalid pattern '%.*s': %s", int(pattern.size()),
               pattern.data(), reason.c_str()));
}

static void AppendLiteral(std::vector<Part>& parts, std::string_view text) {
  if (!parts.empty() && parts.back().kind == PartKind::Literal) {
    parts.back().text += text;
    return;
  }
  Part part;
  part.kind = PartKind::Literal;
  part.text = std::string(text);
  parts.push_back(std::move(part));
}

static void AppendNumber(std::vector<Part>& parts, ChronoField field,
                         int32_t minWidth, int32_t maxWidth,
                         bool exceedsPad = false) {
  Part part;
  part.kind = PartKind::Number;
  part.field = field;
  part.minWidth = uint8_t(minWidth);
  part.maxWidth = uint8_t(maxWidth);
  part.exceedsPad = exceedsPad;
  parts.push_back(std::move(part));
}

static void AppendOffset(std::vector<Part>& parts, uint8_t offsetType,
                         const char* noOffsetText) {
  Part part;
  part.kind = PartKind::Offset;
  part.field = ChronoField::OffsetSeconds;
  part.offsetType = offsetType;
  part.text = noOffsetText;
  parts.push_back(std::move(part));
}

static DateTimeResult<Ok> AppendLetter(std::string_view pattern, char letter,
                                       int32_t count,
                                       std::vector<Part>& parts) {
  auto tooMany = [&]() {
    return PatternError(pattern,
                        Smprintf("too many pattern letters: %c", letter));
  };

  switch (letter) {
    case 'u':
    case 'y': {
      ChronoField field =
          letter == 'u' ? ChronoField::Year : ChronoField::YearOfEra;
      if (count == 2) {
        Part part;
        part.kind = PartKind::ReducedYear;
        part.field = field;
        part.minWidth = 2;
        part.maxWidth = 2;
        parts.push_back(std::move(part));
      } else if (count < 4) {
        AppendNumber(parts, field, count, 10);
      } else if (count <= 10) {
        AppendNumber(parts, field, count, 10, /* exceedsPad = */ true);
      } else {
        return Err(tooMany());
      }
      return Ok();
    }
    case 'M':
      if (count > 2) {
        return Err(PatternError(
            pattern, "month names need locale dependent text"));
      }
      AppendNumber(parts, ChronoField::MonthOfYear, count, 2);
      return Ok();
    case 'd':
    case 'H':
    case 'k':
    case 'm':
    case 's': {
      if (count > 2) {
        return Err(tooMany());
      }
      ChronoField field = letter == 'd'   ? ChronoField::DayOfMonth
                          : letter == 'H' ? ChronoField::HourOfDay
                          : letter == 'k' ? ChronoField::ClockHourOfDay
                          : letter == 'm' ? ChronoField::MinuteOfHour
                                          : ChronoField::SecondOfMinute;
      AppendNumber(parts, field, count, 2);
      return Ok();
    }
    case 'D':
      if (count > 3) {
        return Err(tooMany());
      }
      AppendNumber(parts, ChronoField::DayOfYear, count, 3);
      return Ok();
    case 'S': {
      if (count > 9) {
        return Err(tooMany());
      }
      Part part;
      part.kind = PartKind::Fraction;
      part.field = ChronoField::NanoOfSecond;
      part.minWidth = uint8_t(count);
      part.maxWidth = uint8_t(count);
      parts.push_back(std::move(part));
      return Ok();
    }
    case 'n':
      if (count > 9) {
        return Err(tooMany());
      }
      AppendNumber(parts, ChronoField::NanoOfSecond, count, 9);
      return Ok();
    case 'N':
    case 'A':
      if (count > 18) {
        return Err(tooMany());
      }
      AppendNumber(parts,
                   letter == 'N' ? ChronoField::NanoOfDay
                                 : ChronoField::MilliOfDay,
                   count, 18);
      return Ok();
    case 'V': {
      if (count != 2) {
        return Err(PatternError(pattern, "pattern letter count must be 2: V"));
      }
      Part part;
      part.kind = PartKind::ZoneId;
      parts.push_back(std::move(part));
      return Ok();
    }
    case 'X':
    case 'x': {
      if (count > 5) {
        return Err(tooMany());
      }
      static constexpr uint8_t types[] = {1, 3, 4, 5, 6};
      static constexpr const char* zeros[] = {"+00", "+0000", "+00:00",
                                              "+0000", "+00:00"};
      AppendOffset(parts, types[count - 1],
                   letter == 'X' ? "Z" : zeros[count - 1]);
      return Ok();
    }
    case 'Z':
      if (count <= 3) {
        AppendOffset(parts, 3, "+0000");
      } else if (count == 5) {
        AppendOffset(parts, 6, "Z");
      } else if (count == 4) {
        return Err(PatternError(
            pattern, "localized offsets need locale dependent text"));
      } else {
        return Err(tooMany());
      }
      return Ok();
    case 'G':
    case 'E':
    case 'e':
    case 'c':
    case 'L':
    case 'a':
    case 'z':
    case 'O':
    case 'v':
      return Err(PatternError(
          pattern, Smprintf("pattern letter '%c' needs locale dependent text",
                            letter)));
    case 'h':
    case 'K':
      return Err(PatternError(
          pattern,
          Smprintf("pattern letter '%c' needs an AM/PM marker", letter)));
    default:
      return Err(PatternError(
          pattern, Smprintf("unknown pattern letter: %c", letter)));
  }
}

DateTimeResult<DateTimeFormatter> DateTimeFormatter::OfPattern(
    std::string_view pattern) {
  std::vector<Part> parts;
  size_t i = 0;
  while (i < pattern.length()) {
    char ch = pattern[i];

    if (IsAsciiAlpha(ch)) {
      size_t start = i;
      while (i < pattern.length() && pattern[i] == ch) {
        i++;
      }
      TEMPORA_TRY(AppendLetter(pattern, ch, int32_t(i - start), parts));
      continue;
    }

    if (ch == '\'') {
      i++;
      std::string literal;
      bool closed = false;
      while (i < pattern.length()) {
        if (pattern[i] == '\'') {
          if (i + 1 < pattern.length() && pattern[i + 1] == '\'') {
            literal += '\'';
            i += 2;
            continue;
          }
          closed = true;
          i++;
          break;
        }
        literal += pattern[i++];
      }
      if (!closed) {
        return Err(PatternError(pattern, "unterminated quote"));
      }
      // Two quotes in a row.
      if (literal.empty()) {
        literal = "'";
      }
      AppendLiteral(parts, literal);
      continue;
    }

    if (ch == '[' || ch == ']' || ch == '{' || ch == '}' || ch == '#') {
      return Err(PatternError(
          pattern, Smprintf("pattern uses a reserved character: %c", ch)));
    }

    AppendLiteral(parts, pattern.substr(i, 1));
    i++;
  }
  return DateTimeFormatter(pattern, std::move(parts));
}

/****************************************************************************
 * Printing
 ****************************************************************************/

namespace {

struct PrintSource final {
  const LocalDate* date = nullptr;
  const LocalTime* time = nullptr;
  const ZoneOffset* offset = nullptr;
  const ZoneId* zone = nullptr;
};

}  // namespace

static DateTimeResult<int64_t> GetField(const PrintSource& source,
                                        ChronoField field) {
  if (IsDateBased(field) && source.date) {
    return source.date->getLong(field);
  }
  if (IsTimeBased(field) && source.time) {
    return source.time->getLong(field);
  }
  if (field == ChronoField::OffsetSeconds && source.offset) {
    return int64_t(source.offset->getTotalSeconds());
  }
  return Err(UnsupportedFieldError(field));
}

static DateTimeResult<Ok> PrintNumber(std::string& result, const Part& part,
                                      int64_t value) {
  uint64_t magnitude = value < 0 ? uint64_t(0) - uint64_t(value)
                                 : uint64_t(value);
  std::string digits = std::to_string(magnitude);
  if (digits.length() > part.maxWidth) {
    return Err(DateTimeError::InvalidValue(Smprintf(
        "Field %s cannot be printed as the value %" PRId64
        " exceeds the maximum print width of %d",
        FieldName(part.field), value, int(part.maxWidth))));
  }
  if (value < 0) {
    result += '-';
  } else if (part.exceedsPad && digits.length() > part.minWidth) {
    result += '+';
  }
  if (digits.length() < part.minWidth) {
    result.append(part.minWidth - digits.length(), '0');
  }
  result += digits;
  return Ok();
}

static void PrintOffset(std::string& result, const Part& part,
                        int32_t totalSeconds) {
  if (totalSeconds == 0) {
    result += part.text;
    return;
  }
  int32_t absSeconds = abs(totalSeconds);
  int32_t hours = absSeconds / 3600;
  int32_t minutes = (absSeconds / 60) % 60;
  int32_t seconds = absSeconds % 60;
  const char* colon = part.offsetType % 2 == 0 ? ":" : "";

  result += Smprintf("%c%02d", totalSeconds < 0 ? '-' : '+', hours);
  if (part.offsetType >= 3 || (part.offsetType >= 1 && minutes > 0)) {
    result += Smprintf("%s%02d", colon, minutes);
    if (part.offsetType >= 7 || (part.offsetType >= 5 && seconds > 0)) {
      result += Smprintf("%s%02d", colon, seconds);
    }
  }
}

static DateTimeResult<std::string> Print(const std::vector<Part>& parts,
                                         const PrintSource& source) {
  std::string result;
  for (const Part& part : parts) {
    switch (part.kind) {
      case PartKind::Literal:
        result += part.text;
        break;
      case PartKind::Number: {
        int64_t value = TEMPORA_TRY(GetField(source, part.field));
        TEMPORA_TRY(PrintNumber(result, part, value));
        break;
      }
      case PartKind::ReducedYear: {
        int64_t value = TEMPORA_TRY(GetField(source, part.field));
        result += Smprintf("%02d", int(llabs(value) % 100));
        break;
      }
      case PartKind::Fraction: {
        int64_t nano =
            TEMPORA_TRY(GetField(source, ChronoField::NanoOfSecond));
        result += Smprintf("%09d", int(nano)).substr(0, part.minWidth);
        break;
      }
      case PartKind::Offset: {
        int64_t seconds =
            TEMPORA_TRY(GetField(source, ChronoField::OffsetSeconds));
        PrintOffset(result, part, int32_t(seconds));
        break;
      }
      case PartKind::ZoneId:
        if (!source.zone) {
          return Err(DateTimeError::UnsupportedField(
              "Unable to extract a zone id"));
        }
        result += source.zone->getId();
        break;
    }
  }
  return result;
}

DateTimeResult<std::string> DateTimeFormatter::format(
    const LocalDate& date) const {
  PrintSource source;
  source.date = &date;
  return Print(parts_, source);
}

DateTimeResult<std::string> DateTimeFormatter::format(
    const LocalTime& time) const {
  PrintSource source;
  source.time = &time;
  return Print(parts_, source);
}

DateTimeResult<std::string> DateTimeFormatter::format(
    const LocalDateTime& dateTime) const {
  PrintSource source;
  source.date = &dateTime.toLocalDate();
  source.time = &dateTime.toLocalTime();
  return Print(parts_, source);
}

DateTimeResult<std::string> DateTimeFormatter::format(
    const OffsetDateTime& dateTime) const {
  ZoneId zone = ZoneId::Of(dateTime.getOffset());
  PrintSource source;
  source.date = &dateTime.toLocalDate();
  source.time = &dateTime.toLocalTime();
  source.offset = &dateTime.getOffset();
  source.zone = &zone;
  return Print(parts_, source);
}

DateTimeResult<std::string> DateTimeFormatter::format(
    const ZonedDateTime& dateTime) const {
  PrintSource source;
  source.date = &dateTime.toLocalDate();
  source.time = &dateTime.toLocalTime();
  source.offset = &dateTime.getOffset();
  source.zone = &dateTime.getZone();
  return Print(parts_, source);
}

/****************************************************************************
 * Parsing
 ****************************************************************************/

static size_t CountDigits(std::string_view text, size_t pos) {
  size_t end = pos;
  while (end < text.length() && IsAsciiDigit(text[end])) {
    end++;
  }
  return end - pos;
}

static int64_t ReadDigits(std::string_view text, size_t pos, size_t count) {
  int64_t value = 0;
  for (size_t i = 0; i < count; i++) {
    value = value * 10 + AsciiDigitToNumber(text[pos + i]);
  }
  return value;
}

// `reserved` digits are left for the fixed width numbers which follow.
static DateTimeResult<int64_t> ParseNumber(std::string_view text, size_t* pos,
                                           const Part& part, size_t reserved) {
  size_t start = *pos;
  bool signAllowed = part.field == ChronoField::Year ||
                     part.field == ChronoField::YearOfEra;
  bool negative = false;
  bool positive = false;
  if (signAllowed && start < text.length()) {
    if (text[start] == '-') {
      negative = true;
    } else if (text[start] == '+' && part.exceedsPad) {
      positive = true;
    }
  }

  size_t digitsStart = start + (negative || positive ? 1 : 0);
  size_t available = CountDigits(text, digitsStart);
  size_t count = available > reserved ? available - reserved : 0;
  if (count > part.maxWidth) {
    count = part.maxWidth;
  }
  if (count < part.minWidth) {
    return Err(DateTimeError::ParseAt(text, int32_t(digitsStart)));
  }
  // A '+' only goes with more digits than the pad width, and more digits
  // need the '+'.
  if (part.exceedsPad && !negative && positive != (count > part.minWidth)) {
    return Err(DateTimeError::ParseAt(text, int32_t(start)));
  }

  int64_t value = ReadDigits(text, digitsStart, count);
  *pos = digitsStart + count;
  return negative ? -value : value;
}

static bool ParseOffsetComponent(std::string_view text, size_t* pos,
                                 bool colon, int32_t* value) {
  size_t index = *pos;
  if (colon) {
    if (index >= text.length() || text[index] != ':') {
      return false;
    }
    index++;
  }
  if (CountDigits(text, index) < 2) {
    return false;
  }
  *value = int32_t(ReadDigits(text, index, 2));
  *pos = index + 2;
  return true;
}

static DateTimeResult<int64_t> ParseOffset(std::string_view text, size_t* pos,
                                           const Part& part) {
  size_t start = *pos;
  if (start < text.length() && (text[start] == '+' || text[start] == '-')) {
    int32_t sign = text[start] == '-' ? -1 : 1;
    size_t index = start + 1;
    if (CountDigits(text, index) < 2) {
      return Err(DateTimeError::ParseAt(text, int32_t(start)));
    }
    int32_t hours = int32_t(ReadDigits(text, index, 2));
    int32_t minutes = 0;
    int32_t seconds = 0;
    index += 2;

    uint8_t type = part.offsetType;
    bool colon = type % 2 == 0;
    if (type >= 1) {
      if (ParseOffsetComponent(text, &index, colon, &minutes)) {
        if (type >= 5 &&
            !ParseOffsetComponent(text, &index, colon, &seconds) &&
            type >= 7) {
          return Err(DateTimeError::ParseAt(text, int32_t(start)));
        }
      } else if (type >= 3) {
        return Err(DateTimeError::ParseAt(text, int32_t(start)));
      }
    }

    DateTimeResult<ZoneOffset> offset = ZoneOffset::OfHoursMinutesSeconds(
        sign * hours, sign * minutes, sign * seconds);
    if (offset.isErr()) {
      return Err(DateTimeError::ParseWithCause(text, offset.inspectErr()));
    }
    *pos = index;
    return int64_t(offset.inspect().getTotalSeconds());
  }

  if (text.substr(start, part.text.length()) == part.text) {
    *pos = start + part.text.length();
    return 0;
  }
  return Err(DateTimeError::ParseAt(text, int32_t(start)));
}

static bool IsZoneIdChar(char ch) {
  return IsAsciiAlphanumeric(ch) || ch == '/' || ch == '_' || ch == '+' ||
         ch == '-' || ch == ':' || ch == '.' || ch == '~';
}

DateTimeResult<DateTimeFormatter::Parsed> DateTimeFormatter::parseFields(
    std::string_view text) const {
  Parsed parsed;
  size_t pos = 0;

  auto set = [&](ChronoField field, int64_t value) -> DateTimeResult<Ok> {
    DateTimeResult<Ok> result = parsed.set(field, value);
    if (result.isErr()) {
      return Err(DateTimeError::ParseWithCause(text, result.inspectErr()));
    }
    return Ok();
  };

  for (size_t i = 0; i < parts_.size(); i++) {
    const Part& part = parts_[i];
    switch (part.kind) {
      case PartKind::Literal:
        if (text.substr(pos, part.text.length()) != part.text) {
          return Err(DateTimeError::ParseAt(text, int32_t(pos)));
        }
        pos += part.text.length();
        break;

      case PartKind::Number: {
        size_t reserved = 0;
        if (!part.isFixedWidthNumber()) {
          for (size_t j = i + 1;
               j < parts_.size() && parts_[j].isFixedWidthNumber(); j++) {
            reserved += parts_[j].maxWidth;
          }
        }
        int64_t value = TEMPORA_TRY(ParseNumber(text, &pos, part, reserved));
        TEMPORA_TRY(set(part.field, value));
        break;
      }

      case PartKind::ReducedYear: {
        if (CountDigits(text, pos) < 2) {
          return Err(DateTimeError::ParseAt(text, int32_t(pos)));
        }
        int64_t value = 2000 + ReadDigits(text, pos, 2);
        pos += 2;
        TEMPORA_TRY(set(part.field, value));
        break;
      }

      case PartKind::Fraction: {
        if (CountDigits(text, pos) < part.minWidth) {
          return Err(DateTimeError::ParseAt(text, int32_t(pos)));
        }
        int64_t value = ReadDigits(text, pos, part.minWidth);
        for (int32_t k = part.minWidth; k < 9; k++) {
          value *= 10;
        }
        pos += part.minWidth;
        TEMPORA_TRY(set(ChronoField::NanoOfSecond, value));
        break;
      }

      case PartKind::Offset: {
        int64_t seconds = TEMPORA_TRY(ParseOffset(text, &pos, part));
        TEMPORA_TRY(set(ChronoField::OffsetSeconds, seconds));
        break;
      }

      case PartKind::ZoneId: {
        size_t start = pos;
        while (pos < text.length() && IsZoneIdChar(text[pos])) {
          pos++;
        }
        if (pos == start) {
          return Err(DateTimeError::ParseAt(text, int32_t(start)));
        }
        parsed.zoneId = std::string(text.substr(start, pos - start));
        break;
      }
    }
  }

  if (pos != text.length()) {
    return Err(DateTimeError::ParseAt(text, int32_t(pos)));
  }
  return parsed;
}

/****************************************************************************
 * Resolving
 ****************************************************************************/

namespace {

struct Resolved final {
  std::optional<LocalDate> date;
  std::optional<LocalTime> time;
  std::optional<ZoneOffset> offset;
};

}  // namespace

static DateTimeError ConflictError(ChronoField field, int64_t value,
                                   const std::string& resolved) {
  return DateTimeError::InvalidValue(
      Smprintf("Conflict found: %s %" PRId64 " differs from %s",
               FieldName(field), value, resolved.c_str()));
}

static DateTimeResult<std::optional<LocalDate>> ResolveDate(
    const DateTimeFormatter::Parsed& parsed) {
  std::optional<int64_t> year = parsed.get(ChronoField::Year);
  if (std::optional<int64_t> yearOfEra = parsed.get(ChronoField::YearOfEra)) {
    TEMPORA_TRY(CheckValidValue(ChronoField::YearOfEra, *yearOfEra));
    if (year) {
      int64_t expected = *year >= 1 ? *year : 1 - *year;
      if (expected != *yearOfEra) {
        return Err(ConflictError(ChronoField::YearOfEra, *yearOfEra,
                                 Smprintf("Year %" PRId64, *year)));
      }
    } else {
      // Without an era the year-of-era is in the current era.
      year = yearOfEra;
    }
  }
  if (!year) {
    return std::optional<LocalDate>();
  }
  int32_t validYear =
      TEMPORA_TRY(CheckValidIntValue(ChronoField::Year, *year));

  std::optional<int64_t> month = parsed.get(ChronoField::MonthOfYear);
  std::optional<int64_t> day = parsed.get(ChronoField::DayOfMonth);
  std::optional<int64_t> dayOfYear = parsed.get(ChronoField::DayOfYear);

  std::optional<LocalDate> date;
  if (month && day) {
    int32_t validMonth =
        TEMPORA_TRY(CheckValidIntValue(ChronoField::MonthOfYear, *month));
    int32_t validDay =
        TEMPORA_TRY(CheckValidIntValue(ChronoField::DayOfMonth, *day));
    date = TEMPORA_TRY(LocalDate::Of(validYear, validMonth, validDay));
  }
  if (dayOfYear) {
    int32_t validDayOfYear =
        TEMPORA_TRY(CheckValidIntValue(ChronoField::DayOfYear, *dayOfYear));
    if (date) {
      if (date->getDayOfYear() != validDayOfYear) {
        return Err(ConflictError(ChronoField::DayOfYear, *dayOfYear,
                                 date->toString()));
      }
    } else {
      date = TEMPORA_TRY(LocalDate::OfYearDay(validYear, validDayOfYear));
    }
  }
  return date;
}

static DateTimeResult<std::optional<LocalTime>> ResolveTime(
    const DateTimeFormatter::Parsed& parsed) {
  std::optional<int64_t> hour = parsed.get(ChronoField::HourOfDay);
  if (std::optional<int64_t> clockHour =
          parsed.get(ChronoField::ClockHourOfDay)) {
    TEMPORA_TRY(CheckValidValue(ChronoField::ClockHourOfDay, *clockHour));
    int64_t value = *clockHour == 24 ? 0 : *clockHour;
    if (hour && *hour != value) {
      return Err(ConflictError(ChronoField::ClockHourOfDay, *clockHour,
                               Smprintf("HourOfDay %" PRId64, *hour)));
    }
    hour = value;
  }

  std::optional<LocalTime> time;
  if (hour) {
    int32_t validHour =
        TEMPORA_TRY(CheckValidIntValue(ChronoField::HourOfDay, *hour));
    int32_t minute = TEMPORA_TRY(CheckValidIntValue(
        ChronoField::MinuteOfHour,
        parsed.get(ChronoField::MinuteOfHour).value_or(0)));
    int32_t second = TEMPORA_TRY(CheckValidIntValue(
        ChronoField::SecondOfMinute,
        parsed.get(ChronoField::SecondOfMinute).value_or(0)));
    int32_t nano = TEMPORA_TRY(CheckValidIntValue(
        ChronoField::NanoOfSecond,
        parsed.get(ChronoField::NanoOfSecond).value_or(0)));
    time = TEMPORA_TRY(LocalTime::Of(validHour, minute, second, nano));
  }

  if (std::optional<int64_t> nanoOfDay = parsed.get(ChronoField::NanoOfDay)) {
    LocalTime fromNanos = TEMPORA_TRY(LocalTime::OfNanoOfDay(*nanoOfDay));
    if (time && *time != fromNanos) {
      return Err(
          ConflictError(ChronoField::NanoOfDay, *nanoOfDay, time->toString()));
    }
    time = fromNanos;
  }

  if (std::optional<int64_t> milliOfDay =
          parsed.get(ChronoField::MilliOfDay)) {
    TEMPORA_TRY(CheckValidValue(ChronoField::MilliOfDay, *milliOfDay));
    if (time) {
      if (time->toNanoOfDay() / NanosPerMilli != *milliOfDay) {
        return Err(ConflictError(ChronoField::MilliOfDay, *milliOfDay,
                                 time->toString()));
      }
    } else {
      time = TEMPORA_TRY(LocalTime::OfNanoOfDay(*milliOfDay * NanosPerMilli));
    }
  }
  return time;
}

static DateTimeResult<Resolved> ResolveFields(
    const DateTimeFormatter::Parsed& parsed) {
  Resolved resolved;
  resolved.date = TEMPORA_TRY(ResolveDate(parsed));
  resolved.time = TEMPORA_TRY(ResolveTime(parsed));
  if (std::optional<int64_t> seconds = parsed.get(ChronoField::OffsetSeconds)) {
    resolved.offset = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(*seconds));
  }
  return resolved;
}

// Wraps a failure into a parse error of the whole text.
template <typename T>
static DateTimeResult<T> WrapError(std::string_view text,
                                   DateTimeResult<T>&& result) {
  if (result.isErr()) {
    return Err(DateTimeError::ParseWithCause(text, result.inspectErr()));
  }
  return result.unwrap();
}

static DateTimeError Unobtainable(std::string_view text, const char* what) {
  return DateTimeError::ParseWithCause(
      text, DateTimeError::InvalidValue(Smprintf(
                "Unable to obtain %s from the parsed fields", what)));
}

DateTimeResult<LocalDate> DateTimeFormatter::parseLocalDate(
    std::string_view text) const {
  Parsed parsed = TEMPORA_TRY(parseFields(text));
  Resolved resolved = TEMPORA_TRY(WrapError(text, ResolveFields(parsed)));
  if (!resolved.date) {
    return Err(Unobtainable(text, "LocalDate"));
  }
  return *resolved.date;
}

DateTimeResult<LocalTime> DateTimeFormatter::parseLocalTime(
    std::string_view text) const {
  Parsed parsed = TEMPORA_TRY(parseFields(text));
  Resolved resolved = TEMPORA_TRY(WrapError(text, ResolveFields(parsed)));
  if (!resolved.time) {
    return Err(Unobtainable(text, "LocalTime"));
  }
  return *resolved.time;
}

DateTimeResult<LocalDateTime> DateTimeFormatter::parseLocalDateTime(
    std::string_view text) const {
  Parsed parsed = TEMPORA_TRY(parseFields(text));
  Resolved resolved = TEMPORA_TRY(WrapError(text, ResolveFields(parsed)));
  if (!resolved.date || !resolved.time) {
    return Err(Unobtainable(text, "LocalDateTime"));
  }
  return LocalDateTime(*resolved.date, *resolved.time);
}

DateTimeResult<OffsetDateTime> DateTimeFormatter::parseOffsetDateTime(
    std::string_view text) const {
  Parsed parsed = TEMPORA_TRY(parseFields(text));
  Resolved resolved = TEMPORA_TRY(WrapError(text, ResolveFields(parsed)));
  if (!resolved.date || !resolved.time || !resolved.offset) {
    return Err(Unobtainable(text, "OffsetDateTime"));
  }
  return OffsetDateTime::Of(*resolved.date, *resolved.time, *resolved.offset);
}

DateTimeResult<ZonedDateTime> DateTimeFormatter::parseZonedDateTime(
    std::string_view text, const zone::ZoneRulesRegistry& registry) const {
  Parsed parsed = TEMPORA_TRY(parseFields(text));
  Resolved resolved = TEMPORA_TRY(WrapError(text, ResolveFields(parsed)));
  if (!resolved.date || !resolved.time ||
      (!parsed.zoneId && !resolved.offset)) {
    return Err(Unobtainable(text, "ZonedDateTime"));
  }

  LocalDateTime dateTime(*resolved.date, *resolved.time);
  if (!parsed.zoneId) {
    return ZonedDateTime::OfFixed(dateTime, *resolved.offset);
  }

  ZoneId zone =
      TEMPORA_TRY(WrapError(text, ZoneId::Of(*parsed.zoneId, registry)));
  if (resolved.offset) {
    return WrapError(
        text, ZonedDateTime::OfInstant(dateTime, *resolved.offset, zone));
  }
  return WrapError(text, ZonedDateTime::Of(dateTime, zone));
}
