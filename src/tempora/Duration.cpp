/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Duration.h"

#include <limits>
#include <optional>

#include "tempora/CheckedArithmetic.h"
#include "tempora/Instant.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/TextUtils.h"
#include "tempora/ZoneOffset.h"

using namespace tempora;

using Int128 = __int128;

static constexpr int64_t SecondsPerDay = 86400;
static constexpr int64_t SecondsPerHour = 3600;
static constexpr int64_t SecondsPerMinute = 60;

DateTimeResult<Duration> Duration::OfDays(int64_t days) {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(days, SecondsPerDay));
  return Duration(seconds, 0);
}

DateTimeResult<Duration> Duration::OfHours(int64_t hours) {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(hours, SecondsPerHour));
  return Duration(seconds, 0);
}

DateTimeResult<Duration> Duration::OfMinutes(int64_t minutes) {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(minutes, SecondsPerMinute));
  return Duration(seconds, 0);
}

DateTimeResult<Duration> Duration::OfSeconds(int64_t seconds,
                                             int64_t nanoAdjustment) {
  int64_t secs = TEMPORA_TRY(
      AddExact(seconds, FloorDiv(nanoAdjustment, NanosPerSecond)));
  int32_t nanos = int32_t(FloorMod(nanoAdjustment, NanosPerSecond));
  return Duration(secs, nanos);
}

Duration Duration::OfMillis(int64_t millis) {
  int64_t secs = FloorDiv<int64_t>(millis, 1000);
  int32_t mos = int32_t(FloorMod<int64_t>(millis, 1000));
  return Duration(secs, mos * 1'000'000);
}

Duration Duration::OfNanos(int64_t nanos) {
  return Duration(FloorDiv(nanos, NanosPerSecond),
                  int32_t(FloorMod(nanos, NanosPerSecond)));
}

DateTimeResult<Duration> Duration::Of(int64_t amount, ChronoUnit unit) {
  return Zero().plus(amount, unit);
}

DateTimeResult<Duration> Duration::Between(const Instant& start,
                                           const Instant& end) {
  int64_t secs =
      TEMPORA_TRY(SubtractExact(end.getEpochSecond(), start.getEpochSecond()));
  int64_t nanos = int64_t(end.getNano()) - int64_t(start.getNano());
  return OfSeconds(secs, nanos);
}

Duration Duration::Between(const LocalTime& start, const LocalTime& end) {
  return OfNanos(end.toNanoOfDay() - start.toNanoOfDay());
}

DateTimeResult<Duration> Duration::Between(const LocalDateTime& start,
                                           const LocalDateTime& end) {
  int64_t secs = TEMPORA_TRY(SubtractExact(end.toEpochSecond(ZoneOffset::UTC()),
                                           start.toEpochSecond(ZoneOffset::UTC())));
  int64_t nanos = int64_t(end.getNano()) - int64_t(start.getNano());
  return OfSeconds(secs, nanos);
}

DateTimeResult<int64_t> Duration::get(ChronoUnit unit) const {
  if (unit == ChronoUnit::Seconds) {
    return seconds_;
  }
  if (unit == ChronoUnit::Nanos) {
    return int64_t(nanos_);
  }
  return Err(UnsupportedUnitError(unit));
}

DateTimeResult<Duration> Duration::withNanos(int32_t nanoOfSecond) const {
  TEMPORA_TRY(CheckValidIntValue(ChronoField::NanoOfSecond, nanoOfSecond));
  return Duration(seconds_, nanoOfSecond);
}

DateTimeResult<Duration> Duration::plus(int64_t secondsToAdd,
                                        int64_t nanosToAdd) const {
  if ((secondsToAdd | nanosToAdd) == 0) {
    return *this;
  }
  int64_t epochSec = TEMPORA_TRY(AddExact(seconds_, secondsToAdd));
  epochSec = TEMPORA_TRY(AddExact(epochSec, nanosToAdd / NanosPerSecond));
  nanosToAdd = nanosToAdd % NanosPerSecond;
  int64_t nanoAdjustment = nanos_ + nanosToAdd;
  return OfSeconds(epochSec, nanoAdjustment);
}

DateTimeResult<Duration> Duration::plus(const Duration& duration) const {
  return plus(duration.getSeconds(), duration.getNano());
}

DateTimeResult<Duration> Duration::plus(int64_t amountToAdd,
                                        ChronoUnit unit) const {
  if (unit == ChronoUnit::Days) {
    int64_t seconds = TEMPORA_TRY(MultiplyExact(amountToAdd, SecondsPerDay));
    return plus(seconds, 0);
  }
  if (IsDurationEstimated(unit)) {
    return Err(DateTimeError::UnsupportedField(
        "Unit must not have an estimated duration"));
  }
  if (amountToAdd == 0) {
    return *this;
  }

  Int128 nanos = Int128(amountToAdd) * UnitNanos(unit);
  Int128 seconds = nanos / NanosPerSecond;
  if (seconds > std::numeric_limits<int64_t>::max() ||
      seconds < std::numeric_limits<int64_t>::min()) {
    return Err(DateTimeError::Overflow("Duration addition overflows"));
  }
  return plus(int64_t(seconds), int64_t(nanos % NanosPerSecond));
}

DateTimeResult<Duration> Duration::plusDays(int64_t days) const {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(days, SecondsPerDay));
  return plus(seconds, 0);
}

DateTimeResult<Duration> Duration::plusHours(int64_t hours) const {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(hours, SecondsPerHour));
  return plus(seconds, 0);
}

DateTimeResult<Duration> Duration::plusMinutes(int64_t minutes) const {
  int64_t seconds = TEMPORA_TRY(MultiplyExact(minutes, SecondsPerMinute));
  return plus(seconds, 0);
}

DateTimeResult<Duration> Duration::minus(const Duration& duration) const {
  int64_t secsToSubtract = duration.getSeconds();
  int32_t nanosToSubtract = duration.getNano();
  if (secsToSubtract == std::numeric_limits<int64_t>::min()) {
    Duration partial = TEMPORA_TRY(
        plus(std::numeric_limits<int64_t>::max(), -nanosToSubtract));
    return partial.plus(1, 0);
  }
  return plus(-secsToSubtract, -nanosToSubtract);
}

DateTimeResult<Duration> Duration::minus(int64_t amountToSubtract,
                                         ChronoUnit unit) const {
  if (amountToSubtract == std::numeric_limits<int64_t>::min()) {
    Duration partial =
        TEMPORA_TRY(plus(std::numeric_limits<int64_t>::max(), unit));
    return partial.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<Duration> Duration::minusDays(int64_t days) const {
  return minus(days, ChronoUnit::Days);
}

DateTimeResult<Duration> Duration::minusHours(int64_t hours) const {
  return minus(hours, ChronoUnit::Hours);
}

DateTimeResult<Duration> Duration::minusMinutes(int64_t minutes) const {
  return minus(minutes, ChronoUnit::Minutes);
}

DateTimeResult<Duration> Duration::minusSeconds(int64_t seconds) const {
  return minus(seconds, ChronoUnit::Seconds);
}

DateTimeResult<Duration> Duration::minusMillis(int64_t millis) const {
  return minus(millis, ChronoUnit::Millis);
}

DateTimeResult<Duration> Duration::minusNanos(int64_t nanos) const {
  return minus(nanos, ChronoUnit::Nanos);
}

static Int128 ToTotalNanos(const Duration& duration) {
  return Int128(duration.getSeconds()) * Duration::NanosPerSecond +
         duration.getNano();
}

static DateTimeResult<Duration> FromTotalNanos(Int128 totalNanos) {
  Int128 seconds = totalNanos / Duration::NanosPerSecond;
  Int128 nanos = totalNanos % Duration::NanosPerSecond;
  if (nanos < 0) {
    nanos += Duration::NanosPerSecond;
    seconds -= 1;
  }
  if (seconds > std::numeric_limits<int64_t>::max() ||
      seconds < std::numeric_limits<int64_t>::min()) {
    return Err(DateTimeError::Overflow(
        "Exceeds capacity of Duration: " +
        std::to_string(int64_t(totalNanos / Duration::NanosPerSecond))));
  }
  return Duration::OfSecondsUnchecked(int64_t(seconds), int32_t(nanos));
}

DateTimeResult<Duration> Duration::multipliedBy(int64_t multiplicand) const {
  if (multiplicand == 0) {
    return Zero();
  }
  if (multiplicand == 1) {
    return *this;
  }

  // Reject products whose seconds overflow before scaling to nanoseconds,
  // which could otherwise exceed 128 bits.
  Int128 seconds = Int128(seconds_) * multiplicand;
  if (seconds > Int128(std::numeric_limits<int64_t>::max()) + 1 ||
      seconds < Int128(std::numeric_limits<int64_t>::min()) - 1) {
    return Err(DateTimeError::Overflow(
        "Exceeds capacity of Duration: " + toString() + " * " +
        std::to_string(multiplicand)));
  }
  return FromTotalNanos(seconds * NanosPerSecond +
                        Int128(nanos_) * multiplicand);
}

DateTimeResult<Duration> Duration::dividedBy(int64_t divisor) const {
  if (divisor == 0) {
    return Err(DateTimeError::Overflow("Cannot divide by zero"));
  }
  if (divisor == 1) {
    return *this;
  }

  // Integer division of __int128 truncates towards zero, which is the
  // required rounding at nanosecond precision.
  return FromTotalNanos(ToTotalNanos(*this) / divisor);
}

DateTimeResult<int64_t> Duration::toMillis() const {
  int64_t millis = TEMPORA_TRY(MultiplyExact(seconds_, 1000));
  return AddExact(millis, nanos_ / 1'000'000);
}

DateTimeResult<int64_t> Duration::toNanos() const {
  int64_t nanos = TEMPORA_TRY(MultiplyExact(seconds_, NanosPerSecond));
  return AddExact(nanos, nanos_);
}

int32_t Duration::compareTo(const Duration& other) const {
  if (seconds_ != other.seconds_) {
    return seconds_ < other.seconds_ ? -1 : 1;
  }
  return nanos_ - other.nanos_;
}

std::string Duration::toString() const {
  if (isZero()) {
    return std::string("PT0S");
  }

  int64_t hours = seconds_ / SecondsPerHour;
  int32_t minutes = int32_t((seconds_ % SecondsPerHour) / SecondsPerMinute);
  int32_t secs = int32_t(seconds_ % SecondsPerMinute);

  std::string buf = "PT";
  if (hours != 0) {
    buf += std::to_string(hours);
    buf += 'H';
  }
  if (minutes != 0) {
    buf += std::to_string(minutes);
    buf += 'M';
  }
  if (secs == 0 && nanos_ == 0 && buf.length() > 2) {
    return buf;
  }

  // A negative duration with a fraction is printed with the fraction
  // counting towards zero, e.g. -0.5 seconds is stored as (-1, 500000000).
  if (secs < 0 && nanos_ > 0) {
    if (secs == -1) {
      buf += "-0";
    } else {
      buf += std::to_string(secs + 1);
    }
  } else {
    buf += std::to_string(secs);
  }
  if (nanos_ > 0) {
    size_t pos = buf.length();
    if (secs < 0) {
      buf += std::to_string(2 * NanosPerSecond - nanos_);
    } else {
      buf += std::to_string(nanos_ + NanosPerSecond);
    }
    while (buf.back() == '0') {
      buf.pop_back();
    }
    buf[pos] = '.';
  }
  buf += 'S';
  return buf;
}

namespace {

/**
 * Parser for the textual form of a duration, equivalent to the pattern
 *
 *   [-+]?P(?:([-+]?[0-9]+)D)?
 *     (T(?:([-+]?[0-9]+)H)?(?:([-+]?[0-9]+)M)?
 *       (?:([-+]?[0-9]+)(?:[.,]([0-9]{0,9}))?S)?)?
 *
 * matched case insensitively against the whole input.
 */
class DurationParser final {
  std::string_view text_;
  size_t index_ = 0;

  bool atEnd() const { return index_ == text_.length(); }

  bool hasCharacter(char ch) const {
    return !atEnd() && ToAsciiUppercase(text_[index_]) == ch;
  }

  bool character(char ch) {
    if (!hasCharacter(ch)) {
      return false;
    }
    index_++;
    return true;
  }

  // Reads [-+]?[0-9]+ and returns the matched text.
  std::optional<std::string_view> signedNumber() {
    size_t start = index_;
    if (hasCharacter('+') || hasCharacter('-')) {
      index_++;
    }
    size_t digitsStart = index_;
    while (!atEnd() && IsAsciiDigit(text_[index_])) {
      index_++;
    }
    if (index_ == digitsStart) {
      index_ = start;
      return std::nullopt;
    }
    return text_.substr(start, index_ - start);
  }

  // Reads a signed number immediately followed by `designator`, or nothing.
  std::optional<std::string_view> component(char designator) {
    size_t start = index_;
    auto number = signedNumber();
    if (!number || !character(designator)) {
      index_ = start;
      return std::nullopt;
    }
    return number;
  }

 public:
  struct Components {
    bool negate = false;
    std::optional<std::string_view> days;
    std::optional<std::string_view> hours;
    std::optional<std::string_view> minutes;
    std::optional<std::string_view> seconds;
    std::optional<std::string_view> fraction;
  };

  explicit DurationParser(std::string_view text) : text_(text) {}

  std::optional<Components> parse() {
    Components result;
    if (hasCharacter('-') || hasCharacter('+')) {
      result.negate = text_[index_] == '-';
      index_++;
    }
    if (!character('P')) {
      return std::nullopt;
    }

    result.days = component('D');

    if (character('T')) {
      result.hours = component('H');
      result.minutes = component('M');

      size_t start = index_;
      if (auto number = signedNumber()) {
        std::optional<std::string_view> fraction;
        if (hasCharacter('.') || hasCharacter(',')) {
          index_++;
          size_t fractionStart = index_;
          while (!atEnd() && IsAsciiDigit(text_[index_]) &&
                 index_ - fractionStart < 9) {
            index_++;
          }
          fraction = text_.substr(fractionStart, index_ - fractionStart);
        }
        if (character('S')) {
          result.seconds = number;
          result.fraction = fraction;
        } else {
          index_ = start;
        }
      }

      // "T" must be followed by at least one time component.
      if (!result.hours && !result.minutes && !result.seconds) {
        return std::nullopt;
      }
    }

    if (!atEnd()) {
      return std::nullopt;
    }
    if (!result.days && !result.hours && !result.minutes &&
        !result.seconds) {
      return std::nullopt;
    }
    return result;
  }
};

}  // namespace

static DateTimeError DurationParseError(std::string_view text,
                                        const char* detail) {
  std::string message = "Text cannot be parsed to a Duration";
  if (detail) {
    message += ": ";
    message += detail;
  }
  return DateTimeError(std::move(message), text, 0);
}

static DateTimeResult<int64_t> ParseNumber(
    std::string_view text, const std::optional<std::string_view>& parsed,
    int64_t multiplier, const char* errorText) {
  if (!parsed) {
    return 0;
  }

  std::string_view digits = *parsed;
  bool negative = false;
  if (digits[0] == '+' || digits[0] == '-') {
    negative = digits[0] == '-';
    digits.remove_prefix(1);
  }

  // Accumulate negatively so that the minimum value can be represented.
  int64_t value = 0;
  for (char ch : digits) {
    if (__builtin_mul_overflow(value, 10, &value) ||
        __builtin_sub_overflow(value, AsciiDigitToNumber(ch), &value)) {
      return Err(DurationParseError(text, errorText));
    }
  }
  if (!negative) {
    if (value == std::numeric_limits<int64_t>::min()) {
      return Err(DurationParseError(text, errorText));
    }
    value = -value;
  }

  auto result = MultiplyExact(value, multiplier);
  if (result.isErr()) {
    return Err(DurationParseError(text, errorText));
  }
  return result.unwrap();
}

static int32_t ParseFraction(const std::optional<std::string_view>& parsed,
                             int32_t negate) {
  if (!parsed || parsed->empty()) {
    return 0;
  }
  int32_t value = 0;
  size_t i = 0;
  for (; i < parsed->length(); i++) {
    value = value * 10 + AsciiDigitToNumber((*parsed)[i]);
  }
  for (; i < 9; i++) {
    value *= 10;
  }
  return value * negate;
}

static DateTimeResult<Duration> CreateDuration(bool negate,
                                               int64_t daysAsSecs,
                                               int64_t hoursAsSecs,
                                               int64_t minsAsSecs,
                                               int64_t secs, int32_t nanos) {
  int64_t seconds = TEMPORA_TRY(AddExact(minsAsSecs, secs));
  seconds = TEMPORA_TRY(AddExact(hoursAsSecs, seconds));
  seconds = TEMPORA_TRY(AddExact(daysAsSecs, seconds));
  Duration duration = TEMPORA_TRY(Duration::OfSeconds(seconds, nanos));
  if (negate) {
    return duration.negated();
  }
  return duration;
}

DateTimeResult<Duration> Duration::Parse(std::string_view text) {
  auto components = DurationParser(text).parse();
  if (!components) {
    return Err(DurationParseError(text, nullptr));
  }

  int64_t daysAsSecs =
      TEMPORA_TRY(ParseNumber(text, components->days, SecondsPerDay, "days"));
  int64_t hoursAsSecs = TEMPORA_TRY(
      ParseNumber(text, components->hours, SecondsPerHour, "hours"));
  int64_t minsAsSecs = TEMPORA_TRY(
      ParseNumber(text, components->minutes, SecondsPerMinute, "minutes"));
  int64_t seconds =
      TEMPORA_TRY(ParseNumber(text, components->seconds, 1, "seconds"));
  bool negativeSecs =
      components->seconds && (*components->seconds)[0] == '-';
  int32_t nanos = ParseFraction(components->fraction, negativeSecs ? -1 : 1);

  auto result = CreateDuration(components->negate, daysAsSecs, hoursAsSecs,
                               minsAsSecs, seconds, nanos);
  if (result.isErr()) {
    return Err(DurationParseError(text, "overflow"));
  }
  return result;
}
