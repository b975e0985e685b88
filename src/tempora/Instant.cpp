/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Instant.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/Clock.h"
#include "tempora/Duration.h"
#include "tempora/IsoParser.h"
#include "tempora/LocalDateTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/Printf.h"
#include "tempora/ZonedDateTime.h"

using namespace tempora;

static constexpr int64_t NanosPerSecond = 1000'000'000;
static constexpr int64_t SecondsPerDay = 86400;

// Length of a 400 year cycle times 25, and the offset from year 0 to 1970.
static constexpr int64_t SecondsPer10000Years = 146097LL * 25LL * 86400LL;
static constexpr int64_t Seconds0000To1970 =
    ((146097LL * 5LL) - (30LL * 365LL + 7LL)) * 86400LL;

DateTimeResult<Instant> Instant::Create(int64_t seconds,
                                        int32_t nanoOfSecond) {
  if ((seconds | nanoOfSecond) == 0) {
    return Epoch();
  }
  if (seconds < MinSecond || seconds > MaxSecond) {
    return Err(DateTimeError::InvalidValue(
        std::string("Instant exceeds minimum or maximum instant")));
  }
  return Instant(seconds, nanoOfSecond);
}

DateTimeResult<Instant> Instant::OfEpochSecond(int64_t epochSecond) {
  return Create(epochSecond, 0);
}

DateTimeResult<Instant> Instant::OfEpochSecond(int64_t epochSecond,
                                               int64_t nanoAdjustment) {
  int64_t secs = TEMPORA_TRY(
      AddExact(epochSecond, FloorDiv(nanoAdjustment, NanosPerSecond)));
  int32_t nos = int32_t(FloorMod(nanoAdjustment, NanosPerSecond));
  return Create(secs, nos);
}

Instant Instant::OfEpochMilli(int64_t epochMilli) {
  int64_t secs = FloorDiv<int64_t>(epochMilli, 1000);
  int32_t mos = int32_t(FloorMod<int64_t>(epochMilli, 1000));
  return Instant(secs, mos * 1000'000);
}

Instant Instant::Now(const Clock& clock) { return clock.instant(); }

DateTimeResult<Instant> Instant::Parse(std::string_view text) {
  IsoParser parser(text);
  ParsedDate date = TEMPORA_TRY(parser.parseDate());
  TEMPORA_TRY(parser.expectIgnoreCase('T'));
  ParsedTime time = TEMPORA_TRY(parser.parseTime(/* requireSeconds = */ true));
  TEMPORA_TRY(parser.expectIgnoreCase('Z'));
  TEMPORA_TRY(parser.finish());

  // Years beyond the LocalDate range are folded into 10,000 year cycles.
  int32_t year = int32_t(date.year % 10000);
  int32_t days = 0;
  if (time.hour == 24 && time.minute == 0 && time.second == 0 &&
      time.nano == 0) {
    time.hour = 0;
    days = 1;
  } else if (time.hour == 23 && time.minute == 59 && time.second == 60) {
    time.second = 59;
  }

  auto toInstant = [&]() -> DateTimeResult<Instant> {
    LocalDateTime ldt = TEMPORA_TRY(LocalDateTime::Of(
        year, date.month, date.day, time.hour, time.minute, time.second, 0));
    ldt = TEMPORA_TRY(ldt.plusDays(days));
    int64_t instantSecs = ldt.toEpochSecond(ZoneOffset::UTC());
    int64_t cycles = TEMPORA_TRY(
        MultiplyExact(date.year / 10000, SecondsPer10000Years));
    instantSecs = TEMPORA_TRY(AddExact(instantSecs, cycles));
    return Create(instantSecs, time.nano);
  };
  return parser.resolve(toInstant());
}

DateTimeResult<ValueRange> Instant::range(ChronoField field) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  return FieldRange(field);
}

DateTimeResult<int32_t> Instant::get(ChronoField field) const {
  switch (field) {
    case ChronoField::NanoOfSecond:
      return nanos_;
    case ChronoField::MicroOfSecond:
      return nanos_ / 1000;
    case ChronoField::MilliOfSecond:
      return nanos_ / 1000'000;
    case ChronoField::InstantSeconds:
      return CheckValidIntValue(field, seconds_);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<int64_t> Instant::getLong(ChronoField field) const {
  switch (field) {
    case ChronoField::NanoOfSecond:
      return int64_t(nanos_);
    case ChronoField::MicroOfSecond:
      return int64_t(nanos_ / 1000);
    case ChronoField::MilliOfSecond:
      return int64_t(nanos_ / 1000'000);
    case ChronoField::InstantSeconds:
      return seconds_;
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<Instant> Instant::with(ChronoField field,
                                      int64_t newValue) const {
  if (!isSupported(field)) {
    return Err(UnsupportedFieldError(field));
  }
  TEMPORA_TRY(CheckValidValue(field, newValue));
  int64_t nval;
  switch (field) {
    case ChronoField::MilliOfSecond:
      nval = newValue * 1000'000;
      return nval != nanos_ ? Create(seconds_, int32_t(nval))
                            : DateTimeResult<Instant>(*this);
    case ChronoField::MicroOfSecond:
      nval = newValue * 1000;
      return nval != nanos_ ? Create(seconds_, int32_t(nval))
                            : DateTimeResult<Instant>(*this);
    case ChronoField::NanoOfSecond:
      return newValue != nanos_ ? Create(seconds_, int32_t(newValue))
                                : DateTimeResult<Instant>(*this);
    case ChronoField::InstantSeconds:
      return newValue != seconds_ ? Create(newValue, nanos_)
                                  : DateTimeResult<Instant>(*this);
    default:
      return Err(UnsupportedFieldError(field));
  }
}

DateTimeResult<Instant> Instant::truncatedTo(ChronoUnit unit) const {
  if (unit == ChronoUnit::Nanos) {
    return *this;
  }
  Duration unitDur = UnitDuration(unit);
  if (unitDur.getSeconds() > SecondsPerDay) {
    return Err(DateTimeError::InvalidValue(
        std::string("Unit is too large to be used for truncation")));
  }
  int64_t dur = TEMPORA_TRY(unitDur.toNanos());
  if ((SecondsPerDay * NanosPerSecond) % dur != 0) {
    return Err(DateTimeError::InvalidValue(std::string(
        "Unit must divide into a standard day without remainder")));
  }
  int64_t nod = FloorMod(seconds_, SecondsPerDay) * NanosPerSecond + nanos_;
  int64_t result = FloorDiv(nod, dur) * dur;
  return plusNanos(result - nod);
}

DateTimeResult<Instant> Instant::plus(int64_t secondsToAdd,
                                      int64_t nanosToAdd) const {
  if ((secondsToAdd | nanosToAdd) == 0) {
    return *this;
  }
  int64_t epochSec = TEMPORA_TRY(AddExact(seconds_, secondsToAdd));
  epochSec = TEMPORA_TRY(AddExact(epochSec, nanosToAdd / NanosPerSecond));
  nanosToAdd = nanosToAdd % NanosPerSecond;
  int64_t nanoAdjustment = nanos_ + nanosToAdd;
  return OfEpochSecond(epochSec, nanoAdjustment);
}

DateTimeResult<Instant> Instant::plus(const Duration& duration) const {
  return plus(duration.getSeconds(), duration.getNano());
}

DateTimeResult<Instant> Instant::plus(int64_t amountToAdd,
                                      ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Nanos:
      return plusNanos(amountToAdd);
    case ChronoUnit::Micros:
      return plus(amountToAdd / 1000'000, (amountToAdd % 1000'000) * 1000);
    case ChronoUnit::Millis:
      return plusMillis(amountToAdd);
    case ChronoUnit::Seconds:
      return plusSeconds(amountToAdd);
    case ChronoUnit::Minutes:
      return plusSeconds(TEMPORA_TRY(MultiplyExact(amountToAdd, 60)));
    case ChronoUnit::Hours:
      return plusSeconds(TEMPORA_TRY(MultiplyExact(amountToAdd, 3600)));
    case ChronoUnit::HalfDays:
      return plusSeconds(
          TEMPORA_TRY(MultiplyExact(amountToAdd, SecondsPerDay / 2)));
    case ChronoUnit::Days:
      return plusSeconds(TEMPORA_TRY(MultiplyExact(amountToAdd, SecondsPerDay)));
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<Instant> Instant::minus(const Duration& duration) const {
  Duration negated = TEMPORA_TRY(duration.negated());
  return plus(negated);
}

DateTimeResult<Instant> Instant::minus(int64_t amountToSubtract,
                                       ChronoUnit unit) const {
  if (amountToSubtract == INT64_MIN) {
    Instant result = TEMPORA_TRY(plus(INT64_MAX, unit));
    return result.plus(1, unit);
  }
  return plus(-amountToSubtract, unit);
}

DateTimeResult<Instant> Instant::minusSeconds(int64_t seconds) const {
  return minus(seconds, ChronoUnit::Seconds);
}

DateTimeResult<Instant> Instant::minusMillis(int64_t millis) const {
  return minus(millis, ChronoUnit::Millis);
}

DateTimeResult<Instant> Instant::minusNanos(int64_t nanos) const {
  return minus(nanos, ChronoUnit::Nanos);
}

DateTimeResult<int64_t> Instant::nanosUntil(const Instant& end) const {
  int64_t secsDiff = TEMPORA_TRY(SubtractExact(end.seconds_, seconds_));
  int64_t totalNanos = TEMPORA_TRY(MultiplyExact(secsDiff, NanosPerSecond));
  return AddExact(totalNanos, end.nanos_ - nanos_);
}

DateTimeResult<int64_t> Instant::secondsUntil(const Instant& end) const {
  int64_t secsDiff = TEMPORA_TRY(SubtractExact(end.seconds_, seconds_));
  int64_t nanosDiff = end.nanos_ - nanos_;
  if (secsDiff > 0 && nanosDiff < 0) {
    secsDiff--;
  } else if (secsDiff < 0 && nanosDiff > 0) {
    secsDiff++;
  }
  return secsDiff;
}

DateTimeResult<int64_t> Instant::until(const Instant& end,
                                       ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Nanos:
      return nanosUntil(end);
    case ChronoUnit::Micros:
      return TEMPORA_TRY(nanosUntil(end)) / 1000;
    case ChronoUnit::Millis: {
      int64_t endMillis = TEMPORA_TRY(end.toEpochMilli());
      int64_t startMillis = TEMPORA_TRY(toEpochMilli());
      return SubtractExact(endMillis, startMillis);
    }
    case ChronoUnit::Seconds:
      return secondsUntil(end);
    case ChronoUnit::Minutes:
      return TEMPORA_TRY(secondsUntil(end)) / 60;
    case ChronoUnit::Hours:
      return TEMPORA_TRY(secondsUntil(end)) / 3600;
    case ChronoUnit::HalfDays:
      return TEMPORA_TRY(secondsUntil(end)) / (SecondsPerDay / 2);
    case ChronoUnit::Days:
      return TEMPORA_TRY(secondsUntil(end)) / SecondsPerDay;
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

DateTimeResult<OffsetDateTime> Instant::atOffset(
    const ZoneOffset& offset) const {
  return OffsetDateTime::OfInstant(*this, offset);
}

DateTimeResult<ZonedDateTime> Instant::atZone(const ZoneId& zone) const {
  return ZonedDateTime::OfInstant(*this, zone);
}

DateTimeResult<int64_t> Instant::toEpochMilli() const {
  if (seconds_ >= 0) {
    int64_t millis = TEMPORA_TRY(MultiplyExact(seconds_, 1000));
    return AddExact(millis, nanos_ / 1000'000);
  }
  int64_t millis = TEMPORA_TRY(MultiplyExact(seconds_ + 1, 1000));
  return SubtractExact(millis, 1000 - nanos_ / 1000'000);
}

std::string Instant::toString() const {
  std::string result;
  if (seconds_ >= -Seconds0000To1970) {
    // Current era.
    int64_t zeroSecs = seconds_ - SecondsPer10000Years + Seconds0000To1970;
    int64_t hi = FloorDiv(zeroSecs, SecondsPer10000Years) + 1;
    int64_t lo = FloorMod(zeroSecs, SecondsPer10000Years);
    LocalDateTime ldt = TEMPORA_ALWAYS_OK(LocalDateTime::OfEpochSecond(
        lo - Seconds0000To1970, 0, ZoneOffset::UTC()));
    if (hi > 0) {
      result += Smprintf("+%lld", (long long)hi);
    }
    result += ldt.toString();
    if (ldt.getSecond() == 0) {
      result += ":00";
    }
  } else {
    // Before current era.
    int64_t zeroSecs = seconds_ + Seconds0000To1970;
    int64_t hi = zeroSecs / SecondsPer10000Years;
    int64_t lo = zeroSecs % SecondsPer10000Years;
    LocalDateTime ldt = TEMPORA_ALWAYS_OK(LocalDateTime::OfEpochSecond(
        lo - Seconds0000To1970, 0, ZoneOffset::UTC()));
    std::string text = ldt.toString();
    if (ldt.getSecond() == 0) {
      text += ":00";
    }
    if (hi < 0) {
      if (ldt.getYear() == -10000) {
        text.replace(0, 2, Smprintf("%lld", (long long)(hi - 1)));
      } else if (lo == 0) {
        text.insert(0, Smprintf("%lld", (long long)hi));
      } else {
        text.insert(1, Smprintf("%lld", (long long)(-hi)));
      }
    }
    result += text;
  }

  if (nanos_ != 0) {
    if (nanos_ % 1000'000 == 0) {
      result += Smprintf(".%03d", nanos_ / 1000'000);
    } else if (nanos_ % 1000 == 0) {
      result += Smprintf(".%06d", nanos_ / 1000);
    } else {
      result += Smprintf(".%09d", nanos_);
    }
  }
  result += 'Z';
  return result;
}
