/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Period.h"

#include "tempora/CheckedArithmetic.h"
#include "tempora/LocalDate.h"
#include "tempora/Printf.h"
#include "tempora/TextUtils.h"

using namespace tempora;

DateTimeResult<Period> Period::OfWeeks(int32_t weeks) {
  int64_t days = TEMPORA_TRY(MultiplyExact(weeks, 7));
  return Period(0, 0, TEMPORA_TRY(ToIntExact(days)));
}

DateTimeResult<Period> Period::Between(const LocalDate& startInclusive,
                                       const LocalDate& endExclusive) {
  return startInclusive.until(endExclusive);
}

namespace {

class PeriodParser final {
  std::string_view text_;
  size_t index_ = 0;

 public:
  explicit PeriodParser(std::string_view text) : text_(text) {}

  bool atEnd() const { return index_ == text_.length(); }
  size_t index() const { return index_; }

  bool sign(bool* negative) {
    if (atEnd()) {
      return false;
    }
    char ch = text_[index_];
    if (ch == '-' || ch == '+') {
      *negative = ch == '-';
      index_++;
      return true;
    }
    return false;
  }

  bool letter(char upper) {
    if (!atEnd() && ToAsciiUppercase(text_[index_]) == upper) {
      index_++;
      return true;
    }
    return false;
  }

  // Reads "[+-]digits<unit>" if present. Restores the position when the
  // component is absent.
  DateTimeResult<bool> component(char unit, int32_t* value) {
    size_t start = index_;
    bool negative = false;
    sign(&negative);
    size_t digitsStart = index_;
    int64_t result = 0;
    bool overflow = false;
    while (!atEnd() && IsAsciiDigit(text_[index_])) {
      if (!overflow) {
        result = result * 10 + AsciiDigitToNumber(text_[index_]);
        if (result > int64_t(INT32_MAX) + 1) {
          overflow = true;
        }
      }
      index_++;
    }
    if (index_ == digitsStart || !letter(unit)) {
      index_ = start;
      return false;
    }
    if (negative) {
      result = -result;
    }
    if (overflow || result > INT32_MAX || result < INT32_MIN) {
      return Err(DateTimeError::ParseWithCause(
          text_, DateTimeError::Overflow("integer overflow")));
    }
    *value = int32_t(result);
    return true;
  }
};

}  // namespace

DateTimeResult<Period> Period::Parse(std::string_view text) {
  PeriodParser parser(text);

  bool negate = false;
  parser.sign(&negate);
  if (!parser.letter('P')) {
    return Err(DateTimeError(
        std::string("Text cannot be parsed to a Period"), text, 0));
  }

  int32_t years = 0;
  int32_t months = 0;
  int32_t weeks = 0;
  int32_t days = 0;
  bool any = TEMPORA_TRY(parser.component('Y', &years));
  any |= TEMPORA_TRY(parser.component('M', &months));
  any |= TEMPORA_TRY(parser.component('W', &weeks));
  any |= TEMPORA_TRY(parser.component('D', &days));
  if (!any || !parser.atEnd()) {
    return Err(DateTimeError(std::string("Text cannot be parsed to a Period"),
                             text, 0));
  }

  auto overflow = [&](const DateTimeError& cause) {
    return Err(DateTimeError::ParseWithCause(text, cause));
  };

  auto weekDays = MultiplyExact(weeks, 7);
  if (weekDays.isErr()) {
    return overflow(weekDays.unwrapErr());
  }
  auto totalDays = AddExact(weekDays.unwrap(), days);
  if (totalDays.isErr()) {
    return overflow(totalDays.unwrapErr());
  }
  auto intDays = ToIntExact(totalDays.unwrap());
  if (intDays.isErr()) {
    return overflow(intDays.unwrapErr());
  }

  Period period(years, months, intDays.unwrap());
  if (negate) {
    auto negated = period.negated();
    if (negated.isErr()) {
      return overflow(negated.unwrapErr());
    }
    return negated.unwrap();
  }
  return period;
}

DateTimeResult<int64_t> Period::get(ChronoUnit unit) const {
  switch (unit) {
    case ChronoUnit::Years:
      return int64_t(years_);
    case ChronoUnit::Months:
      return int64_t(months_);
    case ChronoUnit::Days:
      return int64_t(days_);
    default:
      return Err(UnsupportedUnitError(unit));
  }
}

static DateTimeResult<int32_t> AddIntExact(int32_t a, int64_t b) {
  int64_t sum = TEMPORA_TRY(AddExact(a, b));
  return ToIntExact(sum);
}

DateTimeResult<Period> Period::plus(const Period& other) const {
  return Period(TEMPORA_TRY(AddIntExact(years_, other.years_)),
                TEMPORA_TRY(AddIntExact(months_, other.months_)),
                TEMPORA_TRY(AddIntExact(days_, other.days_)));
}

DateTimeResult<Period> Period::plusYears(int64_t years) const {
  if (years == 0) {
    return *this;
  }
  return Period(TEMPORA_TRY(AddIntExact(years_, years)), months_, days_);
}

DateTimeResult<Period> Period::plusMonths(int64_t months) const {
  if (months == 0) {
    return *this;
  }
  return Period(years_, TEMPORA_TRY(AddIntExact(months_, months)), days_);
}

DateTimeResult<Period> Period::plusDays(int64_t days) const {
  if (days == 0) {
    return *this;
  }
  return Period(years_, months_, TEMPORA_TRY(AddIntExact(days_, days)));
}

DateTimeResult<Period> Period::minus(const Period& other) const {
  Period negatedOther = TEMPORA_TRY(other.negated());
  return plus(negatedOther);
}

DateTimeResult<Period> Period::minusYears(int64_t years) const {
  return plusYears(TEMPORA_TRY(NegateExact(years)));
}

DateTimeResult<Period> Period::minusMonths(int64_t months) const {
  return plusMonths(TEMPORA_TRY(NegateExact(months)));
}

DateTimeResult<Period> Period::minusDays(int64_t days) const {
  return plusDays(TEMPORA_TRY(NegateExact(days)));
}

DateTimeResult<Period> Period::multipliedBy(int32_t scalar) const {
  if (isZero() || scalar == 1) {
    return *this;
  }
  auto scale = [scalar](int32_t value) -> DateTimeResult<int32_t> {
    int64_t product = TEMPORA_TRY(MultiplyExact(value, scalar));
    return ToIntExact(product);
  };
  return Period(TEMPORA_TRY(scale(years_)), TEMPORA_TRY(scale(months_)),
                TEMPORA_TRY(scale(days_)));
}

DateTimeResult<Period> Period::normalized() const {
  int64_t totalMonths = toTotalMonths();
  int64_t splitYears = totalMonths / 12;
  int32_t splitMonths = int32_t(totalMonths % 12);
  if (splitYears == years_ && splitMonths == months_) {
    return *this;
  }
  return Period(TEMPORA_TRY(ToIntExact(splitYears)), splitMonths, days_);
}

DateTimeResult<LocalDate> Period::addTo(const LocalDate& date) const {
  return date.plus(*this);
}

DateTimeResult<LocalDate> Period::subtractFrom(const LocalDate& date) const {
  return date.minus(*this);
}

std::string Period::toString() const {
  if (isZero()) {
    return "P0D";
  }
  std::string result = "P";
  if (years_ != 0) {
    result += Smprintf("%dY", years_);
  }
  if (months_ != 0) {
    result += Smprintf("%dM", months_);
  }
  if (days_ != 0) {
    result += Smprintf("%dD", days_);
  }
  return result;
}
