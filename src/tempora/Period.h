/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Period_h
#define tempora_Period_h

#include <stdint.h>

#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/TemporalUnit.h"

namespace tempora {

class LocalDate;

/**
 * A date-based amount of time in the ISO-8601 calendar system, such as
 * "2 years, 3 months and 4 days".
 *
 * The three fields are independent and are not normalized: "15 months" stays
 * distinct from "1 year and 3 months" until normalized() is called.
 */
class Period final {
  int32_t years_ = 0;
  int32_t months_ = 0;
  int32_t days_ = 0;

  constexpr Period(int32_t years, int32_t months, int32_t days)
      : years_(years), months_(months), days_(days) {}

 public:
  constexpr Period() = default;

  static constexpr Period Zero() { return Period(); }
  static constexpr Period Of(int32_t years, int32_t months, int32_t days) {
    return Period(years, months, days);
  }
  static constexpr Period OfYears(int32_t years) { return Period(years, 0, 0); }
  static constexpr Period OfMonths(int32_t months) {
    return Period(0, months, 0);
  }
  static DateTimeResult<Period> OfWeeks(int32_t weeks);
  static constexpr Period OfDays(int32_t days) { return Period(0, 0, days); }

  static DateTimeResult<Period> Between(const LocalDate& startInclusive,
                                        const LocalDate& endExclusive);

  /**
   * Parses "PnYnMnWnD", where each component is optional but at least one is
   * present. Weeks are converted to days. A leading '-' negates the period.
   */
  static DateTimeResult<Period> Parse(std::string_view text);

  int32_t getYears() const { return years_; }
  int32_t getMonths() const { return months_; }
  int32_t getDays() const { return days_; }

  DateTimeResult<int64_t> get(ChronoUnit unit) const;

  bool isZero() const { return years_ == 0 && months_ == 0 && days_ == 0; }
  bool isNegative() const { return years_ < 0 || months_ < 0 || days_ < 0; }

  Period withYears(int32_t years) const {
    return Period(years, months_, days_);
  }
  Period withMonths(int32_t months) const {
    return Period(years_, months, days_);
  }
  Period withDays(int32_t days) const { return Period(years_, months_, days); }

  DateTimeResult<Period> plus(const Period& other) const;
  DateTimeResult<Period> plusYears(int64_t years) const;
  DateTimeResult<Period> plusMonths(int64_t months) const;
  DateTimeResult<Period> plusDays(int64_t days) const;
  DateTimeResult<Period> minus(const Period& other) const;
  DateTimeResult<Period> minusYears(int64_t years) const;
  DateTimeResult<Period> minusMonths(int64_t months) const;
  DateTimeResult<Period> minusDays(int64_t days) const;

  DateTimeResult<Period> multipliedBy(int32_t scalar) const;
  DateTimeResult<Period> negated() const { return multipliedBy(-1); }

  /**
   * Rolls whole multiples of twelve months into years. Days are untouched.
   */
  DateTimeResult<Period> normalized() const;

  int64_t toTotalMonths() const { return int64_t(years_) * 12 + months_; }

  DateTimeResult<LocalDate> addTo(const LocalDate& date) const;
  DateTimeResult<LocalDate> subtractFrom(const LocalDate& date) const;

  bool operator==(const Period& other) const {
    return years_ == other.years_ && months_ == other.months_ &&
           days_ == other.days_;
  }
  bool operator!=(const Period& other) const { return !(*this == other); }

  /**
   * Outputs "P1Y2M3D". The zero period is "P0D".
   */
  std::string toString() const;
};

}  // namespace tempora

#endif /* tempora_Period_h */
