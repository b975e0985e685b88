/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_TemporalAdjusters_h
#define tempora_TemporalAdjusters_h

#include <stdint.h>

#include "tempora/Assertions.h"
#include "tempora/DateTimeError.h"
#include "tempora/DayOfWeek.h"
#include "tempora/Result.h"
#include "tempora/TemporalFields.h"
#include "tempora/TemporalUnit.h"
#include "tempora/ValueRange.h"

namespace tempora {

/**
 * A common date adjustment, such as "last day of month" or "next Tuesday".
 *
 * Adjusters apply to any date-based value with the usual field accessors:
 * LocalDate, LocalDateTime, OffsetDateTime, ZonedDateTime and the
 * calendar system dates.
 */
class TemporalAdjuster final {
 public:
  enum class Kind : uint8_t {
    FirstDayOfMonth,
    LastDayOfMonth,
    FirstDayOfNextMonth,
    FirstDayOfYear,
    LastDayOfYear,
    FirstDayOfNextYear,
    DayOfWeekInMonth,
    Next,
    NextOrSame,
    Previous,
    PreviousOrSame,
  };

 private:
  Kind kind_;
  int32_t ordinal_;
  DayOfWeek dayOfWeek_;

 public:
  constexpr explicit TemporalAdjuster(Kind kind, int32_t ordinal = 0,
                                      DayOfWeek dayOfWeek = DayOfWeek::Monday)
      : kind_(kind), ordinal_(ordinal), dayOfWeek_(dayOfWeek) {}

  Kind kind() const { return kind_; }
  int32_t ordinal() const { return ordinal_; }
  DayOfWeek dayOfWeek() const { return dayOfWeek_; }

  template <typename T>
  DateTimeResult<T> adjust(const T& temporal) const;

 private:
  template <typename T>
  DateTimeResult<T> adjustDayOfWeekInMonth(const T& temporal) const;
};

template <typename T>
DateTimeResult<T> TemporalAdjuster::adjustDayOfWeekInMonth(
    const T& temporal) const {
  int64_t dowValue = int64_t(dayOfWeek_);
  if (ordinal_ >= 0) {
    T temp = TEMPORA_TRY(temporal.with(ChronoField::DayOfMonth, 1));
    int64_t curDow = TEMPORA_TRY(temp.getLong(ChronoField::DayOfWeek));
    int64_t dowDiff = (dowValue - curDow + 7) % 7;
    dowDiff += (int64_t(ordinal_) - 1) * 7;
    return temp.plus(dowDiff, ChronoUnit::Days);
  }

  ValueRange range = TEMPORA_TRY(temporal.range(ChronoField::DayOfMonth));
  T temp =
      TEMPORA_TRY(temporal.with(ChronoField::DayOfMonth, range.getMaximum()));
  int64_t curDow = TEMPORA_TRY(temp.getLong(ChronoField::DayOfWeek));
  int64_t daysDiff = dowValue - curDow;
  daysDiff = daysDiff == 0 ? 0 : (daysDiff > 0 ? daysDiff - 7 : daysDiff);
  daysDiff -= (-int64_t(ordinal_) - 1) * 7;
  return temp.plus(daysDiff, ChronoUnit::Days);
}

template <typename T>
DateTimeResult<T> TemporalAdjuster::adjust(const T& temporal) const {
  switch (kind_) {
    case Kind::FirstDayOfMonth:
      return temporal.with(ChronoField::DayOfMonth, 1);
    case Kind::LastDayOfMonth: {
      ValueRange range = TEMPORA_TRY(temporal.range(ChronoField::DayOfMonth));
      return temporal.with(ChronoField::DayOfMonth, range.getMaximum());
    }
    case Kind::FirstDayOfNextMonth: {
      T temp = TEMPORA_TRY(temporal.with(ChronoField::DayOfMonth, 1));
      return temp.plus(1, ChronoUnit::Months);
    }
    case Kind::FirstDayOfYear:
      return temporal.with(ChronoField::DayOfYear, 1);
    case Kind::LastDayOfYear: {
      ValueRange range = TEMPORA_TRY(temporal.range(ChronoField::DayOfYear));
      return temporal.with(ChronoField::DayOfYear, range.getMaximum());
    }
    case Kind::FirstDayOfNextYear: {
      T temp = TEMPORA_TRY(temporal.with(ChronoField::DayOfYear, 1));
      return temp.plus(1, ChronoUnit::Years);
    }
    case Kind::DayOfWeekInMonth:
      return adjustDayOfWeekInMonth(temporal);
    case Kind::Next:
    case Kind::NextOrSame: {
      int64_t calDow = TEMPORA_TRY(temporal.getLong(ChronoField::DayOfWeek));
      int64_t dowValue = int64_t(dayOfWeek_);
      if (kind_ == Kind::NextOrSame && calDow == dowValue) {
        return temporal;
      }
      int64_t daysDiff = calDow - dowValue;
      return temporal.plus(daysDiff >= 0 ? 7 - daysDiff : -daysDiff,
                           ChronoUnit::Days);
    }
    case Kind::Previous:
    case Kind::PreviousOrSame: {
      int64_t calDow = TEMPORA_TRY(temporal.getLong(ChronoField::DayOfWeek));
      int64_t dowValue = int64_t(dayOfWeek_);
      if (kind_ == Kind::PreviousOrSame && calDow == dowValue) {
        return temporal;
      }
      int64_t daysDiff = dowValue - calDow;
      return temporal.plus(-(daysDiff >= 0 ? 7 - daysDiff : -daysDiff),
                           ChronoUnit::Days);
    }
  }
  TEMPORA_ASSERT_UNREACHABLE("invalid adjuster kind");
  return temporal;
}

constexpr TemporalAdjuster FirstDayOfMonth() {
  return TemporalAdjuster(TemporalAdjuster::Kind::FirstDayOfMonth);
}
constexpr TemporalAdjuster LastDayOfMonth() {
  return TemporalAdjuster(TemporalAdjuster::Kind::LastDayOfMonth);
}
constexpr TemporalAdjuster FirstDayOfNextMonth() {
  return TemporalAdjuster(TemporalAdjuster::Kind::FirstDayOfNextMonth);
}
constexpr TemporalAdjuster FirstDayOfYear() {
  return TemporalAdjuster(TemporalAdjuster::Kind::FirstDayOfYear);
}
constexpr TemporalAdjuster LastDayOfYear() {
  return TemporalAdjuster(TemporalAdjuster::Kind::LastDayOfYear);
}
constexpr TemporalAdjuster FirstDayOfNextYear() {
  return TemporalAdjuster(TemporalAdjuster::Kind::FirstDayOfNextYear);
}

/**
 * The `ordinal`-th `dayOfWeek` of the month. Zero is the last such day of
 * the previous month; negative ordinals count back from the end of the
 * month, so -1 is the last `dayOfWeek` of the month.
 */
constexpr TemporalAdjuster DayOfWeekInMonth(int32_t ordinal,
                                            DayOfWeek dayOfWeek) {
  return TemporalAdjuster(TemporalAdjuster::Kind::DayOfWeekInMonth, ordinal,
                          dayOfWeek);
}
constexpr TemporalAdjuster FirstInMonth(DayOfWeek dayOfWeek) {
  return DayOfWeekInMonth(1, dayOfWeek);
}
constexpr TemporalAdjuster LastInMonth(DayOfWeek dayOfWeek) {
  return DayOfWeekInMonth(-1, dayOfWeek);
}

constexpr TemporalAdjuster Next(DayOfWeek dayOfWeek) {
  return TemporalAdjuster(TemporalAdjuster::Kind::Next, 0, dayOfWeek);
}
constexpr TemporalAdjuster NextOrSame(DayOfWeek dayOfWeek) {
  return TemporalAdjuster(TemporalAdjuster::Kind::NextOrSame, 0, dayOfWeek);
}
constexpr TemporalAdjuster Previous(DayOfWeek dayOfWeek) {
  return TemporalAdjuster(TemporalAdjuster::Kind::Previous, 0, dayOfWeek);
}
constexpr TemporalAdjuster PreviousOrSame(DayOfWeek dayOfWeek) {
  return TemporalAdjuster(TemporalAdjuster::Kind::PreviousOrSame, 0,
                          dayOfWeek);
}

}  // namespace tempora

#endif /* tempora_TemporalAdjusters_h */
