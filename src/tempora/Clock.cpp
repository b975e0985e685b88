/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Clock.h"

#include <chrono>

#include "tempora/CheckedArithmetic.h"

using namespace tempora;

namespace {

class SystemClock final : public Clock {
 public:
  explicit SystemClock(const ZoneId& zone) : Clock(zone) {}

  Instant instant() const override {
    auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    int64_t nanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch)
            .count();
    return TEMPORA_ALWAYS_OK(Instant::OfEpochSecond(
        FloorDiv<int64_t>(nanos, 1'000'000'000),
        FloorMod<int64_t>(nanos, 1'000'000'000)));
  }

  std::unique_ptr<Clock> withZone(const ZoneId& zone) const override {
    return std::make_unique<SystemClock>(zone);
  }

  std::string toString() const override {
    return "SystemClock[" + zone_.getId() + "]";
  }
};

class FixedClock final : public Clock {
  Instant instant_;

 public:
  FixedClock(const Instant& fixedInstant, const ZoneId& zone)
      : Clock(zone), instant_(fixedInstant) {}

  Instant instant() const override { return instant_; }

  std::unique_ptr<Clock> withZone(const ZoneId& zone) const override {
    return std::make_unique<FixedClock>(instant_, zone);
  }

  std::string toString() const override {
    return "FixedClock[" + instant_.toString() + "," + zone_.getId() + "]";
  }
};

class OffsetClock final : public Clock {
  std::shared_ptr<const Clock> baseClock_;
  Duration offset_;

 public:
  OffsetClock(std::shared_ptr<const Clock> baseClock, const Duration& offset,
              const ZoneId& zone)
      : Clock(zone), baseClock_(std::move(baseClock)), offset_(offset) {}

  Instant instant() const override {
    auto result = baseClock_->instant().plus(offset_);
    if (result.isErr()) {
      return offset_.isNegative() ? Instant::Min() : Instant::Max();
    }
    return result.unwrap();
  }

  std::unique_ptr<Clock> withZone(const ZoneId& zone) const override {
    return std::make_unique<OffsetClock>(baseClock_, offset_, zone);
  }

  std::string toString() const override {
    return "OffsetClock[" + baseClock_->toString() + "," +
           offset_.toString() + "]";
  }
};

}  // namespace

std::unique_ptr<Clock> Clock::SystemUTC() {
  return std::make_unique<SystemClock>(ZoneId::Of(ZoneOffset::UTC()));
}

std::unique_ptr<Clock> Clock::System(const ZoneId& zone) {
  return std::make_unique<SystemClock>(zone);
}

std::unique_ptr<Clock> Clock::Fixed(const Instant& fixedInstant,
                                    const ZoneId& zone) {
  return std::make_unique<FixedClock>(fixedInstant, zone);
}

std::unique_ptr<Clock> Clock::Offset(std::shared_ptr<const Clock> baseClock,
                                     const Duration& offset) {
  ZoneId zone = baseClock->getZone();
  return std::make_unique<OffsetClock>(std::move(baseClock), offset, zone);
}
