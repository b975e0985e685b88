/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneRules.h"

#include <algorithm>

#include "tempora/CheckedArithmetic.h"
#include "tempora/IsoCalendar.h"
#include "tempora/LocalDate.h"
#include "tempora/Logging.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gZoneRulesLog("zonerules");

#define LOG(args) TEMPORA_LOG(gZoneRulesLog, LogLevel::Debug, args)

ZoneRules::ZoneRules(std::vector<int64_t>&& standardTransitions,
                     std::vector<ZoneOffset>&& standardOffsets,
                     std::vector<int64_t>&& savingsInstantTransitions,
                     std::vector<ZoneOffset>&& wallOffsets,
                     std::vector<ZoneOffsetTransitionRule>&& lastRules,
                     std::vector<LocalDateTime>&& savingsLocalTransitions)
    : standardTransitions_(std::move(standardTransitions)),
      standardOffsets_(std::move(standardOffsets)),
      savingsInstantTransitions_(std::move(savingsInstantTransitions)),
      wallOffsets_(std::move(wallOffsets)),
      lastRules_(std::move(lastRules)),
      savingsLocalTransitions_(std::move(savingsLocalTransitions)) {
  TEMPORA_ASSERT(standardOffsets_.size() == standardTransitions_.size() + 1);
  TEMPORA_ASSERT(wallOffsets_.size() == savingsInstantTransitions_.size() + 1);
  TEMPORA_ASSERT(savingsLocalTransitions_.size() ==
                 savingsInstantTransitions_.size() * 2);
}

std::shared_ptr<const ZoneRules> ZoneRules::Fixed(const ZoneOffset& offset) {
  return std::shared_ptr<const ZoneRules>(
      new ZoneRules({}, {offset}, {}, {offset}, {}, {}));
}

DateTimeResult<Ok> ZoneRules::ValidateLastRules(
    const std::vector<ZoneOffsetTransitionRule>& lastRules) {
  if (lastRules.size() > MaxLastRules) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("Too many transition rules")));
  }

  // Each rule must produce a transition in every year.
  for (const auto& rule : lastRules) {
    if (rule.getOffsetBefore() == rule.getOffsetAfter()) {
      return Err(DateTimeError::ZoneRulesData(
          std::string("Transition rule offsets must not be equal")));
    }
    int32_t dom = rule.getDayOfMonthIndicator();
    if (dom > MonthMinLength(rule.getMonth())) {
      return Err(DateTimeError::ZoneRulesData(
          "Transition rule day of month is not valid in every year: " +
          rule.toString()));
    }
  }
  return Ok();
}

// Appends the two local date-times bounding a transition, earlier first.
static void AddLocalTransitions(std::vector<LocalDateTime>& list,
                                const ZoneOffsetTransition& trans) {
  if (trans.isGap()) {
    list.push_back(trans.getDateTimeBefore());
    list.push_back(trans.getDateTimeAfter());
  } else {
    list.push_back(trans.getDateTimeAfter());
    list.push_back(trans.getDateTimeBefore());
  }
}

DateTimeResult<std::shared_ptr<const ZoneRules>> ZoneRules::Of(
    const ZoneOffset& baseStandardOffset, const ZoneOffset& baseWallOffset,
    const std::vector<ZoneOffsetTransition>& standardOffsetTransitions,
    const std::vector<ZoneOffsetTransition>& transitions,
    const std::vector<ZoneOffsetTransitionRule>& lastRules) {
  TEMPORA_TRY(ValidateLastRules(lastRules));

  std::vector<int64_t> standardTransitions;
  std::vector<ZoneOffset> standardOffsets;
  standardTransitions.reserve(standardOffsetTransitions.size());
  standardOffsets.reserve(standardOffsetTransitions.size() + 1);
  standardOffsets.push_back(baseStandardOffset);
  for (const auto& trans : standardOffsetTransitions) {
    standardTransitions.push_back(trans.toEpochSecond());
    standardOffsets.push_back(trans.getOffsetAfter());
  }

  std::vector<LocalDateTime> localTransitions;
  std::vector<ZoneOffset> wallOffsets;
  std::vector<int64_t> savingsInstantTransitions;
  localTransitions.reserve(transitions.size() * 2);
  wallOffsets.reserve(transitions.size() + 1);
  savingsInstantTransitions.reserve(transitions.size());
  wallOffsets.push_back(baseWallOffset);
  for (const auto& trans : transitions) {
    AddLocalTransitions(localTransitions, trans);
    wallOffsets.push_back(trans.getOffsetAfter());
    savingsInstantTransitions.push_back(trans.toEpochSecond());
  }

  return std::shared_ptr<const ZoneRules>(new ZoneRules(
      std::move(standardTransitions), std::move(standardOffsets),
      std::move(savingsInstantTransitions), std::move(wallOffsets),
      std::vector<ZoneOffsetTransitionRule>(lastRules),
      std::move(localTransitions)));
}

DateTimeResult<std::shared_ptr<const ZoneRules>> ZoneRules::FromArrays(
    std::vector<int64_t> standardTransitions,
    std::vector<ZoneOffset> standardOffsets,
    std::vector<int64_t> savingsInstantTransitions,
    std::vector<ZoneOffset> wallOffsets,
    std::vector<ZoneOffsetTransitionRule> lastRules) {
  if (standardOffsets.size() != standardTransitions.size() + 1 ||
      wallOffsets.size() != savingsInstantTransitions.size() + 1) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("Mismatched transition and offset counts")));
  }
  if (!std::is_sorted(standardTransitions.begin(), standardTransitions.end()) ||
      !std::is_sorted(savingsInstantTransitions.begin(),
                      savingsInstantTransitions.end())) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("Transitions must be in ascending order")));
  }
  auto outOfRange = [](int64_t epochSecond) {
    return epochSecond < Instant::MinSecond || epochSecond > Instant::MaxSecond;
  };
  if (std::any_of(standardTransitions.begin(), standardTransitions.end(),
                  outOfRange) ||
      std::any_of(savingsInstantTransitions.begin(),
                  savingsInstantTransitions.end(), outOfRange)) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("Transition outside the supported instant range")));
  }
  TEMPORA_TRY(ValidateLastRules(lastRules));

  std::vector<LocalDateTime> localTransitions;
  localTransitions.reserve(savingsInstantTransitions.size() * 2);
  for (size_t i = 0; i < savingsInstantTransitions.size(); i++) {
    ZoneOffsetTransition trans = TEMPORA_TRY(ZoneOffsetTransition::OfEpochSecond(
        savingsInstantTransitions[i], wallOffsets[i], wallOffsets[i + 1]));
    AddLocalTransitions(localTransitions, trans);
  }

  return std::shared_ptr<const ZoneRules>(new ZoneRules(
      std::move(standardTransitions), std::move(standardOffsets),
      std::move(savingsInstantTransitions), std::move(wallOffsets),
      std::move(lastRules), std::move(localTransitions)));
}

int32_t ZoneRules::FindYear(int64_t epochSecond, const ZoneOffset& offset) {
  // Clamped so that the transitions of the year and its successor can always
  // be created.
  constexpr int64_t minYear = LocalDate::MinYear + 1;
  constexpr int64_t maxYear = LocalDate::MaxYear - 1;

  int64_t localSecond = epochSecond + offset.getTotalSeconds();
  int64_t localEpochDay = FloorDiv<int64_t>(localSecond, 86400);
  int64_t year = EpochDayToIsoDate(localEpochDay).year;
  return int32_t(std::clamp(year, minYear, maxYear));
}

std::vector<ZoneOffsetTransition> ZoneRules::findTransitionArray(
    int32_t year) const {
  year = std::clamp(year, LocalDate::MinYear + 1, LocalDate::MaxYear - 1);

  std::lock_guard<std::mutex> lock(cacheLock_);
  auto cached = lastRulesCache_.find(year);
  if (cached != lastRulesCache_.end()) {
    return cached->second;
  }

  std::vector<ZoneOffsetTransition> transArray;
  transArray.reserve(lastRules_.size());
  for (const auto& rule : lastRules_) {
    transArray.push_back(TEMPORA_ALWAYS_OK(rule.createTransition(year)));
  }

  if (year < LastCachedYear) {
    LOG(("Caching %zu transitions for year %d", transArray.size(), year));
    lastRulesCache_.emplace(year, transArray);
  }
  return transArray;
}

ZoneOffset ZoneRules::getOffset(const Instant& instant) const {
  int64_t epochSec = instant.getEpochSecond();
  if (!lastRules_.empty() &&
      (savingsInstantTransitions_.empty() ||
       epochSec > savingsInstantTransitions_.back())) {
    int32_t year = FindYear(epochSec, wallOffsets_.back());
    std::vector<ZoneOffsetTransition> transArray = findTransitionArray(year);
    for (const auto& trans : transArray) {
      if (epochSec < trans.toEpochSecond()) {
        return trans.getOffsetBefore();
      }
    }
    return transArray.back().getOffsetAfter();
  }

  // Index of the last transition at or before the instant, or -1.
  auto it = std::upper_bound(savingsInstantTransitions_.begin(),
                             savingsInstantTransitions_.end(), epochSec);
  ptrdiff_t index = (it - savingsInstantTransitions_.begin()) - 1;
  return wallOffsets_[index + 1];
}

ZoneOffset ZoneRules::getOffset(const LocalDateTime& dateTime) const {
  OffsetInfo info = getOffsetInfo(dateTime);
  if (const auto* trans = std::get_if<ZoneOffsetTransition>(&info)) {
    return trans->getOffsetBefore();
  }
  return std::get<ZoneOffset>(info);
}

std::vector<ZoneOffset> ZoneRules::getValidOffsets(
    const LocalDateTime& dateTime) const {
  OffsetInfo info = getOffsetInfo(dateTime);
  if (const auto* trans = std::get_if<ZoneOffsetTransition>(&info)) {
    return trans->getValidOffsets();
  }
  return {std::get<ZoneOffset>(info)};
}

std::optional<ZoneOffsetTransition> ZoneRules::getTransition(
    const LocalDateTime& dateTime) const {
  OffsetInfo info = getOffsetInfo(dateTime);
  if (const auto* trans = std::get_if<ZoneOffsetTransition>(&info)) {
    return *trans;
  }
  return std::nullopt;
}

bool ZoneRules::isValidOffset(const LocalDateTime& dateTime,
                              const ZoneOffset& offset) const {
  std::vector<ZoneOffset> valid = getValidOffsets(dateTime);
  return std::find(valid.begin(), valid.end(), offset) != valid.end();
}

// Classifies a local date-time against a single transition.
static ZoneRules::OffsetInfo FindOffsetInfo(const LocalDateTime& dt,
                                            const ZoneOffsetTransition& trans) {
  const LocalDateTime& localTransition = trans.getDateTimeBefore();
  if (trans.isGap()) {
    if (dt.isBefore(localTransition)) {
      return trans.getOffsetBefore();
    }
    if (dt.isBefore(trans.getDateTimeAfter())) {
      return trans;
    }
    return trans.getOffsetAfter();
  }
  if (!dt.isBefore(localTransition)) {
    return trans.getOffsetAfter();
  }
  if (dt.isBefore(trans.getDateTimeAfter())) {
    return trans.getOffsetBefore();
  }
  return trans;
}

ZoneRules::OffsetInfo ZoneRules::getOffsetInfo(const LocalDateTime& dt) const {
  if (!lastRules_.empty() && (savingsLocalTransitions_.empty() ||
                              dt.isAfter(savingsLocalTransitions_.back()))) {
    std::vector<ZoneOffsetTransition> transArray =
        findTransitionArray(dt.getYear());
    OffsetInfo info = wallOffsets_.back();
    for (const auto& trans : transArray) {
      info = FindOffsetInfo(dt, trans);
      if (std::holds_alternative<ZoneOffsetTransition>(info) ||
          std::get<ZoneOffset>(info) == trans.getOffsetBefore()) {
        return info;
      }
    }
    return info;
  }

  // Index of the last local transition at or before the date-time. Equal
  // adjacent entries resolve to the later one.
  auto it = std::upper_bound(savingsLocalTransitions_.begin(),
                             savingsLocalTransitions_.end(), dt);
  ptrdiff_t index = (it - savingsLocalTransitions_.begin()) - 1;
  if (index < 0) {
    return wallOffsets_[0];
  }

  if ((index & 1) == 0) {
    // Inside a gap or overlap.
    const LocalDateTime& dtBefore = savingsLocalTransitions_[index];
    const LocalDateTime& dtAfter = savingsLocalTransitions_[index + 1];
    const ZoneOffset& offsetBefore = wallOffsets_[index / 2];
    const ZoneOffset& offsetAfter = wallOffsets_[index / 2 + 1];
    if (offsetAfter.getTotalSeconds() > offsetBefore.getTotalSeconds()) {
      return ZoneOffsetTransition(dtBefore, offsetBefore, offsetAfter);
    }
    return ZoneOffsetTransition(dtAfter, offsetBefore, offsetAfter);
  }
  return wallOffsets_[index / 2 + 1];
}

ZoneOffset ZoneRules::getStandardOffset(const Instant& instant) const {
  auto it = std::upper_bound(standardTransitions_.begin(),
                             standardTransitions_.end(),
                             instant.getEpochSecond());
  ptrdiff_t index = (it - standardTransitions_.begin()) - 1;
  return standardOffsets_[index + 1];
}

Duration ZoneRules::getDaylightSavings(const Instant& instant) const {
  ZoneOffset standardOffset = getStandardOffset(instant);
  ZoneOffset actualOffset = getOffset(instant);
  return Duration::OfSeconds(actualOffset.getTotalSeconds() -
                             standardOffset.getTotalSeconds());
}

std::optional<ZoneOffsetTransition> ZoneRules::nextTransition(
    const Instant& instant) const {
  int64_t epochSec = instant.getEpochSecond();
  if (savingsInstantTransitions_.empty() ||
      epochSec >= savingsInstantTransitions_.back()) {
    if (lastRules_.empty()) {
      return std::nullopt;
    }
    int32_t year = FindYear(epochSec, wallOffsets_.back());
    for (const auto& trans : findTransitionArray(year)) {
      if (epochSec < trans.toEpochSecond()) {
        return trans;
      }
    }
    if (year < LocalDate::MaxYear - 1) {
      return findTransitionArray(year + 1).front();
    }
    return std::nullopt;
  }

  // First transition strictly after the instant.
  auto it = std::upper_bound(savingsInstantTransitions_.begin(),
                             savingsInstantTransitions_.end(), epochSec);
  size_t index = it - savingsInstantTransitions_.begin();
  return TEMPORA_ALWAYS_OK(ZoneOffsetTransition::OfEpochSecond(
      savingsInstantTransitions_[index], wallOffsets_[index],
      wallOffsets_[index + 1]));
}

std::optional<ZoneOffsetTransition> ZoneRules::previousTransition(
    const Instant& instant) const {
  if (savingsInstantTransitions_.empty() && lastRules_.empty()) {
    return std::nullopt;
  }

  int64_t epochSec = instant.getEpochSecond();
  if (instant.getNano() > 0) {
    // The transition at the start of this second is strictly before.
    epochSec++;
  }

  if (!lastRules_.empty() && (savingsInstantTransitions_.empty() ||
                              epochSec > savingsInstantTransitions_.back())) {
    const ZoneOffset& lastHistoricOffset = wallOffsets_.back();
    int32_t year = FindYear(epochSec, lastHistoricOffset);
    std::vector<ZoneOffsetTransition> transArray = findTransitionArray(year);
    for (auto it = transArray.rbegin(); it != transArray.rend(); ++it) {
      if (epochSec > it->toEpochSecond()) {
        return *it;
      }
    }
    int32_t lastHistoricYear =
        savingsInstantTransitions_.empty()
            ? LocalDate::MinYear + 1
            : FindYear(savingsInstantTransitions_.back(), lastHistoricOffset);
    if (--year > lastHistoricYear) {
      return findTransitionArray(year).back();
    }
    if (savingsInstantTransitions_.empty()) {
      return std::nullopt;
    }
  }

  // Last transition strictly before the instant.
  auto it = std::lower_bound(savingsInstantTransitions_.begin(),
                             savingsInstantTransitions_.end(), epochSec);
  size_t index = it - savingsInstantTransitions_.begin();
  if (index == 0) {
    return std::nullopt;
  }
  return TEMPORA_ALWAYS_OK(ZoneOffsetTransition::OfEpochSecond(
      savingsInstantTransitions_[index - 1], wallOffsets_[index - 1],
      wallOffsets_[index]));
}

std::vector<ZoneOffsetTransition> ZoneRules::getTransitions() const {
  std::vector<ZoneOffsetTransition> list;
  list.reserve(savingsInstantTransitions_.size());
  for (size_t i = 0; i < savingsInstantTransitions_.size(); i++) {
    list.push_back(TEMPORA_ALWAYS_OK(ZoneOffsetTransition::OfEpochSecond(
        savingsInstantTransitions_[i], wallOffsets_[i], wallOffsets_[i + 1])));
  }
  return list;
}

bool ZoneRules::operator==(const ZoneRules& other) const {
  if (this == &other) {
    return true;
  }
  if (isFixedOffset() && other.isFixedOffset()) {
    return wallOffsets_[0] == other.wallOffsets_[0];
  }
  return standardTransitions_ == other.standardTransitions_ &&
         standardOffsets_ == other.standardOffsets_ &&
         savingsInstantTransitions_ == other.savingsInstantTransitions_ &&
         wallOffsets_ == other.wallOffsets_ && lastRules_ == other.lastRules_;
}

std::string ZoneRules::toString() const {
  if (isFixedOffset()) {
    return "FixedRules:" + wallOffsets_[0].toString();
  }
  return "ZoneRules[currentStandardOffset=" +
         standardOffsets_.back().toString() + "]";
}
