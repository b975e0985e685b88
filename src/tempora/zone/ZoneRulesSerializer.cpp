/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneRulesSerializer.h"

#include <vector>

#include "tempora/LocalTime.h"

using namespace tempora;
using namespace tempora::zone;

// 1825-01-01T00:00Z and 2300-01-01T00:00Z.
static constexpr int64_t CompactEpochSecMin = -4575744000LL;
static constexpr int64_t CompactEpochSecLimit = 10413792000LL;

static DateTimeError CorruptData(const char* what) {
  return DateTimeError::ZoneRulesData(std::string("Invalid binary time-zone "
                                                  "data: ") +
                                      what);
}

void tempora::zone::WriteEpochSec(int64_t epochSecond, DataOutput& out) {
  if (epochSecond >= CompactEpochSecMin &&
      epochSecond < CompactEpochSecLimit && epochSecond % 900 == 0) {
    int32_t store = int32_t((epochSecond - CompactEpochSecMin) / 900);
    out.writeByte((store >> 16) & 255);
    out.writeByte((store >> 8) & 255);
    out.writeByte(store & 255);
  } else {
    out.writeByte(255);
    out.writeLong(epochSecond);
  }
}

DateTimeResult<int64_t> tempora::zone::ReadEpochSec(DataInput& in) {
  int32_t hiByte = TEMPORA_TRY(in.readUnsignedByte());
  if (hiByte == 255) {
    return in.readLong();
  }
  int32_t midByte = TEMPORA_TRY(in.readUnsignedByte());
  int32_t loByte = TEMPORA_TRY(in.readUnsignedByte());
  int64_t total = (int64_t(hiByte) << 16) + (midByte << 8) + loByte;
  return total * 900 + CompactEpochSecMin;
}

void tempora::zone::WriteOffset(const ZoneOffset& offset, DataOutput& out) {
  int32_t offsetSecs = offset.getTotalSeconds();
  int32_t offsetByte = offsetSecs % 900 == 0 ? offsetSecs / 900 : 127;
  out.writeByte(offsetByte);
  if (offsetByte == 127) {
    out.writeInt(offsetSecs);
  }
}

DateTimeResult<ZoneOffset> tempora::zone::ReadOffset(DataInput& in) {
  int32_t offsetByte = TEMPORA_TRY(in.readByte());
  if (offsetByte == 127) {
    return ZoneOffset::OfTotalSeconds(TEMPORA_TRY(in.readInt()));
  }
  return ZoneOffset::OfTotalSeconds(offsetByte * 900);
}

void tempora::zone::WriteTransitionRule(const ZoneOffsetTransitionRule& rule,
                                        DataOutput& out) {
  int32_t timeSecs = rule.isMidnightEndOfDay()
                         ? LocalTime::SecondsPerDay
                         : rule.getLocalTime().toSecondOfDay();
  int32_t stdOffset = rule.getStandardOffset().getTotalSeconds();
  int32_t beforeDiff = rule.getOffsetBefore().getTotalSeconds() - stdOffset;
  int32_t afterDiff = rule.getOffsetAfter().getTotalSeconds() - stdOffset;

  int32_t timeByte =
      timeSecs % 3600 == 0
          ? (rule.isMidnightEndOfDay() ? 24 : rule.getLocalTime().getHour())
          : 31;
  int32_t stdOffsetByte = stdOffset % 900 == 0 ? stdOffset / 900 + 128 : 255;
  auto diffByte = [](int32_t diff) {
    return (diff == 0 || diff == 1800 || diff == 3600) ? diff / 1800 : 3;
  };
  int32_t beforeByte = diffByte(beforeDiff);
  int32_t afterByte = diffByte(afterDiff);
  int32_t dowByte = rule.getDayOfWeek() ? int32_t(*rule.getDayOfWeek()) : 0;

  uint32_t packed = (uint32_t(rule.getMonth()) << 28) +
                    (uint32_t(rule.getDayOfMonthIndicator() + 32) << 22) +
                    (uint32_t(dowByte) << 19) + (uint32_t(timeByte) << 14) +
                    (uint32_t(rule.getTimeDefinition()) << 12) +
                    (uint32_t(stdOffsetByte) << 4) +
                    (uint32_t(beforeByte) << 2) + uint32_t(afterByte);
  out.writeInt(int32_t(packed));
  if (timeByte == 31) {
    out.writeInt(timeSecs);
  }
  if (stdOffsetByte == 255) {
    out.writeInt(stdOffset);
  }
  if (beforeByte == 3) {
    out.writeInt(rule.getOffsetBefore().getTotalSeconds());
  }
  if (afterByte == 3) {
    out.writeInt(rule.getOffsetAfter().getTotalSeconds());
  }
}

DateTimeResult<ZoneOffsetTransitionRule> tempora::zone::ReadTransitionRule(
    DataInput& in) {
  uint32_t data = uint32_t(TEMPORA_TRY(in.readInt()));
  Month month = TEMPORA_TRY(MonthOf(int32_t(data >> 28)));
  int32_t dom = int32_t((data >> 22) & 63) - 32;
  int32_t dowByte = int32_t((data >> 19) & 7);
  std::optional<DayOfWeek> dow;
  if (dowByte != 0) {
    dow = TEMPORA_TRY(DayOfWeekOf(dowByte));
  }
  int32_t timeByte = int32_t((data >> 14) & 31);
  int32_t defnByte = int32_t((data >> 12) & 3);
  if (defnByte > int32_t(TimeDefinition::Standard)) {
    return Err(CorruptData("time definition"));
  }
  TimeDefinition defn = TimeDefinition(defnByte);
  int32_t stdByte = int32_t((data >> 4) & 255);
  int32_t beforeByte = int32_t((data >> 2) & 3);
  int32_t afterByte = int32_t(data & 3);

  LocalTime time;
  if (timeByte == 31) {
    time = TEMPORA_TRY(LocalTime::OfSecondOfDay(TEMPORA_TRY(in.readInt())));
  } else {
    time = TEMPORA_TRY(LocalTime::Of(timeByte % 24, 0));
  }
  int32_t stdSeconds;
  if (stdByte == 255) {
    stdSeconds = TEMPORA_TRY(in.readInt());
  } else {
    stdSeconds = (stdByte - 128) * 900;
  }
  ZoneOffset standard = TEMPORA_TRY(ZoneOffset::OfTotalSeconds(stdSeconds));
  auto readDiffOffset = [&](int32_t byte) -> DateTimeResult<ZoneOffset> {
    if (byte == 3) {
      return ZoneOffset::OfTotalSeconds(TEMPORA_TRY(in.readInt()));
    }
    return ZoneOffset::OfTotalSeconds(standard.getTotalSeconds() + byte * 1800);
  };
  ZoneOffset before = TEMPORA_TRY(readDiffOffset(beforeByte));
  ZoneOffset after = TEMPORA_TRY(readDiffOffset(afterByte));
  return ZoneOffsetTransitionRule::Of(month, dom, dow, time, timeByte == 24,
                                      defn, standard, before, after);
}

void tempora::zone::WriteTransition(const ZoneOffsetTransition& transition,
                                    DataOutput& out) {
  WriteEpochSec(transition.toEpochSecond(), out);
  WriteOffset(transition.getOffsetBefore(), out);
  WriteOffset(transition.getOffsetAfter(), out);
}

DateTimeResult<ZoneOffsetTransition> tempora::zone::ReadTransition(
    DataInput& in) {
  int64_t epochSecond = TEMPORA_TRY(ReadEpochSec(in));
  ZoneOffset before = TEMPORA_TRY(ReadOffset(in));
  ZoneOffset after = TEMPORA_TRY(ReadOffset(in));
  return ZoneOffsetTransition::OfEpochSecond(epochSecond, before, after);
}

void tempora::zone::WriteRulesBody(const ZoneRules& rules, DataOutput& out) {
  out.writeInt(int32_t(rules.standardTransitions().size()));
  for (int64_t trans : rules.standardTransitions()) {
    WriteEpochSec(trans, out);
  }
  for (const ZoneOffset& offset : rules.standardOffsets()) {
    WriteOffset(offset, out);
  }
  out.writeInt(int32_t(rules.savingsInstantTransitions().size()));
  for (int64_t trans : rules.savingsInstantTransitions()) {
    WriteEpochSec(trans, out);
  }
  for (const ZoneOffset& offset : rules.wallOffsets()) {
    WriteOffset(offset, out);
  }
  out.writeByte(int32_t(rules.getTransitionRules().size()));
  for (const auto& rule : rules.getTransitionRules()) {
    WriteTransitionRule(rule, out);
  }
}

// Reads a count that is followed by at least `count` bytes.
static DateTimeResult<size_t> ReadCount(DataInput& in) {
  int32_t count = TEMPORA_TRY(in.readInt());
  if (count < 0 || size_t(count) > in.remaining()) {
    return Err(CorruptData("element count"));
  }
  return size_t(count);
}

DateTimeResult<std::shared_ptr<const ZoneRules>> tempora::zone::ReadRulesBody(
    DataInput& in) {
  size_t stdSize = TEMPORA_TRY(ReadCount(in));
  std::vector<int64_t> stdTrans;
  stdTrans.reserve(stdSize);
  for (size_t i = 0; i < stdSize; i++) {
    stdTrans.push_back(TEMPORA_TRY(ReadEpochSec(in)));
  }
  std::vector<ZoneOffset> stdOffsets;
  stdOffsets.reserve(stdSize + 1);
  for (size_t i = 0; i < stdSize + 1; i++) {
    stdOffsets.push_back(TEMPORA_TRY(ReadOffset(in)));
  }

  size_t savSize = TEMPORA_TRY(ReadCount(in));
  std::vector<int64_t> savTrans;
  savTrans.reserve(savSize);
  for (size_t i = 0; i < savSize; i++) {
    savTrans.push_back(TEMPORA_TRY(ReadEpochSec(in)));
  }
  std::vector<ZoneOffset> savOffsets;
  savOffsets.reserve(savSize + 1);
  for (size_t i = 0; i < savSize + 1; i++) {
    savOffsets.push_back(TEMPORA_TRY(ReadOffset(in)));
  }

  int32_t ruleSize = TEMPORA_TRY(in.readByte());
  if (ruleSize < 0 || size_t(ruleSize) > ZoneRules::MaxLastRules) {
    return Err(CorruptData("rule count"));
  }
  std::vector<ZoneOffsetTransitionRule> rules;
  rules.reserve(ruleSize);
  for (int32_t i = 0; i < ruleSize; i++) {
    rules.push_back(TEMPORA_TRY(ReadTransitionRule(in)));
  }

  return ZoneRules::FromArrays(std::move(stdTrans), std::move(stdOffsets),
                               std::move(savTrans), std::move(savOffsets),
                               std::move(rules));
}

void tempora::zone::WriteZoneRules(const ZoneRules& rules, DataOutput& out) {
  out.writeByte(int32_t(ZoneSerType::Rules));
  WriteRulesBody(rules, out);
}

DateTimeResult<std::shared_ptr<const ZoneRules>> tempora::zone::ReadZoneRules(
    DataInput& in) {
  int32_t type = TEMPORA_TRY(in.readByte());
  if (type != int32_t(ZoneSerType::Rules)) {
    return Err(CorruptData("unknown serialized type"));
  }
  return ReadRulesBody(in);
}
