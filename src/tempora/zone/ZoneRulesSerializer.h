/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/*
 * Compact binary form of zone rules, as stored in TZDB data files.
 *
 * Epoch seconds that are multiples of 900 between 1825 and 2300 take three
 * bytes, others 0xFF followed by eight bytes. Offsets that are multiples of
 * 900 seconds take one byte, others 0x7F followed by four bytes. A
 * transition rule packs into four bytes when its time is on the hour and
 * its offsets are simple.
 */

#ifndef tempora_zone_ZoneRulesSerializer_h
#define tempora_zone_ZoneRulesSerializer_h

#include <stdint.h>

#include <memory>

#include "tempora/DataStream.h"
#include "tempora/DateTimeError.h"
#include "tempora/ZoneOffset.h"
#include "tempora/zone/ZoneOffsetTransition.h"
#include "tempora/zone/ZoneOffsetTransitionRule.h"
#include "tempora/zone/ZoneRules.h"

namespace tempora {
namespace zone {

// Leading type byte of each serialized object.
enum class ZoneSerType : uint8_t {
  Rules = 1,
  Transition = 2,
  TransitionRule = 3,
};

void WriteEpochSec(int64_t epochSecond, DataOutput& out);
DateTimeResult<int64_t> ReadEpochSec(DataInput& in);

void WriteOffset(const ZoneOffset& offset, DataOutput& out);
DateTimeResult<ZoneOffset> ReadOffset(DataInput& in);

void WriteTransitionRule(const ZoneOffsetTransitionRule& rule,
                         DataOutput& out);
DateTimeResult<ZoneOffsetTransitionRule> ReadTransitionRule(DataInput& in);

void WriteTransition(const ZoneOffsetTransition& transition, DataOutput& out);
DateTimeResult<ZoneOffsetTransition> ReadTransition(DataInput& in);

void WriteRulesBody(const ZoneRules& rules, DataOutput& out);
DateTimeResult<std::shared_ptr<const ZoneRules>> ReadRulesBody(DataInput& in);

/**
 * Writes the type byte followed by the object.
 */
void WriteZoneRules(const ZoneRules& rules, DataOutput& out);

/**
 * Reads zone rules written by WriteZoneRules.
 */
DateTimeResult<std::shared_ptr<const ZoneRules>> ReadZoneRules(DataInput& in);

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneRulesSerializer_h */
