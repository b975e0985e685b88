/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_TzdbDataWriter_h
#define tempora_zone_TzdbDataWriter_h

#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRulesProvider.h"

namespace tempora {
namespace zone {

// Region id to rules, for one data version.
using ZoneRulesByRegion = std::map<std::string, ZoneRulesPtr>;

/**
 * Encodes the rules of one or more data versions in the format read by
 * TzdbZoneRulesProvider. Identical rules are stored once.
 */
DateTimeResult<std::vector<uint8_t>> WriteTzdbData(
    const std::map<std::string, ZoneRulesByRegion>& versions);

/**
 * Writes WriteTzdbData's output to `path`.
 */
DateTimeResult<Ok> WriteTzdbFile(
    const std::string& path,
    const std::map<std::string, ZoneRulesByRegion>& versions);

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_TzdbDataWriter_h */
