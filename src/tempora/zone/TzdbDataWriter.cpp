/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/TzdbDataWriter.h"

#include <stdio.h>

#include <algorithm>
#include <set>

#include "tempora/DataStream.h"
#include "tempora/Logging.h"
#include "tempora/zone/ZoneRulesSerializer.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gTzdbLog("tzdb");

// Counts and indices are stored as signed shorts.
static constexpr size_t MaxShortCount = INT16_MAX;

static DateTimeError TooLarge(const char* what) {
  return DateTimeError::ZoneRulesData(std::string("Too many ") + what +
                                      " for the TZDB format");
}

DateTimeResult<std::vector<uint8_t>> tempora::zone::WriteTzdbData(
    const std::map<std::string, ZoneRulesByRegion>& versions) {
  std::set<std::string> allRegionIds;
  for (const auto& version : versions) {
    for (const auto& region : version.second) {
      allRegionIds.insert(region.first);
    }
  }
  std::vector<std::string> regionArray(allRegionIds.begin(),
                                       allRegionIds.end());

  // Serialized rules, deduplicated by their encoding.
  std::vector<std::vector<uint8_t>> ruleBlobs;
  std::map<std::vector<uint8_t>, size_t> blobIndices;
  std::map<std::string, std::vector<std::pair<size_t, size_t>>> versionEntries;
  for (const auto& [versionId, regions] : versions) {
    auto& entries = versionEntries[versionId];
    for (const auto& [regionId, rules] : regions) {
      if (!rules) {
        return Err(DateTimeError::NullArgument("rules"));
      }
      DataOutput blob;
      WriteZoneRules(*rules, blob);
      std::vector<uint8_t> bytes = blob.takeBytes();
      if (bytes.size() > MaxShortCount) {
        return Err(DateTimeError::ZoneRulesData(
            "Rules too large for the TZDB format: " + regionId));
      }

      auto [it, inserted] = blobIndices.emplace(bytes, ruleBlobs.size());
      if (inserted) {
        ruleBlobs.push_back(std::move(bytes));
      }
      size_t regionIndex =
          std::lower_bound(regionArray.begin(), regionArray.end(), regionId) -
          regionArray.begin();
      entries.emplace_back(regionIndex, it->second);
    }
  }

  if (versions.size() > MaxShortCount) {
    return Err(TooLarge("versions"));
  }
  if (regionArray.size() > MaxShortCount) {
    return Err(TooLarge("regions"));
  }
  if (ruleBlobs.size() > MaxShortCount) {
    return Err(TooLarge("rules"));
  }

  DataOutput out;
  out.writeByte(1);
  TEMPORA_TRY(out.writeUTF("TZDB"));
  out.writeShort(int32_t(versions.size()));
  for (const auto& version : versions) {
    TEMPORA_TRY(out.writeUTF(version.first));
  }
  out.writeShort(int32_t(regionArray.size()));
  for (const auto& regionId : regionArray) {
    TEMPORA_TRY(out.writeUTF(regionId));
  }
  out.writeShort(int32_t(ruleBlobs.size()));
  for (const auto& blob : ruleBlobs) {
    out.writeShort(int32_t(blob.size()));
    out.writeBytes(blob.data(), blob.size());
  }
  for (const auto& version : versions) {
    const auto& entries = versionEntries[version.first];
    out.writeShort(int32_t(entries.size()));
    for (const auto& [regionIndex, ruleIndex] : entries) {
      out.writeShort(int32_t(regionIndex));
      out.writeShort(int32_t(ruleIndex));
    }
  }

  TEMPORA_LOG(gTzdbLog, LogLevel::Debug,
              ("Encoded %zu versions, %zu regions and %zu distinct rules",
               versions.size(), regionArray.size(), ruleBlobs.size()));
  return out.takeBytes();
}

DateTimeResult<Ok> tempora::zone::WriteTzdbFile(
    const std::string& path,
    const std::map<std::string, ZoneRulesByRegion>& versions) {
  std::vector<uint8_t> bytes = TEMPORA_TRY(WriteTzdbData(versions));

  FILE* fp = fopen(path.c_str(), "wb");
  if (!fp) {
    return Err(DateTimeError::ZoneRulesData("Unable to open " + path));
  }
  bool ok = fwrite(bytes.data(), 1, bytes.size(), fp) == bytes.size();
  ok = fclose(fp) == 0 && ok;
  if (!ok) {
    return Err(DateTimeError::ZoneRulesData("Unable to write " + path));
  }

  TEMPORA_LOG(gTzdbLog, LogLevel::Info,
              ("Wrote %zu bytes of TZDB data to %s", bytes.size(),
               path.c_str()));
  return Ok();
}
