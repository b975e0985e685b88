/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/TzdbZoneRulesProvider.h"

#include <stdio.h>

#include <algorithm>

#include "tempora/DataStream.h"
#include "tempora/Logging.h"
#include "tempora/zone/ZoneRulesSerializer.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gTzdbLog("tzdb");

#define LOG(level, args) TEMPORA_LOG(gTzdbLog, LogLevel::level, args)

static DateTimeError FormatNotRecognised() {
  return DateTimeError::ZoneRulesData(std::string("File format not recognised"));
}

static DateTimeResult<std::vector<uint8_t>> ReadFile(const std::string& path) {
  FILE* fp = fopen(path.c_str(), "rb");
  if (!fp) {
    return Err(DateTimeError::ZoneRulesData(
        "Unable to load TZDB time-zone rules: " + path));
  }

  std::vector<uint8_t> bytes;
  uint8_t buffer[8192];
  size_t read;
  while ((read = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
    bytes.insert(bytes.end(), buffer, buffer + read);
  }
  bool failed = ferror(fp) != 0;
  fclose(fp);

  if (failed) {
    return Err(DateTimeError::ZoneRulesData(
        "Unable to load TZDB time-zone rules: " + path));
  }
  return bytes;
}

// Reads a non-negative two byte count.
static DateTimeResult<size_t> ReadShortCount(DataInput& in) {
  int16_t count = TEMPORA_TRY(in.readShort());
  if (count < 0) {
    return Err(FormatNotRecognised());
  }
  return size_t(count);
}

DateTimeResult<std::unique_ptr<TzdbZoneRulesProvider>>
TzdbZoneRulesProvider::Open(const std::string& path) {
  std::vector<uint8_t> bytes = TEMPORA_TRY(ReadFile(path));
  LOG(Info, ("Loading %zu bytes of TZDB data from %s", bytes.size(),
             path.c_str()));
  return FromBytes(bytes);
}

DateTimeResult<std::unique_ptr<TzdbZoneRulesProvider>>
TzdbZoneRulesProvider::FromBytes(const std::vector<uint8_t>& bytes) {
  std::unique_ptr<TzdbZoneRulesProvider> provider(new TzdbZoneRulesProvider());
  TEMPORA_TRY(provider->load(bytes));
  if (provider->versions_.empty()) {
    return Err(DateTimeError::ZoneRulesData(
        std::string("No time-zone rules found for 'TZDB'")));
  }
  return provider;
}

DateTimeResult<Ok> TzdbZoneRulesProvider::load(
    const std::vector<uint8_t>& bytes) {
  DataInput in(bytes);
  if (TEMPORA_TRY(in.readByte()) != 1) {
    return Err(FormatNotRecognised());
  }
  std::string groupId = TEMPORA_TRY(in.readUTF());
  if (groupId != "TZDB") {
    return Err(FormatNotRecognised());
  }

  size_t versionCount = TEMPORA_TRY(ReadShortCount(in));
  std::vector<std::string> versionArray;
  versionArray.reserve(versionCount);
  for (size_t i = 0; i < versionCount; i++) {
    versionArray.push_back(TEMPORA_TRY(in.readUTF()));
  }

  size_t regionCount = TEMPORA_TRY(ReadShortCount(in));
  std::vector<std::string> regionArray;
  regionArray.reserve(regionCount);
  for (size_t i = 0; i < regionCount; i++) {
    regionArray.push_back(TEMPORA_TRY(in.readUTF()));
  }

  size_t ruleCount = TEMPORA_TRY(ReadShortCount(in));
  std::vector<RuleData> ruleArray;
  ruleArray.reserve(ruleCount);
  for (size_t i = 0; i < ruleCount; i++) {
    size_t length = TEMPORA_TRY(ReadShortCount(in));
    ruleArray.emplace_back(TEMPORA_TRY(in.readBytes(length)));
  }

  std::map<std::string, Version> versions;
  for (size_t i = 0; i < versionCount; i++) {
    size_t versionRegionCount = TEMPORA_TRY(ReadShortCount(in));
    std::vector<std::pair<std::string, uint16_t>> entries;
    entries.reserve(versionRegionCount);
    for (size_t j = 0; j < versionRegionCount; j++) {
      size_t regionIndex = TEMPORA_TRY(ReadShortCount(in));
      size_t ruleIndex = TEMPORA_TRY(ReadShortCount(in));
      if (regionIndex >= regionCount || ruleIndex >= ruleCount) {
        return Err(FormatNotRecognised());
      }
      entries.emplace_back(regionArray[regionIndex], uint16_t(ruleIndex));
    }
    std::sort(entries.begin(), entries.end());

    Version version;
    version.versionId = versionArray[i];
    for (auto& entry : entries) {
      version.regionIds.push_back(std::move(entry.first));
      version.ruleIndices.push_back(entry.second);
    }
    if (!versions.emplace(versionArray[i], std::move(version)).second) {
      return Err(DateTimeError::ZoneRulesData(
          "Data already loaded for TZDB time-zone rules version: " +
          versionArray[i]));
    }
  }

  regionIds_.insert(regionArray.begin(), regionArray.end());
  versions_ = std::move(versions);
  ruleData_ = std::move(ruleArray);

  LOG(Debug, ("Loaded %zu versions, %zu regions and %zu rules",
              versionCount, regionCount, ruleCount));
  return Ok();
}

DateTimeResult<ZoneRulesPtr> TzdbZoneRulesProvider::createRule(
    uint16_t index) {
  std::lock_guard<std::mutex> lock(ruleLock_);
  RuleData& data = ruleData_[index];
  if (auto* rules = std::get_if<ZoneRulesPtr>(&data)) {
    return *rules;
  }

  const auto& bytes = std::get<std::vector<uint8_t>>(data);
  DataInput in(bytes);
  ZoneRulesPtr rules = TEMPORA_TRY(ReadZoneRules(in));
  LOG(Verbose, ("Deserialized rules %u", unsigned(index)));
  data = rules;
  return rules;
}

DateTimeResult<ZoneRulesPtr> TzdbZoneRulesProvider::getRules(
    const Version& version, const std::string& regionId) {
  auto it = std::lower_bound(version.regionIds.begin(),
                             version.regionIds.end(), regionId);
  if (it == version.regionIds.end() || *it != regionId) {
    return ZoneRulesPtr();
  }

  uint16_t index = version.ruleIndices[it - version.regionIds.begin()];
  auto rules = createRule(index);
  if (rules.isErr()) {
    return Err(DateTimeError::ZoneRulesData(
        "Invalid binary time-zone data: TZDB:" + regionId +
        ", version: " + version.versionId + ": " +
        rules.inspectErr().message()));
  }
  return rules.unwrap();
}

DateTimeResult<ZoneRulesPtr> TzdbZoneRulesProvider::provideRules(
    const std::string& regionId, bool forCaching) {
  const Version& latest = versions_.rbegin()->second;
  ZoneRulesPtr rules = TEMPORA_TRY(getRules(latest, regionId));
  if (!rules) {
    return Err(DateTimeError::UnknownZone("Unknown time-zone ID: " + regionId));
  }
  return rules;
}

DateTimeResult<ZoneRulesVersions> TzdbZoneRulesProvider::provideVersions(
    const std::string& regionId) {
  ZoneRulesVersions map;
  for (const auto& [versionId, version] : versions_) {
    ZoneRulesPtr rules = TEMPORA_TRY(getRules(version, regionId));
    if (rules) {
      map.emplace(versionId, std::move(rules));
    }
  }
  return map;
}

std::vector<std::string> TzdbZoneRulesProvider::versionIds() const {
  std::vector<std::string> ids;
  for (const auto& entry : versions_) {
    ids.push_back(entry.first);
  }
  return ids;
}
