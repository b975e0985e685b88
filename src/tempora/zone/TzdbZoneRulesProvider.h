/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_TzdbZoneRulesProvider_h
#define tempora_zone_TzdbZoneRulesProvider_h

#include <stdint.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRulesProvider.h"

namespace tempora {
namespace zone {

/**
 * Provides rules from a compiled TZDB data file.
 *
 * The file starts with the format version byte 1 and the group id "TZDB",
 * followed by the version ids, the region ids, the serialized rules, and
 * for each version the (region index, rules index) pairs. Rules are shared
 * between versions and deserialized on first use.
 */
class TzdbZoneRulesProvider final : public ZoneRulesProvider {
  // A serialized blob, replaced by the rules once deserialized.
  using RuleData = std::variant<std::vector<uint8_t>, ZoneRulesPtr>;

  struct Version final {
    std::string versionId;
    // Sorted, parallel to ruleIndices.
    std::vector<std::string> regionIds;
    std::vector<uint16_t> ruleIndices;
  };

  std::set<std::string> regionIds_;
  std::map<std::string, Version> versions_;

  std::mutex ruleLock_;
  std::vector<RuleData> ruleData_;

  TzdbZoneRulesProvider() = default;

  DateTimeResult<Ok> load(const std::vector<uint8_t>& bytes);

  // The rules of `regionId` in `version`, or nullptr if it has none.
  DateTimeResult<ZoneRulesPtr> getRules(const Version& version,
                                        const std::string& regionId);
  DateTimeResult<ZoneRulesPtr> createRule(uint16_t index);

 public:
  /**
   * Reads the data file at `path`.
   */
  static DateTimeResult<std::unique_ptr<TzdbZoneRulesProvider>> Open(
      const std::string& path);

  static DateTimeResult<std::unique_ptr<TzdbZoneRulesProvider>> FromBytes(
      const std::vector<uint8_t>& bytes);

  const char* name() const override { return "TZDB"; }

  std::set<std::string> provideZoneIds() const override { return regionIds_; }

  DateTimeResult<ZoneRulesPtr> provideRules(const std::string& regionId,
                                            bool forCaching) override;

  DateTimeResult<ZoneRulesVersions> provideVersions(
      const std::string& regionId) override;

  /**
   * The version ids in the file, oldest first.
   */
  std::vector<std::string> versionIds() const;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_TzdbZoneRulesProvider_h */
