/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_IcuZoneRulesProvider_h
#define tempora_zone_IcuZoneRulesProvider_h

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRulesProvider.h"

namespace tempora {
namespace zone {

/**
 * Provides rules from the time-zone data built into ICU.
 *
 * ICU's historic transitions become the transition lists and its final
 * annual rules become the last rules. Rules are built on first request and
 * cached for the lifetime of the provider.
 */
class IcuZoneRulesProvider final : public ZoneRulesProvider {
  std::set<std::string> zoneIds_;
  std::string version_;

  std::mutex cacheLock_;
  std::map<std::string, ZoneRulesPtr> cache_;

  IcuZoneRulesProvider(std::set<std::string> zoneIds, std::string version)
      : zoneIds_(std::move(zoneIds)), version_(std::move(version)) {}

 public:
  /**
   * Creates a provider for every ICU zone id not in `excludedIds`.
   */
  static DateTimeResult<std::unique_ptr<IcuZoneRulesProvider>> Create(
      const std::set<std::string>& excludedIds = {});

  /**
   * Converts the ICU zone `zoneId` to rules, without caching.
   */
  static DateTimeResult<ZoneRulesPtr> BuildRules(const std::string& zoneId);

  // ICU's TZDB version, such as "2024a".
  const std::string& version() const { return version_; }

  const char* name() const override { return "ICU"; }

  std::set<std::string> provideZoneIds() const override { return zoneIds_; }

  DateTimeResult<ZoneRulesPtr> provideRules(const std::string& regionId,
                                            bool forCaching) override;

  DateTimeResult<ZoneRulesVersions> provideVersions(
      const std::string& regionId) override;
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_IcuZoneRulesProvider_h */
