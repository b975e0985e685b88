/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneRulesRegistry_h
#define tempora_zone_ZoneRulesRegistry_h

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRulesProvider.h"

namespace tempora {
namespace zone {

/**
 * Which providers ZoneRulesRegistry::CreateDefault registers.
 */
struct RegistryConfig final {
  // Compiled TZDB data file, registered before the ICU database.
  std::optional<std::string> tzdbPath;
  bool useIcu = true;

  /**
   * TEMPORA_TZDB_PATH names the TZDB data file. TEMPORA_DISABLE_ICU=1
   * disables the ICU provider.
   */
  static RegistryConfig FromEnvironment();
};

/**
 * Maps region ids to the provider that owns them.
 *
 * Each id belongs to exactly one provider. Lookups take a shared lock, so
 * concurrent readers never block each other; registration takes the
 * exclusive lock.
 */
class ZoneRulesRegistry final {
  mutable std::shared_mutex lock_;
  std::vector<std::shared_ptr<ZoneRulesProvider>> providers_;
  std::map<std::string, std::shared_ptr<ZoneRulesProvider>> zones_;

  DateTimeResult<std::shared_ptr<ZoneRulesProvider>> getProvider(
      const std::string& zoneId) const;

 public:
  ZoneRulesRegistry() = default;
  ZoneRulesRegistry(const ZoneRulesRegistry&) = delete;
  ZoneRulesRegistry& operator=(const ZoneRulesRegistry&) = delete;

  /**
   * A registry with the providers selected by `config`.
   */
  static DateTimeResult<std::unique_ptr<ZoneRulesRegistry>> CreateDefault(
      const RegistryConfig& config);

  /**
   * Registers all ids of `provider`. Fails without registering anything if
   * one of them is already registered.
   */
  DateTimeResult<Ok> registerProvider(
      std::shared_ptr<ZoneRulesProvider> provider);

  std::set<std::string> getAvailableZoneIds() const;

  bool isEmpty() const;

  DateTimeResult<ZoneRulesPtr> getRules(const std::string& zoneId,
                                        bool forCaching) const;

  DateTimeResult<ZoneRulesVersions> getVersions(
      const std::string& zoneId) const;

  /**
   * Asks every provider to refresh its rules. Returns true if any changed.
   */
  bool refresh();
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneRulesRegistry_h */
