/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/zone/ZoneRulesRegistry.h"

#include <stdlib.h>
#include <string.h>

#include <mutex>

#include "tempora/Logging.h"
#include "tempora/zone/IcuZoneRulesProvider.h"
#include "tempora/zone/TzdbZoneRulesProvider.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gRegistryLog("registry");

#define LOG(level, args) TEMPORA_LOG(gRegistryLog, LogLevel::level, args)

RegistryConfig RegistryConfig::FromEnvironment() {
  RegistryConfig config;
  if (const char* path = getenv("TEMPORA_TZDB_PATH"); path && *path) {
    config.tzdbPath = path;
  }
  if (const char* disable = getenv("TEMPORA_DISABLE_ICU");
      disable && strcmp(disable, "1") == 0) {
    config.useIcu = false;
  }
  return config;
}

DateTimeResult<std::unique_ptr<ZoneRulesRegistry>>
ZoneRulesRegistry::CreateDefault(const RegistryConfig& config) {
  auto registry = std::make_unique<ZoneRulesRegistry>();

  std::set<std::string> tzdbIds;
  if (config.tzdbPath) {
    std::shared_ptr<ZoneRulesProvider> tzdb =
        TEMPORA_TRY(TzdbZoneRulesProvider::Open(*config.tzdbPath));
    tzdbIds = tzdb->provideZoneIds();
    TEMPORA_TRY(registry->registerProvider(std::move(tzdb)));
  }

  if (config.useIcu) {
    // Ids already served by the data file stay with it.
    std::shared_ptr<ZoneRulesProvider> icu =
        TEMPORA_TRY(IcuZoneRulesProvider::Create(tzdbIds));
    TEMPORA_TRY(registry->registerProvider(std::move(icu)));
  }

  return registry;
}

DateTimeResult<Ok> ZoneRulesRegistry::registerProvider(
    std::shared_ptr<ZoneRulesProvider> provider) {
  if (!provider) {
    return Err(DateTimeError::NullArgument("provider"));
  }

  std::set<std::string> ids = provider->provideZoneIds();

  std::unique_lock lock(lock_);
  for (const auto& id : ids) {
    if (zones_.count(id)) {
      return Err(DateTimeError::ZoneRulesData(
          "Unable to register zone as one already registered with that ID: " +
          id + ", currently loading from provider: " + provider->name()));
    }
  }
  for (const auto& id : ids) {
    zones_.emplace(id, provider);
  }
  providers_.push_back(provider);

  LOG(Info, ("Registered provider %s with %zu zones", provider->name(),
             ids.size()));
  return Ok();
}

std::set<std::string> ZoneRulesRegistry::getAvailableZoneIds() const {
  std::shared_lock lock(lock_);
  std::set<std::string> ids;
  for (const auto& entry : zones_) {
    ids.insert(ids.end(), entry.first);
  }
  return ids;
}

bool ZoneRulesRegistry::isEmpty() const {
  std::shared_lock lock(lock_);
  return zones_.empty();
}

DateTimeResult<std::shared_ptr<ZoneRulesProvider>>
ZoneRulesRegistry::getProvider(const std::string& zoneId) const {
  std::shared_lock lock(lock_);
  auto entry = zones_.find(zoneId);
  if (entry == zones_.end()) {
    if (zones_.empty()) {
      return Err(DateTimeError::ZoneRulesData(
          std::string("No time-zone data files registered")));
    }
    return Err(DateTimeError::UnknownZone("Unknown time-zone ID: " + zoneId));
  }
  return entry->second;
}

DateTimeResult<ZoneRulesPtr> ZoneRulesRegistry::getRules(
    const std::string& zoneId, bool forCaching) const {
  std::shared_ptr<ZoneRulesProvider> provider =
      TEMPORA_TRY(getProvider(zoneId));
  return provider->provideRules(zoneId, forCaching);
}

DateTimeResult<ZoneRulesVersions> ZoneRulesRegistry::getVersions(
    const std::string& zoneId) const {
  std::shared_ptr<ZoneRulesProvider> provider =
      TEMPORA_TRY(getProvider(zoneId));
  return provider->provideVersions(zoneId);
}

bool ZoneRulesRegistry::refresh() {
  std::vector<std::shared_ptr<ZoneRulesProvider>> providers;
  {
    std::shared_lock lock(lock_);
    providers = providers_;
  }

  bool changed = false;
  for (const auto& provider : providers) {
    if (provider->provideRefresh()) {
      LOG(Info, ("Provider %s refreshed its rules", provider->name()));
      changed = true;
    }
  }
  return changed;
}
