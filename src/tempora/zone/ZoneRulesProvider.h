/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_zone_ZoneRulesProvider_h
#define tempora_zone_ZoneRulesProvider_h

#include <map>
#include <memory>
#include <set>
#include <string>

#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRules.h"

namespace tempora {
namespace zone {

using ZoneRulesPtr = std::shared_ptr<const ZoneRules>;

// Rules of one region keyed by data version, oldest first.
using ZoneRulesVersions = std::map<std::string, ZoneRulesPtr>;

/**
 * A source of time-zone rules, registered with a ZoneRulesRegistry.
 *
 * Implementations must be safe to call from multiple threads.
 */
class ZoneRulesProvider {
 public:
  virtual ~ZoneRulesProvider() = default;

  /**
   * Short name used in logs and error messages.
   */
  virtual const char* name() const = 0;

  /**
   * The region ids this provider has rules for. The set must not change
   * after the provider was registered.
   */
  virtual std::set<std::string> provideZoneIds() const = 0;

  /**
   * Rules of `regionId`. `forCaching` is true when the caller will keep the
   * rules for a long time, in which case a provider with dynamic rules
   * should return the rules of the newest version.
   */
  virtual DateTimeResult<ZoneRulesPtr> provideRules(
      const std::string& regionId, bool forCaching) = 0;

  /**
   * Every version of the rules this provider has for `regionId`.
   */
  virtual DateTimeResult<ZoneRulesVersions> provideVersions(
      const std::string& regionId) = 0;

  /**
   * Check for updated rules. Returns true if the rules changed.
   */
  virtual bool provideRefresh() { return false; }
};

}  // namespace zone
}  // namespace tempora

#endif /* tempora_zone_ZoneRulesProvider_h */
