/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_ZoneId_h
#define tempora_ZoneId_h

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tempora/DateTimeError.h"
#include "tempora/ZoneOffset.h"

namespace tempora {

namespace zone {
class ZoneRules;
class ZoneRulesRegistry;
}  // namespace zone

/**
 * A time-zone identifier together with the rules it resolves to.
 *
 * A ZoneId is either an offset id ("Z", "+01:00"), whose rules are fixed,
 * or a region id ("Europe/Paris", "UTC", "GMT+02:00"), whose rules were
 * looked up in a ZoneRulesRegistry when the id was created. Two ids are
 * equal when their id strings are equal.
 */
class ZoneId final {
  std::string id_;
  std::optional<ZoneOffset> offset_;
  std::shared_ptr<const zone::ZoneRules> rules_;

  ZoneId(std::string id, std::optional<ZoneOffset> offset,
         std::shared_ptr<const zone::ZoneRules> rules)
      : id_(std::move(id)), offset_(offset), rules_(std::move(rules)) {}

  static ZoneId FixedRegion(std::string id, const ZoneOffset& offset);
  static DateTimeResult<ZoneId> OfRegion(
      const std::string& id, const zone::ZoneRulesRegistry& registry);
  static DateTimeResult<ZoneId> OfPrefixed(std::string_view id,
                                           size_t prefixLength);

 public:
  /**
   * The zone id of a fixed offset. The id is the offset id.
   */
  static ZoneId Of(const ZoneOffset& offset);

  /**
   * Parse a zone id. Offsets ("Z", "+01:00") and prefixed offsets
   * ("UTC", "GMT+01:00", "UT-05") never consult the registry, region ids
   * must be known to it.
   */
  static DateTimeResult<ZoneId> Of(std::string_view id,
                                   const zone::ZoneRulesRegistry& registry);

  /**
   * Like Of, but first replaces `id` by its entry in `aliasMap`, if any.
   */
  static DateTimeResult<ZoneId> Of(
      std::string_view id, const std::map<std::string, std::string>& aliasMap,
      const zone::ZoneRulesRegistry& registry);

  /**
   * An offset id qualified by a "UTC", "GMT" or "UT" prefix. An empty prefix
   * returns the plain offset id.
   */
  static DateTimeResult<ZoneId> OfOffset(std::string_view prefix,
                                         const ZoneOffset& offset);

  /**
   * The classic three letter ids mapped to full region or offset ids.
   */
  static const std::map<std::string, std::string>& ShortIds();

  /**
   * True if `id` has the syntax of a region id.
   */
  static bool IsValidRegionId(std::string_view id);

  const std::string& getId() const { return id_; }

  /**
   * The offset if this is an offset id.
   */
  const std::optional<ZoneOffset>& asOffset() const { return offset_; }
  bool isOffset() const { return offset_.has_value(); }

  const zone::ZoneRules& getRules() const { return *rules_; }
  const std::shared_ptr<const zone::ZoneRules>& getRulesPtr() const {
    return rules_;
  }

  /**
   * The equivalent offset id if the rules are fixed, otherwise this id.
   */
  ZoneId normalized() const;

  bool operator==(const ZoneId& other) const { return id_ == other.id_; }
  bool operator!=(const ZoneId& other) const { return id_ != other.id_; }

  std::string toString() const { return id_; }
};

}  // namespace tempora

#endif /* tempora_ZoneId_h */
