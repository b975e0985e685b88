/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/ZoneId.h"

#include "tempora/Instant.h"
#include "tempora/TextUtils.h"
#include "tempora/zone/ZoneRules.h"
#include "tempora/zone/ZoneRulesRegistry.h"

using namespace tempora;
using namespace tempora::zone;

ZoneId ZoneId::Of(const ZoneOffset& offset) {
  return ZoneId(offset.getId(), offset, ZoneRules::Fixed(offset));
}

ZoneId ZoneId::FixedRegion(std::string id, const ZoneOffset& offset) {
  return ZoneId(std::move(id), std::nullopt, ZoneRules::Fixed(offset));
}

const std::map<std::string, std::string>& ZoneId::ShortIds() {
  static const std::map<std::string, std::string> shortIds = {
      {"ACT", "Australia/Darwin"},
      {"AET", "Australia/Sydney"},
      {"AGT", "America/Argentina/Buenos_Aires"},
      {"ART", "Africa/Cairo"},
      {"AST", "America/Anchorage"},
      {"BET", "America/Sao_Paulo"},
      {"BST", "Asia/Dhaka"},
      {"CAT", "Africa/Harare"},
      {"CNT", "America/St_Johns"},
      {"CST", "America/Chicago"},
      {"CTT", "Asia/Shanghai"},
      {"EAT", "Africa/Addis_Ababa"},
      {"ECT", "Europe/Paris"},
      {"IET", "America/Indiana/Indianapolis"},
      {"IST", "Asia/Kolkata"},
      {"JST", "Asia/Tokyo"},
      {"MIT", "Pacific/Apia"},
      {"NET", "Asia/Yerevan"},
      {"NST", "Pacific/Auckland"},
      {"PLT", "Asia/Karachi"},
      {"PNT", "America/Phoenix"},
      {"PRT", "America/Puerto_Rico"},
      {"PST", "America/Los_Angeles"},
      {"SST", "Pacific/Guadalcanal"},
      {"VST", "Asia/Ho_Chi_Minh"},
      {"EST", "-05:00"},
      {"MST", "-07:00"},
      {"HST", "-10:00"},
  };
  return shortIds;
}

bool ZoneId::IsValidRegionId(std::string_view id) {
  if (id.length() < 2 || !IsAsciiAlpha(id[0])) {
    return false;
  }
  for (char ch : id.substr(1)) {
    if (!IsAsciiAlphanumeric(ch) && ch != '~' && ch != '/' && ch != '.' &&
        ch != '_' && ch != '+' && ch != '-') {
      return false;
    }
  }
  return true;
}

DateTimeResult<ZoneId> ZoneId::OfRegion(const std::string& id,
                                        const ZoneRulesRegistry& registry) {
  if (!IsValidRegionId(id)) {
    return Err(DateTimeError::InvalidValue(
        "Invalid ID for region-based ZoneId, invalid format: " + id));
  }

  auto rules = registry.getRules(id, true);
  if (rules.isErr()) {
    if (id == "GMT0") {
      return FixedRegion(id, ZoneOffset::UTC());
    }
    return rules.propagateErr();
  }
  return ZoneId(id, std::nullopt, rules.unwrap());
}

DateTimeResult<ZoneId> ZoneId::OfPrefixed(std::string_view id,
                                          size_t prefixLength) {
  ZoneOffset offset =
      TEMPORA_TRY(ZoneOffset::Parse(id.substr(prefixLength)));
  return OfOffset(id.substr(0, prefixLength), offset);
}

DateTimeResult<ZoneId> ZoneId::Of(std::string_view id,
                                  const ZoneRulesRegistry& registry) {
  if (id == "Z") {
    return Of(ZoneOffset::UTC());
  }
  if (id.length() == 1) {
    return Err(DateTimeError::InvalidValue("Invalid zone: " +
                                           std::string(id)));
  }
  if (id[0] == '+' || id[0] == '-') {
    ZoneOffset offset = TEMPORA_TRY(ZoneOffset::Parse(id));
    return Of(offset);
  }
  if (id == "UTC" || id == "GMT" || id == "UT") {
    return FixedRegion(std::string(id), ZoneOffset::UTC());
  }

  auto startsWithSign = [&](size_t prefixLength) {
    return id.length() > prefixLength &&
           (id[prefixLength] == '+' || id[prefixLength] == '-');
  };
  std::string_view prefix3 = id.substr(0, 3);
  if ((prefix3 == "UTC" || prefix3 == "GMT") && startsWithSign(3)) {
    return OfPrefixed(id, 3);
  }
  if (id.substr(0, 2) == "UT" && startsWithSign(2)) {
    return OfPrefixed(id, 2);
  }
  return OfRegion(std::string(id), registry);
}

DateTimeResult<ZoneId> ZoneId::Of(
    std::string_view id, const std::map<std::string, std::string>& aliasMap,
    const ZoneRulesRegistry& registry) {
  auto alias = aliasMap.find(std::string(id));
  if (alias != aliasMap.end()) {
    return Of(alias->second, registry);
  }
  return Of(id, registry);
}

DateTimeResult<ZoneId> ZoneId::OfOffset(std::string_view prefix,
                                        const ZoneOffset& offset) {
  if (prefix.empty()) {
    return Of(offset);
  }
  if (prefix != "GMT" && prefix != "UTC" && prefix != "UT") {
    return Err(DateTimeError::InvalidValue(
        "Invalid prefix, must be GMT, UTC or UT: " + std::string(prefix)));
  }
  std::string id(prefix);
  if (offset.getTotalSeconds() != 0) {
    id += offset.getId();
  }
  return FixedRegion(std::move(id), offset);
}

ZoneId ZoneId::normalized() const {
  if (rules_->isFixedOffset()) {
    return Of(rules_->getOffset(Instant::Epoch()));
  }
  return *this;
}
