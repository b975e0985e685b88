/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/*
 * Writes the time-zone database of the installed ICU to a TZDB.dat file
 * that TzdbZoneRulesProvider can load.
 *
 *   tempora-tzdb-export <output-file> [zone-id...]
 *
 * With no zone ids every ICU region is exported.
 */

#include <stdio.h>

#include <map>
#include <memory>
#include <set>
#include <string>

#include "tempora/Logging.h"
#include "tempora/zone/IcuZoneRulesProvider.h"
#include "tempora/zone/TzdbDataWriter.h"

using namespace tempora;
using namespace tempora::zone;

static LazyLogModule gExportLog("tzdbexport");

#define LOG(level, args) TEMPORA_LOG(gExportLog, LogLevel::level, args)

static DateTimeResult<Ok> Export(const std::string& path,
                                 const std::set<std::string>& requested) {
  std::unique_ptr<IcuZoneRulesProvider> provider =
      TEMPORA_TRY(IcuZoneRulesProvider::Create());

  std::set<std::string> zoneIds =
      requested.empty() ? provider->provideZoneIds() : requested;

  ZoneRulesByRegion rules;
  for (const std::string& zoneId : zoneIds) {
    LOG(Debug, ("Converting %s", zoneId.c_str()));
    rules[zoneId] = TEMPORA_TRY(provider->provideRules(zoneId, false));
  }

  std::map<std::string, ZoneRulesByRegion> versions;
  versions[provider->version()] = std::move(rules);
  TEMPORA_TRY(WriteTzdbFile(path, versions));

  LOG(Info, ("Wrote %zu zones of version %s to %s", zoneIds.size(),
             provider->version().c_str(), path.c_str()));
  return Ok();
}

int main(int argc, char** argv) {
  if (argc < 2) {
    fprintf(stderr, "usage: %s <output-file> [zone-id...]\n", argv[0]);
    return 2;
  }

  std::set<std::string> requested;
  for (int i = 2; i < argc; i++) {
    requested.insert(argv[i]);
  }

  DateTimeResult<Ok> result = Export(argv[1], requested);
  if (result.isErr()) {
    fprintf(stderr, "%s: %s\n", argv[0], result.inspectErr().message().c_str());
    return 1;
  }
  return 0;
}
