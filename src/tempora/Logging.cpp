/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Logging.h"

#include "tempora/Assertions.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tempora {

const char* ToLogStr(LogLevel aLevel) {
  switch (aLevel) {
    case LogLevel::Error:
      return "E";
    case LogLevel::Warning:
      return "W";
    case LogLevel::Info:
      return "I";
    case LogLevel::Debug:
      return "D";
    case LogLevel::Verbose:
      return "V";
    case LogLevel::Disabled:
    default:
      TEMPORA_CRASH("Invalid log level.");
  }
}

static LogLevel ToLogLevel(int32_t aLevel) {
  if (aLevel <= int32_t(LogLevel::Disabled)) {
    return LogLevel::Disabled;
  }
  if (aLevel >= int32_t(LogLevel::Verbose)) {
    return LogLevel::Verbose;
  }
  return LogLevel(aLevel);
}

/**
 * Owns every log module and the output stream. Modules are never destroyed,
 * so the pointers handed out by LogModule::Get stay valid for the lifetime of
 * the process.
 */
class LogModuleManager final {
  std::mutex mLock;
  std::map<std::string, std::unique_ptr<LogModule>, std::less<>> mModules;
  std::map<std::string, LogLevel, std::less<>> mConfigured;
  std::optional<LogLevel> mAllLevel;
  FILE* mOutFile = nullptr;

  LogLevel ConfiguredLevel(std::string_view aName) const {
    auto iter = mConfigured.find(aName);
    if (iter != mConfigured.end()) {
      return iter->second;
    }
    return mAllLevel.value_or(LogLevel::Disabled);
  }

  // Parses "module:level,module:level". A bare module name means Debug.
  void ParseConfig(const char* aConfig) {
    mConfigured.clear();
    mAllLevel.reset();

    std::string_view config(aConfig);
    while (!config.empty()) {
      size_t comma = config.find(',');
      std::string_view entry = config.substr(0, comma);
      config = comma == std::string_view::npos ? std::string_view()
                                                : config.substr(comma + 1);
      if (entry.empty()) {
        continue;
      }

      LogLevel level = LogLevel::Debug;
      size_t colon = entry.find(':');
      if (colon != std::string_view::npos) {
        std::string levelText(entry.substr(colon + 1));
        level = ToLogLevel(int32_t(strtol(levelText.c_str(), nullptr, 10)));
        entry = entry.substr(0, colon);
      }

      if (entry == "all") {
        mAllLevel = level;
      } else {
        mConfigured[std::string(entry)] = level;
      }
    }
  }

 public:
  void Init() {
    std::lock_guard<std::mutex> lock(mLock);

    const char* config = getenv("TEMPORA_LOG");
    ParseConfig(config ? config : "");

    if (mOutFile && mOutFile != stderr) {
      fclose(mOutFile);
    }
    mOutFile = stderr;
    if (const char* fileName = getenv("TEMPORA_LOG_FILE");
        fileName && *fileName) {
      if (FILE* file = fopen(fileName, "a")) {
        mOutFile = file;
      }
    }

    for (auto& [name, module] : mModules) {
      module->SetLevel(ConfiguredLevel(name));
    }
  }

  LogModule* CreateOrGetModule(const char* aName) {
    std::lock_guard<std::mutex> lock(mLock);

    auto iter = mModules.find(std::string_view(aName));
    if (iter != mModules.end()) {
      return iter->second.get();
    }

    auto module = std::unique_ptr<LogModule>(
        new LogModule(strdup(aName), ConfiguredLevel(aName)));
    LogModule* result = module.get();
    mModules.emplace(aName, std::move(module));
    return result;
  }

  void SetAllLevels(LogLevel aLevel) {
    std::lock_guard<std::mutex> lock(mLock);
    mConfigured.clear();
    mAllLevel = aLevel;
    for (auto& [name, module] : mModules) {
      module->SetLevel(aLevel);
    }
  }

  void Print(const char* aName, LogLevel aLevel, const char* aFmt,
             va_list aArgs) {
    std::string message = Vsmprintf(aFmt, aArgs);

    std::lock_guard<std::mutex> lock(mLock);
    FILE* out = mOutFile ? mOutFile : stderr;
    fprintf(out, "[%d]: %s/%s %s\n", int(getpid()), ToLogStr(aLevel), aName,
            message.c_str());
    fflush(out);
  }
};

static LogModuleManager& Manager() {
  // Leaked intentionally; modules may log during static destruction.
  static LogModuleManager* sManager = [] {
    auto* manager = new LogModuleManager();
    manager->Init();
    return manager;
  }();
  return *sManager;
}

LogModule* LogModule::Get(const char* aName) {
  return Manager().CreateOrGetModule(aName);
}

void LogModule::Init() { Manager().Init(); }

void LogModule::SetAllLevels(LogLevel aLevel) {
  Manager().SetAllLevels(aLevel);
}

void LogModule::Printv(LogLevel aLevel, const char* aFmt,
                       va_list aArgs) const {
  Manager().Print(mName, aLevel, aFmt, aArgs);
}

namespace detail {

void log_print(const LogModule* aModule, LogLevel aLevel, const char* aFmt,
               ...) {
  va_list ap;
  va_start(ap, aFmt);
  aModule->Printv(aLevel, aFmt, ap);
  va_end(ap);
}

}  // namespace detail

}  // namespace tempora
