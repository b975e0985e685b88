/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_Logging_h
#define tempora_Logging_h

#include <stdarg.h>
#include <stdint.h>

#include <atomic>

#include "tempora/Printf.h"

namespace tempora {

/**
 * Log levels, from least to most verbose. A module logs a message when the
 * message's level is at or below the module's level.
 */
enum class LogLevel : int32_t {
  Disabled = 0,
  Error,
  Warning,
  Info,
  Debug,
  Verbose,
};

const char* ToLogStr(LogLevel aLevel);

class LogModule final {
  const char* mName;
  std::atomic<LogLevel> mLevel;

  LogModule(const char* aName, LogLevel aLevel)
      : mName(aName), mLevel(aLevel) {}

  friend class LogModuleManager;

 public:
  LogModule(const LogModule&) = delete;
  LogModule& operator=(const LogModule&) = delete;

  /**
   * Retrieves the module with the given name. If it does not already exist
   * it will be created with the level configured in the environment.
   *
   * @param aName The name of the module.
   * @return A log module for the given name. This may be shared.
   */
  static LogModule* Get(const char* aName);

  /**
   * Re-reads `TEMPORA_LOG` and `TEMPORA_LOG_FILE`. Modules which already
   * exist are updated.
   */
  static void Init();

  /**
   * Sets the log level of every existing module and of modules created
   * afterwards, overriding the environment.
   */
  static void SetAllLevels(LogLevel aLevel);

  void SetLevel(LogLevel aLevel) {
    mLevel.store(aLevel, std::memory_order_relaxed);
  }

  LogLevel Level() const { return mLevel.load(std::memory_order_relaxed); }

  bool ShouldLog(LogLevel aLevel) const { return aLevel <= Level(); }

  const char* Name() const { return mName; }

  void Printv(LogLevel aLevel, const char* aFmt, va_list aArgs) const;
};

/**
 * Helper class that lazy loads the given log module. This is safe to use for
 * declaring static references to log modules and can be used as a
 * replacement for accessing a LogModule directly.
 *
 * Example usage:
 *   static LazyLogModule sLayoutLog("layout");
 *
 *   void Foo() {
 *     TEMPORA_LOG(sLayoutLog, LogLevel::Verbose, ("Entering foo"));
 *   }
 */
class LazyLogModule final {
  const char* const mLogName;
  mutable std::atomic<LogModule*> mLog;

 public:
  explicit constexpr LazyLogModule(const char* aLogName)
      : mLogName(aLogName), mLog(nullptr) {}

  operator LogModule*() const {
    LogModule* log = mLog.load(std::memory_order_acquire);
    if (!log) {
      log = LogModule::Get(mLogName);
      mLog.store(log, std::memory_order_release);
    }
    return log;
  }
};

namespace detail {

inline bool log_test(const LogModule* module, LogLevel level) {
  return module && module->ShouldLog(level);
}

void log_print(const LogModule* aModule, LogLevel aLevel, const char* aFmt,
               ...) TEMPORA_FORMAT_PRINTF(3, 4);

}  // namespace detail

}  // namespace tempora

#define TEMPORA_LOG_EXPAND_ARGS(...) __VA_ARGS__

#define TEMPORA_LOG_TEST(_module, _level) \
  (::tempora::detail::log_test(_module, _level))

/**
 * TEMPORA_LOG(module, level, (format, args...)) logs a printf-style message
 * when `module` is enabled for `level`. The arguments are not evaluated
 * otherwise.
 */
#define TEMPORA_LOG(_module, _level, _args)                            \
  do {                                                                 \
    const ::tempora::LogModule* temporaLogModule = _module;            \
    if (TEMPORA_LOG_TEST(temporaLogModule, _level)) {                  \
      ::tempora::detail::log_print(temporaLogModule, _level,           \
                                   TEMPORA_LOG_EXPAND_ARGS _args);     \
    }                                                                  \
  } while (0)

#endif /* tempora_Logging_h */
