/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <stdio.h>
#include <stdlib.h>

#include <string>

#include "TemporaTestHelpers.h"
#include "gtest/gtest.h"
#include "tempora/Logging.h"
#include "tempora/Printf.h"

namespace tempora::test {

static std::string ReadAll(const std::string& aPath) {
  std::string contents;
  FILE* fp = fopen(aPath.c_str(), "rb");
  if (!fp) {
    return contents;
  }
  char buffer[512];
  size_t read;
  while ((read = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
    contents.append(buffer, read);
  }
  fclose(fp);
  return contents;
}

// Restores the default logging configuration when a test finishes.
class ScopedLogEnv {
 public:
  ScopedLogEnv(const char* aConfig, const std::string& aFile) {
    setenv("TEMPORA_LOG", aConfig, 1);
    setenv("TEMPORA_LOG_FILE", aFile.c_str(), 1);
    LogModule::Init();
  }

  ~ScopedLogEnv() {
    unsetenv("TEMPORA_LOG");
    unsetenv("TEMPORA_LOG_FILE");
    LogModule::Init();
  }
};

TEST(Tempora_Logging, Smprintf)
{
  EXPECT_EQ(Smprintf("%s-%03d", "zone", 7), "zone-007");
  EXPECT_EQ(Smprintf("%zu rules", size_t(12)), "12 rules");
  EXPECT_EQ(Smprintf("%s", ""), "");

  std::string longText(1000, 'x');
  EXPECT_EQ(Smprintf("[%s]", longText.c_str()), "[" + longText + "]");
}

TEST(Tempora_Logging, ModulesAreShared)
{
  LogModule* first = LogModule::Get("tempora-test-shared");
  LogModule* second = LogModule::Get("tempora-test-shared");
  EXPECT_EQ(first, second);
  EXPECT_STREQ(first->Name(), "tempora-test-shared");

  static LazyLogModule sLazy("tempora-test-shared");
  EXPECT_EQ(static_cast<LogModule*>(sLazy), first);
}

TEST(Tempora_Logging, LevelsFromEnvironment)
{
  std::string path = ::testing::TempDir() + "tempora-test-log.txt";
  remove(path.c_str());

  {
    ScopedLogEnv env("tempora-test-env:3,tempora-test-bare", path);

    LogModule* info = LogModule::Get("tempora-test-env");
    EXPECT_EQ(info->Level(), LogLevel::Info);
    EXPECT_TRUE(info->ShouldLog(LogLevel::Warning));
    EXPECT_FALSE(info->ShouldLog(LogLevel::Debug));
    EXPECT_EQ(LogModule::Get("tempora-test-bare")->Level(), LogLevel::Debug);
    EXPECT_EQ(LogModule::Get("tempora-test-other")->Level(),
              LogLevel::Disabled);

    TEMPORA_LOG(info, LogLevel::Info, ("loaded %d zones", 42));
    TEMPORA_LOG(info, LogLevel::Verbose, ("not written"));
  }

  std::string contents = ReadAll(path);
  EXPECT_NE(contents.find("I/tempora-test-env loaded 42 zones\n"),
            std::string::npos);
  EXPECT_EQ(contents.find("not written"), std::string::npos);

  // Modules fall back to disabled once the configuration is gone.
  EXPECT_EQ(LogModule::Get("tempora-test-env")->Level(), LogLevel::Disabled);
  remove(path.c_str());
}

TEST(Tempora_Logging, AllModules)
{
  std::string path = ::testing::TempDir() + "tempora-test-log-all.txt";
  remove(path.c_str());

  {
    ScopedLogEnv env("all:5", path);
    EXPECT_EQ(LogModule::Get("tempora-test-all")->Level(), LogLevel::Verbose);

    // Arguments are not evaluated for disabled levels.
    LogModule::Get("tempora-test-all")->SetLevel(LogLevel::Error);
    int evaluated = 0;
    TEMPORA_LOG(LogModule::Get("tempora-test-all"), LogLevel::Debug,
                ("%d", ++evaluated));
    EXPECT_EQ(evaluated, 0);
    TEMPORA_LOG(LogModule::Get("tempora-test-all"), LogLevel::Error,
                ("%d", ++evaluated));
    EXPECT_EQ(evaluated, 1);
  }

  EXPECT_NE(ReadAll(path).find("E/tempora-test-all 1\n"), std::string::npos);
  remove(path.c_str());
}

TEST(Tempora_Logging, LogStr)
{
  EXPECT_STREQ(ToLogStr(LogLevel::Error), "E");
  EXPECT_STREQ(ToLogStr(LogLevel::Warning), "W");
  EXPECT_STREQ(ToLogStr(LogLevel::Verbose), "V");
}

}  // namespace tempora::test
