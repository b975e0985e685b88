/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef tempora_gtest_TemporaTestHelpers_h
#define tempora_gtest_TemporaTestHelpers_h

#include <string>

#include "gtest/gtest.h"
#include "tempora/DateTimeError.h"
#include "tempora/zone/ZoneRulesRegistry.h"

namespace tempora::test {

template <typename T>
std::string ErrorMessage(const DateTimeResult<T>& aResult) {
  return aResult.isErr() ? aResult.inspectErr().toString() : std::string();
}

/**
 * Unwraps a result that the test expects to succeed. A failure is reported
 * with the error message before the release assertion in unwrap() fires.
 */
template <typename T>
T Unwrap(DateTimeResult<T> aResult) {
  EXPECT_TRUE(aResult.isOk()) << ErrorMessage(aResult);
  return aResult.unwrap();
}

template <typename T>
bool IsErrOfKind(const DateTimeResult<T>& aResult,
                 DateTimeError::Kind aKind) {
  return aResult.isErr() && aResult.inspectErr().is(aKind);
}

// A registry backed by the ICU time-zone data, shared by all tests.
inline const zone::ZoneRulesRegistry& IcuRegistry() {
  static std::unique_ptr<zone::ZoneRulesRegistry> sRegistry =
      Unwrap(zone::ZoneRulesRegistry::CreateDefault(zone::RegistryConfig()));
  return *sRegistry;
}

}  // namespace tempora::test

#define EXPECT_ERR_KIND(expr, kind)                                     \
  EXPECT_TRUE(::tempora::test::IsErrOfKind(                             \
      (expr), ::tempora::DateTimeError::Kind::kind))                   \
      << #expr

#endif /* tempora_gtest_TemporaTestHelpers_h */
