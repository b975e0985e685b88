/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Implementations of runtime and static assertion macros for tempora. */

#ifndef tempora_Assertions_h
#define tempora_Assertions_h

#include <stdio.h>
#include <stdlib.h>

namespace tempora::detail {

[[noreturn]] inline void ReportAssertionFailure(const char* aExpr,
                                                const char* aExplanation,
                                                const char* aFile,
                                                int aLine) {
  if (aExplanation) {
    fprintf(stderr, "Assertion failure: %s (%s), at %s:%d\n", aExpr,
            aExplanation, aFile, aLine);
  } else {
    fprintf(stderr, "Assertion failure: %s, at %s:%d\n", aExpr, aFile, aLine);
  }
  fflush(stderr);
  abort();
}

}  // namespace tempora::detail

#if defined(__GNUC__) || defined(__clang__)
#  define TEMPORA_LIKELY(x) (__builtin_expect(!!(x), 1))
#  define TEMPORA_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#  define TEMPORA_LIKELY(x) (!!(x))
#  define TEMPORA_UNLIKELY(x) (!!(x))
#endif

#define TEMPORA_ASSERT_HELPER1(expr)                                       \
  do {                                                                     \
    if (TEMPORA_UNLIKELY(!(expr))) {                                       \
      ::tempora::detail::ReportAssertionFailure(#expr, nullptr, __FILE__,  \
                                                __LINE__);                 \
    }                                                                      \
  } while (false)

#define TEMPORA_ASSERT_HELPER2(expr, explain)                              \
  do {                                                                     \
    if (TEMPORA_UNLIKELY(!(expr))) {                                       \
      ::tempora::detail::ReportAssertionFailure(#expr, explain, __FILE__,  \
                                                __LINE__);                 \
    }                                                                      \
  } while (false)

#define TEMPORA_ASSERT_SELECT(_1, _2, NAME, ...) NAME

/**
 * TEMPORA_RELEASE_ASSERT(expr[, explanation]) checks `expr` in all builds and
 * aborts with a message if it is false. Use it only for invariants whose
 * violation would corrupt memory.
 */
#define TEMPORA_RELEASE_ASSERT(...)                                  \
  TEMPORA_ASSERT_SELECT(__VA_ARGS__, TEMPORA_ASSERT_HELPER2,         \
                        TEMPORA_ASSERT_HELPER1, )                    \
  (__VA_ARGS__)

/**
 * TEMPORA_ASSERT(expr[, explanation]) is the debug-only variant. In release
 * builds the expression is not evaluated.
 */
#ifdef NDEBUG
#  define TEMPORA_ASSERT(...) \
    do {                      \
    } while (false)
#else
#  define TEMPORA_ASSERT(...) TEMPORA_RELEASE_ASSERT(__VA_ARGS__)
#endif

#define TEMPORA_ASSERT_UNREACHABLE(reason) \
  TEMPORA_ASSERT(false, "TEMPORA_ASSERT_UNREACHABLE: " reason)

#define TEMPORA_CRASH(reason)                                        \
  ::tempora::detail::ReportAssertionFailure("TEMPORA_CRASH", reason, \
                                            __FILE__, __LINE__)

#endif /* tempora_Assertions_h */
