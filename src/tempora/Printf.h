/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* printf-style formatting into std::string. */

#ifndef tempora_Printf_h
#define tempora_Printf_h

#include <stdarg.h>

#include <string>

namespace tempora {

#if defined(__GNUC__) || defined(__clang__)
#  define TEMPORA_FORMAT_PRINTF(stringIndex, firstToCheck) \
    __attribute__((format(printf, stringIndex, firstToCheck)))
#else
#  define TEMPORA_FORMAT_PRINTF(stringIndex, firstToCheck)
#endif

/**
 * Format `aFormat` and its arguments into a newly allocated string.
 */
std::string Smprintf(const char* aFormat, ...) TEMPORA_FORMAT_PRINTF(1, 2);

std::string Vsmprintf(const char* aFormat, va_list aArgs);

}  // namespace tempora

#endif /* tempora_Printf_h */
