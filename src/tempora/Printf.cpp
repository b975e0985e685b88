/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Printf.h"

#include <stdio.h>

namespace tempora {

std::string Vsmprintf(const char* aFormat, va_list aArgs) {
  va_list copy;
  va_copy(copy, aArgs);
  int length = vsnprintf(nullptr, 0, aFormat, copy);
  va_end(copy);
  if (length <= 0) {
    return std::string();
  }

  std::string result(size_t(length) + 1, '\0');
  vsnprintf(result.data(), result.size(), aFormat, aArgs);
  result.resize(size_t(length));
  return result;
}

std::string Smprintf(const char* aFormat, ...) {
  va_list args;
  va_start(args, aFormat);
  std::string result = Vsmprintf(aFormat, args);
  va_end(args);
  return result;
}

}  // namespace tempora
