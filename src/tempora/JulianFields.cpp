/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/JulianFields.h"

#include "tempora/Assertions.h"

using namespace tempora;

const char* tempora::JulianFieldName(JulianField field) {
  switch (field) {
    case JulianField::JulianDay:
      return "JulianDay";
    case JulianField::ModifiedJulianDay:
      return "ModifiedJulianDay";
    case JulianField::RataDie:
      return "RataDie";
  }
  TEMPORA_CRASH("invalid julian field");
}

int64_t tempora::JulianFieldOffset(JulianField field) {
  switch (field) {
    case JulianField::JulianDay:
      return 2440588;
    case JulianField::ModifiedJulianDay:
      return 40587;
    case JulianField::RataDie:
      return 719163;
  }
  TEMPORA_CRASH("invalid julian field");
}

ValueRange tempora::JulianFieldRange(JulianField field) {
  int64_t offset = JulianFieldOffset(field);
  return ValueRange::Fixed(LocalDate::Min().toEpochDay() + offset,
                           LocalDate::Max().toEpochDay() + offset);
}

DateTimeResult<LocalDate> tempora::WithJulianField(const LocalDate& date,
                                                   JulianField field,
                                                   int64_t newValue) {
  TEMPORA_TRY(JulianFieldRange(field).checkValidValue(newValue,
                                                      JulianFieldName(field)));
  int64_t epochDay = newValue - JulianFieldOffset(field);
  if (epochDay == date.toEpochDay()) {
    return date;
  }
  return LocalDate::OfEpochDay(epochDay);
}
