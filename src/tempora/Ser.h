/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/*
 * Binary form of the value types: a type byte followed by the fields.
 *
 *   Duration, Instant   int64 seconds, int32 nanos
 *   LocalDate           int32 year, byte month, byte day
 *   LocalTime           compact: trailing zero fields are dropped and the
 *                       last byte written is complemented
 *   ZoneOffset          byte quarter hours, or 127 and int32 seconds
 *   ZoneRegion          modified UTF-8 id
 *
 * Composite values concatenate the forms of their parts. The zone of a
 * ZonedDateTime is written with its own type byte.
 */

#ifndef tempora_Ser_h
#define tempora_Ser_h

#include <stdint.h>

#include <variant>
#include <vector>

#include "tempora/DataStream.h"
#include "tempora/DateTimeError.h"
#include "tempora/Duration.h"
#include "tempora/Instant.h"
#include "tempora/LocalDate.h"
#include "tempora/LocalDateTime.h"
#include "tempora/LocalTime.h"
#include "tempora/OffsetDateTime.h"
#include "tempora/OffsetTime.h"
#include "tempora/ZoneId.h"
#include "tempora/ZoneOffset.h"
#include "tempora/ZonedDateTime.h"

namespace tempora {

namespace zone {
class ZoneRulesRegistry;
}  // namespace zone

enum class SerType : uint8_t {
  Duration = 1,
  Instant = 2,
  LocalDate = 3,
  LocalDateTime = 4,
  LocalTime = 5,
  ZonedDateTime = 6,
  ZoneRegion = 7,
  ZoneOffset = 8,
  OffsetTime = 66,
  OffsetDateTime = 69,
};

// A ZoneId holding an offset is written as a ZoneOffset, so ReadValue gives
// it back as the ZoneOffset alternative. DeserializeZoneId reads it back as a
// ZoneId.
using SerValue =
    std::variant<Duration, Instant, LocalDate, LocalDateTime, LocalTime,
                 ZonedDateTime, ZoneId, ZoneOffset, OffsetTime, OffsetDateTime>;

SerType SerTypeOf(const SerValue& value);

/**
 * Writes the type byte and the value. Fails only for a zone id too long
 * for the UTF form.
 */
DateTimeResult<Ok> WriteValue(const SerValue& value, DataOutput& out);

/**
 * Reads a value written by WriteValue. Region ids are resolved through
 * `registry`.
 */
DateTimeResult<SerValue> ReadValue(DataInput& in,
                                   const zone::ZoneRulesRegistry& registry);

DateTimeResult<std::vector<uint8_t>> Serialize(const SerValue& value);

/**
 * Reads a single value that must span all of `bytes`.
 */
DateTimeResult<SerValue> Deserialize(const std::vector<uint8_t>& bytes,
                                     const zone::ZoneRulesRegistry& registry);

/**
 * Reads a zone id written by Serialize: a region, or an offset, which gives
 * the ZoneId of that offset. Other types fail with an InvalidValue error.
 */
DateTimeResult<ZoneId> DeserializeZoneId(
    const std::vector<uint8_t>& bytes,
    const zone::ZoneRulesRegistry& registry);

}  // namespace tempora

#endif /* tempora_Ser_h */
