/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/Ser.h"

#include <iterator>

#include "tempora/Printf.h"
#include "tempora/zone/ZoneRulesRegistry.h"
#include "tempora/zone/ZoneRulesSerializer.h"

using namespace tempora;

static void WriteDate(const LocalDate& date, DataOutput& out) {
  out.writeInt(date.getYear());
  out.writeByte(date.getMonthValue());
  out.writeByte(date.getDayOfMonth());
}

static DateTimeResult<LocalDate> ReadDate(DataInput& in) {
  int32_t year = TEMPORA_TRY(in.readInt());
  int32_t month = TEMPORA_TRY(in.readByte());
  int32_t day = TEMPORA_TRY(in.readByte());
  return LocalDate::Of(year, month, day);
}

static void WriteTime(const LocalTime& time, DataOutput& out) {
  if (time.getNano() == 0) {
    if (time.getSecond() == 0) {
      if (time.getMinute() == 0) {
        out.writeByte(~time.getHour());
      } else {
        out.writeByte(time.getHour());
        out.writeByte(~time.getMinute());
      }
    } else {
      out.writeByte(time.getHour());
      out.writeByte(time.getMinute());
      out.writeByte(~time.getSecond());
    }
  } else {
    out.writeByte(time.getHour());
    out.writeByte(time.getMinute());
    out.writeByte(time.getSecond());
    out.writeInt(time.getNano());
  }
}

static DateTimeResult<LocalTime> ReadTime(DataInput& in) {
  int32_t hour = TEMPORA_TRY(in.readByte());
  int32_t minute = 0;
  int32_t second = 0;
  int32_t nano = 0;
  if (hour < 0) {
    hour = ~hour;
  } else {
    minute = TEMPORA_TRY(in.readByte());
    if (minute < 0) {
      minute = ~minute;
    } else {
      second = TEMPORA_TRY(in.readByte());
      if (second < 0) {
        second = ~second;
      } else {
        nano = TEMPORA_TRY(in.readInt());
      }
    }
  }
  return LocalTime::Of(hour, minute, second, nano);
}

static void WriteDateTime(const LocalDateTime& dateTime, DataOutput& out) {
  WriteDate(dateTime.toLocalDate(), out);
  WriteTime(dateTime.toLocalTime(), out);
}

static DateTimeResult<LocalDateTime> ReadDateTime(DataInput& in) {
  LocalDate date = TEMPORA_TRY(ReadDate(in));
  LocalTime time = TEMPORA_TRY(ReadTime(in));
  return LocalDateTime(date, time);
}

static DateTimeResult<Ok> WriteZone(const ZoneId& zoneId, DataOutput& out) {
  if (zoneId.isOffset()) {
    out.writeByte(int32_t(SerType::ZoneOffset));
    zone::WriteOffset(*zoneId.asOffset(), out);
    return Ok();
  }
  out.writeByte(int32_t(SerType::ZoneRegion));
  return out.writeUTF(zoneId.getId());
}

static DateTimeResult<ZoneId> ReadRegion(
    DataInput& in, const zone::ZoneRulesRegistry& registry) {
  std::string id = TEMPORA_TRY(in.readUTF());
  return ZoneId::Of(id, registry);
}

static DateTimeResult<ZoneId> ReadZone(
    DataInput& in, const zone::ZoneRulesRegistry& registry) {
  int32_t type = TEMPORA_TRY(in.readUnsignedByte());
  if (type == int32_t(SerType::ZoneOffset)) {
    ZoneOffset offset = TEMPORA_TRY(zone::ReadOffset(in));
    return ZoneId::Of(offset);
  }
  if (type == int32_t(SerType::ZoneRegion)) {
    return ReadRegion(in, registry);
  }
  return Err(DateTimeError::InvalidValue(
      Smprintf("Invalid serialized zone type: %d", type)));
}

SerType tempora::SerTypeOf(const SerValue& value) {
  static constexpr SerType types[] = {
      SerType::Duration,      SerType::Instant,       SerType::LocalDate,
      SerType::LocalDateTime, SerType::LocalTime,     SerType::ZonedDateTime,
      SerType::ZoneRegion,    SerType::ZoneOffset,    SerType::OffsetTime,
      SerType::OffsetDateTime,
  };
  static_assert(std::size(types) == std::variant_size_v<SerValue>);
  SerType type = types[value.index()];
  if (type == SerType::ZoneRegion && std::get<ZoneId>(value).isOffset()) {
    return SerType::ZoneOffset;
  }
  return type;
}

DateTimeResult<Ok> tempora::WriteValue(const SerValue& value,
                                       DataOutput& out) {
  if (auto* zoneId = std::get_if<ZoneId>(&value)) {
    return WriteZone(*zoneId, out);
  }

  out.writeByte(int32_t(SerTypeOf(value)));
  switch (SerTypeOf(value)) {
    case SerType::Duration: {
      const Duration& duration = std::get<Duration>(value);
      out.writeLong(duration.getSeconds());
      out.writeInt(duration.getNano());
      break;
    }
    case SerType::Instant: {
      const Instant& instant = std::get<Instant>(value);
      out.writeLong(instant.getEpochSecond());
      out.writeInt(instant.getNano());
      break;
    }
    case SerType::LocalDate:
      WriteDate(std::get<LocalDate>(value), out);
      break;
    case SerType::LocalDateTime:
      WriteDateTime(std::get<LocalDateTime>(value), out);
      break;
    case SerType::LocalTime:
      WriteTime(std::get<LocalTime>(value), out);
      break;
    case SerType::ZonedDateTime: {
      const ZonedDateTime& zdt = std::get<ZonedDateTime>(value);
      WriteDateTime(zdt.toLocalDateTime(), out);
      zone::WriteOffset(zdt.getOffset(), out);
      return WriteZone(zdt.getZone(), out);
    }
    case SerType::ZoneOffset:
      zone::WriteOffset(std::get<ZoneOffset>(value), out);
      break;
    case SerType::OffsetTime: {
      const OffsetTime& time = std::get<OffsetTime>(value);
      WriteTime(time.toLocalTime(), out);
      zone::WriteOffset(time.getOffset(), out);
      break;
    }
    case SerType::OffsetDateTime: {
      const OffsetDateTime& odt = std::get<OffsetDateTime>(value);
      WriteDateTime(odt.toLocalDateTime(), out);
      zone::WriteOffset(odt.getOffset(), out);
      break;
    }
    case SerType::ZoneRegion:
      TEMPORA_ASSERT_UNREACHABLE("zone ids are written above");
  }
  return Ok();
}

DateTimeResult<SerValue> tempora::ReadValue(
    DataInput& in, const zone::ZoneRulesRegistry& registry) {
  int32_t type = TEMPORA_TRY(in.readUnsignedByte());
  switch (SerType(type)) {
    case SerType::Duration: {
      int64_t seconds = TEMPORA_TRY(in.readLong());
      int32_t nanos = TEMPORA_TRY(in.readInt());
      return SerValue(TEMPORA_TRY(Duration::OfSeconds(seconds, nanos)));
    }
    case SerType::Instant: {
      int64_t seconds = TEMPORA_TRY(in.readLong());
      int32_t nanos = TEMPORA_TRY(in.readInt());
      return SerValue(TEMPORA_TRY(Instant::OfEpochSecond(seconds, nanos)));
    }
    case SerType::LocalDate:
      return SerValue(TEMPORA_TRY(ReadDate(in)));
    case SerType::LocalDateTime:
      return SerValue(TEMPORA_TRY(ReadDateTime(in)));
    case SerType::LocalTime:
      return SerValue(TEMPORA_TRY(ReadTime(in)));
    case SerType::ZonedDateTime: {
      LocalDateTime dateTime = TEMPORA_TRY(ReadDateTime(in));
      ZoneOffset offset = TEMPORA_TRY(zone::ReadOffset(in));
      ZoneId zoneId = TEMPORA_TRY(ReadZone(in, registry));
      return SerValue(
          TEMPORA_TRY(ZonedDateTime::OfInstant(dateTime, offset, zoneId)));
    }
    case SerType::ZoneRegion:
      return SerValue(TEMPORA_TRY(ReadRegion(in, registry)));
    case SerType::ZoneOffset:
      return SerValue(TEMPORA_TRY(zone::ReadOffset(in)));
    case SerType::OffsetTime: {
      LocalTime time = TEMPORA_TRY(ReadTime(in));
      ZoneOffset offset = TEMPORA_TRY(zone::ReadOffset(in));
      return SerValue(OffsetTime(time, offset));
    }
    case SerType::OffsetDateTime: {
      LocalDateTime dateTime = TEMPORA_TRY(ReadDateTime(in));
      ZoneOffset offset = TEMPORA_TRY(zone::ReadOffset(in));
      return SerValue(OffsetDateTime::Of(dateTime.toLocalDate(),
                                         dateTime.toLocalTime(), offset));
    }
  }
  return Err(DateTimeError::InvalidValue(
      Smprintf("Invalid serialized type: %d", type)));
}

DateTimeResult<std::vector<uint8_t>> tempora::Serialize(const SerValue& value) {
  DataOutput out;
  TEMPORA_TRY(WriteValue(value, out));
  return out.takeBytes();
}

DateTimeResult<SerValue> tempora::Deserialize(
    const std::vector<uint8_t>& bytes,
    const zone::ZoneRulesRegistry& registry) {
  DataInput in(bytes);
  SerValue value = TEMPORA_TRY(ReadValue(in, registry));
  if (!in.atEnd()) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Trailing data after serialized value at offset %zu",
                 in.position())));
  }
  return value;
}

DateTimeResult<ZoneId> tempora::DeserializeZoneId(
    const std::vector<uint8_t>& bytes,
    const zone::ZoneRulesRegistry& registry) {
  DataInput in(bytes);
  ZoneId zoneId = TEMPORA_TRY(ReadZone(in, registry));
  if (!in.atEnd()) {
    return Err(DateTimeError::InvalidValue(
        Smprintf("Trailing data after serialized zone id at offset %zu",
                 in.position())));
  }
  return zoneId;
}
