/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "tempora/DataStream.h"

using namespace tempora;

void DataOutput::writeShort(int32_t value) {
  uint16_t v = uint16_t(value);
  buffer_.push_back(uint8_t(v >> 8));
  buffer_.push_back(uint8_t(v));
}

void DataOutput::writeInt(int32_t value) {
  uint32_t v = uint32_t(value);
  for (int shift = 24; shift >= 0; shift -= 8) {
    buffer_.push_back(uint8_t(v >> shift));
  }
}

void DataOutput::writeLong(int64_t value) {
  uint64_t v = uint64_t(value);
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer_.push_back(uint8_t(v >> shift));
  }
}

DateTimeResult<Ok> DataOutput::writeUTF(std::string_view str) {
  if (str.length() > UINT16_MAX) {
    return Err(DateTimeError::ZoneRulesData(
        "String too long to encode: " + std::to_string(str.length()) +
        " bytes"));
  }
  writeShort(int32_t(str.length()));
  writeBytes(reinterpret_cast<const uint8_t*>(str.data()), str.length());
  return Ok();
}

DateTimeResult<Ok> DataInput::require(size_t count) const {
  if (count > length_ - position_) {
    return Err(DateTimeError::ZoneRulesData(
        "Unexpected end of data at offset " + std::to_string(position_)));
  }
  return Ok();
}

DateTimeResult<int8_t> DataInput::readByte() {
  return int8_t(TEMPORA_TRY(readUnsignedByte()));
}

DateTimeResult<uint8_t> DataInput::readUnsignedByte() {
  TEMPORA_TRY(require(1));
  return data_[position_++];
}

DateTimeResult<int16_t> DataInput::readShort() {
  TEMPORA_TRY(require(2));
  uint16_t v = uint16_t((data_[position_] << 8) | data_[position_ + 1]);
  position_ += 2;
  return int16_t(v);
}

DateTimeResult<int32_t> DataInput::readInt() {
  TEMPORA_TRY(require(4));
  uint32_t v = 0;
  for (int i = 0; i < 4; i++) {
    v = (v << 8) | data_[position_++];
  }
  return int32_t(v);
}

DateTimeResult<int64_t> DataInput::readLong() {
  TEMPORA_TRY(require(8));
  uint64_t v = 0;
  for (int i = 0; i < 8; i++) {
    v = (v << 8) | data_[position_++];
  }
  return int64_t(v);
}

DateTimeResult<std::vector<uint8_t>> DataInput::readBytes(size_t count) {
  TEMPORA_TRY(require(count));
  std::vector<uint8_t> bytes(data_ + position_, data_ + position_ + count);
  position_ += count;
  return bytes;
}

DateTimeResult<std::string> DataInput::readUTF() {
  int16_t rawLength = TEMPORA_TRY(readShort());
  size_t length = uint16_t(rawLength);
  TEMPORA_TRY(require(length));
  std::string str(reinterpret_cast<const char*>(data_ + position_), length);
  position_ += length;
  return str;
}
