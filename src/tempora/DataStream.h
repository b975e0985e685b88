/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* Big-endian binary streams used by the serialized forms. */

#ifndef tempora_DataStream_h
#define tempora_DataStream_h

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "tempora/DateTimeError.h"

namespace tempora {

class DataOutput final {
  std::vector<uint8_t> buffer_;

 public:
  DataOutput() = default;

  void writeByte(int32_t value) { buffer_.push_back(uint8_t(value)); }
  void writeShort(int32_t value);
  void writeInt(int32_t value);
  void writeLong(int64_t value);
  void writeBytes(const uint8_t* data, size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
  }

  /**
   * Two byte length followed by the UTF-8 bytes of `str`. Fails for strings
   * longer than 65535 bytes.
   */
  DateTimeResult<Ok> writeUTF(std::string_view str);

  const std::vector<uint8_t>& bytes() const { return buffer_; }
  std::vector<uint8_t> takeBytes() { return std::move(buffer_); }
  size_t length() const { return buffer_.size(); }
};

/**
 * Reads from a byte range it does not own. Reading past the end is an
 * error of kind ZoneRulesData.
 */
class DataInput final {
  const uint8_t* data_;
  size_t length_;
  size_t position_ = 0;

  DateTimeResult<Ok> require(size_t count) const;

 public:
  DataInput(const uint8_t* data, size_t length)
      : data_(data), length_(length) {}
  explicit DataInput(const std::vector<uint8_t>& bytes)
      : DataInput(bytes.data(), bytes.size()) {}

  size_t position() const { return position_; }
  size_t remaining() const { return length_ - position_; }
  bool atEnd() const { return position_ == length_; }

  DateTimeResult<int8_t> readByte();
  DateTimeResult<uint8_t> readUnsignedByte();
  DateTimeResult<int16_t> readShort();
  DateTimeResult<int32_t> readInt();
  DateTimeResult<int64_t> readLong();
  DateTimeResult<std::vector<uint8_t>> readBytes(size_t count);
  DateTimeResult<std::string> readUTF();
};

}  // namespace tempora

#endif /* tempora_DataStream_h */
