/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstring>

#include "Encoder.hh"
#include "Zigzag.hh"

namespace avrolite {

  using std::make_shared;

  class BinaryEncoder : public Encoder {
    StreamWriter out_;

    void init(OutputStream& os);
    void flush();
    int64_t byteCount() const;
    void encodeNull();
    void encodeBool(bool b);
    void encodeInt(int32_t i);
    void encodeLong(int64_t l);
    void encodeFloat(float f);
    void encodeDouble(double d);
    void encodeString(const std::string& s);
    void encodeBytes(const uint8_t *bytes, size_t len);
    void encodeFixed(const uint8_t *bytes, size_t len);
    void encodeEnum(size_t e);
    void arrayStart();
    void arrayEnd();
    void mapStart();
    void mapEnd();
    void setItemCount(size_t count);
    void startItem();
    void encodeUnionIndex(size_t e);

    void doEncodeLong(int64_t l);
  };

  EncoderPtr binaryEncoder() {
    return make_shared<BinaryEncoder>();
  }

  void BinaryEncoder::init(OutputStream& os) {
    out_.reset(os);
  }

  void BinaryEncoder::flush() {
    out_.flush();
  }

  int64_t BinaryEncoder::byteCount() const {
    return out_.byteCount();
  }

  void BinaryEncoder::encodeNull() {
  }

  void BinaryEncoder::encodeBool(bool b) {
    out_.write(b ? 1 : 0);
  }

  void BinaryEncoder::encodeInt(int32_t i) {
    std::array<uint8_t, 5> bytes;
    size_t size = encodeInt32(i, bytes);
    out_.writeBytes(bytes.data(), size);
  }

  void BinaryEncoder::encodeLong(int64_t l) {
    doEncodeLong(l);
  }

  /* Floating point values go out little endian whatever the host byte order*/
  void BinaryEncoder::encodeFloat(float f) {
    uint32_t bits;
    ::memcpy(&bits, &f, sizeof(bits));
    uint8_t bytes[4];
    for (size_t i = 0; i < 4; ++i) {
      bytes[i] = static_cast<uint8_t> (bits >> (8 * i));
    }
    out_.writeBytes(bytes, 4);
  }

  void BinaryEncoder::encodeDouble(double d) {
    uint64_t bits;
    ::memcpy(&bits, &d, sizeof(bits));
    uint8_t bytes[8];
    for (size_t i = 0; i < 8; ++i) {
      bytes[i] = static_cast<uint8_t> (bits >> (8 * i));
    }
    out_.writeBytes(bytes, 8);
  }

  void BinaryEncoder::encodeString(const std::string& s) {
    doEncodeLong(s.size());
    out_.writeBytes(reinterpret_cast<const uint8_t*> (s.data()), s.size());
  }

  void BinaryEncoder::encodeBytes(const uint8_t *bytes, size_t len) {
    doEncodeLong(len);
    out_.writeBytes(bytes, len);
  }

  void BinaryEncoder::encodeFixed(const uint8_t *bytes, size_t len) {
    out_.writeBytes(bytes, len);
  }

  void BinaryEncoder::encodeEnum(size_t e) {
    doEncodeLong(e);
  }

  void BinaryEncoder::arrayStart() {
  }

  void BinaryEncoder::arrayEnd() {
    doEncodeLong(0);
  }

  void BinaryEncoder::mapStart() {
  }

  void BinaryEncoder::mapEnd() {
    doEncodeLong(0);
  }

  void BinaryEncoder::setItemCount(size_t count) {
    if (count > 0) {
      doEncodeLong(count);
    }
  }

  void BinaryEncoder::startItem() {
  }

  void BinaryEncoder::encodeUnionIndex(size_t e) {
    doEncodeLong(e);
  }

  void BinaryEncoder::doEncodeLong(int64_t l) {
    std::array<uint8_t, MAX_VARINT_BYTES> bytes;
    size_t size = encodeInt64(l, bytes);
    out_.writeBytes(bytes.data(), size);
  }

}
