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
#include <limits>

#include "Decoder.hh"
#include "Zigzag.hh"

namespace avrolite {

  using std::make_shared;

  class BinaryDecoder : public Decoder {
    StreamReader in_;

    void init(InputStream& is);
    void decodeNull();
    bool decodeBool();
    int32_t decodeInt();
    int64_t decodeLong();
    float decodeFloat();
    double decodeDouble();
    void decodeString(std::string& value);
    void skipString();
    void decodeBytes(std::vector<uint8_t>& value);
    void skipBytes();
    void decodeFixed(size_t n, std::vector<uint8_t>& value);
    void skipFixed(size_t n);
    size_t decodeEnum();
    size_t arrayStart();
    size_t arrayNext();
    size_t skipArray();
    size_t mapStart();
    size_t mapNext();
    size_t skipMap();
    size_t decodeUnionIndex();
    void drain();

    int64_t doDecodeLong();
    size_t doDecodeLength();
    size_t doDecodeItemCount();
  };

  DecoderPtr binaryDecoder() {
    return make_shared<BinaryDecoder>();
  }

  /* Checks that the bytes form well formed UTF-8: no overlong forms, no surrogates, nothing beyond U+10FFFF.*/
  static bool isValidUtf8(const std::string& s) {
    const unsigned char* p = reinterpret_cast<const unsigned char*> (s.data());
    const unsigned char* end = p + s.size();
    while (p < end) {
      unsigned char c = *p++;
      if (c < 0x80) {
        continue;
      }
      size_t n;
      uint32_t cp;
      if (c >= 0xc2 && c <= 0xdf) {
        n = 1;
        cp = c & 0x1f;
      } else if ((c & 0xf0) == 0xe0) {
        n = 2;
        cp = c & 0x0f;
      } else if (c >= 0xf0 && c <= 0xf4) {
        n = 3;
        cp = c & 0x07;
      } else {
        return false;
      }
      if (static_cast<size_t> (end - p) < n) {
        return false;
      }
      for (size_t i = 0; i < n; ++i) {
        if ((p[i] & 0xc0) != 0x80) {
          return false;
        }
        cp = (cp << 6) | (p[i] & 0x3f);
      }
      p += n;
      if ((n == 2 && (cp < 0x800 || (cp >= 0xd800 && cp <= 0xdfff))) ||
        (n == 3 && (cp < 0x10000 || cp > 0x10ffff))) {
        return false;
      }
    }
    return true;
  }

  void BinaryDecoder::init(InputStream& is) {
    in_.reset(is);
  }

  void BinaryDecoder::decodeNull() {
  }

  bool BinaryDecoder::decodeBool() {
    uint8_t v = in_.read();
    if (v == 0) {
      return false;
    } else if (v == 1) {
      return true;
    }
    throw FormatException(boost::format("Invalid value for bool: %1%") % static_cast<int> (v));
  }

  int32_t BinaryDecoder::decodeInt() {
    int64_t val = doDecodeLong();
    if (val < std::numeric_limits<int32_t>::min() || val > std::numeric_limits<int32_t>::max()) {
      throw FormatException(boost::format("Value out of range for Avro int: %1%") % val);
    }
    return static_cast<int32_t> (val);
  }

  int64_t BinaryDecoder::decodeLong() {
    return doDecodeLong();
  }

  float BinaryDecoder::decodeFloat() {
    uint8_t bytes[4];
    in_.readBytes(bytes, 4);
    uint32_t bits = 0;
    for (size_t i = 0; i < 4; ++i) {
      bits |= static_cast<uint32_t> (bytes[i]) << (8 * i);
    }
    float result;
    ::memcpy(&result, &bits, sizeof(result));
    return result;
  }

  double BinaryDecoder::decodeDouble() {
    uint8_t bytes[8];
    in_.readBytes(bytes, 8);
    uint64_t bits = 0;
    for (size_t i = 0; i < 8; ++i) {
      bits |= static_cast<uint64_t> (bytes[i]) << (8 * i);
    }
    double result;
    ::memcpy(&result, &bits, sizeof(result));
    return result;
  }

  size_t BinaryDecoder::doDecodeLength() {
    int64_t len = doDecodeLong();
    if (len < 0) {
      throw FormatException(boost::format("Cannot have negative length: %1%") % len);
    }
    return static_cast<size_t> (len);
  }

  void BinaryDecoder::decodeString(std::string& value) {
    in_.readInto(value, doDecodeLength());
    if (!isValidUtf8(value)) {
      throw FormatException("Invalid UTF-8 in string");
    }
  }

  void BinaryDecoder::skipString() {
    size_t len = doDecodeLength();
    in_.skipBytes(len);
  }

  void BinaryDecoder::decodeBytes(std::vector<uint8_t>& value) {
    in_.readInto(value, doDecodeLength());
  }

  void BinaryDecoder::skipBytes() {
    size_t len = doDecodeLength();
    in_.skipBytes(len);
  }

  void BinaryDecoder::decodeFixed(size_t n, std::vector<uint8_t>& value) {
    value.resize(n);
    if (n > 0) {
      in_.readBytes(&value[0], n);
    }
  }

  void BinaryDecoder::skipFixed(size_t n) {
    in_.skipBytes(n);
  }

  size_t BinaryDecoder::decodeEnum() {
    int64_t e = doDecodeLong();
    if (e < 0) {
      throw ResolutionException(boost::format("Enum index out of range: %1%") % e);
    }
    return static_cast<size_t> (e);
  }

  /* A negative count carries the byte size of the block after it, which item by item reading has no use for*/
  size_t BinaryDecoder::doDecodeItemCount() {
    int64_t result = doDecodeLong();
    if (result < 0) {
      doDecodeLong();
      return static_cast<size_t> (-result);
    }
    return static_cast<size_t> (result);
  }

  size_t BinaryDecoder::arrayStart() {
    return doDecodeItemCount();
  }

  size_t BinaryDecoder::arrayNext() {
    return doDecodeItemCount();
  }

  size_t BinaryDecoder::skipArray() {
    for (;;) {
      int64_t r = doDecodeLong();
      if (r < 0) {
        size_t n = doDecodeLength();
        in_.skipBytes(n);
      } else {
        return static_cast<size_t> (r);
      }
    }
  }

  size_t BinaryDecoder::mapStart() {
    return doDecodeItemCount();
  }

  size_t BinaryDecoder::mapNext() {
    return doDecodeItemCount();
  }

  size_t BinaryDecoder::skipMap() {
    return skipArray();
  }

  size_t BinaryDecoder::decodeUnionIndex() {
    int64_t e = doDecodeLong();
    if (e < 0) {
      throw ResolutionException(boost::format("Union index out of range: %1%") % e);
    }
    return static_cast<size_t> (e);
  }

  void BinaryDecoder::drain() {
    if (in_.in_ != 0) {
      in_.drain(false);
    }
  }

  int64_t BinaryDecoder::doDecodeLong() {
    uint64_t encoded = 0;
    int shift = 0;
    uint8_t u;
    do {
      if (shift >= 70) {
        throw FormatException("Invalid Avro varint: more than 10 bytes");
      }
      u = in_.read();
      encoded |= static_cast<uint64_t> (u & 0x7f) << shift;
      shift += 7;
    } while (u & 0x80);
    return decodeZigzag64(encoded);
  }

}
