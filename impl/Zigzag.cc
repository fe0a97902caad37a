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

#include "Zigzag.hh"

namespace avrolite {

  template <typename T, size_t N>
  static size_t encodeVarint(T val, std::array<uint8_t, N> &output) {
    size_t bytesOut = 0;
    do {
      uint8_t b = static_cast<uint8_t> (val & 0x7F);
      val >>= 7;
      if (val) {
        b |= 0x80;
      }
      output[bytesOut++] = b;
    } while (val && bytesOut < N);
    return bytesOut;
  }

  size_t encodeInt64(int64_t input, std::array<uint8_t, MAX_VARINT_BYTES> &output) {
    return encodeVarint(encodeZigzag64(input), output);
  }

  size_t encodeInt32(int32_t input, std::array<uint8_t, 5> &output) {
    return encodeVarint(encodeZigzag32(input), output);
  }

}
