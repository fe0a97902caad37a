/*
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

#ifndef avrolite_Zigzag_hh__
#define avrolite_Zigzag_hh__

#include <array>
#include <cstddef>
#include <cstdint>

/* Zig-zag mapping of signed integers onto unsigned ones, so that values of small magnitude get short varints.*/
namespace avrolite {

  /* Longest varint for a 64 bit value*/
  const size_t MAX_VARINT_BYTES = 10;

  inline uint64_t encodeZigzag64(int64_t input) {
    return ((static_cast<uint64_t> (input) << 1) ^ static_cast<uint64_t> (input >> 63));
  }

  inline int64_t decodeZigzag64(uint64_t input) {
    return static_cast<int64_t> ((input >> 1) ^ (~(input & 1) + 1));
  }

  inline uint32_t encodeZigzag32(int32_t input) {
    return ((static_cast<uint32_t> (input) << 1) ^ static_cast<uint32_t> (input >> 31));
  }

  inline int32_t decodeZigzag32(uint32_t input) {
    return static_cast<int32_t> ((input >> 1) ^ (~(input & 1) + 1));
  }

  /* Writes the zig-zag varint form of input into output, least significant group first. Returns the number of bytes used.*/
  size_t encodeInt64(int64_t input, std::array<uint8_t, MAX_VARINT_BYTES> &output);

  size_t encodeInt32(int32_t input, std::array<uint8_t, 5> &output);

}

#endif
