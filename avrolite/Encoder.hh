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

#ifndef avrolite_Encoder_hh__
#define avrolite_Encoder_hh__

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ValidSchema.hh"
#include "Stream.hh"

/* Low level support for encoding avro values. This class has two types of functions. One type of functions support the writing of
   leaf values (for example, encodeLong and encodeString). These functions have analogs in Decoder.

   The other type of functions support the writing of maps and arrays. These functions are arrayStart, startItem, and arrayEnd (and
   similar functions for maps). Some implementations of Encoder handle the buffering required to break large maps and arrays into
   blocks, which is necessary for applications that want to do streaming.*/
namespace avrolite {

  /* The abstract base class for all Avro encoders. The implementations differ in the method of encoding (binary versus JSON) or in
     capabilities (ability to verify the order of invocation of different functions).*/
  class Encoder {
  public:

    virtual ~Encoder() { };

    /* All future encodings will go to os, which should be valid until it is reset with another call to init() or the encoder is
       destructed.*/
    virtual void init(OutputStream& os) = 0;

    /* Flushes any data in internal buffers.*/
    virtual void flush() = 0;

    /* Returns the number of bytes produced so far. For a meaningful value, do a flush() before invoking this function.*/
    virtual int64_t byteCount() const = 0;

    virtual void encodeNull() = 0;

    virtual void encodeBool(bool b) = 0;

    virtual void encodeInt(int32_t i) = 0;

    virtual void encodeLong(int64_t l) = 0;

    virtual void encodeFloat(float f) = 0;

    virtual void encodeDouble(double d) = 0;

    /* Encodes a UTF-8 string to the current stream.*/
    virtual void encodeString(const std::string& s) = 0;

    /* Encodes arbitrary binary data into the current stream as Avro "bytes" data type.*/
    virtual void encodeBytes(const uint8_t *bytes, size_t len) = 0;

    void encodeBytes(const std::vector<uint8_t>& bytes) {
      uint8_t b = 0;
      encodeBytes(bytes.empty() ? &b : &bytes[0], bytes.size());
    }

    /* Encodes fixed length binary to the current stream.*/
    virtual void encodeFixed(const uint8_t *bytes, size_t len) = 0;

    void encodeFixed(const std::vector<uint8_t>& bytes) {
      uint8_t b = 0;
      encodeFixed(bytes.empty() ? &b : &bytes[0], bytes.size());
    }

    /* Encodes the position of a symbol of an Avro enum.*/
    virtual void encodeEnum(size_t e) = 0;

    /* Indicates that an array of items is being encoded.*/
    virtual void arrayStart() = 0;

    /* Indicates that the current array of items have ended.*/
    virtual void arrayEnd() = 0;

    /* Indicates that a map of items is being encoded.*/
    virtual void mapStart() = 0;

    /* Indicates that the current map of items have ended.*/
    virtual void mapEnd() = 0;

    /* Indicates that count number of items are to follow in the current array or map.*/
    virtual void setItemCount(size_t count) = 0;

    /* Marks a beginning of an item in the current array or map.*/
    virtual void startItem() = 0;

    /* Encodes a branch of a union. The actual value is to follow.*/
    virtual void encodeUnionIndex(size_t e) = 0;
  };

  /* Shared pointer to Encoder.*/
  typedef std::shared_ptr<Encoder> EncoderPtr;

  /* Output settings of the JSON encoder. With includeNamespace unset, union values are written bare instead of wrapped in an
     object keyed by the branch name; such output cannot be decoded back.*/
  struct JsonEncoderOptions {
    bool pretty;
    bool includeNamespace;

    JsonEncoderOptions() : pretty(false), includeNamespace(true) { }
  };

  /* Returns an encoder that can encode binary Avro standard.*/
  EncoderPtr binaryEncoder();

  /* Returns an encoder that validates sequence of calls to an underlying Encoder against the given schema.*/
  EncoderPtr validatingEncoder(const ValidSchema& schema, const EncoderPtr& base);

  /* Returns an encoder that encodes Avro standard for JSON.*/
  EncoderPtr jsonEncoder(const ValidSchema& schema);

  /* Returns an encoder that encodes Avro standard for JSON, indented for human readers.*/
  EncoderPtr jsonPrettyEncoder(const ValidSchema& schema);

  EncoderPtr jsonEncoder(const ValidSchema& schema, const JsonEncoderOptions& options);

}

#endif
