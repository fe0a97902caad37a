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

#ifndef avrolite_Decoder_hh__
#define avrolite_Decoder_hh__

#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "ValidSchema.hh"
#include "Stream.hh"

/* Low level support for decoding avro values. This class has two types of functions. One type of functions support decoding of leaf
   values (for example, decodeLong and decodeString). These functions have analogs in Encoder.

   The other type of functions support decoding of maps and arrays. These functions are arrayStart, arrayNext, and skipArray (and
   similar functions for maps).*/
namespace avrolite {

  /* Decoder is an interface implemented by every decoder capable of decoding Avro data.*/
  class Decoder {
  public:

    virtual ~Decoder() { };

    /* All future decoding will come from is, which should be valid until replaced by another call to init() or this Decoder is
       destructed.*/
    virtual void init(InputStream& is) = 0;

    virtual void decodeNull() = 0;

    virtual bool decodeBool() = 0;

    virtual int32_t decodeInt() = 0;

    virtual int64_t decodeLong() = 0;

    virtual float decodeFloat() = 0;

    virtual double decodeDouble() = 0;

    /* Decodes a UTF-8 string from the current stream.*/
    std::string decodeString() {
      std::string result;
      decodeString(result);
      return result;
    }

    /* Decodes a UTF-8 string from the stream and assigns it to value.*/
    virtual void decodeString(std::string& value) = 0;

    /* Skips a string on the current stream.*/
    virtual void skipString() = 0;

    /* Decodes arbitrary binary data from the current stream.*/
    std::vector<uint8_t> decodeBytes() {
      std::vector<uint8_t> result;
      decodeBytes(result);
      return result;
    }

    /* Decodes arbitrary binary data from the current stream and puts it in value.*/
    virtual void decodeBytes(std::vector<uint8_t>& value) = 0;

    /* Skips bytes on the current stream.*/
    virtual void skipBytes() = 0;

    /* Decodes fixed length binary from the current stream. n is the size (byte count) of the fixed being read.*/
    std::vector<uint8_t> decodeFixed(size_t n) {
      std::vector<uint8_t> result;
      decodeFixed(n, result);
      return result;
    }

    virtual void decodeFixed(size_t n, std::vector<uint8_t>& value) = 0;

    virtual void skipFixed(size_t n) = 0;

    /* Decodes the position of an enum symbol.*/
    virtual size_t decodeEnum() = 0;

    /* Start decoding an array. Returns the number of entries in the first block.*/
    virtual size_t arrayStart() = 0;

    /* Returns the number of entries in the next block, or zero when the array is over.*/
    virtual size_t arrayNext() = 0;

    /* Tries to skip an array. If it can, it returns 0. Otherwise it returns the number of elements to be skipped; the client should
       skip the individual items and then call arrayNext() to find out if there are more.*/
    virtual size_t skipArray() = 0;

    /* Start decoding a map. Returns the number of entries in the first block.*/
    virtual size_t mapStart() = 0;

    virtual size_t mapNext() = 0;

    /* Tries to skip a map, with the same contract as skipArray().*/
    virtual size_t skipMap() = 0;

    /* Decodes the branch of a union. The actual value is to follow.*/
    virtual size_t decodeUnionIndex() = 0;

    /* Drops any internal buffering. Bytes read ahead but not consumed are handed back to the input stream.

       Call it after the last value is read. Checks that wait for the end of a value, such as the closing brace of a JSON union
       wrapper, run here, and so do the skips of writer fields the reader does not use.*/
    virtual void drain() = 0;
  };

  /* Shared pointer to Decoder.*/
  typedef std::shared_ptr<Decoder> DecoderPtr;

  /* ResolvingDecoder is derived from Decoder, with an additional function to obtain the field ordering of fields within a record.*/
  class ResolvingDecoder : public Decoder {
  public:

    /* Returns the order of fields for records. The order of fields could be different from the order of their order in the schema
       because the writer's field order could be different. In order to avoid buffering and later use, we return the values in the
       writer's field order; reader fields missing from the writer, which are filled from their defaults, come last.*/
    virtual const std::vector<size_t>& fieldOrder() = 0;
  };

  /* Shared pointer to ResolvingDecoder.*/
  typedef std::shared_ptr<ResolvingDecoder> ResolvingDecoderPtr;

  /* Returns an decoder that can decode binary Avro standard.*/
  DecoderPtr binaryDecoder();

  /* Returns an decoder that validates sequence of calls to an underlying Decoder against the given schema.*/
  DecoderPtr validatingDecoder(const ValidSchema& schema, const DecoderPtr& base);

  /* Returns an decoder that can decode Avro standard for JSON. Record fields may appear in any order in the input; they are
     delivered in schema order.*/
  DecoderPtr jsonDecoder(const ValidSchema& schema);

  /* Returns a decoder that decodes avro data from base written according to writerSchema and resolves against readerSchema. The
     client uses the decoder as if the data were written using readerSchema.*/
  ResolvingDecoderPtr resolvingDecoder(const ValidSchema& writer, const ValidSchema& reader, const DecoderPtr& base);

}

#endif
