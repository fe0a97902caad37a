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

#ifndef avrolite_Generic_hh__
#define avrolite_Generic_hh__

#include <utility>

#include <boost/noncopyable.hpp>

#include "GenericDatum.hh"
#include "Decoder.hh"
#include "Encoder.hh"
#include "ValidSchema.hh"

namespace avrolite {

  /* A utility class to read generic datum from decoders.*/
  class GenericReader : boost::noncopyable {
    const ValidSchema schema_;
    const bool isResolving_;
    const DecoderPtr decoder_;

    static void read(GenericDatum& datum, Decoder& d, bool isResolving);

  public:

    /* Constructs a reader for the given schema using the given decoder.*/
    GenericReader(const ValidSchema& s, const DecoderPtr& decoder);

    /* Constructs a reader for the given reader's schema readerSchema using the given decoder which holds data matching writer's
       schema writerSchema.*/
    GenericReader(const ValidSchema& writerSchema,
      const ValidSchema& readerSchema, const DecoderPtr& decoder);

    /* Reads a value off the decoder into a fresh datum of the reader's schema.*/
    void read(GenericDatum& datum) const;

    /* Reads a value off the decoder. With reuse set, the containers already in datum are filled in place when it has the shape of
       the reader's schema.*/
    void read(GenericDatum& datum, bool reuse) const;

    /* Drains any residual bytes in the input stream (e.g. because reader's schema has no use of them) and return unused bytes
       back to the underlying input stream. A value is only fully checked once this has run, see Decoder::drain().*/
    void drain() {
      decoder_->drain();
    }

    /* Reads a generic datum from the stream, using the given schema.*/
    static void read(Decoder& d, GenericDatum& g);

    /* Reads a generic datum from the stream, using the given schema.*/
    static void read(Decoder& d, GenericDatum& g, const ValidSchema& s);
  };

  /* A utility class to write generic datum to encoders.*/
  class GenericWriter : boost::noncopyable {
    const ValidSchema schema_;
    const EncoderPtr encoder_;

    static void write(const GenericDatum& datum, Encoder& e);
  public:

    /* Constructs a writer for the given schema using the given encoder.*/
    GenericWriter(const ValidSchema& s, const EncoderPtr& encoder);

    /* Writes a value onto the encoder.*/
    void write(const GenericDatum& datum) const;

    /* Writes a generic datum on to the stream.*/
    static void write(Encoder& e, const GenericDatum& g);

    /* Writes a generic datum on to the stream, using the given schema. Should be used with an encoder that validates against
       the schema.*/
    static void write(Encoder& e, const GenericDatum& g, const ValidSchema&) {
      write(e, g);
    }

    /* The first branch of unionSchema, in declared order, whose shape matches value. Throws ResolutionException if there is
       none.*/
    static size_t branchFor(const NodePtr& unionSchema, const GenericDatum& value);
  };

  template <typename T> struct codec_traits;

  /* Specialization of codec_traits for a generic datum along with its schema.*/
  template <> struct codec_traits<std::pair<ValidSchema, GenericDatum> > {

    /* Encodes*/
    static void encode(Encoder& e,
      const std::pair<ValidSchema, GenericDatum>& p) {
      GenericWriter::write(e, p.second, p.first);
    }

    /* Decodes*/
    static void decode(Decoder& d,
      std::pair<ValidSchema, GenericDatum>& p) {
      GenericReader::read(d, p.second, p.first);
    }
  };

  /* Specialization of codec_traits for GenericDatum.*/
  template <> struct codec_traits<GenericDatum> {

    /* Encodes*/
    static void encode(Encoder& e, const GenericDatum& g) {
      GenericWriter::write(e, g);
    }

    /* Decodes*/
    static void decode(Decoder& d, GenericDatum& g) {
      GenericReader::read(d, g);
    }
  };

}

#endif
