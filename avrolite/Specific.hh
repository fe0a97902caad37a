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

#ifndef avrolite_Specific_hh__
#define avrolite_Specific_hh__

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include <boost/array.hpp>

#include "Encoder.hh"
#include "Decoder.hh"
#include "Types.hh"

/* A bunch of templates and specializations for encoding and decoding specific types.

   Primitive AVRO types BOOLEAN, INT, LONG, FLOAT, DOUBLE, STRING and BYTES get decoded to and encoded from C++ types bool, int32_t,
   int64_t, float, double, std::string and std::vector<uint8_t> respectively. In addition, std::vector<T> for arbitrary type T gets
   encoded as an Avro array of T. Similarly, std::map<std::string, T> for arbitrary type T gets encoded as an Avro map with value
   type T.

   Users can have their custom types encoded/decoded by specializing avrolite::codec_traits class for their types.*/
namespace avrolite {

  /* Codec_traits tells avrolite how to encode and decode an object of given type.

     The class is expected to have two static methods:
     static void encode(Encoder& e, const T& value);
     static void decode(Decoder& e, T& value);
     The default is empty.*/
  template <typename T>
  struct codec_traits;

  template <typename T>
  void encode(Encoder& e, const T& t);

  template <typename T>
  void decode(Decoder& d, T& t);

  /* codec_traits for Avro boolean.*/
  template <> struct codec_traits<bool> {

    static void encode(Encoder& e, bool b) {
      e.encodeBool(b);
    }

    static void decode(Decoder& d, bool& b) {
      b = d.decodeBool();
    }
  };

  /* codec_traits for Avro int.*/
  template <> struct codec_traits<int32_t> {

    static void encode(Encoder& e, int32_t i) {
      e.encodeInt(i);
    }

    static void decode(Decoder& d, int32_t& i) {
      i = d.decodeInt();
    }
  };

  /* codec_traits for Avro long.*/
  template <> struct codec_traits<int64_t> {

    static void encode(Encoder& e, int64_t l) {
      e.encodeLong(l);
    }

    static void decode(Decoder& d, int64_t& l) {
      l = d.decodeLong();
    }
  };

  /* codec_traits for Avro float.*/
  template <> struct codec_traits<float> {

    static void encode(Encoder& e, float f) {
      e.encodeFloat(f);
    }

    static void decode(Decoder& d, float& f) {
      f = d.decodeFloat();
    }
  };

  /* codec_traits for Avro double.*/
  template <> struct codec_traits<double> {

    static void encode(Encoder& e, double d) {
      e.encodeDouble(d);
    }

    static void decode(Decoder& d, double& dbl) {
      dbl = d.decodeDouble();
    }
  };

  /* codec_traits for Avro string.*/
  template <> struct codec_traits<std::string> {

    static void encode(Encoder& e, const std::string& s) {
      e.encodeString(s);
    }

    static void decode(Decoder& d, std::string& s) {
      s = d.decodeString();
    }
  };

  /* codec_traits for Avro bytes.*/
  template <> struct codec_traits<std::vector<uint8_t> > {

    static void encode(Encoder& e, const std::vector<uint8_t>& b) {
      e.encodeBytes(b);
    }

    static void decode(Decoder& d, std::vector<uint8_t>& s) {
      d.decodeBytes(s);
    }
  };

  /* codec_traits for Avro fixed.*/
  template <size_t N> struct codec_traits<boost::array<uint8_t, N> > {

    static void encode(Encoder& e, const boost::array<uint8_t, N>& s) {
      e.encodeFixed(s.data(), N);
    }

    static void decode(Decoder& d, boost::array<uint8_t, N>& s) {
      std::vector<uint8_t> v(N);
      d.decodeFixed(N, v);
      std::copy(v.begin(), v.end(), s.begin());
    }
  };

  /* codec_traits for Avro arrays.*/
  template <typename T> struct codec_traits<std::vector<T> > {

    static void encode(Encoder& e, const std::vector<T>& b) {
      e.arrayStart();
      if (!b.empty()) {
        e.setItemCount(b.size());
        for (typename std::vector<T>::const_iterator it = b.begin();
          it != b.end(); ++it) {
          e.startItem();
          avrolite::encode(e, *it);
        }
      }
      e.arrayEnd();
    }

    static void decode(Decoder& d, std::vector<T>& s) {
      s.clear();
      for (size_t n = d.arrayStart(); n != 0; n = d.arrayNext()) {
        for (size_t i = 0; i < n; ++i) {
          T t;
          avrolite::decode(d, t);
          s.push_back(t);
        }
      }
    }
  };

  /* codec_traits for Avro maps.*/
  template <typename T> struct codec_traits<std::map<std::string, T> > {

    static void encode(Encoder& e, const std::map<std::string, T>& b) {
      e.mapStart();
      if (!b.empty()) {
        e.setItemCount(b.size());
        for (typename std::map<std::string, T>::const_iterator
          it = b.begin();
          it != b.end(); ++it) {
          e.startItem();
          avrolite::encode(e, it->first);
          avrolite::encode(e, it->second);
        }
      }
      e.mapEnd();
    }

    static void decode(Decoder& d, std::map<std::string, T>& s) {
      s.clear();
      for (size_t n = d.mapStart(); n != 0; n = d.mapNext()) {
        for (size_t i = 0; i < n; ++i) {
          std::string k;
          avrolite::decode(d, k);
          T t;
          avrolite::decode(d, t);
          s[k] = t;
        }
      }
    }
  };

  /* codec_traits for Avro null.*/
  template <> struct codec_traits<Null> {

    static void encode(Encoder& e, const Null&) {
      e.encodeNull();
    }

    static void decode(Decoder& d, Null&) {
      d.decodeNull();
    }
  };

  /* Generic encoder function that makes use of the codec_traits.*/
  template <typename T>
  void encode(Encoder& e, const T& t) {
    codec_traits<T>::encode(e, t);
  }

  /* Generic decoder function that makes use of the codec_traits.*/
  template <typename T>
  void decode(Decoder& d, T& t) {
    codec_traits<T>::decode(d, t);
  }

}

#endif
