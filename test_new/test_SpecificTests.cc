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

#include <catch.hpp>
#include <cmath>
#include <memory>
#include "Compiler.hh"
#include "Specific.hh"
#include "Stream.hh"

using std::string;
using std::vector;
using std::map;
using boost::array;

namespace avrolite {

  /* A hand written type standing for the record {"x": int, "y": long, "tags": array<string>}*/
  struct Point {
    int32_t x;
    int64_t y;
    vector<string> tags;

    Point() : x(0), y(0) { }

    bool operator==(const Point& oth) const {
      return x == oth.x && y == oth.y && tags == oth.tags;
    }
  };

  template <> struct codec_traits<Point> {

    static void encode(Encoder& e, const Point& p) {
      avrolite::encode(e, p.x);
      avrolite::encode(e, p.y);
      avrolite::encode(e, p.tags);
    }

    static void decode(Decoder& d, Point& p) {
      avrolite::decode(d, p.x);
      avrolite::decode(d, p.y);
      avrolite::decode(d, p.tags);
    }
  };

}

using namespace avrolite;

namespace {

  class Harness {
    OutputStreamPtr os_;
    EncoderPtr e_;
    DecoderPtr d_;
  public:

    Harness(const EncoderPtr& e, const DecoderPtr& d) : os_(memoryOutputStream()), e_(e), d_(d) {
      e_->init(*os_);
    }

    template <typename T> void encode(const T& t) {
      avrolite::encode(*e_, t);
      e_->flush();
    }

    template <typename T> void decode(T& t) {
      InputStreamPtr is = memoryInputStream(*os_);
      d_->init(*is);
      avrolite::decode(*d_, t);
    }

    vector<uint8_t> bytes() const {
      return *snapshot(*os_);
    }

    string text() const {
      vector<uint8_t> b = bytes();
      return string(b.begin(), b.end());
    }
  };

  template <typename T> T binaryRoundTrip(const T& t) {
    Harness h(binaryEncoder(), binaryDecoder());
    h.encode(t);
    T actual = T();
    h.decode(actual);
    return actual;
  }

  const char pointSchema[] =
    "{\"type\": \"record\", \"name\": \"Point\", \"fields\": ["
    "  {\"name\": \"x\", \"type\": \"int\"},"
    "  {\"name\": \"y\", \"type\": \"long\"},"
    "  {\"name\": \"tags\", \"type\": {\"type\": \"array\", \"items\": \"string\"}}"
    "]}";

}

TEST_CASE("Specific types: scalars through the binary codec", "[specific]") {
  REQUIRE(binaryRoundTrip(true) == true);
  REQUIRE(binaryRoundTrip(int32_t(-10)) == -10);
  REQUIRE(binaryRoundTrip(int64_t(-109)) == -109);
  REQUIRE(std::abs(binaryRoundTrip(10.19f) - 10.19f) < 0.00001f);
  REQUIRE(binaryRoundTrip(10.00001) == 10.00001);
  REQUIRE(binaryRoundTrip(string("abc")) == "abc");

  uint8_t values[] = {1, 7, 23, 47, 83};
  vector<uint8_t> n(values, values + 5);
  REQUIRE(binaryRoundTrip(n) == n);
}

TEST_CASE("Specific types: wire bytes of an int and a string", "[specific]") {
  Harness h(binaryEncoder(), binaryDecoder());
  h.encode(int32_t(-3));
  h.encode(string("hi"));
  uint8_t expected[] = {0x05, 0x04, 'h', 'i'};
  REQUIRE(h.bytes() == vector<uint8_t>(expected, expected + sizeof(expected)));
}

TEST_CASE("Specific types: containers", "[specific]") {
  vector<int64_t> longs;
  for (int64_t i = -3; i < 300; i += 7) {
    longs.push_back(i * i * i);
  }
  REQUIRE(binaryRoundTrip(longs) == longs);
  REQUIRE(binaryRoundTrip(vector<int64_t>()).empty());

  map<string, vector<double> > m;
  m["a"].push_back(1.5);
  m["b"];
  m["c"].push_back(-0.25);
  m["c"].push_back(1e100);
  REQUIRE(binaryRoundTrip(m) == m);

  array<uint8_t, 4> fixed = {{0xde, 0xad, 0xbe, 0xef}};
  REQUIRE(binaryRoundTrip(fixed) == fixed);
}

TEST_CASE("Specific types: user type with its own codec_traits", "[specific]") {
  Point p;
  p.x = 10;
  p.y = 1023;
  p.tags.push_back("north");
  p.tags.push_back("");
  REQUIRE(binaryRoundTrip(p) == p);
}

TEST_CASE("Specific types: validated against a schema", "[specific]") {
  ValidSchema s = compileJsonSchemaFromString(pointSchema);
  Point p;
  p.x = -1;
  p.y = 1LL << 40;
  p.tags.push_back("t");

  Harness h(validatingEncoder(s, binaryEncoder()), validatingDecoder(s, binaryDecoder()));
  h.encode(p);
  Point actual;
  h.decode(actual);
  REQUIRE(actual == p);

  Harness wrong(validatingEncoder(s, binaryEncoder()), binaryDecoder());
  REQUIRE_THROWS_AS(wrong.encode(string("not a point")), ResolutionException);
}

TEST_CASE("Specific types: JSON text of a record", "[specific]") {
  ValidSchema s = compileJsonSchemaFromString(pointSchema);
  Point p;
  p.x = 3;
  p.y = -4;
  p.tags.push_back("a");
  p.tags.push_back("b");

  Harness h(jsonEncoder(s), jsonDecoder(s));
  h.encode(p);
  REQUIRE(h.text() == "{\"x\":3,\"y\":-4,\"tags\":[\"a\",\"b\"]}");
  Point actual;
  h.decode(actual);
  REQUIRE(actual == p);
}
