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
#include <string>
#include <vector>
#include <cmath>
#include <limits>
#include "Exception.hh"
#include "Stream.hh"
#include "../impl/json/JsonDom.hh"
#include "../impl/json/JsonIO.hh"

using std::string;
using std::vector;
using namespace avrolite;
using namespace avrolite::json;

TEST_CASE("JSON document: empty containers", "[containers]") {
  REQUIRE(loadEntity("null").type() == etNull);
  REQUIRE(loadEntity("[]").arrayValue().empty());
  REQUIRE(loadEntity(" { } ").objectValue().empty());
}

TEST_CASE("JSON document: nested array and object", "[containers]") {
  Entity n = loadEntity("{\"k1\": 100, \"k2\": [400, \"v0\", {\"x\": null}]}");
  REQUIRE(n.type() == etObject);
  const Object& m = n.objectValue();
  REQUIRE(m.size() == 2);

  Object::const_iterator it = m.find("k1");
  REQUIRE(it != m.end());
  REQUIRE(it->second.longValue() == 100ll);

  it = m.find("k2");
  REQUIRE(it != m.end());
  const Array& a = it->second.arrayValue();
  REQUIRE(a.size() == 3);
  REQUIRE(a[0].longValue() == 400ll);
  REQUIRE(a[1].stringValue() == "v0");
  REQUIRE(a[2].objectValue().find("x")->second.type() == etNull);
}

TEST_CASE("JSON document: last duplicate key wins", "[containers]") {
  Entity n = loadEntity("{\"a\": 1, \"a\": 2}");
  REQUIRE(n.objectValue().size() == 1);
  REQUIRE(n.objectValue().find("a")->second.longValue() == 2);
}

TEST_CASE("JSON document: accessor of the wrong type throws", "[containers]") {
  Entity n = loadEntity("[1]");
  REQUIRE_THROWS_AS(n.objectValue(), Exception);
  REQUIRE_THROWS_AS(n.stringValue(), Exception);
}

template <typename T>
struct TestData {
  const char *input;
  EntityType type;
  T value;
};

TestData<bool> boolData[] = {
  { "true", etBool, true},
  { "false", etBool, false},
};

TestData<int64_t> longData[] = {
  { "0", etLong, 0},
  { "-1", etLong, -1},
  { "9223372036854775807", etLong, 9223372036854775807LL},
  { "-9223372036854775807", etLong, -9223372036854775807LL},
};

TestData<double> doubleData[] = {
  { "-1.0", etDouble, -1.0},
  { "4.7e3", etDouble, 4700.0},
  { "-7.2e-4", etDouble, -0.00072},
  { "1E4", etDouble, 10000},
  { "-0e0", etDouble, 0.0},
};

TestData<const char*> stringData[] = {
  { "\"\"", etString, ""},
  { "\"\\u000a\"", etString, "\n"},
  { "\"\\\"\\\\\\/\"", etString, "\"\\/"},
  { "\"\\u00e9\"", etString, "\xc3\xa9"},
  { "\"\\ud83d\\ude00\"", etString, "\xf0\x9f\x98\x80"},
};

TEST_CASE("JSON document: scalars", "[scalars]") {
  for (auto& d : boolData) {
    Entity n = loadEntity(d.input);
    REQUIRE(n.type() == d.type);
    REQUIRE(n.boolValue() == d.value);
  }
  for (auto& d : longData) {
    Entity n = loadEntity(d.input);
    REQUIRE(n.type() == d.type);
    REQUIRE(n.longValue() == d.value);
  }
  for (auto& d : doubleData) {
    Entity n = loadEntity(d.input);
    REQUIRE(n.type() == d.type);
    REQUIRE(std::abs(n.doubleValue() - d.value) < 1e-10);
  }
  for (auto& d : stringData) {
    Entity n = loadEntity(d.input);
    REQUIRE(n.type() == d.type);
    REQUIRE(n.stringValue() == d.value);
  }
}

const char* malformed[] = {
  "",
  "[1, 2",
  "{\"a\" 1}",
  "{\"a\": 1,}",
  "[1 2]",
  "\"unterminated",
  "tru",
  "nul",
  "01x",
  "{\"a\": 1}}",
  "\"\\x\"",
  "]",
};

TEST_CASE("JSON document: malformed text is a format error", "[malformed]") {
  for (auto& text : malformed) {
    REQUIRE_THROWS_AS(loadEntity(text), FormatException);
  }
}

TEST_CASE("JSON document: compact text", "[write]") {
  Entity n = loadEntity("{ \"b\" : [ 1 , 2.5, \"x\" ], \"a\" : true }");
  REQUIRE(n.toString() == "{\"a\":true,\"b\":[1,2.5,\"x\"]}");
}

TEST_CASE("JSON parser: token stream", "[parser]") {
  const char text[] = "{\"k\": [1, -2.5, \"s\", null, false]}";
  InputStreamPtr in = memoryInputStream(reinterpret_cast<const uint8_t*> (text), sizeof(text) - 1);
  JsonParser p;
  p.init(*in);

  JsonParser::Token expected[] = {
    JsonParser::tkObjectStart, JsonParser::tkString, JsonParser::tkArrayStart, JsonParser::tkLong, JsonParser::tkDouble,
    JsonParser::tkString, JsonParser::tkNull, JsonParser::tkBool, JsonParser::tkArrayEnd, JsonParser::tkObjectEnd
  };
  for (auto& tk : expected) {
    REQUIRE(p.peek() == tk);
    REQUIRE(p.advance() == tk);
  }
  REQUIRE(p.atEnd());
}

TEST_CASE("JSON parser: expectToken reports a mismatch", "[parser]") {
  const char text[] = "[1]";
  InputStreamPtr in = memoryInputStream(reinterpret_cast<const uint8_t*> (text), sizeof(text) - 1);
  JsonParser p;
  p.init(*in);
  REQUIRE_THROWS_AS(p.expectToken(JsonParser::tkObjectStart), ResolutionException);
}

TEST_CASE("JSON generator: binary strings and special numbers", "[generator]") {
  OutputStreamPtr out = memoryOutputStream();
  JsonGenerator<JsonNullFormatter> g;
  g.init(*out);
  g.arrayStart();
  const uint8_t bytes[] = {0x41, 0x00, 0xff};
  g.encodeBinary(bytes, sizeof(bytes));
  g.encodeNumber(std::numeric_limits<double>::quiet_NaN());
  g.encodeNumber(-std::numeric_limits<double>::infinity());
  g.encodeNumber(1.0);
  g.arrayEnd();
  g.flush();

  std::shared_ptr<vector<uint8_t> > data = snapshot(*out);
  string s(data->begin(), data->end());
  REQUIRE(s == "[\"A\\u0000\\u00ff\",\"NaN\",\"-Infinity\",1.0]");
}

TEST_CASE("JSON generator: Latin-1 text round trip", "[generator]") {
  vector<uint8_t> out;
  REQUIRE(toLatin1("A\xc3\xa9", out));
  REQUIRE(out.size() == 2);
  REQUIRE(out[1] == 0xe9);
  REQUIRE_FALSE(toLatin1("\xe2\x82\xac", out));
}
