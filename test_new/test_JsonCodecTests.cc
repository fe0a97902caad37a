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
#include <limits>
#include "Compiler.hh"
#include "Decoder.hh"
#include "Encoder.hh"
#include "Generic.hh"
#include "Stream.hh"

using std::string;
using std::vector;
using namespace avrolite;

namespace {

  GenericDatum fromJson(const ValidSchema& s, const string& text) {
    InputStreamPtr in = stringInputStream(text);
    DecoderPtr d = jsonDecoder(s);
    d->init(*in);
    GenericDatum datum(s);
    GenericReader::read(*d, datum);
    d->drain();
    return datum;
  }

  string toJson(const ValidSchema& s, const GenericDatum& datum,
    const JsonEncoderOptions& options = JsonEncoderOptions()) {
    OutputStreamPtr out = memoryOutputStream();
    EncoderPtr e = jsonEncoder(s, options);
    e->init(*out);
    GenericWriter::write(*e, datum);
    e->flush();
    std::shared_ptr<vector<uint8_t> > b = snapshot(*out);
    return string(b->begin(), b->end());
  }

  const GenericRecord& record(const GenericDatum& d) {
    return d.value<GenericRecord>();
  }

  const char personSchema[] =
    "{\"type\": \"record\", \"name\": \"Person\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\", \"aliases\": [\"old_a\"]},"
    "  {\"name\": \"b\", \"type\": \"string\"},"
    "  {\"name\": \"c\", \"type\": \"long\", \"default\": 5}"
    "]}";

}

TEST_CASE("JSON codec: members in any order", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  GenericDatum d = fromJson(s, "{\"b\": \"x\", \"c\": 9, \"a\": 1}");
  REQUIRE(record(d).field("a").value<int32_t>() == 1);
  REQUIRE(record(d).field("b").value<string>() == "x");
  REQUIRE(record(d).field("c").value<int64_t>() == 9);
  REQUIRE(toJson(s, d) == "{\"a\":1,\"b\":\"x\",\"c\":9}");
}

TEST_CASE("JSON codec: undeclared members are ignored", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  GenericDatum d = fromJson(s, "{\"zz\": [1, {\"q\": [2]}], \"a\": 2, \"b\": \"y\", \"c\": 0, \"yy\": null}");
  REQUIRE(record(d).field("a").value<int32_t>() == 2);
  REQUIRE(record(d).field("c").value<int64_t>() == 0);
}

TEST_CASE("JSON codec: missing members", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  GenericDatum d = fromJson(s, "{\"b\": \"z\", \"old_a\": 3}");
  REQUIRE(record(d).field("a").value<int32_t>() == 3);
  REQUIRE(record(d).field("c").value<int64_t>() == 5);

  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": 1, \"c\": 2}"), ResolutionException);
}

TEST_CASE("JSON codec: defaults of every shape", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"D\", \"fields\": ["
    "  {\"name\": \"u\", \"type\": [\"int\", \"null\"], \"default\": 3},"
    "  {\"name\": \"n\", \"type\": [\"null\", \"string\"], \"default\": null},"
    "  {\"name\": \"arr\", \"type\": {\"type\": \"array\", \"items\": \"double\"}, \"default\": [1, 2.5]},"
    "  {\"name\": \"m\", \"type\": {\"type\": \"map\", \"values\": \"boolean\"}, \"default\": {\"t\": true}},"
    "  {\"name\": \"bin\", \"type\": \"bytes\", \"default\": \"\\u00ff\"},"
    "  {\"name\": \"e\", \"type\": {\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"P\", \"Q\"]}, \"default\": \"Q\"},"
    "  {\"name\": \"r\", \"type\": {\"type\": \"record\", \"name\": \"In\", \"fields\": [{\"name\": \"x\", \"type\": \"float\"}]},"
    "   \"default\": {\"x\": 0.5}}"
    "]}");
  GenericDatum d = fromJson(s, "{}");
  const GenericRecord& r = record(d);
  REQUIRE(r.field("u").unionBranch() == 0);
  REQUIRE(r.field("u").value<int32_t>() == 3);
  REQUIRE(r.field("n").unionBranch() == 0);
  REQUIRE(r.field("arr").value<GenericArray>().value().size() == 2);
  REQUIRE(r.field("arr").value<GenericArray>().value()[1].value<double>() == 2.5);
  REQUIRE(r.field("m").value<GenericMap>().value()[0].second.value<bool>());
  REQUIRE(r.field("bin").value<vector<uint8_t> >() == vector<uint8_t>(1, 0xff));
  REQUIRE(r.field("e").value<GenericEnum>().symbol() == "Q");
  REQUIRE(record(r.field("r")).field("x").value<float>() == 0.5f);
}

TEST_CASE("JSON codec: nested records and arrays", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"Outer\", \"fields\": ["
    "  {\"name\": \"items\", \"type\": {\"type\": \"array\", \"items\":"
    "    {\"type\": \"record\", \"name\": \"Pt\", \"fields\": [{\"name\": \"x\", \"type\": \"int\"}, {\"name\": \"y\", \"type\": \"int\"}]}}},"
    "  {\"name\": \"last\", \"type\": \"Pt\"}"
    "]}");
  GenericDatum d = fromJson(s, "{\"last\": {\"y\": 6, \"x\": 5}, \"items\": [{\"y\": 2, \"x\": 1}, {\"x\": 3, \"y\": 4}]}");
  const GenericArray::Value& items = record(d).field("items").value<GenericArray>().value();
  REQUIRE(items.size() == 2);
  REQUIRE(record(items[0]).field("x").value<int32_t>() == 1);
  REQUIRE(record(items[0]).field("y").value<int32_t>() == 2);
  REQUIRE(record(items[1]).field("x").value<int32_t>() == 3);
  REQUIRE(record(record(d).field("last")).field("x").value<int32_t>() == 5);
  REQUIRE(toJson(s, d) == "{\"items\":[{\"x\":1,\"y\":2},{\"x\":3,\"y\":4}],\"last\":{\"x\":5,\"y\":6}}");
}

TEST_CASE("JSON codec: member of the wrong type", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": \"1\", \"b\": \"x\"}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": 1.5, \"b\": \"x\"}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": 3000000000, \"b\": \"x\"}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": [1], \"b\": \"x\"}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "[1, \"x\"]"), ResolutionException);
}

TEST_CASE("JSON codec: malformed text", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\": 1, \"b\": \"x\""), FormatException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"a\" 1}"), FormatException);
}

struct RealData {
  const char* text;
  double value;
};

RealData realData[] = {
  { "1", 1.0},
  { "-2.5", -2.5},
  { "1e3", 1000.0},
  { "\"Infinity\"", std::numeric_limits<double>::infinity()},
  { "\"INF\"", std::numeric_limits<double>::infinity()},
  { "\"-Infinity\"", -std::numeric_limits<double>::infinity()},
  { "\"-INF\"", -std::numeric_limits<double>::infinity()},
};

TEST_CASE("JSON codec: floating point values", "[json]") {
  ValidSchema s = compileJsonSchemaFromString("\"double\"");
  for (auto& r : realData) {
    REQUIRE(fromJson(s, r.text).value<double>() == r.value);
  }
  REQUIRE(std::isnan(fromJson(s, "\"NaN\"").value<double>()));
  REQUIRE_THROWS_AS(fromJson(s, "\"nan\""), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "\"inf\""), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "\"\""), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "\"1.5\""), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "true"), ResolutionException);

  REQUIRE(toJson(s, GenericDatum(std::numeric_limits<double>::quiet_NaN())) == "\"NaN\"");
  REQUIRE(toJson(s, GenericDatum(-std::numeric_limits<double>::infinity())) == "\"-Infinity\"");
  REQUIRE(toJson(s, GenericDatum(0.1)) == "0.1");

  ValidSchema f = compileJsonSchemaFromString("\"float\"");
  REQUIRE(toJson(f, GenericDatum(0.1f)) == "0.1");
  REQUIRE(fromJson(f, "0.1").value<float>() == 0.1f);
}

TEST_CASE("JSON codec: unions", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(
    "[\"null\", \"int\", {\"type\": \"map\", \"values\": \"long\"},"
    " {\"type\": \"record\", \"name\": \"R\", \"namespace\": \"ns\", \"fields\": [{\"name\": \"f\", \"type\": \"string\"}]}]");

  GenericDatum n = fromJson(s, "null");
  REQUIRE(n.unionBranch() == 0);
  REQUIRE(toJson(s, n) == "null");

  GenericDatum i = fromJson(s, "{\"int\": 7}");
  REQUIRE(i.unionBranch() == 1);
  REQUIRE(i.value<int32_t>() == 7);
  REQUIRE(toJson(s, i) == "{\"int\":7}");

  GenericDatum m = fromJson(s, "{\"map\": {\"a\": 1, \"b\": 2}}");
  REQUIRE(m.unionBranch() == 2);
  REQUIRE(m.value<GenericMap>().value().size() == 2);
  REQUIRE(toJson(s, m) == "{\"map\":{\"a\":1,\"b\":2}}");

  GenericDatum r = fromJson(s, "{\"ns.R\": {\"f\": \"v\"}}");
  REQUIRE(r.unionBranch() == 3);
  REQUIRE(toJson(s, r) == "{\"ns.R\":{\"f\":\"v\"}}");

  REQUIRE_THROWS_AS(fromJson(s, "{\"int\": 1, \"map\": {}}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"long\": 1}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "7"), ResolutionException);
}

TEST_CASE("JSON codec: union wrapper is closed on drain", "[json]") {
  ValidSchema s = compileJsonSchemaFromString("[\"null\", \"int\", \"string\"]");
  InputStreamPtr in = stringInputStream("{\"int\": 1, \"string\": \"x\"}");
  DecoderPtr d = jsonDecoder(s);
  d->init(*in);
  GenericDatum datum(s);
  GenericReader::read(*d, datum);
  REQUIRE(datum.value<int32_t>() == 1);
  REQUIRE_THROWS_AS(d->drain(), ResolutionException);
}

TEST_CASE("JSON codec: union branches without the wrapper object", "[json]") {
  ValidSchema s = compileJsonSchemaFromString("[\"null\", \"string\"]");
  GenericDatum d(s);
  d.selectBranch(1);
  d.value<string>() = "plain";
  JsonEncoderOptions options;
  options.includeNamespace = false;
  REQUIRE(toJson(s, d, options) == "\"plain\"");
  REQUIRE(toJson(s, d) == "{\"string\":\"plain\"}");
}

TEST_CASE("JSON codec: binary values as Latin-1 text", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"B\", \"fields\": ["
    "  {\"name\": \"b\", \"type\": \"bytes\"},"
    "  {\"name\": \"f\", \"type\": {\"type\": \"fixed\", \"name\": \"F\", \"size\": 2}}"
    "]}");
  GenericDatum d = fromJson(s, "{\"f\": \"\\u00e9Z\", \"b\": \"A\\u0000\\u00ff\"}");
  const uint8_t expected[] = {0x41, 0x00, 0xff};
  REQUIRE(record(d).field("b").value<vector<uint8_t> >() == vector<uint8_t>(expected, expected + 3));
  REQUIRE(record(d).field("f").value<GenericFixed>().value()[0] == 0xe9);
  REQUIRE(toJson(s, d) == "{\"b\":\"A\\u0000\\u00ff\",\"f\":\"\\u00e9Z\"}");

  REQUIRE_THROWS_AS(fromJson(s, "{\"b\": \"\\u0100\", \"f\": \"ab\"}"), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "{\"b\": \"\", \"f\": \"abc\"}"), ResolutionException);
}

TEST_CASE("JSON codec: enums by symbol", "[json]") {
  ValidSchema s = compileJsonSchemaFromString("{\"type\": \"enum\", \"name\": \"Suit\", \"symbols\": [\"SPADES\", \"HEARTS\"]}");
  GenericDatum d = fromJson(s, "\"HEARTS\"");
  REQUIRE(d.value<GenericEnum>().value() == 1);
  REQUIRE(toJson(s, d) == "\"HEARTS\"");
  REQUIRE_THROWS_AS(fromJson(s, "\"CLUBS\""), ResolutionException);
  REQUIRE_THROWS_AS(fromJson(s, "1"), ResolutionException);
}

TEST_CASE("JSON codec: pretty output", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  GenericDatum d(s);
  GenericRecord& r = d.value<GenericRecord>();
  r.field("a") = GenericDatum(int32_t(1));
  r.field("b") = GenericDatum(string("x"));
  r.field("c") = GenericDatum(int64_t(2));
  JsonEncoderOptions options;
  options.pretty = true;
  REQUIRE(toJson(s, d, options) == "{\n  \"a\": 1,\n  \"b\": \"x\",\n  \"c\": 2\n}");
}

TEST_CASE("JSON codec: consecutive top level values", "[json]") {
  ValidSchema s = compileJsonSchemaFromString("\"int\"");
  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = jsonEncoder(s);
  e->init(*out);
  e->encodeInt(1);
  e->encodeInt(-2);
  e->flush();
  std::shared_ptr<vector<uint8_t> > b = snapshot(*out);
  REQUIRE(string(b->begin(), b->end()) == "1 -2");

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr d = jsonDecoder(s);
  d->init(*in);
  REQUIRE(d->decodeInt() == 1);
  REQUIRE(d->decodeInt() == -2);
}

TEST_CASE("JSON codec: encoder rejects calls the schema does not allow", "[json]") {
  ValidSchema s = compileJsonSchemaFromString(personSchema);
  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = jsonEncoder(s);
  e->init(*out);
  e->encodeInt(1);
  REQUIRE_THROWS_AS(e->encodeLong(2), ResolutionException);
}

TEST_CASE("JSON codec: writer text read with a reader schema", "[json]") {
  ValidSchema writer = compileJsonSchemaFromString(personSchema);
  ValidSchema reader = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"Person\", \"fields\": ["
    "  {\"name\": \"b\", \"type\": \"string\"},"
    "  {\"name\": \"a\", \"type\": \"double\"},"
    "  {\"name\": \"d\", \"type\": \"string\", \"default\": \"dflt\"}"
    "]}");
  InputStreamPtr in = stringInputStream("{\"c\": 1, \"b\": \"bee\", \"a\": 4}");
  ResolvingDecoderPtr rd = resolvingDecoder(writer, reader, jsonDecoder(writer));
  rd->init(*in);
  GenericDatum d;
  GenericReader::read(*rd, d, reader);
  REQUIRE(record(d).field("a").value<double>() == 4.0);
  REQUIRE(record(d).field("b").value<string>() == "bee");
  REQUIRE(record(d).field("d").value<string>() == "dflt");
}
