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
#include "Compiler.hh"
#include "Decoder.hh"
#include "Encoder.hh"
#include "Generic.hh"
#include "Specific.hh"
#include "Stream.hh"

using std::string;
using std::vector;
using std::make_pair;
using namespace avrolite;

namespace {

  const char richSchema[] =
    "{\"type\": \"record\", \"name\": \"Rich\", \"namespace\": \"ns\", \"fields\": ["
    "  {\"name\": \"flag\", \"type\": \"boolean\"},"
    "  {\"name\": \"color\", \"type\": {\"type\": \"enum\", \"name\": \"Color\", \"symbols\": [\"RED\", \"GREEN\"]}},"
    "  {\"name\": \"id\", \"type\": {\"type\": \"fixed\", \"name\": \"Id\", \"size\": 2}},"
    "  {\"name\": \"scores\", \"type\": {\"type\": \"map\", \"values\": \"double\"}},"
    "  {\"name\": \"tags\", \"type\": {\"type\": \"array\", \"items\": \"string\"}},"
    "  {\"name\": \"opt\", \"type\": [\"null\", \"Color\", \"long\"]},"
    "  {\"name\": \"child\", \"type\": [\"null\", \"Rich\"]}"
    "]}";

  void fill(GenericRecord& r, const string& tag) {
    r.field("flag") = GenericDatum(true);
    r.field("color").value<GenericEnum>().set("GREEN");
    vector<uint8_t>& id = r.field("id").value<GenericFixed>().value();
    id[0] = 0x01;
    id[1] = 0xfe;
    r.field("scores").value<GenericMap>().value().push_back(make_pair(string("math"), GenericDatum(1.25)));
    r.field("scores").value<GenericMap>().value().push_back(make_pair(string("art"), GenericDatum(-0.5)));
    r.field("tags").value<GenericArray>().value().push_back(GenericDatum(tag));
    GenericDatum& opt = r.field("opt");
    opt.selectBranch(1);
    opt.value<GenericEnum>().set(size_t(1));
  }

  GenericDatum sample(const ValidSchema& s) {
    GenericDatum d(s);
    GenericRecord& r = d.value<GenericRecord>();
    fill(r, "top");
    GenericDatum& child = r.field("child");
    child.selectBranch(1);
    fill(child.value<GenericRecord>(), "inner");
    child.value<GenericRecord>().field("opt").selectBranch(2);
    child.value<GenericRecord>().field("opt").value<int64_t>() = -77;
    return d;
  }

  OutputStreamPtr binary(const ValidSchema& s, const GenericDatum& d) {
    OutputStreamPtr out = memoryOutputStream();
    EncoderPtr e = binaryEncoder();
    e->init(*out);
    GenericWriter w(s, e);
    w.write(d);
    e->flush();
    return out;
  }

}

TEST_CASE("Generic: binary round trip of a rich record", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(richSchema);
  GenericDatum d = sample(s);
  OutputStreamPtr out = binary(s, d);

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = validatingDecoder(s, binaryDecoder());
  dec->init(*in);
  GenericReader r(s, dec);
  GenericDatum back;
  r.read(back);
  REQUIRE(back == d);

  const GenericRecord& rec = back.value<GenericRecord>();
  REQUIRE(rec.field("color").value<GenericEnum>().symbol() == "GREEN");
  REQUIRE(rec.field("id").value<GenericFixed>().value()[1] == 0xfe);
  REQUIRE(rec.field("scores").value<GenericMap>().value()[1].first == "art");
  REQUIRE(rec.field("child").unionBranch() == 1);
  REQUIRE(rec.field("child").value<GenericRecord>().field("opt").value<int64_t>() == -77);
}

TEST_CASE("Generic: JSON round trip of a rich record", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(richSchema);
  GenericDatum d = sample(s);

  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = jsonEncoder(s);
  e->init(*out);
  GenericWriter(s, e).write(d);
  e->flush();

  std::shared_ptr<vector<uint8_t> > text = snapshot(*out);
  string json(text->begin(), text->end());
  REQUIRE(json.find("{\"ns.Color\":\"GREEN\"}") != string::npos);
  REQUIRE(json.find("\"id\":\"\\u0001\\u00fe\"") != string::npos);

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = jsonDecoder(s);
  dec->init(*in);
  GenericDatum back;
  GenericReader(s, dec).read(back);
  REQUIRE(back == d);
}

TEST_CASE("Generic: reading into a datum of the same shape reuses it", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(richSchema);
  GenericDatum first = sample(s);
  first.value<GenericRecord>().field("tags").value<GenericArray>().value().push_back(GenericDatum("extra"));

  GenericDatum second(s);
  fill(second.value<GenericRecord>(), "only");

  OutputStreamPtr out = binary(s, second);
  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = binaryDecoder();
  dec->init(*in);
  GenericReader r(s, dec);

  GenericDatum target = first;
  r.read(target, true);
  REQUIRE(target == second);
  REQUIRE(target.value<GenericRecord>().field("tags").value<GenericArray>().value().size() == 1);

  OutputStreamPtr again = binary(s, second);
  InputStreamPtr in2 = memoryInputStream(*again);
  DecoderPtr dec2 = binaryDecoder();
  dec2->init(*in2);
  GenericDatum stranger(int32_t(3));
  GenericReader(s, dec2).read(stranger, true);
  REQUIRE(stranger.type() == Type::AVRO_RECORD);
  REQUIRE(stranger == second);
}

TEST_CASE("Generic: union branch for a value", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(
    "[\"null\", \"int\", {\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"X\"]},"
    " {\"type\": \"array\", \"items\": \"long\"}]");
  const NodePtr& u = s.root();

  REQUIRE(GenericWriter::branchFor(u, GenericDatum()) == 0);
  REQUIRE(GenericWriter::branchFor(u, GenericDatum(int32_t(5))) == 1);
  REQUIRE(GenericWriter::branchFor(u, GenericDatum(u->leafAt(2))) == 2);
  REQUIRE(GenericWriter::branchFor(u, GenericDatum(u->leafAt(3))) == 3);
  REQUIRE_THROWS_AS(GenericWriter::branchFor(u, GenericDatum("text")), ResolutionException);
  REQUIRE_THROWS_AS(GenericWriter::branchFor(u->leafAt(1), GenericDatum(int32_t(5))), Exception);

  ValidSchema other = compileJsonSchemaFromString("{\"type\": \"array\", \"items\": \"string\"}");
  REQUIRE_THROWS_AS(GenericWriter::branchFor(u, GenericDatum(other)), ResolutionException);
}

TEST_CASE("Generic: enum index beyond the symbols", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString("{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"A\", \"B\"]}");
  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = binaryEncoder();
  e->init(*out);
  e->encodeEnum(5);
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = binaryDecoder();
  dec->init(*in);
  GenericDatum d;
  REQUIRE_THROWS_AS(GenericReader(s, dec).read(d), ResolutionException);
}

TEST_CASE("Generic: datum equality", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(richSchema);
  GenericDatum a = sample(s);
  GenericDatum b = sample(s);
  REQUIRE(a == b);

  b.value<GenericRecord>().field("opt").selectBranch(0);
  REQUIRE(a != b);

  REQUIRE(GenericDatum(int32_t(1)) != GenericDatum(int64_t(1)));
  REQUIRE(GenericDatum("x") == GenericDatum(string("x")));
}

TEST_CASE("Generic: codec traits for a generic datum", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString(richSchema);
  GenericDatum d = sample(s);

  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = validatingEncoder(s, binaryEncoder());
  e->init(*out);
  avrolite::encode(*e, d);
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = binaryDecoder();
  dec->init(*in);
  std::pair<ValidSchema, GenericDatum> p = make_pair(s, GenericDatum());
  avrolite::decode(*dec, p);
  REQUIRE(p.second == d);
}

TEST_CASE("Generic: block count larger than the data", "[generic]") {
  ValidSchema s = compileJsonSchemaFromString("{\"type\": \"array\", \"items\": \"int\"}");
  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = binaryEncoder();
  e->init(*out);
  e->encodeLong(int64_t(1) << 40);
  e->encodeInt(1);
  e->encodeInt(2);
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr dec = binaryDecoder();
  dec->init(*in);
  GenericDatum d;
  REQUIRE_THROWS_AS(GenericReader(s, dec).read(d), FormatException);
}
