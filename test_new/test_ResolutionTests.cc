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
#include "Stream.hh"

using std::string;
using std::vector;
using namespace avrolite;

namespace {

  /* Binary bytes of d, checked against the writer's schema on the way out*/
  OutputStreamPtr written(const ValidSchema& writer, const GenericDatum& d) {
    OutputStreamPtr out = memoryOutputStream();
    EncoderPtr e = validatingEncoder(writer, binaryEncoder());
    e->init(*out);
    GenericWriter::write(*e, d);
    e->flush();
    return out;
  }

  GenericDatum resolved(const ValidSchema& writer, const ValidSchema& reader, const OutputStream& data) {
    InputStreamPtr in = memoryInputStream(data);
    ResolvingDecoderPtr rd = resolvingDecoder(writer, reader, binaryDecoder());
    rd->init(*in);
    GenericDatum d;
    GenericReader::read(*rd, d, reader);
    return d;
  }

  GenericDatum convert(const char* writerText, const char* readerText, const GenericDatum& value) {
    ValidSchema writer = compileJsonSchemaFromString(writerText);
    ValidSchema reader = compileJsonSchemaFromString(readerText);
    return resolved(writer, reader, *written(writer, value));
  }

  const GenericRecord& record(const GenericDatum& d) {
    return d.value<GenericRecord>();
  }

}

TEST_CASE("Resolution: fields the reader does not know are skipped", "[projection]") {
  ValidSchema writer = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\"},"
    "  {\"name\": \"junk\", \"type\": {\"type\": \"array\", \"items\": {\"type\": \"record\", \"name\": \"Inner\", \"fields\": ["
    "    {\"name\": \"x\", \"type\": \"string\"},"
    "    {\"name\": \"y\", \"type\": {\"type\": \"map\", \"values\": \"long\"}}]}}},"
    "  {\"name\": \"b\", \"type\": \"string\"},"
    "  {\"name\": \"u\", \"type\": [\"null\", \"Inner\"]}"
    "]}");
  ValidSchema reader = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"b\", \"type\": \"string\"},"
    "  {\"name\": \"a\", \"type\": \"long\"}"
    "]}");

  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = validatingEncoder(writer, binaryEncoder());
  e->init(*out);
  for (int32_t round = 0; round < 2; ++round) {
    e->encodeInt(7 + round);
    e->arrayStart();
    e->setItemCount(2);
    e->startItem();
    e->encodeString("x1");
    e->mapStart();
    e->setItemCount(1);
    e->startItem();
    e->encodeString("k");
    e->encodeLong(1);
    e->mapEnd();
    e->startItem();
    e->encodeString("x2");
    e->mapStart();
    e->mapEnd();
    e->arrayEnd();
    e->encodeString(round == 0 ? "keep" : "also");
    e->encodeUnionIndex(1);
    e->encodeString("x3");
    e->mapStart();
    e->setItemCount(2);
    e->startItem();
    e->encodeString("p");
    e->encodeLong(-3);
    e->startItem();
    e->encodeString("q");
    e->encodeLong(400);
    e->mapEnd();
  }
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  ResolvingDecoderPtr rd = resolvingDecoder(writer, reader, binaryDecoder());
  rd->init(*in);

  GenericDatum d(reader);
  GenericReader::read(*rd, d);
  REQUIRE(record(d).field("a").value<int64_t>() == 7);
  REQUIRE(record(d).field("b").value<string>() == "keep");

  GenericReader::read(*rd, d);
  REQUIRE(record(d).field("a").value<int64_t>() == 8);
  REQUIRE(record(d).field("b").value<string>() == "also");

  rd->drain();
  REQUIRE(in->byteCount() == out->byteCount());
}

TEST_CASE("Resolution: field order follows the writer", "[projection]") {
  ValidSchema writer = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\"}, {\"name\": \"b\", \"type\": \"string\"}]}");
  ValidSchema reader = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"c\", \"type\": \"int\", \"default\": 3},"
    "  {\"name\": \"b\", \"type\": \"string\"}, {\"name\": \"a\", \"type\": \"int\"}]}");

  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = binaryEncoder();
  e->init(*out);
  e->encodeInt(11);
  e->encodeString("z");
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  ResolvingDecoderPtr rd = resolvingDecoder(writer, reader, binaryDecoder());
  rd->init(*in);

  const vector<size_t>& order = rd->fieldOrder();
  REQUIRE(order.size() == 3);
  REQUIRE(order[0] == 2);
  REQUIRE(order[1] == 1);
  REQUIRE(order[2] == 0);
  REQUIRE(rd->decodeInt() == 11);
  REQUIRE(rd->decodeString() == "z");
  REQUIRE(rd->decodeInt() == 3);
}

TEST_CASE("Resolution: field and record aliases", "[aliases]") {
  const char writerText[] =
    "{\"type\": \"record\", \"name\": \"Old\", \"fields\": ["
    "  {\"name\": \"f3\", \"type\": \"int\"},"
    "  {\"name\": \"legacy\", \"type\": \"string\", \"aliases\": [\"current\"]}]}";
  const char readerText[] =
    "{\"type\": \"record\", \"name\": \"New\", \"aliases\": [\"Old\"], \"fields\": ["
    "  {\"name\": \"current\", \"type\": \"string\"},"
    "  {\"name\": \"b\", \"type\": \"int\", \"aliases\": [\"f3\"]}]}";

  ValidSchema writer = compileJsonSchemaFromString(writerText);
  GenericDatum w(writer);
  GenericRecord& r = w.value<GenericRecord>();
  r.field("f3") = GenericDatum(int32_t(42));
  r.field("legacy") = GenericDatum("renamed");

  GenericDatum d = convert(writerText, readerText, w);
  REQUIRE(record(d).field("b").value<int32_t>() == 42);
  REQUIRE(record(d).field("current").value<string>() == "renamed");
}

TEST_CASE("Resolution: an alias matching two writer fields is an error", "[aliases]") {
  const char writerText[] =
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"p\", \"type\": \"int\"}, {\"name\": \"q\", \"type\": \"int\"}]}";
  const char readerText[] =
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"v\", \"type\": \"int\", \"aliases\": [\"p\", \"q\"]}]}";
  ValidSchema writer = compileJsonSchemaFromString(writerText);
  ValidSchema reader = compileJsonSchemaFromString(readerText);

  ResolvingDecoderPtr rd;
  REQUIRE_NOTHROW(rd = resolvingDecoder(writer, reader, binaryDecoder()));

  GenericDatum w(writer);
  OutputStreamPtr out = written(writer, w);
  REQUIRE_THROWS_AS(resolved(writer, reader, *out), ResolutionException);
}

TEST_CASE("Resolution: numeric promotions", "[promotion]") {
  REQUIRE(convert("\"int\"", "\"long\"", GenericDatum(int32_t(-5))).value<int64_t>() == -5);
  REQUIRE(convert("\"int\"", "\"float\"", GenericDatum(int32_t(3))).value<float>() == 3.0f);
  REQUIRE(convert("\"int\"", "\"double\"", GenericDatum(int32_t(1 << 30))).value<double>() == 1073741824.0);
  REQUIRE(convert("\"long\"", "\"float\"", GenericDatum(int64_t(1024))).value<float>() == 1024.0f);
  REQUIRE(convert("\"long\"", "\"double\"", GenericDatum(-(int64_t(1) << 40))).value<double>() == -1099511627776.0);
  REQUIRE(convert("\"float\"", "\"double\"", GenericDatum(0.5f)).value<double>() == 0.5);
}

TEST_CASE("Resolution: string and bytes read as each other", "[promotion]") {
  GenericDatum b = convert("\"string\"", "\"bytes\"", GenericDatum("hi"));
  const vector<uint8_t>& v = b.value<vector<uint8_t> >();
  REQUIRE(v.size() == 2);
  REQUIRE(v[0] == 'h');
  REQUIRE(v[1] == 'i');

  vector<uint8_t> raw;
  raw.push_back('o');
  raw.push_back('k');
  REQUIRE(convert("\"bytes\"", "\"string\"", GenericDatum(raw)).value<string>() == "ok");
}

TEST_CASE("Resolution: narrowing is not allowed", "[promotion]") {
  REQUIRE_THROWS_AS(convert("\"long\"", "\"int\"", GenericDatum(int64_t(1))), ResolutionException);
  REQUIRE_THROWS_AS(convert("\"double\"", "\"float\"", GenericDatum(1.0)), ResolutionException);
  REQUIRE_THROWS_AS(convert("\"string\"", "\"int\"", GenericDatum("1")), ResolutionException);
}

TEST_CASE("Resolution: defaults fill fields the writer lacks", "[defaults]") {
  const char writerText[] =
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\"}]}";
  const char readerText[] =
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\"},"
    "  {\"name\": \"n\", \"type\": [\"null\", \"string\"], \"default\": null},"
    "  {\"name\": \"s\", \"type\": \"string\", \"default\": \"dflt\"},"
    "  {\"name\": \"arr\", \"type\": {\"type\": \"array\", \"items\": \"long\"}, \"default\": [1, 2]},"
    "  {\"name\": \"p\", \"type\": {\"type\": \"record\", \"name\": \"P\", \"fields\": ["
    "    {\"name\": \"x\", \"type\": \"double\"}]}, \"default\": {\"x\": 1.5}}"
    "]}";

  ValidSchema writer = compileJsonSchemaFromString(writerText);
  GenericDatum w(writer);
  w.value<GenericRecord>().field("a") = GenericDatum(int32_t(9));

  GenericDatum d = convert(writerText, readerText, w);
  const GenericRecord& r = record(d);
  REQUIRE(r.field("a").value<int32_t>() == 9);
  REQUIRE(r.field("n").unionBranch() == 0);
  REQUIRE(r.field("n").type() == Type::AVRO_NULL);
  REQUIRE(r.field("s").value<string>() == "dflt");
  const GenericArray::Value& arr = r.field("arr").value<GenericArray>().value();
  REQUIRE(arr.size() == 2);
  REQUIRE(arr[1].value<int64_t>() == 2);
  REQUIRE(record(r.field("p")).field("x").value<double>() == 1.5);
}

TEST_CASE("Resolution: a missing field without a default fails on read", "[defaults]") {
  ValidSchema writer = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\"}]}");
  ValidSchema reader = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\"}, {\"name\": \"b\", \"type\": \"int\"}]}");

  ResolvingDecoderPtr rd;
  REQUIRE_NOTHROW(rd = resolvingDecoder(writer, reader, binaryDecoder()));
  GenericDatum w(writer);
  REQUIRE_THROWS_AS(resolved(writer, reader, *written(writer, w)), ResolutionException);
}

TEST_CASE("Resolution: enum symbols are matched by name", "[enum]") {
  const char writerText[] = "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"A\", \"B\", \"C\"]}";
  ValidSchema writer = compileJsonSchemaFromString(writerText);
  const NodePtr& node = writer.root();

  GenericDatum c = convert(writerText, "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"C\", \"A\"]}",
    GenericDatum(node, GenericEnum(node, "C")));
  REQUIRE(c.value<GenericEnum>().value() == 0);
  REQUIRE(c.value<GenericEnum>().symbol() == "C");

  GenericDatum b = convert(writerText,
    "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"C\", \"A\"], \"default\": \"A\"}",
    GenericDatum(node, GenericEnum(node, "B")));
  REQUIRE(b.value<GenericEnum>().symbol() == "A");

  REQUIRE_THROWS_AS(convert(writerText, "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"C\", \"A\"]}",
    GenericDatum(node, GenericEnum(node, "B"))), ResolutionException);
}

TEST_CASE("Resolution: named types must agree", "[named]") {
  REQUIRE_THROWS_AS(convert("{\"type\": \"fixed\", \"name\": \"F\", \"size\": 4}",
    "{\"type\": \"fixed\", \"name\": \"F\", \"size\": 2}",
    GenericDatum(compileJsonSchemaFromString("{\"type\": \"fixed\", \"name\": \"F\", \"size\": 4}"))),
    ResolutionException);

  const char writerText[] = "{\"type\": \"record\", \"name\": \"A\", \"fields\": []}";
  ValidSchema writer = compileJsonSchemaFromString(writerText);
  REQUIRE_THROWS_AS(convert(writerText, "{\"type\": \"record\", \"name\": \"B\", \"fields\": []}",
    GenericDatum(writer)), ResolutionException);
}

TEST_CASE("Resolution: writer union read as a single type", "[union]") {
  const char writerText[] = "[\"null\", \"int\"]";
  ValidSchema writer = compileJsonSchemaFromString(writerText);

  GenericDatum w(writer);
  w.selectBranch(1);
  w.value<int32_t>() = 12;
  REQUIRE(convert(writerText, "\"long\"", w).value<int64_t>() == 12);

  w.selectBranch(0);
  REQUIRE_THROWS_AS(convert(writerText, "\"long\"", w), ResolutionException);
}

TEST_CASE("Resolution: single type read into a reader union", "[union]") {
  GenericDatum d = convert("\"int\"", "[\"null\", \"string\", \"long\"]", GenericDatum(int32_t(4)));
  REQUIRE(d.unionBranch() == 2);
  REQUIRE(d.value<int64_t>() == 4);

  d = convert("\"int\"", "[\"null\", \"double\", \"int\"]", GenericDatum(int32_t(4)));
  REQUIRE(d.unionBranch() == 2);
  REQUIRE(d.value<int32_t>() == 4);

  REQUIRE_THROWS_AS(convert("\"boolean\"", "[\"null\", \"int\"]", GenericDatum(true)), ResolutionException);
}

TEST_CASE("Resolution: union to union", "[union]") {
  const char writerText[] = "[\"int\", \"string\"]";
  const char readerText[] = "[\"string\", \"long\"]";
  ValidSchema writer = compileJsonSchemaFromString(writerText);

  GenericDatum w(writer);
  w.value<int32_t>() = 6;
  GenericDatum d = convert(writerText, readerText, w);
  REQUIRE(d.unionBranch() == 1);
  REQUIRE(d.value<int64_t>() == 6);

  w.selectBranch(1);
  w.value<string>() = "s";
  d = convert(writerText, readerText, w);
  REQUIRE(d.unionBranch() == 0);
  REQUIRE(d.value<string>() == "s");
}

TEST_CASE("Resolution: recursive records", "[recursive]") {
  const char writerText[] =
    "{\"type\": \"record\", \"name\": \"List\", \"fields\": ["
    "  {\"name\": \"v\", \"type\": \"int\"},"
    "  {\"name\": \"next\", \"type\": [\"null\", \"List\"]}]}";
  const char readerText[] =
    "{\"type\": \"record\", \"name\": \"List\", \"fields\": ["
    "  {\"name\": \"next\", \"type\": [\"null\", \"List\"]},"
    "  {\"name\": \"v\", \"type\": \"long\"}]}";
  ValidSchema writer = compileJsonSchemaFromString(writerText);

  GenericDatum w(writer);
  GenericRecord& head = w.value<GenericRecord>();
  head.field("v") = GenericDatum(int32_t(1));
  GenericDatum& next = head.field("next");
  next.selectBranch(1);
  GenericRecord& tail = next.value<GenericRecord>();
  tail.field("v") = GenericDatum(int32_t(2));

  GenericDatum d = convert(writerText, readerText, w);
  REQUIRE(record(d).field("v").value<int64_t>() == 1);
  const GenericDatum& n = record(d).field("next");
  REQUIRE(n.unionBranch() == 1);
  REQUIRE(record(n).field("v").value<int64_t>() == 2);
  REQUIRE(record(n).field("next").unionBranch() == 0);
}

TEST_CASE("Resolution: generic reader built from two schemas", "[reader]") {
  ValidSchema writer = compileJsonSchemaFromString("\"int\"");
  ValidSchema reader = compileJsonSchemaFromString("\"double\"");
  OutputStreamPtr out = written(writer, GenericDatum(int32_t(8)));

  InputStreamPtr in = memoryInputStream(*out);
  DecoderPtr base = binaryDecoder();
  base->init(*in);
  GenericReader gr(writer, reader, base);
  GenericDatum d;
  gr.read(d);
  REQUIRE(d.value<double>() == 8.0);
}

TEST_CASE("Resolution: drain leaves the stream after skipped trailing fields", "[projection]") {
  ValidSchema writer = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\"},"
    "  {\"name\": \"tail\", \"type\": {\"type\": \"array\", \"items\": \"string\"}}]}");
  ValidSchema reader = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\"}]}");

  OutputStreamPtr out = memoryOutputStream();
  EncoderPtr e = binaryEncoder();
  e->init(*out);
  e->encodeInt(5);
  e->arrayStart();
  e->setItemCount(2);
  e->startItem();
  e->encodeString("left");
  e->startItem();
  e->encodeString("behind");
  e->arrayEnd();
  e->encodeLong(99);
  e->flush();

  InputStreamPtr in = memoryInputStream(*out);
  ResolvingDecoderPtr rd = resolvingDecoder(writer, reader, binaryDecoder());
  rd->init(*in);
  GenericDatum d(reader);
  GenericReader::read(*rd, d);
  REQUIRE(record(d).field("a").value<int32_t>() == 5);
  rd->drain();

  DecoderPtr next = binaryDecoder();
  next->init(*in);
  REQUIRE(next->decodeLong() == 99);
}
