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
#include <sstream>
#include <vector>
#include "Compiler.hh"
#include "GenericDatum.hh"
#include "NodeImpl.hh"
#include "Schema.hh"
#include "ValidSchema.hh"

using namespace avrolite;

/* An empty bytes default survives the round trip through schema text.*/
TEST_CASE("Schema compiler: empty bytes default", "[compiler]") {
  std::string input = "{\n\
    \"type\": \"record\",\n\
    \"name\": \"testrecord\",\n\
    \"fields\": [\n\
        {\n\
            \"name\": \"testbytes\",\n\
            \"type\": \"bytes\",\n\
            \"default\": \"\"\n\
        }\n\
        ]\n\
    }\n\
    ";
  std::string expected =
    "{\n"
    "    \"type\": \"record\",\n"
    "    \"name\": \"testrecord\",\n"
    "    \"fields\": [\n"
    "        {\n"
    "            \"name\": \"testbytes\",\n"
    "            \"default\": \"\",\n"
    "            \"type\": \"bytes\"\n"
    "        }\n"
    "    ]\n"
    "}\n";

  ValidSchema schema = compileJsonSchemaFromString(input);
  std::ostringstream actual;
  schema.toJson(actual);
  REQUIRE(expected == actual.str());
  REQUIRE(schema.root()->hasDefaultAt(0));
  REQUIRE(schema.root()->defaultValueAt(0).value<std::vector<uint8_t> >().empty());
}

TEST_CASE("Schema compiler: primitives", "[compiler]") {
  const char* names[] = {"null", "boolean", "int", "long", "float", "double", "string", "bytes"};
  Type types[] = {Type::AVRO_NULL, Type::AVRO_BOOL, Type::AVRO_INT, Type::AVRO_LONG, Type::AVRO_FLOAT,
    Type::AVRO_DOUBLE, Type::AVRO_STRING, Type::AVRO_BYTES};
  for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
    ValidSchema bare = compileJsonSchemaFromString(std::string("\"") + names[i] + "\"");
    ValidSchema wrapped = compileJsonSchemaFromString(std::string("{\"type\": \"") + names[i] + "\"}");
    REQUIRE(bare.root()->type() == types[i]);
    REQUIRE(wrapped.root()->type() == types[i]);
  }
}

TEST_CASE("Schema compiler: namespaces are inherited by nested definitions", "[compiler]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"Outer\", \"namespace\": \"org.example\", \"fields\": ["
    "  {\"name\": \"e\", \"type\": {\"type\": \"enum\", \"name\": \"Color\", \"symbols\": [\"RED\", \"GREEN\"]}},"
    "  {\"name\": \"f\", \"type\": {\"type\": \"fixed\", \"name\": \"other.Hash\", \"size\": 4}},"
    "  {\"name\": \"g\", \"type\": \"Color\"}"
    "]}");
  const NodePtr& root = s.root();
  REQUIRE(root->name().fullname() == "org.example.Outer");
  REQUIRE(root->leafAt(0)->name().fullname() == "org.example.Color");
  REQUIRE(root->leafAt(1)->name().fullname() == "other.Hash");
  REQUIRE(root->leafAt(1)->fixedSize() == 4);
  REQUIRE(root->leafAt(2)->type() == Type::AVRO_SYMBOLIC);
  REQUIRE(followSymbol(root->leafAt(2)) == root->leafAt(0));
}

TEST_CASE("Schema compiler: forward and recursive references", "[compiler]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"Node\", \"fields\": ["
    "  {\"name\": \"payload\", \"type\": \"Later\"},"
    "  {\"name\": \"next\", \"type\": [\"null\", \"Node\"]},"
    "  {\"name\": \"later\", \"type\": {\"type\": \"fixed\", \"name\": \"Later\", \"size\": 2}}"
    "]}");
  const NodePtr& root = s.root();
  REQUIRE(followSymbol(root->leafAt(0))->type() == Type::AVRO_FIXED);
  NodePtr next = root->leafAt(1);
  REQUIRE(next->type() == Type::AVRO_UNION);
  REQUIRE(followSymbol(next->leafAt(1)) == root);
}

TEST_CASE("Schema compiler: field attributes", "[compiler]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"R\", \"aliases\": [\"Old\"], \"fields\": ["
    "  {\"name\": \"a\", \"type\": \"int\", \"aliases\": [\"x\", \"y\"], \"order\": \"descending\", \"default\": 7},"
    "  {\"name\": \"b\", \"type\": [\"null\", \"string\"], \"default\": null},"
    "  {\"name\": \"c\", \"type\": {\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"A\", \"B\"], \"default\": \"B\"}}"
    "]}");
  const NodePtr& root = s.root();
  REQUIRE(root->aliases().size() == 1);
  REQUIRE(root->fieldAliasesAt(0).size() == 2);
  REQUIRE(root->fieldOrderAt(0) == FieldOrder::DESCENDING);
  REQUIRE(root->defaultValueAt(0).value<int32_t>() == 7);
  REQUIRE(root->defaultValueAt(1).unionBranch() == 0);
  REQUIRE_FALSE(root->hasDefaultAt(2));

  size_t symbol = 0;
  REQUIRE(root->leafAt(2)->defaultSymbolIndex(symbol));
  REQUIRE(symbol == 1);
}

TEST_CASE("Schema compiler: logical types", "[compiler]") {
  ValidSchema date = compileJsonSchemaFromString("{\"type\": \"int\", \"logicalType\": \"date\"}");
  REQUIRE(date.root()->logicalType().type() == LogicalType::DATE);

  ValidSchema decimal = compileJsonSchemaFromString(
    "{\"type\": \"bytes\", \"logicalType\": \"decimal\", \"precision\": 9, \"scale\": 2}");
  REQUIRE(decimal.root()->logicalType().type() == LogicalType::DECIMAL);
  REQUIRE(decimal.root()->logicalType().precision() == 9);
  REQUIRE(decimal.root()->logicalType().scale() == 2);

  ValidSchema unknown = compileJsonSchemaFromString("{\"type\": \"long\", \"logicalType\": \"wibble\"}");
  REQUIRE(unknown.root()->type() == Type::AVRO_LONG);
  REQUIRE(unknown.root()->logicalType().type() == LogicalType::NONE);

  REQUIRE_THROWS_AS(compileJsonSchemaFromString("{\"type\": \"string\", \"logicalType\": \"date\"}"), ParseException);
  REQUIRE_THROWS_AS(compileJsonSchemaFromString(
    "{\"type\": \"bytes\", \"logicalType\": \"decimal\", \"precision\": 2, \"scale\": 3}"), ParseException);
}

TEST_CASE("Schema compiler: canonical form and fingerprint", "[compiler]") {
  ValidSchema a = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"P\", \"namespace\": \"n\", \"doc\": \"ignored\", \"fields\": ["
    "  {\"name\": \"x\", \"type\": \"int\", \"default\": 1},"
    "  {\"name\": \"y\", \"type\": {\"type\": \"array\", \"items\": \"string\"}}"
    "]}");
  ValidSchema b = compileJsonSchemaFromString(
    "{\"fields\": [{\"type\": \"int\", \"name\": \"x\"}, {\"name\": \"y\", \"type\": {\"items\": \"string\", \"type\": \"array\"}}],"
    " \"name\": \"n.P\", \"type\": \"record\"}");
  REQUIRE(a.toCanonicalJson() ==
    "{\"name\":\"n.P\",\"type\":\"record\",\"fields\":[{\"name\":\"x\",\"type\":\"int\"},"
    "{\"name\":\"y\",\"type\":{\"type\":\"array\",\"items\":\"string\"}}]}");
  REQUIRE(a.toCanonicalJson() == b.toCanonicalJson());
  REQUIRE(a.fingerprint() == b.fingerprint());
  REQUIRE(structurallyEqual(a.root(), b.root()));

  ValidSchema c = compileJsonSchemaFromString("\"long\"");
  REQUIRE(c.fingerprint() != compileJsonSchemaFromString("\"int\"").fingerprint());
}

TEST_CASE("Schema compiler: printed schema compiles back to an equal schema", "[compiler]") {
  ValidSchema s = compileJsonSchemaFromString(
    "{\"type\": \"record\", \"name\": \"T\", \"fields\": ["
    "  {\"name\": \"m\", \"type\": {\"type\": \"map\", \"values\": [\"null\", \"double\"]}, \"default\": {\"k\": null}},"
    "  {\"name\": \"self\", \"type\": [\"null\", \"T\"], \"default\": null},"
    "  {\"name\": \"h\", \"type\": {\"type\": \"fixed\", \"name\": \"H\", \"size\": 2}, \"default\": \"\\u00ff\\u0001\"}"
    "]}");
  ValidSchema again = compileJsonSchemaFromString(s.toJson());
  REQUIRE(again.toCanonicalJson() == s.toCanonicalJson());
  REQUIRE(again.root()->defaultValueAt(2).value<GenericFixed>().value()[0] == 0xff);
}

const char* invalidSchemas[] = {
  "",
  "\"unknown\"",
  "{\"type\": \"record\", \"name\": \"R\"}",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\"}]}",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\"}, {\"name\": \"a\", \"type\": \"long\"}]}",
  "{\"type\": \"record\", \"name\": \"1R\", \"fields\": []}",
  "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"A\", \"A\"]}",
  "{\"type\": \"enum\", \"name\": \"E\", \"symbols\": [\"A\"], \"default\": \"B\"}",
  "{\"type\": \"fixed\", \"name\": \"F\", \"size\": -1}",
  "{\"type\": \"fixed\", \"name\": \"F\"}",
  "{\"type\": \"array\"}",
  "[\"int\", [\"long\"]]",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\", \"default\": \"x\"}]}",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\", \"default\": 3000000000}]}",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": [\"null\", \"int\"], \"default\": \"s\"}]}",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"int\", \"order\": \"sideways\"}]}",
  "{\"type\": \"record\", \"name\": \"int\", \"fields\": []}",
  "[{\"type\": \"fixed\", \"name\": \"F\", \"size\": 1}, {\"type\": \"fixed\", \"name\": \"F\", \"size\": 2}]",
  "{\"type\": \"record\", \"name\": \"R\", \"fields\": [{\"name\": \"a\", \"type\": \"Missing\"}]}",
  "{\"type\": ",
  "42",
};

TEST_CASE("Schema compiler: invalid schemas", "[compiler]") {
  for (auto& text : invalidSchemas) {
    REQUIRE_THROWS_AS(compileJsonSchemaFromString(text), ParseException);
  }
}

TEST_CASE("Schema compiler: error reporting without exceptions", "[compiler]") {
  ValidSchema s;
  std::string error;
  std::istringstream good("{\"type\": \"array\", \"items\": \"long\"}");
  REQUIRE(compileJsonSchema(good, s, error));
  REQUIRE(s.root()->type() == Type::AVRO_ARRAY);

  std::istringstream bad("{\"type\": \"map\"}");
  REQUIRE_FALSE(compileJsonSchema(bad, s, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Schema compiler: record built in code carries field attributes", "[compiler]") {
  RecordSchema rs("Point");
  rs.addField("x", IntSchema());
  std::vector<std::string> aliases;
  aliases.push_back("old_y");
  rs.addField("y", LongSchema(), GenericDatum(int64_t(3)), aliases, FieldOrder::DESCENDING);
  REQUIRE_THROWS_AS(rs.addField("z", LongSchema(), GenericDatum(std::string("no"))), ParseException);

  ValidSchema s(rs);
  const NodePtr& r = s.root();
  REQUIRE(r->names() == 2);
  REQUIRE(r->fieldAliasesAt(1).size() == 1);
  REQUIRE(r->fieldAliasesAt(1)[0] == "old_y");
  REQUIRE(r->defaultValueAt(1).value<int64_t>() == 3);
}
