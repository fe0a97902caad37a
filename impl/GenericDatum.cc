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

#include <boost/math/special_functions/fpclassify.hpp>

#include "GenericDatum.hh"
#include "NodeImpl.hh"

namespace avrolite {

  using std::string;
  using std::vector;

  GenericDatum::GenericDatum(const NodePtr& schema) :
  type_(schema->type()), logicalType_(schema->logicalType()) {
    init(schema);
  }

  GenericDatum::GenericDatum(const ValidSchema& schema) :
  type_(schema.root()->type()), logicalType_(schema.root()->logicalType()) {
    init(schema.root());
  }

  void GenericDatum::init(const NodePtr& schema) {
    NodePtr sc = schema;
    if (type_ == Type::AVRO_SYMBOLIC) {
      sc = resolveSymbol(schema);
      type_ = sc->type();
      logicalType_ = sc->logicalType();
    }
    switch (type_) {
      case Type::AVRO_NULL:
        break;
      case Type::AVRO_BOOL:
        value_ = bool();
        break;
      case Type::AVRO_INT:
        value_ = int32_t();
        break;
      case Type::AVRO_LONG:
        value_ = int64_t();
        break;
      case Type::AVRO_FLOAT:
        value_ = float();
        break;
      case Type::AVRO_DOUBLE:
        value_ = double();
        break;
      case Type::AVRO_STRING:
        value_ = string();
        break;
      case Type::AVRO_BYTES:
        value_ = vector<uint8_t>();
        break;
      case Type::AVRO_FIXED:
        value_ = GenericFixed(sc);
        break;
      case Type::AVRO_RECORD:
        value_ = GenericRecord(sc);
        break;
      case Type::AVRO_ENUM:
        value_ = GenericEnum(sc);
        break;
      case Type::AVRO_ARRAY:
        value_ = GenericArray(sc);
        break;
      case Type::AVRO_MAP:
        value_ = GenericMap(sc);
        break;
      case Type::AVRO_UNION:
        value_ = GenericUnion(sc);
        break;
      default:
        throw Exception(boost::format("Unknown schema type %1%") % toString(type_));
    }
  }

  void GenericContainer::assertType(const NodePtr& schema, Type type) {
    if (schema->type() != type) {
      throw Exception(boost::format("Schema type %1% expected %2%") %
        toString(schema->type()) % toString(type));
    }
  }

  GenericRecord::GenericRecord(const NodePtr& schema) :
  GenericContainer(Type::AVRO_RECORD, schema) {
    size_t n = schema->leaves();
    fields_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      if (schema->hasDefaultAt(i)) {
        fields_.push_back(schema->defaultValueAt(i));
      } else {
        fields_.push_back(GenericDatum(schema->leafAt(i)));
      }
    }
  }

  void GenericUnion::selectBranch(size_t branch) {
    if (curBranch_ == branch) {
      return;
    }
    if (branch >= schema()->leaves()) {
      throw ResolutionException(boost::format("Union branch %1% out of range, union has %2% branches")
        % branch % schema()->leaves());
    }
    datum_ = GenericDatum(schema()->leafAt(branch));
    curBranch_ = branch;
  }

  GenericFixed::GenericFixed(const NodePtr& schema, const vector<uint8_t>& v) :
  GenericContainer(Type::AVRO_FIXED, schema), value_(v) {
    if (v.size() != static_cast<size_t> (schema->fixedSize())) {
      throw Exception(boost::format("Fixed %1% needs %2% bytes, got %3%")
        % schema->name() % schema->fixedSize() % v.size());
    }
  }

  template <typename T>
  static bool sameReal(T a, T b) {
    return a == b || (boost::math::isnan(a) && boost::math::isnan(b));
  }

  bool operator==(const GenericDatum& lhs, const GenericDatum& rhs) {
    if (lhs.type() != rhs.type()) {
      return false;
    }
    if (lhs.isUnion() && rhs.isUnion() && lhs.unionBranch() != rhs.unionBranch()) {
      return false;
    }
    switch (lhs.type()) {
      case Type::AVRO_NULL:
        return true;
      case Type::AVRO_BOOL:
        return lhs.value<bool>() == rhs.value<bool>();
      case Type::AVRO_INT:
        return lhs.value<int32_t>() == rhs.value<int32_t>();
      case Type::AVRO_LONG:
        return lhs.value<int64_t>() == rhs.value<int64_t>();
      case Type::AVRO_FLOAT:
        return sameReal(lhs.value<float>(), rhs.value<float>());
      case Type::AVRO_DOUBLE:
        return sameReal(lhs.value<double>(), rhs.value<double>());
      case Type::AVRO_STRING:
        return lhs.value<string>() == rhs.value<string>();
      case Type::AVRO_BYTES:
        return lhs.value<vector<uint8_t> >() == rhs.value<vector<uint8_t> >();
      case Type::AVRO_FIXED:
        return lhs.value<GenericFixed>().value() == rhs.value<GenericFixed>().value();
      case Type::AVRO_ENUM:
        return lhs.value<GenericEnum>().symbol() == rhs.value<GenericEnum>().symbol();
      case Type::AVRO_ARRAY:
        return lhs.value<GenericArray>().value() == rhs.value<GenericArray>().value();
      case Type::AVRO_MAP:
        return lhs.value<GenericMap>().value() == rhs.value<GenericMap>().value();
      case Type::AVRO_RECORD:
      {
        const GenericRecord& a = lhs.value<GenericRecord>();
        const GenericRecord& b = rhs.value<GenericRecord>();
        if (a.fieldCount() != b.fieldCount()) {
          return false;
        }
        for (size_t i = 0; i < a.fieldCount(); ++i) {
          if (a.fieldAt(i) != b.fieldAt(i)) {
            return false;
          }
        }
        return true;
      }
      default:
        return false;
    }
  }

}
