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

#include "Generic.hh"
#include "NodeImpl.hh"

namespace avrolite {

  using std::string;
  using std::vector;

  typedef vector<uint8_t> bytes;

  GenericReader::GenericReader(const ValidSchema& s, const DecoderPtr& decoder) :
  schema_(s), isResolving_(dynamic_cast<ResolvingDecoder*> (decoder.get()) != 0),
  decoder_(decoder) { }

  GenericReader::GenericReader(const ValidSchema& writerSchema,
    const ValidSchema& readerSchema, const DecoderPtr& decoder) :
  schema_(readerSchema),
  isResolving_(true),
  decoder_(resolvingDecoder(writerSchema, readerSchema, decoder)) { }

  void GenericReader::read(GenericDatum& datum) const {
    read(datum, false);
  }

  /* True if datum was made for schema, so that its containers can be filled again*/
  static bool madeFor(const GenericDatum& datum, const NodePtr& schema) {
    NodePtr s = followSymbol(schema);
    if (s->type() == Type::AVRO_UNION || datum.isUnion()) {
      return false;
    }
    if (datum.type() != s->type()) {
      return false;
    }
    switch (s->type()) {
      case Type::AVRO_RECORD:
        return datum.value<GenericRecord>().schema() == s;
      case Type::AVRO_ARRAY:
        return datum.value<GenericArray>().schema() == s;
      case Type::AVRO_MAP:
        return datum.value<GenericMap>().schema() == s;
      case Type::AVRO_ENUM:
        return datum.value<GenericEnum>().schema() == s;
      case Type::AVRO_FIXED:
        return datum.value<GenericFixed>().schema() == s;
      default:
        return true;
    }
  }

  void GenericReader::read(GenericDatum& datum, bool reuse) const {
    if (!reuse || !madeFor(datum, schema_.root())) {
      datum = GenericDatum(schema_.root());
    }
    read(datum, *decoder_, isResolving_);
  }

  void GenericReader::read(GenericDatum& datum, Decoder& d, bool isResolving) {
    if (datum.isUnion()) {
      datum.selectBranch(d.decodeUnionIndex());
    }
    switch (datum.type()) {
      case Type::AVRO_NULL:
        d.decodeNull();
        break;
      case Type::AVRO_BOOL:
        datum.value<bool>() = d.decodeBool();
        break;
      case Type::AVRO_INT:
        datum.value<int32_t>() = d.decodeInt();
        break;
      case Type::AVRO_LONG:
        datum.value<int64_t>() = d.decodeLong();
        break;
      case Type::AVRO_FLOAT:
        datum.value<float>() = d.decodeFloat();
        break;
      case Type::AVRO_DOUBLE:
        datum.value<double>() = d.decodeDouble();
        break;
      case Type::AVRO_STRING:
        d.decodeString(datum.value<string>());
        break;
      case Type::AVRO_BYTES:
        d.decodeBytes(datum.value<bytes>());
        break;
      case Type::AVRO_FIXED:
      {
        GenericFixed& f = datum.value<GenericFixed>();
        d.decodeFixed(f.schema()->fixedSize(), f.value());
      }
        break;
      case Type::AVRO_ENUM:
      {
        GenericEnum& e = datum.value<GenericEnum>();
        size_t n = d.decodeEnum();
        if (n >= e.schema()->names()) {
          throw ResolutionException(boost::format("Enum index %1% out of range for %2%, which has %3% symbols")
            % n % e.schema()->name() % e.schema()->names());
        }
        e.set(n);
      }
        break;
      case Type::AVRO_ARRAY:
      {
        GenericArray& v = datum.value<GenericArray>();
        vector<GenericDatum>& r = v.value();
        const NodePtr& nn = v.schema()->leafAt(0);
        r.resize(0);
        for (size_t m = d.arrayStart(); m != 0; m = d.arrayNext()) {
          for (size_t i = 0; i < m; ++i) {
            r.push_back(GenericDatum(nn));
            read(r.back(), d, isResolving);
          }
        }
      }
        break;
      case Type::AVRO_MAP:
      {
        GenericMap& v = datum.value<GenericMap>();
        GenericMap::Value& r = v.value();
        const NodePtr& nn = v.schema()->leafAt(1);
        r.resize(0);
        for (size_t m = d.mapStart(); m != 0; m = d.mapNext()) {
          for (size_t i = 0; i < m; ++i) {
            r.push_back(std::make_pair(d.decodeString(), GenericDatum(nn)));
            read(r.back().second, d, isResolving);
          }
        }
      }
        break;
      case Type::AVRO_RECORD:
      {
        GenericRecord& r = datum.value<GenericRecord>();
        size_t c = r.schema()->leaves();
        if (isResolving) {
          const vector<size_t>& fo = static_cast<ResolvingDecoder&> (d).fieldOrder();
          for (size_t i = 0; i < c; ++i) {
            read(r.fieldAt(fo[i]), d, isResolving);
          }
        } else {
          for (size_t i = 0; i < c; ++i) {
            read(r.fieldAt(i), d, isResolving);
          }
        }
      }
        break;
      default:
        throw Exception(boost::format("Unknown schema type %1%") %
          toString(datum.type()));
    }
  }

  void GenericReader::read(Decoder& d, GenericDatum& g, const ValidSchema& s) {
    g = GenericDatum(s);
    read(d, g);
  }

  void GenericReader::read(Decoder& d, GenericDatum& g) {
    read(g, d, dynamic_cast<ResolvingDecoder*> (&d) != 0);
  }

  GenericWriter::GenericWriter(const ValidSchema& s, const EncoderPtr& encoder) :
  schema_(s), encoder_(encoder) { }

  void GenericWriter::write(const GenericDatum& datum) const {
    write(datum, *encoder_);
  }

  void GenericWriter::write(const GenericDatum& datum, Encoder& e) {
    if (datum.isUnion()) {
      e.encodeUnionIndex(datum.unionBranch());
    }
    switch (datum.type()) {
      case Type::AVRO_NULL:
        e.encodeNull();
        break;
      case Type::AVRO_BOOL:
        e.encodeBool(datum.value<bool>());
        break;
      case Type::AVRO_INT:
        e.encodeInt(datum.value<int32_t>());
        break;
      case Type::AVRO_LONG:
        e.encodeLong(datum.value<int64_t>());
        break;
      case Type::AVRO_FLOAT:
        e.encodeFloat(datum.value<float>());
        break;
      case Type::AVRO_DOUBLE:
        e.encodeDouble(datum.value<double>());
        break;
      case Type::AVRO_STRING:
        e.encodeString(datum.value<string>());
        break;
      case Type::AVRO_BYTES:
        e.encodeBytes(datum.value<bytes>());
        break;
      case Type::AVRO_FIXED:
        e.encodeFixed(datum.value<GenericFixed>().value());
        break;
      case Type::AVRO_ENUM:
        e.encodeEnum(datum.value<GenericEnum>().value());
        break;
      case Type::AVRO_ARRAY:
      {
        const GenericArray::Value& r = datum.value<GenericArray>().value();
        e.arrayStart();
        if (!r.empty()) {
          e.setItemCount(r.size());
          for (GenericArray::Value::const_iterator it = r.begin(); it != r.end(); ++it) {
            e.startItem();
            write(*it, e);
          }
        }
        e.arrayEnd();
      }
        break;
      case Type::AVRO_MAP:
      {
        const GenericMap::Value& r = datum.value<GenericMap>().value();
        e.mapStart();
        if (!r.empty()) {
          e.setItemCount(r.size());
          for (GenericMap::Value::const_iterator it = r.begin(); it != r.end(); ++it) {
            e.startItem();
            e.encodeString(it->first);
            write(it->second, e);
          }
        }
        e.mapEnd();
      }
        break;
      case Type::AVRO_RECORD:
      {
        const GenericRecord& r = datum.value<GenericRecord>();
        size_t c = r.schema()->leaves();
        for (size_t i = 0; i < c; ++i) {
          write(r.fieldAt(i), e);
        }
      }
        break;
      default:
        throw Exception(boost::format("Unknown schema type %1%") %
          toString(datum.type()));
    }
  }

  void GenericWriter::write(Encoder& e, const GenericDatum& g) {
    write(g, e);
  }

  static bool fits(const GenericDatum& value, const NodePtr& branch) {
    if (value.type() != branch->type()) {
      return false;
    }
    switch (branch->type()) {
      case Type::AVRO_RECORD:
        return structurallyEqual(value.value<GenericRecord>().schema(), branch);
      case Type::AVRO_ENUM:
        return structurallyEqual(value.value<GenericEnum>().schema(), branch);
      case Type::AVRO_FIXED:
        return structurallyEqual(value.value<GenericFixed>().schema(), branch);
      case Type::AVRO_ARRAY:
        return structurallyEqual(value.value<GenericArray>().schema(), branch);
      case Type::AVRO_MAP:
        return structurallyEqual(value.value<GenericMap>().schema(), branch);
      default:
        return true;
    }
  }

  size_t GenericWriter::branchFor(const NodePtr& unionSchema, const GenericDatum& value) {
    NodePtr u = followSymbol(unionSchema);
    if (u->type() != Type::AVRO_UNION) {
      throw Exception(boost::format("Schema type %1% is not a union") % u->type());
    }
    for (size_t i = 0; i < u->leaves(); ++i) {
      if (fits(value, followSymbol(u->leafAt(i)))) {
        return i;
      }
    }
    throw ResolutionException(boost::format("No branch of the union fits a value of type %1%") % value.type());
  }

}
