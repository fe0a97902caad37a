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

#include "NodeImpl.hh"
#include "json/JsonIO.hh"

namespace avrolite {

  using std::string;
  using std::vector;

  /* Wrap an indentation in a struct for ostream operator<< */
  struct indent {

    indent(int depth) :
    d(depth) {
    }
    int d;
  };

  std::ostream& operator<<(std::ostream &os, indent x) {
    static const std::string spaces("    ");
    while (x.d--) {
      os << spaces;
    }
    return os;
  }

  static void printStrings(std::ostream &os, const vector<string>& v) {
    os << '[';
    for (vector<string>::const_iterator it = v.begin(); it != v.end(); ++it) {
      if (it != v.begin()) {
        os << ", ";
      }
      os << json::quote(*it);
    }
    os << ']';
  }

  void Node::printAliases(std::ostream &os, int depth) const {
    if (aliases_.empty()) {
      return;
    }
    vector<string> names;
    for (vector<Name>::const_iterator it = aliases_.begin(); it != aliases_.end(); ++it) {
      names.push_back(it->fullname());
    }
    os << indent(depth) << "\"aliases\": ";
    printStrings(os, names);
    os << ",\n";
  }

  /* Prints a default value the way it appears in a schema. Unions print the value of the chosen branch.*/
  static void printDatum(std::ostream &os, const GenericDatum& d) {
    switch (d.type()) {
      case Type::AVRO_NULL:
        os << "null";
        break;
      case Type::AVRO_BOOL:
        os << (d.value<bool>() ? "true" : "false");
        break;
      case Type::AVRO_INT:
        os << d.value<int32_t>();
        break;
      case Type::AVRO_LONG:
        os << d.value<int64_t>();
        break;
      case Type::AVRO_FLOAT:
        os << json::formatFloat(d.value<float>());
        break;
      case Type::AVRO_DOUBLE:
        os << json::formatDouble(d.value<double>());
        break;
      case Type::AVRO_STRING:
        os << json::quote(d.value<string>());
        break;
      case Type::AVRO_BYTES:
      {
        const vector<uint8_t>& v = d.value<vector<uint8_t> >();
        os << json::quote(v.empty() ? 0 : &v[0], v.size(), true);
        break;
      }
      case Type::AVRO_FIXED:
      {
        const vector<uint8_t>& v = d.value<GenericFixed>().value();
        os << json::quote(v.empty() ? 0 : &v[0], v.size(), true);
        break;
      }
      case Type::AVRO_ENUM:
        os << json::quote(d.value<GenericEnum>().symbol());
        break;
      case Type::AVRO_ARRAY:
      {
        const GenericArray::Value& v = d.value<GenericArray>().value();
        os << '[';
        for (GenericArray::Value::const_iterator it = v.begin(); it != v.end(); ++it) {
          if (it != v.begin()) {
            os << ", ";
          }
          printDatum(os, *it);
        }
        os << ']';
        break;
      }
      case Type::AVRO_MAP:
      {
        const GenericMap::Value& v = d.value<GenericMap>().value();
        os << '{';
        for (GenericMap::Value::const_iterator it = v.begin(); it != v.end(); ++it) {
          if (it != v.begin()) {
            os << ", ";
          }
          os << json::quote(it->first) << ": ";
          printDatum(os, it->second);
        }
        os << '}';
        break;
      }
      case Type::AVRO_RECORD:
      {
        const GenericRecord& r = d.value<GenericRecord>();
        os << '{';
        for (size_t i = 0; i < r.fieldCount(); ++i) {
          if (i > 0) {
            os << ", ";
          }
          os << json::quote(r.schema()->nameAt(i)) << ": ";
          printDatum(os, r.fieldAt(i));
        }
        os << '}';
        break;
      }
      default:
        throw Exception(boost::format("Cannot print default of type %1%") % d.type());
    }
  }

  void NodePrimitive::printJson(std::ostream &os, int depth) const {
    if (logicalType().type() == LogicalType::NONE) {
      os << '\"' << type() << '\"';
      return;
    }
    os << "{\n";
    os << indent(depth + 1) << "\"type\": \"" << type() << "\",\n";
    os << indent(depth + 1);
    logicalType().printJson(os);
    os << '\n' << indent(depth) << '}';
  }

  void NodeSymbolic::printJson(std::ostream &os, int depth) const {
    os << '\"' << nameAttribute_.get() << '\"';
  }

  static void printName(std::ostream& os, const Name& n, int depth) {
    if (!n.ns().empty()) {
      os << indent(depth) << "\"namespace\": \"" << n.ns() << "\",\n";
    }
    os << indent(depth) << "\"name\": \"" << n.simpleName() << "\",\n";
  }

  void NodeRecord::printJson(std::ostream &os, int depth) const {
    os << "{\n";
    os << indent(++depth) << "\"type\": \"record\",\n";
    printName(os, nameAttribute_.get(), depth);
    printAliases(os, depth);
    os << indent(depth) << "\"fields\": [";

    size_t fields = leafAttributes_.size();
    ++depth;
    for (size_t i = 0; i < fields; ++i) {
      if (i > 0) {
        os << ',';
      }
      os << '\n' << indent(depth) << "{\n";
      os << indent(++depth) << "\"name\": \"" << leafNameAttributes_.get(i) << "\",\n";
      if (!fieldAliasesAt(i).empty()) {
        os << indent(depth) << "\"aliases\": ";
        printStrings(os, fieldAliasesAt(i));
        os << ",\n";
      }
      if (fieldOrderAt(i) != FieldOrder::ASCENDING) {
        os << indent(depth) << "\"order\": \"" << toString(fieldOrderAt(i)) << "\",\n";
      }
      if (hasDefaultAt(i)) {
        os << indent(depth) << "\"default\": ";
        printDatum(os, defaultValueAt(i));
        os << ",\n";
      }
      os << indent(depth) << "\"type\": ";
      leafAttributes_.get(i)->printJson(os, depth);
      os << '\n';
      os << indent(--depth) << '}';
    }
    os << '\n' << indent(--depth) << "]\n";
    os << indent(--depth) << '}';
  }

  void NodeEnum::printJson(std::ostream &os, int depth) const {
    os << "{\n";
    os << indent(++depth) << "\"type\": \"enum\",\n";
    printName(os, nameAttribute_.get(), depth);
    printAliases(os, depth);
    if (!defaultSymbol_.empty()) {
      os << indent(depth) << "\"default\": \"" << defaultSymbol_ << "\",\n";
    }
    os << indent(depth) << "\"symbols\": [\n";

    size_t names = leafNameAttributes_.size();
    ++depth;
    for (size_t i = 0; i < names; ++i) {
      if (i > 0) {
        os << ",\n";
      }
      os << indent(depth) << '\"' << leafNameAttributes_.get(i) << '\"';
    }
    os << '\n';
    os << indent(--depth) << "]\n";
    os << indent(--depth) << '}';
  }

  void NodeArray::printJson(std::ostream &os, int depth) const {
    os << "{\n";
    os << indent(depth + 1) << "\"type\": \"array\",\n";
    os << indent(depth + 1) << "\"items\": ";
    leafAttributes_.get()->printJson(os, depth + 1);
    os << '\n';
    os << indent(depth) << '}';
  }

  void NodeMap::printJson(std::ostream &os, int depth) const {
    os << "{\n";
    os << indent(depth + 1) << "\"type\": \"map\",\n";
    os << indent(depth + 1) << "\"values\": ";
    leafAttributes_.get(1)->printJson(os, depth + 1);
    os << '\n';
    os << indent(depth) << '}';
  }

  void NodeUnion::printJson(std::ostream &os, int depth) const {
    os << "[\n";
    size_t fields = leafAttributes_.size();
    ++depth;
    for (size_t i = 0; i < fields; ++i) {
      if (i > 0) {
        os << ",\n";
      }
      os << indent(depth);
      leafAttributes_.get(i)->printJson(os, depth);
    }
    os << '\n';
    os << indent(--depth) << ']';
  }

  void NodeFixed::printJson(std::ostream &os, int depth) const {
    os << "{\n";
    os << indent(++depth) << "\"type\": \"fixed\",\n";
    printName(os, nameAttribute_.get(), depth);
    printAliases(os, depth);
    if (logicalType().type() != LogicalType::NONE) {
      os << indent(depth);
      logicalType().printJson(os);
      os << ",\n";
    }
    os << indent(depth) << "\"size\": " << sizeAttribute_.get() << "\n";
    os << indent(--depth) << '}';
  }

}
