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

#include <set>
#include <sstream>

#include "ValidSchema.hh"
#include "Schema.hh"
#include "NodeImpl.hh"
#include "json/JsonIO.hh"

namespace avrolite {

  using std::string;
  using std::ostringstream;
  using std::make_pair;
  using std::static_pointer_cast;

  ValidSchema::ValidSchema(const NodePtr &root) : root_(root) {
    SymbolMap symbolMap;
    validate(root_, symbolMap);
  }

  ValidSchema::ValidSchema(const Schema &schema) : root_(schema.root()) {
    SymbolMap symbolMap;
    validate(root_, symbolMap);
  }

  ValidSchema::ValidSchema() : root_(NullSchema().root()) {
    SymbolMap symbolMap;
    validate(root_, symbolMap);
  }

  void ValidSchema::setSchema(const Schema &schema) {
    root_ = schema.root();
    SymbolMap symbolMap;
    validate(root_, symbolMap);
  }

  /* Returns false for a named node already seen under the same name, so that the caller replaces it with a symbolic link.*/
  bool ValidSchema::validate(const NodePtr &node, SymbolMap &symbolMap) {
    if (!node) {
      throw ParseException("Schema has an empty node");
    }

    if (!node->isValid()) {
      throw ParseException(boost::format("Schema is invalid, due to bad node of type %1%")
        % node->type());
    }

    if (node->hasName()) {
      const Name &nm = node->name();
      SymbolMap::iterator it = symbolMap.find(nm);
      bool found = it != symbolMap.end();

      if (node->type() == Type::AVRO_SYMBOLIC) {
        bool linked = static_pointer_cast<NodeSymbolic>(node)->isSet();
        if (!found && !linked) {
          throw ParseException(boost::format("Symbolic name \"%1%\" is unknown") % nm);
        }
        return linked;
      }

      if (found) {
        return false;
      }
      symbolMap.insert(it, make_pair(nm, node));
    }

    node->lock();
    size_t leaves = node->leaves();
    for (size_t i = 0; i < leaves; ++i) {
      const NodePtr &leaf(node->leafAt(i));
      if (!validate(leaf, symbolMap)) {
        node->setLeafToSymbolic(i, symbolMap.find(leaf->name())->second);
      }
    }

    return true;
  }

  void ValidSchema::toJson(std::ostream &os) const {
    root_->printJson(os, 0);
    os << '\n';
  }

  string ValidSchema::toJson() const {
    ostringstream oss;
    toJson(oss);
    return oss.str();
  }

  void ValidSchema::toFlatList(std::ostream &os) const {
    root_->printBasicInfo(os);
  }

  static void canonical(std::ostream& os, const NodePtr& n, std::set<Name>& seen) {
    if (n->type() == Type::AVRO_SYMBOLIC) {
      os << json::quote(n->name().fullname());
      return;
    }
    if (n->hasName()) {
      if (seen.find(n->name()) != seen.end()) {
        os << json::quote(n->name().fullname());
        return;
      }
      seen.insert(n->name());
    }
    switch (n->type()) {
      case Type::AVRO_RECORD:
        os << "{\"name\":" << json::quote(n->name().fullname()) << ",\"type\":\"record\",\"fields\":[";
        for (size_t i = 0; i < n->leaves(); ++i) {
          if (i > 0) {
            os << ',';
          }
          os << "{\"name\":" << json::quote(n->nameAt(i)) << ",\"type\":";
          canonical(os, n->leafAt(i), seen);
          os << '}';
        }
        os << "]}";
        break;
      case Type::AVRO_ENUM:
        os << "{\"name\":" << json::quote(n->name().fullname()) << ",\"type\":\"enum\",\"symbols\":[";
        for (size_t i = 0; i < n->names(); ++i) {
          if (i > 0) {
            os << ',';
          }
          os << json::quote(n->nameAt(i));
        }
        os << "]}";
        break;
      case Type::AVRO_FIXED:
        os << "{\"name\":" << json::quote(n->name().fullname()) << ",\"type\":\"fixed\",\"size\":"
          << n->fixedSize() << '}';
        break;
      case Type::AVRO_ARRAY:
        os << "{\"type\":\"array\",\"items\":";
        canonical(os, n->leafAt(0), seen);
        os << '}';
        break;
      case Type::AVRO_MAP:
        os << "{\"type\":\"map\",\"values\":";
        canonical(os, n->leafAt(1), seen);
        os << '}';
        break;
      case Type::AVRO_UNION:
        os << '[';
        for (size_t i = 0; i < n->leaves(); ++i) {
          if (i > 0) {
            os << ',';
          }
          canonical(os, n->leafAt(i), seen);
        }
        os << ']';
        break;
      default:
        os << '"' << n->type() << '"';
        break;
    }
  }

  string ValidSchema::toCanonicalJson() const {
    ostringstream oss;
    std::set<Name> seen;
    canonical(oss, root_, seen);
    return oss.str();
  }

  static const uint64_t emptyFingerprint = 0xc15d213aa4d7a795ULL;

  struct FingerprintTable {
    uint64_t entries[256];

    FingerprintTable() {
      for (int i = 0; i < 256; ++i) {
        uint64_t fp = i;
        for (int j = 0; j < 8; ++j) {
          fp = (fp >> 1) ^ (emptyFingerprint & -(fp & 1ULL));
        }
        entries[i] = fp;
      }
    }
  };

  uint64_t fingerprint64(const string& text) {
    static const FingerprintTable table;
    uint64_t fp = emptyFingerprint;
    for (string::const_iterator it = text.begin(); it != text.end(); ++it) {
      fp = (fp >> 8) ^ table.entries[(fp ^ static_cast<uint8_t> (*it)) & 0xff];
    }
    return fp;
  }

  uint64_t ValidSchema::fingerprint() const {
    return fingerprint64(toCanonicalJson());
  }

  bool structurallyEqual(const NodePtr& lhs, const NodePtr& rhs) {
    NodePtr a = followSymbol(lhs);
    NodePtr b = followSymbol(rhs);
    if (a->type() != b->type()) {
      return false;
    }
    if (a->hasName()) {
      return a->name() == b->name();
    }
    switch (a->type()) {
      case Type::AVRO_ARRAY:
        return structurallyEqual(a->leafAt(0), b->leafAt(0));
      case Type::AVRO_MAP:
        return structurallyEqual(a->leafAt(1), b->leafAt(1));
      case Type::AVRO_UNION:
        if (a->leaves() != b->leaves()) {
          return false;
        }
        for (size_t i = 0; i < a->leaves(); ++i) {
          if (!structurallyEqual(a->leafAt(i), b->leafAt(i))) {
            return false;
          }
        }
        return true;
      default:
        return true;
    }
  }

}
