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

#include <cstring>
#include <iterator>
#include <limits>
#include <sstream>

#include "Compiler.hh"
#include "Schema.hh"
#include "ValidSchema.hh"
#include "Debug.hh"

#include "json/JsonDom.hh"
#include "json/JsonIO.hh"

namespace avrolite {

  using std::string;
  using std::vector;
  using std::map;
  using std::make_pair;

  using json::Entity;
  using json::Object;
  using json::Array;

  typedef map<Name, NodePtr> SymbolTable;

  namespace {

    /* A named type used before its definition. Candidates are tried in order once the whole document is read.*/
    struct ForwardReference {
      std::shared_ptr<NodeSymbolic> node;
      vector<Name> candidates;
    };

    struct PendingDefault {
      NodePtr record;
      size_t index;
      Entity value;
    };

    struct CompilerState {
      SymbolTable symbols;
      vector<ForwardReference> forwards;
      vector<PendingDefault> defaults;
      const LogicalTypeRegistry &registry;

      explicit CompilerState(const LogicalTypeRegistry &r) : registry(r) { }
    };

  }

  static NodePtr makeNode(const Entity &e, CompilerState &st, const string &ns);

  static NodePtr makePrimitive(const string &t) {
    if (t == "null") {
      return NodePtr(new NodePrimitive(Type::AVRO_NULL));
    } else if (t == "boolean") {
      return NodePtr(new NodePrimitive(Type::AVRO_BOOL));
    } else if (t == "int") {
      return NodePtr(new NodePrimitive(Type::AVRO_INT));
    } else if (t == "long") {
      return NodePtr(new NodePrimitive(Type::AVRO_LONG));
    } else if (t == "float") {
      return NodePtr(new NodePrimitive(Type::AVRO_FLOAT));
    } else if (t == "double") {
      return NodePtr(new NodePrimitive(Type::AVRO_DOUBLE));
    } else if (t == "string") {
      return NodePtr(new NodePrimitive(Type::AVRO_STRING));
    } else if (t == "bytes") {
      return NodePtr(new NodePrimitive(Type::AVRO_BYTES));
    } else {
      return NodePtr();
    }
  }

  /* Full name of a reference or definition: dotted names are already full, others take the enclosing namespace*/
  static Name toName(const string &name, const string &ns) {
    if (name.find('.') != string::npos || ns.empty()) {
      return Name(name);
    }
    return Name(name, ns);
  }

  static NodePtr makeNode(const string &t, CompilerState &st, const string &ns) {
    NodePtr result = makePrimitive(t);
    if (result) {
      return result;
    }

    vector<Name> candidates;
    candidates.push_back(toName(t, ns));
    if (t.find('.') == string::npos && !ns.empty()) {
      candidates.push_back(Name(t));
    }
    for (vector<Name>::const_iterator it = candidates.begin(); it != candidates.end(); ++it) {
      SymbolTable::const_iterator found = st.symbols.find(*it);
      if (found != st.symbols.end()) {
        return NodePtr(new NodeSymbolic(HasName(*it), found->second));
      }
    }

    ForwardReference ref;
    ref.node = std::make_shared<NodeSymbolic>(HasName(candidates.front()));
    ref.candidates = candidates;
    st.forwards.push_back(ref);
    DEBUG_OUT("Forward reference to " << candidates.front());
    return ref.node;
  }

  static const Entity *findField(const Object &m, const string &fieldName) {
    Object::const_iterator it = m.find(fieldName);
    return it == m.end() ? 0 : &it->second;
  }

  static const Entity &getField(const Entity &e, const Object &m, const string &fieldName) {
    const Entity *result = findField(m, fieldName);
    if (result == 0) {
      throw ParseException(boost::format("Missing Json field \"%1%\": %2%") % fieldName % e.toString());
    }
    return *result;
  }

  static void ensureType(const Entity &e, json::EntityType t, const string &fieldName) {
    if (e.type() != t) {
      throw ParseException(boost::format("Json field \"%1%\" is not a %2%: %3%")
        % fieldName % json::typeToString(t) % e.toString());
    }
  }

  static const string &getStringField(const Entity &e, const Object &m, const string &fieldName) {
    const Entity &f = getField(e, m, fieldName);
    ensureType(f, json::etString, fieldName);
    return f.stringValue();
  }

  static const Array &getArrayField(const Entity &e, const Object &m, const string &fieldName) {
    const Entity &f = getField(e, m, fieldName);
    ensureType(f, json::etArray, fieldName);
    return f.arrayValue();
  }

  static int64_t getLongField(const Entity &e, const Object &m, const string &fieldName) {
    const Entity &f = getField(e, m, fieldName);
    ensureType(f, json::etLong, fieldName);
    return f.longValue();
  }

  static vector<string> getStrings(const Entity &e, const Object &m, const string &fieldName) {
    vector<string> result;
    if (findField(m, fieldName) == 0) {
      return result;
    }
    const Array &a = getArrayField(e, m, fieldName);
    for (Array::const_iterator it = a.begin(); it != a.end(); ++it) {
      ensureType(*it, json::etString, fieldName);
      result.push_back(it->stringValue());
    }
    return result;
  }

  /* The name of a definition, with the namespace attribute or the enclosing namespace applied*/
  static Name getName(const Entity &e, const Object &m, const string &ns) {
    const string &name = getStringField(e, m, "name");
    if (name.find('.') != string::npos) {
      return Name(name);
    }
    if (const Entity *nsField = findField(m, "namespace")) {
      ensureType(*nsField, json::etString, "namespace");
      return nsField->stringValue().empty() ? Name(name) : Name(name, nsField->stringValue());
    }
    return toName(name, ns);
  }

  static void defineName(CompilerState &st, const Name &name, const NodePtr &node) {
    if (name.ns().empty() && makePrimitive(name.simpleName())) {
      throw ParseException(boost::format("Cannot redefine primitive type %1%") % name);
    }
    if (!st.symbols.insert(make_pair(name, node)).second) {
      throw ParseException(boost::format("Duplicate definition of type %1%") % name);
    }
  }

  static void addAliases(const NodePtr &node, const Entity &e, const Object &m) {
    vector<string> aliases = getStrings(e, m, "aliases");
    for (vector<string>::const_iterator it = aliases.begin(); it != aliases.end(); ++it) {
      node->addAlias(toName(*it, node->name().ns()));
    }
  }

  static FieldOrder getOrder(const Entity &e, const Object &m) {
    if (findField(m, "order") == 0) {
      return FieldOrder::ASCENDING;
    }
    const string &order = getStringField(e, m, "order");
    if (order == "ascending") {
      return FieldOrder::ASCENDING;
    } else if (order == "descending") {
      return FieldOrder::DESCENDING;
    } else if (order == "ignore") {
      return FieldOrder::IGNORE;
    }
    throw ParseException(boost::format("Invalid field order: %1%") % order);
  }

  static NodePtr makeRecordNode(const Entity &e, const Object &m, CompilerState &st, const string &ns) {
    std::shared_ptr<NodeRecord> node = std::make_shared<NodeRecord>();
    const NodePtr self = node;
    node->setName(getName(e, m, ns));
    addAliases(self, e, m);
    // registered before the fields, so that fields may refer to the record
    defineName(st, self->name(), self);

    const Array &fields = getArrayField(e, m, "fields");
    for (Array::const_iterator it = fields.begin(); it != fields.end(); ++it) {
      ensureType(*it, json::etObject, "fields");
      const Object &f = it->objectValue();
      const string &fieldName = getStringField(*it, f, "name");
      NodePtr fieldType = makeNode(getField(*it, f, "type"), st, self->name().ns());
      node->addName(fieldName);
      node->addLeaf(fieldType);
      size_t index = self->names() - 1;
      node->setFieldAttributes(index, getStrings(*it, f, "aliases"), getOrder(*it, f));
      if (const Entity *def = findField(f, "default")) {
        PendingDefault pending = {self, index, *def};
        st.defaults.push_back(pending);
      }
    }
    return node;
  }

  static NodePtr makeEnumNode(const Entity &e, const Object &m, CompilerState &st, const string &ns) {
    std::shared_ptr<NodeEnum> node = std::make_shared<NodeEnum>();
    const NodePtr self = node;
    node->setName(getName(e, m, ns));
    addAliases(self, e, m);

    const Array &symbols = getArrayField(e, m, "symbols");
    for (Array::const_iterator it = symbols.begin(); it != symbols.end(); ++it) {
      ensureType(*it, json::etString, "symbols");
      node->addName(it->stringValue());
    }
    if (findField(m, "default") != 0) {
      node->setDefaultSymbol(getStringField(e, m, "default"));
    }
    defineName(st, self->name(), self);
    return node;
  }

  static NodePtr makeFixedNode(const Entity &e, const Object &m, CompilerState &st, const string &ns) {
    int64_t size = getLongField(e, m, "size");
    if (size < 0 || size > std::numeric_limits<int>::max()) {
      throw ParseException(boost::format("Size for fixed is out of range: %1%") % size);
    }
    NodePtr node(new NodeFixed());
    node->setName(getName(e, m, ns));
    node->setFixedSize(static_cast<int> (size));
    addAliases(node, e, m);
    defineName(st, node->name(), node);
    return node;
  }

  static void setLogicalType(const NodePtr &node, const Entity &e, const Object &m, const CompilerState &st) {
    if (findField(m, "logicalType") == 0) {
      return;
    }
    const string &name = getStringField(e, m, "logicalType");
    if (!st.registry.contains(name)) {
      DEBUG_OUT("Ignoring unknown logical type " << name);
      return;
    }
    LogicalTypeParams params;
    params.physicalType = node->type();
    if (node->type() == Type::AVRO_FIXED) {
      params.fixedSize = node->fixedSize();
    }
    if (findField(m, "precision") != 0) {
      params.precision = static_cast<int> (getLongField(e, m, "precision"));
      params.hasPrecision = true;
    }
    if (findField(m, "scale") != 0) {
      params.scale = static_cast<int> (getLongField(e, m, "scale"));
      params.hasScale = true;
    }
    node->setLogicalType(st.registry.create(name, params));
  }

  static NodePtr makeNode(const Entity &e, const Object &m, CompilerState &st, const string &ns) {
    const Entity &typeField = getField(e, m, "type");
    if (typeField.type() != json::etString) {
      // {"type": {...}} or {"type": [...]}
      return makeNode(typeField, st, ns);
    }
    const string &type = typeField.stringValue();
    NodePtr result;
    if (type == "record" || type == "error") {
      result = makeRecordNode(e, m, st, ns);
    } else if (type == "enum") {
      result = makeEnumNode(e, m, st, ns);
    } else if (type == "array") {
      NodePtr items = makeNode(getField(e, m, "items"), st, ns);
      result = NodePtr(new NodeArray(SingleLeaf(items)));
    } else if (type == "map") {
      NodePtr values = makeNode(getField(e, m, "values"), st, ns);
      result = NodePtr(new NodeMap(SingleLeaf(values)));
    } else if (type == "fixed") {
      result = makeFixedNode(e, m, st, ns);
    } else {
      result = makePrimitive(type);
      if (!result) {
        return makeNode(type, st, ns);
      }
    }
    setLogicalType(result, e, m, st);
    return result;
  }

  static NodePtr makeNode(const Entity &e, CompilerState &st, const string &ns) {
    switch (e.type()) {
      case json::etString:
        return makeNode(e.stringValue(), st, ns);
      case json::etObject:
        return makeNode(e, e.objectValue(), st, ns);
      case json::etArray:
      {
        const Array &a = e.arrayValue();
        MultiLeaves branches;
        for (Array::const_iterator it = a.begin(); it != a.end(); ++it) {
          NodePtr branch = makeNode(*it, st, ns);
          if (branch->type() == Type::AVRO_UNION) {
            throw ParseException(boost::format("Union cannot directly contain a union: %1%") % e.toString());
          }
          branches.add(branch);
        }
        return NodePtr(new NodeUnion(branches));
      }
      default:
        throw ParseException(boost::format("Invalid Avro type: %1%") % e.toString());
    }
  }

  static void resolveForwardReferences(CompilerState &st) {
    for (vector<ForwardReference>::const_iterator it = st.forwards.begin(); it != st.forwards.end(); ++it) {
      NodePtr target;
      for (vector<Name>::const_iterator c = it->candidates.begin(); c != it->candidates.end() && !target; ++c) {
        SymbolTable::const_iterator found = st.symbols.find(*c);
        if (found != st.symbols.end()) {
          it->node->setName(*c);
          target = found->second;
        }
      }
      if (!target) {
        throw ParseException(boost::format("Unknown type: %1%") % it->candidates.front());
      }
      it->node->setNode(target);
    }
  }

  /* True if the JSON kind of a default can stand for a value of the schema*/
  static bool acceptsDefault(const NodePtr &schema, const Entity &e) {
    NodePtr n = followSymbol(schema);
    switch (n->type()) {
      case Type::AVRO_NULL:
        return e.type() == json::etNull;
      case Type::AVRO_BOOL:
        return e.type() == json::etBool;
      case Type::AVRO_INT:
      case Type::AVRO_LONG:
        return e.type() == json::etLong;
      case Type::AVRO_FLOAT:
      case Type::AVRO_DOUBLE:
        return e.type() == json::etLong || e.type() == json::etDouble || e.type() == json::etString;
      case Type::AVRO_STRING:
      case Type::AVRO_BYTES:
      case Type::AVRO_FIXED:
      case Type::AVRO_ENUM:
        return e.type() == json::etString;
      case Type::AVRO_ARRAY:
        return e.type() == json::etArray;
      case Type::AVRO_MAP:
      case Type::AVRO_RECORD:
        return e.type() == json::etObject;
      default:
        return false;
    }
  }

  static double realDefault(const Entity &e) {
    switch (e.type()) {
      case json::etLong:
        return static_cast<double> (e.longValue());
      case json::etDouble:
        return e.doubleValue();
      default:
        if (e.stringValue() == "NaN") {
          return std::numeric_limits<double>::quiet_NaN();
        } else if (e.stringValue() == "Infinity") {
          return std::numeric_limits<double>::infinity();
        } else if (e.stringValue() == "-Infinity") {
          return -std::numeric_limits<double>::infinity();
        }
        throw ParseException(boost::format("Invalid floating point default: %1%") % e.toString());
    }
  }

  static vector<uint8_t> bytesDefault(const Entity &e) {
    vector<uint8_t> result;
    if (!json::toLatin1(e.stringValue(), result)) {
      throw ParseException(boost::format("Bytes default has characters beyond \\u00ff: %1%") % e.toString());
    }
    return result;
  }

  /* Fills d, already shaped by schema, with the value of the JSON default*/
  static void fillDefault(GenericDatum &d, const NodePtr &schema, const Entity &e) {
    NodePtr n = followSymbol(schema);
    if (n->type() != Type::AVRO_UNION && !acceptsDefault(n, e)) {
      throw ParseException(boost::format("Invalid default for type %1%: %2%") % n->type() % e.toString());
    }
    switch (n->type()) {
      case Type::AVRO_NULL:
        break;
      case Type::AVRO_BOOL:
        d.value<bool>() = e.boolValue();
        break;
      case Type::AVRO_INT:
        if (e.longValue() < std::numeric_limits<int32_t>::min() ||
          e.longValue() > std::numeric_limits<int32_t>::max()) {
          throw ParseException(boost::format("Default out of range for int: %1%") % e.longValue());
        }
        d.value<int32_t>() = static_cast<int32_t> (e.longValue());
        break;
      case Type::AVRO_LONG:
        d.value<int64_t>() = e.longValue();
        break;
      case Type::AVRO_FLOAT:
        d.value<float>() = static_cast<float> (realDefault(e));
        break;
      case Type::AVRO_DOUBLE:
        d.value<double>() = realDefault(e);
        break;
      case Type::AVRO_STRING:
        d.value<string>() = e.stringValue();
        break;
      case Type::AVRO_BYTES:
        d.value<vector<uint8_t> >() = bytesDefault(e);
        break;
      case Type::AVRO_FIXED:
      {
        vector<uint8_t> v = bytesDefault(e);
        if (v.size() != static_cast<size_t> (n->fixedSize())) {
          throw ParseException(boost::format("Default for fixed %1% must have %2% bytes: %3%")
            % n->name() % n->fixedSize() % e.toString());
        }
        d.value<GenericFixed>().value() = v;
        break;
      }
      case Type::AVRO_ENUM:
      {
        size_t index;
        if (!n->nameIndex(e.stringValue(), index)) {
          throw ParseException(boost::format("Default %1% is not a symbol of enum %2%") % e.stringValue() % n->name());
        }
        d.value<GenericEnum>().set(index);
        break;
      }
      case Type::AVRO_ARRAY:
      {
        const Array &a = e.arrayValue();
        GenericArray::Value &v = d.value<GenericArray>().value();
        v.clear();
        for (Array::const_iterator it = a.begin(); it != a.end(); ++it) {
          v.push_back(GenericDatum(n->leafAt(0)));
          fillDefault(v.back(), n->leafAt(0), *it);
        }
        break;
      }
      case Type::AVRO_MAP:
      {
        const Object &o = e.objectValue();
        GenericMap::Value &v = d.value<GenericMap>().value();
        v.clear();
        for (Object::const_iterator it = o.begin(); it != o.end(); ++it) {
          v.push_back(make_pair(it->first, GenericDatum(n->leafAt(1))));
          fillDefault(v.back().second, n->leafAt(1), it->second);
        }
        break;
      }
      case Type::AVRO_RECORD:
      {
        const Object &o = e.objectValue();
        GenericRecord &r = d.value<GenericRecord>();
        for (size_t i = 0; i < n->leaves(); ++i) {
          const Entity *v = findField(o, n->nameAt(i));
          if (v != 0) {
            fillDefault(r.fieldAt(i), n->leafAt(i), *v);
          } else if (!n->hasDefaultAt(i)) {
            throw ParseException(boost::format("Default for record %1% has no value for field %2%")
              % n->name() % n->nameAt(i));
          }
        }
        break;
      }
      case Type::AVRO_UNION:
      {
        for (size_t i = 0; i < n->leaves(); ++i) {
          if (acceptsDefault(n->leafAt(i), e)) {
            d.selectBranch(i);
            fillDefault(d, n->leafAt(i), e);
            return;
          }
        }
        throw ParseException(boost::format("No branch of the union accepts default %1%") % e.toString());
      }
      default:
        throw ParseException(boost::format("Unexpected type %1% for a default") % n->type());
    }
  }

  static void applyDefaults(const CompilerState &st) {
    for (vector<PendingDefault>::const_iterator it = st.defaults.begin(); it != st.defaults.end(); ++it) {
      const NodePtr &fieldType = it->record->leafAt(it->index);
      GenericDatum d(fieldType);
      fillDefault(d, fieldType, it->value);
      static_cast<NodeRecord &> (*it->record).setDefaultAt(it->index, d);
    }
  }

  static ValidSchema compile(const Entity &e, const LogicalTypeRegistry &registry) {
    CompilerState st(registry);
    NodePtr root = makeNode(e, st, "");
    resolveForwardReferences(st);
    applyDefaults(st);
    return ValidSchema(root);
  }

  ValidSchema compileJsonSchemaFromStream(InputStream &is, const LogicalTypeRegistry &registry) {
    Entity e;
    try {
      e = json::loadEntity(is);
    } catch (const FormatException &ex) {
      throw ParseException(boost::format("Malformed schema text: %1%") % ex.what());
    }
    return compile(e, registry);
  }

  ValidSchema compileJsonSchemaFromMemory(const uint8_t *input, size_t len, const LogicalTypeRegistry &registry) {
    InputStreamPtr in = memoryInputStream(input, len);
    return compileJsonSchemaFromStream(*in, registry);
  }

  ValidSchema compileJsonSchemaFromString(const char *input, const LogicalTypeRegistry &registry) {
    return compileJsonSchemaFromMemory(reinterpret_cast<const uint8_t *> (input), ::strlen(input), registry);
  }

  ValidSchema compileJsonSchemaFromString(const string &input, const LogicalTypeRegistry &registry) {
    return compileJsonSchemaFromMemory(reinterpret_cast<const uint8_t *> (input.data()), input.size(), registry);
  }

  void compileJsonSchema(std::istream &is, ValidSchema &schema, const LogicalTypeRegistry &registry) {
    if (!is.good()) {
      throw ParseException("Input stream is not good");
    }
    string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    schema = compileJsonSchemaFromString(text, registry);
  }

  bool compileJsonSchema(std::istream &is, ValidSchema &schema, string &error) {
    try {
      compileJsonSchema(is, schema);
      return true;
    } catch (const Exception &e) {
      error = e.what();
      return false;
    }
  }

}
