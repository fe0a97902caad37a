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

#include "Schema.hh"

namespace avrolite {

  Schema::Schema() {
  }

  Schema::~Schema() {
  }

  Schema::Schema(const NodePtr &node) :
  node_(node) {
  }

  Schema::Schema(Node *node) :
  node_(node) {
  }

  RecordSchema::RecordSchema(const std::string &name) :
  NamedSchema(new NodeRecord) {
    node_->setName(Name(name));
  }

  void RecordSchema::addField(const std::string &name, const Schema &fieldSchema) {
    // add the name first. it will throw if the name is a duplicate, preventing
    // the leaf from being added
    node_->addName(name);

    node_->addLeaf(fieldSchema.root());
  }

  /* True if a default datum of type t may stand for a value of schema n*/
  static bool acceptsDefault(const NodePtr &n, Type t) {
    if (n->type() == Type::AVRO_UNION) {
      for (size_t i = 0; i < n->leaves(); ++i) {
        if (acceptsDefault(n->leafAt(i), t)) {
          return true;
        }
      }
      return false;
    }
    return followSymbol(n)->type() == t;
  }

  void RecordSchema::addField(const std::string &name, const Schema &fieldSchema,
    const GenericDatum &defaultValue, const std::vector<std::string> &aliases, FieldOrder order) {
    if (!acceptsDefault(fieldSchema.root(), defaultValue.type())) {
      throw ParseException(boost::format("Default of type %1% does not fit field %2% of type %3%")
        % defaultValue.type() % name % fieldSchema.type());
    }
    addField(name, fieldSchema);
    NodeRecord &record = static_cast<NodeRecord &> (*node_);
    size_t index = node_->names() - 1;
    record.setFieldAttributes(index, aliases, order);
    record.setDefaultAt(index, defaultValue);
  }

  EnumSchema::EnumSchema(const std::string &name) :
  NamedSchema(new NodeEnum) {
    node_->setName(Name(name));
  }

  void EnumSchema::addSymbol(const std::string &symbol) {
    node_->addName(symbol);
  }

  void EnumSchema::setDefaultSymbol(const std::string &symbol) {
    static_cast<NodeEnum &> (*node_).setDefaultSymbol(symbol);
  }

  ArraySchema::ArraySchema(const Schema &itemsSchema) :
  Schema(new NodeArray) {
    node_->addLeaf(itemsSchema.root());
  }

  MapSchema::MapSchema(const Schema &valuesSchema) :
  Schema(new NodeMap) {
    node_->addLeaf(valuesSchema.root());
  }

  UnionSchema::UnionSchema() :
  Schema(new NodeUnion) {
  }

  void UnionSchema::addType(const Schema &typeSchema) {
    if (typeSchema.type() == Type::AVRO_UNION) {
      throw ParseException("Cannot add unions to unions");
    }
    node_->addLeaf(typeSchema.root());
  }

  FixedSchema::FixedSchema(int size, const std::string &name) :
  NamedSchema(new NodeFixed) {
    node_->setFixedSize(size);
    node_->setName(Name(name));
  }

  SymbolicSchema::SymbolicSchema(const Name &name, const NodePtr& link) :
  Schema(new NodeSymbolic(HasName(name), link)) {
  }

}
