/*
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

#ifndef avrolite_ValidSchema_hh__
#define avrolite_ValidSchema_hh__

#include <cstdint>
#include <iostream>
#include <map>
#include <string>

#include "Node.hh"

namespace avrolite {

  class Schema;

  /* A ValidSchema is basically a non-mutable Schema that has passed some minimum of sanity checks. Once validated, any Schema that is
     part of this ValidSchema is considered locked, and cannot be modified (an attempt to modify a locked Schema will throw). Also,
     as it is validated, any recursive duplications of schemas are replaced with symbolic links to the original.

     Once a Schema is converted to a valid schema it can be used in validating parsers/serializers, such that a serializer can verify
     that the data being written matches the schema.*/
  class ValidSchema {
  public:
    explicit ValidSchema(const NodePtr &root);
    explicit ValidSchema(const Schema &schema);
    ValidSchema();

    void setSchema(const Schema &schema);

    const NodePtr &root() const {
      return root_;
    }

    /* Writes the schema as indented JSON*/
    void toJson(std::ostream &os) const;

    std::string toJson() const;

    /* Writes one line per node, for debugging*/
    void toFlatList(std::ostream &os) const;

    /* Parsing Canonical Form: full names, only the attributes that affect the wire format, no whitespace*/
    std::string toCanonicalJson() const;

    /* 64-bit CRC-64-AVRO (Rabin) fingerprint of the canonical form*/
    uint64_t fingerprint() const;

  protected:
    typedef std::map<Name, NodePtr> SymbolMap;

    bool validate(const NodePtr &node, SymbolMap &symbolMap);

    NodePtr root_;
  };

  /* CRC-64-AVRO of the given bytes*/
  uint64_t fingerprint64(const std::string& text);

  /* Equality that looks through symbolic links. Named types are equal when their types and full names are; unnamed types compare
     their contents. Aliases, defaults, documentation and logical types are ignored.*/
  bool structurallyEqual(const NodePtr& a, const NodePtr& b);

}

#endif
