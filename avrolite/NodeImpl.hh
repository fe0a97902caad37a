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

#ifndef avrolite_NodeImpl_hh__
#define avrolite_NodeImpl_hh__

#include <limits>
#include <set>

#include "GenericDatum.hh"
#include "Node.hh"
#include "NodeConcepts.hh"

namespace avrolite {

  /* Implementation details for Node.  NodeImpl represents all the avro types, whose properties are enabled or disabled by selecting
     concept classes.*/
  template
  <
  class NameConcept,
  class LeavesConcept,
  class LeafNamesConcept,
  class SizeConcept
  >
  class NodeImpl : public Node {
  protected:

    NodeImpl(Type type) :
    Node(type),
    nameAttribute_(),
    leafAttributes_(),
    leafNameAttributes_(),
    sizeAttribute_() { }

    NodeImpl(Type type,
      const NameConcept &name,
      const LeavesConcept &leaves,
      const LeafNamesConcept &leafNames,
      const SizeConcept &size) :
    Node(type),
    nameAttribute_(name),
    leafAttributes_(leaves),
    leafNameAttributes_(leafNames),
    sizeAttribute_(size) { }

    void swap(NodeImpl& impl) {
      std::swap(nameAttribute_, impl.nameAttribute_);
      std::swap(leafAttributes_, impl.leafAttributes_);
      std::swap(leafNameAttributes_, impl.leafNameAttributes_);
      std::swap(sizeAttribute_, impl.sizeAttribute_);
      std::swap(nameIndex_, impl.nameIndex_);
    }

    bool hasName() const {
      return NameConcept::hasAttribute;
    }

    void doSetName(const Name &name) {
      nameAttribute_.add(name);
    }

    const Name &name() const {
      return nameAttribute_.get();
    }

    void doAddLeaf(const NodePtr &newLeaf) {
      leafAttributes_.add(newLeaf);
    }

    size_t leaves() const {
      return leafAttributes_.size();
    }

    const NodePtr &leafAt(int index) const {
      return leafAttributes_.get(index);
    }

    void doAddName(const std::string &name) {
      if (!nameIndex_.add(name, leafNameAttributes_.size())) {
        throw ParseException(boost::format("Cannot add duplicate name: %1%") % name);
      }
      leafNameAttributes_.add(name);
    }

    size_t names() const {
      return leafNameAttributes_.size();
    }

    const std::string &nameAt(int index) const {
      return leafNameAttributes_.get(index);
    }

    bool nameIndex(const std::string &name, size_t &index) const {
      return nameIndex_.lookup(name, index);
    }

    void doSetFixedSize(int size) {
      if (size < 0) {
        throw ParseException(boost::format("Fixed size cannot be negative: %1%") % size);
      }
      sizeAttribute_.add(size);
    }

    int fixedSize() const {
      return sizeAttribute_.get();
    }

    virtual bool isValid() const = 0;

    void printBasicInfo(std::ostream &os) const;

    void setLeafToSymbolic(int index, const NodePtr &node);

    NameConcept nameAttribute_;
    LeavesConcept leafAttributes_;
    LeafNamesConcept leafNameAttributes_;
    SizeConcept sizeAttribute_;
    concepts::NameIndexConcept<LeafNamesConcept> nameIndex_;
  };


  typedef concepts::NoAttribute<Name> NoName;
  typedef concepts::SingleAttribute<Name> HasName;

  typedef concepts::NoAttribute<NodePtr> NoLeaves;
  typedef concepts::SingleAttribute<NodePtr> SingleLeaf;
  typedef concepts::MultiAttribute<NodePtr> MultiLeaves;

  typedef concepts::NoAttribute<std::string> NoLeafNames;
  typedef concepts::MultiAttribute<std::string> LeafNames;

  typedef concepts::NoAttribute<int> NoSize;
  typedef concepts::SingleAttribute<int> HasSize;

  typedef NodeImpl< NoName, NoLeaves, NoLeafNames, NoSize > NodeImplPrimitive;
  typedef NodeImpl< HasName, NoLeaves, NoLeafNames, NoSize > NodeImplSymbolic;

  typedef NodeImpl< HasName, MultiLeaves, LeafNames, NoSize > NodeImplRecord;
  typedef NodeImpl< HasName, NoLeaves, LeafNames, NoSize > NodeImplEnum;
  typedef NodeImpl< NoName, SingleLeaf, NoLeafNames, NoSize > NodeImplArray;
  typedef NodeImpl< NoName, MultiLeaves, NoLeafNames, NoSize > NodeImplMap;
  typedef NodeImpl< NoName, MultiLeaves, NoLeafNames, NoSize > NodeImplUnion;
  typedef NodeImpl< HasName, NoLeaves, NoLeafNames, HasSize > NodeImplFixed;

  class NodePrimitive : public NodeImplPrimitive {
  public:

    explicit NodePrimitive(Type type) :
    NodeImplPrimitive(type) { }

    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return true;
    }
  };

  class NodeSymbolic : public NodeImplSymbolic {
    typedef std::weak_ptr<Node> NodeWeakPtr;

  public:

    NodeSymbolic() :
    NodeImplSymbolic(Type::AVRO_SYMBOLIC) { }

    explicit NodeSymbolic(const HasName &name) :
    NodeImplSymbolic(Type::AVRO_SYMBOLIC, name, NoLeaves(), NoLeafNames(), NoSize()) { }

    NodeSymbolic(const HasName &name, const NodePtr n) :
    NodeImplSymbolic(Type::AVRO_SYMBOLIC, name, NoLeaves(), NoLeafNames(), NoSize()), actualNode_(n) { }

    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return (nameAttribute_.size() == 1);
    }

    bool isSet() const {
      return (actualNode_.lock() != 0);
    }

    NodePtr getNode() const {
      NodePtr node = actualNode_.lock();
      if (!node) {
        throw Exception(boost::format("Could not follow symbol %1%") % name());
      }
      return node;
    }

    void setNode(const NodePtr &node) {
      actualNode_ = node;
    }

  protected:

    NodeWeakPtr actualNode_;

  };

  class NodeRecord : public NodeImplRecord {
    std::vector<std::vector<std::string> > fieldsAliases_;
    std::vector<FieldOrder> fieldsOrder_;
    std::vector<GenericDatum> defaultValues_;
    std::vector<bool> hasDefault_;

    void growFieldAttributes() {
      size_t n = leafNameAttributes_.size();
      if (fieldsAliases_.size() < n) {
        fieldsAliases_.resize(n);
        fieldsOrder_.resize(n, FieldOrder::ASCENDING);
        defaultValues_.resize(n);
        hasDefault_.resize(n, false);
      }
    }

    void checkFieldIndex(size_t index) const {
      if (index >= leafNameAttributes_.size()) {
        throw Exception(boost::format("No field at position %1% in record %2%") % index % name());
      }
    }

  public:

    NodeRecord() : NodeImplRecord(Type::AVRO_RECORD) { }

    explicit NodeRecord(const HasName &name) :
    NodeImplRecord(Type::AVRO_RECORD, name, MultiLeaves(), LeafNames(), NoSize()) { }

    void swap(NodeRecord& r) {
      NodeImplRecord::swap(r);
      fieldsAliases_.swap(r.fieldsAliases_);
      fieldsOrder_.swap(r.fieldsOrder_);
      defaultValues_.swap(r.defaultValues_);
      hasDefault_.swap(r.hasDefault_);
    }

    /* Sets the aliases and sort order of the field at index*/
    void setFieldAttributes(size_t index, const std::vector<std::string>& aliases, FieldOrder order) {
      checkLock();
      checkFieldIndex(index);
      for (std::vector<std::string>::const_iterator it = aliases.begin(); it != aliases.end(); ++it) {
        if (!isValidSimpleName(*it)) {
          throw ParseException(boost::format("Invalid field alias: %1%") % *it);
        }
      }
      growFieldAttributes();
      fieldsAliases_[index] = aliases;
      fieldsOrder_[index] = order;
    }

    void setDefaultAt(size_t index, const GenericDatum& value) {
      checkLock();
      checkFieldIndex(index);
      growFieldAttributes();
      defaultValues_[index] = value;
      hasDefault_[index] = true;
    }

    const std::vector<std::string>& fieldAliasesAt(size_t index) const {
      static const std::vector<std::string> none;
      checkFieldIndex(index);
      return index < fieldsAliases_.size() ? fieldsAliases_[index] : none;
    }

    FieldOrder fieldOrderAt(size_t index) const {
      checkFieldIndex(index);
      return index < fieldsOrder_.size() ? fieldsOrder_[index] : FieldOrder::ASCENDING;
    }

    bool hasDefaultAt(size_t index) const {
      checkFieldIndex(index);
      return index < hasDefault_.size() && hasDefault_[index];
    }

    const GenericDatum& defaultValueAt(size_t index) const {
      if (!hasDefaultAt(index)) {
        throw Exception(boost::format("Field %1% of %2% has no default value") % nameAt(index) % name());
      }
      return defaultValues_[index];
    }


    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return ((nameAttribute_.size() == 1) &&
        (leafAttributes_.size() == leafNameAttributes_.size()));
    }
  };

  class NodeEnum : public NodeImplEnum {
    std::string defaultSymbol_;
  public:

    NodeEnum() :
    NodeImplEnum(Type::AVRO_ENUM) { }

    NodeEnum(const HasName &name, const LeafNames &symbols) :
    NodeImplEnum(Type::AVRO_ENUM, name, NoLeaves(), symbols, NoSize()) {
      for (size_t i = 0; i < leafNameAttributes_.size(); ++i) {
        if (!nameIndex_.add(leafNameAttributes_.get(i), i)) {
          throw ParseException(boost::format("Cannot add duplicate name: %1%") % leafNameAttributes_.get(i));
        }
      }
    }

    /* The symbol a reader substitutes for writer symbols it does not know. It must be one of the symbols.*/
    void setDefaultSymbol(const std::string& symbol) {
      checkLock();
      size_t index;
      if (!nameIndex(symbol, index)) {
        throw ParseException(boost::format("Default symbol %1% is not a symbol of enum %2%") % symbol % name());
      }
      defaultSymbol_ = symbol;
    }

    bool defaultSymbolIndex(size_t& index) const {
      return !defaultSymbol_.empty() && nameIndex(defaultSymbol_, index);
    }


    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return (
        (nameAttribute_.size() == 1) &&
        (leafNameAttributes_.size() > 0)
        );
    }
  };

  class NodeArray : public NodeImplArray {
  public:

    NodeArray() :
    NodeImplArray(Type::AVRO_ARRAY) { }

    explicit NodeArray(const SingleLeaf &items) :
    NodeImplArray(Type::AVRO_ARRAY, NoName(), items, NoLeafNames(), NoSize()) { }

    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return (leafAttributes_.size() == 1);
    }
  };

  class NodeMap : public NodeImplMap {
  public:

    NodeMap() :
    NodeImplMap(Type::AVRO_MAP) {
      NodePtr key(new NodePrimitive(Type::AVRO_STRING));
      doAddLeaf(key);
    }

    explicit NodeMap(const SingleLeaf &values) :
    NodeImplMap(Type::AVRO_MAP, NoName(), MultiLeaves(), NoLeafNames(), NoSize()) {
      // key goes before value
      NodePtr key(new NodePrimitive(Type::AVRO_STRING));
      doAddLeaf(key);
      doAddLeaf(values.get());
    }


    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return (leafAttributes_.size() == 2);
    }
  };

  class NodeUnion : public NodeImplUnion {
  public:

    NodeUnion() :
    NodeImplUnion(Type::AVRO_UNION) { }

    explicit NodeUnion(const MultiLeaves &types) :
    NodeImplUnion(Type::AVRO_UNION, NoName(), types, NoLeafNames(), NoSize()) { }

    void printJson(std::ostream &os, int depth) const;

    /* A union is valid when it is not empty, holds no directly nested union, and no two branches share a type name. Named
       branches are told apart by full name, so at most one null branch is allowed.*/
    bool isValid() const {
      std::set<std::string> seen;
      if (leafAttributes_.size() >= 1) {
        for (size_t i = 0; i < leafAttributes_.size(); ++i) {
          std::string name;
          const NodePtr& n = leafAttributes_.get(i);
          switch (n->type()) {
            case Type::AVRO_STRING:
            case Type::AVRO_BYTES:
            case Type::AVRO_INT:
            case Type::AVRO_LONG:
            case Type::AVRO_FLOAT:
            case Type::AVRO_DOUBLE:
            case Type::AVRO_BOOL:
            case Type::AVRO_NULL:
            case Type::AVRO_ARRAY:
            case Type::AVRO_MAP:
              name = toString(n->type());
              break;
            case Type::AVRO_RECORD:
            case Type::AVRO_ENUM:
            case Type::AVRO_FIXED:
            case Type::AVRO_SYMBOLIC:
              name = n->name().fullname();
              break;
            default:
              return false;
          }
          if (seen.find(name) != seen.end()) {
            return false;
          }
          seen.insert(name);
        }
        return true;
      }
      return false;
    }
  };

  class NodeFixed : public NodeImplFixed {
  public:

    NodeFixed() :
    NodeImplFixed(Type::AVRO_FIXED) { }

    NodeFixed(const HasName &name, const HasSize &size) :
    NodeImplFixed(Type::AVRO_FIXED, name, NoLeaves(), NoLeafNames(), size) { }

    void printJson(std::ostream &os, int depth) const;

    bool isValid() const {
      return (
        (nameAttribute_.size() == 1) &&
        (sizeAttribute_.size() == 1)
        );
    }
  };

  template < class A, class B, class C, class D >
  inline void NodeImpl<A, B, C, D>::setLeafToSymbolic(int index, const NodePtr &node) {
    if (!B::hasAttribute) {
      throw Exception("Cannot change leaf node for nonexistent leaf");
    }

    NodePtr &replaceNode = const_cast<NodePtr &> (leafAttributes_.get(index));
    if (replaceNode->name() != node->name()) {
      throw Exception("Symbolic name does not match the name of the schema it references");
    }

    NodePtr symbol(new NodeSymbolic);
    NodeSymbolic *ptr = static_cast<NodeSymbolic *> (symbol.get());

    ptr->setName(node->name());
    ptr->setNode(node);
    replaceNode.swap(symbol);
  }

  template < class A, class B, class C, class D >
  inline void NodeImpl<A, B, C, D>::printBasicInfo(std::ostream &os) const {
    os << type();
    if (hasName()) {
      os << ' ' << nameAttribute_.get();
    }

    if (D::hasAttribute) {
      os << " " << sizeAttribute_.get();
    }
    os << '\n';
    int count = leaves();
    count = count ? count : names();
    for (int i = 0; i < count; ++i) {
      if (C::hasAttribute) {
        os << "name " << nameAt(i) << '\n';
      }
      if (type() != Type::AVRO_SYMBOLIC && leafAttributes_.hasAttribute) {
        leafAt(i)->printBasicInfo(os);
      }
    }
    if (isCompound(type())) {
      os << "end " << type() << '\n';
    }
  }

  inline NodePtr resolveSymbol(const NodePtr &node) {
    if (node->type() != Type::AVRO_SYMBOLIC) {
      throw Exception("Only symbolic nodes may be resolved");
    }
    std::shared_ptr<NodeSymbolic> symNode = std::static_pointer_cast<NodeSymbolic>(node);
    return symNode->getNode();
  }

  /* Follows a symbolic node to the named node it stands for; other nodes are returned unchanged.*/
  inline NodePtr followSymbol(const NodePtr &node) {
    return node->type() == Type::AVRO_SYMBOLIC ? resolveSymbol(node) : node;
  }

  /* True if a writer named type is accepted by a reader named type: same full name, or the writer's full name is one of the
     reader's aliases.*/
  inline bool namesMatch(const Node &writer, const Node &reader) {
    if (writer.name() == reader.name()) {
      return true;
    }
    const std::vector<Name>& aliases = reader.aliases();
    for (std::vector<Name>::const_iterator it = aliases.begin(); it != aliases.end(); ++it) {
      if (*it == writer.name()) {
        return true;
      }
    }
    return false;
  }

}

#endif
