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

#ifndef avrolite_NodeConcepts_hh__
#define avrolite_NodeConcepts_hh__

#include <map>
#include <string>
#include <vector>

#include "Exception.hh"

/* Concept classes used by NodeImpl. A node either has an attribute (single or multiple values) or it does not; the NodeImpl template
   selects the concepts for each avro type, so attempts to use a missing attribute throw instead of silently succeeding.*/
namespace avrolite {

  namespace concepts {

    template <typename Attribute>
    struct NoAttribute {
      static const bool hasAttribute = false;

      size_t size() const {
        return 0;
      }

      void add(const Attribute &) {
        throw Exception("This type does not have attribute");
      }

      const Attribute &get(size_t = 0) const {
        throw Exception("This type does not have attribute");
      }

      Attribute &get(size_t = 0) {
        throw Exception("This type does not have attribute");
      }
    };

    template<typename Attribute>
    struct SingleAttribute {
      static const bool hasAttribute = true;

      SingleAttribute() : attr_(), set_(false) { }

      SingleAttribute(const Attribute& a) : attr_(a), set_(true) { }

      size_t size() const {
        return set_ ? 1 : 0;
      }

      void add(const Attribute &attr) {
        attr_ = attr;
        set_ = true;
      }

      const Attribute &get(size_t index = 0) const {
        if (index != 0) {
          throw Exception("SingleAttribute has only 1 value");
        }
        return attr_;
      }

      Attribute &get(size_t index = 0) {
        if (index != 0) {
          throw Exception("SingleAttribute has only 1 value");
        }
        return attr_;
      }

    private:
      Attribute attr_;
      bool set_;
    };

    template<typename Attribute>
    struct MultiAttribute {
      static const bool hasAttribute = true;

      MultiAttribute() { }

      size_t size() const {
        return attrs_.size();
      }

      void add(const Attribute &attr) {
        attrs_.push_back(attr);
      }

      const Attribute &get(size_t index = 0) const {
        return attrs_.at(index);
      }

      Attribute &get(size_t index) {
        return attrs_.at(index);
      }

    private:
      std::vector<Attribute> attrs_;
    };

    template<typename T>
    struct NameIndexConcept {

      bool lookup(const std::string &, size_t &) const {
        throw Exception("Name index does not exist");
      }

      bool add(const std::string &, size_t) {
        throw Exception("Name index does not exist");
      }
    };

    template<>
    struct NameIndexConcept< MultiAttribute<std::string> > {
      typedef std::map<std::string, size_t> IndexMap;

      bool lookup(const std::string &name, size_t &index) const {
        IndexMap::const_iterator iter = map_.find(name);
        if (iter == map_.end()) {
          return false;
        }
        index = iter->second;
        return true;
      }

      bool add(const std::string &name, size_t index) {
        bool added = false;
        IndexMap::iterator lb = map_.lower_bound(name);
        if (lb == map_.end() || map_.key_comp()(name, lb->first)) {
          map_.insert(lb, IndexMap::value_type(name, index));
          added = true;
        }
        return added;
      }

    private:
      IndexMap map_;
    };

  } // namespace concepts
} // namespace avrolite

#endif
