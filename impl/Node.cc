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

#include <cctype>

#include "Node.hh"

namespace avrolite {

  using std::string;

  Node::~Node() {
  }

  Name::Name(const std::string& name) {
    fullname(name);
  }

  Name::Name(const std::string& name, const std::string& ns) : ns_(ns), simpleName_(name) {
    check();
  }

  std::string Name::fullname() const {
    return (ns_.empty()) ? simpleName_ : ns_ + "." + simpleName_;
  }

  void Name::fullname(const string& name) {
    string::size_type n = name.find_last_of('.');
    if (n == string::npos) {
      simpleName_ = name;
      ns_.clear();
    } else {
      ns_ = name.substr(0, n);
      simpleName_ = name.substr(n + 1);
    }
    check();
  }

  bool Name::operator<(const Name& n) const {
    return (ns_ < n.ns_) ? true :
      (n.ns_ < ns_) ? false :
      (simpleName_ < n.simpleName_);
  }

  bool isValidSimpleName(const string& name) {
    if (name.empty() ||
      !(isalpha(static_cast<unsigned char> (name[0])) || name[0] == '_')) {
      return false;
    }
    for (string::const_iterator it = name.begin() + 1; it != name.end(); ++it) {
      if (!(isalnum(static_cast<unsigned char> (*it)) || *it == '_')) {
        return false;
      }
    }
    return true;
  }

  void Name::check() const {
    if (!ns_.empty()) {
      string::size_type start = 0;
      for (;;) {
        string::size_type end = ns_.find('.', start);
        string part = ns_.substr(start, end == string::npos ? string::npos : end - start);
        if (!isValidSimpleName(part)) {
          throw ParseException(boost::format("Invalid namespace: %1%") % ns_);
        }
        if (end == string::npos) {
          break;
        }
        start = end + 1;
      }
    }
    if (!isValidSimpleName(simpleName_)) {
      throw ParseException(boost::format("Invalid name: %1%") % simpleName_);
    }
  }

  bool Name::operator==(const Name& n) const {
    return ns_ == n.ns_ && simpleName_ == n.simpleName_;
  }

  const std::string& toString(FieldOrder order) {
    static const std::string names[] = {"ascending", "descending", "ignore"};
    return names[static_cast<int> (order)];
  }

  const std::vector<std::string>& Node::fieldAliasesAt(size_t) const {
    throw Exception(boost::format("Type %1% has no fields") % type_);
  }

  FieldOrder Node::fieldOrderAt(size_t) const {
    throw Exception(boost::format("Type %1% has no fields") % type_);
  }

  bool Node::hasDefaultAt(size_t) const {
    return false;
  }

  const GenericDatum& Node::defaultValueAt(size_t) const {
    throw Exception(boost::format("Type %1% has no fields") % type_);
  }

  bool Node::defaultSymbolIndex(size_t&) const {
    return false;
  }

}
