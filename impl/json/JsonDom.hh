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

#ifndef avrolite_json_JsonDom_hh__
#define avrolite_json_JsonDom_hh__

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/any.hpp>

#include "Stream.hh"

namespace avrolite {
  namespace json {

    class Entity;

    typedef bool Bool;
    typedef int64_t Long;
    typedef double Double;
    typedef std::string String;
    typedef std::vector<Entity> Array;
    typedef std::map<std::string, Entity> Object;

    enum EntityType {
      etNull,
      etBool,
      etLong,
      etDouble,
      etString,
      etArray,
      etObject
    };

    const char* typeToString(EntityType t);

    /* A node of a JSON document. Objects keep one value per key; the last duplicate wins.*/
    class Entity {
      EntityType type_;
      boost::any value_;
      size_t line_;

      void ensureType(EntityType type) const;

    public:

      explicit Entity(size_t line = 0) : type_(etNull), line_(line) { }

      Entity(Bool v, size_t line = 0) : type_(etBool), value_(v), line_(line) { }

      Entity(Long v, size_t line = 0) : type_(etLong), value_(v), line_(line) { }

      Entity(Double v, size_t line = 0) : type_(etDouble), value_(v), line_(line) { }

      Entity(const String& v, size_t line = 0) : type_(etString), value_(v), line_(line) { }

      Entity(const Array& v, size_t line = 0) : type_(etArray), value_(v), line_(line) { }

      Entity(const Object& v, size_t line = 0) : type_(etObject), value_(v), line_(line) { }

      EntityType type() const {
        return type_;
      }

      /* Line of the source text the entity started on*/
      size_t line() const {
        return line_;
      }

      Bool boolValue() const {
        ensureType(etBool);
        return boost::any_cast<Bool>(value_);
      }

      Long longValue() const {
        ensureType(etLong);
        return boost::any_cast<Long>(value_);
      }

      Double doubleValue() const {
        ensureType(etDouble);
        return boost::any_cast<Double>(value_);
      }

      const String& stringValue() const {
        ensureType(etString);
        return *boost::any_cast<String>(&value_);
      }

      const Array& arrayValue() const {
        ensureType(etArray);
        return *boost::any_cast<Array>(&value_);
      }

      const Object& objectValue() const {
        ensureType(etObject);
        return *boost::any_cast<Object>(&value_);
      }

      /* Compact JSON text of this entity*/
      std::string toString() const;
    };

    /* Reads exactly one JSON value from the input. Malformed text or trailing content throws FormatException.*/
    Entity loadEntity(InputStream& in);
    Entity loadEntity(const char* text);
    Entity loadEntity(const uint8_t* text, size_t len);

    /* Writes the entity as compact JSON*/
    void writeEntity(std::ostream& os, const Entity& e);

  }
}

#endif
