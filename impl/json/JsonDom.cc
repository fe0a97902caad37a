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
#include <sstream>

#include "JsonDom.hh"
#include "JsonIO.hh"

namespace avrolite {
  namespace json {

    const char* typeToString(EntityType t) {
      switch (t) {
        case etNull: return "null";
        case etBool: return "bool";
        case etLong: return "long";
        case etDouble: return "double";
        case etString: return "string";
        case etArray: return "array";
        case etObject: return "object";
      }
      return "unknown";
    }

    void Entity::ensureType(EntityType type) const {
      if (type_ != type) {
        throw Exception(boost::format("Invalid type. Expected \"%1%\" actual %2%")
          % typeToString(type) % typeToString(type_));
      }
    }

    static Entity readEntity(JsonParser& p) {
      size_t line = p.line();
      switch (p.advance()) {
        case JsonParser::tkNull:
          return Entity(line);
        case JsonParser::tkBool:
          return Entity(p.boolValue(), line);
        case JsonParser::tkLong:
          return Entity(p.longValue(), line);
        case JsonParser::tkDouble:
          return Entity(p.doubleValue(), line);
        case JsonParser::tkString:
          return Entity(p.stringValue(), line);
        case JsonParser::tkArrayStart:
        {
          Array v;
          while (p.peek() != JsonParser::tkArrayEnd) {
            v.push_back(readEntity(p));
          }
          p.advance();
          return Entity(v, line);
        }
        case JsonParser::tkObjectStart:
        {
          Object v;
          while (p.peek() != JsonParser::tkObjectEnd) {
            p.advance();
            std::string k = p.stringValue();
            v[k] = readEntity(p);
          }
          p.advance();
          return Entity(v, line);
        }
        default:
          throw FormatException(boost::format("Unexpected JSON token at line %1%") % line);
      }
    }

    Entity loadEntity(InputStream& in) {
      JsonParser p;
      p.init(in);
      Entity result = readEntity(p);
      if (!p.atEnd()) {
        throw FormatException(boost::format("Unexpected content after JSON value at line %1%") % p.line());
      }
      return result;
    }

    Entity loadEntity(const uint8_t* text, size_t len) {
      InputStreamPtr in = memoryInputStream(text, len);
      return loadEntity(*in);
    }

    Entity loadEntity(const char* text) {
      return loadEntity(reinterpret_cast<const uint8_t*> (text), ::strlen(text));
    }

    void writeEntity(std::ostream& os, const Entity& e) {
      switch (e.type()) {
        case etNull:
          os << "null";
          break;
        case etBool:
          os << (e.boolValue() ? "true" : "false");
          break;
        case etLong:
          os << e.longValue();
          break;
        case etDouble:
          os << formatDouble(e.doubleValue());
          break;
        case etString:
          os << quote(e.stringValue());
          break;
        case etArray:
        {
          const Array& a = e.arrayValue();
          os << '[';
          for (Array::const_iterator it = a.begin(); it != a.end(); ++it) {
            if (it != a.begin()) {
              os << ',';
            }
            writeEntity(os, *it);
          }
          os << ']';
          break;
        }
        case etObject:
        {
          const Object& o = e.objectValue();
          os << '{';
          for (Object::const_iterator it = o.begin(); it != o.end(); ++it) {
            if (it != o.begin()) {
              os << ',';
            }
            os << quote(it->first) << ':';
            writeEntity(os, it->second);
          }
          os << '}';
          break;
        }
      }
    }

    std::string Entity::toString() const {
      std::ostringstream oss;
      writeEntity(oss, *this);
      return oss.str();
    }

  }
}
