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

#ifndef avrolite_LogicalType_hh__
#define avrolite_LogicalType_hh__

#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "Types.hh"

namespace avrolite {

  /* A semantic refinement of a physical type. Logical types never change the wire encoding.*/
  class LogicalType {
  public:

    enum Type {
      NONE,
      DECIMAL,
      DATE,
      TIME_MILLIS,
      TIME_MICROS,
      TIMESTAMP_MILLIS,
      TIMESTAMP_MICROS,
      LOCAL_TIMESTAMP_MILLIS,
      LOCAL_TIMESTAMP_MICROS,
      DURATION,
      UUID,
      CUSTOM
    };

    explicit LogicalType(Type type);

    /* A logical type registered under a name unknown to this library.*/
    explicit LogicalType(const std::string& customName);

    Type type() const {
      return type_;
    }

    /* The name written in the "logicalType" attribute*/
    const std::string& name() const;

    /* Precision and scale can only be set for the DECIMAL logical type. Precision must be positive and scale must be either positive
       or zero. The setters will throw a ParseException if they are called on any type other than DECIMAL.*/
    void setPrecision(int precision);

    int precision() const {
      return precision_;
    }

    void setScale(int scale);

    int scale() const {
      return scale_;
    }

    void printJson(std::ostream& os) const;

    bool operator==(const LogicalType& other) const {
      return type_ == other.type_ && precision_ == other.precision_ &&
        scale_ == other.scale_ && customName_ == other.customName_;
    }

    bool operator!=(const LogicalType& other) const {
      return !(*this == other);
    }

  private:
    Type type_;
    int precision_;
    int scale_;
    std::string customName_;
  };

  /* Attributes of a schema node that a logical type factory may consult.*/
  struct LogicalTypeParams {
    avrolite::Type physicalType;
    int fixedSize;
    int precision;
    int scale;
    bool hasPrecision;
    bool hasScale;

    LogicalTypeParams() : physicalType(avrolite::Type::AVRO_NULL), fixedSize(0),
    precision(0), scale(0), hasPrecision(false), hasScale(false) { }
  };

  /* Builds a LogicalType for a node. Implementations throw ParseException when the node cannot carry the logical type.*/
  class LogicalTypeFactory {
  public:

    virtual ~LogicalTypeFactory() { }

    virtual LogicalType create(const LogicalTypeParams& params) const = 0;
  };

  typedef std::shared_ptr<LogicalTypeFactory> LogicalTypeFactoryPtr;

  /* Maps "logicalType" names to factories. A registry is owned by the caller and handed to the schema compiler, so that independent
     registries can coexist. A default constructed registry knows the standard logical types.*/
  class LogicalTypeRegistry {
    std::map<std::string, LogicalTypeFactoryPtr> factories_;
  public:

    LogicalTypeRegistry();

    /* Adds or replaces the factory for name*/
    void registerType(const std::string& name, const LogicalTypeFactoryPtr& factory);

    bool contains(const std::string& name) const;

    /* Creates the logical type called name. Returns LogicalType(NONE) when name is not registered.*/
    LogicalType create(const std::string& name, const LogicalTypeParams& params) const;
  };

}

#endif
