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

#include <cmath>

#include "LogicalType.hh"
#include "Exception.hh"

namespace avrolite {

  LogicalType::LogicalType(Type type)
  : type_(type), precision_(0), scale_(0) {
  }

  LogicalType::LogicalType(const std::string& customName)
  : type_(CUSTOM), precision_(0), scale_(0), customName_(customName) {
  }

  const std::string& LogicalType::name() const {
    static const std::string names[] = {
      "",
      "decimal",
      "date",
      "time-millis",
      "time-micros",
      "timestamp-millis",
      "timestamp-micros",
      "local-timestamp-millis",
      "local-timestamp-micros",
      "duration",
      "uuid"
    };
    return type_ == CUSTOM ? customName_ : names[type_];
  }

  void LogicalType::setPrecision(int precision) {
    if (type_ != DECIMAL) {
      throw ParseException("Only logical type DECIMAL can have precision");
    }
    if (precision <= 0) {
      throw ParseException(boost::format("Precision cannot be: %1%") % precision);
    }
    precision_ = precision;
  }

  void LogicalType::setScale(int scale) {
    if (type_ != DECIMAL) {
      throw ParseException("Only logical type DECIMAL can have scale");
    }
    if (scale < 0) {
      throw ParseException(boost::format("Scale cannot be: %1%") % scale);
    }
    scale_ = scale;
  }

  void LogicalType::printJson(std::ostream& os) const {
    if (type_ == NONE) {
      return;
    }
    os << "\"logicalType\": \"" << name() << "\"";
    if (type_ == DECIMAL) {
      os << ", \"precision\": " << precision_;
      if (scale_ > 0) {
        os << ", \"scale\": " << scale_;
      }
    }
  }

  namespace {

    class SimpleFactory : public LogicalTypeFactory {
      const LogicalType::Type type_;
      const avrolite::Type physical_;
      const int fixedSize_;
    public:

      SimpleFactory(LogicalType::Type type, avrolite::Type physical, int fixedSize = 0) :
      type_(type), physical_(physical), fixedSize_(fixedSize) {
      }

      LogicalType create(const LogicalTypeParams& params) const {
        LogicalType result(type_);
        if (params.physicalType != physical_ ||
          (fixedSize_ != 0 && params.fixedSize != fixedSize_)) {
          throw ParseException(boost::format("%1% logical type cannot annotate %2% type")
            % result.name() % toString(params.physicalType));
        }
        return result;
      }
    };

    class DecimalFactory : public LogicalTypeFactory {
    public:

      LogicalType create(const LogicalTypeParams& params) const {
        if (params.physicalType != avrolite::Type::AVRO_BYTES &&
          params.physicalType != avrolite::Type::AVRO_FIXED) {
          throw ParseException(boost::format("DECIMAL logical type cannot annotate %1% type")
            % toString(params.physicalType));
        }
        if (!params.hasPrecision) {
          throw ParseException("DECIMAL logical type requires a precision");
        }
        LogicalType result(LogicalType::DECIMAL);
        result.setPrecision(params.precision);
        if (params.hasScale) {
          result.setScale(params.scale);
        }
        if (result.scale() > result.precision()) {
          throw ParseException(boost::format("DECIMAL scale %1% cannot exceed precision %2%")
            % result.scale() % result.precision());
        }
        if (params.physicalType == avrolite::Type::AVRO_FIXED) {
          int maxPrecision = static_cast<int> (
            std::floor(std::log10(2.0) * (8.0 * params.fixedSize - 1)));
          if (result.precision() > maxPrecision) {
            throw ParseException(boost::format(
              "Fixed type of size %1% cannot hold a DECIMAL of precision %2%")
              % params.fixedSize % result.precision());
          }
        }
        return result;
      }
    };

  }

  LogicalTypeRegistry::LogicalTypeRegistry() {
    using avrolite::Type;
    factories_["decimal"] = std::make_shared<DecimalFactory>();
    factories_["date"] = std::make_shared<SimpleFactory>(LogicalType::DATE, Type::AVRO_INT);
    factories_["time-millis"] = std::make_shared<SimpleFactory>(LogicalType::TIME_MILLIS, Type::AVRO_INT);
    factories_["time-micros"] = std::make_shared<SimpleFactory>(LogicalType::TIME_MICROS, Type::AVRO_LONG);
    factories_["timestamp-millis"] = std::make_shared<SimpleFactory>(LogicalType::TIMESTAMP_MILLIS, Type::AVRO_LONG);
    factories_["timestamp-micros"] = std::make_shared<SimpleFactory>(LogicalType::TIMESTAMP_MICROS, Type::AVRO_LONG);
    factories_["local-timestamp-millis"] =
      std::make_shared<SimpleFactory>(LogicalType::LOCAL_TIMESTAMP_MILLIS, Type::AVRO_LONG);
    factories_["local-timestamp-micros"] =
      std::make_shared<SimpleFactory>(LogicalType::LOCAL_TIMESTAMP_MICROS, Type::AVRO_LONG);
    factories_["duration"] = std::make_shared<SimpleFactory>(LogicalType::DURATION, Type::AVRO_FIXED, 12);
    factories_["uuid"] = std::make_shared<SimpleFactory>(LogicalType::UUID, Type::AVRO_STRING);
  }

  void LogicalTypeRegistry::registerType(const std::string& name,
    const LogicalTypeFactoryPtr& factory) {
    factories_[name] = factory;
  }

  bool LogicalTypeRegistry::contains(const std::string& name) const {
    return factories_.find(name) != factories_.end();
  }

  LogicalType LogicalTypeRegistry::create(const std::string& name,
    const LogicalTypeParams& params) const {
    std::map<std::string, LogicalTypeFactoryPtr>::const_iterator it =
      factories_.find(name);
    if (it == factories_.end()) {
      return LogicalType(LogicalType::NONE);
    }
    return it->second->create(params);
  }

}
