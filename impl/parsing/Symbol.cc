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

#include "Symbol.hh"

namespace avrolite {
  namespace parsing {

    using std::vector;
    using std::string;

    static const char* const stringValues[] = {
      "TerminalLow",
      "Null",
      "Bool",
      "Int",
      "Long",
      "Float",
      "Double",
      "String",
      "Bytes",
      "ArrayStart",
      "ArrayEnd",
      "MapStart",
      "MapEnd",
      "Fixed",
      "Enum",
      "Union",
      "TerminalHigh",
      "SizeCheck",
      "NameList",
      "Root",
      "Repeater",
      "Alternative",
      "Placeholder",
      "Indirect",
      "Symbolic",
      "EnumAdjust",
      "UnionAdjust",
      "SkipStart",
      "Resolve",
      "ImplicitActionLow",
      "RecordStart",
      "RecordEnd",
      "UnionEnd",
      "Field",
      "Record",
      "SizeList",
      "WriterUnion",
      "DefaultStart",
      "DefaultEnd",
      "ImplicitActionHigh",
      "Error"
    };

    const char* Symbol::toString(Kind k) {
      return stringValues[k];
    }

    Symbol Symbol::enumAdjustSymbol(const NodePtr& writer, const NodePtr& reader) {
      size_t readerDefault = 0;
      bool hasDefault = reader->defaultSymbolIndex(readerDefault);

      size_t c = writer->names();
      vector<int> adjust;
      adjust.reserve(c);
      for (size_t i = 0; i < c; ++i) {
        size_t j = 0;
        if (reader->nameIndex(writer->nameAt(i), j)) {
          adjust.push_back(static_cast<int> (j));
        } else if (hasDefault) {
          adjust.push_back(static_cast<int> (readerDefault));
        } else {
          adjust.push_back(-1);
        }
      }
      return Symbol(sEnumAdjust, adjust);
    }

  }
}
