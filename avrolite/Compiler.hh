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

#ifndef avrolite_Compiler_hh__
#define avrolite_Compiler_hh__

#include <cstdint>
#include <istream>
#include <string>

#include "LogicalType.hh"
#include "Stream.hh"
#include "ValidSchema.hh"

namespace avrolite {

  /* Reads a JSON schema definition from the stream and compiles it into schema. Named types may be referenced before they are
     defined, as long as the definition appears somewhere in the same document. Logical types are looked up in registry; unknown
     ones are ignored. Throws ParseException on any error.*/
  void compileJsonSchema(std::istream &is, ValidSchema &schema,
    const LogicalTypeRegistry &registry = LogicalTypeRegistry());

  /* Same as above, reporting the error message instead of throwing. Returns true on success.*/
  bool compileJsonSchema(std::istream &is, ValidSchema &schema, std::string &error);

  ValidSchema compileJsonSchemaFromStream(InputStream &is,
    const LogicalTypeRegistry &registry = LogicalTypeRegistry());

  ValidSchema compileJsonSchemaFromMemory(const uint8_t *input, size_t len,
    const LogicalTypeRegistry &registry = LogicalTypeRegistry());

  ValidSchema compileJsonSchemaFromString(const char *input,
    const LogicalTypeRegistry &registry = LogicalTypeRegistry());

  ValidSchema compileJsonSchemaFromString(const std::string &input,
    const LogicalTypeRegistry &registry = LogicalTypeRegistry());

}

#endif
