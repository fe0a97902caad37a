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

#ifndef avrolite_Exception_hh__
#define avrolite_Exception_hh__

#include <stdexcept>
#include <boost/format.hpp>

namespace avrolite {

  /* Wrapper for std::runtime_error that provides convenience constructor for boost::format objects*/
  class Exception : public virtual std::runtime_error {
  public:

    Exception(const std::string &msg) : std::runtime_error(msg) { }

    Exception(const boost::format &msg) : std::runtime_error(boost::str(msg)) { }
  };

  /* Raised while building a schema: malformed schema text, bad names, duplicates, ambiguous unions, undefined references.*/
  class ParseException : public Exception {
  public:

    ParseException(const std::string &msg) :
    std::runtime_error(msg), Exception(msg) { }

    ParseException(const boost::format &msg) :
    std::runtime_error(boost::str(msg)), Exception(msg) { }
  };

  /* Raised when the bytes or tokens are not well-formed: truncated input, invalid varints, malformed JSON text.
     The position of the stream is undefined afterwards.*/
  class FormatException : public Exception {
  public:

    FormatException(const std::string &msg) :
    std::runtime_error(msg), Exception(msg) { }

    FormatException(const boost::format &msg) :
    std::runtime_error(boost::str(msg)), Exception(msg) { }
  };

  /* Raised when well-formed data does not fit the schema, or when a writer schema cannot be resolved against a reader schema.*/
  class ResolutionException : public Exception {
  public:

    ResolutionException(const std::string &msg) :
    std::runtime_error(msg), Exception(msg) { }

    ResolutionException(const boost::format &msg) :
    std::runtime_error(boost::str(msg)), Exception(msg) { }
  };

}

#endif
