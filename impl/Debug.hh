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

#ifndef avrolite_Debug_hh__
#define avrolite_Debug_hh__

/* Tracing for the library internals. Build with DEBUG_VERBOSE defined to get it on std::cout.*/

#ifdef DEBUG_VERBOSE
#include <iostream>
#define DEBUG_OUT(str) std::cout << str << '\n'
#else

namespace avrolite {
  namespace detail {

    class NoOp {
    };

    template<typename T> NoOp& operator<<(NoOp &noOp, const T&) {
      return noOp;
    }

    static NoOp noop;
  }
}

#define DEBUG_OUT(str) avrolite::detail::noop << str
#endif

#endif
