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

#ifndef avrolite_json_JsonIO_hh__
#define avrolite_json_JsonIO_hh__

#include <cstdint>
#include <stack>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include "Stream.hh"

namespace avrolite {
  namespace json {

    /* Returns s as a quoted JSON string literal. With binary set, every byte is taken as a code point of its own and bytes outside
       the printable ASCII range are written as \u00XX escapes; otherwise the text is passed through as UTF-8.*/
    std::string quote(const std::string& s, bool binary = false);

    std::string quote(const uint8_t* b, size_t len, bool binary);

    /* Converts text whose code points are all below 256 into one byte per code point. Returns false, leaving out unspecified, for
       malformed UTF-8 or a larger code point.*/
    bool toLatin1(const std::string& text, std::vector<uint8_t>& out);

    /* Shortest decimal text that reads back as the same double*/
    std::string formatDouble(double d);

    /* Shortest decimal text that reads back as the same float*/
    std::string formatFloat(float f);

    /* A pull tokenizer for JSON text. The parser validates the structure of the text as it goes: misplaced commas, colons or closing
       brackets, bad literals and bad escapes are reported as FormatException. Several top level values may follow one another.*/
    class JsonParser : boost::noncopyable {
    public:

      enum Token {
        tkNull,
        tkBool,
        tkLong,
        tkDouble,
        tkString,
        tkArrayStart,
        tkArrayEnd,
        tkObjectStart,
        tkObjectEnd
      };

      static const char* toString(Token tk);

    private:

      enum State {
        stStart,
        stArray0,
        stArrayN,
        stObject0,
        stObjectN,
        stKey
      };

      StreamReader in_;
      bool hasNext_;
      char nextChar_;
      bool peeked_;
      size_t line_;

      State curState_;
      std::stack<State> stateStack_;

      Token curToken_;
      bool bv_;
      int64_t lv_;
      double dv_;
      std::string sv_;

      bool readChar(char& ch);
      char next();
      Token doAdvance();
      Token value(char ch);
      Token key(char ch);
      Token tryNumber(char ch);
      void expectLiteral(const char* rest);
      std::string readString();
      uint32_t readHex4();
      void popState();
      FormatException unexpected(char ch) const;

    public:

      JsonParser() : hasNext_(false), nextChar_(0), peeked_(false), line_(1),
      curState_(stStart), curToken_(tkNull), bv_(false), lv_(0), dv_(0) { }

      /* Starts reading from is, discarding any state from a previous input.*/
      void init(InputStream& is);

      /* Consumes and returns the next token*/
      Token advance();

      /* Returns the next token without consuming it. The value accessors reflect the peeked token.*/
      Token peek();

      /* Consumes the next token. Throws ResolutionException if it is not tk.*/
      void expectToken(Token tk);

      /* True if nothing but whitespace remains in the input*/
      bool atEnd();

      /* Hands the bytes read ahead back to the input stream and forgets any peeked token*/
      void drain();

      bool boolValue() const {
        return bv_;
      }

      int64_t longValue() const {
        return lv_;
      }

      double doubleValue() const {
        return dv_;
      }

      const std::string& stringValue() const {
        return sv_;
      }

      size_t line() const {
        return line_;
      }
    };

    /* Formatter that writes JSON without any whitespace*/
    class JsonNullFormatter {
    public:

      JsonNullFormatter(StreamWriter&) { }

      void handleObjectStart() { }

      void handleObjectEnd() { }

      void handleValueEnd() { }

      void handleColon() { }
    };

    /* Formatter that writes one member per line, indented by two spaces per level*/
    class JsonPrettyFormatter {
      StreamWriter& out_;
      size_t level_;

      void indent() {
        out_.write('\n');
        for (size_t i = 0; i < level_; ++i) {
          out_.write(' ');
          out_.write(' ');
        }
      }

    public:

      JsonPrettyFormatter(StreamWriter& out) : out_(out), level_(0) { }

      void handleObjectStart() {
        ++level_;
        indent();
      }

      void handleObjectEnd() {
        --level_;
        indent();
      }

      void handleValueEnd() {
        indent();
      }

      void handleColon() {
        out_.write(' ');
      }
    };

    /* Writes JSON text into an OutputStream. Strings written directly inside an object alternate between keys and values.*/
    template <class F>
    class JsonGenerator : boost::noncopyable {
      StreamWriter out_;
      F formatter_;

      enum State {
        stStart,
        stArray0,
        stArrayN,
        stMap0,
        stMapN,
        stKey
      };

      std::stack<State> stateStack_;
      State top_;
      bool topValueWritten_;

      void writeText(const std::string& s) {
        out_.writeBytes(reinterpret_cast<const uint8_t*> (s.data()), s.size());
      }

      void sep() {
        if (top_ == stArrayN) {
          out_.write(',');
          formatter_.handleValueEnd();
        } else if (top_ == stArray0) {
          top_ = stArrayN;
        } else if (top_ == stStart) {
          /* consecutive top level values*/
          if (topValueWritten_) {
            out_.write(' ');
          }
          topValueWritten_ = true;
        }
      }

      void sep2() {
        if (top_ == stKey) {
          top_ = stMapN;
        }
      }

      void pushState(State s) {
        stateStack_.push(top_);
        top_ = s;
      }

      void popState() {
        if (stateStack_.empty()) {
          throw Exception("Unbalanced end of JSON array or object");
        }
        top_ = stateStack_.top();
        stateStack_.pop();
      }

      void doEncodeString(const uint8_t* b, size_t len, bool binary) {
        if (top_ == stMap0) {
          top_ = stKey;
        } else if (top_ == stMapN) {
          out_.write(',');
          formatter_.handleValueEnd();
          top_ = stKey;
        } else if (top_ == stKey) {
          top_ = stMapN;
        } else {
          sep();
        }
        writeText(quote(b, len, binary));
        if (top_ == stKey) {
          out_.write(':');
          formatter_.handleColon();
        }
      }

    public:

      JsonGenerator() : formatter_(out_), top_(stStart), topValueWritten_(false) { }

      void init(OutputStream& os) {
        out_.reset(os);
        while (!stateStack_.empty()) {
          stateStack_.pop();
        }
        top_ = stStart;
        topValueWritten_ = false;
      }

      void flush() {
        out_.flush();
      }

      int64_t byteCount() const {
        return out_.byteCount();
      }

      void encodeString(const std::string& s) {
        doEncodeString(reinterpret_cast<const uint8_t*> (s.data()), s.size(), false);
      }

      void encodeBinary(const uint8_t* bytes, size_t len) {
        doEncodeString(bytes, len, true);
      }

      void encodeNull() {
        sep();
        writeText("null");
        sep2();
      }

      void encodeBool(bool b) {
        sep();
        writeText(b ? "true" : "false");
        sep2();
      }

      void encodeNumber(int32_t i) {
        sep();
        writeText(std::to_string(i));
        sep2();
      }

      void encodeNumber(int64_t l) {
        sep();
        writeText(std::to_string(l));
        sep2();
      }

      void encodeNumber(float f) {
        sep();
        writeText(formatFloat(f));
        sep2();
      }

      void encodeNumber(double d) {
        sep();
        writeText(formatDouble(d));
        sep2();
      }

      void arrayStart() {
        sep();
        pushState(stArray0);
        out_.write('[');
        formatter_.handleObjectStart();
      }

      void arrayEnd() {
        popState();
        formatter_.handleObjectEnd();
        out_.write(']');
        sep2();
      }

      void objectStart() {
        sep();
        pushState(stMap0);
        out_.write('{');
        formatter_.handleObjectStart();
      }

      void objectEnd() {
        popState();
        formatter_.handleObjectEnd();
        out_.write('}');
        sep2();
      }
    };

  }
}

#endif
