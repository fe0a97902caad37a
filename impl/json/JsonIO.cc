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
#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <boost/math/special_functions/fpclassify.hpp>

#include "JsonIO.hh"

namespace avrolite {
  namespace json {

    using std::string;

    static const char hexDigits[] = "0123456789abcdef";

    static void appendEscape(string& s, unsigned int c) {
      s += "\\u00";
      s.push_back(hexDigits[(c >> 4) & 0xf]);
      s.push_back(hexDigits[c & 0xf]);
    }

    string quote(const uint8_t* b, size_t len, bool binary) {
      string result;
      result.reserve(len + 2);
      result.push_back('"');
      for (const uint8_t* p = b; p != b + len; ++p) {
        switch (*p) {
          case '"':
            result += "\\\"";
            break;
          case '\\':
            result += "\\\\";
            break;
          case '\b':
            result += "\\b";
            break;
          case '\f':
            result += "\\f";
            break;
          case '\n':
            result += "\\n";
            break;
          case '\r':
            result += "\\r";
            break;
          case '\t':
            result += "\\t";
            break;
          default:
            if (*p < 0x20 || (binary && *p >= 0x7f)) {
              appendEscape(result, *p);
            } else {
              result.push_back(static_cast<char> (*p));
            }
        }
      }
      result.push_back('"');
      return result;
    }

    string quote(const string& s, bool binary) {
      return quote(reinterpret_cast<const uint8_t*> (s.data()), s.size(), binary);
    }

    bool toLatin1(const string& text, std::vector<uint8_t>& out) {
      out.clear();
      out.reserve(text.size());
      for (string::const_iterator it = text.begin(); it != text.end(); ++it) {
        uint8_t c = static_cast<uint8_t> (*it);
        if (c < 0x80) {
          out.push_back(c);
        } else if ((c & 0xe0) == 0xc0 && c <= 0xc3) {
          // two byte sequences starting with c2 or c3 cover 0x80-0xff
          if (++it == text.end() || (static_cast<uint8_t> (*it) & 0xc0) != 0x80 || c < 0xc2) {
            return false;
          }
          out.push_back(static_cast<uint8_t> (((c & 0x1f) << 6) | (static_cast<uint8_t> (*it) & 0x3f)));
        } else {
          return false;
        }
      }
      return true;
    }

    /* Non-finite values have no JSON number form; they are written as strings*/
    template <typename T>
    static bool nonFinite(T v, string& text) {
      if (boost::math::isnan(v)) {
        text = "\"NaN\"";
      } else if (boost::math::isinf(v)) {
        text = v > 0 ? "\"Infinity\"" : "\"-Infinity\"";
      } else {
        return false;
      }
      return true;
    }

    /* Keeps integral values recognizable as floating point*/
    static string withPoint(const char* buf) {
      string s(buf);
      if (s.find_first_of(".eE") == string::npos) {
        s += ".0";
      }
      return s;
    }

    string formatDouble(double d) {
      string text;
      if (nonFinite(d, text)) {
        return text;
      }
      char buf[40];
      for (int precision = 15; precision < 17; ++precision) {
        std::snprintf(buf, sizeof (buf), "%.*g", precision, d);
        if (std::strtod(buf, 0) == d) {
          return withPoint(buf);
        }
      }
      std::snprintf(buf, sizeof (buf), "%.17g", d);
      return withPoint(buf);
    }

    string formatFloat(float f) {
      string text;
      if (nonFinite(f, text)) {
        return text;
      }
      char buf[40];
      for (int precision = 6; precision < 9; ++precision) {
        std::snprintf(buf, sizeof (buf), "%.*g", precision, static_cast<double> (f));
        if (std::strtof(buf, 0) == f) {
          return withPoint(buf);
        }
      }
      std::snprintf(buf, sizeof (buf), "%.9g", static_cast<double> (f));
      return withPoint(buf);
    }

    const char* JsonParser::toString(Token tk) {
      switch (tk) {
        case tkNull: return "null";
        case tkBool: return "boolean";
        case tkLong: return "long";
        case tkDouble: return "double";
        case tkString: return "string";
        case tkArrayStart: return "array start";
        case tkArrayEnd: return "array end";
        case tkObjectStart: return "object start";
        case tkObjectEnd: return "object end";
      }
      return "unknown";
    }

    void JsonParser::init(InputStream& is) {
      in_.reset(is);
      hasNext_ = false;
      peeked_ = false;
      line_ = 1;
      curState_ = stStart;
      while (!stateStack_.empty()) {
        stateStack_.pop();
      }
    }

    bool JsonParser::readChar(char& ch) {
      if (hasNext_) {
        hasNext_ = false;
        ch = nextChar_;
        return true;
      }
      if (!in_.hasMore()) {
        return false;
      }
      ch = static_cast<char> (in_.read());
      return true;
    }

    char JsonParser::next() {
      char ch;
      for (;;) {
        if (!readChar(ch)) {
          throw FormatException(boost::format("Unexpected end of JSON input at line %1%") % line_);
        }
        if (ch == '\n') {
          ++line_;
        } else if (!isspace(static_cast<unsigned char> (ch))) {
          return ch;
        }
      }
    }

    bool JsonParser::atEnd() {
      if (peeked_) {
        return false;
      }
      char ch;
      for (;;) {
        if (!readChar(ch)) {
          return true;
        }
        if (ch == '\n') {
          ++line_;
        } else if (!isspace(static_cast<unsigned char> (ch))) {
          hasNext_ = true;
          nextChar_ = ch;
          return false;
        }
      }
    }

    void JsonParser::drain() {
      if (in_.in_ != 0) {
        in_.drain(hasNext_);
      }
      hasNext_ = false;
      peeked_ = false;
    }

    FormatException JsonParser::unexpected(char ch) const {
      return FormatException(boost::format("Unexpected character in JSON input at line %1%: '%2%'") % line_ % ch);
    }

    void JsonParser::popState() {
      curState_ = stateStack_.top();
      stateStack_.pop();
    }

    JsonParser::Token JsonParser::advance() {
      if (peeked_) {
        peeked_ = false;
        return curToken_;
      }
      return curToken_ = doAdvance();
    }

    JsonParser::Token JsonParser::peek() {
      if (!peeked_) {
        curToken_ = doAdvance();
        peeked_ = true;
      }
      return curToken_;
    }

    void JsonParser::expectToken(Token tk) {
      Token actual = advance();
      if (actual != tk) {
        throw ResolutionException(boost::format("Incorrect token in the stream. Expected: %1%, found %2%")
          % toString(tk) % toString(actual));
      }
    }

    JsonParser::Token JsonParser::doAdvance() {
      char ch = next();
      switch (curState_) {
        case stArray0:
          if (ch == ']') {
            popState();
            return tkArrayEnd;
          }
          curState_ = stArrayN;
          return value(ch);
        case stArrayN:
          if (ch == ']') {
            popState();
            return tkArrayEnd;
          }
          if (ch != ',') {
            throw unexpected(ch);
          }
          return value(next());
        case stObject0:
          if (ch == '}') {
            popState();
            return tkObjectEnd;
          }
          return key(ch);
        case stObjectN:
          if (ch == '}') {
            popState();
            return tkObjectEnd;
          }
          if (ch != ',') {
            throw unexpected(ch);
          }
          return key(next());
        case stKey:
          if (ch != ':') {
            throw unexpected(ch);
          }
          curState_ = stObjectN;
          return value(next());
        case stStart:
          return value(ch);
      }
      throw unexpected(ch);
    }

    JsonParser::Token JsonParser::key(char ch) {
      if (ch != '"') {
        throw unexpected(ch);
      }
      sv_ = readString();
      curState_ = stKey;
      return tkString;
    }

    JsonParser::Token JsonParser::value(char ch) {
      switch (ch) {
        case '[':
          stateStack_.push(curState_);
          curState_ = stArray0;
          return tkArrayStart;
        case '{':
          stateStack_.push(curState_);
          curState_ = stObject0;
          return tkObjectStart;
        case '"':
          sv_ = readString();
          return tkString;
        case 't':
          expectLiteral("rue");
          bv_ = true;
          return tkBool;
        case 'f':
          expectLiteral("alse");
          bv_ = false;
          return tkBool;
        case 'n':
          expectLiteral("ull");
          return tkNull;
        default:
          if (ch == '-' || isdigit(static_cast<unsigned char> (ch))) {
            return tryNumber(ch);
          }
          throw unexpected(ch);
      }
    }

    void JsonParser::expectLiteral(const char* rest) {
      for (const char* p = rest; *p != 0; ++p) {
        char ch;
        if (!readChar(ch)) {
          throw FormatException(boost::format("Unexpected end of JSON input at line %1%") % line_);
        }
        if (ch != *p) {
          throw unexpected(ch);
        }
      }
    }

    JsonParser::Token JsonParser::tryNumber(char ch) {
      string text(1, ch);
      bool isDouble = false;
      bool more;

      if (ch == '-') {
        if (!readChar(ch) || !isdigit(static_cast<unsigned char> (ch))) {
          throw FormatException(boost::format("Invalid number in JSON input at line %1%") % line_);
        }
        text.push_back(ch);
      }
      more = readChar(ch);
      if (text[text.size() - 1] == '0') {
        if (more && isdigit(static_cast<unsigned char> (ch))) {
          throw unexpected(ch);
        }
      } else {
        while (more && isdigit(static_cast<unsigned char> (ch))) {
          text.push_back(ch);
          more = readChar(ch);
        }
      }
      if (more && ch == '.') {
        isDouble = true;
        text.push_back(ch);
        if (!readChar(ch) || !isdigit(static_cast<unsigned char> (ch))) {
          throw FormatException(boost::format("Invalid fraction in JSON input at line %1%") % line_);
        }
        do {
          text.push_back(ch);
          more = readChar(ch);
        } while (more && isdigit(static_cast<unsigned char> (ch)));
      }
      if (more && (ch == 'e' || ch == 'E')) {
        isDouble = true;
        text.push_back(ch);
        if (!readChar(ch)) {
          throw FormatException(boost::format("Invalid exponent in JSON input at line %1%") % line_);
        }
        if (ch == '+' || ch == '-') {
          text.push_back(ch);
          if (!readChar(ch)) {
            throw FormatException(boost::format("Invalid exponent in JSON input at line %1%") % line_);
          }
        }
        if (!isdigit(static_cast<unsigned char> (ch))) {
          throw unexpected(ch);
        }
        do {
          text.push_back(ch);
          more = readChar(ch);
        } while (more && isdigit(static_cast<unsigned char> (ch)));
      }
      if (more) {
        hasNext_ = true;
        nextChar_ = ch;
      }

      if (!isDouble) {
        errno = 0;
        long long v = std::strtoll(text.c_str(), 0, 10);
        if (errno != ERANGE) {
          lv_ = v;
          dv_ = static_cast<double> (v);
          return tkLong;
        }
      }
      dv_ = std::strtod(text.c_str(), 0);
      return tkDouble;
    }

    uint32_t JsonParser::readHex4() {
      uint32_t result = 0;
      for (int i = 0; i < 4; ++i) {
        char ch;
        if (!readChar(ch)) {
          throw FormatException(boost::format("Unexpected end of JSON input at line %1%") % line_);
        }
        result <<= 4;
        if (ch >= '0' && ch <= '9') {
          result |= ch - '0';
        } else if (ch >= 'a' && ch <= 'f') {
          result |= ch - 'a' + 10;
        } else if (ch >= 'A' && ch <= 'F') {
          result |= ch - 'A' + 10;
        } else {
          throw FormatException(boost::format("Invalid hex digit in JSON escape at line %1%: '%2%'") % line_ % ch);
        }
      }
      return result;
    }

    static void appendUtf8(string& s, uint32_t c) {
      if (c < 0x80) {
        s.push_back(static_cast<char> (c));
      } else if (c < 0x800) {
        s.push_back(static_cast<char> (0xc0 | (c >> 6)));
        s.push_back(static_cast<char> (0x80 | (c & 0x3f)));
      } else if (c < 0x10000) {
        s.push_back(static_cast<char> (0xe0 | (c >> 12)));
        s.push_back(static_cast<char> (0x80 | ((c >> 6) & 0x3f)));
        s.push_back(static_cast<char> (0x80 | (c & 0x3f)));
      } else {
        s.push_back(static_cast<char> (0xf0 | (c >> 18)));
        s.push_back(static_cast<char> (0x80 | ((c >> 12) & 0x3f)));
        s.push_back(static_cast<char> (0x80 | ((c >> 6) & 0x3f)));
        s.push_back(static_cast<char> (0x80 | (c & 0x3f)));
      }
    }

    string JsonParser::readString() {
      string result;
      char ch;
      for (;;) {
        if (!readChar(ch)) {
          throw FormatException(boost::format("Unterminated string in JSON input at line %1%") % line_);
        }
        if (ch == '"') {
          return result;
        }
        if (static_cast<unsigned char> (ch) < 0x20) {
          throw FormatException(boost::format("Control character in JSON string at line %1%") % line_);
        }
        if (ch != '\\') {
          result.push_back(ch);
          continue;
        }
        if (!readChar(ch)) {
          throw FormatException(boost::format("Unterminated string in JSON input at line %1%") % line_);
        }
        switch (ch) {
          case '"':
          case '\\':
          case '/':
            result.push_back(ch);
            break;
          case 'b':
            result.push_back('\b');
            break;
          case 'f':
            result.push_back('\f');
            break;
          case 'n':
            result.push_back('\n');
            break;
          case 'r':
            result.push_back('\r');
            break;
          case 't':
            result.push_back('\t');
            break;
          case 'u':
          case 'U':
          {
            uint32_t c = readHex4();
            if (c >= 0xd800 && c < 0xdc00) {
              char b, u;
              if (!readChar(b) || !readChar(u) || b != '\\' || (u != 'u' && u != 'U')) {
                throw FormatException(boost::format("Unpaired surrogate in JSON string at line %1%") % line_);
              }
              uint32_t low = readHex4();
              if (low < 0xdc00 || low > 0xdfff) {
                throw FormatException(boost::format("Invalid surrogate pair in JSON string at line %1%") % line_);
              }
              c = 0x10000 + ((c - 0xd800) << 10) + (low - 0xdc00);
            } else if (c >= 0xdc00 && c <= 0xdfff) {
              throw FormatException(boost::format("Unpaired surrogate in JSON string at line %1%") % line_);
            }
            appendUtf8(result, c);
            break;
          }
          default:
            throw FormatException(boost::format("Invalid escape sequence in JSON string at line %1%: \\%2%") % line_ % ch);
        }
      }
    }

  }
}
