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

#include <string>
#include <map>
#include <algorithm>
#include <iterator>
#include <limits>
#include <memory>

#include "ValidatingCodec.hh"
#include "Symbol.hh"
#include "ValidSchema.hh"
#include "Decoder.hh"
#include "Encoder.hh"
#include "GenericDatum.hh"
#include "NodeImpl.hh"
#include "../Debug.hh"

#include "../json/JsonIO.hh"

namespace avrolite {

  namespace parsing {

    using std::make_shared;

    using std::map;
    using std::vector;
    using std::string;
    using std::reverse;

    using avrolite::json::JsonParser;
    using avrolite::json::JsonGenerator;

    /* The grammar of the JSON encoding. Records carry actions for the object braces and one per field, enums and unions carry the
       list of names they are written with, and every non-null union branch ends with the brace that closes its wrapper object.*/
    class JsonGrammarGenerator : public ValidatingGrammarGenerator {
      ProductionPtr doGenerate(const NodePtr& n, std::map<NodePtr, ProductionPtr> &m);
    };

    /* The key a union branch is written under*/
    static string nameOf(const NodePtr& node) {
      NodePtr n = followSymbol(node);
      if (n->hasName()) {
        return n->name().fullname();
      }
      return avrolite::toString(n->type());
    }

    ProductionPtr JsonGrammarGenerator::doGenerate(const NodePtr& n,
      std::map<NodePtr, ProductionPtr> &m) {
      switch (n->type()) {
        case Type::AVRO_RECORD:
        {
          ProductionPtr result = make_shared<Production>();

          m.erase(n);

          size_t c = n->leaves();
          result->reserve(2 + 2 * c);
          result->push_back(Symbol::recordStartSymbol());
          for (size_t i = 0; i < c; ++i) {
            ProductionPtr v = doGenerate(n->leafAt(i), m);
            result->push_back(Symbol::fieldSymbol(n, i));
            copy(v->rbegin(), v->rend(), back_inserter(*result));
          }
          result->push_back(Symbol::recordEndSymbol());
          reverse(result->begin(), result->end());

          m[n] = result;
          return make_shared<Production>(1, Symbol::indirect(result));
        }
        case Type::AVRO_ENUM:
        {
          vector<string> names;
          size_t c = n->names();
          names.reserve(c);
          for (size_t i = 0; i < c; ++i) {
            names.push_back(n->nameAt(i));
          }
          ProductionPtr result = make_shared<Production>();
          result->push_back(Symbol::nameListSymbol(names));
          result->push_back(Symbol::enumSymbol());
          return result;
        }
        case Type::AVRO_UNION:
        {
          size_t c = n->leaves();

          vector<ProductionPtr> vv;
          vv.reserve(c);

          vector<string> names;
          names.reserve(c);

          for (size_t i = 0; i < c; ++i) {
            const NodePtr& leaf = n->leafAt(i);
            ProductionPtr v = doGenerate(leaf, m);
            if (followSymbol(leaf)->type() != Type::AVRO_NULL) {
              ProductionPtr v2 = make_shared<Production>();
              v2->push_back(Symbol::unionEndSymbol());
              copy(v->begin(), v->end(), back_inserter(*v2));
              v = v2;
            }
            vv.push_back(v);
            names.push_back(nameOf(leaf));
          }
          ProductionPtr result = make_shared<Production>();
          result->push_back(Symbol::alternative(vv));
          result->push_back(Symbol::nameListSymbol(names));
          result->push_back(Symbol::unionSymbol());
          return result;
        }
        default:
          return ValidatingGrammarGenerator::doGenerate(n, m);
      }
    }

    struct JsonToken {
      JsonParser::Token tk;
      bool bv;
      int64_t lv;
      double dv;
      string sv;

      JsonToken() : tk(JsonParser::tkNull), bv(false), lv(0), dv(0) { }
    };

    typedef vector<JsonToken> JsonTokens;
    typedef std::shared_ptr<JsonTokens> JsonTokensPtr;

    /* Tokens come either straight from the text or, while a buffered record field is being read, from the tokens captured for
       that field. Replays nest: a record inside a buffered field buffers its own fields out of the enclosing replay.*/
    class JsonTokenSource {
      struct Replay {
        JsonTokensPtr tokens;
        size_t pos;

        Replay(const JsonTokensPtr& t) : tokens(t), pos(0) { }
      };

      JsonParser in_;
      vector<Replay> replay_;
      JsonToken cur_;

      Replay& currentReplay() {
        Replay& r = replay_.back();
        if (r.pos >= r.tokens->size()) {
          throw ResolutionException("Field value ended before the schema expected");
        }
        return r;
      }

    public:

      void init(InputStream& is) {
        in_.init(is);
        replay_.clear();
      }

      JsonParser::Token peek() {
        if (!replay_.empty()) {
          Replay& r = currentReplay();
          return (*r.tokens)[r.pos].tk;
        }
        return in_.peek();
      }

      JsonParser::Token advance() {
        if (!replay_.empty()) {
          Replay& r = currentReplay();
          cur_ = (*r.tokens)[r.pos++];
          return cur_.tk;
        }
        cur_.tk = in_.advance();
        switch (cur_.tk) {
          case JsonParser::tkBool:
            cur_.bv = in_.boolValue();
            break;
          case JsonParser::tkLong:
            cur_.lv = in_.longValue();
            break;
          case JsonParser::tkDouble:
            cur_.dv = in_.doubleValue();
            break;
          case JsonParser::tkString:
            cur_.sv = in_.stringValue();
            break;
          default:
            break;
        }
        return cur_.tk;
      }

      void expectToken(JsonParser::Token tk) {
        JsonParser::Token t = advance();
        if (t != tk) {
          throw ResolutionException(boost::format("Incorrect token in the stream. Expected: %1%, found %2%")
            % JsonParser::toString(tk) % JsonParser::toString(t));
        }
      }

      /* Consumes one complete value and appends its tokens to out*/
      void captureValue(JsonTokens& out) {
        size_t level = 0;
        do {
          JsonParser::Token t = advance();
          out.push_back(cur_);
          if (t == JsonParser::tkArrayStart || t == JsonParser::tkObjectStart) {
            ++level;
          } else if (t == JsonParser::tkArrayEnd || t == JsonParser::tkObjectEnd) {
            --level;
          }
        } while (level > 0);
      }

      /* Consumes the rest of an array or object whose opening token has been read*/
      void skipComposite() {
        size_t level = 1;
        while (level > 0) {
          switch (advance()) {
            case JsonParser::tkArrayStart:
            case JsonParser::tkObjectStart:
              ++level;
              break;
            case JsonParser::tkArrayEnd:
            case JsonParser::tkObjectEnd:
              --level;
              break;
            default:
              break;
          }
        }
      }

      void pushReplay(const JsonTokensPtr& tokens) {
        replay_.push_back(Replay(tokens));
      }

      void popReplay() {
        const Replay& r = replay_.back();
        if (r.pos != r.tokens->size()) {
          throw ResolutionException("Field value has more content than its schema allows");
        }
        replay_.pop_back();
      }

      void drain() {
        in_.drain();
      }

      bool boolValue() const {
        return cur_.bv;
      }

      int64_t longValue() const {
        return cur_.lv;
      }

      double doubleValue() const {
        return cur_.dv;
      }

      const string& stringValue() const {
        return cur_.sv;
      }
    };

    static string latin1ToUtf8(const vector<uint8_t>& b) {
      string result;
      result.reserve(b.size());
      for (vector<uint8_t>::const_iterator it = b.begin(); it != b.end(); ++it) {
        if (*it < 0x80) {
          result.push_back(static_cast<char> (*it));
        } else {
          result.push_back(static_cast<char> (0xc0 | (*it >> 6)));
          result.push_back(static_cast<char> (0x80 | (*it & 0x3f)));
        }
      }
      return result;
    }

    static void push(JsonTokens& out, JsonParser::Token tk) {
      out.push_back(JsonToken());
      out.back().tk = tk;
    }

    static void pushString(JsonTokens& out, const string& s) {
      push(out, JsonParser::tkString);
      out.back().sv = s;
    }

    /* The tokens the JSON encoding of a field default would have*/
    static void defaultTokens(const GenericDatum& d, const NodePtr& schema, JsonTokens& out) {
      NodePtr s = followSymbol(schema);
      if (s->type() == Type::AVRO_UNION) {
        NodePtr branch = followSymbol(s->leafAt(d.unionBranch()));
        if (branch->type() == Type::AVRO_NULL) {
          push(out, JsonParser::tkNull);
        } else {
          push(out, JsonParser::tkObjectStart);
          pushString(out, nameOf(branch));
          defaultTokens(d, branch, out);
          push(out, JsonParser::tkObjectEnd);
        }
        return;
      }

      switch (s->type()) {
        case Type::AVRO_NULL:
          push(out, JsonParser::tkNull);
          break;
        case Type::AVRO_BOOL:
          push(out, JsonParser::tkBool);
          out.back().bv = d.value<bool>();
          break;
        case Type::AVRO_INT:
          push(out, JsonParser::tkLong);
          out.back().lv = d.value<int32_t>();
          break;
        case Type::AVRO_LONG:
          push(out, JsonParser::tkLong);
          out.back().lv = d.value<int64_t>();
          break;
        case Type::AVRO_FLOAT:
          push(out, JsonParser::tkDouble);
          out.back().dv = d.value<float>();
          break;
        case Type::AVRO_DOUBLE:
          push(out, JsonParser::tkDouble);
          out.back().dv = d.value<double>();
          break;
        case Type::AVRO_STRING:
          pushString(out, d.value<string>());
          break;
        case Type::AVRO_BYTES:
          pushString(out, latin1ToUtf8(d.value<vector<uint8_t> >()));
          break;
        case Type::AVRO_FIXED:
          pushString(out, latin1ToUtf8(d.value<GenericFixed>().value()));
          break;
        case Type::AVRO_ENUM:
          pushString(out, d.value<GenericEnum>().symbol());
          break;
        case Type::AVRO_ARRAY:
        {
          const GenericArray::Value& v = d.value<GenericArray>().value();
          push(out, JsonParser::tkArrayStart);
          for (GenericArray::Value::const_iterator it = v.begin(); it != v.end(); ++it) {
            defaultTokens(*it, s->leafAt(0), out);
          }
          push(out, JsonParser::tkArrayEnd);
        }
          break;
        case Type::AVRO_MAP:
        {
          const GenericMap::Value& v = d.value<GenericMap>().value();
          push(out, JsonParser::tkObjectStart);
          for (GenericMap::Value::const_iterator it = v.begin(); it != v.end(); ++it) {
            pushString(out, it->first);
            defaultTokens(it->second, s->leafAt(1), out);
          }
          push(out, JsonParser::tkObjectEnd);
        }
          break;
        case Type::AVRO_RECORD:
        {
          const GenericRecord& r = d.value<GenericRecord>();
          push(out, JsonParser::tkObjectStart);
          for (size_t i = 0; i < r.fieldCount(); ++i) {
            pushString(out, s->nameAt(i));
            defaultTokens(r.fieldAt(i), s->leafAt(i), out);
          }
          push(out, JsonParser::tkObjectEnd);
        }
          break;
        default:
          throw Exception(boost::format("Cannot write a default of type %1%") % s->type());
      }
    }

    /* Reads a JSON object for a record in one go, keeping the tokens of each member, and then serves the members in the order the
       record declares its fields. Members the record does not declare are dropped; missing ones come from the field default.*/
    class JsonDecoderHandler {
      struct BufferedRecord {
        map<string, JsonTokensPtr> fields;
        bool fieldActive;

        BufferedRecord() : fieldActive(false) { }
      };

      JsonTokenSource& in_;
      vector<BufferedRecord> records_;

      void bufferRecord() {
        in_.expectToken(JsonParser::tkObjectStart);
        records_.push_back(BufferedRecord());
        BufferedRecord& r = records_.back();
        while (in_.peek() != JsonParser::tkObjectEnd) {
          in_.expectToken(JsonParser::tkString);
          string key = in_.stringValue();
          JsonTokensPtr value = make_shared<JsonTokens>();
          in_.captureValue(*value);
          r.fields[key] = value;
        }
        in_.advance();
        DEBUG_OUT("Buffered " << r.fields.size() << " members of a record");
      }

      void endField() {
        BufferedRecord& r = records_.back();
        if (r.fieldActive) {
          in_.popReplay();
          r.fieldActive = false;
        }
      }

      JsonTokensPtr findField(const BufferedRecord& r, const FieldRef& f) {
        map<string, JsonTokensPtr>::const_iterator it = r.fields.find(f.name());
        if (it != r.fields.end()) {
          return it->second;
        }
        const vector<string>& aliases = f.record->fieldAliasesAt(f.index);
        for (vector<string>::const_iterator a = aliases.begin(); a != aliases.end(); ++a) {
          it = r.fields.find(*a);
          if (it != r.fields.end()) {
            return it->second;
          }
        }
        if (f.record->hasDefaultAt(f.index)) {
          JsonTokensPtr result = make_shared<JsonTokens>();
          defaultTokens(f.record->defaultValueAt(f.index), f.record->leafAt(f.index), *result);
          return result;
        }
        throw ResolutionException(boost::format("No value for field %1% of record %2%")
          % f.name() % f.record->name());
      }

    public:

      JsonDecoderHandler(JsonTokenSource& in) : in_(in) { }

      size_t handle(const Symbol& s) {
        switch (s.kind()) {
          case Symbol::sRecordStart:
            bufferRecord();
            break;
          case Symbol::sField:
          {
            if (records_.empty()) {
              throw Exception("Record field outside of a record");
            }
            endField();
            JsonTokensPtr tokens = findField(records_.back(), *s.extrap<FieldRef>());
            in_.pushReplay(tokens);
            records_.back().fieldActive = true;
          }
            break;
          case Symbol::sRecordEnd:
            if (records_.empty()) {
              throw Exception("Record end outside of a record");
            }
            endField();
            records_.pop_back();
            break;
          case Symbol::sUnionEnd:
            in_.expectToken(JsonParser::tkObjectEnd);
            break;
          default:
            break;
        }
        return 0;
      }

      void reset() {
        records_.clear();
      }
    };

    template <typename P>
    class JsonDecoder : public Decoder {
      JsonTokenSource in_;
      JsonDecoderHandler handler_;
      P parser_;

      void init(InputStream& is);
      void decodeNull();
      bool decodeBool();
      int32_t decodeInt();
      int64_t decodeLong();
      float decodeFloat();
      double decodeDouble();
      void decodeString(string& value);
      void skipString();
      void decodeBytes(vector<uint8_t>& value);
      void skipBytes();
      void decodeFixed(size_t n, vector<uint8_t>& value);
      void skipFixed(size_t n);
      size_t decodeEnum();
      size_t arrayStart();
      size_t arrayNext();
      size_t skipArray();
      size_t mapStart();
      size_t mapNext();
      size_t skipMap();
      size_t decodeUnionIndex();
      void drain();

      void expect(JsonParser::Token tk);
      double readReal();
      void readLatin1(vector<uint8_t>& value);
      size_t nextItem(JsonParser::Token end, Symbol::Kind endSymbol);

    public:

      JsonDecoder(const ValidSchema& s) :
      handler_(in_),
      parser_(JsonGrammarGenerator().generate(s), NULL, handler_) { }

    };

    template <typename P>
    void JsonDecoder<P>::init(InputStream& is) {
      parser_.reset();
      handler_.reset();
      in_.init(is);
    }

    template <typename P>
    void JsonDecoder<P>::expect(JsonParser::Token tk) {
      in_.expectToken(tk);
    }

    template <typename P>
    void JsonDecoder<P>::decodeNull() {
      parser_.advance(Symbol::sNull);
      expect(JsonParser::tkNull);
    }

    template <typename P>
    bool JsonDecoder<P>::decodeBool() {
      parser_.advance(Symbol::sBool);
      expect(JsonParser::tkBool);
      return in_.boolValue();
    }

    template <typename P>
    int32_t JsonDecoder<P>::decodeInt() {
      parser_.advance(Symbol::sInt);
      expect(JsonParser::tkLong);
      int64_t result = in_.longValue();
      if (result < std::numeric_limits<int32_t>::min() || result > std::numeric_limits<int32_t>::max()) {
        throw ResolutionException(boost::format("Value out of range for Avro int: %1%") % result);
      }
      return static_cast<int32_t> (result);
    }

    template <typename P>
    int64_t JsonDecoder<P>::decodeLong() {
      parser_.advance(Symbol::sLong);
      expect(JsonParser::tkLong);
      return in_.longValue();
    }

    /* A JSON number, or one of the strings standing for a special value*/
    template <typename P>
    double JsonDecoder<P>::readReal() {
      JsonParser::Token tk = in_.advance();
      switch (tk) {
        case JsonParser::tkLong:
          return static_cast<double> (in_.longValue());
        case JsonParser::tkDouble:
          return in_.doubleValue();
        case JsonParser::tkString:
        {
          const string& s = in_.stringValue();
          if (s == "NaN") {
            return std::numeric_limits<double>::quiet_NaN();
          } else if (s == "Infinity" || s == "INF") {
            return std::numeric_limits<double>::infinity();
          } else if (s == "-Infinity" || s == "-INF") {
            return -std::numeric_limits<double>::infinity();
          }
          throw ResolutionException(boost::format("Not a number: \"%1%\"") % s);
        }
        default:
          throw ResolutionException(boost::format("Incorrect token in the stream. Expected: number, found %1%")
            % JsonParser::toString(tk));
      }
    }

    template <typename P>
    float JsonDecoder<P>::decodeFloat() {
      parser_.advance(Symbol::sFloat);
      return static_cast<float> (readReal());
    }

    template <typename P>
    double JsonDecoder<P>::decodeDouble() {
      parser_.advance(Symbol::sDouble);
      return readReal();
    }

    template <typename P>
    void JsonDecoder<P>::decodeString(string& value) {
      parser_.advance(Symbol::sString);
      expect(JsonParser::tkString);
      value = in_.stringValue();
    }

    template <typename P>
    void JsonDecoder<P>::skipString() {
      parser_.advance(Symbol::sString);
      expect(JsonParser::tkString);
    }

    template <typename P>
    void JsonDecoder<P>::readLatin1(vector<uint8_t>& value) {
      expect(JsonParser::tkString);
      if (!json::toLatin1(in_.stringValue(), value)) {
        throw ResolutionException("Binary value has a character outside of 0-255");
      }
    }

    template <typename P>
    void JsonDecoder<P>::decodeBytes(vector<uint8_t>& value) {
      parser_.advance(Symbol::sBytes);
      readLatin1(value);
    }

    template <typename P>
    void JsonDecoder<P>::skipBytes() {
      parser_.advance(Symbol::sBytes);
      expect(JsonParser::tkString);
    }

    template <typename P>
    void JsonDecoder<P>::decodeFixed(size_t n, vector<uint8_t>& value) {
      parser_.advance(Symbol::sFixed);
      parser_.assertSize(n);
      readLatin1(value);
      if (value.size() != n) {
        throw ResolutionException(boost::format("Incorrect size for fixed: expected %1%, found %2%") % n % value.size());
      }
    }

    template <typename P>
    void JsonDecoder<P>::skipFixed(size_t n) {
      parser_.advance(Symbol::sFixed);
      parser_.assertSize(n);
      expect(JsonParser::tkString);
    }

    template <typename P>
    size_t JsonDecoder<P>::decodeEnum() {
      parser_.advance(Symbol::sEnum);
      expect(JsonParser::tkString);
      return parser_.indexForName(in_.stringValue());
    }

    /* Items come one at a time: the repeater is armed for one more item unless the closing token follows*/
    template <typename P>
    size_t JsonDecoder<P>::nextItem(JsonParser::Token end, Symbol::Kind endSymbol) {
      if (in_.peek() == end) {
        in_.advance();
        parser_.popRepeater();
        parser_.advance(endSymbol);
        return 0;
      }
      parser_.setRepeatCount(1);
      return 1;
    }

    template <typename P>
    size_t JsonDecoder<P>::arrayStart() {
      parser_.advance(Symbol::sArrayStart);
      expect(JsonParser::tkArrayStart);
      return nextItem(JsonParser::tkArrayEnd, Symbol::sArrayEnd);
    }

    template <typename P>
    size_t JsonDecoder<P>::arrayNext() {
      parser_.processImplicitActions();
      return nextItem(JsonParser::tkArrayEnd, Symbol::sArrayEnd);
    }

    template <typename P>
    size_t JsonDecoder<P>::skipArray() {
      parser_.advance(Symbol::sArrayStart);
      parser_.pop();
      parser_.advance(Symbol::sArrayEnd);
      expect(JsonParser::tkArrayStart);
      in_.skipComposite();
      return 0;
    }

    template <typename P>
    size_t JsonDecoder<P>::mapStart() {
      parser_.advance(Symbol::sMapStart);
      expect(JsonParser::tkObjectStart);
      return nextItem(JsonParser::tkObjectEnd, Symbol::sMapEnd);
    }

    template <typename P>
    size_t JsonDecoder<P>::mapNext() {
      parser_.processImplicitActions();
      return nextItem(JsonParser::tkObjectEnd, Symbol::sMapEnd);
    }

    template <typename P>
    size_t JsonDecoder<P>::skipMap() {
      parser_.advance(Symbol::sMapStart);
      parser_.pop();
      parser_.advance(Symbol::sMapEnd);
      expect(JsonParser::tkObjectStart);
      in_.skipComposite();
      return 0;
    }

    template <typename P>
    size_t JsonDecoder<P>::decodeUnionIndex() {
      parser_.advance(Symbol::sUnion);

      size_t result;
      if (in_.peek() == JsonParser::tkNull) {
        result = parser_.indexForName("null");
      } else {
        expect(JsonParser::tkObjectStart);
        expect(JsonParser::tkString);
        result = parser_.indexForName(in_.stringValue());
      }
      parser_.selectBranch(result);
      return result;
    }

    template <typename P>
    void JsonDecoder<P>::drain() {
      parser_.processImplicitActions();
      in_.drain();
    }

    template<typename F>
    class JsonHandler {
      JsonGenerator<F>& generator_;
      const bool includeNamespace_;
    public:

      JsonHandler(JsonGenerator<F>& g, bool includeNamespace) :
      generator_(g), includeNamespace_(includeNamespace) { }

      size_t handle(const Symbol& s) {
        switch (s.kind()) {
          case Symbol::sRecordStart:
            generator_.objectStart();
            break;
          case Symbol::sRecordEnd:
            generator_.objectEnd();
            break;
          case Symbol::sField:
            generator_.encodeString(s.extrap<FieldRef>()->name());
            break;
          case Symbol::sUnionEnd:
            if (includeNamespace_) {
              generator_.objectEnd();
            }
            break;
          default:
            break;
        }
        return 0;
      }
    };

    template <typename P, typename F>
    class JsonEncoder : public Encoder {
      JsonGenerator<F> out_;
      JsonHandler<F> handler_;
      P parser_;
      const bool includeNamespace_;

      void init(OutputStream& os);
      void flush();
      int64_t byteCount() const;
      void encodeNull();
      void encodeBool(bool b);
      void encodeInt(int32_t i);
      void encodeLong(int64_t l);
      void encodeFloat(float f);
      void encodeDouble(double d);
      void encodeString(const std::string& s);
      void encodeBytes(const uint8_t *bytes, size_t len);
      void encodeFixed(const uint8_t *bytes, size_t len);
      void encodeEnum(size_t e);
      void arrayStart();
      void arrayEnd();
      void mapStart();
      void mapEnd();
      void setItemCount(size_t count);
      void startItem();
      void encodeUnionIndex(size_t e);
    public:

      JsonEncoder(const ValidSchema& schema, bool includeNamespace) :
      handler_(out_, includeNamespace),
      parser_(JsonGrammarGenerator().generate(schema), NULL, handler_),
      includeNamespace_(includeNamespace) { }
    };

    template<typename P, typename F>
    void JsonEncoder<P, F>::init(OutputStream& os) {
      parser_.reset();
      out_.init(os);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::flush() {
      parser_.processImplicitActions();
      out_.flush();
    }

    template<typename P, typename F>
    int64_t JsonEncoder<P, F>::byteCount() const {
      return out_.byteCount();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeNull() {
      parser_.advance(Symbol::sNull);
      out_.encodeNull();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeBool(bool b) {
      parser_.advance(Symbol::sBool);
      out_.encodeBool(b);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeInt(int32_t i) {
      parser_.advance(Symbol::sInt);
      out_.encodeNumber(i);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeLong(int64_t l) {
      parser_.advance(Symbol::sLong);
      out_.encodeNumber(l);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeFloat(float f) {
      parser_.advance(Symbol::sFloat);
      out_.encodeNumber(f);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeDouble(double d) {
      parser_.advance(Symbol::sDouble);
      out_.encodeNumber(d);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeString(const std::string& s) {
      parser_.advance(Symbol::sString);
      out_.encodeString(s);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeBytes(const uint8_t *bytes, size_t len) {
      parser_.advance(Symbol::sBytes);
      out_.encodeBinary(bytes, len);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeFixed(const uint8_t *bytes, size_t len) {
      parser_.advance(Symbol::sFixed);
      parser_.assertSize(len);
      out_.encodeBinary(bytes, len);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeEnum(size_t e) {
      parser_.advance(Symbol::sEnum);
      out_.encodeString(parser_.nameForIndex(e));
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::arrayStart() {
      parser_.advance(Symbol::sArrayStart);
      out_.arrayStart();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::arrayEnd() {
      parser_.popRepeater();
      parser_.advance(Symbol::sArrayEnd);
      out_.arrayEnd();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::mapStart() {
      parser_.advance(Symbol::sMapStart);
      out_.objectStart();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::mapEnd() {
      parser_.popRepeater();
      parser_.advance(Symbol::sMapEnd);
      out_.objectEnd();
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::setItemCount(size_t count) {
      parser_.setRepeatCount(count);
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::startItem() {
      parser_.processImplicitActions();
      if (parser_.top() != Symbol::sRepeater) {
        throw ResolutionException("startItem at not an item boundary");
      }
    }

    template<typename P, typename F>
    void JsonEncoder<P, F>::encodeUnionIndex(size_t e) {
      parser_.advance(Symbol::sUnion);

      string name = parser_.nameForIndex(e);
      parser_.selectBranch(e);
      if (name != "null" && includeNamespace_) {
        out_.objectStart();
        out_.encodeString(name);
      }
    }

  } // namespace parsing

  DecoderPtr jsonDecoder(const ValidSchema& s) {
    return std::make_shared<parsing::JsonDecoder<
      parsing::SimpleParser<parsing::JsonDecoderHandler> > >(s);
  }

  EncoderPtr jsonEncoder(const ValidSchema& schema) {
    return jsonEncoder(schema, JsonEncoderOptions());
  }

  EncoderPtr jsonPrettyEncoder(const ValidSchema& schema) {
    JsonEncoderOptions options;
    options.pretty = true;
    return jsonEncoder(schema, options);
  }

  EncoderPtr jsonEncoder(const ValidSchema& schema, const JsonEncoderOptions& options) {
    if (options.pretty) {
      return std::make_shared<parsing::JsonEncoder<
        parsing::SimpleParser<parsing::JsonHandler<json::JsonPrettyFormatter> >,
        json::JsonPrettyFormatter> >(schema, options.includeNamespace);
    }
    return std::make_shared<parsing::JsonEncoder<
      parsing::SimpleParser<parsing::JsonHandler<json::JsonNullFormatter> >,
      json::JsonNullFormatter> >(schema, options.includeNamespace);
  }

}
