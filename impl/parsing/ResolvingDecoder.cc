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
#include <memory>

#include "ValidatingCodec.hh"
#include "Symbol.hh"
#include "Types.hh"
#include "ValidSchema.hh"
#include "Decoder.hh"
#include "Encoder.hh"
#include "NodeImpl.hh"
#include "Generic.hh"
#include "Stream.hh"
#include "../Debug.hh"

namespace avrolite {

  namespace parsing {

    using std::make_shared;
    using std::map;
    using std::pair;
    using std::vector;
    using std::string;
    using std::reverse;
    using std::make_pair;

    typedef pair<NodePtr, NodePtr> NodePair;

    /* Builds the grammar for reading data written with one schema as values of another. The grammar follows the writer's layout
       of the data; the reader sees the values in its own shape. Incompatibilities become error symbols, so they are reported
       only when data that needs them is actually read.*/
    class ResolvingGrammarGenerator : public ValidatingGrammarGenerator {
      ProductionPtr doGenerate2(const NodePtr& writer,
        const NodePtr& reader, map<NodePair, ProductionPtr> &m,
        map<NodePtr, ProductionPtr> &m2);
      ProductionPtr resolveRecords(const NodePtr& writer,
        const NodePtr& reader, map<NodePair, ProductionPtr> &m,
        map<NodePtr, ProductionPtr> &m2);
      ProductionPtr resolveUnion(const NodePtr& writer,
        const NodePtr& reader, map<NodePair, ProductionPtr> &m,
        map<NodePtr, ProductionPtr> &m2);

      static int bestBranch(const NodePtr& writer, const NodePtr& reader);

      ProductionPtr getWriterProduction(const NodePtr& n,
        map<NodePtr, ProductionPtr>& m2);

    public:
      Symbol generate(
        const ValidSchema& writer, const ValidSchema& reader);
    };

    static ProductionPtr errorProduction(const string& message) {
      DEBUG_OUT("Resolution error: " << message);
      return make_shared<Production>(1, Symbol::error(message));
    }

    static string describe(const NodePtr& n) {
      if (n->hasName()) {
        return avrolite::toString(n->type()) + " " + n->name().fullname();
      }
      return avrolite::toString(n->type());
    }

    Symbol ResolvingGrammarGenerator::generate(
      const ValidSchema& writer, const ValidSchema& reader) {
      map<NodePtr, ProductionPtr> m2;

      const NodePtr& rr = reader.root();
      const NodePtr& rw = writer.root();
      ProductionPtr backup = ValidatingGrammarGenerator::doGenerate(rw, m2);
      fixup(backup, m2);

      map<NodePair, ProductionPtr> m;
      ProductionPtr main = doGenerate2(rw, rr, m, m2);
      fixup(main, m);
      return Symbol::rootSymbol(main, backup);
    }

    /* The kind written for a writer type that is read as a promoted reader type, or sError if there is no such promotion*/
    static Symbol::Kind promotion(Type writer, Type reader) {
      switch (reader) {
        case Type::AVRO_LONG:
          if (writer == Type::AVRO_INT) {
            return Symbol::sInt;
          }
          break;
        case Type::AVRO_FLOAT:
          if (writer == Type::AVRO_INT) {
            return Symbol::sInt;
          } else if (writer == Type::AVRO_LONG) {
            return Symbol::sLong;
          }
          break;
        case Type::AVRO_DOUBLE:
          if (writer == Type::AVRO_INT) {
            return Symbol::sInt;
          } else if (writer == Type::AVRO_LONG) {
            return Symbol::sLong;
          } else if (writer == Type::AVRO_FLOAT) {
            return Symbol::sFloat;
          }
          break;
        case Type::AVRO_STRING:
          if (writer == Type::AVRO_BYTES) {
            return Symbol::sBytes;
          }
          break;
        case Type::AVRO_BYTES:
          if (writer == Type::AVRO_STRING) {
            return Symbol::sString;
          }
          break;
        default:
          break;
      }
      return Symbol::sError;
    }

    static Symbol::Kind readerKind(Type t) {
      switch (t) {
        case Type::AVRO_LONG:
          return Symbol::sLong;
        case Type::AVRO_FLOAT:
          return Symbol::sFloat;
        case Type::AVRO_DOUBLE:
          return Symbol::sDouble;
        case Type::AVRO_STRING:
          return Symbol::sString;
        case Type::AVRO_BYTES:
          return Symbol::sBytes;
        default:
          throw Exception(boost::format("No promotion to %1%") % t);
      }
    }

    /* The reader branch a non-union writer type is read into: an exact match first, then the first branch it promotes to*/
    int ResolvingGrammarGenerator::bestBranch(const NodePtr& writer,
      const NodePtr& reader) {
      Type t = writer->type();

      const size_t c = reader->leaves();
      for (size_t j = 0; j < c; ++j) {
        NodePtr r = followSymbol(reader->leafAt(j));
        if (t == r->type()) {
          if (r->hasName()) {
            if (namesMatch(*writer, *r)) {
              return j;
            }
          } else {
            return j;
          }
        }
      }

      for (size_t j = 0; j < c; ++j) {
        NodePtr r = followSymbol(reader->leafAt(j));
        if (promotion(t, r->type()) != Symbol::sError) {
          return j;
        }
      }
      return -1;
    }

    static std::shared_ptr<vector<uint8_t> > getAvroBinary(
      const GenericDatum& defaultValue) {
      EncoderPtr e = binaryEncoder();
      std::shared_ptr<OutputStream> os = memoryOutputStream();
      e->init(*os);
      GenericWriter::write(*e, defaultValue);
      e->flush();
      return snapshot(*os);
    }

    ProductionPtr ResolvingGrammarGenerator::getWriterProduction(
      const NodePtr& n, map<NodePtr, ProductionPtr>& m2) {
      const NodePtr nn = followSymbol(n);
      map<NodePtr, ProductionPtr>::const_iterator it2 = m2.find(nn);
      if (it2 != m2.end() && it2->second) {
        return it2->second;
      } else {
        ProductionPtr result = ValidatingGrammarGenerator::doGenerate(nn, m2);
        fixup(result, m2);
        return result;
      }
    }

    /* The writer field read as reader field j: same name first, then a name on either side listed among the other side's
       aliases. Returns -1 if there is none and -2 if more than one writer field qualifies.*/
    static int findWriterField(const NodePtr& writer, const NodePtr& reader, size_t j) {
      const string& name = reader->nameAt(j);
      size_t index;
      if (writer->nameIndex(name, index)) {
        return static_cast<int> (index);
      }

      const vector<string>& readerAliases = reader->fieldAliasesAt(j);
      int result = -1;
      size_t c = writer->names();
      for (size_t i = 0; i < c; ++i) {
        bool matches = std::find(readerAliases.begin(), readerAliases.end(), writer->nameAt(i)) != readerAliases.end();
        if (!matches) {
          const vector<string>& writerAliases = writer->fieldAliasesAt(i);
          matches = std::find(writerAliases.begin(), writerAliases.end(), name) != writerAliases.end();
        }
        if (matches) {
          if (result >= 0) {
            return -2;
          }
          result = static_cast<int> (i);
        }
      }
      return result;
    }

    ProductionPtr ResolvingGrammarGenerator::resolveRecords(
      const NodePtr& writer, const NodePtr& reader,
      map<NodePair, ProductionPtr>& m,
      map<NodePtr, ProductionPtr>& m2) {
      const size_t wc = writer->names();
      const size_t rc = reader->names();

      vector<int> readerFieldFor(wc, -1);
      vector<size_t> unmatched;
      for (size_t j = 0; j < rc; ++j) {
        int w = findWriterField(writer, reader, j);
        if (w == -2) {
          return errorProduction((boost::format("Field %1% of record %2% matches more than one writer field")
            % reader->nameAt(j) % reader->name()).str());
        } else if (w < 0) {
          if (!reader->hasDefaultAt(j)) {
            return errorProduction((boost::format("No default value for field %1% of record %2%, which the writer lacks")
              % reader->nameAt(j) % reader->name()).str());
          }
          unmatched.push_back(j);
        } else if (readerFieldFor[w] >= 0) {
          return errorProduction((boost::format("Writer field %1% of record %2% matches more than one reader field")
            % writer->nameAt(w) % writer->name()).str());
        } else {
          readerFieldFor[w] = static_cast<int> (j);
        }
      }

      ProductionPtr result = make_shared<Production>();
      vector<size_t> fieldOrder;
      fieldOrder.reserve(rc);

      /* The writer's fields, in the order they are in the data*/
      for (size_t i = 0; i < wc; ++i) {
        if (readerFieldFor[i] >= 0) {
          size_t j = readerFieldFor[i];
          ProductionPtr p = doGenerate2(writer->leafAt(i), reader->leafAt(j), m, m2);
          copy(p->rbegin(), p->rend(), back_inserter(*result));
          fieldOrder.push_back(j);
        } else {
          DEBUG_OUT("Skipping writer field " << writer->nameAt(i) << " of " << writer->name());
          ProductionPtr p = getWriterProduction(writer->leafAt(i), m2);
          result->push_back(Symbol::skipStart());
          if (p->size() == 1) {
            result->push_back((*p)[0]);
          } else {
            result->push_back(Symbol::indirect(p));
          }
        }
      }

      /* Then the reader's fields the writer lacks, from their defaults*/
      for (vector<size_t>::const_iterator it = unmatched.begin(); it != unmatched.end(); ++it) {
        NodePtr s = followSymbol(reader->leafAt(*it));
        fieldOrder.push_back(*it);

        DEBUG_OUT("Default for reader field " << reader->nameAt(*it) << " of " << reader->name());
        std::shared_ptr<vector<uint8_t> > defaultBinary =
          getAvroBinary(reader->defaultValueAt(*it));
        result->push_back(Symbol::defaultStartAction(defaultBinary));
        ProductionPtr p = doGenerate2(s, s, m, m2);
        copy(p->rbegin(), p->rend(), back_inserter(*result));
        result->push_back(Symbol::defaultEndAction());
      }
      reverse(result->begin(), result->end());
      result->push_back(Symbol::sizeListAction(fieldOrder));
      result->push_back(Symbol::recordAction());

      return result;
    }

    ProductionPtr ResolvingGrammarGenerator::resolveUnion(
      const NodePtr& writer, const NodePtr& reader,
      map<NodePair, ProductionPtr>& m,
      map<NodePtr, ProductionPtr>& m2) {
      vector<ProductionPtr> v;
      size_t c = writer->leaves();
      v.reserve(c);
      for (size_t i = 0; i < c; ++i) {
        ProductionPtr p = doGenerate2(writer->leafAt(i), reader, m, m2);
        v.push_back(p);
      }
      ProductionPtr result = make_shared<Production>();
      result->push_back(Symbol::alternative(v));
      result->push_back(Symbol::writerUnionAction());
      return result;
    }

    ProductionPtr ResolvingGrammarGenerator::doGenerate2(
      const NodePtr& w, const NodePtr& r,
      map<NodePair, ProductionPtr> &m,
      map<NodePtr, ProductionPtr> &m2) {
      const NodePtr writer = followSymbol(w);
      const NodePtr reader = followSymbol(r);
      Type writerType = writer->type();
      Type readerType = reader->type();

      if (writerType == readerType) {
        switch (writerType) {
          case Type::AVRO_NULL:
            return make_shared<Production>(1, Symbol::nullSymbol());
          case Type::AVRO_BOOL:
            return make_shared<Production>(1, Symbol::boolSymbol());
          case Type::AVRO_INT:
            return make_shared<Production>(1, Symbol::intSymbol());
          case Type::AVRO_LONG:
            return make_shared<Production>(1, Symbol::longSymbol());
          case Type::AVRO_FLOAT:
            return make_shared<Production>(1, Symbol::floatSymbol());
          case Type::AVRO_DOUBLE:
            return make_shared<Production>(1, Symbol::doubleSymbol());
          case Type::AVRO_STRING:
            return make_shared<Production>(1, Symbol::stringSymbol());
          case Type::AVRO_BYTES:
            return make_shared<Production>(1, Symbol::bytesSymbol());
          case Type::AVRO_FIXED:
            if (!namesMatch(*writer, *reader)) {
              break;
            }
            if (writer->fixedSize() != reader->fixedSize()) {
              return errorProduction((boost::format("Fixed %1% has size %2% in the writer and %3% in the reader")
                % reader->name() % writer->fixedSize() % reader->fixedSize()).str());
            } else {
              ProductionPtr result = make_shared<Production>();
              result->push_back(Symbol::sizeCheckSymbol(reader->fixedSize()));
              result->push_back(Symbol::fixedSymbol());
              return result;
            }
          case Type::AVRO_RECORD:
            if (namesMatch(*writer, *reader)) {
              const NodePair key(writer, reader);
              map<NodePair, ProductionPtr>::const_iterator kp = m.find(key);
              if (kp != m.end()) {
                return (kp->second) ? make_shared<Production>(1, Symbol::indirect(kp->second)) :
                  make_shared<Production>(1, Symbol::placeholder(key));
              }
              m[key] = ProductionPtr();
              ProductionPtr result = resolveRecords(writer, reader, m, m2);
              m[key] = result;
              return make_shared<Production>(1, Symbol::indirect(result));
            }
            break;

          case Type::AVRO_ENUM:
            if (namesMatch(*writer, *reader)) {
              ProductionPtr result = make_shared<Production>();
              result->push_back(Symbol::enumAdjustSymbol(writer, reader));
              result->push_back(Symbol::enumSymbol());
              return result;
            }
            break;

          case Type::AVRO_ARRAY:
          {
            ProductionPtr p = getWriterProduction(writer->leafAt(0), m2);
            ProductionPtr p2 = doGenerate2(writer->leafAt(0), reader->leafAt(0), m, m2);
            ProductionPtr result = make_shared<Production>();
            result->push_back(Symbol::arrayEndSymbol());
            result->push_back(Symbol::repeater(p2, p, true));
            result->push_back(Symbol::arrayStartSymbol());
            return result;
          }
          case Type::AVRO_MAP:
          {
            ProductionPtr pp =
              doGenerate2(writer->leafAt(1), reader->leafAt(1), m, m2);
            ProductionPtr v = make_shared<Production>(*pp);
            v->push_back(Symbol::stringSymbol());

            ProductionPtr pp2 = getWriterProduction(writer->leafAt(1), m2);
            ProductionPtr v2 = make_shared<Production>(*pp2);
            v2->push_back(Symbol::stringSymbol());

            ProductionPtr result = make_shared<Production>();
            result->push_back(Symbol::mapEndSymbol());
            result->push_back(Symbol::repeater(v, v2, false));
            result->push_back(Symbol::mapStartSymbol());
            return result;
          }
          case Type::AVRO_UNION:
            return resolveUnion(writer, reader, m, m2);
          default:
            throw Exception(boost::format("Unknown node type: %1%") % writerType);
        }
      } else if (writerType == Type::AVRO_UNION) {
        return resolveUnion(writer, reader, m, m2);
      } else if (readerType == Type::AVRO_UNION) {
        int j = bestBranch(writer, reader);
        if (j >= 0) {
          ProductionPtr p = doGenerate2(writer, reader->leafAt(j), m, m2);
          ProductionPtr result = make_shared<Production>();
          result->push_back(Symbol::unionAdjustSymbol(j, p));
          result->push_back(Symbol::unionSymbol());
          return result;
        }
      } else {
        Symbol::Kind k = promotion(writerType, readerType);
        if (k != Symbol::sError) {
          return make_shared<Production>(1, Symbol::resolveSymbol(k, readerKind(readerType)));
        }
      }
      return errorProduction((boost::format("Cannot read writer %1% as reader %2%")
        % describe(writer) % describe(reader)).str());
    }

    class ResolvingDecoderHandler {
      std::shared_ptr<vector<uint8_t> > defaultData_;
      std::shared_ptr<InputStream> inp_;
      DecoderPtr backup_;
      DecoderPtr& base_;
      const DecoderPtr binDecoder;
    public:

      ResolvingDecoderHandler(DecoderPtr& base) : base_(base),
      binDecoder(binaryDecoder()) { }

      size_t handle(const Symbol& s) {
        switch (s.kind()) {
          case Symbol::sWriterUnion:
            return base_->decodeUnionIndex();
          case Symbol::sDefaultStart:
            defaultData_ = s.extra<std::shared_ptr<vector<uint8_t> > >();
            backup_ = base_;
            inp_ = memoryInputStream(defaultData_->empty() ? NULL : &(*defaultData_)[0], defaultData_->size());
            base_ = binDecoder;
            base_->init(*inp_);
            return 0;
          case Symbol::sDefaultEnd:
            base_ = backup_;
            backup_.reset();
            return 0;
          default:
            return 0;
        }
      }

      void reset() {
        if (backup_ != NULL) {
          base_ = backup_;
          backup_.reset();
        }
      }
    };

    template <typename Parser>
    class ResolvingDecoderImpl : public ResolvingDecoder {
      DecoderPtr base_;
      ResolvingDecoderHandler handler_;
      Parser parser_;
      vector<size_t> fieldOrder_;

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
      const vector<size_t>& fieldOrder();
      void drain();

      size_t blockEnd(size_t n, Symbol::Kind end);
      size_t skipBlocks(size_t n, Symbol::Kind end);
    public:

      ResolvingDecoderImpl(const ValidSchema& writer, const ValidSchema& reader,
        const DecoderPtr& base) :
      base_(base),
      handler_(base_),
      parser_(ResolvingGrammarGenerator().generate(writer, reader),
      base_.get(), handler_) { }
    };

    template <typename P>
    void ResolvingDecoderImpl<P>::init(InputStream& is) {
      handler_.reset();
      base_->init(is);
      parser_.reset();
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::decodeNull() {
      parser_.advance(Symbol::sNull);
      base_->decodeNull();
    }

    template <typename P>
    bool ResolvingDecoderImpl<P>::decodeBool() {
      parser_.advance(Symbol::sBool);
      return base_->decodeBool();
    }

    template <typename P>
    int32_t ResolvingDecoderImpl<P>::decodeInt() {
      parser_.advance(Symbol::sInt);
      return base_->decodeInt();
    }

    template <typename P>
    int64_t ResolvingDecoderImpl<P>::decodeLong() {
      Symbol::Kind k = parser_.advance(Symbol::sLong);
      return k == Symbol::sInt ? base_->decodeInt() : base_->decodeLong();
    }

    template <typename P>
    float ResolvingDecoderImpl<P>::decodeFloat() {
      Symbol::Kind k = parser_.advance(Symbol::sFloat);
      return k == Symbol::sInt ? base_->decodeInt() :
        k == Symbol::sLong ? base_->decodeLong() :
        base_->decodeFloat();
    }

    template <typename P>
    double ResolvingDecoderImpl<P>::decodeDouble() {
      Symbol::Kind k = parser_.advance(Symbol::sDouble);
      return k == Symbol::sInt ? base_->decodeInt() :
        k == Symbol::sLong ? base_->decodeLong() :
        k == Symbol::sFloat ? base_->decodeFloat() :
        base_->decodeDouble();
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::decodeString(string& value) {
      if (parser_.advance(Symbol::sString) == Symbol::sBytes) {
        vector<uint8_t> v;
        base_->decodeBytes(v);
        value.assign(v.begin(), v.end());
      } else {
        base_->decodeString(value);
      }
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::skipString() {
      if (parser_.advance(Symbol::sString) == Symbol::sBytes) {
        base_->skipBytes();
      } else {
        base_->skipString();
      }
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::decodeBytes(vector<uint8_t>& value) {
      if (parser_.advance(Symbol::sBytes) == Symbol::sString) {
        string s;
        base_->decodeString(s);
        value.assign(s.begin(), s.end());
      } else {
        base_->decodeBytes(value);
      }
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::skipBytes() {
      if (parser_.advance(Symbol::sBytes) == Symbol::sString) {
        base_->skipString();
      } else {
        base_->skipBytes();
      }
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::decodeFixed(size_t n, vector<uint8_t>& value) {
      parser_.advance(Symbol::sFixed);
      parser_.assertSize(n);
      return base_->decodeFixed(n, value);
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::skipFixed(size_t n) {
      parser_.advance(Symbol::sFixed);
      parser_.assertSize(n);
      base_->skipFixed(n);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::decodeEnum() {
      parser_.advance(Symbol::sEnum);
      size_t n = base_->decodeEnum();
      return parser_.enumAdjust(n);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::blockEnd(size_t n, Symbol::Kind end) {
      if (n == 0) {
        parser_.popRepeater();
        parser_.advance(end);
      } else {
        parser_.setRepeatCount(n);
      }
      return n;
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::skipBlocks(size_t n, Symbol::Kind end) {
      if (n == 0) {
        parser_.pop();
      } else {
        parser_.setRepeatCount(n);
        parser_.skip(*base_);
      }
      parser_.advance(end);
      return 0;
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::arrayStart() {
      parser_.advance(Symbol::sArrayStart);
      return blockEnd(base_->arrayStart(), Symbol::sArrayEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::arrayNext() {
      parser_.processImplicitActions();
      return blockEnd(base_->arrayNext(), Symbol::sArrayEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::skipArray() {
      parser_.advance(Symbol::sArrayStart);
      return skipBlocks(base_->skipArray(), Symbol::sArrayEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::mapStart() {
      parser_.advance(Symbol::sMapStart);
      return blockEnd(base_->mapStart(), Symbol::sMapEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::mapNext() {
      parser_.processImplicitActions();
      return blockEnd(base_->mapNext(), Symbol::sMapEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::skipMap() {
      parser_.advance(Symbol::sMapStart);
      return skipBlocks(base_->skipMap(), Symbol::sMapEnd);
    }

    template <typename P>
    size_t ResolvingDecoderImpl<P>::decodeUnionIndex() {
      parser_.advance(Symbol::sUnion);
      return parser_.unionAdjust();
    }

    template <typename P>
    const vector<size_t>& ResolvingDecoderImpl<P>::fieldOrder() {
      parser_.advance(Symbol::sRecord);
      fieldOrder_ = parser_.sizeList();
      return fieldOrder_;
    }

    template <typename P>
    void ResolvingDecoderImpl<P>::drain() {
      /* writer fields after the last one the reader wants are still in the stream*/
      parser_.processImplicitActions();
      base_->drain();
    }

  } // namespace parsing

  ResolvingDecoderPtr resolvingDecoder(const ValidSchema& writer,
    const ValidSchema& reader, const DecoderPtr& base) {
    return std::make_shared<parsing::ResolvingDecoderImpl
      <parsing::SimpleParser<parsing::ResolvingDecoderHandler> > >(
      writer, reader, base);
  }

}
