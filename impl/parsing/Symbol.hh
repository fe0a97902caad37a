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

#ifndef avrolite_parsing_Symbol_hh__
#define avrolite_parsing_Symbol_hh__

#include <map>
#include <set>
#include <stack>
#include <string>
#include <utility>
#include <vector>
#include <memory>

#include <boost/any.hpp>

#include "Node.hh"
#include "Decoder.hh"
#include "Exception.hh"

/* The grammar machinery behind the validating, resolving and JSON codecs. A schema is turned into a grammar: a tree of productions,
   each a sequence of symbols. Codecs drive a SimpleParser over that grammar, advancing it with the terminal symbol for each call
   they receive; non-terminals expand in place and implicit actions are handed to a codec specific handler as they are passed.*/
namespace avrolite {
  namespace parsing {

    class Symbol;

    /* Productions are stored in reverse order: the last symbol is the one to be matched first.*/
    typedef std::vector<Symbol> Production;
    typedef std::shared_ptr<Production> ProductionPtr;

    /* Items left in the current block of an array or map, and the productions for reading and for skipping one item.*/
    struct RepeaterInfo {
      size_t count;
      bool isArray;
      ProductionPtr read;
      ProductionPtr skip;

      RepeaterInfo(bool a, const ProductionPtr& r, const ProductionPtr& s) :
      count(0), isArray(a), read(r), skip(s) { }
    };

    /* A record field, as seen by the JSON codec*/
    struct FieldRef {
      NodePtr record;
      size_t index;

      FieldRef(const NodePtr& r, size_t i) : record(r), index(i) { }

      const std::string& name() const {
        return record->nameAt(index);
      }
    };

    class Symbol {
    public:

      enum Kind {
        sTerminalLow, // extra has nothing
        sNull,
        sBool,
        sInt,
        sLong,
        sFloat,
        sDouble,
        sString,
        sBytes,
        sArrayStart,
        sArrayEnd,
        sMapStart,
        sMapEnd,
        sFixed,
        sEnum,
        sUnion,
        sTerminalHigh,
        sSizeCheck, // extra has size
        sNameList, // extra has a vector of names
        sRoot, // extra has the main and the backup productions
        sRepeater, // extra has RepeaterInfo
        sAlternative, // extra has a vector of branch productions
        sPlaceholder, // extra has the key of the production to come
        sIndirect, // extra has a shared pointer to a production
        sSymbolic, // extra has a weak pointer to a production
        sEnumAdjust, // extra has the reader position of every writer symbol
        sUnionAdjust, // extra has the reader branch and its production
        sSkipStart,
        sResolve, // extra has the writer and reader kinds

        sImplicitActionLow,
        sRecordStart,
        sRecordEnd,
        sUnionEnd,
        sField, // extra has FieldRef
        sRecord,
        sSizeList, // extra has the field order
        sWriterUnion,
        sDefaultStart, // extra has the binary encoded default
        sDefaultEnd,
        sImplicitActionHigh,
        sError // extra has the message
      };

    private:
      Kind kind_;
      boost::any extra_;

      explicit Symbol(Kind k) : kind_(k) { }

      template <typename T> Symbol(Kind k, const T& t) : kind_(k), extra_(t) { }

    public:

      Kind kind() const {
        return kind_;
      }

      template <typename T> T extra() const {
        return boost::any_cast<T>(extra_);
      }

      template <typename T> T* extrap() {
        return boost::any_cast<T>(&extra_);
      }

      template <typename T> const T* extrap() const {
        return boost::any_cast<T>(&extra_);
      }

      template <typename T> void extra(const T& t) {
        extra_ = t;
      }

      bool isTerminal() const {
        return kind_ > sTerminalLow && kind_ < sTerminalHigh;
      }

      bool isImplicitAction() const {
        return kind_ > sImplicitActionLow && kind_ < sImplicitActionHigh;
      }

      static const char* toString(Kind k);

      static Symbol rootSymbol(const ProductionPtr& s) {
        return Symbol(sRoot, std::make_pair(s, std::make_shared<Production>()));
      }

      static Symbol rootSymbol(const ProductionPtr& main, const ProductionPtr& backup) {
        return Symbol(sRoot, std::make_pair(main, backup));
      }

      static Symbol nullSymbol() {
        return Symbol(sNull);
      }

      static Symbol boolSymbol() {
        return Symbol(sBool);
      }

      static Symbol intSymbol() {
        return Symbol(sInt);
      }

      static Symbol longSymbol() {
        return Symbol(sLong);
      }

      static Symbol floatSymbol() {
        return Symbol(sFloat);
      }

      static Symbol doubleSymbol() {
        return Symbol(sDouble);
      }

      static Symbol stringSymbol() {
        return Symbol(sString);
      }

      static Symbol bytesSymbol() {
        return Symbol(sBytes);
      }

      static Symbol sizeCheckSymbol(size_t s) {
        return Symbol(sSizeCheck, s);
      }

      static Symbol fixedSymbol() {
        return Symbol(sFixed);
      }

      static Symbol enumSymbol() {
        return Symbol(sEnum);
      }

      static Symbol arrayStartSymbol() {
        return Symbol(sArrayStart);
      }

      static Symbol arrayEndSymbol() {
        return Symbol(sArrayEnd);
      }

      static Symbol mapStartSymbol() {
        return Symbol(sMapStart);
      }

      static Symbol mapEndSymbol() {
        return Symbol(sMapEnd);
      }

      static Symbol repeater(const ProductionPtr& p, bool isArray) {
        return repeater(p, p, isArray);
      }

      static Symbol repeater(const ProductionPtr& read, const ProductionPtr& skip, bool isArray) {
        return Symbol(sRepeater, RepeaterInfo(isArray, read, skip));
      }

      static Symbol defaultStartAction(const std::shared_ptr<std::vector<uint8_t> >& bb) {
        return Symbol(sDefaultStart, bb);
      }

      static Symbol defaultEndAction() {
        return Symbol(sDefaultEnd);
      }

      static Symbol alternative(const std::vector<ProductionPtr>& branches) {
        return Symbol(sAlternative, branches);
      }

      static Symbol unionSymbol() {
        return Symbol(sUnion);
      }

      static Symbol recordStartSymbol() {
        return Symbol(sRecordStart);
      }

      static Symbol recordEndSymbol() {
        return Symbol(sRecordEnd);
      }

      static Symbol unionEndSymbol() {
        return Symbol(sUnionEnd);
      }

      static Symbol fieldSymbol(const NodePtr& record, size_t index) {
        return Symbol(sField, FieldRef(record, index));
      }

      static Symbol writerUnionAction() {
        return Symbol(sWriterUnion);
      }

      static Symbol nameListSymbol(const std::vector<std::string>& v) {
        return Symbol(sNameList, v);
      }

      template <typename T>
      static Symbol placeholder(const T& n) {
        return Symbol(sPlaceholder, n);
      }

      static Symbol indirect(const ProductionPtr& p) {
        return Symbol(sIndirect, p);
      }

      static Symbol symbolic(const std::weak_ptr<Production>& p) {
        return Symbol(sSymbolic, p);
      }

      /* Maps every writer symbol to its reader position. Writer symbols unknown to the reader go to the reader's default symbol, or
         to -1 if there is none.*/
      static Symbol enumAdjustSymbol(const NodePtr& writer, const NodePtr& reader);

      static Symbol unionAdjustSymbol(size_t branch, const ProductionPtr& p) {
        return Symbol(sUnionAdjust, std::make_pair(branch, p));
      }

      static Symbol sizeListAction(const std::vector<size_t>& order) {
        return Symbol(sSizeList, order);
      }

      static Symbol recordAction() {
        return Symbol(sRecord);
      }

      static Symbol error(const std::string& message) {
        return Symbol(sError, message);
      }

      static Symbol resolveSymbol(Kind w, Kind r) {
        return Symbol(sResolve, std::make_pair(w, r));
      }

      static Symbol skipStart() {
        return Symbol(sSkipStart);
      }
    };

    typedef std::pair<ProductionPtr, ProductionPtr> RootInfo;
    typedef std::pair<size_t, ProductionPtr> UnionAdjustInfo;

    /* Replaces the placeholders in p, keyed by values of type T, with references to the productions in m*/
    template <typename T>
    void fixup(const ProductionPtr& p, const std::map<T, ProductionPtr>& m);

    template <typename T>
    void fixup(Symbol& s, const std::map<T, ProductionPtr>& m, std::set<ProductionPtr>& seen);

    template <typename T>
    void fixup_internal(const ProductionPtr& p, const std::map<T, ProductionPtr>& m, std::set<ProductionPtr>& seen) {
      if (seen.find(p) == seen.end()) {
        seen.insert(p);
        for (Production::iterator it = p->begin(); it != p->end(); ++it) {
          fixup(*it, m, seen);
        }
      }
    }

    template <typename T>
    void fixup(Symbol& s, const std::map<T, ProductionPtr>& m, std::set<ProductionPtr>& seen) {
      switch (s.kind()) {
        case Symbol::sIndirect:
          fixup_internal(s.extra<ProductionPtr>(), m, seen);
          break;
        case Symbol::sAlternative:
        {
          const std::vector<ProductionPtr>* vv = s.extrap<std::vector<ProductionPtr> >();
          for (std::vector<ProductionPtr>::const_iterator it = vv->begin(); it != vv->end(); ++it) {
            fixup_internal(*it, m, seen);
          }
        }
          break;
        case Symbol::sRepeater:
        {
          const RepeaterInfo* ri = s.extrap<RepeaterInfo>();
          fixup_internal(ri->read, m, seen);
          fixup_internal(ri->skip, m, seen);
        }
          break;
        case Symbol::sPlaceholder:
        {
          const T* key = s.extrap<T>();
          if (key == 0) {
            // keyed by another generator, fixed up by it
            break;
          }
          typename std::map<T, ProductionPtr>::const_iterator it = m.find(*key);
          if (it == m.end() || !it->second) {
            throw Exception("Placeholder symbol cannot be resolved");
          }
          s = Symbol::symbolic(std::weak_ptr<Production>(it->second));
        }
          break;
        case Symbol::sUnionAdjust:
          fixup_internal(s.extrap<UnionAdjustInfo>()->second, m, seen);
          break;
        default:
          break;
      }
    }

    template <typename T>
    void fixup(const ProductionPtr& p, const std::map<T, ProductionPtr>& m) {
      std::set<ProductionPtr> seen;
      for (Production::iterator it = p->begin(); it != p->end(); ++it) {
        fixup(*it, m, seen);
      }
    }

    /* A handler that ignores every implicit action*/
    struct DummyHandler {

      size_t handle(const Symbol&) {
        return 0;
      }
    };

    /* A pushdown parser over a grammar. The handler sees every implicit action as it is passed; decoder, if given, is used for
       skipping data that the grammar says is to be skipped.*/
    template <typename Handler>
    class SimpleParser {
      Decoder* decoder_;
      Handler& handler_;
      std::stack<Symbol> parsingStack;

      static void throwMismatch(Symbol::Kind actual, Symbol::Kind expected) {
        throw ResolutionException(boost::format("Invalid operation. Schema requires: %1%, got: %2%")
          % Symbol::toString(expected) % Symbol::toString(actual));
      }

      static void assertMatch(Symbol::Kind actual, Symbol::Kind expected) {
        if (expected != actual) {
          throwMismatch(actual, expected);
        }
      }

      void append(const ProductionPtr& ss) {
        for (Production::const_iterator it = ss->begin(); it != ss->end(); ++it) {
          parsingStack.push(*it);
        }
      }

      size_t popSize() {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sSizeCheck, s.kind());
        size_t result = s.extra<size_t>();
        parsingStack.pop();
        return result;
      }

      RepeaterInfo& topRepeater() {
        Symbol& s = parsingStack.top();
        assertMatch(Symbol::sRepeater, s.kind());
        return *s.template extrap<RepeaterInfo>();
      }

      /* Replaces the symbol on top, which must be a non-terminal, with what it stands for. Returns false if it is not one that
         expands.*/
      bool expand(Symbol& s) {
        switch (s.kind()) {
          case Symbol::sRoot:
            append(s.template extrap<RootInfo>()->first);
            return true;
          case Symbol::sIndirect:
          {
            ProductionPtr pp = s.template extra<ProductionPtr>();
            parsingStack.pop();
            append(pp);
            return true;
          }
          case Symbol::sSymbolic:
          {
            ProductionPtr pp(s.template extra<std::weak_ptr<Production> >());
            parsingStack.pop();
            append(pp);
            return true;
          }
          default:
            return false;
        }
      }

    public:

      SimpleParser(const Symbol& s, Decoder* d, Handler& h) :
      decoder_(d), handler_(h) {
        parsingStack.push(s);
      }

      /* Advances the parser to match the terminal k. Returns the kind the data actually has, which differs from k when the
         writer's type is promoted to the reader's.*/
      Symbol::Kind advance(Symbol::Kind k) {
        for (;;) {
          Symbol& s = parsingStack.top();
          if (s.kind() == k) {
            parsingStack.pop();
            return k;
          } else if (s.isTerminal()) {
            throwMismatch(k, s.kind());
          } else if (expand(s)) {
            continue;
          } else {
            switch (s.kind()) {
              case Symbol::sRepeater:
              {
                RepeaterInfo& ri = topRepeater();
                if (ri.count == 0) {
                  throw ResolutionException(boost::format("No more items in the current block, wanted %1%")
                    % Symbol::toString(k));
                }
                --ri.count;
                append(ri.read);
              }
                continue;
              case Symbol::sError:
                throw ResolutionException(s.template extra<std::string>());
              case Symbol::sResolve:
              {
                const std::pair<Symbol::Kind, Symbol::Kind>* p =
                  s.template extrap<std::pair<Symbol::Kind, Symbol::Kind> >();
                assertMatch(p->second, k);
                Symbol::Kind result = p->first;
                parsingStack.pop();
                return result;
              }
              case Symbol::sSkipStart:
                parsingStack.pop();
                skip(*decoder_);
                break;
              default:
                if (s.isImplicitAction()) {
                  Symbol a = s;
                  parsingStack.pop();
                  size_t n = handler_.handle(a);
                  if (a.kind() == Symbol::sWriterUnion) {
                    selectBranch(n);
                  }
                } else {
                  throwMismatch(k, s.kind());
                }
            }
          }
        }
      }

      /* Skips one value of the production on top of the stack, reading it from d.*/
      void skip(Decoder& d) {
        const size_t sz = parsingStack.size();
        if (sz == 0) {
          throw Exception("Nothing to skip");
        }
        while (parsingStack.size() >= sz) {
          Symbol& t = parsingStack.top();
          switch (t.kind()) {
            case Symbol::sNull:
              d.decodeNull();
              break;
            case Symbol::sBool:
              d.decodeBool();
              break;
            case Symbol::sInt:
              d.decodeInt();
              break;
            case Symbol::sLong:
              d.decodeLong();
              break;
            case Symbol::sFloat:
              d.decodeFloat();
              break;
            case Symbol::sDouble:
              d.decodeDouble();
              break;
            case Symbol::sString:
              d.skipString();
              break;
            case Symbol::sBytes:
              d.skipBytes();
              break;
            case Symbol::sArrayStart:
            case Symbol::sMapStart:
            {
              bool isArray = t.kind() == Symbol::sArrayStart;
              parsingStack.pop();
              size_t n = isArray ? d.skipArray() : d.skipMap();
              processImplicitActions();
              RepeaterInfo& ri = topRepeater();
              if (n == 0) {
                break;
              }
              ri.count = n;
            }
              continue;
            case Symbol::sArrayEnd:
            case Symbol::sMapEnd:
              break;
            case Symbol::sFixed:
            {
              parsingStack.pop();
              size_t n = popSize();
              d.skipFixed(n);
            }
              continue;
            case Symbol::sEnum:
              parsingStack.pop();
              d.decodeEnum();
              break;
            case Symbol::sUnion:
            {
              parsingStack.pop();
              size_t n = d.decodeUnionIndex();
              selectBranch(n);
            }
              continue;
            case Symbol::sRepeater:
            {
              RepeaterInfo& ri = topRepeater();
              if (ri.count == 0) {
                ri.count = ri.isArray ? d.arrayNext() : d.mapNext();
              }
              if (ri.count != 0) {
                --ri.count;
                append(ri.skip);
                continue;
              }
            }
              break;
            case Symbol::sIndirect:
            case Symbol::sSymbolic:
              expand(t);
              continue;
            default:
              if (t.isImplicitAction()) {
                Symbol a = t;
                parsingStack.pop();
                handler_.handle(a);
                continue;
              }
              throw Exception(boost::format("Don't know how to skip %1%") % Symbol::toString(t.kind()));
          }
          parsingStack.pop();
        }
      }

      /* Checks that n matches the size pushed by the grammar, and pops it*/
      void assertSize(size_t n) {
        size_t s = popSize();
        if (s != n) {
          throw ResolutionException(boost::format("Incorrect size. Expected: %1% found %2%") % s % n);
        }
      }

      void assertLessThanSize(size_t n) {
        size_t s = popSize();
        if (n >= s) {
          throw ResolutionException(boost::format("Index %1% out of range, size is %2%") % n % s);
        }
      }

      /* Translates a writer enum position into the reader's*/
      size_t enumAdjust(size_t n) {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sEnumAdjust, s.kind());
        const std::vector<int>& v = *s.template extrap<std::vector<int> >();
        if (n >= v.size()) {
          throw ResolutionException(boost::format("Enum index out of range: %1%, writer has %2% symbols") % n % v.size());
        }
        int result = v[n];
        if (result < 0) {
          throw ResolutionException(boost::format("Cannot resolve writer enum symbol at position %1%") % n);
        }
        parsingStack.pop();
        return static_cast<size_t> (result);
      }

      /* Pops the union adjustment, expands the chosen reader branch and returns its index*/
      size_t unionAdjust() {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sUnionAdjust, s.kind());
        UnionAdjustInfo a = s.template extra<UnionAdjustInfo>();
        parsingStack.pop();
        append(a.second);
        return a.first;
      }

      std::string nameForIndex(size_t e) {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sNameList, s.kind());
        const std::vector<std::string>& names = *s.template extrap<std::vector<std::string> >();
        if (e >= names.size()) {
          throw ResolutionException(boost::format("Index %1% out of range, there are %2% names") % e % names.size());
        }
        std::string result = names[e];
        parsingStack.pop();
        return result;
      }

      size_t indexForName(const std::string& name) {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sNameList, s.kind());
        const std::vector<std::string>& names = *s.template extrap<std::vector<std::string> >();
        for (size_t i = 0; i < names.size(); ++i) {
          if (names[i] == name) {
            parsingStack.pop();
            return i;
          }
        }
        throw ResolutionException(boost::format("No such name: %1%") % name);
      }

      void setRepeatCount(size_t n) {
        RepeaterInfo& ri = topRepeater();
        if (ri.count != 0) {
          throw ResolutionException(boost::format("Wrong number of items: %1% left in the previous block") % ri.count);
        }
        ri.count = n;
      }

      /* Pops a repeater whose items are all consumed*/
      void popRepeater() {
        processImplicitActions();
        RepeaterInfo& ri = topRepeater();
        if (ri.count != 0) {
          throw ResolutionException(boost::format("Incorrect number of items: %1% not read") % ri.count);
        }
        parsingStack.pop();
      }

      void selectBranch(size_t n) {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sAlternative, s.kind());
        std::vector<ProductionPtr> v = s.template extra<std::vector<ProductionPtr> >();
        if (n >= v.size()) {
          throw ResolutionException(boost::format("Union index out of range: %1%, union has %2% branches") % n % v.size());
        }
        parsingStack.pop();
        append(v[n]);
      }

      /* Pops the field order pushed ahead of a resolved record*/
      std::vector<size_t> sizeList() {
        const Symbol& s = parsingStack.top();
        assertMatch(Symbol::sSizeList, s.kind());
        std::vector<size_t> result = s.template extra<std::vector<size_t> >();
        parsingStack.pop();
        return result;
      }

      Symbol::Kind top() const {
        return parsingStack.top().kind();
      }

      void pop() {
        parsingStack.pop();
      }

      /* Runs the implicit actions, and pending skips, sitting on top of the stack*/
      void processImplicitActions() {
        for (;;) {
          Symbol& s = parsingStack.top();
          if (s.isImplicitAction()) {
            Symbol a = s;
            parsingStack.pop();
            size_t n = handler_.handle(a);
            if (a.kind() == Symbol::sWriterUnion) {
              selectBranch(n);
            }
          } else if (s.kind() == Symbol::sSkipStart) {
            parsingStack.pop();
            skip(*decoder_);
          } else if (s.kind() == Symbol::sIndirect || s.kind() == Symbol::sSymbolic) {
            expand(s);
          } else {
            break;
          }
        }
      }

      /* Drops everything but the root, ready for the next value*/
      void reset() {
        while (parsingStack.size() > 1) {
          parsingStack.pop();
        }
      }
    };

  }
}

#endif
