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

#include <algorithm>
#include <iterator>
#include <vector>

#include "Stream.hh"

namespace avrolite {

  using std::vector;

  /* Reads back the chunks of a MemoryOutputStream. The last chunk is only partially filled.*/
  class ChunkedInputStream : public InputStream {
    const vector<uint8_t*>& chunks_;
    const size_t chunkSize_;
    const size_t lastChunk_;
    const size_t lastChunkFill_;
    size_t chunk_;
    size_t offset_;

    size_t chunkLimit(size_t chunk) const {
      return (chunk == lastChunk_) ? lastChunkFill_ : chunkSize_;
    }

    /* Moves to the next chunk when the current one is used up. Returns the limit of the current chunk, zero at the end.*/
    size_t advanceChunk() {
      size_t limit = chunkLimit(chunk_);
      if (offset_ == limit) {
        if (chunk_ == lastChunk_) {
          return 0;
        }
        ++chunk_;
        offset_ = 0;
        limit = chunkLimit(chunk_);
      }
      return limit;
    }

  public:

    ChunkedInputStream(const vector<uint8_t*>& chunks,
      size_t chunkSize, size_t lastChunkFill) :
    chunks_(chunks), chunkSize_(chunkSize), lastChunk_(chunks.size() - 1),
    lastChunkFill_(lastChunkFill), chunk_(0), offset_(0) {
    }

    bool next(const uint8_t** data, size_t* len) override {
      if (size_t limit = advanceChunk()) {
        *data = chunks_[chunk_] + offset_;
        *len = limit - offset_;
        offset_ = limit;
        return true;
      }
      return false;
    }

    void backup(size_t len) override {
      offset_ -= len;
    }

    void skip(size_t len) override {
      while (len > 0) {
        size_t limit = advanceChunk();
        if (limit == 0) {
          break;
        }
        size_t n = std::min(len, limit - offset_);
        offset_ += n;
        len -= n;
      }
    }

    size_t byteCount() const override {
      return chunk_ * chunkSize_ + offset_;
    }
  };

  /* An input stream over a contiguous byte range, optionally owning it.*/
  class ContiguousInputStream : public InputStream {
    const std::vector<uint8_t> owned_;
    const uint8_t * const data_;
    const size_t size_;
    size_t offset_;
  public:

    ContiguousInputStream(const uint8_t* data, size_t len)
    : data_(data), size_(len), offset_(0) {
    }

    explicit ContiguousInputStream(const std::string& text)
    : owned_(text.begin(), text.end()),
    data_(owned_.empty() ? 0 : &owned_[0]), size_(owned_.size()), offset_(0) {
    }

    bool next(const uint8_t** data, size_t* len) override {
      if (offset_ == size_) {
        return false;
      }
      *data = &data_[offset_];
      *len = size_ - offset_;
      offset_ = size_;
      return true;
    }

    void backup(size_t len) override {
      offset_ -= len;
    }

    void skip(size_t len) override {
      offset_ += std::min(len, size_ - offset_);
    }

    size_t byteCount() const override {
      return offset_;
    }
  };

  class MemoryOutputStream : public OutputStream {
  public:
    const size_t chunkSize_;
    std::vector<uint8_t*> chunks_;
    size_t available_;
    size_t byteCount_;

    MemoryOutputStream(size_t chunkSize) : chunkSize_(chunkSize),
    available_(0), byteCount_(0) {
    }

    ~MemoryOutputStream() {
      for (std::vector<uint8_t*>::const_iterator it = chunks_.begin();
        it != chunks_.end(); ++it) {
        delete[] * it;
      }
    }

    bool next(uint8_t** data, size_t* len) override {
      if (available_ == 0) {
        chunks_.push_back(new uint8_t[chunkSize_]);
        available_ = chunkSize_;
      }
      *data = &chunks_.back()[chunkSize_ - available_];
      *len = available_;
      byteCount_ += available_;
      available_ = 0;
      return true;
    }

    void backup(size_t len) override {
      available_ += len;
      byteCount_ -= len;
    }

    uint64_t byteCount() const override {
      return byteCount_;
    }

    void flush() override {
    }
  };

  OutputStreamPtr memoryOutputStream(size_t chunkSize) {
    if (chunkSize == 0) {
      throw Exception("Chunk size of a memory output stream must be positive");
    }
    return std::make_shared<MemoryOutputStream>(chunkSize);
  }

  InputStreamPtr memoryInputStream(const uint8_t* data, size_t len) {
    return std::make_shared<ContiguousInputStream>(data, len);
  }

  InputStreamPtr stringInputStream(const std::string& text) {
    return std::make_shared<ContiguousInputStream>(text);
  }

  InputStreamPtr memoryInputStream(const OutputStream& source) {
    const MemoryOutputStream& mos =
      dynamic_cast<const MemoryOutputStream&> (source);
    if (mos.chunks_.empty()) {
      return std::make_shared<ContiguousInputStream>(static_cast<const uint8_t*> (0), 0);
    }
    return std::make_shared<ChunkedInputStream>(mos.chunks_, mos.chunkSize_,
      mos.chunkSize_ - mos.available_);
  }

  std::shared_ptr<std::vector<uint8_t> > snapshot(const OutputStream& source) {
    const MemoryOutputStream& mos = dynamic_cast<const MemoryOutputStream&> (source);
    std::shared_ptr<std::vector<uint8_t> > result = std::make_shared<std::vector<uint8_t> >();
    size_t c = mos.byteCount_;
    result->reserve(mos.byteCount_);
    for (vector<uint8_t*>::const_iterator it = mos.chunks_.begin();
      it != mos.chunks_.end(); ++it) {
      size_t n = std::min(c, mos.chunkSize_);
      std::copy(*it, *it + n, std::back_inserter(*result));
      c -= n;
    }
    return result;
  }

}
