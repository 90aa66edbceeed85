// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "cassc/client/paging_iterator.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "cassc/client/call_dispatcher.h"
#include "cassc/rpc/constants.h"

using boost::optional;
using std::string;
using std::unique_ptr;

namespace cassc {
namespace client {

namespace {

// Decodes every slice of a page response into 'rows'. 'rows' is left
// untouched if any of them fails to decode.
template<class Slices>
Status DecodePage(const Slices& slices, const RowDecoder& decoder, KeyedRowList* rows) {
  KeyedRowList decoded;
  decoded.reserve(slices.size());
  for (const KeySlicePB& slice : slices) {
    KeyedRow row;
    RETURN_NOT_OK(decoder(slice, &row));
    decoded.emplace_back(std::move(row));
  }
  rows->swap(decoded);
  return Status::OK();
}

} // anonymous namespace

////////////////////////////////////////////////////////////
// PagingIterator
////////////////////////////////////////////////////////////

PagingIterator::PagingIterator(string start_key, int page_size,
                               optional<int64_t> row_count_limit)
    : start_key_(std::move(start_key)),
      page_size_(page_size),
      row_count_limit_(std::move(row_count_limit)),
      state_(UNSTARTED),
      rows_seen_(0),
      num_pages_fetched_(0),
      position_(0),
      current_page_size_(0),
      expected_page_size_(0) {
  DCHECK_GE(page_size_, 2);
}

PagingIterator::~PagingIterator() {
}

Status PagingIterator::CheckOptions(int page_size, const optional<int64_t>& row_count_limit) {
  if (page_size < 2) {
    return Status::InvalidArgument("Page size must be at least 2",
                                   std::to_string(page_size));
  }
  if (row_count_limit && *row_count_limit <= 0) {
    return Status::InvalidArgument("Row count limit must be positive",
                                   std::to_string(*row_count_limit));
  }
  return Status::OK();
}

int PagingIterator::NextPageCount() const {
  if (!row_count_limit_) {
    return page_size_;
  }
  // One extra row for the boundary row repeated from the previous page.
  int64_t remaining = *row_count_limit_ - rows_seen_ + 1;
  return static_cast<int>(std::min<int64_t>(page_size_, remaining));
}

Status PagingIterator::Rewind() {
  state_ = ACTIVE;
  next_start_key_ = start_key_;
  rows_seen_ = 0;
  num_pages_fetched_ = 0;
  buffer_.clear();
  position_ = 0;
  current_page_size_ = 0;
  expected_page_size_ = 0;
  return FetchPage(true);
}

Status PagingIterator::FetchPage(bool first_page) {
  const int count = NextPageCount();
  KeyedRowList page;
  Status s = UpdateBuffer(next_start_key_, count, &page);
  if (!s.ok()) {
    VLOG(1) << "Fetching a page of " << count << " rows starting at \""
            << next_start_key_ << "\" failed: " << s.ToString();
    state_ = EXHAUSTED;
    return s;
  }
  num_pages_fetched_++;
  VLOG(2) << "Fetched page " << num_pages_fetched_ << ": " << page.size()
          << " of " << count << " rows starting at \"" << next_start_key_ << "\"";

  current_page_size_ = page.size();
  expected_page_size_ = count;
  if (!first_page && !page.empty() && page.front().key == next_start_key_) {
    page.erase(page.begin());
  }
  if (page.empty()) {
    // Either nothing is left, or the server only repeated the boundary row.
    state_ = EXHAUSTED;
  }
  buffer_ = std::move(page);
  position_ = 0;
  return Status::OK();
}

Status PagingIterator::Next(KeyedRow* row, bool* has_row) {
  if (state_ == UNSTARTED) {
    RETURN_NOT_OK(Rewind());
  }

  while (state_ == ACTIVE) {
    if (row_count_limit_ && rows_seen_ >= *row_count_limit_) {
      state_ = EXHAUSTED;
      break;
    }

    if (position_ < buffer_.size()) {
      KeyedRow& candidate = buffer_[position_++];
      next_start_key_ = candidate.key;
      if (candidate.row.empty()) {
        VLOG(2) << "Skipping deleted row \"" << candidate.key << "\"";
        continue;
      }
      rows_seen_++;
      *row = std::move(candidate);
      *has_row = true;
      return Status::OK();
    }

    // The current page is drained.
    if (current_page_size_ < expected_page_size_) {
      state_ = EXHAUSTED;
      break;
    }
    RETURN_NOT_OK(FetchPage(false));
  }

  *has_row = false;
  return Status::OK();
}

Status PagingIterator::GetAll(KeyedRowList* rows) {
  rows->clear();
  RETURN_NOT_OK(Rewind());
  while (true) {
    KeyedRow row;
    bool has_row;
    RETURN_NOT_OK(Next(&row, &has_row));
    if (!has_row) {
      break;
    }
    rows->emplace_back(std::move(row));
  }
  return Status::OK();
}

////////////////////////////////////////////////////////////
// IndexedSlicesIterator
////////////////////////////////////////////////////////////

IndexedSlicesIterator::IndexedSlicesIterator(CallDispatcher* dispatcher,
                                             GetIndexedSlicesRequestPB request,
                                             RowDecoder decoder,
                                             int page_size,
                                             optional<int64_t> row_count_limit)
    : PagingIterator(request.index_clause().start_key(), page_size,
                     std::move(row_count_limit)),
      dispatcher_(dispatcher),
      request_(std::move(request)),
      decoder_(std::move(decoder)) {
}

Status IndexedSlicesIterator::Create(CallDispatcher* dispatcher,
                                     GetIndexedSlicesRequestPB request,
                                     RowDecoder decoder,
                                     int page_size,
                                     optional<int64_t> row_count_limit,
                                     unique_ptr<PagingIterator>* iter) {
  RETURN_NOT_OK(CheckOptions(page_size, row_count_limit));
  iter->reset(new IndexedSlicesIterator(dispatcher, std::move(request), std::move(decoder),
                                        page_size, std::move(row_count_limit)));
  return Status::OK();
}

Status IndexedSlicesIterator::UpdateBuffer(const string& start_key, int count,
                                           KeyedRowList* rows) {
  IndexClausePB* clause = request_.mutable_index_clause();
  clause->set_start_key(start_key);
  clause->set_count(count);
  GetIndexedSlicesResponsePB resp;
  RETURN_NOT_OK(dispatcher_->Call(rpc::kGetIndexedSlicesMethod, request_, &resp));
  return DecodePage(resp.rows(), decoder_, rows);
}

////////////////////////////////////////////////////////////
// KeyRangeIterator
////////////////////////////////////////////////////////////

KeyRangeIterator::KeyRangeIterator(CallDispatcher* dispatcher,
                                   GetRangeSlicesRequestPB request,
                                   RowDecoder decoder,
                                   int page_size,
                                   optional<int64_t> row_count_limit)
    : PagingIterator(request.range().start_key(), page_size,
                     std::move(row_count_limit)),
      dispatcher_(dispatcher),
      request_(std::move(request)),
      decoder_(std::move(decoder)) {
}

Status KeyRangeIterator::Create(CallDispatcher* dispatcher,
                                GetRangeSlicesRequestPB request,
                                RowDecoder decoder,
                                int page_size,
                                optional<int64_t> row_count_limit,
                                unique_ptr<PagingIterator>* iter) {
  RETURN_NOT_OK(CheckOptions(page_size, row_count_limit));
  iter->reset(new KeyRangeIterator(dispatcher, std::move(request), std::move(decoder),
                                   page_size, std::move(row_count_limit)));
  return Status::OK();
}

Status KeyRangeIterator::UpdateBuffer(const string& start_key, int count,
                                      KeyedRowList* rows) {
  KeyRangePB* range = request_.mutable_range();
  range->set_start_key(start_key);
  range->set_count(count);
  GetRangeSlicesResponsePB resp;
  RETURN_NOT_OK(dispatcher_->Call(rpc::kGetRangeSlicesMethod, request_, &resp));
  return DecodePage(resp.rows(), decoder_, rows);
}

} // namespace client
} // namespace cassc
