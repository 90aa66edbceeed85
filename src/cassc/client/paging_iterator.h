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
#ifndef CASSC_CLIENT_PAGING_ITERATOR_H
#define CASSC_CLIENT_PAGING_ITERATOR_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/optional/optional.hpp>

#include "cassc/client/row.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

class CallDispatcher;

// Turns one row returned by the server into a KeyedRow.
typedef std::function<Status(const KeySlicePB& slice, KeyedRow* row)> RowDecoder;

// Iterates over a result set the server hands out in pages.
//
// Pages are requested with an inclusive start key. Every page after the
// first starts at the key of the last row of the previous one, so the
// server returns that row again; it is dropped. Rows without columns are
// deleted rows and are skipped. A page with fewer rows than requested is the
// last one. When a row count limit is set, iteration stops once that many
// rows were returned, and no page larger than needed to reach it is
// requested.
//
// A failed page fetch ends the iteration: the error is returned and the
// iterator moves to EXHAUSTED without keeping any part of the failed page.
//
// Subclasses define how a page is fetched. This class is not thread-safe.
class PagingIterator {
 public:
  enum State {
    UNSTARTED,
    ACTIVE,
    EXHAUSTED,
  };

  virtual ~PagingIterator();

  // Restarts the iteration from the start key and fetches the first page.
  Status Rewind() WARN_UNUSED_RESULT;

  // Returns the next row in 'row' and sets 'has_row'. Once the result set is
  // exhausted 'has_row' is set to false. The first call on an unstarted
  // iterator rewinds it.
  Status Next(KeyedRow* row, bool* has_row) WARN_UNUSED_RESULT;

  // Rewinds and returns every remaining row, in order. Holds the whole result
  // set in memory.
  Status GetAll(KeyedRowList* rows) WARN_UNUSED_RESULT;

  State state() const { return state_; }

  // Rows returned since the last rewind.
  int64_t rows_seen() const { return rows_seen_; }

  // Pages fetched since the last rewind.
  int num_pages_fetched() const { return num_pages_fetched_; }

  int page_size() const { return page_size_; }
  const boost::optional<int64_t>& row_count_limit() const { return row_count_limit_; }

 protected:
  PagingIterator(std::string start_key, int page_size,
                 boost::optional<int64_t> row_count_limit);

  // Returns InvalidArgument unless 'page_size' is at least 2 and
  // 'row_count_limit', if set, is positive. A page size of 1 could never get
  // past a page boundary.
  static Status CheckOptions(int page_size,
                             const boost::optional<int64_t>& row_count_limit);

  // Fetches at most 'count' rows starting with 'start_key' (inclusive) into
  // 'rows', in server order.
  virtual Status UpdateBuffer(const std::string& start_key, int count,
                              KeyedRowList* rows) = 0;

 private:
  Status FetchPage(bool first_page);

  // Number of rows to ask for in the next page.
  int NextPageCount() const;

  const std::string start_key_;
  const int page_size_;
  const boost::optional<int64_t> row_count_limit_;

  State state_;
  std::string next_start_key_;
  int64_t rows_seen_;
  int num_pages_fetched_;

  // The current page and the position of the next row to look at.
  KeyedRowList buffer_;
  size_t position_;

  // Rows the server returned for the current page, and rows asked for.
  size_t current_page_size_;
  size_t expected_page_size_;

  DISALLOW_COPY_AND_ASSIGN(PagingIterator);
};

// Pages through the rows matching a secondary index clause.
class IndexedSlicesIterator : public PagingIterator {
 public:
  // 'request' supplies the column family, index clause and predicate; the
  // index clause's start key is where iteration begins. 'dispatcher' must
  // outlive the iterator.
  static Status Create(CallDispatcher* dispatcher,
                       GetIndexedSlicesRequestPB request,
                       RowDecoder decoder,
                       int page_size,
                       boost::optional<int64_t> row_count_limit,
                       std::unique_ptr<PagingIterator>* iter) WARN_UNUSED_RESULT;

 protected:
  Status UpdateBuffer(const std::string& start_key, int count,
                      KeyedRowList* rows) override;

 private:
  IndexedSlicesIterator(CallDispatcher* dispatcher,
                        GetIndexedSlicesRequestPB request,
                        RowDecoder decoder,
                        int page_size,
                        boost::optional<int64_t> row_count_limit);

  CallDispatcher* const dispatcher_;
  GetIndexedSlicesRequestPB request_;
  const RowDecoder decoder_;
};

// Pages through the rows of a key range.
class KeyRangeIterator : public PagingIterator {
 public:
  // 'request' supplies the column family, predicate and key range; the
  // range's start key is where iteration begins and its end key where it
  // stops (inclusive, empty for no bound). 'dispatcher' must outlive the
  // iterator.
  static Status Create(CallDispatcher* dispatcher,
                       GetRangeSlicesRequestPB request,
                       RowDecoder decoder,
                       int page_size,
                       boost::optional<int64_t> row_count_limit,
                       std::unique_ptr<PagingIterator>* iter) WARN_UNUSED_RESULT;

 protected:
  Status UpdateBuffer(const std::string& start_key, int count,
                      KeyedRowList* rows) override;

 private:
  KeyRangeIterator(CallDispatcher* dispatcher,
                   GetRangeSlicesRequestPB request,
                   RowDecoder decoder,
                   int page_size,
                   boost::optional<int64_t> row_count_limit);

  CallDispatcher* const dispatcher_;
  GetRangeSlicesRequestPB request_;
  const RowDecoder decoder_;
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_PAGING_ITERATOR_H
