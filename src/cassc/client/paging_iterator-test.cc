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

#include <cstdio>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional/optional.hpp>
#include <gtest/gtest.h>

#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

using boost::optional;
using std::string;
using std::vector;

namespace cassc {
namespace client {

namespace {

string Key(int i) {
  char buf[16];
  snprintf(buf, sizeof(buf), "k%02d", i);
  return buf;
}

KeyedRow MakeRow(const string& key) {
  KeyedRow row;
  row.key = key;
  row.row = Row(ColumnMap{ { Value("name"), Value(key) } });
  return row;
}

// A row whose columns were all deleted.
KeyedRow MakeTombstone(const string& key) {
  KeyedRow row;
  row.key = key;
  return row;
}

KeyedRowList MakeRows(int n) {
  KeyedRowList rows;
  for (int i = 0; i < n; i++) {
    rows.push_back(MakeRow(Key(i)));
  }
  return rows;
}

vector<string> Keys(const KeyedRowList& rows) {
  vector<string> keys;
  for (const KeyedRow& row : rows) {
    keys.push_back(row.key);
  }
  return keys;
}

} // anonymous namespace

// Serves pages out of a sorted table the way the server does, from the start
// key on, inclusive. Scripted pages, when given, are served first instead.
class TableIterator : public PagingIterator {
 public:
  struct Request {
    string start_key;
    int count;
  };

  TableIterator(KeyedRowList table, int page_size,
                optional<int64_t> row_count_limit = boost::none,
                string start_key = "")
      : PagingIterator(std::move(start_key), page_size, std::move(row_count_limit)),
        table_(std::move(table)),
        fail_at_fetch_(0) {
  }

  using PagingIterator::CheckOptions;

  void AddScriptedPage(KeyedRowList page) {
    scripted_pages_.push_back(std::move(page));
  }

  // Makes the n-th fetch, counting from 1, fail.
  void FailAtFetch(int n) { fail_at_fetch_ = n; }

  const vector<Request>& requests() const { return requests_; }

 protected:
  Status UpdateBuffer(const string& start_key, int count, KeyedRowList* rows) override {
    requests_.push_back(Request{ start_key, count });
    if (static_cast<int>(requests_.size()) == fail_at_fetch_) {
      return Status::TimedOut("injected failure");
    }
    rows->clear();
    if (!scripted_pages_.empty()) {
      *rows = std::move(scripted_pages_.front());
      scripted_pages_.pop_front();
      return Status::OK();
    }
    for (const KeyedRow& row : table_) {
      if (static_cast<int>(rows->size()) == count) {
        break;
      }
      if (row.key >= start_key) {
        rows->push_back(row);
      }
    }
    return Status::OK();
  }

 private:
  const KeyedRowList table_;
  std::deque<KeyedRowList> scripted_pages_;
  vector<Request> requests_;
  int fail_at_fetch_;
};

class PagingIteratorTest : public CasscTest {
 protected:
  static KeyedRowList Drain(PagingIterator* iter) {
    KeyedRowList rows;
    while (true) {
      KeyedRow row;
      bool has_row;
      Status s = iter->Next(&row, &has_row);
      CHECK_OK(s);
      if (!has_row) {
        break;
      }
      rows.push_back(std::move(row));
    }
    return rows;
  }
};

TEST_F(PagingIteratorTest, TestOptions) {
  ASSERT_OK(TableIterator::CheckOptions(2, boost::none));
  ASSERT_OK(TableIterator::CheckOptions(100, optional<int64_t>(1)));
  ASSERT_TRUE(TableIterator::CheckOptions(1, boost::none).IsInvalidArgument());
  ASSERT_TRUE(TableIterator::CheckOptions(0, boost::none).IsInvalidArgument());
  ASSERT_TRUE(TableIterator::CheckOptions(10, optional<int64_t>(0)).IsInvalidArgument());
}

TEST_F(PagingIteratorTest, TestNextStartsIteration) {
  TableIterator iter(MakeRows(3), 10);
  ASSERT_EQ(PagingIterator::UNSTARTED, iter.state());
  ASSERT_EQ(0, iter.num_pages_fetched());

  KeyedRow row;
  bool has_row;
  ASSERT_OK(iter.Next(&row, &has_row));
  ASSERT_TRUE(has_row);
  ASSERT_EQ(Key(0), row.key);
  ASSERT_EQ(PagingIterator::ACTIVE, iter.state());
  ASSERT_EQ(1, iter.num_pages_fetched());
}

// The first row of a later page repeats the last row of the page before it.
TEST_F(PagingIteratorTest, TestBoundaryRowIsNotRepeated) {
  TableIterator iter(KeyedRowList(), 3);
  iter.AddScriptedPage({ MakeRow("k1"), MakeRow("k2"), MakeRow("k3") });
  iter.AddScriptedPage({ MakeRow("k3"), MakeRow("k4") });

  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ((vector<string>{ "k1", "k2", "k3", "k4" }), Keys(rows));
  ASSERT_EQ(2, iter.num_pages_fetched());
  ASSERT_EQ(2U, iter.requests().size());
  ASSERT_EQ("", iter.requests()[0].start_key);
  ASSERT_EQ("k3", iter.requests()[1].start_key);
  ASSERT_EQ(3, iter.requests()[1].count);
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter.state());
}

TEST_F(PagingIteratorTest, TestFullPageTriggersAnotherFetch) {
  TableIterator iter(MakeRows(10), 10);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(10U, rows.size());
  // The second page only holds the boundary row.
  ASSERT_EQ(2, iter.num_pages_fetched());
  ASSERT_EQ(Key(9), iter.requests()[1].start_key);
}

TEST_F(PagingIteratorTest, TestShortPageEndsIteration) {
  TableIterator iter(MakeRows(9), 10);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(9U, rows.size());
  ASSERT_EQ(1, iter.num_pages_fetched());
}

TEST_F(PagingIteratorTest, TestManyPages) {
  TableIterator iter(MakeRows(25), 4);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(Keys(MakeRows(25)), Keys(rows));
  ASSERT_EQ(25, iter.rows_seen());
  // 4 rows on the first page, 3 new ones on each of the next 7 pages and a
  // last page holding only the boundary row.
  ASSERT_EQ(9, iter.num_pages_fetched());
}

TEST_F(PagingIteratorTest, TestRowCountLimit) {
  TableIterator iter(MakeRows(100), 10, optional<int64_t>(5));
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(Keys(MakeRows(5)), Keys(rows));
  ASSERT_EQ(5, iter.rows_seen());
  ASSERT_EQ(1, iter.num_pages_fetched());
  ASSERT_EQ(6, iter.requests()[0].count);
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter.state());
}

TEST_F(PagingIteratorTest, TestRowCountLimitAcrossPages) {
  TableIterator iter(MakeRows(100), 5, optional<int64_t>(12));
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(Keys(MakeRows(12)), Keys(rows));
  ASSERT_EQ(3, iter.num_pages_fetched());
  // The last page only asks for what is left, plus the boundary row.
  ASSERT_EQ(4, iter.requests()[2].count);
}

TEST_F(PagingIteratorTest, TestDeletedRowsAreSkipped) {
  KeyedRowList table = { MakeRow("k1"), MakeTombstone("k2"), MakeRow("k3") };
  TableIterator iter(table, 10);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ((vector<string>{ "k1", "k3" }), Keys(rows));
  ASSERT_EQ(2, iter.rows_seen());
}

TEST_F(PagingIteratorTest, TestDeletedRowOnPageBoundary) {
  KeyedRowList table = { MakeRow("k1"), MakeRow("k2"), MakeTombstone("k3"),
                         MakeRow("k4"), MakeRow("k5") };
  TableIterator iter(table, 3);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ((vector<string>{ "k1", "k2", "k4", "k5" }), Keys(rows));
  // The tombstone still moves the start of the next page.
  ASSERT_EQ("k3", iter.requests()[1].start_key);
}

TEST_F(PagingIteratorTest, TestGetAllIsRepeatable) {
  TableIterator iter(MakeRows(17), 5);
  KeyedRowList first;
  ASSERT_OK(iter.GetAll(&first));
  KeyedRowList second;
  ASSERT_OK(iter.GetAll(&second));
  ASSERT_EQ(17U, first.size());
  ASSERT_TRUE(first == second);
}

TEST_F(PagingIteratorTest, TestRewind) {
  TableIterator iter(MakeRows(7), 3);
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ(7U, rows.size());
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter.state());

  ASSERT_OK(iter.Rewind());
  ASSERT_EQ(PagingIterator::ACTIVE, iter.state());
  ASSERT_EQ(0, iter.rows_seen());
  ASSERT_EQ(1, iter.num_pages_fetched());
  ASSERT_EQ(Keys(rows), Keys(Drain(&iter)));
}

TEST_F(PagingIteratorTest, TestStartKeyIsInclusive) {
  TableIterator iter(MakeRows(10), 4, boost::none, Key(6));
  KeyedRowList rows = Drain(&iter);
  ASSERT_EQ((vector<string>{ Key(6), Key(7), Key(8), Key(9) }), Keys(rows));
}

// A page holding nothing but the boundary row ends the iteration rather
// than fetching the same page over and over.
TEST_F(PagingIteratorTest, TestBoundaryOnlyPageEndsIteration) {
  TableIterator stuck(KeyedRowList(), 2);
  stuck.AddScriptedPage({ MakeRow("a"), MakeRow("b") });
  stuck.AddScriptedPage({ MakeRow("b") });
  stuck.AddScriptedPage({ MakeRow("b") });
  KeyedRowList rows = Drain(&stuck);
  ASSERT_EQ((vector<string>{ "a", "b" }), Keys(rows));
  ASSERT_EQ(2, stuck.num_pages_fetched());
}

TEST_F(PagingIteratorTest, TestFetchFailure) {
  TableIterator iter(MakeRows(10), 3);
  iter.FailAtFetch(2);

  KeyedRow row;
  bool has_row;
  for (int i = 0; i < 3; i++) {
    ASSERT_OK(iter.Next(&row, &has_row));
    ASSERT_TRUE(has_row);
  }
  Status s = iter.Next(&row, &has_row);
  ASSERT_TRUE(s.IsTimedOut()) << s.ToString();
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter.state());

  ASSERT_OK(iter.Next(&row, &has_row));
  ASSERT_FALSE(has_row);
}

TEST_F(PagingIteratorTest, TestEmptyTable) {
  TableIterator iter(KeyedRowList(), 10);
  KeyedRowList rows;
  ASSERT_OK(iter.GetAll(&rows));
  ASSERT_TRUE(rows.empty());
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter.state());
}

} // namespace client
} // namespace cassc
