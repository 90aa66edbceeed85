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

#include "cassc/client/row.h"

#include <string>

#include <gtest/gtest.h>

#include "cassc/client/value.h"

using std::string;

namespace cassc {
namespace client {

TEST(ValueTest, TestKinds) {
  Value empty;
  ASSERT_TRUE(empty.is_string());
  ASSERT_EQ("", empty.string_value());

  Value i(7);
  ASSERT_TRUE(i.is_int());
  ASSERT_EQ(7, i.int_value());
  ASSERT_EQ("7", i.ToString());

  Value s(string("seven"));
  ASSERT_EQ(Value::STRING, s.kind());
  ASSERT_EQ("seven", s.ToString());
}

TEST(ValueTest, TestOrdering) {
  // Integers sort before strings, numerically among themselves.
  ASSERT_TRUE(Value(100) < Value("1"));
  ASSERT_FALSE(Value("1") < Value(100));
  ASSERT_TRUE(Value(2) < Value(10));
  ASSERT_TRUE(Value(-5) < Value(0));
  ASSERT_TRUE(Value("10") < Value("2"));

  ASSERT_EQ(Value(1), Value(int64_t{1}));
  ASSERT_NE(Value(1), Value("1"));
}

TEST(RowTest, TestColumns) {
  Row row(ColumnMap{ { "b", 2 }, { "a", 1 } });
  ASSERT_FALSE(row.is_super());
  ASSERT_FALSE(row.empty());
  ASSERT_EQ(2U, row.size());
  ASSERT_EQ(Value(1), row.columns().at("a"));
  ASSERT_EQ("{a=1, b=2}", row.ToString());

  (*row.mutable_columns())["c"] = "three";
  ASSERT_EQ("{a=1, b=2, c=three}", row.ToString());
}

TEST(RowTest, TestSuperColumns) {
  Row row(SuperColumnMap{ { "sc1", ColumnMap{ { "a", 1 } } },
                          { "sc2", ColumnMap{ { "b", 2 }, { "c", 3 } } } });
  ASSERT_TRUE(row.is_super());
  ASSERT_EQ(2U, row.size());
  ASSERT_EQ("{sc1={a=1}, sc2={b=2, c=3}}", row.ToString());
}

TEST(RowTest, TestEmptyRows) {
  Row columns;
  ASSERT_TRUE(columns.empty());
  ASSERT_FALSE(columns.is_super());
  ASSERT_EQ("{}", columns.ToString());

  Row super_columns = Row::Empty(Row::SUPER_COLUMNS);
  ASSERT_TRUE(super_columns.empty());
  ASSERT_TRUE(super_columns.is_super());

  // Equal rows must also be of the same kind.
  ASSERT_TRUE(columns == Row(ColumnMap()));
  ASSERT_TRUE(columns != super_columns);
}

TEST(RowTest, TestKeyedRowEquality) {
  KeyedRow a{ "k1", Row(ColumnMap{ { "name", "a" } }) };
  KeyedRow b{ "k1", Row(ColumnMap{ { "name", "a" } }) };
  KeyedRow c{ "k2", Row(ColumnMap{ { "name", "a" } }) };
  ASSERT_TRUE(a == b);
  ASSERT_FALSE(a == c);
}

} // namespace client
} // namespace cassc
