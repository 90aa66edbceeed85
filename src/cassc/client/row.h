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
#ifndef CASSC_CLIENT_ROW_H
#define CASSC_CLIENT_ROW_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "cassc/client/value.h"

namespace cassc {
namespace client {

typedef std::map<Value, Value> ColumnMap;
typedef std::map<Value, ColumnMap> SuperColumnMap;

// The columns of one row. Whether a row holds plain columns or super columns
// is fixed by the column family it belongs to.
//
// A row without any columns stands for a deleted (tombstoned) row.
class Row {
 public:
  enum Kind {
    COLUMNS,
    SUPER_COLUMNS,
  };

  // An empty row of plain columns.
  Row();
  explicit Row(ColumnMap columns);
  explicit Row(SuperColumnMap super_columns);

  // An empty row of the given kind.
  static Row Empty(Kind kind);

  Kind kind() const { return kind_; }
  bool is_super() const { return kind_ == SUPER_COLUMNS; }

  // Whether the row has no columns (or no super columns) at all.
  bool empty() const;

  // Number of columns, or of super columns for super rows.
  size_t size() const;

  // REQUIRES: !is_super()
  const ColumnMap& columns() const;
  ColumnMap* mutable_columns();

  // REQUIRES: is_super()
  const SuperColumnMap& super_columns() const;
  SuperColumnMap* mutable_super_columns();

  // e.g. "{a=1, b=2}" or "{sc={a=1}}".
  std::string ToString() const;

  bool operator==(const Row& other) const;
  bool operator!=(const Row& other) const { return !(*this == other); }

 private:
  Kind kind_;
  ColumnMap columns_;
  SuperColumnMap super_columns_;
};

// A row together with its key.
struct KeyedRow {
  std::string key;
  Row row;

  bool operator==(const KeyedRow& other) const {
    return key == other.key && row == other.row;
  }
};

// Rows in the order the server returned them.
typedef std::vector<KeyedRow> KeyedRowList;

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_ROW_H
