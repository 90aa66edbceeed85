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

#include <sstream>
#include <utility>

#include <glog/logging.h>

using std::string;

namespace cassc {
namespace client {

namespace {

void AppendColumns(const ColumnMap& columns, std::ostringstream* out) {
  *out << "{";
  bool first = true;
  for (const auto& column : columns) {
    if (!first) *out << ", ";
    first = false;
    *out << column.first << "=" << column.second;
  }
  *out << "}";
}

} // anonymous namespace

Row::Row()
    : kind_(COLUMNS) {
}

Row::Row(ColumnMap columns)
    : kind_(COLUMNS),
      columns_(std::move(columns)) {
}

Row::Row(SuperColumnMap super_columns)
    : kind_(SUPER_COLUMNS),
      super_columns_(std::move(super_columns)) {
}

Row Row::Empty(Kind kind) {
  return kind == SUPER_COLUMNS ? Row(SuperColumnMap()) : Row(ColumnMap());
}

bool Row::empty() const {
  return size() == 0;
}

size_t Row::size() const {
  return is_super() ? super_columns_.size() : columns_.size();
}

const ColumnMap& Row::columns() const {
  DCHECK(!is_super());
  return columns_;
}

ColumnMap* Row::mutable_columns() {
  DCHECK(!is_super());
  return &columns_;
}

const SuperColumnMap& Row::super_columns() const {
  DCHECK(is_super());
  return super_columns_;
}

SuperColumnMap* Row::mutable_super_columns() {
  DCHECK(is_super());
  return &super_columns_;
}

string Row::ToString() const {
  std::ostringstream out;
  if (!is_super()) {
    AppendColumns(columns_, &out);
    return out.str();
  }
  out << "{";
  bool first = true;
  for (const auto& super_column : super_columns_) {
    if (!first) out << ", ";
    first = false;
    out << super_column.first << "=";
    AppendColumns(super_column.second, &out);
  }
  out << "}";
  return out.str();
}

bool Row::operator==(const Row& other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  return is_super() ? super_columns_ == other.super_columns_
                    : columns_ == other.columns_;
}

} // namespace client
} // namespace cassc
