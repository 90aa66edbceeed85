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

#include "cassc/client/value.h"

#include <utility>

#include <glog/logging.h>

using std::string;

namespace cassc {
namespace client {

Value::Value()
    : kind_(STRING),
      int_(0) {
}

Value::Value(int v)
    : kind_(INT),
      int_(v) {
}

Value::Value(int64_t v)
    : kind_(INT),
      int_(v) {
}

Value::Value(const char* s)
    : kind_(STRING),
      int_(0),
      str_(s) {
}

Value::Value(string s)
    : kind_(STRING),
      int_(0),
      str_(std::move(s)) {
}

int64_t Value::int_value() const {
  DCHECK(is_int());
  return int_;
}

const string& Value::string_value() const {
  DCHECK(is_string());
  return str_;
}

string Value::ToString() const {
  return is_int() ? std::to_string(int_) : str_;
}

bool Value::operator<(const Value& other) const {
  if (kind_ != other.kind_) {
    return kind_ == INT;
  }
  return is_int() ? int_ < other.int_ : str_ < other.str_;
}

bool Value::operator==(const Value& other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  return is_int() ? int_ == other.int_ : str_ == other.str_;
}

std::ostream& operator<<(std::ostream& o, const Value& v) {
  return o << v.ToString();
}

} // namespace client
} // namespace cassc
