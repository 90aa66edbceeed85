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
#ifndef CASSC_CLIENT_VALUE_H
#define CASSC_CLIENT_VALUE_H

#include <cstdint>
#include <ostream>
#include <string>

namespace cassc {
namespace client {

// A column name, column value or super column name as seen by callers:
// either a signed 64-bit integer or a byte string.
//
// Values are totally ordered: integers sort before strings, integers
// numerically and strings bytewise.
class Value {
 public:
  enum Kind {
    INT,
    STRING,
  };

  // An empty string.
  Value();

  // Implicit so that rows can be written as brace-initialized maps.
  Value(int v); // NOLINT(runtime/explicit)
  Value(int64_t v); // NOLINT(runtime/explicit)
  Value(const char* s); // NOLINT(runtime/explicit)
  Value(std::string s); // NOLINT(runtime/explicit)

  Kind kind() const { return kind_; }
  bool is_int() const { return kind_ == INT; }
  bool is_string() const { return kind_ == STRING; }

  // REQUIRES: is_int()
  int64_t int_value() const;

  // REQUIRES: is_string()
  const std::string& string_value() const;

  // Integers in decimal, strings as they are.
  std::string ToString() const;

  bool operator<(const Value& other) const;
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  Kind kind_;
  int64_t int_;
  std::string str_;
};

std::ostream& operator<<(std::ostream& o, const Value& v);

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_VALUE_H
