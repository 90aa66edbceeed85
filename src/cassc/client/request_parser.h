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
#ifndef CASSC_CLIENT_REQUEST_PARSER_H
#define CASSC_CLIENT_REQUEST_PARSER_H

#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cassc/util/status.h"

namespace cassc {
namespace client {

// A read request given as a single string. See RequestParser.
struct ParsedRequest {
  ParsedRequest();

  std::string column_family;
  std::string key;
  boost::optional<std::vector<std::string>> columns;
  boost::optional<std::string> start_column;
  boost::optional<std::string> end_column;
  bool reversed;
  int column_count;
  boost::optional<std::string> super_column;
};

// Parses read requests of the form
//
//   family.key[.supercolumn|[]][:columns][|count[R]]
//
// where 'columns' is a comma separated list of column names, a range
// "start-end", or a single column name, and a trailing R asks for the
// columns in reverse order. Some examples:
//
//   users.jane
//   users.jane:email,name
//   events.2011:100-200|50R
//   family\.name.key\:1:col\.1,col\|2|100
//
// The characters . : , - | are escaped with a backslash when they are part
// of a name.
class RequestParser {
 public:
  explicit RequestParser(int default_column_count);

  // Returns InvalidPattern for malformed requests.
  Status Parse(const std::string& request, ParsedRequest* parsed) const WARN_UNUSED_RESULT;

  // Splits "family.key" at the first unescaped dot. Returns InvalidPattern if
  // there is none.
  static Status SplitFamilyAndKey(const std::string& request,
                                  std::string* column_family,
                                  std::string* key) WARN_UNUSED_RESULT;

  // Backslash-escapes the request tokens in 'value'.
  static std::string Escape(const std::string& value);

  // Reverses Escape().
  static std::string Unescape(const std::string& value);

 private:
  const int default_column_count_;
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_REQUEST_PARSER_H
