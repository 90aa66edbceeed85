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

#include "cassc/client/request_parser.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

using std::string;
using std::vector;

namespace cassc {
namespace client {

namespace {

const char kTokens[] = { '.', ':', ',', '-', '|' };

// Escaped tokens are swapped for these while a request is parsed so that the
// grammar only sees the unescaped ones.
char PlaceholderFor(size_t token_idx) {
  return static_cast<char>(0x01 + token_idx);
}

string ProtectEscapedTokens(const string& value) {
  string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); i++) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      bool replaced = false;
      for (size_t t = 0; t < sizeof(kTokens); t++) {
        if (value[i + 1] == kTokens[t]) {
          out.push_back(PlaceholderFor(t));
          replaced = true;
          break;
        }
      }
      if (replaced) {
        i++;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

string RestoreTokens(const string& value) {
  string out(value);
  for (char& c : out) {
    for (size_t t = 0; t < sizeof(kTokens); t++) {
      if (c == PlaceholderFor(t)) {
        c = kTokens[t];
        break;
      }
    }
  }
  return out;
}

string Trimmed(const string& s) {
  return RestoreTokens(boost::algorithm::trim_copy(s));
}

// Returns the offset of the trailing "|<digits>[R]" of 's', or string::npos
// when 's' does not end with one. Only the last '|' can start it.
string::size_type FindCountSuffix(const string& s) {
  string::size_type bar = s.rfind('|');
  if (bar == string::npos) {
    return string::npos;
  }
  string::size_type i = bar + 1;
  while (i < s.size() && isdigit(static_cast<unsigned char>(s[i]))) {
    i++;
  }
  if (i < s.size() && s[i] == 'R') {
    i++;
  }
  return i == s.size() ? bar : string::npos;
}

Status InvalidRequest(const string& request) {
  return Status::InvalidPattern("Invalid get request \"" + request + "\" provided");
}

} // anonymous namespace

ParsedRequest::ParsedRequest()
    : reversed(false),
      column_count(100) {
}

RequestParser::RequestParser(int default_column_count)
    : default_column_count_(default_column_count) {
}

Status RequestParser::Parse(const string& request, ParsedRequest* parsed) const {
  // Grammar: family.key[.super|[]][:columns][|count[R]]
  const string s = ProtectEscapedTokens(request);
  const string::size_type n = s.size();

  // Both the family and the key are non-empty, so the family ends at the
  // first dot past the first character and something must follow it.
  const string::size_type dot = n > 1 ? s.find('.', 1) : string::npos;
  if (dot == string::npos || dot + 1 == n) {
    return InvalidRequest(request);
  }
  const string::size_type count_pos = FindCountSuffix(s);

  // The key ends at the first separator that the rest of the request can follow.
  string::size_type pos = dot + 2;
  for (; pos < n; pos++) {
    if (pos == count_pos || s[pos] == '.' || s[pos] == ':') {
      break;
    }
    if (s[pos] == '[' && pos + 1 < n && s[pos + 1] == ']' &&
        (pos + 2 == n || s[pos + 2] == ':' || pos + 2 == count_pos)) {
      break;
    }
  }

  ParsedRequest result;
  result.column_family = RestoreTokens(s.substr(0, dot));
  result.key = RestoreTokens(s.substr(dot + 1, pos - dot - 1));
  result.column_count = default_column_count_;

  if (pos < n && s[pos] == '.') {
    string::size_type end = s.find(':', pos + 1);
    if (count_pos != string::npos && count_pos < end) {
      end = count_pos;
    }
    if (end == string::npos) {
      end = n;
    }
    if (end > pos + 1) {
      result.super_column = RestoreTokens(s.substr(pos + 1, end - pos - 1));
    }
    pos = end;
  } else if (pos < n && s[pos] == '[') {
    pos += 2;
  }

  if (pos < n && s[pos] == ':') {
    const string::size_type end =
        (count_pos != string::npos && count_pos > pos) ? count_pos : n;
    const string columns = s.substr(pos + 1, end - pos - 1);
    if (!columns.empty()) {
      vector<string> parts;
      if (columns.find(',') != string::npos) {
        boost::algorithm::split(parts, columns, boost::algorithm::is_any_of(","));
        vector<string> names;
        for (const string& part : parts) {
          names.push_back(Trimmed(part));
        }
        result.columns = std::move(names);
      } else if (columns.find('-') != string::npos) {
        boost::algorithm::split(parts, columns, boost::algorithm::is_any_of("-"));
        if (parts.size() > 2) {
          return Status::InvalidPattern("Expected no more than 2 columns to define a range",
                                        request);
        }
        result.start_column = Trimmed(parts[0]);
        result.end_column = Trimmed(parts[1]);
      } else {
        result.columns = vector<string>{ Trimmed(columns) };
      }
    }
    pos = end;
  }

  // Whatever is left is the "|count[R]" suffix.
  if (pos < n) {
    string::size_type digits_end = pos + 1;
    while (digits_end < n && isdigit(static_cast<unsigned char>(s[digits_end]))) {
      digits_end++;
    }
    if (digits_end > pos + 1) {
      const string digits = s.substr(pos + 1, digits_end - pos - 1);
      errno = 0;
      long count = strtol(digits.c_str(), nullptr, 10);
      if (errno == ERANGE || count > std::numeric_limits<int>::max()) {
        return Status::InvalidPattern("Column count " + digits + " is out of range", request);
      }
      // Counts must be positive to replace the default.
      if (count > 0) {
        result.column_count = static_cast<int>(count);
      }
    }
    result.reversed = digits_end < n;
  }

  *parsed = std::move(result);
  return Status::OK();
}

Status RequestParser::SplitFamilyAndKey(const string& request,
                                        string* column_family,
                                        string* key) {
  const string protected_request = ProtectEscapedTokens(request);
  string::size_type dot = protected_request.find('.');
  if (dot == string::npos) {
    return Status::InvalidPattern(
        "Unable to set \"" + request + "\", expected the column family name and "
        "key name separated by a fullstop");
  }
  *column_family = RestoreTokens(protected_request.substr(0, dot));
  *key = RestoreTokens(protected_request.substr(dot + 1));
  return Status::OK();
}

string RequestParser::Escape(const string& value) {
  string out;
  out.reserve(value.size());
  for (char c : value) {
    for (char token : kTokens) {
      if (c == token) {
        out.push_back('\\');
        break;
      }
    }
    out.push_back(c);
  }
  return out;
}

string RequestParser::Unescape(const string& value) {
  return RestoreTokens(ProtectEscapedTokens(value));
}

} // namespace client
} // namespace cassc
