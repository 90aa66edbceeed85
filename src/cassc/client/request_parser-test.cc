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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cassc/util/test_macros.h"

using std::string;
using std::vector;

namespace cassc {
namespace client {

class RequestParserTest : public ::testing::Test {
 public:
  RequestParserTest()
      : parser_(100) {
  }

 protected:
  RequestParser parser_;
};

TEST_F(RequestParserTest, TestWholeRow) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users.jsmith", &req));
  ASSERT_EQ("Users", req.column_family);
  ASSERT_EQ("jsmith", req.key);
  ASSERT_FALSE(req.columns);
  ASSERT_FALSE(req.start_column);
  ASSERT_FALSE(req.end_column);
  ASSERT_FALSE(req.super_column);
  ASSERT_FALSE(req.reversed);
  ASSERT_EQ(100, req.column_count);
}

TEST_F(RequestParserTest, TestColumnList) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users.jsmith:email, name ,age", &req));
  ASSERT_EQ("jsmith", req.key);
  ASSERT_TRUE(req.columns);
  ASSERT_EQ((vector<string>{ "email", "name", "age" }), *req.columns);

  ASSERT_OK(parser_.Parse("Users.jsmith:email", &req));
  ASSERT_EQ((vector<string>{ "email" }), *req.columns);
}

TEST_F(RequestParserTest, TestColumnRange) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users.jsmith:a - f", &req));
  ASSERT_FALSE(req.columns);
  ASSERT_EQ("a", *req.start_column);
  ASSERT_EQ("f", *req.end_column);

  // Open ended ranges.
  ASSERT_OK(parser_.Parse("Users.jsmith:m-", &req));
  ASSERT_EQ("m", *req.start_column);
  ASSERT_EQ("", *req.end_column);
}

TEST_F(RequestParserTest, TestRangeWithTooManyBounds) {
  ParsedRequest req;
  Status s = parser_.Parse("Users.jsmith:a-b-c", &req);
  ASSERT_TRUE(s.IsInvalidPattern()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Expected no more than 2 columns to define a range");
}

TEST_F(RequestParserTest, TestCountAndOrder) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users.jsmith|5", &req));
  ASSERT_EQ(5, req.column_count);
  ASSERT_FALSE(req.reversed);

  ASSERT_OK(parser_.Parse("Users.jsmith:a-z|20R", &req));
  ASSERT_EQ(20, req.column_count);
  ASSERT_TRUE(req.reversed);
  ASSERT_EQ("a", *req.start_column);
  ASSERT_EQ("z", *req.end_column);

  ASSERT_OK(parser_.Parse("Users.jsmith|R", &req));
  ASSERT_EQ(100, req.column_count);
  ASSERT_TRUE(req.reversed);

  // Counts must be positive to replace the default.
  ASSERT_OK(parser_.Parse("Users.jsmith|0", &req));
  ASSERT_EQ(100, req.column_count);
}

TEST_F(RequestParserTest, TestCountOutOfRange) {
  ParsedRequest req;
  Status s = parser_.Parse("Users.jsmith|99999999999", &req);
  ASSERT_TRUE(s.IsInvalidPattern()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Column count 99999999999 is out of range");

  s = parser_.Parse("Users.jsmith:a-z|99999999999999999999999R", &req);
  ASSERT_TRUE(s.IsInvalidPattern()) << s.ToString();

  ASSERT_OK(parser_.Parse("Users.jsmith|2147483647", &req));
  ASSERT_EQ(2147483647, req.column_count);
}

TEST_F(RequestParserTest, TestDefaultColumnCount) {
  RequestParser parser(25);
  ParsedRequest req;
  ASSERT_OK(parser.Parse("Users.jsmith", &req));
  ASSERT_EQ(25, req.column_count);
}

TEST_F(RequestParserTest, TestSuperColumn) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Posts.jsmith.2011-01-01:title,body", &req));
  ASSERT_EQ("Posts", req.column_family);
  ASSERT_EQ("jsmith", req.key);
  ASSERT_EQ("2011-01-01", *req.super_column);
  ASSERT_EQ((vector<string>{ "title", "body" }), *req.columns);

  // "[]" stands for all super columns of the row.
  ASSERT_OK(parser_.Parse("Posts.jsmith[]:title", &req));
  ASSERT_EQ("jsmith", req.key);
  ASSERT_FALSE(req.super_column);
  ASSERT_EQ((vector<string>{ "title" }), *req.columns);
}

TEST_F(RequestParserTest, TestLongKey) {
  const string key(65536, 'k');
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users." + key + ":name", &req));
  ASSERT_EQ("Users", req.column_family);
  ASSERT_EQ(65536U, req.key.size());
  ASSERT_EQ(key, req.key);
  ASSERT_EQ((vector<string>{ "name" }), *req.columns);

  ASSERT_OK(parser_.Parse("Posts." + key + "." + key + "|3R", &req));
  ASSERT_EQ(key, req.key);
  ASSERT_EQ(key, *req.super_column);
  ASSERT_FALSE(req.columns);
  ASSERT_EQ(3, req.column_count);
  ASSERT_TRUE(req.reversed);
}

TEST_F(RequestParserTest, TestSeparatorsInsideSegments) {
  ParsedRequest req;
  // A '|' which does not start the trailing count belongs to the segment.
  ASSERT_OK(parser_.Parse("Users.a|b", &req));
  ASSERT_EQ("a|b", req.key);
  ASSERT_EQ(100, req.column_count);

  ASSERT_OK(parser_.Parse("Users.jsmith:x|y|7", &req));
  ASSERT_EQ((vector<string>{ "x|y" }), *req.columns);
  ASSERT_EQ(7, req.column_count);

  // "[]" only ends the key when a valid suffix follows it.
  ASSERT_OK(parser_.Parse("Users.a[]b", &req));
  ASSERT_EQ("a[]b", req.key);
  ASSERT_FALSE(req.super_column);

  // An empty super column is the same as none.
  ASSERT_OK(parser_.Parse("Posts.jsmith.:title", &req));
  ASSERT_FALSE(req.super_column);
  ASSERT_EQ((vector<string>{ "title" }), *req.columns);
}

TEST_F(RequestParserTest, TestEscapedTokens) {
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users.john\\.smith:first\\-name,last\\,name", &req));
  ASSERT_EQ("john.smith", req.key);
  ASSERT_EQ((vector<string>{ "first-name", "last,name" }), *req.columns);
}

TEST_F(RequestParserTest, TestInvalidRequests) {
  ParsedRequest req;
  Status s = parser_.Parse("Users", &req);
  ASSERT_TRUE(s.IsInvalidPattern()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Invalid get request \"Users\" provided");

  ASSERT_TRUE(parser_.Parse(".jsmith", &req).IsInvalidPattern());
  ASSERT_TRUE(parser_.Parse("", &req).IsInvalidPattern());
  ASSERT_TRUE(parser_.Parse("Users.", &req).IsInvalidPattern());
}

TEST_F(RequestParserTest, TestSplitFamilyAndKey) {
  string family;
  string key;
  ASSERT_OK(RequestParser::SplitFamilyAndKey("Users.jsmith", &family, &key));
  ASSERT_EQ("Users", family);
  ASSERT_EQ("jsmith", key);

  ASSERT_OK(RequestParser::SplitFamilyAndKey("Users.john.smith", &family, &key));
  ASSERT_EQ("Users", family);
  ASSERT_EQ("john.smith", key);

  ASSERT_OK(RequestParser::SplitFamilyAndKey("Dotted\\.Family.key", &family, &key));
  ASSERT_EQ("Dotted.Family", family);
  ASSERT_EQ("key", key);

  Status s = RequestParser::SplitFamilyAndKey("Users", &family, &key);
  ASSERT_TRUE(s.IsInvalidPattern()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(),
                      "expected the column family name and key name separated by a fullstop");
}

TEST_F(RequestParserTest, TestEscape) {
  ASSERT_EQ("a\\.b\\:c\\,d\\-e\\|f", RequestParser::Escape("a.b:c,d-e|f"));
  ASSERT_EQ("plain", RequestParser::Escape("plain"));
  ASSERT_EQ("a.b:c,d-e|f", RequestParser::Unescape("a\\.b\\:c\\,d\\-e\\|f"));
  // Backslashes before anything else are kept.
  ASSERT_EQ("a\\b", RequestParser::Unescape("a\\b"));

  const string key = "2011.01:01";
  ParsedRequest req;
  ASSERT_OK(parser_.Parse("Users." + RequestParser::Escape(key), &req));
  ASSERT_EQ(key, req.key);
}

} // namespace client
} // namespace cassc
