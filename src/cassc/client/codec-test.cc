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

#include "cassc/client/codec.h"

#include <string>

#include <gtest/gtest.h>

#include "cassc/util/test_macros.h"

using std::string;

namespace cassc {
namespace client {

TEST(CodecTest, TestTypeNames) {
  ASSERT_EQ("org.apache.cassandra.db.marshal.UTF8Type", MarshalClassName(UTF8));
  ASSERT_EQ("org.apache.cassandra.db.marshal.BytesType", MarshalClassName(BYTES));
  ASSERT_EQ(string("TimeUUIDType"), DataTypeToString(TIME_UUID));

  ASSERT_EQ(LONG, ExtractType("org.apache.cassandra.db.marshal.LongType"));
  ASSERT_EQ(LEXICAL_UUID, ExtractType("org.apache.cassandra.db.marshal.LexicalUUIDType"));
  ASSERT_EQ(ASCII, ExtractType(MarshalClassName(ASCII)));
  // Unqualified and unknown names are treated as raw bytes.
  ASSERT_EQ(BYTES, ExtractType("LongType"));
  ASSERT_EQ(BYTES, ExtractType("org.example.CustomType"));
  ASSERT_EQ(BYTES, ExtractType(""));

  ASSERT_EQ(INTEGER, DataTypeFromName("IntegerType"));
  ASSERT_EQ(BYTES, DataTypeFromName("integer"));
}

TEST(CodecTest, TestPackLong) {
  string packed;
  ASSERT_OK(Pack(Value(1), LONG, &packed));
  ASSERT_EQ(string("\0\0\0\0\0\0\0\x01", 8), packed);

  ASSERT_OK(Pack(Value("-2"), LONG, &packed));
  ASSERT_EQ(string("\xff\xff\xff\xff\xff\xff\xff\xfe", 8), packed);

  Value unpacked;
  ASSERT_OK(Unpack(packed, LONG, &unpacked));
  ASSERT_TRUE(unpacked.is_int());
  ASSERT_EQ(-2, unpacked.int_value());
}

// Non-negative longs sort the same packed and unpacked.
TEST(CodecTest, TestPackedLongsSortNumerically) {
  string small;
  string large;
  ASSERT_OK(Pack(Value(255), LONG, &small));
  ASSERT_OK(Pack(Value(256), LONG, &large));
  ASSERT_LT(small, large);
}

TEST(CodecTest, TestPackBadNumbers) {
  string packed;
  Status s = Pack(Value("twelve"), LONG, &packed);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unable to pack LongType value");

  ASSERT_TRUE(Pack(Value(""), LONG, &packed).IsInvalidArgument());
  ASSERT_TRUE(Pack(Value("12abc"), INTEGER, &packed).IsInvalidArgument());
  ASSERT_TRUE(Pack(Value(int64_t{1} << 40), INTEGER, &packed).IsInvalidArgument());
}

TEST(CodecTest, TestPackInteger) {
  string packed;
  ASSERT_OK(Pack(Value(-1), INTEGER, &packed));
  ASSERT_EQ(string("\xff\xff\xff\xff", 4), packed);

  Value unpacked;
  ASSERT_OK(Unpack(packed, INTEGER, &unpacked));
  ASSERT_EQ(Value(-1), unpacked);

  ASSERT_OK(Pack(Value("70000"), INTEGER, &packed));
  ASSERT_OK(Unpack(packed, INTEGER, &unpacked));
  ASSERT_EQ(Value(70000), unpacked);
}

TEST(CodecTest, TestUnpackWrongSize) {
  Value unpacked;
  Status s = Unpack("abc", LONG, &unpacked);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_TRUE(Unpack("abcdefgh", INTEGER, &unpacked).IsCorruption());
}

TEST(CodecTest, TestPackUuid) {
  string packed;
  ASSERT_OK(Pack(Value("0123456789abcdef0123"), TIME_UUID, &packed));
  ASSERT_EQ(16U, packed.size());
  ASSERT_EQ("0123456789abcdef", packed);

  ASSERT_OK(Pack(Value("short"), LEXICAL_UUID, &packed));
  ASSERT_EQ(16U, packed.size());
  ASSERT_EQ(string("short\0\0\0\0\0\0\0\0\0\0\0", 16), packed);
}

TEST(CodecTest, TestPackText) {
  string packed;
  ASSERT_OK(Pack(Value(42), UTF8, &packed));
  ASSERT_EQ("42", packed);
  ASSERT_OK(Pack(Value("caf\xc3\xa9"), UTF8, &packed));
  ASSERT_EQ("caf\xc3\xa9", packed);

  Value unpacked;
  ASSERT_OK(Unpack(string("\0\x01", 2), BYTES, &unpacked));
  ASSERT_TRUE(unpacked.is_string());
  ASSERT_EQ(string("\0\x01", 2), unpacked.string_value());
}

} // namespace client
} // namespace cassc
