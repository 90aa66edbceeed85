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

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>

using std::string;

namespace cassc {
namespace client {

namespace {

const size_t kUuidSize = 16;
const char* const kMarshalPackage = "org.apache.cassandra.db.marshal.";

void AppendBigEndian(uint64_t v, int num_bytes, string* out) {
  for (int shift = (num_bytes - 1) * 8; shift >= 0; shift -= 8) {
    out->push_back(static_cast<char>((v >> shift) & 0xff));
  }
}

uint64_t ReadBigEndian(const string& bytes) {
  uint64_t v = 0;
  for (char c : bytes) {
    v = (v << 8) | static_cast<uint8_t>(c);
  }
  return v;
}

// Parses the whole of 's' as a decimal integer.
Status ParseInt64(const string& s, int64_t* v) {
  if (s.empty()) {
    return Status::InvalidArgument("Cannot pack an empty string as a number");
  }
  errno = 0;
  char* end = nullptr;
  long long parsed = strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size()) {
    return Status::InvalidArgument("Not a 64-bit decimal integer", s);
  }
  *v = parsed;
  return Status::OK();
}

Status ToInt64(const Value& value, int64_t* v) {
  if (value.is_int()) {
    *v = value.int_value();
    return Status::OK();
  }
  return ParseInt64(value.string_value(), v);
}

} // anonymous namespace

const char* DataTypeToString(DataType type) {
  switch (type) {
    case BYTES: return "BytesType";
    case ASCII: return "AsciiType";
    case UTF8: return "UTF8Type";
    case LONG: return "LongType";
    case INTEGER: return "IntegerType";
    case LEXICAL_UUID: return "LexicalUUIDType";
    case TIME_UUID: return "TimeUUIDType";
  }
  return "UNKNOWN";
}

string MarshalClassName(DataType type) {
  return string(kMarshalPackage) + DataTypeToString(type);
}

DataType DataTypeFromName(const string& name) {
  for (DataType t : { ASCII, UTF8, LONG, INTEGER, LEXICAL_UUID, TIME_UUID }) {
    if (name == DataTypeToString(t)) {
      return t;
    }
  }
  return BYTES;
}

DataType ExtractType(const string& class_name) {
  string::size_type dot = class_name.rfind('.');
  if (dot == string::npos) {
    return BYTES;
  }
  return DataTypeFromName(class_name.substr(dot + 1));
}

Status Pack(const Value& value, DataType type, string* bytes) {
  bytes->clear();
  switch (type) {
    case LONG: {
      int64_t v;
      RETURN_NOT_OK_PREPEND(ToInt64(value, &v), "Unable to pack LongType value");
      AppendBigEndian(static_cast<uint64_t>(v), 8, bytes);
      return Status::OK();
    }
    case INTEGER: {
      int64_t v;
      RETURN_NOT_OK_PREPEND(ToInt64(value, &v), "Unable to pack IntegerType value");
      if (v < std::numeric_limits<int32_t>::min() ||
          v > std::numeric_limits<int32_t>::max()) {
        return Status::InvalidArgument("IntegerType value out of 32-bit range",
                                       std::to_string(v));
      }
      AppendBigEndian(static_cast<uint32_t>(static_cast<int32_t>(v)), 4, bytes);
      return Status::OK();
    }
    case LEXICAL_UUID:
    case TIME_UUID:
      *bytes = value.ToString();
      bytes->resize(kUuidSize, '\0');
      return Status::OK();
    case ASCII:
    case UTF8:
    case BYTES:
      *bytes = value.ToString();
      return Status::OK();
  }
  return Status::InvalidArgument("Unknown data type", std::to_string(type));
}

Status Unpack(const string& bytes, DataType type, Value* value) {
  switch (type) {
    case LONG:
      if (bytes.size() != 8) {
        return Status::Corruption("LongType value must be 8 bytes long, got",
                                  std::to_string(bytes.size()));
      }
      *value = Value(static_cast<int64_t>(ReadBigEndian(bytes)));
      return Status::OK();
    case INTEGER:
      if (bytes.size() != 4) {
        return Status::Corruption("IntegerType value must be 4 bytes long, got",
                                  std::to_string(bytes.size()));
      }
      *value = Value(static_cast<int64_t>(
          static_cast<int32_t>(static_cast<uint32_t>(ReadBigEndian(bytes)))));
      return Status::OK();
    case LEXICAL_UUID:
    case TIME_UUID:
    case ASCII:
    case UTF8:
    case BYTES:
      *value = Value(bytes);
      return Status::OK();
  }
  return Status::InvalidArgument("Unknown data type", std::to_string(type));
}

} // namespace client
} // namespace cassc
