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
//
// Conversion between caller-facing values and the bytes stored by the
// server, driven by the marshal types declared in the schema.
#ifndef CASSC_CLIENT_CODEC_H
#define CASSC_CLIENT_CODEC_H

#include <string>

#include "cassc/client/value.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

enum DataType {
  BYTES,
  ASCII,
  UTF8,
  // 8 bytes, big-endian two's complement.
  LONG,
  // 4 bytes, big-endian two's complement.
  INTEGER,
  // 16 raw bytes.
  LEXICAL_UUID,
  TIME_UUID,
};

// Returns the server-side name of 'type', e.g. "UTF8Type".
const char* DataTypeToString(DataType type);

// Returns the fully qualified server class of 'type', e.g.
// "org.apache.cassandra.db.marshal.UTF8Type".
std::string MarshalClassName(DataType type);

// Maps a server marshal class name to a DataType. Only the part after the
// last dot is considered, so "org.apache.cassandra.db.marshal.LongType" and
// "x.LongType" both give LONG. Empty names, names without a dot and unknown
// types give BYTES.
DataType ExtractType(const std::string& class_name);

// Like ExtractType(), for names which are already reduced to the simple
// class name ("LongType"). Unknown names give BYTES.
DataType DataTypeFromName(const std::string& name);

// Encodes 'value' as 'type'.
//
// Integers given for string types are rendered in decimal; strings given for
// LONG or INTEGER must hold a decimal number. Returns InvalidArgument for
// values which cannot be represented.
Status Pack(const Value& value, DataType type, std::string* bytes) WARN_UNUSED_RESULT;

// Decodes 'bytes' stored as 'type'. LONG and INTEGER produce integers,
// everything else a string. Returns Corruption if 'bytes' has the wrong size
// for a fixed-width type.
Status Unpack(const std::string& bytes, DataType type, Value* value) WARN_UNUSED_RESULT;

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_CODEC_H
