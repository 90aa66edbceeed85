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
#ifndef CASSC_CLIENT_SCHEMA_H
#define CASSC_CLIENT_SCHEMA_H

#include <map>
#include <string>

#include "cassc/client/codec.h"
#include "cassc/util/status.h"

namespace cassc {

class KsDefPB;

namespace client {

// Type information about one column family, as needed to pack and unpack
// its column names and values.
struct ColumnFamilySchema {
  ColumnFamilySchema();

  std::string name;
  bool is_super;

  // Type of plain column names. In super families, of the sub column names.
  DataType column_type;

  // Type of super column names. Only meaningful when 'is_super' is set.
  DataType super_type;

  // Type of values of columns without their own validation class.
  DataType data_type;

  // Column name (as stored) -> validation type.
  std::map<std::string, DataType> column_data_types;

  // The type that top-level names are packed with: super_type for super
  // families, column_type otherwise.
  DataType name_type() const {
    return is_super ? super_type : column_type;
  }

  // The validation type of 'packed_column_name', falling back to BYTES.
  DataType ValueTypeOf(const std::string& packed_column_name) const;
};

struct KeyspaceSchema {
  KeyspaceSchema();

  // Builds the schema of a keyspace from its server-side definition.
  static KeyspaceSchema FromKsDef(const KsDefPB& ks_def);

  // Returns NotFound if the keyspace has no column family 'name'.
  Status FindColumnFamily(const std::string& name,
                          const ColumnFamilySchema** schema) const WARN_UNUSED_RESULT;

  std::string name;
  std::string placement_strategy;
  std::map<std::string, std::string> placement_strategy_options;
  int replication_factor;
  std::map<std::string, ColumnFamilySchema> column_families;
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_SCHEMA_H
