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

#include "cassc/client/schema.h"

#include "cassc/common/cassandra.pb.h"

using std::string;

namespace cassc {
namespace client {

namespace {

const char* const kSuperColumnType = "Super";

} // anonymous namespace

ColumnFamilySchema::ColumnFamilySchema()
    : is_super(false),
      column_type(BYTES),
      super_type(BYTES),
      data_type(BYTES) {
}

DataType ColumnFamilySchema::ValueTypeOf(const string& packed_column_name) const {
  auto it = column_data_types.find(packed_column_name);
  return it == column_data_types.end() ? BYTES : it->second;
}

KeyspaceSchema::KeyspaceSchema()
    : replication_factor(0) {
}

KeyspaceSchema KeyspaceSchema::FromKsDef(const KsDefPB& ks_def) {
  KeyspaceSchema schema;
  schema.name = ks_def.name();
  schema.placement_strategy = ks_def.strategy_class();
  schema.placement_strategy_options.insert(ks_def.strategy_options().begin(),
                                           ks_def.strategy_options().end());
  schema.replication_factor = ks_def.replication_factor();

  for (const CfDefPB& cf_def : ks_def.cf_defs()) {
    ColumnFamilySchema cf;
    cf.name = cf_def.name();
    cf.is_super = cf_def.column_type() == kSuperColumnType;
    if (cf.is_super) {
      cf.column_type = ExtractType(cf_def.subcomparator_type());
      cf.super_type = ExtractType(cf_def.comparator_type());
    } else {
      cf.column_type = ExtractType(cf_def.comparator_type());
    }
    cf.data_type = ExtractType(cf_def.default_validation_class());
    for (const ColumnDefPB& column : cf_def.column_metadata()) {
      cf.column_data_types[column.name()] = ExtractType(column.validation_class());
    }
    schema.column_families[cf.name] = std::move(cf);
  }
  return schema;
}

Status KeyspaceSchema::FindColumnFamily(const string& cf_name,
                                        const ColumnFamilySchema** schema) const {
  auto it = column_families.find(cf_name);
  if (it == column_families.end()) {
    return Status::NotFound("Schema for column family \"" + cf_name + "\" not found",
                            "keyspace " + name);
  }
  *schema = &it->second;
  return Status::OK();
}

} // namespace client
} // namespace cassc
