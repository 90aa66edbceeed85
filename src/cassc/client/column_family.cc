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

#include "cassc/client/column_family.h"

#include <utility>

#include <glog/logging.h>

#include "cassc/client/client.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/monotime.h"

using boost::optional;
using google::protobuf::RepeatedPtrField;
using std::string;
using std::unique_ptr;
using std::vector;

namespace cassc {
namespace client {

namespace {

const int kDefaultColumnCount = 100;

bool IsEmptyString(const Value& v) {
  return v.is_string() && v.string_value().empty();
}

Status CheckColumnsOrRange(const ReadOptions& options) {
  if (options.columns && options.start_column) {
    return Status::InvalidRequest(
        "You can define either a list of columns or the start and end columns "
        "for a range but not both at the same time");
  }
  return Status::OK();
}

} // anonymous namespace

ReadOptions::ReadOptions()
    : reversed(false),
      column_count(kDefaultColumnCount) {
}

////////////////////////////////////////////////////////////
// ColumnFamily::Types
////////////////////////////////////////////////////////////

DataType ColumnFamily::Types::name_type() const {
  if (schema.is_super && !in_super_column) {
    return schema.super_type;
  }
  return schema.column_type;
}

Status ColumnFamily::Types::PackName(const Value& name, string* packed) const {
  if (!autopack) {
    *packed = name.ToString();
    return Status::OK();
  }
  return Pack(name, name_type(), packed);
}

Status ColumnFamily::Types::PackValue(const string& packed_name, const Value& value,
                                      string* packed) const {
  if (!autopack) {
    *packed = value.ToString();
    return Status::OK();
  }
  return Pack(value, schema.ValueTypeOf(packed_name), packed);
}

Status ColumnFamily::Types::UnpackColumn(const ColumnPB& column, ColumnMap* columns) const {
  if (!autopack) {
    (*columns)[Value(column.name())] = Value(column.value());
    return Status::OK();
  }
  Value name;
  Value value;
  RETURN_NOT_OK(Unpack(column.name(), schema.column_type, &name));
  RETURN_NOT_OK(Unpack(column.value(), schema.ValueTypeOf(column.name()), &value));
  (*columns)[std::move(name)] = std::move(value);
  return Status::OK();
}

Status ColumnFamily::Types::DecodeColumns(
    const RepeatedPtrField<ColumnOrSuperColumnPB>& columns, Row* row) const {
  const bool super_row = schema.is_super && !in_super_column;
  Row result = Row::Empty(super_row ? Row::SUPER_COLUMNS : Row::COLUMNS);
  for (const ColumnOrSuperColumnPB& cosc : columns) {
    if (cosc.has_column() && !super_row) {
      RETURN_NOT_OK(UnpackColumn(cosc.column(), result.mutable_columns()));
    } else if (cosc.has_super_column() && super_row) {
      const SuperColumnPB& sc = cosc.super_column();
      Value super_name(sc.name());
      if (autopack) {
        RETURN_NOT_OK(Unpack(sc.name(), schema.super_type, &super_name));
      }
      ColumnMap* sub_columns = &(*result.mutable_super_columns())[super_name];
      for (const ColumnPB& column : sc.columns()) {
        RETURN_NOT_OK(UnpackColumn(column, sub_columns));
      }
    } else {
      return Status::Corruption("Unexpected column in response for column family " +
                                schema.name, cosc.ShortDebugString());
    }
  }
  *row = std::move(result);
  return Status::OK();
}

////////////////////////////////////////////////////////////
// ColumnFamily
////////////////////////////////////////////////////////////

ColumnFamily::ColumnFamily(Client* client, string name, bool autopack)
    : client_(client),
      name_(std::move(name)),
      autopack_(autopack),
      read_consistency_(ONE),
      write_consistency_(ONE),
      schema_(nullptr) {
  DCHECK(client_);
}

ColumnFamily::~ColumnFamily() {
}

Status ColumnFamily::GetSchema(bool use_cache, const ColumnFamilySchema** schema) {
  if (schema_ == nullptr || !use_cache) {
    std::shared_ptr<const KeyspaceSchema> keyspace_schema;
    RETURN_NOT_OK(client_->GetKeyspaceSchema("", use_cache, &keyspace_schema));
    const ColumnFamilySchema* cf_schema;
    RETURN_NOT_OK(keyspace_schema->FindColumnFamily(name_, &cf_schema));
    keyspace_schema_ = std::move(keyspace_schema);
    schema_ = cf_schema;
  }
  *schema = schema_;
  return Status::OK();
}

void ColumnFamily::ResetSchema() {
  schema_ = nullptr;
  keyspace_schema_.reset();
}

Status ColumnFamily::GetColumnNameType(DataType* type) {
  const ColumnFamilySchema* schema;
  RETURN_NOT_OK(GetSchema(true, &schema));
  *type = schema->name_type();
  return Status::OK();
}

Status ColumnFamily::GetColumnValueType(const Value& column, DataType* type) {
  const ColumnFamilySchema* schema;
  RETURN_NOT_OK(GetSchema(true, &schema));
  string packed;
  RETURN_NOT_OK(Pack(column, schema->name_type(), &packed));
  *type = schema->ValueTypeOf(packed);
  return Status::OK();
}

Status ColumnFamily::GetTypes(const optional<Value>& super_column, Types* types) {
  const ColumnFamilySchema* schema;
  RETURN_NOT_OK(GetSchema(true, &schema));
  if (super_column && !schema->is_super) {
    return Status::InvalidRequest("Column family " + name_ + " has no super columns");
  }
  types->autopack = autopack_;
  types->schema = *schema;
  types->in_super_column = static_cast<bool>(super_column);
  return Status::OK();
}

Status ColumnFamily::BuildColumnParent(const Types& types,
                                       const optional<Value>& super_column,
                                       ColumnParentPB* parent) const {
  parent->set_column_family(name_);
  if (super_column) {
    string packed = super_column->ToString();
    if (autopack_) {
      RETURN_NOT_OK(Pack(*super_column, types.schema.super_type, &packed));
    }
    parent->set_super_column(packed);
  }
  return Status::OK();
}

Status ColumnFamily::BuildSlicePredicate(const Types& types, const ReadOptions& options,
                                         SlicePredicatePB* predicate) const {
  if (options.columns) {
    for (const Value& column : *options.columns) {
      RETURN_NOT_OK(types.PackName(column, predicate->add_column_names()));
    }
    return Status::OK();
  }

  SliceRangePB* range = predicate->mutable_slice_range();
  string start;
  string finish;
  if (options.start_column && !IsEmptyString(*options.start_column)) {
    RETURN_NOT_OK(types.PackName(*options.start_column, &start));
  }
  if (options.end_column && !IsEmptyString(*options.end_column)) {
    RETURN_NOT_OK(types.PackName(*options.end_column, &finish));
  }
  range->set_start(start);
  range->set_finish(finish);
  range->set_reversed(options.reversed);
  range->set_count(options.column_count);
  return Status::OK();
}

Status ColumnFamily::BuildIndexClause(const Types& types, const WhereClause& where,
                                      int count, IndexClausePB* clause) const {
  if (where.empty()) {
    return Status::InvalidRequest("An index query needs at least one condition");
  }
  for (const IndexCondition& cond : where) {
    IndexExpressionPB* expr = clause->add_expressions();
    RETURN_NOT_OK(types.PackName(cond.column, expr->mutable_column_name()));
    expr->set_op(cond.op);
    RETURN_NOT_OK(types.PackValue(expr->column_name(), cond.value, expr->mutable_value()));
  }
  clause->set_start_key("");
  clause->set_count(count);
  return Status::OK();
}

Status ColumnFamily::BuildMutations(const Types& types, const Row& columns,
                                    const WriteOptions& options,
                                    RowMutationsPB* mutations) const {
  if (columns.empty()) {
    return Status::InvalidRequest("No columns given to write to " + name_);
  }
  if (columns.is_super() != types.schema.is_super) {
    return Status::InvalidRequest(
        columns.is_super() ? "Cannot write super columns to standard column family " + name_
                           : "Cannot write plain columns to super column family " + name_);
  }
  const int64_t timestamp = options.timestamp ? *options.timestamp : GetCurrentTimeMicros();

  auto build_column = [&](const Types& t, const Value& name, const Value& value,
                          ColumnPB* column) {
    RETURN_NOT_OK(t.PackName(name, column->mutable_name()));
    RETURN_NOT_OK(t.PackValue(column->name(), value, column->mutable_value()));
    column->set_timestamp(timestamp);
    if (options.ttl) {
      column->set_ttl(*options.ttl);
    }
    return Status::OK();
  };

  if (!columns.is_super()) {
    for (const auto& column : columns.columns()) {
      ColumnPB* pb = mutations->add_mutations()->mutable_column_or_supercolumn()
          ->mutable_column();
      RETURN_NOT_OK(build_column(types, column.first, column.second, pb));
    }
    return Status::OK();
  }

  Types sub_types = types;
  sub_types.in_super_column = true;
  for (const auto& super_column : columns.super_columns()) {
    SuperColumnPB* pb = mutations->add_mutations()->mutable_column_or_supercolumn()
        ->mutable_super_column();
    RETURN_NOT_OK(types.PackName(super_column.first, pb->mutable_name()));
    for (const auto& column : super_column.second) {
      RETURN_NOT_OK(build_column(sub_types, column.first, column.second, pb->add_columns()));
    }
  }
  return Status::OK();
}

RowDecoder ColumnFamily::MakeRowDecoder(const Types& types) const {
  return [types](const KeySlicePB& slice, KeyedRow* row) {
    row->key = slice.key();
    return types.DecodeColumns(slice.columns(), &row->row);
  };
}

Status ColumnFamily::Get(const string& key, const ReadOptions& options,
                         Row* row, bool* found) {
  RETURN_NOT_OK(CheckColumnsOrRange(options));
  Types types;
  RETURN_NOT_OK(GetTypes(options.super_column, &types));

  GetSliceRequestPB req;
  req.set_key(key);
  RETURN_NOT_OK(BuildColumnParent(types, options.super_column, req.mutable_column_parent()));
  RETURN_NOT_OK(BuildSlicePredicate(types, options, req.mutable_predicate()));
  req.set_consistency_level(options.consistency ? *options.consistency : read_consistency_);

  GetSliceResponsePB resp;
  RETURN_NOT_OK(client_->Call(rpc::kGetSliceMethod, req, &resp));
  if (resp.columns_size() == 0) {
    *found = false;
    return Status::OK();
  }
  RETURN_NOT_OK(types.DecodeColumns(resp.columns(), row));
  *found = true;
  return Status::OK();
}

Status ColumnFamily::GetAll(const string& key, const optional<Value>& super_column,
                            Row* row, bool* found) {
  ReadOptions options;
  options.super_column = super_column;
  return Get(key, options, row, found);
}

Status ColumnFamily::GetColumns(const string& key, const vector<Value>& columns,
                                const optional<Value>& super_column,
                                Row* row, bool* found) {
  ReadOptions options;
  options.columns = columns;
  options.super_column = super_column;
  return Get(key, options, row, found);
}

Status ColumnFamily::GetColumnRange(const string& key,
                                    const Value& start_column,
                                    const Value& end_column,
                                    const optional<Value>& super_column,
                                    Row* row, bool* found) {
  ReadOptions options;
  options.start_column = start_column;
  options.end_column = end_column;
  options.super_column = super_column;
  return Get(key, options, row, found);
}

Status ColumnFamily::GetMultiple(const vector<string>& keys, const ReadOptions& options,
                                 KeyedRowList* rows) {
  RETURN_NOT_OK(CheckColumnsOrRange(options));
  Types types;
  RETURN_NOT_OK(GetTypes(options.super_column, &types));

  MultigetSliceRequestPB req;
  for (const string& key : keys) {
    req.add_keys(key);
  }
  RETURN_NOT_OK(BuildColumnParent(types, options.super_column, req.mutable_column_parent()));
  RETURN_NOT_OK(BuildSlicePredicate(types, options, req.mutable_predicate()));
  req.set_consistency_level(options.consistency ? *options.consistency : read_consistency_);

  MultigetSliceResponsePB resp;
  RETURN_NOT_OK(client_->Call(rpc::kMultigetSliceMethod, req, &resp));
  KeyedRowList result;
  for (const KeySlicePB& slice : resp.rows()) {
    if (slice.columns_size() == 0) {
      continue;
    }
    KeyedRow row;
    row.key = slice.key();
    RETURN_NOT_OK(types.DecodeColumns(slice.columns(), &row.row));
    result.emplace_back(std::move(row));
  }
  rows->swap(result);
  return Status::OK();
}

Status ColumnFamily::GetWhere(const WhereClause& where, const ReadOptions& options,
                              optional<int64_t> row_count_limit,
                              unique_ptr<PagingIterator>* iter) {
  RETURN_NOT_OK(CheckColumnsOrRange(options));
  Types types;
  RETURN_NOT_OK(GetTypes(options.super_column, &types));

  GetIndexedSlicesRequestPB req;
  RETURN_NOT_OK(BuildColumnParent(types, options.super_column, req.mutable_column_parent()));
  // Index expressions always refer to top-level columns.
  Types index_types = types;
  index_types.in_super_column = false;
  RETURN_NOT_OK(BuildIndexClause(index_types, where, options.column_count,
                                 req.mutable_index_clause()));
  RETURN_NOT_OK(BuildSlicePredicate(types, options, req.mutable_column_predicate()));
  req.set_consistency_level(options.consistency ? *options.consistency : read_consistency_);

  return IndexedSlicesIterator::Create(client_->dispatcher(), std::move(req),
                                       MakeRowDecoder(types), options.column_count,
                                       std::move(row_count_limit), iter);
}

Status ColumnFamily::GetKeyRange(const string& start_key, const string& end_key,
                                 const ReadOptions& options,
                                 optional<int64_t> row_count_limit,
                                 int page_size,
                                 unique_ptr<PagingIterator>* iter) {
  RETURN_NOT_OK(CheckColumnsOrRange(options));
  Types types;
  RETURN_NOT_OK(GetTypes(options.super_column, &types));

  GetRangeSlicesRequestPB req;
  RETURN_NOT_OK(BuildColumnParent(types, options.super_column, req.mutable_column_parent()));
  RETURN_NOT_OK(BuildSlicePredicate(types, options, req.mutable_predicate()));
  KeyRangePB* range = req.mutable_range();
  range->set_start_key(start_key);
  range->set_end_key(end_key);
  range->set_count(page_size);
  req.set_consistency_level(options.consistency ? *options.consistency : read_consistency_);

  return KeyRangeIterator::Create(client_->dispatcher(), std::move(req),
                                  MakeRowDecoder(types), page_size,
                                  std::move(row_count_limit), iter);
}

Status ColumnFamily::Set(const string& key, const Row& columns, const WriteOptions& options) {
  Types types;
  RETURN_NOT_OK(GetTypes(boost::none, &types));

  BatchMutateRequestPB req;
  RowMutationsPB* row_mutations = req.add_mutations();
  row_mutations->set_key(key);
  row_mutations->set_column_family(name_);
  RETURN_NOT_OK(BuildMutations(types, columns, options, row_mutations));
  req.set_consistency_level(options.consistency ? *options.consistency : write_consistency_);

  BatchMutateResponsePB resp;
  return client_->Call(rpc::kBatchMutateMethod, req, &resp);
}

Status ColumnFamily::Remove(const string& key, const vector<Value>& columns,
                            const optional<Value>& super_column,
                            const WriteOptions& options) {
  Types types;
  RETURN_NOT_OK(GetTypes(super_column, &types));
  const int64_t timestamp = options.timestamp ? *options.timestamp : GetCurrentTimeMicros();
  const ConsistencyLevel consistency =
      options.consistency ? *options.consistency : write_consistency_;

  ColumnParentPB parent;
  RETURN_NOT_OK(BuildColumnParent(types, super_column, &parent));

  if (columns.empty()) {
    RemoveRequestPB req;
    req.set_key(key);
    ColumnPathPB* path = req.mutable_column_path();
    path->set_column_family(name_);
    if (parent.has_super_column()) {
      path->set_super_column(parent.super_column());
    }
    req.set_timestamp(timestamp);
    req.set_consistency_level(consistency);
    RemoveResponsePB resp;
    return client_->Call(rpc::kRemoveMethod, req, &resp);
  }

  BatchMutateRequestPB req;
  RowMutationsPB* row_mutations = req.add_mutations();
  row_mutations->set_key(key);
  row_mutations->set_column_family(name_);
  DeletionPB* deletion = row_mutations->add_mutations()->mutable_deletion();
  deletion->set_timestamp(timestamp);
  if (parent.has_super_column()) {
    deletion->set_super_column(parent.super_column());
  }
  for (const Value& column : columns) {
    RETURN_NOT_OK(types.PackName(column, deletion->mutable_predicate()->add_column_names()));
  }
  req.set_consistency_level(consistency);
  BatchMutateResponsePB resp;
  return client_->Call(rpc::kBatchMutateMethod, req, &resp);
}

} // namespace client
} // namespace cassc
