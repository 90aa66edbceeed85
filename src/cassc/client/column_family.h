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
#ifndef CASSC_CLIENT_COLUMN_FAMILY_H
#define CASSC_CLIENT_COLUMN_FAMILY_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cassc/client/codec.h"
#include "cassc/client/paging_iterator.h"
#include "cassc/client/row.h"
#include "cassc/client/schema.h"
#include "cassc/client/value.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

class Client;

// What to read from a row.
struct ReadOptions {
  ReadOptions();

  // Either a list of columns or a range of them may be given, not both.
  // Without either the first 'column_count' columns are read.
  boost::optional<std::vector<Value>> columns;
  boost::optional<Value> start_column;
  boost::optional<Value> end_column;
  bool reversed;
  int column_count;

  // Read the sub columns of this super column instead of the row's top
  // level columns.
  boost::optional<Value> super_column;

  // Defaults to the column family's read consistency.
  boost::optional<ConsistencyLevel> consistency;
};

struct WriteOptions {
  // Defaults to the column family's write consistency.
  boost::optional<ConsistencyLevel> consistency;

  // Defaults to the current time in microseconds since the epoch.
  boost::optional<int64_t> timestamp;

  // Seconds after which the written columns expire.
  boost::optional<int32_t> ttl;
};

// One condition of a secondary index query: 'column' 'op' 'value'.
struct IndexCondition {
  Value column;
  IndexOperator op;
  Value value;
};

typedef std::vector<IndexCondition> WhereClause;

// Typed access to the rows of one column family of the client's current
// keyspace. Column names and values are packed and unpacked according to the
// column family's schema unless autopacking is turned off, in which case they
// are passed through as raw bytes.
//
// Created by Client::Cf(). This class is not thread-safe.
class ColumnFamily {
 public:
  // 'client' must outlive the column family.
  ColumnFamily(Client* client, std::string name, bool autopack);
  ~ColumnFamily();

  const std::string& name() const { return name_; }
  bool autopack() const { return autopack_; }

  ConsistencyLevel read_consistency() const { return read_consistency_; }
  void set_read_consistency(ConsistencyLevel c) { read_consistency_ = c; }
  ConsistencyLevel write_consistency() const { return write_consistency_; }
  void set_write_consistency(ConsistencyLevel c) { write_consistency_ = c; }

  // Returns the schema of this column family, or NotFound if the current
  // keyspace has no column family with this name. The schema is kept after
  // the first lookup; 'use_cache' unset forces it to be fetched again.
  Status GetSchema(bool use_cache, const ColumnFamilySchema** schema) WARN_UNUSED_RESULT;

  // Drops the kept schema; the next operation looks it up again. Called by
  // the client when another keyspace is selected.
  void ResetSchema();

  // Type of top-level names: super column names for super families, column
  // names otherwise.
  Status GetColumnNameType(DataType* type) WARN_UNUSED_RESULT;

  // Validation type of 'column', BYTES if the schema declares none.
  Status GetColumnValueType(const Value& column, DataType* type) WARN_UNUSED_RESULT;

  // Reads one row. Sets 'found' to false if no columns matched.
  Status Get(const std::string& key, const ReadOptions& options,
             Row* row, bool* found) WARN_UNUSED_RESULT;

  // Reads the first columns of a row, or of one of its super columns.
  Status GetAll(const std::string& key,
                const boost::optional<Value>& super_column,
                Row* row, bool* found) WARN_UNUSED_RESULT;

  Status GetColumns(const std::string& key,
                    const std::vector<Value>& columns,
                    const boost::optional<Value>& super_column,
                    Row* row, bool* found) WARN_UNUSED_RESULT;

  Status GetColumnRange(const std::string& key,
                        const Value& start_column,
                        const Value& end_column,
                        const boost::optional<Value>& super_column,
                        Row* row, bool* found) WARN_UNUSED_RESULT;

  // Reads several rows at once. Keys without matching columns are left out
  // of 'rows'.
  Status GetMultiple(const std::vector<std::string>& keys,
                     const ReadOptions& options,
                     KeyedRowList* rows) WARN_UNUSED_RESULT;

  // Returns an iterator over the rows matching 'where' through a secondary
  // index, fetching options.column_count rows per page.
  Status GetWhere(const WhereClause& where,
                  const ReadOptions& options,
                  boost::optional<int64_t> row_count_limit,
                  std::unique_ptr<PagingIterator>* iter) WARN_UNUSED_RESULT;

  // Returns an iterator over the rows from 'start_key' to 'end_key' (both
  // inclusive, empty for no bound), fetching 'page_size' rows per page.
  Status GetKeyRange(const std::string& start_key,
                     const std::string& end_key,
                     const ReadOptions& options,
                     boost::optional<int64_t> row_count_limit,
                     int page_size,
                     std::unique_ptr<PagingIterator>* iter) WARN_UNUSED_RESULT;

  // Writes 'columns' to the row 'key'. Super column rows are only accepted by
  // super column families and the other way around.
  Status Set(const std::string& key, const Row& columns,
             const WriteOptions& options = WriteOptions()) WARN_UNUSED_RESULT;

  // Deletes the given columns of a row, or of one of its super columns. With
  // no columns the whole row (or super column) is deleted.
  Status Remove(const std::string& key,
                const std::vector<Value>& columns,
                const boost::optional<Value>& super_column,
                const WriteOptions& options = WriteOptions()) WARN_UNUSED_RESULT;

 private:
  // Types used to pack and unpack names and values within one parent.
  struct Types {
    bool autopack;
    ColumnFamilySchema schema;
    // Whether the parent is a super column of a super family, i.e. whether
    // names are sub column names.
    bool in_super_column;

    DataType name_type() const;
    Status PackName(const Value& name, std::string* packed) const;
    Status PackValue(const std::string& packed_name, const Value& value,
                     std::string* packed) const;
    Status UnpackColumn(const ColumnPB& column, ColumnMap* columns) const;
    Status DecodeColumns(
        const google::protobuf::RepeatedPtrField<ColumnOrSuperColumnPB>& columns,
        Row* row) const;
  };

  Status GetTypes(const boost::optional<Value>& super_column, Types* types);

  Status BuildColumnParent(const Types& types,
                           const boost::optional<Value>& super_column,
                           ColumnParentPB* parent) const;

  Status BuildSlicePredicate(const Types& types, const ReadOptions& options,
                             SlicePredicatePB* predicate) const;

  Status BuildIndexClause(const Types& types, const WhereClause& where,
                          int count, IndexClausePB* clause) const;

  Status BuildMutations(const Types& types, const Row& columns,
                        const WriteOptions& options,
                        RowMutationsPB* mutations) const;

  RowDecoder MakeRowDecoder(const Types& types) const;

  Client* const client_;
  const std::string name_;
  const bool autopack_;
  ConsistencyLevel read_consistency_;
  ConsistencyLevel write_consistency_;

  std::shared_ptr<const KeyspaceSchema> keyspace_schema_;
  const ColumnFamilySchema* schema_;

  DISALLOW_COPY_AND_ASSIGN(ColumnFamily);
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_COLUMN_FAMILY_H
