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
#ifndef CASSC_CLIENT_CLIENT_H
#define CASSC_CLIENT_CLIENT_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cassc/client/codec.h"
#include "cassc/client/row.h"
#include "cassc/client/schema.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/transport.h"
#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace google {
namespace protobuf {
class Message;
} // namespace protobuf
} // namespace google

namespace cassc {
namespace client {

class CallDispatcher;
class Client;
class ColumnFamily;
class ConnectionPool;
class SchemaCache;

/// Replica placement strategies understood by the server.
extern const char* const kSimpleStrategy;
extern const char* const kNetworkTopologyStrategy;
extern const char* const kOldNetworkTopologyStrategy;

/// @brief A column declared in a column family definition.
struct ColumnDefinition {
  ColumnDefinition();

  /// @param [in] name
  ///   Name of the column, as stored.
  /// @param [in] validation_type
  ///   Type of the column's values.
  ColumnDefinition(std::string name, DataType validation_type);

  std::string name;
  DataType validation_type;

  /// Set to create a secondary index on the column.
  boost::optional<IndexType> index_type;
  boost::optional<std::string> index_name;
};

/// @brief Everything needed to create a column family.
///
/// Only the keyspace and the name are required. Unset tuning options are left
/// to the server's defaults.
struct ColumnFamilyDefinition {
  ColumnFamilyDefinition();

  std::string keyspace;
  std::string name;
  bool is_super;

  /// Type of column names (of super column names for super families).
  DataType comparator_type;

  /// Type of sub column names. Only used by super families.
  boost::optional<DataType> subcomparator_type;

  /// Type of values of columns without a definition of their own.
  DataType default_validation_type;

  std::vector<ColumnDefinition> columns;

  boost::optional<std::string> comment;
  boost::optional<double> row_cache_size;
  boost::optional<double> key_cache_size;
  boost::optional<double> read_repair_chance;
  boost::optional<int32_t> gc_grace_seconds;
  boost::optional<int32_t> min_compaction_threshold;
  boost::optional<int32_t> max_compaction_threshold;
  boost::optional<int32_t> row_cache_save_period_secs;
  boost::optional<int32_t> key_cache_save_period_secs;
  boost::optional<int32_t> memtable_flush_after_mins;
  boost::optional<int32_t> memtable_throughput_mb;
  boost::optional<double> memtable_operations_millions;
};

/// @brief A "factory" for Client objects.
///
/// This class is used to create instances of the Client class
/// with pre-set options/parameters.
class ClientBuilder {
 public:
  ClientBuilder();
  ~ClientBuilder();

  /// Add a server to connect to. At least one server is required.
  ///
  /// @param [in] node
  ///   Address and connection options of the server.
  /// @return Reference to the updated object.
  ClientBuilder& add_server(const rpc::NodeDescriptor& node);

  /// Add a server reachable at @c host:port with default options.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& add_server(const std::string& host, uint16_t port);

  /// Set how many times a failing call is attempted. Defaults to 5.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& max_call_retries(int max_call_retries);

  /// Set the number of columns read from a row when a request does not
  /// say. Defaults to 100.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& default_column_count(int count);

  /// Set whether column names and values are packed and unpacked according
  /// to the schema. Defaults to true; when turned off they are passed as raw
  /// bytes.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& autopack(bool autopack);

  /// Set the factory used to create transports to the servers. Required.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& transport_factory(std::shared_ptr<rpc::TransportFactory> factory);

  /// Seed the random choice of servers. By default a seed is derived from
  /// the clock and the process id.
  ///
  /// @return Reference to the updated object.
  ClientBuilder& random_seed(uint32_t seed);

  /// Create a client object.
  ///
  /// @param [out] client
  ///   The newly created object wrapped in a shared pointer.
  /// @return Operation status. InvalidArgument if no server or no transport
  ///   factory was given.
  Status Build(std::shared_ptr<Client>* client) WARN_UNUSED_RESULT;

 private:
  class Data;

  std::unique_ptr<Data> data_;

  DISALLOW_COPY_AND_ASSIGN(ClientBuilder);
};

/// @brief The top-level handle to a cluster.
///
/// A client keeps a pool of connections to the cluster's servers, a current
/// keyspace and a cache of keyspace schemas. Use ClientBuilder to create one.
///
/// @note Clients are not thread-safe. Use one client per thread.
class Client {
 public:
  ~Client();

  /// Call a remote operation, retrying it on failure.
  ///
  /// @param [in] method
  ///   Name of the operation, e.g. "get_slice".
  /// @param [in] req
  ///   The request message of the operation.
  /// @param [out] resp
  ///   The response message of the operation.
  /// @return Operation status. InvalidRequest if the operation needs a
  ///   keyspace and none was selected, MaxRetriesExceeded if every attempt
  ///   failed.
  Status Call(const std::string& method,
              const google::protobuf::Message& req,
              google::protobuf::Message* resp) WARN_UNUSED_RESULT;

  /// Remember the credentials to use with a keyspace. They are used by
  /// later calls to UseKeyspace() which give no credentials of their own.
  void RegisterKeyspace(const std::string& keyspace,
                        const std::string& username,
                        const std::string& password);

  /// Select the keyspace subsequent operations work on.
  ///
  /// @param [in] keyspace
  ///   Name of the keyspace.
  /// @param [in] username
  ///   User to log in as. When empty, credentials registered for the
  ///   keyspace are used, if any.
  /// @param [in] password
  ///   Password of @c username.
  /// @return Operation status.
  Status UseKeyspace(const std::string& keyspace,
                     const std::string& username = "",
                     const std::string& password = "") WARN_UNUSED_RESULT;

  /// @return Name of the current keyspace; empty if none was selected.
  std::string current_keyspace() const;

  /// Fetch the definition of a keyspace.
  ///
  /// @param [in] keyspace
  ///   Name of the keyspace; empty for the current one.
  /// @param [out] ks_def
  ///   The keyspace definition.
  /// @return Operation status.
  Status DescribeKeyspace(const std::string& keyspace, KsDefPB* ks_def) WARN_UNUSED_RESULT;

  /// Get the schema of a keyspace.
  ///
  /// @param [in] keyspace
  ///   Name of the keyspace; empty for the current one.
  /// @param [in] use_cache
  ///   Whether a cached schema may be returned. When false the schema is
  ///   fetched and not cached.
  /// @param [out] schema
  ///   The schema.
  /// @return Operation status.
  Status GetKeyspaceSchema(const std::string& keyspace,
                           bool use_cache,
                           std::shared_ptr<const KeyspaceSchema>* schema) WARN_UNUSED_RESULT;

  /// Get the version of the server's remote interface.
  Status GetVersion(std::string* version) WARN_UNUSED_RESULT;

  /// Create a keyspace without column families.
  Status CreateKeyspace(const std::string& name,
                        int replication_factor = 1,
                        const std::string& placement_strategy = kSimpleStrategy,
                        const std::map<std::string, std::string>& strategy_options =
                            std::map<std::string, std::string>()) WARN_UNUSED_RESULT;

  /// Change the replication settings of a keyspace.
  Status UpdateKeyspace(const std::string& name,
                        int replication_factor = 1,
                        const std::string& placement_strategy = kSimpleStrategy,
                        const std::map<std::string, std::string>& strategy_options =
                            std::map<std::string, std::string>()) WARN_UNUSED_RESULT;

  Status DropKeyspace(const std::string& name) WARN_UNUSED_RESULT;

  /// Create a column family as described by @c def.
  Status CreateColumnFamily(const ColumnFamilyDefinition& def) WARN_UNUSED_RESULT;

  /// Create a standard column family with the given columns.
  Status CreateStandardColumnFamily(
      const std::string& keyspace,
      const std::string& name,
      const std::vector<ColumnDefinition>& columns = std::vector<ColumnDefinition>(),
      DataType comparator_type = UTF8,
      DataType default_validation_type = UTF8) WARN_UNUSED_RESULT;

  /// Create a super column family with the given sub columns.
  Status CreateSuperColumnFamily(
      const std::string& keyspace,
      const std::string& name,
      const std::vector<ColumnDefinition>& columns = std::vector<ColumnDefinition>(),
      DataType comparator_type = UTF8,
      DataType subcomparator_type = UTF8,
      DataType default_validation_type = UTF8) WARN_UNUSED_RESULT;

  /// Get the column family @c name of the current keyspace.
  ///
  /// @return The column family, owned by the client and valid for its
  ///   lifetime. The same object is returned for the same name; selecting
  ///   another keyspace makes it work on that keyspace's column family.
  ColumnFamily* Cf(const std::string& name);

  /// Read one row using a request string such as "users.jane:email,name".
  /// See RequestParser for the syntax.
  ///
  /// @param [in] request
  ///   The request string.
  /// @param [in] consistency
  ///   Read consistency; defaults to the column family's.
  /// @param [out] row
  ///   The row read.
  /// @param [out] found
  ///   Whether the row had any of the requested columns.
  /// @return Operation status. InvalidPattern for malformed requests.
  Status Get(const std::string& request,
             const boost::optional<ConsistencyLevel>& consistency,
             Row* row, bool* found) WARN_UNUSED_RESULT;

  /// Write columns to the row given as "family.key".
  Status Set(const std::string& family_and_key,
             const Row& columns,
             const boost::optional<ConsistencyLevel>& consistency = boost::none) WARN_UNUSED_RESULT;

  /// Close every open connection. Connections are reopened on demand.
  void CloseConnections();

  int max_call_retries() const;
  void set_max_call_retries(int max_call_retries);

  int default_column_count() const;
  void set_default_column_count(int count);

  bool autopack() const;

  /// @return The pool of connections to the servers.
  ConnectionPool* pool();

  /// @return The dispatcher executing calls. Used by iterators.
  CallDispatcher* dispatcher();

  SchemaCache* schema_cache();

 private:
  class Data;

  friend class ClientBuilder;

  Client();

  std::unique_ptr<Data> data_;

  DISALLOW_COPY_AND_ASSIGN(Client);
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_CLIENT_H
