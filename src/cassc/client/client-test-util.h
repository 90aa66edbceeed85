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
#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>

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

class FakeTransport;

// An in-memory stand-in for a cluster, serving the calls of every
// FakeTransport created for it. Keys and column names are ordered bytewise.
// Rows deleted as a whole stay behind as empty rows, which range scans
// return the way the server returns tombstoned rows.
class FakeCluster {
 public:
  FakeCluster();
  ~FakeCluster();

  // Serves one call. 'session_keyspace' is the keyspace selected on the
  // calling connection; set_keyspace changes it.
  Status Handle(std::string* session_keyspace,
                const std::string& method,
                const google::protobuf::Message& req,
                google::protobuf::Message* resp);

  // Creates a keyspace, with the column families 'ks_def' lists, without
  // going through a client.
  Status CreateKeyspace(const KsDefPB& ks_def);

  // Makes the next 'count' calls of 'method' fail with 'status'.
  void InjectFailures(const std::string& method, int count, const Status& status);

  // Makes transports to 'node' ("host:port") fail to open while 'down'.
  void SetNodeDown(const std::string& node, bool down);

  // Closes every open transport, as a server restart would.
  void DropConnections();

  // Requires logins with these credentials.
  void AddUser(const std::string& username, const std::string& password);

  // Number of calls of 'method' served so far, failed ones included.
  int num_calls(const std::string& method) const;
  void ResetCallCounts();

  // Number of transports opened to 'node' so far.
  int num_opens(const std::string& node) const;
  int num_open_transports() const;

  // Number of stored rows of 'column_family', empty ones included.
  int num_rows(const std::string& keyspace, const std::string& column_family) const;

  const std::string& version() const { return version_; }

 private:
  friend class FakeTransport;

  struct StoredRow {
    std::map<std::string, ColumnPB> columns;
    std::map<std::string, std::map<std::string, ColumnPB>> super_columns;

    bool empty() const { return columns.empty() && super_columns.empty(); }
    void Clear();
  };

  typedef std::map<std::string, StoredRow> RowMap;

  struct Keyspace {
    KsDefPB def;
    std::map<std::string, RowMap> families;
  };

  struct Family {
    const CfDefPB* def;
    RowMap* rows;
  };

  Status FindFamily(const std::string& keyspace, const std::string& name, Family* family);

  Status AppendSlice(const Family& family, const StoredRow& row,
                     const ColumnParentPB& parent,
                     const SlicePredicatePB& predicate,
                     google::protobuf::RepeatedPtrField<ColumnOrSuperColumnPB>* out) const;

  Status Login(const LoginRequestPB& req);
  Status SetKeyspace(const SetKeyspaceRequestPB& req, std::string* session_keyspace);
  Status GetSlice(const std::string& keyspace, const GetSliceRequestPB& req,
                  GetSliceResponsePB* resp);
  Status MultigetSlice(const std::string& keyspace, const MultigetSliceRequestPB& req,
                       MultigetSliceResponsePB* resp);
  Status GetIndexedSlices(const std::string& keyspace, const GetIndexedSlicesRequestPB& req,
                          GetIndexedSlicesResponsePB* resp);
  Status GetRangeSlices(const std::string& keyspace, const GetRangeSlicesRequestPB& req,
                        GetRangeSlicesResponsePB* resp);
  Status BatchMutate(const std::string& keyspace, const BatchMutateRequestPB& req);
  Status Remove(const std::string& keyspace, const RemoveRequestPB& req);
  Status DescribeKeyspace(const DescribeKeyspaceRequestPB& req,
                          DescribeKeyspaceResponsePB* resp);
  Status AddKeyspace(const KsDefPB& ks_def, SchemaChangeResponsePB* resp);
  Status UpdateKeyspace(const KsDefPB& ks_def, SchemaChangeResponsePB* resp);
  Status DropKeyspace(const std::string& name, SchemaChangeResponsePB* resp);
  Status AddColumnFamily(const CfDefPB& cf_def, SchemaChangeResponsePB* resp);

  void NextSchemaVersion(SchemaChangeResponsePB* resp);

  void RegisterTransport(FakeTransport* transport);
  void UnregisterTransport(FakeTransport* transport);
  Status OpenTransport(const std::string& node);

  std::map<std::string, Keyspace> keyspaces_;
  std::map<std::string, std::string> users_;
  std::map<std::string, std::deque<Status>> failures_;
  std::map<std::string, int> call_counts_;
  std::map<std::string, int> open_counts_;
  std::set<std::string> down_nodes_;
  std::set<FakeTransport*> transports_;
  int schema_version_;
  const std::string version_;

  DISALLOW_COPY_AND_ASSIGN(FakeCluster);
};

// A connection to a FakeCluster. Doubles as its own stub.
class FakeTransport : public rpc::Transport, public rpc::RpcStub {
 public:
  FakeTransport(FakeCluster* cluster, rpc::NodeDescriptor node);
  ~FakeTransport() override;

  Status Open() override;
  Status Flush() override;
  Status Close() override;
  bool IsOpen() const override { return open_; }
  rpc::RpcStub* stub() override { return this; }

  Status Call(const std::string& method,
              const google::protobuf::Message& req,
              google::protobuf::Message* resp) override;

  // Marks the transport closed without the client's involvement.
  void Drop() { open_ = false; }

  const std::string& keyspace() const { return keyspace_; }

 private:
  FakeCluster* const cluster_;
  const rpc::NodeDescriptor node_;
  bool open_;
  std::string keyspace_;

  DISALLOW_COPY_AND_ASSIGN(FakeTransport);
};

class FakeTransportFactory : public rpc::TransportFactory {
 public:
  explicit FakeTransportFactory(FakeCluster* cluster);

  Status Create(const rpc::NodeDescriptor& node,
                std::unique_ptr<rpc::Transport>* transport) override;

  int num_created() const { return num_created_; }

 private:
  FakeCluster* const cluster_;
  int num_created_;

  DISALLOW_COPY_AND_ASSIGN(FakeTransportFactory);
};

} // namespace client
} // namespace cassc
