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

#include "cassc/client/client.h"

#include <utility>

#include <glog/logging.h>

#include "cassc/client/client-internal.h"
#include "cassc/client/request_parser.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/random.h"

using boost::optional;
using google::protobuf::Message;
using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

namespace cassc {
namespace client {

const char* const kSimpleStrategy = "org.apache.cassandra.locator.SimpleStrategy";
const char* const kNetworkTopologyStrategy =
    "org.apache.cassandra.locator.NetworkTopologyStrategy";
const char* const kOldNetworkTopologyStrategy =
    "org.apache.cassandra.locator.OldNetworkTopologyStrategy";

namespace {

const int kDefaultMaxCallRetries = 5;
const int kDefaultColumnCount = 100;
const char* const kStandardColumnType = "Standard";
const char* const kSuperColumnType = "Super";

void BuildKsDef(const string& name, int replication_factor,
                const string& placement_strategy,
                const map<string, string>& strategy_options,
                KsDefPB* ks_def) {
  ks_def->set_name(name);
  ks_def->set_strategy_class(placement_strategy);
  ks_def->mutable_strategy_options()->insert(strategy_options.begin(),
                                             strategy_options.end());
  ks_def->set_replication_factor(replication_factor);
}

void BuildCfDef(const ColumnFamilyDefinition& def, CfDefPB* cf_def) {
  cf_def->set_keyspace(def.keyspace);
  cf_def->set_name(def.name);
  cf_def->set_column_type(def.is_super ? kSuperColumnType : kStandardColumnType);
  cf_def->set_comparator_type(MarshalClassName(def.comparator_type));
  if (def.subcomparator_type) {
    cf_def->set_subcomparator_type(MarshalClassName(*def.subcomparator_type));
  }
  cf_def->set_default_validation_class(MarshalClassName(def.default_validation_type));
  for (const ColumnDefinition& column : def.columns) {
    ColumnDefPB* column_def = cf_def->add_column_metadata();
    column_def->set_name(column.name);
    column_def->set_validation_class(MarshalClassName(column.validation_type));
    if (column.index_type) {
      column_def->set_index_type(*column.index_type);
    }
    if (column.index_name) {
      column_def->set_index_name(*column.index_name);
    }
  }
  if (def.comment) cf_def->set_comment(*def.comment);
  if (def.row_cache_size) cf_def->set_row_cache_size(*def.row_cache_size);
  if (def.key_cache_size) cf_def->set_key_cache_size(*def.key_cache_size);
  if (def.read_repair_chance) cf_def->set_read_repair_chance(*def.read_repair_chance);
  if (def.gc_grace_seconds) cf_def->set_gc_grace_seconds(*def.gc_grace_seconds);
  if (def.min_compaction_threshold) {
    cf_def->set_min_compaction_threshold(*def.min_compaction_threshold);
  }
  if (def.max_compaction_threshold) {
    cf_def->set_max_compaction_threshold(*def.max_compaction_threshold);
  }
  if (def.row_cache_save_period_secs) {
    cf_def->set_row_cache_save_period_in_seconds(*def.row_cache_save_period_secs);
  }
  if (def.key_cache_save_period_secs) {
    cf_def->set_key_cache_save_period_in_seconds(*def.key_cache_save_period_secs);
  }
  if (def.memtable_flush_after_mins) {
    cf_def->set_memtable_flush_after_mins(*def.memtable_flush_after_mins);
  }
  if (def.memtable_throughput_mb) {
    cf_def->set_memtable_throughput_in_mb(*def.memtable_throughput_mb);
  }
  if (def.memtable_operations_millions) {
    cf_def->set_memtable_operations_in_millions(*def.memtable_operations_millions);
  }
}

} // anonymous namespace

////////////////////////////////////////////////////////////
// Definitions
////////////////////////////////////////////////////////////

ColumnDefinition::ColumnDefinition()
    : validation_type(BYTES) {
}

ColumnDefinition::ColumnDefinition(string name, DataType validation_type)
    : name(std::move(name)),
      validation_type(validation_type) {
}

ColumnFamilyDefinition::ColumnFamilyDefinition()
    : is_super(false),
      comparator_type(UTF8),
      default_validation_type(UTF8) {
}

////////////////////////////////////////////////////////////
// ClientBuilder
////////////////////////////////////////////////////////////

ClientBuilder::Data::Data()
    : max_call_retries_(kDefaultMaxCallRetries),
      default_column_count_(kDefaultColumnCount),
      autopack_(true) {
}

ClientBuilder::Data::~Data() {
}

ClientBuilder::ClientBuilder()
    : data_(new ClientBuilder::Data()) {
}

ClientBuilder::~ClientBuilder() {
}

ClientBuilder& ClientBuilder::add_server(const rpc::NodeDescriptor& node) {
  data_->servers_.push_back(node);
  return *this;
}

ClientBuilder& ClientBuilder::add_server(const string& host, uint16_t port) {
  return add_server(rpc::NodeDescriptor(host, port));
}

ClientBuilder& ClientBuilder::max_call_retries(int max_call_retries) {
  data_->max_call_retries_ = max_call_retries;
  return *this;
}

ClientBuilder& ClientBuilder::default_column_count(int count) {
  data_->default_column_count_ = count;
  return *this;
}

ClientBuilder& ClientBuilder::autopack(bool autopack) {
  data_->autopack_ = autopack;
  return *this;
}

ClientBuilder& ClientBuilder::transport_factory(shared_ptr<rpc::TransportFactory> factory) {
  data_->transport_factory_ = std::move(factory);
  return *this;
}

ClientBuilder& ClientBuilder::random_seed(uint32_t seed) {
  data_->random_seed_ = seed;
  return *this;
}

Status ClientBuilder::Build(shared_ptr<Client>* client) {
  if (data_->servers_.empty()) {
    return Status::InvalidArgument("No servers given");
  }
  if (!data_->transport_factory_) {
    return Status::InvalidArgument("No transport factory given");
  }
  if (data_->max_call_retries_ < 1) {
    return Status::InvalidArgument("At least one call attempt is required",
                                   std::to_string(data_->max_call_retries_));
  }

  shared_ptr<Client> c(new Client());
  uint32_t seed = data_->random_seed_ ? *data_->random_seed_ : GetRandomSeed32();
  c->data_.reset(new Client::Data(data_->transport_factory_,
                                  seed,
                                  data_->max_call_retries_,
                                  data_->default_column_count_,
                                  data_->autopack_));
  for (const rpc::NodeDescriptor& node : data_->servers_) {
    c->data_->pool_.RegisterServer(node);
  }
  VLOG(1) << "Built client for " << data_->servers_.size() << " servers";
  client->swap(c);
  return Status::OK();
}

////////////////////////////////////////////////////////////
// Client::Data
////////////////////////////////////////////////////////////

Client::Data::Data(shared_ptr<rpc::TransportFactory> transport_factory,
                   uint32_t random_seed,
                   int max_call_retries,
                   int default_column_count,
                   bool autopack)
    : transport_factory_(std::move(transport_factory)),
      pool_(transport_factory_.get(), random_seed),
      dispatcher_(&pool_, max_call_retries),
      schema_cache_(&dispatcher_),
      default_column_count_(default_column_count),
      autopack_(autopack) {
}

Client::Data::~Data() {
  // Column families may refer to cached schemas; drop them first.
  column_families_.clear();
  pool_.CloseConnections();
}

Status Client::Data::ResolveKeyspace(const string& keyspace, string* resolved) const {
  if (!keyspace.empty()) {
    *resolved = keyspace;
    return Status::OK();
  }
  if (!pool_.keyspace_context()) {
    return Status::InvalidRequest("No keyspace has been set");
  }
  *resolved = pool_.keyspace_context()->keyspace;
  return Status::OK();
}

////////////////////////////////////////////////////////////
// Client
////////////////////////////////////////////////////////////

Client::Client() {
}

Client::~Client() {
}

Status Client::Call(const string& method, const Message& req, Message* resp) {
  return data_->dispatcher_.Call(method, req, resp);
}

void Client::RegisterKeyspace(const string& keyspace,
                              const string& username,
                              const string& password) {
  KeyspaceContext context;
  context.keyspace = keyspace;
  context.username = username;
  context.password = password;
  data_->keyspace_credentials_[keyspace] = std::move(context);
}

Status Client::UseKeyspace(const string& keyspace,
                           const string& username,
                           const string& password) {
  KeyspaceContext context;
  context.keyspace = keyspace;
  if (!username.empty()) {
    RegisterKeyspace(keyspace, username, password);
    context.username = username;
    context.password = password;
  } else {
    auto it = data_->keyspace_credentials_.find(keyspace);
    if (it != data_->keyspace_credentials_.end()) {
      context.username = it->second.username;
      context.password = it->second.password;
    }
  }

  // Column families resolve their schema in the current keyspace. The objects
  // themselves stay valid for callers holding them.
  for (const auto& entry : data_->column_families_) {
    entry.second->ResetSchema();
  }
  RETURN_NOT_OK_PREPEND(data_->pool_.UseKeyspace(context),
                        "Unable to use keyspace " + keyspace);
  LOG(INFO) << "Using keyspace " << keyspace
            << (context.username.empty() ? "" : " as " + context.username);
  return Status::OK();
}

string Client::current_keyspace() const {
  const auto& context = data_->pool_.keyspace_context();
  return context ? context->keyspace : string();
}

Status Client::DescribeKeyspace(const string& keyspace, KsDefPB* ks_def) {
  DescribeKeyspaceRequestPB req;
  string name;
  RETURN_NOT_OK(data_->ResolveKeyspace(keyspace, &name));
  req.set_keyspace(name);
  DescribeKeyspaceResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kDescribeKeyspaceMethod, req, &resp));
  ks_def->Swap(resp.mutable_ks_def());
  return Status::OK();
}

Status Client::GetKeyspaceSchema(const string& keyspace,
                                 bool use_cache,
                                 shared_ptr<const KeyspaceSchema>* schema) {
  string name;
  RETURN_NOT_OK(data_->ResolveKeyspace(keyspace, &name));
  return data_->schema_cache_.Lookup(name, use_cache, schema);
}

Status Client::GetVersion(string* version) {
  DescribeVersionRequestPB req;
  DescribeVersionResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kDescribeVersionMethod, req, &resp));
  *version = resp.version();
  return Status::OK();
}

Status Client::CreateKeyspace(const string& name,
                              int replication_factor,
                              const string& placement_strategy,
                              const map<string, string>& strategy_options) {
  SystemAddKeyspaceRequestPB req;
  BuildKsDef(name, replication_factor, placement_strategy, strategy_options,
             req.mutable_ks_def());
  SchemaChangeResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kSystemAddKeyspaceMethod, req, &resp));
  LOG(INFO) << "Created keyspace " << name << ", schema version " << resp.schema_version();
  return Status::OK();
}

Status Client::UpdateKeyspace(const string& name,
                              int replication_factor,
                              const string& placement_strategy,
                              const map<string, string>& strategy_options) {
  SystemUpdateKeyspaceRequestPB req;
  BuildKsDef(name, replication_factor, placement_strategy, strategy_options,
             req.mutable_ks_def());
  SchemaChangeResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kSystemUpdateKeyspaceMethod, req, &resp));
  data_->schema_cache_.Invalidate(name);
  LOG(INFO) << "Updated keyspace " << name << ", schema version " << resp.schema_version();
  return Status::OK();
}

Status Client::DropKeyspace(const string& name) {
  SystemDropKeyspaceRequestPB req;
  req.set_keyspace(name);
  SchemaChangeResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kSystemDropKeyspaceMethod, req, &resp));
  data_->schema_cache_.Invalidate(name);
  LOG(INFO) << "Dropped keyspace " << name << ", schema version " << resp.schema_version();
  return Status::OK();
}

Status Client::CreateColumnFamily(const ColumnFamilyDefinition& def) {
  if (def.keyspace.empty() || def.name.empty()) {
    return Status::InvalidArgument("A column family needs a keyspace and a name");
  }
  SystemAddColumnFamilyRequestPB req;
  BuildCfDef(def, req.mutable_cf_def());
  SchemaChangeResponsePB resp;
  RETURN_NOT_OK(Call(rpc::kSystemAddColumnFamilyMethod, req, &resp));
  data_->schema_cache_.Invalidate(def.keyspace);
  LOG(INFO) << "Created column family " << def.keyspace << "." << def.name
            << ", schema version " << resp.schema_version();
  return Status::OK();
}

Status Client::CreateStandardColumnFamily(const string& keyspace,
                                          const string& name,
                                          const vector<ColumnDefinition>& columns,
                                          DataType comparator_type,
                                          DataType default_validation_type) {
  ColumnFamilyDefinition def;
  def.keyspace = keyspace;
  def.name = name;
  def.columns = columns;
  def.comparator_type = comparator_type;
  def.default_validation_type = default_validation_type;
  return CreateColumnFamily(def);
}

Status Client::CreateSuperColumnFamily(const string& keyspace,
                                       const string& name,
                                       const vector<ColumnDefinition>& columns,
                                       DataType comparator_type,
                                       DataType subcomparator_type,
                                       DataType default_validation_type) {
  ColumnFamilyDefinition def;
  def.keyspace = keyspace;
  def.name = name;
  def.is_super = true;
  def.columns = columns;
  def.comparator_type = comparator_type;
  def.subcomparator_type = subcomparator_type;
  def.default_validation_type = default_validation_type;
  return CreateColumnFamily(def);
}

ColumnFamily* Client::Cf(const string& name) {
  std::unique_ptr<ColumnFamily>& cf = data_->column_families_[name];
  if (!cf) {
    cf.reset(new ColumnFamily(this, name, data_->autopack_));
  }
  return cf.get();
}

Status Client::Get(const string& request,
                   const optional<ConsistencyLevel>& consistency,
                   Row* row, bool* found) {
  RequestParser parser(data_->default_column_count_);
  ParsedRequest parsed;
  RETURN_NOT_OK(parser.Parse(request, &parsed));

  ReadOptions options;
  if (parsed.columns) {
    options.columns = vector<Value>(parsed.columns->begin(), parsed.columns->end());
  }
  if (parsed.start_column) {
    options.start_column = Value(*parsed.start_column);
  }
  if (parsed.end_column) {
    options.end_column = Value(*parsed.end_column);
  }
  options.reversed = parsed.reversed;
  options.column_count = parsed.column_count;
  if (parsed.super_column) {
    options.super_column = Value(*parsed.super_column);
  }
  options.consistency = consistency;
  return Cf(parsed.column_family)->Get(parsed.key, options, row, found);
}

Status Client::Set(const string& family_and_key,
                   const Row& columns,
                   const optional<ConsistencyLevel>& consistency) {
  string column_family;
  string key;
  RETURN_NOT_OK(RequestParser::SplitFamilyAndKey(family_and_key, &column_family, &key));
  WriteOptions options;
  options.consistency = consistency;
  return Cf(column_family)->Set(key, columns, options);
}

void Client::CloseConnections() {
  data_->pool_.CloseConnections();
}

int Client::max_call_retries() const {
  return data_->dispatcher_.max_call_retries();
}

void Client::set_max_call_retries(int max_call_retries) {
  data_->dispatcher_.set_max_call_retries(max_call_retries);
}

int Client::default_column_count() const {
  return data_->default_column_count_;
}

void Client::set_default_column_count(int count) {
  data_->default_column_count_ = count;
}

bool Client::autopack() const {
  return data_->autopack_;
}

ConnectionPool* Client::pool() {
  return &data_->pool_;
}

CallDispatcher* Client::dispatcher() {
  return &data_->dispatcher_;
}

SchemaCache* Client::schema_cache() {
  return &data_->schema_cache_;
}

} // namespace client
} // namespace cassc
