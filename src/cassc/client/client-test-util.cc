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

#include "cassc/client/client-test-util.h"

#include <utility>
#include <vector>

#include <glog/logging.h>
#include <google/protobuf/message.h>

#include "cassc/rpc/constants.h"

using google::protobuf::Message;
using google::protobuf::RepeatedPtrField;
using std::map;
using std::string;
using std::unique_ptr;
using std::vector;

namespace cassc {
namespace client {

namespace {

const char* const kMarshalPackage = "org.apache.cassandra.db.marshal.";
const char* const kSuperColumnType = "Super";

template<class T>
const T& RequestAs(const Message& m) {
  CHECK(m.GetDescriptor() == T::descriptor())
      << "Expected " << T::descriptor()->full_name() << ", got " << m.GetTypeName();
  return static_cast<const T&>(m);
}

template<class T>
T* ResponseAs(Message* m) {
  CHECK(m->GetDescriptor() == T::descriptor())
      << "Expected " << T::descriptor()->full_name() << ", got " << m->GetTypeName();
  return static_cast<T*>(m);
}

Status InvalidRequestError(const string& msg) {
  return Status::RemoteError(msg, "", CassandraErrorPB::INVALID_REQUEST);
}

// Marshal class names may be given unqualified; the server always reports
// them qualified.
string QualifyClassName(const string& class_name) {
  if (class_name.find('.') != string::npos) {
    return class_name;
  }
  return kMarshalPackage + class_name;
}

bool IsSuper(const CfDefPB& def) {
  return def.column_type() == kSuperColumnType;
}

// The entries of 'columns' selected by 'predicate', in the order the server
// returns them.
template<class V>
vector<const typename map<string, V>::value_type*> SelectColumns(
    const map<string, V>& columns, const SlicePredicatePB& predicate) {
  vector<const typename map<string, V>::value_type*> selected;
  if (predicate.column_names_size() > 0) {
    for (const auto& entry : columns) {
      for (const string& name : predicate.column_names()) {
        if (name == entry.first) {
          selected.push_back(&entry);
          break;
        }
      }
    }
    return selected;
  }

  const SliceRangePB& range = predicate.slice_range();
  if (!range.reversed()) {
    auto it = range.start().empty() ? columns.begin() : columns.lower_bound(range.start());
    for (; it != columns.end() && static_cast<int>(selected.size()) < range.count(); ++it) {
      if (!range.finish().empty() && it->first > range.finish()) {
        break;
      }
      selected.push_back(&*it);
    }
  } else {
    auto it = range.start().empty() ? columns.end() : columns.upper_bound(range.start());
    while (it != columns.begin() && static_cast<int>(selected.size()) < range.count()) {
      --it;
      if (!range.finish().empty() && it->first < range.finish()) {
        break;
      }
      selected.push_back(&*it);
    }
  }
  return selected;
}

bool MatchesExpression(const map<string, ColumnPB>& columns, const IndexExpressionPB& expr) {
  auto it = columns.find(expr.column_name());
  if (it == columns.end()) {
    return false;
  }
  const int c = it->second.value().compare(expr.value());
  switch (expr.op()) {
    case EQ: return c == 0;
    case GTE: return c >= 0;
    case GT: return c > 0;
    case LTE: return c <= 0;
    case LT: return c < 0;
  }
  return false;
}

bool IsIndexed(const CfDefPB& def, const string& column_name) {
  for (const ColumnDefPB& column : def.column_metadata()) {
    if (column.name() == column_name) {
      return column.has_index_type();
    }
  }
  return false;
}

void QualifyCfDef(CfDefPB* cf_def) {
  cf_def->set_comparator_type(QualifyClassName(cf_def->comparator_type()));
  if (cf_def->has_subcomparator_type()) {
    cf_def->set_subcomparator_type(QualifyClassName(cf_def->subcomparator_type()));
  }
  if (cf_def->has_default_validation_class()) {
    cf_def->set_default_validation_class(
        QualifyClassName(cf_def->default_validation_class()));
  }
  for (ColumnDefPB& column : *cf_def->mutable_column_metadata()) {
    column.set_validation_class(QualifyClassName(column.validation_class()));
  }
}

} // anonymous namespace

////////////////////////////////////////////////////////////
// FakeCluster
////////////////////////////////////////////////////////////

void FakeCluster::StoredRow::Clear() {
  columns.clear();
  super_columns.clear();
}

FakeCluster::FakeCluster()
    : schema_version_(0),
      version_("19.4.0") {
}

FakeCluster::~FakeCluster() {
  CHECK(transports_.empty()) << "Transports must not outlive their cluster";
}

Status FakeCluster::CreateKeyspace(const KsDefPB& ks_def) {
  SchemaChangeResponsePB resp;
  return AddKeyspace(ks_def, &resp);
}

void FakeCluster::InjectFailures(const string& method, int count, const Status& status) {
  for (int i = 0; i < count; i++) {
    failures_[method].push_back(status);
  }
}

void FakeCluster::SetNodeDown(const string& node, bool down) {
  if (down) {
    down_nodes_.insert(node);
  } else {
    down_nodes_.erase(node);
  }
}

void FakeCluster::DropConnections() {
  for (FakeTransport* transport : transports_) {
    transport->Drop();
  }
}

void FakeCluster::AddUser(const string& username, const string& password) {
  users_[username] = password;
}

int FakeCluster::num_calls(const string& method) const {
  auto it = call_counts_.find(method);
  return it == call_counts_.end() ? 0 : it->second;
}

void FakeCluster::ResetCallCounts() {
  call_counts_.clear();
}

int FakeCluster::num_opens(const string& node) const {
  auto it = open_counts_.find(node);
  return it == open_counts_.end() ? 0 : it->second;
}

int FakeCluster::num_open_transports() const {
  int n = 0;
  for (const FakeTransport* transport : transports_) {
    if (transport->IsOpen()) {
      n++;
    }
  }
  return n;
}

int FakeCluster::num_rows(const string& keyspace, const string& column_family) const {
  auto ks = keyspaces_.find(keyspace);
  if (ks == keyspaces_.end()) {
    return 0;
  }
  auto cf = ks->second.families.find(column_family);
  return cf == ks->second.families.end() ? 0 : static_cast<int>(cf->second.size());
}

void FakeCluster::RegisterTransport(FakeTransport* transport) {
  transports_.insert(transport);
}

void FakeCluster::UnregisterTransport(FakeTransport* transport) {
  transports_.erase(transport);
}

Status FakeCluster::OpenTransport(const string& node) {
  open_counts_[node]++;
  if (down_nodes_.count(node)) {
    return Status::NetworkError("Connection refused", node);
  }
  return Status::OK();
}

Status FakeCluster::Handle(string* session_keyspace,
                           const string& method,
                           const Message& req,
                           Message* resp) {
  call_counts_[method]++;
  auto failures = failures_.find(method);
  if (failures != failures_.end() && !failures->second.empty()) {
    Status s = failures->second.front();
    failures->second.pop_front();
    return s;
  }

  if (rpc::RequiresKeyspace(method) && session_keyspace->empty()) {
    return InvalidRequestError("You have not set a keyspace for this session");
  }
  const string& keyspace = *session_keyspace;

  if (method == rpc::kLoginMethod) {
    return Login(RequestAs<LoginRequestPB>(req));
  }
  if (method == rpc::kSetKeyspaceMethod) {
    return SetKeyspace(RequestAs<SetKeyspaceRequestPB>(req), session_keyspace);
  }
  if (method == rpc::kGetSliceMethod) {
    return GetSlice(keyspace, RequestAs<GetSliceRequestPB>(req),
                    ResponseAs<GetSliceResponsePB>(resp));
  }
  if (method == rpc::kMultigetSliceMethod) {
    return MultigetSlice(keyspace, RequestAs<MultigetSliceRequestPB>(req),
                         ResponseAs<MultigetSliceResponsePB>(resp));
  }
  if (method == rpc::kGetIndexedSlicesMethod) {
    return GetIndexedSlices(keyspace, RequestAs<GetIndexedSlicesRequestPB>(req),
                            ResponseAs<GetIndexedSlicesResponsePB>(resp));
  }
  if (method == rpc::kGetRangeSlicesMethod) {
    return GetRangeSlices(keyspace, RequestAs<GetRangeSlicesRequestPB>(req),
                          ResponseAs<GetRangeSlicesResponsePB>(resp));
  }
  if (method == rpc::kBatchMutateMethod) {
    return BatchMutate(keyspace, RequestAs<BatchMutateRequestPB>(req));
  }
  if (method == rpc::kRemoveMethod) {
    return Remove(keyspace, RequestAs<RemoveRequestPB>(req));
  }
  if (method == rpc::kDescribeKeyspaceMethod) {
    return DescribeKeyspace(RequestAs<DescribeKeyspaceRequestPB>(req),
                            ResponseAs<DescribeKeyspaceResponsePB>(resp));
  }
  if (method == rpc::kDescribeVersionMethod) {
    ResponseAs<DescribeVersionResponsePB>(resp)->set_version(version_);
    return Status::OK();
  }
  if (method == rpc::kSystemAddKeyspaceMethod) {
    return AddKeyspace(RequestAs<SystemAddKeyspaceRequestPB>(req).ks_def(),
                       ResponseAs<SchemaChangeResponsePB>(resp));
  }
  if (method == rpc::kSystemUpdateKeyspaceMethod) {
    return UpdateKeyspace(RequestAs<SystemUpdateKeyspaceRequestPB>(req).ks_def(),
                          ResponseAs<SchemaChangeResponsePB>(resp));
  }
  if (method == rpc::kSystemDropKeyspaceMethod) {
    return DropKeyspace(RequestAs<SystemDropKeyspaceRequestPB>(req).keyspace(),
                        ResponseAs<SchemaChangeResponsePB>(resp));
  }
  if (method == rpc::kSystemAddColumnFamilyMethod) {
    return AddColumnFamily(RequestAs<SystemAddColumnFamilyRequestPB>(req).cf_def(),
                           ResponseAs<SchemaChangeResponsePB>(resp));
  }
  return InvalidRequestError("Unsupported method " + method);
}

Status FakeCluster::FindFamily(const string& keyspace, const string& name, Family* family) {
  auto ks = keyspaces_.find(keyspace);
  if (ks == keyspaces_.end()) {
    return InvalidRequestError("Keyspace " + keyspace + " does not exist");
  }
  for (const CfDefPB& cf_def : ks->second.def.cf_defs()) {
    if (cf_def.name() == name) {
      family->def = &cf_def;
      family->rows = &ks->second.families[name];
      return Status::OK();
    }
  }
  return InvalidRequestError("unconfigured columnfamily " + name);
}

Status FakeCluster::AppendSlice(const Family& family, const StoredRow& row,
                                const ColumnParentPB& parent,
                                const SlicePredicatePB& predicate,
                                RepeatedPtrField<ColumnOrSuperColumnPB>* out) const {
  const bool is_super = IsSuper(*family.def);
  if (parent.has_super_column()) {
    if (!is_super) {
      return InvalidRequestError("Column family " + family.def->name() +
                                 " has no super columns");
    }
    auto sc = row.super_columns.find(parent.super_column());
    if (sc == row.super_columns.end()) {
      return Status::OK();
    }
    for (const auto* entry : SelectColumns(sc->second, predicate)) {
      out->Add()->mutable_column()->CopyFrom(entry->second);
    }
    return Status::OK();
  }

  if (is_super) {
    for (const auto* entry : SelectColumns(row.super_columns, predicate)) {
      SuperColumnPB* sc = out->Add()->mutable_super_column();
      sc->set_name(entry->first);
      for (const auto& column : entry->second) {
        sc->add_columns()->CopyFrom(column.second);
      }
    }
    return Status::OK();
  }

  for (const auto* entry : SelectColumns(row.columns, predicate)) {
    out->Add()->mutable_column()->CopyFrom(entry->second);
  }
  return Status::OK();
}

Status FakeCluster::Login(const LoginRequestPB& req) {
  if (users_.empty()) {
    return Status::OK();
  }
  const auto& credentials = req.auth_request().credentials();
  auto username = credentials.find("username");
  auto password = credentials.find("password");
  if (username != credentials.end() && password != credentials.end()) {
    auto user = users_.find(username->second);
    if (user != users_.end() && user->second == password->second) {
      return Status::OK();
    }
  }
  return Status::RemoteError("Invalid username or password", "",
                             CassandraErrorPB::AUTHENTICATION);
}

Status FakeCluster::SetKeyspace(const SetKeyspaceRequestPB& req, string* session_keyspace) {
  if (!keyspaces_.count(req.keyspace())) {
    return InvalidRequestError("Keyspace " + req.keyspace() + " does not exist");
  }
  *session_keyspace = req.keyspace();
  return Status::OK();
}

Status FakeCluster::GetSlice(const string& keyspace, const GetSliceRequestPB& req,
                             GetSliceResponsePB* resp) {
  Family family;
  RETURN_NOT_OK(FindFamily(keyspace, req.column_parent().column_family(), &family));
  auto row = family.rows->find(req.key());
  if (row == family.rows->end()) {
    return Status::OK();
  }
  return AppendSlice(family, row->second, req.column_parent(), req.predicate(),
                     resp->mutable_columns());
}

Status FakeCluster::MultigetSlice(const string& keyspace, const MultigetSliceRequestPB& req,
                                  MultigetSliceResponsePB* resp) {
  Family family;
  RETURN_NOT_OK(FindFamily(keyspace, req.column_parent().column_family(), &family));
  for (const string& key : req.keys()) {
    KeySlicePB* slice = resp->add_rows();
    slice->set_key(key);
    auto row = family.rows->find(key);
    if (row != family.rows->end()) {
      RETURN_NOT_OK(AppendSlice(family, row->second, req.column_parent(), req.predicate(),
                                slice->mutable_columns()));
    }
  }
  return Status::OK();
}

Status FakeCluster::GetIndexedSlices(const string& keyspace,
                                     const GetIndexedSlicesRequestPB& req,
                                     GetIndexedSlicesResponsePB* resp) {
  Family family;
  RETURN_NOT_OK(FindFamily(keyspace, req.column_parent().column_family(), &family));
  const IndexClausePB& clause = req.index_clause();
  bool has_indexed_eq = false;
  for (const IndexExpressionPB& expr : clause.expressions()) {
    if (expr.op() == EQ && IsIndexed(*family.def, expr.column_name())) {
      has_indexed_eq = true;
    }
  }
  if (!has_indexed_eq) {
    return InvalidRequestError("No indexed columns present in index clause with operator EQ");
  }

  auto it = clause.start_key().empty() ? family.rows->begin()
                                       : family.rows->lower_bound(clause.start_key());
  for (; it != family.rows->end() && resp->rows_size() < clause.count(); ++it) {
    bool matches = true;
    for (const IndexExpressionPB& expr : clause.expressions()) {
      if (!MatchesExpression(it->second.columns, expr)) {
        matches = false;
        break;
      }
    }
    if (!matches) {
      continue;
    }
    KeySlicePB* slice = resp->add_rows();
    slice->set_key(it->first);
    RETURN_NOT_OK(AppendSlice(family, it->second, req.column_parent(),
                              req.column_predicate(), slice->mutable_columns()));
  }
  return Status::OK();
}

Status FakeCluster::GetRangeSlices(const string& keyspace, const GetRangeSlicesRequestPB& req,
                                   GetRangeSlicesResponsePB* resp) {
  Family family;
  RETURN_NOT_OK(FindFamily(keyspace, req.column_parent().column_family(), &family));
  const KeyRangePB& range = req.range();
  auto it = range.start_key().empty() ? family.rows->begin()
                                      : family.rows->lower_bound(range.start_key());
  for (; it != family.rows->end() && resp->rows_size() < range.count(); ++it) {
    if (!range.end_key().empty() && it->first > range.end_key()) {
      break;
    }
    KeySlicePB* slice = resp->add_rows();
    slice->set_key(it->first);
    RETURN_NOT_OK(AppendSlice(family, it->second, req.column_parent(), req.predicate(),
                              slice->mutable_columns()));
  }
  return Status::OK();
}

Status FakeCluster::BatchMutate(const string& keyspace, const BatchMutateRequestPB& req) {
  for (const RowMutationsPB& row_mutations : req.mutations()) {
    Family family;
    RETURN_NOT_OK(FindFamily(keyspace, row_mutations.column_family(), &family));
    const bool is_super = IsSuper(*family.def);
    StoredRow* row = &(*family.rows)[row_mutations.key()];

    for (const MutationPB& mutation : row_mutations.mutations()) {
      if (mutation.has_column_or_supercolumn()) {
        const ColumnOrSuperColumnPB& cosc = mutation.column_or_supercolumn();
        if (cosc.has_column() == is_super || cosc.has_super_column() != is_super) {
          return InvalidRequestError("Column type does not match column family " +
                                     family.def->name());
        }
        if (cosc.has_column()) {
          row->columns[cosc.column().name()] = cosc.column();
        } else {
          auto* sub_columns = &row->super_columns[cosc.super_column().name()];
          for (const ColumnPB& column : cosc.super_column().columns()) {
            (*sub_columns)[column.name()] = column;
          }
        }
        continue;
      }

      if (!mutation.has_deletion()) {
        return InvalidRequestError("Mutation has neither a column nor a deletion");
      }
      const DeletionPB& deletion = mutation.deletion();
      if (deletion.has_super_column()) {
        if (!is_super) {
          return InvalidRequestError("Column family " + family.def->name() +
                                     " has no super columns");
        }
        if (!deletion.has_predicate()) {
          row->super_columns.erase(deletion.super_column());
          continue;
        }
        auto sc = row->super_columns.find(deletion.super_column());
        if (sc == row->super_columns.end()) {
          continue;
        }
        for (const string& name : deletion.predicate().column_names()) {
          sc->second.erase(name);
        }
        if (sc->second.empty()) {
          row->super_columns.erase(sc);
        }
      } else if (!deletion.has_predicate()) {
        row->Clear();
      } else {
        for (const string& name : deletion.predicate().column_names()) {
          if (is_super) {
            row->super_columns.erase(name);
          } else {
            row->columns.erase(name);
          }
        }
      }
    }
  }
  return Status::OK();
}

Status FakeCluster::Remove(const string& keyspace, const RemoveRequestPB& req) {
  const ColumnPathPB& path = req.column_path();
  Family family;
  RETURN_NOT_OK(FindFamily(keyspace, path.column_family(), &family));
  const bool is_super = IsSuper(*family.def);
  if (path.has_super_column() && !is_super) {
    return InvalidRequestError("Column family " + family.def->name() +
                               " has no super columns");
  }
  auto row = family.rows->find(req.key());
  if (row == family.rows->end()) {
    return Status::OK();
  }

  if (path.has_super_column()) {
    if (!path.has_column()) {
      row->second.super_columns.erase(path.super_column());
      return Status::OK();
    }
    auto sc = row->second.super_columns.find(path.super_column());
    if (sc != row->second.super_columns.end()) {
      sc->second.erase(path.column());
      if (sc->second.empty()) {
        row->second.super_columns.erase(sc);
      }
    }
  } else if (path.has_column()) {
    if (is_super) {
      row->second.super_columns.erase(path.column());
    } else {
      row->second.columns.erase(path.column());
    }
  } else {
    row->second.Clear();
  }
  return Status::OK();
}

Status FakeCluster::DescribeKeyspace(const DescribeKeyspaceRequestPB& req,
                                     DescribeKeyspaceResponsePB* resp) {
  auto ks = keyspaces_.find(req.keyspace());
  if (ks == keyspaces_.end()) {
    return Status::RemoteError("Keyspace " + req.keyspace() + " does not exist", "",
                               CassandraErrorPB::NOT_FOUND);
  }
  resp->mutable_ks_def()->CopyFrom(ks->second.def);
  return Status::OK();
}

void FakeCluster::NextSchemaVersion(SchemaChangeResponsePB* resp) {
  resp->set_schema_version("schema-" + std::to_string(++schema_version_));
}

Status FakeCluster::AddKeyspace(const KsDefPB& ks_def, SchemaChangeResponsePB* resp) {
  if (keyspaces_.count(ks_def.name())) {
    return InvalidRequestError("Keyspace " + ks_def.name() + " already exists");
  }
  Keyspace* ks = &keyspaces_[ks_def.name()];
  ks->def.CopyFrom(ks_def);
  for (CfDefPB& cf_def : *ks->def.mutable_cf_defs()) {
    cf_def.set_keyspace(ks_def.name());
    QualifyCfDef(&cf_def);
  }
  NextSchemaVersion(resp);
  return Status::OK();
}

Status FakeCluster::UpdateKeyspace(const KsDefPB& ks_def, SchemaChangeResponsePB* resp) {
  auto ks = keyspaces_.find(ks_def.name());
  if (ks == keyspaces_.end()) {
    return InvalidRequestError("Keyspace " + ks_def.name() + " does not exist");
  }
  KsDefPB* def = &ks->second.def;
  def->set_strategy_class(ks_def.strategy_class());
  *def->mutable_strategy_options() = ks_def.strategy_options();
  def->set_replication_factor(ks_def.replication_factor());
  NextSchemaVersion(resp);
  return Status::OK();
}

Status FakeCluster::DropKeyspace(const string& name, SchemaChangeResponsePB* resp) {
  if (keyspaces_.erase(name) == 0) {
    return InvalidRequestError("Keyspace " + name + " does not exist");
  }
  NextSchemaVersion(resp);
  return Status::OK();
}

Status FakeCluster::AddColumnFamily(const CfDefPB& cf_def, SchemaChangeResponsePB* resp) {
  auto ks = keyspaces_.find(cf_def.keyspace());
  if (ks == keyspaces_.end()) {
    return InvalidRequestError("Keyspace " + cf_def.keyspace() + " does not exist");
  }
  for (const CfDefPB& existing : ks->second.def.cf_defs()) {
    if (existing.name() == cf_def.name()) {
      return InvalidRequestError("Column family " + cf_def.name() + " already exists");
    }
  }
  CfDefPB* added = ks->second.def.add_cf_defs();
  added->CopyFrom(cf_def);
  added->set_id(ks->second.def.cf_defs_size());
  QualifyCfDef(added);
  NextSchemaVersion(resp);
  return Status::OK();
}

////////////////////////////////////////////////////////////
// FakeTransport
////////////////////////////////////////////////////////////

FakeTransport::FakeTransport(FakeCluster* cluster, rpc::NodeDescriptor node)
    : cluster_(cluster),
      node_(std::move(node)),
      open_(false) {
  cluster_->RegisterTransport(this);
}

FakeTransport::~FakeTransport() {
  cluster_->UnregisterTransport(this);
}

Status FakeTransport::Open() {
  RETURN_NOT_OK(cluster_->OpenTransport(node_.ToString()));
  open_ = true;
  return Status::OK();
}

Status FakeTransport::Flush() {
  if (!open_) {
    return Status::NetworkError("Transport is not open", node_.ToString());
  }
  return Status::OK();
}

Status FakeTransport::Close() {
  open_ = false;
  return Status::OK();
}

Status FakeTransport::Call(const string& method, const Message& req, Message* resp) {
  if (!open_) {
    return Status::NetworkError("Transport is not open", node_.ToString());
  }
  return cluster_->Handle(&keyspace_, method, req, resp);
}

////////////////////////////////////////////////////////////
// FakeTransportFactory
////////////////////////////////////////////////////////////

FakeTransportFactory::FakeTransportFactory(FakeCluster* cluster)
    : cluster_(cluster),
      num_created_(0) {
}

Status FakeTransportFactory::Create(const rpc::NodeDescriptor& node,
                                    unique_ptr<rpc::Transport>* transport) {
  num_created_++;
  transport->reset(new FakeTransport(cluster_, node));
  return Status::OK();
}

} // namespace client
} // namespace cassc
