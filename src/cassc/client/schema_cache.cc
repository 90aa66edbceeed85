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

#include "cassc/client/schema_cache.h"

#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "cassc/client/call_dispatcher.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/constants.h"

DEFINE_int32(schema_cache_ttl_secs, 3600,
             "How long a keyspace schema fetched from the server is reused "
             "before it is fetched again.");

using std::shared_ptr;
using std::string;

namespace cassc {
namespace client {

bool SchemaCache::Entry::stale() const {
  return !MonoTime::Now().ComesBefore(expiration_time);
}

SchemaCache::SchemaCache(CallDispatcher* dispatcher)
    : dispatcher_(dispatcher) {
  DCHECK(dispatcher_);
}

Status SchemaCache::Fetch(const string& keyspace, shared_ptr<const KeyspaceSchema>* schema) {
  DescribeKeyspaceRequestPB req;
  req.set_keyspace(keyspace);
  DescribeKeyspaceResponsePB resp;
  RETURN_NOT_OK_PREPEND(dispatcher_->Call(rpc::kDescribeKeyspaceMethod, req, &resp),
                        "Unable to describe keyspace " + keyspace);
  schema->reset(new KeyspaceSchema(KeyspaceSchema::FromKsDef(resp.ks_def())));
  return Status::OK();
}

Status SchemaCache::Lookup(const string& keyspace,
                           bool use_cache,
                           shared_ptr<const KeyspaceSchema>* schema) {
  if (!use_cache) {
    return Fetch(keyspace, schema);
  }

  auto it = entries_.find(keyspace);
  if (it != entries_.end()) {
    if (!it->second.stale()) {
      *schema = it->second.schema;
      return Status::OK();
    }
    VLOG(2) << "Schema of keyspace " << keyspace << " expired";
    entries_.erase(it);
  }

  shared_ptr<const KeyspaceSchema> fetched;
  RETURN_NOT_OK(Fetch(keyspace, &fetched));
  Entry entry;
  entry.expiration_time =
      MonoTime::Now() + MonoDelta::FromSeconds(FLAGS_schema_cache_ttl_secs);
  entry.schema = fetched;
  entries_[keyspace] = std::move(entry);
  *schema = std::move(fetched);
  return Status::OK();
}

void SchemaCache::Invalidate(const string& keyspace) {
  entries_.erase(keyspace);
}

void SchemaCache::Clear() {
  entries_.clear();
}

} // namespace client
} // namespace cassc
