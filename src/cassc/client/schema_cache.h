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

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "cassc/client/schema.h"
#include "cassc/util/macros.h"
#include "cassc/util/monotime.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

class CallDispatcher;

// Memoizes keyspace schemas fetched with describe_keyspace. Entries live for
// --schema_cache_ttl_secs.
//
// This class is not thread-safe.
class SchemaCache {
 public:
  // 'dispatcher' must outlive the cache.
  explicit SchemaCache(CallDispatcher* dispatcher);

  // Returns the schema of 'keyspace'. With 'use_cache' unset the server is
  // always asked and the result is not stored.
  Status Lookup(const std::string& keyspace,
                bool use_cache,
                std::shared_ptr<const KeyspaceSchema>* schema) WARN_UNUSED_RESULT;

  // Drops the entry for 'keyspace', if any.
  void Invalidate(const std::string& keyspace);

  void Clear();

  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    MonoTime expiration_time;
    std::shared_ptr<const KeyspaceSchema> schema;

    bool stale() const;
  };

  Status Fetch(const std::string& keyspace,
               std::shared_ptr<const KeyspaceSchema>* schema);

  CallDispatcher* const dispatcher_;

  // Keyspace name -> entry.
  std::map<std::string, Entry> entries_;

  DISALLOW_COPY_AND_ASSIGN(SchemaCache);
};

} // namespace client
} // namespace cassc
