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

#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "cassc/client/call_dispatcher.h"
#include "cassc/client/client-test-util.h"
#include "cassc/client/codec.h"
#include "cassc/client/connection_pool.h"
#include "cassc/client/schema.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

DECLARE_int32(call_retry_backoff_base_ms);
DECLARE_int32(schema_cache_ttl_secs);

using std::shared_ptr;
using std::string;

namespace cassc {
namespace client {

namespace {

KsDefPB MakeKsDef() {
  KsDefPB ks_def;
  ks_def.set_name("Keyspace1");
  ks_def.set_strategy_class("org.apache.cassandra.locator.NetworkTopologyStrategy");
  (*ks_def.mutable_strategy_options())["DC1"] = "2";
  ks_def.set_replication_factor(2);

  CfDefPB* standard = ks_def.add_cf_defs();
  standard->set_keyspace("Keyspace1");
  standard->set_name("Users");
  standard->set_comparator_type(MarshalClassName(UTF8));
  standard->set_default_validation_class(MarshalClassName(UTF8));
  ColumnDefPB* age = standard->add_column_metadata();
  age->set_name("age");
  age->set_validation_class(MarshalClassName(LONG));
  age->set_index_type(KEYS);

  CfDefPB* super = ks_def.add_cf_defs();
  super->set_keyspace("Keyspace1");
  super->set_name("Posts");
  super->set_column_type("Super");
  super->set_comparator_type(MarshalClassName(TIME_UUID));
  super->set_subcomparator_type(MarshalClassName(ASCII));
  return ks_def;
}

} // anonymous namespace

TEST(KeyspaceSchemaTest, TestFromKsDef) {
  KeyspaceSchema schema = KeyspaceSchema::FromKsDef(MakeKsDef());
  ASSERT_EQ("Keyspace1", schema.name);
  ASSERT_EQ("org.apache.cassandra.locator.NetworkTopologyStrategy",
            schema.placement_strategy);
  ASSERT_EQ("2", schema.placement_strategy_options.at("DC1"));
  ASSERT_EQ(2, schema.replication_factor);
  ASSERT_EQ(2U, schema.column_families.size());

  const ColumnFamilySchema* users;
  ASSERT_OK(schema.FindColumnFamily("Users", &users));
  ASSERT_FALSE(users->is_super);
  ASSERT_EQ(UTF8, users->column_type);
  ASSERT_EQ(UTF8, users->name_type());
  ASSERT_EQ(UTF8, users->data_type);
  ASSERT_EQ(LONG, users->ValueTypeOf("age"));
  ASSERT_EQ(BYTES, users->ValueTypeOf("email"));

  // Super families name their super columns with the comparator and their
  // sub columns with the subcomparator.
  const ColumnFamilySchema* posts;
  ASSERT_OK(schema.FindColumnFamily("Posts", &posts));
  ASSERT_TRUE(posts->is_super);
  ASSERT_EQ(TIME_UUID, posts->super_type);
  ASSERT_EQ(ASCII, posts->column_type);
  ASSERT_EQ(TIME_UUID, posts->name_type());
}

TEST(KeyspaceSchemaTest, TestMissingColumnFamily) {
  KeyspaceSchema schema = KeyspaceSchema::FromKsDef(MakeKsDef());
  const ColumnFamilySchema* cf;
  Status s = schema.FindColumnFamily("Nope", &cf);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Schema for column family \"Nope\" not found");
  ASSERT_STR_CONTAINS(s.ToString(), "keyspace Keyspace1");
}

class SchemaCacheTest : public CasscTest {
 public:
  SchemaCacheTest()
      : factory_(&cluster_),
        pool_(&factory_, SeedRandom()),
        dispatcher_(&pool_, 2),
        cache_(&dispatcher_) {
  }

  void SetUp() override {
    FLAGS_call_retry_backoff_base_ms = 0;
    ASSERT_OK(cluster_.CreateKeyspace(MakeKsDef()));
    pool_.RegisterServer(rpc::NodeDescriptor("10.0.0.1", 9160));
  }

 protected:
  int num_describes() const {
    return cluster_.num_calls(rpc::kDescribeKeyspaceMethod);
  }

  FakeCluster cluster_;
  FakeTransportFactory factory_;
  ConnectionPool pool_;
  CallDispatcher dispatcher_;
  SchemaCache cache_;
};

TEST_F(SchemaCacheTest, TestLookupIsCached) {
  shared_ptr<const KeyspaceSchema> first;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &first));
  ASSERT_EQ("Keyspace1", first->name);
  ASSERT_EQ(1, num_describes());
  ASSERT_EQ(1U, cache_.size());

  shared_ptr<const KeyspaceSchema> second;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &second));
  ASSERT_EQ(first.get(), second.get());
  ASSERT_EQ(1, num_describes());
}

TEST_F(SchemaCacheTest, TestBypassingTheCache) {
  shared_ptr<const KeyspaceSchema> cached;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &cached));

  shared_ptr<const KeyspaceSchema> fresh;
  ASSERT_OK(cache_.Lookup("Keyspace1", false, &fresh));
  ASSERT_EQ(2, num_describes());
  ASSERT_NE(cached.get(), fresh.get());

  // The fresh schema does not replace the cached one.
  shared_ptr<const KeyspaceSchema> again;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &again));
  ASSERT_EQ(cached.get(), again.get());
  ASSERT_EQ(2, num_describes());
}

TEST_F(SchemaCacheTest, TestInvalidate) {
  shared_ptr<const KeyspaceSchema> schema;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &schema));
  cache_.Invalidate("Keyspace1");
  ASSERT_EQ(0U, cache_.size());
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &schema));
  ASSERT_EQ(2, num_describes());

  cache_.Clear();
  ASSERT_EQ(0U, cache_.size());
}

TEST_F(SchemaCacheTest, TestExpiredEntriesAreRefetched) {
  FLAGS_schema_cache_ttl_secs = 0;
  shared_ptr<const KeyspaceSchema> schema;
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &schema));
  ASSERT_OK(cache_.Lookup("Keyspace1", true, &schema));
  ASSERT_EQ(2, num_describes());
  ASSERT_EQ(1U, cache_.size());
}

TEST_F(SchemaCacheTest, TestUnknownKeyspace) {
  shared_ptr<const KeyspaceSchema> schema;
  Status s = cache_.Lookup("NoSuchKeyspace", true, &schema);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unable to describe keyspace NoSuchKeyspace");
  ASSERT_EQ(CassandraErrorPB::NOT_FOUND, s.error_code());
  ASSERT_EQ(0U, cache_.size());
  ASSERT_FALSE(schema);
}

} // namespace client
} // namespace cassc
