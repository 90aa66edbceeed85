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

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>
#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "cassc/client/client-test-util.h"
#include "cassc/client/column_family.h"
#include "cassc/client/connection_pool.h"
#include "cassc/client/paging_iterator.h"
#include "cassc/client/schema_cache.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

DECLARE_int32(call_retry_backoff_base_ms);

using boost::optional;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

namespace cassc {
namespace client {

namespace {

string Key(int i) {
  char buf[16];
  snprintf(buf, sizeof(buf), "k%02d", i);
  return buf;
}

string UserName(int i) {
  char buf[16];
  snprintf(buf, sizeof(buf), "user%02d", i);
  return buf;
}

vector<string> Keys(const KeyedRowList& rows) {
  vector<string> keys;
  for (const KeyedRow& row : rows) {
    keys.push_back(row.key);
  }
  return keys;
}

} // anonymous namespace

class ClientTest : public CasscTest {
 public:
  ClientTest()
      : factory_(new FakeTransportFactory(&cluster_)) {
  }

  void SetUp() override {
    FLAGS_call_retry_backoff_base_ms = 0;
    ASSERT_OK(BuildClient(true, &client_));

    ColumnDefinition age("age", LONG);
    age.index_type = KEYS;
    age.index_name = "users_age";
    ASSERT_OK(client_->CreateKeyspace("Keyspace1"));
    ASSERT_OK(client_->CreateStandardColumnFamily("Keyspace1", "Users", { age }));
    ASSERT_OK(client_->CreateSuperColumnFamily("Keyspace1", "Posts"));
    ASSERT_OK(client_->UseKeyspace("Keyspace1"));
  }

 protected:
  Status BuildClient(bool autopack, shared_ptr<Client>* client) {
    return ClientBuilder()
        .add_server("10.0.0.1", 9160)
        .add_server("10.0.0.2", 9160)
        .transport_factory(factory_)
        .random_seed(SeedRandom())
        .max_call_retries(3)
        .autopack(autopack)
        .Build(client);
  }

  // Writes rows k00.. with a name and an age of i % 3.
  void InsertUsers(int n) {
    ColumnFamily* users = client_->Cf("Users");
    for (int i = 0; i < n; i++) {
      ASSERT_OK(users->Set(Key(i), Row(ColumnMap{ { "name", UserName(i) },
                                                  { "age", i % 3 } })));
    }
  }

  KeyedRowList ReadAll(PagingIterator* iter) {
    KeyedRowList rows;
    CHECK_OK(iter->GetAll(&rows));
    return rows;
  }

  FakeCluster cluster_;
  shared_ptr<FakeTransportFactory> factory_;
  shared_ptr<Client> client_;
};

TEST_F(ClientTest, TestBuilderValidation) {
  shared_ptr<Client> client;
  Status s = ClientBuilder().transport_factory(factory_).Build(&client);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "No servers given");

  s = ClientBuilder().add_server("10.0.0.1", 9160).Build(&client);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "No transport factory given");

  s = ClientBuilder()
      .add_server(rpc::NodeDescriptor())
      .transport_factory(factory_)
      .max_call_retries(0)
      .Build(&client);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_FALSE(client);
}

TEST_F(ClientTest, TestDefaults) {
  shared_ptr<Client> client;
  ASSERT_OK(ClientBuilder()
            .add_server(rpc::NodeDescriptor())
            .transport_factory(factory_)
            .Build(&client));
  ASSERT_EQ(5, client->max_call_retries());
  ASSERT_EQ(100, client->default_column_count());
  ASSERT_TRUE(client->autopack());
  ASSERT_EQ("", client->current_keyspace());
  ASSERT_EQ(1U, client->pool()->servers().size());

  client->set_max_call_retries(2);
  ASSERT_EQ(2, client->dispatcher()->max_call_retries());
  client->set_default_column_count(10);
  ASSERT_EQ(10, client->default_column_count());
}

TEST_F(ClientTest, TestGetVersion) {
  string version;
  ASSERT_OK(client_->GetVersion(&version));
  ASSERT_EQ(cluster_.version(), version);
}

TEST_F(ClientTest, TestCurrentKeyspace) {
  ASSERT_EQ("Keyspace1", client_->current_keyspace());

  KsDefPB ks_def;
  ASSERT_OK(client_->DescribeKeyspace("", &ks_def));
  ASSERT_EQ("Keyspace1", ks_def.name());
  ASSERT_EQ(2, ks_def.cf_defs_size());
}

TEST_F(ClientTest, TestOperationsWithoutKeyspace) {
  shared_ptr<Client> client;
  ASSERT_OK(BuildClient(true, &client));

  Row row;
  bool found;
  Status s = client->Cf("Users")->GetAll("jsmith", boost::none, &row, &found);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "No keyspace has been set");

  GetSliceRequestPB req;
  GetSliceResponsePB resp;
  s = client->Call(rpc::kGetSliceMethod, req, &resp);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_EQ(0, cluster_.num_calls(rpc::kGetSliceMethod));
}

TEST_F(ClientTest, TestUseUnknownKeyspace) {
  Status s = client_->UseKeyspace("NoSuchKeyspace");
  ASSERT_TRUE(s.IsKeyspaceSelectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unable to use keyspace NoSuchKeyspace");
}

// Column families handed out before a keyspace change keep working and
// follow the newly selected keyspace.
TEST_F(ClientTest, TestColumnFamilySurvivesKeyspaceChange) {
  ColumnFamily* users = client_->Cf("Users");
  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "name", "John" } })));

  ASSERT_OK(client_->CreateKeyspace("Keyspace2"));
  ASSERT_OK(client_->CreateStandardColumnFamily("Keyspace2", "Users", {}, UTF8, UTF8));
  ASSERT_OK(client_->UseKeyspace("Keyspace2"));
  ASSERT_EQ(users, client_->Cf("Users"));

  Row row;
  bool found;
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_FALSE(found);
  // No "age" column is declared in this keyspace.
  DataType type;
  ASSERT_OK(users->GetColumnValueType("age", &type));
  ASSERT_EQ(BYTES, type);

  ASSERT_OK(client_->UseKeyspace("Keyspace1"));
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_TRUE(found);
  ASSERT_EQ("{name=John}", row.ToString());
  ASSERT_OK(users->GetColumnValueType("age", &type));
  ASSERT_EQ(LONG, type);
}

TEST_F(ClientTest, TestRegisteredCredentials) {
  cluster_.AddUser("jsmith", "secret");
  client_->RegisterKeyspace("Keyspace1", "jsmith", "secret");
  client_->CloseConnections();
  ASSERT_OK(client_->UseKeyspace("Keyspace1"));
  ASSERT_GT(cluster_.num_calls(rpc::kLoginMethod), 0);

  ASSERT_FALSE(client_->UseKeyspace("Keyspace1", "jsmith", "wrong").ok());
}

TEST_F(ClientTest, TestSetAndGet) {
  ColumnFamily* users = client_->Cf("Users");
  ASSERT_EQ(users, client_->Cf("Users"));
  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "name", "John" },
                                                { "age", 42 },
                                                { "email", "john@example.com" } })));

  Row row;
  bool found;
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_TRUE(found);
  ASSERT_FALSE(row.is_super());
  ASSERT_EQ(3U, row.size());
  ASSERT_EQ(Value("John"), row.columns().at("name"));
  // Declared as a long, so it comes back as a number.
  ASSERT_EQ(Value(42), row.columns().at("age"));
  ASSERT_EQ(Value("john@example.com"), row.columns().at("email"));

  ASSERT_OK(users->GetAll("nobody", boost::none, &row, &found));
  ASSERT_FALSE(found);
}

TEST_F(ClientTest, TestGetSomeColumns) {
  ColumnFamily* users = client_->Cf("Users");
  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "a", "1" }, { "b", "2" },
                                                { "c", "3" }, { "d", "4" } })));
  Row row;
  bool found;
  ASSERT_OK(users->GetColumns("jsmith", { "b", "d", "zz" }, boost::none, &row, &found));
  ASSERT_TRUE(found);
  ASSERT_EQ("{b=2, d=4}", row.ToString());

  ASSERT_OK(users->GetColumnRange("jsmith", "b", "c", boost::none, &row, &found));
  ASSERT_EQ("{b=2, c=3}", row.ToString());

  ReadOptions options;
  options.reversed = true;
  options.column_count = 2;
  ASSERT_OK(users->Get("jsmith", options, &row, &found));
  ASSERT_EQ("{c=3, d=4}", row.ToString());

  options = ReadOptions();
  options.columns = vector<Value>{ "a" };
  options.start_column = Value("a");
  Status s = users->Get("jsmith", options, &row, &found);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "but not both at the same time");
}

TEST_F(ClientTest, TestWriteOptions) {
  ColumnFamily* users = client_->Cf("Users");
  WriteOptions options;
  options.timestamp = 1234;
  options.ttl = 60;
  options.consistency = QUORUM;
  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "name", "John" } }), options));

  GetSliceRequestPB req;
  req.set_key("jsmith");
  req.mutable_column_parent()->set_column_family("Users");
  req.mutable_predicate()->add_column_names("name");
  GetSliceResponsePB resp;
  ASSERT_OK(client_->Call(rpc::kGetSliceMethod, req, &resp));
  ASSERT_EQ(1, resp.columns_size());
  ASSERT_EQ(1234, resp.columns(0).column().timestamp());
  ASSERT_EQ(60, resp.columns(0).column().ttl());
}

TEST_F(ClientTest, TestRemove) {
  ColumnFamily* users = client_->Cf("Users");
  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "name", "John" }, { "email", "j@x" } })));

  ASSERT_OK(users->Remove("jsmith", { "email" }, boost::none));
  Row row;
  bool found;
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_EQ("{name=John}", row.ToString());
  ASSERT_EQ(0, cluster_.num_calls(rpc::kRemoveMethod));

  ASSERT_OK(users->Remove("jsmith", {}, boost::none));
  ASSERT_EQ(1, cluster_.num_calls(rpc::kRemoveMethod));
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_FALSE(found);
}

TEST_F(ClientTest, TestGetMultiple) {
  NO_FATALS(InsertUsers(3));
  KeyedRowList rows;
  ASSERT_OK(client_->Cf("Users")->GetMultiple({ Key(2), "nobody", Key(0) }, ReadOptions(),
                                              &rows));
  ASSERT_EQ((vector<string>{ Key(2), Key(0) }), Keys(rows));
  ASSERT_EQ(Value(UserName(2)), rows[0].row.columns().at("name"));
}

TEST_F(ClientTest, TestSuperColumns) {
  ColumnFamily* posts = client_->Cf("Posts");
  ASSERT_OK(posts->Set("jsmith", Row(SuperColumnMap{
      { "p1", ColumnMap{ { "title", "Hello" }, { "body", "World" } } },
      { "p2", ColumnMap{ { "title", "Bye" } } } })));

  Row row;
  bool found;
  ASSERT_OK(posts->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_TRUE(found);
  ASSERT_TRUE(row.is_super());
  ASSERT_EQ("{p1={body=World, title=Hello}, p2={title=Bye}}", row.ToString());

  ASSERT_OK(posts->GetAll("jsmith", Value("p1"), &row, &found));
  ASSERT_FALSE(row.is_super());
  ASSERT_EQ("{body=World, title=Hello}", row.ToString());

  ASSERT_OK(posts->Remove("jsmith", {}, Value("p1")));
  ASSERT_OK(posts->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_EQ("{p2={title=Bye}}", row.ToString());

  ASSERT_OK(posts->Remove("jsmith", { "title" }, Value("p2")));
  ASSERT_OK(posts->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_FALSE(found);
}

TEST_F(ClientTest, TestRowKindMustMatchFamily) {
  Status s = client_->Cf("Posts")->Set("jsmith", Row(ColumnMap{ { "title", "Hello" } }));
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();

  s = client_->Cf("Users")->Set("jsmith", Row(SuperColumnMap{
      { "p1", ColumnMap{ { "title", "Hello" } } } }));
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();

  s = client_->Cf("Users")->Set("jsmith", Row());
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();

  Row row;
  bool found;
  s = client_->Cf("Users")->GetAll("jsmith", Value("p1"), &row, &found);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_EQ(0, cluster_.num_calls(rpc::kBatchMutateMethod));
}

TEST_F(ClientTest, TestUnknownColumnFamily) {
  Row row;
  bool found;
  Status s = client_->Cf("Nope")->GetAll("jsmith", boost::none, &row, &found);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Schema for column family \"Nope\" not found");
}

TEST_F(ClientTest, TestSchemaTypes) {
  DataType type;
  ASSERT_OK(client_->Cf("Users")->GetColumnNameType(&type));
  ASSERT_EQ(UTF8, type);
  ASSERT_OK(client_->Cf("Users")->GetColumnValueType("age", &type));
  ASSERT_EQ(LONG, type);
  ASSERT_OK(client_->Cf("Users")->GetColumnValueType("email", &type));
  ASSERT_EQ(BYTES, type);

  const ColumnFamilySchema* schema;
  ASSERT_OK(client_->Cf("Posts")->GetSchema(true, &schema));
  ASSERT_TRUE(schema->is_super);
}

TEST_F(ClientTest, TestKeyRange) {
  NO_FATALS(InsertUsers(25));
  ColumnFamily* users = client_->Cf("Users");

  unique_ptr<PagingIterator> iter;
  ASSERT_OK(users->GetKeyRange("", "", ReadOptions(), boost::none, 10, &iter));
  KeyedRowList rows = ReadAll(iter.get());
  ASSERT_EQ(25U, rows.size());
  ASSERT_EQ(Key(0), rows.front().key);
  ASSERT_EQ(Key(24), rows.back().key);
  ASSERT_EQ(Value(UserName(24)), rows.back().row.columns().at("name"));

  ASSERT_OK(users->GetKeyRange(Key(5), Key(14), ReadOptions(), boost::none, 10, &iter));
  rows = ReadAll(iter.get());
  ASSERT_EQ(10U, rows.size());
  ASSERT_EQ(Key(5), rows.front().key);
  ASSERT_EQ(Key(14), rows.back().key);

  ASSERT_OK(users->GetKeyRange("", "", ReadOptions(), optional<int64_t>(7), 10, &iter));
  rows = ReadAll(iter.get());
  ASSERT_EQ(7U, rows.size());

  ASSERT_TRUE(users->GetKeyRange("", "", ReadOptions(), boost::none, 1, &iter)
              .IsInvalidArgument());
}

TEST_F(ClientTest, TestKeyRangeSkipsDeletedRows) {
  NO_FATALS(InsertUsers(6));
  ColumnFamily* users = client_->Cf("Users");
  ASSERT_OK(users->Remove(Key(3), {}, boost::none));
  ASSERT_EQ(6, cluster_.num_rows("Keyspace1", "Users"));

  unique_ptr<PagingIterator> iter;
  ASSERT_OK(users->GetKeyRange("", "", ReadOptions(), boost::none, 3, &iter));
  KeyedRowList rows = ReadAll(iter.get());
  ASSERT_EQ((vector<string>{ Key(0), Key(1), Key(2), Key(4), Key(5) }), Keys(rows));
}

TEST_F(ClientTest, TestGetWhere) {
  NO_FATALS(InsertUsers(10));
  ColumnFamily* users = client_->Cf("Users");

  ReadOptions options;
  options.columns = vector<Value>{ "name" };
  options.column_count = 2;
  unique_ptr<PagingIterator> iter;
  ASSERT_OK(users->GetWhere({ IndexCondition{ "age", EQ, 1 } }, options, boost::none, &iter));
  KeyedRowList rows = ReadAll(iter.get());
  ASSERT_EQ((vector<string>{ Key(1), Key(4), Key(7) }), Keys(rows));
  ASSERT_EQ("{name=user04}", rows[1].row.ToString());
  ASSERT_EQ(2, iter->page_size());

  ASSERT_OK(users->GetWhere({ IndexCondition{ "age", EQ, 2 },
                              IndexCondition{ "name", GT, "user05" } },
                            options, boost::none, &iter));
  rows = ReadAll(iter.get());
  ASSERT_EQ((vector<string>{ Key(8) }), Keys(rows));

  ASSERT_OK(users->GetWhere({ IndexCondition{ "age", EQ, 0 } }, options,
                            optional<int64_t>(2), &iter));
  rows = ReadAll(iter.get());
  ASSERT_EQ((vector<string>{ Key(0), Key(3) }), Keys(rows));
}

TEST_F(ClientTest, TestGetWhereErrors) {
  ColumnFamily* users = client_->Cf("Users");
  unique_ptr<PagingIterator> iter;
  Status s = users->GetWhere(WhereClause(), ReadOptions(), boost::none, &iter);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();

  // The server needs an equality condition on an indexed column. Its
  // rejection is retried like any other server failure.
  ASSERT_OK(users->GetWhere({ IndexCondition{ "name", EQ, "user01" } }, ReadOptions(),
                            boost::none, &iter));
  KeyedRow row;
  bool has_row;
  s = iter->Next(&row, &has_row);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "No indexed columns present");
  ASSERT_EQ(CassandraErrorPB::INVALID_REQUEST, s.error_code());
  ASSERT_EQ(3, cluster_.num_calls(rpc::kGetIndexedSlicesMethod));
  ASSERT_TRUE(client_->dispatcher()->last_error().IsRemoteError());
  ASSERT_EQ(CassandraErrorPB::INVALID_REQUEST,
            client_->dispatcher()->last_error().error_code());
  ASSERT_EQ(PagingIterator::EXHAUSTED, iter->state());
}

TEST_F(ClientTest, TestRequestStrings) {
  ASSERT_OK(client_->Set("Users.jsmith", Row(ColumnMap{ { "name", "John" },
                                                        { "email", "j@x" },
                                                        { "age", "42" } }),
                         QUORUM));
  Row row;
  bool found;
  ASSERT_OK(client_->Get("Users.jsmith:email,name", boost::none, &row, &found));
  ASSERT_TRUE(found);
  ASSERT_EQ("{email=j@x, name=John}", row.ToString());

  ASSERT_OK(client_->Get("Users.jsmith:age", ONE, &row, &found));
  ASSERT_EQ(Value(42), row.columns().at("age"));

  ASSERT_OK(client_->Get("Users.jsmith:e-f", boost::none, &row, &found));
  ASSERT_EQ("{email=j@x}", row.ToString());

  ASSERT_OK(client_->Get("Users.jsmith|1R", boost::none, &row, &found));
  ASSERT_EQ("{name=John}", row.ToString());

  ASSERT_OK(client_->Set("Posts.jsmith", Row(SuperColumnMap{
      { "p1", ColumnMap{ { "title", "Hello" } } } })));
  ASSERT_OK(client_->Get("Posts.jsmith.p1:title", boost::none, &row, &found));
  ASSERT_EQ("{title=Hello}", row.ToString());

  ASSERT_TRUE(client_->Get("Users", boost::none, &row, &found).IsInvalidPattern());
  ASSERT_TRUE(client_->Set("Users", Row(ColumnMap{ { "a", "b" } })).IsInvalidPattern());
}

TEST_F(ClientTest, TestAutopackDisabled) {
  shared_ptr<Client> raw;
  ASSERT_OK(BuildClient(false, &raw));
  ASSERT_OK(raw->UseKeyspace("Keyspace1"));
  ASSERT_FALSE(raw->autopack());
  ColumnFamily* users = raw->Cf("Users");
  ASSERT_FALSE(users->autopack());

  ASSERT_OK(users->Set("jsmith", Row(ColumnMap{ { "age", 42 } })));
  Row row;
  bool found;
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));
  ASSERT_EQ(Value("42"), row.columns().at("age"));

  // The value was written as text, which is not a valid long.
  Status s = client_->Cf("Users")->GetAll("jsmith", boost::none, &row, &found);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
}

TEST_F(ClientTest, TestCallsAreRetried) {
  ColumnFamily* users = client_->Cf("Users");
  Row row;
  bool found;
  ASSERT_OK(users->GetAll("warmup", boost::none, &row, &found));

  cluster_.InjectFailures(rpc::kGetSliceMethod, 2, Status::TimedOut("slow"));
  ASSERT_OK(users->GetAll("jsmith", boost::none, &row, &found));

  cluster_.InjectFailures(rpc::kGetSliceMethod, 3, Status::TimedOut("slow"));
  Status s = users->GetAll("jsmith", boost::none, &row, &found);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_TRUE(client_->dispatcher()->last_error().IsTimedOut());
}

TEST_F(ClientTest, TestSchemaDefinition) {
  std::map<string, string> options;
  options["replication_factor"] = "3";
  ASSERT_OK(client_->CreateKeyspace("Keyspace2", 3, kSimpleStrategy, options));

  KsDefPB ks_def;
  ASSERT_OK(client_->DescribeKeyspace("Keyspace2", &ks_def));
  ASSERT_EQ(3, ks_def.replication_factor());
  ASSERT_EQ(kSimpleStrategy, ks_def.strategy_class());
  ASSERT_EQ("3", ks_def.strategy_options().at("replication_factor"));
  ASSERT_EQ(0, ks_def.cf_defs_size());

  shared_ptr<const KeyspaceSchema> schema;
  ASSERT_OK(client_->GetKeyspaceSchema("Keyspace2", true, &schema));
  ASSERT_TRUE(schema->column_families.empty());

  ColumnFamilyDefinition def;
  def.keyspace = "Keyspace2";
  def.name = "Events";
  def.comparator_type = LONG;
  def.default_validation_type = BYTES;
  def.columns.emplace_back("kind", ASCII);
  def.comment = "event log";
  def.gc_grace_seconds = 3600;
  ASSERT_OK(client_->CreateColumnFamily(def));

  // Creating the column family dropped the cached schema.
  ASSERT_OK(client_->GetKeyspaceSchema("Keyspace2", true, &schema));
  const ColumnFamilySchema* events;
  ASSERT_OK(schema->FindColumnFamily("Events", &events));
  ASSERT_EQ(LONG, events->column_type);

  ASSERT_OK(client_->DescribeKeyspace("Keyspace2", &ks_def));
  ASSERT_EQ(1, ks_def.cf_defs_size());
  const CfDefPB& cf_def = ks_def.cf_defs(0);
  ASSERT_EQ("org.apache.cassandra.db.marshal.LongType", cf_def.comparator_type());
  ASSERT_EQ("org.apache.cassandra.db.marshal.AsciiType",
            cf_def.column_metadata(0).validation_class());
  ASSERT_EQ("event log", cf_def.comment());
  ASSERT_EQ(3600, cf_def.gc_grace_seconds());
  ASSERT_FALSE(cf_def.has_row_cache_size());

  ASSERT_OK(client_->UpdateKeyspace("Keyspace2", 2));
  ASSERT_OK(client_->DescribeKeyspace("Keyspace2", &ks_def));
  ASSERT_EQ(2, ks_def.replication_factor());
  ASSERT_EQ(1, ks_def.cf_defs_size());

  Status s = client_->CreateKeyspace("Keyspace2");
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Keyspace Keyspace2 already exists");
  ASSERT_EQ(CassandraErrorPB::INVALID_REQUEST, s.error_code());

  ASSERT_OK(client_->DropKeyspace("Keyspace2"));
  s = client_->DescribeKeyspace("Keyspace2", &ks_def);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_EQ(CassandraErrorPB::NOT_FOUND, s.error_code());

  ColumnFamilyDefinition unnamed;
  ASSERT_TRUE(client_->CreateColumnFamily(unnamed).IsInvalidArgument());
}

} // namespace client
} // namespace cassc
