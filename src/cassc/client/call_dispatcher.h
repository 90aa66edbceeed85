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

#include <string>

#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace google {
namespace protobuf {
class Message;
} // namespace protobuf
} // namespace google

namespace cassc {
namespace client {

class ConnectionPool;

// Outcome of a single call attempt.
struct CallStatus {
  enum Result {
    OK,

    // The attempt failed in a way another attempt might not: the node was
    // unreachable or timed out, or the server rejected or failed the request.
    TRANSIENT_ERROR,

    // The request could not be sent as built (e.g. it failed to serialize).
    // Sending it again cannot succeed.
    FATAL_ERROR,
  };

  // Sorts a status returned by RpcStub::Call() into one of the results above.
  static CallStatus FromStatus(const Status& s);

  Result result;
  Status status;
};

// Invokes remote operations by name on connections taken from a pool,
// retrying failed attempts with exponential backoff.
//
// This class is not thread-safe.
class CallDispatcher {
 public:
  // 'pool' must outlive the dispatcher.
  CallDispatcher(ConnectionPool* pool, int max_call_retries);

  // Calls 'method' with 'req', filling in 'resp' on success.
  //
  // Operations that need a keyspace fail with InvalidRequest before anything
  // is sent if none has been selected. Pool failures are returned as they
  // are. Fatal errors are returned after the first attempt. Transient errors
  // are retried up to max_call_retries() attempts in total, sleeping
  // --call_retry_backoff_base_ms * 2^attempt between them; when all attempts
  // failed MaxRetriesExceeded is returned, carrying the text and the error
  // code of the last failure.
  Status Call(const std::string& method,
              const google::protobuf::Message& req,
              google::protobuf::Message* resp) WARN_UNUSED_RESULT;

  int max_call_retries() const { return max_call_retries_; }
  void set_max_call_retries(int max_call_retries);

  // The failure of the last attempt made by the most recent Call() that ran
  // out of retries.
  const Status& last_error() const { return last_error_; }

 private:
  ConnectionPool* const pool_;
  int max_call_retries_;
  Status last_error_;

  DISALLOW_COPY_AND_ASSIGN(CallDispatcher);
};

} // namespace client
} // namespace cassc
