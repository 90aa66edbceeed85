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

#include "cassc/client/call_dispatcher.h"

#include <memory>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <google/protobuf/message.h>

#include "cassc/client/connection.h"
#include "cassc/client/connection_pool.h"
#include "cassc/rpc/constants.h"
#include "cassc/rpc/transport.h"
#include "cassc/util/monotime.h"

DEFINE_int32(call_retry_backoff_base_ms, 100,
             "Base of the exponential backoff between attempts of a failed "
             "call. The n-th retry waits this many milliseconds times 2^n.");

using google::protobuf::Message;
using std::shared_ptr;
using std::string;

namespace cassc {
namespace client {

CallStatus CallStatus::FromStatus(const Status& s) {
  if (s.ok()) {
    return CallStatus{CallStatus::OK, Status::OK()};
  }
  if (s.IsInvalidArgument() || s.IsIllegalState()) {
    return CallStatus{CallStatus::FATAL_ERROR, s};
  }
  return CallStatus{CallStatus::TRANSIENT_ERROR, s};
}

CallDispatcher::CallDispatcher(ConnectionPool* pool, int max_call_retries)
    : pool_(pool),
      max_call_retries_(max_call_retries) {
  DCHECK(pool_);
  DCHECK_GT(max_call_retries_, 0);
}

void CallDispatcher::set_max_call_retries(int max_call_retries) {
  DCHECK_GT(max_call_retries, 0);
  max_call_retries_ = max_call_retries;
}

Status CallDispatcher::Call(const string& method, const Message& req, Message* resp) {
  if (rpc::RequiresKeyspace(method) && !pool_->keyspace_context()) {
    return Status::InvalidRequest(
        "Unable to call \"" + method + "\", no keyspace has been set");
  }

  Status last_error;
  for (int attempt = 1; attempt <= max_call_retries_; attempt++) {
    shared_ptr<Connection> conn;
    RETURN_NOT_OK(pool_->GetConnection(&conn));
    rpc::RpcStub* stub;
    RETURN_NOT_OK(conn->GetStub(&stub));

    resp->Clear();
    CallStatus call_status = CallStatus::FromStatus(stub->Call(method, req, resp));
    switch (call_status.result) {
      case CallStatus::OK:
        return Status::OK();
      case CallStatus::FATAL_ERROR:
        VLOG(1) << "Call to " << method << " failed fatally: "
                << call_status.status.ToString();
        return call_status.status;
      case CallStatus::TRANSIENT_ERROR:
        break;
    }

    VLOG(1) << "Attempt " << attempt << " of " << max_call_retries_
            << " calling " << method << " on " << conn->node().ToString()
            << " failed: " << call_status.status.ToString();
    last_error = std::move(call_status.status);
    if (attempt < max_call_retries_) {
      SleepFor(MonoDelta::FromMilliseconds(
          static_cast<int64_t>(FLAGS_call_retry_backoff_base_ms) << attempt));
    }
  }

  LOG(WARNING) << "Giving up calling " << method << " after "
               << max_call_retries_ << " attempts: " << last_error.ToString();
  last_error_ = last_error;
  return Status::MaxRetriesExceeded(
      "Failed calling \"" + method + "\" the maximum of " +
      std::to_string(max_call_retries_) + " times",
      last_error.ToString(), last_error.error_code());
}

} // namespace client
} // namespace cassc
