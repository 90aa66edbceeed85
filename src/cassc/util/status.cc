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

#include "cassc/util/status.h"

#include <cstdio>
#include <cstring>

namespace cassc {

const char* Status::CopyState(const char* state) {
  uint32_t size;
  memcpy(&size, state, sizeof(size));
  auto result = new char[size + 7];
  memcpy(result, state, size + 7);
  return result;
}

Status::Status(Code code, const std::string& msg, const std::string& msg2,
               int16_t error_code) {
  DCHECK(code != kOk);
  const uint32_t len1 = msg.size();
  const uint32_t len2 = msg2.size();
  const uint32_t size = len1 + (len2 ? (2 + len2) : 0);
  auto result = new char[size + 7];
  memcpy(result, &size, sizeof(size));
  result[4] = static_cast<char>(code);
  memcpy(result + 5, &error_code, sizeof(error_code));
  memcpy(result + 7, msg.data(), len1);
  if (len2) {
    result[7 + len1] = ':';
    result[8 + len1] = ' ';
    memcpy(result + 9 + len1, msg2.data(), len2);
  }
  state_ = result;
}

std::string Status::CodeAsString() const {
  if (state_ == nullptr) {
    return "OK";
  }

  char tmp[30];
  const char* type;
  switch (code()) {
    case kOk:
      type = "OK";
      break;
    case kNotFound:
      type = "Not found";
      break;
    case kCorruption:
      type = "Corruption";
      break;
    case kNotSupported:
      type = "Not implemented";
      break;
    case kInvalidArgument:
      type = "Invalid argument";
      break;
    case kIOError:
      type = "IO error";
      break;
    case kIllegalState:
      type = "Illegal state";
      break;
    case kNetworkError:
      type = "Network error";
      break;
    case kTimedOut:
      type = "Timed out";
      break;
    case kRemoteError:
      type = "Remote error";
      break;
    case kConnectionFailed:
      type = "Connection failed";
      break;
    case kConnectionClosed:
      type = "Connection closed";
      break;
    case kKeyspaceSelectionFailed:
      type = "Keyspace selection failed";
      break;
    case kInvalidRequest:
      type = "Invalid request";
      break;
    case kMaxRetriesExceeded:
      type = "Max retries exceeded";
      break;
    case kInvalidPattern:
      type = "Invalid pattern";
      break;
    default:
      snprintf(tmp, sizeof(tmp), "Unknown code(%d)",
               static_cast<int>(code()));
      type = tmp;
      break;
  }
  return std::string(type);
}

std::string Status::ToString() const {
  std::string result(CodeAsString());
  if (state_ == nullptr) {
    return result;
  }

  result.append(": ");
  result.append(message());
  int16_t code = error_code();
  if (code != -1) {
    char buf[64];
    snprintf(buf, sizeof(buf), " (error %d)", code);
    result.append(buf);
  }
  return result;
}

std::string Status::message() const {
  if (state_ == nullptr) {
    return std::string();
  }

  uint32_t length;
  memcpy(&length, state_, sizeof(length));
  return std::string(state_ + 7, length);
}

int16_t Status::error_code() const {
  if (state_ == nullptr) {
    return 0;
  }
  int16_t error_code;
  memcpy(&error_code, state_ + 5, sizeof(error_code));
  return error_code;
}

Status Status::CloneAndPrepend(const std::string& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code(), msg, message(), error_code());
}

Status Status::CloneAndAppend(const std::string& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code(), message(), msg, error_code());
}

} // namespace cassc
