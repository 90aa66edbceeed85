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
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.
#ifndef CASSC_UTIL_STATUS_H
#define CASSC_UTIL_STATUS_H

#include <cstdint>
#include <string>

#include <glog/logging.h>

#include "cassc/util/macros.h"

// Return the given status if it is not OK.
#define RETURN_NOT_OK(s) do { \
    const ::cassc::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s; \
  } while (0)

// Return the given status if it is not OK, but first clone it and
// prepend the given message.
#define RETURN_NOT_OK_PREPEND(s, msg) do { \
    const ::cassc::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s.CloneAndPrepend(msg); \
  } while (0)

// Emit a warning if 'to_call' returns a bad status.
#define WARN_NOT_OK(to_call, warning_prefix) do { \
    const ::cassc::Status& _s = (to_call); \
    if (PREDICT_FALSE(!_s.ok())) { \
      LOG(WARNING) << (warning_prefix) << ": " << _s.ToString(); \
    } \
  } while (0)

// If 's' is not OK, fail with a fatal log message.
#define CHECK_OK(s) do { \
    const ::cassc::Status& _s = (s); \
    CHECK(_s.ok()) << "Bad status: " << _s.ToString(); \
  } while (0)

namespace cassc {

class Status {
 public:
  // Create a success status.
  Status() : state_(nullptr) {}
  ~Status() { delete[] state_; }

  Status(const Status& s);
  Status& operator=(const Status& s);
  Status(Status&& s) noexcept;
  Status& operator=(Status&& s) noexcept;

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status NotFound(const std::string& msg, const std::string& msg2 = "",
                         int16_t error_code = -1) {
    return Status(kNotFound, msg, msg2, error_code);
  }
  static Status Corruption(const std::string& msg, const std::string& msg2 = "",
                           int16_t error_code = -1) {
    return Status(kCorruption, msg, msg2, error_code);
  }
  static Status NotSupported(const std::string& msg, const std::string& msg2 = "",
                             int16_t error_code = -1) {
    return Status(kNotSupported, msg, msg2, error_code);
  }
  static Status InvalidArgument(const std::string& msg, const std::string& msg2 = "",
                                int16_t error_code = -1) {
    return Status(kInvalidArgument, msg, msg2, error_code);
  }
  static Status IOError(const std::string& msg, const std::string& msg2 = "",
                        int16_t error_code = -1) {
    return Status(kIOError, msg, msg2, error_code);
  }
  static Status IllegalState(const std::string& msg, const std::string& msg2 = "",
                             int16_t error_code = -1) {
    return Status(kIllegalState, msg, msg2, error_code);
  }
  static Status NetworkError(const std::string& msg, const std::string& msg2 = "",
                             int16_t error_code = -1) {
    return Status(kNetworkError, msg, msg2, error_code);
  }
  static Status TimedOut(const std::string& msg, const std::string& msg2 = "",
                         int16_t error_code = -1) {
    return Status(kTimedOut, msg, msg2, error_code);
  }
  static Status RemoteError(const std::string& msg, const std::string& msg2 = "",
                            int16_t error_code = -1) {
    return Status(kRemoteError, msg, msg2, error_code);
  }
  static Status ConnectionFailed(const std::string& msg, const std::string& msg2 = "",
                                 int16_t error_code = -1) {
    return Status(kConnectionFailed, msg, msg2, error_code);
  }
  static Status ConnectionClosed(const std::string& msg, const std::string& msg2 = "",
                                 int16_t error_code = -1) {
    return Status(kConnectionClosed, msg, msg2, error_code);
  }
  static Status KeyspaceSelectionFailed(const std::string& msg, const std::string& msg2 = "",
                                        int16_t error_code = -1) {
    return Status(kKeyspaceSelectionFailed, msg, msg2, error_code);
  }
  static Status InvalidRequest(const std::string& msg, const std::string& msg2 = "",
                               int16_t error_code = -1) {
    return Status(kInvalidRequest, msg, msg2, error_code);
  }
  static Status MaxRetriesExceeded(const std::string& msg, const std::string& msg2 = "",
                                   int16_t error_code = -1) {
    return Status(kMaxRetriesExceeded, msg, msg2, error_code);
  }
  static Status InvalidPattern(const std::string& msg, const std::string& msg2 = "",
                               int16_t error_code = -1) {
    return Status(kInvalidPattern, msg, msg2, error_code);
  }

  // Returns true iff the status indicates success.
  bool ok() const { return state_ == nullptr; }

  bool IsNotFound() const { return code() == kNotFound; }
  bool IsCorruption() const { return code() == kCorruption; }
  bool IsNotSupported() const { return code() == kNotSupported; }
  bool IsInvalidArgument() const { return code() == kInvalidArgument; }
  bool IsIOError() const { return code() == kIOError; }
  bool IsIllegalState() const { return code() == kIllegalState; }
  bool IsNetworkError() const { return code() == kNetworkError; }
  bool IsTimedOut() const { return code() == kTimedOut; }
  bool IsRemoteError() const { return code() == kRemoteError; }
  bool IsConnectionFailed() const { return code() == kConnectionFailed; }
  bool IsConnectionClosed() const { return code() == kConnectionClosed; }
  bool IsKeyspaceSelectionFailed() const { return code() == kKeyspaceSelectionFailed; }
  bool IsInvalidRequest() const { return code() == kInvalidRequest; }
  bool IsMaxRetriesExceeded() const { return code() == kMaxRetriesExceeded; }
  bool IsInvalidPattern() const { return code() == kInvalidPattern; }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  // Return a string representation of the status code, without the message
  // text or error code information.
  std::string CodeAsString() const;

  // Return the message portion of the Status. For success, returns an empty
  // string.
  std::string message() const;

  // Get the error code attached to this Status, or -1 if there is none.
  // MaxRetriesExceeded statuses carry the code of the error they wrap.
  int16_t error_code() const;

  // Clone the object and add the specified prefix to the clone's message.
  Status CloneAndPrepend(const std::string& msg) const;

  // Clone the object and add the specified suffix to the clone's message.
  Status CloneAndAppend(const std::string& msg) const;

 private:
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kNotSupported = 3,
    kInvalidArgument = 4,
    kIOError = 5,
    kIllegalState = 6,
    kNetworkError = 7,
    kTimedOut = 8,
    kRemoteError = 9,
    kConnectionFailed = 10,
    kConnectionClosed = 11,
    kKeyspaceSelectionFailed = 12,
    kInvalidRequest = 13,
    kMaxRetriesExceeded = 14,
    kInvalidPattern = 15,
    // NOTE: add new codes to the CodeAsString() switch as well.
  };
  static_assert(sizeof(Code) == 4, "Code enum size is part of the abi");

  Status(Code code, const std::string& msg, const std::string& msg2, int16_t error_code);

  Code code() const {
    return (state_ == nullptr) ? kOk : static_cast<Code>(state_[4]);
  }

  static const char* CopyState(const char* s);

  // OK status has a nullptr state_.  Otherwise, state_ is a new[] array
  // of the following form:
  //    state_[0..3] == length of message
  //    state_[4]    == code
  //    state_[5..6] == error_code
  //    state_[7..]  == message
  const char* state_;
};

inline Status::Status(const Status& s) {
  state_ = (s.state_ == nullptr) ? nullptr : CopyState(s.state_);
}

inline Status& Status::operator=(const Status& s) {
  // The following condition catches both aliasing (when this == &s),
  // and the common case where both s and *this are OK.
  if (state_ != s.state_) {
    delete[] state_;
    state_ = (s.state_ == nullptr) ? nullptr : CopyState(s.state_);
  }
  return *this;
}

inline Status::Status(Status&& s) noexcept : state_(s.state_) {
  s.state_ = nullptr;
}

inline Status& Status::operator=(Status&& s) noexcept {
  if (state_ != s.state_) {
    delete[] state_;
    state_ = s.state_;
    s.state_ = nullptr;
  }
  return *this;
}

} // namespace cassc

#endif // CASSC_UTIL_STATUS_H
