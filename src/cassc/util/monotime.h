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

#include <cstdint>
#include <string>

namespace cassc {

class MonoTime;

// Represent an elapsed duration of time -- i.e the delta between
// two MonoTime instances.
class MonoDelta {
 public:
  static MonoDelta FromSeconds(double seconds);
  static MonoDelta FromMilliseconds(int64_t ms);
  static MonoDelta FromMicroseconds(int64_t us);
  static MonoDelta FromNanoseconds(int64_t ns);

  // Creates an uninitialized delta.
  MonoDelta();

  bool Initialized() const;
  bool LessThan(const MonoDelta& rhs) const;
  bool MoreThan(const MonoDelta& rhs) const;
  bool Equals(const MonoDelta& rhs) const;

  std::string ToString() const;

  double ToSeconds() const;
  int64_t ToMilliseconds() const;
  int64_t ToMicroseconds() const;
  int64_t ToNanoseconds() const;

 private:
  static const int64_t kUninitialized;

  friend class MonoTime;
  explicit MonoDelta(int64_t delta);
  int64_t nano_delta_;
};

// Represent a particular point in time, relative to some fixed but unspecified
// reference point.
//
// This time is monotonic, meaning that if the user changes his or her system
// clock, the monotime does not change.
class MonoTime {
 public:
  static const int64_t kNanosecondsPerSecond = 1000000000L;
  static const int64_t kNanosecondsPerMillisecond = 1000000L;
  static const int64_t kNanosecondsPerMicrosecond = 1000L;

  static MonoTime Now();

  // Creates an uninitialized time.
  MonoTime();

  bool Initialized() const;
  MonoDelta GetDeltaSince(const MonoTime& rhs) const;
  void AddDelta(const MonoDelta& delta);
  bool ComesBefore(const MonoTime& rhs) const;
  std::string ToString() const;

 private:
  explicit MonoTime(int64_t nanos);
  uint64_t nanos_;
};

bool operator<(const MonoTime& lhs, const MonoTime& rhs);
MonoTime operator+(const MonoTime& t, const MonoDelta& delta);

// Sleep for the given duration. Durations that are uninitialized or not
// positive return immediately.
void SleepFor(const MonoDelta& delta);

// Microseconds since the Unix epoch, from the wall clock. Used for write
// timestamps, which must be comparable across clients.
int64_t GetCurrentTimeMicros();

} // namespace cassc
