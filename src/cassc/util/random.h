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

#include <unistd.h>

#include <cstdint>

#include <glog/logging.h>

#include "cassc/util/monotime.h"

namespace cassc {

// A very simple random number generator.  Not especially good at
// generating truly random bits, but good enough for spreading load across
// servers and for tests.
//
// This class is not thread-safe.
class Random {
 private:
  static const uint32_t M = 2147483647L;   // 2^31-1
  static const uint64_t A = 16807;  // bits 14, 8, 7, 5, 2, 1, 0

  uint32_t seed_;

  static uint32_t NormalizeSeed(uint32_t s) {
    uint32_t seed = s & 0x7fffffffu;
    // Avoid bad seeds.
    if (seed == 0 || seed == M) {
      seed = 1;
    }
    return seed;
  }

 public:
  explicit Random(uint32_t s) : seed_(NormalizeSeed(s)) {}

  // Next pseudo-random value in [1, 2^31-2].
  uint32_t Next() {
    // We are computing
    //       seed_ = (seed_ * A) % M,    where M = 2^31-1
    //
    // seed_ must not be zero or M, or else all subsequent computed values
    // will be zero or M respectively.  For all other values, seed_ will end
    // up cycling through every number in [1,M-1]
    uint64_t product = seed_ * A;

    // Compute (product % M) using the fact that ((x << 31) % M) == x.
    seed_ = static_cast<uint32_t>((product >> 31) + (product & M));
    // The first reduction may overflow by 1 bit, so we may need to
    // repeat.  mod == M is not possible; using > allows the faster
    // sign-bit-based test.
    if (seed_ > M) {
      seed_ -= M;
    }
    return seed_;
  }

  // Returns a uniformly distributed value in the range [0..n-1]
  // REQUIRES: n > 0
  uint32_t Uniform(uint32_t n) {
    DCHECK_GT(n, 0U);
    return Next() % n;
  }

  // Randomly returns true ~"1/n" of the time, and false otherwise.
  // REQUIRES: n > 0
  bool OneIn(int n) { return (Next() % n) == 0; }

  void Reset(uint32_t s) { seed_ = NormalizeSeed(s); }
};

// Seed for generators that should differ from process to process.
inline uint32_t GetRandomSeed32() {
  uint32_t seed = static_cast<uint32_t>(GetCurrentTimeMicros());
  seed *= 31;
  seed += static_cast<uint32_t>(getpid());
  return seed;
}

} // namespace cassc
