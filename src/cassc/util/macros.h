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
// Compiler hints and class-declaration helpers shared by the whole tree.
#ifndef CASSC_UTIL_MACROS_H
#define CASSC_UTIL_MACROS_H

#ifndef DISALLOW_COPY_AND_ASSIGN
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;      \
  void operator=(const TypeName&) = delete
#endif

#if defined(__GNUC__)
#define PREDICT_FALSE(x) (__builtin_expect(!!(x), 0))
#define PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))
#define WARN_UNUSED_RESULT __attribute__((warn_unused_result))
#else
#define PREDICT_FALSE(x) (x)
#define PREDICT_TRUE(x) (x)
#define WARN_UNUSED_RESULT
#endif

#endif // CASSC_UTIL_MACROS_H
