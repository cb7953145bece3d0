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
#include <ctime>
#include <string>

#define NANOS_PER_SEC 1000000000ll
#define NANOS_PER_MILLIS 1000000ll
#define NANOS_PER_MICRO 1000ll
#define MICROS_PER_SEC 1000000ll
#define MICROS_PER_MILLI 1000ll
#define MILLIS_PER_SEC 1000ll

namespace vigil {

// Returns the value of CLOCK_MONOTONIC in milliseconds. Only differences between two
// values are meaningful.
inline int64_t MonotonicMillis() {
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec * MILLIS_PER_SEC + ts.tv_nsec / NANOS_PER_MILLIS;
}

inline int64_t MonotonicNanos() {
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec * NANOS_PER_SEC + ts.tv_nsec;
}

// Milliseconds since the unix epoch, wall clock. Query timestamps use this clock.
inline int64_t UnixMillis() {
    timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return ts.tv_sec * MILLIS_PER_SEC + ts.tv_nsec / NANOS_PER_MILLIS;
}

inline int64_t UnixSeconds() {
    return UnixMillis() / MILLIS_PER_SEC;
}

// "2024-01-02 03:04:05.678" in local time, 0 is rendered as "N/A".
std::string ToStringFromUnixMillis(int64_t ms);

} // namespace vigil
