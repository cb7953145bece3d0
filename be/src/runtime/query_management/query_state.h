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
#include <ostream>
#include <string_view>

namespace vigil {

// QUEUED -> RUNNING -> FINISHING -> FINISHED
// any state that is not done -> FAILED or CANCELED
enum class QueryState : uint8_t {
    QUEUED = 0,
    RUNNING,
    FINISHING,
    FINISHED,
    FAILED,
    CANCELED,
};

inline bool is_done_state(QueryState state) {
    return state == QueryState::FINISHED || state == QueryState::FAILED ||
           state == QueryState::CANCELED;
}

std::string_view query_state_to_string(QueryState state);

inline std::ostream& operator<<(std::ostream& os, QueryState state) {
    return os << query_state_to_string(state);
}

} // namespace vigil
