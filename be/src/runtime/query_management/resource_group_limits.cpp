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

#include "runtime/query_management/resource_group_limits.h"

#include <fmt/format.h>

namespace vigil {

std::string ResourceGroupQueryLimits::debug_string() const {
    auto print = [](const std::optional<int64_t>& v) {
        return v.has_value() ? std::to_string(*v) : std::string("none");
    };
    return fmt::format(
            "ResourceGroupQueryLimits(execution_time_ms={}, cpu_time_ms={}, "
            "scan_raw_input_bytes={}, total_memory_bytes={})",
            print(execution_time_ms), print(cpu_time_ms), print(scan_raw_input_bytes),
            print(total_memory_bytes));
}

} // namespace vigil
