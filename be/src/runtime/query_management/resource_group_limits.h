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
#include <optional>
#include <string>

namespace vigil {

// Limits a resource group imposes on each of its queries. Every item is optional, an
// unset item leaves the system and session limits in charge.
struct ResourceGroupQueryLimits {
    std::optional<int64_t> execution_time_ms;
    std::optional<int64_t> cpu_time_ms;
    std::optional<int64_t> scan_raw_input_bytes;
    std::optional<int64_t> total_memory_bytes;

    std::string debug_string() const;
};

} // namespace vigil
