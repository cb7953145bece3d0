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
#include <string_view>

namespace vigil {
class Session;

namespace SessionProperties {

enum class PropertyType { DURATION, DATA_SIZE, COUNT, BOOLEAN };

inline constexpr std::string_view QUERY_MAX_RUN_TIME = "query_max_run_time";
inline constexpr std::string_view QUERY_MAX_QUEUED_TIME = "query_max_queued_time";
inline constexpr std::string_view QUERY_MAX_EXECUTION_TIME = "query_max_execution_time";
inline constexpr std::string_view QUERY_CLIENT_TIMEOUT = "query_client_timeout";
inline constexpr std::string_view QUERY_MAX_CPU_TIME = "query_max_cpu_time";
inline constexpr std::string_view QUERY_MAX_SCAN_RAW_INPUT_BYTES = "query_max_scan_raw_input_bytes";
inline constexpr std::string_view QUERY_MAX_OUTPUT_POSITIONS = "query_max_output_positions";
inline constexpr std::string_view QUERY_MAX_OUTPUT_SIZE = "query_max_output_size";
inline constexpr std::string_view QUERY_MAX_WRITTEN_INTERMEDIATE_BYTES =
        "query_max_written_intermediate_bytes";
inline constexpr std::string_view ENABLE_INTERMEDIATE_MATERIALIZATION =
        "enable_intermediate_materialization";

// Type of a known property, nullopt for unknown names.
std::optional<PropertyType> property_type(std::string_view name);

} // namespace SessionProperties

// Session overrides, nullopt when the session did not set the property.
std::optional<int64_t> get_query_max_run_time_ms(const Session& session);
std::optional<int64_t> get_query_max_queued_time_ms(const Session& session);
std::optional<int64_t> get_query_max_execution_time_ms(const Session& session);
std::optional<int64_t> get_query_max_cpu_time_ms(const Session& session);
std::optional<int64_t> get_query_max_scan_raw_input_bytes(const Session& session);
std::optional<int64_t> get_query_max_output_positions(const Session& session);
std::optional<int64_t> get_query_max_output_size_bytes(const Session& session);
std::optional<int64_t> get_query_max_written_intermediate_bytes(const Session& session);

// Session value, or config::query_client_timeout_ms.
int64_t get_query_client_timeout_ms(const Session& session);

// Whether intermediate results may be materialized (e.g. CTEs written to temporary
// storage), which is what the written intermediate bytes limit applies to. Default false.
bool is_intermediate_materialization_enabled(const Session& session);

} // namespace vigil
