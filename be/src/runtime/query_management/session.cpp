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

#include "runtime/query_management/session.h"

#include <fmt/format.h>

#include <iterator>
#include <utility>

#include "common/config.h"
#include "common/exception.h"
#include "runtime/query_management/session_properties.h"
#include "util/parse_util.h"

namespace vigil {
#include "common/compile_check_begin.h"

Session::Session(std::string user, std::string source, std::string catalog, std::string schema)
        : _user(std::move(user)),
          _source(std::move(source)),
          _catalog(std::move(catalog)),
          _schema(std::move(schema)) {}

void Session::set_property(const std::string& name, const std::string& value) {
    auto type = SessionProperties::property_type(name);
    if (!type.has_value()) {
        throw Exception(ErrorCode::INVALID_ARGUMENT, "Session property {} does not exist", name);
    }
    int64_t parsed = 0;
    bool ok = false;
    switch (*type) {
    case SessionProperties::PropertyType::DURATION:
        ok = ParseUtil::parse_duration_ms(value, &parsed);
        break;
    case SessionProperties::PropertyType::DATA_SIZE:
        ok = ParseUtil::parse_data_size(value, &parsed);
        break;
    case SessionProperties::PropertyType::COUNT:
        ok = ParseUtil::parse_count(value, &parsed);
        break;
    case SessionProperties::PropertyType::BOOLEAN: {
        bool flag = false;
        ok = ParseUtil::parse_bool(value, &flag);
        parsed = flag ? 1 : 0;
        break;
    }
    }
    if (!ok) {
        throw Exception(ErrorCode::INVALID_ARGUMENT, "{} is invalid for session property {}",
                        value, name);
    }
    _properties[name] = value;
    _parsed_properties[name] = parsed;
}

std::optional<std::string> Session::property(const std::string& name) const {
    auto it = _properties.find(name);
    if (it == _properties.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> Session::parsed_property(const std::string& name) const {
    auto it = _parsed_properties.find(name);
    if (it == _parsed_properties.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Session::debug_string() const {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf),
                   "Session(user={}, source={}, catalog={}, schema={}, properties={{", _user,
                   _source, _catalog, _schema);
    bool first = true;
    for (const auto& [name, value] : _properties) {
        fmt::format_to(std::back_inserter(buf), "{}{}={}", first ? "" : ", ", name, value);
        first = false;
    }
    fmt::format_to(std::back_inserter(buf), "}})");
    return fmt::to_string(buf);
}

namespace SessionProperties {

std::optional<PropertyType> property_type(std::string_view name) {
    if (name == QUERY_MAX_RUN_TIME || name == QUERY_MAX_QUEUED_TIME ||
        name == QUERY_MAX_EXECUTION_TIME || name == QUERY_CLIENT_TIMEOUT ||
        name == QUERY_MAX_CPU_TIME) {
        return PropertyType::DURATION;
    }
    if (name == QUERY_MAX_SCAN_RAW_INPUT_BYTES || name == QUERY_MAX_OUTPUT_SIZE ||
        name == QUERY_MAX_WRITTEN_INTERMEDIATE_BYTES) {
        return PropertyType::DATA_SIZE;
    }
    if (name == QUERY_MAX_OUTPUT_POSITIONS) {
        return PropertyType::COUNT;
    }
    if (name == ENABLE_INTERMEDIATE_MATERIALIZATION) {
        return PropertyType::BOOLEAN;
    }
    return std::nullopt;
}

} // namespace SessionProperties

std::optional<int64_t> get_query_max_run_time_ms(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_RUN_TIME));
}

std::optional<int64_t> get_query_max_queued_time_ms(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_QUEUED_TIME));
}

std::optional<int64_t> get_query_max_execution_time_ms(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_EXECUTION_TIME));
}

std::optional<int64_t> get_query_max_cpu_time_ms(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_CPU_TIME));
}

std::optional<int64_t> get_query_max_scan_raw_input_bytes(const Session& session) {
    return session.parsed_property(
            std::string(SessionProperties::QUERY_MAX_SCAN_RAW_INPUT_BYTES));
}

std::optional<int64_t> get_query_max_output_positions(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_OUTPUT_POSITIONS));
}

std::optional<int64_t> get_query_max_output_size_bytes(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_MAX_OUTPUT_SIZE));
}

std::optional<int64_t> get_query_max_written_intermediate_bytes(const Session& session) {
    return session.parsed_property(
            std::string(SessionProperties::QUERY_MAX_WRITTEN_INTERMEDIATE_BYTES));
}

int64_t get_query_client_timeout_ms(const Session& session) {
    return session.parsed_property(std::string(SessionProperties::QUERY_CLIENT_TIMEOUT))
            .value_or(config::query_client_timeout_ms);
}

bool is_intermediate_materialization_enabled(const Session& session) {
    return session.parsed_property(
                          std::string(SessionProperties::ENABLE_INTERMEDIATE_MATERIALIZATION))
                   .value_or(0) != 0;
}

#include "common/compile_check_end.h"
} // namespace vigil
