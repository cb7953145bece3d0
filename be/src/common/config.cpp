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

#include "common/config.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>

#include "common/status.h"

namespace vigil::config {

std::map<std::string, Register::Field>* Register::_s_field_map = nullptr;

namespace {

std::mutex mutable_config_lock;

std::map<std::string, std::string>* full_conf_map = nullptr;

void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                    [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                    .base(),
            s.end());
}

bool convert(const std::string& value, bool& retval) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1") {
        retval = true;
        return true;
    }
    if (lower == "false" || lower == "0") {
        retval = false;
        return true;
    }
    return false;
}

bool convert(const std::string& value, int64_t& retval) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    retval = parsed;
    return true;
}

bool convert(const std::string& value, int32_t& retval) {
    int64_t parsed = 0;
    if (!convert(value, parsed) || parsed > std::numeric_limits<int32_t>::max() ||
        parsed < std::numeric_limits<int32_t>::min()) {
        return false;
    }
    retval = static_cast<int32_t>(parsed);
    return true;
}

bool convert(const std::string& value, double& retval) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    retval = parsed;
    return true;
}

bool convert(const std::string& value, std::string& retval) {
    retval = value;
    return true;
}

template <typename T>
bool set_field(void* storage, const std::string& value) {
    T parsed {};
    if (!convert(value, parsed)) {
        return false;
    }
    *reinterpret_cast<T*>(storage) = parsed;
    return true;
}

bool set_field(const Register::Field& field, const std::string& value) {
    std::string type(field.type);
    if (type == "bool") {
        return set_field<bool>(field.storage, value);
    } else if (type == "int32_t") {
        return set_field<int32_t>(field.storage, value);
    } else if (type == "int64_t") {
        return set_field<int64_t>(field.storage, value);
    } else if (type == "double") {
        return set_field<double>(field.storage, value);
    } else if (type == "std::string") {
        return set_field<std::string>(field.storage, value);
    }
    return false;
}

std::string field_value(const Register::Field& field) {
    std::string type(field.type);
    if (type == "bool") {
        return *reinterpret_cast<bool*>(field.storage) ? "true" : "false";
    } else if (type == "int32_t") {
        return std::to_string(*reinterpret_cast<int32_t*>(field.storage));
    } else if (type == "int64_t") {
        return std::to_string(*reinterpret_cast<int64_t*>(field.storage));
    } else if (type == "double") {
        return fmt::format("{}", *reinterpret_cast<double*>(field.storage));
    } else if (type == "std::string") {
        return *reinterpret_cast<std::string*>(field.storage);
    }
    return "";
}

} // namespace

Register::Register(const char* ftype, const char* fname, void* fstorage, const char* fdefval,
                   bool fvalmutable) {
    if (_s_field_map == nullptr) {
        _s_field_map = new std::map<std::string, Field>();
    }
    Field field(ftype, fname, fstorage, fdefval, fvalmutable);
    // defaults are applied right away so config values are usable before init()
    if (!set_field(field, fdefval)) {
        std::cerr << "invalid default value of config " << fname << ": " << fdefval << std::endl;
        std::abort();
    }
    _s_field_map->insert(std::make_pair(std::string(fname), field));
}

// clang-format off
DEFINE_String(sys_log_dir, "");
DEFINE_String(sys_log_level, "INFO");
DEFINE_String(sys_log_verbose_modules, "");
DEFINE_Int32(sys_log_verbose_level, "10");
DEFINE_Int64(sys_log_max_size_mb, "1024");
DEFINE_Bool(log_to_stderr, "false");

DEFINE_mInt32(max_query_history, "100");
// 15 minutes
DEFINE_mInt64(min_query_expire_age_ms, "900000");
DEFINE_mInt32(max_total_running_task_count_to_kill_query, "2147483647");
DEFINE_mInt32(max_query_running_task_count, "2147483647");

// 100 days
DEFINE_mInt64(query_max_run_time_ms, "8640000000");
DEFINE_mInt64(query_max_queued_time_ms, "8640000000");
DEFINE_mInt64(query_max_execution_time_ms, "8640000000");
// 5 minutes
DEFINE_mInt64(query_client_timeout_ms, "300000");
// 1,000,000,000 seconds
DEFINE_mInt64(query_max_cpu_time_ms, "1000000000000");
// 1PB
DEFINE_mInt64(query_max_scan_raw_input_bytes, "1125899906842624");
// 2TB
DEFINE_mInt64(query_max_written_intermediate_bytes, "2199023255552");
DEFINE_mInt64(query_max_output_positions, "9223372036854775807");
// 1PB
DEFINE_mInt64(query_max_output_size_bytes, "1125899906842624");
// 20GB
DEFINE_mInt64(query_max_memory_bytes, "21474836480");

DEFINE_Int32(query_manager_executor_pool_size, "5");
DEFINE_Int32(query_manager_executor_queue_size, "102400");
DEFINE_Int64(query_tracker_interval_ms, "1000");
DEFINE_Int64(query_manager_interval_ms, "1000");
DEFINE_Int64(query_memory_leak_check_interval_ms, "60000");
DEFINE_Int64(query_shutdown_grace_period_ms, "5000");
// clang-format on

bool init(const char* conf_file, bool fill_conf_map) {
    std::lock_guard<std::mutex> lock(mutable_config_lock);
    std::map<std::string, std::string> props;
    if (conf_file != nullptr) {
        std::ifstream input(conf_file);
        if (!input.is_open()) {
            std::cerr << "config::init() failed to open conf file: " << conf_file << std::endl;
            return false;
        }
        std::string line;
        int line_no = 0;
        while (std::getline(input, line)) {
            ++line_no;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                std::cerr << "config::init() invalid line " << line_no << " in " << conf_file
                          << ": " << line << std::endl;
                return false;
            }
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trim(key);
            trim(value);
            props[key] = value;
        }
    }

    for (const auto& [name, field] : *Register::_s_field_map) {
        auto it = props.find(name);
        const std::string& value = it != props.end() ? it->second : std::string(field.defval);
        if (!set_field(field, value)) {
            std::cerr << "config field error: " << name << " = " << value << std::endl;
            return false;
        }
    }

    if (fill_conf_map) {
        if (full_conf_map == nullptr) {
            full_conf_map = new std::map<std::string, std::string>();
        }
        for (const auto& [name, field] : *Register::_s_field_map) {
            (*full_conf_map)[name] = field_value(field);
        }
    }
    return true;
}

Status set_config(const std::string& field, const std::string& value) {
    auto it = Register::_s_field_map->find(field);
    if (it == Register::_s_field_map->end()) {
        return Status::NotFound("'{}' is not found", field);
    }

    if (!it->second.valmutable) {
        return Status::InvalidArgument("'{}' is not support to modify", field);
    }

    std::lock_guard<std::mutex> lock(mutable_config_lock);
    if (!set_field(it->second, value)) {
        return Status::InvalidArgument("convert '{}' as {} failed", value, it->second.type);
    }
    if (full_conf_map != nullptr) {
        (*full_conf_map)[field] = value;
    }
    return Status::OK();
}

std::vector<std::vector<std::string>> get_config_info() {
    std::vector<std::vector<std::string>> configs;
    std::lock_guard<std::mutex> lock(mutable_config_lock);
    for (const auto& [name, field] : *Register::_s_field_map) {
        std::vector<std::string> config;
        config.push_back(name);
        config.emplace_back(field.type);
        config.push_back(field_value(field));
        config.emplace_back(field.valmutable ? "true" : "false");
        configs.push_back(std::move(config));
    }
    return configs;
}

void reset_to_default() {
    std::lock_guard<std::mutex> lock(mutable_config_lock);
    for (const auto& [name, field] : *Register::_s_field_map) {
        set_field(field, field.defval);
    }
}

} // namespace vigil::config
