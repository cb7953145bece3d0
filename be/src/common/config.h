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
#include <map>
#include <string>
#include <vector>

#define DECLARE_FIELD(FIELD_TYPE, FIELD_NAME) extern FIELD_TYPE FIELD_NAME

#define DECLARE_Bool(name) DECLARE_FIELD(bool, name)
#define DECLARE_Int32(name) DECLARE_FIELD(int32_t, name)
#define DECLARE_Int64(name) DECLARE_FIELD(int64_t, name)
#define DECLARE_Double(name) DECLARE_FIELD(double, name)
#define DECLARE_String(name) DECLARE_FIELD(std::string, name)
#define DECLARE_mBool(name) DECLARE_FIELD(bool, name)
#define DECLARE_mInt32(name) DECLARE_FIELD(int32_t, name)
#define DECLARE_mInt64(name) DECLARE_FIELD(int64_t, name)
#define DECLARE_mDouble(name) DECLARE_FIELD(double, name)
#define DECLARE_mString(name) DECLARE_FIELD(std::string, name)

#define DEFINE_FIELD(FIELD_TYPE, FIELD_NAME, FIELD_DEFAULT, VALMUTABLE) \
    FIELD_TYPE FIELD_NAME;                                             \
    static Register reg_##FIELD_NAME(#FIELD_TYPE, #FIELD_NAME, &(FIELD_NAME), FIELD_DEFAULT, \
                                     VALMUTABLE);

#define DEFINE_Bool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, false)
#define DEFINE_Int32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, false)
#define DEFINE_Int64(name, defaultstr) DEFINE_FIELD(int64_t, name, defaultstr, false)
#define DEFINE_Double(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, false)
#define DEFINE_String(name, defaultstr) DEFINE_FIELD(std::string, name, defaultstr, false)
#define DEFINE_mBool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, true)
#define DEFINE_mInt32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, true)
#define DEFINE_mInt64(name, defaultstr) DEFINE_FIELD(int64_t, name, defaultstr, true)
#define DEFINE_mDouble(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, true)
#define DEFINE_mString(name, defaultstr) DEFINE_FIELD(std::string, name, defaultstr, true)

namespace vigil {
class Status;

// Configuration properties.
// The following configuration items can be defined in the conf file (vigil.conf):
// key = value, one item per line, lines starting with '#' are comments.
// Items prefixed with 'm' in their DEFINE macro are mutable and can be changed at runtime
// with config::set_config().
namespace config {

// log dir, empty means log to stderr
DECLARE_String(sys_log_dir);
// INFO, WARNING, ERROR, FATAL
DECLARE_String(sys_log_level);
// verbose log modules, separated by ','
DECLARE_String(sys_log_verbose_modules);
DECLARE_Int32(sys_log_verbose_level);
DECLARE_Int64(sys_log_max_size_mb);
DECLARE_Bool(log_to_stderr);

// Number of finished queries kept in the query history, with full detail.
DECLARE_mInt32(max_query_history);
// Finished queries are kept at least this long so that clients can fetch their status.
DECLARE_mInt64(min_query_expire_age_ms);
// When the running task count of the cluster exceeds this value, queries whose own running
// task count exceeds max_query_running_task_count are killed, biggest first.
DECLARE_mInt32(max_total_running_task_count_to_kill_query);
DECLARE_mInt32(max_query_running_task_count);

// System wide query limits. A session may lower them, a resource group may lower some.
DECLARE_mInt64(query_max_run_time_ms);
DECLARE_mInt64(query_max_queued_time_ms);
DECLARE_mInt64(query_max_execution_time_ms);
DECLARE_mInt64(query_client_timeout_ms);
DECLARE_mInt64(query_max_cpu_time_ms);
DECLARE_mInt64(query_max_scan_raw_input_bytes);
DECLARE_mInt64(query_max_written_intermediate_bytes);
DECLARE_mInt64(query_max_output_positions);
DECLARE_mInt64(query_max_output_size_bytes);
// User memory a single query may reserve across the cluster.
DECLARE_mInt64(query_max_memory_bytes);

// Threads used to start queries asynchronously.
DECLARE_Int32(query_manager_executor_pool_size);
DECLARE_Int32(query_manager_executor_queue_size);
// Period of the query tracker maintenance pass.
DECLARE_Int64(query_tracker_interval_ms);
// Period of the query manager resource limit enforcement pass.
DECLARE_Int64(query_manager_interval_ms);
DECLARE_Int64(query_memory_leak_check_interval_ms);
// How long stop() waits for failure callbacks of the queries it cancelled.
DECLARE_Int64(query_shutdown_grace_period_ms);

class Register {
public:
    struct Field {
        const char* type = nullptr;
        const char* name = nullptr;
        void* storage = nullptr;
        const char* defval = nullptr;
        bool valmutable = false;
        Field(const char* ftype, const char* fname, void* fstorage, const char* fdefval,
              bool fvalmutable)
                : type(ftype),
                  name(fname),
                  storage(fstorage),
                  defval(fdefval),
                  valmutable(fvalmutable) {}
    };

public:
    static std::map<std::string, Field>* _s_field_map;

public:
    Register(const char* ftype, const char* fname, void* fstorage, const char* fdefval,
             bool fvalmutable);
};

// Loads the conf file (if any) and applies it on top of the defaults.
// fill_conf_map: keep the effective key/value pairs so that they can be listed later.
bool init(const char* conf_file, bool fill_conf_map = false);

// Updates a mutable config item at runtime.
Status set_config(const std::string& field, const std::string& value);

// Returns all config items as (name, type, value, is_mutable).
std::vector<std::vector<std::string>> get_config_info();

// Restores every item to its default value, used by tests.
void reset_to_default();

} // namespace config
} // namespace vigil
