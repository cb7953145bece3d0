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

#include "common/logging.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "common/config.h"

namespace vigil {

static bool logging_initialized = false;

static std::mutex logging_mutex;

bool init_glog(const char* basename) {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);

    if (logging_initialized) {
        return true;
    }

    if (config::log_to_stderr || config::sys_log_dir.empty()) {
        FLAGS_logtostderr = true;
    } else {
        std::error_code ec;
        std::filesystem::create_directories(config::sys_log_dir, ec);
        if (ec) {
            std::cerr << "failed to create log dir " << config::sys_log_dir << ": "
                      << ec.message() << std::endl;
            return false;
        }
        FLAGS_log_dir = config::sys_log_dir;
        // 0 means buffer INFO only
        FLAGS_logbuflevel = 0;
        FLAGS_max_log_size = static_cast<int32_t>(config::sys_log_max_size_mb);
        FLAGS_stop_logging_if_full_disk = true;
    }

    if (config::sys_log_level == "INFO") {
        FLAGS_minloglevel = 0;
    } else if (config::sys_log_level == "WARNING") {
        FLAGS_minloglevel = 1;
    } else if (config::sys_log_level == "ERROR") {
        FLAGS_minloglevel = 2;
    } else if (config::sys_log_level == "FATAL") {
        FLAGS_minloglevel = 3;
    } else {
        std::cerr << "sys_log_level needs to be INFO, WARNING, ERROR, FATAL" << std::endl;
        return false;
    }

    // set verbose modules, e.g. "query_tracker,query_manager"
    FLAGS_v = -1;
    std::stringstream modules(config::sys_log_verbose_modules);
    std::string module;
    while (std::getline(modules, module, ',')) {
        if (!module.empty()) {
            google::SetVLOGLevel(module.c_str(), config::sys_log_verbose_level);
        }
    }

    google::InitGoogleLogging(basename);

    logging_initialized = true;

    return true;
}

void shutdown_logging() {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);
    if (!logging_initialized) {
        return;
    }
    google::ShutdownGoogleLogging();
    logging_initialized = false;
}

} // namespace vigil
