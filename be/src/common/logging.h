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

// GLOG defines this based on the system but doesn't check if it's already
// been defined.  undef it first to avoid warnings.
// glog MUST be included before gflags.  Instead of including them,
// our files should include this file instead.
#undef _XOPEN_SOURCE
#include <glog/logging.h> // IWYU pragma: export

#include <string>

namespace vigil {

// Define VLOG levels.  We want display per-row info less than per-file which
// is less than per-query.  For now per-connection is the same as per-query.
#define VLOG_CRITICAL VLOG(1)
#define VLOG_PROGRESS VLOG(2)
#define VLOG_NOTICE VLOG(3)
#define VLOG_DEBUG VLOG(7)
#define VLOG_TRACE VLOG(10)

#define VLOG_CRITICAL_IS_ON VLOG_IS_ON(1)
#define VLOG_NOTICE_IS_ON VLOG_IS_ON(3)
#define VLOG_DEBUG_IS_ON VLOG_IS_ON(7)

// Initializes glog from the logging related config items (sys_log_dir, sys_log_level,
// sys_log_verbose_modules, ...). Returns false if the log dir could not be used.
// Safe to call more than once, only the first call takes effect.
bool init_glog(const char* basename);

// Shuts down the google logging library. Call before exit to ensure that log files
// are flushed.
void shutdown_logging();

} // namespace vigil
