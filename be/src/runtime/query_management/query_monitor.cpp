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

#include "runtime/query_management/query_monitor.h"

#include <fmt/format.h>

#include "common/logging.h"
#include "util/pretty_printer.h"

namespace vigil {

void LoggingQueryMonitor::query_completed_event(const QueryInfo& info) {
    const BasicQueryInfo& basic = info.basic;
    int64_t elapsed_ms = basic.end_time_ms - basic.create_time_ms;
    LOG(INFO) << fmt::format(
            "query completed. query_id={}, user={}, state={}, queued={}, elapsed={}, "
            "cpu={}, input={}, output_rows={}, output={}, error={}",
            print_id(basic.query_id), basic.user, query_state_to_string(basic.state),
            PrettyPrinter::print_duration_ms(basic.queued_time_ms),
            PrettyPrinter::print_duration_ms(elapsed_ms),
            PrettyPrinter::print_duration_ms(basic.total_cpu_time_ms),
            PrettyPrinter::print_bytes(basic.raw_input_bytes), basic.output_positions,
            PrettyPrinter::print_bytes(info.output_bytes),
            basic.failure_cause.has_value() ? basic.failure_cause->to_string() : "none");
}

} // namespace vigil
