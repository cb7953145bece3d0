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

#include "util/pretty_printer.h"

#include <fmt/format.h>

namespace vigil {
#include "common/compile_check_begin.h"

std::string PrettyPrinter::print_bytes(int64_t value) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
    if (value < 1024 && value > -1024) {
        return fmt::format("{}B", value);
    }
    double v = static_cast<double>(value);
    size_t unit = 0;
    while ((v >= 1024.0 || v <= -1024.0) && unit < sizeof(units) / sizeof(units[0]) - 1) {
        v /= 1024.0;
        unit++;
    }
    return fmt::format("{:.2f} {}", v, units[unit]);
}

std::string PrettyPrinter::print_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }
    double v = static_cast<double>(ms);
    if (ms < 60LL * 1000) {
        return fmt::format("{:.2f}s", v / 1000);
    }
    if (ms < 60LL * 60 * 1000) {
        return fmt::format("{:.2f}m", v / (60 * 1000));
    }
    if (ms < 24LL * 60 * 60 * 1000) {
        return fmt::format("{:.2f}h", v / (60 * 60 * 1000));
    }
    return fmt::format("{:.2f}d", v / (24 * 60 * 60 * 1000));
}

#include "common/compile_check_end.h"
} // namespace vigil
