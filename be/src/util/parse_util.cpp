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

#include "util/parse_util.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace vigil {
#include "common/compile_check_begin.h"

namespace {

std::string to_lower_trimmed(std::string_view value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        end--;
    }
    std::string res(value.substr(begin, end - begin));
    for (auto& c : res) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return res;
}

// Splits "1.5gb" into 1.5 and "gb". Returns false if there is no leading number.
bool split_number_and_unit(const std::string& value, double* number, std::string* unit) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == value.c_str() || !std::isfinite(parsed) || parsed < 0) {
        return false;
    }
    *number = parsed;
    *unit = std::string(end);
    while (!unit->empty() && std::isspace(static_cast<unsigned char>(unit->front()))) {
        unit->erase(unit->begin());
    }
    return true;
}

bool to_int64(double value, int64_t* result) {
    double rounded = std::round(value);
    if (rounded >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    *result = static_cast<int64_t>(rounded);
    return true;
}

} // namespace

bool ParseUtil::parse_duration_ms(std::string_view duration, int64_t* ms) {
    std::string value = to_lower_trimmed(duration);
    double number = 0;
    std::string unit;
    if (!split_number_and_unit(value, &number, &unit)) {
        return false;
    }
    double multiplier = 0;
    if (unit.empty() || unit == "ms") {
        multiplier = 1;
    } else if (unit == "s") {
        multiplier = 1000;
    } else if (unit == "m") {
        multiplier = 60.0 * 1000;
    } else if (unit == "h") {
        multiplier = 60.0 * 60 * 1000;
    } else if (unit == "d") {
        multiplier = 24.0 * 60 * 60 * 1000;
    } else {
        return false;
    }
    return to_int64(number * multiplier, ms);
}

bool ParseUtil::parse_data_size(std::string_view size, int64_t* bytes) {
    std::string value = to_lower_trimmed(size);
    double number = 0;
    std::string unit;
    if (!split_number_and_unit(value, &number, &unit)) {
        return false;
    }
    double multiplier = 0;
    if (unit.empty() || unit == "b") {
        multiplier = 1;
    } else if (unit == "kb") {
        multiplier = 1024.0;
    } else if (unit == "mb") {
        multiplier = 1024.0 * 1024;
    } else if (unit == "gb") {
        multiplier = 1024.0 * 1024 * 1024;
    } else if (unit == "tb") {
        multiplier = 1024.0 * 1024 * 1024 * 1024;
    } else if (unit == "pb") {
        multiplier = 1024.0 * 1024 * 1024 * 1024 * 1024;
    } else {
        return false;
    }
    return to_int64(number * multiplier, bytes);
}

bool ParseUtil::parse_count(std::string_view count, int64_t* value) {
    std::string str = to_lower_trimmed(count);
    if (str.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(str.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || parsed < 0) {
        return false;
    }
    *value = parsed;
    return true;
}

bool ParseUtil::parse_bool(std::string_view value, bool* result) {
    std::string str = to_lower_trimmed(value);
    if (str == "true") {
        *result = true;
        return true;
    }
    if (str == "false") {
        *result = false;
        return true;
    }
    return false;
}

#include "common/compile_check_end.h"
} // namespace vigil
