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
#include <string_view>

namespace vigil {

// Utility class for parsing information from strings.
class ParseUtil {
public:
    // Parses a duration such as "100ms", "30s", "1.5m", "2h", "1d". A plain number is
    // taken as milliseconds. Returns false for negative or malformed input.
    static bool parse_duration_ms(std::string_view duration, int64_t* ms);

    // Parses a data size such as "512B", "64kB", "10MB", "1.5GB", "2TB", "1PB". A plain
    // number is taken as bytes. Units are powers of 1024 and case insensitive.
    static bool parse_data_size(std::string_view size, int64_t* bytes);

    // Parses a non negative integer count.
    static bool parse_count(std::string_view count, int64_t* value);

    // "true"/"false", case insensitive.
    static bool parse_bool(std::string_view value, bool* result);
};

} // namespace vigil
