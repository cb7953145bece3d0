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
#include <string>

namespace vigil {

// Methods for printing numeric values with optional units, or other types with an
// applicable operator<<.
class PrettyPrinter {
public:
    // 512B, 1.50 KB, 3.00 GB ...
    static std::string print_bytes(int64_t value);

    // 150ms, 5.00s, 1.50m, 2.00h, 3.00d
    static std::string print_duration_ms(int64_t ms);
};

} // namespace vigil
