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

#include "util/time.h"

#include <fmt/format.h>

namespace vigil {

std::string ToStringFromUnixMillis(int64_t ms) {
    if (ms <= 0) {
        return "N/A";
    }
    time_t seconds = static_cast<time_t>(ms / MILLIS_PER_SEC);
    tm local;
    localtime_r(&seconds, &local);
    char buf[32];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return fmt::format("{}.{:03d}", std::string(buf, len), ms % MILLIS_PER_SEC);
}

} // namespace vigil
