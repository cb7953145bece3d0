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

#include "common/status.h"

namespace vigil {
#include "common/compile_check_begin.h"

namespace ErrorCode {

ErrorType error_type(int code) {
    switch (code) {
    case OK:
        return ErrorType::NONE;
    case GENERIC_USER_ERROR:
    case USER_CANCELED:
    case ABANDONED_QUERY:
    case INVALID_ARGUMENT:
        return ErrorType::USER_ERROR;
    case EXCEEDED_TIME_LIMIT:
    case EXCEEDED_CPU_LIMIT:
    case EXCEEDED_SCAN_LIMIT:
    case EXCEEDED_OUTPUT_POSITIONS_LIMIT:
    case EXCEEDED_OUTPUT_SIZE_LIMIT:
    case EXCEEDED_INTERMEDIATE_WRITTEN_BYTES:
    case CLUSTER_HAS_TOO_MANY_RUNNING_TASKS:
    case EXCEEDED_MEMORY_LIMIT:
        return ErrorType::INSUFFICIENT_RESOURCES;
    case SERVICE_UNAVAILABLE:
        return ErrorType::EXTERNAL;
    default:
        return ErrorType::INTERNAL_ERROR;
    }
}

std::string_view error_name(int code) {
    switch (code) {
#define M(NAME, CODE) \
    case NAME:        \
        return #NAME;
        APPLY_FOR_ERROR_CODES(M)
#undef M
    default:
        return "UNKNOWN";
    }
}

std::string_view error_type_name(ErrorType type) {
    switch (type) {
    case ErrorType::NONE:
        return "NONE";
    case ErrorType::USER_ERROR:
        return "USER_ERROR";
    case ErrorType::INTERNAL_ERROR:
        return "INTERNAL_ERROR";
    case ErrorType::INSUFFICIENT_RESOURCES:
        return "INSUFFICIENT_RESOURCES";
    case ErrorType::EXTERNAL:
        return "EXTERNAL";
    }
    return "UNKNOWN";
}

} // namespace ErrorCode

std::string Status::to_string() const {
    if (ok()) {
        return "OK";
    }
    return fmt::format("[{}]{}", ErrorCode::error_name(_code), _msg);
}

#include "common/compile_check_end.h"
} // namespace vigil
