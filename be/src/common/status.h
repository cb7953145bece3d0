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

#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "common/compiler_util.h" // IWYU pragma: keep

namespace vigil {
#include "common/compile_check_begin.h"

namespace ErrorCode {

#define APPLY_FOR_ERROR_CODES(M)                          \
    M(OK, 0)                                              \
    M(INTERNAL_ERROR, -1)                                 \
    M(NOT_FOUND, -2)                                      \
    M(ALREADY_EXIST, -3)                                  \
    M(INVALID_ARGUMENT, -4)                               \
    M(CANCELLED, -5)                                      \
    M(SERVICE_UNAVAILABLE, -6)                            \
    M(NOT_IMPLEMENTED_ERROR, -7)                          \
    M(GENERIC_USER_ERROR, 1)                              \
    M(USER_CANCELED, 2)                                   \
    M(ABANDONED_QUERY, 3)                                 \
    M(EXCEEDED_TIME_LIMIT, 100)                           \
    M(EXCEEDED_CPU_LIMIT, 101)                            \
    M(EXCEEDED_SCAN_LIMIT, 102)                           \
    M(EXCEEDED_OUTPUT_POSITIONS_LIMIT, 103)               \
    M(EXCEEDED_OUTPUT_SIZE_LIMIT, 104)                    \
    M(EXCEEDED_INTERMEDIATE_WRITTEN_BYTES, 105)           \
    M(CLUSTER_HAS_TOO_MANY_RUNNING_TASKS, 106)            \
    M(EXCEEDED_MEMORY_LIMIT, 107)                         \
    M(SERVER_SHUTTING_DOWN, 200)

#define M(NAME, CODE) constexpr int NAME = CODE;
APPLY_FOR_ERROR_CODES(M)
#undef M

// Classification of a failure, reported in query completion events and counted in stats.
enum class ErrorType { NONE, USER_ERROR, INTERNAL_ERROR, INSUFFICIENT_RESOURCES, EXTERNAL };

ErrorType error_type(int code);

std::string_view error_name(int code);

std::string_view error_type_name(ErrorType type);

} // namespace ErrorCode

class [[nodiscard]] Status {
public:
    Status() : _code(ErrorCode::OK) {}

    Status(const Status& rhs) = default;
    Status& operator=(const Status& rhs) = default;
    Status(Status&& rhs) noexcept = default;
    Status& operator=(Status&& rhs) noexcept = default;

    static Status OK() { return {}; }

    template <int code, typename... Args>
    static Status Error(std::string_view msg, Args&&... args) {
        static_assert(code != ErrorCode::OK, "use Status::OK() for success");
        Status status;
        status._code = code;
        if constexpr (sizeof...(args) == 0) {
            status._msg = std::string(msg);
        } else {
            status._msg = fmt::format(fmt::runtime(msg), std::forward<Args>(args)...);
        }
        return status;
    }

    template <typename... Args>
    static Status Error(int code, std::string_view msg, Args&&... args) {
        Status status;
        status._code = code;
        if constexpr (sizeof...(args) == 0) {
            status._msg = std::string(msg);
        } else {
            status._msg = fmt::format(fmt::runtime(msg), std::forward<Args>(args)...);
        }
        return status;
    }

#define ERROR_CTOR(name, code)                                                 \
    template <typename... Args>                                                \
    static Status name(std::string_view msg, Args&&... args) {                 \
        return Error<ErrorCode::code>(msg, std::forward<Args>(args)...);       \
    }

    ERROR_CTOR(InternalError, INTERNAL_ERROR)
    ERROR_CTOR(NotFound, NOT_FOUND)
    ERROR_CTOR(AlreadyExist, ALREADY_EXIST)
    ERROR_CTOR(InvalidArgument, INVALID_ARGUMENT)
    ERROR_CTOR(Cancelled, CANCELLED)
    ERROR_CTOR(Uninitialized, SERVICE_UNAVAILABLE)
    ERROR_CTOR(NotSupported, NOT_IMPLEMENTED_ERROR)
    ERROR_CTOR(UserCanceled, USER_CANCELED)
    ERROR_CTOR(ExceededTimeLimit, EXCEEDED_TIME_LIMIT)
#undef ERROR_CTOR

    bool ok() const { return _code == ErrorCode::OK; }

    int code() const { return _code; }

    std::string_view msg() const { return _msg; }

    template <int code>
    bool is() const {
        return code == _code;
    }

    ErrorCode::ErrorType error_type() const { return ErrorCode::error_type(_code); }

    // "[EXCEEDED_TIME_LIMIT]Query exceeded ..."
    std::string to_string() const;

    // Same as to_string() without the error name prefix.
    std::string to_string_no_stack() const { return _msg; }

    bool operator==(const Status& st) const { return _code == st._code && _msg == st._msg; }

private:
    int _code;
    std::string _msg;
};

inline std::ostream& operator<<(std::ostream& ostr, const Status& status) {
    return ostr << status.to_string();
}

// some generally useful macros
#define RETURN_IF_ERROR(stmt)           \
    do {                                \
        Status _status_ = (stmt);       \
        if (UNLIKELY(!_status_.ok())) { \
            return _status_;            \
        }                               \
    } while (false)

#define WARN_IF_ERROR(stmt, prefix)                                  \
    do {                                                             \
        Status _s = (stmt);                                          \
        if (UNLIKELY(!_s.ok())) {                                    \
            LOG(WARNING) << (prefix) << ": " << _s.to_string();      \
        }                                                            \
    } while (false)

#include "common/compile_check_end.h"
} // namespace vigil
