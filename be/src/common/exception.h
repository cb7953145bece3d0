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

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "common/status.h"

namespace vigil {
#include "common/compile_check_begin.h"

// Thrown where a Status can not be returned, e.g. lookups that hand back a reference
// to a registered query. Carries the same error code space as Status.
class Exception : public std::exception {
public:
    Exception() : _code(ErrorCode::OK) {}
    Exception(int code, std::string_view msg) : _code(code), _msg(msg) {}
    Exception(const Status& status) : _code(status.code()), _msg(status.msg()) {}

    template <typename... Args>
    Exception(int code, std::string_view fmt, Args&&... args)
            : Exception(code, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)) {}

    int code() const { return _code; }

    std::string to_string() const;

    const char* what() const noexcept override { return _msg.c_str(); }

    Status to_status() const { return Status::Error(_code, _msg); }

private:
    int _code;
    std::string _msg;
};

inline std::ostream& operator<<(std::ostream& ostr, const Exception& exception) {
    return ostr << exception.to_string();
}

#define RETURN_IF_CATCH_EXCEPTION(stmt)                  \
    do {                                                 \
        try {                                            \
            stmt;                                        \
        } catch (const ::vigil::Exception& e) {          \
            return e.to_status();                        \
        } catch (const std::exception& e) {              \
            return Status::InternalError(e.what());      \
        }                                                \
    } while (false)

#include "common/compile_check_end.h"
} // namespace vigil
