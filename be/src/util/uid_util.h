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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace vigil {
#include "common/compile_check_begin.h"

// convert int to a hex format string, buf must enough to hold converted hex string
template <typename T>
void to_hex(T val, char* buf) {
    static const char* digits = "0123456789abcdef";
    for (int i = 0; i < 2 * static_cast<int>(sizeof(T)); ++i) {
        buf[2 * sizeof(T) - 1 - i] = digits[val & 0x0F];
        val >>= 4;
    }
}

template <typename T>
void from_hex(T* ret, std::string_view buf) {
    T val = 0;
    for (char i : buf) {
        int buf_val = 0;
        if (i >= '0' && i <= '9') {
            buf_val = i - '0';
        } else {
            buf_val = i - 'a' + 10;
        }
        val <<= 4;
        val = val | static_cast<T>(buf_val);
    }
    *ret = val;
}

// 128 bit identifier of a query, rendered as "hi-lo" in hex.
struct UniqueId {
    int64_t hi = 0;
    int64_t lo = 0;

    UniqueId() = default;
    UniqueId(int64_t hi_, int64_t lo_) : hi(hi_), lo(lo_) {}

    // Random id, used for new queries.
    static UniqueId gen_uid();

    ~UniqueId() noexcept = default;

    std::string to_string() const {
        char buf[33];
        to_hex(static_cast<uint64_t>(hi), buf);
        buf[16] = '-';
        to_hex(static_cast<uint64_t>(lo), buf + 17);
        return {buf, 33};
    }

    // Parses the output of to_string(). Returns false if the format is not "%016x-%016x".
    bool from_string(std::string_view str);

    UniqueId& operator=(const UniqueId& uid) = default;

    size_t hash(size_t seed = 0) const;

    bool operator==(const UniqueId& rhs) const { return hi == rhs.hi && lo == rhs.lo; }
    bool operator!=(const UniqueId& rhs) const { return hi != rhs.hi || lo != rhs.lo; }
    bool operator<(const UniqueId& right) const {
        if (hi != right.hi) {
            return hi < right.hi;
        }
        return lo < right.lo;
    }
};

using QueryId = UniqueId;

inline std::string print_id(const UniqueId& id) {
    return id.to_string();
}

std::ostream& operator<<(std::ostream& os, const UniqueId& uid);

#include "common/compile_check_end.h"
} // namespace vigil

namespace std {
template <>
struct hash<vigil::UniqueId> {
    size_t operator()(const vigil::UniqueId& uid) const { return uid.hash(); }
};
} // namespace std
