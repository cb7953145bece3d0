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
#include <initializer_list>
#include <optional>
#include <string_view>

#include "common/exception.h"

namespace vigil {
#include "common/compile_check_begin.h"

// Authority that imposed a limit. When two limits have the same threshold, the most
// specific one is reported: QUERY over RESOURCE_GROUP over SYSTEM.
enum class LimitSource { QUERY, RESOURCE_GROUP, SYSTEM };

inline std::string_view limit_source_name(LimitSource source) {
    switch (source) {
    case LimitSource::QUERY:
        return "QUERY";
    case LimitSource::RESOURCE_GROUP:
        return "RESOURCE_GROUP";
    case LimitSource::SYSTEM:
        return "SYSTEM";
    }
    return "UNKNOWN";
}

// Smaller is more specific.
inline int limit_source_precedence(LimitSource source) {
    switch (source) {
    case LimitSource::QUERY:
        return 0;
    case LimitSource::RESOURCE_GROUP:
        return 1;
    case LimitSource::SYSTEM:
        return 2;
    }
    return 3;
}

// A threshold (duration in ms, bytes, rows ...) together with the authority that imposed it.
template <typename T>
class QueryLimit {
public:
    QueryLimit(T limit, LimitSource source) : _limit(limit), _source(source) {}

    T limit() const { return _limit; }
    LimitSource source() const { return _source; }
    std::string_view source_name() const { return limit_source_name(_source); }

    // True if this limit should be chosen over other.
    bool is_more_restrictive_than(const QueryLimit<T>& other) const {
        if (_limit != other._limit) {
            return _limit < other._limit;
        }
        return limit_source_precedence(_source) < limit_source_precedence(other._source);
    }

    bool operator==(const QueryLimit<T>& other) const {
        return _limit == other._limit && _source == other._source;
    }

private:
    T _limit;
    LimitSource _source;
};

using DurationLimit = QueryLimit<int64_t>;
using DataSizeLimit = QueryLimit<int64_t>;

inline DurationLimit create_duration_limit(int64_t ms, LimitSource source) {
    return {ms, source};
}

inline DataSizeLimit create_data_size_limit(int64_t bytes, LimitSource source) {
    return {bytes, source};
}

// Returns the most restrictive of the present candidates. Throws INVALID_ARGUMENT if none
// of them is present.
template <typename T>
QueryLimit<T> get_minimum(std::initializer_list<std::optional<QueryLimit<T>>> limits) {
    std::optional<QueryLimit<T>> minimum;
    for (const auto& limit : limits) {
        if (!limit.has_value()) {
            continue;
        }
        if (!minimum.has_value() || limit->is_more_restrictive_than(*minimum)) {
            minimum = limit;
        }
    }
    if (!minimum.has_value()) {
        throw Exception(ErrorCode::INVALID_ARGUMENT, "At least one limit must be present");
    }
    return *minimum;
}

#include "common/compile_check_end.h"
} // namespace vigil
