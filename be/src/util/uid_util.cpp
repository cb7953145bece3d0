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

#include "util/uid_util.h"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <cstring>

namespace vigil {
#include "common/compile_check_begin.h"

UniqueId UniqueId::gen_uid() {
    // basic_random_generator is not thread safe, one per thread
    thread_local boost::uuids::random_generator gen;
    boost::uuids::uuid uuid = gen();
    UniqueId uid;
    static_assert(sizeof(uuid.data) == sizeof(uid.hi) + sizeof(uid.lo));
    std::memcpy(&uid.hi, uuid.data, sizeof(uid.hi));
    std::memcpy(&uid.lo, uuid.data + sizeof(uid.hi), sizeof(uid.lo));
    return uid;
}

bool UniqueId::from_string(std::string_view str) {
    if (str.size() != 33 || str[16] != '-') {
        return false;
    }
    for (size_t i = 0; i < str.size(); ++i) {
        if (i == 16) {
            continue;
        }
        char c = str[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    uint64_t high = 0;
    uint64_t low = 0;
    from_hex(&high, str.substr(0, 16));
    from_hex(&low, str.substr(17));
    hi = static_cast<int64_t>(high);
    lo = static_cast<int64_t>(low);
    return true;
}

size_t UniqueId::hash(size_t seed) const {
    // boost::hash_combine
    auto combine = [](size_t h, uint64_t v) {
        return h ^ (std::hash<uint64_t> {}(v) + 0x9e3779b9 + (h << 6) + (h >> 2));
    };
    seed = combine(seed, static_cast<uint64_t>(hi));
    return combine(seed, static_cast<uint64_t>(lo));
}

std::ostream& operator<<(std::ostream& os, const UniqueId& uid) {
    os << uid.to_string();
    return os;
}

#include "common/compile_check_end.h"
} // namespace vigil
