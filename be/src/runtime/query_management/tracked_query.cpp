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

#include "runtime/query_management/tracked_query.h"

#include <algorithm>

#include "runtime/query_management/session_properties.h"
#include "util/time.h"

namespace vigil {
#include "common/compile_check_begin.h"

int64_t TrackedQuery::duration_until_expiration_ms() const {
    int64_t timeout_ms = get_query_client_timeout_ms(session());
    return std::max<int64_t>(0, last_heartbeat_ms() + timeout_ms - UnixMillis());
}

#include "common/compile_check_end.h"
} // namespace vigil
