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

#include "runtime/query_management/query_info.h"

namespace vigil {

// Receives one completion event per query, before the query is handed to expiration.
class QueryMonitor {
public:
    virtual ~QueryMonitor() = default;

    virtual void query_completed_event(const QueryInfo& info) = 0;
};

// Writes a one line summary of every completed query to the INFO log.
class LoggingQueryMonitor final : public QueryMonitor {
public:
    void query_completed_event(const QueryInfo& info) override;
};

} // namespace vigil
