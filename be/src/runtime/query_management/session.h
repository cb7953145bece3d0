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
#include <map>
#include <optional>
#include <string>

namespace vigil {

// Per query settings of a client session: identity plus system session properties
// (see session_properties.h) that may lower the system wide query limits.
//
// A session is fully built before the query is created and is shared read only afterwards.
class Session {
public:
    explicit Session(std::string user, std::string source = "", std::string catalog = "",
                     std::string schema = "");

    const std::string& user() const { return _user; }
    const std::string& source() const { return _source; }
    const std::string& catalog() const { return _catalog; }
    const std::string& schema() const { return _schema; }

    // Sets a system session property. The value is validated against the type of the
    // property: throws Exception(INVALID_ARGUMENT) for unknown properties and malformed values.
    void set_property(const std::string& name, const std::string& value);

    // Raw value as it was set, or nullopt.
    std::optional<std::string> property(const std::string& name) const;

    // Parsed value: milliseconds for durations, bytes for data sizes, 0/1 for booleans.
    std::optional<int64_t> parsed_property(const std::string& name) const;

    const std::map<std::string, std::string>& properties() const { return _properties; }

    std::string debug_string() const;

private:
    std::string _user;
    std::string _source;
    std::string _catalog;
    std::string _schema;
    std::map<std::string, std::string> _properties;
    std::map<std::string, int64_t> _parsed_properties;
};

} // namespace vigil
