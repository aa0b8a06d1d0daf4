/**
 * Copyright © 2025 IBM Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

#ifndef PDU_CYCLE_CONFIG_FILE
#define PDU_CYCLE_CONFIG_FILE "/etc/pdu-cycle/config.json"
#endif

namespace pdu_cycle::config_file_parser
{

/**
 * Standard JSON configuration file path.
 */
extern const std::filesystem::path standardConfigFile;

/**
 * Parses the specified JSON configuration file.
 *
 * Every property in the file is optional.  Properties that are not specified
 * keep the value they have in the defaults parameter.
 *
 * Example:
 * @code
 * {
 *   "comments": [ "Lab rack 4" ],
 *   "auth_scheme": "v2c",
 *   "power_off_timeout": 60,
 *   "snmp": { "write_community": "rack4rw" }
 * }
 * @endcode
 *
 * Throws a ConfigFileParserError if an error occurs.
 *
 * @param pathName configuration file path name
 * @param defaults configuration values used for unspecified properties
 * @return configuration
 */
Config parse(const std::filesystem::path& pathName,
             const Config& defaults = Config{});

/*
 * Internal implementation details for parse()
 */
namespace internal
{

/**
 * Parses the root element of the JSON configuration file.
 *
 * Stores the property values in the specified Config object.
 *
 * Throws an exception if parsing fails.
 *
 * @param element JSON element
 * @param config configuration where values are stored
 */
void parseRoot(const nlohmann::json& element, Config& config);

/**
 * Parses a JSON element containing an snmp object.
 *
 * Stores the property values in the specified SNMPConfig object.
 *
 * Throws an exception if parsing fails.
 *
 * @param element JSON element
 * @param snmp SNMP configuration where values are stored
 */
void parseSNMP(const nlohmann::json& element, SNMPConfig& snmp);

/**
 * Parses a JSON element containing a numeric object identifier, such as
 * "1.3.6.1.4.1.2.6.223.8.2.1.0".
 *
 * A leading '.' is accepted and removed.
 *
 * Throws an exception if parsing fails.
 *
 * @param element JSON element
 * @return object identifier
 */
std::string parseOID(const nlohmann::json& element);

} // namespace internal

} // namespace pdu_cycle::config_file_parser
