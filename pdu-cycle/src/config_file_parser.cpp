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

#include "config_file_parser.hpp"

#include "config_file_parser_error.hpp"
#include "json_parser_utils.hpp"

#include <exception>
#include <fstream>
#include <stdexcept>

using namespace pdu_cycle::json_parser_utils;
using json = nlohmann::json;

namespace pdu_cycle::config_file_parser
{

const std::filesystem::path standardConfigFile{PDU_CYCLE_CONFIG_FILE};

Config parse(const std::filesystem::path& pathName, const Config& defaults)
{
    try
    {
        std::ifstream file{pathName};
        if (!file)
        {
            throw std::runtime_error{"Unable to open file"};
        }

        // Use standard JSON parser to create tree of JSON elements
        json rootElement = json::parse(file);

        Config config{defaults};
        internal::parseRoot(rootElement, config);
        return config;
    }
    catch (const std::exception& e)
    {
        throw ConfigFileParserError{pathName, e.what()};
    }
}

namespace internal
{

void parseRoot(const json& element, Config& config)
{
    verifyIsObject(element);
    unsigned int propertyCount{0};

    // Optional comments property; value not stored
    auto it = element.find("comments");
    if (it != element.end())
    {
        parseStringArray(*it);
        ++propertyCount;
    }

    // Optional auth_scheme property
    it = element.find("auth_scheme");
    if (it != element.end())
    {
        config.authScheme = parseAuthScheme(parseString(*it));
        ++propertyCount;
    }

    // Optional power_off_timeout property
    it = element.find("power_off_timeout");
    if (it != element.end())
    {
        config.powerOffTimeout = parseSeconds(*it);
        ++propertyCount;
    }

    // Optional power_on_timeout property
    it = element.find("power_on_timeout");
    if (it != element.end())
    {
        config.powerOnTimeout = parseSeconds(*it);
        ++propertyCount;
    }

    // Optional ping_timeout property
    it = element.find("ping_timeout");
    if (it != element.end())
    {
        config.pingTimeout = parseSeconds(*it);
        ++propertyCount;
    }

    // Optional ping_deadline property; ping requires at least one second
    it = element.find("ping_deadline");
    if (it != element.end())
    {
        config.pingDeadline = parseSeconds(*it);
        if (config.pingDeadline.count() < 1)
        {
            throw std::invalid_argument{"Invalid ping_deadline: Must be > 0"};
        }
        ++propertyCount;
    }

    // Optional log_level property
    it = element.find("log_level");
    if (it != element.end())
    {
        config.logLevel = parseLogLevel(parseString(*it));
        ++propertyCount;
    }

    // Optional delegated_script property
    it = element.find("delegated_script");
    if (it != element.end())
    {
        config.delegatedScript = parseString(*it);
        ++propertyCount;
    }

    // Optional snmp property
    it = element.find("snmp");
    if (it != element.end())
    {
        parseSNMP(*it, config.snmp);
        ++propertyCount;
    }

    // Verify no invalid properties exist
    verifyPropertyCount(element, propertyCount);
}

void parseSNMP(const json& element, SNMPConfig& snmp)
{
    verifyIsObject(element);
    unsigned int propertyCount{0};

    auto it = element.find("read_community");
    if (it != element.end())
    {
        snmp.readCommunity = parseString(*it);
        ++propertyCount;
    }

    it = element.find("write_community");
    if (it != element.end())
    {
        snmp.writeCommunity = parseString(*it);
        ++propertyCount;
    }

    it = element.find("timeout");
    if (it != element.end())
    {
        snmp.timeout = parseSeconds(*it);
        if (snmp.timeout.count() < 1)
        {
            throw std::invalid_argument{"Invalid SNMP timeout: Must be > 0"};
        }
        ++propertyCount;
    }

    it = element.find("retries");
    if (it != element.end())
    {
        snmp.retries = parseUnsignedInteger(*it);
        ++propertyCount;
    }

    it = element.find("outlet_count_oid");
    if (it != element.end())
    {
        snmp.outletCountOID = parseOID(*it);
        ++propertyCount;
    }

    it = element.find("outlet_state_oid");
    if (it != element.end())
    {
        snmp.outletStateOID = parseOID(*it);
        ++propertyCount;
    }

    // Verify no invalid properties exist
    verifyPropertyCount(element, propertyCount);
}

std::string parseOID(const json& element)
{
    std::string oid = parseString(element);
    if (oid.front() == '.')
    {
        oid.erase(0, 1);
    }

    bool isValid = !oid.empty() && (oid.front() != '.') &&
                   (oid.back() != '.') &&
                   (oid.find("..") == std::string::npos) &&
                   (oid.find_first_not_of("0123456789.") == std::string::npos);
    if (!isValid)
    {
        throw std::invalid_argument{"Invalid object identifier: " + oid};
    }
    return oid;
}

} // namespace internal

} // namespace pdu_cycle::config_file_parser
