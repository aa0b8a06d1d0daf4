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

#include "config.hpp"
#include "config_file_parser.hpp"
#include "config_file_parser_error.hpp"
#include "types.hpp"

#include <stdlib.h> // for mkstemp()
#include <unistd.h> // for close()

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

using namespace pdu_cycle;
using namespace pdu_cycle::config_file_parser;
using namespace pdu_cycle::config_file_parser::internal;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

/**
 * Creates a uniquely named file in the temporary directory and writes the
 * specified contents to it.
 */
fs::path writeConfigFile(const std::string& contents)
{
    std::string templatePath = fs::temp_directory_path() / "pdu-cycle-XXXXXX";
    int fd = mkstemp(templatePath.data());
    if (fd == -1)
    {
        throw std::runtime_error{"Unable to create temporary file"};
    }
    close(fd);

    std::ofstream file{templatePath};
    file << contents;
    return fs::path{templatePath};
}

TEST(ConfigFileParserTests, Parse)
{
    // Test where works: File contains every property
    {
        const std::string contents = R"(
            {
              "comments": [ "Lab rack 4" ],
              "auth_scheme": "v2c",
              "power_off_timeout": 60,
              "power_on_timeout": 90,
              "ping_timeout": 600,
              "ping_deadline": 2,
              "log_level": "debug",
              "delegated_script": "/usr/local/bin/eaton-cycle",
              "snmp": {
                "read_community": "rack4ro",
                "write_community": "rack4rw",
                "timeout": 5,
                "retries": 0,
                "outlet_count_oid": ".1.3.6.1.4.1.2.6.223.8.2.1.0",
                "outlet_state_oid": "1.3.6.1.4.1.2.6.223.8.2.2.1.11"
              }
            }
        )";
        fs::path pathName = writeConfigFile(contents);
        Config config = parse(pathName);
        fs::remove(pathName);

        EXPECT_EQ(config.authScheme, AuthScheme::sharedSecretV2);
        EXPECT_EQ(config.powerOffTimeout, 60s);
        EXPECT_EQ(config.powerOnTimeout, 90s);
        EXPECT_EQ(config.pingTimeout, 600s);
        EXPECT_EQ(config.pingDeadline, 2s);
        EXPECT_EQ(config.logLevel, LogLevel::debug);
        EXPECT_EQ(config.delegatedScript, "/usr/local/bin/eaton-cycle");
        EXPECT_EQ(config.snmp.readCommunity, "rack4ro");
        EXPECT_EQ(config.snmp.writeCommunity, "rack4rw");
        EXPECT_EQ(config.snmp.timeout, 5s);
        EXPECT_EQ(config.snmp.retries, 0u);
        EXPECT_EQ(config.snmp.outletCountOID, "1.3.6.1.4.1.2.6.223.8.2.1.0");
        EXPECT_EQ(config.snmp.outletStateOID, "1.3.6.1.4.1.2.6.223.8.2.2.1.11");
    }

    // Test where works: Empty object keeps the defaults
    {
        fs::path pathName = writeConfigFile("{}");
        Config defaults{};
        defaults.powerOffTimeout = 15s;
        Config config = parse(pathName, defaults);
        fs::remove(pathName);

        EXPECT_EQ(config.authScheme, AuthScheme::sharedSecretV1);
        EXPECT_EQ(config.powerOffTimeout, 15s);
        EXPECT_EQ(config.powerOnTimeout, 40s);
        EXPECT_EQ(config.pingTimeout, 300s);
        EXPECT_EQ(config.pingDeadline, 1s);
        EXPECT_EQ(config.logLevel, LogLevel::info);
        EXPECT_EQ(config.snmp.readCommunity, "public");
        EXPECT_EQ(config.snmp.writeCommunity, "private");
    }

    // Test where fails: File does not exist
    {
        fs::path pathName{"/tmp/pdu-cycle-does-not-exist.json"};
        try
        {
            parse(pathName);
            ADD_FAILURE() << "Should not have reached this line.";
        }
        catch (const ConfigFileParserError& e)
        {
            EXPECT_EQ(e.getPathName(), pathName);
            EXPECT_STREQ(e.what(), "ConfigFileParserError: "
                                   "/tmp/pdu-cycle-does-not-exist.json: "
                                   "Unable to open file");
        }
    }

    // Test where fails: File is not valid JSON
    {
        fs::path pathName = writeConfigFile("{ \"auth_scheme\": ");
        try
        {
            parse(pathName);
            ADD_FAILURE() << "Should not have reached this line.";
        }
        catch (const ConfigFileParserError& e)
        {
            EXPECT_EQ(e.getPathName(), pathName);
        }
        fs::remove(pathName);
    }

    // Test where fails: Invalid property value
    {
        fs::path pathName =
            writeConfigFile(R"( { "power_on_timeout": "forty" } )");
        try
        {
            parse(pathName);
            ADD_FAILURE() << "Should not have reached this line.";
        }
        catch (const ConfigFileParserError& e)
        {
            std::string expected = "ConfigFileParserError: " +
                                   pathName.string() +
                                   ": Element is not a duration in seconds";
            EXPECT_EQ(std::string{e.what()}, expected);
        }
        fs::remove(pathName);
    }
}

TEST(ConfigFileParserTests, ParseRoot)
{
    // Test where works: Unsupported auth scheme is stored, not rejected
    {
        const json element = R"( { "auth_scheme": "v3" } )"_json;
        Config config{};
        parseRoot(element, config);
        EXPECT_EQ(config.authScheme, AuthScheme::unsupported);
    }

    // Test where fails: Element is not an object
    try
    {
        const json element = R"( [ "auth_scheme" ] )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an object");
    }

    // Test where fails: Unknown auth scheme
    try
    {
        const json element = R"( { "auth_scheme": "usm" } )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid authentication scheme: usm");
    }

    // Test where fails: Negative timeout
    try
    {
        const json element = R"( { "ping_timeout": -5 } )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is a negative duration");
    }

    // Test where fails: ping_deadline is zero
    try
    {
        const json element = R"( { "ping_deadline": 0 } )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid ping_deadline: Must be > 0");
    }

    // Test where fails: Invalid log level
    try
    {
        const json element = R"( { "log_level": "chatty" } )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid log level: chatty");
    }

    // Test where fails: Invalid property specified
    try
    {
        const json element = R"(
            {
              "power_off_timeout": 40,
              "foo": "bar"
            }
        )"_json;
        Config config{};
        parseRoot(element, config);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element contains an invalid property");
    }
}

TEST(ConfigFileParserTests, ParseSNMP)
{
    // Test where works: Only some properties specified
    {
        const json element = R"( { "write_community": "rack4rw" } )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        EXPECT_EQ(snmp.readCommunity, "public");
        EXPECT_EQ(snmp.writeCommunity, "rack4rw");
        EXPECT_EQ(snmp.timeout, 3s);
        EXPECT_EQ(snmp.retries, 1u);
    }

    // Test where fails: Element is not an object
    try
    {
        const json element = R"( "public" )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an object");
    }

    // Test where fails: Empty community
    try
    {
        const json element = R"( { "read_community": "" } )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element contains an empty string");
    }

    // Test where fails: Timeout is zero
    try
    {
        const json element = R"( { "timeout": 0 } )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid SNMP timeout: Must be > 0");
    }

    // Test where fails: Negative retries
    try
    {
        const json element = R"( { "retries": -1 } )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an unsigned integer");
    }

    // Test where fails: Invalid property specified
    try
    {
        const json element = R"( { "community": "public" } )"_json;
        SNMPConfig snmp{};
        parseSNMP(element, snmp);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element contains an invalid property");
    }
}

TEST(ConfigFileParserTests, ParseOID)
{
    // Test where works: No leading '.'
    {
        const json element = "1.3.6.1.4.1.2.6.223.8.2.1.0";
        EXPECT_EQ(parseOID(element), "1.3.6.1.4.1.2.6.223.8.2.1.0");
    }

    // Test where works: Leading '.' is removed
    {
        const json element = ".1.3.6.1.4.1.2.6.223.8.2.2.1.11";
        EXPECT_EQ(parseOID(element), "1.3.6.1.4.1.2.6.223.8.2.2.1.11");
    }

    // Test where fails: Element is not a string
    try
    {
        const json element = R"( 1.3 )"_json;
        parseOID(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not a string");
    }

    // Test where fails: Trailing '.'
    try
    {
        const json element = "1.3.6.1.";
        parseOID(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid object identifier: 1.3.6.1.");
    }

    // Test where fails: Empty component
    try
    {
        const json element = "1.3..6";
        parseOID(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid object identifier: 1.3..6");
    }

    // Test where fails: Symbolic name
    try
    {
        const json element = "SNMPv2-MIB::sysDescr.0";
        parseOID(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(),
                     "Invalid object identifier: SNMPv2-MIB::sysDescr.0");
    }

    // Test where fails: Only a '.'
    try
    {
        const json element = ".";
        parseOID(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Invalid object identifier: ");
    }
}
