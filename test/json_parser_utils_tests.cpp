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

#include "json_parser_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace pdu_cycle::json_parser_utils;
using json = nlohmann::json;

TEST(JSONParserUtilsTests, GetRequiredProperty)
{
    // Test where property exists
    {
        const json element = R"( { "auth_scheme": "v2c" } )"_json;
        const json& propertyElement =
            getRequiredProperty(element, "auth_scheme");
        EXPECT_EQ(propertyElement.get<std::string>(), "v2c");
    }

    // Test where property does not exist
    try
    {
        const json element = R"( { "retries": 2 } )"_json;
        getRequiredProperty(element, "auth_scheme");
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Required property missing: auth_scheme");
    }
}

TEST(JSONParserUtilsTests, ParseInteger)
{
    // Test where works: Zero
    {
        const json element = R"( 0 )"_json;
        int value = parseInteger(element);
        EXPECT_EQ(value, 0);
    }

    // Test where works: Positive value
    {
        const json element = R"( 300 )"_json;
        int value = parseInteger(element);
        EXPECT_EQ(value, 300);
    }

    // Test where works: Negative value
    {
        const json element = R"( -23 )"_json;
        int value = parseInteger(element);
        EXPECT_EQ(value, -23);
    }

    // Test where fails: Element is a floating point number
    try
    {
        const json element = R"( 1.03 )"_json;
        parseInteger(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an integer");
    }

    // Test where fails: Element is a string
    try
    {
        const json element = R"( "40" )"_json;
        parseInteger(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an integer");
    }

    // Test where fails: Value does not fit in an int
    try
    {
        const json element = R"( 4294967296 )"_json;
        parseInteger(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an integer");
    }
}

TEST(JSONParserUtilsTests, ParseSeconds)
{
    // Test where works: Zero
    {
        const json element = R"( 0 )"_json;
        std::chrono::seconds value = parseSeconds(element);
        EXPECT_EQ(value.count(), 0);
    }

    // Test where works: Positive value
    {
        const json element = R"( 40 )"_json;
        std::chrono::seconds value = parseSeconds(element);
        EXPECT_EQ(value, std::chrono::seconds{40});
    }

    // Test where fails: Element is not an integer
    try
    {
        const json element = R"( 2.5 )"_json;
        parseSeconds(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not a duration in seconds");
    }

    // Test where fails: Value < 0
    try
    {
        const json element = R"( -1 )"_json;
        parseSeconds(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is a negative duration");
    }
}

TEST(JSONParserUtilsTests, ParseString)
{
    // Test where works: Empty string
    {
        const json element = "";
        std::string value = parseString(element, true);
        EXPECT_EQ(value, "");
    }

    // Test where works: Non-empty string
    {
        const json element = "private";
        std::string value = parseString(element, false);
        EXPECT_EQ(value, "private");
    }

    // Test where fails: Element is not a string
    try
    {
        const json element = R"( { "foo": "bar" } )"_json;
        parseString(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not a string");
    }

    // Test where fails: Empty string
    try
    {
        const json element = "";
        parseString(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element contains an empty string");
    }
}

TEST(JSONParserUtilsTests, ParseStringArray)
{
    // Test where works: Empty array
    {
        const json element = R"( [] )"_json;
        std::vector<std::string> values = parseStringArray(element);
        EXPECT_TRUE(values.empty());
    }

    // Test where works: Array contains empty and non-empty strings
    {
        const json element = R"( [ "Lab rack 4", "" ] )"_json;
        std::vector<std::string> values = parseStringArray(element);
        std::vector<std::string> expected{"Lab rack 4", ""};
        EXPECT_EQ(values, expected);
    }

    // Test where fails: Element is not an array
    try
    {
        const json element = R"( "Lab rack 4" )"_json;
        parseStringArray(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an array");
    }

    // Test where fails: Array contains a non-string
    try
    {
        const json element = R"( [ "Lab rack 4", 4 ] )"_json;
        parseStringArray(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not a string");
    }
}

TEST(JSONParserUtilsTests, ParseUnsignedInteger)
{
    // Test where works: 1
    {
        const json element = R"( 1 )"_json;
        unsigned int value = parseUnsignedInteger(element);
        EXPECT_EQ(value, 1);
    }

    // Test where fails: Element is not an integer
    try
    {
        const json element = R"( 1.5 )"_json;
        parseUnsignedInteger(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an integer");
    }

    // Test where fails: Value < 0
    try
    {
        const json element = R"( -1 )"_json;
        parseUnsignedInteger(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an unsigned integer");
    }
}

TEST(JSONParserUtilsTests, VerifyIsArray)
{
    // Test where element is an array
    {
        const json element = R"( [ "foo", "bar" ] )"_json;
        verifyIsArray(element);
    }

    // Test where element is not an array
    try
    {
        const json element = R"( { "foo": "bar" } )"_json;
        verifyIsArray(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an array");
    }
}

TEST(JSONParserUtilsTests, VerifyIsObject)
{
    // Test where element is an object
    {
        const json element = R"( { "foo": "bar" } )"_json;
        verifyIsObject(element);
    }

    // Test where element is not an object
    try
    {
        const json element = R"( [ "foo", "bar" ] )"_json;
        verifyIsObject(element);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element is not an object");
    }
}

TEST(JSONParserUtilsTests, VerifyPropertyCount)
{
    // Test where element has expected number of properties
    {
        const json element = R"(
            {
              "comments": [ "Lab rack 4" ],
              "auth_scheme": "v1"
            }
        )"_json;
        verifyPropertyCount(element, 2);
    }

    // Test where element has unexpected number of properties
    try
    {
        const json element = R"(
            {
              "comments": [ "Lab rack 4" ],
              "auth_scheme": "v1",
              "foo": 1.3
            }
        )"_json;
        verifyPropertyCount(element, 2);
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_STREQ(e.what(), "Element contains an invalid property");
    }
}
