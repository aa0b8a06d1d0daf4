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

#include <limits>

namespace pdu_cycle::json_parser_utils
{

std::chrono::seconds parseSeconds(const nlohmann::json& element)
{
    if (!element.is_number_integer())
    {
        throw std::invalid_argument{"Element is not a duration in seconds"};
    }
    if (element.get<long long>() < 0)
    {
        throw std::invalid_argument{"Element is a negative duration"};
    }
    return std::chrono::seconds{element.get<long long>()};
}

int parseInteger(const nlohmann::json& element)
{
    if (element.is_number_integer())
    {
        // Reject values that do not fit into an int instead of truncating
        long long value = element.get<long long>();
        if ((value >= std::numeric_limits<int>::min()) &&
            (value <= std::numeric_limits<int>::max()))
        {
            return static_cast<int>(value);
        }
    }

    throw std::invalid_argument{"Element is not an integer"};
}

std::string parseString(const nlohmann::json& element, bool isEmptyValid)
{
    if (!element.is_string())
    {
        throw std::invalid_argument{"Element is not a string"};
    }
    std::string value = element.get<std::string>();
    if (value.empty() && !isEmptyValid)
    {
        throw std::invalid_argument{"Element contains an empty string"};
    }
    return value;
}

std::vector<std::string> parseStringArray(const nlohmann::json& element)
{
    verifyIsArray(element);
    std::vector<std::string> values;
    for (auto& valueElement : element)
    {
        values.emplace_back(parseString(valueElement, true));
    }
    return values;
}

unsigned int parseUnsignedInteger(const nlohmann::json& element)
{
    int value = parseInteger(element);
    if (value < 0)
    {
        throw std::invalid_argument{"Element is not an unsigned integer"};
    }
    return static_cast<unsigned int>(value);
}

} // namespace pdu_cycle::json_parser_utils
