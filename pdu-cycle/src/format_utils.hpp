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

#include <format>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

/**
 * @namespace format_utils
 *
 * Contains utility functions for formatting data.
 */
namespace pdu_cycle::format_utils
{

/**
 * Returns a string containing the elements in the specified container span
 * separated by the specified delimiter.
 *
 * The individual elements are formatted using std::format.
 *
 * @param spn span of elements to format within a container
 * @param delimiter text written between two elements
 * @return formatted string containing the specified elements
 */
template <typename T>
std::string join(const std::span<T>& spn, std::string_view delimiter)
{
    std::string str{};
    for (auto it = spn.begin(); it != spn.end(); ++it)
    {
        str += std::format("{}", *it);
        if (std::distance(it, spn.end()) > 1)
        {
            str += delimiter;
        }
    }
    return str;
}

/**
 * Returns a string containing the elements in the specified container span.
 *
 * The string starts with "[", ends with "]", and the elements are separated by
 * ", ".  Used when writing lists to the journal.
 *
 * @param spn span of elements to format within a container
 * @return formatted string containing the specified elements
 */
template <typename T>
std::string toString(const std::span<T>& spn)
{
    return "[" + join(spn, ", ") + "]";
}

} // namespace pdu_cycle::format_utils
