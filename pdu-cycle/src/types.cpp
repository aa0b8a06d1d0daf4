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

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pdu_cycle
{

static std::string toLower(const std::string& value)
{
    std::string lower{value};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::optional<Vendor> parseVendor(const std::string& name)
{
    std::string lower = toLower(name);
    if (lower == "ibm")
    {
        return Vendor::native;
    }
    else if (lower == "eaton")
    {
        return Vendor::delegated;
    }
    return std::nullopt;
}

AuthScheme parseAuthScheme(const std::string& name)
{
    std::string lower = toLower(name);
    if ((lower == "v1") || (lower == "1"))
    {
        return AuthScheme::sharedSecretV1;
    }
    else if ((lower == "v2c") || (lower == "v2") || (lower == "2c"))
    {
        return AuthScheme::sharedSecretV2;
    }
    else if ((lower == "v3") || (lower == "3"))
    {
        return AuthScheme::unsupported;
    }
    throw std::invalid_argument{"Invalid authentication scheme: " + name};
}

LogLevel parseLogLevel(const std::string& name)
{
    std::string lower = toLower(name);
    if (lower == "debug")
    {
        return LogLevel::debug;
    }
    else if (lower == "info")
    {
        return LogLevel::info;
    }
    else if ((lower == "warning") || (lower == "warn"))
    {
        return LogLevel::warning;
    }
    else if (lower == "error")
    {
        return LogLevel::error;
    }
    throw std::invalid_argument{"Invalid log level: " + name};
}

std::string toString(OutletState state)
{
    return (state == OutletState::on) ? "on" : "off";
}

std::string toString(Vendor vendor)
{
    return (vendor == Vendor::native) ? "native" : "delegated";
}

std::string toString(AuthScheme scheme)
{
    switch (scheme)
    {
        case AuthScheme::sharedSecretV1:
            return "v1";
        case AuthScheme::sharedSecretV2:
            return "v2c";
        case AuthScheme::unsupported:
            break;
    }
    return "v3";
}

std::string toString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::debug:
            return "debug";
        case LogLevel::info:
            return "info";
        case LogLevel::warning:
            return "warning";
        case LogLevel::error:
            break;
    }
    return "error";
}

} // namespace pdu_cycle
