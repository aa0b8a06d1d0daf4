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

#include <optional>
#include <string>

namespace pdu_cycle
{

/**
 * @enum OutletState
 *
 * State of one switched outlet.  The numeric values are the values read from
 * and written to the PDU.
 */
enum class OutletState : int
{
    off = 0,
    on = 1
};

/**
 * @enum Vendor
 *
 * PDU vendor family.
 *
 * Native PDUs are power cycled directly by this application.  Delegated PDUs
 * are power cycled by an external script.
 */
enum class Vendor
{
    native,
    delegated
};

/**
 * @enum AuthScheme
 *
 * Authentication scheme used when talking to a PDU.
 *
 * Only the community based schemes are supported.
 */
enum class AuthScheme
{
    sharedSecretV1,
    sharedSecretV2,
    unsupported
};

/**
 * @enum LogLevel
 *
 * Minimum severity of messages written to the journal.
 */
enum class LogLevel
{
    debug,
    info,
    warning,
    error
};

/**
 * Returns the vendor family for the specified vendor name.
 *
 * The comparison is case-insensitive.  "IBM" is the native family and "eaton"
 * is the delegated family.
 *
 * @param name vendor name
 * @return vendor family, or std::nullopt if the vendor is not supported
 */
std::optional<Vendor> parseVendor(const std::string& name);

/**
 * Returns the authentication scheme for the specified SNMP version name.
 *
 * "v1" and "v2c" map to the community based schemes.  "v3" maps to
 * AuthScheme::unsupported so the request can fail with a specific error.
 *
 * Throws an invalid_argument exception if the name is not recognized.
 *
 * @param name SNMP version name
 * @return authentication scheme
 */
AuthScheme parseAuthScheme(const std::string& name);

/**
 * Returns the log level for the specified name.
 *
 * Throws an invalid_argument exception if the name is not recognized.
 *
 * @param name log level name, such as "info"
 * @return log level
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Returns a printable name for the specified value.
 */
std::string toString(OutletState state);
std::string toString(Vendor vendor);
std::string toString(AuthScheme scheme);
std::string toString(LogLevel level);

} // namespace pdu_cycle
