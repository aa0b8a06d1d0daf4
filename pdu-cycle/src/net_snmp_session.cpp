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

#include "net_snmp_session.hpp"

#include <charconv>
#include <exception>
#include <format>
#include <limits>
#include <stdexcept>

namespace pdu_cycle
{

/**
 * Returns the snmpget/snmpset version argument for the specified scheme.
 */
static std::string getVersionArg(AuthScheme authScheme)
{
    switch (authScheme)
    {
        case AuthScheme::sharedSecretV1:
            return "1";
        case AuthScheme::sharedSecretV2:
            return "2c";
        case AuthScheme::unsupported:
            break;
    }
    throw std::invalid_argument{"Unsupported SNMP authentication scheme: " +
                                toString(authScheme)};
}

/**
 * Returns the specified text without leading and trailing white space.
 */
static std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n";
    std::string::size_type first = text.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return std::string{};
    }
    std::string::size_type last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

NetSNMPSession::NetSNMPSession(const std::string& host, AuthScheme authScheme,
                               const SNMPConfig& config) :
    host{host}, version{getVersionArg(authScheme)}, config{config}
{}

unsigned int NetSNMPSession::getOutletCount()
{
    long count = getInteger(config.outletCountOID);
    if ((count < 0) || (count > std::numeric_limits<int>::max()))
    {
        throw SNMPError{std::format("Invalid outlet count {}", count), host,
                        config.outletCountOID};
    }
    return static_cast<unsigned int>(count);
}

OutletState NetSNMPSession::getOutletState(unsigned int outlet)
{
    std::string oid =
        snmp_internal::getOutletStateOID(config.outletStateOID, outlet);
    return snmp_internal::toOutletState(getInteger(oid), host, oid);
}

void NetSNMPSession::setOutletState(unsigned int outlet, OutletState state)
{
    std::string oid =
        snmp_internal::getOutletStateOID(config.outletStateOID, outlet);
    std::vector<std::string> args = snmp_internal::buildSetArgs(
        host, version, config, oid, static_cast<long>(state));
    runTool("snmpset", args, oid);
}

long NetSNMPSession::getInteger(const std::string& oid)
{
    std::vector<std::string> args =
        snmp_internal::buildGetArgs(host, version, config, oid);
    process::Result result = runTool("snmpget", args, oid);
    return snmp_internal::parseIntegerValue(result.output, host, oid);
}

process::Result NetSNMPSession::runTool(const std::string& program,
                                        const std::vector<std::string>& args,
                                        const std::string& oid)
{
    process::Result result{};
    try
    {
        result = process::run(program, args);
    }
    catch (const std::exception& e)
    {
        throw SNMPError{e.what(), host, oid};
    }

    if (result.exitCode != 0)
    {
        std::string detail = trim(result.errorOutput);
        if (detail.empty())
        {
            detail = trim(result.output);
        }
        throw SNMPError{std::format("{} failed with exit code {}: {}",
                                    program, result.exitCode, detail),
                        host, oid};
    }
    return result;
}

namespace snmp_internal
{

std::string getOutletStateOID(const std::string& stateOID,
                              unsigned int outlet)
{
    return std::format("{}.{}", stateOID, outlet);
}

std::vector<std::string> buildGetArgs(const std::string& host,
                                      const std::string& version,
                                      const SNMPConfig& config,
                                      const std::string& oid)
{
    // -Oqve prints only the value, with enumerations as plain integers
    return {"-v",
            version,
            "-c",
            config.readCommunity,
            "-t",
            std::to_string(config.timeout.count()),
            "-r",
            std::to_string(config.retries),
            "-Oqve",
            host,
            oid};
}

std::vector<std::string> buildSetArgs(const std::string& host,
                                      const std::string& version,
                                      const SNMPConfig& config,
                                      const std::string& oid, long value)
{
    return {"-v",
            version,
            "-c",
            config.writeCommunity,
            "-t",
            std::to_string(config.timeout.count()),
            "-r",
            std::to_string(config.retries),
            "-Oqve",
            host,
            oid,
            "i",
            std::to_string(value)};
}

long parseIntegerValue(const std::string& output, const std::string& host,
                       const std::string& oid)
{
    std::string text = trim(output);
    long value{0};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || (ptr != last) || (ec != std::errc()))
    {
        throw SNMPError{std::format("Malformed response '{}'", text), host,
                        oid};
    }
    return value;
}

OutletState toOutletState(long value, const std::string& host,
                          const std::string& oid)
{
    if (value == static_cast<long>(OutletState::off))
    {
        return OutletState::off;
    }
    else if (value == static_cast<long>(OutletState::on))
    {
        return OutletState::on;
    }
    throw SNMPError{std::format("Invalid outlet state {}", value), host, oid};
}

} // namespace snmp_internal

} // namespace pdu_cycle
