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
#include "failure.hpp"
#include "types.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace pdu_cycle
{

/**
 * @struct PDU
 *
 * Power distribution unit that feeds the target system.
 */
struct PDU
{
    std::string host;
    Vendor vendor;
    AuthScheme authScheme;
};

/**
 * @struct PDUEntry
 *
 * One PDU and the outlets on it that power the target system.  Outlets are
 * stored in the order the caller specified them.
 */
struct PDUEntry
{
    PDU pdu;
    std::vector<unsigned int> outlets;
};

/**
 * @struct PowerCycleRequest
 *
 * Validated request to power cycle one target system.
 */
struct PowerCycleRequest
{
    /**
     * Host name or address of the target system.
     */
    std::string system;

    /**
     * PDUs to process, in order.
     */
    std::vector<PDUEntry> entries;

    std::chrono::seconds powerOffTimeout;
    std::chrono::seconds powerOnTimeout;
    std::chrono::seconds pingTimeout;
};

/**
 * @struct CycleArguments
 *
 * Caller input used to build a PowerCycleRequest.  The PDU hosts, vendors and
 * outlet lists are matched by position.
 */
struct CycleArguments
{
    std::vector<std::string> pduHosts{};
    std::vector<std::string> pduVendors{};
    std::string system{};
    std::vector<std::vector<unsigned int>> outletNumbers{};
};

/**
 * Builds a power cycle request from the specified caller input.
 *
 * The following checks are performed, in order, before any PDU is contacted:
 *   - The host, vendor and outlet lists have the same length
 *     (InputShapeMismatch).
 *   - Every vendor name is supported (UnsupportedVendor).
 *   - The configured authentication scheme is supported
 *     (UnsupportedAuthScheme).
 *
 * @param args caller input
 * @param config application configuration
 * @return request, or the failure that prevented building it
 */
std::variant<PowerCycleRequest, Failure>
    buildRequest(const CycleArguments& args, const Config& config);

/**
 * Parses a comma separated list of outlet numbers, such as "3,4".
 *
 * White space around numbers is ignored.  Range checking against the PDU
 * outlet count is not performed here.
 *
 * Throws an invalid_argument exception if the list is empty or contains a
 * value that is not a non-negative integer.
 *
 * @param text outlet list
 * @return outlet numbers in the order specified
 */
std::vector<unsigned int> parseOutletList(const std::string& text);

} // namespace pdu_cycle
