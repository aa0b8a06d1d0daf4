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
 * Process exit status when the power cycle succeeded.
 */
constexpr int exitSuccess = 0;

/**
 * Process exit status for all failures other than an unsupported vendor.
 */
constexpr int exitFailure = 1;

/**
 * Process exit status when a PDU vendor is not supported.
 */
constexpr int exitUnsupportedVendor = 6;

/**
 * @enum FailureKind
 *
 * Reason a power cycle request failed.  Every kind ends the run.
 */
enum class FailureKind
{
    inputShapeMismatch,
    unsupportedVendor,
    unsupportedAuthScheme,
    invalidOutletNumber,
    protocolError,
    powerOffTimeout,
    unexpectedlyReachableAfterPowerOff,
    powerOnTimeout,
    unreachableAfterPowerOn,
    delegatedCycleFailed
};

/**
 * @struct Failure
 *
 * Failure that ended a power cycle request.
 */
struct Failure
{
    /**
     * Reason for the failure.
     */
    FailureKind kind;

    /**
     * Host name of the PDU being processed.  Empty if the failure occurred
     * before any PDU was processed.
     */
    std::string pduHost{};

    /**
     * Outlet being processed, if the failure applies to one outlet.
     */
    std::optional<unsigned int> outlet{};

    /**
     * Description of the failure including its diagnostic context.
     */
    std::string message{};
};

/**
 * @struct PowerCycleOutcome
 *
 * Result of one power cycle request.
 */
struct PowerCycleOutcome
{
    /**
     * Failure that ended the request, or std::nullopt if it succeeded.
     */
    std::optional<Failure> failure{};

    /**
     * Returns whether the request succeeded.
     *
     * @return true if every PDU was power cycled, false otherwise
     */
    bool succeeded() const
    {
        return !failure.has_value();
    }
};

/**
 * Returns the name of the specified failure kind, such as "PowerOffTimeout".
 *
 * @param kind failure kind
 * @return failure kind name
 */
std::string toString(FailureKind kind);

/**
 * Returns the process exit status for the specified outcome.
 *
 * @param outcome power cycle outcome
 * @return exit status
 */
int toExitStatus(const PowerCycleOutcome& outcome);

} // namespace pdu_cycle
