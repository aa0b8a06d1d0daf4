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

#include "failure.hpp"

namespace pdu_cycle
{

std::string toString(FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::inputShapeMismatch:
            return "InputShapeMismatch";
        case FailureKind::unsupportedVendor:
            return "UnsupportedVendor";
        case FailureKind::unsupportedAuthScheme:
            return "UnsupportedAuthScheme";
        case FailureKind::invalidOutletNumber:
            return "InvalidOutletNumber";
        case FailureKind::protocolError:
            return "ProtocolError";
        case FailureKind::powerOffTimeout:
            return "PowerOffTimeout";
        case FailureKind::unexpectedlyReachableAfterPowerOff:
            return "UnexpectedlyReachableAfterPowerOff";
        case FailureKind::powerOnTimeout:
            return "PowerOnTimeout";
        case FailureKind::unreachableAfterPowerOn:
            return "UnreachableAfterPowerOn";
        case FailureKind::delegatedCycleFailed:
            return "DelegatedCycleFailed";
    }
    return "Unknown";
}

int toExitStatus(const PowerCycleOutcome& outcome)
{
    if (outcome.succeeded())
    {
        return exitSuccess;
    }
    if (outcome.failure->kind == FailureKind::unsupportedVendor)
    {
        return exitUnsupportedVendor;
    }
    return exitFailure;
}

} // namespace pdu_cycle
