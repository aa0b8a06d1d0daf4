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

#include "outlet_validator.hpp"

#include <format>

namespace pdu_cycle
{

std::optional<Failure> OutletValidator::validate(PDUSession& session,
                                                 unsigned int outlet)
{
    unsigned int outletCount{0};
    try
    {
        outletCount = session.getOutletCount();
    }
    catch (const SNMPError& e)
    {
        return Failure{FailureKind::protocolError, session.getHost(), outlet,
                       std::format("Unable to read outlet count: {}",
                                   e.what())};
    }

    if (!isValid(outlet, outletCount))
    {
        return Failure{
            FailureKind::invalidOutletNumber, session.getHost(), outlet,
            std::format(
                "Invalid outlet number {} for PDU {}: must be between 1 and {}",
                outlet, session.getHost(), outletCount)};
    }
    return std::nullopt;
}

} // namespace pdu_cycle
