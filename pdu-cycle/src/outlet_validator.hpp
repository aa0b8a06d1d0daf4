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

#include "failure.hpp"
#include "pdu_session.hpp"

#include <optional>

namespace pdu_cycle
{

/**
 * @class OutletValidator
 *
 * Verifies that an outlet number exists on a PDU.
 *
 * The outlet count is read from the PDU every time an outlet is validated.
 */
class OutletValidator
{
  public:
    // Specify which compiler-generated methods we want
    OutletValidator() = default;
    OutletValidator(const OutletValidator&) = delete;
    OutletValidator(OutletValidator&&) = delete;
    OutletValidator& operator=(const OutletValidator&) = delete;
    OutletValidator& operator=(OutletValidator&&) = delete;
    ~OutletValidator() = default;

    /**
     * Returns whether the specified outlet number is within [1, outletCount].
     *
     * @param outlet outlet number
     * @param outletCount number of outlets on the PDU
     * @return true if valid, false otherwise
     */
    static bool isValid(unsigned int outlet, unsigned int outletCount)
    {
        return (outlet >= 1) && (outlet <= outletCount);
    }

    /**
     * Validates the specified outlet against the live outlet count of the
     * PDU.
     *
     * Returns an InvalidOutletNumber failure if the outlet does not exist, or
     * a ProtocolError failure if the outlet count could not be read.
     *
     * @param session session with the PDU
     * @param outlet outlet number
     * @return failure, or std::nullopt if the outlet is valid
     */
    std::optional<Failure> validate(PDUSession& session, unsigned int outlet);
};

} // namespace pdu_cycle
