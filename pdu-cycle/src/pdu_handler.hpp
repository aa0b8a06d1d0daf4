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
#include "power_cycle_request.hpp"

#include <optional>

namespace pdu_cycle
{

/**
 * @class PDUHandler
 *
 * Abstract base class for objects that power cycle the outlets of one PDU.
 *
 * There is one subclass for each PDU vendor family.
 */
class PDUHandler
{
  public:
    // Specify which compiler-generated methods we want
    PDUHandler() = default;
    PDUHandler(const PDUHandler&) = delete;
    PDUHandler(PDUHandler&&) = delete;
    PDUHandler& operator=(const PDUHandler&) = delete;
    PDUHandler& operator=(PDUHandler&&) = delete;
    virtual ~PDUHandler() = default;

    /**
     * Power cycles the outlets in the specified request entry.
     *
     * @param entry PDU and outlets to power cycle
     * @param request request that contains the entry
     * @return failure, or std::nullopt if the outlets were power cycled
     */
    virtual std::optional<Failure> cycle(const PDUEntry& entry,
                                         const PowerCycleRequest& request) = 0;
};

} // namespace pdu_cycle
