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
#include "pdu_handler.hpp"
#include "power_cycle_request.hpp"
#include "services.hpp"

#include <optional>

namespace pdu_cycle
{

/**
 * @class DelegatedPDUHandler
 *
 * Power cycles outlets on a delegated PDU by running an external script.
 *
 * The script performs the whole off/on sequence.  Outlet numbers are not
 * validated, outlet states are not polled, and the target system is not
 * checked for reachability.  A script that cannot be started or that exits
 * with a non-zero code is reported as a DelegatedCycleFailed failure.
 */
class DelegatedPDUHandler : public PDUHandler
{
  public:
    // Specify which compiler-generated methods we want
    DelegatedPDUHandler() = delete;
    DelegatedPDUHandler(const DelegatedPDUHandler&) = delete;
    DelegatedPDUHandler(DelegatedPDUHandler&&) = delete;
    DelegatedPDUHandler& operator=(const DelegatedPDUHandler&) = delete;
    DelegatedPDUHandler& operator=(DelegatedPDUHandler&&) = delete;
    virtual ~DelegatedPDUHandler() = default;

    /**
     * Constructor.
     *
     * @param services system services like the delegated script and the
     *                 journal
     */
    explicit DelegatedPDUHandler(Services& services) : services{services} {}

    /** @copydoc PDUHandler::cycle() */
    virtual std::optional<Failure>
        cycle(const PDUEntry& entry, const PowerCycleRequest& request) override;

  private:
    Services& services;
};

} // namespace pdu_cycle
