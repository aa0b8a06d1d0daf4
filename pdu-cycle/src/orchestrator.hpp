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
#include "delegated_pdu_handler.hpp"
#include "failure.hpp"
#include "native_pdu_handler.hpp"
#include "pdu_handler.hpp"
#include "power_cycle_request.hpp"
#include "services.hpp"
#include "types.hpp"

namespace pdu_cycle
{

/**
 * @class Orchestrator
 *
 * Power cycles the outlets in a request by dispatching each PDU entry to the
 * handler for its vendor.
 *
 * Entries are processed one at a time in request order.  Each entry is
 * completed, including its reachability checks, before the next entry
 * starts.  The first failure ends the request.
 */
class Orchestrator
{
  public:
    // Specify which compiler-generated methods we want
    Orchestrator() = delete;
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;
    ~Orchestrator() = default;

    /**
     * Constructor.
     *
     * @param services system services like PDU sessions and the journal
     */
    explicit Orchestrator(Services& services) :
        services{services}, nativeHandler{services},
        delegatedHandler{services}
    {}

    /**
     * Power cycles the outlets in the specified request.
     *
     * @param request validated power cycle request
     * @return outcome of the request
     */
    PowerCycleOutcome run(const PowerCycleRequest& request);

    /**
     * Returns the handler for the specified vendor.
     *
     * @param vendor PDU vendor
     * @return handler reference
     */
    PDUHandler& getHandler(Vendor vendor);

  private:
    Services& services;
    NativePDUHandler nativeHandler;
    DelegatedPDUHandler delegatedHandler;
};

/**
 * Power cycles the outlets described by the specified caller input.
 *
 * Builds the request, failing before any PDU is contacted if the input is
 * invalid, then runs it with an Orchestrator.
 *
 * @param args caller input
 * @param config application configuration
 * @param services system services like PDU sessions and the journal
 * @return outcome of the request
 */
PowerCycleOutcome cycle(const CycleArguments& args, const Config& config,
                        Services& services);

} // namespace pdu_cycle
