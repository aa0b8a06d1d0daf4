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
#include "outlet_validator.hpp"
#include "pdu_handler.hpp"
#include "pdu_session.hpp"
#include "power_cycle_request.hpp"
#include "services.hpp"
#include "types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace pdu_cycle
{

/**
 * @enum CycleState
 *
 * State of the power cycle of one native PDU.
 *
 * Normal progression is validating -> poweringOff (repeated for each outlet),
 * then verifyingOffline -> poweringOn -> verifyingOnline -> done.  The failed
 * state can be entered from any state.  done and failed are terminal.
 */
enum class CycleState
{
    validating,
    poweringOff,
    verifyingOffline,
    poweringOn,
    verifyingOnline,
    done,
    failed
};

/**
 * Returns the name of the specified state, such as "POWERING_OFF".
 *
 * @param state cycle state
 * @return state name
 */
std::string toString(CycleState state);

/**
 * @class NativePDUHandler
 *
 * Power cycles outlets on a native PDU by driving the outlets directly and
 * verifying the result.
 *
 * For each PDU entry:
 *   - Every outlet is validated, turned off, and polled until it reports OFF.
 *   - After a grace period, the target system must not be reachable.
 *   - Every outlet is turned on and polled until it reports ON.
 *   - The target system is polled until it is reachable.
 *
 * No outlet is turned on until all outlets on the PDU have reported OFF.
 * The first failure ends processing; outlets that already changed state are
 * left as they are.
 */
class NativePDUHandler : public PDUHandler
{
  public:
    // Specify which compiler-generated methods we want
    NativePDUHandler() = delete;
    NativePDUHandler(const NativePDUHandler&) = delete;
    NativePDUHandler(NativePDUHandler&&) = delete;
    NativePDUHandler& operator=(const NativePDUHandler&) = delete;
    NativePDUHandler& operator=(NativePDUHandler&&) = delete;
    virtual ~NativePDUHandler() = default;

    /**
     * Time between two reads of an outlet state.
     */
    static constexpr std::chrono::seconds outletPollInterval{5};

    /**
     * Time between two reachability checks of the target system.
     */
    static constexpr std::chrono::seconds pingPollInterval{2};

    /**
     * Time to wait after all outlets are off before checking that the target
     * system is unreachable.
     */
    static constexpr std::chrono::seconds offlineGracePeriod{5};

    /**
     * Constructor.
     *
     * @param services system services like PDU sessions and the journal
     */
    explicit NativePDUHandler(Services& services) : services{services} {}

    /** @copydoc PDUHandler::cycle() */
    virtual std::optional<Failure>
        cycle(const PDUEntry& entry, const PowerCycleRequest& request) override;

    /**
     * Returns the current state of the power cycle.
     *
     * After cycle() returns this is either CycleState::done or
     * CycleState::failed.
     *
     * @return cycle state
     */
    CycleState getState() const
    {
        return state;
    }

  private:
    /**
     * Validates each outlet, turns it off, and waits for it to report OFF.
     */
    std::optional<Failure> powerOff(PDUSession& session,
                                    const PDUEntry& entry,
                                    const PowerCycleRequest& request);

    /**
     * Waits for the grace period and verifies that the target system is not
     * reachable.
     */
    std::optional<Failure> verifyOffline(const PDUEntry& entry,
                                         const PowerCycleRequest& request);

    /**
     * Turns each outlet on and waits for it to report ON.
     */
    std::optional<Failure> powerOn(PDUSession& session, const PDUEntry& entry,
                                   const PowerCycleRequest& request);

    /**
     * Waits for the target system to become reachable.
     */
    std::optional<Failure> verifyOnline(const PDUEntry& entry,
                                        const PowerCycleRequest& request);

    /**
     * Sets the state of one outlet and polls it until it reports the new
     * state.
     *
     * @param session session with the PDU
     * @param outlet outlet number
     * @param newState requested outlet state
     * @param timeout maximum time to wait for the outlet to change
     * @param timeoutKind failure kind returned if the timeout expires
     * @return failure, or std::nullopt if the outlet changed state
     */
    std::optional<Failure> setOutletAndWait(PDUSession& session,
                                            unsigned int outlet,
                                            OutletState newState,
                                            std::chrono::seconds timeout,
                                            FailureKind timeoutKind);

    /**
     * Changes the current state and writes the transition to the journal.
     *
     * @param newState new cycle state
     * @param pduHost host name of the PDU being processed
     */
    void setState(CycleState newState, const std::string& pduHost);

    /**
     * System services like PDU sessions and the journal.
     */
    Services& services;

    /**
     * Validates outlet numbers against the PDU outlet count.
     */
    OutletValidator validator{};

    /**
     * Current state of the power cycle.
     */
    CycleState state{CycleState::validating};
};

} // namespace pdu_cycle
