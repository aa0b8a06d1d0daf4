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

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#ifndef PDU_CYCLE_DELEGATED_SCRIPT
#define PDU_CYCLE_DELEGATED_SCRIPT "/usr/libexec/pdu-cycle/eaton-power-cycle"
#endif

namespace pdu_cycle
{

/**
 * @struct SNMPConfig
 *
 * Settings used to talk to native PDUs over SNMP.
 */
struct SNMPConfig
{
    /**
     * Community used for GET requests.
     */
    std::string readCommunity{"public"};

    /**
     * Community used for SET requests.
     */
    std::string writeCommunity{"private"};

    /**
     * Time to wait for one SNMP response.
     */
    std::chrono::seconds timeout{3};

    /**
     * Number of times the SNMP engine retransmits an unanswered request.
     */
    unsigned int retries{1};

    /**
     * Object identifier of the PDU outlet count.
     */
    std::string outletCountOID{"1.3.6.1.4.1.2.6.223.8.2.1.0"};

    /**
     * Object identifier prefix of the outlet state column.  The outlet number
     * is appended as the final component.
     */
    std::string outletStateOID{"1.3.6.1.4.1.2.6.223.8.2.2.1.11"};
};

/**
 * @struct Config
 *
 * Configuration for one run of the application.
 *
 * Built once at startup and passed by const reference to every component that
 * needs it.
 */
struct Config
{
    AuthScheme authScheme{AuthScheme::sharedSecretV1};

    /**
     * Maximum time to wait for an outlet to report OFF.
     */
    std::chrono::seconds powerOffTimeout{40};

    /**
     * Maximum time to wait for an outlet to report ON.
     */
    std::chrono::seconds powerOnTimeout{40};

    /**
     * Maximum time to wait for the target system to become reachable after
     * power is restored.
     */
    std::chrono::seconds pingTimeout{300};

    /**
     * Deadline of a single echo request sent to the target system.
     */
    std::chrono::seconds pingDeadline{1};

    LogLevel logLevel{LogLevel::info};

    SNMPConfig snmp{};

    /**
     * Executable that power cycles delegated PDUs.
     */
    std::filesystem::path delegatedScript{PDU_CYCLE_DELEGATED_SCRIPT};
};

} // namespace pdu_cycle
