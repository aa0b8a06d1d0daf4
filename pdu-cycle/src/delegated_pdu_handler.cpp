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

#include "delegated_pdu_handler.hpp"

#include "format_utils.hpp"

#include <exception>
#include <format>
#include <span>
#include <string>

namespace pdu_cycle
{

std::optional<Failure> DelegatedPDUHandler::cycle(
    const PDUEntry& entry, const PowerCycleRequest& /* request */)
{
    const std::string& host = entry.pdu.host;
    std::string outlets = format_utils::join(std::span{entry.outlets}, ",");
    services.logInfoMsg(std::format(
        "Delegating power cycle of outlets {} on PDU {}", outlets, host));

    int exitCode{0};
    try
    {
        exitCode = services.runDelegatedCycle(host, outlets);
    }
    catch (const std::exception& e)
    {
        return Failure{
            FailureKind::delegatedCycleFailed, host, std::nullopt,
            std::format("Unable to run power cycle script for PDU {}: {}",
                        host, e.what())};
    }

    if (exitCode != 0)
    {
        return Failure{
            FailureKind::delegatedCycleFailed, host, std::nullopt,
            std::format(
                "Power cycle script for PDU {} outlets {} failed with exit code {}",
                host, outlets, exitCode)};
    }
    services.logInfoMsg(std::format(
        "Delegated power cycle of outlets {} on PDU {} complete", outlets,
        host));
    return std::nullopt;
}

} // namespace pdu_cycle
