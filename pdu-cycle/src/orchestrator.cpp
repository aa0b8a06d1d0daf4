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

#include "orchestrator.hpp"

#include <format>
#include <optional>
#include <utility>
#include <variant>

namespace pdu_cycle
{

PowerCycleOutcome Orchestrator::run(const PowerCycleRequest& request)
{
    services.logInfoMsg(
        std::format("Power cycling system {} using {} PDU(s)", request.system,
                    request.entries.size()));
    for (const PDUEntry& entry : request.entries)
    {
        std::optional<Failure> failure =
            getHandler(entry.pdu.vendor).cycle(entry, request);
        if (failure)
        {
            return PowerCycleOutcome{std::move(failure)};
        }
        services.logInfoMsg(std::format("Power cycled PDU {} ({})",
                                        entry.pdu.host,
                                        toString(entry.pdu.vendor)));
    }
    services.logInfoMsg(
        std::format("Power cycle of system {} succeeded", request.system));
    return PowerCycleOutcome{};
}

PDUHandler& Orchestrator::getHandler(Vendor vendor)
{
    if (vendor == Vendor::delegated)
    {
        return delegatedHandler;
    }
    return nativeHandler;
}

PowerCycleOutcome cycle(const CycleArguments& args, const Config& config,
                        Services& services)
{
    std::variant<PowerCycleRequest, Failure> result =
        buildRequest(args, config);
    if (const Failure* failure = std::get_if<Failure>(&result))
    {
        return PowerCycleOutcome{*failure};
    }

    Orchestrator orchestrator{services};
    return orchestrator.run(std::get<PowerCycleRequest>(result));
}

} // namespace pdu_cycle
