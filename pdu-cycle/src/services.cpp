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

#include "services.hpp"

#include "process.hpp"

#include <format>
#include <vector>

namespace pdu_cycle
{

int SystemServices::runDelegatedCycle(const std::string& pduHost,
                                      const std::string& outlets)
{
    std::vector<std::string> args{"--pdu", pduHost, "--outlets", outlets};
    logDebugMsg(std::format("Running {} for PDU {}, outlets {}",
                            config.delegatedScript.string(), pduHost, outlets));
    process::Result result = process::run(config.delegatedScript.string(),
                                          args);
    return result.exitCode;
}

} // namespace pdu_cycle
