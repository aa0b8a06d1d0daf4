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

#include "ping_probe.hpp"

#include "process.hpp"

namespace pdu_cycle
{

bool PingProbe::isReachable(const std::string& host) const
{
    // ping exits with 0 only when a reply was received
    process::Result result = process::run("ping", getArgs(host));
    return (result.exitCode == 0);
}

std::vector<std::string> PingProbe::getArgs(const std::string& host) const
{
    return {"-c", "1", "-W", std::to_string(deadline.count()), host};
}

} // namespace pdu_cycle
