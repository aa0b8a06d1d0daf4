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

#include <chrono>
#include <string>
#include <vector>

namespace pdu_cycle
{

/**
 * @class PingProbe
 *
 * Checks whether a host is reachable by sending it a single ICMP echo request
 * with the ping utility.
 *
 * Each call sends one echo request.  Callers that need to wait for a host
 * implement their own retry loop.
 */
class PingProbe
{
  public:
    // Specify which compiler-generated methods we want
    PingProbe() = delete;
    PingProbe(const PingProbe&) = delete;
    PingProbe(PingProbe&&) = delete;
    PingProbe& operator=(const PingProbe&) = delete;
    PingProbe& operator=(PingProbe&&) = delete;
    ~PingProbe() = default;

    /**
     * Constructor.
     *
     * @param deadline time to wait for the echo reply
     */
    explicit PingProbe(std::chrono::seconds deadline) : deadline{deadline} {}

    /**
     * Returns whether the specified host answered the echo request before the
     * deadline.
     *
     * Throws a runtime_error if the ping utility cannot be run.
     *
     * @param host host name or address
     * @return true if the host is reachable, false otherwise
     */
    bool isReachable(const std::string& host) const;

    /**
     * Returns the ping arguments used to probe the specified host.
     *
     * @param host host name or address
     * @return ping arguments
     */
    std::vector<std::string> getArgs(const std::string& host) const;

  private:
    /**
     * Time to wait for the echo reply.
     */
    const std::chrono::seconds deadline;
};

} // namespace pdu_cycle
