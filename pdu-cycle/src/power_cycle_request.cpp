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

#include "power_cycle_request.hpp"

#include <charconv>
#include <format>
#include <optional>
#include <stdexcept>

namespace pdu_cycle
{

std::variant<PowerCycleRequest, Failure>
    buildRequest(const CycleArguments& args, const Config& config)
{
    if ((args.pduHosts.size() != args.pduVendors.size()) ||
        (args.pduHosts.size() != args.outletNumbers.size()))
    {
        return Failure{
            FailureKind::inputShapeMismatch, "", std::nullopt,
            std::format(
                "PDU hosts, vendors and outlet lists must have the same length: "
                "hosts={}, vendors={}, outlet lists={}",
                args.pduHosts.size(), args.pduVendors.size(),
                args.outletNumbers.size())};
    }

    // Resolve every vendor before any entry is processed
    std::vector<Vendor> vendors{};
    for (std::size_t i = 0; i < args.pduVendors.size(); ++i)
    {
        std::optional<Vendor> vendor = parseVendor(args.pduVendors[i]);
        if (!vendor)
        {
            return Failure{FailureKind::unsupportedVendor, args.pduHosts[i],
                           std::nullopt,
                           std::format("Unsupported PDU vendor {} for PDU {}",
                                       args.pduVendors[i], args.pduHosts[i])};
        }
        vendors.emplace_back(*vendor);
    }

    if (config.authScheme == AuthScheme::unsupported)
    {
        return Failure{FailureKind::unsupportedAuthScheme, "", std::nullopt,
                       std::format("Unsupported authentication scheme {}",
                                   toString(config.authScheme))};
    }

    PowerCycleRequest request{args.system,
                              {},
                              config.powerOffTimeout,
                              config.powerOnTimeout,
                              config.pingTimeout};
    for (std::size_t i = 0; i < args.pduHosts.size(); ++i)
    {
        request.entries.emplace_back(
            PDUEntry{PDU{args.pduHosts[i], vendors[i], config.authScheme},
                     args.outletNumbers[i]});
    }
    return request;
}

std::vector<unsigned int> parseOutletList(const std::string& text)
{
    std::vector<unsigned int> outlets{};
    std::string::size_type start{0};
    while (start <= text.size())
    {
        std::string::size_type end = text.find(',', start);
        if (end == std::string::npos)
        {
            end = text.size();
        }

        std::string token = text.substr(start, end - start);
        std::string::size_type first = token.find_first_not_of(" \t");
        std::string::size_type last = token.find_last_not_of(" \t");
        if (first == std::string::npos)
        {
            throw std::invalid_argument{"Empty outlet number in list: " +
                                        text};
        }
        token = token.substr(first, last - first + 1);

        unsigned int outlet{0};
        const char* begin = token.data();
        const char* finish = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(begin, finish, outlet);
        if ((ptr != finish) || (ec != std::errc()))
        {
            throw std::invalid_argument{"Invalid outlet number: " + token};
        }
        outlets.emplace_back(outlet);

        start = end + 1;
    }
    return outlets;
}

} // namespace pdu_cycle
