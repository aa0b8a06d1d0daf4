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

#include "native_pdu_handler.hpp"

#include "format_utils.hpp"
#include "poll.hpp"

#include <exception>
#include <format>
#include <memory>
#include <span>

namespace pdu_cycle
{

std::string toString(CycleState state)
{
    switch (state)
    {
        case CycleState::validating:
            return "VALIDATING";
        case CycleState::poweringOff:
            return "POWERING_OFF";
        case CycleState::verifyingOffline:
            return "VERIFYING_OFFLINE";
        case CycleState::poweringOn:
            return "POWERING_ON";
        case CycleState::verifyingOnline:
            return "VERIFYING_ONLINE";
        case CycleState::done:
            return "DONE";
        case CycleState::failed:
            break;
    }
    return "FAILED";
}

std::optional<Failure> NativePDUHandler::cycle(
    const PDUEntry& entry, const PowerCycleRequest& request)
{
    const std::string& host = entry.pdu.host;
    state = CycleState::validating;
    services.logInfoMsg(std::format(
        "Power cycling outlets {} on PDU {} for system {}",
        format_utils::toString(std::span{entry.outlets}), host,
        request.system));

    // Session is released when this function returns
    std::unique_ptr<PDUSession> session{};
    try
    {
        session = services.openSession(host, entry.pdu.authScheme);
    }
    catch (const std::exception& e)
    {
        setState(CycleState::failed, host);
        return Failure{FailureKind::protocolError, host, std::nullopt,
                       std::format("Unable to open session with PDU {}: {}",
                                   host, e.what())};
    }

    std::optional<Failure> failure = powerOff(*session, entry, request);
    if (!failure)
    {
        failure = verifyOffline(entry, request);
    }
    if (!failure)
    {
        failure = powerOn(*session, entry, request);
    }
    if (!failure)
    {
        failure = verifyOnline(entry, request);
    }

    if (failure)
    {
        setState(CycleState::failed, host);
        return failure;
    }

    setState(CycleState::done, host);
    services.logInfoMsg(
        std::format("Power cycle of PDU {} outlets {} complete", host,
                    format_utils::toString(std::span{entry.outlets})));
    return std::nullopt;
}

std::optional<Failure> NativePDUHandler::powerOff(
    PDUSession& session, const PDUEntry& entry,
    const PowerCycleRequest& request)
{
    const std::string& host = entry.pdu.host;
    for (unsigned int outlet : entry.outlets)
    {
        setState(CycleState::validating, host);
        std::optional<Failure> failure = validator.validate(session, outlet);
        if (failure)
        {
            return failure;
        }

        setState(CycleState::poweringOff, host);
        services.logInfoMsg(
            std::format("Powering off outlet {} on PDU {}", outlet, host));
        failure = setOutletAndWait(session, outlet, OutletState::off,
                                   request.powerOffTimeout,
                                   FailureKind::powerOffTimeout);
        if (failure)
        {
            return failure;
        }
    }
    return std::nullopt;
}

std::optional<Failure> NativePDUHandler::verifyOffline(
    const PDUEntry& entry, const PowerCycleRequest& request)
{
    const std::string& host = entry.pdu.host;
    setState(CycleState::verifyingOffline, host);
    services.sleep(offlineGracePeriod);

    bool isReachable{false};
    try
    {
        isReachable = services.isReachable(request.system);
    }
    catch (const std::exception& e)
    {
        return Failure{
            FailureKind::protocolError, host, std::nullopt,
            std::format("Unable to check whether system {} is reachable: {}",
                        request.system, e.what())};
    }

    if (isReachable)
    {
        return Failure{
            FailureKind::unexpectedlyReachableAfterPowerOff, host,
            std::nullopt,
            std::format(
                "System {} is still reachable after powering off outlets {} on PDU {}",
                request.system,
                format_utils::toString(std::span{entry.outlets}), host)};
    }
    services.logInfoMsg(
        std::format("System {} is unreachable as expected", request.system));
    return std::nullopt;
}

std::optional<Failure> NativePDUHandler::powerOn(
    PDUSession& session, const PDUEntry& entry,
    const PowerCycleRequest& request)
{
    const std::string& host = entry.pdu.host;
    setState(CycleState::poweringOn, host);
    for (unsigned int outlet : entry.outlets)
    {
        services.logInfoMsg(
            std::format("Powering on outlet {} on PDU {}", outlet, host));
        std::optional<Failure> failure = setOutletAndWait(
            session, outlet, OutletState::on, request.powerOnTimeout,
            FailureKind::powerOnTimeout);
        if (failure)
        {
            return failure;
        }
    }
    return std::nullopt;
}

std::optional<Failure> NativePDUHandler::verifyOnline(
    const PDUEntry& entry, const PowerCycleRequest& request)
{
    const std::string& host = entry.pdu.host;
    setState(CycleState::verifyingOnline, host);
    services.logInfoMsg(
        std::format("Waiting up to {}s for system {} to become reachable",
                    request.pingTimeout.count(), request.system));

    bool isReachable{false};
    try
    {
        isReachable = pollWithTimeout(
            [this, &request]() { return services.isReachable(request.system); },
            true, pingPollInterval, request.pingTimeout,
            [this](std::chrono::seconds interval) {
                services.sleep(interval);
            });
    }
    catch (const std::exception& e)
    {
        return Failure{
            FailureKind::protocolError, host, std::nullopt,
            std::format("Unable to check whether system {} is reachable: {}",
                        request.system, e.what())};
    }

    if (!isReachable)
    {
        return Failure{
            FailureKind::unreachableAfterPowerOn, host, std::nullopt,
            std::format(
                "System {} is not reachable {}s after powering on outlets {} on PDU {}",
                request.system, request.pingTimeout.count(),
                format_utils::toString(std::span{entry.outlets}), host)};
    }
    services.logInfoMsg(std::format("System {} is reachable", request.system));
    return std::nullopt;
}

std::optional<Failure> NativePDUHandler::setOutletAndWait(
    PDUSession& session, unsigned int outlet, OutletState newState,
    std::chrono::seconds timeout, FailureKind timeoutKind)
{
    const std::string& host = session.getHost();
    bool hasChanged{false};
    try
    {
        session.setOutletState(outlet, newState);
        hasChanged = pollWithTimeout(
            [&session, outlet]() { return session.getOutletState(outlet); },
            newState, outletPollInterval, timeout,
            [this](std::chrono::seconds interval) {
                services.sleep(interval);
            });
    }
    catch (const SNMPError& e)
    {
        return Failure{FailureKind::protocolError, host, outlet,
                       std::format("Unable to turn {} outlet {} on PDU {}: {}",
                                   toString(newState), outlet, host,
                                   e.what())};
    }

    if (!hasChanged)
    {
        return Failure{
            timeoutKind, host, outlet,
            std::format("Outlet {} on PDU {} did not turn {} within {}s",
                        outlet, host, toString(newState), timeout.count())};
    }
    services.logDebugMsg(std::format("Outlet {} on PDU {} is {}", outlet, host,
                                     toString(newState)));
    return std::nullopt;
}

void NativePDUHandler::setState(CycleState newState,
                                const std::string& pduHost)
{
    if (newState != state)
    {
        services.logDebugMsg(std::format("PDU {}: {} -> {}", pduHost,
                                         toString(state), toString(newState)));
        state = newState;
    }
}

} // namespace pdu_cycle
