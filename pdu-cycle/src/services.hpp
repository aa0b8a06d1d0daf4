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
#include "net_snmp_session.hpp"
#include "pdu_session.hpp"
#include "ping_probe.hpp"
#include "types.hpp"

#include <phosphor-logging/lg2.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace pdu_cycle
{

/**
 * @class Services
 *
 * Abstract base class that provides an interface to the system services used
 * while power cycling: the journal, sleeping, PDU sessions, reachability
 * checks, and the delegated power cycle script.
 */
class Services
{
  public:
    // Specify which compiler-generated methods we want
    Services() = default;
    Services(const Services&) = delete;
    Services(Services&&) = delete;
    Services& operator=(const Services&) = delete;
    Services& operator=(Services&&) = delete;
    virtual ~Services() = default;

    /**
     * Logs a debug message in the system journal.
     *
     * @param message message to log
     */
    virtual void logDebugMsg(const std::string& message) = 0;

    /**
     * Logs an informational message in the system journal.
     *
     * @param message message to log
     */
    virtual void logInfoMsg(const std::string& message) = 0;

    /**
     * Logs an error message in the system journal.
     *
     * @param message message to log
     */
    virtual void logErrorMsg(const std::string& message) = 0;

    /**
     * Blocks the calling thread for the specified duration.
     *
     * @param duration time to sleep
     */
    virtual void sleep(std::chrono::seconds duration) = 0;

    /**
     * Opens a management session with the specified PDU.
     *
     * Throws an exception if the session cannot be created.
     *
     * @param host PDU host name or address
     * @param authScheme authentication scheme
     * @return session owned by the caller
     */
    virtual std::unique_ptr<PDUSession>
        openSession(const std::string& host, AuthScheme authScheme) = 0;

    /**
     * Returns whether the specified host answers a single echo request.
     *
     * Throws an exception if the check cannot be performed.
     *
     * @param host host name or address
     * @return true if reachable, false otherwise
     */
    virtual bool isReachable(const std::string& host) = 0;

    /**
     * Runs the external script that power cycles outlets on a delegated PDU.
     *
     * Waits for the script to exit.  The script output is not inspected.
     *
     * Throws an exception if the script cannot be started.
     *
     * @param pduHost PDU host name or address
     * @param outlets comma separated outlet numbers, such as "3,4"
     * @return exit code of the script
     */
    virtual int runDelegatedCycle(const std::string& pduHost,
                                  const std::string& outlets) = 0;
};

/**
 * @class SystemServices
 *
 * Implementation of the Services interface using the real system: the
 * journal through phosphor-logging, the Net-SNMP tools, ping, and the
 * configured delegated script.
 */
class SystemServices : public Services
{
  public:
    // Specify which compiler-generated methods we want
    SystemServices() = delete;
    SystemServices(const SystemServices&) = delete;
    SystemServices(SystemServices&&) = delete;
    SystemServices& operator=(const SystemServices&) = delete;
    SystemServices& operator=(SystemServices&&) = delete;
    virtual ~SystemServices() = default;

    /**
     * Constructor.
     *
     * @param config application configuration; must outlive this object
     */
    explicit SystemServices(const Config& config) :
        config{config}, pingProbe{config.pingDeadline}
    {}

    /** @copydoc Services::logDebugMsg() */
    virtual void logDebugMsg(const std::string& message) override
    {
        if (config.logLevel <= LogLevel::debug)
        {
            lg2::debug(message.c_str());
        }
    }

    /** @copydoc Services::logInfoMsg() */
    virtual void logInfoMsg(const std::string& message) override
    {
        if (config.logLevel <= LogLevel::info)
        {
            lg2::info(message.c_str());
        }
    }

    /** @copydoc Services::logErrorMsg() */
    virtual void logErrorMsg(const std::string& message) override
    {
        lg2::error(message.c_str());
    }

    /** @copydoc Services::sleep() */
    virtual void sleep(std::chrono::seconds duration) override
    {
        std::this_thread::sleep_for(duration);
    }

    /** @copydoc Services::openSession() */
    virtual std::unique_ptr<PDUSession>
        openSession(const std::string& host, AuthScheme authScheme) override
    {
        return std::make_unique<NetSNMPSession>(host, authScheme, config.snmp);
    }

    /** @copydoc Services::isReachable() */
    virtual bool isReachable(const std::string& host) override
    {
        return pingProbe.isReachable(host);
    }

    /** @copydoc Services::runDelegatedCycle() */
    virtual int runDelegatedCycle(const std::string& pduHost,
                                  const std::string& outlets) override;

  private:
    /**
     * Application configuration.
     */
    const Config& config;

    /**
     * Probe used to check whether hosts are reachable.
     */
    PingProbe pingProbe;
};

} // namespace pdu_cycle
