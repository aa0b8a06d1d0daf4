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
#include "pdu_session.hpp"
#include "process.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace pdu_cycle
{

/**
 * @class NetSNMPSession
 *
 * Implementation of the PDUSession interface that uses the Net-SNMP command
 * line tools, snmpget and snmpset.
 *
 * Each request runs one tool invocation.  Retransmission of unanswered
 * requests is handled by the tools based on SNMPConfig::retries.
 */
class NetSNMPSession : public PDUSession
{
  public:
    // Specify which compiler-generated methods we want
    NetSNMPSession() = delete;
    NetSNMPSession(const NetSNMPSession&) = delete;
    NetSNMPSession(NetSNMPSession&&) = delete;
    NetSNMPSession& operator=(const NetSNMPSession&) = delete;
    NetSNMPSession& operator=(NetSNMPSession&&) = delete;
    virtual ~NetSNMPSession() = default;

    /**
     * Constructor.
     *
     * Throws an invalid_argument exception if the authentication scheme is
     * not supported.
     *
     * @param host PDU host name or address
     * @param authScheme authentication scheme
     * @param config SNMP settings; must outlive this object
     */
    explicit NetSNMPSession(const std::string& host, AuthScheme authScheme,
                            const SNMPConfig& config);

    /** @copydoc PDUSession::getHost() */
    virtual const std::string& getHost() const override
    {
        return host;
    }

    /** @copydoc PDUSession::getOutletCount() */
    virtual unsigned int getOutletCount() override;

    /** @copydoc PDUSession::getOutletState() */
    virtual OutletState getOutletState(unsigned int outlet) override;

    /** @copydoc PDUSession::setOutletState() */
    virtual void setOutletState(unsigned int outlet,
                                OutletState state) override;

  private:
    /**
     * Reads the integer value of the specified object.
     *
     * @param oid object identifier
     * @return object value
     */
    long getInteger(const std::string& oid);

    /**
     * Runs one Net-SNMP tool and checks its exit code.
     *
     * @param program tool name
     * @param args tool arguments
     * @param oid object identifier being accessed
     * @return tool result
     */
    process::Result runTool(const std::string& program,
                            const std::vector<std::string>& args,
                            const std::string& oid);

    /**
     * PDU host name or address.
     */
    const std::string host;

    /**
     * SNMP protocol version argument: "1" or "2c".
     */
    const std::string version;

    /**
     * SNMP settings.
     */
    const SNMPConfig& config;
};

/*
 * Internal implementation details for NetSNMPSession
 */
namespace snmp_internal
{

/**
 * Returns the object identifier of the state of the specified outlet.
 *
 * @param stateOID object identifier prefix of the outlet state column
 * @param outlet outlet number
 * @return object identifier
 */
std::string getOutletStateOID(const std::string& stateOID,
                              unsigned int outlet);

/**
 * Builds the snmpget arguments to read the specified object.
 *
 * @param host PDU host name
 * @param version SNMP protocol version argument
 * @param config SNMP settings
 * @param oid object identifier
 * @return snmpget arguments
 */
std::vector<std::string> buildGetArgs(const std::string& host,
                                      const std::string& version,
                                      const SNMPConfig& config,
                                      const std::string& oid);

/**
 * Builds the snmpset arguments to write an INTEGER value to the specified
 * object.
 *
 * @param host PDU host name
 * @param version SNMP protocol version argument
 * @param config SNMP settings
 * @param oid object identifier
 * @param value value to write
 * @return snmpset arguments
 */
std::vector<std::string> buildSetArgs(const std::string& host,
                                      const std::string& version,
                                      const SNMPConfig& config,
                                      const std::string& oid, long value);

/**
 * Parses the value printed by snmpget when output options "-Oqve" are used.
 *
 * Throws an SNMPError if the output is not a single integer.  This includes
 * exception values such as "No Such Instance currently exists at this OID".
 *
 * @param output tool output
 * @param host PDU host name
 * @param oid object identifier
 * @return integer value
 */
long parseIntegerValue(const std::string& output, const std::string& host,
                       const std::string& oid);

/**
 * Converts an integer read from a PDU to an outlet state.
 *
 * Throws an SNMPError if the value is neither 0 nor 1.
 *
 * @param value integer value
 * @param host PDU host name
 * @param oid object identifier
 * @return outlet state
 */
OutletState toOutletState(long value, const std::string& host,
                          const std::string& oid);

} // namespace snmp_internal

} // namespace pdu_cycle
