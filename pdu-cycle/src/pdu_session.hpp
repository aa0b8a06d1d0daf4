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

#include <exception>
#include <string>

namespace pdu_cycle
{

/**
 * @class SNMPError
 *
 * An error that occurred while communicating with a PDU.  This includes
 * transport failures, error responses from the SNMP engine, and malformed
 * response values.
 */
class SNMPError : public std::exception
{
  public:
    // Specify which compiler-generated methods we want
    SNMPError() = delete;
    SNMPError(const SNMPError&) = default;
    SNMPError(SNMPError&&) = default;
    SNMPError& operator=(const SNMPError&) = delete;
    SNMPError& operator=(SNMPError&&) = delete;
    virtual ~SNMPError() = default;

    /**
     * Constructor.
     *
     * @param error error message
     * @param host host name of the PDU where the error occurred
     * @param oid object identifier being accessed, if any
     */
    explicit SNMPError(const std::string& error, const std::string& host,
                       const std::string& oid = "") :
        error{"SNMPError: " + error + ": host " + host +
              (oid.empty() ? "" : ", oid " + oid)},
        host{host}, oid{oid}
    {}

    /**
     * Returns the host name of the PDU where the error occurred.
     *
     * @return PDU host name
     */
    const std::string& getHost() const
    {
        return host;
    }

    /**
     * Returns the object identifier being accessed when the error occurred.
     *
     * @return object identifier, or an empty string if none
     */
    const std::string& getOID() const
    {
        return oid;
    }

    /**
     * Returns the description of this error.
     *
     * @return error description
     */
    const char* what() const noexcept override
    {
        return error.c_str();
    }

  private:
    /**
     * Error message.
     */
    const std::string error{};

    /**
     * Host name of the PDU where the error occurred.
     */
    const std::string host{};

    /**
     * Object identifier being accessed when the error occurred.
     */
    const std::string oid{};
};

/**
 * @class PDUSession
 *
 * Abstract base class for a management session with one PDU.
 *
 * A session is owned by the code processing one PDU and is released when that
 * processing completes.  Sessions are never shared between PDUs.
 */
class PDUSession
{
  public:
    // Specify which compiler-generated methods we want
    PDUSession() = default;
    PDUSession(const PDUSession&) = delete;
    PDUSession(PDUSession&&) = delete;
    PDUSession& operator=(const PDUSession&) = delete;
    PDUSession& operator=(PDUSession&&) = delete;
    virtual ~PDUSession() = default;

    /**
     * Returns the host name of the PDU.
     *
     * @return PDU host name
     */
    virtual const std::string& getHost() const = 0;

    /**
     * Returns the number of switched outlets on the PDU.
     *
     * The value is read from the PDU on every call.
     *
     * Throws an SNMPError if an error occurs.
     *
     * @return outlet count
     */
    virtual unsigned int getOutletCount() = 0;

    /**
     * Returns the current state of the specified outlet.
     *
     * Throws an SNMPError if an error occurs, including when the PDU returns
     * a value other than OFF or ON.
     *
     * @param outlet outlet number, starting at 1
     * @return outlet state
     */
    virtual OutletState getOutletState(unsigned int outlet) = 0;

    /**
     * Requests the specified outlet to change to the specified state.
     *
     * Returns when the PDU has acknowledged the request.  The outlet may not
     * have changed state yet.
     *
     * Throws an SNMPError if an error occurs.
     *
     * @param outlet outlet number, starting at 1
     * @param state requested outlet state
     */
    virtual void setOutletState(unsigned int outlet, OutletState state) = 0;
};

} // namespace pdu_cycle
