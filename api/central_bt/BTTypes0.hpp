/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef BT_TYPES0_HPP_
#define BT_TYPES0_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "BTAddress.hpp"
#include "BTStatusCodes.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    class BTException : public jau::RuntimeException {
        public:
        BTException(std::string const m, const char* file, int line) noexcept
        : RuntimeException("BTException", m, file, line) {}

        BTException(const char *m, const char* file, int line) noexcept
        : RuntimeException("BTException", m, file, line) {}
    };

    /**
     * Connection state of one BTPeripheral session.
     * <pre>
     * DISCONNECTED --connect()--> CONNECTING --success--> CONNECTED
     * CONNECTING --failure--> DISCONNECTED
     * CONNECTED --link loss / disconnect()--> DISCONNECTING --> CLEANING_UP --grace--> DISCONNECTED
     * </pre>
     */
    enum class ConnectionState : uint8_t {
        DISCONNECTED  = 0,
        CONNECTING    = 1,
        CONNECTED     = 2,
        /** Transient state while the connection handle is being disconnected and closed. */
        DISCONNECTING = 3,
        /** Handle closed, absorbing straggler callbacks until the grace window elapsed. */
        CLEANING_UP   = 4
    };
    constexpr uint8_t number(const ConnectionState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ConnectionState v) noexcept;

    /**
     * Asynchronous operation kinds tracked by the GattOpRegistry.
     */
    enum class GattOpKind : uint8_t {
        CONNECT           = 0,
        DISCOVER_SERVICES = 1,
        READ              = 2,
        WRITE             = 3,
        /** Client characteristic configuration write, i.e. subscribe or unsubscribe. */
        DESC_WRITE        = 4,
        MTU               = 5,
        DISCONNECT        = 6
    };
    constexpr uint8_t number(const GattOpKind rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const GattOpKind v) noexcept;

    /**
     * Returns true if the given operation kind is tracked per characteristic,
     * otherwise in one session global slot.
     */
    constexpr bool isPerCharacteristic(const GattOpKind v) noexcept {
        return GattOpKind::READ == v || GattOpKind::WRITE == v;
    }

    /**
     * Typed failure of one asynchronous operation, delivered via GattReply.
     */
    enum class GattError : uint8_t {
        NONE                     =  0,
        NOT_CONNECTED            =  1,
        ALREADY_CONNECTED        =  2,
        CHAR_NOT_FOUND           =  3,
        SERVICE_DISCOVERY_FAILED =  4,
        OPERATION_FAILED         =  5,
        OVERWRITTEN              =  6,
        UNEXPECTED_DESCRIPTOR    =  7,
        START_FAILED             =  8,
        TIMEOUT                  =  9,
        CONNECTION_FAILED        = 10,
        DISCONNECTED             = 11,
        NO_CLIENT_CONFIG         = 12,
        INVALID_PARAM            = 13
    };
    constexpr uint8_t number(const GattError rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const GattError v) noexcept;

    /** Characteristic value write type. */
    enum class GattWriteType : uint8_t {
        /** ATT Write Request, acknowledged by the peer. */
        WITH_RESPONSE = 0,
        /** ATT Write Command, not acknowledged by the peer. */
        NO_RESPONSE   = 1
    };
    constexpr uint8_t number(const GattWriteType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const GattWriteType v) noexcept;

    /**
     * Link state as reported by the radio stack's connection state change callback.
     */
    enum class BTRadioLinkState : uint8_t {
        DISCONNECTED  = 0,
        CONNECTING    = 1,
        CONNECTED     = 2,
        DISCONNECTING = 3
    };
    constexpr uint8_t number(const BTRadioLinkState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BTRadioLinkState v) noexcept;

    /**@}*/

} // namespace central_bt

#endif /* BT_TYPES0_HPP_ */
