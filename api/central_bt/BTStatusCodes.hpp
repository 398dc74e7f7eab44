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

#ifndef BT_STATUS_CODES_HPP_
#define BT_STATUS_CODES_HPP_

#include <cstdint>
#include <string>

/**
 * - - - - - - - - - - - - - - -
 *
 * BTStatusCodes.hpp Module for radio stack status codes:
 *
 * - BT Core Spec v5.2: Vol 1, Part F Controller Error Codes: 1.3 List of Error Codes
 * - BT Core Spec v5.2: Vol 3, Part F Attribute Protocol (ATT): 3.4.1.1 Error Response
 * - Vendor GATT stack codes as delivered by the radio stack callbacks
 *
 */
namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Connection state change status as delivered by the radio stack,
     * the ::HCIStatusCode subset relevant for a central link
     * plus the vendor GATT stack codes beyond the HCI range.
     * <p>
     * The value is 16 bit wide, as some GATT stacks report codes above 0xff.
     * </p>
     */
    enum class BTConnStatusCode : uint16_t {
        SUCCESS = 0x00,
        UNKNOWN_CONNECTION_IDENTIFIER = 0x02,
        HARDWARE_FAILURE = 0x03,
        PAGE_TIMEOUT = 0x04,
        AUTHENTICATION_FAILURE = 0x05,
        PIN_OR_KEY_MISSING = 0x06,
        MEMORY_CAPACITY_EXCEEDED = 0x07,
        CONNECTION_TIMEOUT = 0x08,
        CONNECTION_LIMIT_EXCEEDED = 0x09,
        CONNECTION_ALREADY_EXISTS = 0x0b,
        COMMAND_DISALLOWED = 0x0c,
        CONNECTION_REJECTED_LIMITED_RESOURCES = 0x0d,
        CONNECTION_ACCEPT_TIMEOUT_EXCEEDED = 0x10,
        REMOTE_USER_TERMINATED_CONNECTION = 0x13,
        REMOTE_DEVICE_TERMINATED_CONNECTION_LOW_RESOURCES = 0x14,
        REMOTE_DEVICE_TERMINATED_CONNECTION_POWER_OFF = 0x15,
        CONNECTION_TERMINATED_BY_LOCAL_HOST = 0x16,
        UNSPECIFIED_ERROR = 0x1f,
        LMP_OR_LL_RESPONSE_TIMEOUT = 0x22,
        INSUFFICIENT_SECURITY = 0x2f,
        CONTROLLER_BUSY = 0x3a,
        UNACCEPTABLE_CONNECTION_PARAM = 0x3b,
        CONNECTION_TERMINATED_MIC_FAILURE = 0x3d,
        CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT = 0x3e,

        // GATT stack codes

        /** Generic GATT stack error, usually the peer being unreachable or the stack out of sync. */
        GATT_ERROR = 0x85,
        /** GATT stack connection timeout. */
        GATT_CONNECTION_TIMEOUT = 0x93,
        /** GATT stack failure, e.g. no free client slot. */
        GATT_FAILURE = 0x101,

        INTERNAL_FAILURE = 0xfffe,
        UNKNOWN = 0xffff
    };
    constexpr uint16_t number(const BTConnStatusCode rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    constexpr BTConnStatusCode to_BTConnStatusCode(const uint16_t v) noexcept {
        return static_cast<BTConnStatusCode>(v);
    }
    std::string to_string(const BTConnStatusCode ec) noexcept;

    /**
     * Semantic category of a connection status code,
     * surfaced as the failure or disconnection reason.
     */
    enum class ConnStatusCategory : uint8_t {
        /** Regular termination or success. */
        NORMAL = 0,
        /** Connection could not be established or timed out at link level. */
        TIMEOUT = 1,
        /** Peer went out of range or never answered paging. */
        OUT_OF_RANGE = 2,
        /** Peer closed the link. */
        TERMINATED_BY_PEER = 3,
        /** Supervision timeout of an established link. */
        LINK_LOSS = 4,
        /** Local stack or peer ran out of connection resources, e.g. too many concurrent clients. */
        RESOURCE_EXHAUSTED = 5,
        /** Device unavailable or unreachable, the GATT stack gave up. */
        DEVICE_UNAVAILABLE = 6,
        /** Code without a known category. */
        UNKNOWN = 0xff
    };
    constexpr uint8_t number(const ConnStatusCategory rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ConnStatusCategory v) noexcept;

    /** Returns the human readable description of the given category. */
    std::string getDescription(const ConnStatusCategory v) noexcept;

    /**
     * Maps the given raw connection status code to its ::ConnStatusCategory.
     */
    ConnStatusCategory to_ConnStatusCategory(const uint16_t status) noexcept;

    inline ConnStatusCategory to_ConnStatusCategory(const BTConnStatusCode status) noexcept {
        return to_ConnStatusCategory(number(status));
    }

    /**
     * GATT operation completion status as delivered by the radio stack,
     * the ATT error codes plus the vendor GATT stack codes.
     * <p>
     * BT Core Spec v5.2: Vol 3, Part F Attribute Protocol (ATT): 3.4.1.1 Error Response
     * </p>
     */
    enum class GattStatusCode : uint16_t {
        SUCCESS = 0x00,
        INVALID_HANDLE = 0x01,
        NO_READ_PERM = 0x02,
        NO_WRITE_PERM = 0x03,
        INVALID_PDU = 0x04,
        INSUFFICIENT_AUTHENTICATION = 0x05,
        UNSUPPORTED_REQUEST = 0x06,
        INVALID_OFFSET = 0x07,
        INSUFFICIENT_AUTHORIZATION = 0x08,
        PREPARE_QUEUE_FULL = 0x09,
        ATTRIBUTE_NOT_FOUND = 0x0a,
        ATTRIBUTE_NOT_LONG = 0x0b,
        INSUFFICIENT_ENCRYPTION_KEY_SIZE = 0x0c,
        INVALID_ATTRIBUTE_VALUE_LEN = 0x0d,
        UNLIKELY_ERROR = 0x0e,
        INSUFFICIENT_ENCRYPTION = 0x0f,
        UNSUPPORTED_GROUP_TYPE = 0x10,
        INSUFFICIENT_RESOURCES = 0x11,

        GATT_ERROR = 0x85,
        CONNECTION_CONGESTED = 0x8f,
        GATT_FAILURE = 0x101
    };
    constexpr uint16_t number(const GattStatusCode rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    std::string to_string(const GattStatusCode ec) noexcept;

    /**@}*/

} // namespace central_bt

#endif /* BT_STATUS_CODES_HPP_ */
