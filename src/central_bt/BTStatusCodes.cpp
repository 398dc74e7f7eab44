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

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/debug.hpp>

#include "BTStatusCodes.hpp"

using namespace central_bt;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_CONNSTATUS_ENUM(X) \
        X(BTConnStatusCode,SUCCESS) \
        X(BTConnStatusCode,UNKNOWN_CONNECTION_IDENTIFIER) \
        X(BTConnStatusCode,HARDWARE_FAILURE) \
        X(BTConnStatusCode,PAGE_TIMEOUT) \
        X(BTConnStatusCode,AUTHENTICATION_FAILURE) \
        X(BTConnStatusCode,PIN_OR_KEY_MISSING) \
        X(BTConnStatusCode,MEMORY_CAPACITY_EXCEEDED) \
        X(BTConnStatusCode,CONNECTION_TIMEOUT) \
        X(BTConnStatusCode,CONNECTION_LIMIT_EXCEEDED) \
        X(BTConnStatusCode,CONNECTION_ALREADY_EXISTS) \
        X(BTConnStatusCode,COMMAND_DISALLOWED) \
        X(BTConnStatusCode,CONNECTION_REJECTED_LIMITED_RESOURCES) \
        X(BTConnStatusCode,CONNECTION_ACCEPT_TIMEOUT_EXCEEDED) \
        X(BTConnStatusCode,REMOTE_USER_TERMINATED_CONNECTION) \
        X(BTConnStatusCode,REMOTE_DEVICE_TERMINATED_CONNECTION_LOW_RESOURCES) \
        X(BTConnStatusCode,REMOTE_DEVICE_TERMINATED_CONNECTION_POWER_OFF) \
        X(BTConnStatusCode,CONNECTION_TERMINATED_BY_LOCAL_HOST) \
        X(BTConnStatusCode,UNSPECIFIED_ERROR) \
        X(BTConnStatusCode,LMP_OR_LL_RESPONSE_TIMEOUT) \
        X(BTConnStatusCode,INSUFFICIENT_SECURITY) \
        X(BTConnStatusCode,CONTROLLER_BUSY) \
        X(BTConnStatusCode,UNACCEPTABLE_CONNECTION_PARAM) \
        X(BTConnStatusCode,CONNECTION_TERMINATED_MIC_FAILURE) \
        X(BTConnStatusCode,CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT) \
        X(BTConnStatusCode,GATT_ERROR) \
        X(BTConnStatusCode,GATT_CONNECTION_TIMEOUT) \
        X(BTConnStatusCode,GATT_FAILURE) \
        X(BTConnStatusCode,INTERNAL_FAILURE) \
        X(BTConnStatusCode,UNKNOWN)

std::string central_bt::to_string(const BTConnStatusCode ec) noexcept {
    switch(ec) {
        CHAR_DECL_CONNSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BTConnStatusCode "+jau::to_hexstring(number(ec));
}

#define CHAR_DECL_CONNSTATUSCATEGORY_ENUM(X) \
        X(ConnStatusCategory,NORMAL) \
        X(ConnStatusCategory,TIMEOUT) \
        X(ConnStatusCategory,OUT_OF_RANGE) \
        X(ConnStatusCategory,TERMINATED_BY_PEER) \
        X(ConnStatusCategory,LINK_LOSS) \
        X(ConnStatusCategory,RESOURCE_EXHAUSTED) \
        X(ConnStatusCategory,DEVICE_UNAVAILABLE) \
        X(ConnStatusCategory,UNKNOWN)

std::string central_bt::to_string(const ConnStatusCategory v) noexcept {
    switch(v) {
        CHAR_DECL_CONNSTATUSCATEGORY_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ConnStatusCategory "+jau::to_hexstring(number(v));
}

std::string central_bt::getDescription(const ConnStatusCategory v) noexcept {
    switch(v) {
        case ConnStatusCategory::NORMAL: return "Connection closed normally";
        case ConnStatusCategory::TIMEOUT: return "Connection timeout";
        case ConnStatusCategory::OUT_OF_RANGE: return "Device out of range";
        case ConnStatusCategory::TERMINATED_BY_PEER: return "Connection terminated by peer device";
        case ConnStatusCategory::LINK_LOSS: return "Link loss, supervision timeout";
        case ConnStatusCategory::RESOURCE_EXHAUSTED: return "Too many concurrent connections or clients";
        case ConnStatusCategory::DEVICE_UNAVAILABLE: return "Device unavailable or unreachable";
        default: ; // fall through intended
    }
    return "Unknown connection status";
}

ConnStatusCategory central_bt::to_ConnStatusCategory(const uint16_t status) noexcept {
    switch( static_cast<BTConnStatusCode>(status) ) {
        case BTConnStatusCode::SUCCESS:
            [[fallthrough]];
        case BTConnStatusCode::CONNECTION_TERMINATED_BY_LOCAL_HOST:
            return ConnStatusCategory::NORMAL;

        case BTConnStatusCode::PAGE_TIMEOUT:
            return ConnStatusCategory::OUT_OF_RANGE;

        case BTConnStatusCode::CONNECTION_TIMEOUT:
            return ConnStatusCategory::LINK_LOSS;

        case BTConnStatusCode::REMOTE_USER_TERMINATED_CONNECTION:
            [[fallthrough]];
        case BTConnStatusCode::REMOTE_DEVICE_TERMINATED_CONNECTION_LOW_RESOURCES:
            [[fallthrough]];
        case BTConnStatusCode::REMOTE_DEVICE_TERMINATED_CONNECTION_POWER_OFF:
            return ConnStatusCategory::TERMINATED_BY_PEER;

        case BTConnStatusCode::LMP_OR_LL_RESPONSE_TIMEOUT:
            [[fallthrough]];
        case BTConnStatusCode::CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT:
            [[fallthrough]];
        case BTConnStatusCode::GATT_CONNECTION_TIMEOUT:
            return ConnStatusCategory::TIMEOUT;

        case BTConnStatusCode::MEMORY_CAPACITY_EXCEEDED:
            [[fallthrough]];
        case BTConnStatusCode::CONNECTION_LIMIT_EXCEEDED:
            [[fallthrough]];
        case BTConnStatusCode::CONNECTION_REJECTED_LIMITED_RESOURCES:
            [[fallthrough]];
        case BTConnStatusCode::GATT_FAILURE:
            return ConnStatusCategory::RESOURCE_EXHAUSTED;

        case BTConnStatusCode::GATT_ERROR:
            return ConnStatusCategory::DEVICE_UNAVAILABLE;

        default:
            return ConnStatusCategory::UNKNOWN;
    }
}

#define CHAR_DECL_GATTSTATUS_ENUM(X) \
        X(GattStatusCode,SUCCESS) \
        X(GattStatusCode,INVALID_HANDLE) \
        X(GattStatusCode,NO_READ_PERM) \
        X(GattStatusCode,NO_WRITE_PERM) \
        X(GattStatusCode,INVALID_PDU) \
        X(GattStatusCode,INSUFFICIENT_AUTHENTICATION) \
        X(GattStatusCode,UNSUPPORTED_REQUEST) \
        X(GattStatusCode,INVALID_OFFSET) \
        X(GattStatusCode,INSUFFICIENT_AUTHORIZATION) \
        X(GattStatusCode,PREPARE_QUEUE_FULL) \
        X(GattStatusCode,ATTRIBUTE_NOT_FOUND) \
        X(GattStatusCode,ATTRIBUTE_NOT_LONG) \
        X(GattStatusCode,INSUFFICIENT_ENCRYPTION_KEY_SIZE) \
        X(GattStatusCode,INVALID_ATTRIBUTE_VALUE_LEN) \
        X(GattStatusCode,UNLIKELY_ERROR) \
        X(GattStatusCode,INSUFFICIENT_ENCRYPTION) \
        X(GattStatusCode,UNSUPPORTED_GROUP_TYPE) \
        X(GattStatusCode,INSUFFICIENT_RESOURCES) \
        X(GattStatusCode,GATT_ERROR) \
        X(GattStatusCode,CONNECTION_CONGESTED) \
        X(GattStatusCode,GATT_FAILURE)

std::string central_bt::to_string(const GattStatusCode ec) noexcept {
    switch(ec) {
        CHAR_DECL_GATTSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattStatusCode "+jau::to_hexstring(number(ec));
}
