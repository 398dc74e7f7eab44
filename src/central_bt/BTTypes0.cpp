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
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "BTTypes0.hpp"

using namespace central_bt;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_BDADDRESSTYPE_ENUM(X) \
        X(BDAddressType,BDADDR_LE_PUBLIC) \
        X(BDAddressType,BDADDR_LE_RANDOM) \
        X(BDAddressType,BDADDR_UNDEFINED)

std::string central_bt::to_string(const BDAddressType type) noexcept {
    switch(type) {
        CHAR_DECL_BDADDRESSTYPE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BDAddressType "+jau::to_hexstring(number(type));
}

std::string BDAddressAndType::toString() const noexcept {
    return "["+address.toString()+", "+to_string(type)+"]";
}

#define CHAR_DECL_CONNECTIONSTATE_ENUM(X) \
        X(ConnectionState,DISCONNECTED) \
        X(ConnectionState,CONNECTING) \
        X(ConnectionState,CONNECTED) \
        X(ConnectionState,DISCONNECTING) \
        X(ConnectionState,CLEANING_UP)

std::string central_bt::to_string(const ConnectionState v) noexcept {
    switch(v) {
        CHAR_DECL_CONNECTIONSTATE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ConnectionState "+jau::to_hexstring(number(v));
}

#define CHAR_DECL_GATTOPKIND_ENUM(X) \
        X(GattOpKind,CONNECT) \
        X(GattOpKind,DISCOVER_SERVICES) \
        X(GattOpKind,READ) \
        X(GattOpKind,WRITE) \
        X(GattOpKind,DESC_WRITE) \
        X(GattOpKind,MTU) \
        X(GattOpKind,DISCONNECT)

std::string central_bt::to_string(const GattOpKind v) noexcept {
    switch(v) {
        CHAR_DECL_GATTOPKIND_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattOpKind "+jau::to_hexstring(number(v));
}

#define CHAR_DECL_GATTERROR_ENUM(X) \
        X(GattError,NONE) \
        X(GattError,NOT_CONNECTED) \
        X(GattError,ALREADY_CONNECTED) \
        X(GattError,CHAR_NOT_FOUND) \
        X(GattError,SERVICE_DISCOVERY_FAILED) \
        X(GattError,OPERATION_FAILED) \
        X(GattError,OVERWRITTEN) \
        X(GattError,UNEXPECTED_DESCRIPTOR) \
        X(GattError,START_FAILED) \
        X(GattError,TIMEOUT) \
        X(GattError,CONNECTION_FAILED) \
        X(GattError,DISCONNECTED) \
        X(GattError,NO_CLIENT_CONFIG) \
        X(GattError,INVALID_PARAM)

std::string central_bt::to_string(const GattError v) noexcept {
    switch(v) {
        CHAR_DECL_GATTERROR_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattError "+jau::to_hexstring(number(v));
}

std::string central_bt::to_string(const GattWriteType v) noexcept {
    switch(v) {
        case GattWriteType::WITH_RESPONSE: return "WITH_RESPONSE";
        case GattWriteType::NO_RESPONSE: return "NO_RESPONSE";
        default: ; // fall through intended
    }
    return "Unknown GattWriteType "+jau::to_hexstring(number(v));
}

#define CHAR_DECL_BTRADIOLINKSTATE_ENUM(X) \
        X(BTRadioLinkState,DISCONNECTED) \
        X(BTRadioLinkState,CONNECTING) \
        X(BTRadioLinkState,CONNECTED) \
        X(BTRadioLinkState,DISCONNECTING)

std::string central_bt::to_string(const BTRadioLinkState v) noexcept {
    switch(v) {
        CHAR_DECL_BTRADIOLINKSTATE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BTRadioLinkState "+jau::to_hexstring(number(v));
}
