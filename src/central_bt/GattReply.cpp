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
#include <jau/basic_types.hpp>

#include "GattReply.hpp"

using namespace central_bt;

GattReply GattReply::opFailure(const GattOpKind kind_, const GattError error_, const uint16_t status_, const std::string& message_) noexcept {
    return GattReply(kind_, error_, status_, ConnStatusCategory::UNKNOWN,
                     message_+", status "+to_string(static_cast<GattStatusCode>(status_)));
}

GattReply GattReply::connFailure(const GattOpKind kind_, const GattError error_, const uint16_t status_, const std::string& message_) noexcept {
    const ConnStatusCategory category_ = to_ConnStatusCategory(status_);
    return GattReply(kind_, error_, status_, category_,
                     message_+": "+getDescription(category_)+", status "+to_string(to_BTConnStatusCode(status_)));
}

std::string GattReply::toString() const noexcept {
    std::string res = "GattReply["+to_string(kind)+", "+to_string(error);
    if( !isSuccess() ) {
        res.append(", status "+jau::to_hexstring(status)+", "+to_string(category)+", '"+message+"'");
    }
    if( 0 < value.size() ) {
        res.append(", value "+value.toString());
    }
    if( 0 < mtu ) {
        res.append(", mtu "+std::to_string(mtu));
    }
    return res.append("]");
}

std::string GattOpKey::toString() const noexcept {
    if( global ) {
        return to_string(kind);
    }
    return to_string(kind)+" "+target.toString();
}

GattPendingRequest::GattPendingRequest(const GattOpKey& key_, const BTGattCharRef& characteristic_, const uint16_t argument_,
                                       GattReplyCallback callback_) noexcept
: resolved(false), callback(std::move(callback_)),
  key(key_), characteristic(characteristic_), argument(argument_),
  issued_ms(jau::getCurrentMilliseconds())
{ }

bool GattPendingRequest::resolve(const GattReply& reply) noexcept {
    bool expConn = false; // C++11, exp as value since C++20
    if( !resolved.compare_exchange_strong(expConn, true) ) {
        DBG_PRINT("GattPendingRequest::resolve: Already resolved: %s, dropped %s", toString().c_str(), reply.toString().c_str());
        return false;
    }
    DBG_PRINT("GattPendingRequest::resolve: %s -> %s", key.toString().c_str(), reply.toString().c_str());
    try {
        callback(reply);
    } catch (std::exception &e) {
        ERR_PRINT("GattPendingRequest::resolve: %s: Caught exception %s", key.toString().c_str(), e.what());
    }
    return true;
}

std::string GattPendingRequest::toString() const noexcept {
    return "Request["+key.toString()+", arg "+jau::to_hexstring(argument)+", issued "+std::to_string(issued_ms)+" ms, resolved "+
           (resolved?"T":"F")+"]";
}
