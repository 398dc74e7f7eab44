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

#include "GattNumbers.hpp"
#include "BTGattService.hpp"

using namespace central_bt;

BTGattCharRef BTGattService::findGattChar(const jau::uuid_t& char_uuid) const noexcept {
    const jau::uuid128_t char_uuid128 = char_uuid.toUUID128();
    for(const BTGattCharRef& c : characteristicList) {
        if( nullptr != c && char_uuid128 == c->value_type ) {
            return c;
        }
    }
    return nullptr;
}

std::string BTGattService::toString() const noexcept {
    std::string name = "";
    uint16_t uuid16;
    if( getAssignedUUID16(type, uuid16) ) {
        name = " - "+GattServiceTypeToString(static_cast<GattServiceType>(uuid16));
    }
    return "Srvc[type "+type.toString()+(primary?", primary":", secondary")+
                name+", "+std::to_string(characteristicList.size())+" chars]";
}
