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
#include "BTGattChar.hpp"

using namespace central_bt;

#define CHAR_DECL_PROPS_ENUM(X) \
        X(BTGattChar,NONE) \
        X(BTGattChar,Broadcast) \
        X(BTGattChar,Read) \
        X(BTGattChar,WriteNoAck) \
        X(BTGattChar,WriteWithAck) \
        X(BTGattChar,Notify) \
        X(BTGattChar,Indicate) \
        X(BTGattChar,AuthSignedWrite) \
        X(BTGattChar,ExtProps)

#define CASE_TO_STRING2(U,V) case U::V: return #V;

static std::string _getPropertyBitValStr(const BTGattChar::PropertyBitVal prop) noexcept {
    switch(prop) {
        CHAR_DECL_PROPS_ENUM(CASE_TO_STRING2)
        default: ; // fall through intended
    }
    return "Unknown property";
}

std::string central_bt::to_string(const BTGattChar::PropertyBitVal mask) noexcept {
    const BTGattChar::PropertyBitVal none = static_cast<BTGattChar::PropertyBitVal>(0);
    const uint8_t one = 1;
    bool has_pre = false;
    std::string out("[");
    for(int i=0; i<8; i++) {
        const BTGattChar::PropertyBitVal propertyBit = static_cast<BTGattChar::PropertyBitVal>( one << i );
        if( none != ( mask & propertyBit ) ) {
            if( has_pre ) { out.append(", "); }
            out.append(_getPropertyBitValStr(propertyBit));
            has_pre = true;
        }
    }
    out.append("]");
    return out;
}

std::string GattCharKey::toString() const noexcept {
    return service.toString()+"/"+characteristic.toString();
}

static BTGattChar::ssize_type findClientCharConfigIndex(const jau::darray<BTGattDescRef>& descriptorList) noexcept {
    const BTGattChar::size_type size = descriptorList.size();
    for(BTGattChar::size_type i=0; i < size; ++i) {
        const BTGattDescRef& d = descriptorList[i];
        if( nullptr != d && d->isClientCharConfig() ) {
            return static_cast<BTGattChar::ssize_type>(i);
        }
    }
    return -1;
}

BTGattChar::BTGattChar(const jau::uuid_t& service_type_, const jau::uuid_t& value_type_,
                       const PropertyBitVal properties_, jau::darray<BTGattDescRef> && descriptorList_) noexcept
: enabledNotifyState(false),
  service_type(service_type_.toUUID128()), value_type(value_type_.toUUID128()),
  properties(properties_), descriptorList(std::move(descriptorList_)),
  clientCharConfigIndex( findClientCharConfigIndex(descriptorList) )
{ }

BTGattDescRef BTGattChar::findGattDesc(const jau::uuid_t& desc_uuid) const noexcept {
    const jau::uuid128_t desc_uuid128 = desc_uuid.toUUID128();
    for(const BTGattDescRef& d : descriptorList) {
        if( nullptr != d && desc_uuid128 == d->type ) {
            return d;
        }
    }
    return nullptr;
}

std::string BTGattChar::toString() const noexcept {
    std::string char_name;
    std::string desc_str;
    uint16_t uuid16;

    if( getAssignedUUID16(value_type, uuid16) ) {
        char_name = ", "+GattCharacteristicTypeToString(static_cast<GattCharacteristicType>(uuid16));
    }
    if( 0 < descriptorList.size() ) {
        bool comma = false;
        desc_str = ", descr[";
        for(const BTGattDescRef& cd : descriptorList) {
            if( comma ) {
                desc_str += ", ";
            }
            desc_str += nullptr != cd ? cd->toString() : "null";
            comma = true;
        }
        desc_str += "]";
    }
    return "Char[type "+value_type.toString()+char_name+", props "+jau::to_hexstring(number(properties))+" "+to_string(properties)+
           desc_str+", enabled["+(enabledNotifyState?"T":"F")+"], service "+service_type.toString()+"]";
}
