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
#include <cstdlib>

#include <jau/debug.hpp>

#include "GattNumbers.hpp"

using namespace central_bt;

const jau::uuid128_t GattClientCharConfig::TYPE_UUID128 = jau::uuid16_t(GattClientCharConfig::TYPE).toUUID128();

bool central_bt::getAssignedUUID16(const jau::uuid128_t& uuid, uint16_t& res) noexcept {
    static const std::string base_suffix = "-0000-1000-8000-00805f9b34fb";
    const std::string s = uuid.toString();
    if( 36 != s.size() || 0 != s.compare(0, 4, "0000") || 0 != s.compare(8, base_suffix.size(), base_suffix) ) {
        return false;
    }
    res = static_cast<uint16_t>( std::strtoul(s.substr(4, 4).c_str(), nullptr, 16) );
    return true;
}

#define CASE_TO_STRING(V) case V: return #V;

#define SERVICE_TYPE_ENUM(X) \
    X(GENERIC_ACCESS) \
    X(GENERIC_ATTRIBUTE) \
    X(HEALTH_THERMOMETER) \
    X(DEVICE_INFORMATION) \
    X(BATTERY_SERVICE)

std::string central_bt::GattServiceTypeToString(const GattServiceType v) noexcept {
    switch(v) {
        SERVICE_TYPE_ENUM(CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown-Service "+jau::to_hexstring(static_cast<uint16_t>(v));
}

#define CHARACTERISTIC_TYPE_ENUM(X) \
    X(DEVICE_NAME) \
    X(APPEARANCE) \
    X(SERVICE_CHANGED) \
    X(BATTERY_LEVEL) \
    X(TEMPERATURE_MEASUREMENT) \
    X(MODEL_NUMBER_STRING) \
    X(MANUFACTURER_NAME_STRING)

std::string central_bt::GattCharacteristicTypeToString(const GattCharacteristicType v) noexcept {
    switch(v) {
        CHARACTERISTIC_TYPE_ENUM(CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown-Characteristic "+jau::to_hexstring(static_cast<uint16_t>(v));
}
