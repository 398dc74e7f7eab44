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

#ifndef GATT_NUMBERS_HPP_
#define GATT_NUMBERS_HPP_

#include <cstdint>
#include <string>

#include <jau/uuid.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * GattNumbers.hpp Module for assigned GATT numbers and ATT limits
 * used by a GATT client session:
 *
 * - https://www.bluetooth.com/specifications/gatt/services/
 *
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.3.3 Client Characteristic Configuration
 *
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 5.2.1 ATT_MTU
 *
 */
namespace central_bt {

/** \addtogroup CentralBTUserAPI
 *
 *  @{
 */

/**
 * ATT MTU limits and defaults.
 */
enum class GattMtu : uint16_t {
    /* BT Core Spec v5.2: Vol 3, Part G GATT: 5.2.1 ATT_MTU */
    MIN_ATT_MTU = 23,

    /**
     * Maximum ATT MTU requested by common GATT stacks,
     * i.e. the maximum attribute value length of 512 plus 5 octets header.
     * <p>
     * Also the default MTU assumed by a new session.
     * </p>
     */
    MAX_ATT_MTU = 517
};
constexpr uint16_t number(const GattMtu d) noexcept { return static_cast<uint16_t>(d); }

/**
 * GATT Service Type, each encapsulating a set of Characteristics.
 *
 * <pre>
 * https://www.bluetooth.com/specifications/gatt/services/
 * </pre>
 */
enum GattServiceType : uint16_t {
    /** This service contains generic information about the device. This is a mandatory service. */
    GENERIC_ACCESS                              = 0x1800,
    /** The service allows receiving indications of changed services. This is a mandatory service. */
    GENERIC_ATTRIBUTE                           = 0x1801,
    /** This service exposes temperature and other data from a thermometer intended for healthcare and fitness applications. */
    HEALTH_THERMOMETER                          = 0x1809,
    /** This service exposes manufacturer and/or vendor information about a device. */
    DEVICE_INFORMATION                          = 0x180A,
    /** This service exposes the state of a battery within a device. */
    BATTERY_SERVICE                             = 0x180F,
};
std::string GattServiceTypeToString(const GattServiceType v) noexcept;

/**
 * GATT Assigned Characteristic Attribute Type for single logical value.
 *
 * https://www.bluetooth.com/specifications/gatt/characteristics/
 */
enum GattCharacteristicType : uint16_t {
    DEVICE_NAME                                 = 0x2A00,
    APPEARANCE                                  = 0x2A01,
    SERVICE_CHANGED                             = 0x2A05,
    BATTERY_LEVEL                               = 0x2A19,
    TEMPERATURE_MEASUREMENT                     = 0x2A1C,
    MODEL_NUMBER_STRING                         = 0x2A24,
    MANUFACTURER_NAME_STRING                    = 0x2A29,
};
std::string GattCharacteristicTypeToString(const GattCharacteristicType v) noexcept;

/**
 * Returns true if the given UUID128 is derived from the Bluetooth base UUID
 * `0000xxxx-0000-1000-8000-00805f9b34fb` and stores its assigned 16 bit number in `res`.
 */
bool getAssignedUUID16(const jau::uuid128_t& uuid, uint16_t& res) noexcept;

/**
 * Client Characteristic Configuration Descriptor (CCCD) type and values.
 * <p>
 * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.3.3 Client Characteristic Configuration
 * </p>
 */
struct GattClientCharConfig {
    /** CCCD type 0x2902 as UUID16 */
    static constexpr uint16_t TYPE = 0x2902;

    /** Disables notification and indication, value 0x0000 */
    static constexpr uint16_t DISABLE = 0x0000;

    /** Enables notification, value 0x0001 */
    static constexpr uint16_t NOTIFICATION = 0x0001;

    /** Enables indication, value 0x0002 */
    static constexpr uint16_t INDICATION = 0x0002;

    /** The CCCD type in its 128 bit form, 00002902-0000-1000-8000-00805f9b34fb. */
    static const jau::uuid128_t TYPE_UUID128;
};

/**@}*/

} // namespace central_bt

#endif /* GATT_NUMBERS_HPP_ */
