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

#ifndef BT_GATT_CHARACTERISTIC_HPP_
#define BT_GATT_CHARACTERISTIC_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <functional>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>
#include <jau/ordered_atomic.hpp>

#include "BTGattDesc.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GATTCharacteristic:
 *
 * - BT Core Spec v5.2: Vol 3, Part G Generic Attribute Protocol (GATT)
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 2.6 GATT Profile Hierarchy
 */
namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Identity of a characteristic within one peripheral,
     * the (service type, characteristic value type) pair.
     * <p>
     * A characteristic value type is not unique across services,
     * hence characteristics are always indexed by this pair.
     * </p>
     */
    class GattCharKey {
        public:
            jau::uuid128_t service;
            jau::uuid128_t characteristic;

            GattCharKey() noexcept
            : service(), characteristic() {}

            GattCharKey(const jau::uuid_t& service_, const jau::uuid_t& characteristic_) noexcept
            : service(service_.toUUID128()), characteristic(characteristic_.toUUID128()) {}

            /** Returns `<service>/<characteristic>` in UUID128 string form, used as index key. */
            std::string toString() const noexcept;
    };
    inline bool operator==(const GattCharKey& lhs, const GattCharKey& rhs) noexcept
    { return lhs.service == rhs.service && lhs.characteristic == rhs.characteristic; }

    inline bool operator!=(const GattCharKey& lhs, const GattCharKey& rhs) noexcept
    { return !(lhs == rhs); }

    /**
     * Representing a discovered Gatt Characteristic record.
     *
     * A list of shared BTGattChar instances is available from BTGattService
     * via BTGattService::characteristicList.
     * <p>
     * Instances are created wholesale at service discovery and never patched,
     * except for the local notification delivery flag.
     * </p>
     *
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3 Characteristic Definition
     */
    class BTGattChar {
        private:
            /** Local notification delivery flag, toggled by subscribe. */
            jau::sc_atomic_bool enabledNotifyState;

        public:
            /** BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1.1 Characteristic Properties */
            enum PropertyBitVal : uint8_t {
                NONE            = 0,
                Broadcast       = (1 << 0),
                Read            = (1 << 1),
                WriteNoAck      = (1 << 2),
                WriteWithAck    = (1 << 3),
                Notify          = (1 << 4),
                Indicate        = (1 << 5),
                AuthSignedWrite = (1 << 6),
                ExtProps        = (1 << 7)
            };

            typedef jau::nsize_t size_type;
            typedef jau::snsize_t ssize_type;

            /* Owning service type UUID */
            const jau::uuid128_t service_type;

            /* Characteristics Value Type UUID */
            const jau::uuid128_t value_type;

            /* Characteristics Property */
            const PropertyBitVal properties;

            /** List of Characteristic Descriptions as shared reference */
            const jau::darray<BTGattDescRef> descriptorList;

            /* Optional Client Characteristic Configuration index within descriptorList */
            const ssize_type clientCharConfigIndex;

            BTGattChar(const jau::uuid_t& service_type_, const jau::uuid_t& value_type_,
                       const PropertyBitVal properties_, jau::darray<BTGattDescRef> && descriptorList_) noexcept;

            GattCharKey getKey() const noexcept { return GattCharKey(service_type, value_type); }

            bool hasProperties(const PropertyBitVal v) const noexcept { return v == ( properties & v ); }

            /**
             * Return the Client Characteristic Configuration BTGattDescRef if available or nullptr.
             */
            BTGattDescRef getClientCharConfig() const noexcept {
                if( 0 > clientCharConfigIndex ) {
                    return nullptr;
                }
                return descriptorList[static_cast<size_type>(clientCharConfigIndex)];
            }

            /**
             * Find a BTGattDesc by its desc_uuid.
             *
             * @param desc_uuid the UUID of the desired BTGattDesc
             * @return The matching descriptor or null if not found
             */
            BTGattDescRef findGattDesc(const jau::uuid_t& desc_uuid) const noexcept;

            /** Returns true if notifications of this characteristic shall be delivered. */
            bool getNotificationEnabled() const noexcept { return enabledNotifyState; }

            void setNotificationEnabled(const bool v) noexcept { enabledNotifyState = v; }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<BTGattChar> BTGattCharRef;

    constexpr uint8_t number(const BTGattChar::PropertyBitVal rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr BTGattChar::PropertyBitVal operator |(const BTGattChar::PropertyBitVal lhs, const BTGattChar::PropertyBitVal rhs) noexcept {
        return static_cast<BTGattChar::PropertyBitVal> ( number(lhs) | number(rhs) );
    }
    constexpr BTGattChar::PropertyBitVal operator &(const BTGattChar::PropertyBitVal lhs, const BTGattChar::PropertyBitVal rhs) noexcept {
        return static_cast<BTGattChar::PropertyBitVal> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const BTGattChar::PropertyBitVal lhs, const BTGattChar::PropertyBitVal rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const BTGattChar::PropertyBitVal lhs, const BTGattChar::PropertyBitVal rhs) noexcept {
        return !( lhs == rhs );
    }
    std::string to_string(const BTGattChar::PropertyBitVal mask) noexcept;

    /**@}*/

} // namespace central_bt

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    template<> struct hash<central_bt::GattCharKey> {
        std::size_t operator()(central_bt::GattCharKey const& a) const noexcept {
            // 31 * x == (x << 5) - x
            std::size_t h = 31 + std::hash<std::string>()(a.service.toString());
            return ((h << 5) - h) + std::hash<std::string>()(a.characteristic.toString());
        }
    };
}

#endif /* BT_GATT_CHARACTERISTIC_HPP_ */
