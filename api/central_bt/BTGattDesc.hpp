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

#ifndef BT_GATT_DESCRIPTOR_HPP_
#define BT_GATT_DESCRIPTOR_HPP_

#include <jau/uuid.hpp>
#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include "GattNumbers.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GATTDescriptor:
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
     * Representing a discovered Gatt Characteristic Descriptor record.
     *
     * A list of shared BTGattDesc instances is available from BTGattChar
     * via BTGattChar::descriptorList.
     *
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.3 Characteristic Descriptor
     */
    class BTGattDesc {
        public:
            /** Type of descriptor, normalized to its 128 bit form */
            const jau::uuid128_t type;

            explicit BTGattDesc(const jau::uuid_t& type_) noexcept
            : type(type_.toUUID128()) { }

            /* BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.3.3 Client Characteristic Configuration (Characteristic Descriptor, optional, single, uint16_t bitfield) */
            bool isClientCharConfig() const noexcept { return GattClientCharConfig::TYPE_UUID128 == type; }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<BTGattDesc> BTGattDescRef;

    inline bool operator==(const BTGattDesc& lhs, const BTGattDesc& rhs) noexcept
    { return lhs.type == rhs.type; }

    inline bool operator!=(const BTGattDesc& lhs, const BTGattDesc& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace central_bt

#endif /* BT_GATT_DESCRIPTOR_HPP_ */
