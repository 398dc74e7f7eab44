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

#ifndef BT_GATT_SERVICE_HPP_
#define BT_GATT_SERVICE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>

#include "BTGattChar.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GATTService:
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
     * Representing a discovered Gatt Service record.
     *
     * A list of shared BTGattService instances can be retrieved from BTPeripheral
     * after successful connection and service discovery via BTPeripheral::listServices().
     *
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.1 Service Definition
     */
    class BTGattService {
        public:
            const bool primary;

            /** Service type UUID */
            const jau::uuid128_t type;

            /** List of Characteristic Declarations as shared reference, in discovery order */
            const jau::darray<BTGattCharRef> characteristicList;

            BTGattService(const bool isPrimary_, const jau::uuid_t& type_, jau::darray<BTGattCharRef> && characteristicList_) noexcept
            : primary(isPrimary_), type(type_.toUUID128()), characteristicList(std::move(characteristicList_)) { }

            /**
             * Find a BTGattChar by its char_uuid.
             *
             * @param char_uuid the jau::uuid_t of the desired BTGattChar, within this BTGattService.
             * @return The matching characteristic or null if not found
             */
            BTGattCharRef findGattChar(const jau::uuid_t& char_uuid) const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<BTGattService> BTGattServiceRef;

    /**@}*/

} // namespace central_bt

#endif /* BT_GATT_SERVICE_HPP_ */
