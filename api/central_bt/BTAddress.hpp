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

#ifndef BT_ADDRESS_HPP_
#define BT_ADDRESS_HPP_

#include <string>
#include <cstdint>

#include <jau/eui48.hpp>

using jau::EUI48;

namespace central_bt {

    /**
     * LE address type of a remote peripheral,
     * see BT Core Spec v5.2: Vol 6 LE, Part B Link Layer Specification: 1.3 Device Address
     */
    enum class BDAddressType : uint8_t {
        /** Bluetooth LE public address */
        BDADDR_LE_PUBLIC  = 0x01,
        /** Bluetooth LE random address */
        BDADDR_LE_RANDOM  = 0x02,
        /** Undefined */
        BDADDR_UNDEFINED  = 0xff
    };
    constexpr uint8_t number(const BDAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BDAddressType type) noexcept;

    /**
     * EUI48 address and ::BDAddressType tuple,
     * identifying the remote peripheral of one BTPeripheral session.
     */
    class BDAddressAndType {
        public:
            jau::EUI48 address;
            BDAddressType type;

            BDAddressAndType(const jau::EUI48 & address_, BDAddressType type_) noexcept
            : address(address_), type(type_) {}

            BDAddressAndType() noexcept : address(), type{BDAddressType::BDADDR_UNDEFINED} { }

            /** Returns true if type is not ::BDAddressType::BDADDR_UNDEFINED. */
            constexpr bool isDefined() const noexcept { return BDAddressType::BDADDR_UNDEFINED != type; }

            std::string toString() const noexcept;
    };
    inline bool operator==(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept {
        return lhs.address == rhs.address && lhs.type == rhs.type;
    }
    inline bool operator!=(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const BDAddressAndType& a) noexcept { return a.toString(); }

} // namespace central_bt

#endif /* BT_ADDRESS_HPP_ */
