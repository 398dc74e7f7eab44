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

#ifndef PERIPHERAL_LISTENER_HPP_
#define PERIPHERAL_LISTENER_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

#include "BTAddress.hpp"
#include "BTStatusCodes.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * One delivered characteristic value change.
     */
    class GattNotification {
        public:
            /** Owning service type */
            jau::uuid128_t service;
            /** Characteristic value type */
            jau::uuid128_t characteristic;
            /** Raw payload in base64 text form, see jau::codec::base::encode64(). */
            std::string data;
            /** The time in monotonic milliseconds when this event occurred. See jau::getCurrentMilliseconds(). */
            uint64_t timestamp;

            GattNotification(const jau::uuid128_t& service_, const jau::uuid128_t& characteristic_,
                             const std::string& data_, const uint64_t timestamp_) noexcept
            : service(service_), characteristic(characteristic_), data(data_), timestamp(timestamp_) {}

            std::string toString() const noexcept {
                return "GattNotification[service "+service.toString()+", char "+characteristic.toString()+", data '"+data+"']";
            }
    };

    /**
     * Sink of unsolicited characteristic value changes of one BTPeripheral.
     * <p>
     * Deliveries are serialized, never two concurrent invocations for one BTPeripheral.
     * </p>
     */
    class GattNotificationListener {
        public:
            virtual void notificationReceived(const GattNotification& n) = 0;

            virtual ~GattNotificationListener() noexcept {}

            virtual std::string toString() const noexcept { return "GattNotificationListener["+jau::to_hexstring(this)+"]"; }
    };
    typedef std::shared_ptr<GattNotificationListener> GattNotificationListenerRef;

    /**
     * Sink of the connection lifecycle events of one BTPeripheral.
     */
    class PeripheralStatusListener {
        public:
            /**
             * Peripheral got connected.
             * @param address the peripheral
             * @param timestamp the time in monotonic milliseconds when this event occurred. See jau::getCurrentMilliseconds().
             */
            virtual void deviceConnected(const BDAddressAndType& address, const uint64_t timestamp) {
                (void)address;
                (void)timestamp;
            }

            /**
             * Peripheral got disconnected, explicitly or spontaneously.
             * @param address the peripheral
             * @param reason the raw connection status reason, see ::BTConnStatusCode
             * @param category the semantic category of reason
             * @param timestamp the time in monotonic milliseconds when this event occurred. See jau::getCurrentMilliseconds().
             */
            virtual void deviceDisconnected(const BDAddressAndType& address, const uint16_t reason, const ConnStatusCategory category,
                                            const uint64_t timestamp) {
                (void)address;
                (void)reason;
                (void)category;
                (void)timestamp;
            }

            virtual ~PeripheralStatusListener() noexcept {}

            virtual std::string toString() const noexcept { return "PeripheralStatusListener["+jau::to_hexstring(this)+"]"; }
    };
    typedef std::shared_ptr<PeripheralStatusListener> PeripheralStatusListenerRef;

    /**@}*/

} // namespace central_bt

#endif /* PERIPHERAL_LISTENER_HPP_ */
