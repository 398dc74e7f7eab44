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

#ifndef GATT_NOTIFICATION_DISPATCHER_HPP_
#define GATT_NOTIFICATION_DISPATCHER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/octets.hpp>
#include <jau/ordered_atomic.hpp>

#include "BTGattChar.hpp"
#include "PeripheralListener.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Delivers unsolicited characteristic value changes to one settable GattNotificationListener.
     * <p>
     * The listener is held by weak reference, the dispatcher never owns it.
     * Without an attached listener notifications are dropped, nothing is queued.
     * </p>
     * <p>
     * Deliveries are serialized.
     * </p>
     */
    class GattNotificationDispatcher {
        private:
            /** Serializes delivery and listener exchange. */
            mutable std::recursive_mutex mtx_dispatch;
            std::weak_ptr<GattNotificationListener> listener;

            jau::relaxed_atomic_uint64 deliveredCount;
            jau::relaxed_atomic_uint64 droppedCount;

        public:
            /** Trace payload of each dispatched notification, see BTPeripheralEnv::DEBUG_DATA. */
            const bool debug_data;

            explicit GattNotificationDispatcher(const bool debug_data_) noexcept
            : listener(), deliveredCount(0), droppedCount(0), debug_data(debug_data_) {}

            GattNotificationDispatcher(const GattNotificationDispatcher&) = delete;
            void operator=(const GattNotificationDispatcher&) = delete;

            /**
             * Attaches the given listener, replacing a previous one.
             * Passing nullptr detaches.
             */
            void setListener(const GattNotificationListenerRef& l) noexcept;

            bool hasListener() const noexcept;

            /**
             * Delivers the value change of the given characteristic to the attached listener.
             * <p>
             * Dropped if no listener is attached or the characteristic's notification delivery is disabled,
             * see BTGattChar::getNotificationEnabled().
             * </p>
             * @return true if delivered, otherwise false
             */
            bool dispatch(const BTGattChar& characteristic, const jau::TROOctets& value) noexcept;

            uint64_t getDeliveredCount() const noexcept { return deliveredCount; }
            uint64_t getDroppedCount() const noexcept { return droppedCount; }
    };

    /**@}*/

} // namespace central_bt

#endif /* GATT_NOTIFICATION_DISPATCHER_HPP_ */
