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

#ifndef BT_RADIO_ADAPTER_HPP_
#define BT_RADIO_ADAPTER_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "BTTypes0.hpp"
#include "BTGattService.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * BTRadioAdapter.hpp Module for the consumed radio stack interface:
 *
 * - BTRadioAdapter issuing connection attempts
 * - BTRadioHandle, one live connection and its GATT client commands
 * - BTRadioCallback, the completion channel of a BTRadioHandle
 *
 */
namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Completion and event channel of one BTRadioHandle,
     * implemented by the session and handed to BTRadioAdapter::connectGatt().
     * <p>
     * Callbacks are invoked on the radio stack's own thread,
     * serialized with respect to each other for one handle.
     * </p>
     * <p>
     * Implementations shall never throw.
     * </p>
     */
    class BTRadioCallback {
        public:
            virtual ~BTRadioCallback() noexcept {}

            /**
             * Connection state change of the link.
             * @param status raw connection status, see ::BTConnStatusCode
             * @param newState the new link state
             */
            virtual void onConnectionStateChange(const uint16_t status, const BTRadioLinkState newState) noexcept = 0;

            /**
             * Service discovery completed.
             * @param status raw GATT status, see ::GattStatusCode
             * @param services the discovered services, ignored if status is not zero
             */
            virtual void onServicesDiscovered(const uint16_t status, const jau::darray<BTGattServiceRef>& services) noexcept = 0;

            virtual void onCharacteristicRead(const GattCharKey& key, const jau::TROOctets& value, const uint16_t status) noexcept = 0;

            virtual void onCharacteristicWrite(const GattCharKey& key, const uint16_t status) noexcept = 0;

            /**
             * Descriptor write completed.
             * @param key the characteristic owning the descriptor
             * @param descriptor the written descriptor type
             * @param status raw GATT status, see ::GattStatusCode
             */
            virtual void onDescriptorWrite(const GattCharKey& key, const jau::uuid_t& descriptor, const uint16_t status) noexcept = 0;

            /**
             * ATT MTU changed, either requested or peer initiated.
             */
            virtual void onMtuChanged(const uint16_t mtu, const uint16_t status) noexcept = 0;

            /**
             * Unsolicited characteristic value notification or indication.
             */
            virtual void onCharacteristicChanged(const GattCharKey& key, const jau::TROOctets& value) noexcept = 0;
    };
    typedef std::shared_ptr<BTRadioCallback> BTRadioCallbackRef;

    /**
     * One live radio connection handle as returned by BTRadioAdapter::connectGatt().
     * <p>
     * Each command returns true if it has been started,
     * its completion is delivered later via the BTRadioCallback.
     * Commands never invoke the BTRadioCallback from within the calling thread.
     * </p>
     * <p>
     * The handle is exclusively owned by the session and released via close(),
     * returning its radio resources to the stack.
     * </p>
     */
    class BTRadioHandle {
        public:
            virtual ~BTRadioHandle() noexcept {}

            /** Requests disconnection of the link, completion via BTRadioCallback::onConnectionStateChange(). */
            virtual bool disconnect() noexcept = 0;

            /**
             * Releases all radio resources of this handle, no further callbacks will be delivered.
             * <p>
             * May throw a BTException on stack failure.
             * </p>
             */
            virtual void close() = 0;

            virtual bool discoverServices() noexcept = 0;

            virtual bool readCharacteristic(const GattCharKey& key) noexcept = 0;

            virtual bool writeCharacteristic(const GattCharKey& key, const jau::TROOctets& value, const GattWriteType writeType) noexcept = 0;

            /**
             * Enables or disables local delivery of notifications and indications within the stack,
             * completes synchronously.
             */
            virtual bool setCharacteristicNotification(const GattCharKey& key, const bool enable) noexcept = 0;

            virtual bool writeDescriptor(const GattCharKey& key, const jau::uuid_t& descriptor, const jau::TROOctets& value) noexcept = 0;

            virtual bool requestMtu(const uint16_t mtu) noexcept = 0;
    };

    /**
     * Radio stack adapter issuing connection attempts to a peripheral.
     */
    class BTRadioAdapter {
        public:
            virtual ~BTRadioAdapter() noexcept {}

            /**
             * Issues a connection attempt.
             * @param address the peripheral
             * @param autoConnect if true, the stack reconnects automatically on link loss.
             * @param callback receiving all completions of the returned handle
             * @return the new connection handle or nullptr if the attempt could not be started
             */
            virtual std::unique_ptr<BTRadioHandle> connectGatt(const BDAddressAndType& address, const bool autoConnect,
                                                               const BTRadioCallbackRef& callback) noexcept = 0;

            /** Returns true if the given peripheral is bonded, independent of its connection state. */
            virtual bool isBonded(const BDAddressAndType& address) const noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<BTRadioAdapter> BTRadioAdapterRef;

    /**@}*/

} // namespace central_bt

#endif /* BT_RADIO_ADAPTER_HPP_ */
