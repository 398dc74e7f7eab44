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

#ifndef BT_PERIPHERAL_HPP_
#define BT_PERIPHERAL_HPP_

#include <cstdint>
#include <string>
#include <mutex>
#include <memory>

#include <jau/octets.hpp>
#include <jau/uuid.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/simple_timer.hpp>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"
#include "GattReply.hpp"
#include "GattServiceCatalog.hpp"
#include "GattOpRegistry.hpp"
#include "GattNotificationDispatcher.hpp"
#include "PeripheralEventEmitter.hpp"
#include "BTRadioAdapter.hpp"
#include "BTConnection.hpp"
#include "BTPeripheralEnv.hpp"

namespace central_bt {

    /** @defgroup CentralBTUserAPI Central-BT User Level API
     *  User level Central-BT API types and functionality addressing the GATT central-client perspective
     *  of one peripheral session.
     *
     *  @{
     */

    /**
     * GATT central session of one remote peripheral.
     * <p>
     * BTPeripheral owns the connection lifecycle via BTConnection,
     * caches the discovered topology in its GattServiceCatalog and correlates
     * each asynchronous operation with its radio completion via its GattOpRegistry.
     * </p>
     * <p>
     * Each asynchronous operation resolves its GattReplyCallback exactly once,
     * either synchronously on a failed validation or later on the radio stack's thread.
     * None of the operations block on radio I/O or throw.
     * </p>
     * <p>
     * A periodic watchdog expires pending requests with ::GattError::TIMEOUT
     * and ends the ::ConnectionState::CLEANING_UP grace window.
     * </p>
     * <p>
     * Instances are created via BTPeripheral::create() only.
     * </p>
     */
    class BTPeripheral : public std::enable_shared_from_this<BTPeripheral> {
        public:
            /**
             * Session configuration, defaults from BTPeripheralEnv.
             */
            class Config {
                public:
                    /** See BTPeripheralEnv::CLEANUP_GRACE, zero skips ::ConnectionState::CLEANING_UP. */
                    jau::fraction_i64 cleanup_grace;
                    /** See BTPeripheralEnv::CONNECT_TIMEOUT, zero disables. */
                    jau::fraction_i64 connect_timeout;
                    /** See BTPeripheralEnv::GATT_OP_TIMEOUT, zero disables. */
                    jau::fraction_i64 op_timeout;
                    /** See BTPeripheralEnv::WATCHDOG_PERIOD */
                    jau::fraction_i64 watchdog_period;
                    /** See BTPeripheralEnv::DEFAULT_MTU */
                    uint16_t default_mtu;
                    /** See BTPeripheralEnv::DEBUG_DATA */
                    bool debug_data;

                    Config() noexcept;

                    std::string toString() const noexcept;
            };

        private:
            class LinkCallback; // forward
            friend class LinkCallback;

            class ctor_cookie { friend BTPeripheral; ctor_cookie(const uint16_t secret) { (void)secret; } };

            const BTRadioAdapterRef adapter;
            const BDAddressAndType addressAndType;
            const Config config;

            BTConnection connection;
            GattServiceCatalog catalog;
            GattOpRegistry registry;
            GattNotificationDispatcher dispatcher;
            PeripheralEventEmitter emitter;

            jau::relaxed_atomic_uint16 mtu;
            jau::sc_atomic_bool closed;

            /** Serializes connect(), state check and request registration included */
            std::recursive_mutex mtx_connect;
            /** Guards the local notification flags of subscribe() and their restore */
            std::recursive_mutex mtx_subscribe;

            jau::simple_timer watchdog;

            jau::fraction_i64 watchdogTimeout(jau::simple_timer& timer) noexcept;

            /** Fails the given reply callback synchronously with the given error. */
            void reject(const GattReplyCallback& cb, const GattOpKind kind, const GattError error, const std::string& msg) noexcept;

            /**
             * Validates an open session with a connected link and resolves the characteristic,
             * otherwise rejects the request and returns nullptr.
             */
            BTGattCharRef validate(const GattOpKind kind, const GattCharKey& key, const GattReplyCallback& cb) noexcept;

            /** Validates an open session with a connected link, otherwise rejects the request. */
            bool validate(const GattOpKind kind, const GattReplyCallback& cb) noexcept;

            /**
             * Registers the given request and issues its radio command,
             * failing and removing the request if the command could not be started.
             */
            void submit(const GattPendingRequestRef& req, const BTConnection::command_t& cmd) noexcept;

            /**
             * Completes a teardown started via BTConnection::beginTeardown():
             * takes all pending requests, closes the handle, clears the catalog,
             * resolves the taken requests and emits the disconnect if the link was connected.
             *
             * @param prior the state before the teardown
             * @param reason the raw connection status reason
             * @param requestDisconnect if true, the radio disconnect is requested before closing
             * @param connectError the error for a pending connect request
             * @param emit if true, emit the disconnect event
             */
            void teardown(const ConnectionState prior, const uint16_t reason, const bool requestDisconnect,
                          const GattError connectError, const bool emit) noexcept;

            // BTRadioCallback delegates, only invoked for the current attempt

            void linkStateChanged(const uint32_t attempt, const uint16_t status, const BTRadioLinkState newState) noexcept;
            void servicesDiscovered(const uint32_t attempt, const uint16_t status, const jau::darray<BTGattServiceRef>& services) noexcept;
            void characteristicRead(const GattCharKey& key, const jau::TROOctets& value, const uint16_t status) noexcept;
            void characteristicWrite(const GattCharKey& key, const uint16_t status) noexcept;
            void descriptorWrite(const GattCharKey& key, const jau::uuid_t& descriptor, const uint16_t status) noexcept;
            void mtuChanged(const uint32_t attempt, const uint16_t mtu_, const uint16_t status) noexcept;
            void characteristicChanged(const GattCharKey& key, const jau::TROOctets& value) noexcept;

        public:
            /** Private ctor for private BTPeripheral::create() method */
            BTPeripheral(const BTPeripheral::ctor_cookie& cc, const BTRadioAdapterRef& adapter_,
                         const BDAddressAndType& addressAndType_, const Config& config_);

            BTPeripheral(const BTPeripheral&) = delete;
            void operator=(const BTPeripheral&) = delete;

            /**
             * Creates a new session for the given peripheral.
             * @param adapter the radio adapter, must not be nullptr
             * @param addressAndType the peripheral, must be defined
             * @param config the session configuration
             * @throws jau::IllegalArgumentException if adapter is nullptr or the address type is undefined
             */
            static std::shared_ptr<BTPeripheral> create(const BTRadioAdapterRef& adapter, const BDAddressAndType& addressAndType,
                                                        const Config& config=Config());

            /** Releases this session, see close(). */
            ~BTPeripheral() noexcept;

            /**
             * Releases this session.
             * <p>
             * Detaches all listeners, tears down the connection without emitting events,
             * fails all pending requests with ::GattError::DISCONNECTED and stops the watchdog.
             * </p>
             * <p>
             * Idempotent, all subsequent operations are rejected.
             * </p>
             */
            void close() noexcept;

            bool isClosed() const noexcept { return closed; }

            const BDAddressAndType& getAddressAndType() const noexcept { return addressAndType; }

            const Config& getConfig() const noexcept { return config; }

            /**
             * Issues a non auto-reconnecting connection attempt.
             * <p>
             * Fails with ::GattError::ALREADY_CONNECTED if a connection exists or is being established,
             * a pending cleanup grace window is ended early.
             * A failed attempt resolves ::GattError::CONNECTION_FAILED, carrying the status and its ::ConnStatusCategory.
             * On success PeripheralStatusListener::deviceConnected() is emitted after resolving the request.
             * </p>
             */
            void connect(GattReplyCallback cb) noexcept;

            /**
             * Disconnects the peripheral, idempotent.
             * <p>
             * Fails all pending requests with ::GattError::DISCONNECTED,
             * requests the radio disconnect, closes the connection handle and clears the discovered services.
             * Resolves success, also if no connection exists or a disconnect is already in progress.
             * </p>
             */
            void disconnect(GattReplyCallback cb) noexcept;

            /**
             * Discovers all services, replacing the catalog wholesale on success
             * and clearing it on failure with ::GattError::SERVICE_DISCOVERY_FAILED.
             */
            void discoverServices(GattReplyCallback cb) noexcept;

            /**
             * Returns the services of the most recent successful discovery, no radio I/O.
             */
            GattServiceCatalog::service_list_t listServices() const noexcept { return catalog.getServices(); }

            /**
             * Returns the discovered characteristic or nullptr if absent.
             */
            BTGattCharRef findGattChar(const jau::uuid_t& service, const jau::uuid_t& characteristic) const noexcept {
                return catalog.findGattChar(service, characteristic);
            }

            /**
             * Reads the characteristic value, delivered in GattReply::value.
             */
            void read(const jau::uuid_t& service, const jau::uuid_t& characteristic, GattReplyCallback cb) noexcept;

            /**
             * Writes the characteristic value with or without response.
             */
            void write(const jau::uuid_t& service, const jau::uuid_t& characteristic, const jau::TROOctets& data,
                       const bool withResponse, GattReplyCallback cb) noexcept;

            /**
             * Enables or disables notifications of the characteristic.
             * <p>
             * Toggles the local notification delivery flag, then writes its
             * Client Characteristic Configuration Descriptor:
             * 0x0001 notification if the characteristic has the Notify property, otherwise 0x0002 indication,
             * 0x0000 for disable.
             * The prior flag is restored if the request fails, is overwritten or could not be started.
             * </p>
             * <p>
             * Fails with ::GattError::NO_CLIENT_CONFIG if the characteristic has no CCCD or,
             * for enabling, neither the Notify nor the Indicate property.
             * </p>
             */
            void subscribe(const jau::uuid_t& service, const jau::uuid_t& characteristic, const bool enabled, GattReplyCallback cb) noexcept;

            /**
             * Requests the given ATT MTU within [23..517], delivered in GattReply::mtu.
             * <p>
             * Success updates the cached MTU, failure leaves it unchanged.
             * </p>
             */
            void requestMtu(const uint16_t value, GattReplyCallback cb) noexcept;

            /** Returns true if connected, no side effects. */
            bool isConnected() const noexcept { return connection.isConnected(); }

            /** Returns true if the peripheral is bonded, independent of the connection state. */
            bool isBonded() const noexcept;

            ConnectionState getConnectionState() const noexcept { return connection.getState(); }

            /**
             * Returns the cached ATT MTU, initially Config::default_mtu.
             * <p>
             * Only updated by a successful MTU completion, kept across disconnects.
             * </p>
             */
            uint16_t getMtu() const noexcept { return mtu; }

            /** Returns the number of pending requests. */
            size_t getPendingCount() const noexcept { return registry.size(); }

            /**
             * Attaches the notification sink, held by weak reference. Passing nullptr detaches.
             */
            void setNotificationListener(const GattNotificationListenerRef& l) noexcept { dispatcher.setListener(l); }

            /**
             * Attaches the lifecycle event sink, held by weak reference. Passing nullptr detaches.
             */
            void setStatusListener(const PeripheralStatusListenerRef& l) noexcept { emitter.setListener(l); }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<BTPeripheral> BTPeripheralRef;

    /**@}*/

} // namespace central_bt

#endif /* BT_PERIPHERAL_HPP_ */
