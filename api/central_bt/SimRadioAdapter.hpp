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

#ifndef SIM_RADIO_ADAPTER_HPP_
#define SIM_RADIO_ADAPTER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/ringbuffer.hpp>
#include <jau/service_runner.hpp>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"
#include "BTGattChar.hpp"
#include "BTGattService.hpp"
#include "BTRadioAdapter.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module SimRadioAdapter:
 *
 * Host side virtual peripheral implementing BTRadioAdapter
 * against an in-memory GATT database.
 */
namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Simulated GATT descriptor, holding its value.
     */
    class SimGattDesc {
        public:
            /** Type of descriptor */
            const jau::uuid128_t type;

            /** Its value */
            jau::POctets value;

            SimGattDesc(const jau::uuid_t& type_, jau::POctets && value_) noexcept
            : type(type_.toUUID128()), value(std::move(value_)) {}

            /** Returns a zeroed Client Characteristic Configuration Descriptor (CCCD). */
            static std::shared_ptr<SimGattDesc> createClientCharConfig() noexcept;

            bool isClientCharConfig() const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<SimGattDesc> SimGattDescRef;

    /**
     * Simulated GATT characteristic, holding its value.
     */
    class SimGattChar {
        public:
            /* Characteristics Value Type UUID */
            const jau::uuid128_t value_type;

            /* Characteristics Property */
            const BTGattChar::PropertyBitVal properties;

            /** List of Characteristic Descriptions. */
            jau::darray<SimGattDescRef> descriptors;

            /** Its value */
            jau::POctets value;

            SimGattChar(const jau::uuid_t& value_type_, const BTGattChar::PropertyBitVal properties_,
                        jau::darray<SimGattDescRef> && descriptors_, jau::POctets && value_) noexcept
            : value_type(value_type_.toUUID128()), properties(properties_),
              descriptors(std::move(descriptors_)), value(std::move(value_)) {}

            bool hasProperties(const BTGattChar::PropertyBitVal v) const noexcept { return v == ( properties & v ); }

            SimGattDescRef findGattDesc(const jau::uuid_t& type) noexcept;

            SimGattDescRef getClientCharConfig() noexcept { return findGattDesc(jau::uuid16_t(GattClientCharConfig::TYPE)); }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<SimGattChar> SimGattCharRef;

    /**
     * Simulated GATT service.
     */
    class SimGattService {
        public:
            /** Indicate whether this service is a primary service. */
            const bool primary;

            /** Service type UUID */
            const jau::uuid128_t type;

            /** List of Characteristic Declarations. */
            jau::darray<SimGattCharRef> characteristics;

            SimGattService(const bool primary_, const jau::uuid_t& type_, jau::darray<SimGattCharRef> && characteristics_) noexcept
            : primary(primary_), type(type_.toUUID128()), characteristics(std::move(characteristics_)) {}

            SimGattCharRef findGattChar(const jau::uuid_t& char_uuid) noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<SimGattService> SimGattServiceRef;

    /**
     * In-memory GATT database of the simulated peripheral.
     * <p>
     * This class is not thread safe and only intended to be prepared
     * before being passed to SimRadioAdapter, which guards all later access.
     * </p>
     */
    class SimGattDatabase {
        public:
            typedef jau::darray<SimGattServiceRef> service_list_t;

            service_list_t services;

            SimGattDatabase() noexcept : services() {}

            SimGattDatabase(service_list_t && services_) noexcept
            : services(std::move(services_)) {}

            SimGattServiceRef findGattService(const jau::uuid_t& type) noexcept;

            SimGattCharRef findGattChar(const GattCharKey& key) noexcept;

            /**
             * Returns the discovered representation of all services,
             * as delivered via BTRadioCallback::onServicesDiscovered().
             */
            jau::darray<BTGattServiceRef> toGattServices() const noexcept;

            std::string toFullString() const noexcept;
    };
    typedef std::shared_ptr<SimGattDatabase> SimGattDatabaseRef;

    /**
     * Simulated BTRadioAdapter serving one virtual peripheral.
     * <p>
     * Completions are delivered asynchronously on the adapter's event thread,
     * a jau::service_runner fed by a jau::ringbuffer, and never while holding adapter locks.
     * </p>
     * <p>
     * Fault injection:
     * - connection status of the next connection attempts, see setConnectStatus()
     * - one-shot status of the next operation per ::GattOpKind, see setNextStatus()
     * - start failure per ::GattOpKind, see setStartFailure()
     * - holding and releasing operation completions, see setHoldResponses() and releaseHeld()
     * - spontaneous link loss, see linkLoss()
     * - unsolicited value notifications, see notify()
     * </p>
     * <p>
     * Instances shall be created as std::shared_ptr, see create().
     * </p>
     */
    class SimRadioAdapter : public BTRadioAdapter, public std::enable_shared_from_this<SimRadioAdapter> {
        private:
            class Handle; // forward
            friend class Handle;

            /**
             * One connection attempt of a BTRadioCallback, shared by its Handle and all its events.
             */
            class Link {
                public:
                    const uint32_t id;
                    const BTRadioCallbackRef callback;
                    /** True if its Handle has been closed, no more events are delivered. */
                    jau::sc_atomic_bool closed;

                    Link(const uint32_t id_, const BTRadioCallbackRef& callback_) noexcept
                    : id(id_), callback(callback_), closed(false) {}
            };
            typedef std::shared_ptr<Link> LinkRef;

            #define SIM_EVENT_TYPE_ENUM(X) \
                X(CONN_STATE) \
                X(SERVICES) \
                X(CHAR_READ) \
                X(CHAR_WRITE) \
                X(DESC_WRITE) \
                X(MTU) \
                X(CHAR_CHANGED)

            #define SIM_EVENT_TYPE_DECL(V) V,

            enum class EventType : uint8_t {
                SIM_EVENT_TYPE_ENUM(SIM_EVENT_TYPE_DECL)
            };
            #undef SIM_EVENT_TYPE_DECL

            /**
             * One pending BTRadioCallback invocation.
             */
            class Event {
                public:
                    const EventType type;
                    const LinkRef link;
                    uint16_t status;
                    BTRadioLinkState linkState;
                    GattCharKey key;
                    jau::uuid128_t descriptor;
                    jau::POctets value;
                    uint16_t mtu;
                    jau::darray<BTGattServiceRef> services;

                    Event(const EventType type_, const LinkRef& link_, const uint16_t status_) noexcept;

                    static std::string getTypeName(const EventType v) noexcept;

                    /** Invokes the callback of its link. */
                    void deliver() const noexcept;

                    std::string toString() const noexcept;
            };

            const BDAddressAndType peer;

            mutable std::mutex mtx_sim;
            SimGattDatabaseRef db;
            LinkRef link;
            uint32_t link_count;
            bool bonded;
            uint16_t connect_status;
            uint16_t next_status[number(GattOpKind::DISCONNECT)+1];
            bool next_status_set[number(GattOpKind::DISCONNECT)+1];
            bool start_failure[number(GattOpKind::DISCONNECT)+1];
            bool hold_responses;
            jau::darray<std::unique_ptr<Event>> held;

            jau::relaxed_atomic_size_t deliveredCount;

            jau::service_runner sim_service;
            jau::ringbuffer<std::unique_ptr<Event>, jau::nsize_t> eventRing;

            void simWork(jau::service_runner& sr) noexcept;
            void simEndLocked(jau::service_runner& sr) noexcept;

            /** Enqueues the given event for delivery, or holds a held response. */
            bool enqueue(std::unique_ptr<Event> && ev, const bool response) noexcept;

            /** Returns and clears the one-shot status of the given kind or the given default. */
            uint16_t takeStatus(const GattOpKind kind, const uint16_t defStatus) noexcept;

            /** Returns true if the given link is the live one and the command of kind shall start. */
            bool canStart(const Link& l, const GattOpKind kind) const noexcept;

            // Handle command implementations, returning true if started

            bool disconnect(const LinkRef& l) noexcept;
            void close(const LinkRef& l) noexcept;
            bool discoverServices(const LinkRef& l) noexcept;
            bool readCharacteristic(const LinkRef& l, const GattCharKey& key) noexcept;
            bool writeCharacteristic(const LinkRef& l, const GattCharKey& key, const jau::TROOctets& value, const GattWriteType writeType) noexcept;
            bool setCharacteristicNotification(const LinkRef& l, const GattCharKey& key, const bool enable) noexcept;
            bool writeDescriptor(const LinkRef& l, const GattCharKey& key, const jau::uuid_t& descriptor, const jau::TROOctets& value) noexcept;
            bool requestMtu(const LinkRef& l, const uint16_t mtu) noexcept;

        public:
            /**
             * Creates a simulated adapter serving the given peripheral and database
             * and starts its event thread.
             */
            SimRadioAdapter(const BDAddressAndType& peer_, const SimGattDatabaseRef& db_) noexcept;

            SimRadioAdapter(const SimRadioAdapter&) = delete;
            void operator=(const SimRadioAdapter&) = delete;

            static std::shared_ptr<SimRadioAdapter> create(const BDAddressAndType& peer, const SimGattDatabaseRef& db) noexcept {
                return std::make_shared<SimRadioAdapter>(peer, db);
            }

            /** Stops the event thread, see close(). */
            ~SimRadioAdapter() noexcept override;

            /**
             * Drops the live link without notification, stops the event thread and flushes all pending events.
             * <p>
             * Shall not be called from a BTRadioCallback.
             * </p>
             */
            void close() noexcept;

            bool isRunning() const noexcept { return sim_service.is_running(); }

            const BDAddressAndType& getPeer() const noexcept { return peer; }

            std::unique_ptr<BTRadioHandle> connectGatt(const BDAddressAndType& address, const bool autoConnect,
                                                       const BTRadioCallbackRef& callback) noexcept override;

            bool isBonded(const BDAddressAndType& address) const noexcept override;

            void setBonded(const bool v) noexcept;

            /**
             * Sets the connection status of all subsequent connection attempts,
             * a non zero ::BTConnStatusCode fails the attempt.
             */
            void setConnectStatus(const uint16_t status) noexcept;

            /**
             * Sets the one-shot completion status of the next operation of the given kind,
             * i.e. a ::GattStatusCode.
             */
            void setNextStatus(const GattOpKind kind, const uint16_t status) noexcept;

            /** Lets all subsequent commands of the given kind fail to start. */
            void setStartFailure(const GattOpKind kind, const bool v) noexcept;

            /** Holds all subsequent operation completions until releaseHeld(). */
            void setHoldResponses(const bool v) noexcept;

            /** Enqueues all held completions in issue order, returns their number. */
            size_t releaseHeld() noexcept;

            /**
             * Drops the live link with the given ::BTConnStatusCode reason,
             * notified via BTRadioCallback::onConnectionStateChange().
             * @return true if a live link existed
             */
            bool linkLoss(const uint16_t reason) noexcept;

            /**
             * Sets the characteristic value and notifies it, if its notifications or indications are enabled
             * via its Client Characteristic Configuration Descriptor.
             * @return true if a notification has been enqueued
             */
            bool notify(const GattCharKey& key, const jau::TROOctets& value) noexcept;

            /** Returns a copy of the current characteristic value, zero sized if absent. */
            jau::POctets getValue(const GattCharKey& key) const noexcept;

            /** Returns true if a live link exists. */
            bool isLinkUp() const noexcept;

            /** Returns the number of connection attempts. */
            uint32_t getConnectCount() const noexcept;

            /** Returns the number of delivered events. */
            size_t getDeliveredCount() const noexcept { return deliveredCount; }

            std::string toString() const noexcept override;
    };
    typedef std::shared_ptr<SimRadioAdapter> SimRadioAdapterRef;

    /**@}*/

} // namespace central_bt

#endif /* SIM_RADIO_ADAPTER_HPP_ */
