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

#ifndef BT_CONNECTION_HPP_
#define BT_CONNECTION_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>

#include "BTTypes0.hpp"
#include "BTRadioAdapter.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Connection state machine of one peripheral,
     * exclusive owner of the single live BTRadioHandle.
     * <pre>
     * DISCONNECTED --connect()--> CONNECTING --connected()--> CONNECTED
     * CONNECTING --beginTeardown()/completeTeardown()--> DISCONNECTED
     * CONNECTED --beginTeardown()--> DISCONNECTING --completeTeardown()--> CLEANING_UP --grace elapsed--> DISCONNECTED
     * </pre>
     * <p>
     * The handle is always closed before the state reaches ::ConnectionState::DISCONNECTED,
     * hence at most one live handle exists at any time.
     * </p>
     * <p>
     * Each connection attempt carries its own sequence number.
     * Callbacks of a previous attempt are identified by it and ignored.
     * A teardown invalidates the current attempt sequence.
     * </p>
     */
    class BTConnection {
        public:
            /** Creates the per attempt BTRadioCallback for the given attempt sequence number. */
            typedef jau::function<BTRadioCallbackRef(const uint32_t)> callback_factory_t;

            /** Radio command issued on the live handle, returning true if started. */
            typedef jau::function<bool(BTRadioHandle&)> command_t;

            /** Session state update applied atomically with an attempt check. */
            typedef jau::function<void()> action_t;

        private:
            const BTRadioAdapterRef adapter;
            const BDAddressAndType addressAndType;
            const jau::fraction_i64 cleanup_grace;

            mutable std::recursive_mutex mtx_conn;
            std::unique_ptr<BTRadioHandle> handle;
            jau::ordered_atomic<ConnectionState, std::memory_order_seq_cst> state;
            jau::sc_atomic_uint32 attempt;
            uint64_t cleanup_deadline_ms;

            void setState(const ConnectionState s) noexcept;

            /** Closes and drops the handle, failures of BTRadioHandle::close() are logged only. */
            void releaseHandle() noexcept;

        public:
            BTConnection(const BTRadioAdapterRef& adapter_, const BDAddressAndType& addressAndType_, const jau::fraction_i64& cleanup_grace_) noexcept;

            BTConnection(const BTConnection&) = delete;
            void operator=(const BTConnection&) = delete;

            /** Releases a remaining handle. */
            ~BTConnection() noexcept;

            ConnectionState getState() const noexcept { return state; }

            /** Returns true if in state ::ConnectionState::CONNECTED. */
            bool isConnected() const noexcept { return ConnectionState::CONNECTED == state; }

            /** Returns true if a live handle exists. */
            bool hasHandle() const noexcept;

            /** Returns the current attempt sequence number, zero before the first attempt. */
            uint32_t getAttempt() const noexcept { return attempt; }

            /** Returns true if the given attempt is the current one and not torn down. */
            bool isCurrent(const uint32_t attempt_) const noexcept { return 0 != attempt_ && attempt_ == attempt; }

            /**
             * Issues a non auto-reconnecting connection attempt.
             * <p>
             * Fails with ::GattError::ALREADY_CONNECTED if a live handle exists,
             * with ::GattError::START_FAILED if the radio adapter could not start the attempt.
             * </p>
             * <p>
             * A pending ::ConnectionState::CLEANING_UP grace window is ended early,
             * its handle has already been closed.
             * </p>
             * @param factory creating the BTRadioCallback of the new attempt
             * @param attempt_out set to the new attempt sequence number on success
             * @param msg set to the failure reason
             * @return ::GattError::NONE on success
             */
            GattError connect(const callback_factory_t& factory, uint32_t& attempt_out, std::string& msg) noexcept;

            /**
             * Link of the given attempt is up.
             * <p>
             * The given action is invoked on the transition while holding the connection lock.
             * </p>
             * @return true if transitioned from ::ConnectionState::CONNECTING to ::ConnectionState::CONNECTED
             */
            bool connected(const uint32_t attempt_, const action_t& action) noexcept;

            /**
             * Invokes the given action while holding the connection lock,
             * if the given attempt is the current one.
             * <p>
             * A concurrent teardown either completes before the check or waits for the action.
             * </p>
             * @return true if the action has been invoked
             */
            bool runIfCurrent(const uint32_t attempt_, const action_t& action) noexcept;

            /**
             * Begins the teardown of the given attempt, zero denotes the current one.
             * <p>
             * Transitions a ::ConnectionState::CONNECTING or ::ConnectionState::CONNECTED link
             * to ::ConnectionState::DISCONNECTING and invalidates the attempt,
             * preventing re-entry by concurrent or straggler teardowns.
             * </p>
             * @param started set to true if this call started the teardown
             * @return the state before this call
             */
            ConnectionState beginTeardown(const uint32_t attempt_, bool& started) noexcept;

            /**
             * Completes a teardown started by beginTeardown().
             * <p>
             * Optionally requests the radio disconnect, closes the handle and only then
             * transitions to ::ConnectionState::CLEANING_UP if the link was connected,
             * otherwise or with a zero grace window to ::ConnectionState::DISCONNECTED.
             * </p>
             */
            void completeTeardown(const bool wasConnected, const bool requestDisconnect) noexcept;

            /**
             * Ends an elapsed cleanup grace window.
             * @return true if transitioned from ::ConnectionState::CLEANING_UP to ::ConnectionState::DISCONNECTED
             */
            bool checkCleanup(const uint64_t now_ms) noexcept;

            /**
             * Issues the given command on the live handle of a connected link.
             * @return ::GattError::NONE if started, ::GattError::NOT_CONNECTED without connected handle,
             *         otherwise ::GattError::START_FAILED
             */
            GattError issue(const command_t& cmd) noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* BT_CONNECTION_HPP_ */
