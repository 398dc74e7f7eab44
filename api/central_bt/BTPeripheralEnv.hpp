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

#ifndef BT_PERIPHERAL_ENV_HPP_
#define BT_PERIPHERAL_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>
#include <jau/fraction_type.hpp>

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * BTPeripheral session singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class BTPeripheralEnv : public jau::root_environment {
        private:
            BTPeripheralEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers central_bt environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Grace window of ::ConnectionState::CLEANING_UP after a closed connection,
             * absorbing straggler callbacks before the session is ::ConnectionState::DISCONNECTED.
             * <p>
             * Defaults to 200ms, range [10ms..5s].
             * </p>
             * <p>
             * Environment variable is 'central_bt.peripheral.cleanup.grace'.
             * </p>
             */
            const jau::fraction_i64 CLEANUP_GRACE;

            /**
             * Timeout of a pending connection attempt, defaults to 30s.
             * <p>
             * Environment variable is 'central_bt.peripheral.connect.timeout'.
             * </p>
             */
            const jau::fraction_i64 CONNECT_TIMEOUT;

            /**
             * Timeout of a pending GATT operation, defaults to 10s.
             * Zero disables the timeout.
             * <p>
             * Environment variable is 'central_bt.gatt.op.timeout'.
             * </p>
             */
            const jau::fraction_i64 GATT_OP_TIMEOUT;

            /**
             * Period of the session watchdog, expiring pending requests and ending the cleanup grace window.
             * <p>
             * Defaults to 50ms, range [10ms..1s].
             * </p>
             * <p>
             * Environment variable is 'central_bt.peripheral.watchdog.period'.
             * </p>
             */
            const jau::fraction_i64 WATCHDOG_PERIOD;

            /**
             * Initial cached ATT MTU of a new session, defaults to 517, range [23..517].
             * <p>
             * Environment variable is 'central_bt.gatt.mtu.default'.
             * </p>
             */
            const int32_t DEFAULT_MTU;

            /**
             * SimRadioAdapter event ringbuffer capacity, defaults to 128 events.
             * <p>
             * Environment variable is 'central_bt.sim.ringsize'.
             * </p>
             */
            const int32_t SIM_RING_CAPACITY;

            /**
             * Debug all GATT payload data
             * <p>
             * Environment variable is 'central_bt.debug.gatt.data'.
             * </p>
             */
            const bool DEBUG_DATA;

        public:
            static BTPeripheralEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static BTPeripheralEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace central_bt

#endif /* BT_PERIPHERAL_ENV_HPP_ */
