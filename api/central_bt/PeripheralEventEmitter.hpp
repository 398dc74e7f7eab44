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

#ifndef PERIPHERAL_EVENT_EMITTER_HPP_
#define PERIPHERAL_EVENT_EMITTER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include "BTAddress.hpp"
#include "PeripheralListener.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Best effort emission of the connection lifecycle events of one peripheral
     * to one settable PeripheralStatusListener, held by weak reference.
     * <p>
     * Emission without an attached listener is a no-op.
     * Events are emitted in call order.
     * </p>
     */
    class PeripheralEventEmitter {
        private:
            mutable std::recursive_mutex mtx_emit;
            std::weak_ptr<PeripheralStatusListener> listener;

            PeripheralStatusListenerRef getListener() const noexcept;

        public:
            const BDAddressAndType addressAndType;

            explicit PeripheralEventEmitter(const BDAddressAndType& addressAndType_) noexcept
            : listener(), addressAndType(addressAndType_) {}

            PeripheralEventEmitter(const PeripheralEventEmitter&) = delete;
            void operator=(const PeripheralEventEmitter&) = delete;

            /** Attaches the given listener, replacing a previous one. Passing nullptr detaches. */
            void setListener(const PeripheralStatusListenerRef& l) noexcept;

            /** @return true if emitted to an attached listener */
            bool emitConnected(const uint64_t timestamp) noexcept;

            /** @return true if emitted to an attached listener */
            bool emitDisconnected(const uint16_t reason, const uint64_t timestamp) noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* PERIPHERAL_EVENT_EMITTER_HPP_ */
