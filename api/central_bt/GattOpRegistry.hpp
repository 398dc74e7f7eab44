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

#ifndef GATT_OP_REGISTRY_HPP_
#define GATT_OP_REGISTRY_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/darray.hpp>

#include "GattReply.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Registry of in-flight requests, at most one GattPendingRequest per GattOpKey.
     * <p>
     * Registering a request on an occupied key fails the prior occupant
     * with ::GattError::OVERWRITTEN before the new one is installed.
     * </p>
     * <p>
     * All check-then-act sequences are atomic with respect to each other.
     * Requests are always resolved outside of the registry lock.
     * </p>
     */
    class GattOpRegistry {
        public:
            typedef jau::darray<GattPendingRequestRef> request_list_t;

        private:
            mutable std::mutex mtx_pending;
            std::unordered_map<GattOpKey, GattPendingRequestRef> pending;

        public:
            GattOpRegistry() noexcept : pending() {}

            GattOpRegistry(const GattOpRegistry&) = delete;
            void operator=(const GattOpRegistry&) = delete;

            /**
             * Installs the given request under its key,
             * failing a prior occupant of the same key with ::GattError::OVERWRITTEN.
             */
            void put(const GattPendingRequestRef& req) noexcept;

            /**
             * Removes and returns the request registered under the given key, nullptr if absent.
             */
            GattPendingRequestRef take(const GattOpKey& key) noexcept;

            /**
             * Returns the request registered under the given key without removing it, nullptr if absent.
             */
            GattPendingRequestRef get(const GattOpKey& key) const noexcept;

            /**
             * Removes the given request if it still occupies its key.
             * @return true if removed, false if absent or already replaced
             */
            bool removeIfSame(const GattPendingRequestRef& req) noexcept;

            /**
             * Removes and returns all registered requests.
             */
            request_list_t takeAll() noexcept;

            /**
             * Removes and returns all requests issued before their timeout elapsed.
             * <p>
             * ::GattOpKind::CONNECT uses connect_timeout_ms, all other kinds op_timeout_ms.
             * A zero timeout disables expiry for the respective kinds.
             * </p>
             */
            request_list_t takeExpired(const uint64_t now_ms, const uint64_t connect_timeout_ms, const uint64_t op_timeout_ms) noexcept;

            size_t size() const noexcept;

            bool contains(const GattOpKey& key) const noexcept { return nullptr != get(key); }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* GATT_OP_REGISTRY_HPP_ */
