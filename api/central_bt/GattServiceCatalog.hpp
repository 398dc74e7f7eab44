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

#ifndef GATT_SERVICE_CATALOG_HPP_
#define GATT_SERVICE_CATALOG_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>

#include "BTGattService.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Discovered GATT topology of one peripheral.
     * <p>
     * The catalog holds an immutable snapshot of the discovered services,
     * replaced wholesale on each service discovery and cleared on disconnect.
     * Each snapshot carries its characteristic index keyed by GattCharKey.
     * </p>
     * <p>
     * Readers always observe one consistent snapshot,
     * either the previous or the replacing one.
     * </p>
     */
    class GattServiceCatalog {
        public:
            typedef jau::darray<BTGattServiceRef> service_list_t;

        private:
            struct Snapshot {
                service_list_t services;
                std::unordered_map<GattCharKey, BTGattCharRef> index;

                Snapshot() noexcept : services(), index() {}
                explicit Snapshot(const service_list_t& services_) noexcept;
            };
            typedef std::shared_ptr<const Snapshot> SnapshotRef;

            mutable std::mutex mtx_snapshot;
            SnapshotRef snapshot;

            SnapshotRef getSnapshot() const noexcept {
                const std::lock_guard<std::mutex> lock(mtx_snapshot); // RAII-style acquire and relinquish via destructor
                return snapshot;
            }

        public:
            GattServiceCatalog() noexcept;

            GattServiceCatalog(const GattServiceCatalog&) = delete;
            void operator=(const GattServiceCatalog&) = delete;

            /**
             * Replaces the whole catalog with the given services and rebuilds the characteristic index.
             * <p>
             * A characteristic occurring twice within the same service is indexed by its first occurrence.
             * </p>
             */
            void replace(const service_list_t& services) noexcept;

            /** Clears the catalog to empty. */
            void clear() noexcept;

            /** Returns the services of the most recent successful discovery, may be empty. */
            service_list_t getServices() const noexcept { return getSnapshot()->services; }

            /** Returns the number of indexed characteristics. */
            size_t getCharCount() const noexcept { return getSnapshot()->index.size(); }

            bool isEmpty() const noexcept { return 0 == getSnapshot()->services.size(); }

            /**
             * Returns the characteristic indexed by the given key or nullptr if absent.
             */
            BTGattCharRef findGattChar(const GattCharKey& key) const noexcept;

            BTGattCharRef findGattChar(const jau::uuid_t& service, const jau::uuid_t& characteristic) const noexcept {
                return findGattChar(GattCharKey(service, characteristic));
            }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* GATT_SERVICE_CATALOG_HPP_ */
