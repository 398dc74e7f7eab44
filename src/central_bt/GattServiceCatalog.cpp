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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "GattServiceCatalog.hpp"

using namespace central_bt;

GattServiceCatalog::Snapshot::Snapshot(const service_list_t& services_) noexcept
: services(services_), index()
{
    for(const BTGattServiceRef& s : services) {
        if( nullptr == s ) {
            continue;
        }
        for(const BTGattCharRef& c : s->characteristicList) {
            if( nullptr == c ) {
                continue;
            }
            const bool added = index.emplace(GattCharKey(s->type, c->value_type), c).second;
            if( !added ) {
                WARN_PRINT("GattServiceCatalog: Duplicate characteristic %s in service %s",
                        c->value_type.toString().c_str(), s->type.toString().c_str());
            }
        }
    }
}

GattServiceCatalog::GattServiceCatalog() noexcept
: snapshot( std::make_shared<const Snapshot>() )
{ }

void GattServiceCatalog::replace(const service_list_t& services) noexcept {
    SnapshotRef s = std::make_shared<const Snapshot>(services);
    DBG_PRINT("GattServiceCatalog::replace: %zu services, %zu characteristics", (size_t)s->services.size(), s->index.size());
    const std::lock_guard<std::mutex> lock(mtx_snapshot); // RAII-style acquire and relinquish via destructor
    snapshot = std::move(s);
}

void GattServiceCatalog::clear() noexcept {
    SnapshotRef s = std::make_shared<const Snapshot>();
    const std::lock_guard<std::mutex> lock(mtx_snapshot); // RAII-style acquire and relinquish via destructor
    snapshot = std::move(s);
}

BTGattCharRef GattServiceCatalog::findGattChar(const GattCharKey& key) const noexcept {
    SnapshotRef s = getSnapshot();
    auto it = s->index.find(key);
    if( s->index.end() == it ) {
        return nullptr;
    }
    return it->second;
}

std::string GattServiceCatalog::toString() const noexcept {
    SnapshotRef s = getSnapshot();
    return "GattServiceCatalog["+std::to_string(s->services.size())+" services, "+std::to_string(s->index.size())+" chars]";
}
