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

#include "GattOpRegistry.hpp"

using namespace central_bt;

void GattOpRegistry::put(const GattPendingRequestRef& req) noexcept {
    GattPendingRequestRef prior;
    {
        const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
        GattPendingRequestRef& slot = pending[req->key];
        prior = std::move(slot);
        slot = req;
    }
    if( nullptr != prior && prior != req ) {
        DBG_PRINT("GattOpRegistry::put: Overwriting %s", prior->toString().c_str());
        prior->resolve( GattReply::failure(prior->getKind(), GattError::OVERWRITTEN,
                            prior->key.toString()+" request was overwritten before finishing") );
    }
}

GattPendingRequestRef GattOpRegistry::take(const GattOpKey& key) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    auto it = pending.find(key);
    if( pending.end() == it ) {
        return nullptr;
    }
    GattPendingRequestRef res = std::move(it->second);
    pending.erase(it);
    return res;
}

GattPendingRequestRef GattOpRegistry::get(const GattOpKey& key) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    auto it = pending.find(key);
    if( pending.end() == it ) {
        return nullptr;
    }
    return it->second;
}

bool GattOpRegistry::removeIfSame(const GattPendingRequestRef& req) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    auto it = pending.find(req->key);
    if( pending.end() == it || it->second != req ) {
        return false;
    }
    pending.erase(it);
    return true;
}

GattOpRegistry::request_list_t GattOpRegistry::takeAll() noexcept {
    request_list_t res;
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    res.reserve(pending.size());
    for(auto& e : pending) {
        res.push_back( std::move(e.second) );
    }
    pending.clear();
    return res;
}

GattOpRegistry::request_list_t GattOpRegistry::takeExpired(const uint64_t now_ms, const uint64_t connect_timeout_ms, const uint64_t op_timeout_ms) noexcept {
    request_list_t res;
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    for(auto it = pending.begin(); it != pending.end(); ) {
        const GattPendingRequestRef& req = it->second;
        const uint64_t timeout_ms = GattOpKind::CONNECT == req->getKind() ? connect_timeout_ms : op_timeout_ms;
        if( 0 < timeout_ms && now_ms >= req->issued_ms + timeout_ms ) {
            res.push_back( req );
            it = pending.erase(it);
        } else {
            ++it;
        }
    }
    return res;
}

size_t GattOpRegistry::size() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    return pending.size();
}

std::string GattOpRegistry::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    std::string res = "GattOpRegistry["+std::to_string(pending.size())+": ";
    bool comma = false;
    for(const auto& e : pending) {
        if( comma ) { res.append(", "); }
        res.append(e.first.toString());
        comma = true;
    }
    return res.append("]");
}
