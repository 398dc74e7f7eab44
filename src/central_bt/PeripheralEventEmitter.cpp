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

#include "PeripheralEventEmitter.hpp"

using namespace central_bt;

void PeripheralEventEmitter::setListener(const PeripheralStatusListenerRef& l) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_emit); // RAII-style acquire and relinquish via destructor
    listener = l;
}

PeripheralStatusListenerRef PeripheralEventEmitter::getListener() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_emit); // RAII-style acquire and relinquish via destructor
    return listener.lock();
}

bool PeripheralEventEmitter::emitConnected(const uint64_t timestamp) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_emit); // RAII-style acquire and relinquish via destructor
    PeripheralStatusListenerRef l = getListener();
    if( nullptr == l ) {
        DBG_PRINT("PeripheralEventEmitter::emitConnected: No listener for %s", addressAndType.toString().c_str());
        return false;
    }
    try {
        l->deviceConnected(addressAndType, timestamp);
        return true;
    } catch (std::exception &e) {
        ERR_PRINT("PeripheralEventEmitter::emitConnected: %s: Caught exception %s", l->toString().c_str(), e.what());
    }
    return false;
}

bool PeripheralEventEmitter::emitDisconnected(const uint16_t reason, const uint64_t timestamp) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_emit); // RAII-style acquire and relinquish via destructor
    PeripheralStatusListenerRef l = getListener();
    if( nullptr == l ) {
        DBG_PRINT("PeripheralEventEmitter::emitDisconnected: No listener for %s", addressAndType.toString().c_str());
        return false;
    }
    try {
        l->deviceDisconnected(addressAndType, reason, to_ConnStatusCategory(reason), timestamp);
        return true;
    } catch (std::exception &e) {
        ERR_PRINT("PeripheralEventEmitter::emitDisconnected: %s: Caught exception %s", l->toString().c_str(), e.what());
    }
    return false;
}
