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
#include <jau/base_codec.hpp>

#include "GattNotificationDispatcher.hpp"

using namespace central_bt;

void GattNotificationDispatcher::setListener(const GattNotificationListenerRef& l) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_dispatch); // RAII-style acquire and relinquish via destructor
    listener = l;
}

bool GattNotificationDispatcher::hasListener() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_dispatch); // RAII-style acquire and relinquish via destructor
    return nullptr != listener.lock();
}

bool GattNotificationDispatcher::dispatch(const BTGattChar& characteristic, const jau::TROOctets& value) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_dispatch); // RAII-style acquire and relinquish via destructor
    GattNotificationListenerRef l = listener.lock();
    if( nullptr == l ) {
        droppedCount++;
        DBG_PRINT("GattNotificationDispatcher: No listener, dropped %s", characteristic.getKey().toString().c_str());
        return false;
    }
    if( !characteristic.getNotificationEnabled() ) {
        droppedCount++;
        DBG_PRINT("GattNotificationDispatcher: Disabled, dropped %s", characteristic.getKey().toString().c_str());
        return false;
    }
    COND_PRINT(debug_data, "GattNotificationDispatcher: %s: %s",
            characteristic.getKey().toString().c_str(), value.toString().c_str());

    const GattNotification n(characteristic.service_type, characteristic.value_type,
                             jau::codec::base::encode64(value.get_ptr(), value.size()),
                             jau::getCurrentMilliseconds());
    try {
        l->notificationReceived(n);
        deliveredCount++;
        return true;
    } catch (std::exception &e) {
        ERR_PRINT("GattNotificationDispatcher: %s: Caught exception %s", l->toString().c_str(), e.what());
    }
    return false;
}
