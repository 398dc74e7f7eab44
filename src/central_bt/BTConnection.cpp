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
#include <jau/basic_types.hpp>

#include "BTConnection.hpp"

using namespace central_bt;

BTConnection::BTConnection(const BTRadioAdapterRef& adapter_, const BDAddressAndType& addressAndType_, const jau::fraction_i64& cleanup_grace_) noexcept
: adapter(adapter_), addressAndType(addressAndType_), cleanup_grace(cleanup_grace_),
  handle(nullptr), state(ConnectionState::DISCONNECTED), attempt(0), cleanup_deadline_ms(0)
{ }

BTConnection::~BTConnection() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    releaseHandle();
    state = ConnectionState::DISCONNECTED;
}

void BTConnection::setState(const ConnectionState s) noexcept {
    const ConnectionState old = state;
    state = s;
    DBG_PRINT("BTConnection::state: %s: %s -> %s, attempt %u", addressAndType.toString().c_str(),
            to_string(old).c_str(), to_string(s).c_str(), (unsigned int)attempt.load());
}

void BTConnection::releaseHandle() noexcept {
    std::unique_ptr<BTRadioHandle> h = std::move(handle);
    if( nullptr == h ) {
        return;
    }
    try {
        h->close();
    } catch (std::exception &e) {
        ERR_PRINT("BTConnection::releaseHandle: %s: Caught exception on close: %s", addressAndType.toString().c_str(), e.what());
    }
}

bool BTConnection::hasHandle() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    return nullptr != handle;
}

GattError BTConnection::connect(const callback_factory_t& factory, uint32_t& attempt_out, std::string& msg) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor

    switch( state ) {
        case ConnectionState::DISCONNECTED:
            break;
        case ConnectionState::CLEANING_UP:
            // handle already closed
            DBG_PRINT("BTConnection::connect: %s: Ending cleanup early", addressAndType.toString().c_str());
            setState(ConnectionState::DISCONNECTED);
            break;
        default:
            msg = "Already connected, state "+to_string(state.load());
            return GattError::ALREADY_CONNECTED;
    }
    if( nullptr != handle ) {
        // never two live handles
        ERR_PRINT("BTConnection::connect: %s: Stale handle in state %s", addressAndType.toString().c_str(), to_string(state.load()).c_str());
        releaseHandle();
    }
    const uint32_t a = ++attempt;
    BTRadioCallbackRef cb = factory(a);
    // completions may arrive before connectGatt() returns
    setState(ConnectionState::CONNECTING);
    std::unique_ptr<BTRadioHandle> h = adapter->connectGatt(addressAndType, false /* autoConnect */, cb);
    if( nullptr == h ) {
        msg = "Connection attempt could not be started";
        WARN_PRINT("BTConnection::connect: %s: %s", addressAndType.toString().c_str(), msg.c_str());
        ++attempt; // invalidate
        setState(ConnectionState::DISCONNECTED);
        return GattError::START_FAILED;
    }
    attempt_out = a;
    if( !isCurrent(a) ) {
        // torn down by a completion delivered within connectGatt()
        DBG_PRINT("BTConnection::connect: %s: Attempt %u already torn down, state %s", addressAndType.toString().c_str(),
                (unsigned int)a, to_string(state.load()).c_str());
        handle = std::move(h);
        releaseHandle();
        return GattError::NONE;
    }
    handle = std::move(h);
    return GattError::NONE;
}

bool BTConnection::connected(const uint32_t attempt_, const action_t& action) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( !isCurrent(attempt_) || ConnectionState::CONNECTING != state ) {
        DBG_PRINT("BTConnection::connected: %s: Ignored attempt %u, current %u, state %s", addressAndType.toString().c_str(),
                (unsigned int)attempt_, (unsigned int)attempt.load(), to_string(state.load()).c_str());
        return false;
    }
    setState(ConnectionState::CONNECTED);
    action();
    return true;
}

bool BTConnection::runIfCurrent(const uint32_t attempt_, const action_t& action) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( !isCurrent(attempt_) ) {
        DBG_PRINT("BTConnection::runIfCurrent: %s: Ignored stale attempt %u, current %u, state %s", addressAndType.toString().c_str(),
                (unsigned int)attempt_, (unsigned int)attempt.load(), to_string(state.load()).c_str());
        return false;
    }
    action();
    return true;
}

ConnectionState BTConnection::beginTeardown(const uint32_t attempt_, bool& started) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    const ConnectionState old = state;
    started = false;
    if( 0 != attempt_ && !isCurrent(attempt_) ) {
        DBG_PRINT("BTConnection::beginTeardown: %s: Ignored stale attempt %u, current %u, state %s", addressAndType.toString().c_str(),
                (unsigned int)attempt_, (unsigned int)attempt.load(), to_string(old).c_str());
        return old;
    }
    if( ConnectionState::CONNECTING != old && ConnectionState::CONNECTED != old ) {
        DBG_PRINT("BTConnection::beginTeardown: %s: Nothing to tear down, state %s", addressAndType.toString().c_str(), to_string(old).c_str());
        return old;
    }
    ++attempt; // invalidate stragglers of the torn down attempt
    setState(ConnectionState::DISCONNECTING);
    started = true;
    return old;
}

void BTConnection::completeTeardown(const bool wasConnected, const bool requestDisconnect) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( ConnectionState::DISCONNECTING != state ) {
        DBG_PRINT("BTConnection::completeTeardown: %s: Unexpected state %s", addressAndType.toString().c_str(), to_string(state.load()).c_str());
        return;
    }
    if( requestDisconnect && nullptr != handle ) {
        if( !handle->disconnect() ) {
            WARN_PRINT("BTConnection::completeTeardown: %s: Radio disconnect could not be started", addressAndType.toString().c_str());
        }
    }
    // close before marking disconnected, the radio stack has a limited pool of connections
    releaseHandle();

    if( wasConnected && 0 < cleanup_grace.to_ms() ) {
        cleanup_deadline_ms = jau::getCurrentMilliseconds() + static_cast<uint64_t>( cleanup_grace.to_ms() );
        setState(ConnectionState::CLEANING_UP);
    } else {
        setState(ConnectionState::DISCONNECTED);
    }
}

bool BTConnection::checkCleanup(const uint64_t now_ms) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( ConnectionState::CLEANING_UP != state || now_ms < cleanup_deadline_ms ) {
        return false;
    }
    setState(ConnectionState::DISCONNECTED);
    return true;
}

GattError BTConnection::issue(const command_t& cmd) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( ConnectionState::CONNECTED != state || nullptr == handle ) {
        return GattError::NOT_CONNECTED;
    }
    if( !cmd(*handle) ) {
        return GattError::START_FAILED;
    }
    return GattError::NONE;
}

std::string BTConnection::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    return "BTConnection["+addressAndType.toString()+", "+to_string(state.load())+", attempt "+std::to_string(attempt.load())+
           ", handle "+(nullptr != handle ? "live" : "none")+"]";
}
