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

#include <iostream>
#include <cinttypes>
#include <cstring>
#include <thread>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "ScriptedRadioAdapter.hpp"

#include <central_bt/BTPeripheral.hpp>
#include <central_bt/GattNotificationDispatcher.hpp>
#include <central_bt/PeripheralEventEmitter.hpp>

using namespace central_bt;

static const uint8_t payload_raw[] = { 0x01, 0x02, 0x03 };

TEST_CASE( "Notification Dispatcher Test 01", "[notification][dispatcher]" ) {
    GattNotificationDispatcher dispatcher(false);
    BTGattChar c(SVC_BATTERY, CHR_BATTERY_LEVEL, BTGattChar::PropertyBitVal::Notify, jau::darray<BTGattDescRef>());
    const jau::TROOctets payload(payload_raw, sizeof(payload_raw), jau::lb_endian_t::little);

    // no listener
    c.setNotificationEnabled(true);
    REQUIRE( false == dispatcher.hasListener() );
    REQUIRE( false == dispatcher.dispatch(c, payload) );
    REQUIRE( 1 == dispatcher.getDroppedCount() );

    std::shared_ptr<NotificationRecorder> l = std::make_shared<NotificationRecorder>();
    dispatcher.setListener(l);
    REQUIRE( true == dispatcher.hasListener() );
    REQUIRE( true == dispatcher.dispatch(c, payload) );
    REQUIRE( 1 == l->count() );
    {
        const GattNotification n = l->last();
        INFO_STR( n.toString() );
        REQUIRE( "AQID" == n.data );
        REQUIRE( SVC_BATTERY.toUUID128() == n.service );
        REQUIRE( CHR_BATTERY_LEVEL.toUUID128() == n.characteristic );
        REQUIRE( 0 < n.timestamp );
    }
    REQUIRE( 1 == dispatcher.getDeliveredCount() );

    // delivery disabled
    c.setNotificationEnabled(false);
    REQUIRE( false == dispatcher.dispatch(c, payload) );
    REQUIRE( 1 == l->count() );
    REQUIRE( 2 == dispatcher.getDroppedCount() );

    // throwing listener does not escape
    c.setNotificationEnabled(true);
    l->throwOnReceive = true;
    REQUIRE( false == dispatcher.dispatch(c, payload) );
    REQUIRE( 2 == l->count() );
    l->throwOnReceive = false;
    REQUIRE( true == dispatcher.dispatch(c, payload) );
    REQUIRE( 3 == l->count() );

    // weak reference only
    l = nullptr;
    REQUIRE( false == dispatcher.hasListener() );
    REQUIRE( false == dispatcher.dispatch(c, payload) );

    std::shared_ptr<NotificationRecorder> l2 = std::make_shared<NotificationRecorder>();
    dispatcher.setListener(l2);
    dispatcher.setListener(nullptr);
    REQUIRE( false == dispatcher.dispatch(c, payload) );
    REQUIRE( 0 == l2->count() );
}

TEST_CASE( "Notification Peripheral Test 02", "[notification][peripheral]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    std::shared_ptr<NotificationRecorder> l = std::make_shared<NotificationRecorder>();
    p->setNotificationListener(l);

    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const jau::TROOctets payload(payload_raw, sizeof(payload_raw), jau::lb_endian_t::little);

    // not subscribed yet
    adapter->cb()->onCharacteristicChanged(level, payload);
    REQUIRE( 0 == l->count() );

    ReplyRecorder r;
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    adapter->cb()->onDescriptorWrite(level, GattClientCharConfig::TYPE_UUID128, 0);
    REQUIRE( r.last().isSuccess() );

    adapter->cb()->onCharacteristicChanged(level, payload);
    REQUIRE( 1 == l->count() );
    REQUIRE( "AQID" == l->last().data );

    // unknown characteristic
    adapter->cb()->onCharacteristicChanged(GattCharKey(SVC_BATTERY, CHR_MODEL_NUMBER), payload);
    REQUIRE( 1 == l->count() );

    // throwing listener leaves the session intact
    l->throwOnReceive = true;
    adapter->cb()->onCharacteristicChanged(level, payload);
    REQUIRE( 2 == l->count() );
    REQUIRE( p->isConnected() );
    l->throwOnReceive = false;

    // empty payload
    const jau::TROOctets empty(payload_raw, 0, jau::lb_endian_t::little);
    adapter->cb()->onCharacteristicChanged(level, empty);
    REQUIRE( 3 == l->count() );
    REQUIRE( "" == l->last().data );

    // notifications of a released attempt are ignored
    BTRadioCallbackRef oldcb = adapter->cb();
    p->disconnect(r.callback());
    oldcb->onCharacteristicChanged(level, payload);
    REQUIRE( 3 == l->count() );
}

TEST_CASE( "Notification Close Test 03", "[notification][close]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    std::shared_ptr<NotificationRecorder> l = std::make_shared<NotificationRecorder>();
    p->setNotificationListener(l);

    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const jau::TROOctets payload(payload_raw, sizeof(payload_raw), jau::lb_endian_t::little);
    BTRadioCallbackRef cb = adapter->cb();

    ReplyRecorder r;
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    cb->onDescriptorWrite(level, GattClientCharConfig::TYPE_UUID128, 0);
    cb->onCharacteristicChanged(level, payload);
    REQUIRE( 1 == l->count() );

    p->close();
    cb->onCharacteristicChanged(level, payload);
    REQUIRE( 1 == l->count() );
}

TEST_CASE( "Event Emitter Listener Test 04", "[notification][emitter][concurrency]" ) {
    PeripheralEventEmitter emitter(TEST_ADDRESS);
    std::shared_ptr<StatusRecorder> status = std::make_shared<StatusRecorder>();
    REQUIRE( !emitter.emitConnected(1) );

    const int count = 500;
    int emitted = 0;
    std::thread toggler([&emitter, &status, count]() {
        for(int i=0; i<count; ++i) {
            emitter.setListener( 0 == i % 2 ? status : nullptr );
        }
    });
    for(int i=0; i<count; ++i) {
        if( emitter.emitConnected(static_cast<uint64_t>(i)) ) {
            ++emitted;
        }
    }
    toggler.join();
    // each successful emission reached the listener exactly once
    REQUIRE( emitted == status->getConnectedCount() );

    emitter.setListener(status);
    REQUIRE( emitter.emitDisconnected(number(BTConnStatusCode::REMOTE_USER_TERMINATED_CONNECTION), 2) );
    REQUIRE( 1 == status->getDisconnectedCount() );
    REQUIRE( ConnStatusCategory::TERMINATED_BY_PEER == status->lastCategory );
}
